#pragma once
#include "rasteranim/core/Codecs.hpp"
#include "rasteranim/compose/ProgressOverlay.hpp"

#include <opencv2/core.hpp>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace rasteranim {

constexpr int kDefaultFrameDurationMs = 300;

struct AssembleOptions {
    int frame_duration_ms = kDefaultFrameDurationMs;  // > 0
    int loop_count        = 0;                        // 0 = forever
    OverlayOptions overlay{};
};

struct AssembleResult {
    std::size_t frames{0};
    cv::Size    size{};
    std::filesystem::path output;
};

/* Caption shown on a frame: the file name up to its first dot
   ("scene.01.png" -> "scene"). */
std::string frameCaption(const std::filesystem::path& frame);

/**
 * Build one animation from preview files, in the given order.
 *
 *  - every file is read exactly once and gets a progress overlay;
 *  - all frames must match the first frame's size, otherwise
 *    DimensionMismatchError is thrown before anything is written;
 *  - the parent directory of `output` is created when missing.
 *
 * Throws EmptyInputError for an empty list, DecodeError for an unreadable
 * frame, IoError when the artifact cannot be written, ConfigError for a
 * non-positive frame duration.
 */
AssembleResult assembleAnimation(const std::vector<std::filesystem::path>& frames,
                                 const std::filesystem::path& output,
                                 IAnimationEncoder& encoder,
                                 const AssembleOptions& opt = {});

} // namespace rasteranim
