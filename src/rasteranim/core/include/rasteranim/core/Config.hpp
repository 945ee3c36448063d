#pragma once

#include "rasteranim/normalize/Normalizer.hpp"
#include "rasteranim/compose/Assembler.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace rasteranim {

/* Which part of the pipeline a configuration is meant for. */
enum class Stage : std::uint8_t {
    Convert = 0,   // rasters → previews
    Animate = 1,   // previews → animation
    Full = 2       // both, in sequence
};

/* Configuration for one pipeline run.
   Passed by value into every entry point; there is no global state. */
struct PipelineConfig {
    std::filesystem::path inputDirectory{};
    std::filesystem::path outputDirectory{};      // previews, created if absent
    std::filesystem::path outputAnimationPath{};  // single GIF

    std::optional<double> nodataValue{};          // none = no transparency mask
    int frameDurationMs {kDefaultFrameDurationMs};
    int loopCount {0};                            // 0 = loop forever

    std::vector<std::string> extensions {"tif", "tiff"}; // case-insensitive
    bool recursive {false};                       // walk subdirectories

    StretchMode stretch {StretchMode::MinMax};
    double percentileLow {1.0};
    double percentileHigh {98.0};

    OverlayOptions overlay{};

    std::filesystem::path manifestPath{};         // empty = no manifest
};

/* Check the fields `stage` depends on. Throws ConfigError. */
void validateConfig(const PipelineConfig& cfg, Stage stage);

NormalizeOptions normalizeOptionsFrom(const PipelineConfig& cfg);
AssembleOptions  assembleOptionsFrom(const PipelineConfig& cfg);

} // namespace rasteranim
