#include "rasteranim/compose/Assembler.hpp"
#include "rasteranim/core/Errors.hpp"
#include "rasteranim/io/PreviewIO.hpp"

#include <filesystem>
#include <string>
#include <system_error>

namespace rasteranim {

static std::string sizeStr(const cv::Size& s) {
    return std::to_string(s.width) + "x" + std::to_string(s.height);
}

std::string frameCaption(const std::filesystem::path& frame) {
    const std::string name = frame.filename().string();
    return name.substr(0, name.find('.'));
}

/*
  Assemble an animation.

  Method:
    1) Read frame i, check its size against frame 0.
    2) Burn the progress bar for (i+1)/N plus frameCaption() as caption.
    3) After the last frame: make sure the output directory exists and
       hand everything to the encoder in one call.
*/
AssembleResult assembleAnimation(const std::vector<std::filesystem::path>& frames,
                                 const std::filesystem::path& output,
                                 IAnimationEncoder& encoder,
                                 const AssembleOptions& opt)
{
    if (frames.empty())
        throw EmptyInputError("no preview images to animate", output);
    if (opt.frame_duration_ms <= 0)
        throw ConfigError("frame duration must be positive, got " +
                          std::to_string(opt.frame_duration_ms) + " ms");

    AnimationFrames anim{};
    anim.loopCount = opt.loop_count;
    anim.frames.reserve(frames.size());

    const std::size_t total = frames.size();
    cv::Size size{};

    for (std::size_t i = 0; i < total; ++i) {
        cv::Mat img = readPreviewPng(frames[i]);
        if (i == 0) {
            size = img.size();
        } else if (img.size() != size) {
            throw DimensionMismatchError("frame is " + sizeStr(img.size()) +
                                         ", expected " + sizeStr(size), frames[i]);
        }

        drawProgressOverlay(img, i, total, frameCaption(frames[i]), opt.overlay);
        anim.frames.push_back(std::move(img));
        anim.durationsMs.push_back(opt.frame_duration_ms);
    }

    const auto parent = output.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) throw IoError("cannot create output directory (" + ec.message() + ")", parent);
    }

    encoder.encode(anim, output);

    AssembleResult res{};
    res.frames = anim.frames.size();
    res.size   = size;
    res.output = output;
    return res;
}

} // namespace rasteranim
