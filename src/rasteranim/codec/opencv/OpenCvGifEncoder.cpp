#include "OpenCvGifEncoder.hpp"
#include "rasteranim/core/Errors.hpp"

#include <opencv2/imgcodecs.hpp>
#include <filesystem>
#include <string>

namespace rasteranim {

void OpenCvGifEncoder::encode(const AnimationFrames& anim, const std::filesystem::path& path) {
    if (anim.frames.empty())
        throw EmptyInputError("no frames to encode", path);
    CV_Assert(anim.frames.size() == anim.durationsMs.size());

    cv::Animation a(anim.loopCount);
    a.frames    = anim.frames;
    a.durations = anim.durationsMs;

    bool ok = false;
    std::string why = "GIF encoder refused the frames";
    try {
        ok = cv::imwriteanimation(path.string(), a);
    } catch (const cv::Exception& e) {
        why = std::string("GIF encoder failed (") + e.what() + ")";
    }

    if (!ok) {
        std::error_code ec;
        std::filesystem::remove(path, ec);  // drop a partially written file
        throw IoError(why, path);
    }
}

} // namespace rasteranim
