#pragma once

#include <filesystem>
#include <memory>
#include <vector>
#include <opencv2/core.hpp>
#include "Raster.hpp"

namespace rasteranim {

/*
  Source decoder interface.

  decode() reads one raster file into memory with its bands in file order.
  Implementations throw DecodeError on unreadable or malformed input.
*/
class IRasterDecoder {
public:
    virtual ~IRasterDecoder() = default;

    [[nodiscard]] virtual Raster decode(const std::filesystem::path& path) = 0;
};

/* Frames plus timing for one animation, in playback order. */
struct AnimationFrames {
    std::vector<cv::Mat> frames;   // CV_8UC4 (BGRA), all the same size
    std::vector<int> durationsMs;  // one entry per frame
    int loopCount{0};              // 0 = loop forever
};

/*
  Animation encoder interface.

  encode() writes all frames into a single file at `path`.
  Implementations throw IoError if the file cannot be produced.
*/
class IAnimationEncoder {
public:
    virtual ~IAnimationEncoder() = default;

    virtual void encode(const AnimationFrames& anim, const std::filesystem::path& path) = 0;
};

/* Factory functions for the OpenCV-backed codecs. */
std::unique_ptr<IRasterDecoder> makeTiffDecoder();
std::unique_ptr<IAnimationEncoder> makeGifEncoder();

} // namespace rasteranim
