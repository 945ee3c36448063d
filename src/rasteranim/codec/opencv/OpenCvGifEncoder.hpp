#pragma once

#include "rasteranim/core/Codecs.hpp"

namespace rasteranim {

/*
  GIF encoder built on cv::imwriteanimation (OpenCV >= 4.11).

  Frames are passed through as BGRA; palette quantization and the
  transparent index are left to the OpenCV GIF codec.
  On failure no file is left behind at the target path.
*/
class OpenCvGifEncoder final : public IAnimationEncoder {
public:
    void encode(const AnimationFrames& anim, const std::filesystem::path& path) override;
};

} // namespace rasteranim
