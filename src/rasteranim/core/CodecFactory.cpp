#include "rasteranim/core/Codecs.hpp"
#include "opencv/OpenCvTiffDecoder.hpp"
#include "opencv/OpenCvGifEncoder.hpp"
#include <memory>

namespace rasteranim {

std::unique_ptr<IRasterDecoder> makeTiffDecoder()
{
    return std::make_unique<OpenCvTiffDecoder>();
}

std::unique_ptr<IAnimationEncoder> makeGifEncoder()
{
    return std::make_unique<OpenCvGifEncoder>();
}

} // namespace rasteranim
