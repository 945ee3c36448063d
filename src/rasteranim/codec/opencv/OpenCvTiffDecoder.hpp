#pragma once

#include "rasteranim/core/Codecs.hpp"

namespace rasteranim {

/*
  TIFF decoder built on cv::imread(IMREAD_UNCHANGED).

  - Sample depth is kept as stored (8/16-bit integer, 32-bit float, ...).
  - OpenCV returns colour images as BGR(A); bands are swapped back to
    file order so band 0 is the first band written in the file.
  - Only the first page of a multi-page file is read.
  - A GDAL_NODATA tag, when present, becomes Raster::nodata (read with libtiff).
*/
class OpenCvTiffDecoder final : public IRasterDecoder {
public:
    Raster decode(const std::filesystem::path& path) override;
};

} // namespace rasteranim
