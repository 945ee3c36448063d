//====================================================================
// File: core/include/rasteranim/core/Raster.hpp
//====================================================================
#pragma once

#include <opencv2/core.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>

namespace rasteranim {


/// Decoded source raster.
/// Channels of `samples` are in file band order (band 0 first), not
/// OpenCV's BGR order. Depth is whatever the file stores.
struct Raster {
cv::Mat samples{};                    ///< CV_8U/16U/16S/32S/32F/64F, 1..N channels
std::optional<double> nodata{};       ///< sentinel declared by the source, if any
std::filesystem::path source{};


[[nodiscard]] int width() const noexcept { return samples.cols; }
[[nodiscard]] int height() const noexcept { return samples.rows; }
[[nodiscard]] int bands() const noexcept { return samples.channels(); }
[[nodiscard]] bool isFloat() const noexcept {
return samples.depth() == CV_32F || samples.depth() == CV_64F;
}
};


/// 8-bit RGBA preview derived from one raster.
/// `image` is CV_8UC4 in OpenCV's BGRA channel order.
struct Preview {
cv::Mat image{};
bool masked{false};                   ///< a no-data sentinel was applied
std::size_t maskedPixels{0};          ///< pixels with alpha == 0
double low{0.0};                      ///< source value mapped to 0 (band 0)
double high{0.0};                     ///< source value mapped to 255 (band 0)
bool degenerate{false};               ///< range collapsed, mid-gray was used


[[nodiscard]] int width() const noexcept { return image.cols; }
[[nodiscard]] int height() const noexcept { return image.rows; }
};


} // namespace rasteranim
