#pragma once
#include "rasteranim/core/Raster.hpp"

#include <opencv2/core.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rasteranim {

/* How the source value range is mapped onto [0..255]. */
enum class StretchMode : std::uint8_t {
    MinMax = 0,     // global min/max over all used bands
    Percentile = 1  // per-band low/high percentiles, values outside are clipped
};

struct NormalizeOptions {
    std::optional<double> nodata{};   // overrides the sentinel declared by the raster
    StretchMode stretch   = StretchMode::MinMax;
    double percentileLow  = 1.0;      // used by StretchMode::Percentile only
    double percentileHigh = 98.0;
};

/* Value written to every colour channel when the range collapses. */
constexpr std::uint8_t kDegenerateGray = 128;

/**
 * Map one raster into an 8-bit BGRA preview.
 *
 *  - bands: fewer than 3 → band 0 replicated to R,G,B; more than 3 → first 3.
 *  - range: no-data pixels and non-finite samples never take part in the
 *    statistics. A collapsed range gives mid-gray (kDegenerateGray).
 *  - alpha: 0 where band 0 equals the sentinel (NaN matches NaN), else 255.
 *
 * Throws DecodeError if the raster is empty.
 */
Preview normalizeRaster(const Raster& raster, const NormalizeOptions& opt = {});

/**
 * CV_8UC1 mask, 255 where the reference band (band 0) equals `nodata`.
 * The sentinel is compared in the raster's own precision, so a float32
 * raster matches a sentinel given as double.
 */
cv::Mat nodataMask(const cv::Mat& samples, double nodata);

/* Linear-interpolated percentile (0..100) of an unsorted sample set. */
double percentileOf(std::vector<double> values, double pct);

const char* toString(StretchMode m) noexcept;

/* Parse "minmax" / "percentile". Returns nullopt for anything else. */
std::optional<StretchMode> parseStretchMode(const std::string& s);

} // namespace rasteranim
