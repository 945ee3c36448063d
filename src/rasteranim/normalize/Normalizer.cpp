#include "rasteranim/normalize/Normalizer.hpp"
#include "rasteranim/core/Errors.hpp"

#include <opencv2/core.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace rasteranim {

/* Convert one band to CV_64F so every sample type is handled the same way. */
static cv::Mat toDouble(const cv::Mat& band) {
    cv::Mat d;
    band.convertTo(d, CV_64F);
    return d;
}

/* 255 where the sample is a finite number. */
static cv::Mat finiteMask(const cv::Mat& band64) {
    cv::Mat fin;
    cv::compare(cv::abs(band64), std::numeric_limits<double>::infinity(), fin, cv::CMP_LT);
    return fin;
}

/* Rescale [lo..hi] → [0..255] with rounding; degenerate ranges become mid-gray. */
static cv::Mat rescaleBand(const cv::Mat& band64, const cv::Mat& finite,
                           double lo, double hi, bool degenerate) {
    if (degenerate) return cv::Mat(band64.size(), CV_8UC1, cv::Scalar(kDegenerateGray));

    cv::Mat src = band64;
    if (cv::countNonZero(finite) != src.rows * src.cols) {
        // NaN/Inf would saturate unpredictably
        src = band64.clone();
        cv::Mat bad;
        cv::bitwise_not(finite, bad);
        src.setTo(lo, bad);
    }

    const double scale = 255.0 / (hi - lo);
    cv::Mat u8;
    src.convertTo(u8, CV_8U, scale, -lo * scale);  // saturate_cast clips outside [lo..hi]
    return u8;
}

cv::Mat nodataMask(const cv::Mat& samples, double nodata) {
    CV_Assert(!samples.empty());

    cv::Mat ref;
    if (samples.channels() == 1) {
        ref = samples;
    } else {
        cv::extractChannel(samples, ref, 0);
    }
    cv::Mat ref64 = toDouble(ref);

    cv::Mat mask;
    if (std::isnan(nodata)) {
        cv::compare(ref64, ref64, mask, cv::CMP_NE);  // only NaN differs from itself
        return mask;
    }

    // a float32 raster stores the sentinel rounded to float
    double v = nodata;
    if (samples.depth() == CV_32F) v = static_cast<double>(static_cast<float>(nodata));
    cv::compare(ref64, v, mask, cv::CMP_EQ);
    return mask;
}

double percentileOf(std::vector<double> values, double pct) {
    CV_Assert(!values.empty());
    std::sort(values.begin(), values.end());
    const double pos  = std::clamp(pct, 0.0, 100.0) / 100.0 * double(values.size() - 1);
    const std::size_t i0 = static_cast<std::size_t>(std::floor(pos));
    const std::size_t i1 = std::min(i0 + 1, values.size() - 1);
    const double frac = pos - double(i0);
    return values[i0] + (values[i1] - values[i0]) * frac;
}

/* Collect samples of one band where `valid` is set. */
static std::vector<double> validSamples(const cv::Mat& band64, const cv::Mat& valid) {
    std::vector<double> out;
    out.reserve(static_cast<std::size_t>(cv::countNonZero(valid)));
    for (int y = 0; y < band64.rows; ++y) {
        const double* p = band64.ptr<double>(y);
        const std::uint8_t* m = valid.ptr<std::uint8_t>(y);
        for (int x = 0; x < band64.cols; ++x)
            if (m[x]) out.push_back(p[x]);
    }
    return out;
}

/*
  Normalize a raster into a BGRA preview.

  Steps:
    1) Split the displayed bands (3, or band 0 alone) and promote
       them to double.
    2) Build the no-data mask on band 0 and the "valid for statistics"
       mask (not no-data, finite in every used band).
    3) Compute the stretch range: global min/max or per-band percentiles.
    4) Rescale to 8-bit, expand to R,G,B and attach alpha.
*/
Preview normalizeRaster(const Raster& raster, const NormalizeOptions& opt) {
    if (raster.samples.empty() || raster.width() <= 0 || raster.height() <= 0)
        throw DecodeError("raster has no samples", raster.source);

    Preview out{};
    const cv::Size size = raster.samples.size();

    // --- 1) Bands used for colour: R,G,B or band 0 alone
    std::vector<cv::Mat> planes;
    cv::split(raster.samples, planes);
    const int used = planes.size() >= 3 ? 3 : 1;

    std::vector<cv::Mat> bands64(used), finite(used);
    for (int b = 0; b < used; ++b) {
        bands64[b] = toDouble(planes[b]);
        finite[b]  = finiteMask(bands64[b]);
    }

    // --- 2) Masks
    const std::optional<double> sentinel = opt.nodata ? opt.nodata : raster.nodata;
    cv::Mat nodata = sentinel ? nodataMask(raster.samples, *sentinel)
                              : cv::Mat::zeros(size, CV_8UC1);

    cv::Mat valid;
    cv::bitwise_not(nodata, valid);
    for (int b = 0; b < used; ++b) cv::bitwise_and(valid, finite[b], valid);
    const bool anyValid = cv::countNonZero(valid) > 0;

    // --- 3) Range
    std::vector<double> lo(used, 0.0), hi(used, 0.0);
    std::vector<bool> degenerate(used, true);

    if (anyValid && opt.stretch == StretchMode::MinMax) {
        double gmin =  std::numeric_limits<double>::infinity();
        double gmax = -std::numeric_limits<double>::infinity();
        for (int b = 0; b < used; ++b) {
            double mn = 0.0, mx = 0.0;
            cv::minMaxLoc(bands64[b], &mn, &mx, nullptr, nullptr, valid);
            gmin = std::min(gmin, mn);
            gmax = std::max(gmax, mx);
        }
        for (int b = 0; b < used; ++b) {
            lo[b] = gmin; hi[b] = gmax; degenerate[b] = !(gmax > gmin);
        }
    } else if (anyValid) {
        for (int b = 0; b < used; ++b) {
            std::vector<double> s = validSamples(bands64[b], valid);
            lo[b] = percentileOf(s, opt.percentileLow);
            hi[b] = percentileOf(std::move(s), opt.percentileHigh);
            degenerate[b] = !(hi[b] > lo[b]);
        }
    }

    // --- 4) 8-bit planes, channel expansion, alpha
    std::vector<cv::Mat> u8(used);
    for (int b = 0; b < used; ++b)
        u8[b] = rescaleBand(bands64[b], finite[b], lo[b], hi[b], degenerate[b]);

    const cv::Mat& r = u8[0];
    const cv::Mat& g = used >= 3 ? u8[1] : u8[0];
    const cv::Mat& bl = used >= 3 ? u8[2] : u8[0];

    cv::Mat alpha(size, CV_8UC1, cv::Scalar(255));
    alpha.setTo(0, nodata);

    std::vector<cv::Mat> bgra{bl, g, r, alpha};
    cv::merge(bgra, out.image);

    out.masked       = sentinel.has_value();
    out.maskedPixels = static_cast<std::size_t>(cv::countNonZero(nodata));
    out.low          = lo[0];
    out.high         = hi[0];
    out.degenerate   = degenerate[0];
    return out;
}

const char* toString(StretchMode m) noexcept {
    switch (m) {
        case StretchMode::MinMax:     return "minmax";
        case StretchMode::Percentile: return "percentile";
        default:                      return "unknown";
    }
}

std::optional<StretchMode> parseStretchMode(const std::string& s) {
    if (s == "minmax")     return StretchMode::MinMax;
    if (s == "percentile") return StretchMode::Percentile;
    return std::nullopt;
}

} // namespace rasteranim
