#include "OpenCvTiffDecoder.hpp"
#include "rasteranim/core/Errors.hpp"
#include "tiff/GdalNodata.hpp"

#include <opencv2/imgcodecs.hpp>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace rasteranim {

/* Undo OpenCV's BGR(A) ordering for 3- and 4-band images. */
static cv::Mat toFileBandOrder(const cv::Mat& m) {
    if (m.channels() != 3 && m.channels() != 4) return m;
    std::vector<cv::Mat> planes;
    cv::split(m, planes);
    std::swap(planes[0], planes[2]);
    cv::Mat out;
    cv::merge(planes, out);
    return out;
}

Raster OpenCvTiffDecoder::decode(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
        throw DecodeError("raster file not found", path);

    cv::Mat img;
    try {
        img = cv::imread(path.string(), cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        throw DecodeError(std::string("TIFF decoder failed (") + e.what() + ")", path);
    }
    if (img.empty())
        throw DecodeError("not a readable TIFF raster", path);

    Raster r{};
    r.samples = toFileBandOrder(img);
    r.nodata  = readGdalNodata(path);
    r.source  = path;
    return r;
}

} // namespace rasteranim
