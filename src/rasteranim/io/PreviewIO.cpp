#include "rasteranim/io/PreviewIO.hpp"
#include "rasteranim/core/Errors.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <string>
#include <vector>

namespace rasteranim {

std::filesystem::path previewPathFor(const std::filesystem::path& source,
                                     const std::filesystem::path& outDir)
{
    std::filesystem::path name = source.stem();
    name += ".png";
    return outDir / name;
}

void writePreviewPng(const cv::Mat& bgra, const std::filesystem::path& path)
{
    CV_Assert(bgra.type() == CV_8UC4);

    const std::vector<int> params{cv::IMWRITE_PNG_COMPRESSION, kPngCompression};
    bool ok = false;
    std::string why = "failed to write PNG";
    try {
        ok = cv::imwrite(path.string(), bgra, params);
    } catch (const cv::Exception& e) {
        why = std::string("PNG encoder failed (") + e.what() + ")";
    }
    if (!ok) throw IoError(why, path);
}

/*
  Read any PNG as 8-bit BGRA.

  - 16-bit data is scaled down by 257 (65535 → 255).
  - Gray and BGR images get an opaque alpha channel.
*/
cv::Mat readPreviewPng(const std::filesystem::path& path)
{
    cv::Mat src;
    try {
        src = cv::imread(path.string(), cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        throw DecodeError(std::string("PNG decoder failed (") + e.what() + ")", path);
    }
    if (src.empty()) throw DecodeError("not a readable image", path);

    cv::Mat u8;
    switch (src.depth()) {
        case CV_8U:  u8 = src;                                    break;
        case CV_16U: src.convertTo(u8, CV_8U, 1.0 / 257.0);       break;
        default:
            throw DecodeError("unsupported preview sample depth", path);
    }

    cv::Mat bgra;
    switch (u8.channels()) {
        case 1: cv::cvtColor(u8, bgra, cv::COLOR_GRAY2BGRA); break;
        case 3: cv::cvtColor(u8, bgra, cv::COLOR_BGR2BGRA);  break;
        case 4: bgra = u8;                                   break;
        default:
            throw DecodeError("unsupported preview channel count", path);
    }
    return bgra;
}

} // namespace rasteranim
