#pragma once

#include <opencv2/core.hpp>
#include <filesystem>

namespace rasteranim {

// PNG persistence of preview images.
//
// Previews are kept in memory as CV_8UC4 BGRA; on disk they are ordinary
// 8-bit RGBA PNG files. The compression level is fixed so the same preview
// always produces the same bytes.

constexpr int kPngCompression = 3;

/* Destination of the preview for `source`: <outDir>/<source stem>.png */
std::filesystem::path previewPathFor(const std::filesystem::path& source,
                                     const std::filesystem::path& outDir);

/* Write a CV_8UC4 preview as PNG. Throws IoError when the file cannot be written. */
void writePreviewPng(const cv::Mat& bgra, const std::filesystem::path& path);

/* Read a PNG back as CV_8UC4 (BGRA).
   Gray, BGR and 16-bit PNGs are promoted. Throws DecodeError if unreadable. */
cv::Mat readPreviewPng(const std::filesystem::path& path);

} // namespace rasteranim
