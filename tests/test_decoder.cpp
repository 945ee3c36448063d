#include "rasteranim/core/Codecs.hpp"
#include "rasteranim/core/Errors.hpp"
#include "rasteranim/core/Pipeline.hpp"
#include "rasteranim/io/PreviewIO.hpp"
#include "tiff/GdalNodata.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <tiffio.h>

#include <cmath>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

using namespace rasteranim;
using testing_support::RecordingEncoder;
using testing_support::TempDir;
using testing_support::rampU16;

namespace fs = std::filesystem;

namespace {

/* Single-band 16-bit strip TIFF carrying a GDAL_NODATA tag. */
void writeTiffWithNodata(const fs::path& p, const cv::Mat& m, const std::string& nodata) {
    CV_Assert(m.type() == CV_16UC1);
    registerGdalTiffTags();

    TIFF* tf = TIFFOpen(p.string().c_str(), "w");
    if (!tf) throw std::runtime_error("test setup: cannot write " + p.string());

    TIFFSetField(tf, TIFFTAG_IMAGEWIDTH,      static_cast<uint32_t>(m.cols));
    TIFFSetField(tf, TIFFTAG_IMAGELENGTH,     static_cast<uint32_t>(m.rows));
    TIFFSetField(tf, TIFFTAG_SAMPLESPERPIXEL, 1);
    TIFFSetField(tf, TIFFTAG_BITSPERSAMPLE,   16);
    TIFFSetField(tf, TIFFTAG_SAMPLEFORMAT,    SAMPLEFORMAT_UINT);
    TIFFSetField(tf, TIFFTAG_PHOTOMETRIC,     PHOTOMETRIC_MINISBLACK);
    TIFFSetField(tf, TIFFTAG_PLANARCONFIG,    PLANARCONFIG_CONTIG);
    TIFFSetField(tf, TIFFTAG_ROWSPERSTRIP,    static_cast<uint32_t>(m.rows));
    TIFFSetField(tf, kGdalNodataTag,          nodata.c_str());

    for (int y = 0; y < m.rows; ++y) {
        if (TIFFWriteScanline(tf, const_cast<std::uint16_t*>(m.ptr<std::uint16_t>(y)),
                              static_cast<uint32_t>(y), 0) < 0) {
            TIFFClose(tf);
            throw std::runtime_error("test setup: TIFFWriteScanline failed for " + p.string());
        }
    }
    TIFFClose(tf);
}

} // namespace

TEST(TiffDecoder, ReadsDeclaredNodata) {
    TempDir dir;
    writeTiffWithNodata(dir / "a.tif", rampU16(4, 4, 0), "0");

    auto decoder = makeTiffDecoder();
    const Raster r = decoder->decode(dir / "a.tif");
    EXPECT_EQ(r.width(), 4);
    EXPECT_EQ(r.height(), 4);
    EXPECT_EQ(r.samples.at<std::uint16_t>(3, 3), 15);
    ASSERT_TRUE(r.nodata.has_value());
    EXPECT_DOUBLE_EQ(*r.nodata, 0.0);
}

TEST(TiffDecoder, NanAndPaddedSentinels) {
    TempDir dir;
    writeTiffWithNodata(dir / "nan.tif", rampU16(2, 2, 1), "nan");
    writeTiffWithNodata(dir / "pad.tif", rampU16(2, 2, 1), " -9999 ");

    const auto nan = readGdalNodata(dir / "nan.tif");
    ASSERT_TRUE(nan.has_value());
    EXPECT_TRUE(std::isnan(*nan));

    const auto pad = readGdalNodata(dir / "pad.tif");
    ASSERT_TRUE(pad.has_value());
    EXPECT_DOUBLE_EQ(*pad, -9999.0);
}

TEST(TiffDecoder, MalformedSentinelIsIgnored) {
    TempDir dir;
    writeTiffWithNodata(dir / "junk.tif", rampU16(2, 2, 1), "none");
    EXPECT_FALSE(readGdalNodata(dir / "junk.tif").has_value());
}

TEST(TiffDecoder, NoTagMeansNoNodata) {
    TempDir dir;
    testing_support::writeTiff(dir / "plain.tif", rampU16(2, 2, 0));
    testing_support::writeText(dir / "text.tif", "not a tiff");

    auto decoder = makeTiffDecoder();
    EXPECT_FALSE(decoder->decode(dir / "plain.tif").nodata.has_value());
    EXPECT_FALSE(readGdalNodata(dir / "text.tif").has_value());
    EXPECT_THROW((void)decoder->decode(dir / "text.tif"), DecodeError);
}

TEST(TiffDecoder, DeclaredNodataBecomesTransparentWithoutOverride) {
    TempDir dir;
    fs::create_directories(dir / "tif");
    writeTiffWithNodata(dir / "tif" / "a.tif", rampU16(4, 4, 0), "0");

    PipelineConfig cfg{};
    cfg.inputDirectory  = dir / "tif";
    cfg.outputDirectory = dir / "png";

    auto decoder = makeTiffDecoder();
    RecordingEncoder encoder;
    Pipeline pipeline(*decoder, encoder, cfg);
    const PipelineReport rep = pipeline.convert();

    ASSERT_EQ(rep.failures(), 0u);
    EXPECT_TRUE(rep.conversions[0].masked);
    const cv::Mat png = readPreviewPng(dir / "png" / "a.png");
    EXPECT_EQ(png.at<cv::Vec4b>(0, 0)[3], 0);
    EXPECT_EQ(png.at<cv::Vec4b>(0, 1)[3], 255);

    // a configured sentinel wins over the declared one
    cfg.nodataValue = 15.0;
    Pipeline overridden(*decoder, encoder, cfg);
    overridden.convert();
    const cv::Mat png2 = readPreviewPng(dir / "png" / "a.png");
    EXPECT_EQ(png2.at<cv::Vec4b>(0, 0)[3], 255);
    EXPECT_EQ(png2.at<cv::Vec4b>(3, 3)[3], 0);
}
