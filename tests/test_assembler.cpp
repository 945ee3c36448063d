#include "rasteranim/compose/Assembler.hpp"
#include "rasteranim/core/Codecs.hpp"
#include "rasteranim/core/Errors.hpp"
#include "rasteranim/io/PreviewIO.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include <filesystem>
#include <vector>

using namespace rasteranim;
using testing_support::RecordingEncoder;
using testing_support::TempDir;

namespace fs = std::filesystem;

namespace {

fs::path solidPng(const TempDir& dir, const std::string& name, const cv::Scalar& bgra,
                  cv::Size size = {40, 40}) {
    const fs::path p = dir / (name + ".png");
    writePreviewPng(cv::Mat(size, CV_8UC4, bgra), p);
    return p;
}

AssembleOptions barOnly() {
    AssembleOptions o{};
    o.overlay.draw_caption = false;
    o.overlay.draw_percent = false;
    return o;
}

} // namespace

TEST(Assembler, FramesKeepTheGivenOrder) {
    TempDir dir;
    const auto red   = solidPng(dir, "f0", {0, 0, 255, 255});
    const auto green = solidPng(dir, "f1", {0, 255, 0, 255});
    const auto blue  = solidPng(dir, "f2", {255, 0, 0, 255});

    RecordingEncoder enc;
    const AssembleResult res = assembleAnimation({blue, red, green}, dir / "out.gif", enc, barOnly());

    ASSERT_EQ(enc.calls, 1);
    ASSERT_EQ(enc.last.frames.size(), 3u);
    EXPECT_EQ(enc.last.frames[0].at<cv::Vec4b>(0, 0), cv::Vec4b(255, 0, 0, 255));
    EXPECT_EQ(enc.last.frames[1].at<cv::Vec4b>(0, 0), cv::Vec4b(0, 0, 255, 255));
    EXPECT_EQ(enc.last.frames[2].at<cv::Vec4b>(0, 0), cv::Vec4b(0, 255, 0, 255));

    EXPECT_EQ(res.frames, 3u);
    EXPECT_EQ(res.size, cv::Size(40, 40));
    EXPECT_EQ(res.output, dir / "out.gif");
    EXPECT_EQ(enc.lastPath, dir / "out.gif");
}

TEST(Assembler, EveryFrameCarriesItsProgressBar) {
    TempDir dir;
    std::vector<fs::path> frames;
    for (int i = 0; i < 4; ++i)
        frames.push_back(solidPng(dir, "f" + std::to_string(i), {0, 0, 0, 255}, {100, 100}));

    RecordingEncoder enc;
    const AssembleOptions opt = barOnly();
    assembleAnimation(frames, dir / "out.gif", enc, opt);

    ASSERT_EQ(enc.last.frames.size(), 4u);
    for (std::size_t i = 0; i < 4; ++i) {
        const cv::Mat& f = enc.last.frames[i];
        EXPECT_EQ(f.type(), CV_8UC4);
        EXPECT_EQ(f.size(), cv::Size(100, 100));

        const BarGeometry g = progressBarGeometry(f.size(), i, 4, opt.overlay);
        const cv::Vec4b lastFilled = f.at<cv::Vec4b>(g.filled.y, g.filled.br().x - 1);
        EXPECT_EQ(lastFilled, cv::Vec4b(255, 255, 255, 255)) << "frame " << i;
    }
}

TEST(Assembler, DurationsAndLoopCountAreForwarded) {
    TempDir dir;
    const auto a = solidPng(dir, "a", {10, 10, 10, 255});
    const auto b = solidPng(dir, "b", {20, 20, 20, 255});

    AssembleOptions opt = barOnly();
    opt.frame_duration_ms = 125;
    opt.loop_count = 3;

    RecordingEncoder enc;
    assembleAnimation({a, b}, dir / "out.gif", enc, opt);

    EXPECT_EQ(enc.last.durationsMs, (std::vector<int>{125, 125}));
    EXPECT_EQ(enc.last.loopCount, 3);
}

TEST(Assembler, DefaultsAreThreeHundredMsAndLoopForever) {
    const AssembleOptions opt{};
    EXPECT_EQ(opt.frame_duration_ms, 300);
    EXPECT_EQ(opt.loop_count, 0);
}

TEST(Assembler, SizeMismatchFailsBeforeWriting) {
    TempDir dir;
    const auto a = solidPng(dir, "a", {0, 0, 0, 255}, {40, 40});
    const auto b = solidPng(dir, "b", {0, 0, 0, 255}, {41, 40});

    RecordingEncoder enc;
    try {
        assembleAnimation({a, b}, dir / "out.gif", enc);
        FAIL() << "expected DimensionMismatchError";
    } catch (const DimensionMismatchError& e) {
        EXPECT_EQ(e.path(), b);
    }
    EXPECT_EQ(enc.calls, 0);
    EXPECT_FALSE(fs::exists(dir / "out.gif"));
}

TEST(Assembler, EmptyListIsRejected) {
    TempDir dir;
    RecordingEncoder enc;
    EXPECT_THROW(assembleAnimation({}, dir / "out.gif", enc), EmptyInputError);
    EXPECT_EQ(enc.calls, 0);
}

TEST(Assembler, NonPositiveDurationIsRejected) {
    TempDir dir;
    const auto a = solidPng(dir, "a", {0, 0, 0, 255});
    AssembleOptions opt{};
    opt.frame_duration_ms = 0;

    RecordingEncoder enc;
    EXPECT_THROW(assembleAnimation({a}, dir / "out.gif", enc, opt), ConfigError);
}

TEST(Assembler, UnreadableFrameIsDecodeError) {
    TempDir dir;
    const auto a = solidPng(dir, "a", {0, 0, 0, 255});
    const fs::path junk = dir / "junk.png";
    testing_support::writeText(junk, "this is not a png");

    RecordingEncoder enc;
    EXPECT_THROW(assembleAnimation({a, junk}, dir / "out.gif", enc), DecodeError);
    EXPECT_THROW(assembleAnimation({a, dir / "missing.png"}, dir / "out.gif", enc), DecodeError);
    EXPECT_EQ(enc.calls, 0);
}

TEST(Assembler, GrayPngIsPromotedToBgra) {
    TempDir dir;
    const fs::path gray = dir / "gray.png";
    ASSERT_TRUE(cv::imwrite(gray.string(), cv::Mat(20, 20, CV_8UC1, cv::Scalar(90))));

    RecordingEncoder enc;
    assembleAnimation({gray}, dir / "out.gif", enc, barOnly());

    ASSERT_EQ(enc.last.frames.size(), 1u);
    EXPECT_EQ(enc.last.frames[0].type(), CV_8UC4);
    EXPECT_EQ(enc.last.frames[0].at<cv::Vec4b>(0, 0), cv::Vec4b(90, 90, 90, 255));
}

TEST(Assembler, MissingOutputDirectoryIsCreated) {
    TempDir dir;
    const auto a = solidPng(dir, "a", {0, 0, 0, 255});

    RecordingEncoder enc;
    const fs::path out = dir / "nested" / "deeper" / "out.gif";
    assembleAnimation({a}, out, enc);
    EXPECT_TRUE(fs::is_directory(out.parent_path()));
    EXPECT_TRUE(fs::exists(out));
}

TEST(Assembler, WritesARealGif) {
    TempDir dir;
    std::vector<fs::path> frames;
    for (int i = 0; i < 3; ++i)
        frames.push_back(solidPng(dir, "f" + std::to_string(i),
                                  {double(40 * i), 80, 160, 255}, {64, 48}));

    auto enc = makeGifEncoder();
    const fs::path out = dir / "anim.gif";
    assembleAnimation(frames, out, *enc);

    ASSERT_TRUE(fs::exists(out));
    EXPECT_EQ(testing_support::readBytes(out).substr(0, 3), "GIF");

    cv::Animation back;
    ASSERT_TRUE(cv::imreadanimation(out.string(), back));
    ASSERT_EQ(back.frames.size(), 3u);
    EXPECT_EQ(back.frames[0].cols, 64);
    EXPECT_EQ(back.frames[0].rows, 48);
}

TEST(Assembler, FrameCaptionStopsAtFirstDot) {
    EXPECT_EQ(frameCaption("/out/scene.01.png"), "scene");
    EXPECT_EQ(frameCaption("png/b.png"), "b");
    EXPECT_EQ(frameCaption("noext"), "noext");
    EXPECT_EQ(frameCaption(".hidden.png"), "");
}
