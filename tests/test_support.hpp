#pragma once

#include "rasteranim/core/Codecs.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace testing_support {

/* Fresh directory under the system temp dir, removed on destruction. */
class TempDir {
public:
    TempDir() {
        std::mt19937_64 rng{std::random_device{}()};
        std::ostringstream name;
        name << "rasteranim_test_" << std::hex << rng();
        path_ = std::filesystem::temp_directory_path() / name.str();
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(const std::string& rel) const { return path_ / rel; }

private:
    std::filesystem::path path_;
};

/* Encoder fake: keeps what it was given and writes a placeholder file. */
class RecordingEncoder final : public rasteranim::IAnimationEncoder {
public:
    void encode(const rasteranim::AnimationFrames& anim, const std::filesystem::path& path) override {
        ++calls;
        last = anim;
        lastPath = path;
        std::ofstream(path, std::ios::binary) << "GIF89a";
    }

    int calls{0};
    rasteranim::AnimationFrames last{};
    std::filesystem::path lastPath{};
};

/* Single-band 16-bit raster with samples first, first+1, ... in row-major order. */
inline cv::Mat rampU16(int rows, int cols, int first) {
    cv::Mat m(rows, cols, CV_16UC1);
    int v = first;
    for (int y = 0; y < rows; ++y)
        for (int x = 0; x < cols; ++x)
            m.at<std::uint16_t>(y, x) = static_cast<std::uint16_t>(v++);
    return m;
}

inline void writeTiff(const std::filesystem::path& p, const cv::Mat& m) {
    if (!cv::imwrite(p.string(), m)) throw std::runtime_error("test setup: cannot write " + p.string());
}

inline void writeText(const std::filesystem::path& p, const std::string& s) {
    std::ofstream(p, std::ios::binary) << s;
}

inline std::string readBytes(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
}

/* argv builder for the option parser. */
struct Argv {
    explicit Argv(std::vector<std::string> a) : args(std::move(a)) {
        for (auto& s : args) ptrs.push_back(s.data());
    }
    int argc() const { return static_cast<int>(ptrs.size()); }
    char** argv() { return ptrs.data(); }

    std::vector<std::string> args;
    std::vector<char*> ptrs;
};

} // namespace testing_support
