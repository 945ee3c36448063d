#include "manifest.hpp"

#include "rasteranim/core/Errors.hpp"

#include <opencv2/core/version.hpp>
#include <zlib.h>

#include <chrono>
#include <cmath>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <optional>
#include <sstream>
#include <system_error>
#include <vector>

#ifndef RASTERANIM_VERSION
#define RASTERANIM_VERSION "dev"
#endif

namespace manifest {

std::string iso_utc_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    std::ostringstream os;
    os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return os.str();
}

std::string jesc(const std::string& s) {
    std::string o; o.reserve(s.size()+8);
    for (char c: s) {
        switch(c){
            case '\"': o += "\\\""; break;
            case '\\': o += "\\\\"; break;
            case '\n': o += "\\n"; break;
            case '\r': o += "\\r"; break;
            case '\t': o += "\\t"; break;
            default: o += (unsigned char)c < 0x20 ? '?' : c;
        }
    }
    return o;
}

std::string join_argv(int argc, char** argv) {
    std::ostringstream os;
    for (int i=0;i<argc;++i) {
        if (i) os<<' ';
        os<<argv[i];
    }
    return os.str();
}

std::string crc32_file_hex(const std::filesystem::path& p) {
    std::ifstream f(p, std::ios::binary);
    if (!f) return "";
    std::vector<char> buf(1<<16);
    uLong crc = crc32(0L, Z_NULL, 0);
    while (f) {
        f.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        const std::streamsize got = f.gcount();
        if (got <= 0) break;
        crc = crc32(crc, reinterpret_cast<const Bytef*>(buf.data()), static_cast<uInt>(got));
    }
    std::ostringstream os;
    os << std::hex << std::setfill('0') << std::setw(8) << std::uppercase << crc;
    return os.str();
}

static std::uintmax_t size_or_zero(const std::filesystem::path& p) {
    std::error_code ec;
    const auto n = std::filesystem::file_size(p, ec);
    return ec ? 0 : n;
}

/* JSON has no NaN literal; a NaN sentinel is written as a string. */
static std::string nodata_json(const std::optional<double>& v) {
    if (!v) return "null";
    if (std::isnan(*v)) return "\"nan\"";
    std::ostringstream os;
    os << std::setprecision(17) << *v;
    return os.str();
}

static std::string ext_json(const std::vector<std::string>& exts) {
    std::string o = "[";
    for (std::size_t i = 0; i < exts.size(); ++i) {
        if (i) o += ", ";
        o += "\"" + jesc(exts[i]) + "\"";
    }
    return o + "]";
}

void write_manifest(const std::filesystem::path& path,
                    const RunInfo& run,
                    const rasteranim::PipelineConfig& cfg,
                    const rasteranim::PipelineReport& rep)
{
    std::ostringstream j;
    j << "{\n";
    j << "  \"manifest_version\": \"1\",\n";
    j << "  \"mode\": \"" << jesc(run.mode) << "\",\n";
    j << "  \"started_at\": \"" << run.started_at << "\",\n";
    j << "  \"finished_at\": \"" << iso_utc_now() << "\",\n";
    j << "  \"cli\": { \"argv\": \"" << jesc(run.argv) << "\" },\n";
    j << "  \"software\": {\n";
    j << "    \"rasteranim_version\": \"" << RASTERANIM_VERSION << "\",\n";
    j << "    \"opencv\": \"" << CV_VERSION << "\"\n";
    j << "  },\n";
    j << "  \"config\": {\n";
    j << "    \"input_directory\": \"" << jesc(cfg.inputDirectory.string()) << "\",\n";
    j << "    \"output_directory\": \"" << jesc(cfg.outputDirectory.string()) << "\",\n";
    j << "    \"output_animation_path\": \"" << jesc(cfg.outputAnimationPath.string()) << "\",\n";
    j << "    \"nodata_value\": " << nodata_json(cfg.nodataValue) << ",\n";
    j << "    \"frame_duration_ms\": " << cfg.frameDurationMs << ",\n";
    j << "    \"loop_count\": " << cfg.loopCount << ",\n";
    j << "    \"extensions\": " << ext_json(cfg.extensions) << ",\n";
    j << "    \"recursive\": " << (cfg.recursive ? "true" : "false") << ",\n";
    j << "    \"stretch\": \"" << rasteranim::toString(cfg.stretch) << "\"\n";
    j << "  },\n";

    j << "  \"stats\": { \"inputs\": " << rep.inputs.size()
      << ", \"converted\": " << (rep.conversions.size() - rep.failures())
      << ", \"failed\": " << rep.failures() << " },\n";

    j << "  \"conversions\": [\n";
    for (std::size_t i = 0; i < rep.conversions.size(); ++i) {
        const auto& c = rep.conversions[i];
        j << "    {\"source\":\"" << jesc(c.source.string()) << "\","
          << "\"preview\":\"" << jesc(c.preview.string()) << "\","
          << "\"ok\":" << (c.ok ? "true" : "false");
        if (c.ok) {
            j << ",\"width\":" << c.width << ",\"height\":" << c.height
              << ",\"transparent_px\":" << c.maskedPixels
              << ",\"size\":" << size_or_zero(c.preview)
              << ",\"crc32\":\"" << crc32_file_hex(c.preview) << "\"";
        } else {
            j << ",\"error\":\"" << jesc(c.error) << "\"";
        }
        j << "}" << (i + 1 < rep.conversions.size() ? "," : "") << "\n";
    }
    j << "  ],\n";

    if (rep.animation) {
        const auto& a = *rep.animation;
        j << "  \"animation\": {\"path\":\"" << jesc(a.output.string()) << "\","
          << "\"frames\":" << a.frames << ","
          << "\"width\":" << a.size.width << ",\"height\":" << a.size.height << ","
          << "\"size\":" << size_or_zero(a.output) << ","
          << "\"crc32\":\"" << crc32_file_hex(a.output) << "\"},\n";
    } else {
        j << "  \"animation\": null,\n";
    }
    j << "  \"error\": " << (run.error.empty() ? "null" : "\"" + jesc(run.error) + "\"") << "\n";
    j << "}\n";

    std::error_code ec;
    if (!path.parent_path().empty()) std::filesystem::create_directories(path.parent_path(), ec);
    std::ofstream f(path, std::ios::binary);
    f << j.str();
    if (!f) throw rasteranim::IoError("failed to write manifest", path);
}

} // namespace manifest
