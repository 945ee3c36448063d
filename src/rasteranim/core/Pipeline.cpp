#include "rasteranim/core/Pipeline.hpp"
#include "rasteranim/core/Errors.hpp"
#include "rasteranim/io/PreviewIO.hpp"
#include "rasteranim/normalize/Normalizer.hpp"

#include <opencv2/core.hpp>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <set>
#include <string>
#include <system_error>
#include <utility>

namespace rasteranim {

// ---------------- helpers ----------------

static bool ieq(const std::string& a, const std::string& b) {
    if (a.size()!=b.size()) return false;
    for (size_t i=0;i<a.size();++i)
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    return true;
}

static std::string ext_of(const std::filesystem::path& p) {
    std::string e = p.extension().string();
    if (!e.empty() && e[0]=='.') e.erase(0,1);
    return e;
}

static bool ext_allowed(const std::filesystem::path& p, const std::vector<std::string>& exts) {
    const std::string e = ext_of(p);
    for (const auto& a : exts) {
        std::string want = a;
        if (!want.empty() && want[0]=='.') want.erase(0,1);
        if (ieq(e, want)) return true;
    }
    return false;
}

/*
  Directory listing.

  - Subdirectories that cannot be opened are skipped (recursive mode).
  - Any other error while walking becomes IoError for `dir`.
*/
std::vector<std::filesystem::path>
listFiles(const std::filesystem::path& dir,
          const std::vector<std::string>& exts,
          bool recursive)
{
    namespace fs = std::filesystem;
    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return files;

    auto fail = [&](const std::error_code& e) {
        throw IoError("cannot list directory (" + e.message() + ")", dir);
    };
    auto take = [&](const fs::directory_entry& de) {
        std::error_code fec;
        if (de.is_regular_file(fec) && ext_allowed(de.path(), exts)) files.push_back(de.path());
    };

    const auto opts = fs::directory_options::skip_permission_denied;
    if (recursive) {
        fs::recursive_directory_iterator it(dir, opts, ec), end;
        if (ec) fail(ec);
        while (it != end) {
            take(*it);
            it.increment(ec);
            if (ec) fail(ec);
        }
    } else {
        fs::directory_iterator it(dir, opts, ec), end;
        if (ec) fail(ec);
        while (it != end) {
            take(*it);
            it.increment(ec);
            if (ec) fail(ec);
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::size_t PipelineReport::failures() const {
    return static_cast<std::size_t>(std::count_if(conversions.begin(), conversions.end(),
                                                  [](const ConversionRecord& c){ return !c.ok; }));
}

std::vector<std::filesystem::path> PipelineReport::previews() const {
    std::vector<std::filesystem::path> out;
    for (const auto& c : conversions) if (c.ok) out.push_back(c.preview);
    return out;
}

// ---------------- Pipeline ----------------

Pipeline::Pipeline(IRasterDecoder& decoder, IAnimationEncoder& encoder, PipelineConfig cfg)
    : decoder_(decoder), encoder_(encoder), cfg_(std::move(cfg)) {}

void Pipeline::ensureOutputDirectory() const {
    std::error_code ec;
    std::filesystem::create_directories(cfg_.outputDirectory, ec);
    if (ec || !std::filesystem::is_directory(cfg_.outputDirectory, ec))
        throw IoError("cannot create output directory", cfg_.outputDirectory);
}

Preview Pipeline::convertOne(const std::filesystem::path& source,
                             const std::filesystem::path& preview)
{
    Raster raster = decoder_.decode(source);

    Preview p;
    try {
        p = normalizeRaster(raster, normalizeOptionsFrom(cfg_));
    } catch (const cv::Exception& e) {
        // e.g. a sample type the conversion routines do not accept
        throw DecodeError(std::string("cannot normalize raster (") + e.what() + ")", source);
    }

    writePreviewPng(p.image, preview);
    return p;
}

PipelineReport Pipeline::convert() {
    validateConfig(cfg_, Stage::Convert);
    return convertValidated();
}

/*
  Convert every discovered raster.

  - Sorted discovery order is kept in the report.
  - Two sources with the same stem would overwrite each other's
    preview (possible with recursive=true); the later one fails, unless
    the earlier one failed and wrote nothing.
  - DecodeError / IoError are per file: logged, recorded, loop continues.
*/
PipelineReport Pipeline::convertValidated() {
    PipelineReport rep{};
    rep.inputs = listFiles(cfg_.inputDirectory, cfg_.extensions, cfg_.recursive);
    if (rep.inputs.empty())
        throw EmptyInputError("no raster files found", cfg_.inputDirectory);

    std::cout << "[convert] found " << rep.inputs.size() << " raster(s) in "
              << cfg_.inputDirectory.string() << "\n";

    ensureOutputDirectory();

    std::set<std::filesystem::path> produced;
    for (const auto& src : rep.inputs) {
        ConversionRecord rec{};
        rec.source  = src;
        rec.preview = previewPathFor(src, cfg_.outputDirectory);

        try {
            if (produced.count(rec.preview))
                throw IoError("preview name already used by another source", rec.preview);

            Preview p = convertOne(src, rec.preview);
            produced.insert(rec.preview);
            rec.ok           = true;
            rec.width        = p.width();
            rec.height       = p.height();
            rec.masked       = p.masked;
            rec.maskedPixels = p.maskedPixels;

            std::cout << "[convert] " << src.filename().string() << " -> "
                      << rec.preview.string() << " (" << rec.width << "x" << rec.height;
            if (rec.masked) std::cout << ", " << rec.maskedPixels << " px transparent";
            if (p.degenerate) std::cout << ", flat";
            std::cout << ")\n";
        } catch (const Error& e) {
            rec.ok    = false;
            rec.error = e.what();
            std::cerr << "[convert] failed '" << src.string() << "': " << e.what() << "\n";
        }
        rep.conversions.push_back(std::move(rec));
    }

    std::cout << "[convert] done: " << (rep.conversions.size() - rep.failures())
              << " converted, " << rep.failures() << " failed\n";
    return rep;
}

AssembleResult Pipeline::animate(const std::vector<std::filesystem::path>& previews) {
    std::cout << "[animate] " << previews.size() << " frame(s) -> "
              << cfg_.outputAnimationPath.string() << "\n";
    AssembleResult res = assembleAnimation(previews, cfg_.outputAnimationPath,
                                           encoder_, assembleOptionsFrom(cfg_));
    std::cout << "[animate] saved " << res.output.string() << " ("
              << res.frames << " frames, " << res.size.width << "x" << res.size.height
              << ", " << cfg_.frameDurationMs << " ms/frame)\n";
    return res;
}

PipelineReport Pipeline::animateDirectory() {
    validateConfig(cfg_, Stage::Animate);

    PipelineReport rep{};
    rep.inputs = listFiles(cfg_.inputDirectory, cfg_.extensions, cfg_.recursive);
    if (rep.inputs.empty())
        throw EmptyInputError("no preview images found", cfg_.inputDirectory);

    rep.animation = animate(rep.inputs);
    return rep;
}

void Pipeline::run(PipelineReport& rep) {
    validateConfig(cfg_, Stage::Full);

    rep = convertValidated();
    const auto previews = rep.previews();
    if (previews.empty())
        throw EmptyInputError("no raster could be converted", cfg_.inputDirectory);

    rep.animation = animate(previews);
}

PipelineReport Pipeline::run() {
    PipelineReport rep{};
    run(rep);
    return rep;
}

} // namespace rasteranim
