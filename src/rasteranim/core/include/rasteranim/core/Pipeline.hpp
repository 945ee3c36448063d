#pragma once
#include "rasteranim/core/Codecs.hpp"
#include "rasteranim/core/Config.hpp"
#include "rasteranim/core/Raster.hpp"
#include "rasteranim/compose/Assembler.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace rasteranim {

/// Outcome of converting one source raster.
struct ConversionRecord {
    std::filesystem::path source;
    std::filesystem::path preview;   // set even when the conversion failed
    bool        ok{false};
    std::string error;               // what() of the failure, empty when ok
    int         width{0}, height{0};
    bool        masked{false};
    std::size_t maskedPixels{0};
};

/// Everything a run produced, in discovery order.
struct PipelineReport {
    std::vector<std::filesystem::path> inputs;
    std::vector<ConversionRecord>      conversions;
    std::optional<AssembleResult>      animation;

    std::size_t failures() const;
    std::vector<std::filesystem::path> previews() const;  // successful ones only
};

/// List regular files under `dir` whose extension is in `exts`
/// (case-insensitive, without dot), sorted lexicographically by path.
/// Unreadable subdirectories are skipped; throws IoError if the walk fails.
std::vector<std::filesystem::path>
listFiles(const std::filesystem::path& dir,
          const std::vector<std::string>& exts,
          bool recursive = false);

/// Two-stage driver:
/// - convert(): every discovered raster → one PNG preview; failures are
///   logged and recorded per file, siblings keep going;
/// - animate(): previews → one animation; any error aborts the step;
/// - run(): convert() then animate() over the successful previews.
class Pipeline {
public:
    Pipeline(IRasterDecoder& decoder, IAnimationEncoder& encoder, PipelineConfig cfg);

    /// throws EmptyInputError (nothing discovered), IoError (output
    /// directory not creatable), ConfigError
    PipelineReport convert();

    /// animate an explicit, already ordered list of previews
    AssembleResult animate(const std::vector<std::filesystem::path>& previews);

    /// animate every preview found in the configured input directory
    PipelineReport animateDirectory();

    /// full run; throws EmptyInputError if no raster converted
    PipelineReport run();

    /// same as run(), but `rep` keeps the conversions when the
    /// animation step throws
    void run(PipelineReport& rep);

    /// one raster → one preview file; throws DecodeError / IoError
    Preview convertOne(const std::filesystem::path& source,
                       const std::filesystem::path& preview);

    const PipelineConfig& config() const { return cfg_; }

private:
    IRasterDecoder&    decoder_;
    IAnimationEncoder& encoder_;
    PipelineConfig     cfg_;

    PipelineReport convertValidated();
    void ensureOutputDirectory() const;
};

} // namespace rasteranim
