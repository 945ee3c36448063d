#include "rasteranim/core/Config.hpp"
#include "rasteranim/core/Errors.hpp"

#include <string>
#include <system_error>

namespace rasteranim {

void validateConfig(const PipelineConfig& cfg, Stage stage)
{
    if (cfg.inputDirectory.empty())
        throw ConfigError("input directory is required");
    std::error_code ec;
    if (!std::filesystem::is_directory(cfg.inputDirectory, ec))
        throw ConfigError("input directory not found: " + cfg.inputDirectory.string());

    if (stage != Stage::Animate && cfg.outputDirectory.empty())
        throw ConfigError("output directory is required");
    if (stage != Stage::Convert && cfg.outputAnimationPath.empty())
        throw ConfigError("output animation path is required");

    if (cfg.extensions.empty())
        throw ConfigError("at least one input extension is required");

    if (stage != Stage::Convert) {
        if (cfg.frameDurationMs <= 0)
            throw ConfigError("frame duration must be positive, got " +
                              std::to_string(cfg.frameDurationMs) + " ms");
        if (cfg.loopCount < 0)
            throw ConfigError("loop count must not be negative");
    }

    if (stage != Stage::Animate && cfg.stretch == StretchMode::Percentile) {
        if (!(cfg.percentileLow >= 0.0 && cfg.percentileHigh <= 100.0 &&
              cfg.percentileLow < cfg.percentileHigh))
            throw ConfigError("percentiles must satisfy 0 <= low < high <= 100");
    }
}

NormalizeOptions normalizeOptionsFrom(const PipelineConfig& cfg)
{
    NormalizeOptions o{};
    o.nodata         = cfg.nodataValue;
    o.stretch        = cfg.stretch;
    o.percentileLow  = cfg.percentileLow;
    o.percentileHigh = cfg.percentileHigh;
    return o;
}

AssembleOptions assembleOptionsFrom(const PipelineConfig& cfg)
{
    AssembleOptions o{};
    o.frame_duration_ms = cfg.frameDurationMs;
    o.loop_count        = cfg.loopCount;
    o.overlay           = cfg.overlay;
    return o;
}

} // namespace rasteranim
