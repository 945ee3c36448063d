#include "options.hpp"
#include "args.hpp"

#include "rasteranim/core/Errors.hpp"

#include <iostream>
#include <string>

rasteranim::PipelineConfig configFromArgs(int argc, char** argv, rasteranim::Stage stage)
{
    using rasteranim::Stage;

    rasteranim::PipelineConfig cfg{};
    cfg.inputDirectory      = argValue(argc, argv, "input");
    cfg.outputDirectory     = argValue(argc, argv, "output");
    cfg.outputAnimationPath = argValue(argc, argv, "gif");
    cfg.manifestPath        = argValue(argc, argv, "manifest");

    cfg.nodataValue     = argValueDouble(argc, argv, "nodata");
    cfg.frameDurationMs = argValueInt(argc, argv, "duration", cfg.frameDurationMs);
    cfg.loopCount       = argValueInt(argc, argv, "loop", cfg.loopCount);

    const std::string defExt = (stage == Stage::Animate) ? "png" : "tif,tiff";
    cfg.extensions = split_list(argValue(argc, argv, "ext", defExt));
    cfg.recursive  = argHas(argc, argv, "recursive");

    const std::string stretch = argValue(argc, argv, "stretch", "minmax");
    auto mode = rasteranim::parseStretchMode(stretch);
    if (!mode) throw rasteranim::ConfigError("--stretch must be minmax or percentile, got '" + stretch + "'");
    cfg.stretch = *mode;
    if (auto v = argValueDouble(argc, argv, "plow"))  cfg.percentileLow  = *v;
    if (auto v = argValueDouble(argc, argv, "phigh")) cfg.percentileHigh = *v;

    cfg.overlay.bar_height   = argValueInt(argc, argv, "bar", cfg.overlay.bar_height);
    cfg.overlay.draw_caption = !argHas(argc, argv, "no-caption");
    cfg.overlay.draw_percent = !argHas(argc, argv, "no-percent");
    if (cfg.overlay.bar_height <= 0)
        throw rasteranim::ConfigError("--bar must be positive");

    return cfg;
}

void print_options() {
    std::cout
        << "Options:\n"
        << "  --input=DIR          rasters (run/convert) or PNG previews (animate)\n"
        << "  --output=DIR         preview directory, created if absent\n"
        << "  --gif=FILE           animation path\n"
        << "  --nodata=V           sentinel rendered transparent (default: none)\n"
        << "  --duration=MS        per-frame duration (default: 300)\n"
        << "  --loop=N             GIF loop count, 0 = forever (default: 0)\n"
        << "  --ext=LIST           input extensions (default: tif,tiff; animate: png)\n"
        << "  --recursive          also scan subdirectories\n"
        << "  --stretch=MODE       minmax | percentile (default: minmax)\n"
        << "  --plow=P --phigh=P   percentile bounds (default: 1 / 98)\n"
        << "  --bar=PX             progress bar height (default: 20)\n"
        << "  --no-caption         do not print the frame name\n"
        << "  --no-percent         do not print the percentage\n"
        << "  --manifest=FILE      write a JSON run manifest\n";
}
