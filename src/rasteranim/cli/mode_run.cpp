#include "modes.hpp"
#include "options.hpp"
#include "utils.hpp"

#include "rasteranim/core/Codecs.hpp"
#include "rasteranim/core/Errors.hpp"
#include "rasteranim/core/Pipeline.hpp"

#include <opencv2/core.hpp>
#include <exception>
#include <iostream>
#include <string>

int run_full(int argc, char** argv) {
    manifest::RunInfo run{"run", manifest::iso_utc_now(), manifest::join_argv(argc, argv), {}};

    rasteranim::PipelineConfig cfg;
    try {
        cfg = configFromArgs(argc, argv, rasteranim::Stage::Full);
        rasteranim::validateConfig(cfg, rasteranim::Stage::Full);
    } catch (const rasteranim::ConfigError& e) {
        std::cerr << "[run] " << e.what() << "\n"
                  << "[run] usage: rasteranim-cli run --input=DIR --output=DIR --gif=FILE [options]\n";
        return kExitUsage;
    }

    auto decoder = rasteranim::makeTiffDecoder();
    auto encoder = rasteranim::makeGifEncoder();
    rasteranim::Pipeline pipeline(*decoder, *encoder, cfg);

    std::cout << "[run] " << cfg.inputDirectory.string() << " -> "
              << cfg.outputDirectory.string() << " -> " << cfg.outputAnimationPath.string() << "\n";

    rasteranim::PipelineReport rep{};
    try {
        pipeline.run(rep);
    } catch (const rasteranim::Error& e) {
        std::cerr << "[run] error: " << e.what() << "\n";
        run.error = e.what();
        return save_manifest("run", run, cfg, rep, kExitFail);
    } catch (const cv::Exception& e) {
        std::cerr << "[run] OpenCV error: " << e.what() << "\n";
        run.error = e.what();
        return save_manifest("run", run, cfg, rep, kExitFail);
    } catch (const std::exception& e) {
        std::cerr << "[run] unexpected error: " << e.what() << "\n";
        run.error = e.what();
        return save_manifest("run", run, cfg, rep, kExitFail);
    }

    const int code = exit_code_for("run", rep);
    std::cout << "[run] finished.\n";
    return save_manifest("run", run, cfg, rep, code);
}
