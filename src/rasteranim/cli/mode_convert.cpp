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

int run_convert(int argc, char** argv) {
    manifest::RunInfo run{"convert", manifest::iso_utc_now(), manifest::join_argv(argc, argv), {}};

    rasteranim::PipelineConfig cfg;
    try {
        cfg = configFromArgs(argc, argv, rasteranim::Stage::Convert);
        rasteranim::validateConfig(cfg, rasteranim::Stage::Convert);
    } catch (const rasteranim::ConfigError& e) {
        std::cerr << "[convert] " << e.what() << "\n"
                  << "[convert] usage: rasteranim-cli convert --input=DIR --output=DIR [options]\n";
        return kExitUsage;
    }

    // the encoder is never used in this mode, the pipeline just needs one
    auto decoder = rasteranim::makeTiffDecoder();
    auto encoder = rasteranim::makeGifEncoder();
    rasteranim::Pipeline pipeline(*decoder, *encoder, cfg);

    rasteranim::PipelineReport rep{};
    try {
        rep = pipeline.convert();
    } catch (const rasteranim::Error& e) {
        std::cerr << "[convert] error: " << e.what() << "\n";
        run.error = e.what();
        return save_manifest("convert", run, cfg, rep, kExitFail);
    } catch (const cv::Exception& e) {
        std::cerr << "[convert] OpenCV error: " << e.what() << "\n";
        run.error = e.what();
        return save_manifest("convert", run, cfg, rep, kExitFail);
    } catch (const std::exception& e) {
        std::cerr << "[convert] unexpected error: " << e.what() << "\n";
        run.error = e.what();
        return save_manifest("convert", run, cfg, rep, kExitFail);
    }

    return save_manifest("convert", run, cfg, rep, exit_code_for("convert", rep));
}
