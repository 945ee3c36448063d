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

int run_animate(int argc, char** argv) {
    manifest::RunInfo run{"animate", manifest::iso_utc_now(), manifest::join_argv(argc, argv), {}};

    rasteranim::PipelineConfig cfg;
    try {
        cfg = configFromArgs(argc, argv, rasteranim::Stage::Animate);
        rasteranim::validateConfig(cfg, rasteranim::Stage::Animate);
    } catch (const rasteranim::ConfigError& e) {
        std::cerr << "[animate] " << e.what() << "\n"
                  << "[animate] usage: rasteranim-cli animate --input=DIR --gif=FILE [options]\n";
        return kExitUsage;
    }

    auto decoder = rasteranim::makeTiffDecoder();
    auto encoder = rasteranim::makeGifEncoder();
    rasteranim::Pipeline pipeline(*decoder, *encoder, cfg);

    rasteranim::PipelineReport rep{};
    try {
        rep = pipeline.animateDirectory();
    } catch (const rasteranim::Error& e) {
        std::cerr << "[animate] error: " << e.what() << "\n";
        run.error = e.what();
        return save_manifest("animate", run, cfg, rep, kExitFail);
    } catch (const cv::Exception& e) {
        std::cerr << "[animate] OpenCV error: " << e.what() << "\n";
        run.error = e.what();
        return save_manifest("animate", run, cfg, rep, kExitFail);
    } catch (const std::exception& e) {
        std::cerr << "[animate] unexpected error: " << e.what() << "\n";
        run.error = e.what();
        return save_manifest("animate", run, cfg, rep, kExitFail);
    }

    return save_manifest("animate", run, cfg, rep, kExitOk);
}
