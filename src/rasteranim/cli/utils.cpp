#include "utils.hpp"
#include "rasteranim/core/Errors.hpp"

#include <iostream>

/*
  Write the run manifest.

  - If no manifest path is configured, do nothing.
  - On success/failure, print a log line with the path.
*/
int save_manifest(const std::string& tag,
                  const manifest::RunInfo& run,
                  const rasteranim::PipelineConfig& cfg,
                  const rasteranim::PipelineReport& rep,
                  int exitCode)
{
    if (cfg.manifestPath.empty()) return exitCode;
    try {
        manifest::write_manifest(cfg.manifestPath, run, cfg, rep);
        std::cout << "[" << tag << "] manifest saved: " << cfg.manifestPath.string() << "\n";
        return exitCode;
    } catch (const rasteranim::Error& e) {
        std::cerr << "[" << tag << "] " << e.what() << "\n";
        return kExitFail;
    }
}

int exit_code_for(const std::string& tag, const rasteranim::PipelineReport& rep) {
    const auto failed = rep.failures();
    if (failed == 0) return kExitOk;
    std::cerr << "[" << tag << "] " << failed << " of " << rep.inputs.size()
              << " raster(s) failed to convert\n";
    return kExitFail;
}
