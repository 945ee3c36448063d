#pragma once
#include "manifest.hpp"

#include "rasteranim/core/Config.hpp"
#include "rasteranim/core/Pipeline.hpp"

#include <string>

/*
  Helpers shared by the CLI modes.
  They only report; the pipeline itself never prints usage or exits.
*/

/* Process exit codes. */
constexpr int kExitOk    = 0;
constexpr int kExitFail  = 1;   // a conversion or the animation failed
constexpr int kExitUsage = 2;   // bad or missing options

/* Write the manifest if cfg.manifestPath is set.
   Prints a short message on success or failure; a manifest problem
   turns a successful run into kExitFail. */
int save_manifest(const std::string& tag,
                  const manifest::RunInfo& run,
                  const rasteranim::PipelineConfig& cfg,
                  const rasteranim::PipelineReport& rep,
                  int exitCode);

/* Exit code for a finished report: kExitFail if any conversion failed. */
int exit_code_for(const std::string& tag, const rasteranim::PipelineReport& rep);
