#pragma once
#include "rasteranim/core/Config.hpp"
#include "rasteranim/core/Pipeline.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace manifest {

/* Everything the run manifest describes. */
struct RunInfo {
    std::string mode;          // run | convert | animate
    std::string started_at;    // ISO-8601 UTC
    std::string argv;          // joined command line
    std::string error;         // fatal error of the run, empty on success
};

/* Current UTC time in ISO-8601 format. */
std::string iso_utc_now();

/* Minimal JSON string escaper: quotes, backslashes, and control chars. */
std::string jesc(const std::string& s);

/* Join argv arguments into a single command-line string. */
std::string join_argv(int argc, char** argv);

/* CRC32 (zlib) of a file as 8 upper-case hex digits; "" if unreadable. */
std::string crc32_file_hex(const std::filesystem::path& p);

/* Write the manifest JSON to 'path', creating parent directories.
   Throws rasteranim::IoError if the file cannot be written. */
void write_manifest(const std::filesystem::path& path,
                    const RunInfo& run,
                    const rasteranim::PipelineConfig& cfg,
                    const rasteranim::PipelineReport& rep);

} // namespace manifest
