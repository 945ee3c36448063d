#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace rasteranim {

/*
  Base class for all pipeline errors.
  Every error remembers the file it is about (may be empty for
  configuration problems), and what() already contains that path.
*/
class Error : public std::runtime_error {
public:
    Error(const std::string& msg, std::filesystem::path path)
        : std::runtime_error(path.empty() ? msg : msg + ": " + path.string()),
          path_(std::move(path)) {}

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

/* Source raster is unreadable, malformed or has an unsupported sample type. */
class DecodeError : public Error {
public:
    using Error::Error;
};

/* Frames handed to the assembler do not share one width/height. */
class DimensionMismatchError : public Error {
public:
    using Error::Error;
};

/* Nothing to process: no rasters found, or no preview survived conversion. */
class EmptyInputError : public Error {
public:
    using Error::Error;
};

/* Output directory or file could not be written. */
class IoError : public Error {
public:
    using Error::Error;
};

/* Invalid pipeline configuration. */
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& msg)
        : Error(msg, {}) {}
};

} // namespace rasteranim
