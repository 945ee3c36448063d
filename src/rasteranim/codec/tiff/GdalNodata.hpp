#pragma once

#include <filesystem>
#include <optional>

namespace rasteranim {

/* GDAL_NODATA: ASCII tag holding the sentinel as text ("-9999", "nan"). */
constexpr unsigned kGdalNodataTag = 42113;

/*
  Make libtiff aware of the GDAL private tags.
  Safe to call repeatedly; must run before the TIFFOpen() that needs them.
*/
void registerGdalTiffTags();

/*
  No-data sentinel declared in the first directory of a TIFF file.
  nullopt when the file is not a TIFF, has no tag, or the tag text is not
  a number (a warning is printed in that case).
*/
std::optional<double> readGdalNodata(const std::filesystem::path& path);

} // namespace rasteranim
