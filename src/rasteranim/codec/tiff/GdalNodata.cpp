#include "GdalNodata.hpp"

#include <tiffio.h>

#include <array>
#include <cctype>
#include <exception>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>

namespace rasteranim {

namespace {

TIFFExtendProc g_parentExtender = nullptr;

void extendWithGdalTags(TIFF* tif) {
    static const TIFFFieldInfo info[] = {
        {kGdalNodataTag, -1, -1, TIFF_ASCII, FIELD_CUSTOM, 1, 0,
         const_cast<char*>("GDALNoDataValue")},
    };
    TIFFMergeFieldInfo(tif, info, 1);
    if (g_parentExtender) g_parentExtender(tif);
}

// "II*\0", "MM\0*" and the BigTIFF variants
bool hasTiffMagic(const std::filesystem::path& path) {
    std::array<char, 4> h{};
    std::ifstream f(path, std::ios::binary);
    if (!f.read(h.data(), h.size())) return false;
    const bool le = h[0] == 'I' && h[1] == 'I' && (h[2] == 42 || h[2] == 43) && h[3] == 0;
    const bool be = h[0] == 'M' && h[1] == 'M' && h[2] == 0 && (h[3] == 42 || h[3] == 43);
    return le || be;
}

std::string trim(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

} // namespace

void registerGdalTiffTags() {
    static std::once_flag once;
    std::call_once(once, [] { g_parentExtender = TIFFSetTagExtender(extendWithGdalTags); });
}

std::optional<double> readGdalNodata(const std::filesystem::path& path) {
    if (!hasTiffMagic(path)) return std::nullopt;

    registerGdalTiffTags();
    TIFF* tf = TIFFOpen(path.string().c_str(), "r");
    if (!tf) return std::nullopt;

    std::string text;
    char* raw = nullptr;
    if (TIFFGetField(tf, kGdalNodataTag, &raw) == 1 && raw) text = trim(raw);
    TIFFClose(tf);
    if (text.empty()) return std::nullopt;

    std::size_t used = 0;
    double v = 0.0;
    try {
        v = std::stod(text, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used == 0 || used != text.size()) {
        std::cerr << "[convert] ignoring GDAL_NODATA '" << text << "' in " << path.string() << "\n";
        return std::nullopt;
    }
    return v;
}

} // namespace rasteranim
