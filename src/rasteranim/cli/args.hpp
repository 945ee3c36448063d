#pragma once
#include "rasteranim/core/Errors.hpp"

#include <cctype>
#include <exception>
#include <optional>
#include <string>
#include <vector>

/*
  Simple CLI argument helpers.

  Conventions:
    - Key format: --key=value  (no spaces)
    - Flags:      --key        (boolean presence)
    - Parsing starts at argv[2] because argv[1] is the subcommand.
      Example:   rasteranim-cli run --input=tif --output=png --gif=out.gif
    - Keys are case-sensitive.

  Notes:
    - A missing key yields the default value.
    - A key that is present but does not parse as a number is an error
      (rasteranim::ConfigError), never silently replaced by the default.
    - This parser does not handle quotes, repeated keys, or short flags (-k).
*/

/* Get the raw value of "--key=value", or nullopt if the key is absent. */
inline std::optional<std::string> argFind(int argc, char** argv, const std::string& key) {
    const std::string pref = "--" + key + "=";
    for (int i = 2; i < argc; ++i) {
        std::string a(argv[i]);
        if (a.rfind(pref, 0) == 0) return a.substr(pref.size());
    }
    return std::nullopt;
}

/* Get string value for "--key=value". Returns 'def' if not found. */
inline std::string argValue(int argc, char** argv, const std::string& key, const std::string& def = {}) {
    auto v = argFind(argc, argv, key);
    return v ? *v : def;
}

/* Get int value for "--key=value". Returns 'def' if missing, throws on junk. */
inline int argValueInt(int argc, char** argv, const std::string& key, int def) {
    auto v = argFind(argc, argv, key);
    if (!v) return def;
    std::size_t used = 0;
    int out = 0;
    try {
        out = std::stoi(*v, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used == 0 || used != v->size())
        throw rasteranim::ConfigError("--" + key + " expects an integer, got '" + *v + "'");
    return out;
}

/* Get double value for "--key=value"; nullopt if missing, throws on junk.
   "nan" is accepted (std::stod semantics). */
inline std::optional<double> argValueDouble(int argc, char** argv, const std::string& key) {
    auto v = argFind(argc, argv, key);
    if (!v) return std::nullopt;
    std::size_t used = 0;
    double out = 0.0;
    try {
        out = std::stod(*v, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used == 0 || used != v->size())
        throw rasteranim::ConfigError("--" + key + " expects a number, got '" + *v + "'");
    return out;
}

/* Check presence of a boolean flag "--key". */
inline bool argHas(int argc, char** argv, const std::string& key) {
    const std::string flag = "--" + key;
    for (int i = 2; i < argc; ++i) if (flag == argv[i]) return true;
    return false;
}

/* Split "a,b;c d" into {"a","b","c","d"}. */
inline std::vector<std::string> split_list(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char c: s) {
        if (c==',' || c==';' || std::isspace(static_cast<unsigned char>(c))) {
            if (!cur.empty()) { out.push_back(cur); cur.clear(); }
        } else cur.push_back(c);
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}
