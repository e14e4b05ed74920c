#pragma once
// Purpose: Persistence layer for settings (load/save, paths, defaults).
// This header provides a thin facade over settings::Store with the data file layout
// of a configuration directory:
//   <dir>/config.json, <dir>/links.json, <dir>/filters.json, <dir>/Link_files/

#include <string>
#include <filesystem>
#include <system_error>

#include "settings.hpp"
#include "../../logger.hpp"

namespace app {
namespace settings {
namespace store {

namespace detail {
inline std::string join_path(const std::string& a, const std::string& b) {
    if (a.empty()) return b;
    if (b.empty()) return a;
    return (std::filesystem::path(a) / b).string();
}
} // namespace detail

// Create directory (and parents) if missing. True if it exists afterwards.
inline bool ensure_dir(const std::string& path) {
    if (path.empty()) return false;
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        logger::warn("Could not create directory " + path + ": " + ec.message());
        return false;
    }
    return std::filesystem::is_directory(path, ec);
}

// Configuration directory: the current working directory.
inline std::string default_dir() {
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec) return ".";
    return cwd.string();
}

inline std::string config_path(const std::string& dir) { return detail::join_path(dir, "config.json"); }
inline std::string links_path(const std::string& dir) { return detail::join_path(dir, "links.json"); }
inline std::string filters_path(const std::string& dir) { return detail::join_path(dir, "filters.json"); }
inline std::string link_files_dir(const std::string& dir) { return detail::join_path(dir, "Link_files"); }

// Relative paths from the config resolve against the configuration directory.
inline std::string resolve(const std::string& dir, const std::string& path) {
    if (path.empty()) return path;
    std::filesystem::path p(path);
    if (p.is_absolute()) return path;
    return detail::join_path(dir, path);
}

// Load config from given path. Always writes 'out' (defaults if parse fails).
// Returns true on successful parse, false on missing/parse error.
inline bool load_from(const std::string& path, Config& out) {
    return Store::load(path, out);
}

// Save config to given path. Returns true on success.
inline bool save_to(const std::string& path, const Config& cfg) {
    return Store::save(path, cfg);
}

// Load <dir>/config.json; a missing file is created with defaults.
// An unreadable file is logged and left alone; 'out' holds defaults either way.
inline bool load_or_create(const std::string& dir, Config& out) {
    const std::string path = config_path(dir);
    if (load_from(path, out)) return true;

    if (auto err = Store::last_error()) {
        logger::error("Error loading config, using defaults: " + err->message);
        return false;
    }
    if (!save_to(path, out)) {
        logger::warn("Could not write default config to " + path);
        return false;
    }
    logger::info("Created default config: " + path);
    return true;
}

} // namespace store
} // namespace settings
} // namespace app
