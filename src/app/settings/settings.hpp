#pragma once
// Settings handling
// - Config structures and serialization (JSON via nlohmann::json)
// - Store: load/save
// NOTE: header-only implementation for simplicity

#include <string>
#include <vector>
#include <fstream>
#include <sstream>
#include <optional>
#include <utility>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "../../types.hpp"

namespace app {
namespace settings {

struct DownloadLimits {
    int max_images_per_link = 1000;
    int max_time_per_link_seconds = 3600;
    double max_file_size_mb = 500.0;
};

// External downloader invocation (section "gallery_dl" in config.json).
struct ToolConfig {
    std::string command = "gallery-dl";
    std::string config_file;       // passed as --config when the file exists
    std::vector<std::string> default_args{"--write-metadata", "--write-info-json"};
    std::string output_dir;        // passed as -d when set
};

struct IngestConfig {
    bool trim_trailing_closers = false; // strip )]}'" from URL ends before matching
};

struct LoggingConfig {
    std::string level = "INFO";
    std::string file = "dl_homework_garden.log"; // relative to the config dir; empty disables
};

struct Config {
    DownloadLimits download_limits;
    ToolConfig gallery_dl;
    IngestConfig ingest;
    LoggingConfig logging;
};

inline void apply_defaults(Config& c) {
    if (c.gallery_dl.command.empty()) c.gallery_dl.command = "gallery-dl";
    if (c.logging.level.empty()) c.logging.level = "INFO";
}

class Store {
public:
    // Load config from persistent storage (JSON). Always sets 'out' (merged with defaults).
    // Returns true if file existed and was parsed successfully, false if file missing or parse error.
    static bool load(const std::string& path, Config& out);

    // Save config (JSON).
    static bool save(const std::string& path, const Config& cfg);

    // Error from the last failed load/save on this thread; empty after a missing file.
    static std::optional<types::Error>& last_error() {
        static thread_local std::optional<types::Error> err;
        return err;
    }
};

// --------- JSON adapters ----------
inline void to_json(nlohmann::json& j, const DownloadLimits& l) {
    j = nlohmann::json{
        {"max_images_per_link", l.max_images_per_link},
        {"max_time_per_link_seconds", l.max_time_per_link_seconds},
        {"max_file_size_mb", l.max_file_size_mb}
    };
}

inline void from_json(const nlohmann::json& j, DownloadLimits& l) {
    DownloadLimits tmp = l;
    if (j.contains("max_images_per_link")) j.at("max_images_per_link").get_to(tmp.max_images_per_link);
    if (j.contains("max_time_per_link_seconds")) j.at("max_time_per_link_seconds").get_to(tmp.max_time_per_link_seconds);
    if (j.contains("max_file_size_mb")) j.at("max_file_size_mb").get_to(tmp.max_file_size_mb);
    l = tmp;
}

inline void to_json(nlohmann::json& j, const ToolConfig& t) {
    j = nlohmann::json{
        {"command", t.command},
        {"config_file", t.config_file},
        {"default_args", t.default_args},
        {"output_dir", t.output_dir}
    };
}

inline void from_json(const nlohmann::json& j, ToolConfig& t) {
    ToolConfig tmp = t;
    if (j.contains("command")) j.at("command").get_to(tmp.command);
    if (j.contains("config_file")) j.at("config_file").get_to(tmp.config_file);
    if (j.contains("default_args")) j.at("default_args").get_to(tmp.default_args);
    if (j.contains("output_dir")) j.at("output_dir").get_to(tmp.output_dir);
    t = std::move(tmp);
}

inline void to_json(nlohmann::json& j, const IngestConfig& i) {
    j = nlohmann::json{{"trim_trailing_closers", i.trim_trailing_closers}};
}

inline void from_json(const nlohmann::json& j, IngestConfig& i) {
    if (j.contains("trim_trailing_closers")) j.at("trim_trailing_closers").get_to(i.trim_trailing_closers);
}

inline void to_json(nlohmann::json& j, const LoggingConfig& l) {
    j = nlohmann::json{{"level", l.level}, {"file", l.file}};
}

inline void from_json(const nlohmann::json& j, LoggingConfig& l) {
    LoggingConfig tmp = l;
    if (j.contains("level")) j.at("level").get_to(tmp.level);
    if (j.contains("file")) j.at("file").get_to(tmp.file);
    l = std::move(tmp);
}

inline void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"download_limits", c.download_limits},
        {"gallery_dl", c.gallery_dl},
        {"ingest", c.ingest},
        {"logging", c.logging}
    };
}

inline void from_json(const nlohmann::json& j, Config& c) {
    // keep defaults first
    Config tmp = c;

    if (j.contains("download_limits")) j.at("download_limits").get_to(tmp.download_limits);
    if (j.contains("gallery_dl")) j.at("gallery_dl").get_to(tmp.gallery_dl);
    if (j.contains("ingest")) j.at("ingest").get_to(tmp.ingest);
    if (j.contains("logging")) j.at("logging").get_to(tmp.logging);

    c = std::move(tmp);
}

// --------- Store implementation ----------
inline bool Store::load(const std::string& path, Config& out) {
    // Prepare defaults first
    Config cfg;
    apply_defaults(cfg);
    last_error().reset();

    // Try open file
    std::ifstream in(path, std::ios::in);
    if (!in.is_open()) {
        // No file: return false, but 'out' gets defaults
        out = std::move(cfg);
        return false;
    }

    try {
        nlohmann::json j;
        in >> j;
        if (!j.is_object()) throw std::runtime_error("top-level value is not an object");
        from_json(j, cfg);
        apply_defaults(cfg);
        out = std::move(cfg);
        return true;
    } catch (const std::exception& e) {
        // Parse error: keep defaults
        last_error() = types::Error{types::ErrorKind::Configuration, path + ": " + e.what()};
        out = Config{};
        apply_defaults(out);
        return false;
    }
}

inline bool Store::save(const std::string& path, const Config& cfg) {
    last_error().reset();
    try {
        nlohmann::json j = cfg;
        std::ofstream out(path, std::ios::out | std::ios::trunc);
        if (!out.is_open()) {
            last_error() = types::Error{types::ErrorKind::Configuration, "cannot write " + path};
            return false;
        }
        out << j.dump(2);
        return static_cast<bool>(out);
    } catch (const std::exception& e) {
        last_error() = types::Error{types::ErrorKind::Configuration, path + ": " + e.what()};
        return false;
    }
}

} // namespace settings
} // namespace app
