#pragma once
// Link records: a tracked URL with classification/download status.
// - JSON adapters (nlohmann::json), defaults applied at the deserializer boundary
// - "url" is the only required key

#include <string>
#include <vector>
#include <optional>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "../types.hpp"

namespace links {

using types::LinkStatus;

struct Link {
    std::string id = types::new_uuid();
    std::string url;
    LinkStatus status = LinkStatus::Pending;
    std::string source = "unknown"; // file | clipboard | manual | unknown
    std::string source_file;

    std::string added_timestamp = types::now_iso();
    std::optional<std::string> processed_timestamp;
    std::optional<std::string> downloaded_timestamp;

    std::string filter_matched;         // filter name at classification time
    std::optional<int> filter_id;       // numeric filter id (resolved for display)
    std::string download_path;
    int images_count = 0;
    double file_size_mb = 0.0;
    std::string error_message;
    bool deleted = false;

    std::vector<std::string> tags;
    nlohmann::json metadata = nlohmann::json::object();
};

// Declared ahead of operator== so json comparisons in it see Link's adapters.
inline void to_json(nlohmann::json& j, const Link& l);
inline void from_json(const nlohmann::json& j, Link& l);

inline bool operator==(const Link& a, const Link& b) {
    return a.id == b.id && a.url == b.url && a.status == b.status &&
           a.source == b.source && a.source_file == b.source_file &&
           a.added_timestamp == b.added_timestamp &&
           a.processed_timestamp == b.processed_timestamp &&
           a.downloaded_timestamp == b.downloaded_timestamp &&
           a.filter_matched == b.filter_matched && a.filter_id == b.filter_id &&
           a.download_path == b.download_path && a.images_count == b.images_count &&
           a.file_size_mb == b.file_size_mb && a.error_message == b.error_message &&
           a.deleted == b.deleted && a.tags == b.tags && a.metadata == b.metadata;
}

inline bool operator!=(const Link& a, const Link& b) { return !(a == b); }

// --------- JSON adapters ----------
namespace detail {
inline nlohmann::json optional_to_json(const std::optional<std::string>& v) {
    if (v) return *v;
    return nullptr;
}

inline std::optional<std::string> optional_from_json(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return j.at(key).get<std::string>();
}
} // namespace detail

inline void to_json(nlohmann::json& j, const Link& l) {
    j = nlohmann::json{
        {"id", l.id},
        {"url", l.url},
        {"status", types::to_string(l.status)},
        {"source", l.source},
        {"source_file", l.source_file},
        {"added_timestamp", l.added_timestamp},
        {"processed_timestamp", detail::optional_to_json(l.processed_timestamp)},
        {"downloaded_timestamp", detail::optional_to_json(l.downloaded_timestamp)},
        {"filter_matched", l.filter_matched},
        {"filter_id", l.filter_id ? nlohmann::json(*l.filter_id) : nlohmann::json(nullptr)},
        {"download_path", l.download_path},
        {"images_count", l.images_count},
        {"file_size_mb", l.file_size_mb},
        {"error_message", l.error_message},
        {"deleted", l.deleted},
        {"tags", l.tags},
        {"metadata", l.metadata}
    };
}

// Throws nlohmann::json::exception on wrong types, std::invalid_argument on a missing url
// or an unknown status. Stores catch both at their load boundary.
inline void from_json(const nlohmann::json& j, Link& l) {
    Link tmp;
    if (!j.contains("url") || !j.at("url").is_string()) {
        throw std::invalid_argument("link entry without url");
    }
    j.at("url").get_to(tmp.url);

    if (j.contains("id") && j.at("id").is_string()) j.at("id").get_to(tmp.id);
    if (j.contains("status")) {
        const auto s = j.at("status").get<std::string>();
        auto st = types::link_status_from_string(s);
        if (!st) throw std::invalid_argument("unknown link status: " + s);
        tmp.status = *st;
    }
    if (j.contains("source")) j.at("source").get_to(tmp.source);
    if (j.contains("source_file")) j.at("source_file").get_to(tmp.source_file);
    if (j.contains("added_timestamp") && !j.at("added_timestamp").is_null()) {
        j.at("added_timestamp").get_to(tmp.added_timestamp);
    }
    tmp.processed_timestamp = detail::optional_from_json(j, "processed_timestamp");
    tmp.downloaded_timestamp = detail::optional_from_json(j, "downloaded_timestamp");
    if (j.contains("filter_matched")) j.at("filter_matched").get_to(tmp.filter_matched);
    if (j.contains("filter_id") && !j.at("filter_id").is_null()) tmp.filter_id = j.at("filter_id").get<int>();
    if (j.contains("download_path")) j.at("download_path").get_to(tmp.download_path);
    if (j.contains("images_count")) j.at("images_count").get_to(tmp.images_count);
    if (j.contains("file_size_mb")) j.at("file_size_mb").get_to(tmp.file_size_mb);
    if (j.contains("error_message")) j.at("error_message").get_to(tmp.error_message);
    if (j.contains("deleted")) j.at("deleted").get_to(tmp.deleted);
    if (j.contains("tags")) j.at("tags").get_to(tmp.tags);
    if (j.contains("metadata") && j.at("metadata").is_object()) tmp.metadata = j.at("metadata");

    l = std::move(tmp);
}

} // namespace links
