#pragma once
// URL extraction from plain text and ingestion into a links::Store.

#include <string>
#include <vector>
#include <regex>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <system_error>
#include <algorithm>
#include <cctype>

#include "store.hpp"
#include "../logger.hpp"

namespace links {

inline std::string rstrip_chars(std::string s, const std::string& chars) {
    while (!s.empty() && chars.find(s.back()) != std::string::npos) s.pop_back();
    return s;
}

// http(s) URLs in order of appearance, trailing sentence punctuation removed.
inline std::vector<std::string> extract_urls(const std::string& text) {
    static const std::regex url_re(R"(https?://[^\s<>"{}|\\^`\[\]]+)");
    std::vector<std::string> out;
    std::sregex_iterator it(text.begin(), text.end(), url_re), end;
    for (; it != end; ++it) {
        std::string url = rstrip_chars(it->str(), ".,;:!?");
        if (!url.empty()) out.push_back(std::move(url));
    }
    return out;
}

inline std::vector<Link*> add_links_from_text(Store& store, const std::string& text,
                                             const std::string& source = "manual",
                                             const std::string& source_file = "") {
    std::vector<Link*> added;
    for (const auto& url : extract_urls(text)) {
        if (Link* l = store.add(url, source, source_file)) {
            added.push_back(l);
        }
    }
    logger::info("Added " + std::to_string(added.size()) + " links from text");
    return added;
}

inline bool is_text_file(const std::filesystem::path& p) {
    std::string ext = p.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    return ext == ".txt" || ext == ".md" || ext == ".log" || ext == ".url";
}

inline bool read_text_file(const std::filesystem::path& p, std::string& out) {
    std::ifstream in(p, std::ios::in | std::ios::binary);
    if (!in.is_open()) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

// Ingest every plain-text file under dir (recursive). Returns the links touched.
inline std::vector<Link*> ingest_directory(Store& store, const std::string& dir) {
    namespace fs = std::filesystem;
    std::vector<Link*> out;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        logger::warn("Not a directory: " + dir);
        return out;
    }

    std::vector<fs::path> files;
    for (fs::recursive_directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && is_text_file(it->path())) files.push_back(it->path());
    }
    if (ec) logger::warn("Error scanning " + dir + ": " + ec.message());
    std::sort(files.begin(), files.end());

    for (const auto& f : files) {
        std::string text;
        if (!read_text_file(f, text)) {
            logger::warn("Could not read " + f.string());
            continue;
        }
        auto added = add_links_from_text(store, text, "file", f.string());
        out.insert(out.end(), added.begin(), added.end());
    }
    logger::info("Processed " + std::to_string(files.size()) + " files, " +
                 std::to_string(out.size()) + " links");
    return out;
}

} // namespace links
