#pragma once
// Heuristics over the downloader's line-oriented output.
// gallery-dl prints one path per stored file ("# path" when the file already existed);
// other tools tend to print "saving ..." / "... downloaded" style lines.

#include <string>
#include <vector>
#include <set>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <system_error>
#include <cstdint>

namespace download {
namespace output {

inline std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    return s;
}

inline std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return std::string();
    auto e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

// "# /dl/a.jpg" -> "/dl/a.jpg"; other lines unchanged (trimmed).
inline std::string path_candidate(const std::string& line) {
    std::string t = trim(line);
    if (t.size() > 2 && t[0] == '#' && t[1] == ' ') t = trim(t.substr(2));
    return t;
}

// A line carrying an error marker: a leading "[error]" tag (also after other tags,
// as in gallery-dl's "[imgur][error] ...") or a leading "error:".
inline bool is_error_line(const std::string& line) {
    const std::string l = lower(trim(line));
    std::size_t pos = 0;
    while (pos < l.size() && l[pos] == '[') {
        const std::size_t close = l.find(']', pos);
        if (close == std::string::npos) break;
        if (l.compare(pos, close - pos + 1, "[error]") == 0) return true;
        pos = close + 1;
    }
    while (pos < l.size() && l[pos] == ' ') ++pos;
    return l.compare(pos, 6, "error:") == 0;
}

inline bool is_image_event(const std::string& line) {
    if (is_error_line(line)) return false;
    const std::string l = lower(line);
    if (l.find("saving") != std::string::npos ||
        l.find("saved") != std::string::npos ||
        l.find("downloaded") != std::string::npos ||
        l.find("exists") != std::string::npos) {
        return true;
    }
    const std::string p = path_candidate(line);
    return !p.empty() && p[0] == '/' && std::filesystem::path(p).has_extension();
}

inline int count_image_events(const std::vector<std::string>& lines) {
    return static_cast<int>(std::count_if(lines.begin(), lines.end(), is_image_event));
}

// Sum of the sizes of existing regular files named by output lines, in MB.
inline double measure_files_mb(const std::vector<std::string>& lines) {
    namespace fs = std::filesystem;
    std::set<std::string> seen;
    std::uintmax_t total = 0;
    for (const auto& line : lines) {
        const std::string p = path_candidate(line);
        if (p.empty() || !seen.insert(p).second) continue;
        std::error_code ec;
        if (!fs::is_regular_file(p, ec)) continue;
        const auto sz = fs::file_size(p, ec);
        if (!ec) total += sz;
    }
    return static_cast<double>(total) / (1024.0 * 1024.0);
}

// Error lines joined with "; ", else the last non-empty line, else "<tool> failed (code N)".
inline std::string failure_message(const std::vector<std::string>& lines,
                                   const std::string& tool, int exit_code) {
    std::string errors;
    for (const auto& line : lines) {
        if (!is_error_line(line)) continue;
        if (!errors.empty()) errors += "; ";
        errors += trim(line);
    }
    if (!errors.empty()) return errors;
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        const std::string t = trim(*it);
        if (!t.empty()) return t;
    }
    return tool + " failed (code " + std::to_string(exit_code) + ")";
}

} // namespace output
} // namespace download
