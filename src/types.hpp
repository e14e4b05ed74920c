#pragma once
// Shared basic types and enums used across modules (links, filters, downloads).

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <random>
#include <cstdint>

namespace types {

enum class ErrorKind {
    Configuration,  // unreadable/invalid persisted configuration
    StoreIO,        // persistence read/write failure
    ToolInvocation, // spawn failure or non-zero exit
    LimitBreach,    // timeout / image_count / file_size
    Pattern,        // malformed regex in a rule
    Observer        // a progress/completion callback raised
};

struct Error {
    ErrorKind kind = ErrorKind::StoreIO;
    std::string message;
};

enum class LinkStatus {
    Pending,
    ToDownload,
    ToSkip,
    ToSkipLimit,
    ToReprocess,
    Downloading,
    Downloaded,
    Skipped,
    Error
};

enum class FilterAction {
    Download,
    Skip,
    Delete
};

enum class MatchType {
    Exact,
    CaseInsensitive,
    Any,
    Expression,
    Regex,
    StartsWith,
    EndsWith,
    Contains,
    NotContains,
    NotStartsWith,
    NotEndsWith,
    NotRegex
};

enum class LimitKind {
    Timeout,
    ImageCount,
    FileSize
};

// --------- string forms (persisted values) ----------

inline const char* to_string(LinkStatus s) {
    switch (s) {
        case LinkStatus::Pending:     return "pending";
        case LinkStatus::ToDownload:  return "to_download";
        case LinkStatus::ToSkip:      return "to_skip";
        case LinkStatus::ToSkipLimit: return "to_skip_limit";
        case LinkStatus::ToReprocess: return "to_reprocess";
        case LinkStatus::Downloading: return "downloading";
        case LinkStatus::Downloaded:  return "downloaded";
        case LinkStatus::Skipped:     return "skipped";
        case LinkStatus::Error:       return "error";
    }
    return "pending";
}

inline std::optional<LinkStatus> link_status_from_string(const std::string& s) {
    static const LinkStatus all[] = {
        LinkStatus::Pending, LinkStatus::ToDownload, LinkStatus::ToSkip,
        LinkStatus::ToSkipLimit, LinkStatus::ToReprocess, LinkStatus::Downloading,
        LinkStatus::Downloaded, LinkStatus::Skipped, LinkStatus::Error
    };
    for (auto v : all) {
        if (s == to_string(v)) return v;
    }
    return std::nullopt;
}

inline const char* to_string(FilterAction a) {
    switch (a) {
        case FilterAction::Download: return "to_download";
        case FilterAction::Skip:     return "to_skip";
        case FilterAction::Delete:   return "deleted";
    }
    return "to_skip";
}

inline std::optional<FilterAction> filter_action_from_string(const std::string& s) {
    if (s == "to_download") return FilterAction::Download;
    if (s == "to_skip")     return FilterAction::Skip;
    if (s == "deleted")     return FilterAction::Delete;
    return std::nullopt;
}

inline const char* to_string(MatchType m) {
    switch (m) {
        case MatchType::Exact:           return "match_exactly";
        case MatchType::CaseInsensitive: return "match_case_insensitive";
        case MatchType::Any:             return "match_any";
        case MatchType::Expression:      return "match_expression";
        case MatchType::Regex:           return "match_regex";
        case MatchType::StartsWith:      return "match_starts_with";
        case MatchType::EndsWith:        return "match_ends_with";
        case MatchType::Contains:        return "match_contains";
        case MatchType::NotContains:     return "match_not_contains";
        case MatchType::NotStartsWith:   return "match_not_starts_with";
        case MatchType::NotEndsWith:     return "match_not_ends_with";
        case MatchType::NotRegex:        return "match_not_regex";
    }
    return "match_exactly";
}

inline std::optional<MatchType> match_type_from_string(const std::string& s) {
    static const MatchType all[] = {
        MatchType::Exact, MatchType::CaseInsensitive, MatchType::Any,
        MatchType::Expression, MatchType::Regex, MatchType::StartsWith,
        MatchType::EndsWith, MatchType::Contains, MatchType::NotContains,
        MatchType::NotStartsWith, MatchType::NotEndsWith, MatchType::NotRegex
    };
    for (auto v : all) {
        if (s == to_string(v)) return v;
    }
    return std::nullopt;
}

inline const char* to_string(LimitKind k) {
    switch (k) {
        case LimitKind::Timeout:    return "timeout";
        case LimitKind::ImageCount: return "image_count";
        case LimitKind::FileSize:   return "file_size";
    }
    return "timeout";
}

// --------- ids and timestamps ----------

// Local time, ISO-8601 without offset: 2024-05-01T13:45:10
inline std::string now_iso() {
    using namespace std::chrono;
    std::time_t tt = system_clock::to_time_t(system_clock::now());
    std::tm tm_buf{};
#if defined(_WIN32)
    localtime_s(&tm_buf, &tt);
#else
    localtime_r(&tt, &tm_buf);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

// Random (version 4) UUID string.
inline std::string new_uuid() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<std::uint64_t> dist;
    std::uint64_t hi = dist(rng);
    std::uint64_t lo = dist(rng);
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL; // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL; // variant 10

    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(8) << (hi >> 32) << '-'
        << std::setw(4) << ((hi >> 16) & 0xFFFF) << '-'
        << std::setw(4) << (hi & 0xFFFF) << '-'
        << std::setw(4) << (lo >> 48) << '-'
        << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
    return oss.str();
}

} // namespace types
