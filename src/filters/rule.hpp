#pragma once
// A single positional rule of a filter.

#include <string>
#include <regex>
#include <algorithm>
#include <cctype>
#include <optional>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "../logger.hpp"
#include "../types.hpp"

namespace filters {

using types::MatchType;

namespace detail {
inline std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    return s;
}

inline bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

inline bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}
} // namespace detail

// Last malformed pattern seen by a rule on this thread (ErrorKind::Pattern).
inline std::optional<types::Error>& last_pattern_error() {
    static thread_local std::optional<types::Error> err;
    return err;
}

struct Rule {
    std::string token;       // legacy literal
    MatchType match_type = MatchType::Exact;
    std::string expression;  // preferred operand when non-empty

    const std::string& operand() const { return expression.empty() ? token : expression; }

    bool matches(const std::string& value) const {
        const std::string& op = operand();
        switch (match_type) {
            case MatchType::Exact:           return value == op;
            case MatchType::CaseInsensitive: return detail::lower(value) == detail::lower(op);
            case MatchType::Any:             return true;
            case MatchType::StartsWith:      return detail::starts_with(value, op);
            case MatchType::EndsWith:        return detail::ends_with(value, op);
            case MatchType::Contains:        return value.find(op) != std::string::npos;
            case MatchType::NotContains:     return value.find(op) == std::string::npos;
            case MatchType::NotStartsWith:   return !detail::starts_with(value, op);
            case MatchType::NotEndsWith:     return !detail::ends_with(value, op);
            case MatchType::Regex:           return regex_test(value, false).value_or(false);
            case MatchType::Expression:      return regex_test(value, true).value_or(false);
            case MatchType::NotRegex: {
                // a malformed negative rule fails open
                auto found = regex_test(value, false);
                return found ? !*found : true;
            }
        }
        return false;
    }

private:
    // nullopt when the pattern does not compile.
    std::optional<bool> regex_test(const std::string& value, bool whole) const {
        try {
            const std::regex re(operand());
            return whole ? std::regex_match(value, re) : std::regex_search(value, re);
        } catch (const std::regex_error& e) {
            last_pattern_error() = types::Error{types::ErrorKind::Pattern, operand() + ": " + e.what()};
            logger::error("Invalid regex pattern: " + operand() + " (" + e.what() + ")");
            return std::nullopt;
        }
    }
};

inline bool operator==(const Rule& a, const Rule& b) {
    return a.token == b.token && a.match_type == b.match_type && a.expression == b.expression;
}

// --------- JSON adapters ----------
inline void to_json(nlohmann::json& j, const Rule& r) {
    j = nlohmann::json{
        {"token", r.token},
        {"match_type", types::to_string(r.match_type)},
        {"expression", r.expression}
    };
}

inline void from_json(const nlohmann::json& j, Rule& r) {
    Rule tmp;
    if (j.contains("token") && !j.at("token").is_null()) j.at("token").get_to(tmp.token);
    if (j.contains("expression") && !j.at("expression").is_null()) j.at("expression").get_to(tmp.expression);
    if (j.contains("match_type")) {
        const auto s = j.at("match_type").get<std::string>();
        auto mt = types::match_type_from_string(s);
        if (!mt) throw std::invalid_argument("unknown match type: " + s);
        tmp.match_type = *mt;
    }
    r = std::move(tmp);
}

} // namespace filters
