#pragma once
// Filters: ordered positional rule sets producing an action.

#include <string>
#include <vector>
#include <optional>
#include <algorithm>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "rule.hpp"
#include "tokenize.hpp"
#include "../types.hpp"

namespace filters {

using types::FilterAction;

struct Filter {
    std::string id = types::new_uuid();
    std::optional<int> numeric_id;  // assigned by the store, stable across edits
    std::string name;
    std::vector<Rule> rules;
    FilterAction action = FilterAction::Skip;
    bool enabled = true;
    int priority = 0;
    std::string description;
    std::string created_timestamp;
    std::string modified_timestamp;

    // Rule i must match token i; extra tokens are ignored.
    bool matches(const std::string& url) const {
        if (!enabled || rules.empty()) return false;
        const auto tokens = tokenize(url);
        if (rules.size() > tokens.size()) return false;
        for (std::size_t i = 0; i < rules.size(); ++i) {
            if (!rules[i].matches(tokens[i])) return false;
        }
        return true;
    }
};

inline bool operator==(const Filter& a, const Filter& b) {
    return a.id == b.id && a.numeric_id == b.numeric_id && a.name == b.name &&
           a.rules == b.rules && a.action == b.action && a.enabled == b.enabled &&
           a.priority == b.priority && a.description == b.description &&
           a.created_timestamp == b.created_timestamp &&
           a.modified_timestamp == b.modified_timestamp;
}

// Descending priority; equal priorities keep their relative order.
inline void sort_by_priority(std::vector<Filter>& filters) {
    std::stable_sort(filters.begin(), filters.end(),
                     [](const Filter& a, const Filter& b) { return a.priority > b.priority; });
}

// First match in descending-priority order. The input order breaks ties.
inline const Filter* find_matching_filter(const std::vector<Filter>& filters, const std::string& url) {
    std::vector<const Filter*> ordered;
    ordered.reserve(filters.size());
    for (const auto& f : filters) ordered.push_back(&f);
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const Filter* a, const Filter* b) { return a->priority > b->priority; });
    for (const Filter* f : ordered) {
        if (f->matches(url)) return f;
    }
    return nullptr;
}

// --------- JSON adapters ----------
inline void to_json(nlohmann::json& j, const Filter& f) {
    j = nlohmann::json{
        {"id", f.id},
        {"numeric_id", f.numeric_id ? nlohmann::json(*f.numeric_id) : nlohmann::json(nullptr)},
        {"name", f.name},
        {"rules", f.rules},
        {"action", types::to_string(f.action)},
        {"enabled", f.enabled},
        {"priority", f.priority},
        {"description", f.description},
        {"created_timestamp", f.created_timestamp},
        {"modified_timestamp", f.modified_timestamp}
    };
}

inline void from_json(const nlohmann::json& j, Filter& f) {
    Filter tmp;
    if (j.contains("id") && j.at("id").is_string()) j.at("id").get_to(tmp.id);
    if (j.contains("numeric_id") && !j.at("numeric_id").is_null()) tmp.numeric_id = j.at("numeric_id").get<int>();
    if (j.contains("name") && !j.at("name").is_null()) j.at("name").get_to(tmp.name);
    if (j.contains("rules")) j.at("rules").get_to(tmp.rules);
    if (!j.contains("action")) throw std::invalid_argument("filter entry without action");
    const auto a = j.at("action").get<std::string>();
    auto action = types::filter_action_from_string(a);
    if (!action) throw std::invalid_argument("unknown filter action: " + a);
    tmp.action = *action;
    if (j.contains("enabled")) j.at("enabled").get_to(tmp.enabled);
    if (j.contains("priority")) j.at("priority").get_to(tmp.priority);
    if (j.contains("description") && !j.at("description").is_null()) j.at("description").get_to(tmp.description);
    if (j.contains("created_timestamp") && !j.at("created_timestamp").is_null()) j.at("created_timestamp").get_to(tmp.created_timestamp);
    if (j.contains("modified_timestamp") && !j.at("modified_timestamp").is_null()) j.at("modified_timestamp").get_to(tmp.modified_timestamp);
    f = std::move(tmp);
}

} // namespace filters
