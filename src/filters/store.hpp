#pragma once
// Filter Store: prioritized filter list, numeric id allocation and filters.json persistence.
//
// File layout: {"next_numeric_id": N, "filters": [ ... ]}. A bare array (older files)
// is accepted on load and rewritten in the current layout on the next save.

#include <string>
#include <vector>
#include <mutex>
#include <optional>
#include <fstream>
#include <filesystem>
#include <system_error>
#include <algorithm>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "filter.hpp"
#include "../logger.hpp"
#include "../types.hpp"

namespace filters {

enum class Direction { Up, Down };

class Store {
public:
    virtual ~Store() = default;

    // Snapshot in evaluation order (descending priority, stable).
    virtual std::vector<Filter> list() const = 0;
    virtual bool add(Filter filter) = 0;
    virtual bool update(const Filter& filter) = 0;
    virtual bool remove(const std::string& id) = 0;
    virtual bool move(const std::string& id, Direction direction) = 0;
    virtual bool persist() = 0;

    std::optional<Filter> find_matching(const std::string& url) const {
        const auto all = list();
        if (const Filter* f = find_matching_filter(all, url)) {
            logger::debug("URL " + url + " matched filter: " + f->name);
            return *f;
        }
        logger::debug("No filter matched URL: " + url);
        return std::nullopt;
    }

    std::vector<Filter> by_action(FilterAction action) const {
        std::vector<Filter> out;
        for (auto& f : list()) {
            if (f.action == action) out.push_back(f);
        }
        return out;
    }
};

// Gives every filter without a numeric id the next value of `next` (list order).
// `next` is raised above any id already present first. Returns how many were assigned.
inline int assign_numeric_ids(std::vector<Filter>& filters, int& next) {
    for (const auto& f : filters) {
        if (f.numeric_id && *f.numeric_id >= next) next = *f.numeric_id + 1;
    }
    if (next < 1) next = 1;
    int assigned = 0;
    for (auto& f : filters) {
        if (!f.numeric_id) {
            f.numeric_id = next++;
            ++assigned;
        }
    }
    return assigned;
}

class JsonStore : public Store {
public:
    explicit JsonStore(std::string path) : path_(std::move(path)) {}

    // Load filters.json, sort by priority and assign missing numeric ids.
    // Newly assigned ids are persisted before returning so they survive restarts.
    bool load() {
        std::lock_guard<std::mutex> lk(m_);
        std::error_code ec;
        if (!std::filesystem::exists(path_, ec)) {
            logger::info("Filters file " + path_ + " does not exist, starting with empty filter list");
            return true;
        }
        std::ifstream in(path_, std::ios::in);
        if (!in.is_open()) {
            set_error(types::ErrorKind::StoreIO, "cannot open " + path_);
            return false;
        }

        std::vector<Filter> loaded;
        int stored_next = 1;
        try {
            nlohmann::json j;
            in >> j;
            const nlohmann::json* arr = &j;
            if (j.is_object()) {
                if (j.contains("next_numeric_id")) stored_next = j.at("next_numeric_id").get<int>();
                if (!j.contains("filters")) throw std::invalid_argument("missing \"filters\"");
                arr = &j.at("filters");
            }
            if (!arr->is_array()) throw std::invalid_argument("expected a JSON array of filters");
            loaded = arr->get<std::vector<Filter>>();
        } catch (const std::exception& e) {
            set_error(types::ErrorKind::StoreIO, "error loading filters from " + path_ + ": " + e.what());
            return false;
        }

        sort_by_priority(loaded);
        filters_ = std::move(loaded);
        next_numeric_id_ = std::max(next_numeric_id_, stored_next);
        const int assigned = assign_numeric_ids(filters_, next_numeric_id_);
        logger::info("Loaded " + std::to_string(filters_.size()) + " filters from " + path_);
        if (assigned > 0) {
            logger::info("Assigned numeric ids to " + std::to_string(assigned) + " filters");
            return persist_locked();
        }
        return true;
    }

    std::vector<Filter> list() const override {
        std::lock_guard<std::mutex> lk(m_);
        return filters_;
    }

    bool add(Filter filter) override {
        std::lock_guard<std::mutex> lk(m_);
        if (filter.created_timestamp.empty()) filter.created_timestamp = types::now_iso();
        filter.modified_timestamp = filter.created_timestamp;
        filter.numeric_id.reset();
        std::vector<Filter> one{filter};
        assign_numeric_ids(one, next_numeric_id_);
        filters_.push_back(std::move(one.front()));
        sort_by_priority(filters_);
        logger::info("Added filter: " + filter.name);
        return persist_locked();
    }

    // Replaces the filter with the same id. The numeric id is kept.
    bool update(const Filter& filter) override {
        std::lock_guard<std::mutex> lk(m_);
        for (auto& f : filters_) {
            if (f.id != filter.id) continue;
            const auto numeric_id = f.numeric_id;
            f = filter;
            f.numeric_id = numeric_id;
            f.modified_timestamp = types::now_iso();
            sort_by_priority(filters_);
            logger::info("Updated filter: " + filter.name);
            return persist_locked();
        }
        logger::warn("Filter not found for update: " + filter.id);
        return false;
    }

    bool remove(const std::string& id) override {
        std::lock_guard<std::mutex> lk(m_);
        const auto before = filters_.size();
        filters_.erase(std::remove_if(filters_.begin(), filters_.end(),
                                      [&](const Filter& f) { return f.id == id; }),
                       filters_.end());
        if (filters_.size() < before) {
            logger::info("Removed filter with ID: " + id);
            return persist_locked();
        }
        logger::warn("Filter not found for removal: " + id);
        return false;
    }

    // Up raises priority by one, Down lowers it; refused at the ends of the list.
    bool move(const std::string& id, Direction direction) override {
        std::lock_guard<std::mutex> lk(m_);
        auto it = std::find_if(filters_.begin(), filters_.end(),
                               [&](const Filter& f) { return f.id == id; });
        if (it == filters_.end()) return false;
        const auto index = static_cast<std::size_t>(it - filters_.begin());
        if (direction == Direction::Up && index > 0) {
            it->priority += 1;
        } else if (direction == Direction::Down && index + 1 < filters_.size()) {
            it->priority -= 1;
        } else {
            return false;
        }
        it->modified_timestamp = types::now_iso();
        sort_by_priority(filters_);
        return persist_locked();
    }

    bool persist() override {
        std::lock_guard<std::mutex> lk(m_);
        return persist_locked();
    }

    int next_numeric_id() const {
        std::lock_guard<std::mutex> lk(m_);
        return next_numeric_id_;
    }

    std::optional<types::Error> last_error() const {
        std::lock_guard<std::mutex> lk(m_);
        return last_error_;
    }

    const std::string& path() const { return path_; }

private:
    void set_error(types::ErrorKind kind, const std::string& msg) {
        last_error_ = types::Error{kind, msg};
        logger::error(msg);
    }

    bool persist_locked() {
        namespace fs = std::filesystem;
        try {
            std::error_code ec;
            const fs::path p(path_);
            if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

            nlohmann::json j{
                {"next_numeric_id", next_numeric_id_},
                {"filters", filters_}
            };
            const std::string tmp = path_ + ".tmp";
            {
                std::ofstream out(tmp, std::ios::out | std::ios::trunc);
                if (!out.is_open()) {
                    set_error(types::ErrorKind::StoreIO, "error saving filters: cannot open " + tmp);
                    return false;
                }
                out << j.dump(2);
                if (!out.good()) {
                    set_error(types::ErrorKind::StoreIO, "error saving filters: write to " + tmp + " failed");
                    return false;
                }
            }
            fs::rename(tmp, p, ec);
            if (ec) {
                set_error(types::ErrorKind::StoreIO, "error saving filters to " + path_ + ": " + ec.message());
                return false;
            }
        } catch (const std::exception& e) {
            set_error(types::ErrorKind::StoreIO, "error saving filters to " + path_ + ": " + e.what());
            return false;
        }
        logger::debug("Saved " + std::to_string(filters_.size()) + " filters to " + path_);
        return true;
    }

    std::string path_;
    mutable std::mutex m_;
    std::vector<Filter> filters_;
    int next_numeric_id_ = 1;
    std::optional<types::Error> last_error_;
};

} // namespace filters
