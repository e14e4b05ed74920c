#pragma once
// Maps numeric filter ids to current display names, read from filters.json.

#include <string>
#include <optional>
#include <unordered_map>
#include <fstream>
#include <filesystem>
#include <system_error>

#include <nlohmann/json.hpp>

#include "../logger.hpp"

namespace filters {

class NameResolver {
public:
    explicit NameResolver(std::string path) : path_(std::move(path)) {}

    // Reload the id -> name map. Missing file clears the map.
    bool refresh() {
        std::error_code ec;
        if (!std::filesystem::exists(path_, ec)) {
            names_.clear();
            return true;
        }
        std::ifstream in(path_, std::ios::in);
        if (!in.is_open()) {
            logger::error("Failed to refresh filter names: cannot open " + path_);
            return false;
        }
        try {
            nlohmann::json j;
            in >> j;
            const nlohmann::json& arr = j.is_object() && j.contains("filters") ? j.at("filters") : j;
            std::unordered_map<int, std::string> mapping;
            if (arr.is_array()) {
                for (const auto& entry : arr) {
                    if (!entry.contains("numeric_id") || entry.at("numeric_id").is_null()) continue;
                    const int id = entry.at("numeric_id").get<int>();
                    std::string name;
                    if (entry.contains("name") && entry.at("name").is_string()) {
                        name = trim(entry.at("name").get<std::string>());
                    }
                    if (name.empty()) name = unnamed(id);
                    mapping[id] = name;
                }
            }
            names_ = std::move(mapping);
        } catch (const std::exception& e) {
            logger::error(std::string("Failed to refresh filter names: ") + e.what());
            return false;
        }
        logger::debug("Filter name resolver loaded " + std::to_string(names_.size()) + " names");
        return true;
    }

    std::string resolve(std::optional<int> numeric_id) const {
        if (!numeric_id) return std::string();
        auto it = names_.find(*numeric_id);
        if (it != names_.end()) return it->second;
        return unnamed(*numeric_id);
    }

    std::size_t size() const { return names_.size(); }

private:
    static std::string unnamed(int id) { return "Unnamed_" + std::to_string(id); }

    static std::string trim(const std::string& s) {
        auto b = s.find_first_not_of(" \t\r\n");
        if (b == std::string::npos) return std::string();
        auto e = s.find_last_not_of(" \t\r\n");
        return s.substr(b, e - b + 1);
    }

    std::string path_;
    std::unordered_map<int, std::string> names_;
};

} // namespace filters
