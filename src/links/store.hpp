#pragma once
// Link Store: owns Link records, status and the soft-delete flag.
// - Store: collaborator interface consumed by the classifier and the download orchestrator
// - JsonStore: links.json persistence (nlohmann::json), header-only
//
// Returned Link pointers stay valid for the store's lifetime (links are never removed,
// only soft-deleted).

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <optional>
#include <fstream>
#include <filesystem>
#include <system_error>
#include <algorithm>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "link.hpp"
#include "../logger.hpp"
#include "../types.hpp"

namespace links {

class Store {
public:
    virtual ~Store() = default;

    virtual Link* get_by_id(const std::string& id) = 0;
    // Any link with this URL, deleted ones included.
    virtual Link* get_by_url(const std::string& url) = 0;
    // Returns the existing active link, a reactivated deleted one, or a new pending link.
    virtual Link* add(const std::string& url, const std::string& source = "manual",
                      const std::string& source_file = "") = 0;
    virtual bool update_status(const std::string& id, LinkStatus status) = 0;
    virtual bool mark_deleted(const std::string& id) = 0;
    virtual std::vector<Link*> list_active() = 0;
    virtual std::vector<Link*> list_by_status(const std::vector<LinkStatus>& statuses) = 0;
    virtual bool persist() = 0;

    std::vector<Link*> pending() { return list_by_status({LinkStatus::Pending}); }
    std::vector<Link*> downloadable() { return list_by_status({LinkStatus::ToDownload}); }
    std::vector<Link*> limit_skipped() { return list_by_status({LinkStatus::ToSkipLimit}); }
    // Skipped links that can be retried.
    std::vector<Link*> skipped() {
        return list_by_status({LinkStatus::ToSkip, LinkStatus::ToSkipLimit,
                               LinkStatus::Skipped, LinkStatus::Error});
    }
};

class JsonStore : public Store {
public:
    explicit JsonStore(std::string path) : path_(std::move(path)) {}

    // Load links.json. A missing file is an empty store (true).
    // On read/parse errors the in-memory state is left untouched and false is returned.
    bool load() {
        std::lock_guard<std::mutex> lk(m_);
        std::error_code ec;
        if (!std::filesystem::exists(path_, ec)) {
            logger::info("Links file " + path_ + " does not exist, starting with empty link list");
            return true;
        }
        std::ifstream in(path_, std::ios::in);
        if (!in.is_open()) {
            set_error(types::ErrorKind::StoreIO, "cannot open " + path_);
            return false;
        }
        try {
            nlohmann::json j;
            in >> j;
            if (!j.is_array()) throw std::invalid_argument("expected a JSON array");
            std::vector<std::unique_ptr<Link>> loaded;
            loaded.reserve(j.size());
            for (const auto& entry : j) {
                auto l = std::make_unique<Link>();
                *l = entry.get<Link>();
                loaded.push_back(std::move(l));
            }
            links_ = std::move(loaded);
        } catch (const std::exception& e) {
            set_error(types::ErrorKind::StoreIO, "error loading links from " + path_ + ": " + e.what());
            return false;
        }
        logger::info("Loaded " + std::to_string(links_.size()) + " links from " + path_);
        return true;
    }

    Link* get_by_id(const std::string& id) override {
        std::lock_guard<std::mutex> lk(m_);
        return find_id_locked(id);
    }

    Link* get_by_url(const std::string& url) override {
        std::lock_guard<std::mutex> lk(m_);
        return find_url_locked(url);
    }

    Link* add(const std::string& url, const std::string& source = "manual",
              const std::string& source_file = "") override {
        std::lock_guard<std::mutex> lk(m_);
        // Prefer an active link with the URL; fall back to a deleted one for reactivation.
        Link* deleted_match = nullptr;
        for (auto& l : links_) {
            if (l->url != url) continue;
            if (!l->deleted) {
                logger::debug("Link already exists: " + url);
                return l.get();
            }
            if (!deleted_match) deleted_match = l.get();
        }

        if (deleted_match) {
            deleted_match->deleted = false;
            deleted_match->status = LinkStatus::Pending;
            deleted_match->added_timestamp = types::now_iso();
            deleted_match->source = source;
            deleted_match->source_file = source_file;
            logger::info("Reactivated deleted link: " + url);
            (void)persist_locked();
            return deleted_match;
        }

        auto l = std::make_unique<Link>();
        l->url = url;
        l->source = source;
        l->source_file = source_file;
        Link* raw = l.get();
        links_.push_back(std::move(l));
        (void)persist_locked();
        logger::info("Added new link: " + url);
        return raw;
    }

    bool update_status(const std::string& id, LinkStatus status) override {
        std::lock_guard<std::mutex> lk(m_);
        Link* l = find_id_locked(id);
        if (!l) {
            logger::error("Link not found: " + id);
            return false;
        }
        l->status = status;
        const std::string now = types::now_iso();
        l->processed_timestamp = now;
        if (status == LinkStatus::Downloaded) {
            l->downloaded_timestamp = now;
        }
        logger::debug("Updated link " + id + " status to " + types::to_string(status));
        return persist_locked();
    }

    bool mark_deleted(const std::string& id) override {
        std::lock_guard<std::mutex> lk(m_);
        Link* l = find_id_locked(id);
        if (!l) {
            logger::error("Link not found: " + id);
            return false;
        }
        l->deleted = true;
        logger::info("Marked link as deleted: " + l->url);
        return persist_locked();
    }

    std::vector<Link*> list_active() override {
        std::lock_guard<std::mutex> lk(m_);
        std::vector<Link*> out;
        for (auto& l : links_) {
            if (!l->deleted) out.push_back(l.get());
        }
        return out;
    }

    std::vector<Link*> list_by_status(const std::vector<LinkStatus>& statuses) override {
        std::lock_guard<std::mutex> lk(m_);
        std::vector<Link*> out;
        for (auto& l : links_) {
            if (l->deleted) continue;
            if (std::find(statuses.begin(), statuses.end(), l->status) != statuses.end()) {
                out.push_back(l.get());
            }
        }
        return out;
    }

    bool persist() override {
        std::lock_guard<std::mutex> lk(m_);
        return persist_locked();
    }

    // All links, deleted ones included, in insertion order.
    std::vector<Link*> all() {
        std::lock_guard<std::mutex> lk(m_);
        std::vector<Link*> out;
        out.reserve(links_.size());
        for (auto& l : links_) out.push_back(l.get());
        return out;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lk(m_);
        return links_.size();
    }

    std::optional<types::Error> last_error() const {
        std::lock_guard<std::mutex> lk(m_);
        return last_error_;
    }

    const std::string& path() const { return path_; }

private:
    Link* find_id_locked(const std::string& id) {
        for (auto& l : links_) {
            if (l->id == id) return l.get();
        }
        return nullptr;
    }

    Link* find_url_locked(const std::string& url) {
        for (auto& l : links_) {
            if (l->url == url) return l.get();
        }
        return nullptr;
    }

    void set_error(types::ErrorKind kind, const std::string& msg) {
        last_error_ = types::Error{kind, msg};
        logger::error(msg);
    }

    // Write to a sibling temp file, then rename over links.json.
    bool persist_locked() {
        namespace fs = std::filesystem;
        try {
            std::error_code ec;
            const fs::path p(path_);
            if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

            nlohmann::json j = nlohmann::json::array();
            for (const auto& l : links_) j.push_back(*l);

            const std::string tmp = path_ + ".tmp";
            {
                std::ofstream out(tmp, std::ios::out | std::ios::trunc);
                if (!out.is_open()) {
                    set_error(types::ErrorKind::StoreIO, "error saving links: cannot open " + tmp);
                    return false;
                }
                out << j.dump(2);
                if (!out.good()) {
                    set_error(types::ErrorKind::StoreIO, "error saving links: write to " + tmp + " failed");
                    return false;
                }
            }
            fs::rename(tmp, p, ec);
            if (ec) {
                set_error(types::ErrorKind::StoreIO, "error saving links to " + path_ + ": " + ec.message());
                return false;
            }
        } catch (const std::exception& e) {
            set_error(types::ErrorKind::StoreIO, "error saving links to " + path_ + ": " + e.what());
            return false;
        }
        logger::debug("Saved " + std::to_string(links_.size()) + " links to " + path_);
        return true;
    }

    std::string path_;
    mutable std::mutex m_;
    std::vector<std::unique_ptr<Link>> links_;
    std::optional<types::Error> last_error_;
};

} // namespace links
