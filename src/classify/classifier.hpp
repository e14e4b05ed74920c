#pragma once
// Applies filter actions to links (ingestion and reprocessing).
// - download -> to_download, skip -> to_skip, delete -> soft delete (status untouched)
// - links that are downloading or downloaded are never reclassified by reprocess_all()

#include <string>
#include <vector>
#include <algorithm>

#include "../links/store.hpp"
#include "../filters/store.hpp"
#include "../logger.hpp"
#include "../types.hpp"

namespace classify {

using types::LinkStatus;

struct Options {
    bool trim_trailing_closers = false;
};

// "https://x.y/a)" -> "https://x.y/a"; never trims to empty.
inline std::string trim_trailing_closers(const std::string& url) {
    std::string out = url;
    while (!out.empty() && std::string(")]}'\"").find(out.back()) != std::string::npos) out.pop_back();
    return out.empty() ? url : out;
}

inline void apply(links::Link& link, const filters::Filter& f) {
    switch (f.action) {
        case types::FilterAction::Download: link.status = LinkStatus::ToDownload; break;
        case types::FilterAction::Skip:     link.status = LinkStatus::ToSkip; break;
        case types::FilterAction::Delete:   link.deleted = true; break;
    }
    link.filter_matched = f.name;
    link.filter_id = f.numeric_id;
    link.processed_timestamp = types::now_iso();
}

class Classifier {
public:
    Classifier(links::Store& links, const filters::Store& filters, Options opts = {})
        : links_(links), filters_(filters), opts_(opts) {}

    // Classify one link. Returns false when no filter matched (link left as is).
    // With trimming on, a link whose trimmed url duplicates an active link is
    // soft-deleted and counts as handled.
    bool process(links::Link& link, bool persist = true) {
        if (opts_.trim_trailing_closers) {
            const std::string trimmed = trim_trailing_closers(link.url);
            if (trimmed != link.url) {
                // the trimmed url is already queued: drop this copy instead of duplicating it
                for (const auto* other : links_.list_active()) {
                    if (other != &link && other->url == trimmed) {
                        logger::info("Trimmed url already present, removing duplicate: " + link.url);
                        if (!links_.mark_deleted(link.id)) {
                            logger::error("Could not remove duplicate link " + link.url);
                        }
                        return true;
                    }
                }
                logger::info("Trimmed trailing characters: " + link.url + " -> " + trimmed);
                link.url = trimmed;
            }
        }
        auto f = filters_.find_matching(link.url);
        if (!f) return false;
        apply(link, *f);
        logger::debug("Applied filter '" + f->name + "' to " + link.url);
        if (persist) (void)links_.persist();
        return true;
    }

    // Classify every pending/to_reprocess link. Returns the links no filter matched.
    std::vector<links::Link*> process_pending() {
        std::vector<links::Link*> unmatched;
        for (auto* l : links_.list_by_status({LinkStatus::Pending, LinkStatus::ToReprocess})) {
            if (!process(*l, false)) unmatched.push_back(l);
        }
        (void)links_.persist();
        return unmatched;
    }

    // Re-evaluate active links against the current filters without prompting.
    int reprocess_all() {
        static const std::vector<LinkStatus> eligible = {
            LinkStatus::Pending, LinkStatus::ToReprocess, LinkStatus::ToSkip,
            LinkStatus::ToDownload, LinkStatus::Error, LinkStatus::Skipped,
            LinkStatus::ToSkipLimit
        };
        int reprocessed = 0;
        for (auto* l : links_.list_by_status(eligible)) {
            if (process(*l, false)) ++reprocessed;
        }
        (void)links_.persist();
        logger::info("Reprocessed " + std::to_string(reprocessed) + " links against filters");
        return reprocessed;
    }

    // Manual transition of an active link to to_reprocess.
    bool request_reprocess(const std::string& id) {
        links::Link* l = links_.get_by_id(id);
        if (!l || l->deleted) {
            logger::warn("Cannot reprocess missing or deleted link: " + id);
            return false;
        }
        return links_.update_status(id, LinkStatus::ToReprocess);
    }

private:
    links::Store& links_;
    const filters::Store& filters_;
    Options opts_;
};

} // namespace classify
