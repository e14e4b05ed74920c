#pragma once
// Console front-end: wires config, stores, classifier and the download orchestrator.

#include <string>
#include <memory>
#include <atomic>
#include <iosfwd>

#include "settings/settings.hpp"
#include "../links/store.hpp"
#include "../filters/store.hpp"
#include "../download/decision.hpp"

namespace app {

// Asks on `out` whether a limit-breaching download should go on and reads the answer
// from `in`. Anything but y/Y, end of input, or an interrupt (before or while
// waiting) means skip.
bool confirm_limit(std::istream& in, std::ostream& out,
                   const download::DecisionChannel::Request& req,
                   const std::atomic<bool>& interrupted);

class App {
public:
    // dir: configuration directory holding config.json and the data files.
    explicit App(std::string dir);

    // Full startup + one download run. 0 on success, 1 on a fatal setup error.
    int run();

    // Steps of run(), usable on their own.
    bool setup();
    int ingest();
    int classify_pending();
    int download();

    const settings::Config& config() const { return cfg_; }
    links::JsonStore& link_store() { return *links_; }
    filters::JsonStore& filter_store() { return *filters_; }

private:
    std::string dir_;
    settings::Config cfg_;
    std::unique_ptr<links::JsonStore> links_;
    std::unique_ptr<filters::JsonStore> filters_;
};

} // namespace app
