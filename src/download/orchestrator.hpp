#pragma once
// Download orchestrator: runs the external downloader over a batch of links, one process
// at a time, on a single background worker.
//
// Per item: mark downloading, spawn, poll every tick (stop/skip, time limit, drain output),
// then image-count and file-size checks, then the exit code. Limit breaches go through
// the DecisionGateway. Observers are called from the worker thread, in order.

#include <string>
#include <vector>
#include <functional>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <cstddef>
#include <utility>
#include <optional>

#include "decision.hpp"
#include "progress.hpp"
#include "../links/store.hpp"
#include "../types.hpp"

namespace download {

// Per-link ceilings; a value <= 0 disables the check.
struct Limits {
    int max_images_per_link = 1000;
    int max_time_per_link_seconds = 3600;
    double max_file_size_mb = 500.0;
};

struct ToolOptions {
    std::string command = "gallery-dl";
    std::vector<std::string> default_args;
    std::string output_dir;   // "-d <dir>" when set; relative paths resolve against base_dir
    std::string config_file;  // "--config <file>" when set and present on disk
    std::string base_dir;     // configuration directory
};

class Orchestrator {
public:
    using ProgressCallback = std::function<void(const ProgressSnapshot&)>;
    using CompletionCallback = std::function<void(const std::string& link_id, bool success)>;
    using SubscriptionId = std::size_t;

    Orchestrator(links::Store& store, Limits limits, ToolOptions tool,
                 std::chrono::milliseconds tick = std::chrono::milliseconds(100));
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // All links currently to_download. False if a run is active or nothing to do.
    bool start();
    // Explicit batch (e.g. to_skip_limit overrides). Unknown and deleted ids are dropped.
    bool start(const std::vector<std::string>& link_ids);

    void pause();
    void resume();
    void stop();
    void skip_current();

    ProgressSnapshot progress() const;
    bool is_running() const;
    // True once the worker has finished (or was never started) within timeout.
    bool wait_idle(std::chrono::milliseconds timeout);

    SubscriptionId on_progress(ProgressCallback cb);
    SubscriptionId on_completion(CompletionCallback cb);
    bool unsubscribe(SubscriptionId id);

    void set_resolver(Resolver r) { gateway_.set_resolver(std::move(r)); }
    DecisionGateway& gateway() { return gateway_; }

    // <command> <default args...> [-d <dir>] [--config <file>] <url>
    std::vector<std::string> build_command(const std::string& url) const;

    const Limits& limits() const { return limits_; }

    // Most recent failure of the current or last run: spawn/exit (ToolInvocation),
    // limit skip (LimitBreach), or a raising callback (Observer). Cleared by start.
    std::optional<types::Error> last_error() const;

private:
    bool start_batch(std::vector<links::Link*> batch);
    void run(std::vector<links::Link*> batch);
    types::LinkStatus download_one(links::Link& link);
    types::LinkStatus finish(links::Link& link, types::LinkStatus status);
    types::LinkStatus skip_for_limit(links::Link& link, types::LimitKind kind, const std::string& detail);

    void record_error(types::ErrorKind kind, const std::string& message);
    void publish();
    void notify_completion(const std::string& link_id, bool success);

    links::Store& store_;
    const Limits limits_;
    const ToolOptions tool_;
    const std::chrono::milliseconds tick_;

    DecisionGateway gateway_;
    Control control_;

    mutable std::mutex state_m_;
    std::condition_variable idle_cv_;
    ProgressSnapshot progress_;
    bool active_ = false;
    std::optional<types::Error> last_error_;

    std::mutex start_m_;
    std::thread worker_;

    std::mutex observers_m_;
    SubscriptionId next_subscription_ = 1;
    std::vector<std::pair<SubscriptionId, ProgressCallback>> progress_observers_;
    std::vector<std::pair<SubscriptionId, CompletionCallback>> completion_observers_;
};

} // namespace download
