#pragma once
// Run status, progress snapshots and the control token shared with the download worker.

#include <string>
#include <optional>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <chrono>

namespace download {

enum class RunStatus {
    Idle,
    Running,
    Paused,
    Stopped
};

inline const char* to_string(RunStatus s) {
    switch (s) {
        case RunStatus::Idle:    return "idle";
        case RunStatus::Running: return "running";
        case RunStatus::Paused:  return "paused";
        case RunStatus::Stopped: return "stopped";
    }
    return "idle";
}

// Value copy handed to observers; the live instance belongs to the worker.
struct ProgressSnapshot {
    RunStatus status = RunStatus::Idle;
    std::optional<std::string> current_link_id;
    std::string current_url;
    int total_links = 0;
    int completed_links = 0;
    int failed_links = 0;
    double current_progress = 0.0; // finished items / total
    std::string current_operation;
    int images_downloaded = 0;
};

// Cooperative control signals, observed by the worker once per tick.
// Stop wins over pause; skip only affects the item in flight.
class Control {
public:
    void reset() {
        std::lock_guard<std::mutex> lk(m_);
        stop_ = false;
        pause_ = false;
        skip_ = false;
    }

    void request_stop() {
        std::lock_guard<std::mutex> lk(m_);
        stop_ = true;
        cv_.notify_all();
    }

    void set_paused(bool paused) {
        std::lock_guard<std::mutex> lk(m_);
        pause_ = paused;
        cv_.notify_all();
    }

    void request_skip() { skip_ = true; }
    void clear_skip() { skip_ = false; }

    bool stop_requested() const { return stop_; }
    bool paused() const { return pause_; }
    bool skip_requested() const { return skip_; }

    // Blocks while paused, waking at least every tick. False if stop was requested.
    bool wait_while_paused(std::chrono::milliseconds tick) {
        std::unique_lock<std::mutex> lk(m_);
        while (pause_ && !stop_) {
            cv_.wait_for(lk, tick);
        }
        return !stop_;
    }

private:
    std::mutex m_;
    std::condition_variable cv_;
    std::atomic<bool> stop_{false};
    std::atomic<bool> pause_{false};
    std::atomic<bool> skip_{false};
};

} // namespace download
