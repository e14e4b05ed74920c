#include "orchestrator.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <sstream>
#include <iomanip>

#include "output.hpp"
#include "process.hpp"
#include "../logger.hpp"

namespace download {

using types::LinkStatus;
using types::LimitKind;

namespace {
std::string join_args(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty()) out += ' ';
        out += a;
    }
    return out;
}

std::string format_mb(double mb) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << mb;
    return oss.str();
}
} // namespace

Orchestrator::Orchestrator(links::Store& store, Limits limits, ToolOptions tool,
                           std::chrono::milliseconds tick)
    : store_(store), limits_(limits), tool_(std::move(tool)), tick_(tick) {}

Orchestrator::~Orchestrator() {
    stop();
    if (worker_.joinable()) worker_.join();
}

bool Orchestrator::start() {
    return start_batch(store_.downloadable());
}

bool Orchestrator::start(const std::vector<std::string>& link_ids) {
    std::vector<links::Link*> batch;
    for (const auto& id : link_ids) {
        links::Link* l = store_.get_by_id(id);
        if (l && !l->deleted) batch.push_back(l);
    }
    return start_batch(std::move(batch));
}

bool Orchestrator::start_batch(std::vector<links::Link*> batch) {
    std::lock_guard<std::mutex> start_lock(start_m_);
    {
        std::lock_guard<std::mutex> lk(state_m_);
        if (active_) {
            logger::warn("Download already running");
            return false;
        }
    }
    // The previous worker has published its final snapshot; reap the thread.
    if (worker_.joinable()) worker_.join();

    if (batch.empty()) {
        logger::info("No links to download");
        return false;
    }

    control_.reset();
    {
        std::lock_guard<std::mutex> lk(state_m_);
        progress_ = ProgressSnapshot{};
        progress_.status = RunStatus::Running;
        progress_.total_links = static_cast<int>(batch.size());
        last_error_.reset();
        active_ = true;
    }
    const std::size_t count = batch.size();
    worker_ = std::thread(&Orchestrator::run, this, std::move(batch));
    logger::info("Started downloading " + std::to_string(count) + " links");
    return true;
}

void Orchestrator::pause() {
    std::lock_guard<std::mutex> lk(state_m_);
    if (progress_.status != RunStatus::Running) return;
    progress_.status = RunStatus::Paused;
    control_.set_paused(true);
    logger::info("Downloads paused");
}

void Orchestrator::resume() {
    std::lock_guard<std::mutex> lk(state_m_);
    if (progress_.status != RunStatus::Paused) return;
    progress_.status = RunStatus::Running;
    control_.set_paused(false);
    logger::info("Downloads resumed");
}

void Orchestrator::stop() {
    std::lock_guard<std::mutex> lk(state_m_);
    control_.request_stop();
    if (!active_) return;
    progress_.status = RunStatus::Stopped;
    logger::info("Downloads stopped");
}

void Orchestrator::skip_current() {
    std::lock_guard<std::mutex> lk(state_m_);
    if (!active_ || !progress_.current_link_id) return;
    control_.request_skip();
    logger::info("Skipping current download");
}

ProgressSnapshot Orchestrator::progress() const {
    std::lock_guard<std::mutex> lk(state_m_);
    return progress_;
}

bool Orchestrator::is_running() const {
    std::lock_guard<std::mutex> lk(state_m_);
    return active_;
}

bool Orchestrator::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(state_m_);
    return idle_cv_.wait_for(lk, timeout, [this]{ return !active_; });
}

Orchestrator::SubscriptionId Orchestrator::on_progress(ProgressCallback cb) {
    std::lock_guard<std::mutex> lk(observers_m_);
    const SubscriptionId id = next_subscription_++;
    progress_observers_.emplace_back(id, std::move(cb));
    return id;
}

Orchestrator::SubscriptionId Orchestrator::on_completion(CompletionCallback cb) {
    std::lock_guard<std::mutex> lk(observers_m_);
    const SubscriptionId id = next_subscription_++;
    completion_observers_.emplace_back(id, std::move(cb));
    return id;
}

bool Orchestrator::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lk(observers_m_);
    const auto before = progress_observers_.size() + completion_observers_.size();
    auto same = [id](const auto& entry) { return entry.first == id; };
    progress_observers_.erase(std::remove_if(progress_observers_.begin(), progress_observers_.end(), same),
                              progress_observers_.end());
    completion_observers_.erase(std::remove_if(completion_observers_.begin(), completion_observers_.end(), same),
                                completion_observers_.end());
    return progress_observers_.size() + completion_observers_.size() < before;
}

std::vector<std::string> Orchestrator::build_command(const std::string& url) const {
    namespace fs = std::filesystem;
    std::vector<std::string> argv;
    argv.push_back(tool_.command);
    argv.insert(argv.end(), tool_.default_args.begin(), tool_.default_args.end());

    if (!tool_.output_dir.empty()) {
        fs::path dir(tool_.output_dir);
        if (dir.is_relative() && !tool_.base_dir.empty()) dir = fs::path(tool_.base_dir) / dir;
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) logger::warn("Could not create output directory " + dir.string() + ": " + ec.message());
        argv.push_back("-d");
        argv.push_back(dir.string());
    }

    if (!tool_.config_file.empty()) {
        std::error_code ec;
        if (fs::exists(tool_.config_file, ec)) {
            argv.push_back("--config");
            argv.push_back(tool_.config_file);
        } else {
            logger::debug("Downloader config file not found, not passing it: " + tool_.config_file);
        }
    }

    argv.push_back(url);
    return argv;
}

void Orchestrator::run(std::vector<links::Link*> batch) {
    const std::size_t total = batch.size();
    try {
        for (std::size_t i = 0; i < total; ++i) {
            if (control_.stop_requested()) break;

            // Pause is only honored between items.
            if (control_.paused()) {
                publish();
                if (!control_.wait_while_paused(tick_)) break;
            }
            if (control_.stop_requested()) break;

            links::Link& link = *batch[i];
            LinkStatus final_status = LinkStatus::Error;
            try {
                final_status = download_one(link);
            } catch (const std::exception& e) {
                logger::error("Error downloading " + link.url + ": " + e.what());
                link.error_message = e.what();
                final_status = finish(link, LinkStatus::Error);
            } catch (...) {
                logger::error("Error downloading " + link.url + ": unknown exception");
                link.error_message = "unknown error";
                final_status = finish(link, LinkStatus::Error);
            }

            const bool success = final_status == LinkStatus::Downloaded;
            {
                std::lock_guard<std::mutex> lk(state_m_);
                if (success) ++progress_.completed_links;
                else ++progress_.failed_links;
                progress_.current_progress = static_cast<double>(i + 1) / static_cast<double>(total);
                control_.clear_skip();
                progress_.current_link_id.reset();
                progress_.current_url.clear();
            }
            notify_completion(link.id, success);
            publish();
        }
    } catch (const std::exception& e) {
        logger::error(std::string("Error in download worker: ") + e.what());
    } catch (...) {
        logger::error("Error in download worker: unknown exception");
    }

    {
        std::lock_guard<std::mutex> lk(state_m_);
        progress_.status = RunStatus::Idle;
        progress_.current_link_id.reset();
        progress_.current_url.clear();
        progress_.current_operation = "Idle";
    }
    publish();
    {
        std::lock_guard<std::mutex> lk(state_m_);
        active_ = false;
    }
    idle_cv_.notify_all();
}

LinkStatus Orchestrator::download_one(links::Link& link) {
    {
        std::lock_guard<std::mutex> lk(state_m_);
        control_.clear_skip();
        progress_.current_link_id = link.id;
        progress_.current_url = link.url;
        progress_.current_operation = "Downloading " + link.url;
        progress_.images_downloaded = 0;
    }
    link.error_message.clear();
    (void)store_.update_status(link.id, LinkStatus::Downloading);
    publish();

    const auto argv = build_command(link.url);
    logger::info("Starting download: " + link.url);
    logger::debug("Command: " + join_args(argv));

    Process proc;
    if (!proc.start(argv)) {
        logger::error("Could not start downloader for " + link.url + ": " + proc.last_error());
        link.error_message = proc.last_error();
        record_error(types::ErrorKind::ToolInvocation, link.url + ": " + proc.last_error());
        return finish(link, LinkStatus::Error);
    }

    auto baseline = std::chrono::steady_clock::now();
    int live_images = 0;
    std::string last_line;
    std::vector<std::string> raw_lines;

    auto consume = [&](std::vector<std::string> lines) {
        for (auto& line : lines) {
            raw_lines.push_back(line);
            if (line == last_line) continue;
            last_line = line;
            if (output::is_image_event(line)) ++live_images;
            {
                std::lock_guard<std::mutex> lk(state_m_);
                progress_.current_operation = line;
                progress_.images_downloaded = live_images;
            }
            publish();
        }
    };

    while (proc.running()) {
        if (control_.stop_requested() || control_.skip_requested()) {
            proc.terminate();
            proc.join_reader();
            logger::info("Download terminated: " + link.url);
            return finish(link, LinkStatus::Skipped);
        }

        if (limits_.max_time_per_link_seconds > 0 &&
            std::chrono::steady_clock::now() - baseline > std::chrono::seconds(limits_.max_time_per_link_seconds)) {
            logger::warn("Download timeout for " + link.url);
            if (gateway_.decide(link, LimitKind::Timeout)) {
                // Time spent deciding is not charged against the limit.
                baseline = std::chrono::steady_clock::now();
            } else {
                proc.terminate();
                proc.join_reader();
                return skip_for_limit(link, LimitKind::Timeout,
                    "running longer than " + std::to_string(limits_.max_time_per_link_seconds) + "s");
            }
        }

        consume(proc.drain_lines());
        std::this_thread::sleep_for(tick_);
    }

    proc.join_reader();
    consume(proc.drain_lines());
    const int exit_code = proc.exit_code();

    const int images = std::max(live_images, output::count_image_events(raw_lines));
    const double size_mb = output::measure_files_mb(raw_lines);
    link.images_count = images;
    link.file_size_mb = size_mb;
    {
        std::lock_guard<std::mutex> lk(state_m_);
        progress_.images_downloaded = images;
    }

    if (limits_.max_images_per_link > 0 && images > limits_.max_images_per_link) {
        logger::warn("Image count limit exceeded: " + std::to_string(images) + " > " +
                     std::to_string(limits_.max_images_per_link));
        if (!gateway_.decide(link, LimitKind::ImageCount)) {
            return skip_for_limit(link, LimitKind::ImageCount,
                std::to_string(images) + " images exceed the limit of " + std::to_string(limits_.max_images_per_link));
        }
    }

    if (limits_.max_file_size_mb > 0 && size_mb > limits_.max_file_size_mb) {
        logger::warn("File size limit exceeded: " + format_mb(size_mb) + "MB > " +
                     format_mb(limits_.max_file_size_mb) + "MB");
        if (!gateway_.decide(link, LimitKind::FileSize)) {
            return skip_for_limit(link, LimitKind::FileSize,
                format_mb(size_mb) + "MB exceeds the limit of " + format_mb(limits_.max_file_size_mb) + "MB");
        }
    }

    if (exit_code == 0) {
        logger::info("Successfully downloaded: " + link.url);
        return finish(link, LinkStatus::Downloaded);
    }

    link.error_message = output::failure_message(raw_lines, tool_.command, exit_code);
    logger::error("Downloader error for " + link.url + ": " + link.error_message);
    record_error(types::ErrorKind::ToolInvocation, link.url + ": " + link.error_message);
    return finish(link, LinkStatus::Error);
}

LinkStatus Orchestrator::skip_for_limit(links::Link& link, LimitKind kind, const std::string& detail) {
    link.error_message = std::string("error(") + types::to_string(kind) + "): " + detail;
    logger::warn("Skipping " + link.url + ": " + link.error_message);
    record_error(types::ErrorKind::LimitBreach, link.url + ": " + link.error_message);
    return finish(link, LinkStatus::ToSkipLimit);
}

LinkStatus Orchestrator::finish(links::Link& link, LinkStatus status) {
    if (!store_.update_status(link.id, status)) {
        logger::error("Could not record status " + std::string(types::to_string(status)) + " for " + link.url);
    }
    return status;
}

void Orchestrator::record_error(types::ErrorKind kind, const std::string& message) {
    std::lock_guard<std::mutex> lk(state_m_);
    last_error_ = types::Error{kind, message};
}

std::optional<types::Error> Orchestrator::last_error() const {
    std::lock_guard<std::mutex> lk(state_m_);
    return last_error_;
}

void Orchestrator::publish() {
    const ProgressSnapshot snap = progress();
    std::vector<ProgressCallback> callbacks;
    {
        std::lock_guard<std::mutex> lk(observers_m_);
        for (const auto& entry : progress_observers_) callbacks.push_back(entry.second);
    }
    for (const auto& cb : callbacks) {
        try {
            cb(snap);
        } catch (const std::exception& e) {
            logger::error(std::string("Error in progress callback: ") + e.what());
            record_error(types::ErrorKind::Observer, std::string("progress callback: ") + e.what());
        } catch (...) {
            logger::error("Error in progress callback: unknown exception");
            record_error(types::ErrorKind::Observer, "progress callback: unknown exception");
        }
    }
}

void Orchestrator::notify_completion(const std::string& link_id, bool success) {
    std::vector<CompletionCallback> callbacks;
    {
        std::lock_guard<std::mutex> lk(observers_m_);
        for (const auto& entry : completion_observers_) callbacks.push_back(entry.second);
    }
    for (const auto& cb : callbacks) {
        try {
            cb(link_id, success);
        } catch (const std::exception& e) {
            logger::error(std::string("Error in completion callback: ") + e.what());
            record_error(types::ErrorKind::Observer, std::string("completion callback: ") + e.what());
        } catch (...) {
            logger::error("Error in completion callback: unknown exception");
            record_error(types::ErrorKind::Observer, "completion callback: unknown exception");
        }
    }
}

} // namespace download
