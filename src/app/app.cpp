#include "app.hpp"
#include <iostream>
#include <string>
#include <atomic>
#include <csignal>
#include <chrono>
#include <thread>

#include "../logger.hpp"
#include "settings/store.hpp"
#include "../links/extract.hpp"
#include "../filters/name_resolver.hpp"
#include "../classify/classifier.hpp"
#include "../download/orchestrator.hpp"
#include "../download/decision.hpp"

namespace app {

namespace {
std::atomic<bool> g_interrupted{false};

extern "C" void on_sigint(int) { g_interrupted = true; }

const char* limit_question(types::LimitKind kind) {
    switch (kind) {
        case types::LimitKind::Timeout:    return "Download is taking longer than the time limit.";
        case types::LimitKind::ImageCount: return "Download exceeded the image count limit.";
        case types::LimitKind::FileSize:   return "Download exceeded the file size limit.";
    }
    return "Download exceeded a limit.";
}
} // namespace

bool confirm_limit(std::istream& in, std::ostream& out,
                   const download::DecisionChannel::Request& req,
                   const std::atomic<bool>& interrupted) {
    if (interrupted) return false;
    out << limit_question(req.kind) << "\n  " << req.url
        << "\nContinue anyway? [y/N] (Ctrl-C takes effect after Enter) " << std::flush;
    std::string answer;
    if (!std::getline(in, answer)) return false;
    if (interrupted) return false;
    return !answer.empty() && (answer[0] == 'y' || answer[0] == 'Y');
}

App::App(std::string dir) : dir_(std::move(dir)) {}

bool App::setup() {
    // 1) Load config (JSON). If missing, create defaults.
    (void)settings::store::load_or_create(dir_, cfg_);

    // 2) Init logger: level and optional rotating file
    logger::set_level_name(cfg_.logging.level);
    if (!cfg_.logging.file.empty()) {
        const std::string logPath = settings::store::resolve(dir_, cfg_.logging.file);
        logger::set_log_file(logPath);
        logger::info(std::string("Logging to file: ") + logPath);
    }
    logger::info("Startup: DL Homework Garden");

    // 3) Data files
    if (!settings::store::ensure_dir(settings::store::link_files_dir(dir_))) {
        logger::warn("Link_files directory is not available");
    }

    filters_ = std::make_unique<filters::JsonStore>(settings::store::filters_path(dir_));
    if (!filters_->load()) {
        if (auto err = filters_->last_error()) logger::error("Filters not loaded: " + err->message);
        return false;
    }
    logger::info("Filters loaded: " + std::to_string(filters_->list().size()));

    links_ = std::make_unique<links::JsonStore>(settings::store::links_path(dir_));
    if (!links_->load()) {
        if (auto err = links_->last_error()) logger::error("Links not loaded: " + err->message);
        return false;
    }
    logger::info("Links loaded: " + std::to_string(links_->list_active().size()) + " active");
    return true;
}

int App::ingest() {
    auto added = links::ingest_directory(*links_, settings::store::link_files_dir(dir_));
    return static_cast<int>(added.size());
}

int App::classify_pending() {
    classify::Options opts;
    opts.trim_trailing_closers = cfg_.ingest.trim_trailing_closers;
    classify::Classifier classifier(*links_, *filters_, opts);

    const std::size_t pending = links_->pending().size();
    auto unmatched = classifier.process_pending();
    for (auto* l : unmatched) {
        logger::info("No filter matches: " + l->url);
    }

    filters::NameResolver names(settings::store::filters_path(dir_));
    (void)names.refresh();
    for (auto* l : links_->downloadable()) {
        logger::debug("Queued by " + names.resolve(l->filter_id) + ": " + l->url);
    }
    return static_cast<int>(pending) - static_cast<int>(unmatched.size());
}

int App::download() {
    download::Limits limits;
    limits.max_images_per_link = cfg_.download_limits.max_images_per_link;
    limits.max_time_per_link_seconds = cfg_.download_limits.max_time_per_link_seconds;
    limits.max_file_size_mb = cfg_.download_limits.max_file_size_mb;

    download::ToolOptions tool;
    tool.command = cfg_.gallery_dl.command;
    tool.default_args = cfg_.gallery_dl.default_args;
    tool.output_dir = cfg_.gallery_dl.output_dir;
    tool.config_file = settings::store::resolve(dir_, cfg_.gallery_dl.config_file);
    tool.base_dir = dir_;

    download::Orchestrator orch(*links_, limits, tool);
    download::DecisionChannel channel;
    orch.set_resolver(channel.resolver());

    int done = 0;
    int failed = 0;
    orch.on_progress([](const download::ProgressSnapshot& s) {
        if (!s.current_link_id) return;
        std::cout << "[" << (s.completed_links + s.failed_links) << "/" << s.total_links << "] "
                  << s.current_operation << std::endl;
    });
    orch.on_completion([&done, &failed](const std::string&, bool success) {
        if (success) ++done;
        else ++failed;
    });

    if (!orch.start()) return 0;

    g_interrupted = false;
    auto previous = std::signal(SIGINT, on_sigint);

    while (orch.is_running()) {
        if (g_interrupted) {
            logger::info("Interrupted, stopping downloads");
            orch.stop();
            channel.cancel_pending();
            (void)orch.wait_idle(std::chrono::seconds(10));
            continue;
        }
        auto req = channel.wait_request(std::chrono::milliseconds(200));
        if (!req) continue;

        (void)channel.answer(confirm_limit(std::cin, std::cout, *req, g_interrupted));
    }

    std::signal(SIGINT, previous == SIG_ERR ? SIG_DFL : previous);
    (void)links_->persist();
    logger::info("Downloads finished: " + std::to_string(done) + " ok, " + std::to_string(failed) + " failed");
    return done;
}

int App::run() {
    if (!setup()) return 1;
    const int added = ingest();
    if (added > 0) logger::info("Ingested " + std::to_string(added) + " links from Link_files");
    const int classified = classify_pending();
    logger::info("Classified " + std::to_string(classified) + " links");
    (void)download();
    return 0;
}

} // namespace app
