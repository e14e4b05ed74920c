#pragma once
// Decision Gateway: synchronous arbitration when a per-link limit is breached.
// - Gateway: at most one outstanding decide() call; no resolver -> skip (false)
// - DecisionChannel: resolver that hands the request to another thread and blocks on a future

#include <string>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <future>
#include <optional>
#include <deque>
#include <atomic>
#include <chrono>

#include "../links/link.hpp"
#include "../logger.hpp"
#include "../types.hpp"

namespace download {

using types::LimitKind;

// Returns true to continue the download, false to skip it.
using Resolver = std::function<bool(const links::Link&, LimitKind)>;

class DecisionGateway {
public:
    // Last registration wins. An empty function clears the resolver.
    void set_resolver(Resolver r) {
        std::lock_guard<std::mutex> lk(resolver_m_);
        resolver_ = std::move(r);
    }

    bool has_resolver() const {
        std::lock_guard<std::mutex> lk(resolver_m_);
        return static_cast<bool>(resolver_);
    }

    // Blocks until the resolver answers.
    bool decide(const links::Link& link, LimitKind kind) {
        std::lock_guard<std::mutex> one_at_a_time(decide_m_);
        Resolver r;
        {
            std::lock_guard<std::mutex> lk(resolver_m_);
            r = resolver_;
        }
        const std::string what = std::string("Limit exceeded (") + types::to_string(kind) + ") for " + link.url;
        if (!r) {
            logger::warn(what + ", skipping by default");
            return false;
        }
        pending_ = true;
        bool result = false;
        try {
            result = r(link, kind);
        } catch (const std::exception& e) {
            logger::error(std::string("Error in limit decision resolver: ") + e.what());
            result = false;
        } catch (...) {
            logger::error("Error in limit decision resolver: unknown exception");
            result = false;
        }
        pending_ = false;
        logger::info(what + (result ? ", continuing" : ", skipping"));
        return result;
    }

    bool pending() const { return pending_; }

private:
    mutable std::mutex resolver_m_;
    std::mutex decide_m_;
    Resolver resolver_;
    std::atomic<bool> pending_{false};
};

// Rendezvous between the download worker and a presentation layer.
//
//   DecisionChannel ch;
//   orchestrator.set_resolver(ch.resolver());
//   // UI thread:
//   if (auto req = ch.wait_request(100ms)) ch.answer(ask_user(*req));
class DecisionChannel {
public:
    struct Request {
        std::string link_id;
        std::string url;
        LimitKind kind = LimitKind::Timeout;
    };

    Resolver resolver() {
        return [this](const links::Link& link, LimitKind kind) { return post(link, kind); };
    }

    // Take the outstanding request, if any arrives within timeout.
    std::optional<Request> wait_request(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lk(m_);
        cv_.wait_for(lk, timeout, [this]{ return pending_.has_value() && !taken_; });
        if (!pending_ || taken_) return std::nullopt;
        taken_ = true;
        return pending_->request;
    }

    // Answer the outstanding request. Returns false when nothing is waiting.
    bool answer(bool proceed) {
        std::lock_guard<std::mutex> lk(m_);
        if (!pending_) return false;
        pending_->promise.set_value(proceed);
        pending_.reset();
        taken_ = false;
        return true;
    }

    // Answer any outstanding request with "skip".
    void cancel_pending() { (void)answer(false); }

    bool has_pending() const {
        std::lock_guard<std::mutex> lk(m_);
        return pending_.has_value();
    }

private:
    struct Pending {
        Request request;
        std::promise<bool> promise;
    };

    bool post(const links::Link& link, LimitKind kind) {
        std::future<bool> fut;
        {
            std::lock_guard<std::mutex> lk(m_);
            Pending p;
            p.request = Request{link.id, link.url, kind};
            fut = p.promise.get_future();
            pending_.emplace(std::move(p));
            taken_ = false;
        }
        cv_.notify_all();
        return fut.get();
    }

    mutable std::mutex m_;
    std::condition_variable cv_;
    std::optional<Pending> pending_;
    bool taken_ = false;
};

} // namespace download
