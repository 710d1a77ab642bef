#pragma once

#include <drogon/utils/coroutine.h>
#include <trantor/net/EventLoop.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace service {
    enum class ProbeState { PENDING, READY, DEAD };
    enum class PollOutcome { READY, DEAD, TIMEOUT, CANCELLED };

    std::string enumToStr(PollOutcome outcome);

    struct PollPolicy {
        std::chrono::milliseconds interval;
        int maxAttempts;
    };

    class CancellationToken {
    public:
        void cancel(std::string reason = "") {
            {
                std::lock_guard lock(mutex_);
                reason_ = std::move(reason);
            }
            cancelled_ = true;
        }

        bool isCancelled() const { return cancelled_; }

        std::string reason() const {
            std::lock_guard lock(mutex_);
            return reason_;
        }

    private:
        std::atomic<bool> cancelled_{false};
        mutable std::mutex mutex_;
        std::string reason_;
    };

    using Probe = std::function<drogon::Task<ProbeState>(int attempt)>;

    // Bounded-retry readiness loop shared by container and database startup checks.
    // Cancellation is observed between attempts only.
    drogon::Task<PollOutcome> pollUntilReady(trantor::EventLoop *loop, PollPolicy policy, Probe probe,
                                             std::shared_ptr<CancellationToken> token = nullptr);

    // Waits until the predicate holds or the timeout elapses
    drogon::Task<bool> waitFor(trantor::EventLoop *loop, std::chrono::milliseconds interval, std::chrono::milliseconds timeout,
                               std::function<drogon::Task<bool>()> predicate, std::shared_ptr<CancellationToken> token = nullptr);
}
