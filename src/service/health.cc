#include "health.h"
#include "util.h"

using namespace drogon;

namespace service {
    // clang-format off
    ENUM_TO_STR(PollOutcome,
        {PollOutcome::READY, "ready"},
        {PollOutcome::DEAD, "dead"},
        {PollOutcome::TIMEOUT, "timeout"},
        {PollOutcome::CANCELLED, "cancelled"}
    )
    // clang-format on

    Task<PollOutcome> pollUntilReady(trantor::EventLoop *loop, const PollPolicy policy, const Probe probe,
                                     const std::shared_ptr<CancellationToken> token) {
        for (int attempt = 1; attempt <= policy.maxAttempts; attempt++) {
            if (token && token->isCancelled()) {
                co_return PollOutcome::CANCELLED;
            }

            switch (co_await probe(attempt)) {
                case ProbeState::READY:
                    co_return PollOutcome::READY;
                case ProbeState::DEAD:
                    co_return PollOutcome::DEAD;
                case ProbeState::PENDING:
                    break;
            }

            if (attempt < policy.maxAttempts) {
                co_await sleepCoro(loop, policy.interval);
            }
        }

        co_return PollOutcome::TIMEOUT;
    }

    Task<bool> waitFor(trantor::EventLoop *loop, const std::chrono::milliseconds interval, const std::chrono::milliseconds timeout,
                       const std::function<Task<bool>()> predicate, const std::shared_ptr<CancellationToken> token) {
        const auto attempts = std::max(1, static_cast<int>(timeout / interval));
        const auto outcome = co_await pollUntilReady(
            loop, {interval, attempts},
            [&predicate](int) -> Task<ProbeState> { co_return co_await predicate() ? ProbeState::READY : ProbeState::PENDING; }, token);
        co_return outcome == PollOutcome::READY;
    }
}
