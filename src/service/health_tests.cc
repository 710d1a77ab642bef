#include <service/health.h>
#include <testing/fakes.h>

#include <doctest/doctest.h>

using namespace drogon;
using namespace service;
using namespace std::chrono_literals;

TEST_CASE("poll returns ready on the first ready probe") {
    fakes::TestLoop loop;
    int calls = 0;

    const auto outcome = loop.run<PollOutcome>([&]() -> Task<PollOutcome> {
        co_return co_await pollUntilReady(loop.loop(), {1ms, 10}, [&](const int attempt) -> Task<ProbeState> {
            calls++;
            co_return attempt == 3 ? ProbeState::READY : ProbeState::PENDING;
        });
    });

    CHECK(outcome == PollOutcome::READY);
    CHECK(calls == 3);
}

TEST_CASE("dead probe stops polling immediately") {
    fakes::TestLoop loop;
    int calls = 0;

    const auto outcome = loop.run<PollOutcome>([&]() -> Task<PollOutcome> {
        co_return co_await pollUntilReady(loop.loop(), {1ms, 60}, [&](int) -> Task<ProbeState> {
            calls++;
            co_return ProbeState::DEAD;
        });
    });

    CHECK(outcome == PollOutcome::DEAD);
    CHECK(calls == 1);
}

TEST_CASE("poll times out after the attempt budget") {
    fakes::TestLoop loop;
    int calls = 0;

    const auto outcome = loop.run<PollOutcome>([&]() -> Task<PollOutcome> {
        co_return co_await pollUntilReady(loop.loop(), {1ms, 5}, [&](int) -> Task<ProbeState> {
            calls++;
            co_return ProbeState::PENDING;
        });
    });

    CHECK(outcome == PollOutcome::TIMEOUT);
    CHECK(calls == 5);
}

TEST_CASE("cancellation is observed between attempts") {
    fakes::TestLoop loop;
    const auto token = std::make_shared<CancellationToken>();
    int calls = 0;

    const auto outcome = loop.run<PollOutcome>([&]() -> Task<PollOutcome> {
        co_return co_await pollUntilReady(
            loop.loop(), {1ms, 10},
            [&](const int attempt) -> Task<ProbeState> {
                calls++;
                if (attempt == 2) {
                    token->cancel("stop");
                }
                co_return ProbeState::PENDING;
            },
            token);
    });

    CHECK(outcome == PollOutcome::CANCELLED);
    CHECK(calls == 2);
    CHECK(token->reason() == "stop");
}

TEST_CASE("wait for predicate") {
    fakes::TestLoop loop;
    int calls = 0;

    const auto satisfied = loop.run<bool>([&]() -> Task<bool> {
        co_return co_await waitFor(loop.loop(), 1ms, 10ms, [&]() -> Task<bool> { co_return ++calls >= 2; });
    });
    CHECK(satisfied);

    const auto never = loop.run<bool>(
        [&]() -> Task<bool> { co_return co_await waitFor(loop.loop(), 1ms, 5ms, []() -> Task<bool> { co_return false; }); });
    CHECK_FALSE(never);
}
