#include <service/ports.h>
#include <testing/fakes.h>

#include <doctest/doctest.h>

using namespace drogon;
using namespace service;

TEST_CASE("allocation skips bound ports") {
    fakes::TestLoop loop;
    PortAllocator ports([](const int port) { return port != 4000 && port != 4001; });

    const auto port = loop.run<std::optional<int>>([&]() -> Task<std::optional<int>> { co_return co_await ports.allocate(4000, 10); });

    REQUIRE(port.has_value());
    CHECK(*port == 4002);
    CHECK(ports.isReserved(4002));
}

TEST_CASE("reserved ports are not handed out twice until released") {
    fakes::TestLoop loop;
    PortAllocator ports([](int) { return true; });

    const auto [first, second] = loop.run<std::pair<std::optional<int>, std::optional<int>>>(
        [&]() -> Task<std::pair<std::optional<int>, std::optional<int>>> {
            const auto a = co_await ports.allocate(5000, 1);
            const auto b = co_await ports.allocate(5000, 1);
            co_return std::make_pair(a, b);
        });
    CHECK(first == 5000);
    CHECK_FALSE(second.has_value());

    const auto again = loop.run<std::optional<int>>([&]() -> Task<std::optional<int>> {
        co_await ports.release(5000);
        co_return co_await ports.allocate(5000, 1);
    });
    CHECK(again == 5000);
}

TEST_CASE("concurrent allocations receive distinct ports") {
    fakes::TestLoop first;
    fakes::TestLoop second;
    PortAllocator ports([](int) { return true; });

    std::vector<int> allocated;
    std::mutex mutex;
    const auto allocateMany = [&](fakes::TestLoop &loop) {
        return std::async(std::launch::async, [&]() {
            for (int i = 0; i < 25; i++) {
                const auto port = loop.run<std::optional<int>>([&]() -> Task<std::optional<int>> { co_return co_await ports.allocate(6000, 100); });
                std::lock_guard lock(mutex);
                if (port) {
                    allocated.push_back(*port);
                }
            }
        });
    };

    auto a = allocateMany(first);
    auto b = allocateMany(second);
    a.get();
    b.get();

    REQUIRE(allocated.size() == 50);
    const std::set<int> unique(allocated.begin(), allocated.end());
    CHECK(unique.size() == 50);
}

TEST_CASE("exhausted range reports no port") {
    fakes::TestLoop loop;
    PortAllocator ports([](int) { return false; });

    const auto port = loop.run<std::optional<int>>([&]() -> Task<std::optional<int>> { co_return co_await ports.allocate(7000, 5); });
    CHECK_FALSE(port.has_value());
}
