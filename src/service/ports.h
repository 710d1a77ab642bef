#pragma once

#include <drogon/utils/coroutine.h>
#include <mutex>

#include <functional>
#include <optional>
#include <set>

namespace service {
    bool isPortFree(int port);

    class PortAllocator {
    public:
        using Probe = std::function<bool(int port)>;

        explicit PortAllocator(Probe probe = isPortFree);

        // Scans [start, start + span) for a port that is neither reserved nor bound. The port stays reserved until released.
        drogon::Task<std::optional<int>> allocate(int start, int span);

        drogon::Task<> release(int port);

        bool isReserved(int port) const;

    private:
        Probe probe_;
        std::set<int> reserved_;
        mutable std::mutex reservedMutex_;
        drogon::Mutex allocationMutex_;
    };
}
