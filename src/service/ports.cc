#include "ports.h"

#include <log/log.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace drogon;
using namespace logging;

namespace service {
    bool isPortFree(const int port) {
        const int fd = socket(AF_INET, SOCK_STREAM, 0);
        if (fd < 0) {
            return false;
        }

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
        addr.sin_port = htons(static_cast<uint16_t>(port));

        const bool free = bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0;
        close(fd);
        return free;
    }

    PortAllocator::PortAllocator(Probe probe) : probe_(std::move(probe)) {}

    Task<std::optional<int>> PortAllocator::allocate(const int start, const int span) {
        [[maybe_unused]] const auto guard = co_await allocationMutex_.scoped_lock();

        for (int port = start; port < start + span; port++) {
            {
                std::lock_guard lock(reservedMutex_);
                if (reserved_.contains(port)) {
                    continue;
                }
            }
            if (!probe_(port)) {
                continue;
            }

            std::lock_guard lock(reservedMutex_);
            reserved_.insert(port);
            logger.debug("Allocated port {}", port);
            co_return port;
        }

        logger.warn("No free port found in range {}-{}", start, start + span - 1);
        co_return std::nullopt;
    }

    Task<> PortAllocator::release(const int port) {
        std::lock_guard lock(reservedMutex_);
        reserved_.erase(port);
        co_return;
    }

    bool PortAllocator::isReserved(const int port) const {
        std::lock_guard lock(reservedMutex_);
        return reserved_.contains(port);
    }
}
