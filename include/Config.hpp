#pragma once
#ifndef RENDEZVOUS_CONFIG_HPP
#define RENDEZVOUS_CONFIG_HPP

#include "PeerDiscovery.hpp"
#include "Types.hpp"
#include <chrono>
#include <string>
#include <cstdint>

namespace rendezvous {

    struct RelayConfig {
        uint16_t port = DEFAULT_PORT;
        std::string identityPath = DEFAULT_IDENTITY_PATH;
        uint32_t maxReservations = DEFAULT_MAX_RESERVATIONS;
        DiscoveryMode discoveryMode = DiscoveryMode::Rooms;
        size_t workerThreads = DEFAULT_WORKER_THREADS;
        std::chrono::seconds sweepInterval{0};  // 0 keeps pruning lazy
        bool verbose = false;
        bool showHelp = false;
    };

    /**
     * Parses `--option value` and `--option=value` arguments.
     *
     * @throws std::invalid_argument on an unknown option, a missing value or a value
     *         out of range.
     */
    RelayConfig parseCommandLine(int argc, const char* const argv[]);

    std::string usage(const std::string& program);

} // namespace rendezvous

#endif // RENDEZVOUS_CONFIG_HPP
