#pragma once
#ifndef RENDEZVOUS_RELAY_NODE_HPP
#define RENDEZVOUS_RELAY_NODE_HPP

#include "NetworkHost.hpp"
#include "PeerDiscovery.hpp"
#include <atomic>
#include <chrono>

namespace rendezvous {

    /**
     * Single dispatcher: pulls host events one at a time and routes them to the active
     * discovery strategy and the log.
     */
    class RelayNode {
        public:
            struct Options {
                DiscoveryMode mode = DiscoveryMode::Rooms;
                std::chrono::seconds sweepInterval{0};
                bool verbose = false;
            };

            RelayNode(NetworkHost& host, Options options);

            RelayNode(const RelayNode&) = delete;
            RelayNode& operator=(const RelayNode&) = delete;

            /** Attaches the discovery strategy to the host, then starts the host */
            void start();
            void stop();

            /**
             * Waits up to `timeout` for one event and dispatches it, then runs the sweep
             * if one is due.
             *
             * @param timeout Longest wait for an event.
             * @return false if no event arrived.
             */
            bool pollOnce(std::chrono::milliseconds timeout);

            /** Dispatches events until `keepRunning` turns false */
            void run(const std::atomic<bool>& keepRunning);

            /**
             * Routes one event to the strategy and the log. Inbound requests are answered
             * in room mode and refused with an error in broadcast mode.
             *
             * @param event Event pulled from the host.
             */
            void dispatch(const HostEvent& event);

            PeerDiscovery& discovery() { return strategy; }
            uint64_t requestsAnswered() const { return answered; }

        private:
            void maybeSweep();

            NetworkHost& host;
            const Options options;
            PeerDiscovery strategy;
            std::chrono::steady_clock::time_point lastSweep;
            uint64_t answered = 0;
    };

} // namespace rendezvous

#endif // RENDEZVOUS_RELAY_NODE_HPP
