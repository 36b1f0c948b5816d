#pragma once
#ifndef RENDEZVOUS_ROOM_DISCOVERY_HPP
#define RENDEZVOUS_ROOM_DISCOVERY_HPP

#include "DiscoveryProtocol.hpp"
#include "NetworkHost.hpp"
#include "RoomRegistry.hpp"

namespace rendezvous {

    /**
     * Drops a peer from every room once its connection to the relay closes.
     */
    class ConnectionEventBridge {
        public:
            explicit ConnectionEventBridge(RoomRegistry& registry) : registry(registry) {}

            /** Returns the number of rooms the peer was removed from */
            size_t onConnectionClosed(const ConnectionClosed& event);

        private:
            RoomRegistry& registry;
    };

    /**
     * Room-scoped discovery: a peer registers into a room and learns the other members.
     */
    class RoomDiscovery {
        public:
            explicit RoomDiscovery(bool verbose = false, RoomRegistry::Clock::duration ttl = PEER_TTL);

            /** Registers the discovery protocol on `host` */
            void attach(NetworkHost& host);

            /**
             * Registers the requester in its room and lists the other members.
             * The requester itself is never part of the result.
             */
            DiscoveryResponse handle(const DiscoveryRequest& request, RoomRegistry::Clock::time_point now);

            /**
             * Answers one inbound discovery exchange with exactly one response or error.
             * A malformed body, a foreign protocol or an undeliverable response fails the
             * exchange through NetworkHost::sendError.
             * @param host Host the exchange arrived on
             * @param request Decoded host event
             * @return true when a DiscoveryResponse was handed to the host
             */
            bool onRequest(NetworkHost& host, const InboundRequest& request);

            void onConnectionClosed(const ConnectionClosed& event);

            /** Applies the TTL to every room; returns the number of entries removed */
            size_t sweep(RoomRegistry::Clock::time_point now);

            RoomRegistry& registry() { return rooms; }
            const RoomRegistry& registry() const { return rooms; }

        private:
            RoomRegistry rooms;
            ConnectionEventBridge bridge;
            bool verbose;
    };

} // namespace rendezvous

#endif // RENDEZVOUS_ROOM_DISCOVERY_HPP
