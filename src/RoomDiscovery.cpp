#include "RoomDiscovery.hpp"
#include <iostream>

namespace rendezvous {

    size_t ConnectionEventBridge::onConnectionClosed(const ConnectionClosed& event) {
        return registry.removePeer(event.peerId);
    }

    RoomDiscovery::RoomDiscovery(bool verbose, RoomRegistry::Clock::duration ttl)
        : rooms(ttl), bridge(rooms), verbose(verbose) {}

    void RoomDiscovery::attach(NetworkHost& host) {
        host.registerProtocol(DISCOVERY_PROTOCOL);
    }

    DiscoveryResponse RoomDiscovery::handle(const DiscoveryRequest& request, RoomRegistry::Clock::time_point now) {
        DiscoveryResponse response;
        response.peers = rooms.registerPeer(request.room, request.peerId, request.addrs, now);
        return response;
    }

    bool RoomDiscovery::onRequest(NetworkHost& host, const InboundRequest& request) {
        if (request.protocol != DISCOVERY_PROTOCOL) {
            std::cerr << "Warning: Refusing request for " << request.protocol << " from " << request.peerId << std::endl;
            if (!host.sendError(request.channel, "Unsupported protocol: " + request.protocol) && verbose) {
                std::cout << "[debug] " << request.peerId << " left before the refusal was sent" << std::endl;
            }
            return false;
        }

        auto decoded = decodeDiscoveryRequest(request.body);
        if (!decoded) {
            if (!host.sendError(request.channel, "Malformed discovery request")) {
                std::cerr << "Warning: Could not refuse malformed request from " << request.peerId << std::endl;
            }
            return false;
        }

        if (verbose && decoded->peerId != request.peerId) {
            std::cout << "[debug] " << request.peerId << " registers as " << decoded->peerId << std::endl;
        }

        // the registry lock is released before anything is sent
        const DiscoveryResponse response = handle(*decoded, RoomRegistry::Clock::now());

        if (verbose) {
            std::cout << "[debug] Room '" << decoded->room << "': " << decoded->peerId
                      << " sees " << response.peers.size() << " peer(s)" << std::endl;
        }

        if (!host.sendResponse(request.channel, encodeDiscoveryResponse(response))) {
            std::cerr << "Warning: Could not send discovery response to " << request.peerId << std::endl;
            // the exchange still ends: the requester sees an error instead of waiting
            if (!host.sendError(request.channel, "Discovery response could not be delivered") && verbose) {
                std::cout << "[debug] " << request.peerId << " is gone; exchange dropped" << std::endl;
            }
            return false;
        }
        return true;
    }

    void RoomDiscovery::onConnectionClosed(const ConnectionClosed& event) {
        const size_t removed = bridge.onConnectionClosed(event);
        if (verbose && removed > 0) {
            std::cout << "[debug] Removed " << event.peerId << " from " << removed << " room(s)" << std::endl;
        }
    }

    size_t RoomDiscovery::sweep(RoomRegistry::Clock::time_point now) {
        return rooms.pruneExpired(now);
    }

} // namespace rendezvous
