#include "RelayNode.hpp"
#include <iostream>

namespace rendezvous {

    RelayNode::RelayNode(NetworkHost& host, Options options)
        : host(host), options(options), lastSweep(std::chrono::steady_clock::now()) {
        if (options.mode == DiscoveryMode::Broadcast) {
            strategy.emplace<BroadcastDiscovery>(options.verbose);
        } else {
            strategy.emplace<RoomDiscovery>(options.verbose);
        }
    }

    void RelayNode::start() {
        // protocols and topics are in place before the first peer can connect
        if (auto* rooms = std::get_if<RoomDiscovery>(&strategy)) {
            rooms->attach(host);
        } else if (auto* broadcast = std::get_if<BroadcastDiscovery>(&strategy)) {
            broadcast->attach(host);
        }
        host.start();

        std::cout << "Discovery mode: " << discoveryModeToString(options.mode) << std::endl;
    }

    void RelayNode::stop() {
        host.stop();
    }

    bool RelayNode::pollOnce(std::chrono::milliseconds timeout) {
        auto event = host.nextEvent(timeout);
        if (event) {
            dispatch(*event);
        }
        maybeSweep();
        return event.has_value();
    }

    void RelayNode::run(const std::atomic<bool>& keepRunning) {
        while (keepRunning.load()) {
            pollOnce(std::chrono::milliseconds(250));
        }
    }

    void RelayNode::dispatch(const HostEvent& event) {
        if (auto* listen = std::get_if<ListenAddress>(&event)) {
            std::cout << "Listening on " << listen->address << "/p2p/" << host.localPeerId() << std::endl;
        } else if (auto* established = std::get_if<ConnectionEstablished>(&event)) {
            std::cout << "Connection established with " << established->peerId
                      << " via " << established->remoteAddress << std::endl;
        } else if (auto* closed = std::get_if<ConnectionClosed>(&event)) {
            std::cout << "Connection closed with " << closed->peerId << ": " << closed->cause << std::endl;
            // any close clears the peer, even if another connection to it remains open
            if (auto* rooms = std::get_if<RoomDiscovery>(&strategy)) {
                rooms->onConnectionClosed(*closed);
            }
        } else if (auto* request = std::get_if<InboundRequest>(&event)) {
            if (auto* rooms = std::get_if<RoomDiscovery>(&strategy)) {
                if (rooms->onRequest(host, *request)) {
                    ++answered;
                }
            } else {
                if (options.verbose) {
                    std::cout << "[debug] Refusing request for " << request->protocol << " in broadcast mode" << std::endl;
                }
                if (!host.sendError(request->channel, "Room discovery is disabled on this relay")) {
                    std::cerr << "Warning: Could not refuse request from " << request->peerId << std::endl;
                }
            }
        } else if (auto* message = std::get_if<TopicMessage>(&event)) {
            if (auto* broadcast = std::get_if<BroadcastDiscovery>(&strategy)) {
                broadcast->onTopicMessage(*message);
            }
        } else if (auto* subscribed = std::get_if<TopicSubscribed>(&event)) {
            if (auto* broadcast = std::get_if<BroadcastDiscovery>(&strategy)) {
                broadcast->onSubscribed(*subscribed);
            }
        } else if (auto* unsubscribed = std::get_if<TopicUnsubscribed>(&event)) {
            if (auto* broadcast = std::get_if<BroadcastDiscovery>(&strategy)) {
                broadcast->onUnsubscribed(*unsubscribed);
            }
        } else if (auto* reservation = std::get_if<ReservationAccepted>(&event)) {
            std::cout << "Relay reservation " << (reservation->renewed ? "renewed" : "accepted")
                      << " for " << reservation->peerId << std::endl;
        }
    }

    void RelayNode::maybeSweep() {
        if (options.sweepInterval.count() <= 0) {
            return;
        }
        auto* rooms = std::get_if<RoomDiscovery>(&strategy);
        if (!rooms) {
            return;
        }

        const auto now = std::chrono::steady_clock::now();
        if (now - lastSweep < options.sweepInterval) {
            return;
        }
        lastSweep = now;

        const size_t removed = rooms->sweep(now);
        if (options.verbose && removed > 0) {
            std::cout << "[debug] Sweep removed " << removed << " expired room entries" << std::endl;
        }
    }

} // namespace rendezvous
