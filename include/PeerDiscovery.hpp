#pragma once
#ifndef RENDEZVOUS_PEER_DISCOVERY_HPP
#define RENDEZVOUS_PEER_DISCOVERY_HPP

#include "BroadcastDiscovery.hpp"
#include "RoomDiscovery.hpp"
#include <optional>
#include <string>
#include <variant>

namespace rendezvous {

    enum class DiscoveryMode {
        Rooms,
        Broadcast
    };

    /** The active discovery strategy; exactly one runs per node */
    using PeerDiscovery = std::variant<RoomDiscovery, BroadcastDiscovery>;

    inline std::string discoveryModeToString(DiscoveryMode mode) {
        return mode == DiscoveryMode::Broadcast ? "broadcast" : "rooms";
    }

    inline std::optional<DiscoveryMode> parseDiscoveryMode(const std::string& text) {
        if (text == "rooms") return DiscoveryMode::Rooms;
        if (text == "broadcast") return DiscoveryMode::Broadcast;
        return std::nullopt;
    }

} // namespace rendezvous

#endif // RENDEZVOUS_PEER_DISCOVERY_HPP
