#pragma once
#ifndef RENDEZVOUS_DISCOVERY_PROTOCOL_HPP
#define RENDEZVOUS_DISCOVERY_PROTOCOL_HPP

#include "RoomRegistry.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace rendezvous {

    // ============================================================
    //  DISCOVERY EXCHANGE PAYLOADS
    // ============================================================

    struct DiscoveryRequest {
        std::string room;
        std::string peerId;
        std::vector<std::string> addrs;
    };

    struct DiscoveryResponse {
        std::vector<PeerInfo> peers;
    };

    void to_json(nlohmann::json& j, const PeerInfo& info);
    void from_json(const nlohmann::json& j, PeerInfo& info);
    void to_json(nlohmann::json& j, const DiscoveryRequest& request);
    void from_json(const nlohmann::json& j, DiscoveryRequest& request);
    void to_json(nlohmann::json& j, const DiscoveryResponse& response);
    void from_json(const nlohmann::json& j, DiscoveryResponse& response);

    /** Serializes a request body as sent by clients */
    std::vector<uint8_t> encodeDiscoveryRequest(const DiscoveryRequest& request);

    /** Parses a request body; std::nullopt when it is not valid JSON or misses a field */
    std::optional<DiscoveryRequest> decodeDiscoveryRequest(const std::vector<uint8_t>& body);

    std::vector<uint8_t> encodeDiscoveryResponse(const DiscoveryResponse& response);

    std::optional<DiscoveryResponse> decodeDiscoveryResponse(const std::vector<uint8_t>& body);

} // namespace rendezvous

#endif // RENDEZVOUS_DISCOVERY_PROTOCOL_HPP
