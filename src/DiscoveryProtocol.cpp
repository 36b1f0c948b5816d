#include "DiscoveryProtocol.hpp"
#include <iostream>

using json = nlohmann::json;

namespace rendezvous {

    void to_json(json& j, const PeerInfo& info) {
        j = json{{"peer_id", info.peerId}, {"addrs", info.addrs}};
    }

    void from_json(const json& j, PeerInfo& info) {
        j.at("peer_id").get_to(info.peerId);
        j.at("addrs").get_to(info.addrs);
    }

    void to_json(json& j, const DiscoveryRequest& request) {
        j = json{{"room", request.room}, {"peer_id", request.peerId}, {"addrs", request.addrs}};
    }

    void from_json(const json& j, DiscoveryRequest& request) {
        j.at("room").get_to(request.room);
        j.at("peer_id").get_to(request.peerId);
        j.at("addrs").get_to(request.addrs);
    }

    void to_json(json& j, const DiscoveryResponse& response) {
        j = json{{"peers", response.peers}};
    }

    void from_json(const json& j, DiscoveryResponse& response) {
        j.at("peers").get_to(response.peers);
    }

    namespace {
        std::vector<uint8_t> dumpBytes(const json& j) {
            const std::string text = j.dump();
            return std::vector<uint8_t>(text.begin(), text.end());
        }

        template <typename T>
        std::optional<T> parseBody(const std::vector<uint8_t>& body, const char* what) {
            try {
                return json::parse(body.begin(), body.end()).get<T>();
            } catch (const json::exception& e) {
                std::cerr << "Warning: Malformed " << what << ": " << e.what() << std::endl;
                return std::nullopt;
            }
        }
    }

    std::vector<uint8_t> encodeDiscoveryRequest(const DiscoveryRequest& request) {
        return dumpBytes(request);
    }

    std::optional<DiscoveryRequest> decodeDiscoveryRequest(const std::vector<uint8_t>& body) {
        return parseBody<DiscoveryRequest>(body, "discovery request");
    }

    std::vector<uint8_t> encodeDiscoveryResponse(const DiscoveryResponse& response) {
        return dumpBytes(response);
    }

    std::optional<DiscoveryResponse> decodeDiscoveryResponse(const std::vector<uint8_t>& body) {
        return parseBody<DiscoveryResponse>(body, "discovery response");
    }

} // namespace rendezvous
