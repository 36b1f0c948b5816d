#include <gtest/gtest.h>
#include "DiscoveryProtocol.hpp"
#include <string>
#include <vector>

using namespace rendezvous;
using json = nlohmann::json;

namespace {
    std::vector<uint8_t> bytes(const std::string& text) {
        return std::vector<uint8_t>(text.begin(), text.end());
    }
}

// ---- REQUESTS ----

TEST(DiscoveryProtocolTest, DecodesWellFormedRequest) {
    auto request = decodeDiscoveryRequest(bytes(
        R"({"room":"lobby","peer_id":"12D3KooWabc","addrs":["/ip4/1.2.3.4/tcp/1/ws","/ip6/::1/tcp/1/ws"]})"));

    ASSERT_TRUE(request.has_value());
    EXPECT_EQ(request->room, "lobby");
    EXPECT_EQ(request->peerId, "12D3KooWabc");
    ASSERT_EQ(request->addrs.size(), 2u);
    EXPECT_EQ(request->addrs[1], "/ip6/::1/tcp/1/ws");
}

TEST(DiscoveryProtocolTest, AcceptsEmptyAddressListAndExtraFields) {
    auto request = decodeDiscoveryRequest(bytes(R"({"room":"r","peer_id":"p","addrs":[],"extra":42})"));
    ASSERT_TRUE(request.has_value());
    EXPECT_TRUE(request->addrs.empty());
}

TEST(DiscoveryProtocolTest, RejectsMalformedRequests) {
    EXPECT_FALSE(decodeDiscoveryRequest(bytes("")).has_value());
    EXPECT_FALSE(decodeDiscoveryRequest(bytes("not json")).has_value());
    EXPECT_FALSE(decodeDiscoveryRequest(bytes(R"({"room":"r","peer_id":"p"})")).has_value());
    EXPECT_FALSE(decodeDiscoveryRequest(bytes(R"({"room":1,"peer_id":"p","addrs":[]})")).has_value());
    EXPECT_FALSE(decodeDiscoveryRequest(bytes(R"({"room":"r","peer_id":"p","addrs":"a"})")).has_value());
    EXPECT_FALSE(decodeDiscoveryRequest(bytes(R"(["r","p",[]])")).has_value());
}

TEST(DiscoveryProtocolTest, EncodedRequestUsesWireFieldNames) {
    DiscoveryRequest request{"lobby", "P1", {"a1"}};
    auto encoded = encodeDiscoveryRequest(request);

    auto parsed = json::parse(encoded.begin(), encoded.end());
    EXPECT_EQ(parsed.at("room"), "lobby");
    EXPECT_EQ(parsed.at("peer_id"), "P1");
    EXPECT_EQ(parsed.at("addrs"), json::array({"a1"}));
}

// ---- RESPONSES ----

TEST(DiscoveryProtocolTest, EncodesResponsePeers) {
    DiscoveryResponse response;
    response.peers.push_back(PeerInfo{"P1", {"a1"}});
    response.peers.push_back(PeerInfo{"P2", {}});

    auto encoded = encodeDiscoveryResponse(response);
    auto parsed = json::parse(encoded.begin(), encoded.end());

    ASSERT_TRUE(parsed.at("peers").is_array());
    ASSERT_EQ(parsed.at("peers").size(), 2u);
    EXPECT_EQ(parsed["peers"][0].at("peer_id"), "P1");
    EXPECT_EQ(parsed["peers"][0].at("addrs"), json::array({"a1"}));
    EXPECT_TRUE(parsed["peers"][1].at("addrs").empty());
}

TEST(DiscoveryProtocolTest, EmptyResponseHasEmptyPeerArray) {
    auto encoded = encodeDiscoveryResponse(DiscoveryResponse{});
    EXPECT_EQ(std::string(encoded.begin(), encoded.end()), R"({"peers":[]})");
}

TEST(DiscoveryProtocolTest, DecodesResponseFromClientSide) {
    auto response = decodeDiscoveryResponse(bytes(R"({"peers":[{"peer_id":"P9","addrs":["x","y"]}]})"));
    ASSERT_TRUE(response.has_value());
    ASSERT_EQ(response->peers.size(), 1u);
    EXPECT_EQ(response->peers[0].peerId, "P9");
    EXPECT_EQ(response->peers[0].addrs.size(), 2u);

    EXPECT_FALSE(decodeDiscoveryResponse(bytes(R"({"peers":[{"addrs":[]}]})")).has_value());
}
