#include <gtest/gtest.h>
#include "RelayNode.hpp"
#include "FakeHost.hpp"
#include <atomic>
#include <thread>

using namespace rendezvous;
using namespace std::chrono_literals;

// ============================================================================
// HELPERS
// ============================================================================

namespace {

    InboundRequest discoveryRequest(const std::string& room, const std::string& peerId, uint64_t id) {
        return InboundRequest{peerId, DISCOVERY_PROTOCOL,
                              encodeDiscoveryRequest(DiscoveryRequest{room, peerId, {"/ip4/10.0.0.1/tcp/1/ws"}}),
                              ResponseChannel{id, id}};
    }

    RelayNode::Options roomsMode() {
        RelayNode::Options options;
        options.mode = DiscoveryMode::Rooms;
        return options;
    }

    RelayNode::Options broadcastMode() {
        RelayNode::Options options;
        options.mode = DiscoveryMode::Broadcast;
        return options;
    }
}

// ============================================================================
// ROOM MODE
// ============================================================================

TEST(RelayNodeTest, StartAttachesRoomDiscovery) {
    FakeHost host;
    RelayNode node(host, roomsMode());
    node.start();

    EXPECT_TRUE(host.started);
    EXPECT_EQ(host.protocols.count(DISCOVERY_PROTOCOL), 1u);
    EXPECT_TRUE(host.topics.empty());
    EXPECT_TRUE(std::holds_alternative<RoomDiscovery>(node.discovery()));
}

TEST(RelayNodeTest, ProtocolIsRegisteredBeforeHostStarts) {
    FakeHost host;
    RelayNode node(host, roomsMode());
    node.start();

    EXPECT_EQ(host.protocolsAtStart.count(DISCOVERY_PROTOCOL), 1u);
}

TEST(RelayNodeTest, PollDispatchesRequests) {
    FakeHost host;
    RelayNode node(host, roomsMode());
    node.start();

    host.push(discoveryRequest("lobby", "P1", 1));
    host.push(discoveryRequest("lobby", "P2", 2));

    EXPECT_TRUE(node.pollOnce(100ms));
    EXPECT_TRUE(node.pollOnce(100ms));
    EXPECT_FALSE(node.pollOnce(10ms));

    ASSERT_EQ(host.responses.size(), 2u);
    EXPECT_EQ(node.requestsAnswered(), 2u);

    auto second = decodeDiscoveryResponse(host.responses[1].second);
    ASSERT_TRUE(second.has_value());
    ASSERT_EQ(second->peers.size(), 1u);
    EXPECT_EQ(second->peers[0].peerId, "P1");
}

TEST(RelayNodeTest, ConnectionClosedClearsRegistry) {
    FakeHost host;
    RelayNode node(host, roomsMode());
    node.start();

    node.dispatch(discoveryRequest("R", "X", 1));
    node.dispatch(discoveryRequest("S", "X", 2));
    node.dispatch(ConnectionClosed{"X", "Connection reset", 0});

    auto& rooms = std::get<RoomDiscovery>(node.discovery());
    EXPECT_EQ(rooms.registry().roomCount(), 0u);
}

TEST(RelayNodeTest, AnyCloseClearsPeerEvenWithOtherConnectionsOpen) {
    FakeHost host;
    RelayNode node(host, roomsMode());
    node.start();

    node.dispatch(discoveryRequest("R", "X", 1));
    node.dispatch(ConnectionClosed{"X", "Closed by peer", 1});

    EXPECT_EQ(std::get<RoomDiscovery>(node.discovery()).registry().entryCount(), 0u);
}

TEST(RelayNodeTest, InformationalEventsLeaveStateUntouched) {
    FakeHost host;
    RelayNode node(host, roomsMode());
    node.start();

    node.dispatch(ListenAddress{"/ip4/0.0.0.0/tcp/4001/ws"});
    node.dispatch(ConnectionEstablished{"X", "/ip4/127.0.0.1/tcp/5555/ws", 1});
    node.dispatch(ReservationAccepted{"X", false});
    node.dispatch(TopicMessage{"X", DISCOVERY_TOPIC, 1, {1}});

    EXPECT_EQ(std::get<RoomDiscovery>(node.discovery()).registry().entryCount(), 0u);
    EXPECT_TRUE(host.responses.empty());
}

TEST(RelayNodeTest, RunStopsWhenFlagClears) {
    FakeHost host;
    RelayNode node(host, roomsMode());
    node.start();

    std::atomic<bool> keepRunning{true};
    std::thread loop([&] { node.run(keepRunning); });

    host.push(discoveryRequest("lobby", "P1", 1));
    for (int i = 0; i < 100 && host.responses.empty(); ++i) {
        std::this_thread::sleep_for(10ms);
    }

    keepRunning = false;
    loop.join();
    node.stop();

    EXPECT_EQ(node.requestsAnswered(), 1u);
    EXPECT_TRUE(host.stopped);
}

TEST(RelayNodeTest, SweepRunsWhenConfigured) {
    FakeHost host;
    RelayNode::Options options = roomsMode();
    options.sweepInterval = 1s;
    RelayNode node(host, options);
    node.start();

    auto& rooms = std::get<RoomDiscovery>(node.discovery());
    rooms.handle(DiscoveryRequest{"R", "X", {}}, RoomRegistry::Clock::now() - 60s);

    // the first sweep is due one interval after construction
    std::this_thread::sleep_for(1100ms);
    node.pollOnce(1ms);

    EXPECT_EQ(rooms.registry().roomCount(), 0u);
}

TEST(RelayNodeTest, NoSweepByDefault) {
    FakeHost host;
    RelayNode node(host, roomsMode());
    node.start();

    auto& rooms = std::get<RoomDiscovery>(node.discovery());
    rooms.handle(DiscoveryRequest{"R", "X", {}}, RoomRegistry::Clock::now() - 60s);
    node.pollOnce(1ms);

    EXPECT_EQ(rooms.registry().roomCount(), 1u);
}

// ============================================================================
// BROADCAST MODE
// ============================================================================

TEST(RelayNodeTest, BroadcastModeSubscribesToDiscoveryTopic) {
    FakeHost host;
    RelayNode node(host, broadcastMode());
    node.start();

    EXPECT_EQ(host.topics.count(DISCOVERY_TOPIC), 1u);
    EXPECT_TRUE(host.protocols.empty());
    EXPECT_TRUE(std::holds_alternative<BroadcastDiscovery>(node.discovery()));
}

TEST(RelayNodeTest, BroadcastModeCountsAnnouncements) {
    FakeHost host;
    RelayNode node(host, broadcastMode());
    node.start();

    node.dispatch(TopicSubscribed{"X", DISCOVERY_TOPIC});
    node.dispatch(TopicMessage{"X", DISCOVERY_TOPIC, 1, {'h', 'i'}});
    node.dispatch(TopicMessage{"X", "/unrelated", 2, {}});
    node.dispatch(TopicUnsubscribed{"X", DISCOVERY_TOPIC});

    EXPECT_EQ(std::get<BroadcastDiscovery>(node.discovery()).announcementsObserved(), 1u);
}

TEST(RelayNodeTest, BroadcastModeTopicIsJoinedBeforeHostStarts) {
    FakeHost host;
    RelayNode node(host, broadcastMode());
    node.start();

    EXPECT_EQ(host.topicsAtStart.count(DISCOVERY_TOPIC), 1u);
}

TEST(RelayNodeTest, BroadcastModeRefusesRequests) {
    FakeHost host;
    RelayNode node(host, broadcastMode());
    node.start();

    node.dispatch(discoveryRequest("lobby", "P1", 3));
    EXPECT_TRUE(host.responses.empty());
    ASSERT_EQ(host.errors.size(), 1u);
    EXPECT_EQ(host.errors[0].first.requestId, 3u);
    EXPECT_EQ(node.requestsAnswered(), 0u);
}

TEST(BroadcastDiscoveryTest, AttachIsIdempotent) {
    FakeHost host;
    BroadcastDiscovery discovery;

    discovery.attach(host);
    discovery.attach(host);
    EXPECT_EQ(host.topics.size(), 1u);
    EXPECT_EQ(discovery.topic(), DISCOVERY_TOPIC);
}
