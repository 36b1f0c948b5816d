#include <gtest/gtest.h>
#include "Message.hpp"
#include <string>
#include <vector>

using namespace rendezvous;

namespace {
    std::vector<uint8_t> bytes(const std::string& text) {
        return std::vector<uint8_t>(text.begin(), text.end());
    }
}

// ---- FRAMING ----

TEST(MessageTest, FrameLayout) {
    auto frame = serializeMessage(makeMessage(MessageType::PING, {0xAA, 0xBB}));

    ASSERT_EQ(frame.size(), MESSAGE_HEADER_SIZE + 2 + CHECKSUM_SIZE);
    // magic, big-endian
    EXPECT_EQ(frame[0], 0x52);
    EXPECT_EQ(frame[1], 0x44);
    EXPECT_EQ(frame[2], 0x5A);
    EXPECT_EQ(frame[3], 0x31);
    EXPECT_EQ(frame[4], PROTOCOL_VERSION);
    EXPECT_EQ(frame[5], static_cast<uint8_t>(MessageType::PING));
    EXPECT_EQ(frame[13], 2);
    EXPECT_EQ(frame[14], 0xAA);
}

TEST(MessageTest, ParseRecoversTypeAndPayload) {
    auto frame = serializeMessage(makeMessage(MessageType::REQUEST, bytes("body")));

    Message parsed;
    ASSERT_TRUE(parseFullMessage(frame, parsed));
    EXPECT_EQ(parsed.type, MessageType::REQUEST);
    EXPECT_EQ(parsed.payload, bytes("body"));
}

TEST(MessageTest, EmptyPayloadFrame) {
    Message parsed;
    ASSERT_TRUE(parseFullMessage(serializeMessage(makeMessage(MessageType::RESERVE)), parsed));
    EXPECT_EQ(parsed.type, MessageType::RESERVE);
    EXPECT_TRUE(parsed.payload.empty());
}

TEST(MessageTest, RejectsBadMagicVersionAndChecksum) {
    const auto frame = serializeMessage(makeMessage(MessageType::PING, bytes("x")));
    Message parsed;

    auto badMagic = frame;
    badMagic[0] ^= 0xFF;
    EXPECT_FALSE(parseFullMessage(badMagic, parsed));

    auto badVersion = frame;
    badVersion[4] = PROTOCOL_VERSION + 1;
    EXPECT_FALSE(parseFullMessage(badVersion, parsed));

    auto badPayload = frame;
    badPayload[MESSAGE_HEADER_SIZE] ^= 0x01;
    EXPECT_FALSE(parseFullMessage(badPayload, parsed));

    auto badChecksum = frame;
    badChecksum.back() ^= 0x01;
    EXPECT_FALSE(parseFullMessage(badChecksum, parsed));
}

TEST(MessageTest, RejectsWrongLength) {
    auto frame = serializeMessage(makeMessage(MessageType::PING, bytes("abc")));
    Message parsed;

    auto shorter = frame;
    shorter.pop_back();
    EXPECT_FALSE(parseFullMessage(shorter, parsed));

    auto longer = frame;
    longer.push_back(0x00);
    EXPECT_FALSE(parseFullMessage(longer, parsed));

    EXPECT_FALSE(parseFullMessage({}, parsed));
}

TEST(MessageTest, OversizedPayloadThrows) {
    Message message = makeMessage(MessageType::PUBLISH, std::vector<uint8_t>(MAX_PAYLOAD_SIZE + 1));
    EXPECT_THROW(serializeMessage(message), std::runtime_error);
}

TEST(MessageTest, HeaderRejectsOversizedLength) {
    auto frame = serializeMessage(makeMessage(MessageType::PING));
    frame[6] = 0x01;  // length high byte

    Message header;
    uint64_t length = 0;
    EXPECT_FALSE(parseMessageHeader(frame, header, length));
}

TEST(MessageTest, TypeNames) {
    EXPECT_EQ(messageTypeToString(MessageType::HELLO), "HELLO");
    EXPECT_EQ(messageTypeToString(MessageType::RESERVE_DENIED), "RESERVE_DENIED");
    EXPECT_EQ(messageTypeToString(static_cast<MessageType>(99)), "UNKNOWN");
}

// ---- PAYLOADS ----

TEST(MessageTest, HelloRequiresPeerId) {
    HelloData hello;
    EXPECT_TRUE(deserializeHello(serializeHello({"12D3KooWpeer"}), hello));
    EXPECT_EQ(hello.peerId, "12D3KooWpeer");

    EXPECT_FALSE(deserializeHello(serializeHello({""}), hello));
    EXPECT_FALSE(deserializeHello(serializeHello({std::string(MAX_PEER_ID_LENGTH + 1, 'x')}), hello));
    EXPECT_FALSE(deserializeHello({0x00, 0x00}, hello));
}

TEST(MessageTest, RequestFieldsSurviveEncoding) {
    RequestData request{7, DISCOVERY_PROTOCOL, bytes("{}")};

    RequestData decoded;
    ASSERT_TRUE(deserializeRequest(serializeRequest(request), decoded));
    EXPECT_EQ(decoded.requestId, 7u);
    EXPECT_EQ(decoded.protocol, DISCOVERY_PROTOCOL);
    EXPECT_EQ(decoded.body, bytes("{}"));
}

TEST(MessageTest, TrailingBytesAreRejected) {
    auto payload = serializeResponse({3, bytes("ok")});
    payload.push_back(0x00);

    ResponseData decoded;
    EXPECT_FALSE(deserializeResponse(payload, decoded));
}

TEST(MessageTest, LengthPrefixBeyondBufferIsRejected) {
    PayloadWriter writer;
    writer.writeU64(1);
    writer.writeU32(1000);  // claims 1000 body bytes
    writer.writeU32(0);
    auto payload = writer.take();

    ResponseData decoded;
    EXPECT_FALSE(deserializeResponse(payload, decoded));
}

TEST(MessageTest, PublishRequiresTopic) {
    PublishData publish{"/rendezvous/discovery", "", 42, bytes("hi")};

    PublishData decoded;
    ASSERT_TRUE(deserializePublish(serializePublish(publish), decoded));
    EXPECT_EQ(decoded.topic, "/rendezvous/discovery");
    EXPECT_EQ(decoded.seqno, 42u);
    EXPECT_EQ(decoded.data, bytes("hi"));

    publish.topic.clear();
    EXPECT_FALSE(deserializePublish(serializePublish(publish), decoded));
}

TEST(MessageTest, TopicPayload) {
    std::string topic;
    EXPECT_TRUE(deserializeTopic(serializeTopic("t"), topic));
    EXPECT_EQ(topic, "t");
    EXPECT_FALSE(deserializeTopic(serializeTopic(""), topic));
    EXPECT_FALSE(deserializeTopic(serializeTopic(std::string(MAX_TOPIC_LENGTH + 1, 't')), topic));
}
