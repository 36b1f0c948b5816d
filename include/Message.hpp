#pragma once
#ifndef RENDEZVOUS_MESSAGE_HPP
#define RENDEZVOUS_MESSAGE_HPP

#include "Types.hpp"
#include <cstdint>
#include <vector>
#include <string>
#include <zlib.h>      // crc32
#include <stdexcept>

namespace rendezvous {

    // ============================================================
    //  MESSAGE TYPES
    // ============================================================
    enum class MessageType : uint8_t {
        HELLO            = 1,
        HELLO_ACK        = 2,
        PING             = 4,
        PONG             = 5,
        REQUEST          = 6,
        RESPONSE         = 7,
        RESPONSE_ERROR   = 8,
        SUBSCRIBE        = 9,
        UNSUBSCRIBE      = 10,
        PUBLISH          = 11,
        RESERVE          = 12,
        RESERVE_ACCEPTED = 13,
        RESERVE_DENIED   = 14,
        DISCONNECT       = 255
    };

    // ============================================================
    //  FRAME
    // ============================================================
    struct Message {
        uint32_t magic   = NETWORK_MAGIC;
        uint8_t  version = PROTOCOL_VERSION;
        MessageType type = MessageType::PING;
        std::vector<uint8_t> payload;
    };

    Message makeMessage(MessageType type, std::vector<uint8_t> payload = {});

    /** Serializes a Message into its network form: header | payload | crc32 */
    std::vector<uint8_t> serializeMessage(const Message& msg);

    /** Parses only the header: magic, version, type and payload length */
    bool parseMessageHeader(const std::vector<uint8_t>& headerBuf, Message& outHeader, uint64_t& payloadLen);

    /** CRC32 of a buffer */
    uint32_t crc32_buf(const void* data, size_t len);

    /** Parses a complete frame. The buffer must hold exactly one frame. */
    bool parseFullMessage(const std::vector<uint8_t>& buf, Message& outMsg);

    /** MessageType as text, for logs */
    std::string messageTypeToString(MessageType t);

    // ============================================================
    //  PAYLOAD FIELDS (big-endian integers, u32 length prefixes)
    // ============================================================
    class PayloadWriter {
    public:
        void writeU32(uint32_t value);
        void writeU64(uint64_t value);
        void writeString(const std::string& value);
        void writeBytes(const std::vector<uint8_t>& value);

        std::vector<uint8_t> take() { return std::move(buffer); }

    private:
        std::vector<uint8_t> buffer;
    };

    class PayloadReader {
    public:
        explicit PayloadReader(const std::vector<uint8_t>& data) : data(data) {}

        bool readU32(uint32_t& value);
        bool readU64(uint64_t& value);
        bool readString(std::string& value, size_t maxLength = MAX_PAYLOAD_SIZE);
        bool readBytes(std::vector<uint8_t>& value);

        bool atEnd() const { return position == data.size(); }

    private:
        bool readLength(uint32_t& length, size_t maxLength);

        const std::vector<uint8_t>& data;
        size_t position = 0;
    };

    // ============================================================
    //  FRAME PAYLOADS
    // ============================================================
    struct HelloData {
        std::string peerId;
    };

    struct HelloAck {
        std::string peerId;        // the relay's peer id
        std::string agentVersion;
        std::string observedAddr;  // the client's address as seen by the relay
    };

    struct RequestData {
        uint64_t requestId = 0;
        std::string protocol;
        std::vector<uint8_t> body;
    };

    struct ResponseData {
        uint64_t requestId = 0;
        std::vector<uint8_t> body;
    };

    struct ResponseError {
        uint64_t requestId = 0;
        std::string reason;
    };

    struct PublishData {
        std::string topic;
        std::string source;
        uint64_t seqno = 0;
        std::vector<uint8_t> data;
    };

    std::vector<uint8_t> serializeHello(const HelloData& hello);
    bool deserializeHello(const std::vector<uint8_t>& payload, HelloData& out);

    std::vector<uint8_t> serializeHelloAck(const HelloAck& ack);
    bool deserializeHelloAck(const std::vector<uint8_t>& payload, HelloAck& out);

    std::vector<uint8_t> serializeRequest(const RequestData& request);
    bool deserializeRequest(const std::vector<uint8_t>& payload, RequestData& out);

    std::vector<uint8_t> serializeResponse(const ResponseData& response);
    bool deserializeResponse(const std::vector<uint8_t>& payload, ResponseData& out);

    std::vector<uint8_t> serializeResponseError(const ResponseError& error);
    bool deserializeResponseError(const std::vector<uint8_t>& payload, ResponseError& out);

    /** SUBSCRIBE / UNSUBSCRIBE carry a single topic string */
    std::vector<uint8_t> serializeTopic(const std::string& topic);
    bool deserializeTopic(const std::vector<uint8_t>& payload, std::string& out);

    std::vector<uint8_t> serializePublish(const PublishData& publish);
    bool deserializePublish(const std::vector<uint8_t>& payload, PublishData& out);

} // namespace rendezvous

#endif // RENDEZVOUS_MESSAGE_HPP
