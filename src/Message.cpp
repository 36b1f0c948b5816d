#include "Message.hpp"
#include <iostream>

namespace rendezvous {

    namespace {
        void putU32(std::vector<uint8_t>& out, uint32_t value) {
            for (int shift = 24; shift >= 0; shift -= 8) {
                out.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
            }
        }

        void putU64(std::vector<uint8_t>& out, uint64_t value) {
            for (int shift = 56; shift >= 0; shift -= 8) {
                out.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
            }
        }

        uint32_t getU32(const std::vector<uint8_t>& in, size_t pos) {
            uint32_t value = 0;
            for (size_t i = 0; i < 4; ++i) {
                value = (value << 8) | in[pos + i];
            }
            return value;
        }

        uint64_t getU64(const std::vector<uint8_t>& in, size_t pos) {
            uint64_t value = 0;
            for (size_t i = 0; i < 8; ++i) {
                value = (value << 8) | in[pos + i];
            }
            return value;
        }
    }

    // ------------------------------------------------------------
    // CRC32
    // ------------------------------------------------------------
    uint32_t crc32_buf(const void* data, size_t length) {
        return static_cast<uint32_t>(::crc32(0L,
            reinterpret_cast<const unsigned char*>(data),
            static_cast<uInt>(length)));
    }

    Message makeMessage(MessageType type, std::vector<uint8_t> payload) {
        Message message;
        message.type = type;
        message.payload = std::move(payload);
        return message;
    }

    // ------------------------------------------------------------
    // SERIALIZATION
    // ------------------------------------------------------------
    std::vector<uint8_t> serializeMessage(const Message& message) {
        const uint64_t payloadLength = message.payload.size();

        if (payloadLength > MAX_PAYLOAD_SIZE) {
            throw std::runtime_error("Payload size exceeds maximum allowed");
        }

        std::vector<uint8_t> buffer;
        buffer.reserve(MESSAGE_HEADER_SIZE + payloadLength + CHECKSUM_SIZE);

        putU32(buffer, message.magic);
        buffer.push_back(message.version);
        buffer.push_back(static_cast<uint8_t>(message.type));
        putU64(buffer, payloadLength);

        buffer.insert(buffer.end(), message.payload.begin(), message.payload.end());

        // checksum over everything before it
        putU32(buffer, crc32_buf(buffer.data(), buffer.size()));

        return buffer;
    }

    // ------------------------------------------------------------
    // HEADER ONLY
    // ------------------------------------------------------------
    bool parseMessageHeader(const std::vector<uint8_t>& headerBuffer, Message& outputHeader, uint64_t& payloadLength) {
        if (headerBuffer.size() < MESSAGE_HEADER_SIZE) {
            return false;
        }

        outputHeader.magic = getU32(headerBuffer, 0);
        outputHeader.version = headerBuffer[4];
        outputHeader.type = static_cast<MessageType>(headerBuffer[5]);
        payloadLength = getU64(headerBuffer, 6);

        if (outputHeader.magic != NETWORK_MAGIC) {
            std::cerr << "Warning: Invalid network magic in message header" << std::endl;
            return false;
        }

        if (outputHeader.version != PROTOCOL_VERSION) {
            std::cerr << "Warning: Unsupported protocol version: " << static_cast<int>(outputHeader.version) << std::endl;
            return false;
        }

        if (payloadLength > MAX_PAYLOAD_SIZE) {
            std::cerr << "Warning: Payload size too large: " << payloadLength << std::endl;
            return false;
        }

        return true;
    }

    // ------------------------------------------------------------
    // FULL FRAME (header + payload + checksum)
    // ------------------------------------------------------------
    bool parseFullMessage(const std::vector<uint8_t>& buffer, Message& outputMessage) {
        if (buffer.size() < MESSAGE_HEADER_SIZE + CHECKSUM_SIZE) {
            return false;
        }

        Message header;
        uint64_t payloadLength = 0;
        if (!parseMessageHeader(buffer, header, payloadLength)) {
            return false;
        }

        const size_t totalLength = MESSAGE_HEADER_SIZE + static_cast<size_t>(payloadLength) + CHECKSUM_SIZE;
        if (buffer.size() != totalLength) {
            return false;
        }

        const uint32_t receivedChecksum = getU32(buffer, MESSAGE_HEADER_SIZE + static_cast<size_t>(payloadLength));
        const uint32_t calculatedChecksum = crc32_buf(buffer.data(), MESSAGE_HEADER_SIZE + static_cast<size_t>(payloadLength));
        if (calculatedChecksum != receivedChecksum) {
            std::cerr << "Warning: Message checksum verification failed" << std::endl;
            return false;
        }

        outputMessage = header;
        outputMessage.payload.assign(
            buffer.begin() + MESSAGE_HEADER_SIZE,
            buffer.begin() + static_cast<std::ptrdiff_t>(MESSAGE_HEADER_SIZE + payloadLength));

        return true;
    }

    std::string messageTypeToString(MessageType type) {
        switch (type) {
            case MessageType::HELLO:            return "HELLO";
            case MessageType::HELLO_ACK:        return "HELLO_ACK";
            case MessageType::PING:             return "PING";
            case MessageType::PONG:             return "PONG";
            case MessageType::REQUEST:          return "REQUEST";
            case MessageType::RESPONSE:         return "RESPONSE";
            case MessageType::RESPONSE_ERROR:   return "RESPONSE_ERROR";
            case MessageType::SUBSCRIBE:        return "SUBSCRIBE";
            case MessageType::UNSUBSCRIBE:      return "UNSUBSCRIBE";
            case MessageType::PUBLISH:          return "PUBLISH";
            case MessageType::RESERVE:          return "RESERVE";
            case MessageType::RESERVE_ACCEPTED: return "RESERVE_ACCEPTED";
            case MessageType::RESERVE_DENIED:   return "RESERVE_DENIED";
            case MessageType::DISCONNECT:       return "DISCONNECT";
            default:                            return "UNKNOWN";
        }
    }

    // ------------------------------------------------------------
    // PAYLOAD FIELDS
    // ------------------------------------------------------------
    void PayloadWriter::writeU32(uint32_t value) {
        putU32(buffer, value);
    }

    void PayloadWriter::writeU64(uint64_t value) {
        putU64(buffer, value);
    }

    void PayloadWriter::writeString(const std::string& value) {
        putU32(buffer, static_cast<uint32_t>(value.size()));
        buffer.insert(buffer.end(), value.begin(), value.end());
    }

    void PayloadWriter::writeBytes(const std::vector<uint8_t>& value) {
        putU32(buffer, static_cast<uint32_t>(value.size()));
        buffer.insert(buffer.end(), value.begin(), value.end());
    }

    bool PayloadReader::readU32(uint32_t& value) {
        if (data.size() - position < 4) {
            return false;
        }
        value = getU32(data, position);
        position += 4;
        return true;
    }

    bool PayloadReader::readU64(uint64_t& value) {
        if (data.size() - position < 8) {
            return false;
        }
        value = getU64(data, position);
        position += 8;
        return true;
    }

    bool PayloadReader::readLength(uint32_t& length, size_t maxLength) {
        if (!readU32(length)) {
            return false;
        }
        return length <= maxLength && length <= data.size() - position;
    }

    bool PayloadReader::readString(std::string& value, size_t maxLength) {
        uint32_t length = 0;
        if (!readLength(length, maxLength)) {
            return false;
        }
        value.assign(data.begin() + static_cast<std::ptrdiff_t>(position),
                     data.begin() + static_cast<std::ptrdiff_t>(position + length));
        position += length;
        return true;
    }

    bool PayloadReader::readBytes(std::vector<uint8_t>& value) {
        uint32_t length = 0;
        if (!readLength(length, MAX_PAYLOAD_SIZE)) {
            return false;
        }
        value.assign(data.begin() + static_cast<std::ptrdiff_t>(position),
                     data.begin() + static_cast<std::ptrdiff_t>(position + length));
        position += length;
        return true;
    }

    // ------------------------------------------------------------
    // FRAME PAYLOADS
    // ------------------------------------------------------------
    std::vector<uint8_t> serializeHello(const HelloData& hello) {
        PayloadWriter writer;
        writer.writeString(hello.peerId);
        return writer.take();
    }

    bool deserializeHello(const std::vector<uint8_t>& payload, HelloData& out) {
        PayloadReader reader(payload);
        return reader.readString(out.peerId, MAX_PEER_ID_LENGTH) && !out.peerId.empty() && reader.atEnd();
    }

    std::vector<uint8_t> serializeHelloAck(const HelloAck& ack) {
        PayloadWriter writer;
        writer.writeString(ack.peerId);
        writer.writeString(ack.agentVersion);
        writer.writeString(ack.observedAddr);
        return writer.take();
    }

    bool deserializeHelloAck(const std::vector<uint8_t>& payload, HelloAck& out) {
        PayloadReader reader(payload);
        return reader.readString(out.peerId, MAX_PEER_ID_LENGTH) &&
               reader.readString(out.agentVersion) &&
               reader.readString(out.observedAddr) &&
               reader.atEnd();
    }

    std::vector<uint8_t> serializeRequest(const RequestData& request) {
        PayloadWriter writer;
        writer.writeU64(request.requestId);
        writer.writeString(request.protocol);
        writer.writeBytes(request.body);
        return writer.take();
    }

    bool deserializeRequest(const std::vector<uint8_t>& payload, RequestData& out) {
        PayloadReader reader(payload);
        return reader.readU64(out.requestId) &&
               reader.readString(out.protocol, MAX_TOPIC_LENGTH) &&
               reader.readBytes(out.body) &&
               reader.atEnd();
    }

    std::vector<uint8_t> serializeResponse(const ResponseData& response) {
        PayloadWriter writer;
        writer.writeU64(response.requestId);
        writer.writeBytes(response.body);
        return writer.take();
    }

    bool deserializeResponse(const std::vector<uint8_t>& payload, ResponseData& out) {
        PayloadReader reader(payload);
        return reader.readU64(out.requestId) && reader.readBytes(out.body) && reader.atEnd();
    }

    std::vector<uint8_t> serializeResponseError(const ResponseError& error) {
        PayloadWriter writer;
        writer.writeU64(error.requestId);
        writer.writeString(error.reason);
        return writer.take();
    }

    bool deserializeResponseError(const std::vector<uint8_t>& payload, ResponseError& out) {
        PayloadReader reader(payload);
        return reader.readU64(out.requestId) && reader.readString(out.reason) && reader.atEnd();
    }

    std::vector<uint8_t> serializeTopic(const std::string& topic) {
        PayloadWriter writer;
        writer.writeString(topic);
        return writer.take();
    }

    bool deserializeTopic(const std::vector<uint8_t>& payload, std::string& out) {
        PayloadReader reader(payload);
        return reader.readString(out, MAX_TOPIC_LENGTH) && !out.empty() && reader.atEnd();
    }

    std::vector<uint8_t> serializePublish(const PublishData& publish) {
        PayloadWriter writer;
        writer.writeString(publish.topic);
        writer.writeString(publish.source);
        writer.writeU64(publish.seqno);
        writer.writeBytes(publish.data);
        return writer.take();
    }

    bool deserializePublish(const std::vector<uint8_t>& payload, PublishData& out) {
        PayloadReader reader(payload);
        return reader.readString(out.topic, MAX_TOPIC_LENGTH) && !out.topic.empty() &&
               reader.readString(out.source, MAX_PEER_ID_LENGTH) &&
               reader.readU64(out.seqno) &&
               reader.readBytes(out.data) &&
               reader.atEnd();
    }

} // namespace rendezvous
