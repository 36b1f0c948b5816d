#pragma once
#ifndef RENDEZVOUS_NETWORK_HOST_HPP
#define RENDEZVOUS_NETWORK_HOST_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace rendezvous {

    // ============================================================
    //  HOST EVENTS
    // ============================================================

    /** Handle used to answer exactly one inbound request */
    struct ResponseChannel {
        uint64_t connectionId = 0;
        uint64_t requestId = 0;
    };

    struct ListenAddress {
        std::string address;
    };

    struct ConnectionEstablished {
        std::string peerId;
        std::string remoteAddress;
        size_t numEstablished = 1;  // open connections with this peer, this one included
    };

    struct ConnectionClosed {
        std::string peerId;
        std::string cause;
        size_t numEstablished = 0;  // connections with this peer still open
    };

    struct InboundRequest {
        std::string peerId;
        std::string protocol;
        std::vector<uint8_t> body;
        ResponseChannel channel;
    };

    struct TopicMessage {
        std::string source;
        std::string topic;
        uint64_t seqno = 0;
        std::vector<uint8_t> data;
    };

    struct TopicSubscribed {
        std::string peerId;
        std::string topic;
    };

    struct TopicUnsubscribed {
        std::string peerId;
        std::string topic;
    };

    struct ReservationAccepted {
        std::string peerId;
        bool renewed = false;
    };

    using HostEvent = std::variant<
        ListenAddress,
        ConnectionEstablished,
        ConnectionClosed,
        InboundRequest,
        TopicMessage,
        TopicSubscribed,
        TopicUnsubscribed,
        ReservationAccepted>;

    // ============================================================
    //  HOST
    // ============================================================

    /**
     * The peer-to-peer networking layer the relay sits on: connection lifecycle,
     * relay reservations, request/response exchanges and topic publish/subscribe.
     *
     * Events are pulled by a single dispatcher thread through nextEvent(); every other
     * member may be called from that thread while the host's own workers are running.
     */
    class NetworkHost {
        public:
            virtual ~NetworkHost() = default;

            /** Starts listening. Protocols and topics should be registered first. */
            virtual void start() = 0;

            /** Closes every connection; nextEvent() returns std::nullopt afterwards. */
            virtual void stop() = 0;

            /**
             * Blocks up to `timeout` for the next event.
             *
             * @param timeout Longest wait.
             * @return The event, or std::nullopt on timeout or after stop().
             */
            virtual std::optional<HostEvent> nextEvent(std::chrono::milliseconds timeout) = 0;

            /**
             * Accepts inbound requests for `protocol`. Requests for protocols that were never
             * registered are refused by the host.
             *
             * @param protocol Protocol id, e.g. DISCOVERY_PROTOCOL.
             */
            virtual void registerProtocol(const std::string& protocol) = 0;

            /**
             * Sends the single response of an exchange.
             *
             * @param channel Exchange to answer, taken from the InboundRequest.
             * @param body Encoded response body.
             * @return false when the exchange can no longer be answered (connection gone,
             *         or the body does not fit one frame). The exchange is then still open.
             */
            virtual bool sendResponse(const ResponseChannel& channel, const std::vector<uint8_t>& body) = 0;

            /**
             * Fails the exchange instead of answering it, so the requester is never left
             * waiting. Returns false when the connection is gone.
             * @param channel Exchange to fail
             * @param reason Human-readable cause carried to the requester
             */
            virtual bool sendError(const ResponseChannel& channel, const std::string& reason) = 0;

            /**
             * Joins `topic` as the local node.
             *
             * @param topic Topic name.
             * @return false if already subscribed.
             */
            virtual bool subscribe(const std::string& topic) = 0;

            virtual const std::string& localPeerId() const = 0;
    };

} // namespace rendezvous

#endif // RENDEZVOUS_NETWORK_HOST_HPP
