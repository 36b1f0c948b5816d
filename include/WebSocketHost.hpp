#pragma once
#ifndef RENDEZVOUS_WEBSOCKET_HOST_HPP
#define RENDEZVOUS_WEBSOCKET_HOST_HPP

#include "EventQueue.hpp"
#include "IdentityManager.hpp"
#include "NetworkHost.hpp"
#include "PeerConnection.hpp"
#include "ReservationTable.hpp"
#include "TopicRouter.hpp"
#include "Types.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace rendezvous {

    /**
     * NetworkHost over WebSocket, listening on the IPv4 and IPv6 wildcard addresses.
     *
     * A connection must open with HELLO carrying the remote peer id before anything else
     * is accepted on it.
     */
    class WebSocketHost : public NetworkHost {
        public:
            struct Options {
                uint16_t port = DEFAULT_PORT;  // 0 picks an ephemeral port
                size_t maxReservations = DEFAULT_MAX_RESERVATIONS;
                size_t workerThreads = DEFAULT_WORKER_THREADS;
                bool verbose = false;
            };

            WebSocketHost(Identity identity, Options options);
            ~WebSocketHost() override;

            WebSocketHost(const WebSocketHost&) = delete;
            WebSocketHost& operator=(const WebSocketHost&) = delete;

            /**
             * Binds the listeners and starts the network workers. A host is started at most once.
             *
             * @throws std::runtime_error if the IPv4 listener cannot be opened.
             */
            void start() override;
            void stop() override;

            std::optional<HostEvent> nextEvent(std::chrono::milliseconds timeout) override;
            void registerProtocol(const std::string& protocol) override;

            /**
             * Sends a RESPONSE frame. A body that would not fit one frame is not sent.
             *
             * @return false if the connection is gone or the response is too large.
             */
            bool sendResponse(const ResponseChannel& channel, const std::vector<uint8_t>& body) override;

            /**
             * Sends a RESPONSE_ERROR frame carrying `reason`.
             *
             * @return false if the connection is gone.
             */
            bool sendError(const ResponseChannel& channel, const std::string& reason) override;
            bool subscribe(const std::string& topic) override;
            const std::string& localPeerId() const override;

            /** Port actually bound, valid after start() */
            uint16_t boundPort() const { return port.load(); }

            size_t connectionCount() const;
            const ReservationTable& reservations() const { return reservationTable; }

        private:
            struct ConnectionState {
                PeerConnection::Ptr connection;
                std::string peerId;  // empty until HELLO
            };

            void openAcceptor(tcp::acceptor& acceptor, const tcp::endpoint& endpoint, bool v6Only);
            void doAccept(tcp::acceptor& acceptor);
            void onNewConnection(tcp::socket socket);

            void onMessage(const PeerConnection::Ptr& conn, const Message& msg);
            void onClose(const PeerConnection::Ptr& conn, const std::string& reason);

            void handleHello(const PeerConnection::Ptr& conn, const Message& msg);
            void handleRequest(const PeerConnection::Ptr& conn, const std::string& peerId, const Message& msg);
            void handleSubscription(const PeerConnection::Ptr& conn, const std::string& peerId, const Message& msg);
            void handlePublish(const PeerConnection::Ptr& conn, const std::string& peerId, const Message& msg);
            void handleReserve(const PeerConnection::Ptr& conn, const std::string& peerId);

            std::string peerIdOf(uint64_t connectionId) const;
            PeerConnection::Ptr connectionById(uint64_t connectionId) const;

            const Identity identity;
            const Options options;

            boost::asio::io_context io;
            boost::asio::executor_work_guard<boost::asio::io_context::executor_type> workGuard;
            tcp::acceptor acceptorV4;
            tcp::acceptor acceptorV6;
            std::vector<std::thread> workers;

            std::atomic<bool> running{false};
            std::atomic<bool> started{false};
            std::atomic<uint16_t> port{0};
            std::atomic<uint64_t> nextConnectionId{TopicRouter::LOCAL_SUBSCRIBER + 1};

            mutable std::mutex connMtx;
            std::unordered_map<uint64_t, ConnectionState> connections;
            std::unordered_map<std::string, size_t> peerConnections;
            std::unordered_set<std::string> protocols;

            TopicRouter router;
            ReservationTable reservationTable;
            EventQueue<HostEvent> events;
    };

} // namespace rendezvous

#endif // RENDEZVOUS_WEBSOCKET_HOST_HPP
