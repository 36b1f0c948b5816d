#include "WebSocketHost.hpp"
#include "KeyManager.hpp"
#include <algorithm>
#include <iostream>

namespace rendezvous {

    WebSocketHost::WebSocketHost(Identity identity, Options options)
        : identity(std::move(identity)),
          options(options),
          io(),
          workGuard(boost::asio::make_work_guard(io)),
          acceptorV4(io),
          acceptorV6(io),
          reservationTable(options.maxReservations) {}

    WebSocketHost::~WebSocketHost() {
        stop();
    }

    // ============================================================
    //  LIFECYCLE
    // ============================================================

    void WebSocketHost::openAcceptor(tcp::acceptor& acceptor, const tcp::endpoint& endpoint, bool v6Only) {
        acceptor.open(endpoint.protocol());
        acceptor.set_option(tcp::acceptor::reuse_address(true));
        if (v6Only) {
            acceptor.set_option(boost::asio::ip::v6_only(true));
        }
        acceptor.bind(endpoint);
        acceptor.listen(boost::asio::socket_base::max_listen_connections);
    }

    void WebSocketHost::start() {
        if (started.exchange(true)) {
            return;
        }

        try {
            openAcceptor(acceptorV4, tcp::endpoint(tcp::v4(), options.port), false);
        } catch (const boost::system::system_error& e) {
            throw std::runtime_error("Cannot listen on 0.0.0.0:" + std::to_string(options.port) + ": " + e.what());
        }
        port.store(acceptorV4.local_endpoint().port());

        // the IPv6 listener shares the port chosen for IPv4
        try {
            openAcceptor(acceptorV6, tcp::endpoint(tcp::v6(), port.load()), true);
        } catch (const boost::system::system_error& e) {
            std::cerr << "Warning: IPv6 listener unavailable: " << e.what() << std::endl;
            boost::system::error_code ec;
            acceptorV6.close(ec);
        }

        running.store(true);
        for (tcp::acceptor* acceptor : {&acceptorV4, &acceptorV6}) {
            if (!acceptor->is_open()) {
                continue;
            }
            events.push(ListenAddress{PeerConnection::endpointToAddress(acceptor->local_endpoint())});
            doAccept(*acceptor);
        }

        const size_t threads = std::max<size_t>(1, options.workerThreads);
        for (size_t i = 0; i < threads; ++i) {
            workers.emplace_back([this] {
                try {
                    io.run();
                } catch (const std::exception& e) {
                    std::cerr << "Error: Network worker stopped: " << e.what() << std::endl;
                }
            });
        }
    }

    void WebSocketHost::stop() {
        if (!running.exchange(false)) {
            return;
        }

        boost::system::error_code ec;
        acceptorV4.close(ec);
        acceptorV6.close(ec);

        std::vector<PeerConnection::Ptr> open;
        {
            std::lock_guard<std::mutex> lock(connMtx);
            for (auto& kv : connections) {
                open.push_back(kv.second.connection);
            }
        }
        for (auto& conn : open) {
            conn->close("Relay shutting down");
        }

        workGuard.reset();
        io.stop();
        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers.clear();

        {
            std::lock_guard<std::mutex> lock(connMtx);
            connections.clear();
            peerConnections.clear();
        }
        events.close();
    }

    // ============================================================
    //  ACCEPTING
    // ============================================================

    void WebSocketHost::doAccept(tcp::acceptor& acceptor) {
        acceptor.async_accept(boost::asio::make_strand(io),
            [this, &acceptor](const boost::system::error_code& ec, tcp::socket socket) {
                if (!ec) {
                    onNewConnection(std::move(socket));
                } else if (ec != boost::asio::error::operation_aborted) {
                    std::cerr << "Warning: Accept failed: " << ec.message() << std::endl;
                }

                if (running.load() && acceptor.is_open()) {
                    doAccept(acceptor);
                }
            });
    }

    void WebSocketHost::onNewConnection(tcp::socket socket) {
        const uint64_t id = nextConnectionId.fetch_add(1);
        auto conn = std::make_shared<PeerConnection>(std::move(socket), id);

        conn->setMessageHandler([this](const PeerConnection::Ptr& c, const Message& m) {
            onMessage(c, m);
        });
        conn->setCloseHandler([this](const PeerConnection::Ptr& c, const std::string& reason) {
            onClose(c, reason);
        });

        {
            std::lock_guard<std::mutex> lock(connMtx);
            connections[id] = ConnectionState{conn, ""};
        }

        if (options.verbose) {
            std::cout << "[debug] Incoming connection #" << id << " from " << conn->remoteAddress() << std::endl;
        }
        conn->accept();
    }

    // ============================================================
    //  INBOUND FRAMES
    // ============================================================

    void WebSocketHost::onMessage(const PeerConnection::Ptr& conn, const Message& msg) {
        const std::string peerId = peerIdOf(conn->id());

        if (peerId.empty()) {
            if (msg.type != MessageType::HELLO) {
                conn->close("Expected HELLO, got " + messageTypeToString(msg.type));
                return;
            }
            handleHello(conn, msg);
            return;
        }

        switch (msg.type) {
            case MessageType::PING:
                conn->sendMessage(makeMessage(MessageType::PONG, msg.payload));
                break;
            case MessageType::PONG:
                break;
            case MessageType::REQUEST:
                handleRequest(conn, peerId, msg);
                break;
            case MessageType::SUBSCRIBE:
            case MessageType::UNSUBSCRIBE:
                handleSubscription(conn, peerId, msg);
                break;
            case MessageType::PUBLISH:
                handlePublish(conn, peerId, msg);
                break;
            case MessageType::RESERVE:
                handleReserve(conn, peerId);
                break;
            case MessageType::DISCONNECT:
                conn->close("Peer disconnected");
                break;
            default:
                std::cerr << "Warning: Unexpected " << messageTypeToString(msg.type)
                          << " from " << peerId << std::endl;
                break;
        }
    }

    void WebSocketHost::handleHello(const PeerConnection::Ptr& conn, const Message& msg) {
        HelloData hello;
        if (!deserializeHello(msg.payload, hello)) {
            conn->close("Malformed HELLO");
            return;
        }

        std::vector<uint8_t> peerKey;
        if (!KeyManager::publicKeyFromPeerId(hello.peerId, peerKey)) {
            conn->close("Invalid peer id in HELLO");
            return;
        }

        size_t established = 0;
        {
            std::lock_guard<std::mutex> lock(connMtx);
            auto it = connections.find(conn->id());
            if (it == connections.end()) {
                return;
            }
            it->second.peerId = hello.peerId;
            established = ++peerConnections[hello.peerId];
        }

        HelloAck ack{identity.peerId(), AGENT_VERSION, conn->remoteAddress()};
        conn->sendMessage(makeMessage(MessageType::HELLO_ACK, serializeHelloAck(ack)));

        events.push(ConnectionEstablished{hello.peerId, conn->remoteAddress(), established});
    }

    void WebSocketHost::handleRequest(const PeerConnection::Ptr& conn, const std::string& peerId, const Message& msg) {
        RequestData request;
        if (!deserializeRequest(msg.payload, request)) {
            conn->close("Malformed REQUEST");
            return;
        }

        bool known = false;
        {
            std::lock_guard<std::mutex> lock(connMtx);
            known = protocols.count(request.protocol) > 0;
        }

        if (!known) {
            ResponseError refusal{request.requestId, "Unsupported protocol: " + request.protocol};
            conn->sendMessage(makeMessage(MessageType::RESPONSE_ERROR, serializeResponseError(refusal)));
            return;
        }

        events.push(InboundRequest{peerId, request.protocol, std::move(request.body),
                                   ResponseChannel{conn->id(), request.requestId}});
    }

    void WebSocketHost::handleSubscription(const PeerConnection::Ptr& conn, const std::string& peerId, const Message& msg) {
        std::string topic;
        if (!deserializeTopic(msg.payload, topic)) {
            conn->close("Malformed " + messageTypeToString(msg.type));
            return;
        }

        if (msg.type == MessageType::SUBSCRIBE) {
            if (router.subscribe(conn->id(), topic)) {
                events.push(TopicSubscribed{peerId, topic});
            }
        } else if (router.unsubscribe(conn->id(), topic)) {
            events.push(TopicUnsubscribed{peerId, topic});
        }
    }

    void WebSocketHost::handlePublish(const PeerConnection::Ptr& conn, const std::string& peerId, const Message& msg) {
        PublishData publish;
        if (!deserializePublish(msg.payload, publish)) {
            conn->close("Malformed PUBLISH");
            return;
        }

        // the sender cannot speak for another peer
        publish.source = peerId;

        if (!router.markSeen(TopicRouter::messageId(publish))) {
            return;
        }

        const Message forward = makeMessage(MessageType::PUBLISH, serializePublish(publish));
        for (uint64_t subscriber : router.subscribers(publish.topic)) {
            if (subscriber == TopicRouter::LOCAL_SUBSCRIBER || subscriber == conn->id()) {
                continue;
            }
            if (auto target = connectionById(subscriber)) {
                target->sendMessage(forward);
            }
        }

        if (router.isSubscribed(TopicRouter::LOCAL_SUBSCRIBER, publish.topic)) {
            events.push(TopicMessage{publish.source, publish.topic, publish.seqno, std::move(publish.data)});
        }
    }

    void WebSocketHost::handleReserve(const PeerConnection::Ptr& conn, const std::string& peerId) {
        const auto outcome = reservationTable.reserve(peerId);
        if (outcome == ReservationTable::Outcome::Denied) {
            std::cerr << "Warning: Reservation denied for " << peerId << ", "
                      << reservationTable.capacity() << " slots in use" << std::endl;
            conn->sendMessage(makeMessage(MessageType::RESERVE_DENIED));
            return;
        }

        conn->sendMessage(makeMessage(MessageType::RESERVE_ACCEPTED));
        events.push(ReservationAccepted{peerId, outcome == ReservationTable::Outcome::Renewed});
    }

    void WebSocketHost::onClose(const PeerConnection::Ptr& conn, const std::string& reason) {
        std::string peerId;
        size_t remaining = 0;
        {
            std::lock_guard<std::mutex> lock(connMtx);
            auto it = connections.find(conn->id());
            if (it == connections.end()) {
                return;
            }
            peerId = it->second.peerId;
            connections.erase(it);

            if (!peerId.empty()) {
                auto count = peerConnections.find(peerId);
                if (count != peerConnections.end()) {
                    remaining = --count->second;
                    if (remaining == 0) {
                        peerConnections.erase(count);
                    }
                }
            }
        }

        const auto leftTopics = router.removeSubscriber(conn->id());

        if (peerId.empty()) {
            if (options.verbose) {
                std::cout << "[debug] Connection #" << conn->id() << " closed before HELLO: " << reason << std::endl;
            }
            return;
        }

        for (const auto& topic : leftTopics) {
            events.push(TopicUnsubscribed{peerId, topic});
        }
        if (remaining == 0) {
            reservationTable.release(peerId);
        }
        events.push(ConnectionClosed{peerId, reason, remaining});
    }

    // ============================================================
    //  DISPATCHER-FACING API
    // ============================================================

    std::optional<HostEvent> WebSocketHost::nextEvent(std::chrono::milliseconds timeout) {
        return events.pop(timeout);
    }

    void WebSocketHost::registerProtocol(const std::string& protocol) {
        std::lock_guard<std::mutex> lock(connMtx);
        protocols.insert(protocol);
    }

    bool WebSocketHost::sendResponse(const ResponseChannel& channel, const std::vector<uint8_t>& body) {
        auto conn = connectionById(channel.connectionId);
        if (!conn || !conn->isConnected()) {
            return false;
        }

        std::vector<uint8_t> payload = serializeResponse({channel.requestId, body});
        if (payload.size() > MAX_PAYLOAD_SIZE) {
            std::cerr << "Warning: Response of " << payload.size() << " bytes exceeds the frame limit" << std::endl;
            return false;
        }
        return conn->sendMessage(makeMessage(MessageType::RESPONSE, std::move(payload)));
    }

    bool WebSocketHost::sendError(const ResponseChannel& channel, const std::string& reason) {
        auto conn = connectionById(channel.connectionId);
        if (!conn || !conn->isConnected()) {
            return false;
        }
        ResponseError error{channel.requestId, reason};
        return conn->sendMessage(makeMessage(MessageType::RESPONSE_ERROR, serializeResponseError(error)));
    }

    bool WebSocketHost::subscribe(const std::string& topic) {
        return router.subscribe(TopicRouter::LOCAL_SUBSCRIBER, topic);
    }

    const std::string& WebSocketHost::localPeerId() const {
        return identity.peerId();
    }

    size_t WebSocketHost::connectionCount() const {
        std::lock_guard<std::mutex> lock(connMtx);
        return connections.size();
    }

    std::string WebSocketHost::peerIdOf(uint64_t connectionId) const {
        std::lock_guard<std::mutex> lock(connMtx);
        auto it = connections.find(connectionId);
        return it == connections.end() ? std::string() : it->second.peerId;
    }

    PeerConnection::Ptr WebSocketHost::connectionById(uint64_t connectionId) const {
        std::lock_guard<std::mutex> lock(connMtx);
        auto it = connections.find(connectionId);
        return it == connections.end() ? nullptr : it->second.connection;
    }

} // namespace rendezvous
