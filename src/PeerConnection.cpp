#include "PeerConnection.hpp"
#include <chrono>
#include <iostream>

namespace rendezvous {

    PeerConnection::PeerConnection(tcp::socket&& socket, uint64_t connectionId)
        : ws(std::move(socket)),
          connectionId(connectionId) {
        boost::system::error_code ec;
        auto endpoint = beast::get_lowest_layer(ws).socket().remote_endpoint(ec);
        if (!ec) {
            remote = endpointToAddress(endpoint);
        }
    }

    PeerConnection::PeerConnection(boost::asio::io_context& ctx, uint64_t connectionId)
        : ws(boost::asio::make_strand(ctx)),
          connectionId(connectionId) {}

    void PeerConnection::setMessageHandler(MessageCallback cb) {
        onMessage = std::move(cb);
    }

    void PeerConnection::setCloseHandler(CloseCallback cb) {
        onClose = std::move(cb);
    }

    bool PeerConnection::isConnected() const {
        return connected.load() && !closed.load();
    }

    std::string PeerConnection::endpointToAddress(const tcp::endpoint& endpoint) {
        const auto address = endpoint.address();
        return std::string(address.is_v6() ? "/ip6/" : "/ip4/") + address.to_string() +
               "/tcp/" + std::to_string(endpoint.port()) + "/ws";
    }

    void PeerConnection::configureStream(beast::role_type role) {
        // the websocket layer manages its own timeouts from here on
        beast::get_lowest_layer(ws).expires_never();
        ws.set_option(websocket::stream_base::timeout::suggested(role));
        ws.read_message_max(MAX_FRAME_SIZE);
        ws.binary(true);
    }

    void PeerConnection::accept() {
        auto self = shared_from_this();
        boost::asio::dispatch(ws.get_executor(), [this, self] {
            configureStream(beast::role_type::server);
            ws.async_accept([this, self](beast::error_code ec) {
                if (ec) {
                    handleDisconnect("WebSocket handshake failed: " + ec.message());
                    return;
                }

                connected.store(true);
                if (!outbox.empty() && !writing) {
                    doWrite();
                }
                asyncRead();
            });
        });
    }

    void PeerConnection::connectTo(const std::string& host, uint16_t port, ConnectCallback onConnected) {
        auto self = shared_from_this();
        auto resolver = std::make_shared<tcp::resolver>(ws.get_executor());

        auto fail = [this, self, onConnected](const std::string& error) {
            if (onConnected) {
                onConnected(error);
            }
            handleDisconnect(error);
        };

        resolver->async_resolve(host, std::to_string(port),
            [this, self, resolver, host, onConnected, fail](beast::error_code ec, tcp::resolver::results_type results) {
                if (ec) {
                    fail("Resolve failed: " + ec.message());
                    return;
                }

                beast::get_lowest_layer(ws).expires_after(std::chrono::seconds(10));
                beast::get_lowest_layer(ws).async_connect(results,
                    [this, self, host, onConnected, fail](beast::error_code ec2, const tcp::endpoint& endpoint) {
                        if (ec2) {
                            fail("Connect failed: " + ec2.message());
                            return;
                        }

                        remote = endpointToAddress(endpoint);
                        configureStream(beast::role_type::client);

                        ws.async_handshake(host + ":" + std::to_string(endpoint.port()), "/",
                            [this, self, onConnected, fail](beast::error_code ec3) {
                                if (ec3) {
                                    fail("WebSocket handshake failed: " + ec3.message());
                                    return;
                                }

                                connected.store(true);
                                if (onConnected) {
                                    onConnected("");
                                }
                                if (!outbox.empty() && !writing) {
                                    doWrite();
                                }
                                asyncRead();
                            });
                    });
            });
    }

    void PeerConnection::asyncRead() {
        auto self = shared_from_this();
        ws.async_read(readBuf, [this, self](beast::error_code ec, std::size_t) {
            if (ec) {
                if (ec == websocket::error::closed) {
                    handleDisconnect("Closed by peer");
                } else {
                    handleDisconnect("Read error: " + ec.message());
                }
                return;
            }

            const auto* begin = static_cast<const uint8_t*>(readBuf.data().data());
            std::vector<uint8_t> frame(begin, begin + readBuf.size());
            readBuf.consume(readBuf.size());

            Message message;
            if (!ws.got_binary() || !parseFullMessage(frame, message)) {
                close("Malformed frame");
                return;
            }

            if (onMessage) {
                try {
                    onMessage(self, message);
                } catch (const std::exception& e) {
                    std::cerr << "Error in message handler: " << e.what() << std::endl;
                }
            }

            if (!closed.load()) {
                asyncRead();
            }
        });
    }

    bool PeerConnection::sendMessage(const Message& msg) {
        if (closed.load()) {
            return false;
        }

        std::vector<uint8_t> buf;
        try {
            buf = serializeMessage(msg);
        } catch (const std::exception& e) {
            std::cerr << "PeerConnection error: Message serialization failed: " << e.what() << std::endl;
            return false;
        }

        auto self = shared_from_this();
        boost::asio::post(ws.get_executor(), [this, self, buf = std::move(buf)]() mutable {
            if (closed.load()) {
                return;
            }
            outbox.push_back(std::move(buf));
            if (connected.load() && !writing) {
                doWrite();
            }
        });
        return true;
    }

    void PeerConnection::doWrite() {
        writing = true;
        auto self = shared_from_this();
        ws.async_write(boost::asio::buffer(outbox.front()), [this, self](beast::error_code ec, std::size_t) {
            if (ec) {
                writing = false;
                outbox.clear();
                handleDisconnect("Send error: " + ec.message());
                return;
            }

            outbox.pop_front();
            if (outbox.empty() || closed.load()) {
                writing = false;
            } else {
                doWrite();
            }
        });
    }

    void PeerConnection::close(const std::string& reason) {
        auto self = shared_from_this();
        boost::asio::post(ws.get_executor(), [this, self, reason] {
            if (closed.load()) {
                return;
            }

            // a close frame cannot be sent while a write is in flight
            if (!connected.load() || writing) {
                handleDisconnect(reason);
                return;
            }

            ws.async_close(websocket::close_code::normal, [this, self, reason](beast::error_code) {
                handleDisconnect(reason);
            });
        });
    }

    void PeerConnection::handleDisconnect(const std::string& reason) {
        if (closed.exchange(true)) {
            return;
        }
        connected.store(false);

        boost::system::error_code ec;
        auto& socket = beast::get_lowest_layer(ws).socket();
        if (socket.is_open()) {
            socket.shutdown(tcp::socket::shutdown_both, ec);
            socket.close(ec);
        }

        if (onClose) {
            onClose(shared_from_this(), reason);
        }
    }

} // namespace rendezvous
