#pragma once
#ifndef RENDEZVOUS_PEER_CONNECTION_HPP
#define RENDEZVOUS_PEER_CONNECTION_HPP

#include "Message.hpp"
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace rendezvous {

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;

/**
 * One WebSocket connection carrying framed messages, one frame per binary message.
 *
 * All socket work runs on the connection's strand; callbacks are invoked there too.
 */
class PeerConnection : public std::enable_shared_from_this<PeerConnection> {
public:
    using Ptr = std::shared_ptr<PeerConnection>;
    using MessageCallback = std::function<void(const Ptr&, const Message&)>;
    using CloseCallback = std::function<void(const Ptr&, const std::string&)>;
    using ConnectCallback = std::function<void(const std::string&)>;

    /**
     * Wraps an accepted socket. The socket's executor must be a strand.
     *
     * @param socket Socket returned by the acceptor.
     * @param connectionId Host-unique id of this connection.
     */
    PeerConnection(tcp::socket&& socket, uint64_t connectionId);

    /**
     * Creates an outbound connection on its own strand of `ctx`; see connectTo().
     *
     * @param ctx Context whose threads run the connection.
     * @param connectionId Id reported to the handlers.
     */
    PeerConnection(boost::asio::io_context& ctx, uint64_t connectionId);

    /**
     * Performs the server side of the WebSocket handshake, then starts the read loop.
     */
    void accept();

    /**
     * Resolves, connects and performs the client handshake.
     *
     * @param host Host name or address literal.
     * @param port TCP port of the WebSocket listener.
     * @param onConnected Called once with an empty string on success, or the error text.
     */
    void connectTo(const std::string& host, uint16_t port, ConnectCallback onConnected);

    /**
     * Queues a frame for sending. Safe from any thread.
     *
     * @param msg Frame to send; its payload must fit MAX_PAYLOAD_SIZE.
     * @return false if the connection is closed or the message cannot be serialized.
     */
    bool sendMessage(const Message& msg);

    /**
     * Closes the connection; the close handler receives `reason`. Later calls are no-ops.
     *
     * @param reason Text passed to the close handler and the WebSocket close frame.
     */
    void close(const std::string& reason);

    /**
     * @param cb Called on the strand for every well-formed frame.
     */
    void setMessageHandler(MessageCallback cb);

    /**
     * @param cb Called exactly once, when the connection ends for any reason.
     */
    void setCloseHandler(CloseCallback cb);

    uint64_t id() const { return connectionId; }
    const std::string& remoteAddress() const { return remote; }
    bool isConnected() const;

    /** Multiaddr-style text of a WebSocket endpoint, e.g. /ip4/127.0.0.1/tcp/4001/ws */
    static std::string endpointToAddress(const tcp::endpoint& endpoint);

private:
    void configureStream(beast::role_type role);
    void asyncRead();
    void doWrite();
    void handleDisconnect(const std::string& reason);

    websocket::stream<beast::tcp_stream> ws;
    beast::flat_buffer readBuf;
    const uint64_t connectionId;
    std::string remote;

    MessageCallback onMessage;
    CloseCallback onClose;

    // strand only
    std::deque<std::vector<uint8_t>> outbox;
    bool writing = false;

    std::atomic<bool> connected{false};
    std::atomic<bool> closed{false};
};

} // namespace rendezvous

#endif // RENDEZVOUS_PEER_CONNECTION_HPP
