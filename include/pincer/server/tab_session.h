#pragma once

#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/websocket/stream.hpp>

#include <pincer/bridge/tab_socket.h>
#include <pincer/core/types.h>

namespace pincer::server {

/**
 * One accepted tab WebSocket.
 *
 * The stream's executor is a strand; the read loop, the write queue and close all run on it.
 * sendText() may be called from any thread and only enqueues.
 */
class TabSession : public bridge::TabSocket, public std::enable_shared_from_this<TabSession> {
public:
    using Stream = boost::beast::websocket::stream<boost::beast::tcp_stream>;
    using FrameHandler = std::function<void(const ConnectionId&, std::string_view)>;
    using CloseHandler = std::function<void(const ConnectionId&)>;

    // `stream` must already have completed the server handshake.
    TabSession(ConnectionId id, Stream stream);
    ~TabSession() override;

    const ConnectionId& id() const noexcept { return id_; }

    bool isOpen() const override;
    bool sendText(std::string frame) override;
    void close() override;

    // Reads text frames until the peer closes or the socket fails, then calls onClosed once.
    boost::asio::awaitable<void> run(FrameHandler onFrame, CloseHandler onClosed);

private:
    boost::asio::awaitable<void> flush();
    void sendClose();

    ConnectionId id_;
    Stream ws_;
    std::atomic<bool> open_{true};
    // strand-only
    std::deque<std::string> writeQueue_;
    bool writing_ = false;
    bool closing_ = false;
};

} // namespace pincer::server
