#pragma once

#include <atomic>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/websocket/stream.hpp>

#include <pincer/client/client_transport.h>

namespace pincer::client {

struct WsUrl {
    std::string host;
    std::string port;
    std::string target; // path plus query, at least "/"
};

// Plain ws:// only; nullopt for any other scheme or a missing host.
std::optional<WsUrl> parseWsUrl(std::string_view url);

// Beast WebSocket client. All socket work runs on a private strand.
class WebSocketClientTransport : public ClientTransport,
                                 public std::enable_shared_from_this<WebSocketClientTransport> {
public:
    explicit WebSocketClientTransport(boost::asio::any_io_executor executor);
    ~WebSocketClientTransport() override;

    void open(const std::string& url, TransportHandlers handlers) override;
    bool send(std::string frame) override;
    void close() override;

private:
    using Stream = boost::beast::websocket::stream<boost::beast::tcp_stream>;

    boost::asio::awaitable<void> run(std::string url);
    boost::asio::awaitable<void> flush();
    void sendClose();
    void fail(const Error& error);
    void finish();

    boost::asio::strand<boost::asio::any_io_executor> strand_;
    Stream ws_;
    TransportHandlers handlers_;
    std::atomic<bool> open_{false};
    // strand-only
    std::deque<std::string> writeQueue_;
    bool writing_ = false;
    bool closing_ = false;
    bool errorReported_ = false;
    bool finished_ = false;
};

} // namespace pincer::client
