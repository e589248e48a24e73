#include <pincer/client/websocket_client_transport.h>

#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/websocket/rfc6455.hpp>
#include <spdlog/spdlog.h>

#include <chrono>

namespace pincer::client {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
using boost::asio::use_awaitable;
using boost::asio::ip::tcp;

namespace {
constexpr auto kConnectTimeout = std::chrono::seconds(30);
}

std::optional<WsUrl> parseWsUrl(std::string_view url) {
    constexpr std::string_view kScheme = "ws://";
    if (!url.starts_with(kScheme))
        return std::nullopt;
    auto rest = url.substr(kScheme.size());
    auto slash = rest.find_first_of("/?");
    auto authority = rest.substr(0, slash);
    WsUrl out;
    out.target = slash == std::string_view::npos ? "/" : std::string(rest.substr(slash));
    if (out.target.front() == '?')
        out.target.insert(out.target.begin(), '/');

    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos)
            return std::nullopt;
        out.host = std::string(authority.substr(1, close - 1));
        auto tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail.front() != ':')
                return std::nullopt;
            out.port = std::string(tail.substr(1));
        }
    } else if (auto colon = authority.rfind(':'); colon != std::string_view::npos) {
        out.host = std::string(authority.substr(0, colon));
        out.port = std::string(authority.substr(colon + 1));
    } else {
        out.host = std::string(authority);
    }
    if (out.host.empty())
        return std::nullopt;
    if (out.port.empty())
        out.port = "80";
    return out;
}

WebSocketClientTransport::WebSocketClientTransport(boost::asio::any_io_executor executor)
    : strand_(boost::asio::make_strand(executor)), ws_(strand_) {}

WebSocketClientTransport::~WebSocketClientTransport() = default;

void WebSocketClientTransport::open(const std::string& url, TransportHandlers handlers) {
    handlers_ = std::move(handlers);
    boost::asio::co_spawn(strand_, shared_from_this()->run(url), boost::asio::detached);
}

bool WebSocketClientTransport::send(std::string frame) {
    if (!open_.load(std::memory_order_acquire))
        return false;
    boost::asio::post(strand_, [self = shared_from_this(), frame = std::move(frame)]() mutable {
        if (!self->open_ || self->closing_)
            return;
        self->writeQueue_.push_back(std::move(frame));
        if (self->writing_)
            return;
        self->writing_ = true;
        boost::asio::co_spawn(self->strand_, self->flush(), boost::asio::detached);
    });
    return true;
}

void WebSocketClientTransport::close() {
    boost::asio::post(strand_, [self = shared_from_this()] {
        if (self->closing_ || self->finished_)
            return;
        self->closing_ = true;
        self->open_ = false;
        self->writeQueue_.clear();
        if (self->ws_.is_open()) {
            // An in-flight write finishes first; flush() sends the close frame after it.
            if (!self->writing_)
                self->sendClose();
        } else {
            // Still resolving, connecting or handshaking.
            beast::get_lowest_layer(self->ws_).cancel();
        }
    });
}

void WebSocketClientTransport::fail(const Error& error) {
    if (errorReported_ || finished_)
        return;
    errorReported_ = true;
    if (handlers_.onError)
        handlers_.onError(error);
}

void WebSocketClientTransport::finish() {
    open_ = false;
    writeQueue_.clear();
    if (finished_)
        return;
    finished_ = true;
    if (handlers_.onClose)
        handlers_.onClose();
}

boost::asio::awaitable<void> WebSocketClientTransport::run(std::string url) {
    auto self = shared_from_this();
    auto parsed = parseWsUrl(url);
    if (!parsed) {
        fail(Error{ErrorCode::InvalidArgument, "Unsupported gateway URL: " + url});
        finish();
        co_return;
    }

    beast::error_code ec;
    tcp::resolver resolver(strand_);
    auto endpoints = co_await resolver.async_resolve(
        parsed->host, parsed->port, boost::asio::redirect_error(use_awaitable, ec));
    if (ec || closing_) {
        if (ec && !closing_)
            fail(Error{ErrorCode::NetworkError,
                       "resolve " + parsed->host + " failed: " + ec.message()});
        finish();
        co_return;
    }

    auto& tcpLayer = beast::get_lowest_layer(ws_);
    tcpLayer.expires_after(kConnectTimeout);
    co_await tcpLayer.async_connect(endpoints, boost::asio::redirect_error(use_awaitable, ec));
    if (ec || closing_) {
        if (ec && !closing_)
            fail(Error{ErrorCode::NetworkError, "connect " + parsed->host + ":" + parsed->port +
                                                    " failed: " + ec.message()});
        finish();
        co_return;
    }

    tcpLayer.expires_never();
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws_.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
        req.set(beast::http::field::user_agent, "pincer-agent");
    }));
    co_await ws_.async_handshake(parsed->host + ":" + parsed->port, parsed->target,
                                 boost::asio::redirect_error(use_awaitable, ec));
    if (ec || closing_) {
        if (ec && !closing_)
            fail(Error{ErrorCode::NetworkError, "WebSocket handshake failed: " + ec.message()});
        finish();
        co_return;
    }
    ws_.text(true);

    open_ = true;
    if (handlers_.onOpen)
        handlers_.onOpen();

    beast::flat_buffer buffer;
    for (;;) {
        co_await ws_.async_read(buffer, boost::asio::redirect_error(use_awaitable, ec));
        if (ec) {
            if (ec != websocket::error::closed && !closing_)
                fail(Error{ErrorCode::NetworkError, ec.message()});
            break;
        }
        if (ws_.got_text() && handlers_.onMessage)
            handlers_.onMessage(beast::buffers_to_string(buffer.data()));
        buffer.consume(buffer.size());
    }
    finish();
}

boost::asio::awaitable<void> WebSocketClientTransport::flush() {
    auto self = shared_from_this();
    while (!writeQueue_.empty()) {
        std::string frame = std::move(writeQueue_.front());
        writeQueue_.pop_front();
        beast::error_code ec;
        co_await ws_.async_write(boost::asio::buffer(frame),
                                 boost::asio::redirect_error(use_awaitable, ec));
        if (ec) {
            spdlog::debug("Gateway socket write failed: {}", ec.message());
            open_ = false;
            writeQueue_.clear();
            break;
        }
    }
    writing_ = false;
    if (closing_ && ws_.is_open())
        sendClose();
}

void WebSocketClientTransport::sendClose() {
    ws_.async_close(websocket::close_code::normal,
                    [self = shared_from_this()](beast::error_code ec) {
                        if (ec)
                            spdlog::debug("Gateway socket close: {}", ec.message());
                    });
}

} // namespace pincer::client
