#include <pincer/server/bridge_server.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/beast/websocket/stream.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <random>
#include <vector>

namespace pincer::server {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
using boost::asio::co_spawn;
using boost::asio::detached;
using boost::asio::use_awaitable;
using boost::asio::ip::tcp;

namespace {
constexpr auto kHandshakeTimeout = std::chrono::seconds(30);
constexpr char kBase36[] = "0123456789abcdefghijklmnopqrstuvwxyz";

std::string endpointString(const tcp::socket& socket) {
    beast::error_code ec;
    auto ep = socket.remote_endpoint(ec);
    if (ec)
        return "?";
    return ep.address().to_string() + ":" + std::to_string(ep.port());
}
} // namespace

ConnectionId generateConnectionId() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 35);
    ConnectionId id = "pincer-" + std::to_string(protocol::nowEpochMs()) + "-";
    for (int i = 0; i < 6; ++i)
        id += kBase36[dist(rng)];
    return id;
}

BridgeServer::BridgeServer(boost::asio::io_context& ioc, bridge::ConnectionRegistry& registry,
                           InboundRouter& router, config::ServerConfig cfg)
    : ioc_(ioc), registry_(registry), router_(router), cfg_(std::move(cfg)), policy_(cfg_),
      acceptor_(boost::asio::make_strand(ioc)) {}

BridgeServer::~BridgeServer() {
    running_ = false;
    beast::error_code ec;
    acceptor_.close(ec);
}

Result<void> BridgeServer::start() {
    if (running_)
        return Error{ErrorCode::InvalidState, "Bridge server already running"};
    beast::error_code ec;
    auto address = boost::asio::ip::make_address(cfg_.bindAddress, ec);
    if (ec)
        return Error{ErrorCode::InvalidArgument,
                     "Invalid bind address '" + cfg_.bindAddress + "': " + ec.message()};
    const tcp::endpoint ep{address, cfg_.port};
    acceptor_.open(ep.protocol(), ec);
    if (ec)
        return Error{ErrorCode::NetworkError, "acceptor open failed: " + ec.message()};
    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    acceptor_.bind(ep, ec);
    if (ec) {
        beast::error_code ignored;
        acceptor_.close(ignored);
        return Error{ErrorCode::NetworkError, "bind " + cfg_.bindAddress + ":" +
                                                  std::to_string(cfg_.port) +
                                                  " failed: " + ec.message()};
    }
    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
        beast::error_code ignored;
        acceptor_.close(ignored);
        return Error{ErrorCode::NetworkError, "listen failed: " + ec.message()};
    }
    boundPort_ = acceptor_.local_endpoint(ec).port();
    running_ = true;
    spdlog::info("Pincer bridge listening on ws://{}:{}{}", cfg_.bindAddress, boundPort_,
                 cfg_.wsPath);
    co_spawn(acceptor_.get_executor(), acceptLoop(), detached);
    return Result<void>();
}

void BridgeServer::stop() {
    if (!running_.exchange(false))
        return;
    boost::asio::post(acceptor_.get_executor(), [this] {
        beast::error_code ec;
        acceptor_.close(ec);
    });

    std::vector<std::shared_ptr<TabSession>> live;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto& [id, weak] : sessions_)
            if (auto s = weak.lock())
                live.push_back(std::move(s));
    }
    spdlog::info("Pincer bridge stopping; closing {} session(s)", live.size());
    for (auto& s : live)
        s->close();
}

std::size_t BridgeServer::sessionCount() const {
    std::lock_guard<std::mutex> lk(mu_);
    return sessions_.size();
}

boost::asio::awaitable<void> BridgeServer::acceptLoop() {
    while (running_ && acceptor_.is_open()) {
        tcp::socket socket(boost::asio::make_strand(ioc_));
        beast::error_code ec;
        co_await acceptor_.async_accept(socket, boost::asio::redirect_error(use_awaitable, ec));
        if (ec) {
            if (ec == boost::asio::error::operation_aborted || !acceptor_.is_open())
                break;
            spdlog::warn("accept error: {}", ec.message());
            continue;
        }
        auto ex = socket.get_executor();
        co_spawn(ex, handleConnection(std::move(socket)), detached);
    }
    spdlog::debug("Bridge accept loop exited");
}

boost::asio::awaitable<void> BridgeServer::handleConnection(tcp::socket socket) {
    const auto remote = endpointString(socket);
    beast::tcp_stream stream(std::move(socket));
    beast::flat_buffer buffer;
    http::request<http::string_body> req;
    beast::error_code ec;

    stream.expires_after(kHandshakeTimeout);
    co_await http::async_read(stream, buffer, req, boost::asio::redirect_error(use_awaitable, ec));
    if (ec) {
        spdlog::debug("http read error from {}: {}", remote, ec.message());
        co_return;
    }

    auto decision = policy_.evaluate(req);
    if (!decision.accepted()) {
        spdlog::info("Rejected {} {} from {}: {}", static_cast<unsigned>(decision.status),
                     std::string(req.target()), remote, decision.reason);
        http::response<http::string_body> res{decision.status, req.version()};
        res.set(http::field::server, "pincer");
        res.set(http::field::content_type, "text/plain");
        res.body() = decision.reason;
        res.keep_alive(false);
        res.prepare_payload();
        co_await http::async_write(stream, res, boost::asio::redirect_error(use_awaitable, ec));
        stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        co_return;
    }

    stream.expires_never();
    TabSession::Stream ws(std::move(stream));
    ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws.set_option(websocket::stream_base::decorator(
        [](websocket::response_type& res) { res.set(http::field::server, "pincer"); }));
    co_await ws.async_accept(req, boost::asio::redirect_error(use_awaitable, ec));
    if (ec) {
        spdlog::warn("WebSocket handshake with {} failed: {}", remote, ec.message());
        co_return;
    }

    auto id = generateConnectionId();
    auto session = std::make_shared<TabSession>(id, std::move(ws));
    {
        std::lock_guard<std::mutex> lk(mu_);
        sessions_[id] = session;
    }
    bridge::TabConnection conn;
    conn.id = id;
    conn.socket = session;
    conn.connectedAt = std::chrono::system_clock::now();
    conn.lastActivity = conn.connectedAt;
    registry_.add(std::move(conn));
    spdlog::info("Tab socket {} connected from {}", id, remote);

    // Raced with stop(): let the session run its close path so the entry is removed.
    if (!running_)
        session->close();

    co_await session->run(
        [this](const ConnectionId& cid, std::string_view text) { router_.handleFrame(cid, text); },
        [this](const ConnectionId& cid) { onSessionClosed(cid); });
}

void BridgeServer::onSessionClosed(const ConnectionId& id) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        sessions_.erase(id);
    }
    spdlog::info("Tab socket {} closed", id);
    router_.handleClosed(id);
}

} // namespace pincer::server
