#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <pincer/bridge/connection_registry.h>
#include <pincer/config/bridge_config.h>
#include <pincer/core/types.h>
#include <pincer/server/inbound_router.h>
#include <pincer/server/tab_session.h>
#include <pincer/server/upgrade_policy.h>

namespace pincer::server {

// "pincer-<epoch-ms>-<6 base36 chars>"
ConnectionId generateConnectionId();

/**
 * WebSocket listener for tab connections.
 *
 * Each accepted upgrade becomes a TabSession registered under a fresh id; frames go to the
 * router and the registry entry is removed when the session ends. The io_context must keep
 * running until stop() has drained every session.
 */
class BridgeServer {
public:
    BridgeServer(boost::asio::io_context& ioc, bridge::ConnectionRegistry& registry,
                 InboundRouter& router, config::ServerConfig cfg);
    ~BridgeServer();

    BridgeServer(const BridgeServer&) = delete;
    BridgeServer& operator=(const BridgeServer&) = delete;

    // Binds and starts accepting. Port 0 picks an ephemeral port (see port()).
    Result<void> start();
    // Stops accepting and closes every live session.
    void stop();

    uint16_t port() const noexcept { return boundPort_; }
    bool running() const noexcept { return running_.load(); }
    std::size_t sessionCount() const;

private:
    boost::asio::awaitable<void> acceptLoop();
    boost::asio::awaitable<void> handleConnection(boost::asio::ip::tcp::socket socket);
    void onSessionClosed(const ConnectionId& id);

    boost::asio::io_context& ioc_;
    bridge::ConnectionRegistry& registry_;
    InboundRouter& router_;
    config::ServerConfig cfg_;
    UpgradePolicy policy_;
    boost::asio::ip::tcp::acceptor acceptor_;
    uint16_t boundPort_ = 0;
    std::atomic<bool> running_{false};

    mutable std::mutex mu_;
    std::unordered_map<ConnectionId, std::weak_ptr<TabSession>> sessions_;
};

} // namespace pincer::server
