#pragma once

#include <memory>

#include <boost/asio/io_context.hpp>

#include <pincer/bridge/connection_registry.h>
#include <pincer/config/bridge_config.h>
#include <pincer/server/bridge_server.h>
#include <pincer/server/inbound_router.h>

namespace pincer::server {

/**
 * Host-side bridge instance: registry, inbound router and listener created together and torn
 * down together. Callers reach connections, contexts and commands through registry().
 */
class BridgeHost {
public:
    BridgeHost(boost::asio::io_context& ioc, config::ServerConfig cfg);
    ~BridgeHost();

    BridgeHost(const BridgeHost&) = delete;
    BridgeHost& operator=(const BridgeHost&) = delete;

    Result<void> start();
    // Closes the listener and every session, failing all pending commands with ConnectionClosed.
    void stop();

    bridge::ConnectionRegistry& registry() noexcept { return registry_; }
    const config::ServerConfig& config() const noexcept { return cfg_; }
    uint16_t port() const noexcept { return server_->port(); }
    std::size_t sessionCount() const { return server_->sessionCount(); }

private:
    config::ServerConfig cfg_;
    bridge::ConnectionRegistry registry_;
    InboundRouter router_;
    std::unique_ptr<BridgeServer> server_;
};

} // namespace pincer::server
