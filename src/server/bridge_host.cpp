#include <pincer/server/bridge_host.h>

#include <spdlog/spdlog.h>

namespace pincer::server {

namespace {
bridge::ConnectionRegistry::Options registryOptions(const config::ServerConfig& cfg) {
    bridge::ConnectionRegistry::Options opts;
    opts.requestTimeout = cfg.requestTimeout;
    return opts;
}
} // namespace

BridgeHost::BridgeHost(boost::asio::io_context& ioc, config::ServerConfig cfg)
    : cfg_(std::move(cfg)), registry_(ioc.get_executor(), registryOptions(cfg_)),
      router_(registry_), server_(std::make_unique<BridgeServer>(ioc, registry_, router_, cfg_)) {
}

BridgeHost::~BridgeHost() {
    stop();
}

Result<void> BridgeHost::start() {
    if (!cfg_.enabled) {
        spdlog::info("Pincer bridge disabled by configuration");
        return Result<void>();
    }
    return server_->start();
}

void BridgeHost::stop() {
    server_->stop();
    registry_.clear();
}

} // namespace pincer::server
