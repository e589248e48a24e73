#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/any_io_executor.hpp>

#include <pincer/client/client_transport.h>
#include <pincer/client/gateway_connection.h>
#include <pincer/config/bridge_config.h>
#include <pincer/core/types.h>
#include <pincer/protocol/envelope.h>

namespace pincer::client {

struct TabInfo {
    std::string url;
    std::string title;
};

struct AgentStatus {
    ConnectionState state{ConnectionState::Disconnected};
    std::size_t tabCount{0};
};

// Browser-side collaborator that owns the actual tabs and their content layer.
class TabHost {
public:
    using ContextReply = std::function<void(std::optional<protocol::PageContext>)>;
    using CommandReply = std::function<void(Result<protocol::Json>)>;

    virtual ~TabHost() = default;

    virtual std::optional<TabId> activeTabId() = 0;
    // nullopt when the tab has no content layer attached yet.
    virtual void captureContext(TabId tab, ContextReply reply) = 0;
    virtual void runCommand(TabId tab, const protocol::CommandEnvelope& command,
                            CommandReply reply) = 0;
};

/**
 * Tab-side coordinator: keeps the tab map, forwards context and selection upstream, and routes
 * gateway commands to the TabHost, answering each with a command_result.
 */
class BridgeAgent {
public:
    using StatusHandler = std::function<void(const AgentStatus&)>;
    using HandlerId = uint64_t;

    BridgeAgent(boost::asio::any_io_executor executor, config::ClientConfig cfg,
                TransportFactory factory, TabHost& host);
    ~BridgeAgent();

    BridgeAgent(const BridgeAgent&) = delete;
    BridgeAgent& operator=(const BridgeAgent&) = delete;

    // Connects when auto_connect is set.
    void start();
    void connect();
    void disconnect();
    void updateConfig(config::ClientConfig cfg);

    AgentStatus status() const;
    HandlerId onStatusChange(StatusHandler handler);
    bool removeStatusHandler(HandlerId id);

    void onTabActivated(TabId tab, const std::string& url, const std::string& title);
    void onTabUpdated(TabId tab, bool loadComplete, const std::string& url,
                      const std::string& title);
    void onTabRemoved(TabId tab);
    std::optional<TabInfo> tab(TabId tab) const;

    // Upstream forwards from the content layer; false when not connected.
    bool publishContext(TabId tab, const protocol::PageContext& context);
    bool publishSelection(TabId tab, const std::string& url, std::string text);

    GatewayConnection& connection();

private:
    struct Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace pincer::client
