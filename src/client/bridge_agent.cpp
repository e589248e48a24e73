#include <pincer/client/bridge_agent.h>
#include <pincer/client/domain_policy.h>

#include <spdlog/spdlog.h>

#include <map>
#include <mutex>
#include <unordered_map>
#include <variant>
#include <vector>

namespace pincer::client {

using namespace protocol;

namespace {
constexpr std::string_view kBrowserInternalScheme = "chrome://";
}

struct BridgeAgent::Impl : std::enable_shared_from_this<Impl> {
    Impl(config::ClientConfig c, TabHost& h)
        : cfg(std::move(c)), policy(DomainPolicy::fromConfig(cfg)), host(h) {}

    mutable std::mutex mu;
    config::ClientConfig cfg;
    DomainPolicy policy;
    TabHost& host;
    std::unordered_map<TabId, TabInfo> tabs;
    std::map<HandlerId, StatusHandler> statusHandlers;
    HandlerId nextHandler{1};
    // Guarded by mu. Null once the agent is being destroyed; host callbacks that outlive it
    // see null and drop their output.
    std::shared_ptr<GatewayConnection> connection;

    std::shared_ptr<GatewayConnection> gateway() const {
        std::lock_guard<std::mutex> lk(mu);
        return connection;
    }

    bool connected() const {
        auto gw = gateway();
        return gw && gw->state() == ConnectionState::Connected;
    }

    bool send(const EventEnvelope& ev) {
        auto gw = gateway();
        return gw && gw->send(ev);
    }

    void broadcastStatus(ConnectionState s) {
        std::vector<StatusHandler> handlers;
        AgentStatus st;
        st.state = s;
        {
            std::lock_guard<std::mutex> lk(mu);
            st.tabCount = tabs.size();
            handlers.reserve(statusHandlers.size());
            for (const auto& [id, h] : statusHandlers)
                handlers.push_back(h);
        }
        for (const auto& h : handlers) {
            try {
                h(st);
            } catch (const std::exception& e) {
                spdlog::warn("Status handler failed: {}", e.what());
            }
        }
    }

    std::string tabUrl(TabId tab) const {
        std::lock_guard<std::mutex> lk(mu);
        auto it = tabs.find(tab);
        return it == tabs.end() ? std::string{} : it->second.url;
    }

    void sendResult(TabId tab, const RequestId& requestId, Json payload) {
        EventEnvelope ev{tab, tabUrl(tab), nowEpochMs(), requestId,
                         CommandResultEvent{std::move(payload)}};
        if (!send(ev))
            spdlog::debug("Result for {} dropped: not connected", requestId);
    }

    void handleCommand(CommandEnvelope cmd) {
        spdlog::info("Received command: {} ({})", commandTypeName(cmd.body), cmd.requestId);

        std::optional<TabId> tab;
        if (cmd.tabId && *cmd.tabId != 0)
            tab = cmd.tabId;
        else
            tab = host.activeTabId();

        if (std::holds_alternative<ExecuteCommand>(cmd.body)) {
            spdlog::warn("[{}] execute command {} refused",
                         errorToString(ErrorCode::CommandRejected), cmd.requestId);
            sendResult(tab.value_or(0), cmd.requestId,
                       Json{{"error", "Script execution disabled"}});
            return;
        }
        if (!tab) {
            spdlog::warn("No active tab for command {}", cmd.requestId);
            return;
        }

        std::weak_ptr<Impl> weak = shared_from_this();
        host.runCommand(*tab, cmd,
                        [weak, tabId = *tab, requestId = cmd.requestId](Result<Json> r) {
                            auto self = weak.lock();
                            if (!self)
                                return;
                            if (!r) {
                                spdlog::error("Failed to execute command {}: {}", requestId,
                                              r.error().message);
                                self->sendResult(tabId, requestId,
                                                 Json{{"error", r.error().message}});
                                return;
                            }
                            auto payload = std::move(r).value();
                            if (payload.is_null()) {
                                spdlog::debug("Command {} produced no response", requestId);
                                return;
                            }
                            self->sendResult(tabId, requestId, std::move(payload));
                        });
    }

    void requestContextFromTab(TabId tab) {
        std::weak_ptr<Impl> weak = shared_from_this();
        host.captureContext(tab, [weak, tab](std::optional<PageContext> ctx) {
            auto self = weak.lock();
            if (!self)
                return;
            if (!ctx) {
                // Content layer may not be injected yet
                spdlog::debug("Could not get context from tab {}", tab);
                return;
            }
            EventEnvelope ev{tab, ctx->url, nowEpochMs(), std::nullopt,
                             PageContextEvent{std::move(*ctx)}};
            if (!self->send(ev))
                spdlog::debug("Context for tab {} dropped: not connected", tab);
        });
    }
};

BridgeAgent::BridgeAgent(boost::asio::any_io_executor executor, config::ClientConfig cfg,
                         TransportFactory factory, TabHost& host)
    : impl_(std::make_shared<Impl>(cfg, host)) {
    std::weak_ptr<Impl> weak = impl_;
    ConnectionEvents events;
    events.onStatusChange = [weak](ConnectionState s) {
        if (auto self = weak.lock())
            self->broadcastStatus(s);
    };
    events.onCommand = [weak](CommandEnvelope cmd) {
        if (auto self = weak.lock())
            self->handleCommand(std::move(cmd));
    };
    events.onError = [](const Error& e) {
        spdlog::error("Connection error: {}", e.message);
    };
    auto gw = std::make_shared<GatewayConnection>(std::move(executor), std::move(cfg),
                                                  std::move(factory), std::move(events));
    std::lock_guard<std::mutex> lk(impl_->mu);
    impl_->connection = std::move(gw);
}

BridgeAgent::~BridgeAgent() {
    // Detach under the lock, then tear down outside it: closing the transport may run host
    // callbacks that take mu.
    std::shared_ptr<GatewayConnection> gw;
    {
        std::lock_guard<std::mutex> lk(impl_->mu);
        gw = std::move(impl_->connection);
    }
    gw.reset();
}

void BridgeAgent::start() {
    bool autoConnect = false;
    {
        std::lock_guard<std::mutex> lk(impl_->mu);
        autoConnect = impl_->cfg.autoConnect;
    }
    if (autoConnect)
        connect();
    spdlog::info("Bridge agent started (auto_connect={})", autoConnect);
}

void BridgeAgent::connect() {
    impl_->gateway()->connect();
}

void BridgeAgent::disconnect() {
    impl_->gateway()->disconnect();
}

void BridgeAgent::updateConfig(config::ClientConfig cfg) {
    {
        std::lock_guard<std::mutex> lk(impl_->mu);
        impl_->cfg = cfg;
        impl_->policy = DomainPolicy::fromConfig(cfg);
    }
    impl_->gateway()->updateConfig(std::move(cfg));
}

AgentStatus BridgeAgent::status() const {
    AgentStatus st;
    st.state = impl_->gateway()->state();
    std::lock_guard<std::mutex> lk(impl_->mu);
    st.tabCount = impl_->tabs.size();
    return st;
}

BridgeAgent::HandlerId BridgeAgent::onStatusChange(StatusHandler handler) {
    std::lock_guard<std::mutex> lk(impl_->mu);
    auto id = impl_->nextHandler++;
    impl_->statusHandlers.emplace(id, std::move(handler));
    return id;
}

bool BridgeAgent::removeStatusHandler(HandlerId id) {
    std::lock_guard<std::mutex> lk(impl_->mu);
    return impl_->statusHandlers.erase(id) > 0;
}

void BridgeAgent::onTabActivated(TabId tab, const std::string& url, const std::string& title) {
    if (url.empty() || url.starts_with(kBrowserInternalScheme))
        return;
    bool push = false;
    {
        std::lock_guard<std::mutex> lk(impl_->mu);
        impl_->tabs[tab] = TabInfo{url, title};
        push = impl_->cfg.sendOnTabSwitch && impl_->policy.allowsUrl(url);
    }
    if (push && impl_->connected())
        impl_->requestContextFromTab(tab);
}

void BridgeAgent::onTabUpdated(TabId tab, bool loadComplete, const std::string& url,
                               const std::string& title) {
    if (!loadComplete || url.empty())
        return;
    std::lock_guard<std::mutex> lk(impl_->mu);
    impl_->tabs[tab] = TabInfo{url, title};
}

void BridgeAgent::onTabRemoved(TabId tab) {
    std::lock_guard<std::mutex> lk(impl_->mu);
    impl_->tabs.erase(tab);
}

std::optional<TabInfo> BridgeAgent::tab(TabId tab) const {
    std::lock_guard<std::mutex> lk(impl_->mu);
    auto it = impl_->tabs.find(tab);
    if (it == impl_->tabs.end())
        return std::nullopt;
    return it->second;
}

bool BridgeAgent::publishContext(TabId tab, const PageContext& context) {
    if (!impl_->connected())
        return false;
    {
        std::lock_guard<std::mutex> lk(impl_->mu);
        if (!impl_->policy.allowsUrl(context.url)) {
            spdlog::debug("Context for tab {} withheld by domain policy", tab);
            return false;
        }
    }
    EventEnvelope ev{tab, context.url, nowEpochMs(), std::nullopt, PageContextEvent{context}};
    return impl_->send(ev);
}

bool BridgeAgent::publishSelection(TabId tab, const std::string& url, std::string text) {
    if (!impl_->connected())
        return false;
    {
        std::lock_guard<std::mutex> lk(impl_->mu);
        if (!impl_->policy.allowsUrl(url))
            return false;
    }
    EventEnvelope ev{tab, url, nowEpochMs(), std::nullopt, SelectionEvent{std::move(text)}};
    return impl_->send(ev);
}

GatewayConnection& BridgeAgent::connection() {
    return *impl_->gateway();
}

} // namespace pincer::client
