#include <pincer/bridge/connection_registry.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <variant>

namespace pincer::bridge {

ConnectionRegistry::ConnectionRegistry(boost::asio::any_io_executor executor)
    : ConnectionRegistry(std::move(executor), Options{}) {}

ConnectionRegistry::ConnectionRegistry(boost::asio::any_io_executor executor, Options options)
    : correlator_(std::move(executor), options.requestTimeout), clock_(std::move(options.clock)) {
}

ConnectionRegistry::~ConnectionRegistry() {
    clear();
}

TimePoint ConnectionRegistry::now() const {
    return clock_ ? clock_() : std::chrono::system_clock::now();
}

void ConnectionRegistry::add(TabConnection conn) {
    std::lock_guard<std::mutex> lk(mu_);
    auto id = conn.id;
    connections_.insert_or_assign(std::move(id), std::move(conn));
}

void ConnectionRegistry::remove(const ConnectionId& id) {
    std::vector<RequestCorrelator::Settlement> settled;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (connections_.erase(id) == 0)
            return;
        settled = correlator_.takeConnection(
            id, Error{ErrorCode::ConnectionClosed, "Connection closed: " + id});
    }
    if (!settled.empty())
        spdlog::info("Connection {} removed; failing {} pending command(s)", id, settled.size());
    for (auto& s : settled)
        s();
}

void ConnectionRegistry::clear() {
    std::vector<ConnectionId> ids;
    {
        std::lock_guard<std::mutex> lk(mu_);
        ids.reserve(connections_.size());
        for (const auto& [id, conn] : connections_)
            ids.push_back(id);
    }
    for (const auto& id : ids)
        remove(id);
}

std::optional<TabConnection> ConnectionRegistry::get(const ConnectionId& id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = connections_.find(id);
    if (it == connections_.end())
        return std::nullopt;
    return it->second;
}

std::optional<TabConnection> ConnectionRegistry::getByTabId(TabId tabId) const {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& [id, conn] : connections_) {
        if (conn.tabId && *conn.tabId == tabId)
            return conn;
    }
    return std::nullopt;
}

std::vector<TabConnection> ConnectionRegistry::list() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<TabConnection> out;
    out.reserve(connections_.size());
    for (const auto& [id, conn] : connections_)
        out.push_back(conn);
    return out;
}

std::optional<TabConnection> ConnectionRegistry::getActive() const {
    std::lock_guard<std::mutex> lk(mu_);
    const TabConnection* active = nullptr;
    for (const auto& [id, conn] : connections_) {
        if (!active || conn.lastActivity > active->lastActivity)
            active = &conn;
    }
    if (!active)
        return std::nullopt;
    return *active;
}

std::size_t ConnectionRegistry::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return connections_.size();
}

bool ConnectionRegistry::bindTab(const ConnectionId& id, TabId tabId, std::string_view url) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = connections_.find(id);
    if (it == connections_.end() || it->second.tabId)
        return false;
    it->second.tabId = tabId;
    if (it->second.url.empty())
        it->second.url = std::string(url);
    return true;
}

void ConnectionRegistry::updateContext(const ConnectionId& id, PageContext context) {
    TabConnection snapshot;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = connections_.find(id);
        if (it == connections_.end())
            return;
        auto& conn = it->second;
        conn.context = std::make_shared<const PageContext>(std::move(context));
        conn.lastActivity = std::max(conn.lastActivity, now());
        conn.url = conn.context->url;
        conn.title = conn.context->title;
        snapshot = conn;
    }
    contextBus_.publish(snapshot, *snapshot.context);
}

SubscriptionId ConnectionRegistry::onContextUpdate(ContextHandler handler) {
    return contextBus_.subscribe(std::move(handler));
}

bool ConnectionRegistry::removeContextHandler(SubscriptionId id) {
    return contextBus_.unsubscribe(id);
}

void ConnectionRegistry::sendCommand(const ConnectionId& id, protocol::CommandEnvelope command,
                                     CommandCallback done) {
    if (std::holds_alternative<protocol::ExecuteCommand>(command.body)) {
        spdlog::warn("Refusing to send execute command {} to {}", command.requestId, id);
        done(Error{ErrorCode::CommandRejected, "Script execution is disabled"});
        return;
    }
    if (command.requestId.empty()) {
        done(Error{ErrorCode::InvalidArgument, "Command requestId is empty"});
        return;
    }

    std::string frame;
    try {
        frame = protocol::serializeCommand(command);
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Cannot encode command {} for {}: {}", command.requestId, id, e.what());
        done(Error{ErrorCode::InvalidArgument,
                   std::string("Command cannot be encoded: ") + e.what()});
        return;
    }

    std::optional<Error> immediate;
    std::optional<RequestCorrelator::Settlement> unsent;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = connections_.find(id);
        auto socket = it == connections_.end() ? nullptr : it->second.socket.lock();
        if (it == connections_.end()) {
            immediate = Error{ErrorCode::ConnectionNotFound, "Connection not found: " + id};
        } else if (!socket || !socket->isOpen()) {
            immediate = Error{ErrorCode::ConnectionNotOpen, "Connection not open: " + id};
        } else if (auto armed = correlator_.arm(id, command.requestId, std::move(done));
                   !armed) {
            // arm() leaves `done` untouched on failure.
            immediate = armed.error();
        } else if (!socket->sendText(std::move(frame))) {
            unsent = correlator_.take(id, command.requestId,
                                      Error{ErrorCode::ConnectionNotOpen,
                                            "Connection not open: " + id});
        }
    }

    if (immediate) {
        spdlog::debug("sendCommand {} -> {} failed: {}", command.requestId, id,
                      immediate->message);
        done(std::move(*immediate));
        return;
    }
    if (unsent) {
        (*unsent)();
        return;
    }
    spdlog::debug("Sent {} ({}) to {}", protocol::commandTypeName(command.body),
                  command.requestId, id);
}

std::future<Result<protocol::Json>>
ConnectionRegistry::sendCommand(const ConnectionId& id, protocol::CommandEnvelope command) {
    auto promise = std::make_shared<std::promise<Result<protocol::Json>>>();
    auto future = promise->get_future();
    sendCommand(id, std::move(command),
                [promise](Result<protocol::Json> r) { promise->set_value(std::move(r)); });
    return future;
}

bool ConnectionRegistry::resolveCommand(const ConnectionId& id, const RequestId& requestId,
                                        protocol::Json result) {
    return correlator_.resolve(id, requestId, std::move(result));
}

std::size_t ConnectionRegistry::pendingCommands() const {
    return correlator_.pending();
}

std::size_t ConnectionRegistry::pendingCommands(const ConnectionId& id) const {
    return correlator_.pending(id);
}

std::chrono::milliseconds ConnectionRegistry::requestTimeout() const noexcept {
    return correlator_.timeout();
}

RequestId ConnectionRegistry::nextRequestId(std::string_view prefix) {
    static std::atomic<uint64_t> counter{1};
    return std::string(prefix) + "-" + std::to_string(counter.fetch_add(1));
}

} // namespace pincer::bridge
