#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <boost/asio/any_io_executor.hpp>

#include <pincer/bridge/context_bus.h>
#include <pincer/bridge/request_correlator.h>
#include <pincer/bridge/tab_connection.h>
#include <pincer/core/types.h>
#include <pincer/protocol/envelope.h>

namespace pincer::bridge {

/**
 * Live tab connections on the host side.
 *
 * All mutations (add, remove, bindTab, updateContext, sendCommand) are serialized by one mutex;
 * removing a connection fails its pending commands in the same critical section. Lookups return
 * copies, so a caller never observes a half-applied mutation. Context handlers and command
 * completions always run after the lock is released.
 *
 * The executor passed at construction must outlive the registry.
 */
class ConnectionRegistry {
public:
    using CommandCallback = RequestCorrelator::Completion;
    using Clock = std::function<TimePoint()>;

    struct Options {
        std::chrono::milliseconds requestTimeout{kDefaultRequestTimeout};
        Clock clock; // defaults to system_clock::now
    };

    explicit ConnectionRegistry(boost::asio::any_io_executor executor);
    ConnectionRegistry(boost::asio::any_io_executor executor, Options options);
    ~ConnectionRegistry();

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    // Ids are generator-assigned; adding an id that is already present replaces the entry.
    void add(TabConnection conn);
    // Fails every command pending on `id` with ConnectionClosed. Unknown ids are a no-op.
    void remove(const ConnectionId& id);
    // Removes every connection (host shutdown).
    void clear();

    std::optional<TabConnection> get(const ConnectionId& id) const;
    std::optional<TabConnection> getByTabId(TabId tabId) const;
    std::vector<TabConnection> list() const;
    // Connection with the greatest lastActivity; ties are broken arbitrarily.
    std::optional<TabConnection> getActive() const;
    std::size_t size() const;

    // First write wins: returns false if the connection is unknown or already bound.
    bool bindTab(const ConnectionId& id, TabId tabId, std::string_view url = {});

    void updateContext(const ConnectionId& id, PageContext context);
    SubscriptionId onContextUpdate(ContextHandler handler);
    bool removeContextHandler(SubscriptionId id);

    // Completes exactly once with the result payload, CommandTimeout, or ConnectionClosed.
    // Validation failures (ConnectionNotFound, ConnectionNotOpen, CommandRejected,
    // DuplicateRequest) complete immediately without arming a timer.
    void sendCommand(const ConnectionId& id, protocol::CommandEnvelope command,
                     CommandCallback done);
    std::future<Result<protocol::Json>> sendCommand(const ConnectionId& id,
                                                    protocol::CommandEnvelope command);

    // Inbound command_result path.
    bool resolveCommand(const ConnectionId& id, const RequestId& requestId,
                        protocol::Json result);

    std::size_t pendingCommands() const;
    std::size_t pendingCommands(const ConnectionId& id) const;
    std::chrono::milliseconds requestTimeout() const noexcept;

    static RequestId nextRequestId(std::string_view prefix);

private:
    TimePoint now() const;

    mutable std::mutex mu_;
    std::unordered_map<ConnectionId, TabConnection> connections_;
    RequestCorrelator correlator_;
    ContextBus contextBus_;
    Clock clock_;
};

} // namespace pincer::bridge
