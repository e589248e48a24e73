#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

#include <pincer/bridge/tab_connection.h>

namespace pincer::bridge {

using ContextHandler = std::function<void(const TabConnection&, const PageContext&)>;
using SubscriptionId = uint64_t;

// Synchronous, registration-ordered fan-out of context updates. A throwing handler is logged
// and skipped; delivery continues with the next handler.
class ContextBus {
public:
    SubscriptionId subscribe(ContextHandler handler);
    bool unsubscribe(SubscriptionId id);

    // Returns the number of handlers that failed.
    std::size_t publish(const TabConnection& conn, const PageContext& context) const;

    std::size_t size() const;

private:
    mutable std::mutex mu_;
    std::vector<std::pair<SubscriptionId, ContextHandler>> handlers_;
    SubscriptionId nextId_{1};
};

} // namespace pincer::bridge
