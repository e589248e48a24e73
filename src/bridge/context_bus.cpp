#include <pincer/bridge/context_bus.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

namespace pincer::bridge {

SubscriptionId ContextBus::subscribe(ContextHandler handler) {
    std::lock_guard<std::mutex> lk(mu_);
    auto id = nextId_++;
    handlers_.emplace_back(id, std::move(handler));
    return id;
}

bool ContextBus::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = std::find_if(handlers_.begin(), handlers_.end(),
                           [id](const auto& h) { return h.first == id; });
    if (it == handlers_.end())
        return false;
    handlers_.erase(it);
    return true;
}

std::size_t ContextBus::publish(const TabConnection& conn, const PageContext& context) const {
    // Handlers run unlocked so they may call back into the registry or the bus.
    std::vector<std::pair<SubscriptionId, ContextHandler>> snapshot;
    {
        std::lock_guard<std::mutex> lk(mu_);
        snapshot = handlers_;
    }
    std::size_t failures = 0;
    for (const auto& [id, handler] : snapshot) {
        if (!handler)
            continue;
        try {
            handler(conn, context);
        } catch (const std::exception& e) {
            ++failures;
            spdlog::warn("{}: context handler #{} for {} threw: {}",
                         errorToString(ErrorCode::SubscriberFailure), id, conn.id, e.what());
        } catch (...) {
            ++failures;
            spdlog::warn("{}: context handler #{} for {} threw a non-standard exception",
                         errorToString(ErrorCode::SubscriberFailure), id, conn.id);
        }
    }
    return failures;
}

std::size_t ContextBus::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return handlers_.size();
}

} // namespace pincer::bridge
