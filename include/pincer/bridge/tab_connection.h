#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <pincer/bridge/tab_socket.h>
#include <pincer/core/types.h>
#include <pincer/protocol/envelope.h>

namespace pincer::bridge {

using protocol::PageContext;

struct TabConnection {
    ConnectionId id;
    std::optional<TabId> tabId; // bound once, on the first frame that carries one
    std::string url;
    std::string title;
    std::weak_ptr<TabSocket> socket; // borrowed
    TimePoint connectedAt{};
    TimePoint lastActivity{};
    std::shared_ptr<const PageContext> context;

    bool isOpen() const {
        auto s = socket.lock();
        return s && s->isOpen();
    }
};

} // namespace pincer::bridge
