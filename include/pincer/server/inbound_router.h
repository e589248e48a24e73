#pragma once

#include <string>
#include <string_view>

#include <pincer/bridge/connection_registry.h>
#include <pincer/core/types.h>

namespace pincer::server {

// Applies upstream envelopes from tab sockets to the registry.
class InboundRouter {
public:
    explicit InboundRouter(bridge::ConnectionRegistry& registry);

    // Malformed frames are logged and dropped; they never close the connection.
    void handleFrame(const ConnectionId& id, std::string_view text);
    void handleClosed(const ConnectionId& id);

private:
    bridge::ConnectionRegistry& registry_;
};

// "Browser tab: <title or url>", plus a quoted selection line (first 100 bytes) when present.
std::string formatContextSummary(const bridge::PageContext& context);

} // namespace pincer::server
