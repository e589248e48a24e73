#include <pincer/core/text_utils.h>
#include <pincer/server/inbound_router.h>

#include <spdlog/spdlog.h>

#include <type_traits>
#include <variant>

namespace pincer::server {

using namespace protocol;

namespace {
constexpr std::size_t kSummarySelectionBytes = 100;
}

InboundRouter::InboundRouter(bridge::ConnectionRegistry& registry) : registry_(registry) {}

void InboundRouter::handleFrame(const ConnectionId& id, std::string_view text) {
    auto parsed = parseEvent(text);
    if (!parsed) {
        spdlog::error("[{}] {} from {}: {}", errorToString(ErrorCode::MalformedMessage),
                      parsed.error().message, id, truncateUtf8(text, 200));
        return;
    }
    auto event = std::move(parsed).value();

    if (event.tabId != 0 && registry_.bindTab(id, event.tabId, event.url))
        spdlog::debug("Connection {} bound to tab {}", id, event.tabId);

    std::visit(
        [&](auto& body) {
            using T = std::decay_t<decltype(body)>;
            if constexpr (std::is_same_v<T, ConnectEvent>) {
                spdlog::info("Tab {} connected on {} ({})", event.tabId, id, event.url);
            } else if constexpr (std::is_same_v<T, DisconnectEvent>) {
                spdlog::info("Tab {} announced disconnect on {}", event.tabId, id);
                registry_.remove(id);
            } else if constexpr (std::is_same_v<T, PageContextEvent>) {
                body.context.timestamp = nowEpochMs();
                registry_.updateContext(id, std::move(body.context));
            } else if constexpr (std::is_same_v<T, SelectionEvent>) {
                auto conn = registry_.get(id);
                if (!conn || !conn->context) {
                    spdlog::debug("Selection from {} dropped: no cached context", id);
                    return;
                }
                PageContext next = *conn->context;
                next.selectedText = std::move(body.text);
                registry_.updateContext(id, std::move(next));
            } else if constexpr (std::is_same_v<T, CommandResultEvent>) {
                if (!event.requestId) {
                    spdlog::debug("command_result from {} without requestId ignored", id);
                    return;
                }
                if (!registry_.resolveCommand(id, *event.requestId, std::move(body.result)))
                    spdlog::debug("command_result {} on {} has no pending request",
                                  *event.requestId, id);
            } else if constexpr (std::is_same_v<T, ScreenshotEvent> ||
                                 std::is_same_v<T, DomSnapshotEvent>) {
                spdlog::debug("{} from {} received", eventTypeName(event.body), id);
            } else if constexpr (std::is_same_v<T, InteractionEvent>) {
                spdlog::debug("{} from tab {}", body.kind, event.tabId);
            } else if constexpr (std::is_same_v<T, UnknownEvent>) {
                spdlog::debug("Unknown event type '{}' from {} dropped", body.type, id);
            } else {
                static_assert(always_false_v<T>, "unhandled event type");
            }
        },
        event.body);
}

void InboundRouter::handleClosed(const ConnectionId& id) {
    registry_.remove(id);
}

std::string formatContextSummary(const bridge::PageContext& context) {
    std::string out = "Browser tab: ";
    out += context.title.empty() ? context.url : context.title;
    if (context.selectedText && !context.selectedText->empty()) {
        out += "\nSelected: \"";
        out += truncateUtf8(*context.selectedText, kSummarySelectionBytes);
        out += "...\"";
    }
    return out;
}

} // namespace pincer::server
