#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

#include <nlohmann/json.hpp>

#include <pincer/core/types.h>

namespace pincer::protocol {

using Json = nlohmann::json;

template <typename> inline constexpr bool always_false_v = false;

// Cached snapshot of a tab's page state. Replaced wholesale on every update.
struct PageContext {
    std::string url;
    std::string title;
    std::optional<std::string> favicon;
    std::optional<std::string> selectedText;
    std::optional<std::string> visibleText;
    std::map<std::string, std::string> meta;
    int64_t timestamp{0}; // epoch milliseconds
};

// ---------------------------------------------------------------------------
// Upstream events (tab -> host)
// ---------------------------------------------------------------------------

struct ConnectEvent {};
struct DisconnectEvent {};
struct PageContextEvent {
    PageContext context;
};
struct SelectionEvent {
    std::string text;
};
struct ScreenshotEvent {
    Json data;
};
struct DomSnapshotEvent {
    Json snapshot;
};
// Interaction notifications emitted by older content scripts; carried for logging only.
struct InteractionEvent {
    std::string kind; // "click_event" or "scroll_event"
    Json payload;
};
struct CommandResultEvent {
    Json result;
};
struct UnknownEvent {
    std::string type;
    Json payload;
};

using EventBody = std::variant<ConnectEvent, DisconnectEvent, PageContextEvent, SelectionEvent,
                               ScreenshotEvent, DomSnapshotEvent, InteractionEvent,
                               CommandResultEvent, UnknownEvent>;

struct EventEnvelope {
    TabId tabId{0};
    std::string url;
    int64_t timestamp{0};
    std::optional<RequestId> requestId;
    EventBody body;
};

// ---------------------------------------------------------------------------
// Downstream commands (host -> tab)
// ---------------------------------------------------------------------------

struct Coordinates {
    double x{0};
    double y{0};
};

// Element addressing shared by the interaction commands: ref wins over selector, selector over
// coordinates.
struct ElementTarget {
    std::optional<std::string> selector;
    std::optional<std::string> ref;
    std::optional<Coordinates> coordinates;
};

struct GetContextCommand {};
struct GetSnapshotCommand {};
struct ScreenshotCommand {};
struct HighlightCommand {
    ElementTarget target;
};
struct ClickCommand {
    ElementTarget target;
};
struct TypeCommand {
    ElementTarget target;
    std::string text;
};
struct ScrollCommand {
    ElementTarget target;
};
struct NavigateCommand {
    std::string url;
};
// Reserved. Never dispatched: the host refuses to send it and the agent refuses to run it.
struct ExecuteCommand {
    std::string script;
};
struct UnknownCommand {
    std::string type;
};

using CommandBody =
    std::variant<GetContextCommand, GetSnapshotCommand, ScreenshotCommand, HighlightCommand,
                 ClickCommand, TypeCommand, ScrollCommand, NavigateCommand, ExecuteCommand,
                 UnknownCommand>;

struct CommandEnvelope {
    RequestId requestId;
    std::optional<TabId> tabId;
    Json options; // null when absent
    CommandBody body;
};

// Wire names
std::string_view eventTypeName(const EventBody& body);
std::string_view commandTypeName(const CommandBody& body);

// JSON codec. Parse failures are reported as ErrorCode::MalformedMessage; unrecognized type
// strings parse successfully into UnknownEvent / UnknownCommand. Integer fields (tabId,
// timestamp) must be whole numbers that fit in int64_t. The serializers throw
// nlohmann::json::type_error when a string field is not valid UTF-8.
Result<EventEnvelope> parseEvent(std::string_view text);
std::string serializeEvent(const EventEnvelope& event);

Result<CommandEnvelope> parseCommand(std::string_view text);
std::string serializeCommand(const CommandEnvelope& command);

// PageContext <-> JSON. Only url/title/selectedText are interpreted; other fields are carried.
PageContext pageContextFromJson(const Json& j);
Json pageContextToJson(const PageContext& context);

int64_t nowEpochMs();

} // namespace pincer::protocol
