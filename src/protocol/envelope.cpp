#include <pincer/protocol/envelope.h>

#include <chrono>
#include <cmath>
#include <limits>

namespace pincer::protocol {

namespace {

Error malformed(std::string detail) {
    return Error{ErrorCode::MalformedMessage, std::move(detail)};
}

std::optional<std::string> optString(const Json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string())
        return std::nullopt;
    return it->get<std::string>();
}

// Correlation ids are opaque; numeric ids from loosely typed senders are kept as their decimal
// text so they still match.
std::optional<std::string> optId(const Json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end())
        return std::nullopt;
    if (it->is_string())
        return it->get<std::string>();
    if (it->is_number_integer())
        return it->dump();
    return std::nullopt;
}

// Whole numbers representable as int64_t. Floats qualify only when finite and integral.
std::optional<int64_t> asInt64(const Json& v) {
    if (v.is_number_unsigned()) {
        auto u = v.get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
            return std::nullopt;
        return static_cast<int64_t>(u);
    }
    if (v.is_number_integer())
        return v.get<int64_t>();
    if (v.is_number_float()) {
        // [-2^63, 2^63); both bounds are exact doubles.
        constexpr double kLow = -9223372036854775808.0;
        constexpr double kHigh = 9223372036854775808.0;
        double d = v.get<double>();
        if (!std::isfinite(d) || std::trunc(d) != d || d < kLow || d >= kHigh)
            return std::nullopt;
        return static_cast<int64_t>(d);
    }
    return std::nullopt;
}

Result<std::optional<TabId>> optTabId(const Json& j) {
    auto it = j.find("tabId");
    if (it == j.end() || it->is_null())
        return std::optional<TabId>{};
    if (!it->is_number())
        return malformed("tabId must be a number");
    auto n = asInt64(*it);
    if (!n)
        return malformed("tabId is not an integer in range: " + it->dump());
    return std::optional<TabId>{*n};
}

ElementTarget targetFromJson(const Json& j) {
    ElementTarget t;
    t.selector = optString(j, "selector");
    t.ref = optString(j, "ref");
    if (auto it = j.find("coordinates"); it != j.end() && it->is_object()) {
        auto x = it->find("x");
        auto y = it->find("y");
        if (x != it->end() && y != it->end() && x->is_number() && y->is_number())
            t.coordinates = Coordinates{x->get<double>(), y->get<double>()};
    }
    return t;
}

void targetToJson(const ElementTarget& t, Json& out) {
    if (t.selector)
        out["selector"] = *t.selector;
    if (t.ref)
        out["ref"] = *t.ref;
    if (t.coordinates)
        out["coordinates"] = {{"x", t.coordinates->x}, {"y", t.coordinates->y}};
}

} // namespace

int64_t nowEpochMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::string_view eventTypeName(const EventBody& body) {
    return std::visit(
        [](auto&& e) -> std::string_view {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, ConnectEvent>) {
                return "connect";
            } else if constexpr (std::is_same_v<T, DisconnectEvent>) {
                return "disconnect";
            } else if constexpr (std::is_same_v<T, PageContextEvent>) {
                return "page_context";
            } else if constexpr (std::is_same_v<T, SelectionEvent>) {
                return "selection";
            } else if constexpr (std::is_same_v<T, ScreenshotEvent>) {
                return "screenshot";
            } else if constexpr (std::is_same_v<T, DomSnapshotEvent>) {
                return "dom_snapshot";
            } else if constexpr (std::is_same_v<T, InteractionEvent>) {
                return e.kind;
            } else if constexpr (std::is_same_v<T, CommandResultEvent>) {
                return "command_result";
            } else if constexpr (std::is_same_v<T, UnknownEvent>) {
                return e.type;
            } else {
                static_assert(always_false_v<T>, "unhandled event type");
            }
        },
        body);
}

std::string_view commandTypeName(const CommandBody& body) {
    return std::visit(
        [](auto&& c) -> std::string_view {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, GetContextCommand>) {
                return "get_context";
            } else if constexpr (std::is_same_v<T, GetSnapshotCommand>) {
                return "get_snapshot";
            } else if constexpr (std::is_same_v<T, ScreenshotCommand>) {
                return "screenshot";
            } else if constexpr (std::is_same_v<T, HighlightCommand>) {
                return "highlight";
            } else if constexpr (std::is_same_v<T, ClickCommand>) {
                return "click";
            } else if constexpr (std::is_same_v<T, TypeCommand>) {
                return "type";
            } else if constexpr (std::is_same_v<T, ScrollCommand>) {
                return "scroll";
            } else if constexpr (std::is_same_v<T, NavigateCommand>) {
                return "navigate";
            } else if constexpr (std::is_same_v<T, ExecuteCommand>) {
                return "execute";
            } else if constexpr (std::is_same_v<T, UnknownCommand>) {
                return c.type;
            } else {
                static_assert(always_false_v<T>, "unhandled command type");
            }
        },
        body);
}

PageContext pageContextFromJson(const Json& j) {
    PageContext ctx;
    if (!j.is_object())
        return ctx;
    ctx.url = optString(j, "url").value_or("");
    ctx.title = optString(j, "title").value_or("");
    ctx.favicon = optString(j, "favicon");
    ctx.selectedText = optString(j, "selectedText");
    ctx.visibleText = optString(j, "visibleText");
    if (auto it = j.find("meta"); it != j.end() && it->is_object()) {
        for (auto m = it->begin(); m != it->end(); ++m) {
            if (m.value().is_string())
                ctx.meta.emplace(m.key(), m.value().get<std::string>());
        }
    }
    if (auto it = j.find("timestamp"); it != j.end() && it->is_number())
        ctx.timestamp = asInt64(*it).value_or(0);
    return ctx;
}

Json pageContextToJson(const PageContext& context) {
    Json j = {{"url", context.url}, {"title", context.title}, {"timestamp", context.timestamp}};
    if (context.favicon)
        j["favicon"] = *context.favicon;
    if (context.selectedText)
        j["selectedText"] = *context.selectedText;
    if (context.visibleText)
        j["visibleText"] = *context.visibleText;
    if (!context.meta.empty())
        j["meta"] = context.meta;
    return j;
}

Result<EventEnvelope> parseEvent(std::string_view text) {
    auto j = Json::parse(text.begin(), text.end(), nullptr, false);
    if (j.is_discarded())
        return malformed("invalid JSON");
    if (!j.is_object())
        return malformed("envelope is not an object");
    auto type = optString(j, "type");
    if (!type)
        return malformed("missing type");

    EventEnvelope ev;
    auto tab = optTabId(j);
    if (!tab)
        return tab.error();
    ev.tabId = tab.value().value_or(0);
    ev.url = optString(j, "url").value_or("");
    if (auto it = j.find("timestamp"); it != j.end() && it->is_number()) {
        auto ts = asInt64(*it);
        if (!ts)
            return malformed("timestamp is not an integer in range: " + it->dump());
        ev.timestamp = *ts;
    }
    ev.requestId = optId(j, "requestId");

    Json payload = j.value("payload", Json());
    const std::string& t = *type;
    if (t == "connect") {
        ev.body = ConnectEvent{};
    } else if (t == "disconnect") {
        ev.body = DisconnectEvent{};
    } else if (t == "page_context") {
        if (!payload.is_object())
            return malformed("page_context payload is not an object");
        ev.body = PageContextEvent{pageContextFromJson(payload)};
    } else if (t == "selection") {
        std::string sel;
        if (payload.is_object())
            sel = optString(payload, "text").value_or("");
        ev.body = SelectionEvent{std::move(sel)};
    } else if (t == "screenshot") {
        ev.body = ScreenshotEvent{std::move(payload)};
    } else if (t == "dom_snapshot") {
        ev.body = DomSnapshotEvent{std::move(payload)};
    } else if (t == "click_event" || t == "scroll_event") {
        ev.body = InteractionEvent{t, std::move(payload)};
    } else if (t == "command_result") {
        ev.body = CommandResultEvent{std::move(payload)};
    } else {
        ev.body = UnknownEvent{t, std::move(payload)};
    }
    return ev;
}

std::string serializeEvent(const EventEnvelope& event) {
    Json j;
    j["type"] = std::string(eventTypeName(event.body));
    j["tabId"] = event.tabId;
    j["url"] = event.url;
    j["timestamp"] = event.timestamp;
    if (event.requestId)
        j["requestId"] = *event.requestId;
    j["payload"] = std::visit(
        [](auto&& e) -> Json {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, ConnectEvent> || std::is_same_v<T, DisconnectEvent>) {
                return Json::object();
            } else if constexpr (std::is_same_v<T, PageContextEvent>) {
                return pageContextToJson(e.context);
            } else if constexpr (std::is_same_v<T, SelectionEvent>) {
                return Json{{"text", e.text}};
            } else if constexpr (std::is_same_v<T, ScreenshotEvent>) {
                return e.data;
            } else if constexpr (std::is_same_v<T, DomSnapshotEvent>) {
                return e.snapshot;
            } else if constexpr (std::is_same_v<T, InteractionEvent> ||
                                 std::is_same_v<T, UnknownEvent>) {
                return e.payload;
            } else if constexpr (std::is_same_v<T, CommandResultEvent>) {
                return e.result;
            } else {
                static_assert(always_false_v<T>, "unhandled event type");
            }
        },
        event.body);
    return j.dump();
}

Result<CommandEnvelope> parseCommand(std::string_view text) {
    auto j = Json::parse(text.begin(), text.end(), nullptr, false);
    if (j.is_discarded())
        return malformed("invalid JSON");
    if (!j.is_object())
        return malformed("command is not an object");
    auto type = optString(j, "type");
    if (!type)
        return malformed("missing type");
    auto requestId = optId(j, "requestId");
    if (!requestId)
        return malformed("missing requestId");

    CommandEnvelope cmd;
    cmd.requestId = std::move(*requestId);
    auto tab = optTabId(j);
    if (!tab)
        return tab.error();
    cmd.tabId = tab.value();
    if (auto it = j.find("options"); it != j.end() && it->is_object())
        cmd.options = *it;

    const std::string& t = *type;
    if (t == "get_context") {
        cmd.body = GetContextCommand{};
    } else if (t == "get_snapshot") {
        cmd.body = GetSnapshotCommand{};
    } else if (t == "screenshot") {
        cmd.body = ScreenshotCommand{};
    } else if (t == "highlight") {
        cmd.body = HighlightCommand{targetFromJson(j)};
    } else if (t == "click") {
        cmd.body = ClickCommand{targetFromJson(j)};
    } else if (t == "type") {
        cmd.body = TypeCommand{targetFromJson(j), optString(j, "text").value_or("")};
    } else if (t == "scroll") {
        cmd.body = ScrollCommand{targetFromJson(j)};
    } else if (t == "navigate") {
        cmd.body = NavigateCommand{optString(j, "url").value_or("")};
    } else if (t == "execute") {
        cmd.body = ExecuteCommand{optString(j, "script").value_or("")};
    } else {
        cmd.body = UnknownCommand{t};
    }
    return cmd;
}

std::string serializeCommand(const CommandEnvelope& command) {
    Json j;
    j["type"] = std::string(commandTypeName(command.body));
    j["requestId"] = command.requestId;
    if (command.tabId)
        j["tabId"] = *command.tabId;
    std::visit(
        [&j](auto&& c) {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, HighlightCommand> || std::is_same_v<T, ClickCommand> ||
                          std::is_same_v<T, ScrollCommand>) {
                targetToJson(c.target, j);
            } else if constexpr (std::is_same_v<T, TypeCommand>) {
                targetToJson(c.target, j);
                j["text"] = c.text;
            } else if constexpr (std::is_same_v<T, NavigateCommand>) {
                j["url"] = c.url;
            } else if constexpr (std::is_same_v<T, ExecuteCommand>) {
                j["script"] = c.script;
            }
        },
        command.body);
    if (command.options.is_object())
        j["options"] = command.options;
    return j.dump();
}

} // namespace pincer::protocol
