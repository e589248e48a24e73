#include <gtest/gtest.h>

#include <pincer/protocol/envelope.h>

#include <limits>
#include <variant>

namespace pincer::protocol::test {

TEST(EventEnvelopeTest, ParsesPageContextPayload) {
    auto r = parseEvent(R"({"type":"page_context","tabId":7,"url":"https://a","timestamp":1700,
        "payload":{"url":"https://a","title":"A","selectedText":"hi","meta":{"k":"v"},
                   "extra":123}})");
    ASSERT_TRUE(r) << r.error().message;
    const auto& ev = r.value();
    EXPECT_EQ(ev.tabId, 7);
    EXPECT_EQ(ev.url, "https://a");
    EXPECT_EQ(ev.timestamp, 1700);
    EXPECT_FALSE(ev.requestId.has_value());
    ASSERT_TRUE(std::holds_alternative<PageContextEvent>(ev.body));
    const auto& ctx = std::get<PageContextEvent>(ev.body).context;
    EXPECT_EQ(ctx.title, "A");
    EXPECT_EQ(ctx.selectedText.value_or(""), "hi");
    EXPECT_EQ(ctx.meta.at("k"), "v");
    EXPECT_FALSE(ctx.visibleText.has_value());
}

TEST(EventEnvelopeTest, CommandResultCarriesRequestIdAndPayload) {
    auto r = parseEvent(
        R"({"type":"command_result","tabId":7,"url":"","timestamp":1,"requestId":"r1","payload":{"ok":true}})");
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().requestId.value_or(""), "r1");
    ASSERT_TRUE(std::holds_alternative<CommandResultEvent>(r.value().body));
    EXPECT_EQ(std::get<CommandResultEvent>(r.value().body).result, Json({{"ok", true}}));
}

TEST(EventEnvelopeTest, NumericRequestIdIsKeptAsText) {
    auto r = parseEvent(R"({"type":"command_result","tabId":1,"requestId":42,"payload":null})");
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().requestId.value_or(""), "42");
}

TEST(EventEnvelopeTest, UnknownTypeParsesAsUnknownEvent) {
    auto r = parseEvent(R"({"type":"hover_event","tabId":3,"payload":{"x":1}})");
    ASSERT_TRUE(r);
    ASSERT_TRUE(std::holds_alternative<UnknownEvent>(r.value().body));
    EXPECT_EQ(std::get<UnknownEvent>(r.value().body).type, "hover_event");
    EXPECT_EQ(eventTypeName(r.value().body), "hover_event");
}

TEST(EventEnvelopeTest, LegacyInteractionEventsAreRecognized) {
    auto r = parseEvent(R"({"type":"scroll_event","tabId":3,"payload":{"y":100}})");
    ASSERT_TRUE(r);
    ASSERT_TRUE(std::holds_alternative<InteractionEvent>(r.value().body));
    EXPECT_EQ(eventTypeName(r.value().body), "scroll_event");
}

TEST(EventEnvelopeTest, MalformedInputIsRejected) {
    for (const char* text : {"not json", "[1,2]", R"({"tabId":1})", R"({"type":5})",
                             R"({"type":"connect","tabId":"seven"})",
                             R"({"type":"page_context","tabId":1,"payload":"oops"})"}) {
        auto r = parseEvent(text);
        ASSERT_FALSE(r) << text;
        EXPECT_EQ(r.error().code, ErrorCode::MalformedMessage) << text;
    }
}

TEST(EventEnvelopeTest, TabIdMustBeWholeAndInRange) {
    for (const char* text : {R"({"type":"connect","tabId":1e300})",
                             R"({"type":"connect","tabId":-1e300})",
                             R"({"type":"connect","tabId":9223372036854775808})",
                             R"({"type":"connect","tabId":18446744073709551615})",
                             R"({"type":"connect","tabId":7.5})"}) {
        auto r = parseEvent(text);
        ASSERT_FALSE(r) << text;
        EXPECT_EQ(r.error().code, ErrorCode::MalformedMessage) << text;
    }
    auto whole = parseEvent(R"({"type":"connect","tabId":12.0})");
    ASSERT_TRUE(whole);
    EXPECT_EQ(whole.value().tabId, 12);

    auto big = parseEvent(R"({"type":"connect","tabId":9223372036854775807})");
    ASSERT_TRUE(big);
    EXPECT_EQ(big.value().tabId, std::numeric_limits<TabId>::max());

    auto cmd = parseCommand(R"({"type":"click","requestId":"r","tabId":1e19})");
    ASSERT_FALSE(cmd);
    EXPECT_EQ(cmd.error().code, ErrorCode::MalformedMessage);
}

TEST(EventEnvelopeTest, TimestampMustFitInSignedMilliseconds) {
    auto r = parseEvent(R"({"type":"connect","tabId":1,"timestamp":1e300})");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::MalformedMessage);

    // Inside a page_context payload an unusable timestamp is dropped, not fatal.
    auto ctx = parseEvent(
        R"({"type":"page_context","tabId":1,"payload":{"url":"https://a","timestamp":1e300}})");
    ASSERT_TRUE(ctx);
    EXPECT_EQ(std::get<PageContextEvent>(ctx.value().body).context.timestamp, 0);
}

TEST(CommandEnvelopeTest, InvalidUtf8TextFailsToSerialize) {
    CommandEnvelope cmd;
    cmd.requestId = "r1";
    cmd.body = TypeCommand{{}, "\xff\xfe"};
    EXPECT_THROW(serializeCommand(cmd), nlohmann::json::type_error);
}

TEST(EventEnvelopeTest, SelectionSerializesTextPayload) {
    EventEnvelope ev{9, "https://b", 5, std::nullopt, SelectionEvent{"picked"}};
    auto j = Json::parse(serializeEvent(ev));
    EXPECT_EQ(j["type"], "selection");
    EXPECT_EQ(j["tabId"], 9);
    EXPECT_EQ(j["url"], "https://b");
    EXPECT_EQ(j["payload"]["text"], "picked");
    EXPECT_FALSE(j.contains("requestId"));
}

TEST(CommandEnvelopeTest, ParsesClickWithElementRef) {
    auto r = parseCommand(R"({"type":"click","requestId":"r1","ref":"e3","tabId":7})");
    ASSERT_TRUE(r) << r.error().message;
    const auto& cmd = r.value();
    EXPECT_EQ(cmd.requestId, "r1");
    EXPECT_EQ(cmd.tabId.value_or(0), 7);
    ASSERT_TRUE(std::holds_alternative<ClickCommand>(cmd.body));
    const auto& target = std::get<ClickCommand>(cmd.body).target;
    EXPECT_EQ(target.ref.value_or(""), "e3");
    EXPECT_FALSE(target.selector.has_value());
    EXPECT_FALSE(target.coordinates.has_value());
}

TEST(CommandEnvelopeTest, TypeAndNavigateFields) {
    auto typed = parseCommand(
        R"({"type":"type","requestId":"r2","selector":"#q","text":"hello","coordinates":{"x":1.5,"y":2}})");
    ASSERT_TRUE(typed);
    const auto& t = std::get<TypeCommand>(typed.value().body);
    EXPECT_EQ(t.text, "hello");
    EXPECT_EQ(t.target.selector.value_or(""), "#q");
    ASSERT_TRUE(t.target.coordinates.has_value());
    EXPECT_DOUBLE_EQ(t.target.coordinates->x, 1.5);

    auto nav = parseCommand(R"({"type":"navigate","requestId":"r3","url":"https://c"})");
    ASSERT_TRUE(nav);
    EXPECT_EQ(std::get<NavigateCommand>(nav.value().body).url, "https://c");
    EXPECT_FALSE(nav.value().tabId.has_value());
}

TEST(CommandEnvelopeTest, RequestIdIsMandatory) {
    auto r = parseCommand(R"({"type":"get_context"})");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::MalformedMessage);
}

TEST(CommandEnvelopeTest, SerializedClickMatchesWireShape) {
    CommandEnvelope cmd;
    cmd.requestId = "r1";
    cmd.tabId = 7;
    ElementTarget target;
    target.ref = "e3";
    cmd.body = ClickCommand{target};
    auto j = Json::parse(serializeCommand(cmd));
    EXPECT_EQ(j, Json({{"type", "click"}, {"requestId", "r1"}, {"tabId", 7}, {"ref", "e3"}}));
}

TEST(CommandEnvelopeTest, UnknownCommandKeepsItsType) {
    auto r = parseCommand(R"({"type":"zoom","requestId":"z"})");
    ASSERT_TRUE(r);
    EXPECT_EQ(commandTypeName(r.value().body), "zoom");
}

} // namespace pincer::protocol::test
