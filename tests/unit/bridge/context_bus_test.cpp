#include <gtest/gtest.h>

#include <pincer/bridge/context_bus.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace pincer::bridge::test {

TEST(ContextBusTest, DeliversInRegistrationOrderDespiteThrowingHandler) {
    ContextBus bus;
    std::vector<std::string> calls;
    bus.subscribe([&](const TabConnection&, const PageContext&) { calls.push_back("first"); });
    bus.subscribe([&](const TabConnection&, const PageContext&) {
        calls.push_back("second");
        throw std::runtime_error("handler exploded");
    });
    bus.subscribe([&](const TabConnection&, const PageContext&) {
        calls.push_back("third");
        throw 42;
    });
    bus.subscribe([&](const TabConnection&, const PageContext& ctx) {
        calls.push_back("fourth:" + ctx.title);
    });

    TabConnection conn;
    conn.id = "c1";
    PageContext ctx;
    ctx.title = "T";
    std::size_t failures = 0;
    EXPECT_NO_THROW(failures = bus.publish(conn, ctx));
    EXPECT_EQ(failures, 2u);
    EXPECT_EQ(calls, (std::vector<std::string>{"first", "second", "third", "fourth:T"}));
}

TEST(ContextBusTest, UnsubscribeStopsDelivery) {
    ContextBus bus;
    int hits = 0;
    auto id = bus.subscribe([&](const TabConnection&, const PageContext&) { ++hits; });
    EXPECT_EQ(bus.size(), 1u);
    EXPECT_TRUE(bus.unsubscribe(id));
    EXPECT_FALSE(bus.unsubscribe(id));
    EXPECT_EQ(bus.size(), 0u);
    bus.publish(TabConnection{}, PageContext{});
    EXPECT_EQ(hits, 0);
}

TEST(ContextBusTest, HandlerMaySubscribeDuringPublish) {
    ContextBus bus;
    int late = 0;
    bus.subscribe([&](const TabConnection&, const PageContext&) {
        bus.subscribe([&](const TabConnection&, const PageContext&) { ++late; });
    });
    bus.publish(TabConnection{}, PageContext{});
    EXPECT_EQ(late, 0);
    EXPECT_EQ(bus.size(), 2u);
}

} // namespace pincer::bridge::test
