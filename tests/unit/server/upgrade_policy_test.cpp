#include <gtest/gtest.h>

#include <pincer/server/upgrade_policy.h>

#include <string>

namespace pincer::server::test {

namespace {

http::request<http::string_body> upgradeRequest(const std::string& target,
                                                const char* origin = nullptr) {
    http::request<http::string_body> req{http::verb::get, target, 11};
    req.set(http::field::host, "127.0.0.1:18789");
    req.set(http::field::connection, "Upgrade");
    req.set(http::field::upgrade, "websocket");
    req.set(http::field::sec_websocket_version, "13");
    req.set(http::field::sec_websocket_key, "dGhlIHNhbXBsZSBub25jZQ==");
    if (origin)
        req.set(http::field::origin, origin);
    return req;
}

config::ServerConfig baseConfig() {
    config::ServerConfig cfg;
    cfg.wsPath = "/pincer";
    return cfg;
}

} // namespace

TEST(QueryParamTest, ExtractsAndDecodesValues) {
    EXPECT_EQ(getQueryParam("/pincer?token=a%20b%26c&x=1", "token").value_or(""), "a b&c");
    EXPECT_EQ(getQueryParam("/pincer?x=1&token=t#frag", "token").value_or(""), "t");
    EXPECT_EQ(getQueryParam("/pincer?token=", "token").value_or("unset"), "");
    EXPECT_FALSE(getQueryParam("/pincer?tok=1", "token").has_value());
    EXPECT_FALSE(getQueryParam("/pincer", "token").has_value());
    EXPECT_EQ(targetPath("/pincer?token=1"), "/pincer");
    EXPECT_EQ(targetPath("/pincer#x"), "/pincer");
}

TEST(UpgradePolicyTest, AcceptsPlainUpgradeOnConfiguredPath) {
    UpgradePolicy policy(baseConfig());
    auto d = policy.evaluate(upgradeRequest("/pincer"));
    EXPECT_TRUE(d.accepted()) << d.reason;
}

TEST(UpgradePolicyTest, OtherPathsAreNotFound) {
    UpgradePolicy policy(baseConfig());
    auto d = policy.evaluate(upgradeRequest("/other"));
    EXPECT_EQ(d.status, http::status::not_found);
    EXPECT_FALSE(d.accepted());
}

TEST(UpgradePolicyTest, PlainHttpRequestNeedsUpgrade) {
    UpgradePolicy policy(baseConfig());
    http::request<http::string_body> req{http::verb::get, "/pincer", 11};
    req.set(http::field::host, "127.0.0.1");
    EXPECT_EQ(policy.evaluate(req).status, http::status::upgrade_required);
}

TEST(UpgradePolicyTest, TokenMustMatchWhenConfigured) {
    auto cfg = baseConfig();
    cfg.authToken = "s3cret";
    UpgradePolicy policy(cfg);
    EXPECT_EQ(policy.evaluate(upgradeRequest("/pincer")).status, http::status::unauthorized);
    EXPECT_EQ(policy.evaluate(upgradeRequest("/pincer?token=wrong")).status,
              http::status::unauthorized);
    EXPECT_TRUE(policy.evaluate(upgradeRequest("/pincer?token=s3cret")).accepted());
}

TEST(UpgradePolicyTest, OriginListFiltersBrowserOrigins) {
    auto cfg = baseConfig();
    cfg.allowedOrigins = {"chrome-extension://*"};
    UpgradePolicy policy(cfg);
    EXPECT_TRUE(policy.evaluate(upgradeRequest("/pincer", "chrome-extension://abcdef")).accepted());
    EXPECT_EQ(policy.evaluate(upgradeRequest("/pincer", "https://evil.test")).status,
              http::status::forbidden);
    // Non-browser clients omit Origin entirely.
    EXPECT_TRUE(policy.evaluate(upgradeRequest("/pincer")).accepted());
}

} // namespace pincer::server::test
