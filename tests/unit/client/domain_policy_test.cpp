#include <gtest/gtest.h>

#include <pincer/client/domain_policy.h>

namespace pincer::client::test {

TEST(DomainPolicyTest, EmptyListsAllowEverything) {
    DomainPolicy policy;
    EXPECT_TRUE(policy.allowsHost("example.com"));
    EXPECT_TRUE(policy.allowsUrl("https://anything.test/path"));
    EXPECT_TRUE(policy.allowsUrl("about:blank"));
}

TEST(DomainPolicyTest, BlockedWinsOverAllowed) {
    DomainPolicy policy({"*.example.com"}, {"mail.example.com"});
    EXPECT_TRUE(policy.allowsHost("docs.example.com"));
    EXPECT_FALSE(policy.allowsHost("mail.example.com"));
    EXPECT_FALSE(policy.allowsHost("other.org"));
}

TEST(DomainPolicyTest, WildcardCoversApexAndIsCaseInsensitive) {
    DomainPolicy policy({}, {"*.Bank.com"});
    EXPECT_FALSE(policy.allowsHost("bank.com"));
    EXPECT_FALSE(policy.allowsHost("WWW.BANK.COM"));
    EXPECT_FALSE(policy.allowsUrl("https://login.bank.com:8443/auth?x=1"));
    EXPECT_TRUE(policy.allowsHost("notbank.com"));
}

TEST(DomainPolicyTest, HostlessUrlsNeedAnOpenAllowList) {
    DomainPolicy restricted({"example.com"}, {});
    EXPECT_FALSE(restricted.allowsUrl("file:///etc/hosts"));
    EXPECT_TRUE(restricted.allowsUrl("https://example.com/"));
}

TEST(DomainPolicyTest, BuildsFromClientConfig) {
    config::ClientConfig cfg;
    cfg.allowedDomains = {"example.com"};
    cfg.blockedDomains = {"example.com"};
    auto policy = DomainPolicy::fromConfig(cfg);
    EXPECT_FALSE(policy.allowsHost("example.com"));
}

} // namespace pincer::client::test
