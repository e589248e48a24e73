#include <gtest/gtest.h>

#include <pincer/config/config_helpers.h>

#include "support/temp_dir_scope.hpp"

#include <cstdlib>

namespace pincer::config::test {

using test_support::TempDirScope;
using namespace std::chrono_literals;

TEST(ConfigHelpersTest, StrictScalarParsers) {
    EXPECT_EQ(parse_uint(" 42 ").value_or(0), 42u);
    EXPECT_FALSE(parse_uint("-1").has_value());
    EXPECT_FALSE(parse_uint("12abc").has_value());
    EXPECT_FALSE(parse_uint("").has_value());

    EXPECT_EQ(parse_ms("250").value_or(0ms), 250ms);
    EXPECT_EQ(parse_ms("250ms").value_or(0ms), 250ms);
    EXPECT_FALSE(parse_ms("1s").has_value());
    EXPECT_EQ(parse_ms("86400000").value_or(0ms), kMaxMillisSetting);
    EXPECT_FALSE(parse_ms("86400001").has_value());
    EXPECT_FALSE(parse_ms("18446744073709551615").has_value());
    EXPECT_FALSE(parse_ms("9223372036854775808ms").has_value());
    EXPECT_FALSE(parse_ms("500", 100ms).has_value());

    EXPECT_EQ(parse_bool("Yes"), std::optional<bool>(true));
    EXPECT_EQ(parse_bool("off"), std::optional<bool>(false));
    EXPECT_FALSE(parse_bool("maybe").has_value());

    EXPECT_EQ(parse_port("18789").value_or(0), 18789);
    EXPECT_FALSE(parse_port("0").has_value());
    EXPECT_FALSE(parse_port("70000").has_value());
}

TEST(ConfigHelpersTest, ListsAcceptCommaAndArrayForms) {
    EXPECT_EQ(parse_list("a.com, b.com"), (std::vector<std::string>{"a.com", "b.com"}));
    EXPECT_EQ(parse_list(R"(["*.bank.com", 'mail.example.com'])"),
              (std::vector<std::string>{"*.bank.com", "mail.example.com"}));
    EXPECT_EQ(parse_list(R"(["a,b", "c"])"), (std::vector<std::string>{"a,b", "c"}));
    EXPECT_TRUE(parse_list("[]").empty());
}

TEST(ConfigHelpersTest, ParsesSectionsCommentsAndDottedKeys) {
    auto dir = TempDirScope::unique_under("pincer_config_helpers");
    auto file = dir.write("config.toml", R"(# top comment
log.level = "debug"

[server]
port = 9000   # inline comment
auth_token = "abc#def"
allowed_origins = ["chrome-extension://*"]
)");
    auto table = parse_config_file(file);
    EXPECT_EQ(table["log"]["level"], "debug");
    EXPECT_EQ(table["server"]["port"], "9000");
    EXPECT_EQ(table["server"]["auth_token"], "abc#def");
    EXPECT_EQ(table["server"]["allowed_origins"], R"(["chrome-extension://*"])");
    EXPECT_EQ(table["server"].count("missing"), 0u);
    EXPECT_TRUE(parse_config_file(dir.path() / "absent.toml").empty());
}

TEST(ConfigHelpersTest, ConfigPathPrefersOverrideThenEnvironment) {
    EXPECT_EQ(get_config_path("/tmp/explicit.toml"), std::filesystem::path("/tmp/explicit.toml"));

    ::setenv("PINCER_CONFIG", "/tmp/from-env.toml", 1);
    EXPECT_EQ(get_config_path(), std::filesystem::path("/tmp/from-env.toml"));
    ::unsetenv("PINCER_CONFIG");

    ::setenv("XDG_CONFIG_HOME", "/tmp/xdg", 1);
    EXPECT_EQ(get_config_path(), std::filesystem::path("/tmp/xdg/pincer/config.toml"));
    ::unsetenv("XDG_CONFIG_HOME");
}

} // namespace pincer::config::test
