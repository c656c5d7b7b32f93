#include <gtest/gtest.h>

#include "testing.hpp"
#include "util/config.hpp"

#include <filesystem>
#include <string>

namespace stash::config {

TEST(ConfigTest, EmptyObjectLeavesEverythingUnset) {
    StashConfigFromFile cfg;
    auto r = cfg.LoadString("{}", "inline");
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_FALSE(cfg.strip_components.has_value());
    EXPECT_FALSE(cfg.preserve_permissions.has_value());
    EXPECT_FALSE(cfg.preserve_times.has_value());
    EXPECT_FALSE(cfg.log_level.has_value());
    EXPECT_FALSE(cfg.key_file.has_value());
}

TEST(ConfigTest, ReadsAllKeysAndIgnoresUnknownOnes) {
    StashConfigFromFile cfg;
    auto r = cfg.LoadString(R"({
        "StripComponents": 1,
        "PreservePermissions": false,
        "PreserveTimes": true,
        "LogLevel": "Debug",
        "KeyFile": "/etc/stashkit/registry.key",
        "SomethingElse": [1, 2, 3]
    })", "inline");
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(cfg.strip_components, 1U);
    EXPECT_EQ(cfg.preserve_permissions, false);
    EXPECT_EQ(cfg.preserve_times, true);
    EXPECT_EQ(cfg.log_level, LogLevel::Debug);
    EXPECT_EQ(cfg.key_file, std::string("/etc/stashkit/registry.key"));
}

TEST(ConfigTest, RejectsWrongTypes) {
    const char* cases[] = {
        R"({"StripComponents": -1})",
        R"({"StripComponents": "1"})",
        R"({"PreservePermissions": "yes"})",
        R"({"LogLevel": "loud"})",
        R"({"LogLevel": 3})",
        R"({"KeyFile": ""})",
    };
    for (const char* text : cases) {
        StashConfigFromFile cfg;
        auto r = cfg.LoadString(text, "inline");
        EXPECT_FALSE(r.is_ok()) << text;
        EXPECT_EQ(r.kind, ErrorKind::Config) << text;
        EXPECT_FALSE(cfg.strip_components.has_value()) << text;
    }
}

TEST(ConfigTest, RejectsInvalidJsonAndNonObjects) {
    StashConfigFromFile cfg;
    EXPECT_FALSE(cfg.LoadString("{not json", "inline").is_ok());
    EXPECT_FALSE(cfg.LoadString("[1, 2]", "inline").is_ok());
}

TEST(ConfigTest, LoadsFromFile) {
    testutil::TemporaryDirectory tmp;
    const auto path = std::filesystem::path(tmp.Path()) / "stashkit.conf";
    testutil::WriteFile(path, R"({"StripComponents": 2})");

    StashConfigFromFile cfg;
    auto r = cfg.LoadFile(path.string());
    ASSERT_TRUE(r.is_ok()) << r.msg;
    EXPECT_EQ(cfg.strip_components, 2U);
}

TEST(ConfigTest, MissingFileIsConfigError) {
    testutil::TemporaryDirectory tmp;
    StashConfigFromFile cfg;
    auto r = cfg.LoadFile(tmp.Path() + "/absent.conf");
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.kind, ErrorKind::Config);
}

} // namespace stash::config
