#include <gtest/gtest.h>
#include <toolbridge/util/config.hpp>
#include <sstream>

using namespace toolbridge;

TEST(Config, Defaults) {
    Config cfg;
    EXPECT_FALSE(cfg.git_executable.has_value());
    EXPECT_EQ(cfg.probe_timeout.count(), 5000);
    EXPECT_EQ(cfg.status_timeout.count(), 5000);
    EXPECT_EQ(cfg.push_timeout.count(), 15000);
    EXPECT_EQ(cfg.network_timeout.count(), 30000);
    EXPECT_EQ(cfg.gradle_console, ConsoleMode::Plain);
    EXPECT_EQ(cfg.log_level, log::Level::Warn);
}

TEST(Config, ParsesKeyValueLines) {
    std::istringstream in(
        "# comment\n"
        "\n"
        "git_executable = /opt/git/bin/git\n"
        "status_timeout_ms=2500\n"
        "network_timeout_ms=60000\n"
        "gradle_offline=on\n"
        "gradle_console=quiet\n"
        "log_level=debug\n");
    Config cfg = parse_config(in);
    EXPECT_EQ(cfg.git_executable.value_or(""), "/opt/git/bin/git");
    EXPECT_EQ(cfg.status_timeout.count(), 2500);
    EXPECT_EQ(cfg.network_timeout.count(), 60000);
    EXPECT_TRUE(cfg.gradle_offline);
    EXPECT_EQ(cfg.gradle_console, ConsoleMode::Quiet);
    EXPECT_EQ(cfg.log_level, log::Level::Debug);

    auto t = cfg.git_timeouts();
    EXPECT_EQ(t.local.count(), 2500);
    EXPECT_EQ(t.network.count(), 60000);
    EXPECT_EQ(t.push.count(), 15000);
}

TEST(Config, BadValuesKeepDefaults) {
    Config cfg;
    EXPECT_FALSE(apply_setting(cfg, "probe_timeout_ms", "soon"));
    EXPECT_FALSE(apply_setting(cfg, "probe_timeout_ms", "-5"));
    EXPECT_FALSE(apply_setting(cfg, "gradle_console", "fancy"));
    EXPECT_FALSE(apply_setting(cfg, "no_such_key", "1"));
    EXPECT_EQ(cfg.probe_timeout.count(), 5000);
    EXPECT_EQ(cfg.gradle_console, ConsoleMode::Plain);
    EXPECT_TRUE(apply_setting(cfg, "gradle_offline", "false"));
    EXPECT_FALSE(cfg.gradle_offline);
}

TEST(Config, MissingFileGivesDefaults) {
    Config cfg = load_config("/nonexistent/toolbridge/rc");
    EXPECT_EQ(cfg.network_timeout.count(), 30000);
    EXPECT_EQ(load_config("").probe_timeout.count(), 5000);
}

TEST(Log, LevelNames) {
    EXPECT_EQ(log::parse_level("info"), log::Level::Info);
    EXPECT_EQ(log::parse_level("error"), log::Level::Error);
    EXPECT_FALSE(log::parse_level("loud").has_value());
    auto saved = log::level();
    log::set_level(log::Level::Error);
    EXPECT_FALSE(log::enabled(log::Level::Warn));
    EXPECT_TRUE(log::enabled(log::Level::Error));
    log::set_level(saved);
}
