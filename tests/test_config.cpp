#include <gtest/gtest.h>
#include "core/config.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <unistd.h>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    std::string test_dir;
    std::string original_home;
    std::string original_xdg;
    bool had_home = false;
    bool had_xdg = false;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / ("craft-test-config-" + std::to_string(::getpid()));
        fs::create_directories(test_dir);

        const char* home = std::getenv("HOME");
        if (home) {
            had_home = true;
            original_home = home;
        }
        const char* xdg = std::getenv("XDG_CONFIG_HOME");
        if (xdg) {
            had_xdg = true;
            original_xdg = xdg;
        }
        setenv("HOME", test_dir.c_str(), 1);
        unsetenv("XDG_CONFIG_HOME");
    }

    void TearDown() override {
        if (had_home) {
            setenv("HOME", original_home.c_str(), 1);
        } else {
            unsetenv("HOME");
        }
        if (had_xdg) {
            setenv("XDG_CONFIG_HOME", original_xdg.c_str(), 1);
        }
        fs::remove_all(test_dir);
    }

    std::string write_yaml(const std::string& body) {
        std::string path = test_dir + "/custom.yaml";
        std::ofstream out(path);
        out << body;
        return path;
    }

    static bool has(const std::vector<std::string>& keys, const std::string& key) {
        return std::find(keys.begin(), keys.end(), key) != keys.end();
    }
};

TEST_F(ConfigTest, DefaultValues) {
    Config cfg;
    const auto& d = cfg.data();
    EXPECT_EQ(d.server.dir, "~/minecraft");
    EXPECT_EQ(d.server.jar_name, "server.jar");
    EXPECT_EQ(d.server.memory_min, "2G");
    EXPECT_EQ(d.server.memory_max, "4G");
    EXPECT_EQ(d.server.port, 25565);
    EXPECT_EQ(d.server.stop_command, "stop");
    EXPECT_EQ(d.server.readiness, "port");
    EXPECT_TRUE(d.server.autostart);
    EXPECT_TRUE(d.watchdog.enabled);
    EXPECT_EQ(d.watchdog.interval, 30);
    EXPECT_EQ(d.watchdog.max_restarts, 5);
    EXPECT_EQ(d.watchdog.restart_cooldown, 300);
    EXPECT_TRUE(d.backup.on_restart);
    EXPECT_TRUE(d.backup.snapshot_command.empty());
    EXPECT_EQ(d.stats.history_size, 100);
    EXPECT_DOUBLE_EQ(d.stats.memory_percent, 80.0);
    EXPECT_EQ(d.logging.level, "info");
}

TEST_F(ConfigTest, ConfigDirUsesHome) {
    EXPECT_EQ(Config::config_dir(), test_dir + "/.config/craft-cpp");
    EXPECT_EQ(Config::config_path(), test_dir + "/.config/craft-cpp/config.yaml");
}

TEST_F(ConfigTest, ConfigDirPrefersXdg) {
    setenv("XDG_CONFIG_HOME", (test_dir + "/xdg").c_str(), 1);
    EXPECT_EQ(Config::config_dir(), test_dir + "/xdg/craft-cpp");
}

TEST_F(ConfigTest, ExpandHome) {
    EXPECT_EQ(Config::expand_home("~/minecraft"), test_dir + "/minecraft");
    EXPECT_EQ(Config::expand_home("/srv/mc"), "/srv/mc");
    EXPECT_EQ(Config::expand_home(""), "");

    Config cfg;
    EXPECT_EQ(cfg.server_dir(), test_dir + "/minecraft");
}

TEST_F(ConfigTest, LoadMissingFileKeepsDefaults) {
    Config cfg;
    EXPECT_FALSE(cfg.load());
    EXPECT_EQ(cfg.data().server.port, 25565);
}

TEST_F(ConfigTest, SaveAndLoadRoundTrip) {
    {
        Config cfg;
        auto& d = cfg.data();
        d.server.dir = "/srv/survival";
        d.server.jar_name = "paper.jar";
        d.server.memory_max = "8G";
        d.server.java_args = "-XX:+UseZGC -Dfile.encoding=UTF-8";
        d.server.autostart = false;
        d.watchdog.max_restarts = 7;
        d.watchdog.restart_on_crash = false;
        d.backup.snapshot_command = "tar czf backup-$SNAPSHOT_LABEL.tgz world";
        d.stats.connection_spike_multiplier = 3.5;
        d.logging.file = "/var/log/craft.log";
        ASSERT_TRUE(cfg.save());
    }

    EXPECT_TRUE(fs::exists(Config::config_path()));

    Config cfg;
    ASSERT_TRUE(cfg.load());
    const auto& d = cfg.data();
    EXPECT_EQ(d.server.dir, "/srv/survival");
    EXPECT_EQ(d.server.jar_name, "paper.jar");
    EXPECT_EQ(d.server.memory_max, "8G");
    EXPECT_EQ(d.server.java_args, "-XX:+UseZGC -Dfile.encoding=UTF-8");
    EXPECT_FALSE(d.server.autostart);
    EXPECT_EQ(d.watchdog.max_restarts, 7);
    EXPECT_FALSE(d.watchdog.restart_on_crash);
    EXPECT_EQ(d.backup.snapshot_command, "tar czf backup-$SNAPSHOT_LABEL.tgz world");
    EXPECT_DOUBLE_EQ(d.stats.connection_spike_multiplier, 3.5);
    EXPECT_EQ(d.logging.file, "/var/log/craft.log");
}

TEST_F(ConfigTest, PartialFileOverridesOnlyGivenKeys) {
    Config cfg(write_yaml("server:\n  port: 25570\nwatchdog:\n  interval: 15\n"));
    ASSERT_TRUE(cfg.load());
    EXPECT_EQ(cfg.data().server.port, 25570);
    EXPECT_EQ(cfg.data().watchdog.interval, 15);
    EXPECT_EQ(cfg.data().server.jar_name, "server.jar");
    EXPECT_EQ(cfg.data().watchdog.max_restarts, 5);
}

TEST_F(ConfigTest, MalformedYamlFallsBackToDefaults) {
    Config cfg(write_yaml("server: [unclosed\n  port: :::\n"));
    EXPECT_FALSE(cfg.load());
    EXPECT_EQ(cfg.data().server.port, 25565);
}

TEST_F(ConfigTest, WrongTypeKeepsDefaultForThatKey) {
    Config cfg(write_yaml("watchdog:\n  max_restarts: lots\n  interval: 20\n"));
    EXPECT_TRUE(cfg.load());
    EXPECT_EQ(cfg.data().watchdog.max_restarts, 5);
    EXPECT_EQ(cfg.data().watchdog.interval, 20);
}

TEST_F(ConfigTest, ValidateRepairsOutOfRange) {
    Config cfg(write_yaml(
        "server:\n"
        "  stop_timeout: 1\n"
        "  memory_max: 200G\n"
        "  readiness: telepathy\n"
        "watchdog:\n"
        "  interval: 1\n"
        "  max_restarts: 50\n"
        "  restart_cooldown: 10\n"
        "stats:\n"
        "  history_size: 5\n"
        "logging:\n"
        "  console_history: 10\n"));
    ASSERT_TRUE(cfg.load());

    auto repaired = cfg.validate();
    EXPECT_TRUE(has(repaired, "server.stop_timeout"));
    EXPECT_TRUE(has(repaired, "server.memory_max"));
    EXPECT_TRUE(has(repaired, "server.readiness"));
    EXPECT_TRUE(has(repaired, "watchdog.interval"));
    EXPECT_TRUE(has(repaired, "watchdog.max_restarts"));
    EXPECT_TRUE(has(repaired, "watchdog.restart_cooldown"));
    EXPECT_TRUE(has(repaired, "stats.history_size"));
    EXPECT_TRUE(has(repaired, "logging.console_history"));

    const auto& d = cfg.data();
    EXPECT_EQ(d.server.stop_timeout, 10);
    EXPECT_EQ(d.server.memory_max, "4G");
    EXPECT_EQ(d.server.readiness, "port");
    EXPECT_EQ(d.watchdog.interval, 30);
    EXPECT_EQ(d.watchdog.max_restarts, 5);
    EXPECT_EQ(d.watchdog.restart_cooldown, 300);
    EXPECT_EQ(d.stats.history_size, 100);
    EXPECT_EQ(d.logging.console_history, 1000);
}

TEST_F(ConfigTest, ValidateKeepsGoodValues) {
    Config cfg;
    EXPECT_TRUE(cfg.validate().empty());
}

TEST_F(ConfigTest, ValidateLowersMinAboveMax) {
    Config cfg;
    cfg.data().server.memory_min = "6G";
    cfg.data().server.memory_max = "4G";
    auto repaired = cfg.validate();
    EXPECT_TRUE(has(repaired, "server.memory_min"));
    EXPECT_EQ(cfg.data().server.memory_min, "4G");
}

TEST_F(ConfigTest, ValidMemory) {
    EXPECT_TRUE(Config::valid_memory("2G"));
    EXPECT_TRUE(Config::valid_memory("0.5G"));
    EXPECT_TRUE(Config::valid_memory("512M"));
    EXPECT_TRUE(Config::valid_memory("64G"));
    EXPECT_FALSE(Config::valid_memory("65G"));
    EXPECT_FALSE(Config::valid_memory("50M"));
    EXPECT_FALSE(Config::valid_memory("2"));
    EXPECT_FALSE(Config::valid_memory("G"));
    EXPECT_FALSE(Config::valid_memory("2GB"));
    EXPECT_FALSE(Config::valid_memory("abcG"));
}
