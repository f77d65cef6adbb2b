#include <gtest/gtest.h>
#include "config.h"
#include "shepherd/replay_buffer.h"
#include "test_helpers.h"
#include "temp_dir.h"
#include <fstream>
#include <cstdlib>
#include <unistd.h>

// Test fixture for Config tests
class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir = std::make_unique<test_helpers::TempDir>("config_test_");
        ASSERT_TRUE(temp_dir->valid());
    }

    void TearDown() override {
        temp_dir.reset();
    }

    std::string write_config(const std::string& content) {
        std::string path = temp_dir->file_path("config.json");
        EXPECT_TRUE(test_helpers::write_file(path, content));
        return path;
    }

    std::unique_ptr<test_helpers::TempDir> temp_dir;
};

// =============================================================================
// Defaults
// =============================================================================

TEST_F(ConfigTest, Defaults) {
    Config cfg;
    EXPECT_EQ(cfg.replay_buffer_bytes, 1024u * 1024);
    EXPECT_EQ(cfg.restart_delay_ms, 2000);
    EXPECT_EQ(cfg.max_restarts, 50);
    EXPECT_EQ(cfg.restart_reset_after_ms, 300000);
    EXPECT_EQ(cfg.cols, 80);
    EXPECT_EQ(cfg.rows, 24);
    EXPECT_EQ(cfg.log_level, "info");
    EXPECT_TRUE(cfg.log_file.empty());
    EXPECT_NO_THROW(cfg.validate());
}

TEST_F(ConfigTest, SocketDirFromRuntimeDir) {
    test_helpers::ScopedEnv env("XDG_RUNTIME_DIR", "/run/user/4242");
    EXPECT_EQ(Config::get_default_socket_dir(), "/run/user/4242/tower");
}

TEST_F(ConfigTest, SocketDirFallsBackToTmp) {
    test_helpers::ScopedEnv env("XDG_RUNTIME_DIR", "");
    EXPECT_EQ(Config::get_default_socket_dir(), "/tmp/tower-" + std::to_string(getuid()));
}

TEST_F(ConfigTest, ConfigPathHonorsXdg) {
    test_helpers::ScopedEnv env("XDG_CONFIG_HOME", temp_dir->path());
    EXPECT_EQ(Config::get_default_config_path(), temp_dir->path() + "/tower/config.json");
}

TEST_F(ConfigTest, ShepherdLogPathHonorsXdgState) {
    test_helpers::ScopedEnv env("XDG_STATE_HOME", "/var/state");
    EXPECT_EQ(Config::get_default_shepherd_log_path(), "/var/state/tower/shepherd.log");
}

TEST_F(ConfigTest, HomeDirectoryFromEnv) {
    test_helpers::ScopedEnv env("HOME", "/home/towertest");
    EXPECT_EQ(Config::get_home_directory(), "/home/towertest");
}

// =============================================================================
// Loading
// =============================================================================

TEST_F(ConfigTest, LoadOverridesFields) {
    std::string path = write_config(R"({
        "socket_dir": "/tmp/sockets",
        "shepherd_path": "/opt/tower/bin/shepherd",
        "log_level": "debug",
        "replay_buffer_bytes": 4096,
        "restart_delay_ms": 250,
        "max_restarts": 3,
        "cols": 132,
        "rows": 50
    })");

    Config cfg;
    cfg.set_config_path(path);
    cfg.load();

    EXPECT_EQ(cfg.socket_dir, "/tmp/sockets");
    EXPECT_EQ(cfg.shepherd_path, "/opt/tower/bin/shepherd");
    EXPECT_EQ(cfg.log_level, "debug");
    EXPECT_EQ(cfg.replay_buffer_bytes, 4096u);
    EXPECT_EQ(cfg.restart_delay_ms, 250);
    EXPECT_EQ(cfg.max_restarts, 3);
    EXPECT_EQ(cfg.cols, 132);
    EXPECT_EQ(cfg.rows, 50);
    // Untouched keys keep their defaults
    EXPECT_EQ(cfg.restart_reset_after_ms, 300000);
}

TEST_F(ConfigTest, MissingDefaultFileUsesDefaults) {
    test_helpers::ScopedEnv env("XDG_CONFIG_HOME", temp_dir->path());
    Config cfg;
    EXPECT_NO_THROW(cfg.load());
    EXPECT_EQ(cfg.max_restarts, 50);
}

TEST_F(ConfigTest, MissingExplicitFileThrows) {
    Config cfg;
    cfg.set_config_path(temp_dir->file_path("nope.json"));
    EXPECT_THROW(cfg.load(), ConfigError);
}

TEST_F(ConfigTest, InvalidJsonThrows) {
    Config cfg;
    cfg.set_config_path(write_config("{ \"max_restarts\": "));
    EXPECT_THROW(cfg.load(), ConfigError);
}

TEST_F(ConfigTest, WrongTypeThrows) {
    Config cfg;
    cfg.set_config_path(write_config(R"({"max_restarts": "many"})"));
    EXPECT_THROW(cfg.load(), ConfigError);
}

// =============================================================================
// Validation
// =============================================================================

TEST_F(ConfigTest, ValidateRejectsNegativeRestartValues) {
    Config cfg;
    cfg.max_restarts = -1;
    EXPECT_THROW(cfg.validate(), ConfigError);

    cfg = Config();
    cfg.restart_delay_ms = -5;
    EXPECT_THROW(cfg.validate(), ConfigError);
}

TEST_F(ConfigTest, ValidateRejectsBadTerminalSize) {
    Config cfg;
    cfg.cols = 0;
    EXPECT_THROW(cfg.validate(), ConfigError);

    cfg = Config();
    cfg.rows = 70000;
    EXPECT_THROW(cfg.validate(), ConfigError);
}

TEST_F(ConfigTest, ValidateRejectsEmptyReplay) {
    Config cfg;
    cfg.replay_buffer_bytes = 0;
    EXPECT_THROW(cfg.validate(), ConfigError);
}

TEST_F(ConfigTest, ValidateBoundsReplayToOneFrame) {
    Config cfg;
    cfg.replay_buffer_bytes = MAX_REPLAY_BYTES;
    EXPECT_NO_THROW(cfg.validate());

    cfg.replay_buffer_bytes = MAX_REPLAY_BYTES + 1;
    EXPECT_THROW(cfg.validate(), ConfigError);

    cfg.replay_buffer_bytes = MAX_FRAME_SIZE;
    EXPECT_THROW(cfg.validate(), ConfigError);
}

TEST_F(ConfigTest, ValidateRejectsZeroTimeout) {
    Config cfg;
    cfg.connect_timeout_ms = 0;
    EXPECT_THROW(cfg.validate(), ConfigError);
}
