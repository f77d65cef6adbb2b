#include "tower.h"
#include "config.h"
#include "shepherd/replay_buffer.h"

#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <climits>
#include <pwd.h>
#include <unistd.h>

using json = nlohmann::json;

Config::Config() {
    set_defaults();
}

void Config::set_defaults() {
    socket_dir = get_default_socket_dir();
    shepherd_path = get_default_shepherd_path();
    log_file = "";  // Empty = console only
    shepherd_log_file = get_default_shepherd_log_path();
    log_level = "info";

    // 1 MiB of recent PTY output kept for reconnect replay
    replay_buffer_bytes = 1024 * 1024;

    // Auto-restart defaults
    restart_delay_ms = 2000;
    max_restarts = 50;
    restart_reset_after_ms = 300000;  // 5 minutes

    socket_wait_timeout_ms = 5000;
    connect_timeout_ms = 5000;
    probe_timeout_ms = 2000;
    kill_timeout_ms = 5000;

    // Standard VT100 size
    cols = 80;
    rows = 24;
}

std::string Config::get_home_directory() {
    const char* home = getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home);
    }

    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) {
        return std::string(pw->pw_dir);
    }

    throw ConfigError("Unable to determine home directory");
}

std::string Config::get_default_config_path() {
    std::string config_home;
    const char* xdg_config = getenv("XDG_CONFIG_HOME");
    if (xdg_config && xdg_config[0] != '\0') {
        config_home = xdg_config;
    } else {
        config_home = get_home_directory() + "/.config";
    }
    return config_home + "/tower/config.json";
}

std::string Config::get_default_socket_dir() {
    const char* runtime_dir = getenv("XDG_RUNTIME_DIR");
    if (runtime_dir && runtime_dir[0] != '\0') {
        return std::string(runtime_dir) + "/tower";
    }
    return "/tmp/tower-" + std::to_string(getuid());
}

std::string Config::get_default_shepherd_log_path() {
    const char* xdg_state = getenv("XDG_STATE_HOME");
    if (xdg_state && xdg_state[0] != '\0') {
        return std::string(xdg_state) + "/tower/shepherd.log";
    }
    try {
        return get_home_directory() + "/.local/state/tower/shepherd.log";
    } catch (const ConfigError&) {
        return "/tmp/tower-" + std::to_string(getuid()) + "-shepherd.log";
    }
}

std::string Config::get_default_shepherd_path() {
    char buf[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len > 0) {
        buf[len] = '\0';
        std::filesystem::path candidate = std::filesystem::path(buf).parent_path() / "shepherd";
        if (access(candidate.c_str(), X_OK) == 0) {
            return candidate.string();
        }
    }
    return "shepherd";
}

std::string Config::get_config_path() const {
    if (!custom_config_path_.empty()) {
        return custom_config_path_;
    }
    return get_default_config_path();
}

void Config::load() {
    std::string config_path = get_config_path();

    LOG_DEBUG("Loading config from: " + config_path);

    if (!std::filesystem::exists(config_path)) {
        // An explicit --config that does not exist is an error; the default path is optional
        if (!custom_config_path_.empty()) {
            throw ConfigError("Config file not found: " + config_path);
        }
        LOG_DEBUG("Config file not found, using defaults: " + config_path);
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw ConfigError("Failed to open config file: " + config_path);
    }

    try {
        file >> json;

        if (json.contains("socket_dir")) {
            socket_dir = json["socket_dir"].get<std::string>();
        }
        if (json.contains("shepherd_path")) {
            shepherd_path = json["shepherd_path"].get<std::string>();
        }
        if (json.contains("log_file")) {
            log_file = json["log_file"].get<std::string>();
        }
        if (json.contains("shepherd_log_file")) {
            shepherd_log_file = json["shepherd_log_file"].get<std::string>();
        }
        if (json.contains("log_level")) {
            log_level = json["log_level"].get<std::string>();
        }
        if (json.contains("replay_buffer_bytes")) {
            replay_buffer_bytes = json["replay_buffer_bytes"].get<size_t>();
        }

        restart_delay_ms = json.value("restart_delay_ms", restart_delay_ms);
        max_restarts = json.value("max_restarts", max_restarts);
        restart_reset_after_ms = json.value("restart_reset_after_ms", restart_reset_after_ms);
        socket_wait_timeout_ms = json.value("socket_wait_timeout_ms", socket_wait_timeout_ms);
        connect_timeout_ms = json.value("connect_timeout_ms", connect_timeout_ms);
        probe_timeout_ms = json.value("probe_timeout_ms", probe_timeout_ms);
        kill_timeout_ms = json.value("kill_timeout_ms", kill_timeout_ms);
        cols = json.value("cols", cols);
        rows = json.value("rows", rows);
    } catch (const json::exception& e) {
        throw ConfigError("Invalid config file " + config_path + ": " + e.what());
    }

    LOG_DEBUG("Config loaded, socket_dir=" + socket_dir);
}

void Config::validate() const {
    if (socket_dir.empty()) {
        throw ConfigError("socket_dir cannot be empty");
    }
    if (shepherd_path.empty()) {
        throw ConfigError("shepherd_path cannot be empty");
    }
    if (replay_buffer_bytes == 0) {
        throw ConfigError("replay_buffer_bytes must be positive");
    }
    if (replay_buffer_bytes > MAX_REPLAY_BYTES) {
        throw ConfigError("replay_buffer_bytes cannot exceed " + std::to_string(MAX_REPLAY_BYTES));
    }
    if (restart_delay_ms < 0) {
        throw ConfigError("restart_delay_ms cannot be negative");
    }
    if (max_restarts < 0) {
        throw ConfigError("max_restarts cannot be negative");
    }
    if (restart_reset_after_ms < 0) {
        throw ConfigError("restart_reset_after_ms cannot be negative");
    }
    if (socket_wait_timeout_ms <= 0 || connect_timeout_ms <= 0 ||
        probe_timeout_ms <= 0 || kill_timeout_ms <= 0) {
        throw ConfigError("Timeouts must be positive");
    }
    if (cols < 1 || cols > 65535 || rows < 1 || rows > 65535) {
        throw ConfigError("Terminal size out of range: " + std::to_string(cols) + "x" + std::to_string(rows));
    }
}
