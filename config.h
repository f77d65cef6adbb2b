#pragma once

#include <string>
#include <stdexcept>
#include <nlohmann/json.hpp>

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

class Config {
public:
    Config();

    // Load configuration from $XDG_CONFIG_HOME/tower/config.json
    void load();

    // Validation
    void validate() const;

    // Get user's home directory (HOME env var first, then getpwuid)
    static std::string get_home_directory();

    // Get default config path (XDG-compliant)
    static std::string get_default_config_path();

    // Runtime directory for shepherd sockets: $XDG_RUNTIME_DIR/tower or /tmp/tower-<uid>
    static std::string get_default_socket_dir();

    // Well-known log location for detached shepherd daemons
    static std::string get_default_shepherd_log_path();

    // shepherd binary next to the running executable, else bare name for PATH lookup
    static std::string get_default_shepherd_path();

    // Set custom config file path (for command-line override)
    void set_config_path(const std::string& config_path) { custom_config_path_ = config_path; }

    // Public configuration variables
    std::string socket_dir;
    std::string shepherd_path;
    std::string log_file;
    std::string shepherd_log_file;
    std::string log_level;
    size_t replay_buffer_bytes;
    int restart_delay_ms;
    int max_restarts;
    int restart_reset_after_ms;
    int socket_wait_timeout_ms;
    int connect_timeout_ms;
    int probe_timeout_ms;
    int kill_timeout_ms;
    int cols;
    int rows;
    nlohmann::json json;  // Parsed config JSON

private:
    std::string get_config_path() const;
    void set_defaults();

    std::string custom_config_path_;  // Custom config file path (optional)
};
