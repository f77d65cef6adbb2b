#pragma once

#include "event_loop.h"
#include "config.h"
#include "shepherd/shepherd_client.h"
#include "shepherd/shepherd_process.h"
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <csignal>
#include <sys/types.h>

class SessionError : public std::runtime_error {
public:
    explicit SessionError(const std::string& message) : std::runtime_error(message) {}
};

/// @brief Kinds of asynchronous session failure reported to the observer
enum class SessionErrorKind {
    DISCONNECTED,        // shepherd vanished without sending EXIT
    RESTARTS_EXHAUSTED,  // worker kept dying, restart budget spent
    CLIENT_ERROR         // transport or protocol fault on an established session
};

const char* session_error_kind_name(SessionErrorKind kind);

/// @brief Receives lifecycle notices for every managed session
/// Callbacks run on the event loop thread. Default implementations ignore the notice.
class SessionObserver {
public:
    virtual ~SessionObserver() = default;

    /// @brief Worker exited (the session may still be restarted afterwards)
    virtual void on_session_exit(const std::string& id, const ExitMessage& exit) {}

    /// @brief A SPAWN was sent to relaunch the worker
    /// @param restart_count Restarts performed since the counter last reset
    virtual void on_session_restart(const std::string& id, int restart_count) {}

    virtual void on_session_error(const std::string& id, SessionErrorKind kind, const std::string& message) {}
};

/// @brief Parameters for create_session(); unset policy values come from Config
struct SessionOptions {
    std::string id;
    std::string command;
    std::vector<std::string> args;
    std::string cwd;
    std::map<std::string, std::string> env;
    int cols = 0;  // 0 = config default
    int rows = 0;
    bool restart_on_exit = false;
    std::optional<int> restart_delay_ms;
    std::optional<int> max_restarts;
    std::optional<int> restart_reset_after_ms;
};

/// @brief Snapshot of one managed session
struct SessionInfo {
    pid_t pid = -1;              // shepherd daemon pid
    int64_t start_time = 0;      // shepherd start, epoch ms
    std::string socket_path;
    int restart_count = 0;
    int64_t created_at = 0;      // when this controller registered it, epoch ms
    bool restart_on_exit = false;
};

/// @brief Owns every shepherd session of this controller
///
/// The only component that launches shepherd daemons, allocates socket
/// paths and decides whether a dead worker is relaunched. Everything runs
/// on one EventLoop; the blocking-looking calls (create, reconnect, kill,
/// cleanup) keep servicing that loop while they wait.
class SessionManager {
public:
    /// @param loop Event loop all clients and timers run on (not owned)
    /// @param config Paths, timeouts and restart defaults (copied)
    SessionManager(EventLoop& loop, const Config& config);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /// @brief Observer for exit/restart/error notices (not owned, may be null)
    void set_observer(SessionObserver* observer) { this->observer = observer; }

    /// @brief Launch a shepherd for a new worker and connect to it
    /// @throws SessionError / ShepherdError after killing the shepherd and
    /// removing its socket; a failed call never leaves a process behind
    SessionInfo create_session(const SessionOptions& options);

    /// @brief Re-attach to a shepherd that outlived a previous controller
    /// @param pid,start_time When both are known, guard against PID reuse
    /// @return Connected client; its get_replay_data() seeds the UI
    /// @throws SessionError if the shepherd is gone (its stale socket is removed)
    std::shared_ptr<ShepherdClient> reconnect_session(const std::string& id, const std::string& socket_path,
                                                      std::optional<pid_t> pid = std::nullopt,
                                                      std::optional<int64_t> start_time = std::nullopt);

    /// @brief Intentionally terminate a session and its shepherd
    /// @return false if no such session
    bool kill_session(const std::string& id, int signal = SIGTERM);

    std::map<std::string, std::shared_ptr<ShepherdClient>> list_sessions() const;
    std::optional<SessionInfo> get_session_info(const std::string& id) const;
    std::shared_ptr<ShepherdClient> get_client(const std::string& id) const;
    size_t session_count() const { return sessions.size(); }

    /// @brief Detach from every session, leaving the shepherds running
    void shutdown();

    /// @brief Delete socket files under socket_dir that nothing is listening on
    /// @return Number of files deleted
    int cleanup_stale_sockets(const std::string& socket_dir);
    int cleanup_stale_sockets() { return cleanup_stale_sockets(config.socket_dir); }

    std::string socket_path_for(const std::string& id) const;

    static bool is_valid_session_id(const std::string& id);

    /// @brief Start time of a process in epoch ms, nullopt if unknown
    static std::optional<int64_t> get_process_start_time(pid_t pid) noexcept;

    // Start times further apart than this mean the pid was reused
    static constexpr int64_t START_TIME_TOLERANCE_MS = 2000;

private:
    struct Session {
        std::string id;
        std::shared_ptr<ShepherdClient> client;
        pid_t pid = -1;
        int64_t start_time = 0;
        std::string socket_path;
        int64_t created_at = 0;
        SpawnMessage command;

        bool restart_on_exit = false;
        int restart_delay_ms = 0;
        int max_restarts = 0;
        int restart_reset_after_ms = 0;
        int restart_count = 0;
        EventLoop::TimerId restart_timer = 0;
        EventLoop::TimerId reset_timer = 0;
    };

    EventLoop& loop;
    Config config;
    SessionObserver* observer = nullptr;
    std::map<std::string, std::unique_ptr<Session>> sessions;
    // Client callbacks hold a weak reference; expires with the manager
    std::shared_ptr<bool> alive;

    void ensure_socket_dir(const std::string& dir) const;
    pid_t launch_shepherd(const ShepherdLaunchConfig& launch, int& info_fd);
    nlohmann::json read_startup_info(int info_fd, std::chrono::milliseconds timeout);
    bool wait_for_socket(const std::string& path, std::chrono::milliseconds timeout);
    bool wait_for_exit(pid_t pid, std::chrono::milliseconds timeout);
    void check_socket_mode(const std::string& path) const;

    void attach_handlers(Session& session);
    void handle_exit(const std::string& id, const ShepherdClient* client, const ExitMessage& exit);
    void handle_close(const std::string& id, const ShepherdClient* client);
    void handle_error(const std::string& id, const ShepherdClient* client, const std::string& message);
    Session* find_session(const std::string& id, const ShepherdClient* client);

    void schedule_restart(Session& session);
    void send_restart(const std::string& id);
    void remove_dead_session(const std::string& id);
    void cancel_timers(Session& session);
    void notify_error(const std::string& id, SessionErrorKind kind, const std::string& message);
};
