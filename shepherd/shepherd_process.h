#pragma once

#include "protocol.h"
#include "connection.h"
#include "pty_backend.h"
#include "replay_buffer.h"
#include "../event_loop.h"
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <functional>
#include <stdexcept>
#include <nlohmann/json.hpp>

class ShepherdProcessError : public std::runtime_error {
public:
    explicit ShepherdProcessError(const std::string& message) : std::runtime_error(message) {}
};

/// @brief Launch configuration passed to the shepherd daemon as one JSON argument
struct ShepherdLaunchConfig {
    SpawnMessage command;
    int cols = 80;
    int rows = 24;
    std::string socket_path;
    size_t replay_buffer_bytes = DEFAULT_REPLAY_BYTES;

    nlohmann::json to_json() const;
    /// @throws ShepherdProcessError on missing or invalid fields
    static ShepherdLaunchConfig from_json(const nlohmann::json& j);
};

/// @brief Core of the shepherd daemon: one worker on a PTY, one listening socket
///
/// Accepts any number of connections. Each must open with HELLO and is
/// answered with WELCOME carrying the replay history; from then on worker
/// output is broadcast as DATA. A "tower" client has full control, a
/// "terminal" client may only WRITE and RESIZE. A new tower HELLO replaces
/// the previous tower connection.
///
/// The worker is never restarted here on its own; only an explicit SPAWN
/// relaunches it. A client that handshakes after the worker died gets the
/// stored EXIT right after WELCOME. SIGCHLD handling is the caller's job: call
/// handle_child_exit() whenever a child may have exited.
class ShepherdProcess {
public:
    using ExitHandler = std::function<void(const WorkerExit& exit)>;

    ShepherdProcess(EventLoop& loop, PtyFactory pty_factory, const std::string& socket_path,
                    size_t replay_buffer_bytes = DEFAULT_REPLAY_BYTES,
                    int protocol_version = PROTOCOL_VERSION);
    ~ShepherdProcess();

    ShepherdProcess(const ShepherdProcess&) = delete;
    ShepherdProcess& operator=(const ShepherdProcess&) = delete;

    /// @brief Listen on the socket, then spawn the worker
    /// @throws ShepherdProcessError if the socket cannot be bound
    /// @throws PtyError if the initial worker cannot be spawned
    void start(const SpawnMessage& command, int cols, int rows);

    /// @brief Reap exited workers; drains output and broadcasts EXIT for the current one
    void handle_child_exit();

    /// @brief Terminate the worker, drop every connection, remove the socket
    void shutdown();

    void set_exit_handler(ExitHandler handler) { exit_handler = std::move(handler); }

    int64_t get_start_time() const { return start_time; }
    pid_t get_worker_pid() const;
    bool has_exited() const { return exited; }
    std::string get_replay_data() const { return replay.snapshot(); }
    size_t connection_count() const;
    int get_cols() const { return cols; }
    int get_rows() const { return rows; }
    const std::string& get_socket_path() const { return socket_path; }

    // Connections with more unsent output than this are dropped
    static constexpr size_t MAX_PENDING_OUTPUT = 8 * 1024 * 1024;

private:
    struct Client {
        std::unique_ptr<Connection> conn;
        bool handshaken = false;
        std::string client_type;
    };

    EventLoop& loop;
    PtyFactory pty_factory;
    std::string socket_path;
    int protocol_version;
    int listen_fd = -1;
    int64_t start_time;
    int cols = 80;
    int rows = 24;

    std::unique_ptr<PtyBackend> pty;
    std::vector<std::unique_ptr<PtyBackend>> retired;  // replaced workers awaiting reap
    bool exited = true;
    std::optional<WorkerExit> last_exit;  // repeated to clients that connect after the exit
    std::string pending_input;
    ReplayBuffer replay;

    std::map<uint64_t, Client> clients;
    uint64_t next_client_id = 1;
    ExitHandler exit_handler;

    void listen_socket();
    void accept_connections();
    void drop_client(uint64_t id, const std::string& reason);

    void handle_frame(uint64_t id, const Frame& frame);
    void handle_hello(uint64_t id, const Frame& frame);
    void handle_resize(uint64_t id, const Frame& frame);
    void handle_kill(uint64_t id, const Frame& frame);
    void handle_spawn(uint64_t id, const Frame& frame);
    void handle_write(const std::string& bytes);

    void spawn_worker(const SpawnMessage& command);
    void retire_worker();
    void watch_worker();
    void handle_worker_events(PtyBackend* backend, short revents);
    bool read_worker_output();
    void flush_input();
    void finish_worker(const WorkerExit& exit);

    void broadcast(const std::string& frame);
};
