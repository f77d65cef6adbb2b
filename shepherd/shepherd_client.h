#pragma once

#include "protocol.h"
#include "connection.h"
#include "../event_loop.h"
#include <string>
#include <deque>
#include <memory>
#include <optional>
#include <functional>
#include <chrono>
#include <stdexcept>
#include <csignal>
#include <utility>

class ShepherdError : public std::runtime_error {
public:
    explicit ShepherdError(const std::string& message) : std::runtime_error(message) {}
};

/// @brief Controller-side handle to one shepherd daemon
///
/// State machine:
///   DISCONNECTED -connect-> CONNECTING -socket open-> HANDSHAKING -WELCOME-> CONNECTED
///   and any of CONNECTING/HANDSHAKING/CONNECTED -teardown-> CLOSED.
///
/// Frames that arrive before WELCOME are held in a bounded FIFO and
/// delivered, in order, right after the handshake succeeds and before any
/// later frame. Delivery starts on the loop iteration after connect()
/// returns, so handlers installed right after connect() see every frame.
/// The close handler fires on every teardown; the exit handler fires only
/// when an EXIT frame was received.
///
/// Always owned through std::shared_ptr (see create()); socket callbacks
/// hold a weak reference so a handler may drop the last owner safely.
class ShepherdClient : public std::enable_shared_from_this<ShepherdClient> {
public:
    enum class State {
        DISCONNECTED,
        CONNECTING,
        HANDSHAKING,
        CONNECTED,
        CLOSED
    };

    using DataHandler = std::function<void(const std::string& bytes)>;
    using ExitHandler = std::function<void(const ExitMessage& exit)>;
    using CloseHandler = std::function<void()>;
    using ErrorHandler = std::function<void(const std::string& message)>;
    using VersionWarningHandler = std::function<void(int client_version, int shepherd_version)>;
    using PongHandler = std::function<void()>;

    static constexpr size_t MAX_PENDING_FRAMES = 4096;

    static std::shared_ptr<ShepherdClient> create(EventLoop& loop,
                                                  int client_version = PROTOCOL_VERSION,
                                                  const std::string& client_type = CLIENT_TYPE_TOWER);
    ~ShepherdClient();

    ShepherdClient(const ShepherdClient&) = delete;
    ShepherdClient& operator=(const ShepherdClient&) = delete;

    /// @brief Connect and complete the HELLO/WELCOME handshake
    ///
    /// Services the event loop while waiting, so other sessions keep running.
    /// @throws ShepherdError on refusal, timeout, protocol error or if the
    /// shepherd speaks a newer protocol than this client
    WelcomeMessage connect(const std::string& socket_path,
                           std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

    // Commands; silently ignored unless connected
    void write(const std::string& bytes);
    void resize(int cols, int rows);
    /// Also marks the client detached so the coming close is not treated as a crash
    void kill(int signal = SIGTERM);
    void spawn(const SpawnMessage& command);
    void ping();

    /// @brief Close the socket (idempotent); fires the close handler once
    void disconnect();

    /// @brief Replay history from WELCOME, nullopt before a successful connect
    std::optional<std::string> get_replay_data() const { return replay_data; }
    std::optional<WelcomeMessage> get_welcome() const { return welcome; }

    State get_state() const { return state; }
    bool is_connected() const { return state == State::CONNECTED; }
    bool is_detached() const { return detached; }
    const std::string& get_socket_path() const { return socket_path; }
    int get_client_version() const { return client_version; }

    static const char* state_name(State state);

    // Handler slots; an empty slot means the notification is dropped
    void on_data(DataHandler handler) { data_handler = std::move(handler); }
    void on_exit(ExitHandler handler) { exit_handler = std::move(handler); }
    void on_close(CloseHandler handler) { close_handler = std::move(handler); }
    void on_error(ErrorHandler handler) { error_handler = std::move(handler); }
    void on_version_warning(VersionWarningHandler handler) { version_warning_handler = std::move(handler); }
    void on_pong(PongHandler handler) { pong_handler = std::move(handler); }

private:
    ShepherdClient(EventLoop& loop, int client_version, const std::string& client_type);

    EventLoop& loop;
    int client_version;
    std::string client_type;
    std::string socket_path;
    State state = State::DISCONNECTED;
    bool detached = false;
    std::unique_ptr<Connection> conn;

    std::deque<Frame> pending_frames;  // held until release_held()
    bool holding = false;
    std::optional<std::pair<std::string, bool>> held_close;
    std::string handshake_error;
    std::optional<WelcomeMessage> welcome;
    std::optional<std::string> replay_data;

    DataHandler data_handler;
    ExitHandler exit_handler;
    CloseHandler close_handler;
    ErrorHandler error_handler;
    VersionWarningHandler version_warning_handler;
    PongHandler pong_handler;

    void handle_frame(const Frame& frame);
    void handle_welcome(const Frame& frame);
    void release_held();
    void deliver(const Frame& frame);
    void handle_socket_closed(const std::string& reason, bool protocol_error);
    void fail_handshake(const std::string& message);
    void emit_error(const std::string& message);
    void teardown();
    void send(const std::string& bytes);
};
