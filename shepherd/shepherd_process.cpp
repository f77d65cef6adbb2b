#include "../tower.h"
#include "shepherd_process.h"
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>
#include <csignal>
#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>

using json = nlohmann::json;

// ============================================================================
// Launch config
// ============================================================================

json ShepherdLaunchConfig::to_json() const {
    json j = command.to_json();
    j["cols"] = cols;
    j["rows"] = rows;
    j["socketPath"] = socket_path;
    j["replayBufferBytes"] = replay_buffer_bytes;
    return j;
}

ShepherdLaunchConfig ShepherdLaunchConfig::from_json(const json& j) {
    ShepherdLaunchConfig config;
    try {
        config.command = SpawnMessage::from_json(j);
        config.cols = j.value("cols", 80);
        config.rows = j.value("rows", 24);
        config.socket_path = j.at("socketPath").get<std::string>();
        config.replay_buffer_bytes = j.value("replayBufferBytes", DEFAULT_REPLAY_BYTES);
    } catch (const json::exception& e) {
        throw ShepherdProcessError(std::string("Invalid launch config: ") + e.what());
    } catch (const ProtocolError& e) {
        throw ShepherdProcessError(std::string("Invalid launch config: ") + e.what());
    }
    if (config.socket_path.empty()) {
        throw ShepherdProcessError("Invalid launch config: socketPath is empty");
    }
    if (config.cols < 1 || config.cols > 65535 || config.rows < 1 || config.rows > 65535) {
        throw ShepherdProcessError("Invalid launch config: terminal size out of range");
    }
    if (config.replay_buffer_bytes == 0 || config.replay_buffer_bytes > MAX_REPLAY_BYTES) {
        throw ShepherdProcessError("Invalid launch config: replayBufferBytes out of range");
    }
    return config;
}

// ============================================================================
// ShepherdProcess
// ============================================================================

ShepherdProcess::ShepherdProcess(EventLoop& loop, PtyFactory pty_factory, const std::string& socket_path,
                                 size_t replay_buffer_bytes, int protocol_version)
    : loop(loop)
    , pty_factory(std::move(pty_factory))
    , socket_path(socket_path)
    , protocol_version(protocol_version)
    , start_time(tower::get_current_time_ms())
    , replay(replay_buffer_bytes) {
}

ShepherdProcess::~ShepherdProcess() {
    clients.clear();
    if (pty && pty->master_fd() >= 0) {
        loop.unwatch(pty->master_fd());
    }
    if (listen_fd >= 0) {
        loop.unwatch(listen_fd);
        close(listen_fd);
    }
}

void ShepherdProcess::start(const SpawnMessage& command, int cols, int rows) {
    this->cols = cols;
    this->rows = rows;
    start_time = tower::get_current_time_ms();

    listen_socket();

    try {
        spawn_worker(command);
    } catch (const PtyError&) {
        loop.unwatch(listen_fd);
        close(listen_fd);
        listen_fd = -1;
        unlink(socket_path.c_str());
        throw;
    }
}

void ShepherdProcess::listen_socket() {
    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    if (socket_path.size() >= sizeof(addr.sun_path)) {
        throw ShepherdProcessError("Socket path too long: " + socket_path);
    }
    strncpy(addr.sun_path, socket_path.c_str(), sizeof(addr.sun_path) - 1);

    // Only ever remove a previous socket, never some other file
    struct stat st;
    if (lstat(socket_path.c_str(), &st) == 0 && S_ISSOCK(st.st_mode)) {
        unlink(socket_path.c_str());
    }

    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw ShepherdProcessError(tower::errno_string("socket", errno));
    }

    if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        close(fd);
        throw ShepherdProcessError(tower::errno_string("bind " + socket_path, err));
    }

    // Restrict socket to owner only
    if (chmod(socket_path.c_str(), 0600) < 0) {
        int err = errno;
        close(fd);
        unlink(socket_path.c_str());
        throw ShepherdProcessError(tower::errno_string("chmod " + socket_path, err));
    }

    if (listen(fd, 16) < 0) {
        int err = errno;
        close(fd);
        unlink(socket_path.c_str());
        throw ShepherdProcessError(tower::errno_string("listen", err));
    }

    listen_fd = fd;
    loop.watch(listen_fd, POLLIN, [this](short) {
        accept_connections();
    });
    LOG_INFO("Listening on " + socket_path);
}

void ShepherdProcess::accept_connections() {
    while (listen_fd >= 0) {
        int fd = accept4(listen_fd, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (fd < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                LOG_WARN(tower::errno_string("accept", errno));
            }
            return;
        }

        uint64_t id = next_client_id++;
        Client& client = clients[id];
        client.conn = std::make_unique<Connection>(loop, fd);
        client.conn->start(
            [this, id](const Frame& frame) {
                handle_frame(id, frame);
            },
            [this, id](const std::string& reason, bool protocol_error) {
                if (protocol_error) {
                    LOG_WARN("Connection " + std::to_string(id) + " protocol error: " + reason);
                } else {
                    dprintf(1, "connection %llu closed", static_cast<unsigned long long>(id));
                }
                clients.erase(id);
            });
        LOG_DEBUG("Connection " + std::to_string(id) + " accepted");
    }
}

void ShepherdProcess::drop_client(uint64_t id, const std::string& reason) {
    auto it = clients.find(id);
    if (it == clients.end()) {
        return;
    }
    LOG_WARN("Dropping connection " + std::to_string(id) + ": " + reason);
    clients.erase(it);
}

size_t ShepherdProcess::connection_count() const {
    size_t count = 0;
    for (const auto& entry : clients) {
        if (entry.second.handshaken) {
            count++;
        }
    }
    return count;
}

pid_t ShepherdProcess::get_worker_pid() const {
    return pty ? pty->pid() : -1;
}

// ----------------------------------------------------------------------------
// Frame dispatch
// ----------------------------------------------------------------------------

void ShepherdProcess::handle_frame(uint64_t id, const Frame& frame) {
    auto it = clients.find(id);
    if (it == clients.end()) {
        return;
    }
    Client& client = it->second;

    if (!client.handshaken) {
        if (frame.is(FrameType::HELLO)) {
            handle_hello(id, frame);
        }
        return;
    }

    if (!is_known_frame_type(frame.type)) {
        dprintf(2, "ignoring unknown frame type 0x%02x", frame.type);
        return;
    }

    bool is_tower = client.client_type == CLIENT_TYPE_TOWER;

    switch (static_cast<FrameType>(frame.type)) {
        case FrameType::WRITE:
            handle_write(frame.payload);
            break;
        case FrameType::RESIZE:
            handle_resize(id, frame);
            break;
        case FrameType::KILL:
            if (is_tower) {
                handle_kill(id, frame);
            }
            break;
        case FrameType::SPAWN:
            if (is_tower) {
                handle_spawn(id, frame);
            }
            break;
        case FrameType::PING:
            client.conn->send(encode_pong());
            break;
        default:
            break;
    }
}

void ShepherdProcess::handle_hello(uint64_t id, const Frame& frame) {
    HelloMessage hello;
    try {
        hello = decode_hello(frame.payload);
    } catch (const ProtocolError& e) {
        drop_client(id, e.what());
        return;
    }
    LOG_INFO("HELLO from connection " + std::to_string(id) + ": version=" +
             std::to_string(hello.version) + " clientType=" + hello.client_type);

    if (hello.client_type == CLIENT_TYPE_TOWER) {
        std::vector<uint64_t> replaced;
        for (const auto& entry : clients) {
            if (entry.first != id && entry.second.handshaken &&
                entry.second.client_type == CLIENT_TYPE_TOWER) {
                replaced.push_back(entry.first);
            }
        }
        for (uint64_t old_id : replaced) {
            LOG_INFO("Replacing tower connection " + std::to_string(old_id));
            clients.erase(old_id);
        }
    }

    auto it = clients.find(id);
    if (it == clients.end()) {
        return;
    }
    it->second.handshaken = true;
    it->second.client_type = hello.client_type;

    WelcomeMessage welcome;
    welcome.version = protocol_version;
    welcome.pid = get_worker_pid();
    welcome.shepherd_pid = getpid();
    welcome.start_time = start_time;
    welcome.cols = cols;
    welcome.rows = rows;
    welcome.replay = replay.snapshot();
    try {
        it->second.conn->send(encode_welcome(welcome));
    } catch (const ProtocolError& e) {
        drop_client(id, std::string("cannot encode WELCOME: ") + e.what());
        return;
    }
    dprintf(1, "WELCOME sent: pid=%d replay=%zu", welcome.pid, welcome.replay.size());

    if (exited && last_exit) {
        ExitMessage msg;
        msg.code = last_exit->code;
        msg.signal = last_exit->signal;
        it->second.conn->send(encode_exit(msg));
    }
}

void ShepherdProcess::handle_resize(uint64_t id, const Frame& frame) {
    ResizeMessage msg;
    try {
        msg = decode_resize(frame.payload);
    } catch (const ProtocolError& e) {
        drop_client(id, e.what());
        return;
    }
    cols = msg.cols;
    rows = msg.rows;
    if (pty && !exited) {
        pty->resize(cols, rows);
    }
}

void ShepherdProcess::handle_kill(uint64_t id, const Frame& frame) {
    KillMessage msg;
    try {
        msg = decode_kill(frame.payload);
    } catch (const ProtocolError& e) {
        drop_client(id, e.what());
        return;
    }
    if (!is_allowed_signal(msg.signal)) {
        LOG_WARN("Rejected KILL with signal " + std::to_string(msg.signal));
        return;
    }
    if (pty && !exited) {
        LOG_INFO("Sending signal " + std::to_string(msg.signal) + " to worker " + std::to_string(pty->pid()));
        pty->kill(msg.signal);
    }
}

void ShepherdProcess::handle_spawn(uint64_t id, const Frame& frame) {
    SpawnMessage msg;
    try {
        msg = decode_spawn(frame.payload);
    } catch (const ProtocolError& e) {
        drop_client(id, e.what());
        return;
    }
    LOG_INFO("SPAWN: " + msg.command + ", replacing worker " + std::to_string(get_worker_pid()));

    retire_worker();
    replay.clear();
    try {
        spawn_worker(msg);
    } catch (const PtyError& e) {
        LOG_ERROR(std::string("SPAWN failed: ") + e.what());
        WorkerExit failed;
        failed.code = 127;
        finish_worker(failed);
    }
}

void ShepherdProcess::handle_write(const std::string& bytes) {
    if (!pty || exited || bytes.empty()) {
        return;
    }
    pending_input += bytes;
    flush_input();
}

// ----------------------------------------------------------------------------
// Worker
// ----------------------------------------------------------------------------

void ShepherdProcess::spawn_worker(const SpawnMessage& command) {
    pending_input.clear();
    std::unique_ptr<PtyBackend> backend = pty_factory();
    backend->spawn(command, cols, rows);
    pty = std::move(backend);
    exited = false;
    last_exit.reset();
    watch_worker();
    LOG_INFO("Worker started: pid=" + std::to_string(pty->pid()) + " command=" + command.command);
}

void ShepherdProcess::retire_worker() {
    if (!pty) {
        return;
    }
    if (pty->master_fd() >= 0) {
        loop.unwatch(pty->master_fd());
    }
    if (!exited) {
        pty->kill(SIGTERM);
    }
    pty->close();
    if (!exited) {
        retired.push_back(std::move(pty));
    }
    pty.reset();
    pending_input.clear();
    exited = true;
}

void ShepherdProcess::watch_worker() {
    int fd = pty->master_fd();
    if (fd < 0) {
        return;
    }
    PtyBackend* backend = pty.get();
    loop.watch(fd, pending_input.empty() ? POLLIN : (POLLIN | POLLOUT), [this, backend](short revents) {
        handle_worker_events(backend, revents);
    });
}

void ShepherdProcess::handle_worker_events(PtyBackend* backend, short revents) {
    if (backend != pty.get()) {
        return;  // replaced worker
    }
    if (revents & POLLOUT) {
        flush_input();
    }
    if (revents & (POLLIN | POLLHUP | POLLERR)) {
        bool open = read_worker_output();
        if (open && (revents & (POLLHUP | POLLERR)) && !(revents & POLLIN)) {
            open = false;
        }
        if (!open && pty && pty->master_fd() >= 0) {
            // Slave side gone; wait for SIGCHLD to report the exit
            loop.unwatch(pty->master_fd());
        }
    }
}

// Returns false once the master reports EOF or EIO
bool ShepherdProcess::read_worker_output() {
    char buf[64 * 1024];
    while (pty) {
        ssize_t n = pty->read(buf, sizeof(buf));
        if (n > 0) {
            std::string chunk(buf, static_cast<size_t>(n));
            replay.append(chunk);
            broadcast(encode_data(chunk));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return true;
        }
        return false;
    }
    return false;
}

void ShepherdProcess::flush_input() {
    while (pty && !pending_input.empty()) {
        ssize_t n = pty->write(pending_input.data(), pending_input.size());
        if (n > 0) {
            pending_input.erase(0, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            break;
        }
        LOG_WARN(tower::errno_string("write to worker", errno));
        pending_input.clear();
        break;
    }
    if (pty && pty->master_fd() >= 0 && loop.is_watched(pty->master_fd())) {
        loop.modify(pty->master_fd(), pending_input.empty() ? POLLIN : (POLLIN | POLLOUT));
    }
}

void ShepherdProcess::handle_child_exit() {
    for (auto it = retired.begin(); it != retired.end();) {
        if ((*it)->try_reap()) {
            it = retired.erase(it);
        } else {
            ++it;
        }
    }

    if (!pty || exited) {
        return;
    }
    std::optional<WorkerExit> status = pty->try_reap();
    if (!status) {
        return;
    }

    // Deliver whatever the worker wrote before dying ahead of EXIT
    read_worker_output();
    if (pty->master_fd() >= 0) {
        loop.unwatch(pty->master_fd());
    }
    pty->close();
    finish_worker(*status);
}

void ShepherdProcess::finish_worker(const WorkerExit& status) {
    exited = true;
    last_exit = status;
    pending_input.clear();

    ExitMessage msg;
    msg.code = status.code;
    msg.signal = status.signal;
    LOG_INFO("Worker exited: code=" + (status.code ? std::to_string(*status.code) : std::string("null")) +
             " signal=" + (status.signal ? std::to_string(*status.signal) : std::string("null")));
    broadcast(encode_exit(msg));

    if (exit_handler) {
        exit_handler(status);
    }
}

void ShepherdProcess::broadcast(const std::string& frame) {
    std::vector<uint64_t> overloaded;
    for (auto& entry : clients) {
        if (!entry.second.handshaken) {
            continue;
        }
        entry.second.conn->send(frame);
        if (entry.second.conn->pending_output() > MAX_PENDING_OUTPUT) {
            overloaded.push_back(entry.first);
        }
    }
    for (uint64_t id : overloaded) {
        drop_client(id, "output backlog exceeded");
    }
}

void ShepherdProcess::shutdown() {
    LOG_INFO("Shutting down");
    if (pty && !exited) {
        pty->kill(SIGTERM);
    }
    if (pty && pty->master_fd() >= 0) {
        loop.unwatch(pty->master_fd());
    }
    clients.clear();
    if (listen_fd >= 0) {
        loop.unwatch(listen_fd);
        close(listen_fd);
        listen_fd = -1;
        unlink(socket_path.c_str());
    }
}
