#include "tower.h"
#include "session_manager.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <sys/wait.h>

using json = nlohmann::json;

namespace {

// Alive and not a zombie
bool process_alive(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    if (::kill(pid, 0) < 0 && errno == ESRCH) {
        return false;
    }
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    std::string line;
    if (stat.is_open() && std::getline(stat, line)) {
        size_t paren = line.rfind(')');
        if (paren != std::string::npos && paren + 2 < line.size()) {
            char state = line[paren + 2];
            if (state == 'Z' || state == 'X') {
                return false;
            }
        }
    }
    return true;
}

// Remove path only if it is a socket
void unlink_socket(const std::string& path) {
    struct stat st;
    if (lstat(path.c_str(), &st) == 0 && S_ISSOCK(st.st_mode)) {
        unlink(path.c_str());
    }
}

std::chrono::milliseconds remaining_until(EventLoop::Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - EventLoop::Clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

const std::string SOCKET_PREFIX = "shepherd-";
const std::string SOCKET_SUFFIX = ".sock";

} // namespace

const char* session_error_kind_name(SessionErrorKind kind) {
    switch (kind) {
        case SessionErrorKind::DISCONNECTED: return "disconnected";
        case SessionErrorKind::RESTARTS_EXHAUSTED: return "restarts-exhausted";
        case SessionErrorKind::CLIENT_ERROR: return "client-error";
    }
    return "unknown";
}

SessionManager::SessionManager(EventLoop& loop, const Config& config)
    : loop(loop), config(config), alive(std::make_shared<bool>(true)) {
}

SessionManager::~SessionManager() {
    shutdown();
    alive.reset();
}

// ============================================================================
// Lookup
// ============================================================================

bool SessionManager::is_valid_session_id(const std::string& id) {
    if (id.empty() || id.size() > 64) {
        return false;
    }
    return std::all_of(id.begin(), id.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
               c == '.' || c == '_' || c == '-';
    });
}

std::string SessionManager::socket_path_for(const std::string& id) const {
    return config.socket_dir + "/" + SOCKET_PREFIX + id + SOCKET_SUFFIX;
}

std::map<std::string, std::shared_ptr<ShepherdClient>> SessionManager::list_sessions() const {
    std::map<std::string, std::shared_ptr<ShepherdClient>> result;
    for (const auto& entry : sessions) {
        result[entry.first] = entry.second->client;
    }
    return result;
}

std::optional<SessionInfo> SessionManager::get_session_info(const std::string& id) const {
    auto it = sessions.find(id);
    if (it == sessions.end()) {
        return std::nullopt;
    }
    const Session& s = *it->second;
    SessionInfo info;
    info.pid = s.pid;
    info.start_time = s.start_time;
    info.socket_path = s.socket_path;
    info.restart_count = s.restart_count;
    info.created_at = s.created_at;
    info.restart_on_exit = s.restart_on_exit;
    return info;
}

std::shared_ptr<ShepherdClient> SessionManager::get_client(const std::string& id) const {
    auto it = sessions.find(id);
    if (it == sessions.end()) {
        return nullptr;
    }
    return it->second->client;
}

SessionManager::Session* SessionManager::find_session(const std::string& id, const ShepherdClient* client) {
    auto it = sessions.find(id);
    if (it == sessions.end() || it->second->client.get() != client) {
        return nullptr;
    }
    return it->second.get();
}

// ============================================================================
// Create
// ============================================================================

SessionInfo SessionManager::create_session(const SessionOptions& options) {
    if (!is_valid_session_id(options.id)) {
        throw SessionError("Invalid session id: '" + options.id + "'");
    }
    if (sessions.count(options.id)) {
        throw SessionError("Session already exists: " + options.id);
    }
    if (options.command.empty()) {
        throw SessionError("Session " + options.id + ": command is empty");
    }

    std::string socket_path = socket_path_for(options.id);
    struct sockaddr_un addr;
    if (socket_path.size() >= sizeof(addr.sun_path)) {
        throw SessionError("Socket path too long: " + socket_path);
    }

    ensure_socket_dir(config.socket_dir);

    // Never take over the path of a shepherd that is still serving it
    struct stat st;
    if (lstat(socket_path.c_str(), &st) == 0 && S_ISSOCK(st.st_mode)) {
        std::string probe_error;
        int fd = connect_unix_socket(loop, socket_path, std::chrono::milliseconds(config.probe_timeout_ms), probe_error);
        if (fd >= 0) {
            close(fd);
            throw SessionError("A shepherd is already listening on " + socket_path);
        }
    }

    ShepherdLaunchConfig launch;
    launch.command.command = options.command;
    launch.command.args = options.args;
    launch.command.cwd = options.cwd;
    launch.command.env = options.env;
    launch.cols = options.cols > 0 ? options.cols : config.cols;
    launch.rows = options.rows > 0 ? options.rows : config.rows;
    launch.socket_path = socket_path;
    launch.replay_buffer_bytes = config.replay_buffer_bytes;

    LOG_INFO("Creating session " + options.id + ": " + options.command);

    auto deadline = EventLoop::Clock::now() + std::chrono::milliseconds(config.socket_wait_timeout_ms);
    int info_fd = -1;
    pid_t pid = -1;
    int64_t start_time = 0;
    std::shared_ptr<ShepherdClient> client;

    try {
        pid = launch_shepherd(launch, info_fd);

        json info = read_startup_info(info_fd, remaining_until(deadline));
        close(info_fd);
        info_fd = -1;

        pid_t reported = info.value("pid", -1);
        if (reported != pid) {
            LOG_WARN("Shepherd reported pid " + std::to_string(reported) + ", expected " + std::to_string(pid));
        }
        start_time = info.value("startTime", static_cast<int64_t>(0));

        if (!wait_for_socket(socket_path, remaining_until(deadline))) {
            throw SessionError("Timed out waiting for shepherd socket " + socket_path);
        }
        check_socket_mode(socket_path);

        client = ShepherdClient::create(loop);
        client->connect(socket_path, std::chrono::milliseconds(config.connect_timeout_ms));
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create session " + options.id + ": " + e.what());
        if (info_fd >= 0) {
            close(info_fd);
        }
        if (client) {
            client->disconnect();
        }
        if (pid > 0) {
            ::kill(pid, SIGKILL);
        }
        unlink_socket(socket_path);
        throw;
    }

    auto session = std::make_unique<Session>();
    session->id = options.id;
    session->client = client;
    session->pid = pid;
    session->start_time = start_time;
    session->socket_path = socket_path;
    session->created_at = tower::get_current_time_ms();
    session->command = launch.command;
    session->restart_on_exit = options.restart_on_exit;
    session->restart_delay_ms = options.restart_delay_ms.value_or(config.restart_delay_ms);
    session->max_restarts = options.max_restarts.value_or(config.max_restarts);
    session->restart_reset_after_ms = options.restart_reset_after_ms.value_or(config.restart_reset_after_ms);

    Session& ref = *session;
    sessions[options.id] = std::move(session);
    attach_handlers(ref);

    LOG_INFO("Session " + options.id + " started: shepherd pid " + std::to_string(pid) +
             ", worker pid " + std::to_string(client->get_welcome() ? client->get_welcome()->pid : -1));

    SessionInfo result;
    result.pid = ref.pid;
    result.start_time = ref.start_time;
    result.socket_path = ref.socket_path;
    result.restart_count = ref.restart_count;
    result.created_at = ref.created_at;
    result.restart_on_exit = ref.restart_on_exit;
    return result;
}

void SessionManager::ensure_socket_dir(const std::string& dir) const {
    std::filesystem::path parent = std::filesystem::path(dir).parent_path();
    std::error_code ec;
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }
    if (mkdir(dir.c_str(), 0700) < 0 && errno != EEXIST) {
        throw SessionError(tower::errno_string("mkdir " + dir, errno));
    }

    // Must be a real directory owned by us, not a symlink
    struct stat st;
    if (lstat(dir.c_str(), &st) != 0) {
        throw SessionError(tower::errno_string("stat " + dir, errno));
    }
    if (S_ISLNK(st.st_mode)) {
        throw SessionError("Socket directory is a symlink: " + dir);
    }
    if (!S_ISDIR(st.st_mode)) {
        throw SessionError("Socket directory is not a directory: " + dir);
    }
    if (st.st_uid != getuid()) {
        throw SessionError("Socket directory not owned by us: " + dir);
    }
    if ((st.st_mode & 0777) != 0700) {
        chmod(dir.c_str(), 0700);
    }
}

pid_t SessionManager::launch_shepherd(const ShepherdLaunchConfig& launch, int& info_fd) {
    // Everything the children need is prepared before forking
    std::vector<std::string> args;
    args.push_back(config.shepherd_path);
    if (g_debug_level > 0) {
        args.push_back("--debug=" + std::to_string(g_debug_level));
    }
    if (!config.shepherd_log_file.empty()) {
        args.push_back("--log-file");
        args.push_back(config.shepherd_log_file);
    }
    args.push_back(launch.to_json().dump());

    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int info_pipe[2];
    int pid_pipe[2];
    if (pipe2(info_pipe, O_CLOEXEC) < 0) {
        throw SessionError(tower::errno_string("pipe", errno));
    }
    if (pipe2(pid_pipe, O_CLOEXEC) < 0) {
        int err = errno;
        close(info_pipe[0]);
        close(info_pipe[1]);
        throw SessionError(tower::errno_string("pipe", err));
    }

    pid_t middle = fork();
    if (middle < 0) {
        int err = errno;
        close(info_pipe[0]);
        close(info_pipe[1]);
        close(pid_pipe[0]);
        close(pid_pipe[1]);
        throw SessionError(tower::errno_string("fork", err));
    }

    if (middle == 0) {
        // Intermediate child: new session, fork the daemon, report its pid, leave
        setsid();
        pid_t daemon_pid = fork();
        if (daemon_pid < 0) {
            _exit(1);
        }
        if (daemon_pid == 0) {
            int devnull = open("/dev/null", O_RDWR);
            if (devnull >= 0) {
                dup2(devnull, STDIN_FILENO);
                dup2(devnull, STDERR_FILENO);
            }
            dup2(info_pipe[1], STDOUT_FILENO);
            execvp(argv[0], argv.data());
            _exit(127);
        }
        ssize_t written = write(pid_pipe[1], &daemon_pid, sizeof(daemon_pid));
        _exit(written == static_cast<ssize_t>(sizeof(daemon_pid)) ? 0 : 1);
    }

    close(info_pipe[1]);
    close(pid_pipe[1]);

    int status = 0;
    while (waitpid(middle, &status, 0) < 0 && errno == EINTR) {
    }

    pid_t daemon_pid = -1;
    ssize_t n;
    do {
        n = read(pid_pipe[0], &daemon_pid, sizeof(daemon_pid));
    } while (n < 0 && errno == EINTR);
    close(pid_pipe[0]);

    if (n != static_cast<ssize_t>(sizeof(daemon_pid)) || daemon_pid <= 0) {
        close(info_pipe[0]);
        throw SessionError("Failed to launch shepherd " + config.shepherd_path);
    }

    info_fd = info_pipe[0];
    dprintf(1, "launched shepherd pid %d", daemon_pid);
    return daemon_pid;
}

json SessionManager::read_startup_info(int info_fd, std::chrono::milliseconds timeout) {
    int flags = fcntl(info_fd, F_GETFL, 0);
    fcntl(info_fd, F_SETFL, flags | O_NONBLOCK);

    std::string buffer;
    bool eof = false;
    auto line_complete = [&buffer, &eof]() {
        return eof || buffer.find('\n') != std::string::npos;
    };

    loop.watch(info_fd, POLLIN, [&](short) {
        char buf[512];
        while (true) {
            ssize_t n = read(info_fd, buf, sizeof(buf));
            if (n > 0) {
                buffer.append(buf, static_cast<size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n == 0 || (errno != EAGAIN && errno != EWOULDBLOCK)) {
                eof = true;
            }
            break;
        }
    });
    loop.run_until(line_complete, timeout);
    loop.unwatch(info_fd);

    size_t newline = buffer.find('\n');
    if (newline == std::string::npos) {
        if (eof) {
            throw SessionError("Shepherd exited during startup, see " + config.shepherd_log_file);
        }
        throw SessionError("Timed out waiting for shepherd startup");
    }

    try {
        return json::parse(buffer.substr(0, newline));
    } catch (const json::exception& e) {
        throw SessionError(std::string("Invalid shepherd startup info: ") + e.what());
    }
}

bool SessionManager::wait_for_socket(const std::string& path, std::chrono::milliseconds timeout) {
    auto deadline = EventLoop::Clock::now() + timeout;
    while (true) {
        struct stat st;
        if (lstat(path.c_str(), &st) == 0 && S_ISSOCK(st.st_mode)) {
            return true;
        }
        auto left = remaining_until(deadline);
        if (left.count() == 0) {
            return false;
        }
        loop.run_for(std::min(left, std::chrono::milliseconds(20)));
    }
}

bool SessionManager::wait_for_exit(pid_t pid, std::chrono::milliseconds timeout) {
    auto deadline = EventLoop::Clock::now() + timeout;
    while (process_alive(pid)) {
        auto left = remaining_until(deadline);
        if (left.count() == 0) {
            return false;
        }
        loop.run_for(std::min(left, std::chrono::milliseconds(20)));
    }
    return true;
}

void SessionManager::check_socket_mode(const std::string& path) const {
    struct stat st;
    if (lstat(path.c_str(), &st) != 0) {
        throw SessionError(tower::errno_string("stat " + path, errno));
    }
    if (!S_ISSOCK(st.st_mode)) {
        throw SessionError("Not a socket: " + path);
    }
    if (st.st_uid != getuid()) {
        throw SessionError("Socket not owned by us: " + path);
    }
    if (st.st_mode & 0077) {
        throw SessionError("Socket has insecure permissions: " + path);
    }
}

// ============================================================================
// Reconnect
// ============================================================================

std::shared_ptr<ShepherdClient> SessionManager::reconnect_session(const std::string& id, const std::string& socket_path,
                                                                  std::optional<pid_t> pid,
                                                                  std::optional<int64_t> start_time) {
    if (!is_valid_session_id(id)) {
        throw SessionError("Invalid session id: '" + id + "'");
    }
    if (sessions.count(id)) {
        throw SessionError("Session already exists: " + id);
    }

    struct stat st;
    if (lstat(socket_path.c_str(), &st) != 0) {
        throw SessionError("Shepherd socket not found: " + socket_path);
    }
    if (!S_ISSOCK(st.st_mode)) {
        throw SessionError("Not a socket: " + socket_path);
    }

    if (pid && start_time) {
        std::optional<int64_t> actual = get_process_start_time(*pid);
        if (actual && std::llabs(*actual - *start_time) > START_TIME_TOLERANCE_MS) {
            throw SessionError("Process " + std::to_string(*pid) + " started at " + std::to_string(*actual) +
                               ", expected " + std::to_string(*start_time) + " (pid reused)");
        }
    }

    // A live connection is the only proof the shepherd still exists
    std::string probe_error;
    int fd = connect_unix_socket(loop, socket_path, std::chrono::milliseconds(config.probe_timeout_ms), probe_error);
    if (fd < 0) {
        LOG_INFO("Shepherd for " + id + " is gone (" + probe_error + "), removing " + socket_path);
        unlink_socket(socket_path);
        throw SessionError("Shepherd for session " + id + " is not running: " + probe_error);
    }
    close(fd);

    std::shared_ptr<ShepherdClient> client = ShepherdClient::create(loop);
    WelcomeMessage welcome;
    try {
        welcome = client->connect(socket_path, std::chrono::milliseconds(config.connect_timeout_ms));
    } catch (const ShepherdError& e) {
        client->disconnect();
        throw SessionError("Reconnect to session " + id + " failed: " + e.what());
    }

    auto session = std::make_unique<Session>();
    session->id = id;
    session->client = client;
    session->pid = welcome.shepherd_pid > 0 ? welcome.shepherd_pid : pid.value_or(-1);
    session->start_time = welcome.start_time;
    session->socket_path = socket_path;
    session->created_at = tower::get_current_time_ms();
    session->restart_on_exit = false;

    Session& ref = *session;
    sessions[id] = std::move(session);
    attach_handlers(ref);

    LOG_INFO("Reconnected session " + id + " (shepherd pid " + std::to_string(ref.pid) + ", " +
             std::to_string(welcome.replay.size()) + " bytes of replay)");
    return client;
}

// ============================================================================
// Notifications
// ============================================================================

void SessionManager::attach_handlers(Session& session) {
    std::weak_ptr<bool> token = alive;
    std::string id = session.id;
    ShepherdClient* client = session.client.get();

    session.client->on_exit([this, token, id, client](const ExitMessage& exit) {
        if (!token.expired()) {
            handle_exit(id, client, exit);
        }
    });
    session.client->on_close([this, token, id, client]() {
        if (!token.expired()) {
            handle_close(id, client);
        }
    });
    session.client->on_error([this, token, id, client](const std::string& message) {
        if (!token.expired()) {
            handle_error(id, client, message);
        }
    });
}

void SessionManager::handle_exit(const std::string& id, const ShepherdClient* client, const ExitMessage& exit) {
    if (!find_session(id, client)) {
        return;
    }
    LOG_INFO("Session " + id + " worker exited: code=" +
             (exit.code ? std::to_string(*exit.code) : std::string("null")) + " signal=" +
             (exit.signal ? std::to_string(*exit.signal) : std::string("null")));

    if (observer) {
        observer->on_session_exit(id, exit);
    }

    // The observer may have killed the session
    Session* s = find_session(id, client);
    if (!s) {
        return;
    }

    if (!s->restart_on_exit) {
        remove_dead_session(id);
        return;
    }

    // Counter must not reset while the worker is down
    if (s->reset_timer) {
        loop.cancel_timer(s->reset_timer);
        s->reset_timer = 0;
    }

    if (s->restart_count >= s->max_restarts) {
        int count = s->restart_count;
        remove_dead_session(id);
        notify_error(id, SessionErrorKind::RESTARTS_EXHAUSTED,
                     "Session " + id + " exhausted its restart budget after " + std::to_string(count) + " restarts");
        return;
    }

    s->restart_count++;
    schedule_restart(*s);
}

void SessionManager::handle_close(const std::string& id, const ShepherdClient* client) {
    Session* s = find_session(id, client);
    if (!s) {
        return;  // already removed by exit, kill or shutdown
    }
    bool expected = s->client->is_detached();
    remove_dead_session(id);
    if (!expected) {
        notify_error(id, SessionErrorKind::DISCONNECTED, "Session " + id + " disconnected unexpectedly");
    }
}

void SessionManager::handle_error(const std::string& id, const ShepherdClient* client, const std::string& message) {
    if (!find_session(id, client)) {
        LOG_DEBUG("Dropping error for removed session " + id + ": " + message);
        return;
    }
    notify_error(id, SessionErrorKind::CLIENT_ERROR, message);
}

void SessionManager::notify_error(const std::string& id, SessionErrorKind kind, const std::string& message) {
    LOG_WARN("session-error [" + std::string(session_error_kind_name(kind)) + "] " + message);
    if (observer) {
        observer->on_session_error(id, kind, message);
    }
}

// ============================================================================
// Restart policy
// ============================================================================

void SessionManager::schedule_restart(Session& session) {
    LOG_INFO("Restarting session " + session.id + " in " + std::to_string(session.restart_delay_ms) +
             "ms (restart " + std::to_string(session.restart_count) + "/" + std::to_string(session.max_restarts) + ")");
    std::string id = session.id;
    session.restart_timer = loop.add_timer(std::chrono::milliseconds(session.restart_delay_ms), [this, id]() {
        send_restart(id);
    });
}

void SessionManager::send_restart(const std::string& id) {
    auto it = sessions.find(id);
    if (it == sessions.end()) {
        return;
    }
    Session& s = *it->second;
    s.restart_timer = 0;

    if (!s.client->is_connected()) {
        return;  // close handling owns this session now
    }
    s.client->spawn(s.command);

    // Window never shorter than the delay, or the counter could clear before this restart completes
    int window = std::max(s.restart_reset_after_ms, s.restart_delay_ms);
    s.reset_timer = loop.add_timer(std::chrono::milliseconds(window), [this, id]() {
        auto found = sessions.find(id);
        if (found == sessions.end()) {
            return;
        }
        found->second->reset_timer = 0;
        found->second->restart_count = 0;
        LOG_DEBUG("Session " + id + " restart counter reset");
    });

    if (observer) {
        observer->on_session_restart(id, s.restart_count);
    }
}

void SessionManager::cancel_timers(Session& session) {
    if (session.restart_timer) {
        loop.cancel_timer(session.restart_timer);
        session.restart_timer = 0;
    }
    if (session.reset_timer) {
        loop.cancel_timer(session.reset_timer);
        session.reset_timer = 0;
    }
}

void SessionManager::remove_dead_session(const std::string& id) {
    auto it = sessions.find(id);
    if (it == sessions.end()) {
        return;
    }
    std::unique_ptr<Session> session = std::move(it->second);
    sessions.erase(it);
    cancel_timers(*session);

    // The worker is gone for good; do not leave its shepherd idling headless
    std::optional<int64_t> actual = get_process_start_time(session->pid);
    if (session->pid > 0 && process_alive(session->pid) &&
        (!actual || std::llabs(*actual - session->start_time) <= START_TIME_TOLERANCE_MS)) {
        ::kill(session->pid, SIGTERM);
    }

    session->client->disconnect();
    unlink_socket(session->socket_path);
    LOG_INFO("Session " + id + " removed");
}

// ============================================================================
// Kill / shutdown
// ============================================================================

bool SessionManager::kill_session(const std::string& id, int signal) {
    auto it = sessions.find(id);
    if (it == sessions.end()) {
        return false;
    }

    // Unregister and disarm before any signal goes out
    std::unique_ptr<Session> session = std::move(it->second);
    sessions.erase(it);
    cancel_timers(*session);
    session->restart_on_exit = false;

    LOG_INFO("Killing session " + id + " with signal " + std::to_string(signal));
    session->client->kill(signal);

    if (session->pid > 0 && ::kill(session->pid, SIGTERM) == 0) {
        if (!wait_for_exit(session->pid, std::chrono::milliseconds(config.kill_timeout_ms))) {
            LOG_WARN("Shepherd " + std::to_string(session->pid) + " ignored SIGTERM, sending SIGKILL");
            ::kill(session->pid, SIGKILL);
            wait_for_exit(session->pid, std::chrono::milliseconds(1000));
        }
    }

    session->client->disconnect();
    unlink_socket(session->socket_path);
    return true;
}

void SessionManager::shutdown() {
    if (sessions.empty()) {
        return;
    }
    LOG_INFO("Detaching from " + std::to_string(sessions.size()) + " session(s)");

    std::map<std::string, std::unique_ptr<Session>> detached;
    detached.swap(sessions);
    for (auto& entry : detached) {
        cancel_timers(*entry.second);
    }
    for (auto& entry : detached) {
        entry.second->client->disconnect();
    }
}

// ============================================================================
// Stale socket cleanup
// ============================================================================

int SessionManager::cleanup_stale_sockets(const std::string& socket_dir) {
    std::error_code ec;
    if (!std::filesystem::is_directory(socket_dir, ec)) {
        return 0;
    }

    std::vector<std::string> candidates;
    for (const auto& entry : std::filesystem::directory_iterator(socket_dir, ec)) {
        std::string name = entry.path().filename().string();
        if (name.size() <= SOCKET_PREFIX.size() + SOCKET_SUFFIX.size() ||
            name.compare(0, SOCKET_PREFIX.size(), SOCKET_PREFIX) != 0 ||
            name.compare(name.size() - SOCKET_SUFFIX.size(), SOCKET_SUFFIX.size(), SOCKET_SUFFIX) != 0) {
            continue;
        }
        candidates.push_back(entry.path().string());
    }
    if (ec) {
        LOG_WARN("Cannot list " + socket_dir + ": " + ec.message());
    }

    int removed = 0;
    for (const auto& path : candidates) {
        struct stat st;
        if (lstat(path.c_str(), &st) != 0 || !S_ISSOCK(st.st_mode)) {
            continue;  // symlinks and regular files are never touched
        }

        bool owned = false;
        for (const auto& entry : sessions) {
            if (entry.second->socket_path == path) {
                owned = true;
                break;
            }
        }
        std::string name = std::filesystem::path(path).filename().string();
        std::string id = name.substr(SOCKET_PREFIX.size(), name.size() - SOCKET_PREFIX.size() - SOCKET_SUFFIX.size());
        if (owned || sessions.count(id)) {
            continue;
        }

        std::string error;
        int fd = connect_unix_socket(loop, path, std::chrono::milliseconds(config.probe_timeout_ms), error);
        if (fd >= 0) {
            close(fd);
            dprintf(1, "live shepherd on %s", path.c_str());
            continue;
        }

        if (unlink(path.c_str()) == 0) {
            LOG_DEBUG("Removed stale socket " + path + " (" + error + ")");
            removed++;
        }
    }
    return removed;
}

// ============================================================================
// Diagnostics
// ============================================================================

std::optional<int64_t> SessionManager::get_process_start_time(pid_t pid) noexcept {
    if (pid <= 0) {
        return std::nullopt;
    }
    try {
        std::ifstream stat_file("/proc/" + std::to_string(pid) + "/stat");
        std::string line;
        if (!stat_file.is_open() || !std::getline(stat_file, line)) {
            return std::nullopt;
        }

        // comm may contain spaces; fields resume after the last ')'
        size_t paren = line.rfind(')');
        if (paren == std::string::npos) {
            return std::nullopt;
        }
        std::istringstream fields(line.substr(paren + 1));
        std::string field;
        // starttime is field 22; field 3 (state) is the first after ')'
        for (int i = 3; i <= 22; i++) {
            if (!(fields >> field)) {
                return std::nullopt;
            }
        }
        long long start_ticks = std::stoll(field);

        std::ifstream proc_stat("/proc/stat");
        long long boot_time = -1;
        while (std::getline(proc_stat, line)) {
            if (line.compare(0, 6, "btime ") == 0) {
                boot_time = std::stoll(line.substr(6));
                break;
            }
        }
        long ticks = sysconf(_SC_CLK_TCK);
        if (boot_time < 0 || ticks <= 0) {
            return std::nullopt;
        }
        return static_cast<int64_t>(boot_time) * 1000 + static_cast<int64_t>(start_ticks) * 1000 / ticks;
    } catch (const std::exception& e) {
        dprintf(1, "start time lookup for %d failed: %s", pid, e.what());
        return std::nullopt;
    }
}
