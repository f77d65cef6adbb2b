#include "../tower.h"
#include "pty_backend.h"
#include <pty.h>
#include <unistd.h>
#include <fcntl.h>
#include <csignal>
#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <vector>
#include <sys/ioctl.h>
#include <sys/wait.h>

ForkPty::~ForkPty() {
    if (child > 0 && !reaped) {
        ::kill(child, SIGHUP);
    }
    close();
}

void ForkPty::spawn(const SpawnMessage& command, int cols, int rows) {
    if (child > 0) {
        throw PtyError("Worker already spawned");
    }

    struct winsize ws;
    memset(&ws, 0, sizeof(ws));
    ws.ws_col = static_cast<unsigned short>(cols);
    ws.ws_row = static_cast<unsigned short>(rows);

    // Build argv before forking; only async-signal-safe calls after fork
    std::vector<std::string> argv_storage;
    argv_storage.push_back(command.command);
    for (const auto& arg : command.args) {
        argv_storage.push_back(arg);
    }
    std::vector<char*> argv;
    for (auto& arg : argv_storage) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    int fd = -1;
    pid_t pid = forkpty(&fd, nullptr, nullptr, &ws);
    if (pid < 0) {
        throw PtyError(tower::errno_string("forkpty", errno));
    }

    if (pid == 0) {
        // Child: become the worker. Ignored dispositions and the mask
        // survive execvp, so hand the worker a clean slate.
        signal(SIGHUP, SIG_DFL);
        signal(SIGINT, SIG_DFL);
        signal(SIGQUIT, SIG_DFL);
        signal(SIGPIPE, SIG_DFL);
        signal(SIGCHLD, SIG_DFL);
        signal(SIGTERM, SIG_DFL);
        sigset_t empty;
        sigemptyset(&empty);
        sigprocmask(SIG_SETMASK, &empty, nullptr);

        if (!command.cwd.empty() && chdir(command.cwd.c_str()) != 0) {
            fprintf(stderr, "chdir %s: %s\r\n", command.cwd.c_str(), strerror(errno));
            _exit(127);
        }
        for (const auto& kv : command.env) {
            setenv(kv.first.c_str(), kv.second.c_str(), 1);
        }
        if (command.env.find("TERM") == command.env.end()) {
            setenv("TERM", "xterm-256color", 1);
        }

        execvp(argv[0], argv.data());
        fprintf(stderr, "exec %s: %s\r\n", argv[0], strerror(errno));
        _exit(127);
    }

    master = fd;
    child = pid;
    reaped = false;

    int flags = fcntl(master, F_GETFL, 0);
    fcntl(master, F_SETFL, flags | O_NONBLOCK);
    fcntl(master, F_SETFD, FD_CLOEXEC);

    dprintf(1, "forkpty: pid=%d master=%d %dx%d", child, master, cols, rows);
}

ssize_t ForkPty::read(char* buf, size_t len) {
    if (master < 0) {
        errno = EBADF;
        return -1;
    }
    return ::read(master, buf, len);
}

ssize_t ForkPty::write(const char* data, size_t len) {
    if (master < 0) {
        errno = EBADF;
        return -1;
    }
    return ::write(master, data, len);
}

void ForkPty::resize(int cols, int rows) {
    if (master < 0) {
        return;
    }
    struct winsize ws;
    memset(&ws, 0, sizeof(ws));
    ws.ws_col = static_cast<unsigned short>(cols);
    ws.ws_row = static_cast<unsigned short>(rows);
    if (ioctl(master, TIOCSWINSZ, &ws) < 0) {
        LOG_WARN(tower::errno_string("TIOCSWINSZ", errno));
    }
}

bool ForkPty::kill(int signal) {
    if (child <= 0 || reaped) {
        return false;
    }
    return ::kill(child, signal) == 0;
}

std::optional<WorkerExit> ForkPty::try_reap() {
    if (child <= 0 || reaped) {
        return std::nullopt;
    }

    int status = 0;
    pid_t r;
    do {
        r = waitpid(child, &status, WNOHANG);
    } while (r < 0 && errno == EINTR);

    if (r == 0) {
        return std::nullopt;
    }

    reaped = true;
    WorkerExit exit;
    if (r < 0) {
        // Someone else reaped it; status is unknown
        LOG_WARN(tower::errno_string("waitpid", errno));
        exit.code = -1;
    } else if (WIFEXITED(status)) {
        exit.code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit.signal = WTERMSIG(status);
    } else {
        exit.code = -1;
    }
    return exit;
}

void ForkPty::close() {
    if (master >= 0) {
        ::close(master);
        master = -1;
    }
}
