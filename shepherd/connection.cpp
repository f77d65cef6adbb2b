#include "../tower.h"
#include "connection.h"
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <cerrno>
#include <cstring>
#include <algorithm>

namespace {
constexpr size_t READ_CHUNK = 64 * 1024;
}

Connection::Connection(EventLoop& loop, int fd)
    : loop(loop), fd_(fd), alive(std::make_shared<bool>(true)) {
    int flags = fcntl(fd_, F_GETFL, 0);
    if (flags >= 0) {
        fcntl(fd_, F_SETFL, flags | O_NONBLOCK);
    }
    fcntl(fd_, F_SETFD, FD_CLOEXEC);
}

Connection::~Connection() {
    close();
}

void Connection::start(FrameHandler on_frame, CloseHandler on_close) {
    frame_handler = std::move(on_frame);
    close_handler = std::move(on_close);
    if (fd_ < 0) {
        return;
    }
    loop.watch(fd_, POLLIN, [this](short revents) {
        handle_events(revents);
    });
    update_interest();
}

bool Connection::send(const std::string& bytes) {
    if (fd_ < 0) {
        return false;
    }
    outbuf += bytes;
    // A failed write must not re-enter the owner from inside send()
    if (!flush(true)) {
        return false;
    }
    update_interest();
    return true;
}

void Connection::close() {
    if (fd_ < 0) {
        return;
    }
    *alive = false;
    loop.unwatch(fd_);
    ::close(fd_);
    fd_ = -1;
    outbuf.clear();
}

void Connection::handle_events(short revents) {
    std::shared_ptr<bool> guard = alive;

    if (revents & POLLOUT) {
        if (!flush(false)) {
            return;
        }
        update_interest();
    }
    if (revents & (POLLIN | POLLHUP | POLLERR)) {
        handle_readable();
        if (!*guard) {
            return;
        }
    }
}

void Connection::handle_readable() {
    std::shared_ptr<bool> guard = alive;
    char buf[READ_CHUNK];

    while (*guard && fd_ >= 0) {
        ssize_t n = ::read(fd_, buf, sizeof(buf));
        if (n > 0) {
            std::vector<Frame> frames;
            try {
                frames = parser.feed(buf, static_cast<size_t>(n));
            } catch (const ProtocolError& e) {
                fail(e.what(), true);
                return;
            }
            // The handler may destroy this connection; keep the callable alive
            FrameHandler handler = frame_handler;
            for (const auto& frame : frames) {
                dprintf(3, "fd %d recv %s (%zu bytes)", fd_, frame_type_name(frame.type).c_str(), frame.payload.size());
                if (handler) {
                    handler(frame);
                }
                if (!*guard) {
                    return;
                }
            }
            continue;
        }
        if (n == 0) {
            try {
                parser.finish();
            } catch (const ProtocolError& e) {
                fail(e.what(), true);
                return;
            }
            fail("", false);
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        fail(tower::errno_string("read", errno), false);
        return;
    }
}

bool Connection::flush(bool deferred) {
    while (!outbuf.empty() && fd_ >= 0) {
        ssize_t n = ::send(fd_, outbuf.data(), outbuf.size(), MSG_NOSIGNAL);
        if (n > 0) {
            outbuf.erase(0, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return true;
        }
        std::string reason = tower::errno_string("send", errno);
        if (deferred) {
            fail_later(reason);
        } else {
            fail(reason, false);
        }
        return false;
    }
    return fd_ >= 0;
}

void Connection::update_interest() {
    if (fd_ < 0) {
        return;
    }
    loop.modify(fd_, outbuf.empty() ? POLLIN : (POLLIN | POLLOUT));
}

void Connection::fail(const std::string& reason, bool protocol_error) {
    if (fd_ < 0) {
        return;
    }
    if (!reason.empty()) {
        dprintf(1, "fd %d closing: %s", fd_, reason.c_str());
    }
    close();
    CloseHandler handler = std::move(close_handler);
    close_handler = nullptr;
    if (handler) {
        handler(reason, protocol_error);
    }
}

void Connection::fail_later(const std::string& reason) {
    dprintf(1, "fd %d closing: %s", fd_, reason.c_str());
    close();
    CloseHandler handler = std::move(close_handler);
    close_handler = nullptr;
    if (handler) {
        loop.post([handler, reason]() {
            handler(reason, false);
        });
    }
}

int connect_unix_socket(EventLoop& loop, const std::string& path,
                        std::chrono::milliseconds timeout, std::string& error) {
    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    if (path.size() >= sizeof(addr.sun_path)) {
        error = "Socket path too long: " + path;
        return -1;
    }
    strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        error = tower::errno_string("socket", errno);
        return -1;
    }

    auto deadline = EventLoop::Clock::now() + timeout;
    auto remaining = [&deadline]() {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - EventLoop::Clock::now());
        return left.count() > 0 ? left : std::chrono::milliseconds(0);
    };

    while (true) {
        if (::connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) == 0) {
            return fd;
        }
        int err = errno;
        if (err == EINTR) {
            continue;
        }

        if (err == EINPROGRESS) {
            bool ready = false;
            loop.watch(fd, POLLOUT, [&ready](short) {
                ready = true;
            });
            loop.run_until([&ready]() { return ready; }, remaining());
            loop.unwatch(fd);
            if (!ready) {
                ::close(fd);
                error = "connect " + path + ": timed out";
                return -1;
            }
            int so_error = 0;
            socklen_t len = sizeof(so_error);
            if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
                so_error = errno;
            }
            if (so_error != 0) {
                ::close(fd);
                error = tower::errno_string("connect " + path, so_error);
                return -1;
            }
            return fd;
        }

        if (err == EAGAIN) {
            // Listener backlog is full; retry until the deadline
            if (remaining().count() == 0) {
                ::close(fd);
                error = "connect " + path + ": timed out";
                return -1;
            }
            loop.run_for(std::min(remaining(), std::chrono::milliseconds(10)));
            continue;
        }

        ::close(fd);
        error = tower::errno_string("connect " + path, err);
        return -1;
    }
}
