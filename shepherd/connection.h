#pragma once

#include "protocol.h"
#include "../event_loop.h"
#include <functional>
#include <memory>
#include <string>
#include <chrono>

/// @brief Framed, non-blocking stream socket bound to an EventLoop
///
/// Owns the fd. Incoming bytes are parsed into frames and handed to the
/// frame handler in arrival order; outgoing bytes are written immediately
/// when possible and otherwise queued until the socket is writable.
/// The close handler fires at most once, on EOF, socket error or protocol
/// error, never for an explicit close(). A write failure inside send() is
/// reported through the loop on a later iteration.
class Connection {
public:
    using FrameHandler = std::function<void(const Frame& frame)>;
    /// reason is empty for a clean EOF
    using CloseHandler = std::function<void(const std::string& reason, bool protocol_error)>;

    Connection(EventLoop& loop, int fd);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /// @brief Begin watching the fd
    void start(FrameHandler on_frame, CloseHandler on_close);

    /// @brief Queue encoded frame bytes for sending
    /// @return false if the connection is closed or the write failed
    bool send(const std::string& bytes);

    /// @brief Close the fd without invoking the close handler (idempotent)
    void close();

    bool is_open() const { return fd_ >= 0; }
    int fd() const { return fd_; }
    size_t pending_output() const { return outbuf.size(); }

private:
    EventLoop& loop;
    int fd_;
    FrameParser parser;
    std::string outbuf;
    FrameHandler frame_handler;
    CloseHandler close_handler;
    // Flipped on close; lets handlers detect that the connection died under them
    std::shared_ptr<bool> alive;

    void handle_events(short revents);
    void handle_readable();
    bool flush(bool deferred);
    void update_interest();
    void fail(const std::string& reason, bool protocol_error);
    void fail_later(const std::string& reason);
};

/// @brief Non-blocking connect to a Unix socket, servicing loop while waiting
/// @param error Set to a readable reason on failure
/// @return Connected non-blocking fd, or -1 on refusal, error or timeout
int connect_unix_socket(EventLoop& loop, const std::string& path,
                        std::chrono::milliseconds timeout, std::string& error);
