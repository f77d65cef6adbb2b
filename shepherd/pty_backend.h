#pragma once

#include "protocol.h"
#include <string>
#include <optional>
#include <functional>
#include <memory>
#include <stdexcept>
#include <sys/types.h>

class PtyError : public std::runtime_error {
public:
    explicit PtyError(const std::string& message) : std::runtime_error(message) {}
};

/// @brief How a worker ended: exactly one of code or signal is set
struct WorkerExit {
    std::optional<int> code;
    std::optional<int> signal;
};

/// @brief A worker process attached to a pseudo-terminal
///
/// The shepherd core only talks to this interface so tests can drive it
/// with an in-memory fake instead of a real child.
class PtyBackend {
public:
    virtual ~PtyBackend() = default;

    /// @brief Launch the worker
    /// @throws PtyError if the PTY or child cannot be created
    virtual void spawn(const SpawnMessage& command, int cols, int rows) = 0;

    /// @brief Non-blocking fd carrying worker output and accepting input, -1 if none
    virtual int master_fd() const = 0;

    virtual pid_t pid() const = 0;

    /// @brief read(2)/write(2) semantics on the master side
    virtual ssize_t read(char* buf, size_t len) = 0;
    virtual ssize_t write(const char* data, size_t len) = 0;

    virtual void resize(int cols, int rows) = 0;

    /// @brief Deliver a signal to the worker
    /// @return false if the worker is already gone
    virtual bool kill(int signal) = 0;

    /// @brief Non-blocking reap
    /// @return Exit status once the worker has terminated
    virtual std::optional<WorkerExit> try_reap() = 0;

    /// @brief Release the master side
    virtual void close() = 0;
};

using PtyFactory = std::function<std::unique_ptr<PtyBackend>()>;

/// @brief PtyBackend over forkpty(3)
class ForkPty : public PtyBackend {
public:
    ForkPty() = default;
    ~ForkPty() override;

    void spawn(const SpawnMessage& command, int cols, int rows) override;
    int master_fd() const override { return master; }
    pid_t pid() const override { return child; }
    ssize_t read(char* buf, size_t len) override;
    ssize_t write(const char* data, size_t len) override;
    void resize(int cols, int rows) override;
    bool kill(int signal) override;
    std::optional<WorkerExit> try_reap() override;
    void close() override;

private:
    int master = -1;
    pid_t child = -1;
    bool reaped = false;
};
