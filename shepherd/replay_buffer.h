#pragma once

#include <deque>
#include <string>
#include <cstddef>

#include "protocol.h"

constexpr size_t DEFAULT_REPLAY_BYTES = 1024 * 1024;

/// @brief Largest replay that still fits one WELCOME frame with its header
constexpr size_t MAX_REPLAY_BYTES = MAX_FRAME_SIZE - 64 * 1024;

/// @brief Byte-bounded history of raw worker output
///
/// Stores output chunks exactly as read from the PTY (escape sequences
/// included) and evicts the oldest bytes once the limit is exceeded, so a
/// reconnecting client can repaint recent screen state.
class ReplayBuffer {
public:
    explicit ReplayBuffer(size_t max_bytes = DEFAULT_REPLAY_BYTES);

    void append(const std::string& data);

    /// @brief All retained bytes, oldest first
    std::string snapshot() const;

    void clear();

    size_t size() const { return total_bytes; }
    size_t capacity() const { return max_bytes; }
    bool empty() const { return total_bytes == 0; }

private:
    std::deque<std::string> chunks;
    size_t total_bytes = 0;
    size_t max_bytes;
};
