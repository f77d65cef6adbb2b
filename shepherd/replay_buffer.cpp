#include "replay_buffer.h"

ReplayBuffer::ReplayBuffer(size_t max_bytes) : max_bytes(max_bytes) {
}

void ReplayBuffer::append(const std::string& data) {
    if (data.empty() || max_bytes == 0) {
        return;
    }

    if (data.size() >= max_bytes) {
        chunks.clear();
        chunks.push_back(data.substr(data.size() - max_bytes));
        total_bytes = max_bytes;
        return;
    }

    chunks.push_back(data);
    total_bytes += data.size();

    // Drop whole chunks first, then trim the front of the oldest survivor
    while (total_bytes > max_bytes && total_bytes - chunks.front().size() >= max_bytes) {
        total_bytes -= chunks.front().size();
        chunks.pop_front();
    }
    if (total_bytes > max_bytes) {
        size_t excess = total_bytes - max_bytes;
        chunks.front().erase(0, excess);
        total_bytes -= excess;
    }
}

std::string ReplayBuffer::snapshot() const {
    std::string out;
    out.reserve(total_bytes);
    for (const auto& chunk : chunks) {
        out += chunk;
    }
    return out;
}

void ReplayBuffer::clear() {
    chunks.clear();
    total_bytes = 0;
}
