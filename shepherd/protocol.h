#pragma once

// Shepherd wire protocol shared by the daemon and the controller.
//
// Frame format: [1-byte type][4-byte big-endian payload length][payload]
//
// DATA and WRITE payloads are raw terminal bytes. Control payloads are JSON.
// WELCOME is [4-byte BE header length][JSON header][raw replay bytes] so the
// replay history stays binary-safe.

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <stdexcept>
#include <cstdint>
#include <nlohmann/json.hpp>

class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& message) : std::runtime_error(message) {}
};

enum class FrameType : uint8_t {
    DATA = 0x01,     // shepherd -> client: worker output
    RESIZE = 0x02,   // client -> shepherd
    KILL = 0x03,     // client -> shepherd: signal the worker
    EXIT = 0x04,     // shepherd -> client: worker exited
    WRITE = 0x05,    // client -> shepherd: worker input
    PING = 0x06,
    PONG = 0x07,
    HELLO = 0x08,    // client -> shepherd: opens the handshake
    WELCOME = 0x09,  // shepherd -> client: closes the handshake
    SPAWN = 0x0a,    // client -> shepherd: relaunch the worker
};

constexpr int PROTOCOL_VERSION = 1;
constexpr uint32_t MAX_FRAME_SIZE = 16 * 1024 * 1024;
constexpr size_t HEADER_SIZE = 5;

constexpr const char* CLIENT_TYPE_TOWER = "tower";
constexpr const char* CLIENT_TYPE_TERMINAL = "terminal";

struct Frame {
    uint8_t type;  // raw so unknown types survive parsing
    std::string payload;

    bool is(FrameType t) const { return type == static_cast<uint8_t>(t); }
};

bool is_known_frame_type(uint8_t type);
std::string frame_type_name(uint8_t type);

/// @brief Signals a client may deliver to the worker via KILL
/// (SIGHUP, SIGINT, SIGKILL, SIGTERM, SIGWINCH)
bool is_allowed_signal(int signal);

struct HelloMessage {
    int version = PROTOCOL_VERSION;
    std::string client_type = CLIENT_TYPE_TOWER;

    nlohmann::json to_json() const;
    static HelloMessage from_json(const nlohmann::json& j);
};

struct WelcomeMessage {
    int version = PROTOCOL_VERSION;
    int pid = -1;            // worker pid
    int shepherd_pid = -1;   // daemon pid
    int64_t start_time = 0;  // daemon start, epoch ms
    int cols = 80;
    int rows = 24;
    std::string replay;      // recent worker output

    nlohmann::json to_json() const;  // header only, replay excluded
    static WelcomeMessage from_json(const nlohmann::json& j);
};

struct ResizeMessage {
    int cols = 80;
    int rows = 24;

    nlohmann::json to_json() const;
    static ResizeMessage from_json(const nlohmann::json& j);
};

struct KillMessage {
    int signal = 15;

    nlohmann::json to_json() const;
    static KillMessage from_json(const nlohmann::json& j);
};

struct ExitMessage {
    std::optional<int> code;
    std::optional<int> signal;

    nlohmann::json to_json() const;
    static ExitMessage from_json(const nlohmann::json& j);
};

struct SpawnMessage {
    std::string command;
    std::vector<std::string> args;
    std::string cwd;
    std::map<std::string, std::string> env;

    nlohmann::json to_json() const;
    static SpawnMessage from_json(const nlohmann::json& j);
};

// --- Encoding ---

std::string encode_frame(FrameType type, const std::string& payload);
std::string encode_data(const std::string& bytes);
std::string encode_write(const std::string& bytes);
std::string encode_resize(const ResizeMessage& msg);
std::string encode_kill(const KillMessage& msg);
std::string encode_exit(const ExitMessage& msg);
std::string encode_hello(const HelloMessage& msg);
std::string encode_welcome(const WelcomeMessage& msg);
std::string encode_spawn(const SpawnMessage& msg);
std::string encode_ping();
std::string encode_pong();

// --- Decoding (all throw ProtocolError on malformed payloads) ---

nlohmann::json parse_json_payload(const std::string& payload);
HelloMessage decode_hello(const std::string& payload);
WelcomeMessage decode_welcome(const std::string& payload);
ResizeMessage decode_resize(const std::string& payload);
KillMessage decode_kill(const std::string& payload);
ExitMessage decode_exit(const std::string& payload);
SpawnMessage decode_spawn(const std::string& payload);

/// @brief Incremental frame parser for a byte stream of arbitrary chunking
class FrameParser {
public:
    /// @brief Append bytes and return every frame they complete, in order
    /// @throws ProtocolError if a header announces more than MAX_FRAME_SIZE
    std::vector<Frame> feed(const char* data, size_t len);

    /// @brief End-of-stream check
    /// @throws ProtocolError if a partial frame is still buffered
    void finish() const;

    size_t buffered() const { return buffer.size() - offset; }

private:
    std::string buffer;
    size_t offset = 0;
};
