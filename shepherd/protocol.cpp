#include "protocol.h"
#include <csignal>

using json = nlohmann::json;

namespace {

void put_u32(std::string& out, uint32_t value) {
    out.push_back(static_cast<char>((value >> 24) & 0xFF));
    out.push_back(static_cast<char>((value >> 16) & 0xFF));
    out.push_back(static_cast<char>((value >> 8) & 0xFF));
    out.push_back(static_cast<char>(value & 0xFF));
}

uint32_t get_u32(const char* p) {
    const unsigned char* u = reinterpret_cast<const unsigned char*>(p);
    return (static_cast<uint32_t>(u[0]) << 24) | (static_cast<uint32_t>(u[1]) << 16) |
           (static_cast<uint32_t>(u[2]) << 8) | static_cast<uint32_t>(u[3]);
}

template<typename T>
T decode_json(const std::string& payload, const char* what) {
    json j = parse_json_payload(payload);
    try {
        return T::from_json(j);
    } catch (const json::exception& e) {
        throw ProtocolError(std::string("Invalid ") + what + " payload: " + e.what());
    }
}

} // namespace

bool is_known_frame_type(uint8_t type) {
    return type >= static_cast<uint8_t>(FrameType::DATA) &&
           type <= static_cast<uint8_t>(FrameType::SPAWN);
}

std::string frame_type_name(uint8_t type) {
    switch (static_cast<FrameType>(type)) {
        case FrameType::DATA: return "DATA";
        case FrameType::RESIZE: return "RESIZE";
        case FrameType::KILL: return "KILL";
        case FrameType::EXIT: return "EXIT";
        case FrameType::WRITE: return "WRITE";
        case FrameType::PING: return "PING";
        case FrameType::PONG: return "PONG";
        case FrameType::HELLO: return "HELLO";
        case FrameType::WELCOME: return "WELCOME";
        case FrameType::SPAWN: return "SPAWN";
    }
    return "UNKNOWN(" + std::to_string(type) + ")";
}

bool is_allowed_signal(int signal) {
    switch (signal) {
        case SIGHUP:
        case SIGINT:
        case SIGKILL:
        case SIGTERM:
        case SIGWINCH:
            return true;
        default:
            return false;
    }
}

// --- Message JSON ---

json HelloMessage::to_json() const {
    return json{{"version", version}, {"clientType", client_type}};
}

HelloMessage HelloMessage::from_json(const json& j) {
    HelloMessage msg;
    msg.version = j.at("version").get<int>();
    msg.client_type = j.value("clientType", std::string(CLIENT_TYPE_TOWER));
    if (msg.client_type != CLIENT_TYPE_TOWER && msg.client_type != CLIENT_TYPE_TERMINAL) {
        throw ProtocolError("Unknown clientType: " + msg.client_type);
    }
    return msg;
}

json WelcomeMessage::to_json() const {
    return json{
        {"version", version},
        {"pid", pid},
        {"shepherdPid", shepherd_pid},
        {"startTime", start_time},
        {"cols", cols},
        {"rows", rows}
    };
}

WelcomeMessage WelcomeMessage::from_json(const json& j) {
    WelcomeMessage msg;
    msg.version = j.at("version").get<int>();
    msg.pid = j.value("pid", -1);
    msg.shepherd_pid = j.value("shepherdPid", -1);
    msg.start_time = j.value("startTime", static_cast<int64_t>(0));
    msg.cols = j.value("cols", 80);
    msg.rows = j.value("rows", 24);
    return msg;
}

json ResizeMessage::to_json() const {
    return json{{"cols", cols}, {"rows", rows}};
}

ResizeMessage ResizeMessage::from_json(const json& j) {
    ResizeMessage msg;
    msg.cols = j.at("cols").get<int>();
    msg.rows = j.at("rows").get<int>();
    if (msg.cols < 1 || msg.cols > 65535 || msg.rows < 1 || msg.rows > 65535) {
        throw ProtocolError("RESIZE out of range: " + std::to_string(msg.cols) + "x" + std::to_string(msg.rows));
    }
    return msg;
}

json KillMessage::to_json() const {
    return json{{"signal", signal}};
}

KillMessage KillMessage::from_json(const json& j) {
    KillMessage msg;
    msg.signal = j.at("signal").get<int>();
    return msg;
}

json ExitMessage::to_json() const {
    json j;
    j["code"] = code ? json(*code) : json(nullptr);
    j["signal"] = signal ? json(*signal) : json(nullptr);
    return j;
}

ExitMessage ExitMessage::from_json(const json& j) {
    if (!j.is_object()) {
        throw ProtocolError("EXIT payload is not an object");
    }
    ExitMessage msg;
    const json& code = j.at("code");
    if (!code.is_null()) {
        msg.code = code.get<int>();
    }
    if (j.contains("signal") && !j["signal"].is_null()) {
        msg.signal = j["signal"].get<int>();
    }
    return msg;
}

json SpawnMessage::to_json() const {
    return json{{"command", command}, {"args", args}, {"cwd", cwd}, {"env", env}};
}

SpawnMessage SpawnMessage::from_json(const json& j) {
    SpawnMessage msg;
    msg.command = j.at("command").get<std::string>();
    if (msg.command.empty()) {
        throw ProtocolError("SPAWN command is empty");
    }
    msg.args = j.value("args", std::vector<std::string>{});
    msg.cwd = j.value("cwd", std::string());
    msg.env = j.value("env", std::map<std::string, std::string>{});
    return msg;
}

// --- Encoding ---

std::string encode_frame(FrameType type, const std::string& payload) {
    if (payload.size() > MAX_FRAME_SIZE) {
        throw ProtocolError("Frame payload size " + std::to_string(payload.size()) +
                            " exceeds maximum " + std::to_string(MAX_FRAME_SIZE));
    }
    std::string frame;
    frame.reserve(HEADER_SIZE + payload.size());
    frame.push_back(static_cast<char>(type));
    put_u32(frame, static_cast<uint32_t>(payload.size()));
    frame += payload;
    return frame;
}

std::string encode_data(const std::string& bytes) {
    return encode_frame(FrameType::DATA, bytes);
}

std::string encode_write(const std::string& bytes) {
    return encode_frame(FrameType::WRITE, bytes);
}

std::string encode_resize(const ResizeMessage& msg) {
    return encode_frame(FrameType::RESIZE, msg.to_json().dump());
}

std::string encode_kill(const KillMessage& msg) {
    return encode_frame(FrameType::KILL, msg.to_json().dump());
}

std::string encode_exit(const ExitMessage& msg) {
    return encode_frame(FrameType::EXIT, msg.to_json().dump());
}

std::string encode_hello(const HelloMessage& msg) {
    return encode_frame(FrameType::HELLO, msg.to_json().dump());
}

std::string encode_welcome(const WelcomeMessage& msg) {
    std::string header = msg.to_json().dump();
    std::string payload;
    payload.reserve(4 + header.size() + msg.replay.size());
    put_u32(payload, static_cast<uint32_t>(header.size()));
    payload += header;
    payload += msg.replay;
    return encode_frame(FrameType::WELCOME, payload);
}

std::string encode_spawn(const SpawnMessage& msg) {
    return encode_frame(FrameType::SPAWN, msg.to_json().dump());
}

std::string encode_ping() {
    return encode_frame(FrameType::PING, "");
}

std::string encode_pong() {
    return encode_frame(FrameType::PONG, "");
}

// --- Decoding ---

json parse_json_payload(const std::string& payload) {
    if (payload.empty()) {
        throw ProtocolError("Empty JSON payload");
    }
    try {
        return json::parse(payload);
    } catch (const json::exception& e) {
        throw ProtocolError(std::string("Invalid JSON payload: ") + e.what());
    }
}

HelloMessage decode_hello(const std::string& payload) {
    return decode_json<HelloMessage>(payload, "HELLO");
}

WelcomeMessage decode_welcome(const std::string& payload) {
    if (payload.size() < 4) {
        throw ProtocolError("WELCOME payload too short");
    }
    uint32_t header_len = get_u32(payload.data());
    if (header_len > payload.size() - 4) {
        throw ProtocolError("WELCOME header length " + std::to_string(header_len) + " exceeds payload");
    }
    WelcomeMessage msg = decode_json<WelcomeMessage>(payload.substr(4, header_len), "WELCOME");
    msg.replay = payload.substr(4 + header_len);
    return msg;
}

ResizeMessage decode_resize(const std::string& payload) {
    return decode_json<ResizeMessage>(payload, "RESIZE");
}

KillMessage decode_kill(const std::string& payload) {
    return decode_json<KillMessage>(payload, "KILL");
}

ExitMessage decode_exit(const std::string& payload) {
    return decode_json<ExitMessage>(payload, "EXIT");
}

SpawnMessage decode_spawn(const std::string& payload) {
    return decode_json<SpawnMessage>(payload, "SPAWN");
}

// --- FrameParser ---

std::vector<Frame> FrameParser::feed(const char* data, size_t len) {
    buffer.append(data, len);

    std::vector<Frame> frames;
    while (buffer.size() - offset >= HEADER_SIZE) {
        const char* header = buffer.data() + offset;
        uint32_t payload_len = get_u32(header + 1);
        if (payload_len > MAX_FRAME_SIZE) {
            throw ProtocolError("Frame payload size " + std::to_string(payload_len) +
                                " exceeds maximum " + std::to_string(MAX_FRAME_SIZE));
        }
        if (buffer.size() - offset < HEADER_SIZE + payload_len) {
            break;  // need more data
        }
        Frame frame;
        frame.type = static_cast<uint8_t>(header[0]);
        frame.payload.assign(header + HEADER_SIZE, payload_len);
        frames.push_back(std::move(frame));
        offset += HEADER_SIZE + payload_len;
    }

    // Compact once the consumed prefix dominates the buffer
    if (offset > 0 && offset * 2 >= buffer.size()) {
        buffer.erase(0, offset);
        offset = 0;
    }
    return frames;
}

void FrameParser::finish() const {
    if (buffered() > 0) {
        throw ProtocolError("Incomplete frame: " + std::to_string(buffered()) +
                            " bytes remaining at end of stream");
    }
}
