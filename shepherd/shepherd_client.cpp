#include "../tower.h"
#include "shepherd_client.h"

std::shared_ptr<ShepherdClient> ShepherdClient::create(EventLoop& loop, int client_version,
                                                       const std::string& client_type) {
    return std::shared_ptr<ShepherdClient>(new ShepherdClient(loop, client_version, client_type));
}

ShepherdClient::ShepherdClient(EventLoop& loop, int client_version, const std::string& client_type)
    : loop(loop), client_version(client_version), client_type(client_type) {
}

ShepherdClient::~ShepherdClient() {
    if (conn) {
        conn->close();
    }
}

const char* ShepherdClient::state_name(State state) {
    switch (state) {
        case State::DISCONNECTED: return "disconnected";
        case State::CONNECTING: return "connecting";
        case State::HANDSHAKING: return "handshaking";
        case State::CONNECTED: return "connected";
        case State::CLOSED: return "closed";
    }
    return "unknown";
}

WelcomeMessage ShepherdClient::connect(const std::string& socket_path, std::chrono::milliseconds timeout) {
    if (state != State::DISCONNECTED) {
        throw ShepherdError(std::string("connect() called on a client that is ") + state_name(state));
    }

    // Keep ourselves alive even if a handler drops the last owner mid-handshake
    std::shared_ptr<ShepherdClient> self = shared_from_this();
    std::weak_ptr<ShepherdClient> weak = self;

    this->socket_path = socket_path;
    state = State::CONNECTING;
    auto deadline = EventLoop::Clock::now() + timeout;

    std::string error;
    int fd = connect_unix_socket(loop, socket_path, timeout, error);
    if (fd < 0) {
        state = State::CLOSED;
        throw ShepherdError(error);
    }

    state = State::HANDSHAKING;
    conn = std::make_unique<Connection>(loop, fd);
    conn->start(
        [weak](const Frame& frame) {
            if (auto client = weak.lock()) {
                client->handle_frame(frame);
            }
        },
        [weak](const std::string& reason, bool protocol_error) {
            if (auto client = weak.lock()) {
                client->handle_socket_closed(reason, protocol_error);
            }
        });

    HelloMessage hello;
    hello.version = client_version;
    hello.client_type = client_type;
    send(encode_hello(hello));
    dprintf(1, "HELLO sent to %s (version %d)", socket_path.c_str(), client_version);

    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - EventLoop::Clock::now());
    if (left.count() < 0) {
        left = std::chrono::milliseconds(0);
    }
    loop.run_until([this]() { return state != State::HANDSHAKING; }, left);

    if (state == State::HANDSHAKING) {
        fail_handshake("Handshake with " + socket_path + " timed out");
    }
    if (state != State::CONNECTED || !welcome) {
        throw ShepherdError(handshake_error.empty() ? "Connection to " + socket_path + " closed during handshake"
                                                    : handshake_error);
    }

    loop.post([weak]() {
        if (auto client = weak.lock()) {
            client->release_held();
        }
    });
    return *welcome;
}

void ShepherdClient::handle_frame(const Frame& frame) {
    if (state == State::HANDSHAKING) {
        if (frame.is(FrameType::WELCOME)) {
            handle_welcome(frame);
            return;
        }
        if (pending_frames.size() >= MAX_PENDING_FRAMES) {
            fail_handshake("Protocol error: more than " + std::to_string(MAX_PENDING_FRAMES) +
                           " frames before WELCOME");
            return;
        }
        pending_frames.push_back(frame);
        return;
    }
    if (state == State::CONNECTED) {
        if (holding) {
            if (pending_frames.size() >= MAX_PENDING_FRAMES) {
                emit_error("Protocol error: more than " + std::to_string(MAX_PENDING_FRAMES) + " undelivered frames");
                teardown();
                return;
            }
            pending_frames.push_back(frame);
            return;
        }
        deliver(frame);
    }
}

void ShepherdClient::handle_welcome(const Frame& frame) {
    WelcomeMessage msg;
    try {
        msg = decode_welcome(frame.payload);
    } catch (const ProtocolError& e) {
        fail_handshake(std::string("Protocol error: ") + e.what());
        return;
    }

    if (client_version < msg.version) {
        fail_handshake("Shepherd protocol version " + std::to_string(msg.version) +
                       " is newer than client version " + std::to_string(client_version) +
                       ": stale shepherd, reconnect after upgrade");
        return;
    }

    welcome = msg;
    replay_data = msg.replay;
    state = State::CONNECTED;
    holding = true;
    LOG_DEBUG("Connected to shepherd " + socket_path + " (worker pid " + std::to_string(msg.pid) + ")");

    if (client_version > msg.version) {
        LOG_WARN("Shepherd at " + socket_path + " speaks protocol version " + std::to_string(msg.version) +
                 ", client speaks " + std::to_string(client_version));
        if (version_warning_handler) {
            version_warning_handler(client_version, msg.version);
        }
    }
}

void ShepherdClient::release_held() {
    if (!holding) {
        return;
    }
    std::shared_ptr<ShepherdClient> self = shared_from_this();
    holding = false;

    // Everything held since the handshake goes out before any newer frame
    while (!pending_frames.empty() && state == State::CONNECTED) {
        Frame next = std::move(pending_frames.front());
        pending_frames.pop_front();
        deliver(next);
    }

    if (held_close && state == State::CONNECTED) {
        std::pair<std::string, bool> closed = *held_close;
        held_close.reset();
        handle_socket_closed(closed.first, closed.second);
    }
}

void ShepherdClient::deliver(const Frame& frame) {
    if (!is_known_frame_type(frame.type)) {
        dprintf(2, "ignoring unknown frame type 0x%02x", frame.type);
        return;
    }

    switch (static_cast<FrameType>(frame.type)) {
        case FrameType::DATA:
            if (data_handler) {
                data_handler(frame.payload);
            }
            break;
        case FrameType::EXIT: {
            ExitMessage msg;
            try {
                msg = decode_exit(frame.payload);
            } catch (const ProtocolError& e) {
                emit_error(std::string("Malformed EXIT frame: ") + e.what());
                return;
            }
            if (exit_handler) {
                exit_handler(msg);
            }
            break;
        }
        case FrameType::PING:
            send(encode_pong());
            break;
        case FrameType::PONG:
            if (pong_handler) {
                pong_handler();
            }
            break;
        default:
            break;
    }
}

void ShepherdClient::handle_socket_closed(const std::string& reason, bool protocol_error) {
    std::shared_ptr<ShepherdClient> self = shared_from_this();

    if (state == State::HANDSHAKING) {
        std::string message = "Connection to " + socket_path + " closed during handshake";
        if (!reason.empty()) {
            message += ": " + reason;
        }
        fail_handshake(message);
        return;
    }
    if (state != State::CONNECTED) {
        return;
    }
    if (holding) {
        held_close = std::make_pair(reason, protocol_error);
        return;
    }

    if (!reason.empty() && !detached) {
        emit_error(protocol_error ? "Protocol error: " + reason : reason);
    }
    teardown();
}

void ShepherdClient::fail_handshake(const std::string& message) {
    LOG_DEBUG("Handshake failed: " + message);
    handshake_error = message;
    teardown();
}

void ShepherdClient::emit_error(const std::string& message) {
    if (error_handler) {
        error_handler(message);
    } else {
        LOG_WARN("Unhandled shepherd client error (" + socket_path + "): " + message);
    }
}

void ShepherdClient::teardown() {
    if (state == State::CLOSED || state == State::DISCONNECTED) {
        return;
    }
    if (conn) {
        conn->close();
        conn.reset();
    }
    pending_frames.clear();
    holding = false;
    held_close.reset();
    state = State::CLOSED;
    if (close_handler) {
        close_handler();
    }
}

void ShepherdClient::send(const std::string& bytes) {
    if (conn) {
        conn->send(bytes);
    }
}

void ShepherdClient::write(const std::string& bytes) {
    if (state != State::CONNECTED || bytes.empty()) {
        return;
    }
    send(encode_write(bytes));
}

void ShepherdClient::resize(int cols, int rows) {
    if (state != State::CONNECTED) {
        return;
    }
    ResizeMessage msg;
    msg.cols = cols;
    msg.rows = rows;
    send(encode_resize(msg));
}

void ShepherdClient::kill(int signal) {
    if (state != State::CONNECTED) {
        return;
    }
    detached = true;
    KillMessage msg;
    msg.signal = signal;
    send(encode_kill(msg));
}

void ShepherdClient::spawn(const SpawnMessage& command) {
    if (state != State::CONNECTED) {
        return;
    }
    send(encode_spawn(command));
}

void ShepherdClient::ping() {
    if (state != State::CONNECTED) {
        return;
    }
    send(encode_ping());
}

void ShepherdClient::disconnect() {
    if (state == State::DISCONNECTED) {
        state = State::CLOSED;
        return;
    }
    teardown();
}
