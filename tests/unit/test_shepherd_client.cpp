#include <gtest/gtest.h>
#include "shepherd/shepherd_client.h"
#include "test_helpers.h"
#include "temp_dir.h"
#include <poll.h>
#include <unistd.h>
#include <sys/socket.h>

using namespace std::chrono_literals;

namespace {

// Scripted stand-in for a shepherd daemon: accepts one connection and
// answers HELLO with whatever the test queued
class FakeShepherd {
public:
    FakeShepherd(EventLoop& loop, const std::string& path) : loop(loop), path(path) {}

    ~FakeShepherd() {
        conn.reset();
        if (listen_fd >= 0) {
            loop.unwatch(listen_fd);
            close(listen_fd);
        }
    }

    bool start() {
        listen_fd = test_helpers::bind_unix_socket(path);
        if (listen_fd < 0) {
            return false;
        }
        loop.watch(listen_fd, POLLIN, [this](short) {
            int fd = accept4(listen_fd, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
            if (fd < 0) {
                return;
            }
            conn = std::make_unique<Connection>(loop, fd);
            conn->start([this](const Frame& frame) { handle(frame); },
                        [this](const std::string&, bool) { peer_closed = true; });
        });
        return true;
    }

    void send(const std::string& bytes) {
        if (conn) {
            conn->send(bytes);
        }
    }

    // Drop the connection on the next loop iteration
    void hang_up() {
        loop.post([this]() { conn.reset(); });
    }

    static std::string welcome(int version, const std::string& replay = "") {
        WelcomeMessage msg;
        msg.version = version;
        msg.pid = 1234;
        msg.shepherd_pid = 1233;
        msg.start_time = 1700000000000;
        msg.replay = replay;
        return encode_welcome(msg);
    }

    static std::string exit_frame(std::optional<int> code, std::optional<int> signal = std::nullopt) {
        ExitMessage msg;
        msg.code = code;
        msg.signal = signal;
        return encode_exit(msg);
    }

    EventLoop& loop;
    std::string path;
    int listen_fd = -1;
    std::unique_ptr<Connection> conn;
    std::vector<Frame> received;
    std::optional<HelloMessage> hello;
    bool peer_closed = false;

    // Sent in one write when HELLO arrives
    std::string reply;
    bool hang_up_after_reply = false;
    bool answer_pings = true;

private:
    void handle(const Frame& frame) {
        received.push_back(frame);
        if (frame.is(FrameType::HELLO)) {
            hello = decode_hello(frame.payload);
            if (!reply.empty()) {
                send(reply);
            }
            if (hang_up_after_reply) {
                hang_up();
            }
        } else if (frame.is(FrameType::PING) && answer_pings) {
            send(encode_pong());
        }
    }
};

} // namespace

class ShepherdClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(temp_dir.valid());
        socket_path = temp_dir.socket_path("client");
        server = std::make_unique<FakeShepherd>(loop, socket_path);
        ASSERT_TRUE(server->start());
    }

    void TearDown() override {
        server.reset();
    }

    bool server_got(FrameType type) const {
        for (const auto& f : server->received) {
            if (f.is(type)) {
                return true;
            }
        }
        return false;
    }

    test_helpers::TempDir temp_dir{"shepherd_client_test_"};
    EventLoop loop;
    std::string socket_path;
    std::unique_ptr<FakeShepherd> server;
};

// =============================================================================
// Handshake
// =============================================================================

TEST_F(ShepherdClientTest, InitialState) {
    auto client = ShepherdClient::create(loop);
    EXPECT_EQ(client->get_state(), ShepherdClient::State::DISCONNECTED);
    EXPECT_FALSE(client->get_replay_data().has_value());
    EXPECT_FALSE(client->get_welcome().has_value());
    EXPECT_FALSE(client->is_connected());
    EXPECT_STREQ(ShepherdClient::state_name(client->get_state()), "disconnected");

    // Commands before connect are dropped
    client->write("ignored");
    client->resize(10, 10);
    client->ping();
}

TEST_F(ShepherdClientTest, HelloCarriesVersionAndType) {
    server->reply = FakeShepherd::welcome(PROTOCOL_VERSION);
    auto client = ShepherdClient::create(loop, PROTOCOL_VERSION, CLIENT_TYPE_TERMINAL);
    client->connect(socket_path, 1000ms);

    ASSERT_TRUE(server->hello.has_value());
    EXPECT_EQ(server->hello->version, PROTOCOL_VERSION);
    EXPECT_EQ(server->hello->client_type, "terminal");
    EXPECT_TRUE(client->is_connected());
    EXPECT_EQ(client->get_socket_path(), socket_path);
}

TEST_F(ShepherdClientTest, WelcomeExposesReplay) {
    server->reply = FakeShepherd::welcome(PROTOCOL_VERSION, "prompt$ ");
    auto client = ShepherdClient::create(loop);
    WelcomeMessage welcome = client->connect(socket_path, 1000ms);

    EXPECT_EQ(welcome.pid, 1234);
    EXPECT_EQ(welcome.shepherd_pid, 1233);
    EXPECT_EQ(welcome.start_time, 1700000000000);
    ASSERT_TRUE(client->get_replay_data().has_value());
    EXPECT_EQ(*client->get_replay_data(), "prompt$ ");
}

TEST_F(ShepherdClientTest, FramesBeforeWelcomeDeliveredFirst) {
    server->reply = encode_data("B1") + encode_data("B2") +
                    FakeShepherd::welcome(PROTOCOL_VERSION) + encode_data("B3");
    auto client = ShepherdClient::create(loop);
    client->connect(socket_path, 1000ms);

    std::vector<std::string> chunks;
    client->on_data([&](const std::string& bytes) { chunks.push_back(bytes); });
    server->send(encode_data("B4"));

    ASSERT_TRUE(test_helpers::wait_until(loop, [&]() { return chunks.size() == 4; }, 2000));
    EXPECT_EQ(chunks, (std::vector<std::string>{"B1", "B2", "B3", "B4"}));
}

TEST_F(ShepherdClientTest, NewerShepherdRejected) {
    server->reply = FakeShepherd::welcome(PROTOCOL_VERSION + 1);
    auto client = ShepherdClient::create(loop);
    bool closed = false;
    client->on_close([&]() { closed = true; });

    try {
        client->connect(socket_path, 1000ms);
        FAIL() << "connect() should have thrown";
    } catch (const ShepherdError& e) {
        EXPECT_NE(std::string(e.what()).find("stale shepherd, reconnect after upgrade"), std::string::npos);
    }
    EXPECT_EQ(client->get_state(), ShepherdClient::State::CLOSED);
    EXPECT_FALSE(client->get_replay_data().has_value());
    EXPECT_TRUE(closed);
}

TEST_F(ShepherdClientTest, OlderShepherdWarns) {
    server->reply = FakeShepherd::welcome(1);
    auto client = ShepherdClient::create(loop, 2);
    std::optional<std::pair<int, int>> warning;
    client->on_version_warning([&](int client_v, int shepherd_v) { warning = std::make_pair(client_v, shepherd_v); });

    EXPECT_NO_THROW(client->connect(socket_path, 1000ms));
    ASSERT_TRUE(warning.has_value());
    EXPECT_EQ(warning->first, 2);
    EXPECT_EQ(warning->second, 1);
    EXPECT_TRUE(client->is_connected());
}

TEST_F(ShepherdClientTest, EqualVersionsNoWarning) {
    server->reply = FakeShepherd::welcome(PROTOCOL_VERSION);
    auto client = ShepherdClient::create(loop);
    bool warned = false;
    client->on_version_warning([&](int, int) { warned = true; });
    client->connect(socket_path, 1000ms);
    EXPECT_FALSE(warned);
}

TEST_F(ShepherdClientTest, MissingSocketThrows) {
    auto client = ShepherdClient::create(loop);
    EXPECT_THROW(client->connect(temp_dir.socket_path("nobody"), 500ms), ShepherdError);
    EXPECT_EQ(client->get_state(), ShepherdClient::State::CLOSED);
    // A client is single-use
    EXPECT_THROW(client->connect(socket_path, 500ms), ShepherdError);
}

TEST_F(ShepherdClientTest, HandshakeTimeout) {
    auto client = ShepherdClient::create(loop);
    try {
        client->connect(socket_path, 100ms);
        FAIL() << "connect() should have thrown";
    } catch (const ShepherdError& e) {
        EXPECT_NE(std::string(e.what()).find("timed out"), std::string::npos);
    }
    EXPECT_EQ(client->get_state(), ShepherdClient::State::CLOSED);
}

TEST_F(ShepherdClientTest, ClosedDuringHandshake) {
    server->hang_up_after_reply = true;
    auto client = ShepherdClient::create(loop);
    try {
        client->connect(socket_path, 1000ms);
        FAIL() << "connect() should have thrown";
    } catch (const ShepherdError& e) {
        EXPECT_NE(std::string(e.what()).find("closed during handshake"), std::string::npos);
    }
}

TEST_F(ShepherdClientTest, TooManyFramesBeforeWelcome) {
    std::string flood;
    for (size_t i = 0; i <= ShepherdClient::MAX_PENDING_FRAMES; i++) {
        flood += encode_data("x");
    }
    server->reply = flood + FakeShepherd::welcome(PROTOCOL_VERSION);
    auto client = ShepherdClient::create(loop);
    EXPECT_THROW(client->connect(socket_path, 2000ms), ShepherdError);
}

TEST_F(ShepherdClientTest, MalformedWelcomeFailsHandshake) {
    server->reply = encode_frame(FrameType::WELCOME, std::string("\x00\x00\x00\x05{bad}", 9));
    auto client = ShepherdClient::create(loop);
    EXPECT_THROW(client->connect(socket_path, 1000ms), ShepherdError);
}

// =============================================================================
// Exit and close
// =============================================================================

TEST_F(ShepherdClientTest, ExitThenClose) {
    server->reply = FakeShepherd::welcome(PROTOCOL_VERSION) + FakeShepherd::exit_frame(0);
    server->hang_up_after_reply = true;
    auto client = ShepherdClient::create(loop);
    client->connect(socket_path, 1000ms);

    std::vector<std::string> events;
    client->on_exit([&](const ExitMessage& e) { events.push_back("exit:" + std::to_string(e.code.value_or(-1))); });
    client->on_close([&]() { events.push_back("close"); });
    client->on_error([&](const std::string& msg) { events.push_back("error:" + msg); });

    ASSERT_TRUE(test_helpers::wait_until(loop, [&]() { return events.size() >= 2; }, 2000));
    loop.run_for(20ms);
    EXPECT_EQ(events, (std::vector<std::string>{"exit:0", "close"}));
    EXPECT_EQ(client->get_state(), ShepherdClient::State::CLOSED);
}

TEST_F(ShepherdClientTest, CloseWithoutExit) {
    server->reply = FakeShepherd::welcome(PROTOCOL_VERSION);
    auto client = ShepherdClient::create(loop);
    client->connect(socket_path, 1000ms);

    int exits = 0;
    int closes = 0;
    client->on_exit([&](const ExitMessage&) { exits++; });
    client->on_close([&]() { closes++; });

    server->hang_up();
    ASSERT_TRUE(test_helpers::wait_until(loop, [&]() { return closes > 0; }, 2000));
    loop.run_for(20ms);
    EXPECT_EQ(exits, 0);
    EXPECT_EQ(closes, 1);
}

TEST_F(ShepherdClientTest, SignalExit) {
    server->reply = FakeShepherd::welcome(PROTOCOL_VERSION) + FakeShepherd::exit_frame(std::nullopt, 15);
    auto client = ShepherdClient::create(loop);
    client->connect(socket_path, 1000ms);
    std::optional<ExitMessage> exit;
    client->on_exit([&](const ExitMessage& e) { exit = e; });

    ASSERT_TRUE(test_helpers::wait_until(loop, [&]() { return exit.has_value(); }, 2000));
    EXPECT_FALSE(exit->code.has_value());
    EXPECT_EQ(exit->signal, 15);
}

TEST_F(ShepherdClientTest, MalformedExitReportedAsError) {
    server->reply = FakeShepherd::welcome(PROTOCOL_VERSION) + encode_frame(FrameType::EXIT, "not json");
    auto client = ShepherdClient::create(loop);
    client->connect(socket_path, 1000ms);

    std::string error;
    bool exited = false;
    client->on_error([&](const std::string& msg) { error = msg; });
    client->on_exit([&](const ExitMessage&) { exited = true; });

    ASSERT_TRUE(test_helpers::wait_until(loop, [&]() { return !error.empty(); }, 2000));
    EXPECT_NE(error.find("Malformed EXIT"), std::string::npos);
    EXPECT_FALSE(exited);
    EXPECT_TRUE(client->is_connected());
}

TEST_F(ShepherdClientTest, MalformedExitWithoutErrorHandler) {
    server->reply = FakeShepherd::welcome(PROTOCOL_VERSION) +
                    encode_frame(FrameType::EXIT, "[]") + encode_data("after");
    auto client = ShepherdClient::create(loop);
    client->connect(socket_path, 1000ms);

    std::string output;
    client->on_data([&](const std::string& bytes) { output += bytes; });
    ASSERT_TRUE(test_helpers::wait_until(loop, [&]() { return output == "after"; }, 2000));
    EXPECT_TRUE(client->is_connected());
}

TEST_F(ShepherdClientTest, DisconnectIsIdempotent) {
    server->reply = FakeShepherd::welcome(PROTOCOL_VERSION);
    auto client = ShepherdClient::create(loop);
    client->connect(socket_path, 1000ms);
    int closes = 0;
    client->on_close([&]() { closes++; });

    client->disconnect();
    client->disconnect();
    EXPECT_EQ(closes, 1);
    EXPECT_EQ(client->get_state(), ShepherdClient::State::CLOSED);
    ASSERT_TRUE(test_helpers::wait_until(loop, [&]() { return server->peer_closed; }, 2000));
}

TEST_F(ShepherdClientTest, KillMarksDetached) {
    server->reply = FakeShepherd::welcome(PROTOCOL_VERSION);
    auto client = ShepherdClient::create(loop);
    client->connect(socket_path, 1000ms);
    bool errored = false;
    client->on_error([&](const std::string&) { errored = true; });

    client->kill(SIGTERM);
    EXPECT_TRUE(client->is_detached());
    ASSERT_TRUE(test_helpers::wait_until(loop, [&]() { return server_got(FrameType::KILL); }, 2000));

    KillMessage kill;
    for (const auto& f : server->received) {
        if (f.is(FrameType::KILL)) {
            kill = decode_kill(f.payload);
        }
    }
    EXPECT_EQ(kill.signal, SIGTERM);

    server->hang_up();
    ASSERT_TRUE(test_helpers::wait_until(loop, [&]() {
        return client->get_state() == ShepherdClient::State::CLOSED;
    }, 2000));
    EXPECT_FALSE(errored);
}

// =============================================================================
// Commands and keepalive
// =============================================================================

TEST_F(ShepherdClientTest, CommandsEncodeFrames) {
    server->reply = FakeShepherd::welcome(PROTOCOL_VERSION);
    auto client = ShepherdClient::create(loop);
    client->connect(socket_path, 1000ms);

    client->write("echo hi\n");
    client->resize(100, 30);
    SpawnMessage cmd;
    cmd.command = "bash";
    client->spawn(cmd);

    ASSERT_TRUE(test_helpers::wait_until(loop, [&]() { return server->received.size() >= 4; }, 2000));
    EXPECT_TRUE(server->received[1].is(FrameType::WRITE));
    EXPECT_EQ(server->received[1].payload, "echo hi\n");
    ASSERT_TRUE(server->received[2].is(FrameType::RESIZE));
    ResizeMessage resize = decode_resize(server->received[2].payload);
    EXPECT_EQ(resize.cols, 100);
    EXPECT_EQ(resize.rows, 30);
    ASSERT_TRUE(server->received[3].is(FrameType::SPAWN));
    EXPECT_EQ(decode_spawn(server->received[3].payload).command, "bash");
}

TEST_F(ShepherdClientTest, PingPong) {
    server->reply = FakeShepherd::welcome(PROTOCOL_VERSION);
    auto client = ShepherdClient::create(loop);
    client->connect(socket_path, 1000ms);
    bool pong = false;
    client->on_pong([&]() { pong = true; });
    client->ping();
    ASSERT_TRUE(test_helpers::wait_until(loop, [&]() { return pong; }, 2000));
}

TEST_F(ShepherdClientTest, AnswersShepherdPing) {
    server->reply = FakeShepherd::welcome(PROTOCOL_VERSION) + encode_ping();
    auto client = ShepherdClient::create(loop);
    client->connect(socket_path, 1000ms);
    ASSERT_TRUE(test_helpers::wait_until(loop, [&]() { return server_got(FrameType::PONG); }, 2000));
}

TEST_F(ShepherdClientTest, HandlerMayDropLastOwner) {
    server->reply = FakeShepherd::welcome(PROTOCOL_VERSION) + encode_data("x");
    auto client = ShepherdClient::create(loop);
    client->connect(socket_path, 1000ms);
    bool got = false;
    client->on_data([&](const std::string&) {
        got = true;
        client.reset();
    });
    ASSERT_TRUE(test_helpers::wait_until(loop, [&]() { return got; }, 2000));
    loop.run_for(20ms);
    EXPECT_EQ(client, nullptr);
}
