#include "tower.h"
#include "config.h"
#include "event_loop.h"
#include "session_manager.h"

#include <getopt.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <csignal>
#include <cstring>
#include <cstdlib>
#include <iostream>
#include <filesystem>
#include <functional>
#include <optional>
#include <sys/ioctl.h>
#include <sys/stat.h>

// Global debug level
int g_debug_level = 0;

// Ctrl-] leaves the session running and returns to the shell
static const unsigned char DETACH_KEY = 0x1d;

static struct termios saved_termios;
static bool termios_saved = false;
static int winch_pipe[2] = {-1, -1};

static void term_raw() {
	if (!isatty(STDIN_FILENO)) return;
	struct termios t;
	if (tcgetattr(STDIN_FILENO, &saved_termios) < 0) return;
	termios_saved = true;
	t = saved_termios;
	cfmakeraw(&t);
	tcsetattr(STDIN_FILENO, TCSANOW, &t);
}

static void term_restore() {
	if (termios_saved)
		tcsetattr(STDIN_FILENO, TCSANOW, &saved_termios);
	termios_saved = false;
}

static void winch_handler(int) {
	int saved_errno = errno;
	char c = 1;
	if (write(winch_pipe[1], &c, 1) < 0) {
		// Pipe full: a resize is already pending
	}
	errno = saved_errno;
}

static void terminal_size(int& cols, int& rows) {
	struct winsize ws;
	if (ioctl(STDIN_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0) {
		cols = ws.ws_col;
		rows = ws.ws_row;
	}
}

static void write_all(int fd, const std::string& data) {
	size_t off = 0;
	while (off < data.size()) {
		ssize_t n = write(fd, data.data() + off, data.size() - off);
		if (n < 0) {
			if (errno == EINTR) continue;
			if (errno == EAGAIN) {
				struct pollfd pfd = {fd, POLLOUT, 0};
				poll(&pfd, 1, 100);
				continue;
			}
			return;
		}
		off += static_cast<size_t>(n);
	}
}

static void print_usage(int, char** argv) {
	printf("\n=== Tower - persistent terminal sessions ===\n");
	printf("\nUsage:\n");
	printf("	%s [OPTIONS] run [--id ID] [--restart] [--max-restarts N] [--cwd DIR] -- <command> [args...]\n", argv[0]);
	printf("	%s [OPTIONS] attach <id>		Reconnect to a running session\n", argv[0]);
	printf("	%s [OPTIONS] kill <id> [signal]	Terminate a session and its shepherd\n", argv[0]);
	printf("	%s [OPTIONS] list			List session sockets and whether they are live\n", argv[0]);
	printf("	%s [OPTIONS] cleanup			Remove sockets with no shepherd behind them\n", argv[0]);
	printf("\nOptions:\n");
	printf("	-c, --config FILE  Specify config file (default: %s)\n", Config::get_default_config_path().c_str());
	printf("	-d, --debug[=N]    Enable debug mode with optional level (1-9, default: 1)\n");
	printf("	-l, --log-file	   Log to file instead of console\n");
	printf("	-h, --help		   Show this help message\n");
	printf("\nWhile attached, press Ctrl-] to detach and leave the session running.\n");
	printf("\n");
}

/// @brief Reports session lifecycle to the attached terminal
class AttachObserver : public SessionObserver {
public:
	explicit AttachObserver(const std::string& id) : id(id) {}

	void on_session_exit(const std::string& session_id, const ExitMessage& exit) override {
		if (session_id != id) return;
		if (exit.code) exit_code = *exit.code;
		else if (exit.signal) exit_code = 128 + *exit.signal;
	}

	void on_session_restart(const std::string& session_id, int restart_count) override {
		if (session_id != id) return;
		fprintf(stderr, "\r\n[restarting '%s', attempt %d]\r\n", id.c_str(), restart_count);
	}

	void on_session_error(const std::string& session_id, SessionErrorKind kind, const std::string& message) override {
		if (session_id != id) return;
		fprintf(stderr, "\r\n[%s: %s]\r\n", session_error_kind_name(kind), message.c_str());
		if (kind != SessionErrorKind::CLIENT_ERROR) exit_code = 1;
	}

	int exit_code = 0;

private:
	std::string id;
};

// Pump stdin and the session until it ends or the user detaches
static int attach(EventLoop& loop, SessionManager& manager, const std::string& id) {
	std::shared_ptr<ShepherdClient> client = manager.get_client(id);
	if (!client) return 1;

	AttachObserver observer(id);
	manager.set_observer(&observer);

	std::optional<std::string> replay = client->get_replay_data();
	if (replay) write_all(STDOUT_FILENO, *replay);

	client->on_data([](const std::string& bytes) {
		write_all(STDOUT_FILENO, bytes);
	});

	bool detached = false;
	loop.watch(STDIN_FILENO, POLLIN, [&](short) {
		char buf[4096];
		ssize_t n = read(STDIN_FILENO, buf, sizeof(buf));
		if (n <= 0) {
			if (n < 0 && (errno == EINTR || errno == EAGAIN)) return;
			loop.unwatch(STDIN_FILENO);
			return;
		}
		std::string input(buf, static_cast<size_t>(n));
		size_t key = input.find(static_cast<char>(DETACH_KEY));
		if (key != std::string::npos) {
			client->write(input.substr(0, key));
			detached = true;
			loop.stop();
			return;
		}
		client->write(input);
	});

	if (pipe2(winch_pipe, O_NONBLOCK | O_CLOEXEC) == 0) {
		signal(SIGWINCH, winch_handler);
		loop.watch(winch_pipe[0], POLLIN, [&](short) {
			char drain[64];
			while (read(winch_pipe[0], drain, sizeof(drain)) > 0) {}
			int cols = 0, rows = 0;
			terminal_size(cols, rows);
			if (cols > 0) client->resize(cols, rows);
		});
	}

	// Stop once the session leaves the registry (exit, crash, budget exhausted)
	std::function<void()> check;
	check = [&]() {
		if (!manager.get_client(id)) {
			loop.stop();
			return;
		}
		loop.add_timer(std::chrono::milliseconds(100), check);
	};
	loop.add_timer(std::chrono::milliseconds(100), check);

	term_raw();
	loop.run();
	term_restore();

	loop.unwatch(STDIN_FILENO);
	if (winch_pipe[0] >= 0) {
		signal(SIGWINCH, SIG_DFL);
		loop.unwatch(winch_pipe[0]);
		close(winch_pipe[0]);
		close(winch_pipe[1]);
		winch_pipe[0] = winch_pipe[1] = -1;
	}
	manager.set_observer(nullptr);

	if (detached) {
		manager.shutdown();
		fprintf(stderr, "\r\n[detached from '%s']\r\n", id.c_str());
		return 0;
	}
	return observer.exit_code;
}

static int cmd_run(EventLoop& loop, SessionManager& manager, const Config& config, int argc, char** argv) {
	SessionOptions options;
	options.id = "s" + std::to_string(getpid());
	options.cols = config.cols;
	options.rows = config.rows;
	terminal_size(options.cols, options.rows);

	char cwd[4096];
	if (getcwd(cwd, sizeof(cwd))) options.cwd = cwd;

	int i = 0;
	for (; i < argc; i++) {
		std::string arg = argv[i];
		if (arg == "--") {
			i++;
			break;
		} else if (arg == "--id" && i + 1 < argc) {
			options.id = argv[++i];
		} else if (arg == "--restart") {
			options.restart_on_exit = true;
		} else if (arg == "--max-restarts" && i + 1 < argc) {
			options.max_restarts = atoi(argv[++i]);
		} else if (arg == "--cwd" && i + 1 < argc) {
			options.cwd = argv[++i];
		} else if (arg.compare(0, 2, "--") == 0) {
			std::cerr << "Unknown run option: " << arg << std::endl;
			return 1;
		} else {
			break;
		}
	}
	if (i >= argc) {
		std::cerr << "run: missing command" << std::endl;
		return 1;
	}
	options.command = argv[i++];
	for (; i < argc; i++) {
		options.args.push_back(argv[i]);
	}

	try {
		SessionInfo info = manager.create_session(options);
		fprintf(stderr, "[session '%s' started, shepherd pid %d]\r\n", options.id.c_str(), info.pid);
	} catch (const std::exception& e) {
		std::cerr << "Failed to start session: " << e.what() << std::endl;
		return 1;
	}
	return attach(loop, manager, options.id);
}

static int cmd_attach(EventLoop& loop, SessionManager& manager, const std::string& id) {
	try {
		manager.reconnect_session(id, manager.socket_path_for(id));
	} catch (const std::exception& e) {
		std::cerr << "Cannot attach to session '" << id << "': " << e.what() << std::endl;
		return 1;
	}
	int cols = 0, rows = 0;
	terminal_size(cols, rows);
	if (cols > 0) manager.get_client(id)->resize(cols, rows);
	return attach(loop, manager, id);
}

static int cmd_kill(SessionManager& manager, const std::string& id, int signal) {
	try {
		manager.reconnect_session(id, manager.socket_path_for(id));
	} catch (const std::exception& e) {
		std::cerr << "Cannot reach session '" << id << "': " << e.what() << std::endl;
		return 1;
	}
	if (!manager.kill_session(id, signal)) {
		std::cerr << "Session '" << id << "' went away before it could be killed" << std::endl;
		return 1;
	}
	printf("Session '%s' killed\n", id.c_str());
	return 0;
}

static int cmd_list(EventLoop& loop, const Config& config) {
	std::error_code ec;
	if (!std::filesystem::is_directory(config.socket_dir, ec)) {
		printf("No sessions\n");
		return 0;
	}
	int count = 0;
	for (const auto& entry : std::filesystem::directory_iterator(config.socket_dir, ec)) {
		std::string name = entry.path().filename().string();
		if (name.size() <= 14 || name.compare(0, 9, "shepherd-") != 0 ||
		    name.compare(name.size() - 5, 5, ".sock") != 0) {
			continue;
		}
		struct stat st;
		if (lstat(entry.path().c_str(), &st) != 0 || !S_ISSOCK(st.st_mode)) continue;

		std::string error;
		int fd = connect_unix_socket(loop, entry.path().string(),
		                             std::chrono::milliseconds(config.probe_timeout_ms), error);
		bool live = fd >= 0;
		if (live) close(fd);
		printf("%-32s %s\n", name.substr(9, name.size() - 14).c_str(), live ? "live" : "stale");
		count++;
	}
	if (count == 0) printf("No sessions\n");
	return 0;
}

int main(int argc, char** argv) {
	std::string config_file_path;
	std::string log_file;

	static struct option long_options[] = {
		{"config", required_argument, 0, 'c'},
		{"debug", optional_argument, 0, 'd'},
		{"log-file", required_argument, 0, 'l'},
		{"help", no_argument, 0, 'h'},
		{0, 0, 0, 0}
	};

	int opt;
	int option_index = 0;
	// '+' stops at the subcommand so its own arguments are left alone
	while ((opt = getopt_long(argc, argv, "+c:dl:h", long_options, &option_index)) != -1) {
		switch (opt) {
			case 'c':
				config_file_path = optarg;
				break;
			case 'd':
				if (optarg) {
					g_debug_level = atoi(optarg);
				} else {
					g_debug_level = 1;
				}
				break;
			case 'l':
				log_file = optarg;
				break;
			case 'h':
				print_usage(argc, argv);
				return 0;
			default:
				print_usage(argc, argv);
				return 1;
		}
	}

	if (optind >= argc) {
		print_usage(argc, argv);
		return 1;
	}
	std::string command = argv[optind++];

	Config config;
	if (!config_file_path.empty()) {
		config.set_config_path(config_file_path);
	}
	try {
		config.load();
		config.validate();
	} catch (const ConfigError& e) {
		std::cerr << "Configuration error: " << e.what() << std::endl;
		return 1;
	}

	if (log_file.empty()) log_file = config.log_file;
	if (!log_file.empty()) {
		if (Logger::instance().set_log_file(log_file)) {
			Logger::instance().set_console_output(false);
		}
	}
	Logger::instance().set_log_level(g_debug_level > 0 ? LogLevel::DEBUG : Logger::parse_level(config.log_level));

	signal(SIGPIPE, SIG_IGN);

	EventLoop loop;
	SessionManager manager(loop, config);

	int rest = argc - optind;
	char** rest_argv = argv + optind;

	if (command == "run") {
		return cmd_run(loop, manager, config, rest, rest_argv);
	} else if (command == "attach" && rest == 1) {
		return cmd_attach(loop, manager, rest_argv[0]);
	} else if (command == "kill" && (rest == 1 || rest == 2)) {
		int sig = rest == 2 ? atoi(rest_argv[1]) : SIGTERM;
		return cmd_kill(manager, rest_argv[0], sig);
	} else if (command == "list" && rest == 0) {
		return cmd_list(loop, config);
	} else if (command == "cleanup" && rest == 0) {
		int removed = manager.cleanup_stale_sockets();
		printf("Removed %d stale socket(s)\n", removed);
		return 0;
	}

	print_usage(argc, argv);
	return 1;
}
