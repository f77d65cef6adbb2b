// shepherd: detached daemon that owns one PTY worker and serves it on a
// Unix socket. Launched by the session manager, never by hand.

#include "../tower.h"
#include "../config.h"
#include "shepherd_process.h"
#include "pty_backend.h"

#include <getopt.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <csignal>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <filesystem>
#include <sys/stat.h>

// Global debug level
int g_debug_level = 0;

static int signal_pipe[2] = {-1, -1};

static void signal_handler(int signal) {
	int saved_errno = errno;
	unsigned char sig = static_cast<unsigned char>(signal);
	if (write(signal_pipe[1], &sig, 1) < 0) {
		// Pipe full: a wakeup is already pending
	}
	errno = saved_errno;
}

static void print_usage(int, char** argv) {
	printf("\nUsage: %s [OPTIONS] <json-config>\n"
		"\nOptions:\n"
		"  -d, --debug[=N]    Enable debug tracing (level 1-9)\n"
		"  -l, --log-file     Log file (default: %s)\n"
		"  -h, --help         Show this help\n"
		"\nThe JSON config carries {command, args, cwd, env, cols, rows, socketPath, replayBufferBytes}.\n",
		argv[0], Config::get_default_shepherd_log_path().c_str());
}

static void ensure_parent_directory(const std::string& path) {
	std::filesystem::path parent = std::filesystem::path(path).parent_path();
	if (parent.empty()) {
		return;
	}
	std::error_code ec;
	std::filesystem::create_directories(parent, ec);
}

static bool setup_socket_directory(const std::string& socket_path) {
	std::filesystem::path dir = std::filesystem::path(socket_path).parent_path();
	if (dir.empty()) {
		return true;
	}
	std::error_code ec;
	if (std::filesystem::create_directories(dir, ec)) {
		chmod(dir.c_str(), 0700);
	}
	if (ec) {
		LOG_FATAL("Cannot create socket directory " + dir.string() + ": " + ec.message());
		return false;
	}
	return true;
}

static bool install_signal_handlers() {
	if (pipe2(signal_pipe, O_NONBLOCK | O_CLOEXEC) < 0) {
		LOG_FATAL(tower::errno_string("signal pipe", errno));
		return false;
	}

	struct sigaction sa;
	memset(&sa, 0, sizeof(sa));
	sa.sa_handler = signal_handler;
	sigemptyset(&sa.sa_mask);
	sa.sa_flags = SA_RESTART | SA_NOCLDSTOP;
	sigaction(SIGCHLD, &sa, nullptr);
	sigaction(SIGTERM, &sa, nullptr);
	sigaction(SIGINT, &sa, nullptr);

	signal(SIGPIPE, SIG_IGN);
	signal(SIGHUP, SIG_IGN);
	return true;
}

// Report {pid, startTime} to the launcher, then detach stdout
static void report_started(int64_t start_time) {
	nlohmann::json info = {
		{"pid", getpid()},
		{"startTime", start_time}
	};
	std::cout << info.dump() << std::endl;

	int devnull = open("/dev/null", O_WRONLY | O_CLOEXEC);
	if (devnull >= 0) {
		dup2(devnull, STDOUT_FILENO);
		close(devnull);
	} else {
		close(STDOUT_FILENO);
	}
}

int main(int argc, char** argv) {
	std::string log_file;

	static struct option long_options[] = {
		{"debug", optional_argument, 0, 'd'},
		{"log-file", required_argument, 0, 'l'},
		{"help", no_argument, 0, 'h'},
		{0, 0, 0, 0}
	};

	int opt;
	int option_index = 0;
	while ((opt = getopt_long(argc, argv, "dl:h", long_options, &option_index)) != -1) {
		switch (opt) {
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

	// No terminal is attached once launched; everything goes to the log file
	if (log_file.empty()) {
		log_file = Config::get_default_shepherd_log_path();
	}
	ensure_parent_directory(log_file);
	// Keep stderr as the sink if the log file cannot be opened
	if (Logger::instance().set_log_file(log_file)) {
		Logger::instance().set_console_output(false);
	}
	Logger::instance().set_process_tag("shepherd[" + std::to_string(getpid()) + "]");
	if (g_debug_level > 0) {
		Logger::instance().set_log_level(LogLevel::DEBUG);
	}

	ShepherdLaunchConfig config;
	try {
		config = ShepherdLaunchConfig::from_json(nlohmann::json::parse(argv[optind]));
	} catch (const nlohmann::json::exception& e) {
		LOG_FATAL(std::string("Invalid JSON config: ") + e.what());
		std::cerr << "shepherd: invalid JSON config" << std::endl;
		return 1;
	} catch (const ShepherdProcessError& e) {
		LOG_FATAL(e.what());
		std::cerr << "shepherd: " << e.what() << std::endl;
		return 1;
	}

	if (!setup_socket_directory(config.socket_path) || !install_signal_handlers()) {
		return 1;
	}

	EventLoop loop;
	ShepherdProcess process(loop, []() {
		return std::unique_ptr<PtyBackend>(new ForkPty());
	}, config.socket_path, config.replay_buffer_bytes);

	try {
		process.start(config.command, config.cols, config.rows);
	} catch (const std::exception& e) {
		LOG_FATAL(std::string("Startup failed: ") + e.what());
		std::cerr << "shepherd: " << e.what() << std::endl;
		return 1;
	}

	report_started(process.get_start_time());
	LOG_INFO("Shepherd started for " + config.command.command + " on " + config.socket_path);

	loop.watch(signal_pipe[0], POLLIN, [&](short) {
		unsigned char sigs[64];
		ssize_t n;
		bool child = false;
		bool terminate = false;
		while ((n = read(signal_pipe[0], sigs, sizeof(sigs))) > 0) {
			for (ssize_t i = 0; i < n; i++) {
				if (sigs[i] == SIGCHLD) {
					child = true;
				} else if (sigs[i] == SIGTERM || sigs[i] == SIGINT) {
					terminate = true;
				}
			}
		}
		if (child) {
			process.handle_child_exit();
		}
		if (terminate) {
			LOG_INFO("Termination signal received");
			process.shutdown();
			loop.stop();
		}
	});

	// A SIGCHLD may have landed before the watch existed
	process.handle_child_exit();

	loop.run();

	LOG_INFO("Shepherd exiting");
	return 0;
}
