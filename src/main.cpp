#include "config.hpp"
#include "formatters.hpp"
#include "http_server.hpp"
#include "server_log.hpp"
#include "tail_cursor.hpp"

#include <iostream>
#include <csignal>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>

using namespace sandbox_tail;

std::atomic<bool> running{true};
CancelToken interrupt;

void signal_handler(int) {
    running = false;
    interrupt.cancel();
}

std::shared_ptr<httplib::Client> make_upstream(const Config& config, Endpoint& endpoint) {
    endpoint = split_endpoint(config.endpoint);
    auto client = std::make_shared<httplib::Client>(endpoint.origin);
    client->set_connection_timeout(std::chrono::milliseconds(config.timeout_ms));
    client->set_read_timeout(std::chrono::milliseconds(config.timeout_ms));
    client->set_keep_alive(true);
    return client;
}

int run_serve(const Config& config) {
    Endpoint endpoint;
    auto upstream = make_upstream(config, endpoint);

    ServiceOptions options;
    options.agent_id = config.coords.agent_id;
    options.read_path = endpoint.path;
    options.chunk_size = config.chunk_size;
    options.poll_interval_ms = config.poll_interval_ms;

    ServerLog::log("Main", "Upstream: " + endpoint.origin + endpoint.path);

    HttpServer http(config.http_port, upstream, options);
    http.start();

    ServerLog::log("Main", "Ready on http://localhost:" + std::to_string(http.port()) +
                   "/logs/v2/task/... Press Ctrl+C to stop.");

    while (running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    ServerLog::log("Main", "Stopping, " + std::to_string(http.active_streams()) + " open streams");
    http.stop();
    ServerLog::log("Main", "Shutdown complete");
    return 0;
}

int run_tail(const Config& config) {
    // stdout carries the file; diagnostics go to stderr
    ServerLog::set_sink([](LogLevel, const std::string& component, const std::string& message) {
        std::cerr << "[" << component << "] " << message << std::endl;
    });

    Endpoint endpoint;
    auto upstream = make_upstream(config, endpoint);

    auto cursor = TailCursor::open(upstream, endpoint.path, config.coords, config.file,
                                   formatter_by_name(config.format), config.read_config(), interrupt);
    ServerLog::debug("Tail", "Starting at offset " + std::to_string(cursor->offset()));

    try {
        while (running) {
            PullResult result;
            try {
                result = cursor->pull();
            } catch (const FormatError& e) {
                ServerLog::error("Tail", std::string("Skipping line: ") + e.what());
                continue;
            }

            if (!result.end_of_data()) {
                std::cout << result.data;
                continue;
            }
            if (!config.follow) {
                break;
            }
            std::cout.flush();
            std::this_thread::sleep_for(std::chrono::milliseconds(config.poll_interval_ms));
        }
    } catch (const CancelledError& e) {
        ServerLog::debug("Tail", std::string("Interrupted: ") + e.what());
    }

    std::cout.flush();
    ServerLog::debug("Tail", std::to_string(cursor->emitted()) + " lines, stopped at offset " +
                     std::to_string(cursor->offset()));
    return 0;
}

int main(int argc, char* argv[]) {
    Config config;
    try {
        config = parse_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    if (config.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    ServerLog::set_verbose(config.verbose);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        if (config.mode == Mode::Tail) {
            return run_tail(config);
        }
        return run_serve(config);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
