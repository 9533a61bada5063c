/**
 * @file fileshare_server.cpp
 * @brief Command-line file sharing server
 *
 * Usage: fileshare_server [-p|--port PORT] [-d|--path DIR] [-v|--verbose] [--json-log]
 */

#include <fileshare/core/logging.h>
#include <fileshare/server/file_share_server.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

using namespace fileshare;

// Global flag for graceful shutdown
static std::atomic<bool> running{true};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        running = false;
    }
}

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\n"
              << "Options:\n"
              << "  -p, --port PORT   server port (default: 8080)\n"
              << "  -d, --path DIR    root directory path (default: .)\n"
              << "  -v, --verbose     enable debug logging\n"
              << "      --json-log    write logs as JSON lines\n"
              << "  -h, --help        show this help\n";
}

auto parse_port(const std::string& text) -> std::optional<uint16_t> {
    try {
        std::size_t consumed = 0;
        auto value = std::stoul(text, &consumed);
        if (consumed != text.size() || value == 0 || value > 65535) {
            return std::nullopt;
        }
        return static_cast<uint16_t>(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    server_config config;
    bool verbose = false;
    bool json_log = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next_value = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-p" || arg == "--port") {
            auto value = next_value();
            if (!value) return 1;
            auto port = parse_port(*value);
            if (!port) {
                std::cerr << "Invalid port: " << *value << std::endl;
                return 1;
            }
            config.port = *port;
        } else if (arg == "-d" || arg == "--path") {
            auto value = next_value();
            if (!value) return 1;
            config.root_directory = *value;
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (arg == "--json-log") {
            json_log = true;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    auto& logger = get_logger();
    logger.set_level(verbose ? log_level::debug : log_level::info);
    if (json_log) {
        logger.set_output_format(log_output_format::json);
    }
    logger.initialize();

    auto server_result = file_share_server::builder()
        .with_root_directory(config.root_directory)
        .with_port(config.port)
        .build();

    if (!server_result.has_value()) {
        std::cerr << "Failed to create server: "
                  << server_result.error().message << std::endl;
        return 1;
    }

    auto& server = server_result.value();

    auto start_result = server.start();
    if (!start_result.has_value()) {
        std::cerr << "Failed to start server: "
                  << start_result.error().message << std::endl;
        return 1;
    }

    std::cout << "Server starting on port " << server.port()
              << ", serving files from " << server.config().root_directory.string()
              << std::endl;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    while (running && server.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    auto stop_result = server.stop();
    if (!stop_result.has_value()) {
        std::cerr << "Error during shutdown: "
                  << stop_result.error().message << std::endl;
    }

    logger.shutdown();
    return 0;
}
