/**
 * @file fileshare_client.cpp
 * @brief Command-line file sharing client
 *
 * Usage:
 *   fileshare_client [options] download <file_path>
 *   fileshare_client [options] downloaddir <dir_path>
 *   fileshare_client [options] list [dir_path]
 */

#include <fileshare/client/file_share_client.h>
#include <fileshare/core/logging.h>

#include <chrono>
#include <csignal>
#include <exception>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace fileshare;

// Cancelled on SIGINT/SIGTERM so running workers stop taking files
static cancellation_token shutdown_token;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        shutdown_token.cancel();
    }
}

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options] <command> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  download <file_path>    download a single file\n"
              << "  downloaddir <dir_path>  download a directory recursively\n"
              << "  list [dir_path]         list available directories (default: .)\n"
              << "\n"
              << "Options:\n"
              << "  -s, --server URL        server URL (default: http://localhost:8080)\n"
              << "  -o, --output DIR        save path (default: .)\n"
              << "  -c, --concurrency N     download concurrency (default: 5)\n"
              << "  -r, --resume FILE       transfer state file (default: .download_state.json)\n"
              << "  -t, --timeout SEC       per-request timeout, 0 for none (default: 0)\n"
              << "  -v, --verbose           enable debug logging\n"
              << "      --json-log          write logs as JSON lines\n"
              << "  -h, --help              show this help\n";
}

auto format_mb(int64_t bytes) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2)
        << static_cast<double>(bytes) / 1024.0 / 1024.0 << " MB";
    return oss.str();
}

auto run_download(file_share_client& client, const std::string& path) -> int {
    auto outcome = client.download_file(path, shutdown_token);
    switch (outcome.status) {
        case transfer_status::downloaded:
            std::cout << "Downloaded: " << path << " (" << format_mb(outcome.bytes_written)
                      << ")" << std::endl;
            return 0;
        case transfer_status::skipped:
            std::cout << "File " << path << " already exists and is complete, skipped"
                      << std::endl;
            return 0;
        case transfer_status::cancelled:
            std::cout << "Download of " << path << " cancelled" << std::endl;
            return 1;
        case transfer_status::failed:
        default:
            std::cerr << "Download of " << path << " failed: " << outcome.error_message
                      << std::endl;
            return 1;
    }
}

auto run_download_directory(file_share_client& client, const std::string& path) -> int {
    auto summary = client.download_directory(path, shutdown_token);
    if (!summary) {
        std::cerr << "Failed to list directory " << path << ": "
                  << summary.error().message << std::endl;
        return 1;
    }

    const auto& s = summary.value();
    if (s.total_files == 0) {
        std::cout << "Directory " << path << " is empty or does not exist" << std::endl;
        return 0;
    }

    std::cout << "Directory download finished: " << path << "\n"
              << "  files:      " << s.total_files << "\n"
              << "  downloaded: " << s.downloaded << " (" << format_mb(
                     static_cast<int64_t>(s.total_bytes)) << ")\n"
              << "  skipped:    " << s.skipped << "\n"
              << "  failed:     " << s.failed << "\n"
              << "  cancelled:  " << s.cancelled << "\n"
              << "  elapsed:    " << s.elapsed.count() << " ms" << std::endl;

    for (const auto& outcome : s.outcomes) {
        if (outcome.status == transfer_status::failed) {
            std::cerr << "  failed: " << outcome.path << ": " << outcome.error_message
                      << std::endl;
        }
    }
    return s.failed == 0 && s.cancelled == 0 ? 0 : 1;
}

auto run_list(file_share_client& client, const std::string& path) -> int {
    auto directories = client.list_directories(path);
    if (!directories) {
        std::cerr << "Failed to list " << path << ": " << directories.error().message
                  << std::endl;
        return 1;
    }

    std::cout << "Available directories:" << std::endl;
    for (const auto& dir : directories.value()) {
        std::cout << "- " << dir << std::endl;
    }
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    client_config config;
    bool verbose = false;
    bool json_log = false;
    std::vector<std::string> positional;

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
        } else if (arg == "-s" || arg == "--server") {
            auto value = next_value();
            if (!value) return 1;
            config.server_url = *value;
        } else if (arg == "-o" || arg == "--output") {
            auto value = next_value();
            if (!value) return 1;
            config.save_directory = *value;
        } else if (arg == "-c" || arg == "--concurrency") {
            auto value = next_value();
            if (!value) return 1;
            try {
                auto workers = std::stol(*value);
                config.concurrency = workers < 1 ? 1 : static_cast<std::size_t>(workers);
            } catch (const std::exception&) {
                std::cerr << "Invalid concurrency: " << *value << std::endl;
                return 1;
            }
        } else if (arg == "-r" || arg == "--resume") {
            auto value = next_value();
            if (!value) return 1;
            config.ledger_path = *value;
        } else if (arg == "-t" || arg == "--timeout") {
            auto value = next_value();
            if (!value) return 1;
            try {
                auto seconds = std::stol(*value);
                if (seconds < 0) {
                    throw std::invalid_argument("negative timeout");
                }
                config.request_timeout = std::chrono::seconds(seconds);
            } catch (const std::exception&) {
                std::cerr << "Invalid timeout: " << *value << std::endl;
                return 1;
            }
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (arg == "--json-log") {
            json_log = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    const auto& command = positional[0];
    const bool needs_path = command == "download" || command == "downloaddir";
    if ((needs_path && positional.size() != 2) ||
        (command == "list" && positional.size() > 2)) {
        std::cerr << "Wrong number of arguments for " << command << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    auto& logger = get_logger();
    logger.set_level(verbose ? log_level::debug : log_level::warn);
    if (json_log) {
        logger.set_output_format(log_output_format::json);
    }
    logger.initialize();

    auto client_result = file_share_client::builder()
        .with_server_url(config.server_url)
        .with_save_directory(config.save_directory)
        .with_concurrency(config.concurrency)
        .with_ledger_path(config.ledger_path)
        .with_request_timeout(config.request_timeout)
        .build();

    if (!client_result.has_value()) {
        std::cerr << "Failed to create client: "
                  << client_result.error().message << std::endl;
        return 1;
    }
    auto& client = client_result.value();

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    int exit_code = 1;
    if (command == "download") {
        exit_code = run_download(client, positional[1]);
    } else if (command == "downloaddir") {
        exit_code = run_download_directory(client, positional[1]);
    } else if (command == "list") {
        exit_code = run_list(client, positional.size() > 1 ? positional[1] : ".");
    } else {
        std::cerr << "Unknown command: " << command << std::endl;
        print_usage(argv[0]);
    }

    logger.shutdown();
    return exit_code;
}
