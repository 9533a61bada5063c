/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>

namespace fileshare::benchmark {

temp_tree::temp_tree(const std::string& prefix) {
    root_ = std::filesystem::temp_directory_path() /
            (prefix + "_" + std::to_string(std::random_device{}()));
    std::filesystem::create_directories(root_);
}

temp_tree::~temp_tree() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
}

auto temp_tree::create_file(const std::string& relative, std::size_t size, uint32_t seed)
    -> std::filesystem::path {
    auto path = root_ / relative;
    std::filesystem::create_directories(path.parent_path());

    std::string data(size, '\0');
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> dis(0, 255);
    for (auto& byte : data) {
        byte = static_cast<char>(dis(gen));
    }

    std::ofstream out(path, std::ios::binary);
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    return path;
}

auto temp_tree::populate(const std::string& base,
                         std::size_t file_count,
                         std::size_t dir_count,
                         std::size_t file_size) -> std::vector<std::string> {
    std::vector<std::string> paths;
    paths.reserve(file_count);
    if (dir_count == 0) {
        dir_count = 1;
    }
    for (std::size_t i = 0; i < file_count; ++i) {
        auto relative = base + "/dir" + std::to_string(i % dir_count) + "/file" +
                        std::to_string(i) + ".bin";
        create_file(relative, file_size, static_cast<uint32_t>(i + 1));
        paths.push_back(std::move(relative));
    }
    return paths;
}

auto format_bytes(uint64_t bytes) -> std::string {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;
    auto size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit_index < 4) {
        size /= 1024.0;
        ++unit_index;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(unit_index == 0 ? 0 : 2) << size << " "
        << units[unit_index];
    return oss.str();
}

}  // namespace fileshare::benchmark
