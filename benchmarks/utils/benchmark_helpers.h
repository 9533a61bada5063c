/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef FILESHARE_BENCHMARKS_BENCHMARK_HELPERS_H
#define FILESHARE_BENCHMARKS_BENCHMARK_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace fileshare::benchmark {

/**
 * @brief Temporary directory tree that is removed on destruction
 */
class temp_tree {
public:
    /**
     * @brief Create an empty tree under the system temp directory
     * @param prefix Directory name prefix
     */
    explicit temp_tree(const std::string& prefix = "fileshare_bench");

    ~temp_tree();

    // Non-copyable
    temp_tree(const temp_tree&) = delete;
    auto operator=(const temp_tree&) -> temp_tree& = delete;

    /**
     * @brief Create a file of @p size random bytes at @p relative
     * @param relative Path below the tree root; parent directories are created
     * @param size File size
     * @param seed Random seed
     */
    auto create_file(const std::string& relative, std::size_t size, uint32_t seed = 42)
        -> std::filesystem::path;

    /**
     * @brief Spread @p file_count files over @p dir_count subdirectories of @p base
     * @return Relative paths of the created files
     */
    auto populate(const std::string& base,
                  std::size_t file_count,
                  std::size_t dir_count,
                  std::size_t file_size) -> std::vector<std::string>;

    [[nodiscard]] auto root() const -> const std::filesystem::path& { return root_; }

private:
    std::filesystem::path root_;
};

/**
 * @brief Format bytes as human-readable string
 * @param bytes Number of bytes
 * @return Formatted string (e.g., "1.5 GB")
 */
auto format_bytes(uint64_t bytes) -> std::string;

}  // namespace fileshare::benchmark

#endif  // FILESHARE_BENCHMARKS_BENCHMARK_HELPERS_H
