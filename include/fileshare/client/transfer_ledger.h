/**
 * @file transfer_ledger.h
 * @brief Persisted record of completed downloads
 *
 * The ledger maps a server-relative path to the byte count of its last
 * complete download. On disk it is stored as
 * {"files": {"relative/path": 123, ...}}.
 */

#ifndef FILESHARE_CLIENT_TRANSFER_LEDGER_H
#define FILESHARE_CLIENT_TRANSFER_LEDGER_H

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "fileshare/core/types.h"

namespace fileshare {

/**
 * @brief In-memory ledger contents
 */
class transfer_ledger {
public:
    using entry_map = std::map<std::string, int64_t>;

    transfer_ledger() = default;
    explicit transfer_ledger(entry_map entries) : entries_(std::move(entries)) {}

    /**
     * @brief Load a ledger file
     *
     * Never fails: a missing, unreadable or corrupt file yields an empty
     * ledger (with a warning for the latter two).
     */
    [[nodiscard]] static auto load(const std::filesystem::path& file) -> transfer_ledger;

    /**
     * @brief Write the whole ledger to @p file
     */
    [[nodiscard]] auto save(const std::filesystem::path& file) const -> result<void>;

    [[nodiscard]] auto get(const std::string& path) const -> std::optional<int64_t>;

    void set(const std::string& path, int64_t size) { entries_[path] = size; }

    [[nodiscard]] auto entries() const -> const entry_map& { return entries_; }

    [[nodiscard]] auto size() const -> std::size_t { return entries_.size(); }

    [[nodiscard]] auto empty() const -> bool { return entries_.empty(); }

private:
    entry_map entries_;
};

/**
 * @brief Single owner of one ledger file
 *
 * Every update is a load, merge and save of the whole file performed under
 * one lock, so concurrent workers never lose each other's entries. Create
 * one store per ledger file and share it between workers.
 */
class ledger_store {
public:
    explicit ledger_store(std::filesystem::path file);

    ledger_store(const ledger_store&) = delete;
    auto operator=(const ledger_store&) -> ledger_store& = delete;

    /**
     * @brief Persist {path: size}
     *
     * A save failure is logged and returned; the caller's transfer is not
     * affected by it.
     */
    auto record(const std::string& path, int64_t size) -> result<void>;

    /**
     * @brief Current on-disk contents
     */
    [[nodiscard]] auto snapshot() const -> transfer_ledger;

    [[nodiscard]] auto file() const -> const std::filesystem::path& { return file_; }

private:
    std::filesystem::path file_;
    mutable std::mutex mutex_;
};

}  // namespace fileshare

#endif  // FILESHARE_CLIENT_TRANSFER_LEDGER_H
