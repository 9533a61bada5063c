/**
 * @file transfer_ledger.cpp
 * @brief Ledger persistence
 */

#include "fileshare/client/transfer_ledger.h"
#include "fileshare/core/json_codec.h"
#include "fileshare/core/logging.h"

#include <fstream>
#include <sstream>

namespace fileshare {

namespace fs = std::filesystem;

auto transfer_ledger::load(const fs::path& file) -> transfer_ledger {
    std::error_code ec;
    if (!fs::exists(file, ec)) {
        FS_LOG_TRACE(log_category::ledger, "No ledger at " + file.string());
        return {};
    }

    std::ifstream in(file, std::ios::binary);
    if (!in) {
        FS_LOG_WARN(log_category::ledger,
            "Failed to open ledger, starting empty: " + file.string());
        return {};
    }

    std::ostringstream oss;
    oss << in.rdbuf();

    auto decoded = json_codec::decode_ledger(oss.str());
    if (!decoded) {
        FS_LOG_WARN(log_category::ledger,
            "Corrupt ledger " + file.string() + " (" + decoded.error().message +
            "), starting empty");
        return {};
    }

    return transfer_ledger{std::move(decoded.value())};
}

auto transfer_ledger::save(const fs::path& file) const -> result<void> {
    std::ofstream out(file, std::ios::binary | std::ios::trunc);
    if (!out) {
        FS_LOG_ERROR(log_category::ledger,
            "Failed to open ledger for writing: " + file.string());
        return unexpected{error{error_code::file_write_error,
                               "failed to open ledger for writing"}};
    }

    out << json_codec::encode_ledger(entries_);
    out.flush();
    if (!out) {
        FS_LOG_ERROR(log_category::ledger, "Failed to write ledger: " + file.string());
        return unexpected{error{error_code::file_write_error, "failed to write ledger"}};
    }

    FS_LOG_TRACE(log_category::ledger,
        "Ledger persisted to " + file.string() + " (" + std::to_string(entries_.size()) +
        " entries)");
    return {};
}

auto transfer_ledger::get(const std::string& path) const -> std::optional<int64_t> {
    auto it = entries_.find(path);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

ledger_store::ledger_store(fs::path file) : file_(std::move(file)) {}

auto ledger_store::record(const std::string& path, int64_t size) -> result<void> {
    std::lock_guard<std::mutex> lock(mutex_);

    auto ledger = transfer_ledger::load(file_);
    ledger.set(path, size);

    auto saved = ledger.save(file_);
    if (!saved) {
        transfer_log_context ctx;
        ctx.path = path;
        ctx.bytes_written = size;
        ctx.error_message = saved.error().message;
        FS_LOG_WARN_CTX(log_category::ledger, "Ledger update not persisted", ctx);
        return saved;
    }
    return {};
}

auto ledger_store::snapshot() const -> transfer_ledger {
    std::lock_guard<std::mutex> lock(mutex_);
    return transfer_ledger::load(file_);
}

}  // namespace fileshare
