/**
 * @file batch_download.h
 * @brief Concurrent download of a whole server directory
 */

#ifndef FILESHARE_CLIENT_BATCH_DOWNLOAD_H
#define FILESHARE_CLIENT_BATCH_DOWNLOAD_H

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "fileshare/adapters/thread_pool_adapter.h"
#include "fileshare/client/client_types.h"
#include "fileshare/client/http_client.h"
#include "fileshare/client/single_file_transfer.h"
#include "fileshare/core/cancellation.h"
#include "fileshare/core/types.h"

namespace fileshare {

/**
 * @brief Fetch and decode GET {server_url}/list/{directory}
 *
 * Transport failures, non-2xx statuses (http_status_error, with the
 * server's error message when present) and undecodable bodies
 * (invalid_response) are errors.
 */
[[nodiscard]] auto fetch_listing(http_client_interface& http,
                                 const std::string& server_url,
                                 const std::string& directory) -> result<listing>;

/**
 * @brief Bounded FIFO of pending downloads
 *
 * Each task is handed to exactly one consumer. pop() blocks while the
 * queue is empty and open, and returns std::nullopt once it is closed and
 * drained.
 */
class download_task_queue {
public:
    explicit download_task_queue(std::size_t capacity);

    download_task_queue(const download_task_queue&) = delete;
    auto operator=(const download_task_queue&) -> download_task_queue& = delete;

    /**
     * @brief Add a task
     * @return false if the queue is closed or full
     */
    auto push(file_record task) -> bool;

    /**
     * @brief Reject further pushes and wake blocked consumers
     */
    void close();

    [[nodiscard]] auto pop() -> std::optional<file_record>;

    [[nodiscard]] auto size() const -> std::size_t;

    [[nodiscard]] auto is_closed() const -> bool;

private:
    std::size_t capacity_;
    std::deque<file_record> tasks_;
    bool closed_ = false;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
};

/**
 * @brief Downloads every file of a server directory with C workers
 *
 * One listing request, then the files are queued and exactly C workers
 * drain the queue, each running the transfer function to completion for
 * every task it dequeues. run() returns after all workers exited.
 * Per-file failures are recorded in the summary and never abort the batch.
 */
class batch_download_orchestrator {
public:
    /// Runs one task; the worker id is in [0, C)
    using transfer_function = std::function<transfer_outcome(
        const file_record&, const cancellation_token&, std::size_t)>;

    /**
     * @param concurrency Worker count; values below 1 are treated as 1
     */
    batch_download_orchestrator(std::shared_ptr<http_client_interface> http,
                                std::string server_url,
                                transfer_function transfer,
                                std::size_t concurrency);

    /**
     * @brief Convenience constructor running @p transfer for every task
     */
    batch_download_orchestrator(std::shared_ptr<http_client_interface> http,
                                std::string server_url,
                                std::shared_ptr<const single_file_transfer> transfer,
                                std::size_t concurrency);

    /**
     * @brief Download @p directory
     *
     * Fails only when the listing cannot be obtained. An empty listing is
     * a successful, empty summary. Once @p token is cancelled workers stop
     * taking tasks; tasks never dequeued do not appear in the outcomes.
     */
    [[nodiscard]] auto run(const std::string& directory,
                           const cancellation_token& token) const -> result<batch_summary>;

    [[nodiscard]] auto concurrency() const -> std::size_t { return concurrency_; }

private:
    std::shared_ptr<http_client_interface> http_;
    std::string server_url_;
    transfer_function transfer_;
    std::size_t concurrency_;
};

}  // namespace fileshare

#endif  // FILESHARE_CLIENT_BATCH_DOWNLOAD_H
