/**
 * @file batch_download.cpp
 * @brief Directory download orchestration
 */

#include "fileshare/client/batch_download.h"
#include "fileshare/core/json_codec.h"
#include "fileshare/core/logging.h"
#include "fileshare/core/url_codec.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <vector>

namespace fileshare {

auto fetch_listing(http_client_interface& http,
                   const std::string& server_url,
                   const std::string& directory) -> result<listing> {
    auto url = url_codec::join_url(server_url,
        "list/" + url_codec::url_encode(directory, true));

    auto response = http.get(url);
    if (!response) {
        return unexpected{response.error()};
    }

    const auto& reply = response.value();
    if (!reply.is_success()) {
        auto message = "server returned status " + std::to_string(reply.status_code);
        if (auto server_error = json_codec::decode_error(reply.get_body_string())) {
            message += ": " + *server_error;
        }
        return unexpected{error{error_code::http_status_error, message}};
    }

    auto files = json_codec::decode_listing(reply.get_body_string());
    if (!files) {
        return unexpected{error{error_code::invalid_response,
                               "failed to parse listing: " + files.error().message}};
    }
    return files;
}

// ============================================================================
// download_task_queue
// ============================================================================

download_task_queue::download_task_queue(std::size_t capacity) : capacity_(capacity) {}

auto download_task_queue::push(file_record task) -> bool {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || tasks_.size() >= capacity_) {
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    not_empty_.notify_one();
    return true;
}

void download_task_queue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    not_empty_.notify_all();
}

auto download_task_queue::pop() -> std::optional<file_record> {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [this] { return closed_ || !tasks_.empty(); });
    if (tasks_.empty()) {
        return std::nullopt;
    }
    auto task = std::move(tasks_.front());
    tasks_.pop_front();
    return task;
}

auto download_task_queue::size() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

auto download_task_queue::is_closed() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

// ============================================================================
// batch_download_orchestrator
// ============================================================================

batch_download_orchestrator::batch_download_orchestrator(
    std::shared_ptr<http_client_interface> http,
    std::string server_url,
    transfer_function transfer,
    std::size_t concurrency)
    : http_(std::move(http)),
      server_url_(std::move(server_url)),
      transfer_(std::move(transfer)),
      concurrency_(std::max<std::size_t>(concurrency, 1)) {}

batch_download_orchestrator::batch_download_orchestrator(
    std::shared_ptr<http_client_interface> http,
    std::string server_url,
    std::shared_ptr<const single_file_transfer> transfer,
    std::size_t concurrency)
    : batch_download_orchestrator(
          std::move(http), std::move(server_url),
          [transfer = std::move(transfer)](const file_record& task,
                                           const cancellation_token& token,
                                           std::size_t worker_id) {
              return transfer->run(task.path, token, worker_id);
          },
          concurrency) {}

auto batch_download_orchestrator::run(const std::string& directory,
                                      const cancellation_token& token) const
    -> result<batch_summary> {
    const auto started = std::chrono::steady_clock::now();

    FS_LOG_INFO(log_category::batch, "Fetching listing of " + directory);
    auto files = fetch_listing(*http_, server_url_, directory);
    if (!files) {
        FS_LOG_ERROR(log_category::batch,
            "Failed to list " + directory + ": " + files.error().message);
        return unexpected{files.error()};
    }

    batch_summary summary;
    summary.directory = directory;
    summary.total_files = files.value().size();

    if (files.value().empty()) {
        FS_LOG_INFO(log_category::batch, "Directory " + directory + " is empty or missing");
        return summary;
    }

    download_task_queue queue(files.value().size());
    for (auto& file : files.value()) {
        if (!queue.push(std::move(file))) {
            return unexpected{error{error_code::internal_error, "download queue rejected a task"}};
        }
    }
    queue.close();

    FS_LOG_INFO(log_category::batch,
        "Downloading " + std::to_string(summary.total_files) + " files with " +
        std::to_string(concurrency_) + " workers");

    std::mutex outcomes_mutex;
    auto worker_loop = [&](std::size_t worker_id) {
        while (!token.is_cancelled()) {
            auto task = queue.pop();
            if (!task) {
                break;
            }

            transfer_outcome outcome;
            try {
                outcome = transfer_(*task, token, worker_id);
            } catch (const std::exception& e) {
                outcome.path = task->path;
                outcome.status = transfer_status::failed;
                outcome.code = error_code::internal_error;
                outcome.error_message = e.what();
                FS_LOG_ERROR(log_category::batch,
                    "Transfer of " + task->path + " threw: " + e.what());
            }

            std::lock_guard<std::mutex> lock(outcomes_mutex);
            summary.outcomes.push_back(std::move(outcome));
        }
    };

    auto pool = adapters::transfer_pool_factory::create(concurrency_, "batch_download");
    std::vector<std::future<void>> workers;
    workers.reserve(concurrency_);
    for (std::size_t i = 0; i < concurrency_; ++i) {
        workers.push_back(pool->submit([&worker_loop, i] { worker_loop(i); }));
    }

    for (std::size_t i = 0; i < workers.size(); ++i) {
        try {
            workers[i].get();
        } catch (const std::exception& e) {
            FS_LOG_ERROR(log_category::batch,
                "Worker " + std::to_string(i) + " terminated: " + e.what());
        }
    }

    for (const auto& outcome : summary.outcomes) {
        switch (outcome.status) {
            case transfer_status::downloaded:
                ++summary.downloaded;
                summary.total_bytes += static_cast<uint64_t>(outcome.bytes_written);
                break;
            case transfer_status::skipped:
                ++summary.skipped;
                break;
            case transfer_status::failed:
                ++summary.failed;
                break;
            case transfer_status::cancelled:
                ++summary.cancelled;
                break;
        }
    }
    summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (token.is_cancelled()) {
        FS_LOG_WARN(log_category::batch,
            "Directory download cancelled: " + directory + " (" +
            std::to_string(summary.processed()) + "/" +
            std::to_string(summary.total_files) + " processed)");
    } else {
        FS_LOG_INFO(log_category::batch,
            "Directory download complete: " + directory + " (" +
            std::to_string(summary.downloaded) + " downloaded, " +
            std::to_string(summary.skipped) + " skipped, " +
            std::to_string(summary.failed) + " failed)");
    }
    return summary;
}

}  // namespace fileshare
