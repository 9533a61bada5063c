// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Worker pool adapter implementation
 */

#include "fileshare/adapters/thread_pool_adapter.h"
#include "fileshare/core/logging.h"

#include <exception>
#include <stdexcept>
#include <thread>

#if KCENON_WITH_THREAD_SYSTEM
// Suppress deprecation warnings from thread_system headers
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace fileshare::adapters {

namespace {

auto resolve_worker_count(size_t requested) -> size_t {
    if (requested > 0) {
        return requested;
    }
    auto count = std::thread::hardware_concurrency();
    return count > 0 ? count : 4;
}

/**
 * @brief Releases one pending-task slot when the task finishes
 */
class pending_guard {
public:
    explicit pending_guard(std::atomic<size_t>& pending) : pending_(pending) {}
    ~pending_guard() { pending_.fetch_sub(1, std::memory_order_relaxed); }

    pending_guard(const pending_guard&) = delete;
    pending_guard& operator=(const pending_guard&) = delete;

private:
    std::atomic<size_t>& pending_;
};

}  // namespace

// ============================================================================
// thread_system_transfer_adapter implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Job that wraps a function for thread_system execution
 */
class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name)
        : job(name), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (func_) {
            func_();
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
};

struct thread_system_transfer_adapter::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t worker_count{0};
    std::shared_ptr<std::atomic<size_t>> pending = std::make_shared<std::atomic<size_t>>(0);
};

thread_system_transfer_adapter::thread_system_transfer_adapter(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
}

thread_system_transfer_adapter::~thread_system_transfer_adapter() {
    if (pimpl_ && pimpl_->pool) {
        auto stopped = pimpl_->pool->stop(false);
        if (stopped.is_err()) {
            FS_LOG_WARN(log_category::batch,
                        "Failed to stop worker pool '" + pimpl_->pool_name + "'");
        }
    }
}

std::shared_ptr<thread_system_transfer_adapter>
thread_system_transfer_adapter::create_default(size_t worker_count,
                                                const std::string& pool_name) {
    worker_count = resolve_worker_count(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);

    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        auto added = pool->enqueue(std::move(worker));
        if (added.is_err()) {
            FS_LOG_ERROR(log_category::batch,
                         "Failed to add worker to pool '" + pool_name + "'");
            return nullptr;
        }
    }

    auto started = pool->start();
    if (started.is_err()) {
        FS_LOG_ERROR(log_category::batch,
                     "Failed to start worker pool '" + pool_name + "'");
        return nullptr;
    }

    return std::make_shared<thread_system_transfer_adapter>(std::move(pool), pool_name,
                                                            worker_count);
}

std::future<void> thread_system_transfer_adapter::submit(std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    pimpl_->pending->fetch_add(1, std::memory_order_relaxed);
    auto pending = pimpl_->pending;
    auto wrapped_task = [task = std::move(task), promise, pending]() {
        std::exception_ptr failure;
        {
            pending_guard guard(*pending);
            try {
                task();
            } catch (...) {
                failure = std::current_exception();
            }
        }
        // The slot is released before the caller can observe completion
        if (failure) {
            promise->set_exception(failure);
        } else {
            promise->set_value();
        }
    };

    auto job = std::make_unique<function_job>(std::move(wrapped_task), "download_worker");
    auto enqueued = pimpl_->pool->enqueue(std::move(job));
    if (enqueued.is_err()) {
        pimpl_->pending->fetch_sub(1, std::memory_order_relaxed);
        promise->set_exception(std::make_exception_ptr(
            std::runtime_error("worker pool rejected task")));
    }

    return future;
}

size_t thread_system_transfer_adapter::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_transfer_adapter::is_running() const {
    return pimpl_->pool != nullptr;
}

size_t thread_system_transfer_adapter::pending_tasks() const {
    return pimpl_->pending->load(std::memory_order_relaxed);
}

std::string thread_system_transfer_adapter::pool_name() const {
    return pimpl_->pool_name;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// async_transfer_pool implementation
// ============================================================================

struct async_transfer_pool::impl {
    size_t worker_count{0};
    std::atomic<size_t> pending{0};
};

async_transfer_pool::async_transfer_pool(size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->worker_count = resolve_worker_count(worker_count);
}

async_transfer_pool::~async_transfer_pool() = default;

std::future<void> async_transfer_pool::submit(std::function<void()> task) {
    pimpl_->pending.fetch_add(1, std::memory_order_relaxed);

    auto* pimpl = pimpl_.get();
    return std::async(std::launch::async, [pimpl, task = std::move(task)]() {
        pending_guard guard(pimpl->pending);
        task();
    });
}

size_t async_transfer_pool::worker_count() const {
    return pimpl_->worker_count;
}

bool async_transfer_pool::is_running() const { return true; }

size_t async_transfer_pool::pending_tasks() const {
    return pimpl_->pending.load(std::memory_order_relaxed);
}

// ============================================================================
// transfer_pool_factory implementation
// ============================================================================

std::shared_ptr<transfer_thread_pool_interface> transfer_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    auto pool = thread_system_transfer_adapter::create_default(worker_count, pool_name);
    if (pool) {
        return pool;
    }
    FS_LOG_WARN(log_category::batch, "Falling back to std::async worker pool");
#else
    (void)pool_name;
#endif
    return std::make_shared<async_transfer_pool>(worker_count);
}

}  // namespace fileshare::adapters
