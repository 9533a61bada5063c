// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Worker pool adapter used by the batch downloader
 *
 * Provides one submit interface over thread_system's thread_pool, with a
 * std::async fallback when thread_system is not compiled in.
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "fileshare/config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace fileshare::adapters {

/**
 * @brief Interface for the pool that runs download workers
 */
class transfer_thread_pool_interface {
public:
    virtual ~transfer_thread_pool_interface() = default;

    /**
     * @brief Submit a task for execution
     * @return Future that becomes ready when the task finished (or threw)
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    [[nodiscard]] virtual size_t worker_count() const = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Number of submitted tasks that have not finished yet
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Adapter that wraps thread_system::thread_pool
 *
 * The adapter owns the pool it creates and stops it on destruction, after
 * the already queued jobs have run.
 */
class thread_system_transfer_adapter : public transfer_thread_pool_interface {
public:
    thread_system_transfer_adapter(std::shared_ptr<kcenon::thread::thread_pool> pool,
                                   const std::string& pool_name,
                                   size_t worker_count);

    ~thread_system_transfer_adapter() override;

    thread_system_transfer_adapter(const thread_system_transfer_adapter&) = delete;
    thread_system_transfer_adapter& operator=(const thread_system_transfer_adapter&) = delete;

    /**
     * @brief Create a started pool with @p worker_count workers
     * @param worker_count Number of worker threads (0 = hardware concurrency)
     */
    [[nodiscard]] static std::shared_ptr<thread_system_transfer_adapter> create_default(
        size_t worker_count, const std::string& pool_name);

    std::future<void> submit(std::function<void()> task) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;

    [[nodiscard]] std::string pool_name() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fallback pool that runs every task on its own std::async thread
 *
 * worker_count() reports the count requested at construction; there is no
 * queue, so every submitted task starts immediately.
 */
class async_transfer_pool : public transfer_thread_pool_interface {
public:
    explicit async_transfer_pool(size_t worker_count = 0);
    ~async_transfer_pool() override;

    async_transfer_pool(const async_transfer_pool&) = delete;
    async_transfer_pool& operator=(const async_transfer_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

/**
 * @brief Factory selecting the best available pool
 *
 * 1. thread_system_transfer_adapter (when KCENON_WITH_THREAD_SYSTEM)
 * 2. async_transfer_pool (fallback)
 */
class transfer_pool_factory {
public:
    [[nodiscard]] static std::shared_ptr<transfer_thread_pool_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = "fileshare_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace fileshare::adapters
