// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Worker pool abstraction for chunk sending
 *
 * The transfer scheduler runs its send loops on a pool obtained from
 * transfer_pool_factory. With thread_system available the pool is a
 * kcenon::thread::thread_pool; otherwise each task runs on std::async.
 *
 * @code
 * auto pool = transfer_pool_factory::create(4, "upload_pool");
 * auto done = pool->submit([] { send_next_chunk(); });
 * done.wait();
 * @endcode
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::chunked_upload::adapters {

/**
 * @brief Minimal pool interface used by the scheduler
 */
class transfer_thread_pool_interface {
public:
    virtual ~transfer_thread_pool_interface() = default;

    /**
     * @brief Run @p task on a worker
     * @return Future that becomes ready when the task returns or throws
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    [[nodiscard]] virtual size_t worker_count() const = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Tasks submitted but not yet finished
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;

    /**
     * @brief Stop accepting work
     *
     * Returns without waiting for tasks already running; callers that need
     * them finished wait on the futures submit() returned.
     */
    virtual void shutdown() = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Pool backed by thread_system
 */
class thread_system_transfer_adapter : public transfer_thread_pool_interface {
public:
    thread_system_transfer_adapter(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& pool_name,
        size_t worker_count);

    ~thread_system_transfer_adapter() override;

    thread_system_transfer_adapter(const thread_system_transfer_adapter&) = delete;
    thread_system_transfer_adapter& operator=(const thread_system_transfer_adapter&) = delete;

    /**
     * @brief Create, populate and start a thread_system pool
     * @param worker_count Number of workers; 0 means hardware concurrency
     */
    [[nodiscard]] static std::shared_ptr<thread_system_transfer_adapter> create(
        size_t worker_count, const std::string& pool_name);

    std::future<void> submit(std::function<void()> task) override;
    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    void shutdown() override;

    [[nodiscard]] std::string pool_name() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fallback pool that starts one std::async task per submission
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
    void shutdown() override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

/**
 * @brief Picks the best available pool implementation
 */
class transfer_pool_factory {
public:
    [[nodiscard]] static std::shared_ptr<transfer_thread_pool_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = "chunked_upload_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::chunked_upload::adapters
