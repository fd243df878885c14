// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Worker pool implementations for chunk sending
 */

#include "kcenon/chunked_upload/adapters/thread_pool_adapter.h"

#include <mutex>
#include <stdexcept>
#include <thread>

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#endif

namespace kcenon::chunked_upload::adapters {

namespace {

auto resolve_worker_count(size_t requested) -> size_t {
    if (requested > 0) {
        return requested;
    }
    auto hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 4;
}

}  // namespace

// ============================================================================
// thread_system_transfer_adapter
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

namespace {

/**
 * @brief Wraps a task so its outcome reaches a promise and a counter drops
 */
auto make_tracked_task(std::function<void()> task,
                       std::shared_ptr<std::promise<void>> promise,
                       std::shared_ptr<std::atomic<size_t>> active) {
    return [task = std::move(task), promise = std::move(promise),
            active = std::move(active)]() {
        try {
            task();
            promise->set_value();
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
        active->fetch_sub(1, std::memory_order_relaxed);
    };
}

}  // namespace

class upload_task_job : public kcenon::thread::job {
public:
    explicit upload_task_job(std::function<void()> func)
        : job("chunked_upload_task"), func_(std::move(func)) {}

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
    std::shared_ptr<std::atomic<size_t>> active = std::make_shared<std::atomic<size_t>>(0);
    std::once_flag stopped;
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
    shutdown();
}

std::shared_ptr<thread_system_transfer_adapter>
thread_system_transfer_adapter::create(size_t worker_count, const std::string& pool_name) {
    worker_count = resolve_worker_count(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);
    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }
    pool->start();

    return std::make_shared<thread_system_transfer_adapter>(
        std::move(pool), pool_name, worker_count);
}

std::future<void> thread_system_transfer_adapter::submit(std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    pimpl_->active->fetch_add(1, std::memory_order_relaxed);
    auto job = std::make_unique<upload_task_job>(
        make_tracked_task(std::move(task), promise, pimpl_->active));

    auto enqueue_result = pimpl_->pool->enqueue(std::move(job));
    if (!enqueue_result.is_ok()) {
        pimpl_->active->fetch_sub(1, std::memory_order_relaxed);
        promise->set_exception(std::make_exception_ptr(
            std::runtime_error("thread pool rejected task")));
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
    return pimpl_->active->load(std::memory_order_relaxed);
}

void thread_system_transfer_adapter::shutdown() {
    std::call_once(pimpl_->stopped, [this] {
        if (pimpl_->pool) {
            pimpl_->pool->stop(false);
        }
    });
}

std::string thread_system_transfer_adapter::pool_name() const {
    return pimpl_->pool_name;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// async_transfer_pool
// ============================================================================

struct async_transfer_pool::impl {
    size_t worker_count{0};
    std::shared_ptr<std::atomic<size_t>> active = std::make_shared<std::atomic<size_t>>(0);
    std::atomic<bool> running{true};
};

async_transfer_pool::async_transfer_pool(size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->worker_count = resolve_worker_count(worker_count);
}

async_transfer_pool::~async_transfer_pool() = default;

std::future<void> async_transfer_pool::submit(std::function<void()> task) {
    if (!pimpl_->running.load()) {
        std::promise<void> rejected;
        rejected.set_exception(std::make_exception_ptr(
            std::runtime_error("pool is shut down")));
        return rejected.get_future();
    }

    pimpl_->active->fetch_add(1, std::memory_order_relaxed);
    return std::async(std::launch::async,
                      [active = pimpl_->active, task = std::move(task)]() {
                          struct release {
                              std::atomic<size_t>& counter;
                              ~release() { counter.fetch_sub(1, std::memory_order_relaxed); }
                          } guard{*active};
                          task();
                      });
}

size_t async_transfer_pool::worker_count() const {
    return pimpl_->worker_count;
}

bool async_transfer_pool::is_running() const {
    return pimpl_->running.load();
}

size_t async_transfer_pool::pending_tasks() const {
    return pimpl_->active->load(std::memory_order_relaxed);
}

void async_transfer_pool::shutdown() {
    pimpl_->running.store(false);
}

// ============================================================================
// transfer_pool_factory
// ============================================================================

std::shared_ptr<transfer_thread_pool_interface> transfer_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_transfer_adapter::create(worker_count, pool_name);
#else
    (void)pool_name;
    return std::make_shared<async_transfer_pool>(worker_count);
#endif
}

}  // namespace kcenon::chunked_upload::adapters
