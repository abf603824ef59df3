/**
 * @file thread_pool_adapter.cpp
 * @brief Implementation of thread_pool_adapter
 */

#include <medimg/integration/thread_pool_adapter.hpp>

#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>
#include <kcenon/thread/interfaces/thread_context.h>

#include <exception>
#include <stdexcept>
#include <vector>

namespace medimg::integration {

thread_pool_adapter::thread_pool_adapter(const thread_pool_config& config) : config_(config) {
    if (config_.worker_count == 0) {
        config_.worker_count = 1;
    }
    kcenon::thread::thread_context context;
    pool_ = std::make_shared<kcenon::thread::thread_pool>(config_.pool_name, context);
}

thread_pool_adapter::~thread_pool_adapter() {
    shutdown(true);
}

// =============================================================================
// Lifecycle
// =============================================================================

auto thread_pool_adapter::start() -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return start_locked();
}

auto thread_pool_adapter::start_locked() -> bool {
    if (started_ && pool_->is_running()) {
        return true;
    }

    kcenon::thread::thread_context context;
    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    workers.reserve(config_.worker_count);
    for (std::size_t i = 0; i < config_.worker_count; ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>(false, context));
    }

    if (pool_->enqueue_batch(std::move(workers)).is_err()) {
        return false;
    }
    if (pool_->start().is_err()) {
        return false;
    }

    started_ = true;
    return true;
}

auto thread_pool_adapter::is_running() const noexcept -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return started_ && pool_->is_running();
}

void thread_pool_adapter::shutdown(bool wait_for_completion) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!started_) {
        return;
    }
    pool_->stop(!wait_for_completion);
    started_ = false;
}

// =============================================================================
// Submission
// =============================================================================

auto thread_pool_adapter::submit(std::function<void()> task) -> std::future<void> {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    std::lock_guard<std::mutex> lock(mutex_);
    if (!start_locked()) {
        throw std::runtime_error("Prefetch pool '" + config_.pool_name +
                                 "' could not start its workers");
    }

    (void)pool_->submit([task = std::move(task), promise, counters = counters_]() mutable {
        try {
            task();
        } catch (...) {
            counters->failed.fetch_add(1, std::memory_order_relaxed);
            promise->set_exception(std::current_exception());
            return;
        }
        counters->completed.fetch_add(1, std::memory_order_relaxed);
        promise->set_value();
    });
    return future;
}

// =============================================================================
// Counters
// =============================================================================

auto thread_pool_adapter::get_thread_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return started_ ? config_.worker_count : 0;
}

auto thread_pool_adapter::get_pending_task_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_->get_pending_task_count();
}

auto thread_pool_adapter::get_config() const noexcept -> const thread_pool_config& {
    return config_;
}

auto thread_pool_adapter::get_completed_task_count() const noexcept -> uint64_t {
    return counters_->completed.load(std::memory_order_relaxed);
}

auto thread_pool_adapter::get_failed_task_count() const noexcept -> uint64_t {
    return counters_->failed.load(std::memory_order_relaxed);
}

}  // namespace medimg::integration
