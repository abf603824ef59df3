/**
 * @file mock_thread_pool.hpp
 * @brief Deterministic thread_pool_interface for unit tests
 */

#pragma once

#include <medimg/integration/thread_pool_interface.hpp>

#include <atomic>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace medimg::integration::testing {

/**
 * @brief Mock pool that runs, records or rejects submitted tasks
 *
 * - synchronous: the task runs on the submitting thread before submit()
 *   returns
 * - recording: the task is stored and runs only on run_pending()
 *
 * @example
 * @code
 * auto pool = std::make_shared<mock_thread_pool>();
 * prefetch_engine engine(cache, handler, pool);
 * engine.execute(rules, studies);
 * REQUIRE(pool->get_submitted_task_count() == 3);
 * @endcode
 */
class mock_thread_pool final : public thread_pool_interface {
public:
    enum class execution_mode {
        synchronous,
        recording
    };

    mock_thread_pool() = default;
    ~mock_thread_pool() override = default;

    mock_thread_pool(const mock_thread_pool&) = delete;
    mock_thread_pool& operator=(const mock_thread_pool&) = delete;
    mock_thread_pool(mock_thread_pool&&) = delete;
    mock_thread_pool& operator=(mock_thread_pool&&) = delete;

    [[nodiscard]] auto start() -> bool override {
        running_ = true;
        return true;
    }

    [[nodiscard]] auto is_running() const noexcept -> bool override { return running_; }

    void shutdown(bool /*wait_for_completion*/) override { running_ = false; }

    [[nodiscard]] auto submit(std::function<void()> task) -> std::future<void> override {
        auto promise = std::make_shared<std::promise<void>>();
        auto future = promise->get_future();
        auto wrapped = [task = std::move(task), promise]() mutable {
            try {
                task();
                promise->set_value();
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        };

        execution_mode mode;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (should_fail_submit_) {
                throw std::runtime_error("Mock configured to fail");
            }
            ++submitted_task_count_;
            mode = mode_;
            if (mode == execution_mode::recording) {
                pending_.push_back(std::move(wrapped));
                return future;
            }
        }

        wrapped();
        return future;
    }

    [[nodiscard]] auto get_thread_count() const -> std::size_t override { return 1; }

    [[nodiscard]] auto get_pending_task_count() const -> std::size_t override {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

    // =========================================================================
    // Mock Configuration
    // =========================================================================

    void set_mode(execution_mode mode) {
        std::lock_guard<std::mutex> lock(mutex_);
        mode_ = mode;
    }

    /// Make submit() throw, as a pool that cannot start would
    void set_should_fail(bool should_fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        should_fail_submit_ = should_fail;
    }

    /**
     * @brief Run tasks stored in recording mode, in submission order
     */
    void run_pending() {
        std::vector<std::function<void()>> tasks;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            tasks.swap(pending_);
        }
        for (auto& task : tasks) {
            task();
        }
    }

    [[nodiscard]] auto get_submitted_task_count() const -> std::size_t {
        return submitted_task_count_;
    }

private:
    mutable std::mutex mutex_;
    std::atomic<bool> running_{false};
    execution_mode mode_{execution_mode::synchronous};
    bool should_fail_submit_{false};
    std::atomic<std::size_t> submitted_task_count_{0};
    std::vector<std::function<void()>> pending_;
};

}  // namespace medimg::integration::testing
