/**
 * @file thread_pool_interface.hpp
 * @brief Abstract worker pool used for bounded background work
 *
 * The prefetch engine receives a pool through this interface so tests can
 * inject a synchronous mock instead of real threads.
 */

#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <future>
#include <string>
#include <thread>

namespace medimg::integration {

/**
 * @struct thread_pool_config
 * @brief Configuration options for the thread pool
 */
struct thread_pool_config {
    /// Number of worker threads
    std::size_t worker_count = std::max(2u, std::thread::hardware_concurrency() / 2);

    /// Thread pool name for logging
    std::string pool_name = "medimg_pool";
};

/**
 * @brief Abstract interface for thread pool operations
 *
 * Thread Safety: all methods must be thread-safe in implementations;
 * concurrent submission is allowed.
 */
class thread_pool_interface {
public:
    virtual ~thread_pool_interface() = default;

    /**
     * @brief Start the workers; a no-op if already running
     * @return true if the pool is running afterwards
     */
    [[nodiscard]] virtual auto start() -> bool = 0;

    [[nodiscard]] virtual auto is_running() const noexcept -> bool = 0;

    /**
     * @brief Stop accepting tasks
     * @param wait_for_completion Drain queued tasks before returning
     */
    virtual void shutdown(bool wait_for_completion = true) = 0;

    /**
     * @brief Queue a task
     *
     * The future carries any exception the task throws.
     *
     * @throws std::runtime_error if the pool cannot be started
     */
    [[nodiscard]] virtual auto submit(std::function<void()> task) -> std::future<void> = 0;

    [[nodiscard]] virtual auto get_thread_count() const -> std::size_t = 0;

    [[nodiscard]] virtual auto get_pending_task_count() const -> std::size_t = 0;

protected:
    thread_pool_interface() = default;

    thread_pool_interface(const thread_pool_interface&) = delete;
    thread_pool_interface& operator=(const thread_pool_interface&) = delete;

    thread_pool_interface(thread_pool_interface&&) = default;
    thread_pool_interface& operator=(thread_pool_interface&&) = default;
};

}  // namespace medimg::integration
