/**
 * @file thread_pool_adapter.hpp
 * @brief thread_pool_interface backed by kcenon::thread::thread_pool
 */

#pragma once

#include <medimg/integration/thread_pool_interface.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>

namespace kcenon::thread {
class thread_pool;
}  // namespace kcenon::thread

namespace medimg::integration {

/**
 * @class thread_pool_adapter
 * @brief Worker pool that runs prefetch image fetches
 *
 * Wraps kcenon::thread::thread_pool with config.worker_count workers. The
 * workers are created on start() or on the first submit(). Each task's
 * outcome is counted so a prefetch run can be compared with what the pool
 * actually executed. The destructor drains queued fetches.
 *
 * @example
 * @code
 * thread_pool_config config;
 * config.worker_count = 4;
 * auto pool = std::make_shared<thread_pool_adapter>(config);
 * prefetch_engine engine(cache, handler, pool);
 * @endcode
 */
class thread_pool_adapter final : public thread_pool_interface {
public:
    explicit thread_pool_adapter(const thread_pool_config& config = {});

    ~thread_pool_adapter() override;

    thread_pool_adapter(const thread_pool_adapter&) = delete;
    thread_pool_adapter& operator=(const thread_pool_adapter&) = delete;
    thread_pool_adapter(thread_pool_adapter&&) = delete;
    thread_pool_adapter& operator=(thread_pool_adapter&&) = delete;

    [[nodiscard]] auto start() -> bool override;
    [[nodiscard]] auto is_running() const noexcept -> bool override;
    void shutdown(bool wait_for_completion = true) override;

    [[nodiscard]] auto submit(std::function<void()> task) -> std::future<void> override;

    [[nodiscard]] auto get_thread_count() const -> std::size_t override;
    [[nodiscard]] auto get_pending_task_count() const -> std::size_t override;

    [[nodiscard]] auto get_config() const noexcept -> const thread_pool_config&;

    /// Tasks that returned normally
    [[nodiscard]] auto get_completed_task_count() const noexcept -> uint64_t;

    /// Tasks whose exception was handed to their future
    [[nodiscard]] auto get_failed_task_count() const noexcept -> uint64_t;

private:
    [[nodiscard]] auto start_locked() -> bool;

    std::shared_ptr<kcenon::thread::thread_pool> pool_;
    thread_pool_config config_;
    mutable std::mutex mutex_;
    bool started_{false};

    // Shared with queued tasks, which may finish after a non-draining shutdown
    struct task_counters {
        std::atomic<uint64_t> completed{0};
        std::atomic<uint64_t> failed{0};
    };
    std::shared_ptr<task_counters> counters_ = std::make_shared<task_counters>();
};

}  // namespace medimg::integration
