/**
 * @file prefetch_engine.hpp
 * @brief Evaluates prefetch rules and loads matching images into the cache
 *
 * @code
 * prefetch_engine engine(cache, handler, pool, {}, logger);
 * auto pending = engine.execute_async(default_rules(), working_set);
 * // ... continue serving requests ...
 * auto outcome = pending.get();
 * @endcode
 */

#pragma once

#include "medimg/core/result.hpp"
#include "medimg/di/ilogger.hpp"
#include "medimg/integration/thread_pool_interface.hpp"
#include "medimg/services/cache/cache_service.hpp"
#include "medimg/services/cache/prefetch_types.hpp"
#include "medimg/services/dicom_handler.hpp"

#include <future>
#include <memory>
#include <span>
#include <vector>

namespace medimg::services::cache {

/**
 * @class prefetch_engine
 * @brief Runs rules in priority order with bounded fetch parallelism
 *
 * Rules run one after another, highest priority first; ties keep the order
 * given. A disabled rule is skipped entirely. Within a rule, image fetches
 * are submitted to the thread pool in batches of at most
 * max_concurrent_fetches, and scheduling stops once max_images fetches have
 * been issued. A failed fetch is logged and counted and never stops the run.
 */
class prefetch_engine {
public:
    prefetch_engine(std::shared_ptr<cache_service> cache,
                    std::shared_ptr<dicom_handler> handler,
                    std::shared_ptr<integration::thread_pool_interface> pool,
                    prefetch_engine_config config = {},
                    std::shared_ptr<di::ILogger> logger = nullptr,
                    image_loader loader = nullptr);

    /**
     * @brief Evaluate rules against the working set and populate the cache
     *
     * @return The run summary, or prefetch_disabled when the cache has
     *         prefetching turned off
     */
    [[nodiscard]] auto execute(std::span<const prefetch_rule> rules,
                               std::span<const prefetch_candidate> working_set)
        -> Result<prefetch_result>;

    /**
     * @brief execute() on a separate task; the arguments are copied
     */
    [[nodiscard]] auto execute_async(std::vector<prefetch_rule> rules,
                                     std::vector<prefetch_candidate> working_set)
        -> std::future<Result<prefetch_result>>;

    [[nodiscard]] auto config() const noexcept -> const prefetch_engine_config& {
        return config_;
    }

private:
    /// Fetch one image and store its pixel bytes; true when cached
    auto fetch_image(const std::filesystem::path& path) const -> bool;

    auto run_rule(const prefetch_rule& rule, std::span<const prefetch_candidate> working_set,
                  prefetch_result& totals) -> rule_report;

    std::shared_ptr<cache_service> cache_;
    std::shared_ptr<dicom_handler> handler_;
    std::shared_ptr<integration::thread_pool_interface> pool_;
    prefetch_engine_config config_;
    std::shared_ptr<di::ILogger> logger_;
    image_loader loader_;
};

}  // namespace medimg::services::cache
