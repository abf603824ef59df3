/**
 * @file memory_cache_backend.hpp
 * @brief In-process cache backend with a byte-bounded LRU
 */

#pragma once

#include "medimg/services/cache/cache_backend.hpp"
#include "medimg/services/cache/lru_index.hpp"

#include <shared_mutex>

namespace medimg::services::cache {

/**
 * @struct memory_backend_config
 * @brief Configuration for memory_cache_backend
 */
struct memory_backend_config {
    /// Upper bound on the summed payload sizes; 0 disables the bound
    uint64_t max_bytes{2ULL * 1024 * 1024 * 1024};
};

/**
 * @class memory_cache_backend
 * @brief Thread-safe in-memory backend
 *
 * Reads that change the access order take the exclusive lock; keys() and
 * stats() share it.
 */
class memory_cache_backend final : public cache_backend {
public:
    explicit memory_cache_backend(const memory_backend_config& config = {});

    [[nodiscard]] auto get(std::string_view key, time_point now)
        -> Result<lookup_result> override;
    [[nodiscard]] auto put(const std::string& key, stored_entry entry)
        -> Result<put_outcome> override;
    [[nodiscard]] auto remove(std::string_view key) -> Result<bool> override;
    [[nodiscard]] auto remove_if_unchanged(std::string_view key, time_point inserted_at)
        -> Result<bool> override;
    [[nodiscard]] auto clear() -> VoidResult override;
    [[nodiscard]] auto touch(std::string_view key, time_point now,
                             std::optional<std::chrono::seconds> ttl)
        -> Result<bool> override;
    [[nodiscard]] auto contains(std::string_view key, time_point now) const
        -> Result<bool> override;
    [[nodiscard]] auto remove_expired(time_point now)
        -> Result<std::vector<std::string>> override;
    [[nodiscard]] auto keys(std::string_view prefix) const
        -> Result<std::vector<std::string>> override;
    [[nodiscard]] auto stats() const -> backend_stats override;
    [[nodiscard]] auto name() const noexcept -> std::string_view override { return "memory"; }

private:
    struct payload_weight {
        auto operator()(const stored_entry& entry) const noexcept -> std::size_t {
            return entry.payload.size();
        }
    };

    mutable std::shared_mutex mutex_;
    lru_index<stored_entry, payload_weight> index_;
};

}  // namespace medimg::services::cache
