/**
 * @file cache_backend.hpp
 * @brief Storage abstraction behind cache_service
 *
 * A backend stores opaque payloads with their timing metadata and keeps the
 * byte bound by evicting least-recently-accessed entries. A backend checks
 * expiry and erases a stale entry under the same lock, so a concurrent put()
 * of the same key is never lost to a read that saw the old entry.
 *
 * All implementations are thread-safe. Errors are reported as
 * cache_backend_error and are never fatal to the caller.
 */

#pragma once

#include "medimg/core/result.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace medimg::services::cache {

using clock_type = std::chrono::system_clock;
using time_point = clock_type::time_point;

// ─────────────────────────────────────────────────────
// Entry and statistics
// ─────────────────────────────────────────────────────

/**
 * @struct stored_entry
 * @brief A serialized value plus the timing data the service needs
 */
struct stored_entry {
    std::vector<uint8_t> payload;
    time_point inserted_at{};
    std::chrono::seconds ttl{0};  ///< 0 means the entry never expires
    time_point last_accessed{};

    [[nodiscard]] auto expires_at() const -> std::optional<time_point> {
        if (ttl.count() <= 0) {
            return std::nullopt;
        }
        return inserted_at + ttl;
    }

    [[nodiscard]] auto is_expired(time_point now) const -> bool {
        const auto deadline = expires_at();
        return deadline.has_value() && now >= *deadline;
    }
};

/**
 * @struct put_outcome
 * @brief What a put() did to the store
 */
struct put_outcome {
    bool stored{false};                      ///< false when the payload exceeds the byte bound
    std::vector<std::string> evicted_keys;   ///< LRU victims, oldest access first
};

/**
 * @struct lookup_result
 * @brief What a get() found
 */
struct lookup_result {
    std::optional<stored_entry> entry;  ///< Live entry, std::nullopt on a miss
    bool expired{false};                ///< A stale entry was found and erased
};

/**
 * @struct backend_stats
 * @brief Running counters maintained by the backend
 */
struct backend_stats {
    std::size_t item_count{0};
    uint64_t total_bytes{0};
    uint64_t max_bytes{0};
    uint64_t evictions{0};
    std::optional<time_point> oldest_item;   ///< Earliest inserted_at still stored
    std::optional<time_point> newest_item;   ///< Latest inserted_at still stored
};

// ─────────────────────────────────────────────────────
// Backend interface
// ─────────────────────────────────────────────────────

/**
 * @class cache_backend
 * @brief Abstract key/value store with LRU byte bound
 */
class cache_backend {
public:
    virtual ~cache_backend() = default;

    /**
     * @brief Fetch a live entry and mark it most recently used
     *
     * An entry expired at now is erased in the same critical section and
     * reported with lookup_result::expired. An entry whose storage cannot be
     * read is dropped before the error is returned.
     *
     * @return The lookup, or cache_backend_error
     */
    [[nodiscard]] virtual auto get(std::string_view key, time_point now)
        -> Result<lookup_result> = 0;

    /**
     * @brief Insert or replace an entry, evicting LRU entries to fit
     */
    [[nodiscard]] virtual auto put(const std::string& key, stored_entry entry)
        -> Result<put_outcome> = 0;

    /**
     * @return true when an entry was removed
     */
    [[nodiscard]] virtual auto remove(std::string_view key) -> Result<bool> = 0;

    /**
     * @brief Remove key only while it still holds the entry inserted at
     *        inserted_at
     *
     * @return true when that entry was removed; false when the key is absent
     *         or has been replaced since
     */
    [[nodiscard]] virtual auto remove_if_unchanged(std::string_view key, time_point inserted_at)
        -> Result<bool> = 0;

    [[nodiscard]] virtual auto clear() -> VoidResult = 0;

    /**
     * @brief Restart a live entry's TTL window at now, optionally with a new TTL
     *
     * @return true when the entry exists and has not expired at now
     */
    [[nodiscard]] virtual auto touch(std::string_view key, time_point now,
                                     std::optional<std::chrono::seconds> ttl)
        -> Result<bool> = 0;

    /**
     * @brief Presence check that neither reads the payload nor changes
     *        access order
     *
     * @return true when the key is stored and not expired at now
     */
    [[nodiscard]] virtual auto contains(std::string_view key, time_point now) const
        -> Result<bool> = 0;

    /**
     * @brief Erase every entry whose TTL has elapsed at now
     *
     * @return The erased keys
     */
    [[nodiscard]] virtual auto remove_expired(time_point now)
        -> Result<std::vector<std::string>> = 0;

    /**
     * @brief Keys beginning with prefix (all keys for an empty prefix)
     */
    [[nodiscard]] virtual auto keys(std::string_view prefix) const
        -> Result<std::vector<std::string>> = 0;

    [[nodiscard]] virtual auto stats() const -> backend_stats = 0;

    [[nodiscard]] virtual auto name() const noexcept -> std::string_view = 0;

protected:
    cache_backend() = default;
    cache_backend(const cache_backend&) = default;
    cache_backend& operator=(const cache_backend&) = default;
    cache_backend(cache_backend&&) = default;
    cache_backend& operator=(cache_backend&&) = default;
};

}  // namespace medimg::services::cache
