/**
 * @file sqlite_cache_backend.hpp
 * @brief External key/value cache backend on SQLite
 *
 * Entries live in one table:
 * @code
 * CREATE TABLE cache_entries (
 *     cache_key      TEXT PRIMARY KEY,
 *     payload        BLOB NOT NULL,
 *     payload_size   INTEGER NOT NULL,
 *     inserted_at    INTEGER NOT NULL,   -- Unix milliseconds
 *     ttl_seconds    INTEGER NOT NULL,
 *     last_accessed  INTEGER NOT NULL    -- Unix milliseconds
 * );
 * @endcode
 *
 * Item and byte counters are loaded once at open and then maintained on each
 * mutation; LRU victims are selected through the last_accessed index.
 */

#pragma once

#include "medimg/services/cache/cache_backend.hpp"

#include <memory>
#include <mutex>
#include <string>

struct sqlite3;

namespace medimg::services::cache {

/**
 * @struct sqlite_backend_config
 * @brief Configuration for sqlite_cache_backend
 */
struct sqlite_backend_config {
    /// Database file, or ":memory:" for a private in-memory database
    std::string database_path{"medimg-cache.db"};
    uint64_t max_bytes{2ULL * 1024 * 1024 * 1024};
    bool wal_mode{true};
};

/**
 * @class sqlite_cache_backend
 * @brief Backend persisted in a SQLite database
 *
 * @example
 * @code
 * sqlite_backend_config config;
 * config.database_path = ":memory:";
 * auto backend = sqlite_cache_backend::open(config);
 * if (backend.is_ok()) {
 *     cache_service cache(std::move(backend.value()));
 * }
 * @endcode
 */
class sqlite_cache_backend final : public cache_backend {
public:
    /**
     * @brief Open or create the database and its schema
     *
     * @return The backend, or cache_backend_error
     */
    [[nodiscard]] static auto open(const sqlite_backend_config& config)
        -> Result<std::unique_ptr<sqlite_cache_backend>>;

    ~sqlite_cache_backend() override;

    sqlite_cache_backend(const sqlite_cache_backend&) = delete;
    sqlite_cache_backend& operator=(const sqlite_cache_backend&) = delete;
    sqlite_cache_backend(sqlite_cache_backend&&) = delete;
    sqlite_cache_backend& operator=(sqlite_cache_backend&&) = delete;

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
    [[nodiscard]] auto name() const noexcept -> std::string_view override { return "sqlite"; }

private:
    sqlite_cache_backend(sqlite3* db, sqlite_backend_config config);

    [[nodiscard]] auto load_counters() -> VoidResult;
    [[nodiscard]] auto entry_size(std::string_view key) const -> Result<std::optional<uint64_t>>;
    /// Delete key only while its row still carries inserted_at
    [[nodiscard]] auto delete_row(std::string_view key, int64_t inserted_at, uint64_t size)
        -> Result<bool>;
    /// Evict LRU rows other than keep until incoming bytes fit the bound
    [[nodiscard]] auto evict_until_fits(std::string_view keep, uint64_t incoming,
                                        bool keep_exists, std::vector<std::string>& evicted)
        -> VoidResult;
    [[nodiscard]] auto time_bound(bool oldest) const -> std::optional<time_point>;
    [[nodiscard]] auto error_result(const std::string& action) const -> error_info;

    sqlite3* db_{nullptr};
    sqlite_backend_config config_;
    mutable std::mutex mutex_;

    std::size_t item_count_{0};
    uint64_t total_bytes_{0};
    uint64_t evictions_{0};
};

}  // namespace medimg::services::cache
