/**
 * @file cache_service.hpp
 * @brief Typed TTL cache over a pluggable backend, with DICOM wrappers
 *
 * The service owns expiry and statistics; the backend owns storage and the
 * LRU byte bound. Every operation is total: a backend failure is logged and
 * degrades to a miss (reads) or a no-op (writes), never to an error the
 * caller must handle.
 *
 * Key namespaces used by the DICOM wrappers:
 * - `study:{study_instance_uid}`  study metadata
 * - `image:{sop_instance_uid}`    pixel data bytes
 * - `search:{search_key}`         search result lists
 */

#pragma once

#include "medimg/core/dicom_metadata.hpp"
#include "medimg/core/result.hpp"
#include "medimg/di/ilogger.hpp"
#include "medimg/services/cache/cache_backend.hpp"
#include "medimg/services/cache/cache_serializer.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace medimg::services::cache {

// ─────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────

enum class cache_backend_kind {
    memory,
    filesystem,
    sqlite
};

[[nodiscard]] auto to_string(cache_backend_kind kind) noexcept -> std::string_view;

/**
 * @brief Parse "memory", "filesystem" (or "file"), "sqlite"; case-insensitive
 */
[[nodiscard]] auto parse_backend_kind(std::string_view text) -> Result<cache_backend_kind>;

/**
 * @brief Parse a byte size such as "2GB", "512 MB", "1.5kb" or "4096"
 *
 * Units are B, KB, MB, GB (1024-based, case-insensitive); a bare number is
 * bytes.
 *
 * @return The size, or invalid_configuration
 */
[[nodiscard]] auto parse_size(std::string_view text) -> Result<uint64_t>;

/**
 * @struct cache_service_config
 * @brief Configuration for cache_service
 */
struct cache_service_config {
    cache_backend_kind backend{cache_backend_kind::memory};

    /// TTL applied when set() is called without one; 0 disables expiry
    std::chrono::seconds default_ttl{3600};

    /// Byte bound handed to the backend (2 GiB)
    uint64_t max_cache_size{2ULL * 1024 * 1024 * 1024};

    /// TTL for search results; default_ttl / 2 when unset
    std::optional<std::chrono::seconds> search_ttl;

    /// Images larger than this are not cached
    std::size_t max_image_bytes{10 * 1024 * 1024};

    bool prefetch_enabled{true};

    /// Directory of the filesystem backend
    std::filesystem::path cache_directory{"medimg-cache"};

    /// Database file of the sqlite backend
    std::string database_path{"medimg-cache.db"};

    [[nodiscard]] auto effective_search_ttl() const -> std::chrono::seconds {
        return search_ttl.value_or(default_ttl / 2);
    }
};

// ─────────────────────────────────────────────────────
// Statistics
// ─────────────────────────────────────────────────────

/**
 * @struct cache_stats
 * @brief Snapshot of the running counters
 */
struct cache_stats {
    double hit_rate{0.0};          ///< hits / total_requests, 0 when no requests
    double miss_rate{0.0};
    uint64_t total_requests{0};
    uint64_t hits{0};
    uint64_t misses{0};
    uint64_t writes{0};
    uint64_t deletes{0};
    uint64_t evictions{0};
    uint64_t expirations{0};
    std::size_t item_count{0};
    uint64_t cache_size{0};        ///< Stored payload bytes
    std::optional<time_point> oldest_item;
    std::optional<time_point> newest_item;
};

// ─────────────────────────────────────────────────────
// Cache Service
// ─────────────────────────────────────────────────────

/**
 * @class cache_service
 * @brief Thread-safe typed cache
 *
 * @example
 * @code
 * cache_service_config config;
 * config.backend = cache_backend_kind::filesystem;
 * config.cache_directory = "/var/cache/medimg";
 *
 * auto cache = cache_service::create(config, std::make_shared<di::LoggerService>());
 * if (cache.is_ok()) {
 *     cache.value()->cache_study_metadata(metadata);
 *     auto hit = cache.value()->get_cached_study_metadata(metadata.study.instance_uid);
 * }
 * @endcode
 */
class cache_service {
public:
    /**
     * @brief Build the backend named in config and wrap it
     *
     * @return The service, or cache_backend_error when the backend cannot
     *         be opened
     */
    [[nodiscard]] static auto create(const cache_service_config& config,
                                     std::shared_ptr<di::ILogger> logger = nullptr)
        -> Result<std::unique_ptr<cache_service>>;

    /**
     * @brief Wrap an existing backend
     *
     * @throws std::invalid_argument if backend is null
     */
    explicit cache_service(std::shared_ptr<cache_backend> backend,
                           cache_service_config config = {},
                           std::shared_ptr<di::ILogger> logger = nullptr);

    cache_service(const cache_service&) = delete;
    cache_service& operator=(const cache_service&) = delete;

    // =========================================================================
    // Generic Operations
    // =========================================================================

    /**
     * @brief Typed lookup
     *
     * An expired entry is removed and counted as a miss. A payload that does
     * not decode as T is removed and counted as a miss.
     */
    template <typename T>
    [[nodiscard]] auto get(std::string_view key) -> std::optional<T> {
        auto entry = fetch(key);
        if (!entry) {
            record_lookup(false);
            return std::nullopt;
        }
        auto value = cache_serializer<T>::deserialize(entry->payload);
        if (value.is_err()) {
            logger_->warn_fmt("Discarding undecodable cache entry {}: {}", key,
                              value.error().message);
            discard(key, entry->inserted_at);
            record_lookup(false);
            return std::nullopt;
        }
        record_lookup(true);
        return std::move(value.value());
    }

    /**
     * @brief Typed store
     *
     * @param ttl Entry TTL; config().default_ttl when absent
     * @return true when the value was stored (false for a value larger than
     *         the whole cache, or on backend failure)
     */
    template <typename T>
    auto set(const std::string& key, const T& value,
             std::optional<std::chrono::seconds> ttl = std::nullopt) -> bool {
        return store(key, cache_serializer<T>::serialize(value), ttl.value_or(config_.default_ttl));
    }

    /**
     * @return true when an entry was removed
     */
    auto remove(std::string_view key) -> bool;

    /**
     * @brief Remove every entry and reset the counters
     */
    void clear();

    /**
     * @brief Restart an entry's TTL window, optionally with a new TTL
     *
     * @return false when the key is absent or already expired
     */
    auto touch(std::string_view key, std::optional<std::chrono::seconds> ttl = std::nullopt)
        -> bool;

    /**
     * @brief Presence check; does not count as a request and does not
     *        change access order
     */
    [[nodiscard]] auto contains(std::string_view key) const -> bool;

    [[nodiscard]] auto get_stats() const -> cache_stats;

    /**
     * @brief Remove every expired entry now
     *
     * @return Number of entries removed
     */
    auto purge_expired() -> std::size_t;

    /**
     * @brief Keys starting with prefix, most recently used first where the
     *        backend tracks order
     */
    [[nodiscard]] auto keys(std::string_view prefix = {}) const -> std::vector<std::string>;

    // =========================================================================
    // DICOM Wrappers
    // =========================================================================

    auto cache_study_metadata(const core::dicom_metadata& metadata) -> bool;

    [[nodiscard]] auto get_cached_study_metadata(std::string_view study_instance_uid)
        -> std::optional<core::dicom_metadata>;

    /**
     * @brief Cache pixel bytes; images above max_image_bytes are skipped
     */
    auto cache_image_data(std::string_view sop_instance_uid, std::span<const uint8_t> bytes)
        -> bool;

    [[nodiscard]] auto get_cached_image_data(std::string_view sop_instance_uid)
        -> std::optional<std::vector<uint8_t>>;

    auto cache_search_results(std::string_view search_key,
                              const std::vector<std::string>& results,
                              std::optional<std::chrono::seconds> ttl = std::nullopt) -> bool;

    [[nodiscard]] auto get_cached_search_results(std::string_view search_key)
        -> std::optional<std::vector<std::string>>;

    /**
     * @brief Remove the study's metadata entry; image and search entries
     *        are left alone
     */
    auto invalidate_study(std::string_view study_instance_uid) -> bool;

    /**
     * @brief Cache each study's metadata
     *
     * @return Number of studies stored
     */
    auto warm_up(std::span<const core::dicom_metadata> studies) -> std::size_t;

    [[nodiscard]] static auto study_key(std::string_view study_instance_uid) -> std::string;
    [[nodiscard]] static auto image_key(std::string_view sop_instance_uid) -> std::string;
    [[nodiscard]] static auto search_key(std::string_view search_key) -> std::string;

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] auto config() const noexcept -> const cache_service_config& { return config_; }
    [[nodiscard]] auto backend_name() const noexcept -> std::string_view;

private:
    [[nodiscard]] auto fetch(std::string_view key) -> std::optional<stored_entry>;
    auto store(const std::string& key, std::vector<uint8_t> payload, std::chrono::seconds ttl)
        -> bool;
    /// Drop an undecodable entry unless a newer write replaced it
    void discard(std::string_view key, time_point inserted_at);
    void record_lookup(bool hit) noexcept;

    std::shared_ptr<cache_backend> backend_;
    cache_service_config config_;
    std::shared_ptr<di::ILogger> logger_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> writes_{0};
    std::atomic<uint64_t> deletes_{0};
    std::atomic<uint64_t> evictions_{0};
    std::atomic<uint64_t> expirations_{0};
};

}  // namespace medimg::services::cache
