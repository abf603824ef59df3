/**
 * @file file_cache_backend.hpp
 * @brief Filesystem cache backend, one file per entry
 *
 * Each entry lives in `<directory>/<sanitized-key>-<hash>.cache`. The
 * sanitized stem keeps file names readable; the 64-bit key hash keeps keys
 * that sanitize identically apart. The key itself is stored in the file
 * header so the index can be rebuilt from the directory at open.
 *
 * File layout (little-endian):
 * @code
 * "MICE" | u16 version | u16 key_len | key | i64 inserted_ms | i64 ttl_s
 *        | i64 last_accessed_ms | u64 payload_len | payload
 * @endcode
 */

#pragma once

#include "medimg/services/cache/cache_backend.hpp"
#include "medimg/services/cache/lru_index.hpp"

#include <filesystem>
#include <memory>
#include <shared_mutex>

namespace medimg::services::cache {

/**
 * @struct file_backend_config
 * @brief Configuration for file_cache_backend
 */
struct file_backend_config {
    std::filesystem::path directory{"medimg-cache"};
    uint64_t max_bytes{2ULL * 1024 * 1024 * 1024};
    std::string file_extension{".cache"};
};

/**
 * @class file_cache_backend
 * @brief Persistent backend surviving process restarts
 *
 * Access order is kept in memory only; after a restart entries are ordered
 * by the last_accessed value in their headers.
 */
class file_cache_backend final : public cache_backend {
public:
    /**
     * @brief Create the directory if needed and index existing entries
     *
     * @return The backend, or cache_backend_error when the directory cannot
     *         be created
     */
    [[nodiscard]] static auto open(const file_backend_config& config)
        -> Result<std::unique_ptr<file_cache_backend>>;

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
    [[nodiscard]] auto name() const noexcept -> std::string_view override {
        return "filesystem";
    }

    [[nodiscard]] auto directory() const noexcept -> const std::filesystem::path& {
        return config_.directory;
    }

    /**
     * @brief File name stem for a key: `[^A-Za-z0-9_-]` replaced by '_',
     *        followed by '-' and the 16-digit hex FNV-1a hash of the key
     */
    [[nodiscard]] static auto file_stem_for(std::string_view key) -> std::string;

private:
    struct file_slot {
        std::filesystem::path path;
        time_point inserted_at{};
        std::chrono::seconds ttl{0};
        time_point last_accessed{};
        std::size_t payload_size{0};

        [[nodiscard]] auto is_expired(time_point now) const -> bool {
            return ttl.count() > 0 && now >= inserted_at + ttl;
        }
    };

    struct slot_weight {
        auto operator()(const file_slot& slot) const noexcept -> std::size_t {
            return slot.payload_size;
        }
    };

    explicit file_cache_backend(file_backend_config config);

    [[nodiscard]] auto rebuild_index() -> VoidResult;
    [[nodiscard]] auto path_for(std::string_view key) const -> std::filesystem::path;
    [[nodiscard]] auto write_file(const std::filesystem::path& path, std::string_view key,
                                  const stored_entry& entry) const -> VoidResult;
    void remove_file(const std::filesystem::path& path) const;
    /// Erase a slot and its file; the caller holds the exclusive lock
    void drop(std::string_view key);

    file_backend_config config_;
    mutable std::shared_mutex mutex_;
    lru_index<file_slot, slot_weight> index_;
};

}  // namespace medimg::services::cache
