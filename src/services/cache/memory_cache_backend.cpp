/**
 * @file memory_cache_backend.cpp
 * @brief Implementation of memory_cache_backend
 */

#include "medimg/services/cache/memory_cache_backend.hpp"

#include <mutex>

namespace medimg::services::cache {

memory_cache_backend::memory_cache_backend(const memory_backend_config& config)
    : index_(config.max_bytes) {}

auto memory_cache_backend::get(std::string_view key, time_point now)
    -> Result<lookup_result> {
    std::unique_lock lock(mutex_);
    lookup_result result;
    auto* entry = index_.promote(key);
    if (entry == nullptr) {
        return Result<lookup_result>::ok(std::move(result));
    }
    if (entry->is_expired(now)) {
        (void)index_.erase(key);
        result.expired = true;
        return Result<lookup_result>::ok(std::move(result));
    }
    entry->last_accessed = now;
    result.entry = *entry;
    return Result<lookup_result>::ok(std::move(result));
}

auto memory_cache_backend::put(const std::string& key, stored_entry entry)
    -> Result<put_outcome> {
    std::unique_lock lock(mutex_);
    put_outcome outcome;
    if (!index_.fits(entry.payload.size())) {
        return Result<put_outcome>::ok(std::move(outcome));
    }

    auto evicted = index_.insert_or_assign(key, std::move(entry));
    outcome.stored = true;
    outcome.evicted_keys.reserve(evicted.size());
    for (auto& [victim, value] : evicted) {
        outcome.evicted_keys.push_back(std::move(victim));
    }
    return Result<put_outcome>::ok(std::move(outcome));
}

auto memory_cache_backend::remove(std::string_view key) -> Result<bool> {
    std::unique_lock lock(mutex_);
    return Result<bool>::ok(index_.erase(key).has_value());
}

auto memory_cache_backend::remove_if_unchanged(std::string_view key, time_point inserted_at)
    -> Result<bool> {
    std::unique_lock lock(mutex_);
    const auto* entry = index_.find(key);
    if (entry == nullptr || entry->inserted_at != inserted_at) {
        return Result<bool>::ok(false);
    }
    (void)index_.erase(key);
    return Result<bool>::ok(true);
}

auto memory_cache_backend::clear() -> VoidResult {
    std::unique_lock lock(mutex_);
    (void)index_.clear();
    return ok();
}

auto memory_cache_backend::touch(std::string_view key, time_point now,
                                 std::optional<std::chrono::seconds> ttl) -> Result<bool> {
    std::unique_lock lock(mutex_);
    auto* entry = index_.promote(key);
    if (entry == nullptr || entry->is_expired(now)) {
        return Result<bool>::ok(false);
    }
    entry->last_accessed = now;
    if (ttl) {
        entry->ttl = *ttl;
    }
    (void)index_.retime(key, now);
    return Result<bool>::ok(true);
}

auto memory_cache_backend::contains(std::string_view key, time_point now) const
    -> Result<bool> {
    std::shared_lock lock(mutex_);
    const auto* entry = index_.find(key);
    return Result<bool>::ok(entry != nullptr && !entry->is_expired(now));
}

auto memory_cache_backend::remove_expired(time_point now)
    -> Result<std::vector<std::string>> {
    std::unique_lock lock(mutex_);
    std::vector<std::string> expired;
    index_.for_each([&](const std::string& key, const stored_entry& entry) {
        if (entry.is_expired(now)) {
            expired.push_back(key);
        }
    });
    for (const auto& key : expired) {
        (void)index_.erase(key);
    }
    return Result<std::vector<std::string>>::ok(std::move(expired));
}

auto memory_cache_backend::keys(std::string_view prefix) const
    -> Result<std::vector<std::string>> {
    std::shared_lock lock(mutex_);
    return Result<std::vector<std::string>>::ok(index_.keys(prefix));
}

auto memory_cache_backend::stats() const -> backend_stats {
    std::shared_lock lock(mutex_);
    backend_stats result;
    result.item_count = index_.size();
    result.total_bytes = index_.total_bytes();
    result.max_bytes = index_.max_bytes();
    result.evictions = index_.evictions();
    result.oldest_item = index_.oldest();
    result.newest_item = index_.newest();
    return result;
}

}  // namespace medimg::services::cache
