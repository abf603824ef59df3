/**
 * @file cache_service.cpp
 * @brief Implementation of cache_service
 */

#include "medimg/services/cache/cache_service.hpp"

#include "medimg/integration/logger_adapter.hpp"
#include "medimg/services/cache/file_cache_backend.hpp"
#include "medimg/services/cache/memory_cache_backend.hpp"
#include "medimg/services/cache/sqlite_cache_backend.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <stdexcept>

namespace medimg::services::cache {

using integration::invalidation_reason;
using integration::logger_adapter;

namespace {

auto lower(std::string_view text) -> std::string {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

}  // namespace

// ============================================================================
// Configuration Helpers
// ============================================================================

auto to_string(cache_backend_kind kind) noexcept -> std::string_view {
    switch (kind) {
        case cache_backend_kind::memory: return "memory";
        case cache_backend_kind::filesystem: return "filesystem";
        case cache_backend_kind::sqlite: return "sqlite";
    }
    return "unknown";
}

auto parse_backend_kind(std::string_view text) -> Result<cache_backend_kind> {
    const auto name = lower(trim(text));
    if (name == "memory") {
        return Result<cache_backend_kind>::ok(cache_backend_kind::memory);
    }
    if (name == "filesystem" || name == "file") {
        return Result<cache_backend_kind>::ok(cache_backend_kind::filesystem);
    }
    if (name == "sqlite") {
        return Result<cache_backend_kind>::ok(cache_backend_kind::sqlite);
    }
    return medimg_error<cache_backend_kind>(error_codes::invalid_configuration,
                                            "Unsupported cache backend", std::string{text});
}

auto parse_size(std::string_view text) -> Result<uint64_t> {
    const auto input = trim(text);
    auto invalid = [&]() {
        return medimg_error<uint64_t>(error_codes::invalid_configuration,
                                      "Invalid size (expected e.g. 512MB, 2GB)",
                                      std::string{text});
    };

    std::size_t digits = 0;
    while (digits < input.size() &&
           (std::isdigit(static_cast<unsigned char>(input[digits])) || input[digits] == '.')) {
        ++digits;
    }
    if (digits == 0) {
        return invalid();
    }

    double number = 0.0;
    const auto* first = input.data();
    const auto [ptr, ec] = std::from_chars(first, first + digits, number);
    if (ec != std::errc{} || ptr != first + digits || number < 0.0) {
        return invalid();
    }

    const auto unit = lower(trim(input.substr(digits)));
    double multiplier = 0.0;
    if (unit.empty() || unit == "b") {
        multiplier = 1.0;
    } else if (unit == "kb") {
        multiplier = 1024.0;
    } else if (unit == "mb") {
        multiplier = 1024.0 * 1024.0;
    } else if (unit == "gb") {
        multiplier = 1024.0 * 1024.0 * 1024.0;
    } else {
        return invalid();
    }

    return Result<uint64_t>::ok(static_cast<uint64_t>(std::llround(number * multiplier)));
}

// ============================================================================
// Construction
// ============================================================================

auto cache_service::create(const cache_service_config& config,
                           std::shared_ptr<di::ILogger> logger)
    -> Result<std::unique_ptr<cache_service>> {
    using result_type = Result<std::unique_ptr<cache_service>>;
    std::shared_ptr<cache_backend> backend;

    switch (config.backend) {
        case cache_backend_kind::memory: {
            memory_backend_config backend_config;
            backend_config.max_bytes = config.max_cache_size;
            backend = std::make_shared<memory_cache_backend>(backend_config);
            break;
        }
        case cache_backend_kind::filesystem: {
            file_backend_config backend_config;
            backend_config.directory = config.cache_directory;
            backend_config.max_bytes = config.max_cache_size;
            auto opened = file_cache_backend::open(backend_config);
            if (opened.is_err()) {
                return result_type::err(opened.error());
            }
            backend = std::move(opened.value());
            break;
        }
        case cache_backend_kind::sqlite: {
            sqlite_backend_config backend_config;
            backend_config.database_path = config.database_path;
            backend_config.max_bytes = config.max_cache_size;
            auto opened = sqlite_cache_backend::open(backend_config);
            if (opened.is_err()) {
                return result_type::err(opened.error());
            }
            backend = std::move(opened.value());
            break;
        }
    }

    return result_type::ok(
        std::make_unique<cache_service>(std::move(backend), config, std::move(logger)));
}

cache_service::cache_service(std::shared_ptr<cache_backend> backend,
                             cache_service_config config,
                             std::shared_ptr<di::ILogger> logger)
    : backend_(std::move(backend)),
      config_(std::move(config)),
      logger_(logger ? std::move(logger) : di::null_logger()) {
    if (!backend_) {
        throw std::invalid_argument("cache_service requires a backend");
    }
    logger_->info_fmt("Cache service using {} backend (max {} bytes, default TTL {}s)",
                      backend_->name(), config_.max_cache_size, config_.default_ttl.count());
}

// ============================================================================
// Generic Operations
// ============================================================================

auto cache_service::fetch(std::string_view key) -> std::optional<stored_entry> {
    const auto now = clock_type::now();
    auto entry = backend_->get(key, now);
    if (entry.is_err()) {
        logger_->warn_fmt("Cache read of {} failed, treating as miss: {}", key,
                          entry.error().message);
        return std::nullopt;
    }
    auto& lookup = entry.value();
    if (lookup.expired) {
        expirations_.fetch_add(1, std::memory_order_relaxed);
        logger_->debug_fmt("Cache entry {} expired", key);
        logger_adapter::log_cache_invalidate(std::string{key}, invalidation_reason::expired);
        return std::nullopt;
    }
    return std::move(lookup.entry);
}

auto cache_service::store(const std::string& key, std::vector<uint8_t> payload,
                          std::chrono::seconds ttl) -> bool {
    const auto now = clock_type::now();
    const auto size = payload.size();

    stored_entry entry;
    entry.payload = std::move(payload);
    entry.inserted_at = now;
    entry.ttl = ttl;
    entry.last_accessed = now;

    writes_.fetch_add(1, std::memory_order_relaxed);
    auto outcome = backend_->put(key, std::move(entry));
    if (outcome.is_err()) {
        logger_->warn_fmt("Cache write of {} failed: {}", key, outcome.error().message);
        logger_adapter::log_cache_write(key, size, ttl, false);
        return false;
    }

    const auto& result = outcome.value();
    if (!result.stored) {
        logger_->warn_fmt("Cache entry {} ({} bytes) exceeds the cache bound; not stored", key,
                          size);
    }
    evictions_.fetch_add(result.evicted_keys.size(), std::memory_order_relaxed);
    for (const auto& victim : result.evicted_keys) {
        logger_->debug_fmt("Evicted {} to make room for {}", victim, key);
        logger_adapter::log_cache_invalidate(victim, invalidation_reason::evicted);
    }
    logger_adapter::log_cache_write(key, size, ttl, result.stored);
    return result.stored;
}

void cache_service::discard(std::string_view key, time_point inserted_at) {
    auto removed = backend_->remove_if_unchanged(key, inserted_at);
    if (removed.is_err()) {
        logger_->warn_fmt("Failed to remove cache entry {}: {}", key, removed.error().message);
    }
}

void cache_service::record_lookup(bool hit) noexcept {
    if (hit) {
        hits_.fetch_add(1, std::memory_order_relaxed);
    } else {
        misses_.fetch_add(1, std::memory_order_relaxed);
    }
}

auto cache_service::remove(std::string_view key) -> bool {
    deletes_.fetch_add(1, std::memory_order_relaxed);
    auto removed = backend_->remove(key);
    if (removed.is_err()) {
        logger_->warn_fmt("Failed to remove cache entry {}: {}", key, removed.error().message);
        return false;
    }
    if (removed.value()) {
        logger_adapter::log_cache_invalidate(std::string{key},
                                             invalidation_reason::explicit_remove);
    }
    return removed.value();
}

void cache_service::clear() {
    auto cleared = backend_->clear();
    if (cleared.is_err()) {
        logger_->error_fmt("Failed to clear {} cache: {}", backend_->name(),
                           cleared.error().message);
        return;
    }

    hits_.store(0, std::memory_order_relaxed);
    misses_.store(0, std::memory_order_relaxed);
    writes_.store(0, std::memory_order_relaxed);
    deletes_.store(0, std::memory_order_relaxed);
    evictions_.store(0, std::memory_order_relaxed);
    expirations_.store(0, std::memory_order_relaxed);

    logger_->info("Cache cleared");
    logger_adapter::log_cache_invalidate("*", invalidation_reason::cleared);
}

auto cache_service::touch(std::string_view key, std::optional<std::chrono::seconds> ttl)
    -> bool {
    auto touched = backend_->touch(key, clock_type::now(), ttl);
    if (touched.is_err()) {
        logger_->warn_fmt("Failed to touch cache entry {}: {}", key, touched.error().message);
        return false;
    }
    return touched.value();
}

auto cache_service::contains(std::string_view key) const -> bool {
    auto present = backend_->contains(key, clock_type::now());
    if (present.is_err()) {
        logger_->warn_fmt("Cache presence check of {} failed: {}", key,
                          present.error().message);
        return false;
    }
    return present.value();
}

auto cache_service::get_stats() const -> cache_stats {
    cache_stats stats;
    stats.hits = hits_.load(std::memory_order_relaxed);
    stats.misses = misses_.load(std::memory_order_relaxed);
    stats.writes = writes_.load(std::memory_order_relaxed);
    stats.deletes = deletes_.load(std::memory_order_relaxed);
    stats.evictions = evictions_.load(std::memory_order_relaxed);
    stats.expirations = expirations_.load(std::memory_order_relaxed);
    stats.total_requests = stats.hits + stats.misses;
    if (stats.total_requests > 0) {
        const auto total = static_cast<double>(stats.total_requests);
        stats.hit_rate = static_cast<double>(stats.hits) / total;
        stats.miss_rate = static_cast<double>(stats.misses) / total;
    }

    const auto backend = backend_->stats();
    stats.item_count = backend.item_count;
    stats.cache_size = backend.total_bytes;
    stats.oldest_item = backend.oldest_item;
    stats.newest_item = backend.newest_item;
    return stats;
}

auto cache_service::purge_expired() -> std::size_t {
    auto expired = backend_->remove_expired(clock_type::now());
    if (expired.is_err()) {
        logger_->warn_fmt("Expiry sweep failed: {}", expired.error().message);
        return 0;
    }

    const auto& removed = expired.value();
    expirations_.fetch_add(removed.size(), std::memory_order_relaxed);
    for (const auto& key : removed) {
        logger_adapter::log_cache_invalidate(key, invalidation_reason::expired);
    }
    if (!removed.empty()) {
        logger_->info_fmt("Expiry sweep removed {} entries", removed.size());
    }
    return removed.size();
}

auto cache_service::keys(std::string_view prefix) const -> std::vector<std::string> {
    auto listed = backend_->keys(prefix);
    if (listed.is_err()) {
        logger_->warn_fmt("Failed to list cache keys: {}", listed.error().message);
        return {};
    }
    return std::move(listed.value());
}

auto cache_service::backend_name() const noexcept -> std::string_view {
    return backend_->name();
}

// ============================================================================
// DICOM Wrappers
// ============================================================================

auto cache_service::study_key(std::string_view study_instance_uid) -> std::string {
    return "study:" + std::string{study_instance_uid};
}

auto cache_service::image_key(std::string_view sop_instance_uid) -> std::string {
    return "image:" + std::string{sop_instance_uid};
}

auto cache_service::search_key(std::string_view search_key) -> std::string {
    return "search:" + std::string{search_key};
}

auto cache_service::cache_study_metadata(const core::dicom_metadata& metadata) -> bool {
    if (metadata.study.instance_uid.empty()) {
        logger_->warn("Not caching study metadata without a Study Instance UID");
        return false;
    }
    return set(study_key(metadata.study.instance_uid), metadata);
}

auto cache_service::get_cached_study_metadata(std::string_view study_instance_uid)
    -> std::optional<core::dicom_metadata> {
    return get<core::dicom_metadata>(study_key(study_instance_uid));
}

auto cache_service::cache_image_data(std::string_view sop_instance_uid,
                                     std::span<const uint8_t> bytes) -> bool {
    if (bytes.size() > config_.max_image_bytes) {
        logger_->debug_fmt("Skipping image {} ({} bytes > {} byte limit)", sop_instance_uid,
                           bytes.size(), config_.max_image_bytes);
        return false;
    }
    return set(image_key(sop_instance_uid), std::vector<uint8_t>(bytes.begin(), bytes.end()));
}

auto cache_service::get_cached_image_data(std::string_view sop_instance_uid)
    -> std::optional<std::vector<uint8_t>> {
    return get<std::vector<uint8_t>>(image_key(sop_instance_uid));
}

auto cache_service::cache_search_results(std::string_view search_key_text,
                                         const std::vector<std::string>& results,
                                         std::optional<std::chrono::seconds> ttl) -> bool {
    return set(search_key(search_key_text), results,
               ttl.value_or(config_.effective_search_ttl()));
}

auto cache_service::get_cached_search_results(std::string_view search_key_text)
    -> std::optional<std::vector<std::string>> {
    return get<std::vector<std::string>>(search_key(search_key_text));
}

auto cache_service::invalidate_study(std::string_view study_instance_uid) -> bool {
    const auto key = study_key(study_instance_uid);
    deletes_.fetch_add(1, std::memory_order_relaxed);
    auto removed = backend_->remove(key);
    if (removed.is_err()) {
        logger_->warn_fmt("Failed to invalidate study {}: {}", study_instance_uid,
                          removed.error().message);
        return false;
    }
    if (removed.value()) {
        logger_->debug_fmt("Invalidated study {}", study_instance_uid);
        logger_adapter::log_cache_invalidate(key, invalidation_reason::study_invalidated);
    }
    return removed.value();
}

auto cache_service::warm_up(std::span<const core::dicom_metadata> studies) -> std::size_t {
    std::size_t stored = 0;
    for (const auto& study : studies) {
        if (cache_study_metadata(study)) {
            ++stored;
        }
    }
    logger_->info_fmt("Cache warm-up stored {} of {} studies", stored, studies.size());
    return stored;
}

}  // namespace medimg::services::cache
