/**
 * @file file_cache_backend.cpp
 * @brief Implementation of file_cache_backend
 */

#include "medimg/services/cache/file_cache_backend.hpp"

#include "medimg/compat/format.hpp"
#include "medimg/compat/time.hpp"
#include "medimg/encoding/byte_order.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <mutex>
#include <random>
#include <system_error>

namespace medimg::services::cache {

namespace {

constexpr std::array<uint8_t, 4> kMagic = {'M', 'I', 'C', 'E'};
constexpr uint16_t kFormatVersion = 1;
constexpr std::size_t kFixedHeaderSize = 4 + 2 + 2;
constexpr std::size_t kTimingSize = 8 + 8 + 8 + 8;

struct entry_file {
    std::string key;
    stored_entry entry;
    std::size_t payload_size{0};
};

auto backend_error(const std::string& message, const std::string& details = "")
    -> error_info {
    return details.empty() ? error_info{error_codes::cache_backend_error, message, "medimg"}
                           : error_info{error_codes::cache_backend_error, message, "medimg",
                                        details};
}

auto fnv1a_64(std::string_view text) noexcept -> uint64_t {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : text) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

auto generate_temp_filename(const std::filesystem::path& base) -> std::filesystem::path {
    static thread_local std::mt19937_64 gen{std::random_device{}()};
    return base.parent_path() /
           (base.filename().string() + ".tmp." + std::to_string(gen()));
}

/**
 * @brief Read an entry file; with header_only the payload is skipped
 */
auto read_entry_file(const std::filesystem::path& path, bool header_only)
    -> Result<entry_file> {
    std::error_code size_ec;
    const auto file_size = std::filesystem::file_size(path, size_ec);
    if (size_ec) {
        return Result<entry_file>::err(
            backend_error("Failed to stat cache file: " + size_ec.message(), path.string()));
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Result<entry_file>::err(backend_error("Failed to open cache file", path.string()));
    }

    std::array<uint8_t, kFixedHeaderSize> fixed{};
    if (!file.read(reinterpret_cast<char*>(fixed.data()), fixed.size()) ||
        !std::equal(kMagic.begin(), kMagic.end(), fixed.begin())) {
        return Result<entry_file>::err(backend_error("Not a cache file", path.string()));
    }
    if (encoding::read_le16(fixed, 4) != kFormatVersion) {
        return Result<entry_file>::err(
            backend_error("Unsupported cache file version", path.string()));
    }

    const std::size_t key_length = encoding::read_le16(fixed, 6);
    const auto header_size = kFixedHeaderSize + key_length + kTimingSize;
    if (file_size < header_size) {
        return Result<entry_file>::err(backend_error("Truncated cache file", path.string()));
    }

    entry_file result;
    result.key.resize(key_length);
    std::array<uint8_t, kTimingSize> timing{};
    if (!file.read(result.key.data(), static_cast<std::streamsize>(result.key.size())) ||
        !file.read(reinterpret_cast<char*>(timing.data()), timing.size())) {
        return Result<entry_file>::err(backend_error("Truncated cache file", path.string()));
    }

    auto& entry = result.entry;
    entry.inserted_at =
        compat::from_unix_millis(static_cast<int64_t>(encoding::read_le64(timing, 0)));
    entry.ttl = std::chrono::seconds{static_cast<int64_t>(encoding::read_le64(timing, 8))};
    entry.last_accessed =
        compat::from_unix_millis(static_cast<int64_t>(encoding::read_le64(timing, 16)));
    const auto payload_size = encoding::read_le64(timing, 24);
    if (payload_size != file_size - header_size) {
        return Result<entry_file>::err(backend_error(
            compat::format("Cache file payload length {} does not match file size {}",
                           payload_size, file_size),
            path.string()));
    }

    result.payload_size = static_cast<std::size_t>(payload_size);
    if (header_only) {
        return Result<entry_file>::ok(std::move(result));
    }

    entry.payload.resize(static_cast<std::size_t>(payload_size));
    if (!file.read(reinterpret_cast<char*>(entry.payload.data()),
                   static_cast<std::streamsize>(payload_size))) {
        return Result<entry_file>::err(backend_error("Truncated cache payload", path.string()));
    }
    return Result<entry_file>::ok(std::move(result));
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

file_cache_backend::file_cache_backend(file_backend_config config)
    : config_(std::move(config)), index_(config_.max_bytes) {}

auto file_cache_backend::open(const file_backend_config& config)
    -> Result<std::unique_ptr<file_cache_backend>> {
    std::error_code ec;
    std::filesystem::create_directories(config.directory, ec);
    if (ec) {
        return Result<std::unique_ptr<file_cache_backend>>::err(
            backend_error("Failed to create cache directory: " + ec.message(),
                          config.directory.string()));
    }

    auto backend = std::unique_ptr<file_cache_backend>(new file_cache_backend(config));
    auto rebuilt = backend->rebuild_index();
    if (rebuilt.is_err()) {
        return Result<std::unique_ptr<file_cache_backend>>::err(rebuilt.error());
    }
    return Result<std::unique_ptr<file_cache_backend>>::ok(std::move(backend));
}

auto file_cache_backend::rebuild_index() -> VoidResult {
    std::unique_lock lock(mutex_);
    (void)index_.clear();

    std::vector<std::pair<std::string, file_slot>> found;
    std::error_code ec;
    for (const auto& item : std::filesystem::directory_iterator(config_.directory, ec)) {
        if (!item.is_regular_file() || item.path().extension() != config_.file_extension) {
            continue;
        }
        auto header = read_entry_file(item.path(), true);
        if (header.is_err()) {
            continue;
        }

        auto& parsed = header.value();
        file_slot slot;
        slot.path = item.path();
        slot.inserted_at = parsed.entry.inserted_at;
        slot.ttl = parsed.entry.ttl;
        slot.last_accessed = parsed.entry.last_accessed;
        slot.payload_size = parsed.payload_size;
        found.emplace_back(std::move(parsed.key), std::move(slot));
    }
    if (ec) {
        return medimg_void_error(error_codes::cache_backend_error,
                                 "Failed to scan cache directory: " + ec.message(),
                                 config_.directory.string());
    }

    // Most recently accessed first, so restore() appends in LRU order
    std::sort(found.begin(), found.end(), [](const auto& a, const auto& b) {
        return a.second.last_accessed > b.second.last_accessed;
    });
    for (auto& [key, slot] : found) {
        index_.restore(key, std::move(slot));
    }
    return ok();
}

// ============================================================================
// cache_backend Implementation
// ============================================================================

auto file_cache_backend::get(std::string_view key, time_point now)
    -> Result<lookup_result> {
    std::unique_lock lock(mutex_);
    lookup_result result;
    auto* slot = index_.promote(key);
    if (slot == nullptr) {
        return Result<lookup_result>::ok(std::move(result));
    }
    if (slot->is_expired(now)) {
        drop(key);
        result.expired = true;
        return Result<lookup_result>::ok(std::move(result));
    }

    auto contents = read_entry_file(slot->path, false);
    if (contents.is_err()) {
        drop(key);
        return Result<lookup_result>::err(contents.error());
    }
    slot->last_accessed = now;
    result.entry = std::move(contents.value().entry);
    result.entry->last_accessed = now;
    return Result<lookup_result>::ok(std::move(result));
}

auto file_cache_backend::put(const std::string& key, stored_entry entry)
    -> Result<put_outcome> {
    std::unique_lock lock(mutex_);
    put_outcome outcome;
    if (!index_.fits(entry.payload.size())) {
        return Result<put_outcome>::ok(std::move(outcome));
    }

    const auto path = path_for(key);
    auto written = write_file(path, key, entry);
    if (written.is_err()) {
        return Result<put_outcome>::err(written.error());
    }

    file_slot slot;
    slot.path = path;
    slot.inserted_at = entry.inserted_at;
    slot.ttl = entry.ttl;
    slot.last_accessed = entry.last_accessed;
    slot.payload_size = entry.payload.size();

    auto evicted = index_.insert_or_assign(key, std::move(slot));
    outcome.stored = true;
    for (auto& [victim, victim_slot] : evicted) {
        remove_file(victim_slot.path);
        outcome.evicted_keys.push_back(std::move(victim));
    }
    return Result<put_outcome>::ok(std::move(outcome));
}

auto file_cache_backend::remove(std::string_view key) -> Result<bool> {
    std::unique_lock lock(mutex_);
    auto slot = index_.erase(key);
    if (!slot) {
        return Result<bool>::ok(false);
    }
    remove_file(slot->path);
    return Result<bool>::ok(true);
}

auto file_cache_backend::remove_if_unchanged(std::string_view key, time_point inserted_at)
    -> Result<bool> {
    std::unique_lock lock(mutex_);
    const auto* slot = index_.find(key);
    // Headers keep millisecond precision
    if (slot == nullptr ||
        compat::to_unix_millis(slot->inserted_at) != compat::to_unix_millis(inserted_at)) {
        return Result<bool>::ok(false);
    }
    drop(key);
    return Result<bool>::ok(true);
}

auto file_cache_backend::clear() -> VoidResult {
    std::unique_lock lock(mutex_);
    for (auto& [key, slot] : index_.clear()) {
        remove_file(slot.path);
    }
    return ok();
}

auto file_cache_backend::touch(std::string_view key, time_point now,
                               std::optional<std::chrono::seconds> ttl) -> Result<bool> {
    std::unique_lock lock(mutex_);
    auto* slot = index_.promote(key);
    if (slot == nullptr || slot->is_expired(now)) {
        return Result<bool>::ok(false);
    }

    auto contents = read_entry_file(slot->path, false);
    if (contents.is_err()) {
        drop(key);
        return Result<bool>::err(contents.error());
    }
    auto& entry = contents.value().entry;
    entry.inserted_at = now;
    entry.last_accessed = now;
    if (ttl) {
        entry.ttl = *ttl;
    }

    auto written = write_file(slot->path, key, entry);
    if (written.is_err()) {
        return Result<bool>::err(written.error());
    }
    slot->ttl = entry.ttl;
    slot->last_accessed = now;
    (void)index_.retime(key, now);
    return Result<bool>::ok(true);
}

auto file_cache_backend::contains(std::string_view key, time_point now) const
    -> Result<bool> {
    std::shared_lock lock(mutex_);
    const auto* slot = index_.find(key);
    return Result<bool>::ok(slot != nullptr && !slot->is_expired(now));
}

auto file_cache_backend::remove_expired(time_point now)
    -> Result<std::vector<std::string>> {
    std::unique_lock lock(mutex_);
    std::vector<std::string> expired;
    index_.for_each([&](const std::string& key, const file_slot& slot) {
        if (slot.is_expired(now)) {
            expired.push_back(key);
        }
    });
    for (const auto& key : expired) {
        drop(key);
    }
    return Result<std::vector<std::string>>::ok(std::move(expired));
}

auto file_cache_backend::keys(std::string_view prefix) const
    -> Result<std::vector<std::string>> {
    std::shared_lock lock(mutex_);
    return Result<std::vector<std::string>>::ok(index_.keys(prefix));
}

auto file_cache_backend::stats() const -> backend_stats {
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

// ============================================================================
// Internal Helper Methods
// ============================================================================

auto file_cache_backend::file_stem_for(std::string_view key) -> std::string {
    std::string stem;
    stem.reserve(key.size() + 17);
    for (char c : key) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-') {
            stem += c;
        } else {
            stem += '_';
        }
    }
    stem += compat::format("-{:016x}", fnv1a_64(key));
    return stem;
}

auto file_cache_backend::path_for(std::string_view key) const -> std::filesystem::path {
    return config_.directory / (file_stem_for(key) + config_.file_extension);
}

auto file_cache_backend::write_file(const std::filesystem::path& path, std::string_view key,
                                    const stored_entry& entry) const -> VoidResult {
    if (key.size() > 0xFFFF) {
        return medimg_void_error(error_codes::cache_backend_error,
                                 "Cache key too long for file backend");
    }

    std::vector<uint8_t> header(kMagic.begin(), kMagic.end());
    header.reserve(kFixedHeaderSize + key.size() + kTimingSize);
    encoding::write_le16(header, kFormatVersion);
    encoding::write_le16(header, static_cast<uint16_t>(key.size()));
    header.insert(header.end(), key.begin(), key.end());
    encoding::write_le64(header, static_cast<uint64_t>(compat::to_unix_millis(entry.inserted_at)));
    encoding::write_le64(header, static_cast<uint64_t>(entry.ttl.count()));
    encoding::write_le64(header,
                         static_cast<uint64_t>(compat::to_unix_millis(entry.last_accessed)));
    encoding::write_le64(header, entry.payload.size());

    // Write to a temporary file first, then rename over the target
    const auto temp_path = generate_temp_filename(path);
    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file ||
            !file.write(reinterpret_cast<const char*>(header.data()),
                        static_cast<std::streamsize>(header.size())) ||
            !file.write(reinterpret_cast<const char*>(entry.payload.data()),
                        static_cast<std::streamsize>(entry.payload.size()))) {
            file.close();
            remove_file(temp_path);
            return medimg_void_error(error_codes::cache_backend_error,
                                     "Failed to write cache file", temp_path.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        remove_file(temp_path);
        return medimg_void_error(error_codes::cache_backend_error,
                                 "Failed to rename cache file: " + ec.message(),
                                 path.string());
    }
    return ok();
}

void file_cache_backend::drop(std::string_view key) {
    if (auto slot = index_.erase(key)) {
        remove_file(slot->path);
    }
}

void file_cache_backend::remove_file(const std::filesystem::path& path) const {
    std::error_code ec;
    std::filesystem::remove(path, ec);
}

}  // namespace medimg::services::cache
