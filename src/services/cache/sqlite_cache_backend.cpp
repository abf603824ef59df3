/**
 * @file sqlite_cache_backend.cpp
 * @brief Implementation of sqlite_cache_backend
 */

#include "medimg/services/cache/sqlite_cache_backend.hpp"

#include "medimg/compat/format.hpp"
#include "medimg/compat/time.hpp"

#include <sqlite3.h>

namespace medimg::services::cache {

namespace {

constexpr const char* kSchemaSql = R"(
    CREATE TABLE IF NOT EXISTS cache_entries (
        cache_key      TEXT PRIMARY KEY,
        payload        BLOB NOT NULL,
        payload_size   INTEGER NOT NULL,
        inserted_at    INTEGER NOT NULL,
        ttl_seconds    INTEGER NOT NULL,
        last_accessed  INTEGER NOT NULL
    );
    CREATE INDEX IF NOT EXISTS idx_cache_entries_last_accessed
        ON cache_entries(last_accessed);
    CREATE INDEX IF NOT EXISTS idx_cache_entries_inserted_at
        ON cache_entries(inserted_at);
)";

/**
 * @brief RAII owner of a prepared statement
 */
class statement {
public:
    statement(sqlite3* db, const char* sql) {
        rc_ = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
    }

    ~statement() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }

    statement(const statement&) = delete;
    statement& operator=(const statement&) = delete;

    [[nodiscard]] auto ok() const noexcept -> bool { return rc_ == SQLITE_OK; }
    [[nodiscard]] auto get() const noexcept -> sqlite3_stmt* { return stmt_; }

    void bind_text(int index, std::string_view text) {
        sqlite3_bind_text(stmt_, index, text.data(), static_cast<int>(text.size()),
                          SQLITE_TRANSIENT);
    }

    void bind_int64(int index, int64_t value) { sqlite3_bind_int64(stmt_, index, value); }

    auto step() -> int { return sqlite3_step(stmt_); }

    /// Release the read cursor before writing to the same table
    void reset() { sqlite3_reset(stmt_); }

private:
    sqlite3_stmt* stmt_{nullptr};
    int rc_{SQLITE_ERROR};
};

auto get_text(sqlite3_stmt* stmt, int col) -> std::string {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? std::string(text) : std::string{};
}

}  // namespace

// ============================================================================
// Construction / Destruction
// ============================================================================

auto sqlite_cache_backend::open(const sqlite_backend_config& config)
    -> Result<std::unique_ptr<sqlite_cache_backend>> {
    using result_type = Result<std::unique_ptr<sqlite_cache_backend>>;
    sqlite3* db = nullptr;

    auto rc = sqlite3_open(config.database_path.c_str(), &db);
    if (rc != SQLITE_OK) {
        std::string error_msg = db ? sqlite3_errmsg(db) : "Failed to allocate memory";
        if (db) {
            sqlite3_close(db);
        }
        return medimg_error<std::unique_ptr<sqlite_cache_backend>>(
            error_codes::cache_backend_error,
            compat::format("Failed to open cache database: {}", error_msg),
            config.database_path);
    }

    if (config.wal_mode && config.database_path != ":memory:") {
        rc = sqlite3_exec(db, "PRAGMA journal_mode = WAL;", nullptr, nullptr, nullptr);
        if (rc != SQLITE_OK) {
            sqlite3_close(db);
            return medimg_error<std::unique_ptr<sqlite_cache_backend>>(
                error_codes::cache_backend_error, "Failed to enable WAL mode",
                config.database_path);
        }
    }

    char* err_msg = nullptr;
    rc = sqlite3_exec(db, kSchemaSql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::string message = err_msg ? err_msg : "unknown error";
        sqlite3_free(err_msg);
        sqlite3_close(db);
        return medimg_error<std::unique_ptr<sqlite_cache_backend>>(
            error_codes::cache_backend_error,
            compat::format("Failed to create cache schema: {}", message),
            config.database_path);
    }

    auto backend =
        std::unique_ptr<sqlite_cache_backend>(new sqlite_cache_backend(db, config));
    auto counters = backend->load_counters();
    if (counters.is_err()) {
        return result_type::err(counters.error());
    }
    return result_type::ok(std::move(backend));
}

sqlite_cache_backend::sqlite_cache_backend(sqlite3* db, sqlite_backend_config config)
    : db_(db), config_(std::move(config)) {}

sqlite_cache_backend::~sqlite_cache_backend() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

auto sqlite_cache_backend::load_counters() -> VoidResult {
    statement stmt(db_, "SELECT COUNT(*), COALESCE(SUM(payload_size), 0) FROM cache_entries;");
    if (!stmt.ok() || stmt.step() != SQLITE_ROW) {
        return VoidResult(error_result("load counters"));
    }
    item_count_ = static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
    total_bytes_ = static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 1));
    return ok();
}

// ============================================================================
// cache_backend Implementation
// ============================================================================

auto sqlite_cache_backend::get(std::string_view key, time_point now)
    -> Result<lookup_result> {
    using result_type = Result<lookup_result>;
    std::lock_guard<std::mutex> lock(mutex_);
    lookup_result result;

    statement select(db_,
                     "SELECT payload, inserted_at, ttl_seconds, payload_size "
                     "FROM cache_entries WHERE cache_key = ?;");
    if (!select.ok()) {
        return result_type::err(error_result("prepare get"));
    }
    select.bind_text(1, key);

    const auto rc = select.step();
    if (rc == SQLITE_DONE) {
        return result_type::ok(std::move(result));
    }
    if (rc != SQLITE_ROW) {
        return result_type::err(error_result("read entry"));
    }

    stored_entry entry;
    const auto inserted_millis = sqlite3_column_int64(select.get(), 1);
    entry.inserted_at = compat::from_unix_millis(inserted_millis);
    entry.ttl = std::chrono::seconds{sqlite3_column_int64(select.get(), 2)};
    if (entry.is_expired(now)) {
        const auto size = static_cast<uint64_t>(sqlite3_column_int64(select.get(), 3));
        select.reset();
        auto deleted = delete_row(key, inserted_millis, size);
        if (deleted.is_err()) {
            return result_type::err(deleted.error());
        }
        result.expired = deleted.value();
        return result_type::ok(std::move(result));
    }

    const auto* blob = static_cast<const uint8_t*>(sqlite3_column_blob(select.get(), 0));
    const auto blob_size = sqlite3_column_bytes(select.get(), 0);
    if (blob != nullptr && blob_size > 0) {
        entry.payload.assign(blob, blob + blob_size);
    }
    entry.last_accessed = now;

    statement update(db_, "UPDATE cache_entries SET last_accessed = ? WHERE cache_key = ?;");
    if (!update.ok()) {
        return result_type::err(error_result("prepare access update"));
    }
    update.bind_int64(1, compat::to_unix_millis(now));
    update.bind_text(2, key);
    if (update.step() != SQLITE_DONE) {
        return result_type::err(error_result("update access time"));
    }
    result.entry = std::move(entry);
    return result_type::ok(std::move(result));
}

auto sqlite_cache_backend::put(const std::string& key, stored_entry entry)
    -> Result<put_outcome> {
    std::lock_guard<std::mutex> lock(mutex_);
    put_outcome outcome;
    const auto incoming = static_cast<uint64_t>(entry.payload.size());
    if (config_.max_bytes != 0 && incoming > config_.max_bytes) {
        return Result<put_outcome>::ok(std::move(outcome));
    }

    auto existing = entry_size(key);
    if (existing.is_err()) {
        return Result<put_outcome>::err(existing.error());
    }
    const auto replaced = existing.value().value_or(0);

    // The replaced row does not count against the bound
    total_bytes_ -= replaced;
    auto evicted = evict_until_fits(key, incoming, existing.value().has_value(),
                                    outcome.evicted_keys);
    total_bytes_ += replaced;
    if (evicted.is_err()) {
        return Result<put_outcome>::err(evicted.error());
    }

    statement upsert(db_, R"(
        INSERT INTO cache_entries
            (cache_key, payload, payload_size, inserted_at, ttl_seconds, last_accessed)
        VALUES (?, ?, ?, ?, ?, ?)
        ON CONFLICT(cache_key) DO UPDATE SET
            payload = excluded.payload,
            payload_size = excluded.payload_size,
            inserted_at = excluded.inserted_at,
            ttl_seconds = excluded.ttl_seconds,
            last_accessed = excluded.last_accessed;
    )");
    if (!upsert.ok()) {
        return Result<put_outcome>::err(error_result("prepare put"));
    }
    upsert.bind_text(1, key);
    if (entry.payload.empty()) {
        sqlite3_bind_zeroblob(upsert.get(), 2, 0);
    } else {
        sqlite3_bind_blob(upsert.get(), 2, entry.payload.data(),
                          static_cast<int>(entry.payload.size()), SQLITE_TRANSIENT);
    }
    upsert.bind_int64(3, static_cast<int64_t>(incoming));
    upsert.bind_int64(4, compat::to_unix_millis(entry.inserted_at));
    upsert.bind_int64(5, entry.ttl.count());
    upsert.bind_int64(6, compat::to_unix_millis(entry.last_accessed));
    if (upsert.step() != SQLITE_DONE) {
        return Result<put_outcome>::err(error_result("store entry"));
    }

    if (existing.value().has_value()) {
        total_bytes_ = total_bytes_ - replaced + incoming;
    } else {
        ++item_count_;
        total_bytes_ += incoming;
    }
    outcome.stored = true;
    return Result<put_outcome>::ok(std::move(outcome));
}

auto sqlite_cache_backend::remove(std::string_view key) -> Result<bool> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto existing = entry_size(key);
    if (existing.is_err()) {
        return Result<bool>::err(existing.error());
    }
    if (!existing.value()) {
        return Result<bool>::ok(false);
    }

    statement del(db_, "DELETE FROM cache_entries WHERE cache_key = ?;");
    if (!del.ok()) {
        return Result<bool>::err(error_result("prepare remove"));
    }
    del.bind_text(1, key);
    if (del.step() != SQLITE_DONE) {
        return Result<bool>::err(error_result("remove entry"));
    }
    --item_count_;
    total_bytes_ -= *existing.value();
    return Result<bool>::ok(true);
}

auto sqlite_cache_backend::remove_if_unchanged(std::string_view key, time_point inserted_at)
    -> Result<bool> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto existing = entry_size(key);
    if (existing.is_err()) {
        return Result<bool>::err(existing.error());
    }
    if (!existing.value()) {
        return Result<bool>::ok(false);
    }
    return delete_row(key, compat::to_unix_millis(inserted_at), *existing.value());
}

auto sqlite_cache_backend::clear() -> VoidResult {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sqlite3_exec(db_, "DELETE FROM cache_entries;", nullptr, nullptr, nullptr) !=
        SQLITE_OK) {
        return VoidResult(error_result("clear"));
    }
    item_count_ = 0;
    total_bytes_ = 0;
    return ok();
}

auto sqlite_cache_backend::touch(std::string_view key, time_point now,
                                 std::optional<std::chrono::seconds> ttl) -> Result<bool> {
    std::lock_guard<std::mutex> lock(mutex_);
    const char* sql =
        ttl ? "UPDATE cache_entries SET inserted_at = ?1, last_accessed = ?1, ttl_seconds = ?2 "
              "WHERE cache_key = ?3 AND "
              "(ttl_seconds <= 0 OR inserted_at + ttl_seconds * 1000 > ?1);"
            : "UPDATE cache_entries SET inserted_at = ?1, last_accessed = ?1 "
              "WHERE cache_key = ?3 AND "
              "(ttl_seconds <= 0 OR inserted_at + ttl_seconds * 1000 > ?1);";
    statement update(db_, sql);
    if (!update.ok()) {
        return Result<bool>::err(error_result("prepare touch"));
    }
    update.bind_int64(1, compat::to_unix_millis(now));
    if (ttl) {
        update.bind_int64(2, ttl->count());
    }
    update.bind_text(3, key);
    if (update.step() != SQLITE_DONE) {
        return Result<bool>::err(error_result("touch entry"));
    }
    return Result<bool>::ok(sqlite3_changes(db_) > 0);
}

auto sqlite_cache_backend::contains(std::string_view key, time_point now) const
    -> Result<bool> {
    std::lock_guard<std::mutex> lock(mutex_);
    statement select(db_,
                     "SELECT 1 FROM cache_entries WHERE cache_key = ? AND "
                     "(ttl_seconds <= 0 OR inserted_at + ttl_seconds * 1000 > ?);");
    if (!select.ok()) {
        return Result<bool>::err(error_result("prepare contains"));
    }
    select.bind_text(1, key);
    select.bind_int64(2, compat::to_unix_millis(now));
    const auto rc = select.step();
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        return Result<bool>::err(error_result("check key"));
    }
    return Result<bool>::ok(rc == SQLITE_ROW);
}

auto sqlite_cache_backend::remove_expired(time_point now)
    -> Result<std::vector<std::string>> {
    using result_type = Result<std::vector<std::string>>;
    std::lock_guard<std::mutex> lock(mutex_);

    struct expired_row {
        std::string key;
        int64_t inserted_at;
        uint64_t size;
    };
    std::vector<expired_row> rows;
    {
        statement select(db_,
                         "SELECT cache_key, inserted_at, payload_size FROM cache_entries "
                         "WHERE ttl_seconds > 0 AND inserted_at + ttl_seconds * 1000 <= ?;");
        if (!select.ok()) {
            return result_type::err(error_result("prepare expiry scan"));
        }
        select.bind_int64(1, compat::to_unix_millis(now));

        int rc = SQLITE_ROW;
        while ((rc = select.step()) == SQLITE_ROW) {
            rows.push_back({get_text(select.get(), 0), sqlite3_column_int64(select.get(), 1),
                            static_cast<uint64_t>(sqlite3_column_int64(select.get(), 2))});
        }
        if (rc != SQLITE_DONE) {
            return result_type::err(error_result("scan expired entries"));
        }
    }

    std::vector<std::string> removed;
    for (auto& row : rows) {
        auto deleted = delete_row(row.key, row.inserted_at, row.size);
        if (deleted.is_err()) {
            return result_type::err(deleted.error());
        }
        if (deleted.value()) {
            removed.push_back(std::move(row.key));
        }
    }
    return result_type::ok(std::move(removed));
}

auto sqlite_cache_backend::keys(std::string_view prefix) const
    -> Result<std::vector<std::string>> {
    std::lock_guard<std::mutex> lock(mutex_);
    statement select(db_,
                     "SELECT cache_key FROM cache_entries "
                     "WHERE substr(cache_key, 1, ?) = ? ORDER BY last_accessed DESC;");
    if (!select.ok()) {
        return Result<std::vector<std::string>>::err(error_result("prepare keys"));
    }
    select.bind_int64(1, static_cast<int64_t>(prefix.size()));
    select.bind_text(2, prefix);

    std::vector<std::string> result;
    int rc = SQLITE_ROW;
    while ((rc = select.step()) == SQLITE_ROW) {
        result.push_back(get_text(select.get(), 0));
    }
    if (rc != SQLITE_DONE) {
        return Result<std::vector<std::string>>::err(error_result("list keys"));
    }
    return Result<std::vector<std::string>>::ok(std::move(result));
}

auto sqlite_cache_backend::stats() const -> backend_stats {
    std::lock_guard<std::mutex> lock(mutex_);
    backend_stats result;
    result.item_count = item_count_;
    result.total_bytes = total_bytes_;
    result.max_bytes = config_.max_bytes;
    result.evictions = evictions_;
    result.oldest_item = time_bound(true);
    result.newest_item = time_bound(false);
    return result;
}

// ============================================================================
// Internal Helper Methods
// ============================================================================

auto sqlite_cache_backend::entry_size(std::string_view key) const
    -> Result<std::optional<uint64_t>> {
    statement select(db_, "SELECT payload_size FROM cache_entries WHERE cache_key = ?;");
    if (!select.ok()) {
        return Result<std::optional<uint64_t>>::err(error_result("prepare size lookup"));
    }
    select.bind_text(1, key);
    const auto rc = select.step();
    if (rc == SQLITE_DONE) {
        return Result<std::optional<uint64_t>>::ok(std::nullopt);
    }
    if (rc != SQLITE_ROW) {
        return Result<std::optional<uint64_t>>::err(error_result("size lookup"));
    }
    return Result<std::optional<uint64_t>>::ok(
        static_cast<uint64_t>(sqlite3_column_int64(select.get(), 0)));
}

auto sqlite_cache_backend::delete_row(std::string_view key, int64_t inserted_at,
                                      uint64_t size) -> Result<bool> {
    statement del(db_, "DELETE FROM cache_entries WHERE cache_key = ? AND inserted_at = ?;");
    if (!del.ok()) {
        return Result<bool>::err(error_result("prepare expiry delete"));
    }
    del.bind_text(1, key);
    del.bind_int64(2, inserted_at);
    if (del.step() != SQLITE_DONE) {
        return Result<bool>::err(error_result("delete expired entry"));
    }
    if (sqlite3_changes(db_) == 0) {
        return Result<bool>::ok(false);
    }
    --item_count_;
    total_bytes_ -= size;
    return Result<bool>::ok(true);
}

auto sqlite_cache_backend::evict_until_fits(std::string_view keep, uint64_t incoming,
                                            bool keep_exists,
                                            std::vector<std::string>& evicted)
    -> VoidResult {
    if (config_.max_bytes == 0) {
        return ok();
    }

    const std::size_t floor = keep_exists ? 1 : 0;
    while (total_bytes_ + incoming > config_.max_bytes && item_count_ > floor) {
        statement oldest(db_,
                         "SELECT cache_key, payload_size FROM cache_entries "
                         "WHERE cache_key <> ? ORDER BY last_accessed ASC LIMIT 1;");
        if (!oldest.ok()) {
            return VoidResult(error_result("prepare eviction victim"));
        }
        oldest.bind_text(1, keep);
        if (oldest.step() != SQLITE_ROW) {
            return VoidResult(error_result("select eviction victim"));
        }
        auto victim = get_text(oldest.get(), 0);
        const auto size = static_cast<uint64_t>(sqlite3_column_int64(oldest.get(), 1));

        statement del(db_, "DELETE FROM cache_entries WHERE cache_key = ?;");
        if (!del.ok()) {
            return VoidResult(error_result("prepare eviction"));
        }
        del.bind_text(1, victim);
        if (del.step() != SQLITE_DONE) {
            return VoidResult(error_result("evict entry"));
        }

        --item_count_;
        total_bytes_ -= size;
        ++evictions_;
        evicted.push_back(std::move(victim));
    }
    return ok();
}

auto sqlite_cache_backend::time_bound(bool oldest) const -> std::optional<time_point> {
    statement select(db_, oldest ? "SELECT MIN(inserted_at) FROM cache_entries;"
                                 : "SELECT MAX(inserted_at) FROM cache_entries;");
    if (!select.ok() || select.step() != SQLITE_ROW ||
        sqlite3_column_type(select.get(), 0) == SQLITE_NULL) {
        return std::nullopt;
    }
    return compat::from_unix_millis(sqlite3_column_int64(select.get(), 0));
}

auto sqlite_cache_backend::error_result(const std::string& action) const -> error_info {
    return error_info{error_codes::cache_backend_error,
                      compat::format("SQLite cache failed to {}: {}", action,
                                     sqlite3_errmsg(db_)),
                      "medimg"};
}

}  // namespace medimg::services::cache
