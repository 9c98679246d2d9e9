#include <resolvit/cache/sqlite_cache.hpp>
#include <resolvit/common/log.hpp>

#include <sqlite3.h>

namespace resolvit::cache {

    namespace {

        constexpr const char *SCHEMA_MIGRATIONS_TABLE = R"(
            CREATE TABLE IF NOT EXISTS schema_migrations (
                version INTEGER PRIMARY KEY,
                applied_at INTEGER NOT NULL
            )
        )";

        constexpr const char *RESOLUTION_CACHE_TABLE = R"(
            CREATE TABLE IF NOT EXISTS resolution_cache (
                key TEXT PRIMARY KEY,
                value TEXT NOT NULL,
                expires_at INTEGER
            )
        )";

        constexpr const char *RESOLUTION_CACHE_INDEX =
            "CREATE INDEX IF NOT EXISTS idx_resolution_cache_expires ON resolution_cache(expires_at)";

        constexpr int SCHEMA_VERSION = 1;

        int64_t nowMillis() {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                .count();
        }

    } // namespace

    SqliteCache::SqliteCache() : db_(nullptr) {}

    SqliteCache::~SqliteCache() { close(); }

    bool SqliteCache::open(const std::string &path, const OpenOptions &opts) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }

        int rc = sqlite3_open(path.c_str(), &db_);
        if (rc != SQLITE_OK) {
            log::error("cache", "Failed to open cache database " + path);
            if (db_) {
                sqlite3_close(db_);
                db_ = nullptr;
            }
            return false;
        }

        db_path_ = path;
        applyPragmas(opts);

        if (!initializeSchema()) {
            log::error("cache", "Failed to initialize cache schema in " + path);
            sqlite3_close(db_);
            db_ = nullptr;
            return false;
        }
        return true;
    }

    void SqliteCache::close() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    bool SqliteCache::isOpen() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return db_ != nullptr;
    }

    void SqliteCache::applyPragmas(const OpenOptions &opts) {
        if (!db_)
            return;

        if (opts.enable_wal) {
            sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
        }

        std::string busy_timeout = "PRAGMA busy_timeout=" + std::to_string(opts.busy_timeout_ms) + ";";
        sqlite3_exec(db_, busy_timeout.c_str(), nullptr, nullptr, nullptr);

        switch (opts.sync_mode) {
        case OpenOptions::Synchronous::OFF:
            sqlite3_exec(db_, "PRAGMA synchronous=OFF;", nullptr, nullptr, nullptr);
            break;
        case OpenOptions::Synchronous::NORMAL:
            sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
            break;
        case OpenOptions::Synchronous::FULL:
            sqlite3_exec(db_, "PRAGMA synchronous=FULL;", nullptr, nullptr, nullptr);
            break;
        }
    }

    bool SqliteCache::executeSql(const char *sql) {
        char *err_msg = nullptr;
        int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err_msg);
        if (rc != SQLITE_OK) {
            log::error("cache", std::string("SQL error: ") + (err_msg ? err_msg : "unknown"));
            sqlite3_free(err_msg);
            return false;
        }
        return true;
    }

    bool SqliteCache::initializeSchema() {
        if (!executeSql(SCHEMA_MIGRATIONS_TABLE)) {
            return false;
        }

        sqlite3_stmt *stmt;
        int version = 0;
        if (sqlite3_prepare_v2(db_, "SELECT MAX(version) FROM schema_migrations", -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            version = sqlite3_column_int(stmt, 0);
        }
        sqlite3_finalize(stmt);

        if (version >= SCHEMA_VERSION) {
            return true;
        }

        if (!executeSql(RESOLUTION_CACHE_TABLE) || !executeSql(RESOLUTION_CACHE_INDEX)) {
            return false;
        }

        if (sqlite3_prepare_v2(db_, "INSERT INTO schema_migrations (version, applied_at) VALUES (?, ?)", -1, &stmt,
                               nullptr) != SQLITE_OK) {
            return false;
        }
        sqlite3_bind_int(stmt, 1, SCHEMA_VERSION);
        sqlite3_bind_int64(stmt, 2, nowMillis() / 1000);
        bool success = (sqlite3_step(stmt) == SQLITE_DONE);
        sqlite3_finalize(stmt);
        return success;
    }

    std::optional<std::string> SqliteCache::get(const std::string &key) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!db_)
            return std::nullopt;

        sqlite3_stmt *stmt;
        const char *sql = "SELECT value FROM resolution_cache WHERE key = ? AND (expires_at IS NULL OR expires_at > ?)";
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return std::nullopt;
        }
        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmt, 2, nowMillis());

        std::optional<std::string> value;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            const auto *text = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 0));
            if (text) {
                value = std::string(text);
            }
        }
        sqlite3_finalize(stmt);
        return value;
    }

    void SqliteCache::set(const std::string &key, const std::string &value, std::optional<std::chrono::seconds> ttl) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!db_)
            return;

        sqlite3_stmt *stmt;
        const char *sql = "INSERT OR REPLACE INTO resolution_cache (key, value, expires_at) VALUES (?, ?, ?)";
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            log::error("cache", "Failed to prepare cache insert for " + key);
            return;
        }
        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);
        if (ttl) {
            sqlite3_bind_int64(stmt, 3, nowMillis() + std::chrono::duration_cast<std::chrono::milliseconds>(*ttl).count());
        } else {
            sqlite3_bind_null(stmt, 3);
        }
        if (sqlite3_step(stmt) != SQLITE_DONE) {
            log::error("cache", "Failed to store cache entry " + key);
        }
        sqlite3_finalize(stmt);
    }

    void SqliteCache::clear(const std::string &key) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!db_)
            return;

        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, "DELETE FROM resolution_cache WHERE key = ?", -1, &stmt, nullptr) != SQLITE_OK) {
            return;
        }
        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_step(stmt);
        sqlite3_finalize(stmt);
    }

    void SqliteCache::flush() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!db_)
            return;
        executeSql("DELETE FROM resolution_cache");
    }

    int64_t SqliteCache::purgeExpired() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!db_)
            return 0;

        sqlite3_stmt *stmt;
        const char *sql = "DELETE FROM resolution_cache WHERE expires_at IS NOT NULL AND expires_at <= ?";
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return 0;
        }
        sqlite3_bind_int64(stmt, 1, nowMillis());
        int64_t removed = 0;
        if (sqlite3_step(stmt) == SQLITE_DONE) {
            removed = sqlite3_changes(db_);
        }
        sqlite3_finalize(stmt);
        return removed;
    }

    int64_t SqliteCache::entryCount() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!db_)
            return 0;

        sqlite3_stmt *stmt;
        if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM resolution_cache", -1, &stmt, nullptr) != SQLITE_OK) {
            return 0;
        }
        int64_t count = 0;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            count = sqlite3_column_int64(stmt, 0);
        }
        sqlite3_finalize(stmt);
        return count;
    }

} // namespace resolvit::cache
