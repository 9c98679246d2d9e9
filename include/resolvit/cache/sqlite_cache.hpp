#pragma once

#include <resolvit/cache/cache.hpp>

#include <cstdint>
#include <mutex>
#include <string>

// Forward declaration for sqlite3 C API
struct sqlite3;

namespace resolvit::cache {

    /// SQLite connection settings
    struct OpenOptions {
        bool enable_wal = true;
        int32_t busy_timeout_ms = 5000;
        enum class Synchronous { OFF = 0, NORMAL = 1, FULL = 2 };
        Synchronous sync_mode = Synchronous::NORMAL;

        OpenOptions() = default;
    };

    // ===========================================
    // SqliteCache - resolution cache that survives restarts
    // ===========================================

    class SqliteCache : public ResolutionCache {
      public:
        SqliteCache();
        ~SqliteCache() override;

        SqliteCache(const SqliteCache &) = delete;
        SqliteCache &operator=(const SqliteCache &) = delete;

        /// Open or create the cache database and its schema
        /// @param path Database file path, ":memory:" for a private in-memory database
        /// @return true on success, false on failure
        bool open(const std::string &path, const OpenOptions &opts = OpenOptions{});

        void close();

        bool isOpen() const;

        std::optional<std::string> get(const std::string &key) override;

        void set(const std::string &key, const std::string &value,
                 std::optional<std::chrono::seconds> ttl = std::nullopt) override;

        void clear(const std::string &key) override;

        void flush() override;

        /// Delete expired rows, returns how many were removed
        int64_t purgeExpired();

        /// Number of rows, expired ones included
        int64_t entryCount();

      private:
        bool initializeSchema();
        void applyPragmas(const OpenOptions &opts);
        bool executeSql(const char *sql);

        mutable std::mutex mutex_;
        sqlite3 *db_;
        std::string db_path_;
    };

} // namespace resolvit::cache
