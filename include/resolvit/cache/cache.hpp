#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <unordered_map>

namespace resolvit::cache {

    /// Thread-safe key/value store with per-entry expiry
    class ResolutionCache {
      public:
        virtual ~ResolutionCache() = default;

        /// Live value for `key`, nullopt when absent or expired
        virtual std::optional<std::string> get(const std::string &key) = 0;

        /// Store `value`; no TTL means the entry never expires
        virtual void set(const std::string &key, const std::string &value,
                         std::optional<std::chrono::seconds> ttl = std::nullopt) = 0;

        virtual void clear(const std::string &key) = 0;

        /// Drop every entry
        virtual void flush() = 0;
    };

    /// In-process cache
    class MemoryCache : public ResolutionCache {
      public:
        using Clock = std::chrono::steady_clock;

        MemoryCache() = default;

        inline std::optional<std::string> get(const std::string &key) override {
            {
                std::shared_lock lock(mutex_);
                auto it = entries_.find(key);
                if (it == entries_.end()) {
                    return std::nullopt;
                }
                if (!it->second.expires_at || Clock::now() < *it->second.expires_at) {
                    return it->second.value;
                }
            }
            // Expired: evict under the exclusive lock
            std::unique_lock lock(mutex_);
            auto it = entries_.find(key);
            if (it != entries_.end() && it->second.expires_at && Clock::now() >= *it->second.expires_at) {
                entries_.erase(it);
            }
            return std::nullopt;
        }

        inline void set(const std::string &key, const std::string &value,
                        std::optional<std::chrono::seconds> ttl = std::nullopt) override {
            Entry entry;
            entry.value = value;
            if (ttl) {
                entry.expires_at = Clock::now() + *ttl;
            }
            std::unique_lock lock(mutex_);
            entries_[key] = std::move(entry);
        }

        inline void clear(const std::string &key) override {
            std::unique_lock lock(mutex_);
            entries_.erase(key);
        }

        inline void flush() override {
            std::unique_lock lock(mutex_);
            entries_.clear();
        }

        inline size_t size() const {
            std::shared_lock lock(mutex_);
            return entries_.size();
        }

      private:
        struct Entry {
            std::string value;
            std::optional<Clock::time_point> expires_at;
        };

        mutable std::shared_mutex mutex_;
        std::unordered_map<std::string, Entry> entries_;
    };

} // namespace resolvit::cache
