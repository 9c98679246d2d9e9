#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <datapod/datapod.hpp>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <resolvit/cache/cache.hpp>
#include <resolvit/common/cancel.hpp>
#include <resolvit/common/scheduler.hpp>
#include <resolvit/ledger/connection.hpp>
#include <resolvit/ledger/genesis.hpp>

namespace resolvit::ledger {

    /// Immutable settings for one ledger pool
    struct LedgerPoolConfig {
        std::string name;
        std::chrono::milliseconds keepalive{0}; // 0 closes as soon as the last lease is released
        bool read_only = false;
        std::string genesis_transactions;       // empty: read from the pool's genesis file at open time
        std::optional<std::string> socks_proxy;
        std::shared_ptr<cache::ResolutionCache> cache;
        std::optional<std::chrono::seconds> cache_ttl;

        /// Same network and connection parameters (cache settings are not compared)
        inline bool sameConnection(const LedgerPoolConfig &other) const {
            return name == other.name && keepalive == other.keepalive && read_only == other.read_only &&
                   genesis_transactions == other.genesis_transactions && socks_proxy == other.socks_proxy;
        }
    };

    class LedgerPool;

    // ===========================================
    // PoolLease - one counted reference to an open pool
    // ===========================================

    /// Returned by LedgerPool::acquire. The connection stays usable until release() is
    /// called; release() runs at most once and the destructor calls it if the owner did not.
    class PoolLease {
      public:
        PoolLease(std::shared_ptr<LedgerPool> pool, std::shared_ptr<LedgerConnection> connection);
        ~PoolLease();

        PoolLease(const PoolLease &) = delete;
        PoolLease &operator=(const PoolLease &) = delete;

        LedgerConnection &connection() const { return *connection_; }

        const std::shared_ptr<LedgerPool> &pool() const { return pool_; }

        /// Give the reference back. A failed close surfaces here as ERR_POOL_CLOSE.
        dp::Result<void, dp::Error> release();

        bool released() const { return released_.load(); }

      private:
        std::shared_ptr<LedgerPool> pool_;
        std::shared_ptr<LedgerConnection> connection_;
        std::atomic<bool> released_{false};
    };

    // ===========================================
    // LedgerPool - lazily opened, ref-counted ledger connection
    // ===========================================

    class LedgerPool : public std::enable_shared_from_this<LedgerPool> {
      public:
        static constexpr int CLOSE_ATTEMPTS = 3;
        static constexpr std::chrono::milliseconds CLOSE_BACKOFF{10};
        // How often a caller waiting out an open or close rechecks its cancel token
        static constexpr std::chrono::milliseconds TRANSITION_POLL{10};

        static std::shared_ptr<LedgerPool>
        create(LedgerPoolConfig config, std::shared_ptr<LedgerConnector> connector,
               std::shared_ptr<DeferredScheduler> scheduler = DeferredScheduler::shared(),
               const std::filesystem::path &storage_root = defaultStorageRoot());

        ~LedgerPool();

        LedgerPool(const LedgerPool &) = delete;
        LedgerPool &operator=(const LedgerPool &) = delete;

        /// Open the network connection if it is not open yet. Does not retry.
        dp::Result<void, dp::Error> open();

        /// Take a reference, cancelling any pending deferred close and opening on demand.
        /// Network I/O runs outside the pool lock; concurrent callers wait for it and may be cancelled meanwhile.
        dp::Result<std::shared_ptr<PoolLease>, dp::Error> acquire(const CancelToken &cancel = CancelToken());

        /// Close the connection now. Three attempts; when all fail the pool keeps the handle
        /// and pins one extra reference so it is never closed behind a live user.
        dp::Result<void, dp::Error> close();

        const std::string &name() const { return config_.name; }
        const LedgerPoolConfig &config() const { return config_; }

        bool isOpened() const;
        int refCount() const;
        bool hasPendingClose() const;
        bool hasPinnedReference() const;

        /// Number of successful connector opens over the pool's lifetime
        int openCount() const;

      private:
        friend class PoolLease;

        LedgerPool(LedgerPoolConfig config, std::shared_ptr<LedgerConnector> connector,
                   std::shared_ptr<DeferredScheduler> scheduler, const std::filesystem::path &storage_root);

        // The *Locked helpers take the held pool lock and drop it around network I/O
        dp::Result<void, dp::Error> openLocked(std::unique_lock<std::mutex> &lock);
        dp::Result<void, dp::Error> closeLocked(std::unique_lock<std::mutex> &lock);
        bool waitIdleLocked(std::unique_lock<std::mutex> &lock, const CancelToken &cancel);
        dp::Result<std::shared_ptr<LedgerConnection>, dp::Error> connect();
        void cancelPendingCloseLocked();
        dp::Result<void, dp::Error> releaseOne();
        void onKeepaliveExpired(uint64_t generation);

        mutable std::mutex mutex_;
        std::condition_variable transition_cv_;
        bool transitioning_ = false; // an open or close is in flight without the lock
        LedgerPoolConfig config_;
        std::shared_ptr<LedgerConnector> connector_;
        std::shared_ptr<DeferredScheduler> scheduler_;
        GenesisStore genesis_;

        std::shared_ptr<LedgerConnection> handle_;
        bool opened_ = false;
        bool init_config_ = false;
        std::string genesis_txns_;
        int ref_count_ = 0;
        int pinned_ = 0;
        int open_count_ = 0;

        // Deferred close bookkeeping: generation identifies the armed timer, 0 when none
        uint64_t close_generation_ = 0;
        uint64_t pending_generation_ = 0;
        DeferredScheduler::TaskId pending_task_ = 0;
    };

} // namespace resolvit::ledger
