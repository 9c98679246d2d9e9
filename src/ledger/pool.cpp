#include <resolvit/ledger/pool.hpp>

#include <resolvit/common/error.hpp>
#include <resolvit/common/log.hpp>

#include <algorithm>
#include <exception>
#include <thread>

namespace resolvit::ledger {

    // ===========================================
    // PoolLease
    // ===========================================

    PoolLease::PoolLease(std::shared_ptr<LedgerPool> pool, std::shared_ptr<LedgerConnection> connection)
        : pool_(std::move(pool)), connection_(std::move(connection)) {}

    PoolLease::~PoolLease() {
        auto result = release();
        if (result.is_err()) {
            log::error("pool", "Release of pool '" + pool_->name() + "' failed: " + errorText(result.error()));
        }
    }

    dp::Result<void, dp::Error> PoolLease::release() {
        if (released_.exchange(true)) {
            return dp::Result<void, dp::Error>::ok();
        }
        return pool_->releaseOne();
    }

    // ===========================================
    // LedgerPool
    // ===========================================

    std::shared_ptr<LedgerPool> LedgerPool::create(LedgerPoolConfig config, std::shared_ptr<LedgerConnector> connector,
                                                   std::shared_ptr<DeferredScheduler> scheduler,
                                                   const std::filesystem::path &storage_root) {
        return std::shared_ptr<LedgerPool>(
            new LedgerPool(std::move(config), std::move(connector), std::move(scheduler), storage_root));
    }

    LedgerPool::LedgerPool(LedgerPoolConfig config, std::shared_ptr<LedgerConnector> connector,
                           std::shared_ptr<DeferredScheduler> scheduler, const std::filesystem::path &storage_root)
        : config_(std::move(config)), connector_(std::move(connector)), scheduler_(std::move(scheduler)),
          genesis_(storage_root) {
        init_config_ = !config_.genesis_transactions.empty();
    }

    LedgerPool::~LedgerPool() {
        std::unique_lock<std::mutex> lock(mutex_);
        cancelPendingCloseLocked();
        if (handle_) {
            auto result = closeLocked(lock);
            if (result.is_err()) {
                log::error("pool", "Pool '" + config_.name + "' destroyed with an open handle: " +
                                       errorText(result.error()));
            }
        }
    }

    dp::Result<void, dp::Error> LedgerPool::open() {
        std::unique_lock<std::mutex> lock(mutex_);
        waitIdleLocked(lock, CancelToken());
        return openLocked(lock);
    }

    bool LedgerPool::waitIdleLocked(std::unique_lock<std::mutex> &lock, const CancelToken &cancel) {
        while (transitioning_) {
            if (cancel.isCancelled()) {
                return false;
            }
            transition_cv_.wait_until(lock, cancel.clamp(std::chrono::steady_clock::now() + TRANSITION_POLL));
        }
        return true;
    }

    dp::Result<void, dp::Error> LedgerPool::openLocked(std::unique_lock<std::mutex> &lock) {
        if (handle_) {
            opened_ = true;
            return dp::Result<void, dp::Error>::ok();
        }

        transitioning_ = true;
        lock.unlock();
        auto connection = connect();
        lock.lock();
        transitioning_ = false;
        transition_cv_.notify_all();

        if (connection.is_err()) {
            return dp::Result<void, dp::Error>::err(connection.error());
        }
        handle_ = connection.value();
        opened_ = true;
        ++open_count_;
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<std::shared_ptr<LedgerConnection>, dp::Error> LedgerPool::connect() {
        using ConnectResult = dp::Result<std::shared_ptr<LedgerConnection>, dp::Error>;

        if (init_config_) {
            auto written = genesis_.writeConfig(config_.name, config_.genesis_transactions, true);
            if (written.is_err()) {
                return ConnectResult::err(written.error());
            }
            genesis_txns_ = GenesisStore::normalize(config_.genesis_transactions);
            init_config_ = false;
        }

        if (genesis_txns_.empty()) {
            auto stored = genesis_.readConfig(config_.name);
            if (stored.is_err()) {
                return ConnectResult::err(stored.error());
            }
            genesis_txns_ = stored.value();
        }

        const std::string genesis_hash = GenesisStore::hash(genesis_txns_);
        auto cached = genesis_.readCache(config_.name, genesis_hash);
        const std::string &txns = cached ? *cached : genesis_txns_;

        log::info("pool", "Opening pool ledger: " + config_.name);
        std::shared_ptr<LedgerConnection> handle;
        try {
            auto connection = connector_->open(config_.name, txns, config_.socks_proxy);
            if (connection.is_err()) {
                return ConnectResult::err(pool_open_error("Failed to open pool ledger '" + config_.name +
                                                          "': " + errorText(connection.error())));
            }
            handle = connection.value();
        } catch (const std::exception &e) {
            return ConnectResult::err(
                pool_open_error("Failed to open pool ledger '" + config_.name + "': " + e.what()));
        }

        auto current = handle->transactions();
        if (current.is_err()) {
            log::warn("pool", "Could not read transactions of pool '" + config_.name +
                                  "': " + errorText(current.error()));
            return ConnectResult::ok(handle);
        }

        std::string refreshed = GenesisStore::normalize(current.value());
        if (!refreshed.empty() && (!cached || refreshed != *cached)) {
            auto stored = genesis_.writeCache(config_.name, genesis_hash, refreshed);
            if (stored.is_err()) {
                log::error("genesis", "Error writing cached transactions for pool '" + config_.name +
                                          "': " + errorText(stored.error()));
            }
        }
        return ConnectResult::ok(handle);
    }

    dp::Result<std::shared_ptr<PoolLease>, dp::Error> LedgerPool::acquire(const CancelToken &cancel) {
        using AcquireResult = dp::Result<std::shared_ptr<PoolLease>, dp::Error>;

        if (cancel.isCancelled()) {
            return AcquireResult::err(lookup_cancelled("Acquire of pool '" + config_.name + "' cancelled"));
        }

        std::unique_lock<std::mutex> lock(mutex_);
        if (!waitIdleLocked(lock, cancel)) {
            return AcquireResult::err(lookup_cancelled("Acquire of pool '" + config_.name + "' cancelled"));
        }
        cancelPendingCloseLocked();

        if (!handle_) {
            auto opened = openLocked(lock);
            if (opened.is_err()) {
                return AcquireResult::err(opened.error());
            }
        }

        ++ref_count_;
        return AcquireResult::ok(std::make_shared<PoolLease>(shared_from_this(), handle_));
    }

    dp::Result<void, dp::Error> LedgerPool::releaseOne() {
        std::unique_lock<std::mutex> lock(mutex_);
        if (ref_count_ > 0) {
            --ref_count_;
        }
        if (ref_count_ > 0) {
            return dp::Result<void, dp::Error>::ok();
        }
        waitIdleLocked(lock, CancelToken());
        if (ref_count_ > 0 || !handle_) {
            return dp::Result<void, dp::Error>::ok();
        }

        if (config_.keepalive.count() <= 0) {
            return closeLocked(lock);
        }

        cancelPendingCloseLocked();
        const uint64_t generation = ++close_generation_;
        pending_generation_ = generation;
        std::weak_ptr<LedgerPool> weak = weak_from_this();
        pending_task_ = scheduler_->scheduleOnce(
            [weak, generation]() {
                if (auto self = weak.lock()) {
                    self->onKeepaliveExpired(generation);
                }
            },
            config_.keepalive);
        log::debug("pool", "Pool '" + config_.name + "' idle, close scheduled in " +
                               std::to_string(config_.keepalive.count()) + "ms");
        return dp::Result<void, dp::Error>::ok();
    }

    void LedgerPool::onKeepaliveExpired(uint64_t generation) {
        std::unique_lock<std::mutex> lock(mutex_);
        waitIdleLocked(lock, CancelToken());
        // A newer acquire or release re-armed or dropped this timer
        if (pending_generation_ != generation) {
            return;
        }
        pending_generation_ = 0;
        pending_task_ = 0;

        if (ref_count_ != 0 || !handle_) {
            return;
        }
        auto result = closeLocked(lock);
        if (result.is_err()) {
            log::error("pool", "Deferred close of pool '" + config_.name + "' failed: " + errorText(result.error()));
        }
    }

    void LedgerPool::cancelPendingCloseLocked() {
        if (pending_generation_ == 0) {
            return;
        }
        scheduler_->cancel(pending_task_);
        pending_generation_ = 0;
        pending_task_ = 0;
    }

    dp::Result<void, dp::Error> LedgerPool::close() {
        std::unique_lock<std::mutex> lock(mutex_);
        waitIdleLocked(lock, CancelToken());
        cancelPendingCloseLocked();
        auto result = closeLocked(lock);
        if (result.is_ok() && pinned_ > 0) {
            ref_count_ = std::max(0, ref_count_ - pinned_);
            pinned_ = 0;
        }
        return result;
    }

    dp::Result<void, dp::Error> LedgerPool::closeLocked(std::unique_lock<std::mutex> &lock) {
        if (!handle_) {
            opened_ = false;
            return dp::Result<void, dp::Error>::ok();
        }

        auto handle = handle_;
        transitioning_ = true;
        lock.unlock();

        bool closed = false;
        std::string last_error;
        for (int attempt = 1; attempt <= CLOSE_ATTEMPTS; ++attempt) {
            auto result = handle->close();
            if (result.is_ok()) {
                closed = true;
                break;
            }
            last_error = errorText(result.error());
            log::debug("pool", "Close attempt " + std::to_string(attempt) + " of pool '" + config_.name +
                                   "' failed: " + last_error);
            if (attempt < CLOSE_ATTEMPTS) {
                std::this_thread::sleep_for(CLOSE_BACKOFF);
            }
        }

        lock.lock();
        transitioning_ = false;
        transition_cv_.notify_all();

        if (closed) {
            handle_.reset();
            opened_ = false;
            log::info("pool", "Closed pool ledger: " + config_.name);
            return dp::Result<void, dp::Error>::ok();
        }

        // The handle stays open: pin a reference so no release reaches zero behind it
        ++ref_count_;
        ++pinned_;
        std::string msg = "Exception when closing pool ledger '" + config_.name + "': " + last_error;
        log::error("pool", msg);
        return dp::Result<void, dp::Error>::err(pool_close_error(msg));
    }

    bool LedgerPool::isOpened() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return opened_;
    }

    int LedgerPool::refCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return ref_count_;
    }

    bool LedgerPool::hasPendingClose() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_generation_ != 0;
    }

    bool LedgerPool::hasPinnedReference() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pinned_ > 0;
    }

    int LedgerPool::openCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_count_;
    }

} // namespace resolvit::ledger
