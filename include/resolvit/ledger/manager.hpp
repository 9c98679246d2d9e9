#pragma once

#include <chrono>
#include <datapod/datapod.hpp>
#include <filesystem>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include <resolvit/cache/cache.hpp>
#include <resolvit/common/cancel.hpp>
#include <resolvit/common/scheduler.hpp>
#include <resolvit/common/worker_pool.hpp>
#include <resolvit/ledger/config.hpp>
#include <resolvit/ledger/connection.hpp>
#include <resolvit/ledger/registry.hpp>
#include <resolvit/ledger/request.hpp>
#include <resolvit/proof/state_proof.hpp>

namespace resolvit::ledger {

    /// Tuning and collaborators for MultiLedgerManager
    struct ManagerOptions {
        size_t max_workers = 5;
        std::chrono::milliseconds request_timeout{10000};
        std::optional<std::chrono::seconds> cache_ttl;
        std::shared_ptr<cache::ResolutionCache> cache;
        std::shared_ptr<LedgerConnector> connector;
        std::shared_ptr<const proof::StateProofVerifier> verifier; // null: default sparse Merkle verifier
        std::shared_ptr<DeferredScheduler> scheduler;              // null: process-wide scheduler
        std::filesystem::path storage_root;                        // empty: defaultStorageRoot()
        std::optional<std::string> submitter_did;

        ManagerOptions() = default;
    };

    /// A ledger chosen by resolution or routing
    struct LedgerSelection {
        std::string ledger_id;
        std::shared_ptr<LedgerPool> pool;
    };

    /// One verified answer from one ledger, consumed by arbitration
    struct DIDLookupResult {
        std::string ledger_id;
        std::shared_ptr<LedgerPool> pool;
        bool is_self_certified = false;
        bool is_production = true;
        size_t index = 0;
    };

    // ===========================================
    // MultiLedgerManager
    // ===========================================

    /// Resolves DIDs across every configured ledger. Lookups fan out to all ledgers,
    /// verify each reply's state proof and pick the answer by policy class:
    ///   production+self-certified > non-production+self-certified
    ///   > production > non-production, ties broken by configured order.
    class MultiLedgerManager {
      public:
        static constexpr const char *CACHE_KEY_PREFIX = "did_ledger_id_resolver::";

        explicit MultiLedgerManager(ManagerOptions options);
        ~MultiLedgerManager();

        MultiLedgerManager(const MultiLedgerManager &) = delete;
        MultiLedgerManager &operator=(const MultiLedgerManager &) = delete;

        // ===========================================
        // Registry
        // ===========================================

        /// Replace the registry wholesale. Pools whose name and connection settings are
        /// unchanged are carried over; dropped pools are left to their own ref counting.
        dp::Result<void, dp::Error> updateLedgerConfig(const std::vector<LedgerConfig> &configs);

        /// Designated write ledger, else first production, else first non-production
        dp::Result<LedgerSelection, dp::Error> getWriteLedger() const;

        dp::Result<void, dp::Error> setWriteLedger(const std::string &ledger_id);

        dp::Result<std::shared_ptr<LedgerPool>, dp::Error> getLedgerByID(const std::string &ledger_id) const;

        dp::Result<std::string, dp::Error> getLedgerIdByPoolName(const std::string &pool_name) const;

        /// (alias, did) when both are configured for the ledger
        std::optional<std::pair<std::string, std::string>> getEndorserInfo(const std::string &ledger_id) const;

        std::vector<LedgerDescriptor> getProductionLedgers() const;

        std::vector<LedgerDescriptor> getNonProductionLedgers() const;

        /// Current registry; stays valid after a later reconfiguration
        std::shared_ptr<const LedgerRegistry> snapshot() const;

        // ===========================================
        // Resolution
        // ===========================================

        static std::string extractDIDFromIdentifier(const std::string &identifier);

        static std::string cacheKey(const std::string &did) { return std::string(CACHE_KEY_PREFIX) + did; }

        /// Find the ledger a DID is authoritatively registered on.
        /// Per-ledger failures only drop that ledger's answer; the lookup fails with
        /// ERR_DID_NOT_FOUND_ANYWHERE when no ledger produced a verified answer.
        dp::Result<LedgerSelection, dp::Error> lookupDID(const std::string &did, bool use_cache = true,
                                                         const CancelToken &cancel = CancelToken());

        /// Ledger holding the record behind `identifier`; the write ledger when the author DID is unknown
        dp::Result<LedgerSelection, dp::Error> getLedgerForIdentifier(const std::string &identifier,
                                                                      LedgerRecordType record_type,
                                                                      const CancelToken &cancel = CancelToken());

        const ManagerOptions &options() const { return options_; }

      private:
        std::optional<DIDLookupResult> queryLedger(const LedgerDescriptor &descriptor, const std::string &did,
                                                   std::chrono::steady_clock::time_point deadline,
                                                   const CancelToken &cancel) const;

        static dp::Result<LedgerSelection, dp::Error> selectWriteLedger(const LedgerRegistry &registry);

        ManagerOptions options_;
        mutable std::shared_mutex mutex_;
        std::shared_ptr<const LedgerRegistry> registry_;
        std::unique_ptr<WorkerPool> workers_;
    };

} // namespace resolvit::ledger
