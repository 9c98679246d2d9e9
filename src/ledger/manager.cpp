#include <resolvit/ledger/manager.hpp>

#include <resolvit/common/error.hpp>
#include <resolvit/common/log.hpp>
#include <resolvit/identity/did.hpp>

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <map>
#include <mutex>

namespace resolvit::ledger {

    namespace {
        using Clock = std::chrono::steady_clock;

        // Upper bound on how long a waiting lookup takes to notice an explicit cancel
        constexpr std::chrono::milliseconds CANCEL_POLL_INTERVAL{10};

        /// Outcomes of one fan-out, shared between the waiting lookup and its tasks.
        /// Tasks signal completion, so the lookup wakes as soon as an answer lands.
        struct Settlement {
            explicit Settlement(size_t tasks) : deadlines(tasks), done(tasks, false), answers(tasks) {}

            void start(size_t i, Clock::time_point deadline) {
                std::lock_guard<std::mutex> lock(mutex);
                deadlines[i] = deadline;
            }

            void finish(size_t i, std::optional<DIDLookupResult> answer) {
                {
                    std::lock_guard<std::mutex> lock(mutex);
                    answers[i] = std::move(answer);
                    done[i] = true;
                }
                cv.notify_all();
            }

            std::mutex mutex;
            std::condition_variable cv;
            std::vector<std::optional<Clock::time_point>> deadlines; // set when the task starts running
            std::vector<bool> done;
            std::vector<std::optional<DIDLookupResult>> answers;
        };

        /// Lower is better
        int priorityClass(const DIDLookupResult &result) {
            if (result.is_self_certified)
                return result.is_production ? 0 : 1;
            return result.is_production ? 2 : 3;
        }
    } // namespace

    MultiLedgerManager::MultiLedgerManager(ManagerOptions options)
        : options_(std::move(options)), registry_(std::make_shared<LedgerRegistry>()) {
        if (!options_.verifier) {
            options_.verifier = std::make_shared<proof::StateProofVerifier>();
        }
        if (!options_.scheduler) {
            options_.scheduler = DeferredScheduler::shared();
        }
        if (options_.storage_root.empty()) {
            options_.storage_root = defaultStorageRoot();
        }
        workers_ = std::make_unique<WorkerPool>(options_.max_workers);
    }

    MultiLedgerManager::~MultiLedgerManager() { workers_->shutdown(); }

    // ===========================================
    // Registry
    // ===========================================

    dp::Result<void, dp::Error> MultiLedgerManager::updateLedgerConfig(const std::vector<LedgerConfig> &configs) {
        if (!options_.connector) {
            return dp::Result<void, dp::Error>::err(pool_config_error("No ledger connector configured"));
        }

        std::unique_lock lock(mutex_);
        auto previous = registry_;
        auto next = std::make_shared<LedgerRegistry>();
        std::map<std::string, std::shared_ptr<LedgerPool>> pools_by_name;

        for (const auto &config : configs) {
            if (next->contains(config.id)) {
                return dp::Result<void, dp::Error>::err(pool_config_error("Duplicate ledger id: " + config.id));
            }

            LedgerPoolConfig pool_config;
            pool_config.name = config.pool_name.empty() ? config.id : config.pool_name;
            pool_config.keepalive = std::chrono::seconds(config.keepalive);
            pool_config.read_only = config.read_only;
            pool_config.genesis_transactions = config.genesis_transactions;
            pool_config.socks_proxy = config.socks_proxy;
            pool_config.cache = options_.cache;
            pool_config.cache_ttl = options_.cache_ttl;

            std::shared_ptr<LedgerPool> pool;
            auto shared = pools_by_name.find(pool_config.name);
            if (shared != pools_by_name.end()) {
                if (!shared->second->config().sameConnection(pool_config)) {
                    return dp::Result<void, dp::Error>::err(pool_config_error(
                        "Duplicate pool name '" + pool_config.name + "' with different settings"));
                }
                pool = shared->second;
            } else {
                const LedgerDescriptor *existing = previous->findByPoolName(pool_config.name);
                if (existing && existing->pool->config().sameConnection(pool_config)) {
                    pool = existing->pool;
                    log::debug("manager", "Reusing pool '" + pool_config.name + "' for ledger " + config.id);
                } else {
                    pool = LedgerPool::create(pool_config, options_.connector, options_.scheduler,
                                              options_.storage_root);
                }
                pools_by_name.emplace(pool_config.name, pool);
            }

            LedgerDescriptor descriptor;
            descriptor.id = config.id;
            descriptor.pool = pool;
            descriptor.is_production = config.is_production;
            descriptor.is_write = config.is_write;
            descriptor.endorser_did = config.endorser_did;
            descriptor.endorser_alias = config.endorser_alias;

            if (config.is_write && !next->writeLedgerId()) {
                next->setWriteLedgerId(config.id);
            }
            next->add(std::move(descriptor));
        }

        registry_ = next;
        log::info("manager", "Ledger registry updated: production " + std::to_string(next->production().size()) +
                                 ", non_production " + std::to_string(next->nonProduction().size()));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<LedgerSelection, dp::Error> MultiLedgerManager::selectWriteLedger(const LedgerRegistry &registry) {
        if (registry.writeLedgerId()) {
            if (const auto *d = registry.find(*registry.writeLedgerId())) {
                return dp::Result<LedgerSelection, dp::Error>::ok(LedgerSelection{d->id, d->pool});
            }
        }
        if (!registry.production().empty()) {
            const auto &d = registry.production().front();
            return dp::Result<LedgerSelection, dp::Error>::ok(LedgerSelection{d.id, d.pool});
        }
        if (!registry.nonProduction().empty()) {
            const auto &d = registry.nonProduction().front();
            return dp::Result<LedgerSelection, dp::Error>::ok(LedgerSelection{d.id, d.pool});
        }
        return dp::Result<LedgerSelection, dp::Error>::err(no_ledger_configured());
    }

    dp::Result<LedgerSelection, dp::Error> MultiLedgerManager::getWriteLedger() const {
        return selectWriteLedger(*snapshot());
    }

    dp::Result<void, dp::Error> MultiLedgerManager::setWriteLedger(const std::string &ledger_id) {
        std::unique_lock lock(mutex_);
        if (!registry_->contains(ledger_id)) {
            return dp::Result<void, dp::Error>::err(ledger_not_found("Ledger id " + ledger_id + " not found"));
        }
        auto next = std::make_shared<LedgerRegistry>(*registry_);
        next->setWriteLedgerId(ledger_id);
        registry_ = next;
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<std::shared_ptr<LedgerPool>, dp::Error>
    MultiLedgerManager::getLedgerByID(const std::string &ledger_id) const {
        auto registry = snapshot();
        if (const auto *d = registry->find(ledger_id)) {
            return dp::Result<std::shared_ptr<LedgerPool>, dp::Error>::ok(d->pool);
        }
        return dp::Result<std::shared_ptr<LedgerPool>, dp::Error>::err(
            ledger_not_found("Ledger id " + ledger_id + " not found"));
    }

    dp::Result<std::string, dp::Error> MultiLedgerManager::getLedgerIdByPoolName(const std::string &pool_name) const {
        auto registry = snapshot();
        if (const auto *d = registry->findByPoolName(pool_name)) {
            return dp::Result<std::string, dp::Error>::ok(d->id);
        }
        return dp::Result<std::string, dp::Error>::err(
            ledger_not_found("No ledger configured for pool '" + pool_name + "'"));
    }

    std::optional<std::pair<std::string, std::string>>
    MultiLedgerManager::getEndorserInfo(const std::string &ledger_id) const {
        auto registry = snapshot();
        const auto *d = registry->find(ledger_id);
        if (!d || !d->endorser_alias || !d->endorser_did) {
            return std::nullopt;
        }
        return std::make_pair(*d->endorser_alias, *d->endorser_did);
    }

    std::vector<LedgerDescriptor> MultiLedgerManager::getProductionLedgers() const { return snapshot()->production(); }

    std::vector<LedgerDescriptor> MultiLedgerManager::getNonProductionLedgers() const {
        return snapshot()->nonProduction();
    }

    std::shared_ptr<const LedgerRegistry> MultiLedgerManager::snapshot() const {
        std::shared_lock lock(mutex_);
        return registry_;
    }

    // ===========================================
    // Resolution
    // ===========================================

    std::string MultiLedgerManager::extractDIDFromIdentifier(const std::string &identifier) {
        return resolvit::extractDIDFromIdentifier(identifier);
    }

    std::optional<DIDLookupResult> MultiLedgerManager::queryLedger(const LedgerDescriptor &descriptor,
                                                                   const std::string &did, Clock::time_point deadline,
                                                                   const CancelToken &cancel) const {
        auto acquired = descriptor.pool->acquire(cancel);
        if (acquired.is_err()) {
            log::error("manager", "Cannot use ledger " + descriptor.id + " for Did " + did + ": " +
                                      errorText(acquired.error()));
            return std::nullopt;
        }
        auto lease = acquired.value();

        auto request = buildGetNymRequest(options_.submitter_did, did);
        auto submitted = lease->connection().submit(request, deadline, cancel);

        auto released = lease->release();
        if (released.is_err()) {
            log::error("manager", "Ledger " + descriptor.id + ": " + errorText(released.error()));
        }

        if (submitted.is_err()) {
            const auto &err = submitted.error();
            if (isError(err, ERR_LEDGER_TIMEOUT)) {
                log::error("manager", "get-nym request timed out for Did " + did + " and ledger " + descriptor.id +
                                          ", reply not received within " +
                                          std::to_string(options_.request_timeout.count()) + " ms");
            } else if (isError(err, ERR_LOOKUP_CANCELLED)) {
                log::debug("manager", "get-nym request for Did " + did + " on ledger " + descriptor.id + " cancelled");
            } else {
                log::error("manager", "Exception when building and submitting get-nym request, for Did " + did +
                                          " and ledger " + descriptor.id + ", " + errorText(err));
            }
            return std::nullopt;
        }

        auto reply = LedgerReply::parse(submitted.value());
        if (reply.is_err()) {
            log::warn("manager", "Unreadable reply from ledger " + descriptor.id + ": " + errorText(reply.error()));
            return std::nullopt;
        }
        if (!reply.value().isReply() || !reply.value().hasData()) {
            log::warn("manager", "Did " + did + " not posted to ledger " + descriptor.id);
            return std::nullopt;
        }
        auto data = reply.value().data();
        if (!data || !data->is_object()) {
            log::warn("manager", "Did " + did + " not posted to ledger " + descriptor.id);
            return std::nullopt;
        }

        // The proof only covers the record the reply names; it must be the one that was asked for
        const std::string requested = toNym(did);
        const json::Value &reply_result = reply.value().result();
        const json::Value *holders[] = {&reply_result, &*data};
        bool named = false;
        for (const json::Value *holder : holders) {
            auto dest = holder->find("dest");
            if (dest == holder->end() || !dest->is_string())
                continue;
            named = true;
            if (dest->get<std::string>() != requested) {
                log::warn("manager", "Ledger " + descriptor.id + " answered Did " + did + " with the record of " +
                                         dest->get<std::string>());
                return std::nullopt;
            }
        }
        if (!named) {
            log::warn("manager", "Reply from ledger " + descriptor.id + " for Did " + did + " names no dest");
            return std::nullopt;
        }

        if (!options_.verifier->verifyReply(reply.value())) {
            log::warn("manager", "State Proof validation failed for Did " + did + " and ledger " + descriptor.id);
            return std::nullopt;
        }

        std::string verkey;
        auto vk = data->find("verkey");
        if (vk != data->end() && vk->is_string()) {
            verkey = vk->get<std::string>();
        }

        DIDLookupResult result;
        result.ledger_id = descriptor.id;
        result.pool = descriptor.pool;
        result.is_self_certified = isSelfCertified(did, verkey);
        result.is_production = descriptor.is_production;
        result.index = descriptor.index;
        return result;
    }

    dp::Result<LedgerSelection, dp::Error> MultiLedgerManager::lookupDID(const std::string &did, bool use_cache,
                                                                         const CancelToken &cancel) {
        if (!isLedgerDid(did)) {
            return dp::Result<LedgerSelection, dp::Error>::err(invalid_did("Invalid DID " + did));
        }

        auto registry = snapshot();
        const std::string key = cacheKey(did);

        if (use_cache && options_.cache) {
            auto cached = options_.cache->get(key);
            if (cached && !cached->empty()) {
                if (const auto *d = registry->find(*cached)) {
                    return dp::Result<LedgerSelection, dp::Error>::ok(LedgerSelection{d->id, d->pool});
                }
                return dp::Result<LedgerSelection, dp::Error>::err(cache_inconsistency(
                    "cached ledger_id " + *cached + " not found in either production_ledgers or non_production_ledgers"));
            }
        }

        auto descriptors = registry->all();
        auto settlement = std::make_shared<Settlement>(descriptors.size());

        const auto timeout = options_.request_timeout;
        for (size_t i = 0; i < descriptors.size(); ++i) {
            workers_->submit([this, settlement, i, descriptor = descriptors[i], did, cancel, timeout]() {
                auto deadline = cancel.clamp(Clock::now() + timeout);
                settlement->start(i, deadline);
                std::optional<DIDLookupResult> answer;
                if (!cancel.isCancelled()) {
                    try {
                        answer = queryLedger(descriptor, did, deadline, cancel);
                    } catch (const std::exception &e) {
                        log::error("manager", "Lookup of Did " + did + " on ledger " + descriptor.id +
                                                  " failed: " + e.what());
                    }
                }
                settlement->finish(i, std::move(answer));
            });
        }

        // Wait for every task to settle; a task past its own deadline counts as no answer
        std::vector<bool> settled(descriptors.size(), false);
        size_t remaining = descriptors.size();
        std::vector<DIDLookupResult> answers;
        std::unique_lock<std::mutex> lock(settlement->mutex);
        while (remaining > 0) {
            if (cancel.isCancelled()) {
                log::debug("manager", "Lookup of Did " + did + " cancelled");
                return dp::Result<LedgerSelection, dp::Error>::err(lookup_cancelled("Lookup of Did " + did + " cancelled"));
            }

            auto now = Clock::now();
            auto wake = cancel.clamp(now + CANCEL_POLL_INTERVAL);
            for (size_t i = 0; i < descriptors.size(); ++i) {
                if (settled[i])
                    continue;
                if (settlement->done[i]) {
                    if (settlement->answers[i]) {
                        answers.push_back(std::move(*settlement->answers[i]));
                    }
                    settled[i] = true;
                    --remaining;
                    continue;
                }
                const auto &deadline = settlement->deadlines[i];
                if (!deadline)
                    continue;
                if (now >= *deadline) {
                    log::error("manager", "get-nym request timed out for Did " + did + " and ledger " +
                                              descriptors[i].id + ", reply not received within " +
                                              std::to_string(timeout.count()) + " ms");
                    settled[i] = true;
                    --remaining;
                } else if (*deadline < wake) {
                    wake = *deadline;
                }
            }
            if (remaining > 0) {
                settlement->cv.wait_until(lock, wake);
            }
        }
        lock.unlock();

        if (answers.empty()) {
            return dp::Result<LedgerSelection, dp::Error>::err(did_not_found_anywhere(
                "DID " + did + " not found in any of the ledgers total: (production: " +
                std::to_string(registry->production().size()) +
                ", non_production: " + std::to_string(registry->nonProduction().size()) + ")"));
        }

        auto winner = std::min_element(answers.begin(), answers.end(), [](const auto &a, const auto &b) {
            int pa = priorityClass(a);
            int pb = priorityClass(b);
            if (pa != pb)
                return pa < pb;
            return a.index < b.index;
        });

        log::debug("manager", "Did " + did + " resolved to ledger " + winner->ledger_id +
                                  (winner->is_self_certified ? " (self-certified)" : ""));

        if (use_cache && options_.cache) {
            options_.cache->set(key, winner->ledger_id, options_.cache_ttl);
        }
        return dp::Result<LedgerSelection, dp::Error>::ok(LedgerSelection{winner->ledger_id, winner->pool});
    }

    dp::Result<LedgerSelection, dp::Error> MultiLedgerManager::getLedgerForIdentifier(const std::string &identifier,
                                                                                      LedgerRecordType record_type,
                                                                                      const CancelToken &cancel) {
        std::string did = isObjectRecord(record_type) ? extractDIDFromIdentifier(identifier) : identifier;
        auto found = lookupDID(did, true, cancel);
        if (found.is_err() && isError(found.error(), ERR_DID_NOT_FOUND_ANYWHERE)) {
            log::info("manager", errorText(found.error()) + ", using write ledger");
            return getWriteLedger();
        }
        return found;
    }

} // namespace resolvit::ledger
