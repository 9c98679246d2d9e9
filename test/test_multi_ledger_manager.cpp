#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "fixtures/mock_ledger.hpp"
#include "fixtures/reply_builder.hpp"

#include <resolvit/common/error.hpp>
#include <resolvit/common/log.hpp>
#include <resolvit/ledger/manager.hpp>

#include <chrono>
#include <future>
#include <thread>

using namespace resolvit;
using namespace resolvit::ledger;
using namespace resolvit::testing;

namespace {

    LedgerConfig ledgerConfig(const std::string &id, bool production, bool is_write = false) {
        LedgerConfig config;
        config.id = id;
        config.pool_name = id + "-pool";
        config.is_production = production;
        config.is_write = is_write;
        config.genesis_transactions = SAMPLE_GENESIS;
        config.keepalive = 0;
        return config;
    }

    struct ManagerFixture {
        TempDir dir;
        std::shared_ptr<MockConnector> connector = std::make_shared<MockConnector>();
        std::shared_ptr<cache::MemoryCache> cache = std::make_shared<cache::MemoryCache>();
        std::shared_ptr<DeferredScheduler> scheduler = std::make_shared<DeferredScheduler>();
        std::unique_ptr<MultiLedgerManager> manager;

        explicit ManagerFixture(std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
            log::setLevel(log::Level::Off);
            ManagerOptions options;
            options.connector = connector;
            options.cache = cache;
            options.cache_ttl = std::chrono::seconds(600);
            options.scheduler = scheduler;
            options.storage_root = dir.path;
            options.request_timeout = timeout;
            manager = std::make_unique<MultiLedgerManager>(options);
        }

        void configure(const std::vector<LedgerConfig> &configs) { REQUIRE(manager->updateLedgerConfig(configs).is_ok()); }

        std::shared_ptr<MockLedger> ledger(const std::string &id) { return connector->ledger(id + "-pool"); }
    };

    std::string didOf(const TestIdentity &identity) { return "did:sov:" + identity.nym; }

} // namespace

TEST_SUITE("MultiLedgerManager lookup") {

    TEST_CASE("DID on exactly one ledger resolves to that ledger") {
        ManagerFixture fx;
        fx.configure({ledgerConfig("prodA", true), ledgerConfig("prodB", true), ledgerConfig("nonprodC", false)});
        auto id = selfCertifiedIdentity(1);
        fx.ledger("prodB")->setReply(nymReply(id));

        auto found = fx.manager->lookupDID(didOf(id));
        REQUIRE(found.is_ok());
        CHECK(found.value().ledger_id == "prodB");
        CHECK(found.value().pool->name() == "prodB-pool");
        CHECK(fx.cache->get(MultiLedgerManager::cacheKey(didOf(id))) == std::optional<std::string>("prodB"));

        // Every ledger was asked, every lease returned
        CHECK(fx.connector->totalSubmits() == 3);
        for (const auto &d : fx.manager->snapshot()->all()) {
            CHECK(d.pool->refCount() == 0);
        }
    }

    TEST_CASE("Production self-certified beats every other class") {
        ManagerFixture fx;
        fx.configure({ledgerConfig("prodB", true), ledgerConfig("prodA", true), ledgerConfig("nonprodC", false)});
        auto id = selfCertifiedIdentity(2);
        fx.ledger("prodA")->setReply(nymReply(id));
        fx.ledger("prodB")->setReply(nymReply(rotatedIdentity(id, 2)));
        fx.ledger("nonprodC")->setReply(nymReply(id));
        fx.ledger("prodA")->delay_ms = 150; // answers last

        auto found = fx.manager->lookupDID(didOf(id));
        REQUIRE(found.is_ok());
        CHECK(found.value().ledger_id == "prodA");
    }

    TEST_CASE("Non-production self-certified beats production non-self-certified") {
        ManagerFixture fx;
        fx.configure({ledgerConfig("prodB", true), ledgerConfig("nonprodC", false)});
        auto id = selfCertifiedIdentity(3);
        fx.ledger("prodB")->setReply(nymReply(rotatedIdentity(id, 3)));
        fx.ledger("nonprodC")->setReply(nymReply(id));

        auto found = fx.manager->lookupDID(didOf(id));
        REQUIRE(found.is_ok());
        CHECK(found.value().ledger_id == "nonprodC");
    }

    TEST_CASE("Production wins among self-certified answers regardless of timing") {
        ManagerFixture fx;
        fx.configure({ledgerConfig("nonprodC", false), ledgerConfig("prodA", true)});
        auto id = selfCertifiedIdentity(4);
        fx.ledger("nonprodC")->setReply(nymReply(id));
        fx.ledger("prodA")->setReply(nymReply(id));
        fx.ledger("prodA")->delay_ms = 200;

        for (int i = 0; i < 3; ++i) {
            auto found = fx.manager->lookupDID(didOf(id), false);
            REQUIRE(found.is_ok());
            CHECK(found.value().ledger_id == "prodA");
        }
    }

    TEST_CASE("Production non-self-certified beats non-production non-self-certified") {
        ManagerFixture fx;
        fx.configure({ledgerConfig("nonprodC", false), ledgerConfig("prodB", true)});
        auto id = selfCertifiedIdentity(5);
        auto rotated = rotatedIdentity(id, 5);
        fx.ledger("nonprodC")->setReply(nymReply(rotated));
        fx.ledger("prodB")->setReply(nymReply(rotated));

        auto found = fx.manager->lookupDID(didOf(id));
        REQUIRE(found.is_ok());
        CHECK(found.value().ledger_id == "prodB");
    }

    TEST_CASE("Configured order breaks ties within a class") {
        ManagerFixture fx;
        fx.configure({ledgerConfig("first", true), ledgerConfig("second", true), ledgerConfig("third", true)});
        auto id = selfCertifiedIdentity(6);
        fx.ledger("second")->setReply(nymReply(id));
        fx.ledger("third")->setReply(nymReply(id));
        fx.ledger("second")->delay_ms = 100;

        auto found = fx.manager->lookupDID(didOf(id));
        REQUIRE(found.is_ok());
        CHECK(found.value().ledger_id == "second");
    }

    TEST_CASE("DID found nowhere reports the searched ledger counts") {
        ManagerFixture fx;
        fx.configure({ledgerConfig("p1", true), ledgerConfig("p2", true), ledgerConfig("n1", false),
                      ledgerConfig("n2", false)});
        auto id = selfCertifiedIdentity(7);

        auto found = fx.manager->lookupDID(didOf(id));
        REQUIRE(found.is_err());
        CHECK(isError(found.error(), ERR_DID_NOT_FOUND_ANYWHERE));
        auto text = errorText(found.error());
        CHECK(text.find("production: 2, non_production: 2") != std::string::npos);
        CHECK(text.find(didOf(id)) != std::string::npos);
        CHECK_FALSE(fx.cache->get(MultiLedgerManager::cacheKey(didOf(id))).has_value());
    }

    TEST_CASE("Failed proofs count as no answer") {
        ManagerFixture fx;
        fx.configure({ledgerConfig("prodA", true), ledgerConfig("nonprodC", false)});
        auto id = selfCertifiedIdentity(8);
        fx.ledger("prodA")->setReply(nymReply(id, false));
        fx.ledger("nonprodC")->setReply(nymReply(id));

        auto found = fx.manager->lookupDID(didOf(id));
        REQUIRE(found.is_ok());
        CHECK(found.value().ledger_id == "nonprodC");
    }

    TEST_CASE("Transport errors, rejections and timeouts are not fatal") {
        ManagerFixture fx(std::chrono::milliseconds(200));
        fx.configure({ledgerConfig("broken", true), ledgerConfig("nack", true), ledgerConfig("slow", true),
                      ledgerConfig("down", true), ledgerConfig("good", false)});
        auto id = selfCertifiedIdentity(9);
        fx.ledger("broken")->transport_error = true;
        fx.ledger("nack")->setReply(nackReply("client request invalid"));
        fx.ledger("slow")->setReply(nymReply(id));
        fx.ledger("slow")->delay_ms = 2000;
        fx.ledger("down")->fail_open = true;
        fx.ledger("good")->setReply(nymReply(id));

        auto started = std::chrono::steady_clock::now();
        auto found = fx.manager->lookupDID(didOf(id));
        auto elapsed = std::chrono::steady_clock::now() - started;

        REQUIRE(found.is_ok());
        CHECK(found.value().ledger_id == "good");
        CHECK(elapsed < std::chrono::milliseconds(1500));
    }

    TEST_CASE("A ledger whose client throws only loses its own answer") {
        ManagerFixture fx;
        fx.configure({ledgerConfig("prodA", true), ledgerConfig("nonprodC", false)});
        auto id = selfCertifiedIdentity(11);
        fx.ledger("prodA")->throw_on_submit = true;
        fx.ledger("nonprodC")->setReply(nymReply(id));

        auto found = fx.manager->lookupDID(didOf(id));
        REQUIRE(found.is_ok());
        CHECK(found.value().ledger_id == "nonprodC");
        for (const auto &d : fx.manager->snapshot()->all()) {
            CHECK(d.pool->refCount() == 0);
        }
    }

    TEST_CASE("A proven record for another nym is not an answer") {
        ManagerFixture fx;
        fx.configure({ledgerConfig("prodA", true), ledgerConfig("nonprodC", false)});
        auto asked = selfCertifiedIdentity(12);
        auto other = selfCertifiedIdentity(13);
        fx.ledger("prodA")->setReply(nymReply(other));
        fx.ledger("nonprodC")->setReply(nymReply(other));

        auto found = fx.manager->lookupDID(didOf(asked));
        REQUIRE(found.is_err());
        CHECK(isError(found.error(), ERR_DID_NOT_FOUND_ANYWHERE));
        CHECK_FALSE(fx.cache->get(MultiLedgerManager::cacheKey(didOf(asked))).has_value());
    }

    TEST_CASE("Only the ledger answering for the requested nym wins") {
        ManagerFixture fx;
        fx.configure({ledgerConfig("prodA", true), ledgerConfig("nonprodC", false)});
        auto asked = selfCertifiedIdentity(14);
        fx.ledger("prodA")->setReply(nymReply(selfCertifiedIdentity(15)));
        fx.ledger("nonprodC")->setReply(nymReply(asked));

        auto found = fx.manager->lookupDID(didOf(asked));
        REQUIRE(found.is_ok());
        CHECK(found.value().ledger_id == "nonprodC");
    }

    TEST_CASE("Malformed DIDs are rejected before any ledger is queried") {
        ManagerFixture fx;
        fx.configure({ledgerConfig("prodA", true)});

        for (const std::string did : {std::string("did:sov:WgWxqztrNooG92RXvxST\xFF"), std::string("did:sov:"),
                                      std::string("did:sov:0OIl"), std::string("")}) {
            auto found = fx.manager->lookupDID(did);
            REQUIRE(found.is_err());
            CHECK(isError(found.error(), ERR_INVALID_DID));
        }
        CHECK(fx.connector->totalOpens() == 0);
        CHECK(fx.connector->totalSubmits() == 0);
    }

    TEST_CASE("Lookups return as soon as every ledger has answered") {
        ManagerFixture fx;
        fx.configure({ledgerConfig("prodA", true)});
        auto id = selfCertifiedIdentity(16);
        fx.ledger("prodA")->setReply(nymReply(id));

        auto started = std::chrono::steady_clock::now();
        for (int i = 0; i < 50; ++i) {
            REQUIRE(fx.manager->lookupDID(didOf(id), false).is_ok());
        }
        CHECK(std::chrono::steady_clock::now() - started < std::chrono::milliseconds(450));
    }

    TEST_CASE("Empty registry finds nothing") {
        ManagerFixture fx;
        auto found = fx.manager->lookupDID("did:sov:WgWxqztrNooG92RXvxSTWv");
        REQUIRE(found.is_err());
        CHECK(isError(found.error(), ERR_DID_NOT_FOUND_ANYWHERE));
        CHECK(errorText(found.error()).find("production: 0, non_production: 0") != std::string::npos);
    }

    TEST_CASE("Cancellation returns promptly and leaks no references") {
        ManagerFixture fx(std::chrono::milliseconds(5000));
        fx.configure({ledgerConfig("prodA", true), ledgerConfig("nonprodC", false)});
        auto id = selfCertifiedIdentity(10);
        fx.ledger("prodA")->setReply(nymReply(id));
        fx.ledger("prodA")->delay_ms = 3000;
        fx.ledger("nonprodC")->delay_ms = 3000;

        CancelToken token;
        auto started = std::chrono::steady_clock::now();
        auto pending = std::async(std::launch::async, [&]() { return fx.manager->lookupDID(didOf(id), true, token); });
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        token.cancel();

        auto found = pending.get();
        REQUIRE(found.is_err());
        CHECK(isError(found.error(), ERR_LOOKUP_CANCELLED));
        CHECK(std::chrono::steady_clock::now() - started < std::chrono::milliseconds(1500));

        auto until = std::chrono::steady_clock::now() + std::chrono::seconds(3);
        bool drained = false;
        while (!drained && std::chrono::steady_clock::now() < until) {
            drained = true;
            for (const auto &d : fx.manager->snapshot()->all()) {
                drained = drained && d.pool->refCount() == 0;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        CHECK(drained);
    }

    TEST_CASE("Expired deadline cancels the lookup") {
        ManagerFixture fx(std::chrono::milliseconds(5000));
        fx.configure({ledgerConfig("prodA", true)});
        fx.ledger("prodA")->delay_ms = 3000;

        auto found = fx.manager->lookupDID("did:sov:WgWxqztrNooG92RXvxSTWv", false,
                                           CancelToken::withTimeout(std::chrono::milliseconds(100)));
        REQUIRE(found.is_err());
        CHECK(isError(found.error(), ERR_LOOKUP_CANCELLED));
    }
}

TEST_SUITE("MultiLedgerManager cache") {

    TEST_CASE("Second cached lookup issues no network queries") {
        ManagerFixture fx;
        fx.configure({ledgerConfig("prodA", true), ledgerConfig("nonprodC", false)});
        auto id = selfCertifiedIdentity(11);
        fx.ledger("prodA")->setReply(nymReply(id));

        auto first = fx.manager->lookupDID(didOf(id));
        REQUIRE(first.is_ok());
        int submits = fx.connector->totalSubmits();
        int opens = fx.connector->totalOpens();

        auto second = fx.manager->lookupDID(didOf(id));
        REQUIRE(second.is_ok());
        CHECK(second.value().ledger_id == first.value().ledger_id);
        CHECK(second.value().pool == first.value().pool);
        CHECK(fx.connector->totalSubmits() == submits);
        CHECK(fx.connector->totalOpens() == opens);
    }

    TEST_CASE("Uncached lookup bypasses and does not write the cache") {
        ManagerFixture fx;
        fx.configure({ledgerConfig("prodA", true)});
        auto id = selfCertifiedIdentity(12);
        fx.ledger("prodA")->setReply(nymReply(id));

        REQUIRE(fx.manager->lookupDID(didOf(id), false).is_ok());
        REQUIRE(fx.manager->lookupDID(didOf(id), false).is_ok());
        CHECK(fx.connector->totalSubmits() == 2);
        CHECK(fx.cache->size() == 0);
    }

    TEST_CASE("Cached ledger removed by reconfiguration is an inconsistency") {
        ManagerFixture fx;
        fx.configure({ledgerConfig("prodA", true), ledgerConfig("nonprodC", false)});
        auto id = selfCertifiedIdentity(13);
        fx.ledger("prodA")->setReply(nymReply(id));
        REQUIRE(fx.manager->lookupDID(didOf(id)).is_ok());

        fx.configure({ledgerConfig("nonprodC", false)});

        auto found = fx.manager->lookupDID(didOf(id));
        REQUIRE(found.is_err());
        CHECK(isError(found.error(), ERR_CACHE_INCONSISTENCY));
        CHECK(errorText(found.error()).find("prodA") != std::string::npos);

        // Bypassing the cache re-resolves against the new registry
        auto fresh = fx.manager->lookupDID(didOf(id), false);
        REQUIRE(fresh.is_err());
        CHECK(isError(fresh.error(), ERR_DID_NOT_FOUND_ANYWHERE));
    }
}

TEST_SUITE("MultiLedgerManager registry") {

    TEST_CASE("Write ledger selection order") {
        ManagerFixture fx;
        CHECK(isError(fx.manager->getWriteLedger().error(), ERR_NO_LEDGER_CONFIGURED));

        fx.configure({ledgerConfig("n1", false), ledgerConfig("n2", false)});
        CHECK(fx.manager->getWriteLedger().value().ledger_id == "n1");

        fx.configure({ledgerConfig("n1", false), ledgerConfig("p1", true), ledgerConfig("p2", true)});
        CHECK(fx.manager->getWriteLedger().value().ledger_id == "p1");

        fx.configure({ledgerConfig("n1", false), ledgerConfig("p1", true), ledgerConfig("p2", true, true)});
        CHECK(fx.manager->getWriteLedger().value().ledger_id == "p2");
    }

    TEST_CASE("Set write ledger validates the id") {
        ManagerFixture fx;
        fx.configure({ledgerConfig("p1", true), ledgerConfig("n1", false)});

        REQUIRE(fx.manager->setWriteLedger("n1").is_ok());
        CHECK(fx.manager->getWriteLedger().value().ledger_id == "n1");

        auto missing = fx.manager->setWriteLedger("ghost");
        REQUIRE(missing.is_err());
        CHECK(isError(missing.error(), ERR_LEDGER_NOT_FOUND));
        CHECK(fx.manager->getWriteLedger().value().ledger_id == "n1");
    }

    TEST_CASE("Lookups by id and pool name") {
        ManagerFixture fx;
        auto endorsed = ledgerConfig("p1", true);
        endorsed.endorser_did = "did:sov:V4SGRU86Z58d6TV7PBUe6f";
        endorsed.endorser_alias = "endorser";
        fx.configure({endorsed, ledgerConfig("n1", false)});

        REQUIRE(fx.manager->getLedgerByID("n1").is_ok());
        CHECK(fx.manager->getLedgerByID("n1").value()->name() == "n1-pool");
        CHECK(isError(fx.manager->getLedgerByID("x").error(), ERR_LEDGER_NOT_FOUND));

        CHECK(fx.manager->getLedgerIdByPoolName("p1-pool").value() == "p1");
        CHECK(fx.manager->getLedgerIdByPoolName("nope").is_err());

        auto info = fx.manager->getEndorserInfo("p1");
        REQUIRE(info.has_value());
        CHECK(info->first == "endorser");
        CHECK(info->second == "did:sov:V4SGRU86Z58d6TV7PBUe6f");
        CHECK_FALSE(fx.manager->getEndorserInfo("n1").has_value());

        CHECK(fx.manager->getProductionLedgers().size() == 1);
        CHECK(fx.manager->getNonProductionLedgers().size() == 1);
        CHECK(fx.manager->getNonProductionLedgers().front().index == 1);
    }

    TEST_CASE("Reconfiguration reuses pools with unchanged settings") {
        ManagerFixture fx;
        fx.configure({ledgerConfig("p1", true), ledgerConfig("n1", false)});
        auto before_p1 = fx.manager->getLedgerByID("p1").value();
        auto before_n1 = fx.manager->getLedgerByID("n1").value();

        auto changed = ledgerConfig("n1", false);
        changed.keepalive = 30;
        fx.configure({ledgerConfig("p1", true), changed});

        CHECK(fx.manager->getLedgerByID("p1").value() == before_p1);
        CHECK(fx.manager->getLedgerByID("n1").value() != before_n1);
    }

    TEST_CASE("Dropped pools are not closed by reconfiguration") {
        ManagerFixture fx;
        fx.configure({ledgerConfig("p1", true)});
        auto pool = fx.manager->getLedgerByID("p1").value();
        auto lease = pool->acquire();
        REQUIRE(lease.is_ok());

        fx.configure({ledgerConfig("p2", true)});
        CHECK(pool->isOpened());
        CHECK(fx.ledger("p1")->closes.load() == 0);

        REQUIRE(lease.value()->release().is_ok());
        CHECK_FALSE(pool->isOpened());
    }

    TEST_CASE("Invalid configurations are rejected and leave the registry intact") {
        ManagerFixture fx;
        fx.configure({ledgerConfig("p1", true)});

        auto duplicate = fx.manager->updateLedgerConfig({ledgerConfig("a", true), ledgerConfig("a", false)});
        REQUIRE(duplicate.is_err());
        CHECK(isError(duplicate.error(), ERR_POOL_CONFIG));

        auto a = ledgerConfig("a", true);
        auto b = ledgerConfig("b", true);
        b.pool_name = a.pool_name;
        b.keepalive = 99;
        auto clash = fx.manager->updateLedgerConfig({a, b});
        REQUIRE(clash.is_err());
        CHECK(isError(clash.error(), ERR_POOL_CONFIG));

        CHECK(fx.manager->getLedgerByID("p1").is_ok());
        CHECK(fx.manager->snapshot()->size() == 1);
    }

    TEST_CASE("Ledgers sharing a pool name share the pool") {
        ManagerFixture fx;
        auto a = ledgerConfig("a", true);
        auto b = ledgerConfig("b", false);
        b.pool_name = a.pool_name;
        fx.configure({a, b});
        CHECK(fx.manager->getLedgerByID("a").value() == fx.manager->getLedgerByID("b").value());
    }
}

TEST_SUITE("MultiLedgerManager identifier routing") {

    TEST_CASE("Object identifiers route by their author DID") {
        ManagerFixture fx;
        fx.configure({ledgerConfig("p1", true, true), ledgerConfig("n1", false)});
        auto id = selfCertifiedIdentity(14);
        fx.ledger("n1")->setReply(nymReply(id));

        auto schema = fx.manager->getLedgerForIdentifier(id.nym + ":2:degree:1.0", LedgerRecordType::Schema);
        REQUIRE(schema.is_ok());
        CHECK(schema.value().ledger_id == "n1");

        auto cred_def =
            fx.manager->getLedgerForIdentifier(id.nym + ":3:CL:20:tag", LedgerRecordType::CredDef);
        REQUIRE(cred_def.is_ok());
        CHECK(cred_def.value().ledger_id == "n1");

        auto key = fx.manager->getLedgerForIdentifier(didOf(id), LedgerRecordType::KeyForDid);
        REQUIRE(key.is_ok());
        CHECK(key.value().ledger_id == "n1");
    }

    TEST_CASE("Unknown author DID falls back to the write ledger") {
        ManagerFixture fx;
        fx.configure({ledgerConfig("p1", true), ledgerConfig("n1", false, true)});
        auto id = selfCertifiedIdentity(15);

        auto routed = fx.manager->getLedgerForIdentifier(id.nym + ":2:degree:1.0", LedgerRecordType::Schema);
        REQUIRE(routed.is_ok());
        CHECK(routed.value().ledger_id == "n1");
    }

    TEST_CASE("Identifier extraction") {
        CHECK(MultiLedgerManager::extractDIDFromIdentifier("WgWxqztrNooG92RXvxSTWv:2:schema_name:1.0") ==
              "WgWxqztrNooG92RXvxSTWv");
        CHECK(MultiLedgerManager::extractDIDFromIdentifier("WgWxqztrNooG92RXvxSTWv:3:CL:20:tag") ==
              "WgWxqztrNooG92RXvxSTWv");
        CHECK(MultiLedgerManager::extractDIDFromIdentifier(
                  "WgWxqztrNooG92RXvxSTWv:4:WgWxqztrNooG92RXvxSTWv:3:CL:20:tag:CL_ACCUM:0") ==
              "WgWxqztrNooG92RXvxSTWv");
        CHECK(MultiLedgerManager::extractDIDFromIdentifier("did:sov:WgWxqztrNooG92RXvxSTWv") ==
              "WgWxqztrNooG92RXvxSTWv");
    }
}
