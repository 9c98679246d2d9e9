#include "resolvit.hpp"

#include <filesystem>
#include <iostream>
#include <map>
#include <memory>

using namespace resolvit;

// In-process ledger network: answers GET_NYM from a local record table with a sparse Merkle proof
class LocalLedger : public ledger::LedgerConnection {
  public:
    explicit LocalLedger(std::map<std::string, std::string> verkeys) : verkeys_(std::move(verkeys)) {}

    dp::Result<std::string, dp::Error> submit(const std::string &request_json, std::chrono::steady_clock::time_point,
                                              const CancelToken &cancel) override {
        if (cancel.isCancelled()) {
            return dp::Result<std::string, dp::Error>::err(lookup_cancelled());
        }
        auto request = json::parse(request_json);
        if (request.is_discarded()) {
            return dp::Result<std::string, dp::Error>::err(bad_reply("Request is not JSON"));
        }
        std::string nym = request["operation"]["dest"].get<std::string>();

        json::Value result = json::Value::object();
        result["type"] = ledger::TXN_GET_NYM;
        result["dest"] = nym;
        result["seqNo"] = 42;
        result["txnTime"] = 1700000000;
        auto it = verkeys_.find(nym);
        if (it == verkeys_.end()) {
            result["data"] = nullptr;
        } else {
            json::Value data = json::Value::object();
            data["dest"] = nym;
            data["role"] = nullptr;
            data["verkey"] = it->second;
            result["data"] = data.dump();
        }

        auto entry = proof::prepareForStateRead(result);
        std::vector<std::vector<uint8_t>> siblings = {sha256(std::string("left")), sha256(std::string("right"))};
        auto root = proof::SparseMerkleChecker::computeRoot(entry->key, entry->value, siblings);
        std::vector<uint8_t> nodes;
        for (const auto &s : siblings)
            nodes.insert(nodes.end(), s.begin(), s.end());
        result["state_proof"] = {{"root_hash", encoding::base58Encode(root)},
                                 {"proof_nodes", encoding::base64Encode(nodes)}};

        json::Value reply = json::Value::object();
        reply["op"] = "REPLY";
        reply["result"] = result;
        return dp::Result<std::string, dp::Error>::ok(reply.dump());
    }

    dp::Result<std::string, dp::Error> transactions() override { return dp::Result<std::string, dp::Error>::ok(""); }

    dp::Result<void, dp::Error> close() override { return dp::Result<void, dp::Error>::ok(); }

  private:
    std::map<std::string, std::string> verkeys_;
};

class LocalConnector : public ledger::LedgerConnector {
  public:
    void publish(const std::string &pool, const std::string &nym, const std::string &verkey) {
        records_[pool][nym] = verkey;
    }

    dp::Result<std::shared_ptr<ledger::LedgerConnection>, dp::Error>
    open(const std::string &pool_name, const std::string &, const std::optional<std::string> &) override {
        std::cout << "  [connector] opening " << pool_name << std::endl;
        return dp::Result<std::shared_ptr<ledger::LedgerConnection>, dp::Error>::ok(
            std::make_shared<LocalLedger>(records_[pool_name]));
    }

  private:
    std::map<std::string, std::map<std::string, std::string>> records_;
};

void printSeparator(const std::string &title) {
    std::cout << "\n" << std::string(60, '=') << std::endl;
    std::cout << "  " << title << std::endl;
    std::cout << std::string(60, '=') << std::endl;
}

int main() {
    log::setLevel(log::Level::Warn);

    // A self-certified identity: nym = base58(first 16 bytes of verkey)
    std::vector<uint8_t> key(32);
    for (size_t i = 0; i < key.size(); ++i)
        key[i] = static_cast<uint8_t>(0x40 + i);
    std::string verkey = encoding::base58Encode(key);
    std::string nym = encoding::base58Encode(std::vector<uint8_t>(key.begin(), key.begin() + 16));
    std::string did = "did:sov:" + nym;

    auto connector = std::make_shared<LocalConnector>();
    connector->publish("staging", nym, verkey);
    // Production copy was rotated to a key the nym no longer derives from
    connector->publish("sovrin", nym, encoding::base58Encode(sha256(std::string("rotated"))));

    auto storage = std::filesystem::temp_directory_path() / "resolvit-demo";

    ledger::ManagerOptions options;
    options.connector = connector;
    options.cache = std::make_shared<cache::MemoryCache>();
    options.cache_ttl = std::chrono::seconds(600);
    options.storage_root = storage;

    MultiLedgerManager manager(options);

    printSeparator("Configure ledgers");
    auto configs = ledger::parseLedgerConfigList(R"([
        {"id": "staging", "pool_name": "staging", "is_production": false, "keepalive": 1,
         "genesis_transactions": "{\"txn\":{\"data\":{\"alias\":\"Node1\"}}}"},
        {"id": "sovrin", "pool_name": "sovrin", "is_production": true, "is_write": true, "keepalive": 1,
         "genesis_transactions": "{\"txn\":{\"data\":{\"alias\":\"Node1\"}}}"}
    ])");
    if (configs.is_err()) {
        std::cerr << "config: " << errorText(configs.error()) << std::endl;
        return 1;
    }
    auto updated = manager.updateLedgerConfig(configs.value());
    if (updated.is_err()) {
        std::cerr << "registry: " << errorText(updated.error()) << std::endl;
        return 1;
    }
    std::cout << "Production ledgers: " << manager.getProductionLedgers().size() << std::endl;
    std::cout << "Non-production ledgers: " << manager.getNonProductionLedgers().size() << std::endl;
    std::cout << "Write ledger: " << manager.getWriteLedger().value().ledger_id << std::endl;

    printSeparator("Resolve " + did);
    auto found = manager.lookupDID(did);
    if (found.is_err()) {
        std::cerr << "lookup: " << errorText(found.error()) << std::endl;
        return 1;
    }
    std::cout << "Resolved on ledger: " << found.value().ledger_id << std::endl;

    auto cached = manager.lookupDID(did);
    std::cout << "Second lookup (cached): " << cached.value().ledger_id << std::endl;

    printSeparator("Route a schema id");
    auto routed = manager.getLedgerForIdentifier(nym + ":2:degree:1.0", ledger::LedgerRecordType::Schema);
    if (routed.is_ok()) {
        std::cout << "Schema lives on: " << routed.value().ledger_id << std::endl;
    }

    printSeparator("Unknown DID");
    auto missing = manager.lookupDID("did:sov:WgWxqztrNooG92RXvxSTWv");
    if (missing.is_err()) {
        std::cout << errorText(missing.error()) << std::endl;
    }

    std::error_code ec;
    std::filesystem::remove_all(storage, ec);
    return 0;
}
