#include <resolvit/common/digest.hpp>
#include <resolvit/common/encoding.hpp>
#include <resolvit/common/log.hpp>
#include <resolvit/proof/state_proof.hpp>

namespace resolvit::proof {

    namespace {
        constexpr const char *ATTR_KEYS[] = {"raw", "enc", "hash"};

        std::string scalarText(const json::Value &value) {
            if (value.is_string())
                return value.get<std::string>();
            return value.dump();
        }

        std::vector<uint8_t> bytesOf(const std::string &text) { return std::vector<uint8_t>(text.begin(), text.end()); }

        /// Decoded `data` field, string payloads parsed as JSON
        json::Value decodedData(const json::Value &result) {
            if (!result.contains("data"))
                return nullptr;
            const auto &data = result["data"];
            if (data.is_string()) {
                auto parsed = json::parse(data.get<std::string>());
                if (parsed.is_discarded())
                    throw std::invalid_argument("data is not valid JSON");
                return parsed;
            }
            return data;
        }

        json::Value fieldOr(const json::Value &obj, const char *name) {
            if (obj.contains(name))
                return obj[name];
            return nullptr;
        }

        std::optional<StateEntry> prepareNym(const json::Value &result) {
            auto data = decodedData(result);
            std::string dest;
            if (result.contains("dest") && result["dest"].is_string()) {
                dest = result["dest"].get<std::string>();
            } else if (data.is_object() && data.contains("dest")) {
                dest = data["dest"].get<std::string>();
            } else {
                return std::nullopt;
            }

            StateEntry entry{nymStatePath(dest), std::nullopt};
            if (!data.is_null()) {
                data.erase("dest");
                entry.value = json::dumps(data);
            }
            return entry;
        }

        std::optional<StateEntry> prepareAttr(const json::Value &result) {
            std::string attr_type;
            for (const char *key : ATTR_KEYS) {
                if (result.contains(key)) {
                    if (!attr_type.empty())
                        return std::nullopt; // exactly one of raw/enc/hash
                    attr_type = key;
                }
            }
            if (attr_type.empty() || !result.contains("dest"))
                return std::nullopt;

            std::string did = result["dest"].get<std::string>();
            std::string attr_name = result[attr_type].get<std::string>();
            StateEntry entry{bytesOf(attrStatePath(did, attr_name, attr_type == "hash")), std::nullopt};

            const auto data = fieldOr(result, "data");
            if (data.is_null() || (data.is_string() && data.get<std::string>().empty()))
                return entry;

            std::string value;
            if (attr_type == "raw") {
                auto raw = json::parse(data.get<std::string>());
                if (raw.is_discarded())
                    return std::nullopt;
                value = json::dumps(raw);
            } else if (attr_type == "enc") {
                value = data.get<std::string>();
            }
            std::string hashed = value.empty() ? "" : sha256Hex(value);
            entry.value = encodeStateValue(hashed, fieldOr(result, "seqNo"), fieldOr(result, "txnTime"));
            return entry;
        }

        std::optional<StateEntry> prepareSchema(const json::Value &result) {
            auto data = decodedData(result);
            if (!data.is_object() || !result.contains("dest"))
                return std::nullopt;
            std::string path = schemaStatePath(result["dest"].get<std::string>(), scalarText(fieldOr(data, "name")),
                                               scalarText(fieldOr(data, "version")));
            StateEntry entry{bytesOf(path), std::nullopt};
            if (data.contains("attr_names") && !data["attr_names"].empty()) {
                json::Value value = json::Value::object();
                value["attr_names"] = data["attr_names"];
                entry.value = encodeStateValue(value, fieldOr(result, "seqNo"), fieldOr(result, "txnTime"));
            }
            return entry;
        }

        std::optional<StateEntry> prepareClaimDef(const json::Value &result) {
            if (!result.contains("ref") || result["ref"].is_null()) {
                log::warn("proof", "ref field is absent, but it must contain schema seq no");
                return std::nullopt;
            }
            if (!result.contains("origin"))
                return std::nullopt;
            std::string signature_type = result.value("signature_type", std::string("CL"));
            std::string tag = result.value("tag", std::string("tag"));
            std::string path = claimDefStatePath(result["origin"].get<std::string>(), scalarText(result["ref"]),
                                                 signature_type, tag);
            StateEntry entry{bytesOf(path), std::nullopt};
            auto data = decodedData(result);
            if (!data.is_null()) {
                entry.value = encodeStateValue(data, fieldOr(result, "seqNo"), fieldOr(result, "txnTime"));
            }
            return entry;
        }

        std::optional<StateEntry> prepareRevocRegDef(const json::Value &result) {
            auto data = decodedData(result);
            std::string id;
            if (result.contains("id") && result["id"].is_string()) {
                id = result["id"].get<std::string>();
            } else if (data.is_object() && data.contains("id")) {
                id = data["id"].get<std::string>();
            } else {
                return std::nullopt;
            }
            StateEntry entry{bytesOf(id), std::nullopt};
            if (!data.is_null()) {
                entry.value = encodeStateValue(data, fieldOr(result, "seqNo"), fieldOr(result, "txnTime"));
            }
            return entry;
        }

        std::optional<StateEntry> prepareRevocReg(const json::Value &result) {
            if (!result.contains("revocRegDefId"))
                return std::nullopt;
            StateEntry entry{bytesOf(revocRegEntryAccumStatePath(result["revocRegDefId"].get<std::string>())),
                             std::nullopt};
            auto data = decodedData(result);
            if (!data.is_null()) {
                entry.value = encodeStateValue(data, fieldOr(result, "seqNo"), fieldOr(result, "txnTime"));
            }
            return entry;
        }
    } // namespace

    // ===========================================
    // State paths
    // ===========================================

    std::vector<uint8_t> nymStatePath(const std::string &nym) { return sha256(nym); }

    std::string attrStatePath(const std::string &did, const std::string &attr_name, bool attr_is_hash) {
        std::string name_hash = attr_is_hash ? attr_name : sha256Hex(attr_name);
        return did + ":" + MARKER_ATTR + ":" + name_hash;
    }

    std::string schemaStatePath(const std::string &did, const std::string &name, const std::string &version) {
        return did + ":" + MARKER_SCHEMA + ":" + name + ":" + version;
    }

    std::string claimDefStatePath(const std::string &did, const std::string &schema_seq_no,
                                  const std::string &signature_type, const std::string &tag) {
        return did + ":" + MARKER_CLAIM_DEF + ":" + signature_type + ":" + schema_seq_no + ":" + tag;
    }

    std::string revocRegEntryStatePath(const std::string &revoc_reg_def_id) {
        return std::string(MARKER_REVOC_REG_ENTRY) + ":" + revoc_reg_def_id;
    }

    std::string revocRegEntryAccumStatePath(const std::string &revoc_reg_def_id) {
        return std::string(MARKER_REVOC_REG_ENTRY_ACCUM) + ":" + revoc_reg_def_id;
    }

    std::string encodeStateValue(const json::Value &value, const json::Value &seq_no, const json::Value &txn_time) {
        json::Value encoded = json::Value::object();
        encoded["lsn"] = seq_no;
        encoded["lut"] = txn_time;
        encoded["val"] = value;
        return json::dumps(encoded);
    }

    std::optional<StateEntry> prepareForStateRead(const json::Value &result) {
        if (!result.is_object() || !result.contains("type") || !result["type"].is_string())
            return std::nullopt;

        std::string type = result["type"].get<std::string>();
        if (type == ledger::TXN_GET_NYM)
            return prepareNym(result);
        if (type == ledger::TXN_GET_ATTR)
            return prepareAttr(result);
        if (type == ledger::TXN_GET_SCHEMA)
            return prepareSchema(result);
        if (type == ledger::TXN_GET_CLAIM_DEF)
            return prepareClaimDef(result);
        if (type == ledger::TXN_GET_REVOC_REG_DEF)
            return prepareRevocRegDef(result);
        if (type == ledger::TXN_GET_REVOC_REG)
            return prepareRevocReg(result);

        log::warn("proof", "Cannot make state value for request of type " + type);
        return std::nullopt;
    }

    // ===========================================
    // StateProofVerifier
    // ===========================================

    StateProofVerifier::StateProofVerifier() : checker_(std::make_shared<SparseMerkleChecker>()) {}

    StateProofVerifier::StateProofVerifier(std::shared_ptr<const TrieProofChecker> checker)
        : checker_(std::move(checker)) {}

    std::optional<StateProofInput> StateProofVerifier::extract(const ledger::LedgerReply &reply) const {
        const auto &result = reply.result();
        if (!result.contains("state_proof") || !result["state_proof"].is_object()) {
            log::warn("proof", "Reply carries no state proof");
            return std::nullopt;
        }
        const auto &state_proof = result["state_proof"];
        if (!state_proof.contains("root_hash") || !state_proof["root_hash"].is_string() ||
            !state_proof.contains("proof_nodes") || !state_proof["proof_nodes"].is_string()) {
            log::warn("proof", "State proof is missing root_hash or proof_nodes");
            return std::nullopt;
        }

        auto root = encoding::base58Decode(state_proof["root_hash"].get<std::string>());
        if (!root) {
            log::warn("proof", "State proof root_hash is not base58");
            return std::nullopt;
        }
        auto nodes = encoding::base64Decode(state_proof["proof_nodes"].get<std::string>());
        if (!nodes) {
            log::warn("proof", "State proof proof_nodes is not base64");
            return std::nullopt;
        }

        auto entry = prepareForStateRead(result);
        if (!entry) {
            log::warn("proof", "Cannot derive state entry for reply of type '" + reply.type() + "'");
            return std::nullopt;
        }

        StateProofInput input;
        input.root_hash = std::move(*root);
        input.state_key = std::move(entry->key);
        input.expected_value = std::move(entry->value);
        input.proof_nodes = std::move(*nodes);
        return input;
    }

    bool StateProofVerifier::verifyReply(const ledger::LedgerReply &reply) const {
        if (!reply.isReply()) {
            return false;
        }
        try {
            auto input = extract(reply);
            if (!input) {
                return false;
            }
            return checker_ && checker_->verify(*input);
        } catch (const std::exception &e) {
            log::warn("proof", std::string("Malformed reply during proof verification: ") + e.what());
            return false;
        }
    }

    bool StateProofVerifier::verifyReply(const std::string &reply_json) const {
        auto reply = ledger::LedgerReply::parse(reply_json);
        if (!reply.is_ok()) {
            log::warn("proof", "Unparseable reply: " + errorText(reply.error()));
            return false;
        }
        return verifyReply(reply.value());
    }

} // namespace resolvit::proof
