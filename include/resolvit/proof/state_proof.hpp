#pragma once

#include <memory>
#include <optional>
#include <resolvit/common/json.hpp>
#include <resolvit/ledger/request.hpp>
#include <resolvit/proof/trie.hpp>
#include <string>
#include <vector>

namespace resolvit::proof {

    // State path markers
    constexpr const char *MARKER_ATTR = "1";
    constexpr const char *MARKER_SCHEMA = "2";
    constexpr const char *MARKER_CLAIM_DEF = "3";
    constexpr const char *MARKER_REVOC_DEF = "4";
    constexpr const char *MARKER_REVOC_REG_ENTRY = "5";
    constexpr const char *MARKER_REVOC_REG_ENTRY_ACCUM = "6";

    // ===========================================
    // State paths
    // ===========================================

    std::vector<uint8_t> nymStatePath(const std::string &nym);
    std::string attrStatePath(const std::string &did, const std::string &attr_name, bool attr_is_hash);
    std::string schemaStatePath(const std::string &did, const std::string &name, const std::string &version);
    std::string claimDefStatePath(const std::string &did, const std::string &schema_seq_no,
                                  const std::string &signature_type, const std::string &tag);
    std::string revocRegEntryStatePath(const std::string &revoc_reg_def_id);
    std::string revocRegEntryAccumStatePath(const std::string &revoc_reg_def_id);

    /// {"lsn": seq_no, "lut": txn_time, "val": value}
    std::string encodeStateValue(const json::Value &value, const json::Value &seq_no, const json::Value &txn_time);

    /// Key and expected value a read reply commits to
    struct StateEntry {
        std::vector<uint8_t> key;
        std::optional<std::string> value;
    };

    /// Derive the state entry for a read reply result; nullopt for unsupported or malformed replies
    std::optional<StateEntry> prepareForStateRead(const json::Value &result);

    // ===========================================
    // StateProofVerifier
    // ===========================================

    /// Authenticates one node's reply against the state root it declares
    class StateProofVerifier {
      public:
        StateProofVerifier();
        explicit StateProofVerifier(std::shared_ptr<const TrieProofChecker> checker);

        /// False on any failure, including malformed or missing proofs. Never throws.
        bool verifyReply(const ledger::LedgerReply &reply) const;
        bool verifyReply(const std::string &reply_json) const;

        /// Decoded proof input, nullopt when the envelope lacks a usable proof
        std::optional<StateProofInput> extract(const ledger::LedgerReply &reply) const;

      private:
        std::shared_ptr<const TrieProofChecker> checker_;
    };

} // namespace resolvit::proof
