#pragma once

#include <datapod/datapod.hpp>
#include <regex>
#include <resolvit/common/encoding.hpp>
#include <string>
#include <vector>

namespace resolvit {

    /// Ledger DID: did:<method>:[<namespace>:]<nym>
    /// The nym is the base58 identifier the ledger stores NYM records under (GET_NYM `dest`)
    class DID {
      public:
        static constexpr const char *SCHEME = "did";
        static constexpr const char *DEFAULT_METHOD = "sov";

        DID() = default;

        /// Parse a fully qualified DID string (did:sov:xxx, did:indy:sovrin:xxx)
        inline static dp::Result<DID, dp::Error> parse(const std::string &did_string) {
            if (did_string.size() < 4 || did_string.substr(0, 4) != "did:") {
                return dp::Result<DID, dp::Error>::err(
                    dp::Error::invalid_argument("Invalid DID: must start with 'did:'"));
            }

            // Strip path, query and fragment
            std::string base = did_string;
            size_t cut = base.find_first_of("/?#");
            if (cut != std::string::npos) {
                base = base.substr(0, cut);
            }

            size_t method_colon = base.find(':', 4);
            if (method_colon == std::string::npos || method_colon == 4) {
                return dp::Result<DID, dp::Error>::err(
                    dp::Error::invalid_argument("Invalid DID: missing method-specific-id"));
            }

            size_t last_colon = base.rfind(':');
            std::string nym = base.substr(last_colon + 1);
            if (nym.empty()) {
                return dp::Result<DID, dp::Error>::err(dp::Error::invalid_argument("Invalid DID: empty identifier"));
            }

            DID did;
            did.method_ = base.substr(4, method_colon - 4);
            if (last_colon > method_colon) {
                did.namespace_ = base.substr(method_colon + 1, last_colon - method_colon - 1);
            }
            did.nym_ = nym;
            return dp::Result<DID, dp::Error>::ok(did);
        }

        /// Wrap a bare nym as did:sov:<nym>
        inline static DID fromNym(const std::string &nym, const std::string &method = DEFAULT_METHOD) {
            DID did;
            did.method_ = method;
            did.nym_ = nym;
            return did;
        }

        /// Full DID string
        inline std::string toString() const {
            std::string out = std::string(SCHEME) + ":" + method_ + ":";
            if (!namespace_.empty()) {
                out += namespace_ + ":";
            }
            return out + nym_;
        }

        inline const std::string &getMethod() const { return method_; }

        inline const std::string &getNamespace() const { return namespace_; }

        inline const std::string &getNym() const { return nym_; }

        inline bool isEmpty() const { return nym_.empty(); }

        inline bool operator==(const DID &other) const {
            return method_ == other.method_ && namespace_ == other.namespace_ && nym_ == other.nym_;
        }

        inline bool operator!=(const DID &other) const { return !(*this == other); }

      private:
        std::string method_;
        std::string namespace_;
        std::string nym_;
    };

    // ===========================================
    // Identifier helpers
    // ===========================================

    /// Bare nym for a DID or nym string (did:sov:abc -> abc, abc -> abc)
    inline std::string toNym(const std::string &did_or_nym) {
        if (did_or_nym.rfind("did:", 0) == 0) {
            auto parsed = DID::parse(did_or_nym);
            if (parsed.is_ok()) {
                return parsed.value().getNym();
            }
        }
        return did_or_nym;
    }

    /// True for a qualified DID that parses, or a bare nym, whose nym is base58
    inline bool isLedgerDid(const std::string &did_or_nym) {
        if (did_or_nym.rfind("did:", 0) == 0 && DID::parse(did_or_nym).is_err()) {
            return false;
        }
        std::string nym = toNym(did_or_nym);
        return !nym.empty() && encoding::isBase58(nym);
    }

    /// Leading DID of a ledger object identifier.
    /// <did>:2:<name>:<version> (schema), <did>:3:CL:<seq>:<tag> (cred def),
    /// <did>:4:<cred-def-id>:CL_ACCUM:<tag> (rev reg) all yield <did>; did:sov:<did> yields <did>.
    inline std::string extractDIDFromIdentifier(const std::string &identifier) {
        static const std::regex qualified_did("^did:[a-z0-9]+:([1-9A-HJ-NP-Za-km-z]+)$");
        std::smatch match;
        if (std::regex_match(identifier, match, qualified_did)) {
            return match[1].str();
        }

        std::string id = identifier;
        if (id.rfind("did:sov:", 0) == 0) {
            id = id.substr(8);
        }
        return id.substr(0, id.find(':'));
    }

    /// Verkey in abbreviated form: '~' followed by 21-22 base58 characters
    inline bool isAbbreviatedVerkey(const std::string &verkey) {
        static const std::regex abbreviated("^~[1-9A-HJ-NP-Za-km-z]{21,22}$");
        return std::regex_match(verkey, abbreviated);
    }

    /// A DID is self-certified when its nym is derivable from its own verkey:
    /// either the verkey is abbreviated, or base58(first 16 bytes of verkey) equals the nym
    inline bool isSelfCertified(const std::string &did, const std::string &verkey) {
        if (verkey.empty()) {
            return false;
        }
        if (isAbbreviatedVerkey(verkey)) {
            return true;
        }
        auto verkey_bytes = encoding::base58Decode(verkey);
        if (!verkey_bytes || verkey_bytes->size() < 16) {
            return false;
        }
        std::vector<uint8_t> prefix(verkey_bytes->begin(), verkey_bytes->begin() + 16);
        return encoding::base58Encode(prefix) == toNym(did);
    }

} // namespace resolvit
