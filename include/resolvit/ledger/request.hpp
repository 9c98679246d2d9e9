#pragma once

#include <datapod/datapod.hpp>
#include <optional>
#include <resolvit/common/error.hpp>
#include <resolvit/common/json.hpp>
#include <resolvit/identity/did.hpp>
#include <string>

namespace resolvit::ledger {

    // Transaction type codes
    constexpr const char *TXN_NYM = "1";
    constexpr const char *TXN_ATTRIB = "100";
    constexpr const char *TXN_SCHEMA = "101";
    constexpr const char *TXN_CLAIM_DEF = "102";
    constexpr const char *TXN_GET_ATTR = "104";
    constexpr const char *TXN_GET_NYM = "105";
    constexpr const char *TXN_GET_SCHEMA = "107";
    constexpr const char *TXN_GET_CLAIM_DEF = "108";
    constexpr const char *TXN_GET_REVOC_REG_DEF = "115";
    constexpr const char *TXN_GET_REVOC_REG = "116";
    constexpr const char *TXN_GET_REVOC_REG_DELTA = "117";

    /// Kind of record a caller wants to read; decides how an identifier is routed to a ledger
    enum class LedgerRecordType : dp::u8 {
        Schema = 0,
        CredDef = 1,
        RevRegDef = 2,
        RevRegEntry = 3,
        RevRegDelta = 4,
        KeyForDid = 5,
        AllEndpointsForDid = 6,
        EndpointForDid = 7,
    };

    /// Object records are addressed by identifiers that embed the author DID
    inline bool isObjectRecord(LedgerRecordType type) {
        return static_cast<dp::u8>(type) <= static_cast<dp::u8>(LedgerRecordType::RevRegDelta);
    }

    /// GET_NYM read request. `dest` is always the bare nym.
    inline std::string buildGetNymRequest(const std::optional<std::string> &submitter_did, const std::string &did) {
        json::Value request = json::Value::object();
        if (submitter_did) {
            request["submitterDID"] = toNym(*submitter_did);
        } else {
            request["submitterDID"] = nullptr;
        }
        request["operation"] = json::Value::object();
        request["operation"]["type"] = TXN_GET_NYM;
        request["operation"]["dest"] = toNym(did);
        return request.dump();
    }

    enum class ReplyOp : dp::u8 {
        Reply = 0,
        ReqNack = 1,
        Reject = 2,
    };

    /// Parsed reply envelope
    class LedgerReply {
      public:
        /// Accepts both {op, result:{...}} envelopes and bare result objects
        inline static dp::Result<LedgerReply, dp::Error> parse(const std::string &text) {
            auto doc = json::parse(text);
            if (doc.is_discarded() || !doc.is_object()) {
                return dp::Result<LedgerReply, dp::Error>::err(bad_reply("Reply is not a JSON object"));
            }

            LedgerReply reply;
            std::string op = "REPLY";
            if (doc.contains("op")) {
                if (!doc["op"].is_string()) {
                    return dp::Result<LedgerReply, dp::Error>::err(bad_reply("Reply op is not a string"));
                }
                op = doc["op"].get<std::string>();
            }
            if (op == "REPLY") {
                reply.op_ = ReplyOp::Reply;
            } else if (op == "REQNACK") {
                reply.op_ = ReplyOp::ReqNack;
            } else if (op == "REJECT") {
                reply.op_ = ReplyOp::Reject;
            } else {
                return dp::Result<LedgerReply, dp::Error>::err(bad_reply("Unknown reply op: " + op));
            }

            if (doc.contains("reason") && doc["reason"].is_string()) {
                reply.reason_ = doc["reason"].get<std::string>();
            }

            if (doc.contains("result")) {
                if (!doc["result"].is_object()) {
                    return dp::Result<LedgerReply, dp::Error>::err(bad_reply("Reply result is not an object"));
                }
                reply.result_ = doc["result"];
            } else if (reply.op_ == ReplyOp::Reply) {
                reply.result_ = doc;
            }
            return dp::Result<LedgerReply, dp::Error>::ok(reply);
        }

        inline ReplyOp op() const { return op_; }

        inline bool isReply() const { return op_ == ReplyOp::Reply; }

        inline const std::string &reason() const { return reason_; }

        inline const json::Value &result() const { return result_; }

        inline std::string type() const {
            if (result_.contains("type") && result_["type"].is_string())
                return result_["type"].get<std::string>();
            return "";
        }

        /// True when the ledger holds a record for the request
        inline bool hasData() const {
            if (!isReply() || !result_.contains("data"))
                return false;
            const auto &data = result_["data"];
            if (data.is_null())
                return false;
            if (data.is_string())
                return !data.get<std::string>().empty();
            return !data.empty();
        }

        /// `data` as a JSON value (string payloads are decoded)
        inline std::optional<json::Value> data() const {
            if (!hasData())
                return std::nullopt;
            const auto &data = result_["data"];
            if (data.is_string()) {
                auto decoded = json::parse(data.get<std::string>());
                if (decoded.is_discarded())
                    return std::nullopt;
                return decoded;
            }
            return data;
        }

        inline std::optional<dp::i64> seqNo() const { return integerField("seqNo"); }

        inline std::optional<dp::i64> txnTime() const { return integerField("txnTime"); }

      private:
        inline std::optional<dp::i64> integerField(const char *name) const {
            if (result_.contains(name) && result_[name].is_number_integer())
                return result_[name].get<dp::i64>();
            return std::nullopt;
        }

        ReplyOp op_ = ReplyOp::Reply;
        std::string reason_;
        json::Value result_ = json::Value::object();
    };

} // namespace resolvit::ledger
