#pragma once

#include <datapod/datapod.hpp>
#include <optional>
#include <resolvit/common/json.hpp>
#include <string>
#include <vector>

namespace resolvit::ledger {

    /// One configured ledger, as supplied to MultiLedgerManager::updateLedgerConfig
    struct LedgerConfig {
        std::string id;
        std::string pool_name;
        bool is_production = true;
        bool is_write = false;
        std::string genesis_transactions;
        std::string genesis_file;
        int keepalive = 5; // seconds
        bool read_only = false;
        std::optional<std::string> socks_proxy;
        std::optional<std::string> endorser_did;
        std::optional<std::string> endorser_alias;

        /// Build from a JSON object. Missing id gets a random UUID, missing pool_name falls back to id,
        /// and genesis_file is read when no inline genesis is given.
        static dp::Result<LedgerConfig, dp::Error> fromJson(const json::Value &j);

        json::Value toJson() const;
    };

    /// Accepts a top-level array or an object with a "ledgers" array
    dp::Result<std::vector<LedgerConfig>, dp::Error> parseLedgerConfigList(const std::string &text);

    dp::Result<std::vector<LedgerConfig>, dp::Error> loadLedgerConfigFile(const std::string &path);

    /// Random RFC 4122 version 4 UUID string
    std::string generateUuid();

} // namespace resolvit::ledger
