#pragma once

#include <datapod/datapod.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace resolvit::ledger {

    /// Default root for per-pool genesis configuration: $RESOLVIT_HOME/vdr, else $HOME/.resolvit/vdr
    std::filesystem::path defaultStorageRoot();

    /// On-disk genesis configuration, one directory per pool name:
    ///   <root>/<pool>/genesis         configured genesis transactions
    ///   <root>/<pool>/cache-<hash>    transaction list last seen from the network
    class GenesisStore {
      public:
        explicit GenesisStore(std::filesystem::path root);

        /// Trim every line and drop blank ones
        static std::string normalize(const std::string &transactions);

        /// Last 16 hex characters of SHA-256 over the transactions
        static std::string hash(const std::string &transactions);

        /// Write the genesis file for a pool. Identical content is left untouched;
        /// different content is replaced only when `recreate` is set.
        dp::Result<void, dp::Error> writeConfig(const std::string &pool_name, const std::string &transactions,
                                                bool recreate);

        /// Normalized genesis transactions for a pool, ERR_POOL_CONFIG when missing
        dp::Result<std::string, dp::Error> readConfig(const std::string &pool_name) const;

        bool hasConfig(const std::string &pool_name) const;

        std::optional<std::string> readCache(const std::string &pool_name, const std::string &genesis_hash) const;

        dp::Result<void, dp::Error> writeCache(const std::string &pool_name, const std::string &genesis_hash,
                                               const std::string &transactions);

        const std::filesystem::path &root() const { return root_; }

        std::filesystem::path configPath(const std::string &pool_name) const;

        std::filesystem::path cachePath(const std::string &pool_name, const std::string &genesis_hash) const;

      private:
        dp::Result<void, dp::Error> writeSafe(const std::filesystem::path &path, const std::string &content);

        std::filesystem::path root_;
    };

} // namespace resolvit::ledger
