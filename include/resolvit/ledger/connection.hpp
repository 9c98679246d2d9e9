#pragma once

#include <chrono>
#include <datapod/datapod.hpp>
#include <memory>
#include <optional>
#include <resolvit/common/cancel.hpp>
#include <string>

namespace resolvit::ledger {

    // ===========================================
    // Ledger client boundary
    // ===========================================
    // The network client (node discovery, request signing, consensus reads) is an external
    // collaborator. Implementations wrap it behind these two interfaces.

    /// Open connection to one ledger network
    class LedgerConnection {
      public:
        virtual ~LedgerConnection() = default;

        /// Submit a read request and return the raw reply JSON.
        /// Must give up with ERR_LEDGER_TIMEOUT at `deadline` and with ERR_LOOKUP_CANCELLED when `cancel` fires.
        virtual dp::Result<std::string, dp::Error> submit(const std::string &request_json,
                                                          std::chrono::steady_clock::time_point deadline,
                                                          const CancelToken &cancel) = 0;

        /// Current pool transaction list (genesis plus membership updates), newline separated
        virtual dp::Result<std::string, dp::Error> transactions() = 0;

        /// Release the network handle. May fail transiently; the caller retries.
        virtual dp::Result<void, dp::Error> close() = 0;
    };

    /// Factory for connections
    class LedgerConnector {
      public:
        virtual ~LedgerConnector() = default;

        virtual dp::Result<std::shared_ptr<LedgerConnection>, dp::Error>
        open(const std::string &pool_name, const std::string &transactions,
             const std::optional<std::string> &socks_proxy) = 0;
    };

} // namespace resolvit::ledger
