#pragma once

#include <datapod/datapod.hpp>
#include <string>

namespace resolvit {

    // ===========================================
    // Resolvit-specific error codes (100+)
    // ===========================================

    constexpr dp::u32 ERR_POOL_CONFIG = 100;
    constexpr dp::u32 ERR_POOL_OPEN = 101;
    constexpr dp::u32 ERR_POOL_CLOSE = 102;
    constexpr dp::u32 ERR_LEDGER_NOT_FOUND = 103;
    constexpr dp::u32 ERR_DID_NOT_FOUND_ANYWHERE = 104;
    constexpr dp::u32 ERR_CACHE_INCONSISTENCY = 105;
    constexpr dp::u32 ERR_NO_LEDGER_CONFIGURED = 106;
    constexpr dp::u32 ERR_LEDGER_TIMEOUT = 107;
    constexpr dp::u32 ERR_LEDGER_TRANSPORT = 108;
    constexpr dp::u32 ERR_LOOKUP_CANCELLED = 109;
    constexpr dp::u32 ERR_BAD_REPLY = 110;
    constexpr dp::u32 ERR_CACHE_STORE = 111;
    constexpr dp::u32 ERR_INVALID_DID = 112;

    // ===========================================
    // Error factory functions
    // ===========================================

    inline dp::Error pool_config_error(const std::string &msg = "Invalid pool configuration") {
        return dp::Error{ERR_POOL_CONFIG, dp::String(msg.c_str())};
    }

    inline dp::Error pool_open_error(const std::string &msg = "Failed to open pool ledger") {
        return dp::Error{ERR_POOL_OPEN, dp::String(msg.c_str())};
    }

    inline dp::Error pool_close_error(const std::string &msg = "Exception when closing pool ledger") {
        return dp::Error{ERR_POOL_CLOSE, dp::String(msg.c_str())};
    }

    inline dp::Error ledger_not_found(const std::string &msg = "Ledger not found") {
        return dp::Error{ERR_LEDGER_NOT_FOUND, dp::String(msg.c_str())};
    }

    inline dp::Error did_not_found_anywhere(const std::string &msg = "DID not found in any ledger") {
        return dp::Error{ERR_DID_NOT_FOUND_ANYWHERE, dp::String(msg.c_str())};
    }

    inline dp::Error cache_inconsistency(const std::string &msg = "Cached ledger id not in registry") {
        return dp::Error{ERR_CACHE_INCONSISTENCY, dp::String(msg.c_str())};
    }

    inline dp::Error no_ledger_configured(const std::string &msg = "No ledger configured") {
        return dp::Error{ERR_NO_LEDGER_CONFIGURED, dp::String(msg.c_str())};
    }

    inline dp::Error ledger_timeout(const std::string &msg = "Ledger request timed out") {
        return dp::Error{ERR_LEDGER_TIMEOUT, dp::String(msg.c_str())};
    }

    inline dp::Error ledger_transport(const std::string &msg = "Ledger transport failure") {
        return dp::Error{ERR_LEDGER_TRANSPORT, dp::String(msg.c_str())};
    }

    inline dp::Error lookup_cancelled(const std::string &msg = "Lookup cancelled") {
        return dp::Error{ERR_LOOKUP_CANCELLED, dp::String(msg.c_str())};
    }

    inline dp::Error bad_reply(const std::string &msg = "Malformed ledger reply") {
        return dp::Error{ERR_BAD_REPLY, dp::String(msg.c_str())};
    }

    inline dp::Error cache_store_error(const std::string &msg = "Cache store failure") {
        return dp::Error{ERR_CACHE_STORE, dp::String(msg.c_str())};
    }

    inline dp::Error invalid_did(const std::string &msg = "Invalid DID") {
        return dp::Error{ERR_INVALID_DID, dp::String(msg.c_str())};
    }

    // ===========================================
    // Inspection helpers
    // ===========================================

    inline bool isError(const dp::Error &err, dp::u32 code) { return err.code == code; }

    inline std::string errorText(const dp::Error &err) { return std::string(err.message.c_str()); }

} // namespace resolvit
