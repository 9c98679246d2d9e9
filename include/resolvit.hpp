#pragma once

// High-level Resolvit entry point

#include "resolvit/resolvit.hpp"

namespace resolvit {

    using ledger::LedgerConfig;
    using ledger::ManagerOptions;
    using ledger::MultiLedgerManager;

} // namespace resolvit
