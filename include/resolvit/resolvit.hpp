#pragma once

// Multi-ledger DID resolution

#include "resolvit/cache/cache.hpp"
#include "resolvit/cache/sqlite_cache.hpp"
#include "resolvit/common/error.hpp"
#include "resolvit/common/log.hpp"
#include "resolvit/identity/did.hpp"
#include "resolvit/ledger/config.hpp"
#include "resolvit/ledger/manager.hpp"
#include "resolvit/proof/state_proof.hpp"
