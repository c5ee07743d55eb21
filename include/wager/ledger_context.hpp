#pragma once

#include "wager/account_store.hpp"
#include "wager/collaborators.hpp"
#include "wager/event_log.hpp"
#include "wager/fee_treasury.hpp"
#include "wager/game_registry.hpp"
#include "wager/types.hpp"

namespace wager {

// State shared by the processors of one GameManager. The engine identity is
// the holder of the custody pool and of the native reserve.
struct LedgerContext {
    Identity engine_identity;
    AccountBalanceStore& accounts;
    GameConfigRegistry& games;
    FeeTreasury& fees;
    EventLog& events;
    NativeAssetLedger& native;
};

// Collaborators resolved for one request at the entry boundary
struct ResolvedLinks {
    PeggedAssetMinter* minter;   // null when not linked
    IdentityRegistry& registry;  // NullIdentityRegistry when not linked
};

} // namespace wager
