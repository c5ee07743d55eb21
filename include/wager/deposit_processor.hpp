#pragma once

#include "wager/error_handling.hpp"
#include "wager/event_log.hpp"
#include "wager/ledger_context.hpp"

namespace wager {

// Native <-> pegged conversion through the minter. Minted units are held by
// the engine itself (custody pool); accounts are internal counters.
class DepositWithdrawalProcessor {
public:
    explicit DepositWithdrawalProcessor(LedgerContext& ctx);

    // Requires links.minter != nullptr
    Result<DepositEvent> deposit(const Identity& identity, Amount native_amount,
                                 const ResolvedLinks& links);
    Result<WithdrawalEvent> withdraw(const Identity& identity, Amount pegged_amount,
                                     const ResolvedLinks& links);

    // Bankroll: native from the funder into the reserve, pegged into custody,
    // no account credited
    Result<HouseFundedEvent> fund_house(const Identity& funder, Amount native_amount,
                                        const ResolvedLinks& links);

private:
    LedgerContext& ctx_;
};

} // namespace wager
