#pragma once

#include "wager/error_handling.hpp"
#include "wager/event_log.hpp"
#include "wager/ledger_context.hpp"

namespace wager {

// Fee and payout for one wager, computed before anything is mutated
struct SettlementQuote {
    GameConfig config;
    Amount fee{0};
    Amount payout{0};
};

// Settles a single wager against the caller's pegged balance.
//
// The outcome `won` is supplied by the caller and is not derived or verified
// here: whoever submits the request controls its result. Deployments must put
// the submission path behind a trusted relayer or an outcome source of their
// own.
class WagerSettlementEngine {
public:
    explicit WagerSettlementEngine(LedgerContext& ctx);

    static Result<SettlementQuote> quote(const GameConfig& config, Amount bet_amount, bool won);

    // links.minter must be non-null when won is true
    Result<SettlementEvent> play_game(const Identity& identity, GameType game_type,
                                      Amount bet_amount, bool won,
                                      const ResolvedLinks& links);

private:
    LedgerContext& ctx_;

    // Custody must keep covering every account balance once the payout lands
    Result<void> check_solvency(const PeggedAssetMinter& minter, Amount bet_amount, Amount payout) const;
};

} // namespace wager
