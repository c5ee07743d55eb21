/**
 * @file wager_engine.cpp
 * @brief Wager settlement: stake debit, house fee, payout, platform counters
 *
 * Settlement sequence:
 * 1. Game admission (active flag, bet bounds)
 * 2. Eligibility and balance checks
 * 3. Quote fee (HOUSE_EDGE_BPS) and payout (config multiplier), both floored
 * 4. Solvency check for winning wagers
 * 5. Debit stake, credit payout, update counters, report stats (one Transaction)
 */

#include "wager/wager_engine.hpp"
#include "wager/checked_math.hpp"
#include "wager/logger.hpp"
#include "wager/transaction.hpp"

namespace wager {

WagerSettlementEngine::WagerSettlementEngine(LedgerContext& ctx) : ctx_(ctx) {}

Result<SettlementQuote> WagerSettlementEngine::quote(const GameConfig& config, Amount bet_amount, bool won) {
    SettlementQuote q;
    q.config = config;

    auto fee = apply_basis_points(bet_amount, HOUSE_EDGE_BPS);
    if (fee.has_error()) return fee.error();
    q.fee = fee.value();

    if (won) {
        auto payout = apply_basis_points(bet_amount, config.payout_multiplier);
        if (payout.has_error()) return payout.error();
        q.payout = payout.value();
    }
    return q;
}

Result<void> WagerSettlementEngine::check_solvency(const PeggedAssetMinter& minter,
                                                   Amount bet_amount, Amount payout) const {
    auto after_debit = checked_sub(ctx_.accounts.total_balances(), bet_amount);
    if (after_debit.has_error()) return ErrorCode::SYSTEM_CORRUPTED_STATE;

    auto required = checked_add(after_debit.value(), payout);
    if (required.has_error()) return required.error();

    Amount custody = minter.balance_of(ctx_.engine_identity);
    if (custody < payout || custody < required.value()) {
        LOG_WARN_SAFE("Custody {} cannot cover payout {} (required {})",
                      custody, payout, required.value());
        return ErrorCode::INSUFFICIENT_CUSTODY;
    }
    return Result<void>();
}

Result<SettlementEvent> WagerSettlementEngine::play_game(const Identity& identity, GameType game_type,
                                                         Amount bet_amount, bool won,
                                                         const ResolvedLinks& links) {
    auto config = ctx_.games.validate_bet(game_type, bet_amount);
    if (config.has_error()) return config.error();

    if (ctx_.accounts.balance_of(identity) < bet_amount) {
        return ErrorCode::INSUFFICIENT_BALANCE;
    }
    if (!links.registry.is_valid(identity)) {
        return ErrorCode::IDENTITY_REJECTED;
    }

    auto q = quote(config.value(), bet_amount, won);
    if (q.has_error()) return q.error();
    const SettlementQuote& terms = q.value();

    if (won) {
        auto solvent = check_solvency(*links.minter, bet_amount, terms.payout);
        if (solvent.has_error()) return solvent.error();
    }

    SettlementEvent event{identity, game_type, bet_amount, won, terms.payout, terms.fee};
    auto record = ctx_.events.prepare(event);
    if (record.has_error()) return record.error();

    const Identity& engine = ctx_.engine_identity;
    PlatformStats counters_before = ctx_.fees.snapshot();

    Transaction tx("play_game:" + identity);
    tx.add_step("debit stake",
        [&] { return ctx_.accounts.debit(identity, bet_amount); },
        [&] { return ctx_.accounts.credit(identity, bet_amount); });
    if (won) {
        tx.add_step("credit payout",
            [&] { return ctx_.accounts.credit(identity, terms.payout); },
            [&] { return ctx_.accounts.debit(identity, terms.payout); });
    }
    tx.add_step("platform counters",
        [&] { return ctx_.fees.record_settlement(bet_amount, terms.fee, terms.payout); },
        [&] { ctx_.fees.restore(counters_before); return Result<void>(); });
    tx.add_step("game stat",
        [&] { return links.registry.record_game_stat(engine, identity, won, bet_amount); },
        nullptr);

    auto committed = tx.commit();
    if (committed.has_error()) return committed.error();

    auto published = ctx_.events.publish(std::move(record).value());
    if (published.has_error()) return published.error();

    LOG_INFO_SAFE("Settled {} {} bet={} won={} payout={} fee={}",
                  identity, to_string(game_type), bet_amount, won, terms.payout, terms.fee);
    return event;
}

} // namespace wager
