/**
 * @file deposit_processor.cpp
 * @brief Deposits and withdrawals between native wallets and pegged accounts
 *
 * Each request validates every precondition up front, then applies its steps
 * inside a Transaction so a failing collaborator call undoes the steps that
 * already ran. The event record is prepared before commit and published
 * after it.
 */

#include "wager/deposit_processor.hpp"
#include "wager/checked_math.hpp"
#include "wager/logger.hpp"
#include "wager/transaction.hpp"

namespace wager {

DepositWithdrawalProcessor::DepositWithdrawalProcessor(LedgerContext& ctx) : ctx_(ctx) {}

Result<DepositEvent> DepositWithdrawalProcessor::deposit(const Identity& identity, Amount native_amount,
                                                         const ResolvedLinks& links) {
    if (native_amount == 0) {
        return ErrorCode::INVALID_AMOUNT;
    }
    if (!links.registry.is_valid(identity)) {
        return ErrorCode::IDENTITY_REJECTED;
    }

    PeggedAssetMinter& minter = *links.minter;
    const Identity& engine = ctx_.engine_identity;

    auto pegged = minter.native_to_game_units(native_amount);
    if (pegged.has_error()) return pegged.error();
    Amount pegged_amount = pegged.value();

    if (ctx_.native.balance_of(identity) < native_amount) {
        return ErrorCode::INSUFFICIENT_FUNDS;
    }

    // Overflow is checked before anything moves
    auto new_total = checked_add(ctx_.accounts.total_balances(), pegged_amount);
    if (new_total.has_error()) return new_total.error();
    auto new_custody = checked_add(minter.balance_of(engine), pegged_amount);
    if (new_custody.has_error()) return new_custody.error();

    DepositEvent event{identity, native_amount, pegged_amount};
    auto record = ctx_.events.prepare(event);
    if (record.has_error()) return record.error();

    Transaction tx("deposit:" + identity);
    tx.add_step("collect native",
        [&] { return ctx_.native.transfer(identity, engine, native_amount); },
        [&] { return ctx_.native.transfer(engine, identity, native_amount); });
    tx.add_step("mint custody",
        [&] { return minter.mint(engine, engine, pegged_amount); },
        [&] { return minter.burn(engine, engine, pegged_amount); });
    tx.add_step("credit account",
        [&] { return ctx_.accounts.credit(identity, pegged_amount); },
        [&] { return ctx_.accounts.debit(identity, pegged_amount); });
    tx.add_step("deposit stat",
        [&] { return links.registry.record_deposit_stat(engine, identity, native_amount, true); },
        nullptr);

    auto committed = tx.commit();
    if (committed.has_error()) return committed.error();

    auto published = ctx_.events.publish(std::move(record).value());
    if (published.has_error()) return published.error();

    LOG_INFO_SAFE("Deposit {}: {} native -> {} pegged", identity, native_amount, pegged_amount);
    return event;
}

Result<WithdrawalEvent> DepositWithdrawalProcessor::withdraw(const Identity& identity, Amount pegged_amount,
                                                             const ResolvedLinks& links) {
    if (pegged_amount == 0) {
        return ErrorCode::INVALID_AMOUNT;
    }
    if (pegged_amount % RATIO != 0) {
        return ErrorCode::AMOUNT_NOT_CONVERTIBLE;
    }
    if (!links.registry.is_valid(identity)) {
        return ErrorCode::IDENTITY_REJECTED;
    }
    if (ctx_.accounts.balance_of(identity) < pegged_amount) {
        return ErrorCode::INSUFFICIENT_BALANCE;
    }

    PeggedAssetMinter& minter = *links.minter;
    const Identity& engine = ctx_.engine_identity;
    Amount native_amount = minter.game_units_to_native(pegged_amount);

    if (ctx_.native.balance_of(engine) < native_amount) {
        return ErrorCode::INSUFFICIENT_RESERVE;
    }
    if (minter.balance_of(engine) < pegged_amount) {
        return ErrorCode::INSUFFICIENT_CUSTODY;
    }

    WithdrawalEvent event{identity, pegged_amount, native_amount};
    auto record = ctx_.events.prepare(event);
    if (record.has_error()) return record.error();

    Transaction tx("withdraw:" + identity);
    tx.add_step("debit account",
        [&] { return ctx_.accounts.debit(identity, pegged_amount); },
        [&] { return ctx_.accounts.credit(identity, pegged_amount); });
    tx.add_step("burn custody",
        [&] { return minter.burn(engine, engine, pegged_amount); },
        [&] { return minter.mint(engine, engine, pegged_amount); });
    tx.add_step("pay native",
        [&] { return ctx_.native.transfer(engine, identity, native_amount); },
        [&] { return ctx_.native.transfer(identity, engine, native_amount); });
    tx.add_step("withdrawal stat",
        [&] { return links.registry.record_deposit_stat(engine, identity, native_amount, false); },
        nullptr);

    auto committed = tx.commit();
    if (committed.has_error()) return committed.error();

    auto published = ctx_.events.publish(std::move(record).value());
    if (published.has_error()) return published.error();

    LOG_INFO_SAFE("Withdrawal {}: {} pegged -> {} native", identity, pegged_amount, native_amount);
    return event;
}

Result<HouseFundedEvent> DepositWithdrawalProcessor::fund_house(const Identity& funder, Amount native_amount,
                                                                const ResolvedLinks& links) {
    if (native_amount == 0) {
        return ErrorCode::INVALID_AMOUNT;
    }

    PeggedAssetMinter& minter = *links.minter;
    const Identity& engine = ctx_.engine_identity;

    auto pegged = minter.native_to_game_units(native_amount);
    if (pegged.has_error()) return pegged.error();
    Amount pegged_amount = pegged.value();

    if (ctx_.native.balance_of(funder) < native_amount) {
        return ErrorCode::INSUFFICIENT_FUNDS;
    }
    auto new_custody = checked_add(minter.balance_of(engine), pegged_amount);
    if (new_custody.has_error()) return new_custody.error();

    HouseFundedEvent event{funder, native_amount, pegged_amount};
    auto record = ctx_.events.prepare(event);
    if (record.has_error()) return record.error();

    Transaction tx("fund_house:" + funder);
    tx.add_step("collect native",
        [&] { return ctx_.native.transfer(funder, engine, native_amount); },
        [&] { return ctx_.native.transfer(engine, funder, native_amount); });
    tx.add_step("mint custody",
        [&] { return minter.mint(engine, engine, pegged_amount); },
        nullptr);

    auto committed = tx.commit();
    if (committed.has_error()) return committed.error();

    auto published = ctx_.events.publish(std::move(record).value());
    if (published.has_error()) return published.error();

    LOG_INFO_SAFE("House funded by {}: {} native -> {} pegged custody", funder, native_amount, pegged_amount);
    return event;
}

} // namespace wager
