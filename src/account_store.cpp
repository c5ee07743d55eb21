#include "wager/account_store.hpp"
#include "wager/checked_math.hpp"

namespace wager {

Amount AccountBalanceStore::balance_of(const Identity& identity) const {
    auto it = balances_.find(identity);
    return it != balances_.end() ? it->second : 0;
}

bool AccountBalanceStore::has_account(const Identity& identity) const {
    return balances_.contains(identity);
}

Result<void> AccountBalanceStore::credit(const Identity& identity, Amount amount) {
    auto new_balance = checked_add(balance_of(identity), amount);
    if (new_balance.has_error()) return new_balance.error();

    auto new_total = checked_add(total_, amount);
    if (new_total.has_error()) return new_total.error();

    balances_[identity] = new_balance.value();
    total_ = new_total.value();
    return Result<void>();
}

Result<void> AccountBalanceStore::debit(const Identity& identity, Amount amount) {
    Amount current = balance_of(identity);
    if (current < amount) {
        return ErrorCode::INSUFFICIENT_BALANCE;
    }

    auto new_total = checked_sub(total_, amount);
    if (new_total.has_error()) return ErrorCode::SYSTEM_CORRUPTED_STATE;

    balances_[identity] = current - amount;
    total_ = new_total.value();
    return Result<void>();
}

} // namespace wager
