#pragma once

#include "wager/error_handling.hpp"
#include "wager/types.hpp"
#include <unordered_map>

namespace wager {

// Identity -> pegged balance. Single source of truth for spendable funds.
// Entries appear on first credit and are never removed.
class AccountBalanceStore {
public:
    Amount balance_of(const Identity& identity) const;
    bool has_account(const Identity& identity) const;

    Result<void> credit(const Identity& identity, Amount amount);
    Result<void> debit(const Identity& identity, Amount amount);

    // Sum of all balances, maintained incrementally
    Amount total_balances() const { return total_; }
    size_t account_count() const { return balances_.size(); }

private:
    std::unordered_map<Identity, Amount> balances_;
    Amount total_{0};
};

} // namespace wager
