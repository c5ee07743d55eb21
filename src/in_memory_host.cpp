/**
 * @file in_memory_host.cpp
 * @brief Reference collaborators used by the CLI and the test suite
 */

#include "wager/in_memory_host.hpp"
#include "wager/checked_math.hpp"
#include "wager/logger.hpp"

namespace wager {

// InMemoryMinter implementation
InMemoryMinter::InMemoryMinter(Identity id, std::shared_ptr<const CapabilitySet> capabilities)
    : id_(std::move(id)), capabilities_(std::move(capabilities)) {}

Result<void> InMemoryMinter::mint(const Identity& caller, const Identity& holder, Amount amount) {
    if (!capabilities_ || !capabilities_->has_capability(caller, Role::MINTER)) {
        LOG_WARN_SAFE("Mint by unauthorized caller {}", caller);
        return ErrorCode::MISSING_CAPABILITY;
    }
    if (amount == 0) return ErrorCode::INVALID_AMOUNT;

    auto supply = checked_add(total_supply_, amount);
    if (supply.has_error()) return supply.error();

    auto balance = checked_add(balance_of(holder), amount);
    if (balance.has_error()) return balance.error();

    balances_[holder] = balance.value();
    total_supply_ = supply.value();
    return Result<void>();
}

Result<void> InMemoryMinter::burn(const Identity& caller, const Identity& holder, Amount amount) {
    if (!capabilities_ || !capabilities_->has_capability(caller, Role::MINTER)) {
        LOG_WARN_SAFE("Burn by unauthorized caller {}", caller);
        return ErrorCode::MISSING_CAPABILITY;
    }
    if (amount == 0) return ErrorCode::INVALID_AMOUNT;

    Amount balance = balance_of(holder);
    if (balance < amount) {
        return ErrorCode::INSUFFICIENT_CUSTODY;
    }

    balances_[holder] = balance - amount;
    total_supply_ -= amount;
    return Result<void>();
}

Amount InMemoryMinter::balance_of(const Identity& holder) const {
    auto it = balances_.find(holder);
    return it != balances_.end() ? it->second : 0;
}

Result<Amount> InMemoryMinter::native_to_game_units(Amount native_amount) const {
    return checked_mul(native_amount, RATIO);
}

Amount InMemoryMinter::game_units_to_native(Amount game_units) const {
    return game_units / RATIO;
}

// InMemoryIdentityRegistry implementation
InMemoryIdentityRegistry::InMemoryIdentityRegistry(Identity id,
                                                   std::shared_ptr<const CapabilitySet> capabilities)
    : id_(std::move(id)), capabilities_(std::move(capabilities)) {}

void InMemoryIdentityRegistry::register_identity(const Identity& identity) {
    if (registered_.insert(identity).second) {
        LOG_INFO_SAFE("Registered identity {}", identity);
    }
}

void InMemoryIdentityRegistry::ban(const Identity& identity) {
    banned_.insert(identity);
    LOG_WARN_SAFE("Banned identity {}", identity);
}

void InMemoryIdentityRegistry::unban(const Identity& identity) {
    banned_.erase(identity);
}

bool InMemoryIdentityRegistry::is_registered(const Identity& identity) const {
    return registered_.contains(identity);
}

bool InMemoryIdentityRegistry::is_valid(const Identity& identity) const {
    return registered_.contains(identity) && !banned_.contains(identity);
}

Result<void> InMemoryIdentityRegistry::record_game_stat(const Identity& caller, const Identity& identity,
                                                        bool won, Amount amount) {
    if (!capabilities_ || !capabilities_->has_capability(caller, Role::GAME_MANAGER)) {
        return ErrorCode::MISSING_CAPABILITY;
    }

    auto& stats = stats_[identity];
    auto wagered = checked_add(stats.total_wagered, amount);
    if (wagered.has_error()) return wagered.error();

    stats.games_played += 1;
    if (won) stats.games_won += 1;
    stats.total_wagered = wagered.value();
    return Result<void>();
}

Result<void> InMemoryIdentityRegistry::record_deposit_stat(const Identity& caller, const Identity& identity,
                                                           Amount amount, bool is_deposit) {
    if (!capabilities_ || !capabilities_->has_capability(caller, Role::GAME_MANAGER)) {
        return ErrorCode::MISSING_CAPABILITY;
    }

    auto& stats = stats_[identity];
    Amount& total = is_deposit ? stats.total_deposited : stats.total_withdrawn;
    auto updated = checked_add(total, amount);
    if (updated.has_error()) return updated.error();

    total = updated.value();
    return Result<void>();
}

PlayerStats InMemoryIdentityRegistry::stats_of(const Identity& identity) const {
    auto it = stats_.find(identity);
    return it != stats_.end() ? it->second : PlayerStats{};
}

// InMemoryNativeLedger implementation
Amount InMemoryNativeLedger::balance_of(const Identity& holder) const {
    auto it = wallets_.find(holder);
    return it != wallets_.end() ? it->second : 0;
}

Result<void> InMemoryNativeLedger::transfer(const Identity& from, const Identity& to, Amount amount) {
    Amount from_balance = balance_of(from);
    if (from_balance < amount) {
        return ErrorCode::INSUFFICIENT_FUNDS;
    }

    if (from != to) {
        auto to_balance = checked_add(balance_of(to), amount);
        if (to_balance.has_error()) return to_balance.error();

        wallets_[from] = from_balance - amount;
        wallets_[to] = to_balance.value();
    }

    // Copy: the hook may replace itself
    auto hook_it = hooks_.find(to);
    if (hook_it != hooks_.end()) {
        ReceiveHook hook = hook_it->second;
        hook(from, amount);
    }
    return Result<void>();
}

Result<void> InMemoryNativeLedger::credit(const Identity& holder, Amount amount) {
    auto balance = checked_add(balance_of(holder), amount);
    if (balance.has_error()) return balance.error();

    wallets_[holder] = balance.value();
    return Result<void>();
}

void InMemoryNativeLedger::set_receive_hook(const Identity& recipient, ReceiveHook hook) {
    hooks_[recipient] = std::move(hook);
}

void InMemoryNativeLedger::clear_receive_hook(const Identity& recipient) {
    hooks_.erase(recipient);
}

} // namespace wager
