#pragma once

#include "wager/access_gate.hpp"
#include "wager/collaborators.hpp"
#include <functional>
#include <memory>
#include <unordered_map>
#include <unordered_set>

namespace wager {

// Minter whose mint/burn require the caller to hold Role::MINTER in the
// shared capability set.
class InMemoryMinter : public PeggedAssetMinter {
public:
    InMemoryMinter(Identity id, std::shared_ptr<const CapabilitySet> capabilities);

    const Identity& id() const override { return id_; }

    Result<void> mint(const Identity& caller, const Identity& holder, Amount amount) override;
    Result<void> burn(const Identity& caller, const Identity& holder, Amount amount) override;
    Amount balance_of(const Identity& holder) const override;
    Amount total_supply() const override { return total_supply_; }

    Result<Amount> native_to_game_units(Amount native_amount) const override;
    Amount game_units_to_native(Amount game_units) const override;

private:
    Identity id_;
    std::shared_ptr<const CapabilitySet> capabilities_;
    std::unordered_map<Identity, Amount> balances_;
    Amount total_supply_{0};
};

struct PlayerStats {
    uint64_t games_played{0};
    uint64_t games_won{0};
    Amount total_wagered{0};
    Amount total_deposited{0};
    Amount total_withdrawn{0};
};

// Registration, ban list and per-user statistics. Recording requires the
// caller to hold Role::GAME_MANAGER.
class InMemoryIdentityRegistry : public IdentityRegistry {
public:
    InMemoryIdentityRegistry(Identity id, std::shared_ptr<const CapabilitySet> capabilities);

    const Identity& id() const override { return id_; }

    void register_identity(const Identity& identity);
    void ban(const Identity& identity);
    void unban(const Identity& identity);
    bool is_registered(const Identity& identity) const;

    bool is_valid(const Identity& identity) const override;
    Result<void> record_game_stat(const Identity& caller, const Identity& identity,
                                  bool won, Amount amount) override;
    Result<void> record_deposit_stat(const Identity& caller, const Identity& identity,
                                     Amount amount, bool is_deposit) override;

    PlayerStats stats_of(const Identity& identity) const;

private:
    Identity id_;
    std::shared_ptr<const CapabilitySet> capabilities_;
    std::unordered_set<Identity> registered_;
    std::unordered_set<Identity> banned_;
    std::unordered_map<Identity, PlayerStats> stats_;
};

// Wallet ledger for the native asset with optional per-recipient hooks
class InMemoryNativeLedger : public NativeAssetLedger {
public:
    using ReceiveHook = std::function<void(const Identity& from, Amount amount)>;

    Amount balance_of(const Identity& holder) const override;
    Result<void> transfer(const Identity& from, const Identity& to, Amount amount) override;

    // Create native units out of thin air (genesis / test funding)
    Result<void> credit(const Identity& holder, Amount amount);

    void set_receive_hook(const Identity& recipient, ReceiveHook hook);
    void clear_receive_hook(const Identity& recipient);

private:
    std::unordered_map<Identity, Amount> wallets_;
    std::unordered_map<Identity, ReceiveHook> hooks_;
};

} // namespace wager
