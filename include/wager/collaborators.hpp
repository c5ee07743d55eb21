#pragma once

#include "wager/error_handling.hpp"
#include "wager/types.hpp"

namespace wager {

// Issues and destroys pegged units. The conversion functions are pure:
// native * RATIO and pegged / RATIO (floor).
class PeggedAssetMinter {
public:
    virtual ~PeggedAssetMinter() = default;

    virtual const Identity& id() const = 0;

    virtual Result<void> mint(const Identity& caller, const Identity& holder, Amount amount) = 0;
    virtual Result<void> burn(const Identity& caller, const Identity& holder, Amount amount) = 0;
    virtual Amount balance_of(const Identity& holder) const = 0;
    virtual Amount total_supply() const = 0;

    virtual Result<Amount> native_to_game_units(Amount native_amount) const = 0;
    virtual Amount game_units_to_native(Amount game_units) const = 0;
};

// Eligibility and per-identity statistics
class IdentityRegistry {
public:
    virtual ~IdentityRegistry() = default;

    virtual const Identity& id() const = 0;

    virtual bool is_valid(const Identity& identity) const = 0;
    virtual Result<void> record_game_stat(const Identity& caller, const Identity& identity,
                                          bool won, Amount amount) = 0;
    virtual Result<void> record_deposit_stat(const Identity& caller, const Identity& identity,
                                             Amount amount, bool is_deposit) = 0;
};

// Stand-in used when no registry is linked: every identity is eligible and
// nothing is recorded.
class NullIdentityRegistry : public IdentityRegistry {
public:
    static NullIdentityRegistry& instance();

    const Identity& id() const override { return id_; }
    bool is_valid(const Identity&) const override { return true; }
    Result<void> record_game_stat(const Identity&, const Identity&, bool, Amount) override {
        return Result<void>();
    }
    Result<void> record_deposit_stat(const Identity&, const Identity&, Amount, bool) override {
        return Result<void>();
    }

private:
    NullIdentityRegistry() = default;
    Identity id_;
};

// The host's native asset rail. The engine's own wallet is its native reserve.
// A transfer may call back into the recipient (and from there into the engine).
class NativeAssetLedger {
public:
    virtual ~NativeAssetLedger() = default;

    virtual Amount balance_of(const Identity& holder) const = 0;
    virtual Result<void> transfer(const Identity& from, const Identity& to, Amount amount) = 0;
};

} // namespace wager
