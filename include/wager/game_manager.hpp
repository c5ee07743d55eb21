#pragma once

#include "wager/access_gate.hpp"
#include "wager/account_store.hpp"
#include "wager/collaborators.hpp"
#include "wager/deposit_processor.hpp"
#include "wager/error_handling.hpp"
#include "wager/event_log.hpp"
#include "wager/fee_treasury.hpp"
#include "wager/game_registry.hpp"
#include "wager/ledger_context.hpp"
#include "wager/metrics.hpp"
#include "wager/wager_engine.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace wager {

/**
 * @brief Custodial wagering ledger
 *
 * Single entry surface for deposits, withdrawals, wager settlement, fee
 * disbursement and administration. Requests are admitted one at a time; a
 * request that re-enters any entry point (for example from a native transfer
 * hook) is rejected with REENTRANT_CALL. Every request applies in full or
 * not at all.
 */
class GameManager {
public:
    // Throws std::invalid_argument when native is null
    GameManager(Identity engine_identity, AdminState admin, std::shared_ptr<NativeAssetLedger> native);

    GameManager(const GameManager&) = delete;
    GameManager& operator=(const GameManager&) = delete;

    // Administration (owner only, allowed while paused)
    Result<void> link(const Identity& caller,
                      std::shared_ptr<PeggedAssetMinter> minter,
                      std::shared_ptr<IdentityRegistry> registry);
    Result<void> set_game_config(const Identity& caller, GameType game_type,
                                 Amount min_bet, Amount max_bet, BasisPoints multiplier,
                                 bool is_active, const std::string& display_name);
    Result<void> authorize(const Identity& caller, Role role, const Identity& identity);
    Result<void> revoke(const Identity& caller, Role role, const Identity& identity);
    Result<void> pause(const Identity& caller);
    Result<void> unpause(const Identity& caller);
    Result<void> set_treasury(const Identity& caller, const Identity& treasury);
    Result<void> transfer_ownership(const Identity& caller, const Identity& new_owner);

    // Money movement. Returns the pegged amount credited.
    Result<Amount> deposit(const Identity& caller, Amount native_amount);
    // Returns the native amount paid out
    Result<Amount> withdraw(const Identity& caller, Amount pegged_amount);
    Result<SettlementEvent> play_game(const Identity& caller, GameType game_type,
                                      Amount bet_amount, bool won);
    // Owner only. Returns the native amount sent to the treasury.
    Result<Amount> withdraw_fees(const Identity& caller);
    // Owner only. Returns the pegged amount added to custody.
    Result<Amount> fund_house(const Identity& caller, Amount native_amount);

    // Views
    Amount balance_of(const Identity& identity) const;
    Result<GameConfig> game_config(GameType game_type) const;
    PlatformView platform_stats() const;
    Amount total_account_balances() const;
    std::optional<Identity> treasury() const;
    Identity owner() const;
    bool is_paused() const;
    bool has_capability(const Identity& identity, Role role) const;
    std::shared_ptr<const CapabilitySet> capabilities() const { return gate_.capabilities(); }
    const Identity& engine_identity() const { return engine_identity_; }

    const EventLog& events() const { return events_; }
    // Rejected with REENTRANT_CALL from inside a running request
    Result<void> subscribe_events(EventLog::Subscriber subscriber);

private:
    struct Links {
        std::shared_ptr<PeggedAssetMinter> minter;
        std::shared_ptr<IdentityRegistry> registry;
    };

    Identity engine_identity_;
    std::shared_ptr<NativeAssetLedger> native_;

    AccessGate gate_;
    AccountBalanceStore accounts_;
    GameConfigRegistry games_;
    FeeTreasury fees_;
    EventLog events_;
    Links links_;

    LedgerContext ctx_;
    DepositWithdrawalProcessor processor_;
    WagerSettlementEngine settlement_;

    mutable std::recursive_mutex admission_mutex_;
    std::atomic<bool> entered_{false};

    ResolvedLinks resolve_links() const;

    // Prepare the record, apply the mutation, publish
    Result<void> apply_admin(EventPayload payload, const std::function<Result<void>()>& mutation);

    void record_outcome(const std::string& operation, const Identity& caller,
                        const std::error_code& error) const;

    // Serialize, guard against reentry, count and log the outcome
    template<typename F>
    auto admit(const std::string& operation, const Identity& caller, F&& body) -> decltype(body()) {
        using R = decltype(body());

        std::lock_guard<std::recursive_mutex> lock(admission_mutex_);
        ReentrancyGuard guard(entered_);
        if (!guard.acquired()) {
            R rejected(ErrorCode::REENTRANT_CALL);
            record_outcome(operation, caller, rejected.error());
            return rejected;
        }

        auto format_check = AccessGate::require_well_formed(caller);
        if (format_check.has_error()) {
            R rejected(format_check.error());
            record_outcome(operation, caller, rejected.error());
            return rejected;
        }

        R result = body();
        record_outcome(operation, caller, result.has_error() ? result.error() : std::error_code());
        return result;
    }
};

} // namespace wager
