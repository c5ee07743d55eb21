/**
 * @file game_manager.cpp
 * @brief Entry points of the wagering ledger
 *
 * Admission for every state-changing request:
 * 1. Admission lock and reentrancy guard (REENTRANT_CALL on nested entry)
 * 2. Caller identity format
 * 3. Owner / pause checks through AccessGate
 * 4. Collaborators resolved once (null registry, rejected missing minter)
 * 5. Request body, counted and logged on the way out
 */

#include "wager/game_manager.hpp"
#include "wager/logger.hpp"
#include "wager/transaction.hpp"
#include <stdexcept>

namespace wager {

namespace {

std::shared_ptr<NativeAssetLedger> require_ledger(std::shared_ptr<NativeAssetLedger> native) {
    if (!native) {
        throw std::invalid_argument("GameManager requires a native asset ledger");
    }
    return native;
}

} // namespace

GameManager::GameManager(Identity engine_identity, AdminState admin, std::shared_ptr<NativeAssetLedger> native)
    : engine_identity_(std::move(engine_identity)),
      native_(require_ledger(std::move(native))),
      gate_(std::move(admin)),
      ctx_{engine_identity_, accounts_, games_, fees_, events_, *native_},
      processor_(ctx_),
      settlement_(ctx_) {
    LOG_INFO_SAFE("GameManager {} ready (owner {}, paused {})",
                  engine_identity_, gate_.owner(), gate_.is_paused());
}

ResolvedLinks GameManager::resolve_links() const {
    if (links_.registry) {
        return ResolvedLinks{links_.minter.get(), *links_.registry};
    }
    return ResolvedLinks{links_.minter.get(), NullIdentityRegistry::instance()};
}

Result<void> GameManager::apply_admin(EventPayload payload, const std::function<Result<void>()>& mutation) {
    auto record = events_.prepare(std::move(payload));
    if (record.has_error()) return record.error();

    auto applied = mutation();
    if (applied.has_error()) return applied;

    return events_.publish(std::move(record).value());
}

void GameManager::record_outcome(const std::string& operation, const Identity& caller,
                                 const std::error_code& error) const {
    if (!error) {
        METRICS_COUNTER("wager_" + operation + "_accepted_total")->increment();
        return;
    }

    METRICS_COUNTER("wager_" + operation + "_rejected_total")->increment();
    ErrorContext context("GameManager", operation, "caller=" + caller);
    LOG_WARN(context.describe(error));
}

Result<void> GameManager::link(const Identity& caller,
                               std::shared_ptr<PeggedAssetMinter> minter,
                               std::shared_ptr<IdentityRegistry> registry) {
    return admit("link", caller, [&]() -> Result<void> {
        auto owner_check = gate_.require_owner(caller);
        if (owner_check.has_error()) return owner_check;

        LinkedEvent event{minter ? minter->id() : Identity(),
                          registry ? registry->id() : Identity()};
        return apply_admin(event, [&]() -> Result<void> {
            links_.minter = std::move(minter);
            links_.registry = std::move(registry);
            LOG_INFO_SAFE("Linked minter '{}' registry '{}'", event.minter, event.registry);
            return Result<void>();
        });
    });
}

Result<void> GameManager::set_game_config(const Identity& caller, GameType game_type,
                                          Amount min_bet, Amount max_bet, BasisPoints multiplier,
                                          bool is_active, const std::string& display_name) {
    return admit("set_game_config", caller, [&]() -> Result<void> {
        auto owner_check = gate_.require_owner(caller);
        if (owner_check.has_error()) return owner_check;

        GameConfig config{min_bet, max_bet, multiplier, is_active, display_name};
        if (min_bet > max_bet) {
            LOG_WARN_SAFE("{} configured with min_bet {} above max_bet {}; no bet will be admitted",
                          to_string(game_type), min_bet, max_bet);
        }

        return apply_admin(ConfigUpdatedEvent{game_type, config}, [&]() -> Result<void> {
            games_.set(game_type, config);
            return Result<void>();
        });
    });
}

Result<void> GameManager::authorize(const Identity& caller, Role role, const Identity& identity) {
    return admit("authorize", caller, [&]() -> Result<void> {
        return apply_admin(CapabilityChangedEvent{role, identity, true}, [&] {
            return gate_.authorize(caller, role, identity);
        });
    });
}

Result<void> GameManager::revoke(const Identity& caller, Role role, const Identity& identity) {
    return admit("revoke", caller, [&]() -> Result<void> {
        return apply_admin(CapabilityChangedEvent{role, identity, false}, [&] {
            return gate_.revoke(caller, role, identity);
        });
    });
}

Result<void> GameManager::pause(const Identity& caller) {
    return admit("pause", caller, [&]() -> Result<void> {
        return apply_admin(PausedChangedEvent{true}, [&] { return gate_.pause(caller); });
    });
}

Result<void> GameManager::unpause(const Identity& caller) {
    return admit("unpause", caller, [&]() -> Result<void> {
        return apply_admin(PausedChangedEvent{false}, [&] { return gate_.unpause(caller); });
    });
}

Result<void> GameManager::set_treasury(const Identity& caller, const Identity& treasury) {
    return admit("set_treasury", caller, [&]() -> Result<void> {
        TreasuryUpdatedEvent event{gate_.treasury(), treasury};
        return apply_admin(event, [&]() -> Result<void> {
            auto previous = gate_.set_treasury(caller, treasury);
            if (previous.has_error()) return previous.error();

            LOG_INFO_SAFE("Treasury set to {}", treasury);
            return Result<void>();
        });
    });
}

Result<void> GameManager::transfer_ownership(const Identity& caller, const Identity& new_owner) {
    return admit("transfer_ownership", caller, [&]() -> Result<void> {
        OwnershipTransferredEvent event{gate_.owner(), new_owner};
        return apply_admin(event, [&]() -> Result<void> {
            auto previous = gate_.transfer_ownership(caller, new_owner);
            if (previous.has_error()) return previous.error();

            LOG_INFO_SAFE("Ownership transferred from {} to {}", previous.value(), new_owner);
            return Result<void>();
        });
    });
}

Result<Amount> GameManager::deposit(const Identity& caller, Amount native_amount) {
    return admit("deposit", caller, [&]() -> Result<Amount> {
        auto pause_check = gate_.require_not_paused();
        if (pause_check.has_error()) return pause_check.error();

        ResolvedLinks links = resolve_links();
        if (!links.minter) return ErrorCode::MINTER_NOT_LINKED;

        auto event = processor_.deposit(caller, native_amount, links);
        if (event.has_error()) return event.error();
        return event.value().pegged_amount;
    });
}

Result<Amount> GameManager::withdraw(const Identity& caller, Amount pegged_amount) {
    return admit("withdraw", caller, [&]() -> Result<Amount> {
        auto pause_check = gate_.require_not_paused();
        if (pause_check.has_error()) return pause_check.error();

        ResolvedLinks links = resolve_links();
        if (!links.minter) return ErrorCode::MINTER_NOT_LINKED;

        auto event = processor_.withdraw(caller, pegged_amount, links);
        if (event.has_error()) return event.error();
        return event.value().native_amount;
    });
}

Result<SettlementEvent> GameManager::play_game(const Identity& caller, GameType game_type,
                                               Amount bet_amount, bool won) {
    return admit("play_game", caller, [&]() -> Result<SettlementEvent> {
        auto pause_check = gate_.require_not_paused();
        if (pause_check.has_error()) return pause_check.error();

        // A loss settles purely on internal counters; a win needs custody
        ResolvedLinks links = resolve_links();
        if (won && !links.minter) return ErrorCode::MINTER_NOT_LINKED;

        return settlement_.play_game(caller, game_type, bet_amount, won, links);
    });
}

Result<Amount> GameManager::withdraw_fees(const Identity& caller) {
    return admit("withdraw_fees", caller, [&]() -> Result<Amount> {
        auto owner_check = gate_.require_owner(caller);
        if (owner_check.has_error()) return owner_check.error();

        if (!gate_.treasury()) return ErrorCode::TREASURY_NOT_SET;
        const Identity treasury = *gate_.treasury();

        ResolvedLinks links = resolve_links();
        if (!links.minter) return ErrorCode::MINTER_NOT_LINKED;

        Amount pegged_fees = fees_.accrued_fees();
        if (pegged_fees == 0) return ErrorCode::NO_FEES_ACCRUED;

        // Fees below one native unit convert to 0: the counter is still cleared
        Amount native_amount = links.minter->game_units_to_native(pegged_fees);

        if (native_->balance_of(engine_identity_) < native_amount) {
            return ErrorCode::INSUFFICIENT_RESERVE;
        }

        // The disbursed units leave custody; what remains must still back every account.
        // Sub-ratio remainder of the counter is forfeited to the custody surplus.
        PeggedAssetMinter& minter = *links.minter;
        Amount burn_amount = native_amount * RATIO;
        Amount custody = minter.balance_of(engine_identity_);
        if (custody < burn_amount || custody - burn_amount < accounts_.total_balances()) {
            return ErrorCode::INSUFFICIENT_CUSTODY;
        }

        FeeCollectedEvent event{native_amount, pegged_fees, treasury};
        auto record = events_.prepare(event);
        if (record.has_error()) return record.error();

        Transaction tx("withdraw_fees");
        tx.add_step("clear fee counter",
            [&] { fees_.take_fees(); return Result<void>(); },
            [&] { fees_.restore_fees(pegged_fees); return Result<void>(); });
        if (native_amount > 0) {
            tx.add_step("burn custody",
                [&] { return minter.burn(engine_identity_, engine_identity_, burn_amount); },
                [&] { return minter.mint(engine_identity_, engine_identity_, burn_amount); });
            tx.add_step("pay treasury",
                [&] { return native_->transfer(engine_identity_, treasury, native_amount); },
                nullptr);
        }

        auto committed = tx.commit();
        if (committed.has_error()) return committed.error();

        auto published = events_.publish(std::move(record).value());
        if (published.has_error()) return published.error();

        LOG_INFO_SAFE("Fees withdrawn: {} pegged -> {} native to {}", pegged_fees, native_amount, treasury);
        return native_amount;
    });
}

Result<Amount> GameManager::fund_house(const Identity& caller, Amount native_amount) {
    return admit("fund_house", caller, [&]() -> Result<Amount> {
        auto owner_check = gate_.require_owner(caller);
        if (owner_check.has_error()) return owner_check.error();

        auto pause_check = gate_.require_not_paused();
        if (pause_check.has_error()) return pause_check.error();

        ResolvedLinks links = resolve_links();
        if (!links.minter) return ErrorCode::MINTER_NOT_LINKED;

        auto event = processor_.fund_house(caller, native_amount, links);
        if (event.has_error()) return event.error();
        return event.value().pegged_amount;
    });
}

Amount GameManager::balance_of(const Identity& identity) const {
    std::lock_guard<std::recursive_mutex> lock(admission_mutex_);
    return accounts_.balance_of(identity);
}

Result<GameConfig> GameManager::game_config(GameType game_type) const {
    std::lock_guard<std::recursive_mutex> lock(admission_mutex_);
    return games_.get(game_type);
}

PlatformView GameManager::platform_stats() const {
    std::lock_guard<std::recursive_mutex> lock(admission_mutex_);

    PlatformView view;
    view.stats = fees_.stats();
    view.native_reserve = native_->balance_of(engine_identity_);
    view.custody_size = links_.minter ? links_.minter->balance_of(engine_identity_) : 0;
    return view;
}

Amount GameManager::total_account_balances() const {
    std::lock_guard<std::recursive_mutex> lock(admission_mutex_);
    return accounts_.total_balances();
}

std::optional<Identity> GameManager::treasury() const {
    std::lock_guard<std::recursive_mutex> lock(admission_mutex_);
    return gate_.treasury();
}

Identity GameManager::owner() const {
    std::lock_guard<std::recursive_mutex> lock(admission_mutex_);
    return gate_.owner();
}

bool GameManager::is_paused() const {
    std::lock_guard<std::recursive_mutex> lock(admission_mutex_);
    return gate_.is_paused();
}

bool GameManager::has_capability(const Identity& identity, Role role) const {
    std::lock_guard<std::recursive_mutex> lock(admission_mutex_);
    return gate_.has_capability(identity, role);
}

Result<void> GameManager::subscribe_events(EventLog::Subscriber subscriber) {
    std::lock_guard<std::recursive_mutex> lock(admission_mutex_);
    if (entered_.load()) {
        return ErrorCode::REENTRANT_CALL;
    }
    events_.subscribe(std::move(subscriber));
    return Result<void>();
}

} // namespace wager
