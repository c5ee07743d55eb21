/**
 * @file access_gate.cpp
 * @brief Owner, capability and pause checks in front of every entry point
 *
 * The gate only answers and records administrative decisions; request
 * admission order and reentrancy are handled by GameManager with
 * ReentrancyGuard.
 */

#include "wager/access_gate.hpp"
#include "wager/logger.hpp"
#include "wager/security_utils.hpp"

namespace wager {

bool CapabilitySet::has_capability(const Identity& identity, Role role) const {
    auto it = grants_.find(identity);
    if (it == grants_.end()) return false;
    return it->second.contains(role);
}

bool CapabilitySet::grant(const Identity& identity, Role role) {
    return grants_[identity].insert(role).second;
}

bool CapabilitySet::revoke(const Identity& identity, Role role) {
    auto it = grants_.find(identity);
    if (it == grants_.end()) return false;

    bool removed = it->second.erase(role) > 0;
    if (it->second.empty()) {
        grants_.erase(it);
    }
    return removed;
}

AccessGate::AccessGate(AdminState state) : state_(std::move(state)) {
    if (!state_.capabilities) {
        state_.capabilities = std::make_shared<CapabilitySet>();
    }
}

Result<void> AccessGate::require_owner(const Identity& caller) const {
    if (caller != state_.owner) {
        LOG_WARN_SAFE("Owner check failed for caller {}", caller);
        return ErrorCode::NOT_OWNER;
    }
    return Result<void>();
}

Result<void> AccessGate::require_not_paused() const {
    if (state_.paused) {
        return ErrorCode::SYSTEM_PAUSED;
    }
    return Result<void>();
}

Result<void> AccessGate::require_well_formed(const Identity& identity) {
    if (!SecurityUtils::is_valid_identity(identity)) {
        return ErrorCode::INVALID_IDENTITY;
    }
    return Result<void>();
}

bool AccessGate::has_capability(const Identity& identity, Role role) const {
    return state_.capabilities->has_capability(identity, role);
}

Result<void> AccessGate::authorize(const Identity& caller, Role role, const Identity& identity) {
    auto owner_check = require_owner(caller);
    if (owner_check.has_error()) return owner_check;

    auto format_check = require_well_formed(identity);
    if (format_check.has_error()) return format_check;

    if (state_.capabilities->grant(identity, role)) {
        LOG_INFO_SAFE("Granted {} to {}", to_string(role), identity);
    }
    return Result<void>();
}

Result<void> AccessGate::revoke(const Identity& caller, Role role, const Identity& identity) {
    auto owner_check = require_owner(caller);
    if (owner_check.has_error()) return owner_check;

    if (state_.capabilities->revoke(identity, role)) {
        LOG_INFO_SAFE("Revoked {} from {}", to_string(role), identity);
    }
    return Result<void>();
}

Result<void> AccessGate::pause(const Identity& caller) {
    auto owner_check = require_owner(caller);
    if (owner_check.has_error()) return owner_check;

    state_.paused = true;
    LOG_WARN("Ledger paused: money-moving entry points disabled");
    return Result<void>();
}

Result<void> AccessGate::unpause(const Identity& caller) {
    auto owner_check = require_owner(caller);
    if (owner_check.has_error()) return owner_check;

    state_.paused = false;
    LOG_INFO("Ledger unpaused");
    return Result<void>();
}

Result<std::optional<Identity>> AccessGate::set_treasury(const Identity& caller, const Identity& treasury) {
    auto owner_check = require_owner(caller);
    if (owner_check.has_error()) return owner_check.error();

    auto format_check = require_well_formed(treasury);
    if (format_check.has_error()) return format_check.error();

    auto previous = state_.treasury;
    state_.treasury = treasury;
    return previous;
}

Result<Identity> AccessGate::transfer_ownership(const Identity& caller, const Identity& new_owner) {
    auto owner_check = require_owner(caller);
    if (owner_check.has_error()) return owner_check.error();

    auto format_check = require_well_formed(new_owner);
    if (format_check.has_error()) return format_check.error();

    Identity previous = state_.owner;
    state_.owner = new_owner;
    return previous;
}

ReentrancyGuard::ReentrancyGuard(std::atomic<bool>& entered)
    : entered_(entered), acquired_(false) {
    bool expected = false;
    acquired_ = entered_.compare_exchange_strong(expected, true);
}

ReentrancyGuard::~ReentrancyGuard() {
    if (acquired_) {
        entered_.store(false);
    }
}

} // namespace wager
