#pragma once

#include "wager/error_handling.hpp"
#include "wager/types.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <set>
#include <unordered_map>

namespace wager {

// Identity -> granted roles. Independent from ownership.
class CapabilitySet {
public:
    bool has_capability(const Identity& identity, Role role) const;

    // Return true when the set changed
    bool grant(const Identity& identity, Role role);
    bool revoke(const Identity& identity, Role role);

private:
    std::unordered_map<Identity, std::set<Role>> grants_;
};

// Administrative state injected into the engine at construction. Mutated only
// through AccessGate.
struct AdminState {
    Identity owner;
    std::optional<Identity> treasury;
    bool paused{false};
    std::shared_ptr<CapabilitySet> capabilities{std::make_shared<CapabilitySet>()};
};

class AccessGate {
public:
    explicit AccessGate(AdminState state);

    // Admission checks
    Result<void> require_owner(const Identity& caller) const;
    Result<void> require_not_paused() const;
    static Result<void> require_well_formed(const Identity& identity);

    bool has_capability(const Identity& identity, Role role) const;
    bool is_paused() const { return state_.paused; }
    const Identity& owner() const { return state_.owner; }
    const std::optional<Identity>& treasury() const { return state_.treasury; }
    std::shared_ptr<const CapabilitySet> capabilities() const { return state_.capabilities; }

    // Owner-only mutations
    Result<void> authorize(const Identity& caller, Role role, const Identity& identity);
    Result<void> revoke(const Identity& caller, Role role, const Identity& identity);
    Result<void> pause(const Identity& caller);
    Result<void> unpause(const Identity& caller);
    Result<std::optional<Identity>> set_treasury(const Identity& caller, const Identity& treasury);
    Result<Identity> transfer_ownership(const Identity& caller, const Identity& new_owner);

private:
    AdminState state_;
};

// Scoped reentrancy token. Only the first acquirer on a flag holds it; the
// flag is cleared when the holder goes out of scope, on every exit path.
class ReentrancyGuard {
public:
    explicit ReentrancyGuard(std::atomic<bool>& entered);
    ~ReentrancyGuard();

    ReentrancyGuard(const ReentrancyGuard&) = delete;
    ReentrancyGuard& operator=(const ReentrancyGuard&) = delete;

    bool acquired() const { return acquired_; }

private:
    std::atomic<bool>& entered_;
    bool acquired_;
};

} // namespace wager
