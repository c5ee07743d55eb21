#pragma once

#include "wager/error_handling.hpp"
#include "wager/types.hpp"

namespace wager {

// Platform counters and the accrued fee balance (pegged units).
// Counters only grow; the fee counter is cleared by a successful withdrawal.
class FeeTreasury {
public:
    const PlatformStats& stats() const { return stats_; }
    Amount accrued_fees() const { return stats_.total_fees_collected; }

    // Record one settled wager. All-or-nothing: on overflow nothing changes.
    Result<void> record_settlement(Amount bet_amount, Amount fee, Amount payout);

    // Clear the fee counter, returning what was accrued
    Amount take_fees();
    void restore_fees(Amount amount) { stats_.total_fees_collected = amount; }

    // Whole-state snapshot used to undo a settlement inside a transaction
    PlatformStats snapshot() const { return stats_; }
    void restore(const PlatformStats& snapshot) { stats_ = snapshot; }

private:
    PlatformStats stats_;
};

} // namespace wager
