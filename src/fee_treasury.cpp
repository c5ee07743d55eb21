#include "wager/fee_treasury.hpp"
#include "wager/checked_math.hpp"

namespace wager {

Result<void> FeeTreasury::record_settlement(Amount bet_amount, Amount fee, Amount payout) {
    if (stats_.total_games_played == UINT64_MAX) {
        return ErrorCode::ARITHMETIC_OVERFLOW;
    }

    auto volume = checked_add(stats_.total_volume_wagered, bet_amount);
    if (volume.has_error()) return volume.error();

    auto payouts = checked_add(stats_.total_payouts, payout);
    if (payouts.has_error()) return payouts.error();

    auto fees = checked_add(stats_.total_fees_collected, fee);
    if (fees.has_error()) return fees.error();

    stats_.total_games_played += 1;
    stats_.total_volume_wagered = volume.value();
    stats_.total_payouts = payouts.value();
    stats_.total_fees_collected = fees.value();
    return Result<void>();
}

Amount FeeTreasury::take_fees() {
    Amount fees = stats_.total_fees_collected;
    stats_.total_fees_collected = 0;
    return fees;
}

} // namespace wager
