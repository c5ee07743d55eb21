#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <optional>

namespace wager {

using Identity = std::string;
using Amount = uint64_t;       // Pegged or native units, fixed point at the asset's precision
using BasisPoints = uint64_t;  // 10000 = 100%
using SequenceNumber = uint64_t;

// Fixed economic constants
inline constexpr BasisPoints HOUSE_EDGE_BPS = 250;
inline constexpr BasisPoints BASIS_POINTS_DENOM = 10000;
inline constexpr Amount RATIO = 100;  // pegged units per native unit

enum class GameType : uint8_t {
    COIN_FLIP = 0,
    DICE = 1,
    ROULETTE = 2,
    HIGH_LOW = 3
};

inline constexpr GameType ALL_GAME_TYPES[] = {
    GameType::COIN_FLIP, GameType::DICE, GameType::ROULETTE, GameType::HIGH_LOW
};

enum class Role : uint8_t {
    GAME_MANAGER = 1,
    MINTER = 2
};

struct GameConfig {
    Amount min_bet{0};
    Amount max_bet{0};
    BasisPoints payout_multiplier{0};
    bool is_active{false};
    std::string display_name;

    bool operator==(const GameConfig&) const = default;
};

struct PlatformStats {
    uint64_t total_games_played{0};
    Amount total_volume_wagered{0};
    Amount total_payouts{0};
    Amount total_fees_collected{0};
};

// Aggregate view returned to callers; reserve and custody are read from collaborators
struct PlatformView {
    PlatformStats stats;
    Amount native_reserve{0};
    Amount custody_size{0};
};

const char* to_string(GameType type);
std::optional<GameType> parse_game_type(std::string_view name);

const char* to_string(Role role);
std::optional<Role> parse_role(std::string_view name);

} // namespace wager
