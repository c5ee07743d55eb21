#pragma once

#include "wager/error_handling.hpp"
#include "wager/types.hpp"
#include <map>

namespace wager {

// Per-game-type parameters. Every known game type has an entry from
// construction on. Writes replace the tuple wholesale without cross-field
// validation: min_bet > max_bet is accepted and makes the game unplayable.
class GameConfigRegistry {
public:
    GameConfigRegistry();

    static GameConfig default_config(GameType type);

    Result<GameConfig> get(GameType type) const;
    void set(GameType type, GameConfig config);

    // Play-time admission: active flag and [min_bet, max_bet]
    Result<GameConfig> validate_bet(GameType type, Amount bet_amount) const;

    const std::map<GameType, GameConfig>& all() const { return configs_; }

private:
    std::map<GameType, GameConfig> configs_;
};

} // namespace wager
