#include "wager/game_registry.hpp"

namespace wager {

GameConfigRegistry::GameConfigRegistry() {
    for (auto type : ALL_GAME_TYPES) {
        configs_[type] = default_config(type);
    }
}

GameConfig GameConfigRegistry::default_config(GameType type) {
    switch (type) {
        case GameType::COIN_FLIP: return {100, 10'000'000, 19'500, true, "Coin Flip"};
        case GameType::DICE:      return {100, 5'000'000, 57'000, true, "Dice Roll"};
        case GameType::ROULETTE:  return {100, 5'000'000, 35'000, true, "Roulette"};
        case GameType::HIGH_LOW:  return {100, 10'000'000, 19'000, true, "High Low"};
    }
    return {};
}

Result<GameConfig> GameConfigRegistry::get(GameType type) const {
    auto it = configs_.find(type);
    if (it == configs_.end()) {
        return ErrorCode::UNKNOWN_GAME_TYPE;
    }
    return it->second;
}

void GameConfigRegistry::set(GameType type, GameConfig config) {
    configs_[type] = std::move(config);
}

Result<GameConfig> GameConfigRegistry::validate_bet(GameType type, Amount bet_amount) const {
    auto config = get(type);
    if (config.has_error()) return config;

    const auto& cfg = config.value();
    if (!cfg.is_active) {
        return ErrorCode::GAME_INACTIVE;
    }
    if (bet_amount < cfg.min_bet || bet_amount > cfg.max_bet) {
        return ErrorCode::BET_OUT_OF_BOUNDS;
    }
    return config;
}

} // namespace wager
