#include "wager/types.hpp"

namespace wager {

const char* to_string(GameType type) {
    switch (type) {
        case GameType::COIN_FLIP: return "COIN_FLIP";
        case GameType::DICE: return "DICE";
        case GameType::ROULETTE: return "ROULETTE";
        case GameType::HIGH_LOW: return "HIGH_LOW";
    }
    return "UNKNOWN";
}

std::optional<GameType> parse_game_type(std::string_view name) {
    for (auto type : ALL_GAME_TYPES) {
        if (name == to_string(type)) return type;
    }
    return std::nullopt;
}

const char* to_string(Role role) {
    switch (role) {
        case Role::GAME_MANAGER: return "GAME_MANAGER";
        case Role::MINTER: return "MINTER";
    }
    return "UNKNOWN";
}

std::optional<Role> parse_role(std::string_view name) {
    if (name == "GAME_MANAGER") return Role::GAME_MANAGER;
    if (name == "MINTER") return Role::MINTER;
    return std::nullopt;
}

} // namespace wager
