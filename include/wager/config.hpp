#pragma once

#include "wager/error_handling.hpp"
#include "wager/types.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace wager {

struct EngineConfig {
    Identity engine_identity;
    Identity owner;
    std::optional<Identity> treasury;
    Identity minter_identity;
    Identity registry_identity;  // empty: run without an identity registry
    bool start_paused{false};
};

struct LoggingConfig {
    std::string level{"INFO"};
    uint32_t rate_limit_ms{0};
    bool enable_structured{false};
};

struct BootstrapConfig {
    Amount house_funding{0};                 // native units moved from the owner into the bankroll
    std::map<Identity, Amount> wallets;      // initial native wallet balances
};

struct Config {
    EngineConfig engine;
    LoggingConfig logging;
    std::map<GameType, GameConfig> games;    // overrides of the built-in defaults
    BootstrapConfig bootstrap;

    static std::unique_ptr<Config> parse(const std::string& content);
    static std::unique_ptr<Config> load_from_file(const std::string& path,
                                                  const std::string& base_dir = "configs");
};

class ConfigurationValidator {
public:
    static Result<void> validate_full_config(const Config& config);

private:
    static Result<void> validate_engine_config(const EngineConfig& config);
    static Result<void> validate_logging_config(const LoggingConfig& config);
    static Result<void> validate_game_configs(const std::map<GameType, GameConfig>& games);
};

} // namespace wager
