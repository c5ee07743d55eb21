#include "wager/config.hpp"
#include "wager/logger.hpp"
#include "wager/security_utils.hpp"
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace wager {

// Minimal JSON reader for the engine config. Values are looked up by key
// inside a scope (the text of one object), so nested objects may reuse keys.
class JsonParser {
public:
    static std::unique_ptr<Config> parse(const std::string& content) {
        auto config = std::make_unique<Config>();

        std::string engine = extract_object(content, "engine");
        config->engine.engine_identity = extract_string(engine, "engine_identity");
        config->engine.owner = extract_string(engine, "owner");
        std::string treasury = extract_string(engine, "treasury");
        if (!treasury.empty()) config->engine.treasury = treasury;
        config->engine.minter_identity = extract_string(engine, "minter_identity");
        config->engine.registry_identity = extract_string(engine, "registry_identity");
        config->engine.start_paused = extract_bool(engine, "start_paused");

        std::string logging = extract_object(content, "logging");
        if (!logging.empty()) {
            std::string level = extract_string(logging, "level");
            if (!level.empty()) config->logging.level = level;
            config->logging.rate_limit_ms = static_cast<uint32_t>(extract_number(logging, "rate_limit_ms"));
            config->logging.enable_structured = extract_bool(logging, "enable_structured");
        }

        std::string games = extract_object(content, "games");
        for (auto type : ALL_GAME_TYPES) {
            std::string game = extract_object(games, to_string(type));
            if (game.empty()) continue;

            GameConfig cfg;
            cfg.min_bet = extract_number(game, "min_bet");
            cfg.max_bet = extract_number(game, "max_bet");
            cfg.payout_multiplier = extract_number(game, "payout_multiplier");
            cfg.is_active = extract_bool(game, "is_active");
            cfg.display_name = extract_string(game, "display_name");
            config->games[type] = cfg;
        }

        std::string bootstrap = extract_object(content, "bootstrap");
        config->bootstrap.house_funding = extract_number(bootstrap, "house_funding");
        config->bootstrap.wallets = extract_number_map(extract_object(bootstrap, "wallets"));

        return config;
    }

private:
    static size_t find_value(const std::string& json, const std::string& key) {
        auto pos = json.find("\"" + key + "\"");
        if (pos == std::string::npos) return std::string::npos;

        pos = json.find(':', pos);
        if (pos == std::string::npos) return std::string::npos;

        ++pos;
        while (pos < json.length() && std::isspace(static_cast<unsigned char>(json[pos]))) pos++;
        return pos < json.length() ? pos : std::string::npos;
    }

    // Text of the object value of `key`, braces included; empty if absent
    static std::string extract_object(const std::string& json, const std::string& key) {
        auto pos = find_value(json, key);
        if (pos == std::string::npos || json[pos] != '{') return "";

        int depth = 0;
        bool in_string = false;
        for (size_t i = pos; i < json.length(); ++i) {
            char c = json[i];
            if (c == '"' && (i == 0 || json[i - 1] != '\\')) in_string = !in_string;
            if (in_string) continue;
            if (c == '{') depth++;
            if (c == '}' && --depth == 0) {
                return json.substr(pos, i - pos + 1);
            }
        }
        throw std::runtime_error("Unterminated object for key: " + key);
    }

    static std::string extract_string(const std::string& json, const std::string& key) {
        auto pos = find_value(json, key);
        if (pos == std::string::npos || json[pos] != '"') return "";

        auto end = json.find('"', pos + 1);
        if (end == std::string::npos) {
            throw std::runtime_error("Unterminated string for key: " + key);
        }
        return json.substr(pos + 1, end - pos - 1);
    }

    static bool extract_bool(const std::string& json, const std::string& key) {
        auto pos = find_value(json, key);
        if (pos == std::string::npos) return false;
        return json.compare(pos, 4, "true") == 0;
    }

    static uint64_t extract_number(const std::string& json, const std::string& key) {
        auto pos = find_value(json, key);
        if (pos == std::string::npos) return 0;
        return parse_unsigned(json, pos, key);
    }

    static uint64_t parse_unsigned(const std::string& json, size_t pos, const std::string& key) {
        auto end = pos;
        while (end < json.length() && std::isdigit(static_cast<unsigned char>(json[end]))) end++;
        if (end == pos) {
            throw std::runtime_error("Expected unsigned integer for key: " + key);
        }
        return std::stoull(json.substr(pos, end - pos));
    }

    // {"name": 123, ...} -> map
    static std::map<Identity, Amount> extract_number_map(const std::string& object) {
        std::map<Identity, Amount> out;
        size_t pos = 0;
        while (true) {
            auto key_start = object.find('"', pos);
            if (key_start == std::string::npos) break;
            auto key_end = object.find('"', key_start + 1);
            if (key_end == std::string::npos) break;

            std::string key = object.substr(key_start + 1, key_end - key_start - 1);
            auto colon = object.find(':', key_end);
            if (colon == std::string::npos) break;

            auto value = colon + 1;
            while (value < object.length() && std::isspace(static_cast<unsigned char>(object[value]))) value++;
            auto value_end = value;
            while (value_end < object.length() && std::isdigit(static_cast<unsigned char>(object[value_end]))) value_end++;

            out[key] = parse_unsigned(object, value, key);
            pos = value_end;
        }
        return out;
    }
};

std::unique_ptr<Config> Config::parse(const std::string& content) {
    try {
        auto config = JsonParser::parse(content);

        auto validation_result = ConfigurationValidator::validate_full_config(*config);
        if (validation_result.has_error()) {
            throw std::runtime_error("Configuration validation failed: " +
                                     validation_result.error().message());
        }
        return config;
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Failed to parse config: ") + e.what());
    } catch (const std::out_of_range& e) {
        throw std::runtime_error(std::string("Failed to parse config: ") + e.what());
    }
}

std::unique_ptr<Config> Config::load_from_file(const std::string& path, const std::string& base_dir) {
    // Validate file path to prevent path traversal attacks
    if (!SecurityUtils::validate_file_path(path, base_dir)) {
        throw std::runtime_error("Invalid config file path: " + SecurityUtils::sanitize_log_input(path));
    }

    std::string normalized_path = SecurityUtils::normalize_path(path);
    if (normalized_path.empty()) {
        throw std::runtime_error("Cannot normalize config file path");
    }

    std::ifstream file(normalized_path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + SecurityUtils::sanitize_log_input(normalized_path));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto config = parse(buffer.str());
    LOG_INFO("Configuration validation passed");
    return config;
}

Result<void> ConfigurationValidator::validate_full_config(const Config& config) {
    auto engine_result = validate_engine_config(config.engine);
    if (engine_result.has_error()) return engine_result;

    auto logging_result = validate_logging_config(config.logging);
    if (logging_result.has_error()) return logging_result;

    return validate_game_configs(config.games);
}

Result<void> ConfigurationValidator::validate_engine_config(const EngineConfig& config) {
    if (!SecurityUtils::is_valid_identity(config.engine_identity) ||
        !SecurityUtils::is_valid_identity(config.owner) ||
        !SecurityUtils::is_valid_identity(config.minter_identity)) {
        return ErrorCode::CONFIG_INVALID;
    }

    if (config.treasury && !SecurityUtils::is_valid_identity(*config.treasury)) {
        return ErrorCode::CONFIG_INVALID;
    }

    if (!config.registry_identity.empty() && !SecurityUtils::is_valid_identity(config.registry_identity)) {
        return ErrorCode::CONFIG_INVALID;
    }

    // The engine holds custody and reserve; it cannot also be a player or the owner
    if (config.engine_identity == config.owner) {
        return ErrorCode::CONFIG_INVALID;
    }

    return Result<void>();
}

Result<void> ConfigurationValidator::validate_logging_config(const LoggingConfig& config) {
    LogLevel level;
    if (!parse_log_level(config.level, level)) {
        return ErrorCode::CONFIG_INVALID;
    }
    return Result<void>();
}

// Bounds are not cross-checked: a game with min_bet > max_bet is accepted and
// simply never admits a bet.
Result<void> ConfigurationValidator::validate_game_configs(const std::map<GameType, GameConfig>& games) {
    for (const auto& [type, config] : games) {
        if (!SecurityUtils::is_safe_string(config.display_name)) {
            return ErrorCode::CONFIG_INVALID;
        }
        if (config.min_bet > config.max_bet) {
            LOG_WARN_SAFE("Game {} has min_bet {} above max_bet {}; it will reject every bet",
                          to_string(type), config.min_bet, config.max_bet);
        }
    }
    return Result<void>();
}

} // namespace wager
