/**
 * @file main.cpp
 * @brief Command-line host for the wagering ledger
 *
 * Builds an in-memory host (native ledger, minter, identity registry) from
 * the configuration, wires it to a GameManager and executes one command per
 * line read from stdin.
 */

#include "wager/config.hpp"
#include "wager/game_manager.hpp"
#include "wager/in_memory_host.hpp"
#include "wager/logger.hpp"
#include "wager/metrics.hpp"
#include <atomic>
#include <csignal>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace wager {

// Global shutdown flag for graceful termination
std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    (void)signal;
    shutdown_requested.store(true);
}

struct Host {
    std::shared_ptr<InMemoryNativeLedger> native;
    std::shared_ptr<InMemoryMinter> minter;
    std::shared_ptr<InMemoryIdentityRegistry> registry;
    std::unique_ptr<GameManager> manager;
};

void check(const Result<void>& result, const std::string& step) {
    if (result.has_error()) {
        throw std::runtime_error(step + " failed: " + result.error().message());
    }
}

/**
 * @brief Build the host described by the configuration
 *
 * Bootstrap sequence:
 * 1. Credit the configured native wallets
 * 2. Create the manager with the configured admin state
 * 3. Grant the engine MINTER and GAME_MANAGER, link collaborators
 * 4. Apply game overrides and fund the house bankroll
 */
Host build_host(const Config& config) {
    Host host;
    const Identity& owner = config.engine.owner;

    host.native = std::make_shared<InMemoryNativeLedger>();
    for (const auto& [identity, amount] : config.bootstrap.wallets) {
        check(host.native->credit(identity, amount), "credit wallet " + identity);
    }

    AdminState admin;
    admin.owner = owner;
    admin.treasury = config.engine.treasury;
    host.manager = std::make_unique<GameManager>(config.engine.engine_identity, admin, host.native);
    GameManager& manager = *host.manager;

    auto capabilities = manager.capabilities();
    host.minter = std::make_shared<InMemoryMinter>(config.engine.minter_identity, capabilities);
    if (!config.engine.registry_identity.empty()) {
        host.registry = std::make_shared<InMemoryIdentityRegistry>(config.engine.registry_identity, capabilities);
        for (const auto& [identity, amount] : config.bootstrap.wallets) {
            (void)amount;
            host.registry->register_identity(identity);
        }
    }

    check(manager.authorize(owner, Role::MINTER, manager.engine_identity()), "authorize minter");
    check(manager.authorize(owner, Role::GAME_MANAGER, manager.engine_identity()), "authorize game manager");
    check(manager.link(owner, host.minter, host.registry), "link");

    for (const auto& [type, game] : config.games) {
        check(manager.set_game_config(owner, type, game.min_bet, game.max_bet, game.payout_multiplier,
                                      game.is_active, game.display_name),
              std::string("configure ") + to_string(type));
    }

    if (config.bootstrap.house_funding > 0) {
        auto funded = manager.fund_house(owner, config.bootstrap.house_funding);
        if (funded.has_error()) {
            throw std::runtime_error("fund house failed: " + funded.error().message());
        }
    }

    if (config.engine.start_paused) {
        check(manager.pause(owner), "pause");
    }
    return host;
}

template<typename T>
void report(std::ostream& out, const Result<T>& result) {
    if (result.has_error()) {
        out << "error " << result.error().message() << "\n";
    } else {
        out << "ok " << result.value() << "\n";
    }
}

void report(std::ostream& out, const Result<void>& result) {
    if (result.has_error()) {
        out << "error " << result.error().message() << "\n";
    } else {
        out << "ok\n";
    }
}

void print_stats(std::ostream& out, const PlatformView& view) {
    out << "games_played=" << view.stats.total_games_played
        << " volume=" << view.stats.total_volume_wagered
        << " payouts=" << view.stats.total_payouts
        << " fees=" << view.stats.total_fees_collected
        << " native_reserve=" << view.native_reserve
        << " custody=" << view.custody_size << "\n";
}

/**
 * @brief Execute one command line
 * @return false when the session should end
 *
 * Commands (the owner is the caller of every administrative command):
 *   fund <native>                 deposit <id> <native>      withdraw <id> <pegged>
 *   play <id> <GAME> <bet> <won|lost>
 *   config <GAME> <min> <max> <multiplier_bps> <0|1> <name...>
 *   pause | unpause | fees | treasury <id> | register <id> | ban <id>
 *   balance <id> | wallet <id> | stats | metrics | events | quit
 */
bool execute(Host& host, const Identity& owner, const std::string& line, std::ostream& out) {
    std::istringstream in(line);
    std::string command;
    if (!(in >> command)) return true;

    GameManager& manager = *host.manager;

    if (command == "quit" || command == "exit") {
        return false;
    } else if (command == "fund") {
        Amount native = 0;
        in >> native;
        report(out, manager.fund_house(owner, native));
    } else if (command == "deposit") {
        Identity identity;
        Amount native = 0;
        in >> identity >> native;
        report(out, manager.deposit(identity, native));
    } else if (command == "withdraw") {
        Identity identity;
        Amount pegged = 0;
        in >> identity >> pegged;
        report(out, manager.withdraw(identity, pegged));
    } else if (command == "play") {
        Identity identity;
        std::string game, outcome;
        Amount bet = 0;
        in >> identity >> game >> bet >> outcome;

        auto type = parse_game_type(game);
        if (!type) {
            report(out, Result<void>(ErrorCode::UNKNOWN_GAME_TYPE));
            return true;
        }
        auto settled = manager.play_game(identity, *type, bet, outcome == "won");
        if (settled.has_error()) {
            report(out, Result<void>(settled.error()));
        } else {
            const auto& event = settled.value();
            out << "ok payout=" << event.payout << " fee=" << event.fee
                << " balance=" << manager.balance_of(identity) << "\n";
        }
    } else if (command == "config") {
        std::string game, name;
        Amount min_bet = 0, max_bet = 0;
        BasisPoints multiplier = 0;
        int active = 0;
        in >> game >> min_bet >> max_bet >> multiplier >> active;
        std::getline(in >> std::ws, name);

        auto type = parse_game_type(game);
        if (!type) {
            report(out, Result<void>(ErrorCode::UNKNOWN_GAME_TYPE));
            return true;
        }
        report(out, manager.set_game_config(owner, *type, min_bet, max_bet, multiplier, active != 0, name));
    } else if (command == "pause") {
        report(out, manager.pause(owner));
    } else if (command == "unpause") {
        report(out, manager.unpause(owner));
    } else if (command == "fees") {
        report(out, manager.withdraw_fees(owner));
    } else if (command == "treasury") {
        Identity identity;
        in >> identity;
        report(out, manager.set_treasury(owner, identity));
    } else if (command == "register" || command == "ban") {
        Identity identity;
        in >> identity;
        if (!host.registry) {
            out << "error no identity registry configured\n";
        } else if (command == "register") {
            host.registry->register_identity(identity);
            out << "ok\n";
        } else {
            host.registry->ban(identity);
            out << "ok\n";
        }
    } else if (command == "balance") {
        Identity identity;
        in >> identity;
        out << "ok " << manager.balance_of(identity) << "\n";
    } else if (command == "wallet") {
        Identity identity;
        in >> identity;
        out << "ok " << host.native->balance_of(identity) << "\n";
    } else if (command == "stats") {
        print_stats(out, manager.platform_stats());
    } else if (command == "metrics") {
        out << MetricsRegistry::instance().get_prometheus_output();
    } else if (command == "events") {
        for (const auto& record : manager.events().records()) {
            out << record.sequence << " " << serialize(record.payload) << " " << record.digest << "\n";
        }
        out << (manager.events().verify_chain() ? "chain ok" : "chain BROKEN") << "\n";
    } else {
        out << "error unknown command: " << SecurityUtils::sanitize_log_input(command) << "\n";
    }
    return true;
}

void run_session(const Config& config) {
    Host host = build_host(config);
    LOG_INFO("Wager engine ready, reading commands from stdin");

    std::string line;
    while (!shutdown_requested.load() && std::getline(std::cin, line)) {
        if (!execute(host, config.engine.owner, line, std::cout)) break;
        std::cout.flush();
    }

    LOG_INFO_SAFE("Session closed after {} ledger events", host.manager->events().size());
}

} // namespace wager

/**
 * @brief Main entry point
 * @param argc Argument count
 * @param argv Argument vector (expects config file path)
 * @return 0 on success, 1 on error
 */
int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cerr << "Usage: " << argv[0] << " <config_file>" << std::endl;
        return 1;
    }

    std::signal(SIGINT, wager::signal_handler);
    std::signal(SIGTERM, wager::signal_handler);

    try {
        auto config = wager::Config::load_from_file(argv[1]);

        auto& logger = wager::Logger::instance();
        wager::LogLevel level;
        if (wager::parse_log_level(config->logging.level, level)) {
            logger.set_level(level);
        }
        logger.set_rate_limit(std::chrono::milliseconds(config->logging.rate_limit_ms));
        logger.enable_structured(config->logging.enable_structured);

        wager::run_session(*config);

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
