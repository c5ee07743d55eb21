#include <gtest/gtest.h>
#include "wager/game_manager.hpp"
#include "wager/in_memory_host.hpp"
#include "wager/metrics.hpp"
#include <algorithm>
#include <random>
#include <stdexcept>
#include <variant>
#include <vector>

using namespace wager;

class GameManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        native = std::make_shared<InMemoryNativeLedger>();
        ASSERT_TRUE(native->credit("house", 1'000'000).has_value());
        ASSERT_TRUE(native->credit("alice", 1000).has_value());
        ASSERT_TRUE(native->credit("bob", 1000).has_value());

        AdminState admin;
        admin.owner = "house";
        admin.treasury = "vault";
        manager = std::make_unique<GameManager>("engine", admin, native);

        minter = std::make_shared<InMemoryMinter>("minter", manager->capabilities());
        registry = std::make_shared<InMemoryIdentityRegistry>("registry", manager->capabilities());
        registry->register_identity("alice");
        registry->register_identity("bob");

        ASSERT_TRUE(manager->authorize("house", Role::MINTER, "engine").has_value());
        ASSERT_TRUE(manager->authorize("house", Role::GAME_MANAGER, "engine").has_value());
        ASSERT_TRUE(manager->link("house", minter, registry).has_value());
    }

    Amount custody() const { return minter->balance_of("engine"); }
    Amount reserve() const { return native->balance_of("engine"); }

    void expect_backed() const {
        EXPECT_LE(manager->total_account_balances(), custody());
        EXPECT_EQ(custody(), reserve() * RATIO);
    }

    std::shared_ptr<InMemoryNativeLedger> native;
    std::shared_ptr<InMemoryMinter> minter;
    std::shared_ptr<InMemoryIdentityRegistry> registry;
    std::unique_ptr<GameManager> manager;
};

TEST_F(GameManagerTest, DepositOneNativeCreditsHundredPegged) {
    auto credited = manager->deposit("alice", 1);

    ASSERT_TRUE(credited.has_value());
    EXPECT_EQ(credited.value(), 100u);
    EXPECT_EQ(manager->balance_of("alice"), 100u);
    EXPECT_EQ(native->balance_of("alice"), 999u);
    EXPECT_EQ(reserve(), 1u);
    EXPECT_EQ(custody(), 100u);
    EXPECT_EQ(registry->stats_of("alice").total_deposited, 1u);

    const auto& last = manager->events().records().back();
    ASSERT_TRUE(std::holds_alternative<DepositEvent>(last.payload));
    EXPECT_EQ(std::get<DepositEvent>(last.payload).pegged_amount, 100u);
}

TEST_F(GameManagerTest, WinningHighLowBetPaysMultiplier) {
    ASSERT_TRUE(manager->fund_house("house", 1).has_value());
    ASSERT_TRUE(manager->deposit("alice", 1).has_value());

    auto settled = manager->play_game("alice", GameType::HIGH_LOW, 100, true);

    ASSERT_TRUE(settled.has_value());
    EXPECT_EQ(settled.value().fee, 2u);
    EXPECT_EQ(settled.value().payout, 190u);
    EXPECT_EQ(manager->balance_of("alice"), 190u);

    auto view = manager->platform_stats();
    EXPECT_EQ(view.stats.total_games_played, 1u);
    EXPECT_EQ(view.stats.total_volume_wagered, 100u);
    EXPECT_EQ(view.stats.total_payouts, 190u);
    EXPECT_EQ(view.stats.total_fees_collected, 2u);
    EXPECT_EQ(view.custody_size, 200u);
    EXPECT_EQ(view.native_reserve, 2u);

    auto stats = registry->stats_of("alice");
    EXPECT_EQ(stats.games_played, 1u);
    EXPECT_EQ(stats.games_won, 1u);
    EXPECT_EQ(stats.total_wagered, 100u);
    expect_backed();
}

TEST_F(GameManagerTest, LosingBetKeepsStakeAndAccruesFee) {
    ASSERT_TRUE(manager->deposit("alice", 5).has_value());

    auto settled = manager->play_game("alice", GameType::COIN_FLIP, 200, false);

    ASSERT_TRUE(settled.has_value());
    EXPECT_EQ(settled.value().payout, 0u);
    EXPECT_EQ(settled.value().fee, 5u);
    EXPECT_EQ(manager->balance_of("alice"), 300u);
    EXPECT_EQ(manager->platform_stats().stats.total_payouts, 0u);
    EXPECT_EQ(manager->platform_stats().stats.total_fees_collected, 5u);
    expect_backed();
}

TEST_F(GameManagerTest, WithdrawNonMultipleOfRatioIsRejected) {
    ASSERT_TRUE(manager->deposit("alice", 2).has_value());
    size_t events_before = manager->events().size();

    auto result = manager->withdraw("alice", 150);

    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error(), make_error_code(ErrorCode::AMOUNT_NOT_CONVERTIBLE));
    EXPECT_EQ(manager->balance_of("alice"), 200u);
    EXPECT_EQ(native->balance_of("alice"), 998u);
    EXPECT_EQ(custody(), 200u);
    EXPECT_EQ(manager->events().size(), events_before);
}

TEST_F(GameManagerTest, DepositThenWithdrawRoundTrip) {
    ASSERT_TRUE(manager->deposit("alice", 7).has_value());

    auto paid = manager->withdraw("alice", 700);

    ASSERT_TRUE(paid.has_value());
    EXPECT_EQ(paid.value(), 7u);
    EXPECT_EQ(native->balance_of("alice"), 1000u);
    EXPECT_EQ(manager->balance_of("alice"), 0u);
    EXPECT_EQ(reserve(), 0u);
    EXPECT_EQ(custody(), 0u);
    EXPECT_EQ(registry->stats_of("alice").total_withdrawn, 7u);
}

TEST_F(GameManagerTest, AmountPreconditions) {
    EXPECT_EQ(manager->deposit("alice", 0).error(), make_error_code(ErrorCode::INVALID_AMOUNT));
    EXPECT_EQ(manager->withdraw("alice", 0).error(), make_error_code(ErrorCode::INVALID_AMOUNT));
    EXPECT_EQ(manager->deposit("alice", 1001).error(), make_error_code(ErrorCode::INSUFFICIENT_FUNDS));
    EXPECT_EQ(manager->withdraw("alice", 100).error(), make_error_code(ErrorCode::INSUFFICIENT_BALANCE));
    EXPECT_EQ(manager->play_game("alice", GameType::COIN_FLIP, 100, false).error(),
              make_error_code(ErrorCode::INSUFFICIENT_BALANCE));

    EXPECT_EQ(native->balance_of("alice"), 1000u);
    EXPECT_EQ(custody(), 0u);
}

TEST_F(GameManagerTest, BetOutsideBoundsLeavesBalanceUntouched) {
    ASSERT_TRUE(manager->deposit("alice", 200'000).has_error());  // more than the wallet holds
    ASSERT_TRUE(native->credit("alice", 200'000).has_value());
    ASSERT_TRUE(manager->deposit("alice", 200'000).has_value());
    Amount balance = manager->balance_of("alice");

    EXPECT_EQ(manager->play_game("alice", GameType::COIN_FLIP, 99, true).error(),
              make_error_code(ErrorCode::BET_OUT_OF_BOUNDS));
    EXPECT_EQ(manager->play_game("alice", GameType::COIN_FLIP, 10'000'001, false).error(),
              make_error_code(ErrorCode::BET_OUT_OF_BOUNDS));

    EXPECT_EQ(manager->balance_of("alice"), balance);
    EXPECT_EQ(manager->platform_stats().stats.total_games_played, 0u);
}

TEST_F(GameManagerTest, InactiveGameIsRejected) {
    ASSERT_TRUE(manager->deposit("alice", 10).has_value());
    ASSERT_TRUE(manager->set_game_config("house", GameType::DICE, 100, 5'000'000, 57'000,
                                         false, "Dice Roll").has_value());

    EXPECT_EQ(manager->play_game("alice", GameType::DICE, 500, false).error(),
              make_error_code(ErrorCode::GAME_INACTIVE));
    EXPECT_EQ(manager->balance_of("alice"), 1000u);
}

TEST_F(GameManagerTest, InvertedBoundsMakeGameUnplayable) {
    ASSERT_TRUE(manager->deposit("alice", 100).has_value());

    auto configured = manager->set_game_config("house", GameType::ROULETTE, 5000, 100, 35'000, true, "Roulette");
    ASSERT_TRUE(configured.has_value());
    EXPECT_EQ(manager->game_config(GameType::ROULETTE).value().min_bet, 5000u);

    for (Amount bet : {Amount{100}, Amount{1000}, Amount{5000}}) {
        EXPECT_EQ(manager->play_game("alice", GameType::ROULETTE, bet, false).error(),
                  make_error_code(ErrorCode::BET_OUT_OF_BOUNDS)) << bet;
    }
}

TEST_F(GameManagerTest, ConfigurationIsOwnerOnlyAndRecorded) {
    EXPECT_EQ(manager->set_game_config("alice", GameType::DICE, 1, 2, 3, true, "x").error(),
              make_error_code(ErrorCode::NOT_OWNER));

    ASSERT_TRUE(manager->set_game_config("house", GameType::DICE, 500, 600, 70'000, true, "Big Dice").has_value());

    auto config = manager->game_config(GameType::DICE).value();
    EXPECT_EQ(config.display_name, "Big Dice");
    EXPECT_EQ(config.payout_multiplier, 70'000u);

    const auto& last = manager->events().records().back();
    ASSERT_TRUE(std::holds_alternative<ConfigUpdatedEvent>(last.payload));
    EXPECT_EQ(std::get<ConfigUpdatedEvent>(last.payload).config, config);
}

TEST_F(GameManagerTest, PauseBlocksMoneyMovementButNotAdministration) {
    ASSERT_TRUE(manager->deposit("alice", 50).has_value());
    ASSERT_TRUE(manager->play_game("alice", GameType::COIN_FLIP, 4000, false).has_value());

    EXPECT_EQ(manager->pause("alice").error(), make_error_code(ErrorCode::NOT_OWNER));
    ASSERT_TRUE(manager->pause("house").has_value());
    EXPECT_TRUE(manager->is_paused());

    auto paused = make_error_code(ErrorCode::SYSTEM_PAUSED);
    EXPECT_EQ(manager->deposit("alice", 1).error(), paused);
    EXPECT_EQ(manager->withdraw("alice", 100).error(), paused);
    EXPECT_EQ(manager->play_game("alice", GameType::COIN_FLIP, 100, false).error(), paused);
    EXPECT_EQ(manager->fund_house("house", 1).error(), paused);
    EXPECT_EQ(manager->balance_of("alice"), 1000u);

    EXPECT_TRUE(manager->set_game_config("house", GameType::DICE, 100, 1000, 50'000, true, "Dice").has_value());
    auto fees = manager->withdraw_fees("house");
    ASSERT_TRUE(fees.has_value());
    EXPECT_EQ(fees.value(), 1u);
    EXPECT_EQ(native->balance_of("vault"), 1u);

    ASSERT_TRUE(manager->unpause("house").has_value());
    EXPECT_TRUE(manager->withdraw("alice", 100).has_value());
}

TEST_F(GameManagerTest, FeeCounterOnlyGrowsUntilWithdrawn) {
    ASSERT_TRUE(manager->fund_house("house", 1000).has_value());
    ASSERT_TRUE(manager->deposit("alice", 500).has_value());

    Amount previous = 0;
    const bool outcomes[] = {false, true, false, false, true, true, false};
    for (bool won : outcomes) {
        ASSERT_TRUE(manager->play_game("alice", GameType::HIGH_LOW, 1000, won).has_value());
        Amount fees = manager->platform_stats().stats.total_fees_collected;
        EXPECT_GE(fees, previous);
        previous = fees;
    }
    EXPECT_EQ(previous, 7u * 25u);

    // A rejected withdrawal leaves the counter alone
    EXPECT_EQ(manager->withdraw_fees("alice").error(), make_error_code(ErrorCode::NOT_OWNER));
    EXPECT_EQ(manager->platform_stats().stats.total_fees_collected, previous);

    auto paid = manager->withdraw_fees("house");
    ASSERT_TRUE(paid.has_value());
    EXPECT_EQ(paid.value(), 1u);
    EXPECT_EQ(manager->platform_stats().stats.total_fees_collected, 0u);
    EXPECT_EQ(manager->platform_stats().stats.total_games_played, 7u);
    expect_backed();

    const auto& last = manager->events().records().back();
    ASSERT_TRUE(std::holds_alternative<FeeCollectedEvent>(last.payload));
    EXPECT_EQ(std::get<FeeCollectedEvent>(last.payload).pegged_amount, 175u);
    EXPECT_EQ(std::get<FeeCollectedEvent>(last.payload).treasury, "vault");
}

TEST_F(GameManagerTest, FeeWithdrawalPreconditions) {
    EXPECT_EQ(manager->withdraw_fees("house").error(), make_error_code(ErrorCode::NO_FEES_ACCRUED));
    EXPECT_EQ(manager->withdraw_fees("alice").error(), make_error_code(ErrorCode::NOT_OWNER));

    AdminState admin;
    admin.owner = "house";
    GameManager no_treasury("engine2", admin, native);
    EXPECT_EQ(no_treasury.withdraw_fees("house").error(), make_error_code(ErrorCode::TREASURY_NOT_SET));
}

TEST_F(GameManagerTest, FeesBelowOneNativeUnitAreClearedWithoutPayment) {
    // Two pegged units of fee do not make one native unit
    ASSERT_TRUE(manager->deposit("alice", 1).has_value());
    ASSERT_TRUE(manager->play_game("alice", GameType::HIGH_LOW, 100, false).has_value());
    ASSERT_EQ(manager->platform_stats().stats.total_fees_collected, 2u);
    Amount treasury_before = native->balance_of("vault");

    auto withdrawn = manager->withdraw_fees("house");
    ASSERT_TRUE(withdrawn.has_value());
    EXPECT_EQ(withdrawn.value(), 0u);
    EXPECT_EQ(manager->platform_stats().stats.total_fees_collected, 0u);
    EXPECT_EQ(native->balance_of("vault"), treasury_before);
    EXPECT_EQ(custody(), 100u);
    EXPECT_EQ(reserve(), 1u);

    const auto& last = manager->events().records().back();
    ASSERT_TRUE(std::holds_alternative<FeeCollectedEvent>(last.payload));
    const auto& collected = std::get<FeeCollectedEvent>(last.payload);
    EXPECT_EQ(collected.native_amount, 0u);
    EXPECT_EQ(collected.pegged_amount, 2u);
    expect_backed();

    EXPECT_EQ(manager->withdraw_fees("house").error(), make_error_code(ErrorCode::NO_FEES_ACCRUED));
}

TEST_F(GameManagerTest, FeeWithdrawalCannotUnderbackAccounts) {
    ASSERT_TRUE(manager->deposit("alice", 41).has_value());
    ASSERT_TRUE(manager->play_game("alice", GameType::COIN_FLIP, 4000, false).has_value());

    // Bob's win consumes all but 10 units of the custody surplus
    ASSERT_TRUE(manager->deposit("bob", 42).has_value());
    auto win = manager->play_game("bob", GameType::COIN_FLIP, 4200, true);
    ASSERT_TRUE(win.has_value());
    EXPECT_EQ(win.value().payout, 8190u);
    EXPECT_EQ(custody() - manager->total_account_balances(), 10u);

    Amount fees = manager->platform_stats().stats.total_fees_collected;
    EXPECT_EQ(fees, 205u);

    EXPECT_EQ(manager->withdraw_fees("house").error(), make_error_code(ErrorCode::INSUFFICIENT_CUSTODY));
    EXPECT_EQ(manager->platform_stats().stats.total_fees_collected, fees);
    EXPECT_EQ(native->balance_of("vault"), 0u);
    expect_backed();
}

TEST_F(GameManagerTest, WinWithoutCustodyCoverIsRejected) {
    ASSERT_TRUE(manager->deposit("alice", 1).has_value());
    size_t events_before = manager->events().size();

    auto result = manager->play_game("alice", GameType::HIGH_LOW, 100, true);

    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error(), make_error_code(ErrorCode::INSUFFICIENT_CUSTODY));
    EXPECT_EQ(classify(result.error()), ErrorClass::SOLVENCY);
    EXPECT_EQ(manager->balance_of("alice"), 100u);
    EXPECT_EQ(manager->platform_stats().stats.total_games_played, 0u);
    EXPECT_EQ(manager->events().size(), events_before);
}

// The outcome flag is an input: the engine settles whatever the caller claims.
// This documents the trust boundary rather than endorsing it.
TEST_F(GameManagerTest, OutcomeIsTrustedFromCaller) {
    ASSERT_TRUE(manager->fund_house("house", 10'000).has_value());
    ASSERT_TRUE(manager->deposit("alice", 10).has_value());

    Amount balance = manager->balance_of("alice");
    for (int i = 0; i < 5; ++i) {
        auto settled = manager->play_game("alice", GameType::HIGH_LOW, 1000, true);
        ASSERT_TRUE(settled.has_value());
        EXPECT_TRUE(settled.value().won);
        EXPECT_GT(manager->balance_of("alice"), balance);
        balance = manager->balance_of("alice");
    }
    EXPECT_EQ(balance, 1000u + 5u * 900u);
}

TEST_F(GameManagerTest, BannedIdentityIsRejected) {
    ASSERT_TRUE(manager->deposit("alice", 5).has_value());
    registry->ban("alice");

    auto rejected = make_error_code(ErrorCode::IDENTITY_REJECTED);
    EXPECT_EQ(manager->deposit("alice", 1).error(), rejected);
    EXPECT_EQ(manager->withdraw("alice", 100).error(), rejected);
    EXPECT_EQ(manager->play_game("alice", GameType::COIN_FLIP, 100, false).error(), rejected);
    EXPECT_EQ(manager->balance_of("alice"), 500u);

    EXPECT_EQ(manager->deposit("carol", 1).error(), rejected);  // never registered
}

TEST_F(GameManagerTest, UnlinkedRegistryIsSkipped) {
    ASSERT_TRUE(manager->link("house", minter, nullptr).has_value());
    ASSERT_TRUE(native->credit("carol", 10).has_value());

    EXPECT_TRUE(manager->deposit("carol", 2).has_value());
    EXPECT_TRUE(manager->play_game("carol", GameType::COIN_FLIP, 100, false).has_value());
    EXPECT_TRUE(manager->withdraw("carol", 100).has_value());
    EXPECT_EQ(registry->stats_of("carol").games_played, 0u);

    const auto& records = manager->events().records();
    auto linked = std::find_if(records.rbegin(), records.rend(), [](const EventRecord& r) {
        return std::holds_alternative<LinkedEvent>(r.payload);
    });
    ASSERT_NE(linked, records.rend());
    EXPECT_EQ(std::get<LinkedEvent>(linked->payload).minter, "minter");
    EXPECT_TRUE(std::get<LinkedEvent>(linked->payload).registry.empty());
}

TEST_F(GameManagerTest, MissingMinterRejectsOnlyWhatNeedsIt) {
    AdminState admin;
    admin.owner = "house";
    admin.treasury = "vault";
    GameManager unlinked("engine2", admin, native);

    EXPECT_EQ(unlinked.deposit("alice", 1).error(), make_error_code(ErrorCode::MINTER_NOT_LINKED));
    EXPECT_EQ(unlinked.withdraw("alice", 100).error(), make_error_code(ErrorCode::MINTER_NOT_LINKED));
    EXPECT_EQ(unlinked.fund_house("house", 1).error(), make_error_code(ErrorCode::MINTER_NOT_LINKED));
    EXPECT_EQ(unlinked.play_game("alice", GameType::COIN_FLIP, 100, true).error(),
              make_error_code(ErrorCode::MINTER_NOT_LINKED));
    // A loss never touches custody; it fails on the balance instead
    EXPECT_EQ(unlinked.play_game("alice", GameType::COIN_FLIP, 100, false).error(),
              make_error_code(ErrorCode::INSUFFICIENT_BALANCE));
    EXPECT_EQ(unlinked.platform_stats().custody_size, 0u);
}

TEST_F(GameManagerTest, CollaboratorFailureRollsBackEveryStep) {
    ASSERT_TRUE(manager->revoke("house", Role::MINTER, "engine").has_value());
    size_t events_before = manager->events().size();

    auto result = manager->deposit("alice", 3);

    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error(), make_error_code(ErrorCode::MISSING_CAPABILITY));
    EXPECT_EQ(native->balance_of("alice"), 1000u);
    EXPECT_EQ(reserve(), 0u);
    EXPECT_EQ(custody(), 0u);
    EXPECT_EQ(manager->balance_of("alice"), 0u);
    EXPECT_EQ(manager->events().size(), events_before);
}

TEST_F(GameManagerTest, StatRecordingFailureRollsBackDeposit) {
    // Minting still works, the final registry report does not
    ASSERT_TRUE(manager->revoke("house", Role::GAME_MANAGER, "engine").has_value());

    auto result = manager->deposit("alice", 3);

    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error(), make_error_code(ErrorCode::MISSING_CAPABILITY));
    EXPECT_EQ(native->balance_of("alice"), 1000u);
    EXPECT_EQ(custody(), 0u);
    EXPECT_EQ(minter->total_supply(), 0u);
    EXPECT_EQ(manager->balance_of("alice"), 0u);
}

TEST_F(GameManagerTest, SettlementRollbackRestoresCounters) {
    ASSERT_TRUE(manager->deposit("alice", 5).has_value());
    ASSERT_TRUE(manager->revoke("house", Role::GAME_MANAGER, "engine").has_value());

    auto result = manager->play_game("alice", GameType::COIN_FLIP, 200, false);

    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(manager->balance_of("alice"), 500u);
    auto stats = manager->platform_stats().stats;
    EXPECT_EQ(stats.total_games_played, 0u);
    EXPECT_EQ(stats.total_volume_wagered, 0u);
    EXPECT_EQ(stats.total_fees_collected, 0u);
}

TEST_F(GameManagerTest, ReentryFromNativeTransferIsRejected) {
    ASSERT_TRUE(manager->deposit("alice", 5).has_value());

    std::vector<std::error_code> nested;
    native->set_receive_hook("alice", [&](const Identity&, Amount) {
        auto again = manager->withdraw("alice", 100);
        nested.push_back(again.has_error() ? again.error() : std::error_code());
    });

    auto paid = manager->withdraw("alice", 200);

    ASSERT_TRUE(paid.has_value());
    ASSERT_EQ(nested.size(), 1u);
    EXPECT_EQ(nested.front(), make_error_code(ErrorCode::REENTRANT_CALL));
    EXPECT_EQ(manager->balance_of("alice"), 300u);
    EXPECT_EQ(native->balance_of("alice"), 997u);

    // The guard is released once the outer call returns
    native->clear_receive_hook("alice");
    EXPECT_TRUE(manager->withdraw("alice", 100).has_value());
}

TEST_F(GameManagerTest, ReentryIntoAnyEntryPointIsRejected) {
    std::vector<std::error_code> nested;
    native->set_receive_hook("engine", [&](const Identity&, Amount) {
        auto play = manager->play_game("alice", GameType::COIN_FLIP, 100, false);
        nested.push_back(play.error());
        auto config = manager->set_game_config("house", GameType::DICE, 1, 2, 3, true, "x");
        nested.push_back(config.error());
    });

    ASSERT_TRUE(manager->deposit("alice", 1).has_value());

    ASSERT_EQ(nested.size(), 2u);
    for (const auto& ec : nested) {
        EXPECT_EQ(ec, make_error_code(ErrorCode::REENTRANT_CALL));
    }
    EXPECT_EQ(manager->game_config(GameType::DICE).value().display_name, "Dice Roll");
}

TEST_F(GameManagerTest, SubscribersCannotReenter) {
    std::vector<std::error_code> nested;
    ASSERT_TRUE(manager->subscribe_events([&](const EventRecord& record) {
        if (std::holds_alternative<DepositEvent>(record.payload)) {
            auto again = manager->deposit("bob", 1);
            nested.push_back(again.has_error() ? again.error() : std::error_code());
        }
    }).has_value());

    ASSERT_TRUE(manager->deposit("alice", 1).has_value());
    ASSERT_EQ(nested.size(), 1u);
    EXPECT_EQ(nested.front(), make_error_code(ErrorCode::REENTRANT_CALL));
    EXPECT_EQ(manager->balance_of("bob"), 0u);
}

TEST_F(GameManagerTest, SubscribersCannotSubscribeDuringRequest) {
    std::vector<std::error_code> nested;
    ASSERT_TRUE(manager->subscribe_events([&](const EventRecord&) {
        for (int i = 0; i < 8; ++i) {
            auto added = manager->subscribe_events([](const EventRecord&) {});
            nested.push_back(added.has_error() ? added.error() : std::error_code());
        }
    }).has_value());

    ASSERT_TRUE(manager->deposit("alice", 1).has_value());
    ASSERT_EQ(nested.size(), 8u);
    for (const auto& ec : nested) {
        EXPECT_EQ(ec, make_error_code(ErrorCode::REENTRANT_CALL));
    }
    EXPECT_EQ(manager->balance_of("alice"), 100u);
}

TEST_F(GameManagerTest, ThrowingSubscriberLeavesRequestCommitted) {
    ASSERT_TRUE(manager->subscribe_events([](const EventRecord&) {
        throw std::runtime_error("subscriber");
    }).has_value());

    auto deposited = manager->deposit("alice", 1);
    ASSERT_TRUE(deposited.has_value());
    EXPECT_EQ(deposited.value(), 100u);
    EXPECT_EQ(manager->balance_of("alice"), 100u);
    EXPECT_TRUE(std::holds_alternative<DepositEvent>(manager->events().records().back().payload));
    EXPECT_TRUE(manager->events().verify_chain());
    expect_backed();
}

TEST(GameManagerConstructionTest, NullNativeLedgerIsRejected) {
    AdminState admin;
    admin.owner = "house";
    EXPECT_THROW(GameManager("engine", admin, nullptr), std::invalid_argument);
}

TEST_F(GameManagerTest, MalformedCallerIsRejected) {
    EXPECT_EQ(manager->deposit("bad identity", 1).error(), make_error_code(ErrorCode::INVALID_IDENTITY));
    EXPECT_EQ(manager->deposit("", 1).error(), make_error_code(ErrorCode::INVALID_IDENTITY));
    EXPECT_EQ(manager->set_treasury("house", "bad\nvault").error(), make_error_code(ErrorCode::INVALID_IDENTITY));
}

TEST_F(GameManagerTest, TreasuryAndOwnershipChangesAreRecorded) {
    ASSERT_TRUE(manager->set_treasury("house", "vault2").has_value());
    EXPECT_EQ(manager->treasury(), std::optional<Identity>("vault2"));

    const auto& treasury_record = manager->events().records().back();
    ASSERT_TRUE(std::holds_alternative<TreasuryUpdatedEvent>(treasury_record.payload));
    EXPECT_EQ(std::get<TreasuryUpdatedEvent>(treasury_record.payload).previous, std::optional<Identity>("vault"));

    EXPECT_EQ(manager->transfer_ownership("alice", "alice").error(), make_error_code(ErrorCode::NOT_OWNER));
    ASSERT_TRUE(manager->transfer_ownership("house", "successor").has_value());
    EXPECT_EQ(manager->owner(), "successor");
    EXPECT_EQ(manager->pause("house").error(), make_error_code(ErrorCode::NOT_OWNER));
    EXPECT_TRUE(manager->pause("successor").has_value());
}

TEST_F(GameManagerTest, CapabilityChangesAreVisible) {
    EXPECT_TRUE(manager->has_capability("engine", Role::MINTER));
    EXPECT_EQ(manager->authorize("alice", Role::MINTER, "alice").error(), make_error_code(ErrorCode::NOT_OWNER));
    EXPECT_FALSE(manager->has_capability("alice", Role::MINTER));

    const auto& last = manager->events().records().back();
    ASSERT_TRUE(std::holds_alternative<LinkedEvent>(last.payload));
}

TEST_F(GameManagerTest, OutcomesAreCounted) {
    auto& metrics = MetricsRegistry::instance();
    uint64_t accepted = metrics.counter_value("wager_deposit_accepted_total");
    uint64_t rejected = metrics.counter_value("wager_deposit_rejected_total");

    ASSERT_TRUE(manager->deposit("alice", 1).has_value());
    ASSERT_TRUE(manager->deposit("alice", 0).has_error());
    ASSERT_TRUE(manager->deposit("alice", 0).has_error());

    EXPECT_EQ(metrics.counter_value("wager_deposit_accepted_total"), accepted + 1);
    EXPECT_EQ(metrics.counter_value("wager_deposit_rejected_total"), rejected + 2);
}

TEST_F(GameManagerTest, LedgerStaysBackedAcrossRandomActivity) {
    ASSERT_TRUE(manager->fund_house("house", 50).has_value());

    std::mt19937 rng(20240607);
    const Identity players[] = {"alice", "bob"};
    Amount last_fees = 0;

    for (int step = 0; step < 400; ++step) {
        const Identity& player = players[rng() % 2];
        switch (rng() % 4) {
            case 0:
                (void)manager->deposit(player, 1 + rng() % 20);
                break;
            case 1:
                (void)manager->withdraw(player, RATIO * (1 + rng() % 10));
                break;
            case 2:
                (void)manager->play_game(player, ALL_GAME_TYPES[rng() % 4], 100 + rng() % 900, rng() % 2 == 0);
                break;
            default:
                if (rng() % 10 == 0) (void)manager->withdraw_fees("house");
                break;
        }

        Amount fees = manager->platform_stats().stats.total_fees_collected;
        if (fees != 0) {
            EXPECT_GE(fees, last_fees) << "step " << step;
        }
        last_fees = fees;

        EXPECT_LE(manager->total_account_balances(), custody()) << "step " << step;
        EXPECT_EQ(custody(), reserve() * RATIO) << "step " << step;
    }

    EXPECT_TRUE(manager->events().verify_chain());
}
