#pragma once

#include "wager/error_handling.hpp"
#include "wager/types.hpp"
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace wager {

struct DepositEvent {
    Identity identity;
    Amount native_amount;
    Amount pegged_amount;
};

struct WithdrawalEvent {
    Identity identity;
    Amount pegged_amount;
    Amount native_amount;
};

struct SettlementEvent {
    Identity identity;
    GameType game_type;
    Amount bet_amount;
    bool won;
    Amount payout;
    Amount fee;
};

struct FeeCollectedEvent {
    Amount native_amount;
    Amount pegged_amount;
    Identity treasury;
};

struct ConfigUpdatedEvent {
    GameType game_type;
    GameConfig config;
};

struct TreasuryUpdatedEvent {
    std::optional<Identity> previous;
    Identity current;
};

struct LinkedEvent {
    Identity minter;
    Identity registry;
};

struct HouseFundedEvent {
    Identity funder;
    Amount native_amount;
    Amount pegged_amount;
};

struct PausedChangedEvent {
    bool paused;
};

struct CapabilityChangedEvent {
    Role role;
    Identity identity;
    bool granted;
};

struct OwnershipTransferredEvent {
    Identity previous;
    Identity current;
};

using EventPayload = std::variant<
    DepositEvent, WithdrawalEvent, SettlementEvent, FeeCollectedEvent,
    ConfigUpdatedEvent, TreasuryUpdatedEvent, LinkedEvent, HouseFundedEvent,
    PausedChangedEvent, CapabilityChangedEvent, OwnershipTransferredEvent>;

const char* event_name(const EventPayload& payload);

// Canonical single-line encoding, the input of the record digest
std::string serialize(const EventPayload& payload);

struct EventRecord {
    SequenceNumber sequence{0};
    EventPayload payload;
    std::string digest;  // hex SHA-256 over previous digest, sequence and payload
};

// Append-only, hash-chained event record. Records are immutable once published.
class EventLog {
public:
    using Subscriber = std::function<void(const EventRecord&)>;

    // Build the next record without publishing it. Fails only if hashing fails.
    Result<EventRecord> prepare(EventPayload payload) const;

    // Append a record produced by prepare() against the current head, then
    // notify the subscribers registered at that point. A throwing subscriber
    // is logged and does not fail the publish.
    Result<void> publish(EventRecord record);

    // prepare() + publish()
    Result<SequenceNumber> append(EventPayload payload);

    void subscribe(Subscriber subscriber);

    const std::vector<EventRecord>& records() const { return records_; }
    size_t size() const { return records_.size(); }
    const std::string& head_digest() const;

    // Recompute every digest from the genesis value
    bool verify_chain() const;

    static Result<std::string> compute_digest(const std::string& previous_digest,
                                              SequenceNumber sequence,
                                              const std::string& body);

private:
    std::vector<EventRecord> records_;
    std::vector<Subscriber> subscribers_;
};

} // namespace wager
