/**
 * @file event_log.cpp
 * @brief Append-only ledger event records with SHA-256 chaining
 *
 * digest[n] = SHA256(digest[n-1] | n | serialize(payload[n])), with an empty
 * string standing in for digest[-1]. Any edit to a published record breaks
 * verify_chain() from that record on.
 */

#include "wager/event_log.hpp"
#include "wager/logger.hpp"
#include <exception>
#include <iomanip>
#include <memory>
#include <sstream>
#include <openssl/evp.h>

namespace wager {

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

const std::string GENESIS_DIGEST;

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

} // namespace

const char* event_name(const EventPayload& payload) {
    return std::visit(overloaded{
        [](const DepositEvent&) { return "deposit"; },
        [](const WithdrawalEvent&) { return "withdrawal"; },
        [](const SettlementEvent&) { return "settlement"; },
        [](const FeeCollectedEvent&) { return "fee_collected"; },
        [](const ConfigUpdatedEvent&) { return "config_updated"; },
        [](const TreasuryUpdatedEvent&) { return "treasury_updated"; },
        [](const LinkedEvent&) { return "linked"; },
        [](const HouseFundedEvent&) { return "house_funded"; },
        [](const PausedChangedEvent&) { return "paused_changed"; },
        [](const CapabilityChangedEvent&) { return "capability_changed"; },
        [](const OwnershipTransferredEvent&) { return "ownership_transferred"; },
    }, payload);
}

std::string serialize(const EventPayload& payload) {
    std::ostringstream ss;
    ss << event_name(payload);

    std::visit(overloaded{
        [&ss](const DepositEvent& e) {
            ss << " identity=" << e.identity << " native=" << e.native_amount
               << " pegged=" << e.pegged_amount;
        },
        [&ss](const WithdrawalEvent& e) {
            ss << " identity=" << e.identity << " pegged=" << e.pegged_amount
               << " native=" << e.native_amount;
        },
        [&ss](const SettlementEvent& e) {
            ss << " identity=" << e.identity << " game=" << to_string(e.game_type)
               << " bet=" << e.bet_amount << " won=" << (e.won ? "true" : "false")
               << " payout=" << e.payout << " fee=" << e.fee;
        },
        [&ss](const FeeCollectedEvent& e) {
            ss << " native=" << e.native_amount << " pegged=" << e.pegged_amount
               << " treasury=" << e.treasury;
        },
        [&ss](const ConfigUpdatedEvent& e) {
            ss << " game=" << to_string(e.game_type) << " min_bet=" << e.config.min_bet
               << " max_bet=" << e.config.max_bet
               << " multiplier_bps=" << e.config.payout_multiplier
               << " active=" << (e.config.is_active ? "true" : "false")
               << " name=\"" << e.config.display_name << "\"";
        },
        [&ss](const TreasuryUpdatedEvent& e) {
            ss << " previous=" << e.previous.value_or("-") << " current=" << e.current;
        },
        [&ss](const LinkedEvent& e) {
            ss << " minter=" << (e.minter.empty() ? "-" : e.minter)
               << " registry=" << (e.registry.empty() ? "-" : e.registry);
        },
        [&ss](const HouseFundedEvent& e) {
            ss << " funder=" << e.funder << " native=" << e.native_amount
               << " pegged=" << e.pegged_amount;
        },
        [&ss](const PausedChangedEvent& e) {
            ss << " paused=" << (e.paused ? "true" : "false");
        },
        [&ss](const CapabilityChangedEvent& e) {
            ss << " role=" << to_string(e.role) << " identity=" << e.identity
               << " granted=" << (e.granted ? "true" : "false");
        },
        [&ss](const OwnershipTransferredEvent& e) {
            ss << " previous=" << e.previous << " current=" << e.current;
        },
    }, payload);

    return ss.str();
}

Result<std::string> EventLog::compute_digest(const std::string& previous_digest,
                                             SequenceNumber sequence,
                                             const std::string& body) {
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) return ErrorCode::DIGEST_FAILED;

    std::string sequence_text = std::to_string(sequence);

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), previous_digest.data(), previous_digest.size()) != 1 ||
        EVP_DigestUpdate(ctx.get(), "|", 1) != 1 ||
        EVP_DigestUpdate(ctx.get(), sequence_text.data(), sequence_text.size()) != 1 ||
        EVP_DigestUpdate(ctx.get(), "|", 1) != 1 ||
        EVP_DigestUpdate(ctx.get(), body.data(), body.size()) != 1) {
        return ErrorCode::DIGEST_FAILED;
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        return ErrorCode::DIGEST_FAILED;
    }

    std::ostringstream ss;
    for (unsigned int i = 0; i < hash_len; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

const std::string& EventLog::head_digest() const {
    return records_.empty() ? GENESIS_DIGEST : records_.back().digest;
}

Result<EventRecord> EventLog::prepare(EventPayload payload) const {
    SequenceNumber sequence = records_.size();
    auto digest = compute_digest(head_digest(), sequence, serialize(payload));
    if (digest.has_error()) {
        LOG_ERROR_SAFE("Digest failed for {} record", event_name(payload));
        return digest.error();
    }

    EventRecord record;
    record.sequence = sequence;
    record.payload = std::move(payload);
    record.digest = std::move(digest).value();
    return record;
}

Result<void> EventLog::publish(EventRecord record) {
    if (record.sequence != records_.size()) {
        return ErrorCode::SYSTEM_CORRUPTED_STATE;
    }

    records_.push_back(record);
    LOG_DEBUG_SAFE("Event #{} {}", record.sequence, serialize(record.payload));

    // The record is already part of the chain; a subscriber cannot undo it
    const auto subscribers = subscribers_;
    for (const auto& subscriber : subscribers) {
        try {
            subscriber(record);
        } catch (const std::exception& e) {
            LOG_ERROR_SAFE("Subscriber failed on event #{} {}: {}", record.sequence, event_name(record.payload), e.what());
        }
    }
    return Result<void>();
}

Result<SequenceNumber> EventLog::append(EventPayload payload) {
    auto record = prepare(std::move(payload));
    if (record.has_error()) return record.error();

    SequenceNumber sequence = record.value().sequence;
    auto published = publish(std::move(record).value());
    if (published.has_error()) return published.error();
    return sequence;
}

void EventLog::subscribe(Subscriber subscriber) {
    subscribers_.push_back(std::move(subscriber));
}

bool EventLog::verify_chain() const {
    std::string previous = GENESIS_DIGEST;
    for (size_t i = 0; i < records_.size(); ++i) {
        const auto& record = records_[i];
        if (record.sequence != i) return false;

        auto digest = compute_digest(previous, record.sequence, serialize(record.payload));
        if (digest.has_error() || digest.value() != record.digest) {
            return false;
        }
        previous = record.digest;
    }
    return true;
}

} // namespace wager
