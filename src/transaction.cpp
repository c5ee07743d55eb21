#include "wager/transaction.hpp"
#include "wager/logger.hpp"

namespace wager {

FunctionAction::FunctionAction(std::string description, Step execute, Step rollback)
    : description_(std::move(description)),
      execute_(std::move(execute)),
      rollback_(std::move(rollback)) {}

Result<void> FunctionAction::execute() {
    if (!execute_) return Result<void>();
    return execute_();
}

Result<void> FunctionAction::rollback() {
    if (!rollback_) return Result<void>();
    return rollback_();
}

Transaction::Transaction(std::string name) : name_(std::move(name)) {
    if (name_.empty()) {
        name_ = "Transaction_" + std::to_string(reinterpret_cast<uintptr_t>(this));
    }
    LOG_DEBUG_SAFE("Transaction {} started", name_);
}

Transaction::~Transaction() {
    if (state_ == State::ACTIVE) {
        if (!executed_actions_.empty()) {
            LOG_WARN_SAFE("Auto-rolling back transaction {}", name_);
        }
        auto result = rollback();
        if (result.has_error()) {
            LOG_ERROR_SAFE("Auto-rollback of {} failed: {}", name_, result.error().message());
        }
    }
}

void Transaction::add_action(std::unique_ptr<TransactionAction> action) {
    if (state_ != State::ACTIVE) {
        LOG_ERROR_SAFE("Cannot add action to inactive transaction {}", name_);
        return;
    }

    LOG_DEBUG_SAFE("Added action '{}' to transaction {}", action->description(), name_);
    actions_.push_back(std::move(action));
}

void Transaction::add_step(std::string description, FunctionAction::Step execute,
                           FunctionAction::Step rollback) {
    add_action(std::make_unique<FunctionAction>(std::move(description),
                                                std::move(execute),
                                                std::move(rollback)));
}

Result<void> Transaction::commit() {
    if (state_ != State::ACTIVE) {
        return ErrorCode::SYSTEM_CORRUPTED_STATE;
    }

    LOG_DEBUG_SAFE("Committing transaction {} with {} actions", name_, actions_.size());

    for (auto& action : actions_) {
        auto result = action->execute();
        if (result.has_error()) {
            LOG_WARN_SAFE("Action '{}' failed in transaction {}: {}",
                          action->description(), name_, result.error().message());

            auto rollback_result = rollback();
            if (rollback_result.has_error()) {
                return rollback_result.error();
            }
            return result.error();
        }

        executed_actions_.push_back(std::move(action));
    }

    actions_.clear();
    state_ = State::COMMITTED;

    LOG_DEBUG_SAFE("Transaction {} committed", name_);
    return Result<void>();
}

Result<void> Transaction::rollback() {
    if (state_ == State::ROLLED_BACK) {
        return Result<void>();
    }
    if (state_ == State::COMMITTED) {
        return ErrorCode::SYSTEM_CORRUPTED_STATE;
    }

    // Reverse order
    std::error_code last_error;
    for (auto it = executed_actions_.rbegin(); it != executed_actions_.rend(); ++it) {
        auto result = (*it)->rollback();
        if (result.has_error()) {
            LOG_ERROR_SAFE("Rollback failed for action '{}': {}",
                          (*it)->description(), result.error().message());
            last_error = make_error_code(ErrorCode::SYSTEM_CORRUPTED_STATE);
        }
    }

    executed_actions_.clear();
    actions_.clear();
    state_ = State::ROLLED_BACK;

    if (last_error) {
        return last_error;
    }

    LOG_DEBUG_SAFE("Transaction {} rolled back", name_);
    return Result<void>();
}

} // namespace wager
