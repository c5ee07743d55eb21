#pragma once

#include "wager/error_handling.hpp"
#include <functional>
#include <vector>
#include <memory>
#include <string>

namespace wager {

// One reversible step of a ledger request
class TransactionAction {
public:
    virtual ~TransactionAction() = default;
    virtual Result<void> execute() = 0;
    virtual Result<void> rollback() = 0;
    virtual std::string description() const = 0;
};

// Action built from a pair of callables. The rollback must undo exactly what
// a successful execute did.
class FunctionAction : public TransactionAction {
public:
    using Step = std::function<Result<void>()>;

    FunctionAction(std::string description, Step execute, Step rollback);

    Result<void> execute() override;
    Result<void> rollback() override;
    std::string description() const override { return description_; }

private:
    std::string description_;
    Step execute_;
    Step rollback_;
};

// RAII transaction: executes actions in order, and on the first failure undoes
// the executed ones in reverse. Destroyed while still active = rolled back.
class Transaction {
public:
    explicit Transaction(std::string name = "");
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void add_action(std::unique_ptr<TransactionAction> action);
    void add_step(std::string description, FunctionAction::Step execute,
                  FunctionAction::Step rollback);

    // Execute all actions
    Result<void> commit();

    // Rollback all executed actions
    Result<void> rollback();

    bool is_active() const { return state_ == State::ACTIVE; }
    bool is_committed() const { return state_ == State::COMMITTED; }
    bool is_rolled_back() const { return state_ == State::ROLLED_BACK; }

    const std::string& name() const { return name_; }
    size_t pending_actions() const { return actions_.size(); }

private:
    enum class State { ACTIVE, COMMITTED, ROLLED_BACK };

    std::string name_;
    std::vector<std::unique_ptr<TransactionAction>> actions_;
    std::vector<std::unique_ptr<TransactionAction>> executed_actions_;
    State state_ = State::ACTIVE;
};

} // namespace wager
