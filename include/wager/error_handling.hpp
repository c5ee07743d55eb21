#pragma once

#include <system_error>
#include <stdexcept>
#include <string>
#include <chrono>
#include <utility>

namespace wager {

// Unified error codes, grouped by class (see classify())
enum class ErrorCode {
    SUCCESS = 0,

    // Precondition violations
    INVALID_AMOUNT = 1000,
    UNKNOWN_GAME_TYPE,
    GAME_INACTIVE,
    BET_OUT_OF_BOUNDS,
    INSUFFICIENT_BALANCE,
    AMOUNT_NOT_CONVERTIBLE,
    MINTER_NOT_LINKED,
    TREASURY_NOT_SET,
    NO_FEES_ACCRUED,
    SYSTEM_PAUSED,
    INVALID_IDENTITY,
    INSUFFICIENT_FUNDS,

    // Authorization violations
    NOT_OWNER = 2000,
    MISSING_CAPABILITY,
    IDENTITY_REJECTED,

    // Solvency violations
    INSUFFICIENT_CUSTODY = 3000,
    INSUFFICIENT_RESERVE,

    // Arithmetic domain violations
    ARITHMETIC_OVERFLOW = 4000,
    ARITHMETIC_UNDERFLOW,

    // System errors
    REENTRANT_CALL = 5000,
    CONFIG_INVALID,
    FILE_NOT_FOUND,
    DIGEST_FAILED,
    SYSTEM_CORRUPTED_STATE
};

enum class ErrorClass {
    NONE,
    PRECONDITION,
    AUTHORIZATION,
    SOLVENCY,
    ARITHMETIC,
    SYSTEM
};

class ErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "wager"; }
    std::string message(int ev) const override;
};

const ErrorCategory& error_category();
std::error_code make_error_code(ErrorCode ec);

ErrorClass classify(ErrorCode ec);
ErrorClass classify(const std::error_code& ec);
const char* to_string(ErrorClass cls);

// Result monad for error propagation
template<typename T>
class Result {
public:
    Result(T&& value) : value_(std::move(value)), has_value_(true) {}
    Result(const T& value) : value_(value), has_value_(true) {}
    Result(ErrorCode error) : error_(make_error_code(error)), has_value_(false) {}
    Result(std::error_code error) : error_(error), has_value_(false) {}

    bool has_value() const noexcept { return has_value_; }
    bool has_error() const noexcept { return !has_value_; }

    const T& value() const& {
        if (!has_value_) throw std::runtime_error("Accessing value of error result");
        return value_;
    }

    T&& value() && {
        if (!has_value_) throw std::runtime_error("Accessing value of error result");
        return std::move(value_);
    }

    const std::error_code& error() const { return error_; }

    template<typename F>
    auto map(F&& func) const -> Result<decltype(func(std::declval<const T&>()))> {
        using Mapped = Result<decltype(func(std::declval<const T&>()))>;
        if (has_value_) {
            return Mapped(func(value_));
        }
        return Mapped(error_);
    }

    template<typename F>
    Result<T> or_else(F&& func) {
        if (has_error()) {
            return func(error_);
        }
        return *this;
    }

private:
    T value_{};
    std::error_code error_;
    bool has_value_;
};

// Specialization for void
template<>
class Result<void> {
public:
    Result() : has_value_(true) {}
    Result(ErrorCode error) : error_(make_error_code(error)), has_value_(false) {}
    Result(std::error_code error) : error_(error), has_value_(false) {}

    bool has_value() const noexcept { return has_value_; }
    bool has_error() const noexcept { return !has_value_; }
    const std::error_code& error() const { return error_; }

private:
    std::error_code error_;
    bool has_value_;
};

// Error context for detailed error information
struct ErrorContext {
    std::string component;
    std::string operation;
    std::string details;
    std::chrono::steady_clock::time_point timestamp;

    ErrorContext(std::string comp, std::string op, std::string det = "")
        : component(std::move(comp)), operation(std::move(op)),
          details(std::move(det)), timestamp(std::chrono::steady_clock::now()) {}

    std::string describe(const std::error_code& ec) const;
};

} // namespace wager

// Make ErrorCode compatible with std::error_code
namespace std {
template<>
struct is_error_code_enum<wager::ErrorCode> : true_type {};
}
