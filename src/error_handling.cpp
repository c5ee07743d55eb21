#include "wager/error_handling.hpp"

namespace wager {

std::string ErrorCategory::message(int ev) const {
    switch (static_cast<ErrorCode>(ev)) {
        case ErrorCode::SUCCESS: return "Success";

        case ErrorCode::INVALID_AMOUNT: return "Amount must be greater than zero";
        case ErrorCode::UNKNOWN_GAME_TYPE: return "Unknown game type";
        case ErrorCode::GAME_INACTIVE: return "Game is not active";
        case ErrorCode::BET_OUT_OF_BOUNDS: return "Bet outside configured bounds";
        case ErrorCode::INSUFFICIENT_BALANCE: return "Insufficient account balance";
        case ErrorCode::AMOUNT_NOT_CONVERTIBLE: return "Amount is not a multiple of the conversion ratio";
        case ErrorCode::MINTER_NOT_LINKED: return "Pegged asset minter not linked";
        case ErrorCode::TREASURY_NOT_SET: return "Treasury not configured";
        case ErrorCode::NO_FEES_ACCRUED: return "No fees to withdraw";
        case ErrorCode::SYSTEM_PAUSED: return "System is paused";
        case ErrorCode::INVALID_IDENTITY: return "Malformed identity";
        case ErrorCode::INSUFFICIENT_FUNDS: return "Insufficient native funds";

        case ErrorCode::NOT_OWNER: return "Caller is not the owner";
        case ErrorCode::MISSING_CAPABILITY: return "Caller lacks required capability";
        case ErrorCode::IDENTITY_REJECTED: return "Identity rejected by registry";

        case ErrorCode::INSUFFICIENT_CUSTODY: return "Custody pool cannot cover payout";
        case ErrorCode::INSUFFICIENT_RESERVE: return "Native reserve insufficient";

        case ErrorCode::ARITHMETIC_OVERFLOW: return "Arithmetic overflow";
        case ErrorCode::ARITHMETIC_UNDERFLOW: return "Arithmetic underflow";

        case ErrorCode::REENTRANT_CALL: return "Reentrant call rejected";
        case ErrorCode::CONFIG_INVALID: return "Invalid configuration";
        case ErrorCode::FILE_NOT_FOUND: return "File not found";
        case ErrorCode::DIGEST_FAILED: return "Digest computation failed";
        case ErrorCode::SYSTEM_CORRUPTED_STATE: return "System corrupted state";

        default: return "Unknown error";
    }
}

const ErrorCategory& error_category() {
    static ErrorCategory instance;
    return instance;
}

std::error_code make_error_code(ErrorCode ec) {
    return {static_cast<int>(ec), error_category()};
}

ErrorClass classify(ErrorCode ec) {
    int value = static_cast<int>(ec);
    if (value == 0) return ErrorClass::NONE;
    if (value < 2000) return ErrorClass::PRECONDITION;
    if (value < 3000) return ErrorClass::AUTHORIZATION;
    if (value < 4000) return ErrorClass::SOLVENCY;
    if (value < 5000) return ErrorClass::ARITHMETIC;
    return ErrorClass::SYSTEM;
}

ErrorClass classify(const std::error_code& ec) {
    if (!ec) return ErrorClass::NONE;
    if (ec.category() != error_category()) return ErrorClass::SYSTEM;
    return classify(static_cast<ErrorCode>(ec.value()));
}

const char* to_string(ErrorClass cls) {
    switch (cls) {
        case ErrorClass::NONE: return "none";
        case ErrorClass::PRECONDITION: return "precondition";
        case ErrorClass::AUTHORIZATION: return "authorization";
        case ErrorClass::SOLVENCY: return "solvency";
        case ErrorClass::ARITHMETIC: return "arithmetic";
        case ErrorClass::SYSTEM: return "system";
    }
    return "unknown";
}

std::string ErrorContext::describe(const std::error_code& ec) const {
    std::string out = component + "::" + operation + " failed (" +
                      to_string(classify(ec)) + "): " + ec.message();
    if (!details.empty()) {
        out += " [" + details + "]";
    }
    return out;
}

} // namespace wager
