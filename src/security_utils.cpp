/**
 * @file security_utils.cpp
 * @brief Input validation helpers shared by the ledger, config and logger
 *
 * Provides:
 * - Log injection prevention (CWE-117)
 * - Path traversal protection for configuration files (CWE-22/23/24)
 * - Identity format validation
 */

#include "wager/security_utils.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>

namespace wager {

// Control characters to filter (security: prevent injection)
const std::unordered_set<char> SecurityUtils::CONTROL_CHARS = {
    '\x00', '\x01', '\x02', '\x03', '\x04', '\x05', '\x06', '\x07',
    '\x08', '\x0B', '\x0C', '\x0E', '\x0F', '\x10', '\x11', '\x12',
    '\x13', '\x14', '\x15', '\x16', '\x17', '\x18', '\x19', '\x1A',
    '\x1B', '\x1C', '\x1D', '\x1E', '\x1F', '\x7F'
};

/**
 * @brief Sanitize input for logging (prevent log injection)
 * @param input Raw input string
 * @return Sanitized string safe for logging
 *
 * Removes control characters and escapes newlines, carriage returns,
 * tabs, backslashes and quotes so a caller-chosen identity cannot forge
 * log lines.
 */
std::string SecurityUtils::sanitize_log_input(std::string_view input) {
    std::string sanitized;
    sanitized.reserve(input.size() * 2);

    for (char c : input) {
        switch (c) {
            case '\n': sanitized += "\\n"; continue;
            case '\r': sanitized += "\\r"; continue;
            case '\t': sanitized += "\\t"; continue;
            case '\\': sanitized += "\\\\"; continue;
            case '"':  sanitized += "\\\""; continue;
            default: break;
        }
        if (CONTROL_CHARS.contains(c)) {
            continue;
        }
        sanitized += c;
    }

    return sanitized;
}

/**
 * @brief Validate file path (prevent path traversal)
 * @param path File path to validate
 * @param base_dir Base directory (must be within this)
 * @return true if path resolves inside base_dir
 */
bool SecurityUtils::validate_file_path(std::string_view path, std::string_view base_dir) {
    try {
        auto canonical_file = std::filesystem::weakly_canonical(std::filesystem::path(path));
        auto canonical_base = std::filesystem::weakly_canonical(std::filesystem::path(base_dir));

        auto relative = canonical_file.lexically_relative(canonical_base);
        if (relative.empty() || relative.string().starts_with("..")) {
            return false;  // Path escapes base directory
        }
        return true;
    } catch (const std::filesystem::filesystem_error&) {
        return false;  // Fail-safe: deny on error
    }
}

std::string SecurityUtils::normalize_path(std::string_view path) {
    try {
        return std::filesystem::weakly_canonical(path).string();
    } catch (const std::filesystem::filesystem_error&) {
        return "";
    }
}

// Identities are opaque account names: 1..64 chars of [A-Za-z0-9_.:-]
bool SecurityUtils::is_valid_identity(std::string_view identity) {
    if (identity.empty() || identity.size() > 64) return false;

    return std::all_of(identity.begin(), identity.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) ||
               c == '_' || c == '-' || c == '.' || c == ':';
    });
}

bool SecurityUtils::is_safe_string(std::string_view input) {
    return std::none_of(input.begin(), input.end(),
                       [](char c) { return CONTROL_CHARS.contains(c); });
}

} // namespace wager
