#pragma once

#include <format>
#include <string>
#include <string_view>
#include <unordered_set>

namespace wager {

class SecurityUtils {
public:
    // Log input sanitization (CWE-117)
    static std::string sanitize_log_input(std::string_view input);

    // Path traversal prevention (CWE-22/23/24)
    static bool validate_file_path(std::string_view path, std::string_view base_dir);
    static std::string normalize_path(std::string_view path);

    // Type-safe formatting (CWE-134)
    template<typename... Args>
    static std::string safe_format(std::string_view format_str, Args&&... args) {
        try {
            return std::vformat(format_str, std::make_format_args(args...));
        } catch (const std::format_error& e) {
            return std::string("[FORMAT_ERROR: ") + e.what() + "]";
        }
    }

    // Input validation
    static bool is_valid_identity(std::string_view identity);
    static bool is_safe_string(std::string_view input);

private:
    static const std::unordered_set<char> CONTROL_CHARS;
};

} // namespace wager
