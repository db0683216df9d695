// =============================================================================
// Copybook DDL - Error Handling Implementation
// Version: 1.0.0
// =============================================================================

#include "copyddl/common/error.hpp"

namespace copyddl {

const char* CopyddlErrorCategory::name() const noexcept { return "copyddl"; }

String CopyddlErrorCategory::message(int code) const {
    switch (static_cast<ErrorCode>(code)) {
        case ErrorCode::SUCCESS: return "Success";
        case ErrorCode::UNKNOWN_ERROR: return "Unknown error";
        case ErrorCode::INVALID_ARGUMENT: return "Invalid argument";
        case ErrorCode::FILE_NOT_FOUND: return "File not found";
        case ErrorCode::READ_ERROR: return "Read error";
        case ErrorCode::CONFIG_INVALID_VALUE: return "Invalid configuration value";
        case ErrorCode::DDL_INVALID_IDENTIFIER: return "Invalid DDL identifier";
    }
    return "Unknown copyddl error";
}

const std::error_category& copyddl_error_category() noexcept {
    static CopyddlErrorCategory instance;
    return instance;
}

String ErrorInfo::to_string() const {
    return std::format("[{}] {}: {}", static_cast<int>(code),
        copyddl_error_category().message(static_cast<int>(code)), message);
}

StringView error_category_name(ErrorCode code) {
    int c = static_cast<int>(code);
    if (c == 0) return "Success";
    if (c >= 1000 && c < 1100) return "General";
    if (c >= 1100 && c < 1200) return "I/O";
    if (c >= 2000 && c < 2100) return "Config";
    if (c >= 4000 && c < 4100) return "DDL";
    return "Unknown";
}

String format_error_code(ErrorCode code) {
    return std::format("CPYD{:04d}", static_cast<int>(code));
}

} // namespace copyddl
