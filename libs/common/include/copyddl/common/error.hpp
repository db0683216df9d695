#pragma once
// =============================================================================
// Copybook DDL - Error Handling (C++20)
// Version: 1.0.0
// =============================================================================
// The parsing core never fails. Errors come from the edges: reading files,
// configuration values and command-line arguments.
// =============================================================================

#include "copyddl/common/types.hpp"
#include <system_error>

namespace copyddl {

// =============================================================================
// Error Codes
// =============================================================================
enum class ErrorCode : Int32 {
    SUCCESS = 0,

    // General (1000-1099)
    UNKNOWN_ERROR = 1000,
    INVALID_ARGUMENT = 1001,

    // I/O (1100-1199)
    FILE_NOT_FOUND = 1101,
    READ_ERROR = 1105,

    // Configuration (2000-2099)
    CONFIG_INVALID_VALUE = 2001,

    // DDL (4000-4099)
    DDL_INVALID_IDENTIFIER = 4001
};

// =============================================================================
// Error Category
// =============================================================================
class CopyddlErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override;
    [[nodiscard]] String message(int code) const override;
};

[[nodiscard]] const std::error_category& copyddl_error_category() noexcept;

// =============================================================================
// ErrorInfo
// =============================================================================
struct ErrorInfo {
    ErrorCode code = ErrorCode::SUCCESS;
    String message;

    ErrorInfo() = default;
    ErrorInfo(ErrorCode c, String msg) : code(c), message(std::move(msg)) {}

    // "[1101] File not found: <message>"
    [[nodiscard]] String to_string() const;
};

// =============================================================================
// Result<T>
// =============================================================================
template<typename T>
class Result {
private:
    Variant<T, ErrorInfo> data_;

public:
    Result(T value) : data_(std::move(value)) {}
    Result(ErrorInfo error) : data_(std::move(error)) {}

    [[nodiscard]] bool is_success() const { return std::holds_alternative<T>(data_); }
    [[nodiscard]] bool is_error() const { return std::holds_alternative<ErrorInfo>(data_); }

    [[nodiscard]] T& value() & { return std::get<T>(data_); }
    [[nodiscard]] const T& value() const& { return std::get<T>(data_); }
    [[nodiscard]] T&& value() && { return std::get<T>(std::move(data_)); }

    [[nodiscard]] const ErrorInfo& error() const { return std::get<ErrorInfo>(data_); }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }
};

template<>
class Result<void> {
private:
    Optional<ErrorInfo> error_;

public:
    Result() = default;
    Result(ErrorInfo err) : error_(std::move(err)) {}

    [[nodiscard]] bool is_success() const { return !error_.has_value(); }
    [[nodiscard]] bool is_error() const { return error_.has_value(); }
    [[nodiscard]] const ErrorInfo& error() const { return *error_; }
};

template<typename T>
[[nodiscard]] Result<T> make_error(ErrorCode code, String message) {
    return Result<T>(ErrorInfo(code, std::move(message)));
}

template<typename T>
[[nodiscard]] Result<T> make_error(const ErrorInfo& info) {
    return Result<T>(info);
}

// =============================================================================
// Helpers
// =============================================================================

// "General", "I/O", "Config", "DDL"
[[nodiscard]] StringView error_category_name(ErrorCode code);

// "CPYD1101"
[[nodiscard]] String format_error_code(ErrorCode code);

} // namespace copyddl
