#pragma once
// =============================================================================
// Copybook DDL - Core Types (C++20)
// Version: 1.0.0
// =============================================================================

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <variant>
#include <memory>
#include <functional>
#include <chrono>
#include <format>
#include <filesystem>
#include <source_location>
#include <unordered_map>

namespace copyddl {

// =============================================================================
// Fundamental Types
// =============================================================================
using Byte = std::uint8_t;
using UInt8 = std::uint8_t;
using UInt16 = std::uint16_t;
using Int32 = std::int32_t;
using UInt32 = std::uint32_t;
using Int64 = std::int64_t;
using UInt64 = std::uint64_t;
using Float64 = double;
using Size = std::size_t;

// =============================================================================
// String Types
// =============================================================================
using String = std::string;
using StringView = std::string_view;

// =============================================================================
// Container Types
// =============================================================================
template<typename T> using Vector = std::vector<T>;

// =============================================================================
// Smart Pointers
// =============================================================================
template<typename T> using UniquePtr = std::unique_ptr<T>;
template<typename T> using SharedPtr = std::shared_ptr<T>;

// =============================================================================
// Optional and Variant
// =============================================================================
template<typename T> using Optional = std::optional<T>;
template<typename... Ts> using Variant = std::variant<Ts...>;
inline constexpr std::nullopt_t nullopt = std::nullopt;

// =============================================================================
// Time Types
// =============================================================================
using Clock = std::chrono::steady_clock;
using SystemClock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using SystemTimePoint = SystemClock::time_point;
using Microseconds = std::chrono::microseconds;
using Milliseconds = std::chrono::milliseconds;

// =============================================================================
// Filesystem
// =============================================================================
using Path = std::filesystem::path;

// =============================================================================
// String Utilities
// =============================================================================
[[nodiscard]] String to_upper(StringView str);
[[nodiscard]] String to_lower(StringView str);
[[nodiscard]] String trim(StringView str);
[[nodiscard]] String trim_left(StringView str);
[[nodiscard]] String trim_right(StringView str);
[[nodiscard]] std::vector<String> split(StringView str, char delimiter);
[[nodiscard]] String join(const std::vector<String>& strings, StringView delimiter);
[[nodiscard]] bool starts_with(StringView str, StringView prefix);
[[nodiscard]] bool contains(StringView str, StringView substr);
[[nodiscard]] String replace_all(StringView str, StringView from, StringView to);
[[nodiscard]] String pad_right(StringView str, Size width, char pad = ' ');

// JSON string literal, quotes included
[[nodiscard]] String json_quote(StringView str);

} // namespace copyddl
