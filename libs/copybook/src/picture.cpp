// =============================================================================
// Copybook DDL - Picture Clause Interpreter
// Version: 1.0.0
// =============================================================================

#include <copyddl/copybook/copybook.hpp>
#include <array>
#include <charconv>
#include <limits>

namespace copyddl {
namespace copybook {

namespace {

struct DigitGroup {
    Optional<UInt32> digits;  // nullopt when the count overflows
    Size end = 0;             // One past the group
};

Optional<UInt32> parse_count(StringView digits) {
    UInt32 value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) return nullopt;
    return value;
}

// "(n)" at `pos`; returns the digits and the position after ')'
Optional<std::pair<StringView, Size>> repeat_count_at(StringView pic, Size pos) {
    if (pos >= pic.size() || pic[pos] != '(') return nullopt;
    Size end = pos + 1;
    while (end < pic.size() && pic[end] >= '0' && pic[end] <= '9') ++end;
    if (end == pos + 1 || end >= pic.size() || pic[end] != ')') return nullopt;
    return std::pair{pic.substr(pos + 1, end - pos - 1), end + 1};
}

// Digits of the first "<symbol>(n)" in `pic`, symbol taken from `symbols`
Optional<StringView> find_repeat(StringView pic, StringView symbols) {
    for (Size i = 0; i + 1 < pic.size(); ++i) {
        if (symbols.find(pic[i]) == StringView::npos) continue;
        if (auto count = repeat_count_at(pic, i + 1)) return count->first;
    }
    return nullopt;
}

// "9(n)" at `pos`
Optional<DigitGroup> repeat_group_at(StringView pic, Size pos) {
    if (pos >= pic.size() || pic[pos] != '9') return nullopt;
    auto count = repeat_count_at(pic, pos + 1);
    if (!count) return nullopt;
    return DigitGroup{parse_count(count->first), count->second};
}

// Run of literal 9s at `pos`
Optional<DigitGroup> run_group_at(StringView pic, Size pos) {
    Size end = pos;
    while (end < pic.size() && pic[end] == '9') ++end;
    if (end == pos) return nullopt;
    Optional<UInt32> digits;
    if (end - pos <= std::numeric_limits<UInt32>::max()) {
        digits = static_cast<UInt32>(end - pos);
    }
    return DigitGroup{digits, end};
}

// One side of the implied decimal point; "9(n)" wins over a run of 9s
Optional<DigitGroup> digit_group_at(StringView pic, Size pos) {
    if (auto group = repeat_group_at(pic, pos)) return group;
    return run_group_at(pic, pos);
}

const std::array<PictureMatcher, 3> PICTURE_MATCHERS = {
    &match_decimal,
    &match_integer,
    &match_character
};

} // anonymous namespace

// =============================================================================
// SqlType Implementation
// =============================================================================

String SqlType::to_string() const {
    switch (category) {
        case SqlCategory::DECIMAL:
            return std::format("DECIMAL({},{})", length, scale);
        case SqlCategory::INTEGER:
            return "INTEGER";
        case SqlCategory::BIGINT:
            return "BIGINT";
        case SqlCategory::CHARACTER:
        case SqlCategory::FALLBACK:
            return std::format("VARCHAR({})", length);
    }
    return std::format("VARCHAR({})", FALLBACK_VARCHAR_LENGTH);
}

SqlType SqlType::decimal(UInt32 integer_digits, UInt32 scale_digits) {
    return SqlType{SqlCategory::DECIMAL, integer_digits + scale_digits, scale_digits};
}

SqlType SqlType::integer(UInt32 digits) {
    return SqlType{digits > MAX_INTEGER_DIGITS ? SqlCategory::BIGINT : SqlCategory::INTEGER,
                   digits, 0};
}

SqlType SqlType::character(UInt32 length) {
    return SqlType{SqlCategory::CHARACTER, length, 0};
}

SqlType SqlType::fallback() {
    return SqlType{SqlCategory::FALLBACK, FALLBACK_VARCHAR_LENGTH, 0};
}

// =============================================================================
// Matchers
// =============================================================================

Optional<SqlType> match_decimal(StringView normalized_pic) {
    const StringView pic = normalized_pic;
    Size i = 0;
    while (i < pic.size()) {
        if (pic[i] != '9') {
            ++i;
            continue;
        }

        auto left = repeat_group_at(pic, i);
        const bool left_is_run = !left;
        if (!left) left = run_group_at(pic, i);

        Size point = left->end;
        if (point < pic.size() && pic[point] == 'V') {
            if (auto right = digit_group_at(pic, point + 1)) {
                if (!left->digits || !right->digits) return nullopt;
                if (*left->digits > std::numeric_limits<UInt32>::max() - *right->digits) {
                    return nullopt;
                }
                return SqlType::decimal(*left->digits, *right->digits);
            }
        }

        // Any later start inside the same run of 9s stops at the same place
        i = left_is_run ? left->end : i + 1;
    }
    return nullopt;
}

Optional<SqlType> match_integer(StringView normalized_pic) {
    auto digits = find_repeat(normalized_pic, "9");
    if (!digits) return nullopt;
    auto count = parse_count(*digits);
    if (!count) return nullopt;
    return SqlType::integer(*count);
}

Optional<SqlType> match_character(StringView normalized_pic) {
    auto digits = find_repeat(normalized_pic, "XA");
    if (!digits) return nullopt;
    auto count = parse_count(*digits);
    if (!count) return nullopt;
    return SqlType::character(*count);
}

bool has_usage_suffix(StringView normalized_pic) {
    return contains(normalized_pic, "COMP") ||
           contains(normalized_pic, "BINARY") ||
           contains(normalized_pic, "PACKED-DECIMAL");
}

SqlType interpret_picture(StringView pic) {
    String normalized = to_upper(trim(pic));
    if (normalized.empty() || has_usage_suffix(normalized)) {
        return SqlType::fallback();
    }

    for (PictureMatcher matcher : PICTURE_MATCHERS) {
        if (auto type = matcher(normalized)) {
            return *type;
        }
    }
    return SqlType::fallback();
}

} // namespace copybook
} // namespace copyddl
