// =============================================================================
// Copybook DDL - Copybook Parser Module
// Version: 1.0.0
// =============================================================================
// Parses COBOL copybooks into a flat list of typed terminal fields.
// Supports level-number nesting and the common PIC clause forms
// 9(n), 9(p)V9(s), X(n) and A(n). Other clauses map to VARCHAR(255).
// =============================================================================

#ifndef COPYDDL_COPYBOOK_HPP
#define COPYDDL_COPYBOOK_HPP

#include <copyddl/common/types.hpp>
#include <copyddl/common/error.hpp>
#include <copyddl/common/logging.hpp>
#include <istream>
#include <vector>

namespace copyddl {
namespace copybook {

// =============================================================================
// SQL Types
// =============================================================================

enum class SqlCategory : UInt8 {
    DECIMAL,    // PIC 9(p)V9(s)
    INTEGER,    // PIC 9(n), n <= 9
    BIGINT,     // PIC 9(n), n > 9
    CHARACTER,  // PIC X(n) or A(n)
    FALLBACK    // Anything else
};

[[nodiscard]] constexpr StringView to_string(SqlCategory category) {
    switch (category) {
        case SqlCategory::DECIMAL:   return "DECIMAL";
        case SqlCategory::INTEGER:   return "INTEGER";
        case SqlCategory::BIGINT:    return "BIGINT";
        case SqlCategory::CHARACTER: return "CHARACTER";
        case SqlCategory::FALLBACK:  return "FALLBACK";
    }
    return "UNKNOWN";
}

// Widest digit count that still fits a 32-bit INTEGER column
inline constexpr UInt32 MAX_INTEGER_DIGITS = 9;
inline constexpr UInt32 FALLBACK_VARCHAR_LENGTH = 255;

struct SqlType {
    SqlCategory category = SqlCategory::FALLBACK;
    UInt32 length = FALLBACK_VARCHAR_LENGTH;  // Total digits or characters
    UInt32 scale = 0;                         // Digits after the implied point

    [[nodiscard]] bool is_fallback() const { return category == SqlCategory::FALLBACK; }
    [[nodiscard]] String to_string() const;

    static SqlType decimal(UInt32 integer_digits, UInt32 scale_digits);
    static SqlType integer(UInt32 digits);
    static SqlType character(UInt32 length);
    static SqlType fallback();

    bool operator==(const SqlType&) const = default;
};

// =============================================================================
// Picture Clause Interpreter
// =============================================================================

// A matcher inspects an upper-cased PIC clause and either recognizes it or
// returns nullopt so the next matcher can try.
using PictureMatcher = Optional<SqlType> (*)(StringView normalized_pic);

[[nodiscard]] Optional<SqlType> match_decimal(StringView normalized_pic);
[[nodiscard]] Optional<SqlType> match_integer(StringView normalized_pic);
[[nodiscard]] Optional<SqlType> match_character(StringView normalized_pic);

// True for clauses with a storage usage glued on (S9(4)COMP, 9(5)COMP-3, ...)
[[nodiscard]] bool has_usage_suffix(StringView normalized_pic);

// Tries decimal, integer, character in that order; never fails
[[nodiscard]] SqlType interpret_picture(StringView pic);

// =============================================================================
// Line Classifier
// =============================================================================

enum class SkipReason : UInt8 {
    BLANK,
    COMMENT,
    UNRECOGNIZED
};

[[nodiscard]] constexpr StringView to_string(SkipReason reason) {
    switch (reason) {
        case SkipReason::BLANK:        return "BLANK";
        case SkipReason::COMMENT:      return "COMMENT";
        case SkipReason::UNRECOGNIZED: return "UNRECOGNIZED";
    }
    return "UNKNOWN";
}

struct SkipLine {
    SkipReason reason = SkipReason::BLANK;
};

struct GroupDeclaration {
    UInt8 level = 0;
    String name;
};

struct FieldDeclaration {
    UInt8 level = 0;
    String name;
    String pic;
};

using LineClass = Variant<SkipLine, GroupDeclaration, FieldDeclaration>;

[[nodiscard]] LineClass classify_line(StringView line);

// =============================================================================
// Field Definition
// =============================================================================

struct Field {
    UInt8 level = 0;              // 01-49
    String name;                  // Source spelling, hyphens kept
    Optional<String> pic;         // Original PIC text
    String sql_type;              // e.g. DECIMAL(7,2)
    Optional<UInt32> length;
    Optional<String> parent;      // Nearest enclosing group
    SqlCategory category = SqlCategory::FALLBACK;

    [[nodiscard]] bool is_fallback() const { return category == SqlCategory::FALLBACK; }
    [[nodiscard]] String to_string() const;
    [[nodiscard]] String to_json() const;
};

// =============================================================================
// Hierarchy Resolver
// =============================================================================

// Stack of open group declarations. Levels strictly increase from bottom to top.
class HierarchyResolver {
private:
    struct GroupEntry {
        UInt8 level = 0;
        String name;
    };

    std::vector<GroupEntry> stack_;

    void close_groups(UInt8 level);

public:
    HierarchyResolver() = default;

    void open_group(UInt8 level, StringView name);

    // Closes groups at `level` or deeper and returns the enclosing group, if any
    [[nodiscard]] Optional<String> resolve_parent(UInt8 level);

    [[nodiscard]] Optional<String> current_group() const;
    [[nodiscard]] Size depth() const { return stack_.size(); }
    [[nodiscard]] bool empty() const { return stack_.empty(); }
    void reset() { stack_.clear(); }
};

// =============================================================================
// Copybook Layout
// =============================================================================

struct ParseStatistics {
    Size lines_read = 0;
    Size blank_lines = 0;
    Size comment_lines = 0;
    Size unrecognized_lines = 0;
    Size group_declarations = 0;
    Size field_declarations = 0;
    Size fallback_types = 0;

    [[nodiscard]] Size skipped_lines() const {
        return blank_lines + comment_lines + unrecognized_lines;
    }
    [[nodiscard]] String to_string() const;
};

struct CopybookLayout {
    std::vector<Field> fields;
    ParseStatistics statistics;
    String source_file;

    [[nodiscard]] bool empty() const { return fields.empty(); }
    [[nodiscard]] const Field* find_field(StringView name) const;
    [[nodiscard]] String to_string() const;
};

// =============================================================================
// Copybook Parser
// =============================================================================

class CopybookParser {
private:
    std::vector<Field> fields_;
    ParseStatistics stats_;
    HierarchyResolver resolver_;
    SharedPtr<logging::Logger> logger_;

    void process_line(StringView line);
    void add_field(FieldDeclaration declaration);

public:
    CopybookParser();

    // Single pass over `content`; malformed input degrades, never fails
    CopybookLayout parse(StringView content);
    Result<CopybookLayout> parse_file(const Path& path);

    [[nodiscard]] const std::vector<Field>& fields() const { return fields_; }
    [[nodiscard]] const ParseStatistics& statistics() const { return stats_; }
};

// =============================================================================
// Utility Functions
// =============================================================================

// Whole copybook text from a file or an already open stream
[[nodiscard]] Result<String> read_copybook(const Path& path);
[[nodiscard]] Result<String> read_copybook(std::istream& in, StringView source);

// Fixed-width metadata table; absent values print as "-"
[[nodiscard]] String format_field_table(const std::vector<Field>& fields);

} // namespace copybook
} // namespace copyddl

#endif // COPYDDL_COPYBOOK_HPP
