// =============================================================================
// Copybook DDL - Copybook Parser Implementation
// Version: 1.0.0
// =============================================================================

#include <copyddl/copybook/copybook.hpp>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <fstream>
#include <cctype>

namespace copyddl {
namespace copybook {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '-';
}

Size skip_spaces(StringView line, Size pos) {
    while (pos < line.size() && is_space(line[pos])) ++pos;
    return pos;
}

// Case-insensitive `keyword` at `pos` followed by whitespace
bool keyword_at(StringView line, Size pos, StringView keyword) {
    if (line.size() - pos <= keyword.size()) return false;
    for (Size i = 0; i < keyword.size(); ++i) {
        if (std::toupper(static_cast<unsigned char>(line[pos + i])) != keyword[i]) return false;
    }
    return is_space(line[pos + keyword.size()]);
}

// PIC token after the clause keyword, if the line has one
Optional<String> picture_clause(StringView line, Size pos) {
    Size keyword = skip_spaces(line, pos);
    if (keyword == pos) return nullopt;

    Size after = 0;
    if (keyword_at(line, keyword, "PIC")) {
        after = keyword + 3;
    } else if (keyword_at(line, keyword, "PICTURE")) {
        after = keyword + 7;
    } else {
        return nullopt;
    }

    Size start = skip_spaces(line, after);
    Size end = start;
    while (end < line.size() && !is_space(line[end]) && line[end] != '.') ++end;
    if (end == start) return nullopt;
    return String(line.substr(start, end - start));
}

String optional_text(const Optional<String>& value) {
    return value ? *value : String("-");
}

} // anonymous namespace

// =============================================================================
// Line Classifier
// =============================================================================

LineClass classify_line(StringView line) {
    String trimmed = trim(line);
    if (trimmed.empty()) {
        return SkipLine{SkipReason::BLANK};
    }
    if (trimmed.front() == '*') {
        return SkipLine{SkipReason::COMMENT};
    }

    // LEVEL NAME [PIC|PICTURE clause]; the clause stops at whitespace or a period
    Size pos = skip_spaces(line, 0);
    if (line.size() - pos < 2 || !is_digit(line[pos]) || !is_digit(line[pos + 1])) {
        return SkipLine{SkipReason::UNRECOGNIZED};
    }
    auto level = static_cast<UInt8>((line[pos] - '0') * 10 + (line[pos + 1] - '0'));
    pos += 2;

    Size name_start = skip_spaces(line, pos);
    Size name_end = name_start;
    while (name_end < line.size() && is_name_char(line[name_end])) ++name_end;
    if (name_start == pos || name_end == name_start) {
        return SkipLine{SkipReason::UNRECOGNIZED};
    }

    String name(line.substr(name_start, name_end - name_start));
    if (auto pic = picture_clause(line, name_end)) {
        return FieldDeclaration{level, std::move(name), std::move(*pic)};
    }
    return GroupDeclaration{level, std::move(name)};
}

// =============================================================================
// Field Implementation
// =============================================================================

String Field::to_string() const {
    std::ostringstream oss;
    oss << std::setw(2) << std::setfill('0') << static_cast<int>(level) << std::setfill(' ')
        << " " << name;
    if (pic) {
        oss << " PIC " << *pic;
    }
    oss << " -> " << sql_type;
    if (parent) {
        oss << " [parent=" << *parent << "]";
    }
    return oss.str();
}

String Field::to_json() const {
    std::ostringstream oss;
    oss << R"({"level":)" << static_cast<int>(level)
        << R"(,"name":)" << json_quote(name)
        << R"(,"pic":)" << (pic ? json_quote(*pic) : "null")
        << R"(,"sql_type":)" << json_quote(sql_type)
        << R"(,"length":)" << (length ? std::to_string(*length) : "null")
        << R"(,"parent":)" << (parent ? json_quote(*parent) : "null")
        << "}";
    return oss.str();
}

// =============================================================================
// HierarchyResolver Implementation
// =============================================================================

void HierarchyResolver::close_groups(UInt8 level) {
    while (!stack_.empty() && stack_.back().level >= level) {
        stack_.pop_back();
    }
}

void HierarchyResolver::open_group(UInt8 level, StringView name) {
    close_groups(level);
    stack_.push_back(GroupEntry{level, String(name)});
}

Optional<String> HierarchyResolver::resolve_parent(UInt8 level) {
    close_groups(level);
    return current_group();
}

Optional<String> HierarchyResolver::current_group() const {
    if (stack_.empty()) return nullopt;
    return stack_.back().name;
}

// =============================================================================
// ParseStatistics / CopybookLayout Implementation
// =============================================================================

String ParseStatistics::to_string() const {
    return std::format("lines={} fields={} groups={} skipped={} (blank={}, comment={}, "
                       "unrecognized={}) fallback_types={}",
                       lines_read, field_declarations, group_declarations, skipped_lines(),
                       blank_lines, comment_lines, unrecognized_lines, fallback_types);
}

const Field* CopybookLayout::find_field(StringView name) const {
    auto it = std::find_if(fields.begin(), fields.end(),
        [&](const Field& field) { return field.name == name; });
    return it != fields.end() ? &*it : nullptr;
}

String CopybookLayout::to_string() const {
    std::ostringstream oss;
    oss << "Copybook";
    if (!source_file.empty()) {
        oss << " " << source_file;
    }
    oss << " (" << fields.size() << " fields)\n";
    for (const auto& field : fields) {
        oss << "  " << field.to_string() << "\n";
    }
    return oss.str();
}

// =============================================================================
// CopybookParser Implementation
// =============================================================================

CopybookParser::CopybookParser()
    : logger_(logging::LogManager::instance().get_logger("copybook")) {}

void CopybookParser::add_field(FieldDeclaration declaration) {
    auto parent = resolver_.resolve_parent(declaration.level);
    SqlType type = interpret_picture(declaration.pic);

    if (type.is_fallback()) {
        ++stats_.fallback_types;
        logger_->debug("Unrecognized picture clause '{}' for {}, using {}",
                       declaration.pic, declaration.name, type.to_string());
    }

    Field field;
    field.level = declaration.level;
    field.name = std::move(declaration.name);
    field.pic = std::move(declaration.pic);
    field.sql_type = type.to_string();
    field.length = type.length;
    field.parent = std::move(parent);
    field.category = type.category;
    fields_.push_back(std::move(field));
}

void CopybookParser::process_line(StringView line) {
    ++stats_.lines_read;
    LineClass result = classify_line(line);

    if (auto* skip = std::get_if<SkipLine>(&result)) {
        switch (skip->reason) {
            case SkipReason::BLANK:
                ++stats_.blank_lines;
                break;
            case SkipReason::COMMENT:
                ++stats_.comment_lines;
                break;
            case SkipReason::UNRECOGNIZED:
                ++stats_.unrecognized_lines;
                logger_->debug("Skipping unrecognized line {}: '{}'",
                               stats_.lines_read, trim(line));
                break;
        }
    } else if (auto* group = std::get_if<GroupDeclaration>(&result)) {
        ++stats_.group_declarations;
        resolver_.open_group(group->level, group->name);
    } else if (auto* field = std::get_if<FieldDeclaration>(&result)) {
        ++stats_.field_declarations;
        add_field(std::move(*field));
    }
}

CopybookLayout CopybookParser::parse(StringView content) {
    logging::ScopedTimer timer(logger_, "Copybook parse");

    fields_.clear();
    stats_ = ParseStatistics{};
    resolver_.reset();

    for (const auto& line : split(content, '\n')) {
        process_line(line);
    }
    // Open groups left on the stack at end of input are simply discarded
    resolver_.reset();

    logger_->debug("Parsed copybook: {}", stats_.to_string());

    CopybookLayout layout;
    layout.fields = fields_;
    layout.statistics = stats_;
    return layout;
}

Result<CopybookLayout> CopybookParser::parse_file(const Path& path) {
    auto content = read_copybook(path);
    if (content.is_error()) {
        return make_error<CopybookLayout>(content.error());
    }

    CopybookLayout layout = parse(*content);
    layout.source_file = path.string();
    logger_->info("Loaded {} fields from {}", layout.fields.size(), layout.source_file);
    return layout;
}

// =============================================================================
// Utility Functions
// =============================================================================

Result<String> read_copybook(const Path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return make_error<String>(ErrorCode::FILE_NOT_FOUND,
            "Cannot open copybook: " + path.string());
    }
    return read_copybook(file, path.string());
}

Result<String> read_copybook(std::istream& in, StringView source) {
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return make_error<String>(ErrorCode::READ_ERROR,
            std::format("Cannot read copybook: {}", source));
    }
    return ss.str();
}

String format_field_table(const std::vector<Field>& fields) {
    const std::vector<String> headers = {"Level", "Field Name", "PIC", "SQL Type", "Length", "Parent"};

    std::vector<std::vector<String>> rows;
    rows.reserve(fields.size());
    for (const auto& field : fields) {
        rows.push_back({
            std::format("{:02}", static_cast<int>(field.level)),
            field.name,
            optional_text(field.pic),
            field.sql_type,
            field.length ? std::to_string(*field.length) : String("-"),
            optional_text(field.parent)
        });
    }

    std::vector<Size> widths;
    for (const auto& header : headers) {
        widths.push_back(header.size());
    }
    for (const auto& row : rows) {
        for (Size i = 0; i < row.size(); ++i) {
            widths[i] = std::max(widths[i], row[i].size());
        }
    }

    auto render = [&](const std::vector<String>& cells) {
        std::vector<String> padded;
        for (Size i = 0; i < cells.size(); ++i) {
            padded.push_back(i + 1 < cells.size() ? pad_right(cells[i], widths[i]) : cells[i]);
        }
        return join(padded, "  ") + "\n";
    };

    std::ostringstream oss;
    oss << render(headers);
    std::vector<String> rules;
    for (Size width : widths) {
        rules.emplace_back(width, '-');
    }
    oss << render(rules);
    for (const auto& row : rows) {
        oss << render(row);
    }
    return oss.str();
}

} // namespace copybook
} // namespace copyddl
