#include "../framework/test_framework.hpp"
#include "copyddl/copybook/copybook.hpp"

using namespace copyddl;
using namespace copyddl::copybook;
using namespace copyddl::test;

namespace {

SkipReason skip_reason(const LineClass& result) {
    const auto* skip = std::get_if<SkipLine>(&result);
    if (!skip) throw std::runtime_error("expected a skipped line");
    return skip->reason;
}

} // namespace

void test_blank_lines_are_skipped() {
    ASSERT_EQ(skip_reason(classify_line("")), SkipReason::BLANK);
    ASSERT_EQ(skip_reason(classify_line("      ")), SkipReason::BLANK);
    ASSERT_EQ(skip_reason(classify_line("\t\r")), SkipReason::BLANK);
}

void test_comment_lines_are_skipped() {
    ASSERT_EQ(skip_reason(classify_line("      * CUSTOMER RECORD")), SkipReason::COMMENT);
    ASSERT_EQ(skip_reason(classify_line("*05 NOT-A-FIELD PIC X(3).")), SkipReason::COMMENT);
}

void test_malformed_lines_are_skipped() {
    ASSERT_EQ(skip_reason(classify_line("COPY CUSTREC.")), SkipReason::UNRECOGNIZED);
    ASSERT_EQ(skip_reason(classify_line("5 SHORT-LEVEL PIC X(3).")), SkipReason::UNRECOGNIZED);
    ASSERT_EQ(skip_reason(classify_line("005 LONG-LEVEL PIC X(3).")), SkipReason::UNRECOGNIZED);
    ASSERT_EQ(skip_reason(classify_line("05")), SkipReason::UNRECOGNIZED);
}

void test_group_declaration() {
    LineClass result = classify_line("       01  CUSTOMER-RECORD.");
    const auto* group = std::get_if<GroupDeclaration>(&result);
    ASSERT_TRUE(group != nullptr);
    ASSERT_EQ(group->level, 1);
    ASSERT_EQ(group->name, "CUSTOMER-RECORD");
}

void test_field_declaration() {
    LineClass result = classify_line("           05  CUSTOMER-ID            PIC 9(10).");
    const auto* field = std::get_if<FieldDeclaration>(&result);
    ASSERT_TRUE(field != nullptr);
    ASSERT_EQ(field->level, 5);
    ASSERT_EQ(field->name, "CUSTOMER-ID");
    ASSERT_EQ(field->pic, "9(10)");
}

void test_picture_keyword_variants() {
    LineClass picture = classify_line("10 FIRST-NAME PICTURE X(30).");
    const auto* field = std::get_if<FieldDeclaration>(&picture);
    ASSERT_TRUE(field != nullptr);
    ASSERT_EQ(field->pic, "X(30)");

    LineClass lower = classify_line("10 last-name pic x(30).");
    const auto* lower_field = std::get_if<FieldDeclaration>(&lower);
    ASSERT_TRUE(lower_field != nullptr);
    ASSERT_EQ(lower_field->name, "last-name");
    ASSERT_EQ(lower_field->pic, "x(30)");
}

void test_picture_token_stops_at_period_and_space() {
    LineClass result = classify_line("05 BALANCE PIC S9(13)V99 COMP-3.");
    const auto* field = std::get_if<FieldDeclaration>(&result);
    ASSERT_TRUE(field != nullptr);
    ASSERT_EQ(field->pic, "S9(13)V99");

    LineClass glued = classify_line("05 COUNTER PIC S9(4)COMP.");
    const auto* glued_field = std::get_if<FieldDeclaration>(&glued);
    ASSERT_TRUE(glued_field != nullptr);
    ASSERT_EQ(glued_field->pic, "S9(4)COMP");
}

void test_windows_line_endings() {
    LineClass result = classify_line("05 CODE PIC X(2).\r");
    const auto* field = std::get_if<FieldDeclaration>(&result);
    ASSERT_TRUE(field != nullptr);
    ASSERT_EQ(field->pic, "X(2)");
}

void test_non_picture_clause_is_group() {
    // Only PIC/PICTURE makes a line terminal
    LineClass result = classify_line("05 ORDER-ITEMS OCCURS 10 TIMES.");
    ASSERT_TRUE(std::holds_alternative<GroupDeclaration>(result));
}

void test_very_long_lines() {
    const String long_name(200000, 'A');

    LineClass group = classify_line("       01  " + long_name + ".");
    const auto* declaration = std::get_if<GroupDeclaration>(&group);
    ASSERT_TRUE(declaration != nullptr);
    ASSERT_EQ(declaration->name.size(), 200000u);

    LineClass field = classify_line("05 A PIC " + String(200000, 'X'));
    const auto* field_declaration = std::get_if<FieldDeclaration>(&field);
    ASSERT_TRUE(field_declaration != nullptr);
    ASSERT_EQ(field_declaration->name, "A");
    ASSERT_EQ(field_declaration->pic.size(), 200000u);

    ASSERT_EQ(skip_reason(classify_line(String(200000, 'Z'))), SkipReason::UNRECOGNIZED);
    ASSERT_EQ(skip_reason(classify_line(String(200000, ' '))), SkipReason::BLANK);
}

void test_long_line_through_parser() {
    CopybookParser parser;
    auto layout = parser.parse("05 AMOUNT PIC " + String(200000, '9') + "V99");
    ASSERT_EQ(layout.fields.size(), 1u);
    ASSERT_EQ(layout.fields[0].sql_type, "DECIMAL(200002,2)");

    auto skipped = parser.parse(String(200000, '-'));
    ASSERT_TRUE(skipped.fields.empty());
    ASSERT_EQ(skipped.statistics.unrecognized_lines, 1u);
}

int main() {
    TestSuite suite("Line Classifier Tests");

    suite.add_test("Blank lines", test_blank_lines_are_skipped);
    suite.add_test("Comment lines", test_comment_lines_are_skipped);
    suite.add_test("Malformed lines", test_malformed_lines_are_skipped);
    suite.add_test("Group declaration", test_group_declaration);
    suite.add_test("Field declaration", test_field_declaration);
    suite.add_test("PIC/PICTURE keyword", test_picture_keyword_variants);
    suite.add_test("PIC token boundaries", test_picture_token_stops_at_period_and_space);
    suite.add_test("CRLF input", test_windows_line_endings);
    suite.add_test("Non-PIC clause", test_non_picture_clause_is_group);
    suite.add_test("200000-character lines", test_very_long_lines);
    suite.add_test("200000-character line parse", test_long_line_through_parser);

    TestRunner runner;
    runner.add_suite(&suite);
    return runner.run_all();
}
