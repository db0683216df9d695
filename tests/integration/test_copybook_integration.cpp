// Integration tests: copybook text -> field metadata -> CREATE TABLE

#include "../framework/test_framework.hpp"
#include "copyddl/config/config.hpp"
#include "copyddl/copybook/copybook.hpp"
#include "copyddl/ddl/ddl.hpp"
#include <filesystem>
#include <fstream>

using namespace copyddl;
using namespace copyddl::test;

namespace {

const char* const CUSTOMER_COPYBOOK =
    "      * CUSTOMER MASTER RECORD\n"
    "       01  CUSTOMER-RECORD.\n"
    "           05  CUSTOMER-ID            PIC 9(10).\n"
    "           05  CUSTOMER-NAME.\n"
    "               10  FIRST-NAME         PIC X(30).\n"
    "               10  LAST-NAME          PIC X(30).\n"
    "           05  ACCOUNT-BALANCE        PIC S9(13)V99.\n";

const char* const SAMPLE_COPYBOOK =
    "       01  CUSTOMER-RECORD.\n"
    "           05  CUSTOMER-ID            PIC 9(10).\n"
    "           05  CUSTOMER-NAME.\n"
    "               10  FIRST-NAME         PIC X(30).\n"
    "               10  LAST-NAME          PIC X(30).\n"
    "           05  ACCOUNT-NUMBER         PIC 9(12).\n"
    "           05  ACCOUNT-BALANCE        PIC S9(13)V99.\n"
    "           05  EMAIL-ADDR             PIC X(50).\n"
    "           05  SSN                    PIC 9(9).\n";

} // namespace

void test_customer_record_fields() {
    copybook::CopybookParser parser;
    auto layout = parser.parse(CUSTOMER_COPYBOOK);

    ASSERT_EQ(layout.fields.size(), 4u);

    const auto& id = layout.fields[0];
    ASSERT_EQ(id.name, "CUSTOMER-ID");
    ASSERT_EQ(id.level, 5);
    ASSERT_EQ(id.pic.value(), "9(10)");
    ASSERT_EQ(id.sql_type, "BIGINT");
    ASSERT_EQ(id.length.value(), 10u);
    ASSERT_EQ(id.parent.value(), "CUSTOMER-RECORD");

    const auto& first = layout.fields[1];
    ASSERT_EQ(first.name, "FIRST-NAME");
    ASSERT_EQ(first.level, 10);
    ASSERT_EQ(first.sql_type, "VARCHAR(30)");
    ASSERT_EQ(first.parent.value(), "CUSTOMER-NAME");

    ASSERT_EQ(layout.fields[2].name, "LAST-NAME");
    ASSERT_EQ(layout.fields[2].parent.value(), "CUSTOMER-NAME");

    const auto& balance = layout.fields[3];
    ASSERT_EQ(balance.sql_type, "DECIMAL(15,2)");
    ASSERT_EQ(balance.length.value(), 15u);
    ASSERT_EQ(balance.parent.value(), "CUSTOMER-RECORD");
}

void test_customer_record_statistics() {
    copybook::CopybookParser parser;
    auto layout = parser.parse(CUSTOMER_COPYBOOK);

    // Trailing newline yields one final blank line
    ASSERT_EQ(layout.statistics.lines_read, 8u);
    ASSERT_EQ(layout.statistics.comment_lines, 1u);
    ASSERT_EQ(layout.statistics.blank_lines, 1u);
    ASSERT_EQ(layout.statistics.group_declarations, 2u);
    ASSERT_EQ(layout.statistics.field_declarations, 4u);
    ASSERT_EQ(layout.statistics.fallback_types, 0u);
    ASSERT_EQ(parser.fields().size(), 4u);
}

void test_customer_record_ddl() {
    auto conversion = ddl::convert(CUSTOMER_COPYBOOK, "customer");
    ASSERT_EQ(conversion.ddl,
              "CREATE TABLE bronze.customer (\n"
              "    customer_id BIGINT,\n"
              "    first_name VARCHAR(30),\n"
              "    last_name VARCHAR(30),\n"
              "    account_balance DECIMAL(15,2)\n"
              ");");
}

void test_sample_copybook() {
    auto conversion = ddl::convert(SAMPLE_COPYBOOK, "table");
    ASSERT_EQ(conversion.fields.size(), 7u);
    ASSERT_CONTAINS(conversion.ddl, "    account_number BIGINT,\n");
    ASSERT_CONTAINS(conversion.ddl, "    email_addr VARCHAR(50),\n");
    ASSERT_CONTAINS(conversion.ddl, "    ssn INTEGER\n);");
    ASSERT_TRUE(starts_with(conversion.ddl, "CREATE TABLE bronze.table (\n"));
}

void test_mixed_and_malformed_input() {
    const char* text =
        "       01  WS-RECORD.\n"
        "           05  WS-COUNT     PIC S9(4) COMP.\n"
        "           05  WS-PACKED    PIC S9(4)COMP.\n"
        "           05  WS-EDITED    PIC ZZ9.99.\n"
        "       COPY OTHERBOOK.\n"
        "           05  WS-FILLER    PIC X(10).\r\n";

    auto conversion = ddl::convert(text, "ws");
    ASSERT_EQ(conversion.fields.size(), 4u);
    // COMP as a separate token is outside the PIC token
    ASSERT_EQ(conversion.fields[0].sql_type, "INTEGER");
    ASSERT_EQ(conversion.fields[1].sql_type, "VARCHAR(255)");
    ASSERT_TRUE(conversion.fields[2].is_fallback());
    ASSERT_EQ(conversion.fields[2].pic.value(), "ZZ9");
    ASSERT_EQ(conversion.fields[3].sql_type, "VARCHAR(10)");
    ASSERT_EQ(conversion.statistics.unrecognized_lines, 1u);
    ASSERT_EQ(conversion.statistics.fallback_types, 2u);
}

void test_namespace_from_config() {
    auto config = config::default_copybook_config();
    config.parse("[DDL]\nnamespace = silver\n");
    auto conversion = ddl::convert(CUSTOMER_COPYBOOK, "customer",
                                   ddl::DdlOptions::from_config(config));
    ASSERT_TRUE(starts_with(conversion.ddl, "CREATE TABLE silver.customer (\n"));
}

void test_json_document() {
    auto conversion = ddl::convert(CUSTOMER_COPYBOOK, "customer");
    String json = conversion.to_json();

    ASSERT_CONTAINS(json, R"x({"level":5,"name":"CUSTOMER-ID","pic":"9(10)","sql_type":"BIGINT","length":10,"parent":"CUSTOMER-RECORD"})x");
    ASSERT_CONTAINS(json, R"("ddl":"CREATE TABLE bronze.customer (\n    customer_id BIGINT,)");
}

void test_field_table() {
    copybook::CopybookParser parser;
    auto layout = parser.parse(CUSTOMER_COPYBOOK);
    String table = copybook::format_field_table(layout.fields);

    auto lines = split(table, '\n');
    ASSERT_EQ(lines.size(), 7u);  // header, rule, 4 rows, trailing empty
    ASSERT_TRUE(starts_with(lines[0], "Level  Field Name"));
    ASSERT_TRUE(starts_with(lines[1], "-----  "));
    ASSERT_TRUE(starts_with(lines[2], "05     CUSTOMER-ID"));
    ASSERT_CONTAINS(lines[3], "CUSTOMER-NAME");
}

void test_field_table_absent_values() {
    copybook::Field field;
    field.level = 1;
    field.name = "LONE";
    field.sql_type = "VARCHAR(255)";

    String table = copybook::format_field_table({field});
    ASSERT_CONTAINS(table, "01     LONE");
    ASSERT_CONTAINS(table, "VARCHAR(255)  -       -\n");
}

void test_parse_file() {
    Path path = std::filesystem::temp_directory_path() / "copyddl_customer.cpy";
    {
        std::ofstream out(path);
        out << CUSTOMER_COPYBOOK;
    }

    copybook::CopybookParser parser;
    auto layout = parser.parse_file(path);
    ASSERT_TRUE(layout.is_success());
    ASSERT_EQ(layout->fields.size(), 4u);
    ASSERT_EQ(layout->source_file, path.string());
    ASSERT_CONTAINS(layout->to_string(), "(4 fields)");

    std::filesystem::remove(path);
}

void test_parse_missing_file() {
    copybook::CopybookParser parser;
    auto layout = parser.parse_file("/nonexistent/copyddl/missing.cpy");
    ASSERT_TRUE(layout.is_error());
    ASSERT_EQ(layout.error().code, ErrorCode::FILE_NOT_FOUND);
}

void test_parser_reuse_resets_state() {
    copybook::CopybookParser parser;
    (void)parser.parse(CUSTOMER_COPYBOOK);
    auto second = parser.parse("05 ORPHAN PIC X(1).");
    ASSERT_EQ(second.fields.size(), 1u);
    ASSERT_FALSE(second.fields[0].parent.has_value());
    ASSERT_EQ(second.statistics.lines_read, 1u);
}

int main() {
    TestSuite suite("Copybook Integration Tests");

    suite.add_test("Customer record fields", test_customer_record_fields);
    suite.add_test("Customer record statistics", test_customer_record_statistics);
    suite.add_test("Customer record DDL", test_customer_record_ddl);
    suite.add_test("Sample copybook", test_sample_copybook);
    suite.add_test("Mixed and malformed input", test_mixed_and_malformed_input);
    suite.add_test("Namespace from config", test_namespace_from_config);
    suite.add_test("JSON document", test_json_document);
    suite.add_test("Field table", test_field_table);
    suite.add_test("Field table absent values", test_field_table_absent_values);
    suite.add_test("Parse file", test_parse_file);
    suite.add_test("Missing file", test_parse_missing_file);
    suite.add_test("Parser reuse", test_parser_reuse_resets_state);

    TestRunner runner;
    runner.add_suite(&suite);
    return runner.run_all();
}
