// =============================================================================
// Copybook DDL - Basic Example
// Version: 1.0.0
// Demonstrates: Parsing a copybook, field metadata, DDL generation, JSON
// =============================================================================

#include <iostream>
#include <string>

#include "copyddl/common/logging.hpp"
#include "copyddl/config/config.hpp"
#include "copyddl/copybook/copybook.hpp"
#include "copyddl/ddl/ddl.hpp"

using namespace copyddl;

namespace {

const char* const ORDER_COPYBOOK = R"(
      * ORDER HEADER
       01  ORDER-HEADER.
           05  ORDER-ID               PIC 9(8).
           05  ORDER-DATE             PIC X(10).
           05  SHIP-TO.
               10  CITY               PIC X(25).
               10  POSTAL-CODE        PIC X(10).
           05  ORDER-TOTAL            PIC S9(9)V99.
           05  LINE-COUNT             PIC S9(4) COMP.
           05  DISCOUNT-RATE          PIC V999.
)";

} // namespace

void demo_parse() {
    std::cout << "\n=== Copybook Parsing Demo ===\n";

    copybook::CopybookParser parser;
    auto layout = parser.parse(ORDER_COPYBOOK);

    std::cout << copybook::format_field_table(layout.fields);
    std::cout << "\n" << layout.statistics.to_string() << "\n";

    if (const auto* total = layout.find_field("ORDER-TOTAL")) {
        std::cout << "ORDER-TOTAL maps to " << total->sql_type
                  << " under " << total->parent.value_or("-") << "\n";
    }
}

void demo_picture_clauses() {
    std::cout << "\n=== Picture Clause Demo ===\n";

    for (const char* pic : {"9(5)V99", "9(9)", "9(10)", "X(30)", "A(4)", "S9(4)COMP", "ZZ9"}) {
        std::cout << "  " << pic << " -> " << copybook::interpret_picture(pic).to_string() << "\n";
    }
}

void demo_ddl() {
    std::cout << "\n=== DDL Generation Demo ===\n";

    auto config = config::default_copybook_config();
    config.set(config::sections::DDL, config::keys::NAMESPACE, "silver");

    auto conversion = ddl::convert(ORDER_COPYBOOK, "orders", ddl::DdlOptions::from_config(config));
    std::cout << conversion.ddl << "\n";

    std::cout << "\nJSON:\n" << conversion.to_json() << "\n";
}

int main() {
    logging::LogSettings log_settings;
    log_settings.console_level = logging::LogLevel::WARN;
    logging::LogManager::instance().configure(log_settings);

    std::cout << "+==============================================================+\n";
    std::cout << "|                  Copybook DDL Basic Example                  |\n";
    std::cout << "+==============================================================+\n";

    demo_parse();
    demo_picture_clauses();
    demo_ddl();

    logging::LogManager::instance().shutdown();
    return 0;
}
