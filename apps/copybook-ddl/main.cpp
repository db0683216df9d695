// =============================================================================
// Copybook DDL - Command Line Tool
// Version: 1.0.0
// =============================================================================
// Reads a COBOL copybook from a file or stdin and prints the field metadata
// and the generated CREATE TABLE statement (or both as one JSON document).
// =============================================================================

#include <exception>
#include <iostream>

#include "cli_app.hpp"

int main(int argc, char* argv[]) {
    try {
        return copyddl::app::run_copybook_ddl(argc, argv, std::cin, std::cout, std::cerr);
    } catch (const std::exception& e) {
        copyddl::app::report_error(
            copyddl::ErrorInfo(copyddl::ErrorCode::UNKNOWN_ERROR, e.what()), std::cerr);
    }
    return 1;
}
