#pragma once
// =============================================================================
// Copybook DDL - Command Line Tool
// Version: 1.0.0
// =============================================================================
// The tool body, taking its standard streams as arguments. Exit status is 0
// on success and 1 on any error, reported on `err` as
//
//   copybook-ddl: CPYD1101 (I/O) Cannot open copybook: missing.cpy
// =============================================================================

#include "copyddl/common/error.hpp"
#include <istream>
#include <ostream>

namespace copyddl::app {

int run_copybook_ddl(int argc, const char* const argv[],
                     std::istream& in, std::ostream& out, std::ostream& err);

void report_error(const ErrorInfo& error, std::ostream& err);

} // namespace copyddl::app
