// =============================================================================
// Copybook DDL - Command Line Tool Implementation
// Version: 1.0.0
// =============================================================================

#include "cli_app.hpp"

#include "copyddl/common/cli.hpp"
#include "copyddl/common/logging.hpp"
#include "copyddl/config/config.hpp"
#include "copyddl/copybook/copybook.hpp"
#include "copyddl/ddl/ddl.hpp"

namespace copyddl::app {

namespace {

namespace cb = copybook;
namespace cfg = config;
namespace lg = logging;

constexpr StringView PROGRAM = "copybook-ddl";

cli::ArgParser make_parser() {
    cli::ArgParser args(String(PROGRAM),
        "Convert a COBOL copybook into field metadata and a CREATE TABLE statement.");
    args.add_option("table", 't', "Table name")
        .add_option("namespace", 'n', "Schema/namespace for the table")
        .add_option("config", 'c', "Configuration file (defaults to $COPYDDL_CONFIG)")
        .add_option("log-level", 'l', "Log level: trace, debug, info, warn, error, off")
        .add_option("log-file", 0, "Also write log output to this file")
        .add_flag("json", 'j', "Print fields and DDL as one JSON document")
        .add_flag("fields-only", 'f', "Print only the field table")
        .add_flag("ddl-only", 'd', "Print only the CREATE TABLE statement")
        .add_positional("copybook", "Copybook file, '-' or omitted for stdin");
    return args;
}

// Console logging goes to `err` so `out` carries only the field table/DDL/JSON
Result<void> configure_logging(const cfg::ConfigFile& config, const cli::ArgParser& args,
                               std::ostream& err) {
    String level_name = args.get("log-level",
        config.get_string(cfg::sections::LOGGING, cfg::keys::LEVEL, "INFO"));
    auto level = lg::parse_log_level(level_name);
    if (!level) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
            std::format("Unknown log level '{}'", level_name));
    }

    lg::LogSettings settings;
    settings.console_level = *level;
    settings.console = &err;
    String file_name = args.get("log-file",
        config.get_string(cfg::sections::LOGGING, cfg::keys::FILE, ""));
    if (!file_name.empty()) {
        settings.file = Path(file_name);
    }

    lg::LogManager::instance().configure(settings);
    return {};
}

Result<String> read_source(const cli::ArgParser& args, std::istream& in) {
    String source = args.positional(0).value_or("-");
    if (source == "-") {
        return cb::read_copybook(in, "stdin");
    }
    return cb::read_copybook(Path(source));
}

void write_output(const ddl::Conversion& conversion, const cli::ArgParser& args,
                  std::ostream& out) {
    if (args.flag("json")) {
        out << conversion.to_json() << "\n";
        return;
    }
    if (!args.flag("ddl-only")) {
        out << cb::format_field_table(conversion.fields);
    }
    if (!args.flag("fields-only")) {
        if (!args.flag("ddl-only")) out << "\n";
        out << conversion.ddl << "\n";
    }
}

int run(int argc, const char* const argv[], std::istream& in, std::ostream& out,
        std::ostream& err) {
    cli::ArgParser args = make_parser();
    switch (args.parse(argc, argv)) {
        case cli::ArgParser::Status::HELP:
            args.show_help(out);
            return 0;
        case cli::ArgParser::Status::ERROR:
            report_error(ErrorInfo(ErrorCode::INVALID_ARGUMENT, args.error()), err);
            err << "Try '" << PROGRAM << " --help' for more information.\n";
            return 1;
        case cli::ArgParser::Status::OK:
            break;
    }

    if (args.flag("fields-only") && args.flag("ddl-only")) {
        report_error(ErrorInfo(ErrorCode::INVALID_ARGUMENT,
            "--fields-only and --ddl-only are mutually exclusive"), err);
        return 1;
    }

    auto config = cfg::load_copybook_config(args.get("config", ""));
    if (config.is_error()) {
        report_error(config.error(), err);
        return 1;
    }

    if (auto logged = configure_logging(*config, args, err); logged.is_error()) {
        report_error(logged.error(), err);
        return 1;
    }
    auto logger = lg::LogManager::instance().get_logger("cli");
    logger->debug("Effective configuration:\n{}", config->to_string());

    ddl::DdlOptions options = ddl::DdlOptions::from_config(*config);
    if (auto ns = args.get("namespace")) {
        options.namespace_name = trim(*ns);
    }
    String table = trim(args.get("table",
        config->get_string(cfg::sections::DDL, cfg::keys::DEFAULT_TABLE, ddl::DEFAULT_TABLE_NAME)));

    if (table.empty() || options.namespace_name.empty()) {
        report_error(ErrorInfo(ErrorCode::DDL_INVALID_IDENTIFIER,
            "Table and namespace names must not be empty"), err);
        return 1;
    }

    auto input = read_source(args, in);
    if (input.is_error()) {
        report_error(input.error(), err);
        return 1;
    }

    ddl::Conversion conversion = ddl::convert(*input, table, options);
    logger->debug("{}", conversion.statistics.to_string());
    if (conversion.statistics.fallback_types > 0) {
        logger->info("{} field(s) mapped to VARCHAR({}) because their PIC clause was not recognized",
                     conversion.statistics.fallback_types, cb::FALLBACK_VARCHAR_LENGTH);
    }

    write_output(conversion, args, out);
    return 0;
}

} // anonymous namespace

void report_error(const ErrorInfo& error, std::ostream& err) {
    err << PROGRAM << ": " << format_error_code(error.code) << " ("
        << error_category_name(error.code) << ") " << error.message << "\n";
}

int run_copybook_ddl(int argc, const char* const argv[],
                     std::istream& in, std::ostream& out, std::ostream& err) {
    int status = run(argc, argv, in, out, err);
    lg::LogManager::instance().shutdown();
    return status;
}

} // namespace copyddl::app
