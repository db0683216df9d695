// =============================================================================
// Copybook DDL - Table Definition Generator Implementation
// Version: 1.0.0
// =============================================================================

#include "copyddl/ddl/ddl.hpp"
#include <sstream>

namespace copyddl::ddl {

DdlOptions DdlOptions::from_config(const config::ConfigFile& config) {
    DdlOptions options;
    options.namespace_name = trim(config.get_string(config::sections::DDL,
                                                    config::keys::NAMESPACE,
                                                    DEFAULT_NAMESPACE));
    if (options.namespace_name.empty()) {
        options.namespace_name = String(DEFAULT_NAMESPACE);
    }
    return options;
}

String normalize_column_name(StringView field_name) {
    return replace_all(to_lower(field_name), "-", "_");
}

String column_clause(const copybook::Field& field) {
    return String(COLUMN_INDENT) + normalize_column_name(field.name) + " " + field.sql_type;
}

DdlGenerator::DdlGenerator() : DdlGenerator(DdlOptions{}) {}

DdlGenerator::DdlGenerator(DdlOptions options)
    : options_(std::move(options)),
      logger_(logging::LogManager::instance().get_logger("ddl")) {}

String DdlGenerator::generate(const std::vector<copybook::Field>& fields,
                              StringView table_name) const {
    std::vector<String> columns;
    columns.reserve(fields.size());
    for (const auto& field : fields) {
        columns.push_back(column_clause(field));
    }

    if (columns.empty()) {
        logger_->warn("No columns for table {}.{}, statement has an empty body",
                      options_.namespace_name, table_name);
    } else {
        logger_->debug("Generated {} columns for table {}.{}",
                       columns.size(), options_.namespace_name, table_name);
    }

    std::ostringstream oss;
    oss << "CREATE TABLE " << options_.namespace_name << "." << table_name << " (\n"
        << join(columns, ",\n")
        << "\n);";
    return oss.str();
}

// =============================================================================
// Conversion
// =============================================================================

String Conversion::to_json() const {
    std::ostringstream oss;
    oss << R"({"fields":[)";
    for (Size i = 0; i < fields.size(); ++i) {
        if (i > 0) oss << ",";
        oss << fields[i].to_json();
    }
    oss << R"(],"ddl":)" << json_quote(ddl) << "}";
    return oss.str();
}

Conversion convert(StringView content, StringView table_name, const DdlOptions& options) {
    copybook::CopybookParser parser;
    auto layout = parser.parse(content);

    Conversion conversion;
    conversion.ddl = DdlGenerator(options).generate(layout.fields, table_name);
    conversion.fields = std::move(layout.fields);
    conversion.statistics = layout.statistics;
    return conversion;
}

} // namespace copyddl::ddl
