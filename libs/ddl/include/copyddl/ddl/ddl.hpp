#pragma once
// =============================================================================
// Copybook DDL - Table Definition Generator
// Version: 1.0.0
// =============================================================================
// Renders parsed copybook fields as a CREATE TABLE statement:
//
//   CREATE TABLE bronze.customer (
//       customer_id BIGINT,
//       first_name VARCHAR(30)
//   );
// =============================================================================

#include "copyddl/common/types.hpp"
#include "copyddl/common/logging.hpp"
#include "copyddl/config/config.hpp"
#include "copyddl/copybook/copybook.hpp"

namespace copyddl::ddl {

inline constexpr StringView DEFAULT_NAMESPACE = "bronze";
inline constexpr StringView DEFAULT_TABLE_NAME = "table";
inline constexpr StringView COLUMN_INDENT = "    ";

struct DdlOptions {
    String namespace_name{DEFAULT_NAMESPACE};

    [[nodiscard]] static DdlOptions from_config(const config::ConfigFile& config);
};

// Lower-cases the name and turns every '-' into '_'. Idempotent.
[[nodiscard]] String normalize_column_name(StringView field_name);

// "    <column> <sql_type>"
[[nodiscard]] String column_clause(const copybook::Field& field);

class DdlGenerator {
private:
    DdlOptions options_;
    SharedPtr<logging::Logger> logger_;

public:
    DdlGenerator();
    explicit DdlGenerator(DdlOptions options);

    // The table name is emitted verbatim. An empty field list still yields a
    // statement, with an empty column body.
    [[nodiscard]] String generate(const std::vector<copybook::Field>& fields,
                                  StringView table_name) const;

    [[nodiscard]] const DdlOptions& options() const { return options_; }
};

// =============================================================================
// Conversion - parse + generate in one call
// =============================================================================

struct Conversion {
    std::vector<copybook::Field> fields;
    String ddl;
    copybook::ParseStatistics statistics;

    // {"fields":[...],"ddl":"..."}
    [[nodiscard]] String to_json() const;
};

[[nodiscard]] Conversion convert(StringView content, StringView table_name,
                                 const DdlOptions& options = {});

} // namespace copyddl::ddl
