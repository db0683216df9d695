#pragma once
// =============================================================================
// Copybook DDL - Configuration File Parser
// Version: 1.0.0
// INI-style configuration for the DDL generator and logging
// =============================================================================
//
//   [DDL]
//   namespace = bronze
//   default_table = table
//
//   [LOGGING]
//   level = INFO
//   file = ${HOME}/copybook-ddl.log
//
// =============================================================================

#include "copyddl/common/types.hpp"
#include "copyddl/common/error.hpp"
#include <map>

namespace copyddl::config {

// =============================================================================
// Configuration Section
// =============================================================================

class ConfigSection {
private:
    std::map<String, String, std::less<>> values_;

public:
    // Empty and missing values both yield `default_val`
    [[nodiscard]] String get_string(StringView key, StringView default_val = "") const;
    void set(StringView key, StringView value);

    auto begin() const { return values_.begin(); }
    auto end() const { return values_.end(); }
    [[nodiscard]] bool empty() const { return values_.empty(); }
};

// =============================================================================
// Configuration File
// =============================================================================

class ConfigFile {
private:
    Path filepath_;
    std::map<String, ConfigSection, std::less<>> sections_;

    void parse_line(StringView line, String& current_section);

public:
    static constexpr StringView DEFAULT_SECTION = "default";

    ConfigFile();

    // Section names are matched case-sensitively; keys within a section too
    [[nodiscard]] Result<void> load(const Path& path);
    void parse(StringView content);

    [[nodiscard]] const Path& path() const { return filepath_; }
    [[nodiscard]] bool is_loaded() const { return !filepath_.empty(); }

    [[nodiscard]] ConfigSection& section(StringView name);
    [[nodiscard]] const ConfigSection& section(StringView name) const;
    ConfigSection& add_section(StringView name);

    [[nodiscard]] String get_string(StringView section, StringView key, StringView default_val = "") const;
    void set(StringView section, StringView key, StringView value);

    // Values of `other` override values present here
    void merge(const ConfigFile& other);

    [[nodiscard]] Vector<String> section_names() const;
    [[nodiscard]] String to_string() const;
};

// =============================================================================
// Environment Variable Support
// =============================================================================

[[nodiscard]] Optional<String> get_env(StringView name);

// Expands ${VAR} references; unset variables expand to nothing
[[nodiscard]] String expand_env(StringView str);

// =============================================================================
// Configuration Builder (Fluent API)
// =============================================================================

class ConfigBuilder {
private:
    ConfigFile config_;
    String current_section_;

public:
    ConfigBuilder();

    ConfigBuilder& section(StringView name);
    ConfigBuilder& set(StringView key, StringView value);

    [[nodiscard]] ConfigFile build();
};

[[nodiscard]] Result<ConfigFile> load_config(const Path& path);

// =============================================================================
// Copybook DDL Configuration
// =============================================================================

namespace sections {
    constexpr StringView DDL = "DDL";
    constexpr StringView LOGGING = "LOGGING";
}

namespace keys {
    constexpr StringView NAMESPACE = "namespace";
    constexpr StringView DEFAULT_TABLE = "default_table";
    constexpr StringView LEVEL = "level";
    constexpr StringView FILE = "file";
}

// Environment variable naming an optional configuration file
constexpr StringView CONFIG_ENV_VAR = "COPYDDL_CONFIG";

[[nodiscard]] ConfigFile default_copybook_config();

// Defaults overlaid with the file at `path`, or with $COPYDDL_CONFIG when
// `path` is empty and the variable is set. An unknown [LOGGING] level is
// rejected with CONFIG_INVALID_VALUE.
[[nodiscard]] Result<ConfigFile> load_copybook_config(const Path& path = {});

} // namespace copyddl::config
