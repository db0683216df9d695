// =============================================================================
// Copybook DDL - Configuration File Parser Implementation
// Version: 1.0.0
// =============================================================================

#include <copyddl/config/config.hpp>
#include <copyddl/common/logging.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace copyddl::config {

namespace {

String unquote(String value) {
    if (value.size() >= 2) {
        if ((value.front() == '"' && value.back() == '"') ||
            (value.front() == '\'' && value.back() == '\'')) {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

} // anonymous namespace

// =============================================================================
// ConfigSection Implementation
// =============================================================================

String ConfigSection::get_string(StringView key, StringView default_val) const {
    auto it = values_.find(key);
    if (it == values_.end() || it->second.empty()) {
        return String(default_val);
    }
    return it->second;
}

void ConfigSection::set(StringView key, StringView value) {
    values_.insert_or_assign(String(key), String(value));
}

// =============================================================================
// ConfigFile Implementation
// =============================================================================

ConfigFile::ConfigFile() {
    add_section(DEFAULT_SECTION);
}

void ConfigFile::parse_line(StringView line, String& current_section) {
    String trimmed = trim(line);
    if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') {
        return;
    }

    // [section]
    if (trimmed[0] == '[' && trimmed.back() == ']') {
        current_section = trim(StringView(trimmed).substr(1, trimmed.size() - 2));
        add_section(current_section);
        return;
    }

    // key=value or key:value
    size_t sep_pos = std::min(trimmed.find('='), trimmed.find(':'));
    if (sep_pos == String::npos) {
        return;
    }

    String key = trim(StringView(trimmed).substr(0, sep_pos));
    String value = unquote(trim(StringView(trimmed).substr(sep_pos + 1)));
    if (!key.empty()) {
        section(current_section).set(key, expand_env(value));
    }
}

void ConfigFile::parse(StringView content) {
    String current_section{DEFAULT_SECTION};
    for (const auto& line : split(content, '\n')) {
        parse_line(line, current_section);
    }
}

Result<void> ConfigFile::load(const Path& path) {
    std::ifstream file(path);
    if (!file) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND,
            "Cannot open config file: " + path.string());
    }

    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        return make_error<void>(ErrorCode::READ_ERROR,
            "Cannot read config file: " + path.string());
    }

    filepath_ = path;
    sections_.clear();
    add_section(DEFAULT_SECTION);
    parse(content.str());
    return {};
}

static const ConfigSection EMPTY_SECTION{};

ConfigSection& ConfigFile::section(StringView name) {
    auto it = sections_.find(name);
    if (it == sections_.end()) {
        return add_section(name);
    }
    return it->second;
}

const ConfigSection& ConfigFile::section(StringView name) const {
    auto it = sections_.find(name);
    return it != sections_.end() ? it->second : EMPTY_SECTION;
}

ConfigSection& ConfigFile::add_section(StringView name) {
    auto [it, _] = sections_.try_emplace(String(name));
    return it->second;
}

String ConfigFile::get_string(StringView section_name, StringView key, StringView default_val) const {
    return section(section_name).get_string(key, default_val);
}

void ConfigFile::set(StringView section_name, StringView key, StringView value) {
    section(section_name).set(key, value);
}

void ConfigFile::merge(const ConfigFile& other) {
    for (const auto& name : other.section_names()) {
        auto& target = section(name);
        for (const auto& [key, value] : other.section(name)) {
            target.set(key, value);
        }
    }
    if (other.is_loaded()) {
        filepath_ = other.path();
    }
}

Vector<String> ConfigFile::section_names() const {
    Vector<String> result;
    result.reserve(sections_.size());
    for (const auto& [name, _] : sections_) {
        result.push_back(name);
    }
    return result;
}

String ConfigFile::to_string() const {
    std::ostringstream oss;
    for (const auto& [name, sec] : sections_) {
        if (sec.empty()) continue;
        oss << "[" << name << "]\n";
        for (const auto& [key, value] : sec) {
            oss << key << " = " << value << "\n";
        }
        oss << "\n";
    }
    return oss.str();
}

// =============================================================================
// Environment Variable Support
// =============================================================================

Optional<String> get_env(StringView name) {
    const char* value = std::getenv(String(name).c_str());
    if (value) {
        return String(value);
    }
    return nullopt;
}

String expand_env(StringView str) {
    String result;
    result.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '$' && i + 1 < str.size() && str[i + 1] == '{') {
            size_t end = str.find('}', i + 2);
            if (end != StringView::npos) {
                if (auto value = get_env(str.substr(i + 2, end - i - 2))) {
                    result += *value;
                }
                i = end;
                continue;
            }
        }
        result += str[i];
    }

    return result;
}

// =============================================================================
// ConfigBuilder Implementation
// =============================================================================

ConfigBuilder::ConfigBuilder() : current_section_(ConfigFile::DEFAULT_SECTION) {}

ConfigBuilder& ConfigBuilder::section(StringView name) {
    current_section_ = String(name);
    config_.add_section(current_section_);
    return *this;
}

ConfigBuilder& ConfigBuilder::set(StringView key, StringView value) {
    config_.section(current_section_).set(key, value);
    return *this;
}

ConfigFile ConfigBuilder::build() {
    return std::move(config_);
}

Result<ConfigFile> load_config(const Path& path) {
    ConfigFile config;
    auto result = config.load(path);
    if (result.is_error()) {
        return make_error<ConfigFile>(result.error());
    }
    return config;
}

// =============================================================================
// Copybook DDL Configuration
// =============================================================================

ConfigFile default_copybook_config() {
    return ConfigBuilder()
        .section(sections::DDL)
            .set(keys::NAMESPACE, "bronze")
            .set(keys::DEFAULT_TABLE, "table")
        .section(sections::LOGGING)
            .set(keys::LEVEL, "INFO")
        .build();
}

Result<ConfigFile> load_copybook_config(const Path& path) {
    auto logger = logging::LogManager::instance().get_logger("config");
    ConfigFile config = default_copybook_config();

    Path source = path;
    if (source.empty()) {
        auto env_path = get_env(CONFIG_ENV_VAR);
        if (!env_path || env_path->empty()) {
            logger->debug("No configuration file given, using defaults");
            return config;
        }
        source = *env_path;
    }

    auto loaded = load_config(source);
    if (loaded.is_error()) {
        return make_error<ConfigFile>(loaded.error());
    }
    config.merge(*loaded);

    String level = config.get_string(sections::LOGGING, keys::LEVEL, "INFO");
    if (!logging::parse_log_level(level)) {
        return make_error<ConfigFile>(ErrorCode::CONFIG_INVALID_VALUE,
            std::format("Unknown log level '{}' in {}", level, source.string()));
    }

    logger->debug("Loaded configuration from {}", source.string());
    return config;
}

} // namespace copyddl::config
