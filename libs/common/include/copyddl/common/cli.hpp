// =============================================================================
// Copybook DDL - Command Line Argument Parser
// Version: 1.0.0
// =============================================================================

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <sstream>
#include <iostream>
#include <iomanip>

namespace copyddl::cli {

/**
 * @brief Command-line argument parser
 *
 * Supports long options (--name, --name=value), short options (-n value,
 * -nvalue), grouped short flags (-jd), boolean flags and positional
 * arguments. A lone "-" is taken as a positional argument (stdin).
 */
class ArgParser {
public:
    struct Option {
        std::string long_name;
        char short_name = 0;
        std::string description;
        std::string default_value;
        bool is_flag = false;
    };

    enum class Status {
        OK,
        HELP,
        ERROR
    };

    explicit ArgParser(std::string program_name = "", std::string description = "")
        : program_name_(std::move(program_name)), description_(std::move(description)) {}

    ArgParser& add_option(const std::string& long_name,
                          char short_name = 0,
                          const std::string& description = "",
                          const std::string& default_value = "") {
        options_.push_back({long_name, short_name, description, default_value, false});
        return *this;
    }

    ArgParser& add_flag(const std::string& long_name,
                        char short_name = 0,
                        const std::string& description = "") {
        options_.push_back({long_name, short_name, description, "", true});
        return *this;
    }

    ArgParser& add_positional(const std::string& name,
                              const std::string& description = "") {
        positional_names_.push_back(name);
        positional_descriptions_.push_back(description);
        return *this;
    }

    /**
     * @brief Parse command-line arguments
     * @return OK, HELP when -h/--help was given, ERROR otherwise (see error())
     */
    Status parse(int argc, const char* const argv[]) {
        if (argc > 0 && program_name_.empty()) {
            program_name_ = argv[0];
        }

        for (const auto& opt : options_) {
            if (!opt.is_flag && !opt.default_value.empty()) {
                values_[opt.long_name] = opt.default_value;
            }
        }

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                return Status::HELP;
            }

            if (arg.starts_with("--")) {
                std::string name = arg.substr(2);
                std::optional<std::string> inline_value;
                auto eq_pos = name.find('=');
                if (eq_pos != std::string::npos) {
                    inline_value = name.substr(eq_pos + 1);
                    name = name.substr(0, eq_pos);
                }

                const Option* opt = find_option(name);
                if (!opt) {
                    error_ = "Unknown option: --" + name;
                    return Status::ERROR;
                }
                if (opt->is_flag) {
                    if (inline_value) {
                        error_ = "Flag --" + name + " does not take a value";
                        return Status::ERROR;
                    }
                    flags_[opt->long_name] = true;
                    continue;
                }
                if (inline_value) {
                    values_[opt->long_name] = *inline_value;
                } else if (i + 1 < argc) {
                    values_[opt->long_name] = argv[++i];
                } else {
                    error_ = "Option --" + name + " requires a value";
                    return Status::ERROR;
                }
            } else if (arg.size() > 1 && arg[0] == '-') {
                for (size_t j = 1; j < arg.size(); ++j) {
                    const Option* opt = find_option(arg[j]);
                    if (!opt) {
                        error_ = std::string("Unknown option: -") + arg[j];
                        return Status::ERROR;
                    }
                    if (opt->is_flag) {
                        flags_[opt->long_name] = true;
                        continue;
                    }
                    if (j + 1 < arg.size()) {
                        values_[opt->long_name] = arg.substr(j + 1);
                    } else if (i + 1 < argc) {
                        values_[opt->long_name] = argv[++i];
                    } else {
                        error_ = std::string("Option -") + arg[j] + " requires a value";
                        return Status::ERROR;
                    }
                    break;
                }
            } else {
                positional_values_.push_back(arg);
            }
        }

        if (positional_values_.size() > positional_names_.size()) {
            error_ = "Unexpected argument: " + positional_values_[positional_names_.size()];
            return Status::ERROR;
        }

        return Status::OK;
    }

    [[nodiscard]] std::optional<std::string> get(const std::string& name) const {
        auto it = values_.find(name);
        if (it != values_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    [[nodiscard]] std::string get(const std::string& name, const std::string& default_val) const {
        return get(name).value_or(default_val);
    }

    [[nodiscard]] bool flag(const std::string& name) const {
        auto it = flags_.find(name);
        return it != flags_.end() && it->second;
    }

    [[nodiscard]] std::optional<std::string> positional(size_t index) const {
        if (index < positional_values_.size()) {
            return positional_values_[index];
        }
        return std::nullopt;
    }

    [[nodiscard]] const std::string& error() const { return error_; }

    void show_help(std::ostream& out = std::cout) const {
        out << "Usage: " << program_name_ << " [options]";
        for (const auto& name : positional_names_) {
            out << " [" << name << "]";
        }
        out << "\n\n";

        if (!description_.empty()) {
            out << description_ << "\n\n";
        }

        out << "Options:\n";
        for (const auto& opt : options_) {
            out << "  ";
            if (opt.short_name) {
                out << "-" << opt.short_name << ", ";
            } else {
                out << "    ";
            }
            std::string label = opt.long_name + (opt.is_flag ? "" : " <value>");
            out << "--" << std::left << std::setw(22) << label << opt.description;
            if (!opt.default_value.empty()) {
                out << " [default: " << opt.default_value << "]";
            }
            out << "\n";
        }
        out << "  -h, --help                  Show this help message\n";

        if (!positional_names_.empty()) {
            out << "\nArguments:\n";
            for (size_t i = 0; i < positional_names_.size(); ++i) {
                out << "  " << std::left << std::setw(28) << positional_names_[i]
                    << positional_descriptions_[i] << "\n";
            }
        }
    }

private:
    const Option* find_option(const std::string& name) const {
        for (const auto& opt : options_) {
            if (opt.long_name == name) return &opt;
        }
        return nullptr;
    }

    const Option* find_option(char short_name) const {
        for (const auto& opt : options_) {
            if (opt.short_name == short_name) return &opt;
        }
        return nullptr;
    }

    std::string program_name_;
    std::string description_;
    std::vector<Option> options_;
    std::vector<std::string> positional_names_;
    std::vector<std::string> positional_descriptions_;

    std::map<std::string, std::string> values_;
    std::map<std::string, bool> flags_;
    std::vector<std::string> positional_values_;
    std::string error_;
};

} // namespace copyddl::cli
