/**
 * @file SimpleCommandLineParser.hpp
 * @brief Lightweight command-line parser for locus-cli
 */

#pragma once

#include <cctype>
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <sstream>
#include <utility>
#include <iostream>

namespace locus {

/**
 * @brief Simple command-line argument parser
 *
 * Supports --long VALUE, --long=VALUE, -s VALUE, flags and positional
 * arguments. Values that look like negative numbers ("-3.7") are taken
 * as values, not options, so western longitudes can be passed directly.
 */
class SimpleCommandLineParser {
public:
    struct Option {
        std::string long_name;
        std::string short_name;
        std::string description;
        bool has_value = true;
    };

    SimpleCommandLineParser(const std::string& program_name, const std::string& description)
        : program_name_(program_name), description_(description) {}

    void add_option(const std::string& long_name, const std::string& short_name,
                   const std::string& description) {
        register_option(Option{long_name, short_name, description, true});
    }

    void add_flag(const std::string& long_name, const std::string& short_name,
                  const std::string& description) {
        register_option(Option{long_name, short_name, description, false});
    }

    // Parse command line arguments
    bool parse(int argc, char* argv[]) {
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) {
            args.push_back(argv[i]);
        }
        return parse(args);
    }

    bool parse(const std::vector<std::string>& args) {
        args_ = args;
        parsed_values_.clear();
        positional_args_.clear();
        help_requested_ = false;

        // Check for help request
        for (const auto& arg : args_) {
            if (arg == "--help" || arg == "-h") {
                help_requested_ = true;
                return false;
            }
        }

        // Parse arguments
        for (size_t i = 0; i < args_.size(); ++i) {
            const std::string& arg = args_[i];

            if (arg.starts_with("--")) {
                std::string option_name = arg.substr(2);

                // Handle --option=value format
                size_t eq_pos = option_name.find('=');
                std::string value;
                bool has_inline_value = false;
                if (eq_pos != std::string::npos) {
                    value = option_name.substr(eq_pos + 1);
                    option_name = option_name.substr(0, eq_pos);
                    has_inline_value = true;
                }

                auto it = options_.find(option_name);
                if (it == options_.end()) {
                    std::cerr << "Unknown option: --" << option_name << std::endl;
                    return false;
                }

                const auto& option = it->second;
                if (option.has_value) {
                    if (!has_inline_value) {
                        if (i + 1 >= args_.size() || is_option(args_[i + 1])) {
                            std::cerr << "Option --" << option_name << " requires a value" << std::endl;
                            return false;
                        }
                        value = args_[++i];
                    }
                    parsed_values_[option_name] = value;
                } else {
                    parsed_values_[option_name] = "true";
                }

            } else if (is_option(arg)) {
                std::string short_name = arg.substr(1);

                auto it = short_to_long_.find(short_name);
                if (it == short_to_long_.end()) {
                    std::cerr << "Unknown option: -" << short_name << std::endl;
                    return false;
                }

                const std::string option_name = it->second;
                const auto& option = options_[option_name];

                if (option.has_value) {
                    if (i + 1 >= args_.size() || is_option(args_[i + 1])) {
                        std::cerr << "Option -" << short_name << " requires a value" << std::endl;
                        return false;
                    }
                    parsed_values_[option_name] = args_[++i];
                } else {
                    parsed_values_[option_name] = "true";
                }
            } else {
                // Positional argument
                positional_args_.push_back(arg);
            }
        }

        return true;
    }

    bool help_requested() const { return help_requested_; }

    // Get parsed values
    std::optional<std::string> get(const std::string& option_name) const {
        auto it = parsed_values_.find(option_name);
        if (it != parsed_values_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    bool get_flag(const std::string& option_name) const {
        auto value = get(option_name);
        return value.has_value() && value.value() == "true";
    }

    template<typename T>
    std::optional<T> get_as(const std::string& option_name) const {
        auto value = get(option_name);
        if (!value.has_value()) {
            return std::nullopt;
        }

        std::istringstream iss(value.value());
        T result;
        if (iss >> result && (iss >> std::ws).eof()) {
            return result;
        }
        return std::nullopt;
    }

    const std::vector<std::string>& get_positional() const {
        return positional_args_;
    }

    void show_help() const {
        std::cout << description_ << "\n\n";

        std::cout << "USAGE:\n";
        std::cout << "    " << program_name_ << " COMMAND [ARGUMENTS] [OPTIONS]\n\n";

        std::cout << "COMMANDS:\n";
        std::cout << "    geocode NAME             Resolve a place name to coordinates\n";
        std::cout << "    search QUERY             Autocomplete against the built-in location list\n";
        std::cout << "    nearby                   Postal code areas around --lat/--lng or a place name\n";
        std::cout << "    reverse                  Nearest postal code area to --lat/--lng\n";
        std::cout << "    postal CODE              Look up a postal code\n";
        std::cout << "    city NAME                Postal codes of a city\n";
        std::cout << "    region NAME              Cities and postal code ranges of a region\n";
        std::cout << "    validate CODE            Check a postal code against the country format\n\n";

        std::cout << "OPTIONS:\n";
        for (const auto& name : option_order_) {
            print_option(options_.at(name));
        }
        std::cout << "    -h, --help                   Show this help\n\n";

        std::cout << "EXAMPLES:\n";
        std::cout << "    " << program_name_ << " geocode \"München\"\n";
        std::cout << "    " << program_name_ << " nearby --lat 52.52 --lng 13.405 --radius 10 --country DE,AT\n";
        std::cout << "    " << program_name_ << " city Berlin --limit 5\n";
        std::cout << "    " << program_name_ << " validate \"SW1A 1AA\" --country GB\n\n";

        std::cout << "OUTPUT:\n";
        std::cout << "    Results are printed to stdout as JSON; logs go to stderr.\n";
    }

private:
    // "-x" is an option, "-3.7" is a negative number
    static bool is_option(const std::string& arg) {
        if (arg.size() < 2 || arg[0] != '-') {
            return false;
        }
        return !(std::isdigit(static_cast<unsigned char>(arg[1])) || arg[1] == '.');
    }

    void register_option(Option option) {
        if (options_.find(option.long_name) == options_.end()) {
            option_order_.push_back(option.long_name);
        }
        if (!option.short_name.empty()) {
            short_to_long_[option.short_name] = option.long_name;
        }
        options_[option.long_name] = std::move(option);
    }

    static void print_option(const Option& option) {
        std::string usage = option.short_name.empty() ? "    " : "-" + option.short_name + ", ";
        usage += "--" + option.long_name;
        if (option.has_value) {
            usage += " VALUE";
        }
        std::cout << "    " << usage;
        if (usage.size() < 28) {
            std::cout << std::string(29 - usage.size(), ' ');
        } else {
            std::cout << "  ";
        }
        std::cout << option.description << "\n";
    }

    std::string program_name_;
    std::string description_;
    std::map<std::string, Option> options_;
    std::vector<std::string> option_order_;
    std::map<std::string, std::string> short_to_long_;
    std::vector<std::string> args_;
    std::map<std::string, std::string> parsed_values_;
    std::vector<std::string> positional_args_;
    bool help_requested_ = false;
};

} // namespace locus
