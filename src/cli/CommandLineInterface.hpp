/**
 * @file CommandLineInterface.hpp
 * @brief Command line interface for locus-cli
 */

#pragma once

#include "locus.hpp"
#include "SimpleCommandLineParser.hpp"
#include <optional>
#include <string>
#include <vector>

namespace locus {

class LocusServices;

/**
 * @brief Parses arguments into a LocusConfig and a command, then runs it
 */
class CommandLineInterface {
public:
    enum class Command {
        GEOCODE,
        SEARCH,
        NEARBY,
        REVERSE,
        POSTAL,
        CITY,
        REGION,
        LOOKUP,
        VALIDATE
    };

    CommandLineInterface() = default;

    /**
     * @brief Parse command line arguments
     * @param argc Argument count
     * @param argv Argument vector
     * @return true if a command should run; false if help/version was shown
     *         or parsing failed (see exit_code())
     */
    bool parse_arguments(int argc, char* argv[]);

    bool parse_arguments(const std::vector<std::string>& args);

    const LocusConfig& get_config() const { return config_; }
    Command command() const { return command_; }
    const std::string& argument() const { return argument_; }

    /**
     * @brief Exit status to use when parse_arguments() returned false
     */
    int exit_code() const { return exit_code_; }

    /**
     * @brief Run the parsed command, printing JSON to stdout
     * @return Process exit status
     */
    int run(LocusServices& services) const;

    static std::optional<Command> parse_command(const std::string& name);

    /**
     * @brief Print the current configuration
     */
    void print_config() const;

private:
    LocusConfig config_;
    Command command_ = Command::GEOCODE;
    std::string argument_;
    std::optional<double> lat_;
    std::optional<double> lng_;
    std::optional<double> radius_km_;
    std::optional<int> limit_;
    std::vector<std::string> countries_;
    int exit_code_ = 0;

    bool apply_options(const SimpleCommandLineParser& parser);
    void apply_logging_options(const SimpleCommandLineParser& parser);

    // Configuration file methods
    bool create_default_config_file(const std::string& filename);
    bool load_config_file(const std::string& filename);

    std::string country_or_default() const;
};

} // namespace locus
