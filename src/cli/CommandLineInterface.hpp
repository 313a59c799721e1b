/**
 * @file CommandLineInterface.hpp
 * @brief Command line interface for xdi-export
 */

#pragma once

#include "SimpleCommandLineParser.hpp"

#include <optional>
#include <string>

namespace xdi {

/**
 * @brief Options of one xdi-export invocation
 */
struct CliOptions {
    std::string input;                          ///< JSON-lines path, "-" for stdin
    std::string output_dir = ".";
    std::string file_prefix = "{uid}-";
    std::optional<std::string> config;          ///< Template path overriding the start document
    std::optional<std::string> log_file;
    bool summary = false;
};

/**
 * @brief Parses arguments and applies logging options
 */
class CommandLineInterface {
public:
    CommandLineInterface() = default;

    /**
     * @brief Parse command line arguments
     * @return true if the export should run; false after help/version or on error
     */
    bool parse_arguments(int argc, char* argv[]);

    const CliOptions& get_options() const { return options_; }

    /**
     * @brief True when parse_arguments() stopped because help or version was printed
     */
    bool exit_requested() const { return exit_requested_; }

    void print_config() const;

private:
    bool apply_logging_options(const SimpleCommandLineParser& parser);

    CliOptions options_;
    bool exit_requested_ = false;
};

} // namespace xdi
