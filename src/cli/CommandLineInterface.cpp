/**
 * @file CommandLineInterface.cpp
 * @brief Command line interface implementation
 */

#include "CommandLineInterface.hpp"
#include "SimpleCommandLineParser.hpp"
#include "../core/Logger.hpp"
#include "version.h"

#include <cstdlib>
#include <iostream>

namespace xdi {

bool CommandLineInterface::parse_arguments(int argc, char* argv[]) {
    SimpleCommandLineParser parser("xdi-export",
        "Reads the documents of one experimental run (start, descriptors, events,\n"
        "stop) and writes a single XDI file whose header is filled in from a\n"
        "template as the documents arrive. The file is readable while the run is\n"
        "in progress and its header is rewritten with the final values at stop.");

    parser.add_option("input", "i", "JSON-lines document stream, - for stdin", true);
    parser.add_option("output-dir", "o", "Directory for the XDI file", false, ".");
    parser.add_option("file-prefix", "p", "File name template rendered against the start document", false, "{uid}-");
    parser.add_option("config", "c", "Template file (TOML or .json); overrides md[\"suitcase-xdi\"]");

    parser.add_option("log-level", "", "Logging level: 1=ERROR, 2=WARNING (default), 3=INFO, 4=DETAILED, 5=DEBUG, 6=TRACE");
    parser.add_option("log-config", "", "Per-component levels, e.g. \"3,Serializer=5,HeaderResolver=6\"");
    parser.add_option("log-file", "", "Also log to file (append if exists)");
    parser.add_flag("summary", "s", "Print artifact sizes and stage timings when done");
    parser.add_flag("version", "", "Show version information");

    // --version needs no other options
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--version") {
            std::cout << "xdi-export v" << XDI_VERSION_STRING << std::endl;
            std::cout << "XDI document-stream serializer" << std::endl;
            std::cout << "Copyright (c) 2025 Matthew Block" << std::endl;
            exit_requested_ = true;
            return false;
        }
    }

    if (!parser.parse(argc, argv)) {
        exit_requested_ = parser.help_requested();
        return false;
    }

    if (!parser.get_positional().empty()) {
        std::cerr << "Unexpected argument: " << parser.get_positional().front() << std::endl;
        return false;
    }

    options_.input = parser.get("input").value_or("");
    options_.output_dir = parser.get("output-dir").value_or(".");
    options_.file_prefix = parser.get("file-prefix").value_or("{uid}-");
    options_.config = parser.get("config");
    options_.summary = parser.get_flag("summary");

    if (options_.input.empty()) {
        std::cerr << "Option --input must not be empty" << std::endl;
        return false;
    }
    if (options_.file_prefix.empty()) {
        std::cerr << "Option --file-prefix must not be empty" << std::endl;
        return false;
    }

    return apply_logging_options(parser);
}

bool CommandLineInterface::apply_logging_options(const SimpleCommandLineParser& parser) {
    // Priority: CLI > environment > defaults
    const char* env_log_level = std::getenv("XDI_LOG_LEVEL");
    if (env_log_level && !Logger::parseLogConfig(env_log_level)) {
        std::cerr << "Ignoring invalid XDI_LOG_LEVEL: " << env_log_level << std::endl;
    }

    if (auto value = parser.get("log-level")) {
        if (value->find('=') != std::string::npos || !Logger::parseLogConfig(value.value())) {
            std::cerr << "Invalid --log-level: " << value.value() << " (expected 1-6)" << std::endl;
            return false;
        }
    }

    if (auto value = parser.get("log-config")) {
        if (!Logger::parseLogConfig(value.value())) {
            std::cerr << "Invalid --log-config: " << value.value() << std::endl;
            return false;
        }
    }

    const char* env_log_file = std::getenv("XDI_LOG_FILE");
    if (env_log_file) {
        options_.log_file = std::string(env_log_file);
    }
    if (auto value = parser.get("log-file")) {
        options_.log_file = value.value();
    }
    if (options_.log_file && !Logger::setDefaultLogFile(options_.log_file)) {
        return false;
    }

    return true;
}

void CommandLineInterface::print_config() const {
    Logger logger("CommandLineInterface");
    logger.detailed("Input: " + (options_.input == "-" ? std::string("<stdin>") : options_.input));
    logger.detailed("Output directory: " + options_.output_dir);
    logger.detailed("File prefix: " + options_.file_prefix);
    logger.detailed("Template: " + options_.config.value_or("from start document"));
    if (options_.log_file) {
        logger.detailed("Log file: " + *options_.log_file);
    }
}

} // namespace xdi
