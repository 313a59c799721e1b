/**
 * @file main.cpp
 * @brief Main entry point for xdi-export
 *
 * Streams the documents of one run into an XDI file.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "cli/CommandLineInterface.hpp"
#include "cli/ExportOrchestrator.hpp"
#include <iostream>

using namespace xdi;

/**
 * @brief Main entry point
 */
int main(int argc, char* argv[]) {
    try {
        CommandLineInterface cli;

        if (!cli.parse_arguments(argc, argv)) {
            return cli.exit_requested() ? 0 : 1;  // Help/version shown, or parsing failed
        }

        cli.print_config();

        ExportOrchestrator exporter(cli.get_options());
        if (!exporter.export_stream()) {
            std::cerr << "Error: Export failed\n";
            return 1;
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}

// Example usage:
//
// ./xdi-export --input run.jsonl --output-dir out --config xdi_template.toml
// cat run.jsonl | ./xdi-export -i - -o out --file-prefix "{sample_name}-{scan_id}" --summary
