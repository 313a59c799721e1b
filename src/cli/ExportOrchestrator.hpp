/**
 * @file ExportOrchestrator.hpp
 * @brief Drives a document stream through a Serializer for xdi-export
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "CommandLineInterface.hpp"
#include "../core/Logger.hpp"
#include "../core/OutputTracker.hpp"
#include "../export/OutputManager.hpp"

#include <iostream>
#include <string>

namespace xdi {

/**
 * @brief Orchestrates one export run
 *
 * Responsibilities:
 * - Open the input stream and feed every document to a Serializer
 * - Report the produced artifacts on the output stream
 * - Time each stage and, on request, print the tracking summary
 */
class ExportOrchestrator {
public:
    /**
     * @param options Parsed command-line options
     * @param out Stream receiving artifact paths and the summary
     */
    explicit ExportOrchestrator(const CliOptions& options, std::ostream& out = std::cout);

    /**
     * @brief Export the configured input
     * @return true on success; failures are logged at ERROR
     */
    bool export_stream();

    /**
     * @brief Export documents read from an already-open stream
     */
    bool export_stream(std::istream& input, const std::string& source_name);

    const OutputTracker& get_output_tracker() const { return tracker_; }
    const ArtifactMap& get_artifacts() const { return artifacts_; }

private:
    void run(std::istream& input, const std::string& source_name);

    CliOptions options_;
    std::ostream& out_;
    OutputTracker tracker_;
    ArtifactMap artifacts_;
    Logger logger_;

    ExportOrchestrator(const ExportOrchestrator&) = delete;
    ExportOrchestrator& operator=(const ExportOrchestrator&) = delete;
};

} // namespace xdi
