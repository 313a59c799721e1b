/**
 * @file ExportOrchestrator.cpp
 * @brief Implementation of export orchestration
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "ExportOrchestrator.hpp"
#include "DocumentStreamReader.hpp"
#include "../core/XdiErrors.hpp"
#include "../export/Serializer.hpp"

#include <fstream>

namespace xdi {

namespace {

const char* const STAGE_SERIALIZE = "Read and serialize documents";
const char* const STAGE_REPORT = "Report artifacts";

} // namespace

ExportOrchestrator::ExportOrchestrator(const CliOptions& options, std::ostream& out)
    : options_(options)
    , out_(out)
    , logger_("ExportOrchestrator")
{
}

bool ExportOrchestrator::export_stream() {
    if (options_.input == "-") {
        return export_stream(std::cin, "<stdin>");
    }

    std::ifstream input(options_.input);
    if (!input.is_open()) {
        logger_.error("Cannot open input file: " + options_.input);
        return false;
    }
    return export_stream(input, options_.input);
}

bool ExportOrchestrator::export_stream(std::istream& input, const std::string& source_name) {
    try {
        run(input, source_name);
        return true;
    } catch (const XdiError& e) {
        tracker_.completeStage(STAGE_SERIALIZE, false, e.what());
        logger_.error(e.what());
    } catch (const std::ios_base::failure& e) {
        tracker_.completeStage(STAGE_SERIALIZE, false, e.what());
        logger_.error(std::string("I/O failure: ") + e.what());
    }
    return false;
}

void ExportOrchestrator::run(std::istream& input, const std::string& source_name) {
    tracker_.startStage(STAGE_SERIALIZE);

    SerializerOptions serializer_options;
    serializer_options.file_prefix = options_.file_prefix;
    serializer_options.template_path = options_.config;

    DocumentStreamReader reader(input, source_name);
    {
        Serializer serializer(std::filesystem::path(options_.output_dir), serializer_options);

        while (auto document = reader.next()) {
            serializer(document->first, document->second);
        }

        if (serializer.state() != RunState::CLOSED) {
            logger_.warning("Input ended before the stop document; header left provisional");
        }

        serializer.close();
        artifacts_ = serializer.artifacts();

        tracker_.addStageData(STAGE_SERIALIZE, "documents", std::to_string(reader.documents_read()));
        tracker_.addStageData(STAGE_SERIALIZE, "rows", std::to_string(serializer.rows_written()));
        tracker_.addStageData(STAGE_SERIALIZE, "diagnostics", std::to_string(serializer.diagnostics().size()));
    }
    tracker_.completeStage(STAGE_SERIALIZE);

    tracker_.startStage(STAGE_REPORT);
    for (const auto& [label, ids] : artifacts_) {
        for (const auto& id : ids) {
            tracker_.trackArtifact(id, label);
            out_ << id << "\n";
        }
    }
    if (options_.summary) {
        tracker_.updateFileSizes();
        tracker_.completeStage(STAGE_REPORT);
        out_ << tracker_.getSummary();
    } else {
        tracker_.completeStage(STAGE_REPORT);
    }
    out_.flush();

    logger_.info(tracker_.getFileTrackingSummary());
}

} // namespace xdi
