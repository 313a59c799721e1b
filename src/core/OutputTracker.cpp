/**
 * @file OutputTracker.cpp
 * @brief Implementation of artifact and stage tracking
 */

#include "OutputTracker.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace xdi {

OutputTracker::OutputTracker()
    : tracking_start_time_(std::chrono::steady_clock::now()), logger_("OutputTracker") {
}

void OutputTracker::trackArtifact(const std::string& path, const std::string& label) {
    tracked_files_.emplace_back(path, label);
    logger_.debug("[FILE TRACKED] " + path + " (label: " + label + ")");
}

void OutputTracker::startStage(const std::string& stage_name) {
    stages_.emplace_back(stage_name);
    logger_.debug("[STAGE START] " + stage_name);
}

void OutputTracker::completeStage(const std::string& stage_name, bool successful, const std::string& error) {
    ExportStage* stage = findStage(stage_name);
    if (!stage) {
        return;
    }
    stage->complete(successful, error);

    std::string message = "[STAGE COMPLETE] " + stage_name + " (" + formatDuration(stage->duration()) + ")";
    if (!successful) {
        message += " [FAILED: " + error + "]";
    }
    logger_.debug(message);
}

void OutputTracker::addStageData(const std::string& stage_name, const std::string& key, const std::string& value) {
    ExportStage* stage = findStage(stage_name);
    if (stage) {
        stage->stage_data[key] = value;
    }
}

void OutputTracker::updateFileSizes() {
    for (auto& file : tracked_files_) {
        std::error_code ec;
        if (!std::filesystem::exists(file.path, ec)) {
            file.exists = false;
            file.error_message = "File does not exist";
            continue;
        }
        auto size = std::filesystem::file_size(file.path, ec);
        if (ec) {
            file.exists = false;
            file.error_message = "Could not get file size: " + ec.message();
            continue;
        }
        file.file_size_bytes = static_cast<size_t>(size);
        file.exists = true;
        file.error_message.clear();
    }
}

std::string OutputTracker::getFileTrackingSummary() const {
    size_t present = std::count_if(tracked_files_.begin(), tracked_files_.end(),
                                   [](const TrackedArtifact& file) { return file.exists; });

    std::ostringstream oss;
    oss << "Files: " << present << "/" << tracked_files_.size()
        << " present, " << formatFileSize(getTotalFileSize()) << " total";
    return oss.str();
}

std::string OutputTracker::getTimingReport() const {
    auto total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - tracking_start_time_);

    std::ostringstream oss;
    oss << "Total time: " << formatDuration(total_time);

    if (!stages_.empty()) {
        std::chrono::milliseconds stage_time(0);
        for (const auto& stage : stages_) {
            stage_time += stage.duration();
        }
        oss << ", Stage time: " << formatDuration(stage_time);
    }
    return oss.str();
}

std::string OutputTracker::getSummary() const {
    std::ostringstream report;
    report << "=== Export Summary ===\n";

    report << "Artifacts:\n";
    if (tracked_files_.empty()) {
        report << "  [No files tracked]\n";
    }
    for (const auto& file : tracked_files_) {
        report << "  " << file.path << " (" << file.label << ")";
        if (file.exists) {
            report << " [" << formatFileSize(file.file_size_bytes) << "]";
        } else {
            report << " [MISSING: " << file.error_message << "]";
        }
        report << "\n";
    }

    report << "Stages:\n";
    for (const auto& stage : stages_) {
        report << "  " << stage.stage_name;
        if (stage.completed) {
            report << " [" << formatDuration(stage.duration()) << "]";
            if (!stage.successful) {
                report << " FAILED: " << stage.error_message;
            }
        } else {
            report << " [IN PROGRESS]";
        }
        report << "\n";
        for (const auto& [key, value] : stage.stage_data) {
            report << "    " << key << ": " << value << "\n";
        }
    }

    report << getFileTrackingSummary() << "\n";
    report << getTimingReport() << "\n";
    report << "======================\n";
    return report.str();
}

void OutputTracker::printSummary() const {
    logger_.info("\n" + getSummary());
}

size_t OutputTracker::getCompletedStageCount() const {
    return std::count_if(stages_.begin(), stages_.end(),
                         [](const ExportStage& stage) { return stage.completed; });
}

size_t OutputTracker::getTotalFileSize() const {
    size_t total = 0;
    for (const auto& file : tracked_files_) {
        if (file.exists) {
            total += file.file_size_bytes;
        }
    }
    return total;
}

std::string OutputTracker::formatDuration(std::chrono::milliseconds duration) {
    auto ms = duration.count();
    std::ostringstream oss;
    if (ms < 1000) {
        oss << ms << "ms";
    } else if (ms < 60000) {
        oss << std::fixed << std::setprecision(2) << (ms / 1000.0) << "s";
    } else {
        oss << (ms / 60000) << "m" << ((ms % 60000) / 1000) << "s";
    }
    return oss.str();
}

std::string OutputTracker::formatFileSize(size_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB"};
    double size = static_cast<double>(bytes);
    int unit = 0;

    while (size >= 1024 && unit < 3) {
        size /= 1024;
        unit++;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << size << " " << units[unit];
    return oss.str();
}

ExportStage* OutputTracker::findStage(const std::string& stage_name) {
    // Most recent stage with that name
    auto it = std::find_if(stages_.rbegin(), stages_.rend(),
                           [&stage_name](const ExportStage& stage) {
                               return stage.stage_name == stage_name;
                           });
    return (it != stages_.rend()) ? &(*it) : nullptr;
}

} // namespace xdi
