/**
 * @file OutputTracker.hpp
 * @brief Artifact and stage tracking for export runs
 *
 * Records the files an export produced and how long each stage of the
 * export took, and renders both as the summary printed by xdi-export.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "Logger.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace xdi {

/**
 * @brief Information about one produced artifact
 */
struct TrackedArtifact {
    std::string path;
    std::string label;          ///< Manager label, e.g. "stream_data"
    size_t file_size_bytes = 0;
    bool exists = false;
    std::string error_message;

    TrackedArtifact(const std::string& artifact_path, const std::string& artifact_label)
        : path(artifact_path), label(artifact_label) {}
};

/**
 * @brief One timed stage of an export ("read documents", "serialize", ...)
 */
struct ExportStage {
    std::string stage_name;
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point end_time;
    bool completed = false;
    bool successful = false;
    std::string error_message;
    std::map<std::string, std::string> stage_data;

    explicit ExportStage(const std::string& name)
        : stage_name(name), start_time(std::chrono::steady_clock::now()) {}

    void complete(bool success = true, const std::string& error = "") {
        end_time = std::chrono::steady_clock::now();
        completed = true;
        successful = success;
        error_message = error;
    }

    std::chrono::milliseconds duration() const {
        if (!completed) return std::chrono::milliseconds(0);
        return std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
    }
};

class OutputTracker {
public:
    OutputTracker();

    // Artifact tracking
    void trackArtifact(const std::string& path, const std::string& label);

    // Stage tracking
    void startStage(const std::string& stage_name);
    void completeStage(const std::string& stage_name, bool successful = true, const std::string& error = "");
    void addStageData(const std::string& stage_name, const std::string& key, const std::string& value);

    /**
     * @brief Refresh existence and size of every tracked artifact from the file system
     */
    void updateFileSizes();

    // Object state queries
    std::string getFileTrackingSummary() const;
    std::string getTimingReport() const;

    /**
     * @brief Multi-line report: artifacts with sizes, stages with durations and data
     */
    std::string getSummary() const;

    /**
     * @brief Log getSummary() at INFO
     */
    void printSummary() const;

    size_t getTrackedFileCount() const { return tracked_files_.size(); }
    size_t getCompletedStageCount() const;
    size_t getTotalFileSize() const;
    const std::vector<TrackedArtifact>& getTrackedFiles() const { return tracked_files_; }
    const std::vector<ExportStage>& getStages() const { return stages_; }

    static std::string formatDuration(std::chrono::milliseconds duration);
    static std::string formatFileSize(size_t bytes);

private:
    std::vector<TrackedArtifact> tracked_files_;
    std::vector<ExportStage> stages_;
    std::chrono::steady_clock::time_point tracking_start_time_;
    mutable Logger logger_;

    ExportStage* findStage(const std::string& stage_name);
};

} // namespace xdi
