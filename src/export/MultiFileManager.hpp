/**
 * @file MultiFileManager.hpp
 * @brief Output manager writing one file per artifact into a directory
 */

#pragma once

#include "OutputManager.hpp"
#include "../core/Logger.hpp"

#include <filesystem>
#include <fstream>
#include <memory>

namespace xdi {

/**
 * @brief Files under a directory; artifact ids are full paths
 *
 * Replacements are written to the artifact path with its extension
 * replaced by ".updating" and renamed over the artifact on commit.
 */
class MultiFileManager : public OutputManager {
public:
    /**
     * @throws OutputError if the directory cannot be created
     */
    explicit MultiFileManager(const std::filesystem::path& directory);
    ~MultiFileManager() override;

    MultiFileManager(const MultiFileManager&) = delete;
    MultiFileManager& operator=(const MultiFileManager&) = delete;

    std::ostream& open(const std::string& label, const std::string& name, OpenMode mode) override;
    void close() override;
    ArtifactMap artifacts() const override { return artifacts_; }

    std::string read_artifact(const std::string& id) override;
    std::ostream& open_replacement(const std::string& id) override;
    void commit_replacement(const std::string& id) override;

    const std::filesystem::path& directory() const { return directory_; }

    static std::filesystem::path replacement_path(const std::string& id);

private:
    bool is_artifact(const std::string& id) const;
    void close_stream(std::ofstream& stream, const std::string& path);

    std::filesystem::path directory_;
    ArtifactMap artifacts_;
    std::map<std::string, std::unique_ptr<std::ofstream>> open_files_;
    std::map<std::string, std::unique_ptr<std::ofstream>> replacements_;
    Logger logger_;
};

} // namespace xdi
