/**
 * @file MemoryBufferManager.hpp
 * @brief Output manager keeping every artifact in memory
 */

#pragma once

#include "OutputManager.hpp"

#include <memory>
#include <sstream>

namespace xdi {

/**
 * @brief In-memory buffers; artifact ids are the names given to open()
 */
class MemoryBufferManager : public OutputManager {
public:
    MemoryBufferManager() = default;

    MemoryBufferManager(const MemoryBufferManager&) = delete;
    MemoryBufferManager& operator=(const MemoryBufferManager&) = delete;

    std::ostream& open(const std::string& label, const std::string& name, OpenMode mode) override;
    void close() override;
    ArtifactMap artifacts() const override { return artifacts_; }

    std::string read_artifact(const std::string& id) override { return contents(id); }
    std::ostream& open_replacement(const std::string& id) override;
    void commit_replacement(const std::string& id) override;

    /**
     * @brief Text written to a buffer so far
     * @throws OutputError for unknown ids
     */
    std::string contents(const std::string& id) const;

    bool closed() const { return closed_; }

private:
    ArtifactMap artifacts_;
    std::map<std::string, std::unique_ptr<std::ostringstream>> buffers_;
    std::map<std::string, std::unique_ptr<std::ostringstream>> replacements_;
    bool closed_ = false;
};

} // namespace xdi
