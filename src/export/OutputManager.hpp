/**
 * @file OutputManager.hpp
 * @brief Contract between the serializer and whatever stores its output
 *
 * The serializer never creates files itself. It asks a manager for a
 * named text sink under a label, and at finalization asks the same
 * manager to replace that artifact with a rewritten copy.
 */

#pragma once

#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace xdi {

/**
 * @brief How open() treats an existing resource
 */
enum class OpenMode {
    EXCLUSIVE_CREATE,   ///< "x": fail if it exists
    TRUNCATE,           ///< "w": replace contents
    APPEND              ///< "a": keep contents, write at the end
};

/**
 * @brief Parse a Python-style mode string ("x", "xt", "w", "wt", "a", "at")
 * @throws OutputError for anything else
 */
OpenMode parse_open_mode(const std::string& mode);

using ArtifactMap = std::map<std::string, std::vector<std::string>>;

class OutputManager {
public:
    virtual ~OutputManager() = default;

    /**
     * @brief Open a writable text sink
     * @param label Artifact group, e.g. "stream_data"
     * @param name Resource name relative to the manager
     * @return Stream owned by the manager, valid until close() or commit_replacement()
     * @throws OutputError if the resource cannot be opened
     */
    virtual std::ostream& open(const std::string& label, const std::string& name, OpenMode mode) = 0;

    /**
     * @brief Flush and close every sink; artifacts stay listed
     * @throws OutputError if buffered output could not be written
     */
    virtual void close() = 0;

    /**
     * @brief Produced resources by label, in creation order
     */
    virtual ArtifactMap artifacts() const = 0;

    // ========================================================================
    // Rewrite contract used by finalization
    // ========================================================================

    /**
     * @brief Current contents of an artifact (flushing its sink first if still open)
     */
    virtual std::string read_artifact(const std::string& id) = 0;

    /**
     * @brief Fresh temporary sink that will replace the artifact on commit
     */
    virtual std::ostream& open_replacement(const std::string& id) = 0;

    /**
     * @brief Replace the artifact with its temporary sink in one step
     *
     * Closes the artifact's original sink if still open.
     */
    virtual void commit_replacement(const std::string& id) = 0;
};

} // namespace xdi
