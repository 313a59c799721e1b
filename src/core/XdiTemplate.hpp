/**
 * @file XdiTemplate.hpp
 * @brief Parsed XDI template and its loader
 *
 * A template declares, in order:
 *
 *     [versions]          name -> literal line ("XDI" is the first file line)
 *     [columns]           name -> {column_label, data_key, column_data, units?}
 *     [required_headers]  name -> {data?, ...metadata}
 *     [optional_headers]  name -> {data?, ...metadata}
 *
 * The template is loaded once per run and is immutable afterwards.
 */

#pragma once

#include "xdi_export.hpp"

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace xdi {

/**
 * @brief One data column: header label and per-row value
 */
struct ColumnDefinition {
    std::string name;                   ///< Header field name, e.g. "Column.1"
    std::string label_template;         ///< column_label
    std::string data_key;               ///< Descriptor data key the column reads
    std::string data_template;          ///< column_data, rendered per record
    std::optional<std::string> units;   ///< Appended to the rendered label
};

/**
 * @brief One required or optional header field
 */
struct HeaderFieldTemplate {
    std::string name;
    std::optional<std::string> value_template;  ///< "data"; absent means never rendered
    Json metadata;                              ///< Full entry (type, units, use, ...)
};

/**
 * @brief One static version line
 */
struct VersionLine {
    std::string name;
    std::string literal;
};

struct XdiTemplate {
    std::vector<VersionLine> versions;
    std::vector<ColumnDefinition> columns;
    std::vector<HeaderFieldTemplate> required_headers;
    std::vector<HeaderFieldTemplate> optional_headers;

    /**
     * @brief Data keys a descriptor must declare to be eligible for row emission
     */
    std::set<std::string> required_data_keys() const;

    const VersionLine* find_version(const std::string& name) const;

    /**
     * @brief All header field names in buffer order (versions, columns, required, optional)
     */
    std::vector<std::string> field_names() const;
};

/**
 * @brief Builds XdiTemplate instances from TOML or JSON sources
 */
class TemplateLoader {
public:
    /**
     * @brief Load from exactly one of an inline text or a file path
     * @throws ConfigError if neither or both are given, or the template is invalid
     */
    static XdiTemplate load(const std::optional<std::string>& inline_text,
                            const std::optional<std::string>& path);

    /**
     * @brief Parse inline text; JSON if it starts with '{', TOML otherwise
     */
    static XdiTemplate from_text(const std::string& text);

    /**
     * @brief Parse a file; JSON if the path ends in ".json", TOML otherwise
     */
    static XdiTemplate from_file(const std::string& path);

    /**
     * @brief Validate an already-parsed tree and build the template
     * @param source_name Name used in error messages
     */
    static XdiTemplate from_json(const Json& tree, const std::string& source_name = "<inline>");
};

} // namespace xdi
