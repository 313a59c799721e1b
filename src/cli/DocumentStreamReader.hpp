/**
 * @file DocumentStreamReader.hpp
 * @brief Reads a run's documents from a JSON-lines stream
 *
 * Each non-blank line is a JSON array ["name", {body}]. Documents are
 * produced one at a time so a run can be exported while it is still
 * being written.
 */

#pragma once

#include "../export/Serializer.hpp"

#include <istream>
#include <optional>
#include <string>

namespace xdi {

class DocumentStreamReader {
public:
    DocumentStreamReader(std::istream& input, const std::string& source_name);

    /**
     * @brief Next document, or nullopt at end of stream
     * @throws DocumentError naming the source and line for malformed lines
     */
    std::optional<NamedDocument> next();

    size_t line_number() const { return line_number_; }
    size_t documents_read() const { return documents_read_; }

    /**
     * @brief Parse one stream line
     * @param where Location used in error messages
     */
    static NamedDocument parse_line(const std::string& line, const std::string& where);

private:
    std::istream& input_;
    std::string source_name_;
    size_t line_number_ = 0;
    size_t documents_read_ = 0;
};

} // namespace xdi
