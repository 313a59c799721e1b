/**
 * @file DocumentStreamReader.cpp
 * @brief JSON-lines document stream parsing
 */

#include "DocumentStreamReader.hpp"
#include "../core/XdiErrors.hpp"

namespace xdi {

DocumentStreamReader::DocumentStreamReader(std::istream& input, const std::string& source_name)
    : input_(input), source_name_(source_name) {}

std::optional<NamedDocument> DocumentStreamReader::next() {
    std::string line;
    while (std::getline(input_, line)) {
        ++line_number_;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        NamedDocument document = parse_line(line, source_name_ + ":" + std::to_string(line_number_));
        ++documents_read_;
        return document;
    }

    if (input_.bad()) {
        throw DocumentError("read error on " + source_name_ + " after line " + std::to_string(line_number_));
    }
    return std::nullopt;
}

NamedDocument DocumentStreamReader::parse_line(const std::string& line, const std::string& where) {
    Json parsed;
    try {
        parsed = Json::parse(line);
    } catch (const Json::parse_error& e) {
        throw DocumentError(where + ": invalid JSON: " + e.what());
    }

    if (!parsed.is_array() || parsed.size() != 2 || !parsed[0].is_string() || !parsed[1].is_object()) {
        throw DocumentError(where + ": expected [\"name\", {body}]");
    }
    return {parsed[0].get<std::string>(), std::move(parsed[1])};
}

} // namespace xdi
