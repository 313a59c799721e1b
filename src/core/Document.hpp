/**
 * @file Document.hpp
 * @brief Typed view of the four run document kinds
 */

#pragma once

#include "xdi_export.hpp"

#include <set>
#include <string>
#include <variant>
#include <vector>

namespace xdi {

struct RunStart {
    Json body;
    double time = 0.0;
    std::string uid;
};

struct EventDescriptor {
    Json body;
    std::string uid;
    std::set<std::string> data_keys;
};

/**
 * @brief One data record in page-of-one form
 *
 * data, timestamps, seq_num, time and uid hold one-element lists so a
 * column template "{data[det][0]}" selects this record's value.
 */
struct Event {
    Json body;
    std::string descriptor;
};

struct RunStop {
    Json body;
    double time = 0.0;
};

using Document = std::variant<RunStart, EventDescriptor, Event, RunStop>;

DocumentKind kind_of(const Document& document);
const Json& body_of(const Document& document);

/**
 * @brief Build typed documents from a (name, body) pair
 *
 * "event_page" yields one Event per row; the other names yield exactly one
 * document.
 *
 * @throws DocumentError for unknown names and missing mandatory fields
 */
std::vector<Document> parse_document(const std::string& name, const Json& body);

/**
 * @brief Names that carry no exportable data (resource, datum, datum_page)
 */
bool is_ignored_document(const std::string& name);

} // namespace xdi
