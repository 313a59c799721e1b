/**
 * @file Document.cpp
 * @brief Document parsing and event page splitting
 */

#include "Document.hpp"
#include "XdiErrors.hpp"

namespace xdi {

namespace {

// Fields of an event that become one-element lists in page-of-one form
const char* const PAGED_SCALARS[] = {"seq_num", "time", "uid"};

const Json& require_field(const Json& body, const char* field, const std::string& name) {
    if (!body.is_object()) {
        throw DocumentError(name + " document must be an object");
    }
    auto it = body.find(field);
    if (it == body.end()) {
        throw DocumentError(name + " document has no '" + std::string(field) + "'");
    }
    return *it;
}

double require_time(const Json& body, const std::string& name) {
    const Json& time = require_field(body, "time", name);
    if (!time.is_number()) {
        throw DocumentError(name + " document 'time' must be a number");
    }
    return time.get<double>();
}

std::string require_string(const Json& body, const char* field, const std::string& name) {
    const Json& value = require_field(body, field, name);
    if (!value.is_string()) {
        throw DocumentError(name + " document '" + std::string(field) + "' must be a string");
    }
    return value.get<std::string>();
}

Event single_event(const Json& body) {
    const std::string name = "event";
    Event event;
    event.descriptor = require_string(body, "descriptor", name);
    if (!require_field(body, "data", name).is_object()) {
        throw DocumentError("event document 'data' must be an object");
    }

    event.body = body;
    for (auto section : {"data", "timestamps"}) {
        auto it = event.body.find(section);
        if (it == event.body.end() || !it->is_object()) continue;
        for (auto& entry : it->items()) {
            entry.value() = Json::array({entry.value()});
        }
    }
    for (const char* field : PAGED_SCALARS) {
        auto it = event.body.find(field);
        if (it != event.body.end()) {
            *it = Json::array({*it});
        }
    }
    return event;
}

std::vector<Document> split_event_page(const Json& body) {
    const std::string name = "event_page";
    std::string descriptor = require_string(body, "descriptor", name);
    const Json& data = require_field(body, "data", name);
    if (!data.is_object()) {
        throw DocumentError("event_page document 'data' must be an object");
    }

    // Row count: length of the first column list, or of seq_num for empty data
    size_t rows = 0;
    bool sized = false;
    auto measure = [&](const Json& column, const std::string& what) {
        if (!column.is_array()) {
            throw DocumentError("event_page '" + what + "' must be a list");
        }
        if (!sized) {
            rows = column.size();
            sized = true;
        } else if (column.size() != rows) {
            throw DocumentError("event_page '" + what + "' has " + std::to_string(column.size()) +
                                " entries, expected " + std::to_string(rows));
        }
    };
    for (const auto& [key, column] : data.items()) {
        measure(column, "data." + key);
    }
    auto seq = body.find("seq_num");
    if (seq != body.end()) {
        measure(*seq, "seq_num");
    }

    std::vector<Document> events;
    events.reserve(rows);
    for (size_t row = 0; row < rows; ++row) {
        Event event;
        event.descriptor = descriptor;
        event.body = Json::object();

        for (const auto& [key, value] : body.items()) {
            if (key == "data" || key == "timestamps" || key == "filled") {
                Json section = Json::object();
                if (value.is_object()) {
                    for (const auto& [column, entries] : value.items()) {
                        if (entries.is_array() && row < entries.size()) {
                            section[column] = Json::array({entries[row]});
                        }
                    }
                }
                event.body[key] = std::move(section);
            } else if (key == "seq_num" || key == "time" || key == "uid") {
                if (value.is_array() && row < value.size()) {
                    event.body[key] = Json::array({value[row]});
                }
            } else {
                event.body[key] = value;
            }
        }
        events.emplace_back(std::move(event));
    }
    return events;
}

} // namespace

DocumentKind kind_of(const Document& document) {
    switch (document.index()) {
        case 0: return DocumentKind::START;
        case 1: return DocumentKind::DESCRIPTOR;
        case 2: return DocumentKind::EVENT;
        default: return DocumentKind::STOP;
    }
}

const Json& body_of(const Document& document) {
    return std::visit([](const auto& doc) -> const Json& { return doc.body; }, document);
}

bool is_ignored_document(const std::string& name) {
    return name == "resource" || name == "datum" || name == "datum_page";
}

std::vector<Document> parse_document(const std::string& name, const Json& body) {
    if (name == "start") {
        RunStart start;
        start.time = require_time(body, name);
        start.uid = require_string(body, "uid", name);
        start.body = body;
        return {std::move(start)};
    }

    if (name == "descriptor") {
        EventDescriptor descriptor;
        descriptor.uid = require_string(body, "uid", name);
        const Json& data_keys = require_field(body, "data_keys", name);
        if (!data_keys.is_object()) {
            throw DocumentError("descriptor document 'data_keys' must be an object");
        }
        for (const auto& [key, unused] : data_keys.items()) {
            descriptor.data_keys.insert(key);
        }
        descriptor.body = body;
        return {std::move(descriptor)};
    }

    if (name == "event") {
        return {single_event(body)};
    }

    if (name == "event_page") {
        return split_event_page(body);
    }

    if (name == "stop") {
        RunStop stop;
        stop.time = require_time(body, name);
        stop.body = body;
        return {std::move(stop)};
    }

    throw DocumentError("unknown document name '" + name + "'");
}

} // namespace xdi
