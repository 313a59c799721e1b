#pragma once

/**
 * @file xdi_export.hpp
 * @brief Main header for the XDI document-stream serializer
 *
 * Converts the documents of one experimental run (start, descriptors,
 * events, stop) into a single self-describing XDI text file whose header
 * is driven by a declarative template.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <nlohmann/json.hpp>

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace xdi {

// Forward declarations
class OutputManager;
class Serializer;
struct XdiTemplate;

/**
 * @brief Nested key/value structure carried by every document
 *
 * Insertion order is kept so that templates and Python-style renderings of
 * objects come out in declaration order.
 */
using Json = nlohmann::ordered_json;

/**
 * @brief The four document kinds of a run, in lifecycle order
 */
enum class DocumentKind {
    START,
    DESCRIPTOR,
    EVENT,
    STOP
};

/**
 * @brief Template section a header field was declared in
 */
enum class HeaderSection {
    VERSIONS,
    COLUMNS,
    REQUIRED,
    OPTIONAL
};

/**
 * @brief Run lifecycle states
 */
enum class RunState {
    IDLE,
    OPEN,
    CLOSED
};

/**
 * @brief Recoverable conditions reported without interrupting the stream
 */
enum class DiagnosticKind {
    NO_ELIGIBLE_DESCRIPTOR,      ///< Event arrived before any eligible descriptor
    INELIGIBLE_RECORD,           ///< Event references a descriptor lacking the column data keys
    UNRESOLVED_REQUIRED_HEADER   ///< Required header still unresolved at stop
};

/**
 * @brief One recoverable condition raised to the surrounding system
 */
struct Diagnostic {
    DiagnosticKind kind;
    std::string message;
};

using DiagnosticCallback = std::function<void(const Diagnostic&)>;

/** Comment prefix that marks every header line of an XDI file */
inline constexpr std::string_view HEADER_PREFIX = "#";

/** Line separating header fields from the column label row */
inline constexpr std::string_view HEADER_SEPARATOR = "#----";

/** Literal written for header fields that never resolved */
inline constexpr std::string_view UNRESOLVED_LITERAL = "None";

/** Manager label under which the serializer opens its output */
inline constexpr std::string_view STREAM_DATA_LABEL = "stream_data";

inline const char* to_string(DocumentKind kind) {
    switch (kind) {
        case DocumentKind::START: return "start";
        case DocumentKind::DESCRIPTOR: return "descriptor";
        case DocumentKind::EVENT: return "event";
        case DocumentKind::STOP: return "stop";
    }
    return "unknown";
}

inline const char* to_string(RunState state) {
    switch (state) {
        case RunState::IDLE: return "idle";
        case RunState::OPEN: return "open";
        case RunState::CLOSED: return "closed";
    }
    return "unknown";
}

inline const char* to_string(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::NO_ELIGIBLE_DESCRIPTOR: return "no-eligible-descriptor";
        case DiagnosticKind::INELIGIBLE_RECORD: return "ineligible-record";
        case DiagnosticKind::UNRESOLVED_REQUIRED_HEADER: return "unresolved-required-header";
    }
    return "unknown";
}

} // namespace xdi
