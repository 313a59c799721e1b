/**
 * @file XdiErrors.hpp
 * @brief Exception hierarchy for template, document, rendering and output failures
 *
 * Every fatal condition raised while serializing a run derives from XdiError,
 * so callers can catch one type at the process boundary. Recoverable
 * conditions are not exceptions; see Diagnostic in xdi_export.hpp.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace xdi {

/**
 * @brief Base class for all serializer failures
 */
class XdiError : public std::runtime_error {
public:
    XdiError(const std::string& category, const std::string& detail)
        : std::runtime_error(category + ": " + detail), detail_(detail) {}

    /** Message without the category prefix, for re-wrapping with context */
    const std::string& detail() const { return detail_; }

private:
    std::string detail_;
};

/**
 * @brief Template configuration is absent, ambiguous or malformed
 *
 * Raised before any output is produced.
 */
class ConfigError : public XdiError {
public:
    explicit ConfigError(const std::string& message)
        : XdiError("Configuration error", message) {}
};

/**
 * @brief Document received out of run lifecycle order
 */
class SequenceError : public XdiError {
public:
    explicit SequenceError(const std::string& message)
        : XdiError("Sequence error", message) {}
};

/**
 * @brief A value-template cannot be rendered with the data present
 *
 * Covers malformed templates, present-but-wrong-typed values and
 * unsupported format specifiers. A merely absent value is not a
 * RenderError; the renderer reports it as unresolved.
 */
class RenderError : public XdiError {
public:
    explicit RenderError(const std::string& message)
        : XdiError("Render error", message) {}
};

/**
 * @brief A document lacks a field the serializer cannot work without
 */
class DocumentError : public XdiError {
public:
    explicit DocumentError(const std::string& message)
        : XdiError("Document error", message) {}
};

/**
 * @brief The output manager could not open, read, write or replace a resource
 */
class OutputError : public XdiError {
public:
    explicit OutputError(const std::string& message)
        : XdiError("Output error", message) {}
};

} // namespace xdi
