/**
 * @file PlaceholderRenderer.hpp
 * @brief Replacement-field substitution for header and column value-templates
 *
 * Value-templates embed references into a document's nested key/value
 * structure using replacement fields:
 *
 * - {md[XDI][Element_symbol]}: nested object lookup
 * - {data[det][0]}: array element (digit keys index arrays)
 * - {plan.name}: attribute-style lookup, same as [name]
 * - {time:%Y-%m-%d}: strftime pattern applied to an epoch timestamp
 * - {data[I0][0]:.3f}: number formatting, see ValueFormatter.hpp
 * - {md[sample]!r}: repr conversion before formatting
 *
 * Escaping: "{{" and "}}" render as literal braces.
 *
 * A reference to a path absent from the document does not fail; the
 * render comes back unresolved so that a later document can supply it.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "xdi_export.hpp"

#include <optional>
#include <string>
#include <vector>

namespace xdi {

/**
 * @brief Outcome of rendering one value-template
 */
struct RenderResult {
    std::optional<std::string> text;    ///< Rendered text, empty when unresolved
    std::string missing_reference;      ///< First reference that was absent (for logging)

    bool resolved() const { return text.has_value(); }
};

/**
 * @brief Stateless renderer for value-templates
 */
class PlaceholderRenderer {
public:
    /**
     * @brief Render a value-template against a document
     * @param value_template Template text with replacement fields
     * @param document Object whose top-level keys are the first names of references
     * @return Resolved text, or an unresolved result naming the missing reference
     * @throws RenderError for malformed templates and wrong-typed values
     */
    static RenderResult render(const std::string& value_template, const Json& document);

    /**
     * @brief Render a value-template that must resolve
     * @param context Description used in the error message ("file prefix", "column det")
     * @throws RenderError when unresolved, as well as for everything render() rejects
     */
    static std::string render_required(const std::string& value_template,
                                       const Json& document,
                                       const std::string& context);

    /**
     * @brief Field names (path text, without conversion or specifier) referenced by a template
     * @throws RenderError for malformed templates
     */
    static std::vector<std::string> references(const std::string& value_template);
};

} // namespace xdi
