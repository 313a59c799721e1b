/**
 * @file HeaderResolver.hpp
 * @brief Incremental resolution of XDI header fields
 *
 * The header buffer is seeded from the template and the start document,
 * then every later document gets a chance to fill fields that are still
 * unresolved. A field keeps the first value it resolves to.
 */

#pragma once

#include "XdiTemplate.hpp"
#include "xdi_export.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace xdi {

/**
 * @brief One header field and its current value
 */
struct HeaderLine {
    std::string name;
    HeaderSection section;
    std::optional<std::string> value;   ///< Empty while unresolved
};

/**
 * @brief Ordered header fields; a resolved value is never overwritten
 */
class HeaderLineBuffer {
public:
    void append(const std::string& name, HeaderSection section);

    /**
     * @brief Set a field's value if it is still unresolved
     * @return true if the value was stored
     */
    bool resolve(const std::string& name, const std::string& value);

    const HeaderLine* find(const std::string& name) const;

    const std::vector<HeaderLine>& lines() const { return lines_; }

    /**
     * @brief Resolved value or the "None" literal
     */
    std::string value_or_none(const std::string& name) const;

    size_t unresolved_count() const;

private:
    std::vector<HeaderLine> lines_;
};

/**
 * @brief Header Resolution Engine
 */
class HeaderResolver {
public:
    /**
     * @brief Seed the buffer from the template and render every field against the start document
     *
     * Versions take their literal. Scan.start_time is set from the start
     * time, Scan.end_time stays unresolved.
     *
     * @throws RenderError for malformed templates or wrong-typed values
     */
    void initialize(std::shared_ptr<const XdiTemplate> xdi_template, const Json& start_document);

    /**
     * @brief Try every unresolved field against a newly arrived document
     * @return Number of fields resolved by this document
     * @throws RenderError for malformed templates or wrong-typed values
     */
    size_t update(DocumentKind kind, const Json& document);

    const HeaderLineBuffer& buffer() const { return buffer_; }

    /**
     * @brief Names of required headers that have not resolved
     */
    std::vector<std::string> unresolved_required() const;

private:
    std::optional<std::string> render_field(const HeaderLine& line, DocumentKind kind, const Json& document) const;

    std::shared_ptr<const XdiTemplate> template_;
    HeaderLineBuffer buffer_;
};

} // namespace xdi
