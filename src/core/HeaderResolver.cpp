/**
 * @file HeaderResolver.cpp
 * @brief Header field seeding and incremental resolution
 */

#include "HeaderResolver.hpp"
#include "Logger.hpp"
#include "PlaceholderRenderer.hpp"
#include "TimeFormat.hpp"
#include "XdiErrors.hpp"

#include <functional>
#include <unordered_map>

namespace xdi {

namespace {

using SpecialResolver = std::function<std::optional<std::string>(DocumentKind, const Json&)>;

std::optional<std::string> iso_time_of(const Json& document) {
    auto it = document.find("time");
    if (it == document.end() || !it->is_number()) {
        return std::nullopt;
    }
    return format_iso8601(it->get<double>());
}

/**
 * @brief Header fields whose value comes from a document timestamp instead of their template
 */
const std::unordered_map<std::string, SpecialResolver>& special_fields() {
    static const std::unordered_map<std::string, SpecialResolver> table = {
        {"Scan.start_time",
         [](DocumentKind kind, const Json& document) -> std::optional<std::string> {
             if (kind != DocumentKind::START) return std::nullopt;
             return iso_time_of(document);
         }},
        {"Scan.end_time",
         [](DocumentKind kind, const Json& document) -> std::optional<std::string> {
             if (kind != DocumentKind::STOP) return std::nullopt;
             return iso_time_of(document);
         }},
    };
    return table;
}

const ColumnDefinition* find_column(const XdiTemplate& xdi_template, const std::string& name) {
    for (const auto& column : xdi_template.columns) {
        if (column.name == name) return &column;
    }
    return nullptr;
}

const HeaderFieldTemplate* find_header(const std::vector<HeaderFieldTemplate>& section, const std::string& name) {
    for (const auto& field : section) {
        if (field.name == name) return &field;
    }
    return nullptr;
}

} // namespace

// ============================================================================
// HeaderLineBuffer
// ============================================================================

void HeaderLineBuffer::append(const std::string& name, HeaderSection section) {
    lines_.push_back({name, section, std::nullopt});
}

bool HeaderLineBuffer::resolve(const std::string& name, const std::string& value) {
    for (auto& line : lines_) {
        if (line.name == name) {
            if (line.value) {
                return false;
            }
            line.value = value;
            return true;
        }
    }
    return false;
}

const HeaderLine* HeaderLineBuffer::find(const std::string& name) const {
    for (const auto& line : lines_) {
        if (line.name == name) return &line;
    }
    return nullptr;
}

std::string HeaderLineBuffer::value_or_none(const std::string& name) const {
    const HeaderLine* line = find(name);
    if (line == nullptr || !line->value) {
        return std::string(UNRESOLVED_LITERAL);
    }
    return *line->value;
}

size_t HeaderLineBuffer::unresolved_count() const {
    size_t count = 0;
    for (const auto& line : lines_) {
        if (!line.value) ++count;
    }
    return count;
}

// ============================================================================
// HeaderResolver
// ============================================================================

void HeaderResolver::initialize(std::shared_ptr<const XdiTemplate> xdi_template, const Json& start_document) {
    if (!xdi_template) {
        throw ConfigError("header resolution requires a template");
    }
    template_ = std::move(xdi_template);
    buffer_ = HeaderLineBuffer();

    for (const auto& v : template_->versions) buffer_.append(v.name, HeaderSection::VERSIONS);
    for (const auto& c : template_->columns) buffer_.append(c.name, HeaderSection::COLUMNS);
    for (const auto& h : template_->required_headers) buffer_.append(h.name, HeaderSection::REQUIRED);
    for (const auto& h : template_->optional_headers) buffer_.append(h.name, HeaderSection::OPTIONAL);

    size_t resolved = update(DocumentKind::START, start_document);

    Logger logger("HeaderResolver");
    logger.detailed("Initialized " + std::to_string(buffer_.lines().size()) + " header fields, " +
                    std::to_string(resolved) + " resolved from the start document");
}

size_t HeaderResolver::update(DocumentKind kind, const Json& document) {
    if (!template_) {
        throw SequenceError("header update before initialization");
    }

    Logger logger("HeaderResolver");
    size_t resolved = 0;

    const std::vector<HeaderLine> pending = buffer_.lines();
    for (const auto& line : pending) {
        if (line.value) {
            continue;
        }

        std::optional<std::string> value = render_field(line, kind, document);
        if (value && buffer_.resolve(line.name, *value)) {
            ++resolved;
            logger.debug("Resolved " + line.name + " = " + *value + " from " + to_string(kind) + " document");
        }
    }

    return resolved;
}

std::vector<std::string> HeaderResolver::unresolved_required() const {
    std::vector<std::string> names;
    for (const auto& line : buffer_.lines()) {
        if (line.section == HeaderSection::REQUIRED && !line.value) {
            names.push_back(line.name);
        }
    }
    return names;
}

std::optional<std::string> HeaderResolver::render_field(const HeaderLine& line, DocumentKind kind,
                                                        const Json& document) const {
    if (line.section == HeaderSection::REQUIRED || line.section == HeaderSection::OPTIONAL) {
        auto special = special_fields().find(line.name);
        if (special != special_fields().end()) {
            return special->second(kind, document);
        }
    }

    try {
        switch (line.section) {
            case HeaderSection::VERSIONS: {
                const VersionLine* version = template_->find_version(line.name);
                return version ? std::optional<std::string>(version->literal) : std::nullopt;
            }
            case HeaderSection::COLUMNS: {
                const ColumnDefinition* column = find_column(*template_, line.name);
                if (column == nullptr) return std::nullopt;
                RenderResult label = PlaceholderRenderer::render(column->label_template, document);
                if (!label.resolved()) return std::nullopt;
                return column->units ? *label.text + " " + *column->units : *label.text;
            }
            case HeaderSection::REQUIRED:
            case HeaderSection::OPTIONAL: {
                const auto& section = (line.section == HeaderSection::REQUIRED) ? template_->required_headers
                                                                                : template_->optional_headers;
                const HeaderFieldTemplate* field = find_header(section, line.name);
                if (field == nullptr || !field->value_template) return std::nullopt;
                return PlaceholderRenderer::render(*field->value_template, document).text;
            }
        }
    } catch (const RenderError& e) {
        throw RenderError("header field '" + line.name + "': " + e.detail());
    }

    return std::nullopt;
}

} // namespace xdi
