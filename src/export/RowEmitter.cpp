/**
 * @file RowEmitter.cpp
 * @brief Data row rendering
 */

#include "RowEmitter.hpp"
#include "PlaceholderRenderer.hpp"
#include "../core/XdiErrors.hpp"

#include <algorithm>

namespace xdi {

RowEmitter::RowEmitter(std::shared_ptr<const XdiTemplate> xdi_template)
    : template_(std::move(xdi_template)) {
    if (!template_) {
        throw ConfigError("row emission requires a template");
    }
    required_keys_ = template_->required_data_keys();
}

std::string RowEmitter::render_row(const Json& record) const {
    std::string row;
    bool first = true;
    for (const auto& column : template_->columns) {
        if (!first) {
            row += '\t';
        }
        try {
            row += PlaceholderRenderer::render_required(column.data_template, record, "column " + column.name);
        } catch (const RenderError& e) {
            throw RenderError("row for data key '" + column.data_key + "': " + e.detail());
        }
        first = false;
    }

    // A data line must never read as a header line, nor span more than one line
    if (row.compare(0, HEADER_PREFIX.size(), HEADER_PREFIX) == 0) {
        throw RenderError("row starts with '" + std::string(HEADER_PREFIX) +
                          "' and would be taken for a header line: " + row);
    }
    if (row.find_first_of("\r\n") != std::string::npos) {
        throw RenderError("row contains a line break");
    }
    row += '\n';
    return row;
}

bool RowEmitter::is_eligible(const std::set<std::string>& declared_data_keys) const {
    return std::includes(declared_data_keys.begin(), declared_data_keys.end(),
                         required_keys_.begin(), required_keys_.end());
}

} // namespace xdi
