/**
 * @file RowEmitter.hpp
 * @brief Renders one tab-separated data row per record
 */

#pragma once

#include "../core/XdiTemplate.hpp"
#include "xdi_export.hpp"

#include <memory>
#include <set>
#include <string>

namespace xdi {

class RowEmitter {
public:
    explicit RowEmitter(std::shared_ptr<const XdiTemplate> xdi_template);

    /**
     * @brief Render every column's data template against the record, tab-joined, newline-terminated
     * @throws RenderError if any column cannot be rendered, or the row would start
     *         with the header marker or span several lines
     */
    std::string render_row(const Json& record) const;

    /**
     * @brief True if the declared keys cover every column's data key
     */
    bool is_eligible(const std::set<std::string>& declared_data_keys) const;

    const std::set<std::string>& required_data_keys() const { return required_keys_; }

private:
    std::shared_ptr<const XdiTemplate> template_;
    std::set<std::string> required_keys_;
};

} // namespace xdi
