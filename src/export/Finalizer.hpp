/**
 * @file Finalizer.hpp
 * @brief Header block rendering and the post-stop header rewrite
 *
 * Header lines are exactly the lines starting with '#'. A rewrite writes a
 * fresh header block and then copies every other line of the artifact
 * unchanged and in order, so running it twice gives the same file.
 */

#pragma once

#include "../core/HeaderResolver.hpp"
#include "../core/XdiTemplate.hpp"
#include "OutputManager.hpp"

#include <string>
#include <string_view>

namespace xdi {

class Finalizer {
public:
    /**
     * @brief Complete header block for the current buffer state
     *
     * The "XDI" version literal on its own line, "# field = value" for every
     * other field (None when unresolved), the separator, and the column
     * label templates tab-joined behind "# ".
     */
    static std::string render_header_block(const HeaderLineBuffer& buffer, const XdiTemplate& xdi_template);

    /**
     * @brief Replace an artifact's header block, keeping its data lines byte for byte
     * @return Number of data lines carried over
     * @throws OutputError if the manager cannot read or replace the artifact
     */
    static size_t rewrite(OutputManager& manager, const std::string& artifact, const std::string& header_block);

    static bool is_header_line(std::string_view line);
};

} // namespace xdi
