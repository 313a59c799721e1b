/**
 * @file Finalizer.cpp
 * @brief Header rewrite for finished runs
 */

#include "Finalizer.hpp"
#include "../core/Logger.hpp"
#include "../core/XdiErrors.hpp"

namespace xdi {

std::string Finalizer::render_header_block(const HeaderLineBuffer& buffer, const XdiTemplate& xdi_template) {
    std::string block = buffer.value_or_none("XDI");
    block += '\n';

    for (const auto& line : buffer.lines()) {
        if (line.section == HeaderSection::VERSIONS && line.name == "XDI") {
            continue;
        }
        block += std::string(HEADER_PREFIX) + " " + line.name + " = " +
                 (line.value ? *line.value : std::string(UNRESOLVED_LITERAL)) + "\n";
    }

    block += std::string(HEADER_SEPARATOR) + "\n";
    block += std::string(HEADER_PREFIX) + " ";
    bool first = true;
    for (const auto& column : xdi_template.columns) {
        if (!first) block += '\t';
        block += column.label_template;
        first = false;
    }
    block += '\n';
    return block;
}

size_t Finalizer::rewrite(OutputManager& manager, const std::string& artifact, const std::string& header_block) {
    Logger logger("Finalizer");
    logger.detailed("Finishing artifact " + artifact);

    const std::string original = manager.read_artifact(artifact);

    std::ostream& replacement = manager.open_replacement(artifact);
    replacement << header_block;

    size_t data_lines = 0;
    size_t begin = 0;
    while (begin < original.size()) {
        size_t end = original.find('\n', begin);
        size_t length = (end == std::string::npos) ? original.size() - begin : end - begin + 1;
        std::string_view line(original.data() + begin, length);

        if (!is_header_line(line)) {
            replacement << line;
            ++data_lines;
        }
        begin += length;
    }

    if (!replacement) {
        throw OutputError("failed writing replacement for " + artifact);
    }
    manager.commit_replacement(artifact);

    logger.debug("Rewrote " + artifact + " with " + std::to_string(data_lines) + " data lines");
    return data_lines;
}

bool Finalizer::is_header_line(std::string_view line) {
    return line.substr(0, HEADER_PREFIX.size()) == HEADER_PREFIX;
}

} // namespace xdi
