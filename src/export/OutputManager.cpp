/**
 * @file OutputManager.cpp
 * @brief Mode string parsing for output managers
 */

#include "OutputManager.hpp"
#include "../core/XdiErrors.hpp"

namespace xdi {

OpenMode parse_open_mode(const std::string& mode) {
    std::string base = mode;
    if (base.size() == 2 && base[1] == 't') {
        base.pop_back();
    }

    if (base == "x") return OpenMode::EXCLUSIVE_CREATE;
    if (base == "w") return OpenMode::TRUNCATE;
    if (base == "a") return OpenMode::APPEND;

    throw OutputError("unsupported open mode '" + mode + "'; expected x, w or a (optionally with t)");
}

} // namespace xdi
