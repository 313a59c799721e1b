/**
 * @file ValueFormatter.hpp
 * @brief Format-specifier parsing and stringification of document values
 *
 * Values substituted into value-templates are formatted with the
 * Python format-specification mini-language:
 *
 *     [[fill]align][sign][#][0][width][,|_][.precision][type]
 *
 * Supported types: s d f F e E g G % and none.
 */

#pragma once

#include "xdi_export.hpp"

#include <optional>
#include <string>

namespace xdi {

/**
 * @brief Parsed format specifier
 */
struct FormatSpec {
    char fill = ' ';
    char align = '\0';          ///< '<', '>', '^', '=' or '\0' for type default
    char sign = '\0';           ///< '+', '-', ' ' or '\0'
    bool alternate = false;     ///< '#'
    bool zero_pad = false;      ///< '0' before width
    int width = 0;
    char grouping = '\0';       ///< ',' or '_'
    std::optional<int> precision;
    char type = '\0';

    /**
     * @brief Parse a specifier (the text after ':' in a replacement field)
     * @throws RenderError on malformed specifiers
     */
    static FormatSpec parse(const std::string& spec);
};

/**
 * @brief Format a document value with a specifier
 *
 * An empty specifier is equivalent to python_str().
 *
 * @throws RenderError when the specifier does not apply to the value's type
 */
std::string format_value(const Json& value, const std::string& spec);

/**
 * @brief Python str() of a value: strings unquoted, everything else as python_repr()
 */
std::string python_str(const Json& value);

/**
 * @brief Python repr() of a value: 'quoted' strings, True/False/None, [..] and {..}
 */
std::string python_repr(const Json& value);

/**
 * @brief Shortest round-trip rendering of a double, laid out like Python repr()
 */
std::string repr_double(double value);

} // namespace xdi
