/**
 * @file ValueFormatter.cpp
 * @brief Python-compatible value formatting
 */

#include "ValueFormatter.hpp"
#include "XdiErrors.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace xdi {

namespace {

const char* type_name(const Json& value) {
    switch (value.type()) {
        case Json::value_t::string: return "str";
        case Json::value_t::boolean: return "bool";
        case Json::value_t::number_integer:
        case Json::value_t::number_unsigned: return "int";
        case Json::value_t::number_float: return "float";
        case Json::value_t::null: return "NoneType";
        case Json::value_t::array: return "list";
        case Json::value_t::object: return "dict";
        default: return "object";
    }
}

bool is_align(char c) {
    return c == '<' || c == '>' || c == '^' || c == '=';
}

std::string group_digits(const std::string& digits, char separator) {
    if (separator == '\0' || digits.size() <= 3) {
        return digits;
    }

    size_t lead = digits.size() % 3;
    if (lead == 0) lead = 3;

    std::string grouped = digits.substr(0, lead);
    for (size_t i = lead; i < digits.size(); i += 3) {
        grouped += separator;
        grouped.append(digits, i, 3);
    }
    return grouped;
}

std::string group_integer_part(const std::string& body, char separator) {
    size_t end = 0;
    while (end < body.size() && std::isdigit(static_cast<unsigned char>(body[end]))) {
        ++end;
    }
    if (separator == '\0' || end == 0) {
        return body;
    }
    return group_digits(body.substr(0, end), separator) + body.substr(end);
}

std::string sign_prefix(bool negative, const FormatSpec& spec) {
    if (negative) return "-";
    if (spec.sign == '+') return "+";
    if (spec.sign == ' ') return " ";
    return "";
}

std::string pad(const std::string& sign, const std::string& body,
                const FormatSpec& spec, char default_align) {
    char align = spec.align;
    char fill = spec.fill;
    if (align == '\0') {
        if (spec.zero_pad) {
            align = (default_align == '<') ? '<' : '=';
            fill = '0';
        } else {
            align = default_align;
        }
    }

    size_t length = sign.size() + body.size();
    if (spec.width <= 0 || length >= static_cast<size_t>(spec.width)) {
        return sign + body;
    }

    size_t padding = static_cast<size_t>(spec.width) - length;
    switch (align) {
        case '<':
            return sign + body + std::string(padding, fill);
        case '^': {
            size_t left = padding / 2;
            return std::string(left, fill) + sign + body + std::string(padding - left, fill);
        }
        case '=':
            return sign + std::string(padding, fill) + body;
        default:
            return std::string(padding, fill) + sign + body;
    }
}

std::string printf_double(char conversion, int precision, bool alternate, double value) {
    std::string format = alternate ? "%#.*" : "%.*";
    format += conversion;

    int size = std::snprintf(nullptr, 0, format.c_str(), precision, value);
    if (size < 0) {
        throw RenderError("cannot format floating point value");
    }
    std::string out(static_cast<size_t>(size), '\0');
    std::snprintf(out.data(), out.size() + 1, format.c_str(), precision, value);
    return out;
}

void strip_trailing_zeros(std::string& number) {
    if (number.find('.') == std::string::npos) return;
    while (!number.empty() && number.back() == '0') {
        number.pop_back();
    }
    if (!number.empty() && number.back() == '.') {
        number.pop_back();
    }
}

// Python's general format used when a precision is given without a type:
// like 'g', but fixed notation keeps one digit past the point and
// scientific notation starts at exp >= precision - 1
std::string general_with_point(double magnitude, int precision, bool alternate) {
    if (!std::isfinite(magnitude)) {
        return repr_double(magnitude);
    }
    if (precision == 0) precision = 1;

    std::string scientific = printf_double('e', precision - 1, false, magnitude);
    size_t e_pos = scientific.find('e');
    int exponent = std::atoi(scientific.c_str() + e_pos + 1);

    if (exponent >= -4 && exponent < precision - 1) {
        std::string fixed = printf_double('f', precision - 1 - exponent, false, magnitude);
        if (!alternate) {
            strip_trailing_zeros(fixed);
        }
        if (fixed.find('.') == std::string::npos) {
            fixed += ".0";
        } else if (fixed.back() == '.') {
            fixed += "0";
        }
        return fixed;
    }

    std::string mantissa = scientific.substr(0, e_pos);
    if (!alternate) {
        strip_trailing_zeros(mantissa);
    }
    return mantissa + scientific.substr(e_pos);
}

std::string format_string(const std::string& text, const FormatSpec& spec) {
    if (spec.type != '\0' && spec.type != 's') {
        throw RenderError(std::string("Unknown format code '") + spec.type + "' for object of type 'str'");
    }
    if (spec.sign != '\0') {
        throw RenderError("Sign not allowed in string format specifier");
    }
    if (spec.alternate) {
        throw RenderError("Alternate form (#) not allowed in string format specifier");
    }
    if (spec.align == '=') {
        throw RenderError("'=' alignment not allowed in string format specifier");
    }
    if (spec.grouping != '\0') {
        throw RenderError(std::string("Cannot specify '") + spec.grouping + "' with 's'.");
    }

    std::string body = text;
    if (spec.precision && body.size() > static_cast<size_t>(*spec.precision)) {
        body.resize(static_cast<size_t>(*spec.precision));
    }
    return pad("", body, spec, '<');
}

std::string format_float(double value, const FormatSpec& spec) {
    bool negative = std::signbit(value) && !std::isnan(value);
    double magnitude = std::fabs(value);

    std::string body;
    switch (spec.type) {
        case '\0':
            body = spec.precision ? general_with_point(magnitude, *spec.precision, spec.alternate)
                                  : repr_double(magnitude);
            break;
        case 'f':
        case 'F':
        case 'e':
        case 'E':
            body = printf_double(spec.type, spec.precision.value_or(6), spec.alternate, magnitude);
            break;
        case 'g':
        case 'G': {
            int precision = spec.precision.value_or(6);
            body = printf_double(spec.type, precision == 0 ? 1 : precision, spec.alternate, magnitude);
            break;
        }
        case '%':
            body = printf_double('f', spec.precision.value_or(6), spec.alternate, magnitude * 100.0) + "%";
            break;
        default:
            throw RenderError(std::string("Unknown format code '") + spec.type + "' for object of type 'float'");
    }

    return pad(sign_prefix(negative, spec), group_integer_part(body, spec.grouping), spec, '>');
}

std::string format_integer(const Json& value, const FormatSpec& spec) {
    switch (spec.type) {
        case '\0':
        case 'd':
            break;
        case 'e':
        case 'E':
        case 'f':
        case 'F':
        case 'g':
        case 'G':
        case '%':
            return format_float(value.get<double>(), spec);
        default:
            throw RenderError(std::string("Unknown format code '") + spec.type + "' for object of type 'int'");
    }

    if (spec.precision) {
        throw RenderError("Precision not allowed in integer format specifier");
    }

    bool negative = false;
    std::uint64_t magnitude = 0;
    if (value.is_number_unsigned()) {
        magnitude = value.get<std::uint64_t>();
    } else {
        std::int64_t signed_value = value.get<std::int64_t>();
        negative = signed_value < 0;
        magnitude = negative ? (0ULL - static_cast<std::uint64_t>(signed_value))
                             : static_cast<std::uint64_t>(signed_value);
    }

    return pad(sign_prefix(negative, spec), group_digits(std::to_string(magnitude), spec.grouping), spec, '>');
}

std::string repr_string(const std::string& text) {
    char quote = '\'';
    if (text.find('\'') != std::string::npos && text.find('"') == std::string::npos) {
        quote = '"';
    }

    std::string out(1, quote);
    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (c == '\\') {
            out += "\\\\";
        } else if (c == quote) {
            out += '\\';
            out += c;
        } else if (c == '\n') {
            out += "\\n";
        } else if (c == '\r') {
            out += "\\r";
        } else if (c == '\t') {
            out += "\\t";
        } else if (uc < 0x20 || uc == 0x7f) {
            char escaped[8];
            std::snprintf(escaped, sizeof(escaped), "\\x%02x", uc);
            out += escaped;
        } else {
            out += c;
        }
    }
    out += quote;
    return out;
}

} // namespace

FormatSpec FormatSpec::parse(const std::string& spec) {
    FormatSpec result;
    size_t i = 0;
    const size_t n = spec.size();

    if (n >= 2 && is_align(spec[1])) {
        result.fill = spec[0];
        result.align = spec[1];
        i = 2;
    } else if (n >= 1 && is_align(spec[0])) {
        result.align = spec[0];
        i = 1;
    }

    if (i < n && (spec[i] == '+' || spec[i] == '-' || spec[i] == ' ')) {
        result.sign = spec[i++];
    }
    if (i < n && spec[i] == '#') {
        result.alternate = true;
        ++i;
    }
    if (i < n && spec[i] == '0') {
        result.zero_pad = true;
        ++i;
    }

    auto read_number = [&](int& target) {
        size_t begin = i;
        while (i < n && std::isdigit(static_cast<unsigned char>(spec[i]))) {
            ++i;
        }
        if (i == begin) return false;
        if (i - begin > 6) {
            throw RenderError("Too many decimal digits in format string '" + spec + "'");
        }
        target = std::stoi(spec.substr(begin, i - begin));
        return true;
    };

    read_number(result.width);

    if (i < n && (spec[i] == ',' || spec[i] == '_')) {
        result.grouping = spec[i++];
    }

    if (i < n && spec[i] == '.') {
        ++i;
        int precision = 0;
        if (!read_number(precision)) {
            throw RenderError("Format specifier missing precision in '" + spec + "'");
        }
        result.precision = precision;
    }

    if (i < n) {
        result.type = spec[i++];
    }
    if (i < n) {
        throw RenderError("Invalid format specifier '" + spec + "'");
    }

    return result;
}

std::string format_value(const Json& value, const std::string& spec_text) {
    if (spec_text.empty()) {
        return python_str(value);
    }

    FormatSpec spec = FormatSpec::parse(spec_text);

    switch (value.type()) {
        case Json::value_t::string:
            return format_string(value.get<std::string>(), spec);
        case Json::value_t::boolean:
            return format_integer(Json(value.get<bool>() ? 1 : 0), spec);
        case Json::value_t::number_integer:
        case Json::value_t::number_unsigned:
            return format_integer(value, spec);
        case Json::value_t::number_float:
            return format_float(value.get<double>(), spec);
        default:
            throw RenderError(std::string("unsupported format string '") + spec_text +
                              "' passed to " + type_name(value) + ".__format__");
    }
}

std::string python_str(const Json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return python_repr(value);
}

std::string python_repr(const Json& value) {
    switch (value.type()) {
        case Json::value_t::string:
            return repr_string(value.get<std::string>());
        case Json::value_t::boolean:
            return value.get<bool>() ? "True" : "False";
        case Json::value_t::null:
            return "None";
        case Json::value_t::number_integer:
            return std::to_string(value.get<std::int64_t>());
        case Json::value_t::number_unsigned:
            return std::to_string(value.get<std::uint64_t>());
        case Json::value_t::number_float:
            return repr_double(value.get<double>());
        case Json::value_t::array: {
            std::string out = "[";
            bool first = true;
            for (const auto& item : value) {
                if (!first) out += ", ";
                out += python_repr(item);
                first = false;
            }
            return out + "]";
        }
        case Json::value_t::object: {
            std::string out = "{";
            bool first = true;
            for (const auto& [key, item] : value.items()) {
                if (!first) out += ", ";
                out += repr_string(key) + ": " + python_repr(item);
                first = false;
            }
            return out + "}";
        }
        default:
            return "<" + std::string(type_name(value)) + ">";
    }
}

std::string repr_double(double value) {
    if (std::isnan(value)) return "nan";
    if (std::isinf(value)) return value < 0 ? "-inf" : "inf";

    char buffer[64];
    auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value, std::chars_format::scientific);
    if (ec != std::errc()) {
        throw RenderError("cannot format floating point value");
    }
    std::string scientific(buffer, end);

    std::string sign;
    if (!scientific.empty() && scientific[0] == '-') {
        sign = "-";
        scientific.erase(0, 1);
    }

    size_t e_pos = scientific.find('e');
    int exponent = std::atoi(scientific.c_str() + e_pos + 1);
    std::string digits;
    for (size_t i = 0; i < e_pos; ++i) {
        if (scientific[i] != '.') digits += scientific[i];
    }

    if (exponent >= -4 && exponent < 16) {
        if (exponent < 0) {
            return sign + "0." + std::string(static_cast<size_t>(-exponent - 1), '0') + digits;
        }
        size_t integer_digits = static_cast<size_t>(exponent) + 1;
        if (digits.size() <= integer_digits) {
            return sign + digits + std::string(integer_digits - digits.size(), '0') + ".0";
        }
        return sign + digits.substr(0, integer_digits) + "." + digits.substr(integer_digits);
    }

    std::string mantissa = digits.substr(0, 1);
    if (digits.size() > 1) {
        mantissa += "." + digits.substr(1);
    }
    char exponent_text[16];
    std::snprintf(exponent_text, sizeof(exponent_text), "e%c%02d", exponent < 0 ? '-' : '+', std::abs(exponent));
    return sign + mantissa + exponent_text;
}

} // namespace xdi
