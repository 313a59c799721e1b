/**
 * @file PlaceholderRenderer.cpp
 * @brief Implementation of replacement-field substitution
 */

#include "PlaceholderRenderer.hpp"
#include "TimeFormat.hpp"
#include "ValueFormatter.hpp"
#include "XdiErrors.hpp"

#include <algorithm>
#include <cctype>

namespace xdi {

namespace {

/**
 * @brief One replacement field split into its parts
 */
struct ReplacementField {
    std::string path;           ///< e.g. md[XDI][Element_symbol]
    char conversion = '\0';     ///< 's', 'r' or '\0'
    std::string spec;           ///< text after ':'
};

/**
 * @brief One step of a reference path
 */
struct Accessor {
    std::string key;
    bool bracketed = false;
};

bool all_digits(const std::string& text) {
    return !text.empty() &&
           std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

const char* json_type_name(const Json& value) {
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

ReplacementField split_field(const std::string& field_text) {
    ReplacementField field;

    size_t i = 0;
    bool in_bracket = false;
    for (; i < field_text.size(); ++i) {
        char c = field_text[i];
        if (in_bracket) {
            if (c == ']') in_bracket = false;
        } else if (c == '[') {
            in_bracket = true;
        } else if (c == '!' || c == ':') {
            break;
        }
    }
    field.path = field_text.substr(0, i);

    if (i < field_text.size() && field_text[i] == '!') {
        if (i + 1 >= field_text.size()) {
            throw RenderError("end of string while looking for conversion specifier in '{" + field_text + "}'");
        }
        field.conversion = field_text[i + 1];
        if (field.conversion != 's' && field.conversion != 'r') {
            throw RenderError(std::string("Unknown conversion specifier ") + field.conversion);
        }
        i += 2;
        if (i < field_text.size() && field_text[i] != ':') {
            throw RenderError("expected ':' after conversion specifier in '{" + field_text + "}'");
        }
    }

    if (i < field_text.size() && field_text[i] == ':') {
        field.spec = field_text.substr(i + 1);
    }

    return field;
}

std::vector<Accessor> parse_path(const std::string& path) {
    std::vector<Accessor> accessors;

    size_t i = 0;
    while (i < path.size() && path[i] != '.' && path[i] != '[') {
        ++i;
    }
    std::string first = path.substr(0, i);
    if (first.empty() || all_digits(first)) {
        throw RenderError("positional replacement fields are not supported: '{" + path + "}'");
    }
    accessors.push_back({first, false});

    while (i < path.size()) {
        if (path[i] == '.') {
            size_t begin = ++i;
            while (i < path.size() && path[i] != '.' && path[i] != '[') {
                ++i;
            }
            if (i == begin) {
                throw RenderError("Empty attribute in format string '{" + path + "}'");
            }
            accessors.push_back({path.substr(begin, i - begin), false});
        } else if (path[i] == '[') {
            size_t close = path.find(']', i + 1);
            if (close == std::string::npos) {
                throw RenderError("Missing ']' in format string '{" + path + "}'");
            }
            if (close == i + 1) {
                throw RenderError("Empty attribute in format string '{" + path + "}'");
            }
            accessors.push_back({path.substr(i + 1, close - i - 1), true});
            i = close + 1;
            if (i < path.size() && path[i] != '.' && path[i] != '[') {
                throw RenderError("Only '.' or '[' may follow ']' in format field specifier '{" + path + "}'");
            }
        } else {
            throw RenderError("malformed reference '{" + path + "}'");
        }
    }

    return accessors;
}

/**
 * @brief Walk a reference path through the document
 * @return Pointer to the referenced value, or nullptr when a step is absent
 */
const Json* lookup(const Json& document, const std::vector<Accessor>& accessors, const std::string& path) {
    const Json* current = &document;

    for (const auto& step : accessors) {
        if (current->is_object()) {
            auto it = current->find(step.key);
            if (it == current->end()) {
                return nullptr;
            }
            current = &*it;
        } else if (current->is_array()) {
            if (!step.bracketed || !all_digits(step.key)) {
                throw RenderError(std::string("list indices must be integers, not '") + step.key +
                                  "' in '{" + path + "}'");
            }
            if (step.key.size() > 9) {
                return nullptr;
            }
            size_t index = static_cast<size_t>(std::stoul(step.key));
            if (index >= current->size()) {
                return nullptr;
            }
            current = &(*current)[index];
        } else {
            throw RenderError(std::string("'") + json_type_name(*current) +
                              "' object has no element '" + step.key + "' in '{" + path + "}'");
        }
    }

    return current;
}

bool is_timestamp_pattern(const Json& value, const std::string& spec) {
    if (!value.is_number() || spec.size() < 2) {
        return false;
    }
    return spec.find('%') < spec.size() - 1;
}

std::string format_field(const Json& value, const ReplacementField& field) {
    if (field.conversion == 'r') {
        return format_value(Json(python_repr(value)), field.spec);
    }
    if (field.conversion == 's') {
        return format_value(Json(python_str(value)), field.spec);
    }
    if (is_timestamp_pattern(value, field.spec)) {
        return format_timestamp(value.get<double>(), field.spec);
    }
    return format_value(value, field.spec);
}

/**
 * @brief Scan a template, calling on_literal for text and on_field for each replacement field
 *
 * Returns false as soon as on_field does.
 */
template <typename LiteralFn, typename FieldFn>
bool scan_template(const std::string& text, LiteralFn on_literal, FieldFn on_field) {
    size_t i = 0;
    const size_t n = text.size();

    while (i < n) {
        char c = text[i];

        if (c == '{') {
            if (i + 1 < n && text[i + 1] == '{') {
                on_literal('{');
                i += 2;
                continue;
            }

            size_t j = i + 1;
            bool in_bracket = false;
            for (; j < n; ++j) {
                char f = text[j];
                if (in_bracket) {
                    if (f == ']') in_bracket = false;
                } else if (f == '[') {
                    in_bracket = true;
                } else if (f == '}') {
                    break;
                } else if (f == '{') {
                    throw RenderError("nested replacement fields are not supported in '" + text + "'");
                }
            }
            if (j >= n) {
                throw RenderError("Single '{' encountered in format string '" + text + "'");
            }

            if (!on_field(split_field(text.substr(i + 1, j - i - 1)))) {
                return false;
            }
            i = j + 1;
        } else if (c == '}') {
            if (i + 1 < n && text[i + 1] == '}') {
                on_literal('}');
                i += 2;
                continue;
            }
            throw RenderError("Single '}' encountered in format string '" + text + "'");
        } else {
            on_literal(c);
            ++i;
        }
    }

    return true;
}

} // namespace

RenderResult PlaceholderRenderer::render(const std::string& value_template, const Json& document) {
    RenderResult result;
    std::string output;

    bool complete = scan_template(
        value_template,
        [&](char c) { output += c; },
        [&](const ReplacementField& field) {
            const Json* value = lookup(document, parse_path(field.path), field.path);
            if (value == nullptr) {
                result.missing_reference = field.path;
                return false;
            }
            output += format_field(*value, field);
            return true;
        });

    if (complete) {
        result.text = std::move(output);
    }
    return result;
}

std::string PlaceholderRenderer::render_required(const std::string& value_template,
                                                 const Json& document,
                                                 const std::string& context) {
    RenderResult result = render(value_template, document);
    if (!result.resolved()) {
        throw RenderError(context + ": '" + result.missing_reference +
                          "' is not present in the document (template '" + value_template + "')");
    }
    return *result.text;
}

std::vector<std::string> PlaceholderRenderer::references(const std::string& value_template) {
    std::vector<std::string> names;
    scan_template(
        value_template,
        [](char) {},
        [&](const ReplacementField& field) {
            parse_path(field.path);
            names.push_back(field.path);
            return true;
        });
    return names;
}

} // namespace xdi
