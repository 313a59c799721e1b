/**
 * @file XdiTemplate.cpp
 * @brief Template loading and validation
 */

#include "XdiTemplate.hpp"
#include "Logger.hpp"
#include "XdiErrors.hpp"

#include <toml.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace xdi {

namespace {

const char* const SECTION_NAMES[] = {"versions", "columns", "required_headers", "optional_headers"};

const Json& require_section(const Json& tree, const char* section, const std::string& source_name) {
    auto it = tree.find(section);
    if (it == tree.end()) {
        throw ConfigError(source_name + ": missing section [" + std::string(section) + "]");
    }
    if (!it->is_object()) {
        throw ConfigError(source_name + ": section [" + std::string(section) + "] must be a table");
    }
    return *it;
}

std::string require_string(const Json& entry, const char* key, const std::string& where) {
    auto it = entry.find(key);
    if (it == entry.end()) {
        throw ConfigError(where + ": missing '" + std::string(key) + "'");
    }
    if (!it->is_string()) {
        throw ConfigError(where + ": '" + std::string(key) + "' must be a string");
    }
    return it->get<std::string>();
}

std::optional<std::string> optional_string(const Json& entry, const char* key, const std::string& where) {
    auto it = entry.find(key);
    if (it == entry.end()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw ConfigError(where + ": '" + std::string(key) + "' must be a string");
    }
    return it->get<std::string>();
}

std::vector<HeaderFieldTemplate> read_header_section(const Json& section, const char* section_name,
                                                     const std::string& source_name) {
    std::vector<HeaderFieldTemplate> fields;
    for (const auto& [name, entry] : section.items()) {
        std::string where = source_name + ": [" + section_name + "] " + name;
        if (!entry.is_object()) {
            throw ConfigError(where + " must be a table");
        }
        fields.push_back({name, optional_string(entry, "data", where), entry});
    }
    return fields;
}

bool looks_like_json(const std::string& text) {
    size_t first = text.find_first_not_of(" \t\r\n");
    return first != std::string::npos && text[first] == '{';
}

Json parse_json_template(const std::string& text, const std::string& source_name) {
    try {
        return Json::parse(text);
    } catch (const Json::parse_error& e) {
        throw ConfigError(source_name + ": " + e.what());
    }
}

template <typename DateTime>
std::string datetime_text(const DateTime& value) {
    std::ostringstream text;
    text << value;
    return text.str();
}

/**
 * @brief Convert a parsed TOML tree to JSON, keeping declaration order
 *
 * Date and time values become their TOML text.
 */
Json toml_to_json(const toml::ordered_value& value) {
    switch (value.type()) {
        case toml::value_t::boolean:
            return value.as_boolean();
        case toml::value_t::integer:
            return value.as_integer();
        case toml::value_t::floating:
            return value.as_floating();
        case toml::value_t::string:
            return value.as_string();
        case toml::value_t::offset_datetime:
            return datetime_text(value.as_offset_datetime());
        case toml::value_t::local_datetime:
            return datetime_text(value.as_local_datetime());
        case toml::value_t::local_date:
            return datetime_text(value.as_local_date());
        case toml::value_t::local_time:
            return datetime_text(value.as_local_time());
        case toml::value_t::array: {
            Json array = Json::array();
            for (const auto& element : value.as_array()) {
                array.push_back(toml_to_json(element));
            }
            return array;
        }
        case toml::value_t::table: {
            Json table = Json::object();
            for (const auto& [key, element] : value.as_table()) {
                table[key] = toml_to_json(element);
            }
            return table;
        }
        case toml::value_t::empty:
            break;
    }
    return nullptr;
}

Json parse_toml_template(const std::string& text, const std::string& source_name) {
    try {
        return toml_to_json(toml::parse_str<toml::ordered_type_config>(text));
    } catch (const toml::exception& e) {
        throw ConfigError(source_name + ": " + e.what());
    }
}

} // namespace

std::set<std::string> XdiTemplate::required_data_keys() const {
    std::set<std::string> keys;
    for (const auto& column : columns) {
        keys.insert(column.data_key);
    }
    return keys;
}

const VersionLine* XdiTemplate::find_version(const std::string& name) const {
    for (const auto& version : versions) {
        if (version.name == name) {
            return &version;
        }
    }
    return nullptr;
}

std::vector<std::string> XdiTemplate::field_names() const {
    std::vector<std::string> names;
    for (const auto& v : versions) names.push_back(v.name);
    for (const auto& c : columns) names.push_back(c.name);
    for (const auto& h : required_headers) names.push_back(h.name);
    for (const auto& h : optional_headers) names.push_back(h.name);
    return names;
}

XdiTemplate TemplateLoader::load(const std::optional<std::string>& inline_text,
                                 const std::optional<std::string>& path) {
    if (inline_text && path) {
        throw ConfigError("template given both inline and as file '" + *path + "'; supply exactly one");
    }
    if (!inline_text && !path) {
        throw ConfigError("no template: supply either inline configuration text or a configuration file path");
    }
    return inline_text ? from_text(*inline_text) : from_file(*path);
}

XdiTemplate TemplateLoader::from_text(const std::string& text) {
    const std::string source_name = "<inline>";
    Json tree = looks_like_json(text) ? parse_json_template(text, source_name)
                                      : parse_toml_template(text, source_name);
    return from_json(tree, source_name);
}

XdiTemplate TemplateLoader::from_file(const std::string& path) {
    Logger logger("TemplateLoader");
    logger.detailed("Loading template from " + path);

    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("cannot open template file: " + path);
    }
    std::ostringstream contents;
    contents << file.rdbuf();

    if (std::filesystem::path(path).extension() == ".json") {
        return from_json(parse_json_template(contents.str(), path), path);
    }
    return from_json(parse_toml_template(contents.str(), path), path);
}

XdiTemplate TemplateLoader::from_json(const Json& tree, const std::string& source_name) {
    Logger logger("TemplateLoader");

    if (!tree.is_object()) {
        throw ConfigError(source_name + ": template must be a table of sections");
    }
    for (const char* section : SECTION_NAMES) {
        require_section(tree, section, source_name);
    }

    XdiTemplate result;

    for (const auto& [name, literal] : require_section(tree, "versions", source_name).items()) {
        if (!literal.is_string()) {
            throw ConfigError(source_name + ": [versions] " + name + " must be a string");
        }
        result.versions.push_back({name, literal.get<std::string>()});
    }
    const VersionLine* xdi_line = result.find_version("XDI");
    if (xdi_line == nullptr) {
        throw ConfigError(source_name + ": [versions] must contain an \"XDI\" entry");
    }
    // The first file line must read as a header line for the rewrite to find it again
    if (xdi_line->literal.rfind(HEADER_PREFIX, 0) != 0 || xdi_line->literal.find('\n') != std::string::npos) {
        throw ConfigError(source_name + ": [versions] XDI must be a single line starting with '#'");
    }

    for (const auto& [name, entry] : require_section(tree, "columns", source_name).items()) {
        std::string where = source_name + ": [columns] " + name;
        if (!entry.is_object()) {
            throw ConfigError(where + " must be a table");
        }
        ColumnDefinition column;
        column.name = name;
        column.label_template = require_string(entry, "column_label", where);
        column.data_key = require_string(entry, "data_key", where);
        column.data_template = require_string(entry, "column_data", where);
        column.units = optional_string(entry, "units", where);
        result.columns.push_back(std::move(column));
    }
    if (result.columns.empty()) {
        throw ConfigError(source_name + ": [columns] must define at least one column");
    }

    result.required_headers =
        read_header_section(require_section(tree, "required_headers", source_name), "required_headers", source_name);
    result.optional_headers =
        read_header_section(require_section(tree, "optional_headers", source_name), "optional_headers", source_name);

    std::unordered_set<std::string> seen;
    for (const auto& name : result.field_names()) {
        if (!seen.insert(name).second) {
            throw ConfigError(source_name + ": header field '" + name + "' is declared in more than one section");
        }
    }

    for (const auto& [key, unused] : tree.items()) {
        bool known = false;
        for (const char* section : SECTION_NAMES) {
            known = known || key == section;
        }
        if (!known) {
            logger.warning("Ignoring unknown template section [" + key + "] in " + source_name);
        }
    }

    logger.debug("Template " + source_name + ": " + std::to_string(result.versions.size()) + " versions, " +
                 std::to_string(result.columns.size()) + " columns, " +
                 std::to_string(result.required_headers.size()) + " required, " +
                 std::to_string(result.optional_headers.size()) + " optional");

    return result;
}

} // namespace xdi
