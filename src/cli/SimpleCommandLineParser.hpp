/**
 * @file SimpleCommandLineParser.hpp
 * @brief Lightweight command-line parser for xdi-export
 */

#pragma once

#include <algorithm>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace xdi {

/**
 * @brief Command-line parser for long/short options and boolean flags
 *
 * Accepts --name VALUE, --name=VALUE, -n VALUE and flags. A lone "-" is a
 * value (stdin), not an option. Help text lists options in the order they
 * were declared.
 */
class SimpleCommandLineParser {
public:
    struct OptionSpec {
        std::string long_name;
        std::string short_name;
        std::string description;
        bool required = false;
        bool takes_value = true;
        std::string default_value;
    };

    SimpleCommandLineParser(const std::string& program_name, const std::string& description)
        : program_name_(program_name), description_(description) {}

    void add_option(const std::string& long_name, const std::string& short_name,
                    const std::string& description, bool required = false,
                    const std::string& default_value = "") {
        specs_.push_back({long_name, short_name, description, required, true, default_value});
    }

    void add_flag(const std::string& long_name, const std::string& short_name,
                  const std::string& description) {
        specs_.push_back({long_name, short_name, description, false, false, ""});
    }

    /**
     * @brief Parse arguments
     * @return false on error or when help was requested (see help_requested())
     */
    bool parse(int argc, char* argv[]) {
        values_.clear();
        flags_.clear();
        positional_.clear();
        help_requested_ = false;

        std::vector<std::string> args(argv + 1, argv + argc);

        if (std::any_of(args.begin(), args.end(),
                        [](const std::string& a) { return a == "--help" || a == "-h"; })) {
            help_requested_ = true;
            show_help();
            return false;
        }

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];

            if (arg == "-" || !arg.starts_with("-")) {
                positional_.push_back(arg);
                continue;
            }

            const OptionSpec* spec = nullptr;
            std::optional<std::string> inline_value;
            std::string shown;

            if (arg.starts_with("--")) {
                std::string name = arg.substr(2);
                size_t eq = name.find('=');
                if (eq != std::string::npos) {
                    inline_value = name.substr(eq + 1);
                    name.erase(eq);
                }
                shown = "--" + name;
                spec = find_long(name);
            } else {
                shown = arg;
                spec = find_short(arg.substr(1));
            }

            if (spec == nullptr) {
                std::cerr << "Unknown option: " << shown << std::endl;
                return false;
            }

            if (!spec->takes_value) {
                if (inline_value) {
                    std::cerr << "Option " << shown << " does not take a value" << std::endl;
                    return false;
                }
                flags_.insert(spec->long_name);
                continue;
            }

            if (inline_value) {
                values_[spec->long_name] = *inline_value;
            } else if (i + 1 < args.size() && (args[i + 1] == "-" || !args[i + 1].starts_with("-"))) {
                values_[spec->long_name] = args[++i];
            } else {
                std::cerr << "Option " << shown << " requires a value" << std::endl;
                return false;
            }
        }

        for (const auto& spec : specs_) {
            if (values_.count(spec.long_name) > 0) {
                continue;
            }
            if (spec.required) {
                std::cerr << "Required option --" << spec.long_name << " not provided" << std::endl;
                return false;
            }
            if (!spec.default_value.empty()) {
                values_[spec.long_name] = spec.default_value;
            }
        }

        return true;
    }

    std::optional<std::string> get(const std::string& long_name) const {
        auto it = values_.find(long_name);
        if (it == values_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool get_flag(const std::string& long_name) const {
        return flags_.count(long_name) > 0;
    }

    const std::vector<std::string>& get_positional() const { return positional_; }

    bool help_requested() const { return help_requested_; }

    void show_help() const {
        std::cout << "XDI EXPORT - Write one run's documents as a self-describing XDI file\n\n";

        std::cout << "USAGE:\n";
        std::cout << "    " << program_name_ << " --input FILE [OPTIONS]\n";
        std::cout << "    " << program_name_ << " --input - < run.jsonl\n\n";

        std::cout << description_ << "\n\n";

        std::cout << "INPUT:\n";
        std::cout << "    One document per line as a JSON array [\"name\", {body}], in run order:\n";
        std::cout << "    start, descriptor/event/event_page..., stop. Blank lines are skipped.\n\n";

        std::cout << "OPTIONS:\n";
        for (const auto& spec : specs_) {
            std::cout << usage_line(spec) << "\n";
        }
        std::cout << "    -h, --help                  Show this help\n\n";

        std::cout << "TEMPLATE:\n";
        std::cout << "    TOML (or JSON) with sections [versions], [columns], [required_headers],\n";
        std::cout << "    [optional_headers]. Without --config the start document must carry\n";
        std::cout << "    md[\"suitcase-xdi\"][\"config\"] or md[\"suitcase-xdi\"][\"config-file-path\"].\n\n";

        std::cout << "EXAMPLES:\n";
        std::cout << "    " << program_name_ << " --input run.jsonl --output-dir out --config xdi.toml\n";
        std::cout << "    " << program_name_ << " --input run.jsonl --file-prefix \"{md[sample]}-{time:%Y%m%d}\"\n";
        std::cout << "    " << program_name_ << " --input - --log-config \"3,Serializer=5\" < run.jsonl\n";
    }

private:
    const OptionSpec* find_long(const std::string& name) const {
        for (const auto& spec : specs_) {
            if (spec.long_name == name) return &spec;
        }
        return nullptr;
    }

    const OptionSpec* find_short(const std::string& name) const {
        if (name.empty()) return nullptr;
        for (const auto& spec : specs_) {
            if (spec.short_name == name) return &spec;
        }
        return nullptr;
    }

    static std::string usage_line(const OptionSpec& spec) {
        std::string left = "    ";
        left += spec.short_name.empty() ? "    " : "-" + spec.short_name + ", ";
        left += "--" + spec.long_name;
        if (spec.takes_value) {
            left += " VALUE";
        }
        left.resize(std::max<size_t>(left.size() + 2, 32), ' ');

        std::string line = left + spec.description;
        if (spec.required) {
            line += " (required)";
        } else if (!spec.default_value.empty()) {
            line += " (default: " + spec.default_value + ")";
        }
        return line;
    }

    std::string program_name_;
    std::string description_;
    std::vector<OptionSpec> specs_;
    std::map<std::string, std::string> values_;
    std::set<std::string> flags_;
    std::vector<std::string> positional_;
    bool help_requested_ = false;
};

} // namespace xdi
