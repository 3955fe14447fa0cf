#include "config_file.hpp"

#include "util/file_io.hpp"

#include <fmt/format.h>

#include <cctype>
#include <charconv>
#include <string>
#include <vector>

using namespace sturdy;

namespace {

bool
is_identifier_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

bool
is_identifier(const std::string& s) {
    if (s.empty()) {
        return false;
    }
    for (char c : s) {
        if (!is_identifier_char(c)) {
            return false;
        }
    }
    return true;
}

std::string
strip(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(begin, end - begin + 1);
}

// Everything after an unquoted '#' is a comment.
std::string
strip_comment(const std::string& s) {
    char quote = 0;
    for (std::size_t i = 0; i < s.size(); i++) {
        char c = s[i];
        if (quote) {
            if (c == '\\' && quote == '"') {
                i++;
            } else if (c == quote) {
                quote = 0;
            }
        } else if (c == '\'' || c == '"') {
            quote = c;
        } else if (c == '#') {
            return s.substr(0, i);
        }
    }
    return s;
}

bool
parse_string(const std::string& text, std::string& out) {
    char quote = text[0];
    out.clear();
    std::size_t i = 1;
    for (; i < text.size(); i++) {
        char c = text[i];
        if (c == quote) {
            break;
        }
        if (quote == '"' && c == '\\' && i + 1 < text.size()) {
            char e = text[++i];
            switch (e) {
                case 'n':
                    out += '\n';
                    break;
                case 't':
                    out += '\t';
                    break;
                default:
                    out += e;
                    break;
            }
            continue;
        }
        out += c;
    }
    // Closing quote must be the last character.
    return i == text.size() - 1;
}

bool
parse_int(const std::string& text, int64_t& out) {
    const char* first = text.data();
    const char* last = text.data() + text.size();
    if (*first == '+') {
        first++;
    }
    // from_chars takes no sign other than '-', and nothing may follow it.
    if (first == last || *first == '+' || (*first == '-' && first != text.data())) {
        return false;
    }
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) {
        return false;
    }
    out = value;
    return true;
}

bool
parse_value(const std::string& text, ConfigValue& value) {
    if (text.empty()) {
        return false;
    }
    if (text[0] == '\'' || text[0] == '"') {
        std::string s;
        if (!parse_string(text, s)) {
            return false;
        }
        value.v = s;
        return true;
    }
    if (text == "true" || text == "false") {
        value.v = text == "true";
        return true;
    }
    int64_t i = 0;
    if (parse_int(text, i)) {
        value.v = i;
        return true;
    }
    return false;
}

std::string
quote_string(const std::string& s) {
    if (s.find('\'') == std::string::npos && s.find('\n') == std::string::npos) {
        return "'" + s + "'";
    }
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                out += c;
                break;
        }
    }
    return out + "\"";
}

bool
split_path(std::string_view dotted_path, std::string& section, std::string& key) {
    auto dot = dotted_path.find('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 == dotted_path.size()) {
        return false;
    }
    section = std::string(dotted_path.substr(0, dot));
    key = std::string(dotted_path.substr(dot + 1));
    return true;
}

}  // namespace

ConfigSection&
sturdy::ConfigTable::section(const std::string& name) {
    for (auto& s : sections) {
        if (s.name == name) {
            return s;
        }
    }
    sections.push_back(ConfigSection{name, {}, {}});
    return sections.back();
}

std::optional<std::reference_wrapper<ConfigValue>>
sturdy::ConfigTable::lookup_value_by_path(std::string_view dotted_path) {
    std::string section_name, key;
    if (!split_path(dotted_path, section_name, key)) {
        return std::nullopt;
    }
    for (auto& s : sections) {
        if (s.name != section_name) {
            continue;
        }
        for (auto& [entry_key, entry_value] : s.entries) {
            if (entry_key == key) {
                return std::ref(entry_value);
            }
        }
    }
    return std::nullopt;
}

bool
sturdy::ConfigTable::set_value_at(std::string_view dotted_path, ConfigValue value) {
    if (auto existing = lookup_value_by_path(dotted_path); existing) {
        existing->get() = std::move(value);
        return true;
    }
    std::string section_name, key;
    if (!split_path(dotted_path, section_name, key)) {
        return false;
    }
    section(section_name).entries.emplace_back(key, std::move(value));
    return true;
}

bool
sturdy::cfg_parse(const std::string& input_data, ConfigParseResult& result, ConfigTable& table) {
    result = ConfigParseResult{};
    table.sections.clear();

    std::string current_section;
    int line_number = 0;
    std::string::size_type pos = 0;

    auto fail = [&](const std::string& message) {
        result.kind = ConfigErrorKind::Parsing;
        result.line = line_number;
        result.error = fmt::format("line {}: {}", line_number, message);
        return false;
    };

    while (pos <= input_data.size()) {
        auto eol = input_data.find('\n', pos);
        if (eol == std::string::npos) {
            eol = input_data.size();
        }
        auto line = strip(strip_comment(input_data.substr(pos, eol - pos)));
        pos = eol + 1;
        line_number++;

        if (line.empty()) {
            continue;
        }

        if (line.front() == '[') {
            if (line.back() != ']') {
                return fail("unterminated section header");
            }
            auto name = strip(line.substr(1, line.size() - 2));
            if (!is_identifier(name)) {
                return fail(fmt::format("invalid section name '{}'", name));
            }
            table.section(name);
            current_section = name;
            continue;
        }

        auto assign = line.find('=');
        if (assign == std::string::npos) {
            return fail(fmt::format("expected 'key = value', got '{}'", line));
        }
        if (current_section.empty()) {
            return fail("key outside of a section");
        }

        auto key = strip(line.substr(0, assign));
        auto raw_value = strip(line.substr(assign + 1));
        if (!is_identifier(key)) {
            return fail(fmt::format("invalid key '{}'", key));
        }

        ConfigValue value;
        if (!parse_value(raw_value, value)) {
            return fail(fmt::format("invalid value for '{}': {}", key, raw_value));
        }

        // Later assignments win.
        table.set_value_at(current_section + "." + key, value);
    }

    return true;
}

bool
sturdy::cfg_load_file(const std::string& file_path, ConfigParseResult& result, ConfigTable& table) {
    result = ConfigParseResult{};
    table.sections.clear();

    if (check_file_status(file_path) != FileStatus::kOk) {
        result.kind = ConfigErrorKind::File;
        result.error = fmt::format("could not open '{}'", file_path);
        return false;
    }

    std::string contents;
    if (!read_file(file_path, contents)) {
        result.kind = ConfigErrorKind::File;
        result.error = fmt::format("could not read '{}'", file_path);
        return false;
    }

    return cfg_parse(contents, result, table);
}

std::string
sturdy::repr(const ConfigValue& value) {
    if (value.is_bool()) {
        return value.as_bool() ? "true" : "false";
    }
    if (value.is_int()) {
        return fmt::format("{}", value.as_int());
    }
    return quote_string(value.as_string());
}

std::string
sturdy::cfg_serialize(const ConfigTable& table) {
    std::string out;
    for (std::size_t i = 0; i < table.sections.size(); i++) {
        const auto& section = table.sections[i];
        if (i > 0) {
            out += "\n";
        }
        for (const auto& comment : section.comments) {
            out += comment;
            if (!comment.empty() && comment.back() != '\n') {
                out += "\n";
            }
        }
        out += fmt::format("[{}]\n", section.name);
        for (const auto& [key, value] : section.entries) {
            out += fmt::format("    {} = {}\n", key, repr(value));
        }
    }
    return out;
}
