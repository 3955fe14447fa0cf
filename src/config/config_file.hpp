#pragma once

/*
    Reader and writer for the small INI dialect used by the config file:

        # comment
        [general]
            output_dir = './'        # strings in single or double quotes
            versioned_output = true  # true / false
            some_count = 3           # integers

    Keys are addressed with dotted paths, i.e "general.output_dir". Key
    order and section comments are preserved when serializing.
*/

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace sturdy {

struct ConfigValue {
    using Int = int64_t;
    using Bool = bool;
    using String = std::string;

    std::variant<Int, Bool, String> v;

    // clang-format off
    bool is_int() const { return std::holds_alternative<Int>(v); }
    bool is_bool() const { return std::holds_alternative<Bool>(v); }
    bool is_string() const { return std::holds_alternative<String>(v); }

    Int as_int() const { return std::get<Int>(v); }
    Bool as_bool() const { return std::get<Bool>(v); }
    const String& as_string() const { return std::get<String>(v); }
    // clang-format on
};

struct ConfigSection {
    std::string name;

    // Comment block written above the section header, '#' included.
    std::vector<std::string> comments;

    std::vector<std::pair<std::string, ConfigValue>> entries;
};

struct ConfigTable {
    std::vector<ConfigSection> sections;

    // Returns the named section, appending an empty one if it is missing.
    ConfigSection&
    section(const std::string& name);

    // Find a value using e.g. "general.output_dir"
    std::optional<std::reference_wrapper<ConfigValue>>
    lookup_value_by_path(std::string_view dotted_path);

    // Sets a value using e.g. set_value_at("general.save_log", {true})
    bool
    set_value_at(std::string_view dotted_path, ConfigValue value);
};

enum class ConfigErrorKind {
    None,
    File,
    Parsing,
};

struct ConfigParseResult {
    ConfigErrorKind kind = ConfigErrorKind::None;
    std::string error;
    int line = 0;

    bool
    is_ok() const {
        return kind == ConfigErrorKind::None;
    }
};

bool
cfg_parse(const std::string& input_data, ConfigParseResult& result, ConfigTable& table);

bool
cfg_load_file(const std::string& file_path, ConfigParseResult& result, ConfigTable& table);

std::string
cfg_serialize(const ConfigTable& table);

std::string
repr(const ConfigValue& value);

}  // namespace sturdy
