#include "config.hpp"

#include "config/config_file.hpp"
#include "util/file_io.hpp"

#include <fmt/format.h>
#include <sago/platform_folders.h>

#include <string>
#include <tuple>
#include <vector>

using namespace sturdy;

static std::string config_doc_general = R"foo(# General configuration for ´sturdy´
#
# Configure default options. These can be overriden with command-line arguments.
#
#   output_dir               where patched text goes when no input path is known
#   default_output_filename  file name used inside output_dir
#   log_dir                  where --save-log writes the patch narration
#   versioned_output         write <name>_v<major>.<minor><ext> next to the input
#
)foo";

enum class ConfigVariableType {
    Bool,
    String,
};

enum class ConfigLoadResult {
    Ok,
    Invalid,
    DoesNotExist,
};

namespace {

ConfigLoadResult
config_load_file(const std::string& config_path, ConfigTable& config_table, ConfigParseResult& load_result) {
    if (cfg_load_file(config_path, load_result, config_table)) {
        return ConfigLoadResult::Ok;
    }
    if (load_result.kind == ConfigErrorKind::File) {
        return ConfigLoadResult::DoesNotExist;
    }
    return ConfigLoadResult::Invalid;
}

void
config_save(const std::string& config_path, const ConfigTable& config_table) {
    if (!write_file(config_path, cfg_serialize(config_table))) {
        fmt::print(stderr, "warning: could not write default config to {}\n", config_path);
    }
}

using OptionVector = std::vector<std::tuple<std::string, ConfigVariableType, void*>>;

void
config_sync_options(ConfigTable& config, const OptionVector& options) {
    for (const auto& [path, type, ptr] : options) {
        // Do we have a value for this option in the config we loaded?
        if (auto stored_value = config.lookup_value_by_path(path); stored_value) {
            const auto& value = stored_value->get();
            switch (type) {
                case ConfigVariableType::Bool: {
                    if (value.is_bool()) {
                        *((bool*) ptr) = value.as_bool();
                    } else {
                        fmt::print(stderr, "warning: '{}' should be true or false, ignored\n", path);
                    }
                } break;
                case ConfigVariableType::String: {
                    if (value.is_string()) {
                        *((std::string*) ptr) = value.as_string();
                    } else {
                        fmt::print(stderr, "warning: '{}' should be a string, ignored\n", path);
                    }
                } break;
            }
        } else {
            // No such setting in the stored file, so we store the default value
            // from the struct.
            switch (type) {
                case ConfigVariableType::Bool: {
                    config.set_value_at(path, ConfigValue{*(bool*) ptr});
                } break;
                case ConfigVariableType::String: {
                    config.set_value_at(path, ConfigValue{*(std::string*) ptr});
                } break;
            }
        }
    }
}

}  // namespace

std::string
sturdy::config_get_directory() {
    return fmt::format("{}/sturdy", sago::getConfigHome());
}

bool
sturdy::config_apply_options(const std::string& config_path,
                             ProgramOptions& program_options,
                             bool flush_defaults) {
    bool flush_config_to_disk = false;
    bool ok = true;

    ConfigParseResult config_parse_result;
    ConfigTable config_table;
    switch (config_load_file(config_path, config_table, config_parse_result)) {
        case ConfigLoadResult::Ok: {
        } break;
        case ConfigLoadResult::Invalid: {
            fmt::print(stderr, "error: {}\n\twhile parsing: {}\n", config_parse_result.error, config_path);
            config_table = ConfigTable{};
            ok = false;
        } break;
        case ConfigLoadResult::DoesNotExist: {
            if (flush_defaults) {
                fmt::print(stderr, "warning: could not find default config. creating file:\n\t{}\n", config_path);
                flush_config_to_disk = true;
            }
        } break;
    };

    // clang-format off
    const OptionVector options = {
        { "general.output_dir",              ConfigVariableType::String, &program_options.output_dir },
        { "general.default_output_filename", ConfigVariableType::String, &program_options.default_output_filename },
        { "general.log_dir",                 ConfigVariableType::String, &program_options.log_dir },
        { "general.versioned_output",        ConfigVariableType::Bool,   &program_options.versioned_output },
        { "general.save_log",                ConfigVariableType::Bool,   &program_options.save_log },
        { "general.verbose",                 ConfigVariableType::Bool,   &program_options.verbose },
    };
    // clang-format on

    config_sync_options(config_table, options);

    // Write the configuration to disk with default settings
    if (flush_config_to_disk) {
        config_table.section("general").comments.push_back(config_doc_general);
        config_save(config_path, config_table);
    }

    return ok;
}

bool
sturdy::config_apply_options(ProgramOptions& program_options) {
    const std::string config_file_name = "sturdy.conf";
    const std::string config_root = sturdy::config_get_directory();
    const std::string config_path = fmt::format("{}/{}", config_root, config_file_name);

    return config_apply_options(config_path, program_options, true);
}
