#pragma once

#include "config/config_file.hpp"

#include <cstdint>
#include <string>

namespace sturdy {

struct ProgramOptions {
    bool help = false;
    bool show_schema = false;
    bool dry_run = false;

    // Echo the patch narration to stdout.
    bool verbose = true;

    // Write next to the input as <name>_v<major>.<minor><ext>.
    bool versioned_output = true;

    // Store the narration in a timestamped file under `log_dir`.
    bool save_log = false;

    std::string output_dir = "./";
    std::string default_output_filename = "patched_output.txt";
    std::string log_dir = "./logs/";

    std::string input_file;
    std::string patch_file;

    // Explicit output path; overrides all naming rules.
    std::string output_file;
};

std::string
config_get_directory();

// Load <config dir>/sturdy.conf into `program_options`. Missing keys are
// filled with the current values and a missing file is created. Returns
// false if the file exists but could not be parsed.
bool
config_apply_options(ProgramOptions& program_options);

// Same as above for an explicit file. `flush_defaults` writes the merged
// table back when the file is missing.
bool
config_apply_options(const std::string& config_path, ProgramOptions& program_options, bool flush_defaults);

}  // namespace sturdy
