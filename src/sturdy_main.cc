#include "config/config.hpp"
#include "output/output_path.hpp"
#include "output/patch_log.hpp"
#include "processing/patch.hpp"
#include "processing/patch_document.hpp"
#include "util/file_io.hpp"

#include <getopt.h>

#include <fmt/format.h>

#include <cstdio>
#include <cstdlib>
#include <string>

#ifndef STURDY_VERSION
#define STURDY_VERSION "unknown"
#endif

#ifndef STURDY_BUILD_HASH
#define STURDY_BUILD_HASH "unknown"
#endif

namespace {

const int kExitOk = 0;
const int kExitPatchFailed = 1;
const int kExitUsage = 2;

enum class ArgsResult {
    kRun,
    kExit,
    kError,
};

std::string
resolve_output_path(const sturdy::ProgramOptions& opts) {
    if (!opts.output_file.empty()) {
        return opts.output_file;
    }
    if (opts.versioned_output) {
        return sturdy::versioned_output_path(opts.input_file, sturdy::next_version_suffix(opts.input_file));
    }
    return sturdy::default_output_path(opts.output_dir, opts.default_output_filename);
}

void
save_log(const sturdy::PatchLog& log, const sturdy::ProgramOptions& opts) {
    if (!opts.save_log) {
        return;
    }
    std::string path;
    if (log.save(opts.log_dir, path)) {
        fmt::print(stderr, "Debug log saved as {}\n", path);
    } else {
        fmt::print(stderr, "warning: failed to save debug log to {}\n", opts.log_dir);
    }
}

}  // namespace

int
main(int argc, char* argv[]) {
    sturdy::ProgramOptions opts;

    auto show_help = [&](const std::string& optional_error_message) {
        std::string help = fmt::format(R"(
Usage: {} [options] file patch_file

Apply a JSON hunk patch (search/replace blocks) to a file. Use '-' as
patch_file to read the patch from stdin.

Options:
    -v, --version                show program version and exit
    -h, --help                   show this help
        --schema                 print the patch document schema and exit

    -o, --output [path]          write the patched file to this path
    -d, --output-dir [dir]       directory for unversioned output
    -V, --versioned              write <name>_v<major>.<minor><ext> next to the input
    -N, --no-versioned           write <output-dir>/{} instead
    -n, --dry-run                print the patched text to stdout, write nothing

    -l, --save-log               save the patch narration to a timestamped file
        --log-dir [dir]          directory for saved logs
    -q, --quiet                  do not echo the patch narration
)",
                                       argv[0], opts.default_output_filename);

        help += "\n";

        help += "Config directory:\n    " + sturdy::config_get_directory() + "\n\n";

        if (!optional_error_message.empty()) {
            help += optional_error_message;
        }
        puts(help.c_str());
    };

    auto parse_args = [&](int in_argc, char* in_argv[]) -> ArgsResult {
        static struct option long_options[] = {{"help", no_argument, 0, 'h'},
                                               {"version", no_argument, 0, 'v'},
                                               {"schema", no_argument, 0, '1'},
                                               {"output", required_argument, 0, 'o'},
                                               {"output-dir", required_argument, 0, 'd'},
                                               {"versioned", no_argument, 0, 'V'},
                                               {"no-versioned", no_argument, 0, 'N'},
                                               {"dry-run", no_argument, 0, 'n'},
                                               {"save-log", no_argument, 0, 'l'},
                                               {"log-dir", required_argument, 0, '2'},
                                               {"quiet", no_argument, 0, 'q'},
                                               {0, 0, 0, 0}};
        int c = 0, option_index = 0;
        while ((c = getopt_long(in_argc, in_argv, "hvo:d:VNnlq", long_options, &option_index)) >= 0) {
            switch (c) {
                case 'v':
                    fmt::print("version: {}\n", STURDY_VERSION);
                    fmt::print("vcs hash: {}\n", STURDY_BUILD_HASH);
                    return ArgsResult::kExit;
                case 'h':
                    opts.help = true;
                    return ArgsResult::kRun;
                case '1':
                    opts.show_schema = true;
                    return ArgsResult::kRun;
                case 'o':
                    opts.output_file = optarg;
                    break;
                case 'd':
                    opts.output_dir = optarg;
                    break;
                case 'V':
                    opts.versioned_output = true;
                    break;
                case 'N':
                    opts.versioned_output = false;
                    break;
                case 'n':
                    opts.dry_run = true;
                    break;
                case 'l':
                    opts.save_log = true;
                    break;
                case '2':
                    opts.log_dir = optarg;
                    break;
                case 'q':
                    opts.verbose = false;
                    break;
                case '?':
                    show_help("error: invalid option");
                    return ArgsResult::kError;
                default:
                    show_help(fmt::format("error: invalid option: -{}", static_cast<char>(c)));
                    return ArgsResult::kError;
            }
        }

        int positional_count = in_argc - optind;

        if (positional_count != 2) {
            show_help("error: expected a file and a patch file");
            return ArgsResult::kError;
        }

        opts.input_file = in_argv[optind];
        opts.patch_file = in_argv[optind + 1];

        std::string err;
        auto input_status = sturdy::check_file_status(opts.input_file);
        if (input_status != sturdy::FileStatus::kOk) {
            err += fmt::format("File '{}': {}\n", opts.input_file, sturdy::to_string(input_status));
        }
        if (opts.patch_file != "-") {
            auto patch_status = sturdy::check_file_status(opts.patch_file);
            if (patch_status != sturdy::FileStatus::kOk) {
                err += fmt::format("Patch '{}': {}\n", opts.patch_file, sturdy::to_string(patch_status));
            }
        }
        if (!err.empty()) {
            show_help(err);
            return ArgsResult::kError;
        }
        return ArgsResult::kRun;
    };

    // Load the global defaults before we override them with command line args
    if (!sturdy::config_apply_options(opts)) {
        fmt::print(stderr, "warning: using built-in defaults\n");
    }

    switch (parse_args(argc, argv)) {
        case ArgsResult::kRun:
            break;
        case ArgsResult::kExit:
            return kExitOk;
        case ArgsResult::kError:
            return kExitUsage;
    }

    if (opts.help) {
        show_help("");
        return kExitOk;
    }

    if (opts.show_schema) {
        fmt::print("{}", sturdy::patch_schema());
        return kExitOk;
    }

    std::string file_text;
    if (!sturdy::read_file(opts.input_file, file_text)) {
        return kExitUsage;
    }

    std::string patch_text;
    bool patch_read = opts.patch_file == "-" ? sturdy::read_stdin(patch_text)
                                             : sturdy::read_file(opts.patch_file, patch_text);
    if (!patch_read) {
        fmt::print(stderr, "error: could not read patch '{}'\n", opts.patch_file);
        return kExitUsage;
    }

    // Narration would mix with the patched text on stdout in dry-run mode.
    sturdy::PatchLog log(opts.verbose && !opts.dry_run);
    log.log("--- BEGIN PATCH ---");

    sturdy::PatchResult result;
    if (!sturdy::apply_patch_document(file_text, patch_text, result, log.sink())) {
        fmt::print(stderr, "error: {}: {}\n", sturdy::to_string(result.kind), result.error);
        save_log(log, opts);
        return kExitPatchFailed;
    }

    log.log("--- PATCH COMPLETE ---");

    if (opts.dry_run) {
        fmt::print("{}", result.text);
        save_log(log, opts);
        return kExitOk;
    }

    auto out_path = resolve_output_path(opts);
    if (!sturdy::write_file(out_path, result.text)) {
        save_log(log, opts);
        return kExitUsage;
    }
    log.log(fmt::format("Patched file saved as: {}", out_path));

    save_log(log, opts);
    return kExitOk;
}
