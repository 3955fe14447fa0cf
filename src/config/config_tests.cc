#include "config/config.hpp"
#include "util/file_io.hpp"

#include <doctest.h>

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

using namespace sturdy;

TEST_CASE("config") {
    auto dir = fs::temp_directory_path() / "sturdy_config_tests";
    fs::remove_all(dir);
    auto path = (dir / "sturdy.conf").string();

    SUBCASE("missing_file_is_created_with_defaults") {
        ProgramOptions opts;
        REQUIRE(config_apply_options(path, opts, true));
        REQUIRE(fs::exists(path));

        ConfigTable table;
        ConfigParseResult result;
        REQUIRE(cfg_load_file(path, result, table));
        REQUIRE(table.lookup_value_by_path("general.output_dir")->get().as_string() == "./");
        REQUIRE(table.lookup_value_by_path("general.versioned_output")->get().as_bool() == true);
    }

    SUBCASE("missing_file_without_flush") {
        ProgramOptions opts;
        REQUIRE(config_apply_options(path, opts, false));
        REQUIRE_FALSE(fs::exists(path));
    }

    SUBCASE("stored_values_override_defaults") {
        REQUIRE(write_file(path, "[general]\n  log_dir = '/tmp/l'\n  save_log = true\n  verbose = 7\n"));
        ProgramOptions opts;
        REQUIRE(config_apply_options(path, opts, true));
        REQUIRE(opts.log_dir == "/tmp/l");
        REQUIRE(opts.save_log == true);
        // Wrong type is ignored.
        REQUIRE(opts.verbose == true);
        REQUIRE(opts.output_dir == "./");
    }

    SUBCASE("invalid_file_keeps_defaults") {
        REQUIRE(write_file(path, "[general\n"));
        ProgramOptions opts;
        opts.output_dir = "x";
        REQUIRE_FALSE(config_apply_options(path, opts, true));
        REQUIRE(opts.output_dir == "x");
    }

    fs::remove_all(dir);
}
