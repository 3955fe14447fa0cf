#include "config/config_file.hpp"

#include <doctest.h>

#include <cstdint>
#include <string>

using namespace sturdy;

TEST_CASE("config_file") {
    ConfigTable table;
    ConfigParseResult result;

    SUBCASE("values") {
        auto text = R"foo(# leading comment
[general]
    output_dir = './out'   # trailing comment
    log_dir = "logs/#1"
    versioned_output = false
    retries = -3

[other]
    name = 'x'
)foo";
        REQUIRE(cfg_parse(text, result, table));
        REQUIRE(result.is_ok());
        REQUIRE(table.sections.size() == 2);

        auto out = table.lookup_value_by_path("general.output_dir");
        REQUIRE(out.has_value());
        REQUIRE(out->get().as_string() == "./out");
        REQUIRE(table.lookup_value_by_path("general.log_dir")->get().as_string() == "logs/#1");
        REQUIRE(table.lookup_value_by_path("general.versioned_output")->get().as_bool() == false);
        REQUIRE(table.lookup_value_by_path("general.retries")->get().as_int() == -3);
        REQUIRE(table.lookup_value_by_path("other.name")->get().as_string() == "x");
        REQUIRE_FALSE(table.lookup_value_by_path("general.missing").has_value());
        REQUIRE_FALSE(table.lookup_value_by_path("nodot").has_value());
    }

    SUBCASE("escapes") {
        REQUIRE(cfg_parse("[s]\nk = \"a\\\"b\\nc\"\n", result, table));
        REQUIRE(table.lookup_value_by_path("s.k")->get().as_string() == "a\"b\nc");
    }

    SUBCASE("later_assignment_wins") {
        REQUIRE(cfg_parse("[s]\nk = 1\nk = 2\n", result, table));
        REQUIRE(table.sections[0].entries.size() == 1);
        REQUIRE(table.lookup_value_by_path("s.k")->get().as_int() == 2);
    }

    SUBCASE("key_outside_section") {
        REQUIRE_FALSE(cfg_parse("k = 1\n", result, table));
        REQUIRE(result.kind == ConfigErrorKind::Parsing);
        REQUIRE(result.line == 1);
    }

    SUBCASE("bad_value") {
        REQUIRE_FALSE(cfg_parse("[s]\n\nk = maybe\n", result, table));
        REQUIRE(result.kind == ConfigErrorKind::Parsing);
        REQUIRE(result.line == 3);
    }

    SUBCASE("integer_range") {
        REQUIRE(cfg_parse("[s]\nmax = 9223372036854775807\nmin = -9223372036854775808\nplus = +7\n", result, table));
        REQUIRE(table.lookup_value_by_path("s.max")->get().as_int() == INT64_MAX);
        REQUIRE(table.lookup_value_by_path("s.min")->get().as_int() == INT64_MIN);
        REQUIRE(table.lookup_value_by_path("s.plus")->get().as_int() == 7);

        ConfigTable overflow;
        ConfigParseResult overflow_result;
        REQUIRE_FALSE(cfg_parse("[general]\nn = 99999999999999999999\n", overflow_result, overflow));
        REQUIRE(overflow_result.kind == ConfigErrorKind::Parsing);
        REQUIRE(overflow_result.line == 2);
        REQUIRE_FALSE(cfg_parse("[s]\nn = 9223372036854775808\n", overflow_result, overflow));
        REQUIRE_FALSE(cfg_parse("[s]\nn = +-1\n", overflow_result, overflow));
        REQUIRE_FALSE(cfg_parse("[s]\nn = -\n", overflow_result, overflow));
    }

    SUBCASE("unterminated_string") {
        REQUIRE_FALSE(cfg_parse("[s]\nk = 'abc\n", result, table));
    }

    SUBCASE("bad_header") {
        REQUIRE_FALSE(cfg_parse("[s\n", result, table));
        REQUIRE_FALSE(cfg_parse("[a.b]\n", result, table));
    }

    SUBCASE("missing_file") {
        REQUIRE_FALSE(cfg_load_file("/nonexistent/sturdy.conf", result, table));
        REQUIRE(result.kind == ConfigErrorKind::File);
    }

    SUBCASE("set_and_serialize") {
        table.set_value_at("general.name", ConfigValue{std::string("it's")});
        table.set_value_at("general.flag", ConfigValue{true});
        table.set_value_at("general.count", ConfigValue{int64_t{4}});
        table.section("general").comments.push_back("# header\n");
        REQUIRE_FALSE(table.set_value_at("invalid", ConfigValue{true}));

        auto text = cfg_serialize(table);
        REQUIRE(text == "# header\n[general]\n    name = \"it's\"\n    flag = true\n    count = 4\n");

        ConfigTable reparsed;
        REQUIRE(cfg_parse(text, result, reparsed));
        REQUIRE(reparsed.lookup_value_by_path("general.name")->get().as_string() == "it's");
        REQUIRE(reparsed.lookup_value_by_path("general.flag")->get().as_bool());
        REQUIRE(reparsed.lookup_value_by_path("general.count")->get().as_int() == 4);
    }
}
