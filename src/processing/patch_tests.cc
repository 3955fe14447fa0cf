#include "processing/patch.hpp"

#include <doctest.h>

#include <string>
#include <vector>

using namespace sturdy;

namespace {

Hunk
make_hunk(const std::string& search, const std::string& replace) {
    return Hunk{std::nullopt, search, replace};
}

std::string
patch_or_error(const std::string& text, const HunkSet& patch) {
    PatchResult result;
    if (!apply_patch(text, patch, result)) {
        return "error: " + result.error;
    }
    return result.text;
}

Placement
make_placement(std::size_t hunk_index, int64_t start, int64_t end) {
    Placement placement;
    placement.hunk_index = hunk_index;
    placement.start = start;
    placement.end = end;
    return placement;
}

}  // namespace

TEST_CASE("overlaps") {
    SUBCASE("empty_and_single") {
        REQUIRE_FALSE(check_overlaps({}));
        REQUIRE_FALSE(check_overlaps({make_placement(0, 3, 5)}));
    }

    SUBCASE("adjacent_ranges_do_not_overlap") {
        REQUIRE_FALSE(check_overlaps({make_placement(0, 0, 2), make_placement(1, 2, 4)}));
    }

    SUBCASE("shared_line") {
        REQUIRE(check_overlaps({make_placement(0, 0, 3), make_placement(1, 2, 4)}));
    }

    SUBCASE("unsorted_input") {
        std::vector<Placement> placements = {
            make_placement(0, 10, 12),
            make_placement(1, 0, 2),
            make_placement(2, 4, 11),
        };
        REQUIRE(check_overlaps(placements));

        auto pair = find_overlap(placements);
        REQUIRE(pair.has_value());
        REQUIRE(pair->first == 2);
        REQUIRE(pair->second == 0);
    }

    SUBCASE("contained_range") {
        REQUIRE(check_overlaps({make_placement(0, 0, 10), make_placement(1, 3, 4), make_placement(2, 12, 13)}));
    }

    SUBCASE("identical_start") {
        REQUIRE(check_overlaps({make_placement(0, 5, 6), make_placement(1, 5, 6)}));
    }
}

TEST_CASE("apply_patch") {
    SUBCASE("replace_single_line") {
        HunkSet patch{{make_hunk("bar", "baz")}};
        REQUIRE(patch_or_error("foo\nbar\n", patch) == "foo\nbaz\n");
    }

    SUBCASE("inherited_indent_for_new_lines") {
        HunkSet patch{{make_hunk("foo", "foo\nextra")}};
        REQUIRE(patch_or_error("  foo\n", patch) == "  foo\n  extra\n");
    }

    SUBCASE("two_separate_hunks") {
        const std::string text = "a\nb\nc\nd\ne\nf\n";
        HunkSet forward{{make_hunk("b", "B"), make_hunk("e", "E1\nE2")}};
        HunkSet backward{{make_hunk("e", "E1\nE2"), make_hunk("b", "B")}};
        REQUIRE(patch_or_error(text, forward) == "a\nB\nc\nd\nE1\nE2\nf\n");
        REQUIRE(patch_or_error(text, backward) == "a\nB\nc\nd\nE1\nE2\nf\n");
    }

    SUBCASE("empty_search_block_is_not_found") {
        HunkSet patch{{make_hunk("", "inserted")}};
        PatchResult result;
        REQUIRE_FALSE(apply_patch("first\n\nsecond", patch, result));
        REQUIRE(result.kind == PatchErrorKind::NotFound);
        REQUIRE(result.hunk_index == 0);
        REQUIRE(result.text.empty());
    }

    SUBCASE("ambiguous_match") {
        HunkSet patch{{make_hunk("x = 1;", "x = 2;")}};
        PatchResult result;
        REQUIRE_FALSE(apply_patch("x = 1;\ny = 0;\n    x = 1;\n", patch, result));
        REQUIRE(result.kind == PatchErrorKind::AmbiguousMatch);
        REQUIRE(result.hunk_index == 0);
    }

    SUBCASE("failure_reports_hunk_index") {
        HunkSet patch{{make_hunk("a", "A"), make_hunk("missing", "M")}};
        PatchResult result;
        REQUIRE_FALSE(apply_patch("a\nb\n", patch, result));
        REQUIRE(result.kind == PatchErrorKind::NotFound);
        REQUIRE(result.hunk_index == 1);
        REQUIRE(result.error == "Hunk 2 not found in file.");
    }

    SUBCASE("overlapping_hunks") {
        HunkSet patch{{make_hunk("a\nb", "x"), make_hunk("b\nc", "y")}};
        PatchResult result;
        REQUIRE_FALSE(apply_patch("a\nb\nc\n", patch, result));
        REQUIRE(result.kind == PatchErrorKind::OverlappingHunks);
        REQUIRE(result.hunk_index == -1);
        REQUIRE(result.text.empty());
    }

    SUBCASE("identity_patch") {
        const std::string text = "int main() {\r\n\treturn 0;  \r\n}\r\n";
        HunkSet patch{{make_hunk("int main() {", "int main() {"), make_hunk("return 0;\n}", "return 0;\n}")}};
        REQUIRE(patch_or_error(text, patch) == text);
    }

    SUBCASE("keeps_original_whitespace_of_replaced_lines") {
        HunkSet patch{{make_hunk("old();", "new_call();")}};
        REQUIRE(patch_or_error("\t\told();   \n", patch) == "\t\tnew_call();   \n");
    }

    SUBCASE("shorter_replacement_removes_lines") {
        HunkSet patch{{make_hunk("a\nb\nc", "z")}};
        REQUIRE(patch_or_error("start\n  a\n  b\n  c\nend", patch) == "start\n  z\nend");
    }

    SUBCASE("new_lines_drop_their_own_indent") {
        HunkSet patch{{make_hunk("if (x) {", "if (x) {\n        y();  ")}};
        REQUIRE(patch_or_error("    if (x) {\n    }", patch) == "    if (x) {\n    y();  \n    }");
    }

    SUBCASE("crlf_buffer_with_lf_blocks") {
        HunkSet patch{{make_hunk("b\nc", "B\r\nC\r\nD")}};
        REQUIRE(patch_or_error("a\r\nb\r\nc\r\n", patch) == "a\r\nB\r\nC\r\nD\r\n");
    }

    SUBCASE("tolerant_match_applies") {
        std::vector<std::string> log;
        HunkSet patch{{make_hunk("value", "other")}};
        PatchResult result;
        REQUIRE(apply_patch("key\nvalue\r", patch, result, [&](const std::string& line) { log.push_back(line); }));
        REQUIRE(result.text == "key\nother");
        REQUIRE(log.size() == 3);
        REQUIRE(log[0] == "Hunk 1: (no description)");
        REQUIRE(log[1] == "Hunk 1: floating match at lines 2-2");
        REQUIRE(log[2] == "Applied 1 hunk(s)");
    }

    SUBCASE("matching_uses_original_buffer") {
        // The second hunk targets text introduced by the first one; it must
        // not be found since matching never sees earlier edits.
        HunkSet patch{{make_hunk("a", "fresh"), make_hunk("fresh", "b")}};
        PatchResult result;
        REQUIRE_FALSE(apply_patch("a\nc\n", patch, result));
        REQUIRE(result.kind == PatchErrorKind::NotFound);
        REQUIRE(result.hunk_index == 1);
    }

    SUBCASE("progress_narration") {
        std::vector<std::string> log;
        HunkSet patch;
        patch.hunks.push_back({std::string("rename"), "foo", "bar"});
        PatchResult result;
        REQUIRE(apply_patch("x\nfoo\n", patch, result, [&](const std::string& line) { log.push_back(line); }));
        REQUIRE(log.size() == 3);
        REQUIRE(log[0] == "Hunk 1: rename");
        REQUIRE(log[1] == "Hunk 1: strict match at lines 2-2");
    }

    SUBCASE("empty_patch_is_identity") {
        HunkSet patch;
        REQUIRE(patch_or_error("a\n  b\n", patch) == "a\n  b\n");
    }

    SUBCASE("empty_buffer") {
        HunkSet patch{{make_hunk("x", "y")}};
        PatchResult result;
        REQUIRE_FALSE(apply_patch("", patch, result));
        REQUIRE(result.kind == PatchErrorKind::NotFound);
    }
}

TEST_CASE("apply_placements_order_independent") {
    const std::string text = "one\n  two\nthree\n  four\nfive";

    auto apply_in = [&](std::vector<std::size_t> order) {
        auto buffer = split_buffer(text);
        HunkSet patch{{make_hunk("two", "2a\n2b"), make_hunk("four\nfive", "4")}};
        std::vector<Placement> placements;
        PatchResult result;
        REQUIRE(resolve_placements(buffer, patch, placements, result));
        REQUIRE_FALSE(check_overlaps(placements));

        std::vector<Placement> ordered;
        for (auto i : order) {
            ordered.push_back(placements[i]);
        }
        apply_placements(buffer, ordered);
        return join_buffer(buffer);
    };

    const std::string expected = "one\n  2a\n  2b\nthree\n  4";
    REQUIRE(apply_in({0, 1}) == expected);
    REQUIRE(apply_in({1, 0}) == expected);
}
