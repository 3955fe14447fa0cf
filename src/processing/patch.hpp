#pragma once

/*
    Apply a set of search/replace hunks to a text buffer.

    Every hunk is located against the original buffer before anything is
    changed. If any hunk can't be located unambiguously, or two located
    ranges overlap, the whole patch is rejected and no text is produced.

    Replacement lines that take the place of a matched line keep that line's
    indentation and trailing whitespace. Extra lines beyond the matched
    range take the indentation of the first matched line.
*/

#include "processing/buffer.hpp"
#include "processing/hunk_locator.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sturdy {

struct Hunk {
    std::optional<std::string> description;
    std::string search_block;
    std::string replace_block;
};

struct HunkSet {
    std::vector<Hunk> hunks;
};

// Resolved line range [start, end) of one hunk in the original buffer.
struct Placement {
    std::size_t hunk_index = 0;
    int64_t start = 0;
    int64_t end = 0;
    MatchMode mode = MatchMode::Exact;
    std::vector<Line> replace_lines;
};

enum class PatchErrorKind {
    None,
    MalformedPatch,
    AmbiguousMatch,
    NotFound,
    OverlappingHunks,
};

std::string
to_string(PatchErrorKind kind);

struct PatchResult {
    PatchErrorKind kind = PatchErrorKind::None;
    std::string error;

    // 0-based index of the failing hunk, -1 when not tied to a hunk.
    int64_t hunk_index = -1;

    // Patched text, only valid when is_ok().
    std::string text;

    bool
    is_ok() const {
        return kind == PatchErrorKind::None;
    }

    void
    set_error(PatchErrorKind error_kind, int64_t index, std::string message);
};

// Receives one human readable line per matching decision.
using ProgressSink = std::function<void(const std::string&)>;

bool
check_overlaps(const std::vector<Placement>& placements);

// Hunk indexes of the first pair of overlapping placements, ordered by start.
std::optional<std::pair<std::size_t, std::size_t>>
find_overlap(const std::vector<Placement>& placements);

bool
resolve_placements(const Buffer& buffer,
                   const HunkSet& patch,
                   std::vector<Placement>& placements,
                   PatchResult& result,
                   const ProgressSink& on_progress = {});

// Placements must be validated with check_overlaps() first.
void
apply_placements(Buffer& buffer, std::vector<Placement> placements);

bool
apply_patch(const std::string& original_text,
            const HunkSet& patch,
            PatchResult& result,
            const ProgressSink& on_progress = {});

}  // namespace sturdy
