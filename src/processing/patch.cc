#include "patch.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <string>
#include <vector>

using namespace sturdy;

namespace {

std::vector<const Placement*>
sorted_by_start(const std::vector<Placement>& placements) {
    std::vector<const Placement*> sorted;
    sorted.reserve(placements.size());
    for (const auto& placement : placements) {
        sorted.push_back(&placement);
    }
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const Placement* a, const Placement* b) { return a->start < b->start; });
    return sorted;
}

}  // namespace

std::string
sturdy::to_string(PatchErrorKind kind) {
    switch (kind) {
        case PatchErrorKind::None:
            return "Success";
        case PatchErrorKind::MalformedPatch:
            return "Malformed patch";
        case PatchErrorKind::AmbiguousMatch:
            return "Ambiguous match";
        case PatchErrorKind::NotFound:
            return "Hunk not found";
        case PatchErrorKind::OverlappingHunks:
            return "Overlapping hunks";
        default:
            return "Unknown error";
    }
}

void
sturdy::PatchResult::set_error(PatchErrorKind error_kind, int64_t index, std::string message) {
    kind = error_kind;
    hunk_index = index;
    error = std::move(message);
    text.clear();
}

std::optional<std::pair<std::size_t, std::size_t>>
sturdy::find_overlap(const std::vector<Placement>& placements) {
    if (placements.size() < 2) {
        return std::nullopt;
    }

    // Sorted by start, an overlap anywhere always shows up between neighbours.
    auto sorted = sorted_by_start(placements);
    for (std::size_t i = 1; i < sorted.size(); i++) {
        const auto* prev = sorted[i - 1];
        const auto* curr = sorted[i];
        if (prev->end > curr->start) {
            return std::make_pair(prev->hunk_index, curr->hunk_index);
        }
    }
    return std::nullopt;
}

bool
sturdy::check_overlaps(const std::vector<Placement>& placements) {
    return find_overlap(placements).has_value();
}

bool
sturdy::resolve_placements(const Buffer& buffer,
                           const HunkSet& patch,
                           std::vector<Placement>& placements,
                           PatchResult& result,
                           const ProgressSink& on_progress) {
    auto log = [&](const std::string& message) {
        if (on_progress) {
            on_progress(message);
        }
    };

    placements.clear();
    for (std::size_t idx = 0; idx < patch.hunks.size(); idx++) {
        const auto& hunk = patch.hunks[idx];
        const auto num = idx + 1;
        const auto index = static_cast<int64_t>(idx);

        log(fmt::format("Hunk {}: {}", num, hunk.description.value_or("(no description)")));

        // An empty search block is never a wildcard.
        std::vector<Line> search_lines;
        if (!hunk.search_block.empty()) {
            search_lines = split_block(hunk.search_block);
        }

        auto located = resolve_hunk(buffer.lines, search_lines);
        switch (located.status) {
            case LocateStatus::Ambiguous: {
                result.set_error(PatchErrorKind::AmbiguousMatch, index,
                                 fmt::format("Ambiguous {} match for hunk {} ({} locations).",
                                             to_string(located.mode), num, located.match_count));
                log(result.error);
                return false;
            }
            case LocateStatus::NotFound: {
                result.set_error(PatchErrorKind::NotFound, index,
                                 fmt::format("Hunk {} not found in file.", num));
                log(result.error);
                return false;
            }
            case LocateStatus::Found:
                break;
        }

        Placement placement;
        placement.hunk_index = idx;
        placement.start = located.start;
        placement.end = located.start + static_cast<int64_t>(search_lines.size());
        placement.mode = located.mode;
        placement.replace_lines = split_block(hunk.replace_block);

        log(fmt::format("Hunk {}: {} match at lines {}-{}", num, to_string(located.mode),
                        placement.start + 1, placement.end));

        placements.push_back(std::move(placement));
    }

    return true;
}

void
sturdy::apply_placements(Buffer& buffer, std::vector<Placement> placements) {
    // Highest start first; splicing there leaves all lower indexes valid.
    std::stable_sort(placements.begin(), placements.end(),
                     [](const Placement& a, const Placement& b) { return a.start > b.start; });

    auto& lines = buffer.lines;
    for (auto& placement : placements) {
        const auto start = placement.start;
        const auto end = placement.end;

        std::string inherited_indent;
        if (start < static_cast<int64_t>(lines.size())) {
            inherited_indent = lines[start].indent;
        }

        std::vector<Line> spliced;
        spliced.reserve(placement.replace_lines.size());
        for (std::size_t i = 0; i < placement.replace_lines.size(); i++) {
            auto& replacement = placement.replace_lines[i];
            const auto target = start + static_cast<int64_t>(i);
            if (target < end) {
                Line original = lines[target];
                original.set_content(replacement.content);
                spliced.push_back(std::move(original));
            } else {
                replacement.indent = inherited_indent;
                spliced.push_back(std::move(replacement));
            }
        }

        auto first = lines.begin() + start;
        auto last = lines.begin() + end;
        lines.erase(first, last);
        lines.insert(lines.begin() + start, std::make_move_iterator(spliced.begin()),
                     std::make_move_iterator(spliced.end()));
    }
}

bool
sturdy::apply_patch(const std::string& original_text,
                    const HunkSet& patch,
                    PatchResult& result,
                    const ProgressSink& on_progress) {
    result = PatchResult{};

    auto buffer = split_buffer(original_text);

    std::vector<Placement> placements;
    if (!resolve_placements(buffer, patch, placements, result, on_progress)) {
        return false;
    }

    if (check_overlaps(placements)) {
        result.set_error(PatchErrorKind::OverlappingHunks, -1, "Overlapping hunks detected. Patch aborted.");
        if (on_progress) {
            on_progress(result.error);
        }
        return false;
    }

    apply_placements(buffer, std::move(placements));

    result.text = join_buffer(buffer);
    if (on_progress) {
        on_progress(fmt::format("Applied {} hunk(s)", patch.hunks.size()));
    }
    return true;
}
