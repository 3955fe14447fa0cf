#pragma once

/*
    Find where a block of lines occurs inside a buffer.

    This is a plain window scan: every start index is tried and a window
    matches only if every line in it matches. Two comparison modes exist:

        Exact     compare line content as tokenized
        Tolerant  compare line content after trimming all outer whitespace

    The tokenizer already strips spaces and tabs from the content, so the
    modes only differ for other whitespace (a stray "\r", no-break spaces
    and the like).
*/

#include "processing/line_tokenizer.hpp"

#include <gsl/span>

#include <cstdint>
#include <string>
#include <vector>

namespace sturdy {

enum class MatchMode {
    Exact,
    Tolerant,
};

std::string
to_string(MatchMode mode);

// Start indexes (ascending) of every window in `buffer` matching `search`.
// An empty search block never matches.
std::vector<int64_t>
locate(gsl::span<const Line> buffer, gsl::span<const Line> search, MatchMode mode);

enum class LocateStatus {
    Found,
    Ambiguous,
    NotFound,
};

struct LocateResult {
    LocateStatus status = LocateStatus::NotFound;

    // Mode that decided the outcome.
    MatchMode mode = MatchMode::Exact;

    int64_t start = -1;
    int64_t match_count = 0;
};

// Exact first. A unique exact match wins, several exact matches are
// ambiguous. Only when there is no exact match is tolerant mode tried, and
// it has to be unique as well.
LocateResult
resolve_hunk(gsl::span<const Line> buffer, gsl::span<const Line> search);

}  // namespace sturdy
