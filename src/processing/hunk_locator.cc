#include "hunk_locator.hpp"

#include "util/whitespace.hpp"

#include <initializer_list>

using namespace sturdy;

namespace {

bool
lines_match(const Line& buffer_line, const Line& search_line, MatchMode mode) {
    switch (mode) {
        case MatchMode::Exact:
            return buffer_line.same_content(search_line);
        case MatchMode::Tolerant:
            if (buffer_line.same_content(search_line)) {
                return true;
            }
            return trim_whitespace(buffer_line.content) == trim_whitespace(search_line.content);
    }
    return false;
}

}  // namespace

std::string
sturdy::to_string(MatchMode mode) {
    switch (mode) {
        case MatchMode::Exact:
            return "strict";
        case MatchMode::Tolerant:
            return "floating";
    }
    return "unknown";
}

std::vector<int64_t>
sturdy::locate(gsl::span<const Line> buffer, gsl::span<const Line> search, MatchMode mode) {
    std::vector<int64_t> matches;

    const auto window = static_cast<int64_t>(search.size());
    const auto max_start = static_cast<int64_t>(buffer.size()) - window;
    if (window == 0 || max_start < 0) {
        return matches;
    }

    for (int64_t start = 0; start <= max_start; start++) {
        bool ok = true;
        for (int64_t offset = 0; offset < window; offset++) {
            if (!lines_match(buffer[start + offset], search[offset], mode)) {
                ok = false;
                break;
            }
        }
        if (ok) {
            matches.push_back(start);
        }
    }

    return matches;
}

LocateResult
sturdy::resolve_hunk(gsl::span<const Line> buffer, gsl::span<const Line> search) {
    LocateResult result;

    for (auto mode : {MatchMode::Exact, MatchMode::Tolerant}) {
        auto matches = locate(buffer, search, mode);
        result.mode = mode;
        result.match_count = static_cast<int64_t>(matches.size());

        if (matches.size() == 1) {
            result.status = LocateStatus::Found;
            result.start = matches[0];
            return result;
        }
        if (matches.size() > 1) {
            result.status = LocateStatus::Ambiguous;
            return result;
        }
    }

    result.status = LocateStatus::NotFound;
    return result;
}
