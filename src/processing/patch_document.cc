#include "patch_document.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include <string>
#include <utility>

using namespace sturdy;
using json = nlohmann::json;

namespace {

const std::string kPatchSchema = R"foo({
  "hunks": [
    {
      "description": "Short human description",
      "search_block": "exact text to find\n(can span multiple lines)",
      "replace_block": "replacement text\n(same or different length)"
    }
  ]
}
)foo";

std::string
trim_outer(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n\f\v");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(" \t\r\n\f\v");
    return s.substr(begin, end - begin + 1);
}

bool
fail(PatchResult& result, int64_t hunk_index, std::string message) {
    result.set_error(PatchErrorKind::MalformedPatch, hunk_index, std::move(message));
    return false;
}

}  // namespace

std::string
sturdy::strip_code_fence(const std::string& text) {
    auto trimmed = trim_outer(text);
    if (trimmed.compare(0, 3, "```") != 0) {
        return trimmed;
    }

    // Drop the opening fence line, including an optional language tag.
    auto body_start = trimmed.find('\n');
    if (body_start == std::string::npos) {
        return trimmed;
    }

    auto body = trimmed.substr(body_start + 1);
    auto closing = body.rfind("```");
    if (closing != std::string::npos) {
        body = body.substr(0, closing);
    }
    return trim_outer(body);
}

bool
sturdy::parse_patch(const std::string& json_text, HunkSet& patch, PatchResult& result) {
    result = PatchResult{};
    patch.hunks.clear();

    json document;
    try {
        document = json::parse(strip_code_fence(json_text));
    } catch (const json::parse_error& e) {
        return fail(result, -1, fmt::format("Invalid JSON: {}", e.what()));
    }

    if (!document.is_object()) {
        return fail(result, -1, "Patch JSON must be an object.");
    }

    auto hunks = document.find("hunks");
    if (hunks == document.end() || !hunks->is_array()) {
        return fail(result, -1, "Patch JSON must contain a 'hunks' array.");
    }

    for (std::size_t idx = 0; idx < hunks->size(); idx++) {
        const auto& entry = (*hunks)[idx];
        const auto num = idx + 1;
        const auto index = static_cast<int64_t>(idx);

        if (!entry.is_object()) {
            return fail(result, index, fmt::format("Hunk {} is not an object.", num));
        }

        auto search = entry.find("search_block");
        auto replace = entry.find("replace_block");
        if (search == entry.end() || replace == entry.end() || !search->is_string() ||
            !replace->is_string()) {
            return fail(result, index, fmt::format("Hunk {} is missing search_block or replace_block.", num));
        }

        Hunk hunk;
        hunk.search_block = search->get<std::string>();
        hunk.replace_block = replace->get<std::string>();

        auto description = entry.find("description");
        if (description != entry.end() && !description->is_null()) {
            if (!description->is_string()) {
                return fail(result, index, fmt::format("Hunk {} has a description that is not a string.", num));
            }
            hunk.description = description->get<std::string>();
        }

        patch.hunks.push_back(std::move(hunk));
    }

    return true;
}

bool
sturdy::apply_patch_document(const std::string& original_text,
                             const std::string& json_text,
                             PatchResult& result,
                             const ProgressSink& on_progress) {
    HunkSet patch;
    if (!parse_patch(json_text, patch, result)) {
        if (on_progress) {
            on_progress(result.error);
        }
        return false;
    }
    return apply_patch(original_text, patch, result, on_progress);
}

const std::string&
sturdy::patch_schema() {
    return kPatchSchema;
}
