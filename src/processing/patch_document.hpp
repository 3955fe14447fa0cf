#pragma once

/*
    Patch documents as exchanged with the outside world:

        { "hunks": [ { "description": "...",
                       "search_block": "...",
                       "replace_block": "..." } ] }

    The document is validated into a HunkSet before the engine sees it. Any
    shape problem is reported as PatchErrorKind::MalformedPatch.
*/

#include "processing/patch.hpp"

#include <string>

namespace sturdy {

// Remove surrounding whitespace and a Markdown code fence (``` or ```json)
// wrapped around the document, as language models like to produce.
std::string
strip_code_fence(const std::string& text);

bool
parse_patch(const std::string& json_text, HunkSet& patch, PatchResult& result);

bool
apply_patch_document(const std::string& original_text,
                     const std::string& json_text,
                     PatchResult& result,
                     const ProgressSink& on_progress = {});

const std::string&
patch_schema();

}  // namespace sturdy
