#pragma once

/*
    Whitespace classification for patch matching.

    Two classes are used. Indentation characters (space and tab) are what a
    Line is split on. The wider class below is what the tolerant comparison
    trims: ASCII whitespace plus the UTF-8 encoded Unicode space separators.
*/

#include <string>

namespace sturdy {

bool
is_indent_char(char c);

// Number of bytes of the whitespace sequence starting at `pos`, or 0.
std::size_t
whitespace_prefix_length(const std::string& s, std::size_t pos);

// Number of bytes of the whitespace sequence ending right before `end`, or 0.
std::size_t
whitespace_suffix_length(const std::string& s, std::size_t end);

std::string
trim_whitespace(const std::string& s);

}  // namespace sturdy
