#include "whitespace.hpp"

#include <cstring>

using namespace sturdy;

namespace {

// UTF-8 encodings of the non-ASCII Unicode whitespace characters.
// clang-format off
const char* const kUnicodeSpaces[] = {
    "\xC2\x85",      // U+0085 next line
    "\xC2\xA0",      // U+00A0 no-break space
    "\xE1\x9A\x80",  // U+1680 ogham space mark
    "\xE2\x80\x80", "\xE2\x80\x81", "\xE2\x80\x82", "\xE2\x80\x83",
    "\xE2\x80\x84", "\xE2\x80\x85", "\xE2\x80\x86", "\xE2\x80\x87",
    "\xE2\x80\x88", "\xE2\x80\x89", "\xE2\x80\x8A",  // U+2000..U+200A
    "\xE2\x80\xA8",  // U+2028 line separator
    "\xE2\x80\xA9",  // U+2029 paragraph separator
    "\xE2\x80\xAF",  // U+202F narrow no-break space
    "\xE2\x81\x9F",  // U+205F medium mathematical space
    "\xE3\x80\x80",  // U+3000 ideographic space
};
// clang-format on

bool
is_ascii_whitespace(char c) {
    const char whitespaces[] = " \t\r\n\f\v\x1C\x1D\x1E\x1F";
    for (std::size_t i = 0; i < sizeof(whitespaces) - 1; i++) {
        if (whitespaces[i] == c) {
            return true;
        }
    }
    return false;
}

}  // namespace

bool
sturdy::is_indent_char(char c) {
    return c == ' ' || c == '\t';
}

std::size_t
sturdy::whitespace_prefix_length(const std::string& s, std::size_t pos) {
    if (pos >= s.size()) {
        return 0;
    }
    if (is_ascii_whitespace(s[pos])) {
        return 1;
    }
    for (const char* space : kUnicodeSpaces) {
        auto len = std::strlen(space);
        if (s.compare(pos, len, space) == 0) {
            return len;
        }
    }
    return 0;
}

std::size_t
sturdy::whitespace_suffix_length(const std::string& s, std::size_t end) {
    if (end == 0 || end > s.size()) {
        return 0;
    }
    if (is_ascii_whitespace(s[end - 1])) {
        return 1;
    }
    for (const char* space : kUnicodeSpaces) {
        auto len = std::strlen(space);
        if (end >= len && s.compare(end - len, len, space) == 0) {
            return len;
        }
    }
    return 0;
}

std::string
sturdy::trim_whitespace(const std::string& s) {
    std::size_t start = 0;
    std::size_t end = s.size();

    while (start < end) {
        auto n = whitespace_prefix_length(s, start);
        if (n == 0 || start + n > end) {
            break;
        }
        start += n;
    }

    while (end > start) {
        auto n = whitespace_suffix_length(s, end);
        if (n == 0 || end - n < start) {
            break;
        }
        end -= n;
    }

    return s.substr(start, end - start);
}
