#pragma once

/*
    Split a physical line into indentation, content and trailing whitespace.

    Indentation and trailing whitespace are the maximal runs of spaces and
    tabs at either end of the line. A line that is nothing but whitespace
    puts all of it into the indentation and has empty content. The three
    parts concatenated always reproduce the input byte for byte.
*/

#include <cstdint>
#include <string>

namespace sturdy {

struct Line {
    std::string indent;
    std::string content;
    std::string trailing;

    // crc32c of `content`. Keep it in sync through set_content().
    uint32_t checksum = 0;

    void
    set_content(const std::string& new_content);

    bool
    same_content(const Line& other) const {
        return checksum == other.checksum && content == other.content;
    }
};

Line
tokenize_line(const std::string& raw_line);

std::string
reconstruct(const Line& line);

uint32_t
content_checksum(const std::string& content);

}  // namespace sturdy
