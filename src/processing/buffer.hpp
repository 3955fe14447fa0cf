#pragma once

/*
    A text buffer held as a list of tokenized lines plus the line ending
    used to join them again.

    The line ending is detected once: if "\r\n" appears anywhere the whole
    buffer uses it, otherwise "\n". An empty text is a single empty line.
*/

#include "processing/line_tokenizer.hpp"

#include <string>
#include <vector>

namespace sturdy {

struct Buffer {
    std::vector<Line> lines;
    std::string line_ending = "\n";
};

std::string
detect_line_ending(const std::string& text);

Buffer
split_buffer(const std::string& text);

// Split a search or replace block on either "\r\n" or "\n", independent
// of the buffer's convention. An empty block is one empty line.
std::vector<Line>
split_block(const std::string& text);

std::string
join_buffer(const Buffer& buffer);

}  // namespace sturdy
