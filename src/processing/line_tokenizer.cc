#include "line_tokenizer.hpp"

#include "util/whitespace.hpp"

#include <crc32c/crc32c.h>

#include <string>

using namespace sturdy;

uint32_t
sturdy::content_checksum(const std::string& content) {
    return crc32c::Crc32c(content.data(), content.size());
}

void
sturdy::Line::set_content(const std::string& new_content) {
    content = new_content;
    checksum = content_checksum(content);
}

Line
sturdy::tokenize_line(const std::string& raw_line) {
    const auto size = raw_line.size();

    std::string::size_type indent_end = 0;
    while (indent_end < size && is_indent_char(raw_line[indent_end])) {
        indent_end++;
    }

    // Whitespace-only (or empty) line. Everything goes into the indent.
    if (indent_end == size) {
        Line line;
        line.indent = raw_line;
        line.checksum = content_checksum(line.content);
        return line;
    }

    std::string::size_type content_end = size;
    while (content_end > indent_end && is_indent_char(raw_line[content_end - 1])) {
        content_end--;
    }

    Line line;
    line.indent = raw_line.substr(0, indent_end);
    line.content = raw_line.substr(indent_end, content_end - indent_end);
    line.trailing = raw_line.substr(content_end);
    line.checksum = content_checksum(line.content);
    return line;
}

std::string
sturdy::reconstruct(const Line& line) {
    std::string result;
    result.reserve(line.indent.size() + line.content.size() + line.trailing.size());
    result += line.indent;
    result += line.content;
    result += line.trailing;
    return result;
}
