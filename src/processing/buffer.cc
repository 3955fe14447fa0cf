#include "buffer.hpp"

#include <string>
#include <vector>

using namespace sturdy;

namespace {

std::vector<std::string>
split_on(const std::string& text, const std::string& delimiter) {
    std::vector<std::string> parts;
    std::string::size_type pos = 0;
    while (true) {
        auto next = text.find(delimiter, pos);
        if (next == std::string::npos) {
            parts.push_back(text.substr(pos));
            break;
        }
        parts.push_back(text.substr(pos, next - pos));
        pos = next + delimiter.size();
    }
    return parts;
}

}  // namespace

std::string
sturdy::detect_line_ending(const std::string& text) {
    return text.find("\r\n") != std::string::npos ? "\r\n" : "\n";
}

Buffer
sturdy::split_buffer(const std::string& text) {
    Buffer buffer;
    buffer.line_ending = detect_line_ending(text);

    for (const auto& raw : split_on(text, buffer.line_ending)) {
        buffer.lines.push_back(tokenize_line(raw));
    }

    return buffer;
}

std::vector<Line>
sturdy::split_block(const std::string& text) {
    std::vector<Line> lines;
    std::string::size_type start = 0;
    for (std::string::size_type i = 0; i < text.size(); i++) {
        if (text[i] != '\n') {
            continue;
        }
        auto end = i;
        if (end > start && text[end - 1] == '\r') {
            end--;
        }
        lines.push_back(tokenize_line(text.substr(start, end - start)));
        start = i + 1;
    }
    lines.push_back(tokenize_line(text.substr(start)));
    return lines;
}

std::string
sturdy::join_buffer(const Buffer& buffer) {
    std::string result;
    for (std::size_t i = 0; i < buffer.lines.size(); i++) {
        if (i > 0) {
            result += buffer.line_ending;
        }
        result += reconstruct(buffer.lines[i]);
    }
    return result;
}
