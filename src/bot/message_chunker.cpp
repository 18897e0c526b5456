#include "message_chunker.hpp"

namespace {

bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

} // namespace

size_t utf8_length(std::string_view text) {
    size_t n = 0;
    for (unsigned char c : text) {
        if (!is_continuation(c)) ++n;
    }
    return n;
}

std::vector<std::string> split_for_messages(std::string_view text, std::string_view header,
                                            size_t limit) {
    std::vector<std::string> chunks;
    size_t header_len = utf8_length(header);
    size_t body_limit = limit > header_len ? limit - header_len : 1;

    size_t start = 0;
    while (start < text.size()) {
        size_t pos = start;
        size_t points = 0;
        while (pos < text.size()) {
            if (!is_continuation(static_cast<unsigned char>(text[pos]))) {
                if (points == body_limit) break;
                ++points;
            }
            ++pos;
        }
        chunks.emplace_back(text.substr(start, pos - start));
        start = pos;
    }
    return chunks;
}
