#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

inline constexpr size_t kMessageSizeLimit = 4096;
inline constexpr std::string_view kTranscriptionHeader = "Transcription:\n\n";

// Length in Unicode code points of UTF-8 text. Continuation bytes are not
// counted, so malformed input never over-counts.
size_t utf8_length(std::string_view text);

// Splits text into bodies that fit in one message once header is prepended.
// Splits happen on code point boundaries only; concatenating the bodies
// gives back the input. Returns no chunks for empty input.
std::vector<std::string> split_for_messages(std::string_view text,
                                            std::string_view header = kTranscriptionHeader,
                                            size_t limit = kMessageSizeLimit);
