#pragma once

#include <string_view>

enum class ErrorCategory { Download, UnprocessableAudio, Transcription, Unclassified };

// Maps a failure description to the message the user sees. Matching is a
// case-insensitive substring search; the first rule that matches wins.
ErrorCategory classify_error(std::string_view description);
std::string_view user_message(ErrorCategory category);

inline std::string_view classify_to_message(std::string_view description) {
    return user_message(classify_error(description));
}
