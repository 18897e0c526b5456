#include "error_classifier.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace {

struct Rule {
    std::array<std::string_view, 2> needles;
    ErrorCategory category;
};

const std::array<Rule, 3> kRules = {{
    {{{"download", "file"}}, ErrorCategory::Download},
    {{{"cannot reshape tensor", "tensor of 0 elements"}}, ErrorCategory::UnprocessableAudio},
    {{{"transcribe", "whisper"}}, ErrorCategory::Transcription},
}};

} // namespace

ErrorCategory classify_error(std::string_view description) {
    std::string lower(description);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& rule : kRules) {
        for (auto needle : rule.needles) {
            if (lower.find(needle) != std::string::npos) return rule.category;
        }
    }
    return ErrorCategory::Unclassified;
}

std::string_view user_message(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Download:
            return "Sorry, failed to download your file. Please try again.";
        case ErrorCategory::UnprocessableAudio:
            return "Sorry, this audio file cannot be processed. It may be too short, "
                   "corrupted, or in an unsupported format.";
        case ErrorCategory::Transcription:
            return "Sorry, failed to transcribe your audio. The file may be corrupted "
                   "or in an unsupported format.";
        case ErrorCategory::Unclassified:
            break;
    }
    return "Sorry, an error occurred while processing your file.";
}
