#pragma once

#include "backend.hpp"
#include "config.hpp"

#include <expected>
#include <memory>
#include <string>

// Builds one model instance for the configured backend type.
std::expected<std::unique_ptr<SpeechModel>, std::string>
make_speech_model(const Config::Backend& backend);
