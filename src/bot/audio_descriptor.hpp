#pragma once

#include <cstdint>
#include <optional>
#include <string>

// Metadata of an inbound audio file as reported by the chat transport.
// The bytes are fetched later by the worker, using source_id.
struct AudioDescriptor {
    std::string source_id;
    uint64_t declared_size = 0;
    std::string mime_type;
    std::optional<std::string> display_name;
    std::string unique_id;
};
