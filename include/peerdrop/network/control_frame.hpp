#pragma once

#include "peerdrop/storage/file_metadata.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace peerdrop::network {

// Control frames travel as text messages on the data channel; file bytes
// travel as binary messages with no header. The channel's message type is
// what tells them apart.
struct MetadataFrame {
    storage::FileMetadata metadata;
};

struct EndFrame {};

using ControlFrame = std::variant<MetadataFrame, EndFrame>;

std::string encode_control_frame(const ControlFrame& frame);

// Returns std::nullopt and fills error (when given) for text that is not a
// well-formed control frame.
std::optional<ControlFrame> decode_control_frame(std::string_view text, std::string* error = nullptr);

} // namespace peerdrop::network
