#include "peerdrop/network/control_frame.hpp"
#include <nlohmann/json.hpp>

namespace peerdrop::network {

namespace {
    constexpr const char* TYPE_METADATA = "metadata";
    constexpr const char* TYPE_END = "end";
    
    void set_error(std::string* error, std::string message) {
        if (error) {
            *error = std::move(message);
        }
    }
}

std::string encode_control_frame(const ControlFrame& frame) {
    nlohmann::ordered_json j;
    
    if (const auto* meta = std::get_if<MetadataFrame>(&frame)) {
        j["type"] = TYPE_METADATA;
        j["fileName"] = meta->metadata.file_name;
        j["fileSize"] = meta->metadata.file_size;
        j["fileType"] = meta->metadata.file_type;
    } else {
        j["type"] = TYPE_END;
    }
    
    return j.dump();
}

std::optional<ControlFrame> decode_control_frame(std::string_view text, std::string* error) {
    auto j = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        set_error(error, "Control frame is not a JSON object");
        return std::nullopt;
    }
    
    auto type_it = j.find("type");
    if (type_it == j.end() || !type_it->is_string()) {
        set_error(error, "Control frame has no type");
        return std::nullopt;
    }
    
    const auto& type = type_it->get_ref<const std::string&>();
    if (type == TYPE_END) {
        return ControlFrame{EndFrame{}};
    }
    
    if (type != TYPE_METADATA) {
        set_error(error, "Unknown control frame type: " + type);
        return std::nullopt;
    }
    
    auto name_it = j.find("fileName");
    auto size_it = j.find("fileSize");
    if (name_it == j.end() || !name_it->is_string() ||
        size_it == j.end() || !size_it->is_number_unsigned()) {
        set_error(error, "Metadata frame is missing fileName or fileSize");
        return std::nullopt;
    }
    
    MetadataFrame frame;
    frame.metadata.file_name = name_it->get<std::string>();
    frame.metadata.file_size = size_it->get<std::uint64_t>();
    
    auto type_field = j.find("fileType");
    if (type_field != j.end() && type_field->is_string()) {
        frame.metadata.file_type = type_field->get<std::string>();
    }
    
    return ControlFrame{std::move(frame)};
}

} // namespace peerdrop::network
