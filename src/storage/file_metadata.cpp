#include "peerdrop/storage/file_metadata.hpp"
#include "peerdrop/core/utils.hpp"
#include "peerdrop/core/logger.hpp"
#include <unordered_map>

namespace peerdrop::storage {

FileMetadata::FileMetadata(std::string name, std::uint64_t size, std::string type)
    : file_name(std::move(name))
    , file_size(size)
    , file_type(std::move(type))
{
}

bool FileMetadata::operator==(const FileMetadata& other) const {
    return file_name == other.file_name &&
           file_size == other.file_size &&
           file_type == other.file_type;
}

bool FileMetadata::operator!=(const FileMetadata& other) const {
    return !(*this == other);
}

FileBlob::FileBlob(std::string file_name, std::string type, std::vector<std::uint8_t> bytes)
    : name(std::move(file_name))
    , content_type(std::move(type))
    , data(std::move(bytes))
{
}

FileMetadata FileBlob::metadata() const {
    return FileMetadata(name, data.size(), content_type);
}

std::optional<FileBlob> FileBlob::load(const std::filesystem::path& path) {
    if (!core::utils::FileUtils::is_file(path)) {
        LOG_WARN("Not a regular file: {}", path.string());
        return std::nullopt;
    }
    
    auto bytes = core::utils::FileUtils::read_binary(path);
    if (!bytes) {
        LOG_ERROR("Failed to read file: {}", path.string());
        return std::nullopt;
    }
    
    return FileBlob(path.filename().string(), guess_content_type(path), std::move(*bytes));
}

std::string guess_content_type(const std::filesystem::path& path) {
    static const std::unordered_map<std::string, std::string> types = {
        {".txt", "text/plain"},
        {".html", "text/html"},
        {".css", "text/css"},
        {".csv", "text/csv"},
        {".json", "application/json"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".mp3", "audio/mpeg"},
        {".mp4", "video/mp4"}
    };
    
    auto it = types.find(core::utils::StringUtils::to_lower(path.extension().string()));
    if (it != types.end()) {
        return it->second;
    }
    
    // Unknown types travel as an empty string, like a browser File with no type.
    return "";
}

} // namespace peerdrop::storage
