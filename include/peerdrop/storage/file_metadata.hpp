#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <cstdint>

namespace peerdrop::storage {

// Describes the one file carried by a transfer. Never modified after the
// transfer has been announced.
struct FileMetadata {
    std::string file_name;
    std::uint64_t file_size = 0;
    std::string file_type;
    
    FileMetadata() = default;
    FileMetadata(std::string name, std::uint64_t size, std::string type);
    
    bool operator==(const FileMetadata& other) const;
    bool operator!=(const FileMetadata& other) const;
};

// A whole file held in memory: what the caller hands to send_file and what
// the completion callback receives.
struct FileBlob {
    std::string name;
    std::string content_type;
    std::vector<std::uint8_t> data;
    
    FileBlob() = default;
    FileBlob(std::string file_name, std::string type, std::vector<std::uint8_t> bytes);
    
    std::uint64_t size() const { return data.size(); }
    FileMetadata metadata() const;
    
    static std::optional<FileBlob> load(const std::filesystem::path& path);
};

std::string guess_content_type(const std::filesystem::path& path);

} // namespace peerdrop::storage
