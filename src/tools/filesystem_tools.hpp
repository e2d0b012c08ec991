#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include "core/errors/gatehouse_errors.hpp"
#include "policy/path_guard.hpp"
#include "protocol/tool_contract.hpp"

namespace gatehouse::tools {

inline constexpr std::uintmax_t kMaxInlineBytes = 5 * 1024 * 1024;
// Images and other binary files up to this size come back base64 encoded.
inline constexpr std::uintmax_t kMaxBase64Bytes = 1024 * 1024;

struct FileSearchRequest {
    std::string root;
    std::string pattern;
    std::size_t max_results = 1000;
};

// "file:///abs/path"
std::string resource_uri(const std::filesystem::path& path);

// Guess from the extension, falling back to sniffing the content.
std::string detect_mime_type(const std::filesystem::path& path);
bool is_text_mime_type(const std::string& mime_type);
bool is_image_mime_type(const std::string& mime_type);

std::string encode_base64(const std::string& bytes);

// Every path argument passes through the PathGuard before any I/O, and the
// guard's canonical path is the one operated on.
class FilesystemTools {
public:
    explicit FilesystemTools(policy::PathGuard guard);

    core::errors::Result<protocol::ToolResult> read_file(const std::string& path) const;

    core::errors::Result<protocol::ToolResult> write_file(const std::string& path,
                                                          const std::string& content) const;

    core::errors::Result<protocol::ToolResult> list_directory(const std::string& path) const;

    core::errors::Result<protocol::ToolResult> create_directory(const std::string& path) const;

    core::errors::Result<protocol::ToolResult> move_file(const std::string& source,
                                                         const std::string& destination) const;

    core::errors::Result<protocol::ToolResult> search_files(
        const FileSearchRequest& request) const;

    core::errors::Result<protocol::ToolResult> get_file_info(const std::string& path) const;

    protocol::ToolResult list_allowed_directories() const;

    // Serves a file:// URI: directories as a listing, text as text, small
    // binaries as a base64 blob, anything larger as a reference.
    core::errors::Result<protocol::ToolResult> read_resource(const std::string& uri) const;

private:
    core::errors::Result<std::filesystem::path> resolve(const std::string& path) const;

    policy::PathGuard guard_;
};

}  // namespace gatehouse::tools
