#include "tools/filesystem_tools.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <fstream>
#include <map>
#include <sstream>
#include <sys/stat.h>
#include <system_error>
#include <utility>
#include <vector>
#include <openssl/evp.h>
#include "core/logging/logger.hpp"

namespace gatehouse::tools {

using core::errors::ErrorCategory;
using core::errors::GatehouseError;
using protocol::ToolResult;

namespace {

using Clock = std::chrono::steady_clock;

double elapsed_ms(const Clock::time_point started) {
    return std::chrono::duration<double, std::milli>(Clock::now() - started).count();
}

ToolResult failure(const std::string& tool, std::string message,
                   const Clock::time_point started) {
    return ToolResult{tool, false, "", std::move(message), elapsed_ms(started), {}};
}

ToolResult success(const std::string& tool, std::string output,
                   const Clock::time_point started) {
    return ToolResult{tool, true, std::move(output), "", elapsed_ms(started), {}};
}

bool read_all(const std::filesystem::path& path, std::string& content) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (!in.good() && !in.eof()) {
        return false;
    }
    content = buffer.str();
    return true;
}

std::string summarize(const std::filesystem::path& path, const std::string& mime_type,
                      const std::uintmax_t size) {
    return path.string() + " (" + mime_type + ", " + std::to_string(size) + " bytes)";
}

bool is_probably_binary(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }

    constexpr std::size_t kSniffSize = 1024;
    char buffer[kSniffSize];
    in.read(buffer, static_cast<std::streamsize>(kSniffSize));
    const std::streamsize read_bytes = in.gcount();
    for (std::streamsize i = 0; i < read_bytes; ++i) {
        if (buffer[i] == '\0') {
            return true;
        }
    }
    return false;
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

std::string format_utc(const std::time_t seconds) {
    std::tm parts{};
    if (gmtime_r(&seconds, &parts) == nullptr) {
        return "unknown";
    }
    char buffer[32];
    if (std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &parts) == 0) {
        return "unknown";
    }
    return buffer;
}

std::string octal_permissions(const mode_t mode) {
    std::ostringstream out;
    out << std::oct << (mode & 0777);
    return out.str();
}

std::string describe_entry(const std::filesystem::directory_entry& entry,
                           const std::string& label) {
    // The entry itself, never what a link points at.
    std::error_code ec;
    const auto status = entry.symlink_status(ec);
    if (!ec && std::filesystem::is_symlink(status)) {
        return "[LINK] " + label + " (" + resource_uri(entry.path()) + ")";
    }
    if (!ec && std::filesystem::is_directory(status)) {
        return "[DIR]  " + label + " (" + resource_uri(entry.path()) + ")";
    }
    const auto size = entry.file_size(ec);
    if (ec) {
        return "[FILE] " + label + " (" + resource_uri(entry.path()) + ")";
    }
    return "[FILE] " + label + " (" + resource_uri(entry.path()) + ") - " +
           std::to_string(size) + " bytes";
}

}  // namespace

std::string resource_uri(const std::filesystem::path& path) {
    return "file://" + path.string();
}

std::string detect_mime_type(const std::filesystem::path& path) {
    static const std::map<std::string, std::string> kByExtension = {
        {".txt", "text/plain"},          {".log", "text/plain"},
        {".md", "text/markdown"},        {".csv", "text/csv"},
        {".html", "text/html"},          {".htm", "text/html"},
        {".css", "text/css"},            {".xml", "application/xml"},
        {".json", "application/json"},   {".js", "application/javascript"},
        {".yaml", "text/yaml"},          {".yml", "text/yaml"},
        {".toml", "text/plain"},         {".ini", "text/plain"},
        {".conf", "text/plain"},         {".sh", "text/x-shellscript"},
        {".c", "text/x-c"},              {".h", "text/x-c"},
        {".cc", "text/x-c++"},           {".cpp", "text/x-c++"},
        {".hpp", "text/x-c++"},          {".py", "text/x-python"},
        {".go", "text/x-go"},            {".rs", "text/x-rust"},
        {".svg", "image/svg+xml"},       {".png", "image/png"},
        {".jpg", "image/jpeg"},          {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},           {".webp", "image/webp"},
        {".pdf", "application/pdf"},     {".zip", "application/zip"},
        {".gz", "application/gzip"},     {".tar", "application/x-tar"}};

    const auto it = kByExtension.find(lowercase(path.extension().string()));
    if (it != kByExtension.end()) {
        return it->second;
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return "application/octet-stream";
    }
    return is_probably_binary(path) ? "application/octet-stream" : "text/plain";
}

bool is_text_mime_type(const std::string& mime_type) {
    return mime_type.rfind("text/", 0) == 0 || mime_type == "application/json" ||
           mime_type == "application/xml" || mime_type == "application/javascript" ||
           mime_type == "application/x-javascript" ||
           mime_type.find("+xml") != std::string::npos ||
           mime_type.find("+json") != std::string::npos;
}

bool is_image_mime_type(const std::string& mime_type) {
    return mime_type.rfind("image/", 0) == 0;
}

std::string encode_base64(const std::string& bytes) {
    if (bytes.empty()) {
        return "";
    }
    std::string encoded(4 * ((bytes.size() + 2) / 3), '\0');
    const int written =
        EVP_EncodeBlock(reinterpret_cast<unsigned char*>(encoded.data()),
                        reinterpret_cast<const unsigned char*>(bytes.data()),
                        static_cast<int>(bytes.size()));
    encoded.resize(written > 0 ? static_cast<std::size_t>(written) : 0);
    return encoded;
}

FilesystemTools::FilesystemTools(policy::PathGuard guard) : guard_(std::move(guard)) {}

core::errors::Result<std::filesystem::path> FilesystemTools::resolve(
    const std::string& path) const {
    auto decision = guard_.validate(path);
    if (core::errors::is_error(decision)) {
        const auto& rejection = core::errors::get_error(decision);
        GATEHOUSE_LOG_DEBUG("FilesystemTools: path rejected (" +
                            policy::to_string(rejection.kind) + "): " + rejection.path);
        return policy::to_error(rejection);
    }
    return core::errors::get_value(decision);
}

core::errors::Result<ToolResult> FilesystemTools::read_file(const std::string& path) const {
    const auto started = Clock::now();
    auto resolved = resolve(path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path file_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec) || ec) {
        return failure("read_file", "File does not exist: " + file_path.string(), started);
    }
    if (std::filesystem::is_directory(file_path, ec) && !ec) {
        return failure("read_file",
                       "Path is a directory; use list_directory to browse it: " +
                           file_path.string(),
                       started);
    }
    if (!std::filesystem::is_regular_file(file_path, ec) || ec) {
        return failure("read_file", "Path is not a regular file: " + file_path.string(),
                       started);
    }

    const auto size = std::filesystem::file_size(file_path, ec);
    if (ec) {
        return failure("read_file", "Unable to determine file size: " + file_path.string(),
                       started);
    }
    if (size > kMaxInlineBytes) {
        return failure("read_file",
                       "File is too large to display inline (" + std::to_string(size) +
                           " bytes): " + file_path.string(),
                       started);
    }

    const std::string mime_type = detect_mime_type(file_path);
    const bool text = is_text_mime_type(mime_type) && !is_probably_binary(file_path);
    const std::string uri = resource_uri(file_path);
    const bool image = is_image_mime_type(mime_type);

    if (!text && size > kMaxBase64Bytes) {
        if (image) {
            return success("read_file",
                           "Image file is too large to display inline (" +
                               std::to_string(size) +
                               " bytes). Access it via resource URI: " + uri,
                           started);
        }
        return success("read_file",
                       "Binary file: " + summarize(file_path, mime_type, size) +
                           ". Access it via resource URI: " + uri,
                       started);
    }

    std::string content;
    if (!read_all(file_path, content)) {
        return failure("read_file", "I/O error while reading file: " + file_path.string(),
                       started);
    }
    if (text) {
        return success("read_file", std::move(content), started);
    }

    auto result = success("read_file",
                          (image ? "Image file: " : "Binary file: ") +
                              summarize(file_path, mime_type, size),
                          started);
    result.content.push_back(
        protocol::ContentBlock{image ? "image" : "blob", uri, mime_type, encode_base64(content)});
    return result;
}

core::errors::Result<ToolResult> FilesystemTools::write_file(
    const std::string& path, const std::string& content) const {
    const auto started = Clock::now();
    auto resolved = resolve(path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path file_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (std::filesystem::is_directory(file_path, ec) && !ec) {
        return failure("write_file", "Cannot write to a directory: " + file_path.string(),
                       started);
    }

    {
        std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return failure("write_file", "Failed to open file for writing: " +
                                             file_path.string(),
                           started);
        }
        out << content;
        out.flush();
        if (!out.good()) {
            return failure("write_file", "I/O error while writing file: " +
                                             file_path.string(),
                           started);
        }
    }

    return success("write_file",
                   "Successfully wrote " + std::to_string(content.size()) + " bytes to " +
                       file_path.string(),
                   started);
}

core::errors::Result<ToolResult> FilesystemTools::list_directory(
    const std::string& path) const {
    const auto started = Clock::now();
    auto resolved = resolve(path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path dir_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::exists(dir_path, ec) || ec) {
        return failure("list_directory", "Directory does not exist: " + dir_path.string(),
                       started);
    }
    if (!std::filesystem::is_directory(dir_path, ec) || ec) {
        return failure("list_directory", "Path is not a directory: " + dir_path.string(),
                       started);
    }

    std::vector<std::filesystem::directory_entry> entries;
    std::filesystem::directory_iterator it(dir_path, ec);
    const std::filesystem::directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        entries.push_back(*it);
    }
    if (ec) {
        return failure("list_directory", "Error reading directory: " + ec.message(), started);
    }

    std::sort(entries.begin(), entries.end(),
              [](const auto& lhs, const auto& rhs) {
                  return lhs.path().filename() < rhs.path().filename();
              });

    std::ostringstream out;
    out << "Directory listing for: " << dir_path.string() << "\n\n";
    for (const auto& entry : entries) {
        out << describe_entry(entry, entry.path().filename().string()) << "\n";
    }
    return success("list_directory", out.str(), started);
}

core::errors::Result<ToolResult> FilesystemTools::create_directory(
    const std::string& path) const {
    const auto started = Clock::now();
    auto resolved = resolve(path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path dir_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (std::filesystem::exists(dir_path, ec) && !ec) {
        if (std::filesystem::is_directory(dir_path, ec) && !ec) {
            return success("create_directory",
                           "Directory already exists: " + dir_path.string(), started);
        }
        return failure("create_directory",
                       "Path exists but is not a directory: " + dir_path.string(), started);
    }

    std::filesystem::create_directory(dir_path, ec);
    if (ec) {
        return failure("create_directory", "Error creating directory: " + ec.message(),
                       started);
    }
    return success("create_directory", "Successfully created directory " + dir_path.string(),
                   started);
}

core::errors::Result<ToolResult> FilesystemTools::move_file(
    const std::string& source, const std::string& destination) const {
    const auto started = Clock::now();
    auto resolved_source = resolve(source);
    if (core::errors::is_error(resolved_source)) {
        return core::errors::get_error(resolved_source);
    }
    const std::filesystem::path source_path = core::errors::get_value(resolved_source);

    std::error_code ec;
    if (!std::filesystem::exists(source_path, ec) || ec) {
        return failure("move_file", "Source does not exist: " + source_path.string(), started);
    }

    auto resolved_destination = resolve(destination);
    if (core::errors::is_error(resolved_destination)) {
        return core::errors::get_error(resolved_destination);
    }
    const std::filesystem::path destination_path =
        core::errors::get_value(resolved_destination);

    std::filesystem::rename(source_path, destination_path, ec);
    if (ec) {
        return failure("move_file", "Error moving file: " + ec.message(), started);
    }
    return success("move_file",
                   "Successfully moved " + source_path.string() + " to " +
                       destination_path.string(),
                   started);
}

core::errors::Result<ToolResult> FilesystemTools::search_files(
    const FileSearchRequest& request) const {
    if (request.pattern.empty()) {
        return GatehouseError{ErrorCategory::Input, "Search pattern cannot be empty.",
                              "empty_search_pattern"};
    }
    if (request.max_results == 0) {
        return GatehouseError{ErrorCategory::Input, "max_results must be greater than zero.",
                              "invalid_search_limit"};
    }

    const auto started = Clock::now();
    auto resolved = resolve(request.root);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path root = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec) || ec) {
        return failure("search_files", "Search path must be a directory: " + root.string(),
                       started);
    }

    const std::string needle = lowercase(request.pattern);
    std::vector<std::filesystem::directory_entry> matches;
    bool truncated = false;

    const auto options = std::filesystem::directory_options::skip_permission_denied;
    std::filesystem::recursive_directory_iterator it(root, options, ec);
    const std::filesystem::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        const auto& entry = *it;
        if (lowercase(entry.path().filename().string()).find(needle) == std::string::npos) {
            continue;
        }
        // Links inside a root may still point out of it.
        if (core::errors::is_error(guard_.validate(entry.path().string()))) {
            continue;
        }
        if (matches.size() >= request.max_results) {
            truncated = true;
            break;
        }
        matches.push_back(entry);
    }
    if (ec) {
        GATEHOUSE_LOG_WARN("FilesystemTools: search stopped early under " + root.string() +
                           ": " + ec.message());
    }

    if (matches.empty()) {
        return success("search_files",
                       "No files found matching pattern '" + request.pattern + "' in " +
                           root.string(),
                       started);
    }

    std::ostringstream out;
    out << "Found " << matches.size() << " results:\n\n";
    for (const auto& entry : matches) {
        out << describe_entry(entry, entry.path().string()) << "\n";
    }
    if (truncated) {
        out << "(results truncated at " << request.max_results << ")\n";
    }
    return success("search_files", out.str(), started);
}

core::errors::Result<ToolResult> FilesystemTools::get_file_info(
    const std::string& path) const {
    const auto started = Clock::now();
    auto resolved = resolve(path);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path info_path = core::errors::get_value(resolved);

    struct stat info {};
    if (::stat(info_path.c_str(), &info) != 0) {
        return failure("get_file_info",
                       "Error getting file info: " + std::string(std::strerror(errno)),
                       started);
    }

    const bool is_directory = S_ISDIR(info.st_mode);
    const bool is_file = S_ISREG(info.st_mode);
    const std::string mime_type = is_directory ? "directory" : detect_mime_type(info_path);

    std::ostringstream out;
    out << "File information for: " << info_path.string() << "\n\n"
        << "Size: " << info.st_size << " bytes\n"
        << "Changed: " << format_utc(info.st_ctime) << "\n"
        << "Modified: " << format_utc(info.st_mtime) << "\n"
        << "Accessed: " << format_utc(info.st_atime) << "\n"
        << "IsDirectory: " << (is_directory ? "true" : "false") << "\n"
        << "IsFile: " << (is_file ? "true" : "false") << "\n"
        << "Permissions: " << octal_permissions(info.st_mode) << "\n"
        << "MIME Type: " << mime_type << "\n"
        << "Resource URI: " << resource_uri(info_path);
    return success("get_file_info", out.str(), started);
}

ToolResult FilesystemTools::list_allowed_directories() const {
    const auto started = Clock::now();
    const auto& roots = guard_.roots().roots();
    if (roots.empty()) {
        return success("list_allowed_directories", "No directories are allowed.", started);
    }

    std::ostringstream out;
    out << "Allowed directories:\n\n";
    for (const auto& root : roots) {
        out << root.string() << " (" << resource_uri(root) << ")\n";
    }
    return success("list_allowed_directories", out.str(), started);
}

core::errors::Result<ToolResult> FilesystemTools::read_resource(const std::string& uri) const {
    const std::string scheme = "file://";
    if (uri.rfind(scheme, 0) != 0) {
        return GatehouseError{ErrorCategory::Input, "Unsupported URI scheme: " + uri,
                              "unsupported_uri_scheme", "Only file:// URIs can be read."};
    }

    const auto started = Clock::now();
    auto resolved = resolve(uri.substr(scheme.size()));
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path resource_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::exists(resource_path, ec) || ec) {
        return failure("read_resource", "Resource does not exist: " + resource_path.string(),
                       started);
    }
    if (std::filesystem::is_directory(resource_path, ec) && !ec) {
        auto listing = list_directory(resource_path.string());
        if (!core::errors::is_error(listing)) {
            core::errors::get_value(listing).tool_call_id = "read_resource";
        }
        return listing;
    }

    const auto size = std::filesystem::file_size(resource_path, ec);
    if (ec) {
        return failure("read_resource",
                       "Unable to determine file size: " + resource_path.string(), started);
    }
    if (size > kMaxInlineBytes) {
        return success("read_resource",
                       "File is too large to display inline (" + std::to_string(size) +
                           " bytes). Use the read_file tool to access it.",
                       started);
    }

    const std::string mime_type = detect_mime_type(resource_path);
    const bool text = is_text_mime_type(mime_type) && !is_probably_binary(resource_path);
    if (!text && size > kMaxBase64Bytes) {
        return success("read_resource",
                       "Binary file (" + mime_type + ", " + std::to_string(size) +
                           " bytes). Use the read_file tool to access it.",
                       started);
    }

    std::string content;
    if (!read_all(resource_path, content)) {
        return failure("read_resource",
                       "I/O error while reading file: " + resource_path.string(), started);
    }
    if (text) {
        return success("read_resource", std::move(content), started);
    }

    auto result = success("read_resource", summarize(resource_path, mime_type, size), started);
    result.content.push_back(
        protocol::ContentBlock{"blob", resource_uri(resource_path), mime_type,
                               encode_base64(content)});
    return result;
}

}  // namespace gatehouse::tools
