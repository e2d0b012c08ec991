#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <gtest/gtest.h>
#include "core/config/session_id.hpp"
#include "core/errors/gatehouse_errors.hpp"
#include "policy/allowlist_store.hpp"
#include "policy/path_guard.hpp"
#include "tools/filesystem_tools.hpp"

namespace {

using gatehouse::core::errors::ErrorCategory;
using gatehouse::core::errors::get_error;
using gatehouse::core::errors::get_value;
using gatehouse::core::errors::is_error;
using gatehouse::policy::AllowedRoots;
using gatehouse::policy::PathGuard;
using gatehouse::tools::FileSearchRequest;
using gatehouse::tools::FilesystemTools;
namespace fs = std::filesystem;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = fs::current_path() /
                (".tmp_fs_tools_" + gatehouse::core::config::generate_id("ws"));
        fs::create_directories(root_ / "allowed");
        fs::create_directories(root_ / "outside");
        root_ = fs::canonical(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    fs::path allowed() const { return root_ / "allowed"; }
    fs::path outside() const { return root_ / "outside"; }

    FilesystemTools tools() const {
        auto roots = AllowedRoots::from_paths({allowed()});
        return FilesystemTools(PathGuard(get_value(roots)));
    }

    void write(const fs::path& path, const std::string& content) const {
        std::ofstream out(path, std::ios::binary);
        out << content;
    }

    std::string read(const fs::path& path) const {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

private:
    fs::path root_;
};

TEST(FilesystemToolsTest, WriteThenReadTextFile) {
    TempWorkspace workspace;
    const auto tools = workspace.tools();
    const auto target = (workspace.allowed() / "hello.txt").string();

    auto written = tools.write_file(target, "hello world\n");
    ASSERT_FALSE(is_error(written));
    EXPECT_TRUE(get_value(written).success);
    EXPECT_EQ(get_value(written).output, "Successfully wrote 12 bytes to " + target);

    auto read = tools.read_file(target);
    ASSERT_FALSE(is_error(read));
    EXPECT_TRUE(get_value(read).success);
    EXPECT_EQ(get_value(read).output, "hello world\n");
}

TEST(FilesystemToolsTest, OutsideRootIsPolicyErrorAndNothingIsWritten) {
    TempWorkspace workspace;
    const auto target = workspace.outside() / "escape.txt";

    auto written = workspace.tools().write_file(target.string(), "x");
    ASSERT_TRUE(is_error(written));
    EXPECT_EQ(get_error(written).category, ErrorCategory::Policy);
    EXPECT_EQ(get_error(written).code, "outside_allowed_roots");
    EXPECT_FALSE(fs::exists(target));
}

TEST(FilesystemToolsTest, WriteThroughDanglingSymlinkIsRefused) {
    TempWorkspace workspace;
    const auto target = workspace.outside() / "planted.txt";
    fs::create_symlink(target, workspace.allowed() / "trap.txt");

    auto written =
        workspace.tools().write_file((workspace.allowed() / "trap.txt").string(), "x");
    ASSERT_TRUE(is_error(written));
    EXPECT_EQ(get_error(written).code, "symlink_escapes_root");
    EXPECT_FALSE(fs::exists(target));
}

TEST(FilesystemToolsTest, ReadMissingFileIsFailedResult) {
    TempWorkspace workspace;
    auto read = workspace.tools().read_file((workspace.allowed() / "missing.txt").string());
    ASSERT_FALSE(is_error(read));
    EXPECT_FALSE(get_value(read).success);
    EXPECT_NE(get_value(read).error_message.find("File does not exist"), std::string::npos);
}

TEST(FilesystemToolsTest, ReadRefusesDirectories) {
    TempWorkspace workspace;
    auto dir = workspace.tools().read_file(workspace.allowed().string());
    ASSERT_FALSE(is_error(dir));
    EXPECT_FALSE(get_value(dir).success);
    EXPECT_NE(get_value(dir).error_message.find("list_directory"), std::string::npos);
}

TEST(FilesystemToolsTest, ReadReturnsSmallBinaryAsBase64Blob) {
    TempWorkspace workspace;
    const auto path = workspace.allowed() / "blob.bin";
    workspace.write(path, std::string("\x01\x00\x02", 3));

    auto binary = workspace.tools().read_file(path.string());
    ASSERT_FALSE(is_error(binary));
    const auto& result = get_value(binary);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.output.rfind("Binary file: " + path.string(), 0), 0u);
    ASSERT_EQ(result.content.size(), 1u);
    EXPECT_EQ(result.content[0].type, "blob");
    EXPECT_EQ(result.content[0].mime_type, "application/octet-stream");
    EXPECT_EQ(result.content[0].uri, "file://" + path.string());
    EXPECT_EQ(result.content[0].data, "AQAC");
}

TEST(FilesystemToolsTest, ReadReturnsImageContent) {
    TempWorkspace workspace;
    const auto path = workspace.allowed() / "pixel.png";
    workspace.write(path, std::string("\x89PNG", 4));

    auto image = workspace.tools().read_file(path.string());
    ASSERT_FALSE(is_error(image));
    const auto& result = get_value(image);
    EXPECT_TRUE(result.success);
    EXPECT_NE(result.output.find("Image file: "), std::string::npos);
    ASSERT_EQ(result.content.size(), 1u);
    EXPECT_EQ(result.content[0].type, "image");
    EXPECT_EQ(result.content[0].mime_type, "image/png");
    EXPECT_EQ(result.content[0].data, "iVBORw==");
}

TEST(FilesystemToolsTest, LargeBinaryIsReferencedNotInlined) {
    TempWorkspace workspace;
    const auto path = workspace.allowed() / "large.bin";
    workspace.write(path, std::string(gatehouse::tools::kMaxBase64Bytes + 1, '\0'));

    auto binary = workspace.tools().read_file(path.string());
    ASSERT_FALSE(is_error(binary));
    EXPECT_TRUE(get_value(binary).success);
    EXPECT_TRUE(get_value(binary).content.empty());
    EXPECT_NE(get_value(binary).output.find("Access it via resource URI: file://" +
                                            path.string()),
              std::string::npos);
}

TEST(FilesystemToolsTest, ReadResourceServesFileUris) {
    TempWorkspace workspace;
    const auto tools = workspace.tools();
    workspace.write(workspace.allowed() / "note.txt", "resource text");
    workspace.write(workspace.allowed() / "blob.bin", std::string("\x01\x00\x02", 3));

    auto text = tools.read_resource("file://" + (workspace.allowed() / "note.txt").string());
    ASSERT_FALSE(is_error(text));
    EXPECT_TRUE(get_value(text).success);
    EXPECT_EQ(get_value(text).output, "resource text");
    EXPECT_EQ(get_value(text).tool_call_id, "read_resource");

    auto blob = tools.read_resource("file://" + (workspace.allowed() / "blob.bin").string());
    ASSERT_FALSE(is_error(blob));
    ASSERT_EQ(get_value(blob).content.size(), 1u);
    EXPECT_EQ(get_value(blob).content[0].data, "AQAC");

    auto listing = tools.read_resource("file://" + workspace.allowed().string());
    ASSERT_FALSE(is_error(listing));
    EXPECT_NE(get_value(listing).output.find("[FILE] note.txt"), std::string::npos);
    EXPECT_EQ(get_value(listing).tool_call_id, "read_resource");
}

TEST(FilesystemToolsTest, ReadResourceChecksSchemeAndRoots) {
    TempWorkspace workspace;
    workspace.write(workspace.outside() / "secret.txt", "x");

    auto scheme = workspace.tools().read_resource("http://example.com/a.txt");
    ASSERT_TRUE(is_error(scheme));
    EXPECT_EQ(get_error(scheme).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(scheme).code, "unsupported_uri_scheme");

    auto outside = workspace.tools().read_resource(
        "file://" + (workspace.outside() / "secret.txt").string());
    ASSERT_TRUE(is_error(outside));
    EXPECT_EQ(get_error(outside).category, ErrorCategory::Policy);
}

TEST(FilesystemToolsTest, ReadRefusesOversizedFile) {
    TempWorkspace workspace;
    workspace.write(workspace.allowed() / "big.txt",
                    std::string(gatehouse::tools::kMaxInlineBytes + 1, 'a'));
    auto read = workspace.tools().read_file((workspace.allowed() / "big.txt").string());
    ASSERT_FALSE(is_error(read));
    EXPECT_FALSE(get_value(read).success);
    EXPECT_NE(get_value(read).error_message.find("too large"), std::string::npos);
}

TEST(FilesystemToolsTest, WriteRefusesDirectoryTarget) {
    TempWorkspace workspace;
    fs::create_directories(workspace.allowed() / "dir");
    auto written = workspace.tools().write_file((workspace.allowed() / "dir").string(), "x");
    ASSERT_FALSE(is_error(written));
    EXPECT_FALSE(get_value(written).success);
}

TEST(FilesystemToolsTest, ListDirectoryIsSortedAndTyped) {
    TempWorkspace workspace;
    workspace.write(workspace.allowed() / "b.txt", "12345");
    fs::create_directories(workspace.allowed() / "a_dir");

    auto listed = workspace.tools().list_directory(workspace.allowed().string());
    ASSERT_FALSE(is_error(listed));
    ASSERT_TRUE(get_value(listed).success);
    const auto& output = get_value(listed).output;

    const auto dir_line = output.find("[DIR]  a_dir");
    const auto file_line = output.find("[FILE] b.txt");
    ASSERT_NE(dir_line, std::string::npos);
    ASSERT_NE(file_line, std::string::npos);
    EXPECT_LT(dir_line, file_line);
    EXPECT_NE(output.find("- 5 bytes"), std::string::npos);
    EXPECT_EQ(output.rfind("Directory listing for: " + workspace.allowed().string(), 0), 0u);
}

TEST(FilesystemToolsTest, ListDirectoryShowsLinksWithoutTheirTargets) {
    TempWorkspace workspace;
    fs::create_directories(workspace.outside() / "private");
    workspace.write(workspace.outside() / "private" / "data.bin", std::string(4321, 'x'));
    fs::create_directory_symlink(workspace.outside() / "private",
                                 workspace.allowed() / "to_dir");
    fs::create_symlink(workspace.outside() / "private" / "data.bin",
                       workspace.allowed() / "to_file");

    auto listed = workspace.tools().list_directory(workspace.allowed().string());
    ASSERT_FALSE(is_error(listed));
    const auto& output = get_value(listed).output;
    EXPECT_NE(output.find("[LINK] to_dir"), std::string::npos);
    EXPECT_NE(output.find("[LINK] to_file"), std::string::npos);
    EXPECT_EQ(output.find("[DIR]  to_dir"), std::string::npos);
    EXPECT_EQ(output.find("4321 bytes"), std::string::npos);
}

TEST(FilesystemToolsTest, CreateDirectoryIsIdempotent) {
    TempWorkspace workspace;
    const auto tools = workspace.tools();
    const auto target = (workspace.allowed() / "made").string();

    auto first = tools.create_directory(target);
    ASSERT_FALSE(is_error(first));
    EXPECT_TRUE(get_value(first).success);
    EXPECT_TRUE(fs::is_directory(target));

    auto second = tools.create_directory(target);
    ASSERT_FALSE(is_error(second));
    EXPECT_TRUE(get_value(second).success);
    EXPECT_EQ(get_value(second).output, "Directory already exists: " + target);
}

TEST(FilesystemToolsTest, CreateDirectoryRefusesExistingFile) {
    TempWorkspace workspace;
    workspace.write(workspace.allowed() / "taken", "x");
    auto created = workspace.tools().create_directory((workspace.allowed() / "taken").string());
    ASSERT_FALSE(is_error(created));
    EXPECT_FALSE(get_value(created).success);
}

TEST(FilesystemToolsTest, MoveFileWithinRoot) {
    TempWorkspace workspace;
    workspace.write(workspace.allowed() / "from.txt", "payload");

    auto moved = workspace.tools().move_file((workspace.allowed() / "from.txt").string(),
                                             (workspace.allowed() / "to.txt").string());
    ASSERT_FALSE(is_error(moved));
    EXPECT_TRUE(get_value(moved).success);
    EXPECT_FALSE(fs::exists(workspace.allowed() / "from.txt"));
    EXPECT_EQ(workspace.read(workspace.allowed() / "to.txt"), "payload");
}

TEST(FilesystemToolsTest, MoveFileOutOfRootIsRefused) {
    TempWorkspace workspace;
    workspace.write(workspace.allowed() / "keep.txt", "payload");

    auto moved = workspace.tools().move_file((workspace.allowed() / "keep.txt").string(),
                                             (workspace.outside() / "keep.txt").string());
    ASSERT_TRUE(is_error(moved));
    EXPECT_EQ(get_error(moved).category, ErrorCategory::Policy);
    EXPECT_TRUE(fs::exists(workspace.allowed() / "keep.txt"));
}

TEST(FilesystemToolsTest, SearchIsRecursiveAndCaseInsensitive) {
    TempWorkspace workspace;
    fs::create_directories(workspace.allowed() / "nested" / "deeper");
    workspace.write(workspace.allowed() / "nested" / "deeper" / "Report.TXT", "x");
    workspace.write(workspace.allowed() / "other.md", "x");

    FileSearchRequest request;
    request.root = workspace.allowed().string();
    request.pattern = "report";
    auto found = workspace.tools().search_files(request);
    ASSERT_FALSE(is_error(found));
    ASSERT_TRUE(get_value(found).success);
    EXPECT_NE(get_value(found).output.find("Found 1 results"), std::string::npos);
    EXPECT_NE(get_value(found).output.find("Report.TXT"), std::string::npos);
}

TEST(FilesystemToolsTest, SearchSkipsLinksLeadingOutside) {
    TempWorkspace workspace;
    workspace.write(workspace.outside() / "secret.txt", "x");
    fs::create_symlink(workspace.outside() / "secret.txt", workspace.allowed() / "secret.txt");

    FileSearchRequest request;
    request.root = workspace.allowed().string();
    request.pattern = "secret";
    auto found = workspace.tools().search_files(request);
    ASSERT_FALSE(is_error(found));
    EXPECT_NE(get_value(found).output.find("No files found"), std::string::npos);
}

TEST(FilesystemToolsTest, SearchValidatesArguments) {
    TempWorkspace workspace;
    FileSearchRequest request;
    request.root = workspace.allowed().string();
    auto empty = workspace.tools().search_files(request);
    ASSERT_TRUE(is_error(empty));
    EXPECT_EQ(get_error(empty).code, "empty_search_pattern");

    request.pattern = "x";
    request.max_results = 0;
    auto zero = workspace.tools().search_files(request);
    ASSERT_TRUE(is_error(zero));
    EXPECT_EQ(get_error(zero).code, "invalid_search_limit");
}

TEST(FilesystemToolsTest, GetFileInfoReportsMetadata) {
    TempWorkspace workspace;
    workspace.write(workspace.allowed() / "info.json", "{}");
    fs::permissions(workspace.allowed() / "info.json", fs::perms::owner_read | fs::perms::owner_write);

    auto info = workspace.tools().get_file_info((workspace.allowed() / "info.json").string());
    ASSERT_FALSE(is_error(info));
    ASSERT_TRUE(get_value(info).success);
    const auto& output = get_value(info).output;
    EXPECT_NE(output.find("Size: 2 bytes"), std::string::npos);
    EXPECT_NE(output.find("IsFile: true"), std::string::npos);
    EXPECT_NE(output.find("IsDirectory: false"), std::string::npos);
    EXPECT_NE(output.find("Permissions: 600"), std::string::npos);
    EXPECT_NE(output.find("MIME Type: application/json"), std::string::npos);
    EXPECT_NE(output.find("Resource URI: file://"), std::string::npos);
    EXPECT_NE(output.find("Modified: "), std::string::npos);
}

TEST(FilesystemToolsTest, ListAllowedDirectories) {
    TempWorkspace workspace;
    const auto listed = workspace.tools().list_allowed_directories();
    EXPECT_TRUE(listed.success);
    EXPECT_NE(listed.output.find(workspace.allowed().string()), std::string::npos);

    const FilesystemTools nothing{PathGuard(AllowedRoots{})};
    EXPECT_EQ(nothing.list_allowed_directories().output, "No directories are allowed.");
}

TEST(FilesystemToolsTest, MimeTypeDetection) {
    TempWorkspace workspace;
    workspace.write(workspace.allowed() / "noext", "plain words");
    EXPECT_EQ(gatehouse::tools::detect_mime_type(workspace.allowed() / "noext"), "text/plain");
    EXPECT_EQ(gatehouse::tools::detect_mime_type("photo.PNG"), "image/png");
    EXPECT_TRUE(gatehouse::tools::is_text_mime_type("application/json"));
    EXPECT_TRUE(gatehouse::tools::is_text_mime_type("image/svg+xml"));
    EXPECT_FALSE(gatehouse::tools::is_text_mime_type("image/png"));
}

}  // namespace
