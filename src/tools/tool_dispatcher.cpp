#include "tools/tool_dispatcher.hpp"

#include <cstdint>
#include <optional>
#include <utility>

namespace gatehouse::tools {

using core::errors::ErrorCategory;
using core::errors::GatehouseError;
using nlohmann::json;
using protocol::ToolDescriptor;
using protocol::ToolResult;

namespace {

json string_property(const std::string& description) {
    return json{{"type", "string"}, {"description", description}};
}

json object_schema(json properties, std::vector<std::string> required) {
    return json{{"type", "object"},
                {"properties", std::move(properties)},
                {"required", std::move(required)}};
}

core::errors::Result<std::string> require_string(const json& arguments,
                                                 const std::string& name) {
    if (!arguments.is_object() || !arguments.contains(name) ||
        !arguments.at(name).is_string()) {
        return GatehouseError{ErrorCategory::Input,
                              "Argument '" + name + "' must be a string.",
                              "invalid_argument"};
    }
    return arguments.at(name).get<std::string>();
}

core::errors::Result<std::optional<std::string>> optional_string(const json& arguments,
                                                                 const std::string& name) {
    if (!arguments.is_object() || !arguments.contains(name) || arguments.at(name).is_null()) {
        return std::optional<std::string>{};
    }
    if (!arguments.at(name).is_string()) {
        return GatehouseError{ErrorCategory::Input,
                              "Argument '" + name + "' must be a string.",
                              "invalid_argument"};
    }
    return std::optional<std::string>{arguments.at(name).get<std::string>()};
}

core::errors::Result<std::optional<std::uint32_t>> optional_unsigned(
    const json& arguments, const std::string& name) {
    if (!arguments.is_object() || !arguments.contains(name) || arguments.at(name).is_null()) {
        return std::optional<std::uint32_t>{};
    }
    const auto& value = arguments.at(name);
    if (!value.is_number_unsigned() || value.get<std::uint64_t>() > UINT32_MAX) {
        return GatehouseError{ErrorCategory::Input,
                              "Argument '" + name + "' must be a non-negative integer.",
                              "invalid_argument"};
    }
    return std::optional<std::uint32_t>{static_cast<std::uint32_t>(value.get<std::uint64_t>())};
}

}  // namespace

ToolDispatcher::ToolDispatcher(FilesystemTools filesystem, CommandTools commands)
    : filesystem_(std::move(filesystem)), commands_(std::move(commands)) {}

std::vector<ToolDescriptor> ToolDispatcher::list_tools() const {
    return {
        {"read_file", "Read the complete contents of a text file.",
         object_schema({{"path", string_property("Path to the file to read")}}, {"path"})},
        {"write_file", "Create a new file or overwrite an existing file with new content.",
         object_schema({{"path", string_property("Path where to write the file")},
                        {"content", string_property("Content to write to the file")}},
                       {"path", "content"})},
        {"list_directory", "List all files and directories in a directory.",
         object_schema({{"path", string_property("Path of the directory to list")}},
                       {"path"})},
        {"create_directory", "Create a new directory or ensure a directory exists.",
         object_schema({{"path", string_property("Path of the directory to create")}},
                       {"path"})},
        {"move_file", "Move or rename files and directories.",
         object_schema({{"source", string_property("Source path")},
                        {"destination", string_property("Destination path")}},
                       {"source", "destination"})},
        {"search_files", "Recursively search for files and directories by name.",
         object_schema({{"path", string_property("Starting directory for the search")},
                        {"pattern", string_property("Case-insensitive name fragment")}},
                       {"path", "pattern"})},
        {"get_file_info", "Retrieve metadata about a file or directory.",
         object_schema({{"path", string_property("Path to the file or directory")}},
                       {"path"})},
        {"list_allowed_directories",
         "Return the directories this server is allowed to access.",
         object_schema(json::object(), {})},
        {"execute_command",
         "Execute an allowlisted command line. Every part of a pipeline must be "
         "allowlisted.",
         object_schema({{"command", string_property("The command line to execute")},
                        {"working_directory",
                         string_property("Directory to run in; must be allowed")},
                        {"timeout_ms",
                         json{{"type", "integer"},
                              {"description",
                               "Kill the command after this many ms; capped by the "
                               "server limit"}}}},
                       {"command"})},
    };
}

core::errors::Result<ToolResult> ToolDispatcher::dispatch(
    const protocol::ToolCall& call, std::shared_ptr<std::atomic_bool> cancel_token) const {
    auto dispatched = dispatch_by_name(call, cancel_token);
    if (core::errors::is_error(dispatched) || call.id.empty()) {
        return dispatched;
    }
    auto& result = core::errors::get_value(dispatched);
    result.tool_call_id = call.id;
    return dispatched;
}

core::errors::Result<ToolResult> ToolDispatcher::read_resource(const std::string& uri) const {
    return filesystem_.read_resource(uri);
}

core::errors::Result<ToolResult> ToolDispatcher::dispatch_by_name(
    const protocol::ToolCall& call,
    const std::shared_ptr<std::atomic_bool>& cancel_token) const {
    const json& args = call.arguments;

    if (call.name == "read_file" || call.name == "list_directory" ||
        call.name == "create_directory" || call.name == "get_file_info") {
        auto path = require_string(args, "path");
        if (core::errors::is_error(path)) {
            return core::errors::get_error(path);
        }
        const auto& value = core::errors::get_value(path);
        if (call.name == "read_file") {
            return filesystem_.read_file(value);
        }
        if (call.name == "list_directory") {
            return filesystem_.list_directory(value);
        }
        if (call.name == "create_directory") {
            return filesystem_.create_directory(value);
        }
        return filesystem_.get_file_info(value);
    }

    if (call.name == "write_file") {
        auto path = require_string(args, "path");
        if (core::errors::is_error(path)) {
            return core::errors::get_error(path);
        }
        auto content = require_string(args, "content");
        if (core::errors::is_error(content)) {
            return core::errors::get_error(content);
        }
        return filesystem_.write_file(core::errors::get_value(path),
                                      core::errors::get_value(content));
    }

    if (call.name == "move_file") {
        auto source = require_string(args, "source");
        if (core::errors::is_error(source)) {
            return core::errors::get_error(source);
        }
        auto destination = require_string(args, "destination");
        if (core::errors::is_error(destination)) {
            return core::errors::get_error(destination);
        }
        return filesystem_.move_file(core::errors::get_value(source),
                                     core::errors::get_value(destination));
    }

    if (call.name == "search_files") {
        auto path = require_string(args, "path");
        if (core::errors::is_error(path)) {
            return core::errors::get_error(path);
        }
        auto pattern = require_string(args, "pattern");
        if (core::errors::is_error(pattern)) {
            return core::errors::get_error(pattern);
        }
        FileSearchRequest request;
        request.root = core::errors::get_value(path);
        request.pattern = core::errors::get_value(pattern);
        return filesystem_.search_files(request);
    }

    if (call.name == "list_allowed_directories") {
        return filesystem_.list_allowed_directories();
    }

    if (call.name == "execute_command") {
        auto command = require_string(args, "command");
        if (core::errors::is_error(command)) {
            return core::errors::get_error(command);
        }
        auto working_directory = optional_string(args, "working_directory");
        if (core::errors::is_error(working_directory)) {
            return core::errors::get_error(working_directory);
        }
        auto timeout_ms = optional_unsigned(args, "timeout_ms");
        if (core::errors::is_error(timeout_ms)) {
            return core::errors::get_error(timeout_ms);
        }

        CommandRequest request;
        request.command = core::errors::get_value(command);
        request.working_directory = core::errors::get_value(working_directory);
        request.timeout_ms = core::errors::get_value(timeout_ms);
        request.cancel_token = cancel_token;
        return commands_.execute_command(request);
    }

    return GatehouseError{ErrorCategory::Input, "Unknown tool: " + call.name, "unknown_tool"};
}

}  // namespace gatehouse::tools
