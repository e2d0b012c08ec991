#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace gatehouse::protocol {

    // A request from the agent to run one tool
    struct ToolCall {
        std::string id;
        std::string name;          // e.g. "read_file", "execute_command"
        nlohmann::json arguments;  // JSON object of string arguments
    };

    // Payload that cannot travel as plain text
    struct ContentBlock {
        std::string type;       // "image" or "blob"
        std::string uri;
        std::string mime_type;
        std::string data;       // base64
    };

    // What a tool handler hands back
    struct ToolResult {
        std::string tool_call_id;
        bool success;
        std::string output;         // stdout or file content
        std::string error_message;  // stderr or failure reason
        double duration_ms;
        std::vector<ContentBlock> content;
    };

    // Advertised to the agent by list_tools
    struct ToolDescriptor {
        std::string name;
        std::string description;
        nlohmann::json input_schema;
    };

} // namespace gatehouse::protocol
