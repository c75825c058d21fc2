#pragma once
// Tool schema and result types for the JSON-RPC surface

#include <nlohmann/json.hpp>
#include <functional>
#include <string>

namespace warden::rpc {

using json = nlohmann::json;

struct ToolSchema {
    std::string name;
    std::string description;
    json input_schema;
};

struct ToolResult {
    bool is_error = false;
    std::string content;      // Human-readable text
    json structured;          // Machine-readable payload

    static ToolResult ok(const std::string& text, const json& data = json()) {
        return {false, text, data};
    }

    static ToolResult error(const std::string& message) {
        return {true, message, json()};
    }
};

using ToolHandler = std::function<ToolResult(const json&)>;

} // namespace warden::rpc
