#pragma once
// RPC handler: JSON-RPC dispatch for all wardend tools
//
// Used by the stdio loop (one request per line) and by the one-shot CLI
// mode, which calls a tool directly through call().

#include "protocol.hpp"
#include "types.hpp"
#include "tools/memory.hpp"
#include "tools/safety.hpp"
#include "../log.hpp"
#include "../runtime.hpp"
#include "../version.hpp"
#include <atomic>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace warden::rpc {

using json = nlohmann::json;

class Handler {
public:
    explicit Handler(Runtime& runtime) : runtime_(runtime) {
        tools::safety::register_schemas(tools_);
        tools::safety::register_handlers(runtime_, handlers_);
        tools::memory::register_schemas(tools_);
        tools::memory::register_handlers(runtime_, handlers_);
    }

    // One request line in, one response line out
    std::string handle(const std::string& request_str) {
        json response;
        try {
            response = handle_request(json::parse(request_str));
        } catch (const json::parse_error& e) {
            response = make_error(json(), error::PARSE_ERROR,
                                  std::string("JSON parse error: ") + e.what());
        } catch (const std::exception& e) {
            response = make_error(json(), error::INTERNAL_ERROR,
                                  std::string("Internal error: ") + e.what());
        }
        return response.dump(-1, ' ', false, json::error_handler_t::replace);
    }

    json handle_request(const json& request) {
        std::string error_msg;
        if (!validate_request(request, error_msg)) {
            json id = request.is_object() ? request.value("id", json()) : json();
            return make_error(id, error::INVALID_REQUEST, error_msg);
        }

        auto info = parse_request(request);
        log::debug("rpc", "%s", info.method.c_str());

        try {
            if (info.method == "initialize") {
                return handle_initialize(info.params, info.id);
            } else if (info.method == "tools/list") {
                return handle_tools_list(info.id);
            } else if (info.method == "tools/call") {
                return handle_tools_call(info.params, info.id);
            } else if (info.method == "shutdown") {
                shutdown_requested_ = true;
                return make_result(info.id, {{"status", "ok"}});
            }
        } catch (const json::type_error& e) {
            return make_error(info.id, error::INVALID_PARAMS,
                              std::string("Invalid params: ") + e.what());
        } catch (const std::exception& e) {
            log::error("rpc", "%s failed: %s", info.method.c_str(), e.what());
            return make_error(info.id, error::INTERNAL_ERROR,
                              std::string("Internal error: ") + e.what());
        }
        return make_error(info.id, error::METHOD_NOT_FOUND, "Unknown method: " + info.method);
    }

    // Direct tool invocation; errors come back as error results
    ToolResult call(const std::string& name, const json& arguments) {
        auto it = handlers_.find(name);
        if (it == handlers_.end()) {
            return ToolResult::error("Unknown tool: " + name);
        }
        try {
            return it->second(arguments);
        } catch (const ParamError& e) {
            return ToolResult::error(e.what());
        } catch (const std::exception& e) {
            log::error("rpc", "Tool %s failed: %s", name.c_str(), e.what());
            return ToolResult::error(std::string("Tool execution failed: ") + e.what());
        }
    }

    const std::vector<ToolSchema>& tools() const { return tools_; }
    bool shutdown_requested() const { return shutdown_requested_; }

private:
    Runtime& runtime_;
    std::vector<ToolSchema> tools_;
    std::unordered_map<std::string, ToolHandler> handlers_;
    std::atomic<bool> shutdown_requested_{false};

    // Clients may pin {"warden_protocol": {"major": M, "minor": N}}
    json handle_initialize(const json& params, const json& id) {
        if (params.contains("warden_protocol")) {
            const auto& p = params["warden_protocol"];
            if (!p.is_object()) {
                return make_error(id, error::INVALID_PARAMS, "warden_protocol must be an object");
            }
            int major = p.value("major", -1);
            int minor = p.value("minor", 0);
            if (!version::protocol_compatible(major, minor)) {
                return make_error(id, error::INVALID_REQUEST, "Incompatible protocol version");
            }
        }
        return make_result(id, {
            {"protocolVersion", version::PROTOCOL_STRING},
            {"serverInfo", {
                {"name", "wardend"},
                {"version", WARDEN_VERSION}
            }},
            {"wardenProtocol", {
                {"major", WARDEN_PROTOCOL_VERSION_MAJOR},
                {"minor", WARDEN_PROTOCOL_VERSION_MINOR}
            }},
            {"capabilities", {
                {"tools", {{"listChanged", false}}}
            }}
        });
    }

    json handle_tools_list(const json& id) {
        json tools_array = json::array();
        for (const auto& tool : tools_) {
            tools_array.push_back({
                {"name", tool.name},
                {"description", tool.description},
                {"inputSchema", tool.input_schema}
            });
        }
        return make_result(id, {{"tools", tools_array}});
    }

    json handle_tools_call(const json& params, const json& id) {
        if (!params.contains("name") || !params["name"].is_string()) {
            return make_error(id, error::INVALID_PARAMS, "Missing tool name");
        }
        std::string name = params["name"];
        json arguments = params.value("arguments", json::object());

        auto it = handlers_.find(name);
        if (it == handlers_.end()) {
            return make_error(id, error::TOOL_NOT_FOUND, "Unknown tool: " + name);
        }

        try {
            ToolResult result = it->second(arguments);
            return make_result(id, make_tool_response(result.content, result.is_error,
                                                      result.structured));
        } catch (const ParamError& e) {
            return make_error(id, error::INVALID_PARAMS, e.what());
        } catch (const std::exception& e) {
            log::error("rpc", "Tool %s failed: %s", name.c_str(), e.what());
            return make_result(id, make_tool_response(
                std::string("Tool execution failed: ") + e.what(), true));
        }
    }
};

} // namespace warden::rpc
