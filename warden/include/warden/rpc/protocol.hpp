#pragma once
// JSON-RPC 2.0 framing for the wardend tool surface
//
// One request per line on stdin, one response per line on stdout.
// Protocol errors use the standard codes; a tool that runs but fails
// answers with a normal result whose isError is true.

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace warden::rpc {

using json = nlohmann::json;

// Replace invalid UTF-8 with U+FFFD so dump() never throws on tool text
inline std::string sanitize_utf8(const std::string& input) {
    static const char replacement[] = "\xEF\xBF\xBD";
    std::string output;
    output.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        unsigned char c = static_cast<unsigned char>(input[i]);
        size_t len = 0;
        if (c < 0x80) len = 1;
        else if ((c & 0xE0) == 0xC0) len = 2;
        else if ((c & 0xF0) == 0xE0) len = 3;
        else if ((c & 0xF8) == 0xF0) len = 4;

        bool valid = len > 0 && i + len <= input.size();
        for (size_t k = 1; valid && k < len; ++k) {
            valid = (static_cast<unsigned char>(input[i + k]) & 0xC0) == 0x80;
        }

        if (valid) {
            output.append(input, i, len);
            i += len;
        } else {
            output += replacement;
            ++i;
        }
    }
    return output;
}

namespace error {
    constexpr int PARSE_ERROR = -32700;
    constexpr int INVALID_REQUEST = -32600;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;
    constexpr int TOOL_NOT_FOUND = -32001;
    constexpr int TOOL_EXECUTION_ERROR = -32002;
}

// Bad tool arguments; the handler turns this into INVALID_PARAMS
class ParamError : public std::invalid_argument {
public:
    explicit ParamError(const std::string& what) : std::invalid_argument(what) {}
};

inline json make_result(const json& id, const json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

inline json make_error(const json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

inline json make_tool_response(const std::string& text, bool is_error = false,
                               const json& structured = json()) {
    json response = {
        {"content", json::array({{{"type", "text"}, {"text", sanitize_utf8(text)}}})},
        {"isError", is_error}
    };
    if (!structured.is_null()) {
        response["structured"] = structured;
    }
    return response;
}

inline bool validate_request(const json& request, std::string& error_msg) {
    if (!request.is_object()) {
        error_msg = "Request must be an object";
        return false;
    }
    if (!request.contains("jsonrpc") || request["jsonrpc"] != "2.0") {
        error_msg = "Missing or invalid jsonrpc version";
        return false;
    }
    if (!request.contains("method") || !request["method"].is_string()) {
        error_msg = "Missing or invalid method";
        return false;
    }
    return true;
}

struct RequestInfo {
    std::string method;
    json params;
    json id;
};

inline RequestInfo parse_request(const json& request) {
    return {
        request["method"].get<std::string>(),
        request.value("params", json::object()),
        request.value("id", json())
    };
}

// ── Parameter access ───────────────────────────────────────────────

inline std::string require_string(const json& params, const char* key) {
    if (!params.contains(key) || !params[key].is_string()) {
        throw ParamError(std::string("Missing required string parameter: ") + key);
    }
    return params[key].get<std::string>();
}

// Accepts ["a", "b"] or "a, b"
inline std::vector<std::string> string_list(const json& params, const char* key, bool required) {
    std::vector<std::string> out;
    if (!params.contains(key)) {
        if (required) throw ParamError(std::string("Missing required parameter: ") + key);
        return out;
    }
    const json& value = params[key];
    if (value.is_string()) {
        std::string text = value.get<std::string>();
        size_t start = 0;
        while (start <= text.size()) {
            size_t comma = text.find(',', start);
            if (comma == std::string::npos) comma = text.size();
            std::string item = text.substr(start, comma - start);
            size_t b = item.find_first_not_of(" \t");
            size_t e = item.find_last_not_of(" \t");
            if (b != std::string::npos) out.push_back(item.substr(b, e - b + 1));
            start = comma + 1;
        }
        return out;
    }
    if (!value.is_array()) {
        throw ParamError(std::string("Parameter must be a list of strings: ") + key);
    }
    for (const auto& item : value) {
        if (!item.is_string()) {
            throw ParamError(std::string("Parameter must be a list of strings: ") + key);
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

} // namespace warden::rpc
