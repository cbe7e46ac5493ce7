#pragma once
/// @file mcp/jsonrpc.hpp
/// @brief JSON-RPC 2.0 envelopes exchanged with MCP servers

#include "mcpgate/mcp/version.hpp"
#include "mcpgate/types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace mcpgate::mcp
{

struct JsonRpcError
{
    int code{0};
    std::string message;
    std::optional<std::string> data; ///< Non-string data from the wire is kept as JSON text
};

/// A request without an id is a notification: no response is expected or read.
struct JsonRpcRequest
{
    std::string jsonrpc{JSONRPC_VERSION};
    std::optional<int64_t> id;
    std::string method;
    std::optional<Json> params;

    bool is_notification() const
    {
        return !id.has_value();
    }
};

/// Exactly one of result/error is present. The id is absent only on error
/// responses to requests the server could not parse.
struct JsonRpcResponse
{
    std::string jsonrpc{JSONRPC_VERSION};
    std::optional<int64_t> id;
    std::optional<Json> result;
    std::optional<JsonRpcError> error;
};

bool operator==(const JsonRpcError& a, const JsonRpcError& b);
bool operator==(const JsonRpcRequest& a, const JsonRpcRequest& b);
bool operator==(const JsonRpcResponse& a, const JsonRpcResponse& b);

void to_json(Json& j, const JsonRpcError& e);
void from_json(const Json& j, JsonRpcError& e);
void to_json(Json& j, const JsonRpcRequest& r);
void from_json(const Json& j, JsonRpcRequest& r);
void to_json(Json& j, const JsonRpcResponse& r);
void from_json(const Json& j, JsonRpcResponse& r);

JsonRpcRequest make_request(int64_t id, std::string method, Json params = Json::object(),
                            std::string jsonrpc = JSONRPC_VERSION);
JsonRpcRequest make_notification(std::string method, std::optional<Json> params = std::nullopt,
                                 std::string jsonrpc = JSONRPC_VERSION);

/// Compact single-line encoding (no embedded newlines), suitable for stdio framing
std::string encode(const JsonRpcRequest& request);
std::string encode(const JsonRpcResponse& response);

/// Decode a response envelope. Throws DecodeError on malformed JSON or envelope.
JsonRpcResponse decode_response(const std::string& text);
JsonRpcResponse decode_response(const Json& j);

} // namespace mcpgate::mcp
