#include "mcpgate/mcp/jsonrpc.hpp"

#include "mcpgate/exceptions.hpp"

namespace mcpgate::mcp
{

namespace
{
std::optional<int64_t> parse_id(const Json& j)
{
    if (!j.contains("id") || j["id"].is_null())
        return std::nullopt;
    const auto& id = j["id"];
    if (!id.is_number_integer())
        throw DecodeError("JSON-RPC id must be an integer, got: " + id.dump());
    return id.get<int64_t>();
}
} // namespace

bool operator==(const JsonRpcError& a, const JsonRpcError& b)
{
    return a.code == b.code && a.message == b.message && a.data == b.data;
}

bool operator==(const JsonRpcRequest& a, const JsonRpcRequest& b)
{
    return a.jsonrpc == b.jsonrpc && a.id == b.id && a.method == b.method &&
           a.params == b.params;
}

bool operator==(const JsonRpcResponse& a, const JsonRpcResponse& b)
{
    return a.jsonrpc == b.jsonrpc && a.id == b.id && a.result == b.result && a.error == b.error;
}

void to_json(Json& j, const JsonRpcError& e)
{
    j = Json{{"code", e.code}, {"message", e.message}};
    if (e.data)
        j["data"] = *e.data;
}

void from_json(const Json& j, JsonRpcError& e)
{
    e.code = j.at("code").get<int>();
    e.message = j.value("message", std::string());
    e.data.reset();
    if (j.contains("data") && !j["data"].is_null())
    {
        const auto& data = j["data"];
        e.data = data.is_string() ? data.get<std::string>() : data.dump();
    }
}

void to_json(Json& j, const JsonRpcRequest& r)
{
    j = Json{{"jsonrpc", r.jsonrpc}};
    if (r.id)
        j["id"] = *r.id;
    j["method"] = r.method;
    if (r.params)
        j["params"] = *r.params;
}

void from_json(const Json& j, JsonRpcRequest& r)
{
    r.jsonrpc = j.value("jsonrpc", std::string(JSONRPC_VERSION));
    r.id = parse_id(j);
    r.method = j.at("method").get<std::string>();
    r.params.reset();
    if (j.contains("params") && !j["params"].is_null())
        r.params = j["params"];
}

void to_json(Json& j, const JsonRpcResponse& r)
{
    j = Json{{"jsonrpc", r.jsonrpc}};
    j["id"] = r.id ? Json(*r.id) : Json(nullptr);
    if (r.result)
        j["result"] = *r.result;
    if (r.error)
        j["error"] = *r.error;
}

void from_json(const Json& j, JsonRpcResponse& r)
{
    if (!j.is_object())
        throw DecodeError("JSON-RPC response must be an object");

    r.jsonrpc = j.value("jsonrpc", std::string(JSONRPC_VERSION));
    r.id = parse_id(j);

    r.result.reset();
    r.error.reset();
    bool has_result = j.contains("result");
    bool has_error = j.contains("error") && !j["error"].is_null();
    if (has_result && has_error)
        throw DecodeError("JSON-RPC response carries both result and error");
    if (!has_result && !has_error)
        throw DecodeError("JSON-RPC response carries neither result nor error");

    if (has_error)
    {
        if (!j["error"].is_object())
            throw DecodeError("JSON-RPC error must be an object");
        r.error = j["error"].get<JsonRpcError>();
    }
    else
    {
        // A null result is treated as an empty result object
        r.result = j["result"].is_null() ? Json::object() : j["result"];
    }

    if (!r.id && !r.error)
        throw DecodeError("JSON-RPC response is missing its id");
}

JsonRpcRequest make_request(int64_t id, std::string method, Json params, std::string jsonrpc)
{
    JsonRpcRequest r;
    r.jsonrpc = std::move(jsonrpc);
    r.id = id;
    r.method = std::move(method);
    r.params = std::move(params);
    return r;
}

JsonRpcRequest make_notification(std::string method, std::optional<Json> params,
                                 std::string jsonrpc)
{
    JsonRpcRequest r;
    r.jsonrpc = std::move(jsonrpc);
    r.method = std::move(method);
    r.params = std::move(params);
    return r;
}

std::string encode(const JsonRpcRequest& request)
{
    return Json(request).dump();
}

std::string encode(const JsonRpcResponse& response)
{
    return Json(response).dump();
}

JsonRpcResponse decode_response(const std::string& text)
{
    Json j;
    try
    {
        j = Json::parse(text);
    }
    catch (const Json::exception& e)
    {
        throw DecodeError(std::string("failed to unmarshal response: ") + e.what());
    }
    return decode_response(j);
}

JsonRpcResponse decode_response(const Json& j)
{
    try
    {
        return j.get<JsonRpcResponse>();
    }
    catch (const Json::exception& e)
    {
        throw DecodeError(std::string("invalid JSON-RPC response: ") + e.what());
    }
}

} // namespace mcpgate::mcp
