#include "mcpgate/client/config.hpp"

#include "internal/http.hpp"
#include "mcpgate/exceptions.hpp"
#include "mcpgate/mcp/version.hpp"

#include <algorithm>
#include <cctype>

namespace mcpgate::client
{

namespace
{
std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string string_field(const Json& j, const char* key)
{
    if (!j.contains(key) || j[key].is_null())
        return {};
    if (!j[key].is_string())
        throw ConfigError(std::string("'") + key + "' must be a string");
    return j[key].get<std::string>();
}

/// Stored rows keep maps and lists either as JSON values or as JSON-encoded text
Json structured_field(const Json& j, const char* key)
{
    if (!j.contains(key) || j[key].is_null())
        return Json();
    const auto& value = j[key];
    if (!value.is_string())
        return value;
    const auto& text = value.get_ref<const std::string&>();
    if (text.empty())
        return Json();
    try
    {
        return Json::parse(text);
    }
    catch (const Json::parse_error& e)
    {
        throw ConfigError(std::string("'") + key + "' is not valid JSON: " + e.what());
    }
}

StringMap string_map_field(const Json& j, const char* key)
{
    StringMap out;
    Json value = structured_field(j, key);
    if (value.is_null())
        return out;
    if (!value.is_object())
        throw ConfigError(std::string("'") + key + "' must be an object");
    for (auto it = value.begin(); it != value.end(); ++it)
    {
        if (!it.value().is_string())
            throw ConfigError(std::string("'") + key + "." + it.key() + "' must be a string");
        out[it.key()] = it.value().get<std::string>();
    }
    return out;
}

std::vector<std::string> string_list_field(const Json& j, const char* key)
{
    std::vector<std::string> out;
    Json value = structured_field(j, key);
    if (value.is_null())
        return out;
    if (!value.is_array())
        throw ConfigError(std::string("'") + key + "' must be an array");
    for (const auto& item : value)
    {
        if (!item.is_string())
            throw ConfigError(std::string("'") + key + "' must contain only strings");
        out.push_back(item.get<std::string>());
    }
    return out;
}

void load_options(const Json& j, const Settings& settings, ClientOptions& options)
{
    if (j.contains("id") && j["id"].is_number_integer())
        options.id = std::to_string(j["id"].get<int64_t>());
    else
        options.id = string_field(j, "id");
    if (options.id.empty())
        options.id = string_field(j, "name");

    options.protocol_version = string_field(j, "protocol_version");

    if (j.contains("client_info") && !j["client_info"].is_null())
    {
        try
        {
            options.client_info = j["client_info"].get<mcp::ClientInfo>();
        }
        catch (const Json::exception& e)
        {
            throw ConfigError(std::string("'client_info' is invalid: ") + e.what());
        }
    }

    int timeout_ms = 0;
    if (j.contains("timeout_ms") && !j["timeout_ms"].is_null())
    {
        if (!j["timeout_ms"].is_number_integer())
            throw ConfigError("'timeout_ms' must be an integer");
        timeout_ms = j["timeout_ms"].get<int>();
        if (timeout_ms < 0)
            throw ConfigError("'timeout_ms' must not be negative");
    }
    if (timeout_ms == 0)
        timeout_ms = settings.default_timeout_ms;
    options.timeout = std::chrono::milliseconds(timeout_ms);

    options.logger = logging::Logger::from_settings(settings);
    options.apply_defaults();
}
} // namespace

void ClientOptions::apply_defaults()
{
    if (protocol_version.empty())
        protocol_version = mcp::DEFAULT_MCP_VERSION;
    if (jsonrpc_version.empty())
        jsonrpc_version = mcp::JSONRPC_VERSION;
    if (client_info.name.empty())
        client_info.name = kDefaultClientName;
    if (client_info.version.empty())
        client_info.version = kDefaultClientVersion;
    if (timeout.count() <= 0)
        timeout = std::chrono::milliseconds(kDefaultTimeoutMs);
}

AuthType auth_type_from_string(const std::string& s)
{
    std::string v = lower(s);
    if (v.empty() || v == "none")
        return AuthType::None;
    if (v == "bearer")
        return AuthType::Bearer;
    if (v == "api_key" || v == "apikey")
        return AuthType::ApiKey;
    throw ConfigError("Unknown auth_type: " + s);
}

std::string to_string(AuthType type)
{
    switch (type)
    {
    case AuthType::None:
        return "none";
    case AuthType::Bearer:
        return "bearer";
    case AuthType::ApiKey:
        return "api_key";
    }
    return "none";
}

StringMap HttpClientConfig::request_headers() const
{
    StringMap out = headers;
    if (auth_token.empty())
        return out;
    switch (auth_type)
    {
    case AuthType::Bearer:
        http::set_header(out, "Authorization", "Bearer " + auth_token);
        break;
    case AuthType::ApiKey:
        http::set_header(out, "X-API-Key", auth_token);
        break;
    case AuthType::None:
        break;
    }
    return out;
}

TransportKind transport_from_string(const std::string& s)
{
    std::string v = lower(s);
    if (v == "stdio")
        return TransportKind::Stdio;
    if (v == "streamable_http" || v == "http" || v == "shttp")
        return TransportKind::StreamableHttp;
    if (v == "sse")
        return TransportKind::Sse;
    throw ConfigError("Unknown transport: " + s);
}

std::string to_string(TransportKind kind)
{
    switch (kind)
    {
    case TransportKind::Stdio:
        return "stdio";
    case TransportKind::StreamableHttp:
        return "streamable_http";
    case TransportKind::Sse:
        return "sse";
    }
    return "sse";
}

const ClientOptions& ClientConfig::options() const
{
    if (const auto* stdio = std::get_if<StdioClientConfig>(&settings))
        return *stdio;
    return std::get<HttpClientConfig>(settings);
}

ClientConfig ClientConfig::from_json(const Json& j, const Settings& settings)
{
    if (!j.is_object())
        throw ConfigError("connection configuration must be a JSON object");

    ClientConfig config;
    config.name = string_field(j, "name");
    std::string transport = string_field(j, "transport");
    config.transport = transport.empty() ? TransportKind::Sse : transport_from_string(transport);

    if (config.transport == TransportKind::Stdio)
    {
        StdioClientConfig stdio;
        load_options(j, settings, stdio);
        stdio.command = string_field(j, "command");
        stdio.args = string_list_field(j, "args");
        stdio.working_dir = string_field(j, "working_dir");
        stdio.env = string_map_field(j, "env");
        config.settings = std::move(stdio);
    }
    else
    {
        HttpClientConfig remote;
        load_options(j, settings, remote);
        remote.url = string_field(j, "url");
        remote.headers = string_map_field(j, "headers");
        remote.auth_type = auth_type_from_string(string_field(j, "auth_type"));
        remote.auth_token = string_field(j, "auth_token");
        config.settings = std::move(remote);
    }
    return config;
}

} // namespace mcpgate::client
