#pragma once
/// @file client/config.hpp
/// @brief Per-transport connection configuration

#include "mcpgate/logging.hpp"
#include "mcpgate/mcp/types.hpp"
#include "mcpgate/settings.hpp"
#include "mcpgate/types.hpp"

#include <chrono>
#include <string>
#include <variant>
#include <vector>

namespace mcpgate::client
{

constexpr int kDefaultTimeoutMs = 30000;
constexpr const char* kDefaultClientName = "mcpgate-client";
constexpr const char* kDefaultClientVersion = "0.1.0";

/// Settings shared by every transport
struct ClientOptions
{
    /// Connection identifier attached to log lines and error messages
    std::string id;
    std::string protocol_version;
    std::string jsonrpc_version;
    mcp::ClientInfo client_info;
    /// Upper bound for each request; the caller's Context may shorten it further
    std::chrono::milliseconds timeout{0};
    logging::Logger logger;

    /// Fill empty fields: protocol "2024-11-05", JSON-RPC "2.0",
    /// client mcpgate-client/0.1.0, timeout 30 s
    void apply_defaults();
};

struct StdioClientConfig : ClientOptions
{
    std::string command;
    std::vector<std::string> args;
    std::string working_dir;
    StringMap env;
};

enum class AuthType
{
    None,
    Bearer,
    ApiKey
};

/// "none" / "" -> None, "bearer" -> Bearer, "api_key" / "apikey" -> ApiKey
AuthType auth_type_from_string(const std::string& s);
std::string to_string(AuthType type);

/// Used by both the Streamable HTTP and the SSE transport
struct HttpClientConfig : ClientOptions
{
    std::string url;
    StringMap headers;
    AuthType auth_type{AuthType::None};
    std::string auth_token;

    /// Configured headers plus Authorization (bearer) or X-API-Key (api_key)
    StringMap request_headers() const;
};

enum class TransportKind
{
    Stdio,
    StreamableHttp,
    Sse
};

/// "stdio", "streamable_http" (alias "http"), "sse"; ConfigError otherwise
TransportKind transport_from_string(const std::string& s);
std::string to_string(TransportKind kind);

/// Tagged connection configuration as stored by the gateway
struct ClientConfig
{
    TransportKind transport{TransportKind::Sse};
    std::string name;
    std::variant<StdioClientConfig, HttpClientConfig> settings;

    const ClientOptions& options() const;

    /// Load a stored connection row. @p settings supplies the default timeout and
    /// the logger level. Throws ConfigError on missing or ill-typed fields.
    static ClientConfig from_json(const Json& j, const Settings& settings = Settings());
};

} // namespace mcpgate::client
