#pragma once
#include "mcpgate/client/client.hpp"
#include "mcpgate/client/config.hpp"
#include "mcpgate/util/url.hpp"

#include <mutex>
#include <string>

namespace mcpgate::client
{

/// MCP Streamable HTTP client: one POST per call, answered with a JSON body or
/// a text/event-stream body whose first data: payload is the response.
///
/// The server-issued session token (mcp-session-id) is stored from responses and
/// sent with every later request until close(). Calls may run concurrently.
class StreamableHttpClient : public ClientBase
{
  public:
    /// Throws ConfigError for an empty URL or a scheme other than http/https
    explicit StreamableHttpClient(HttpClientConfig config);
    ~StreamableHttpClient() override;

    /// Current session token; empty until a response supplied one
    std::string session_id() const;

    static constexpr const char* kSessionHeader = "mcp-session-id";

  protected:
    mcp::JsonRpcResponse send_request(const mcp::JsonRpcRequest& request,
                                      const Context& ctx) override;
    void send_notification(const mcp::JsonRpcRequest& notification,
                           const Context& ctx) override;
    void shutdown_transport() override;

  private:
    StringMap build_headers() const;
    void store_session(const std::string& value);

    HttpClientConfig config_;
    util::Url url_;

    mutable std::mutex session_mutex_;
    std::string session_id_;
};

} // namespace mcpgate::client
