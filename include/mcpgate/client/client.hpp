#pragma once
/// @file client/client.hpp
/// @brief Transport-independent MCP client contract and the shared connection state machine

#include "mcpgate/client/config.hpp"
#include "mcpgate/context.hpp"
#include "mcpgate/logging.hpp"
#include "mcpgate/mcp/jsonrpc.hpp"
#include "mcpgate/mcp/types.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcpgate::client
{

enum class State
{
    Uninitialized,
    Initializing,
    Ready,
    Closed
};

std::string to_string(State state);

/// Capability surface of one backend MCP connection. Callers and the discovery
/// orchestrator only ever talk to this interface.
class IClient
{
  public:
    virtual ~IClient() = default;

    virtual mcp::InitializeResult initialize(const Context& ctx) = 0;
    virtual std::vector<mcp::Tool> list_tools(const Context& ctx) = 0;
    virtual mcp::ToolCallResult call_tool(const Context& ctx, const std::string& name,
                                          const Json& arguments) = 0;
    virtual std::vector<mcp::Prompt> list_prompts(const Context& ctx) = 0;
    virtual mcp::PromptResult get_prompt(const Context& ctx, const std::string& name,
                                         const StringMap& arguments) = 0;
    virtual std::vector<mcp::Resource> list_resources(const Context& ctx) = 0;
    virtual mcp::ResourceReadResult read_resource(const Context& ctx, const std::string& uri) = 0;

    /// initialize (when not Ready) then tools, prompts and resources. List failures
    /// are logged and leave the corresponding vector empty.
    virtual mcp::DiscoveryResult discover(const Context& ctx) = 0;

    /// Release transport resources and reset state. Idempotent, never throws.
    virtual void close() noexcept = 0;

    virtual State state() const = 0;
    virtual std::optional<mcp::ServerInfo> server_info() const = 0;
    virtual const std::string& id() const = 0;
};

/// Implements the connection state machine
/// (Uninitialized -> Initializing -> Ready -> Closed) over transport primitives.
///
/// Transports implement send_request/send_notification and shutdown_transport;
/// open_transport is called at the start of every initialize. Derived destructors
/// must call close(), since the base destructor can no longer reach them.
class ClientBase : public IClient
{
  public:
    ~ClientBase() override = default;

    ClientBase(const ClientBase&) = delete;
    ClientBase& operator=(const ClientBase&) = delete;

    mcp::InitializeResult initialize(const Context& ctx) override;
    std::vector<mcp::Tool> list_tools(const Context& ctx) override;
    mcp::ToolCallResult call_tool(const Context& ctx, const std::string& name,
                                  const Json& arguments) override;
    std::vector<mcp::Prompt> list_prompts(const Context& ctx) override;
    mcp::PromptResult get_prompt(const Context& ctx, const std::string& name,
                                 const StringMap& arguments) override;
    std::vector<mcp::Resource> list_resources(const Context& ctx) override;
    mcp::ResourceReadResult read_resource(const Context& ctx, const std::string& uri) override;
    mcp::DiscoveryResult discover(const Context& ctx) override;
    void close() noexcept override;

    State state() const override;
    std::optional<mcp::ServerInfo> server_info() const override;
    const std::string& id() const override
    {
        return options_.id;
    }

    /// Next request id of this connection: 1, 2, 3, ... never reused, not even after close
    int64_t next_request_id()
    {
        return next_id_.fetch_add(1, std::memory_order_relaxed);
    }

    const ClientOptions& options() const
    {
        return options_;
    }

  protected:
    explicit ClientBase(ClientOptions options);

    /// Deliver @p request and return the response answering it. Implementations
    /// call validate_response (or rely on the base doing so) and throw the
    /// mcpgate exception matching the failure.
    virtual mcp::JsonRpcResponse send_request(const mcp::JsonRpcRequest& request,
                                              const Context& ctx) = 0;
    virtual void send_notification(const mcp::JsonRpcRequest& notification,
                                   const Context& ctx) = 0;

    /// Acquire transport resources that close() released (respawn, reconnect)
    virtual void open_transport(const Context& /*ctx*/) {}
    virtual void shutdown_transport() = 0;

    /// Throws CorrelationError when the ids differ, ProtocolError for an error response
    static void validate_response(const mcp::JsonRpcRequest& request,
                                  const mcp::JsonRpcResponse& response);

    const logging::Logger& logger() const
    {
        return logger_;
    }

  private:
    /// Send one request under the per-call timeout and return its result object.
    /// Errors are rethrown as the same type with "<method> request failed [<id>]: ".
    Json request(const std::string& method, Json params, const Context& ctx);
    void notify(const std::string& method, const Context& ctx);
    void require_ready(const std::string& method) const;
    std::string error_prefix(const std::string& method) const;

    ClientOptions options_;
    logging::Logger logger_;
    std::atomic<int64_t> next_id_{1};

    mutable std::mutex state_mutex_;
    State state_{State::Uninitialized};
    std::optional<mcp::ServerInfo> server_info_;
};

} // namespace mcpgate::client
