#include "mcpgate/client/client.hpp"

#include "mcpgate/exceptions.hpp"
#include "mcpgate/mcp/version.hpp"

namespace mcpgate::client
{

namespace
{
/// Rethrow the in-flight exception as the same type with @p prefix prepended.
/// Must be called from inside a catch handler.
[[noreturn]] void rethrow_with_prefix(const std::string& prefix)
{
    try
    {
        throw;
    }
    catch (const CorrelationError& e)
    {
        throw CorrelationError(prefix + e.what(), e.expected(), e.actual());
    }
    catch (const ProtocolError& e)
    {
        throw ProtocolError(prefix + e.what(), e.code(), e.remote_message(), e.data());
    }
    catch (const HttpStatusError& e)
    {
        throw HttpStatusError(prefix + e.what(), e.status(), e.body());
    }
    catch (const TimeoutError& e)
    {
        throw TimeoutError(prefix + e.what());
    }
    catch (const DecodeError& e)
    {
        throw DecodeError(prefix + e.what());
    }
    catch (const StateError& e)
    {
        throw StateError(prefix + e.what());
    }
    catch (const ConfigError& e)
    {
        throw ConfigError(prefix + e.what());
    }
    catch (const TransportError& e)
    {
        throw TransportError(prefix + e.what());
    }
    catch (const Error& e)
    {
        throw Error(prefix + e.what());
    }
    catch (const Json::exception& e)
    {
        throw DecodeError(prefix + e.what());
    }
}

template <typename F>
auto with_context(const std::string& prefix, F&& body) -> decltype(body())
{
    try
    {
        return body();
    }
    catch (const Error&)
    {
        rethrow_with_prefix(prefix);
    }
    catch (const Json::exception&)
    {
        rethrow_with_prefix(prefix);
    }
}
} // namespace

std::string to_string(State state)
{
    switch (state)
    {
    case State::Uninitialized:
        return "uninitialized";
    case State::Initializing:
        return "initializing";
    case State::Ready:
        return "ready";
    case State::Closed:
        return "closed";
    }
    return "uninitialized";
}

ClientBase::ClientBase(ClientOptions options) : options_(std::move(options))
{
    options_.apply_defaults();
    logger_ = options_.id.empty() ? options_.logger : options_.logger.with_tag(options_.id);
}

std::string ClientBase::error_prefix(const std::string& method) const
{
    return method + " request failed [" + options_.id + "]: ";
}

State ClientBase::state() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::optional<mcp::ServerInfo> ClientBase::server_info() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return server_info_;
}

void ClientBase::require_ready(const std::string& method) const
{
    if (state() != State::Ready)
        throw StateError(error_prefix(method) + "client not initialized");
}

void ClientBase::validate_response(const mcp::JsonRpcRequest& request,
                                   const mcp::JsonRpcResponse& response)
{
    int64_t expected = request.id.value_or(0);
    if (response.id && *response.id != expected)
        throw CorrelationError("response id " + std::to_string(*response.id) +
                                   " does not match request id " + std::to_string(expected),
                               expected, *response.id);

    if (response.error)
    {
        const auto& err = *response.error;
        std::string what = "server returned error " + std::to_string(err.code) + ": " + err.message;
        if (err.data)
            what += " (" + *err.data + ")";
        throw ProtocolError(what, err.code, err.message, err.data);
    }

    if (!response.id)
        throw CorrelationError("response carries no id, expected " + std::to_string(expected),
                               expected, 0);
}

Json ClientBase::request(const std::string& method, Json params, const Context& ctx)
{
    auto call_ctx = ctx.narrowed(options_.timeout);
    return with_context(error_prefix(method),
                        [&]
                        {
                            call_ctx.throw_if_done("context");
                            auto req = mcp::make_request(next_request_id(), method,
                                                         std::move(params),
                                                         options_.jsonrpc_version);
                            logger_.debug("-> " + method + " id=" + std::to_string(*req.id));
                            auto resp = send_request(req, call_ctx);
                            validate_response(req, resp);
                            return resp.result ? *resp.result : Json::object();
                        });
}

void ClientBase::notify(const std::string& method, const Context& ctx)
{
    auto call_ctx = ctx.narrowed(options_.timeout);
    with_context(error_prefix(method),
                 [&]
                 {
                     logger_.debug("-> " + method + " (notification)");
                     send_notification(
                         mcp::make_notification(method, std::nullopt, options_.jsonrpc_version),
                         call_ctx);
                 });
}

mcp::InitializeResult ClientBase::initialize(const Context& ctx)
{
    const std::string method = "initialize";
    State previous;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == State::Ready)
            throw StateError(error_prefix(method) + "client already initialized");
        if (state_ == State::Initializing)
            throw StateError(error_prefix(method) + "client initialization in progress");
        previous = state_;
        state_ = State::Initializing;
    }

    auto call_ctx = ctx.narrowed(options_.timeout);
    mcp::InitializeResult result;
    try
    {
        with_context(error_prefix(method), [&] { open_transport(call_ctx); });

        Json params = {{"protocolVersion", options_.protocol_version},
                       {"capabilities", Json::object()},
                       {"clientInfo", options_.client_info}};
        Json raw = request(method, std::move(params), call_ctx);
        result = with_context(error_prefix(method),
                              [&] { return mcp::parse_initialize_result(raw); });
    }
    catch (...)
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = previous;
        throw;
    }

    if (!mcp::is_version_supported(result.protocolVersion))
        logger_.warning("server negotiated unsupported protocol version '" +
                        result.protocolVersion + "'");
    else if (result.protocolVersion != options_.protocol_version)
        logger_.debug("server negotiated protocol version " + result.protocolVersion);

    if (!result.serverInfo.protocolVersion)
        result.serverInfo.protocolVersion = result.protocolVersion;

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        server_info_ = result.serverInfo;
        state_ = State::Ready;
    }

    // The connection stays Ready even when this fails; the error still reaches the caller
    notify("notifications/initialized", call_ctx);

    logger_.info("initialized " + result.serverInfo.name + " " + result.serverInfo.version +
                 " (protocol " + result.protocolVersion + ")");
    return result;
}

std::vector<mcp::Tool> ClientBase::list_tools(const Context& ctx)
{
    const std::string method = "tools/list";
    require_ready(method);
    Json raw = request(method, Json::object(), ctx);
    return with_context(error_prefix(method), [&] { return mcp::parse_tools_list(raw); });
}

mcp::ToolCallResult ClientBase::call_tool(const Context& ctx, const std::string& name,
                                          const Json& arguments)
{
    const std::string method = "tools/call";
    require_ready(method);
    Json params = {{"name", name},
                   {"arguments", arguments.is_null() ? Json::object() : arguments}};
    Json raw = request(method, std::move(params), ctx);
    return with_context(error_prefix(method), [&] { return mcp::parse_tool_call_result(raw); });
}

std::vector<mcp::Prompt> ClientBase::list_prompts(const Context& ctx)
{
    const std::string method = "prompts/list";
    require_ready(method);
    Json raw = request(method, Json::object(), ctx);
    return with_context(error_prefix(method), [&] { return mcp::parse_prompts_list(raw); });
}

mcp::PromptResult ClientBase::get_prompt(const Context& ctx, const std::string& name,
                                         const StringMap& arguments)
{
    const std::string method = "prompts/get";
    require_ready(method);
    Json params = {{"name", name}, {"arguments", arguments}};
    Json raw = request(method, std::move(params), ctx);
    return with_context(error_prefix(method), [&] { return mcp::parse_prompt_result(raw); });
}

std::vector<mcp::Resource> ClientBase::list_resources(const Context& ctx)
{
    const std::string method = "resources/list";
    require_ready(method);
    Json raw = request(method, Json::object(), ctx);
    return with_context(error_prefix(method), [&] { return mcp::parse_resources_list(raw); });
}

mcp::ResourceReadResult ClientBase::read_resource(const Context& ctx, const std::string& uri)
{
    const std::string method = "resources/read";
    require_ready(method);
    Json raw = request(method, Json{{"uri", uri}}, ctx);
    return with_context(error_prefix(method),
                        [&] { return mcp::parse_resource_read_result(raw); });
}

mcp::DiscoveryResult ClientBase::discover(const Context& ctx)
{
    if (state() != State::Ready)
        initialize(ctx);

    mcp::DiscoveryResult result;
    result.serverInfo = server_info();

    try
    {
        result.tools = list_tools(ctx);
    }
    catch (const std::exception& e)
    {
        logger_.warning(std::string("failed to list tools: ") + e.what());
    }

    try
    {
        result.prompts = list_prompts(ctx);
    }
    catch (const std::exception& e)
    {
        logger_.warning(std::string("failed to list prompts: ") + e.what());
    }

    try
    {
        result.resources = list_resources(ctx);
    }
    catch (const std::exception& e)
    {
        logger_.warning(std::string("failed to list resources: ") + e.what());
    }

    logger_.debug("discovered " + std::to_string(result.tools.size()) + " tools, " +
                  std::to_string(result.prompts.size()) + " prompts, " +
                  std::to_string(result.resources.size()) + " resources");
    return result;
}

void ClientBase::close() noexcept
{
    bool was_open;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        was_open = state_ != State::Closed;
        state_ = State::Closed;
        server_info_.reset();
    }

    try
    {
        shutdown_transport();
    }
    catch (const std::exception& e)
    {
        logger_.warning(std::string("error while closing transport: ") + e.what());
    }

    if (was_open)
        logger_.debug("connection closed");
}

} // namespace mcpgate::client
