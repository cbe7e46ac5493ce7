#include "mcpgate/client/sse_client.hpp"

#include "internal/http.hpp"
#include "mcpgate/exceptions.hpp"
#include "mcpgate/util/sse.hpp"

namespace mcpgate::client
{

namespace
{
constexpr std::chrono::milliseconds kWaitSlice{50};
/// Idle limit on the event stream; servers send keep-alive comments well within it
constexpr time_t kStreamReadTimeoutSec = 3600;
constexpr std::chrono::milliseconds kServerReplyTimeout{10000};

bool is_success(int status)
{
    return status == 200 || status == 202 || status == 204;
}
} // namespace

SseClient::SseClient(HttpClientConfig config)
    : ClientBase(static_cast<const ClientOptions&>(config)), config_(std::move(config))
{
    try
    {
        url_ = util::parse_url(config_.url);
    }
    catch (const ConfigError& e)
    {
        throw ConfigError("SSE client [" + config_.id + "]: " + e.what());
    }
}

SseClient::~SseClient()
{
    close();
}

std::string SseClient::endpoint() const
{
    std::lock_guard<std::mutex> lock(endpoint_mutex_);
    return endpoint_ ? endpoint_->str() : std::string();
}

util::Url SseClient::require_endpoint() const
{
    if (!connected_.load())
        throw TransportError("event stream is not connected");
    std::lock_guard<std::mutex> lock(endpoint_mutex_);
    if (!endpoint_)
        throw TransportError("server has not announced a message endpoint");
    return *endpoint_;
}

// =============================================================================
// Event stream
// =============================================================================

void SseClient::open_transport(const Context& ctx)
{
    if (connected_.load() && !endpoint().empty())
        return;

    stop_stream();
    start_stream(ctx);

    std::unique_lock<std::mutex> lock(endpoint_mutex_);
    while (!endpoint_ && !stream_ended_)
    {
        endpoint_cv_.wait_for(lock, std::min(ctx.remaining(), kWaitSlice));
        if (ctx.done() && !endpoint_)
        {
            lock.unlock();
            stop_stream();
            ctx.throw_if_done("waiting for endpoint event");
        }
    }
    if (endpoint_)
        return;

    int status = stream_status_;
    std::string reason = stream_error_;
    lock.unlock();
    stop_stream();
    if (status != 0 && status != 200)
        throw HttpStatusError("event stream rejected with HTTP status " + std::to_string(status),
                              status, reason);
    throw TransportError("event stream closed before the endpoint event: " + reason);
}

void SseClient::start_stream(const Context& ctx)
{
    stream_client_ = http::make_client(url_);
    http::apply_deadline(*stream_client_, ctx);
    stream_client_->set_read_timeout(kStreamReadTimeoutSec, 0);

    {
        std::lock_guard<std::mutex> lock(endpoint_mutex_);
        endpoint_.reset();
        stream_ended_ = false;
        stream_status_ = 0;
        stream_error_.clear();
    }
    running_ = true;
    listener_done_ = false;
    listener_ = std::thread([this] { listen(); });
}

void SseClient::stop_stream()
{
    running_ = false;
    if (listener_.joinable())
    {
        // stop() only aborts sockets that are already open; repeat until the
        // listener has left Get() in case it was still connecting
        while (!listener_done_.load())
        {
            stream_client_->stop();
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        listener_.join();
    }
    stream_client_.reset();
    connected_ = false;
    {
        std::lock_guard<std::mutex> lock(endpoint_mutex_);
        endpoint_.reset();
    }
    fail_pending("connection closed");
}

void SseClient::listen()
{
    util::SseParser parser;
    httplib::Headers headers = http::to_headers(http::merge_headers(
        {{"Accept", "text/event-stream"}, {"Cache-Control", "no-cache"}},
        config_.request_headers()));

    int status = 0;
    auto res = stream_client_->Get(
        url_.path, headers,
        [&](const httplib::Response& r)
        {
            status = r.status;
            if (r.status != 200)
                return false;
            connected_ = true;
            logger().debug("event stream connected to " + url_.str());
            return true;
        },
        [&](const char* data, size_t len)
        {
            for (const auto& event : parser.feed(data, len))
                handle_event(event);
            return running_.load();
        });

    for (const auto& event : parser.finish())
        handle_event(event);

    std::string reason;
    if (!running_.load())
        reason = "connection closed";
    else if (status != 0 && status != 200)
        reason = "event stream rejected with HTTP status " + std::to_string(status);
    else if (!res)
        reason = "event stream failed: " + http::describe(res.error());
    else
        reason = "event stream ended";

    connected_ = false;
    {
        std::lock_guard<std::mutex> lock(endpoint_mutex_);
        stream_ended_ = true;
        stream_status_ = status;
        stream_error_ = reason;
    }
    endpoint_cv_.notify_all();
    fail_pending(reason);
    if (running_.load())
        logger().warning(reason);
    listener_done_ = true;
}

void SseClient::handle_event(const util::SseEvent& event)
{
    if (event.event == "endpoint")
    {
        try
        {
            auto resolved = util::resolve_reference(url_, event.data);
            {
                std::lock_guard<std::mutex> lock(endpoint_mutex_);
                endpoint_ = resolved;
            }
            logger().debug("message endpoint: " + resolved.str());
            endpoint_cv_.notify_all();
        }
        catch (const ConfigError& e)
        {
            logger().warning(std::string("ignoring invalid endpoint event: ") + e.what());
        }
        return;
    }

    if (event.event != "message")
    {
        logger().debug("ignoring '" + event.event + "' event");
        return;
    }

    Json message;
    try
    {
        message = Json::parse(event.data);
    }
    catch (const Json::parse_error& e)
    {
        logger().warning(std::string("dropping malformed message event: ") + e.what());
        return;
    }

    if (message.is_array())
    {
        for (const auto& item : message)
            handle_message(item);
    }
    else
    {
        handle_message(message);
    }
}

void SseClient::handle_message(const Json& message)
{
    if (!message.is_object())
    {
        logger().warning("dropping non-object message: " + message.dump());
        return;
    }

    if (message.contains("method"))
    {
        if (message.contains("id") && !message["id"].is_null())
            reply_to_server_request(message);
        else
            logger().debug("server notification '" + message.value("method", std::string()) +
                           "'");
        return;
    }

    mcp::JsonRpcResponse response;
    try
    {
        response = mcp::decode_response(message);
    }
    catch (const DecodeError& e)
    {
        logger().warning(std::string("dropping invalid response: ") + e.what());
        return;
    }
    if (!response.id)
    {
        logger().warning("dropping response without id: " + message.dump());
        return;
    }

    std::lock_guard<std::mutex> lock(pending_mutex_);
    auto it = pending_.find(*response.id);
    if (it == pending_.end())
    {
        logger().warning("dropping response for unknown id=" + std::to_string(*response.id));
        return;
    }
    it->second.set_value(std::move(response));
    pending_.erase(it);
}

void SseClient::reply_to_server_request(const Json& message)
{
    const std::string method = message.value("method", std::string());
    Json reply = {{"jsonrpc", config_.jsonrpc_version}, {"id", message["id"]}};
    if (method == "ping")
        reply["result"] = Json::object();
    else
        reply["error"] = {{"code", -32601}, {"message", "Method not found: " + method}};

    try
    {
        auto ctx = Context::with_timeout(kServerReplyTimeout);
        httplib::Headers headers = http::to_headers(config_.request_headers());
        auto result = http::post(require_endpoint(), headers, reply.dump(), ctx);
        if (!is_success(result.status))
            logger().warning("reply to server request '" + method + "' rejected with status " +
                             std::to_string(result.status));
    }
    catch (const Error& e)
    {
        logger().warning("failed to answer server request '" + method + "': " + e.what());
    }
}

// =============================================================================
// Pending calls
// =============================================================================

void SseClient::fail_pending(const std::string& reason)
{
    std::lock_guard<std::mutex> lock(pending_mutex_);
    for (auto& [id, promise] : pending_)
        promise.set_exception(std::make_exception_ptr(TransportError(reason)));
    pending_.clear();
}

void SseClient::forget_pending(int64_t id)
{
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_.erase(id);
}

mcp::JsonRpcResponse SseClient::send_request(const mcp::JsonRpcRequest& request,
                                             const Context& ctx)
{
    const int64_t id = *request.id;
    util::Url target = require_endpoint();

    std::future<mcp::JsonRpcResponse> future;
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        future = pending_[id].get_future();
    }

    try
    {
        httplib::Headers headers = http::to_headers(http::merge_headers(
            {{"Accept", "application/json, text/event-stream"}}, config_.request_headers()));
        auto reply = http::post(target, headers, mcp::encode(request), ctx);
        if (!is_success(reply.status))
            throw HttpStatusError("unexpected HTTP status " + std::to_string(reply.status),
                                  reply.status, reply.body);

        // Some servers answer inline instead of on the stream
        if (reply.header("Content-Type").find("application/json") != std::string::npos)
        {
            Json inline_body = Json::parse(reply.body, nullptr, false);
            if (inline_body.is_object() &&
                (inline_body.contains("result") || inline_body.contains("error")))
            {
                forget_pending(id);
                auto response = mcp::decode_response(inline_body);
                validate_response(request, response);
                return response;
            }
        }

        while (future.wait_for(std::min(ctx.remaining(), kWaitSlice)) !=
               std::future_status::ready)
        {
            ctx.throw_if_done("waiting for response id=" + std::to_string(id));
            // The stream may have ended before this call was registered
            if (!connected_.load() &&
                future.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready)
                throw TransportError("event stream closed while waiting for response");
        }
        return future.get();
    }
    catch (...)
    {
        forget_pending(id);
        throw;
    }
}

void SseClient::send_notification(const mcp::JsonRpcRequest& notification, const Context& ctx)
{
    httplib::Headers headers = http::to_headers(config_.request_headers());
    auto reply = http::post(require_endpoint(), headers, mcp::encode(notification), ctx);
    if (!is_success(reply.status))
        throw HttpStatusError("unexpected HTTP status " + std::to_string(reply.status),
                              reply.status, reply.body);
}

void SseClient::shutdown_transport()
{
    stop_stream();
}

} // namespace mcpgate::client
