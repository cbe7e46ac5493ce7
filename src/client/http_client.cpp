#include "mcpgate/client/http_client.hpp"

#include "internal/http.hpp"
#include "mcpgate/exceptions.hpp"
#include "mcpgate/util/sse.hpp"

namespace mcpgate::client
{

namespace
{
constexpr size_t kMaxBodyInError = 512;

std::string excerpt(const std::string& body)
{
    if (body.size() <= kMaxBodyInError)
        return body;
    return body.substr(0, kMaxBodyInError) + "...";
}
} // namespace

StreamableHttpClient::StreamableHttpClient(HttpClientConfig config)
    : ClientBase(static_cast<const ClientOptions&>(config)), config_(std::move(config))
{
    try
    {
        url_ = util::parse_url(config_.url);
    }
    catch (const ConfigError& e)
    {
        throw ConfigError("streamable HTTP client [" + config_.id + "]: " + e.what());
    }
}

StreamableHttpClient::~StreamableHttpClient()
{
    close();
}

std::string StreamableHttpClient::session_id() const
{
    std::lock_guard<std::mutex> lock(session_mutex_);
    return session_id_;
}

void StreamableHttpClient::store_session(const std::string& value)
{
    if (value.empty())
        return;
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (session_id_ != value)
    {
        if (!session_id_.empty())
            logger().debug("server replaced session id");
        session_id_ = value;
    }
}

StringMap StreamableHttpClient::build_headers() const
{
    // Configured headers may replace Accept; the session token always wins
    StringMap headers = http::merge_headers({{"Accept", "application/json, text/event-stream"}},
                                            config_.request_headers());
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (!session_id_.empty())
        http::set_header(headers, kSessionHeader, session_id_);
    return headers;
}

mcp::JsonRpcResponse StreamableHttpClient::send_request(const mcp::JsonRpcRequest& request,
                                                        const Context& ctx)
{
    auto reply = http::post(url_, http::to_headers(build_headers()), mcp::encode(request), ctx);

    if (reply.status != 200)
        throw HttpStatusError("unexpected HTTP status " + std::to_string(reply.status) + ": " +
                                  excerpt(reply.body),
                              reply.status, reply.body);

    std::string payload = reply.body;
    if (reply.header("Content-Type").find("text/event-stream") != std::string::npos)
    {
        auto data = util::first_data_payload(reply.body);
        if (!data)
            throw DecodeError("event stream response carried no data");
        payload = std::move(*data);
    }

    auto response = mcp::decode_response(payload);
    validate_response(request, response);
    store_session(reply.header(kSessionHeader));
    return response;
}

void StreamableHttpClient::send_notification(const mcp::JsonRpcRequest& notification,
                                             const Context& ctx)
{
    auto reply =
        http::post(url_, http::to_headers(build_headers()), mcp::encode(notification), ctx);

    if (reply.status != 200 && reply.status != 202 && reply.status != 204)
        throw HttpStatusError("unexpected HTTP status " + std::to_string(reply.status) + ": " +
                                  excerpt(reply.body),
                              reply.status, reply.body);
    store_session(reply.header(kSessionHeader));
}

void StreamableHttpClient::shutdown_transport()
{
    std::lock_guard<std::mutex> lock(session_mutex_);
    session_id_.clear();
}

} // namespace mcpgate::client
