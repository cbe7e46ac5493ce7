#pragma once
#include "mcpgate/client/client.hpp"
#include "mcpgate/client/config.hpp"
#include "mcpgate/util/url.hpp"

#include <atomic>
#include <condition_variable>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace httplib
{
class Client;
}

namespace mcpgate::util
{
struct SseEvent;
}

namespace mcpgate::client
{

/// MCP client over the HTTP+SSE transport (protocol revision 2024-11-05).
///
/// initialize() opens a GET event stream and waits for the `endpoint` event that
/// names where requests are POSTed. Responses arrive as `message` events and are
/// routed to the waiting call by id. The stream is not reopened automatically:
/// when it ends, pending calls fail and the caller may close() and initialize()
/// again.
class SseClient : public ClientBase
{
  public:
    /// Validates the URL only; no network I/O happens before initialize()
    explicit SseClient(HttpClientConfig config);
    ~SseClient() override;

    bool is_connected() const
    {
        return connected_.load();
    }

    /// Resolved POST endpoint announced by the server; empty before it arrived
    std::string endpoint() const;

  protected:
    mcp::JsonRpcResponse send_request(const mcp::JsonRpcRequest& request,
                                      const Context& ctx) override;
    void send_notification(const mcp::JsonRpcRequest& notification,
                           const Context& ctx) override;
    void open_transport(const Context& ctx) override;
    void shutdown_transport() override;

  private:
    void start_stream(const Context& ctx);
    void stop_stream();
    void listen();
    void handle_event(const util::SseEvent& event);
    void handle_message(const Json& message);
    void reply_to_server_request(const Json& message);
    void fail_pending(const std::string& reason);
    void forget_pending(int64_t id);
    util::Url require_endpoint() const;

    HttpClientConfig config_;
    util::Url url_;

    std::unique_ptr<httplib::Client> stream_client_;
    std::thread listener_;
    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<bool> listener_done_{true};

    mutable std::mutex endpoint_mutex_;
    std::condition_variable endpoint_cv_;
    std::optional<util::Url> endpoint_;
    bool stream_ended_{false};
    int stream_status_{0};
    std::string stream_error_;

    std::mutex pending_mutex_;
    std::map<int64_t, std::promise<mcp::JsonRpcResponse>> pending_;
};

} // namespace mcpgate::client
