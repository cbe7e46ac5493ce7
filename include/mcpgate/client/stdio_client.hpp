#pragma once
#include "mcpgate/client/client.hpp"
#include "mcpgate/client/config.hpp"

#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>

namespace mcpgate::process
{
class Process;
class ReadPipe;
} // namespace mcpgate::process

namespace mcpgate::client
{

/// MCP client over a spawned child process speaking newline-delimited JSON-RPC
/// on stdin/stdout. stderr lines are forwarded to the logger at info level.
///
/// One call is in flight at a time: concurrent callers queue on a timed mutex
/// and give up with TimeoutError when their deadline passes first. A call that
/// times out leaves nothing reading the pipe; the late response is recognised
/// by its id and discarded by the next call. Writes to stdin are bounded by the
/// same deadline; one that stops part way through a line breaks the connection
/// until close() and initialize().
class StdioClient : public ClientBase
{
  public:
    /// Spawns the command. Throws ConfigError for an empty command and
    /// TransportError when the process cannot be started.
    explicit StdioClient(StdioClientConfig config);
    ~StdioClient() override;

    /// Child pid, or 0 when no process is running
    int pid() const;

  protected:
    mcp::JsonRpcResponse send_request(const mcp::JsonRpcRequest& request,
                                      const Context& ctx) override;
    void send_notification(const mcp::JsonRpcRequest& notification,
                           const Context& ctx) override;
    /// Respawns the child after close()
    void open_transport(const Context& ctx) override;
    void shutdown_transport() override;

  private:
    void spawn();
    std::unique_lock<std::timed_mutex> acquire(const Context& ctx, const std::string& what);
    void write_line(const std::string& payload, const Context& ctx);
    std::string read_line(const Context& ctx, int64_t request_id);
    void reply_to_server_request(const Json& message, const Context& ctx);
    void remember_abandoned(int64_t id);
    bool take_abandoned(int64_t id);
    void drain_stderr(process::ReadPipe& pipe);

    StdioClientConfig config_;

    std::timed_mutex io_mutex_;
    std::unique_ptr<process::Process> process_; ///< Guarded by io_mutex_
    std::deque<int64_t> abandoned_ids_;          ///< Guarded by io_mutex_
    std::atomic<bool> closing_{false};
    /// Set when a write stopped mid-line; the framing cannot be recovered
    std::atomic<bool> broken_{false};
    std::atomic<int> pid_{0};

    std::thread stderr_thread_;
    std::atomic<bool> stop_stderr_{false};
};

} // namespace mcpgate::client
