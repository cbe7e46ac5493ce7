#include "mcpgate/client/stdio_client.hpp"

#include "internal/process.hpp"
#include "mcpgate/exceptions.hpp"

#include <algorithm>
#include <cctype>

namespace mcpgate::client
{

namespace
{
constexpr std::chrono::milliseconds kPollSlice{50};
constexpr std::chrono::milliseconds kCloseGrace{250};
constexpr int kStderrPollMs = 100;
constexpr size_t kMaxAbandonedIds = 64;

bool is_blank(const std::string& line)
{
    return std::all_of(line.begin(), line.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}
} // namespace

StdioClient::StdioClient(StdioClientConfig config)
    : ClientBase(static_cast<const ClientOptions&>(config)), config_(std::move(config))
{
    if (config_.command.empty())
        throw ConfigError("stdio client [" + config_.id + "]: command is required");
    std::lock_guard<std::timed_mutex> lock(io_mutex_);
    spawn();
}

StdioClient::~StdioClient()
{
    close();
}

int StdioClient::pid() const
{
    return pid_.load();
}

void StdioClient::spawn()
{
    process::ProcessOptions options;
    options.working_directory = config_.working_dir;
    options.environment = config_.env;

    auto proc = std::make_unique<process::Process>();
    try
    {
        proc->spawn(config_.command, config_.args, options);
    }
    catch (const process::ProcessError& e)
    {
        throw TransportError("stdio client [" + config_.id + "]: failed to start '" +
                             config_.command + "': " + e.what());
    }

    process_ = std::move(proc);
    pid_ = process_->pid();
    closing_ = false;
    broken_ = false;
    stop_stderr_ = false;
    stderr_thread_ = std::thread([this, &pipe = process_->stderr_pipe()] { drain_stderr(pipe); });
    logger().debug("spawned '" + config_.command + "' pid=" + std::to_string(pid_.load()));
}

void StdioClient::drain_stderr(process::ReadPipe& pipe)
{
    std::string line;
    try
    {
        while (!stop_stderr_.load())
        {
            auto status = pipe.read_line(line, kStderrPollMs);
            if (status == process::ReadStatus::Eof)
                break;
            if (status == process::ReadStatus::Line && !line.empty())
                logger().info("stderr: " + line);
        }
    }
    catch (const process::ProcessError& e)
    {
        logger().warning(std::string("stderr reader stopped: ") + e.what());
    }
}

std::unique_lock<std::timed_mutex> StdioClient::acquire(const Context& ctx,
                                                        const std::string& what)
{
    std::unique_lock<std::timed_mutex> lock(io_mutex_, std::defer_lock);
    while (!lock.try_lock_for(std::min(ctx.remaining(), kPollSlice)))
        ctx.throw_if_done("waiting for another call in flight before " + what);
    if (closing_.load() || !process_)
        throw TransportError("connection is closed");
    if (broken_.load())
        throw TransportError("connection is broken by an interrupted write; close and "
                             "initialize again");
    return lock;
}

void StdioClient::write_line(const std::string& payload, const Context& ctx)
{
    const std::string data = payload + "\n";
    size_t offset = 0;
    while (true)
    {
        if (closing_.load())
            throw TransportError("connection closed while writing to server stdin");
        if (ctx.done())
        {
            if (offset > 0)
                broken_ = true;
            ctx.throw_if_done("writing to server stdin (" + std::to_string(offset) + " of " +
                              std::to_string(data.size()) + " bytes sent)");
        }

        process::WriteStatus status;
        try
        {
            auto slice = std::min(ctx.remaining(), kPollSlice);
            status = process_->stdin_pipe().write(data, offset, static_cast<int>(slice.count()));
        }
        catch (const process::ProcessError& e)
        {
            broken_ = true;
            throw TransportError(std::string("failed to write to server stdin: ") + e.what());
        }
        if (status == process::WriteStatus::Done)
            return;
    }
}

std::string StdioClient::read_line(const Context& ctx, int64_t request_id)
{
    std::string line;
    while (true)
    {
        if (closing_.load())
            throw TransportError("connection closed while waiting for response");
        if (ctx.done())
        {
            remember_abandoned(request_id);
            ctx.throw_if_done("waiting for response id=" + std::to_string(request_id));
        }

        process::ReadStatus status;
        try
        {
            auto slice = std::min(ctx.remaining(), kPollSlice);
            status = process_->stdout_pipe().read_line(line, static_cast<int>(slice.count()));
        }
        catch (const process::ProcessError& e)
        {
            throw TransportError(std::string("failed to read server stdout: ") + e.what());
        }

        if (status == process::ReadStatus::Line)
            return line;
        if (status == process::ReadStatus::Eof)
        {
            std::string detail = "server closed stdout";
            try
            {
                if (auto code = process_->try_wait())
                {
                    detail += " (exit status " + std::to_string(*code) + ")";
                    pid_ = 0;
                }
            }
            catch (const process::ProcessError& e)
            {
                detail += std::string(" (") + e.what() + ")";
            }
            throw TransportError(detail);
        }
    }
}

void StdioClient::remember_abandoned(int64_t id)
{
    abandoned_ids_.push_back(id);
    if (abandoned_ids_.size() > kMaxAbandonedIds)
        abandoned_ids_.pop_front();
}

bool StdioClient::take_abandoned(int64_t id)
{
    auto it = std::find(abandoned_ids_.begin(), abandoned_ids_.end(), id);
    if (it == abandoned_ids_.end())
        return false;
    abandoned_ids_.erase(it);
    return true;
}

void StdioClient::reply_to_server_request(const Json& message, const Context& ctx)
{
    const std::string method = message.value("method", std::string());
    Json reply = {{"jsonrpc", config_.jsonrpc_version}, {"id", message["id"]}};
    if (method == "ping")
        reply["result"] = Json::object();
    else
        reply["error"] = {{"code", -32601}, {"message", "Method not found: " + method}};
    logger().debug("answering server request '" + method + "'");
    write_line(reply.dump(), ctx);
}

mcp::JsonRpcResponse StdioClient::send_request(const mcp::JsonRpcRequest& request,
                                               const Context& ctx)
{
    auto lock = acquire(ctx, request.method);
    const int64_t id = *request.id;
    write_line(mcp::encode(request), ctx);

    while (true)
    {
        std::string line = read_line(ctx, id);
        if (is_blank(line))
            continue;

        Json message;
        try
        {
            message = Json::parse(line);
        }
        catch (const Json::parse_error& e)
        {
            remember_abandoned(id);
            throw DecodeError(std::string("malformed JSON on server stdout: ") + e.what());
        }

        if (message.is_object() && message.contains("method"))
        {
            if (message.contains("id") && !message["id"].is_null())
                reply_to_server_request(message, ctx);
            else
                logger().debug("skipping server notification '" +
                               message.value("method", std::string()) + "'");
            continue;
        }

        mcp::JsonRpcResponse response;
        try
        {
            response = mcp::decode_response(message);
        }
        catch (const DecodeError&)
        {
            remember_abandoned(id);
            throw;
        }

        if (response.id && *response.id != id)
        {
            if (take_abandoned(*response.id))
            {
                logger().debug("discarding late response for abandoned id=" +
                               std::to_string(*response.id));
                continue;
            }
            // Our own answer may still arrive; the next call must not match it
            remember_abandoned(id);
        }
        return response;
    }
}

void StdioClient::send_notification(const mcp::JsonRpcRequest& notification, const Context& ctx)
{
    auto lock = acquire(ctx, notification.method);
    write_line(mcp::encode(notification), ctx);
}

void StdioClient::open_transport(const Context& ctx)
{
    std::unique_lock<std::timed_mutex> lock(io_mutex_, std::defer_lock);
    while (!lock.try_lock_for(std::min(ctx.remaining(), kPollSlice)))
        ctx.throw_if_done("waiting to start the server process");
    if (!process_)
        spawn();
}

void StdioClient::shutdown_transport()
{
    closing_ = true;
    std::unique_lock<std::timed_mutex> lock(io_mutex_, std::defer_lock);
    if (!lock.try_lock_for(kCloseGrace))
    {
        // The call in flight is stuck on a pipe; killing the child releases it
        logger().warning("call in flight did not stop, killing server process");
        process::Process::kill_pid(pid_.load());
        lock.lock();
    }
    if (!process_)
        return;

    // Each step runs regardless of how the previous one went
    process_->stdin_pipe().close();
    process_->kill();
    try
    {
        int code = process_->wait();
        logger().debug("server process exited with status " + std::to_string(code));
    }
    catch (const process::ProcessError& e)
    {
        logger().warning(std::string("failed to reap server process: ") + e.what());
    }

    stop_stderr_ = true;
    if (stderr_thread_.joinable())
        stderr_thread_.join();

    process_.reset();
    pid_ = 0;
    abandoned_ids_.clear();
}

} // namespace mcpgate::client
