#include "http.hpp"

#include "mcpgate/exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace mcpgate::http
{

namespace
{
/// Socket waits are bounded even when the context has no deadline
constexpr std::chrono::milliseconds kMaxSocketWait{300000};
/// Socket timeouts are set in whole milliseconds and may fire just before the deadline
constexpr std::chrono::milliseconds kDeadlineSlack{20};
constexpr std::chrono::milliseconds kWatchSlice{50};

bool deadline_reached(const Context& ctx, httplib::Error error)
{
    if (ctx.done() || error == httplib::Error::ConnectionTimeout)
        return true;
    bool socket_wait = error == httplib::Error::Read || error == httplib::Error::Write;
    return socket_wait && ctx.deadline() && ctx.remaining() <= kDeadlineSlack;
}

/// Aborts a blocked exchange on @p client once @p ctx is cancelled or expires.
/// stop() only reaches sockets that are already open, so it repeats until the
/// exchange has returned.
class CancelWatch
{
  public:
    CancelWatch(httplib::Client& client, Context ctx)
        : thread_([this, &client, ctx] { run(client, ctx); })
    {
    }

    ~CancelWatch()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            finished_ = true;
        }
        cv_.notify_all();
        thread_.join();
    }

    CancelWatch(const CancelWatch&) = delete;
    CancelWatch& operator=(const CancelWatch&) = delete;

  private:
    void run(httplib::Client& client, const Context& ctx)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!finished_)
        {
            if (ctx.done())
            {
                client.stop();
                cv_.wait_for(lock, std::chrono::milliseconds(10));
                continue;
            }
            cv_.wait_for(lock, std::min(ctx.remaining(), kWatchSlice));
        }
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    bool finished_{false};
    std::thread thread_;
};

bool iequals(const std::string& a, const std::string& b)
{
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(),
                      [](unsigned char x, unsigned char y)
                      { return std::tolower(x) == std::tolower(y); });
}
} // namespace

std::string Reply::header(const std::string& name) const
{
    for (const auto& [key, value] : headers)
    {
        if (iequals(key, name))
            return value;
    }
    return {};
}

std::unique_ptr<httplib::Client> make_client(const util::Url& url)
{
    auto client = std::make_unique<httplib::Client>(url.origin());
    if (!client->is_valid())
        throw TransportError("cannot open " + url.scheme + " connection to " + url.host +
                             (url.is_https() ? " (built without TLS support)" : ""));
    client->set_follow_location(false);
    client->set_keep_alive(false);
    return client;
}

void apply_deadline(httplib::Client& client, const Context& ctx)
{
    auto left = std::min(ctx.remaining(), kMaxSocketWait);
    auto sec = static_cast<time_t>(left.count() / 1000);
    auto usec = static_cast<time_t>((left.count() % 1000) * 1000);
    client.set_connection_timeout(sec, usec);
    client.set_read_timeout(sec, usec);
    client.set_write_timeout(sec, usec);
}

httplib::Headers to_headers(const StringMap& headers)
{
    httplib::Headers out;
    for (const auto& [key, value] : headers)
        out.emplace(key, value);
    return out;
}

void set_header(StringMap& headers, const std::string& name, const std::string& value)
{
    for (auto it = headers.begin(); it != headers.end();)
    {
        if (iequals(it->first, name))
            it = headers.erase(it);
        else
            ++it;
    }
    headers[name] = value;
}

StringMap merge_headers(StringMap defaults, const StringMap& configured)
{
    for (const auto& [key, value] : configured)
        set_header(defaults, key, value);
    return defaults;
}

std::string describe(httplib::Error error)
{
    return httplib::to_string(error);
}

Reply post(const util::Url& url, const httplib::Headers& headers, const std::string& body,
           const Context& ctx)
{
    util::Url target = url;
    for (int redirects = 0;; ++redirects)
    {
        ctx.throw_if_done("POST " + target.str());

        auto client = make_client(target);
        apply_deadline(*client, ctx);
        httplib::Result res;
        {
            CancelWatch watch(*client, ctx);
            res = client->Post(target.path, headers, body, "application/json");
        }
        if (!res)
        {
            if (ctx.cancelled())
                throw TimeoutError("POST " + target.str() + ": cancelled");
            if (deadline_reached(ctx, res.error()))
                throw TimeoutError("POST " + target.str() + ": deadline exceeded (" +
                                   describe(res.error()) + ")");
            throw TransportError("POST " + target.str() + " failed: " + describe(res.error()));
        }

        if (util::is_redirect_status(res->status))
        {
            if (res->status != 307 && res->status != 308)
                throw TransportError("POST " + target.str() + ": redirect status " +
                                     std::to_string(res->status) +
                                     " does not preserve the request body");
            if (redirects >= kMaxRedirects)
                throw TransportError("POST " + url.str() + ": redirect limit exceeded");
            std::string location = res->get_header_value("Location");
            if (location.empty())
                throw TransportError("POST " + target.str() + ": redirect without Location header");
            try
            {
                target = util::resolve_reference(target, location);
            }
            catch (const ConfigError& e)
            {
                throw TransportError("POST " + target.str() + ": bad redirect target: " +
                                     e.what());
            }
            continue;
        }

        Reply reply;
        reply.status = res->status;
        reply.body = std::move(res->body);
        reply.headers = res->headers;
        reply.url = target;
        return reply;
    }
}

} // namespace mcpgate::http
