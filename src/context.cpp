#include "mcpgate/context.hpp"

#include "mcpgate/exceptions.hpp"

namespace mcpgate
{

Context::Context() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

Context Context::with_timeout(std::chrono::milliseconds timeout)
{
    return Context().narrowed(timeout);
}

Context Context::with_deadline(Clock::time_point deadline)
{
    Context ctx;
    ctx.deadline_ = deadline;
    return ctx;
}

Context Context::narrowed(std::chrono::milliseconds timeout) const
{
    Context child(*this);
    if (timeout.count() <= 0)
        return child;
    auto candidate = Clock::now() + timeout;
    if (!child.deadline_ || candidate < *child.deadline_)
        child.deadline_ = candidate;
    return child;
}

void Context::cancel() const
{
    cancelled_->store(true, std::memory_order_release);
}

bool Context::cancelled() const
{
    return cancelled_->load(std::memory_order_acquire);
}

bool Context::done() const
{
    if (cancelled())
        return true;
    return deadline_ && Clock::now() >= *deadline_;
}

std::chrono::milliseconds Context::remaining() const
{
    if (cancelled())
        return std::chrono::milliseconds(0);
    if (!deadline_)
        return std::chrono::milliseconds::max();
    auto now = Clock::now();
    if (now >= *deadline_)
        return std::chrono::milliseconds(0);
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline_ - now);
    // Round sub-millisecond remainders up so a live context never reports zero
    return left.count() == 0 ? std::chrono::milliseconds(1) : left;
}

void Context::throw_if_done(const std::string& operation) const
{
    if (cancelled())
        throw TimeoutError(operation + ": cancelled");
    if (done())
        throw TimeoutError(operation + ": deadline exceeded");
}

} // namespace mcpgate
