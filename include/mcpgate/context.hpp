#pragma once
/// @file context.hpp
/// @brief Deadline and cooperative cancellation passed to every blocking client call

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace mcpgate
{

/// Copies share one cancellation flag; deadlines only ever shrink when narrowed.
///
/// @code
/// auto ctx = mcpgate::Context::with_timeout(std::chrono::seconds(5));
/// client.initialize(ctx);
/// @endcode
class Context
{
  public:
    using Clock = std::chrono::steady_clock;

    /// No deadline, not cancelled
    Context();

    static Context background()
    {
        return Context();
    }
    static Context with_timeout(std::chrono::milliseconds timeout);
    static Context with_deadline(Clock::time_point deadline);

    /// Child sharing the cancellation flag whose deadline is min(parent, now + timeout).
    /// A non-positive timeout leaves the parent deadline unchanged.
    Context narrowed(std::chrono::milliseconds timeout) const;

    void cancel() const;
    bool cancelled() const;

    /// Deadline passed or cancelled
    bool done() const;

    const std::optional<Clock::time_point>& deadline() const
    {
        return deadline_;
    }

    /// Time left before the deadline; max() when there is none, zero once done
    std::chrono::milliseconds remaining() const;

    /// Throws TimeoutError naming @p operation when the context is done
    void throw_if_done(const std::string& operation) const;

  private:
    std::optional<Clock::time_point> deadline_;
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

} // namespace mcpgate
