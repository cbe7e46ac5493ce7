#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace mcpgate
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

/// Invalid or incomplete connection configuration (missing URL or command).
struct ConfigError : public Error
{
    using Error::Error;
};

/// Failure of the byte channel itself: spawn, pipes, sockets, closed streams.
struct TransportError : public Error
{
    using Error::Error;
};

/// Non-success HTTP status returned by a backend.
class HttpStatusError : public TransportError
{
  public:
    HttpStatusError(const std::string& what, int status, std::string body)
        : TransportError(what), status_(status), body_(std::move(body))
    {
    }

    int status() const
    {
        return status_;
    }
    const std::string& body() const
    {
        return body_;
    }

  private:
    int status_;
    std::string body_;
};

/// Operation not permitted in the current connection state.
struct StateError : public Error
{
    using Error::Error;
};

/// Response id does not match the id of the request it answers.
class CorrelationError : public Error
{
  public:
    CorrelationError(const std::string& what, int64_t expected, int64_t actual)
        : Error(what), expected_(expected), actual_(actual)
    {
    }

    int64_t expected() const
    {
        return expected_;
    }
    int64_t actual() const
    {
        return actual_;
    }

  private:
    int64_t expected_;
    int64_t actual_;
};

/// JSON-RPC error object returned by the remote peer.
class ProtocolError : public Error
{
  public:
    ProtocolError(const std::string& what, int code, std::string remote_message,
                  std::optional<std::string> data = std::nullopt)
        : Error(what), code_(code), remote_message_(std::move(remote_message)),
          data_(std::move(data))
    {
    }

    int code() const
    {
        return code_;
    }
    const std::string& remote_message() const
    {
        return remote_message_;
    }
    const std::optional<std::string>& data() const
    {
        return data_;
    }

  private:
    int code_;
    std::string remote_message_;
    std::optional<std::string> data_;
};

/// Deadline exceeded or call cancelled while waiting for a response.
struct TimeoutError : public Error
{
    using Error::Error;
};

/// Malformed JSON, JSON-RPC envelope or event-stream framing.
struct DecodeError : public Error
{
    using Error::Error;
};

} // namespace mcpgate
