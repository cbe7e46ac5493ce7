#pragma once
/// @file util/sse.hpp
/// @brief Incremental Server-Sent-Events parser used by both HTTP transports

#include <optional>
#include <string>
#include <vector>

namespace mcpgate::util
{

struct SseEvent
{
    std::string event{"message"};
    std::string data; ///< Multiple data: lines joined with '\n'
    std::string id;
};

/// Feed raw bytes in arbitrary chunks; complete events come out once their blank
/// line arrives. Comment lines (":keep-alive") and unknown fields are ignored.
/// Both LF and CRLF line endings are accepted.
class SseParser
{
  public:
    std::vector<SseEvent> feed(const char* data, size_t size);
    std::vector<SseEvent> feed(const std::string& chunk)
    {
        return feed(chunk.data(), chunk.size());
    }

    /// Flush a trailing event that was not terminated by a blank line
    std::vector<SseEvent> finish();

  private:
    void process_line(std::string line, std::vector<SseEvent>& out);
    void dispatch(std::vector<SseEvent>& out);

    std::string buffer_;
    SseEvent current_;
    bool has_data_{false};
};

/// Data payload of the first event in a complete text/event-stream body that
/// carries one, or nullopt when the body has none.
std::optional<std::string> first_data_payload(const std::string& body);

} // namespace mcpgate::util
