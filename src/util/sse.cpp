#include "mcpgate/util/sse.hpp"

namespace mcpgate::util
{

std::vector<SseEvent> SseParser::feed(const char* data, size_t size)
{
    std::vector<SseEvent> out;
    buffer_.append(data, size);

    size_t pos = 0;
    while (true)
    {
        size_t line_end = buffer_.find('\n', pos);
        if (line_end == std::string::npos)
            break;
        std::string line = buffer_.substr(pos, line_end - pos);
        pos = line_end + 1;
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        process_line(std::move(line), out);
    }

    if (pos > 0)
        buffer_.erase(0, pos);
    return out;
}

std::vector<SseEvent> SseParser::finish()
{
    std::vector<SseEvent> out;
    if (!buffer_.empty())
    {
        std::string line = std::move(buffer_);
        buffer_.clear();
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        process_line(std::move(line), out);
    }
    dispatch(out);
    return out;
}

void SseParser::process_line(std::string line, std::vector<SseEvent>& out)
{
    if (line.empty())
    {
        dispatch(out);
        return;
    }
    if (line[0] == ':')
        return;

    std::string field;
    std::string value;
    auto colon = line.find(':');
    if (colon == std::string::npos)
    {
        field = std::move(line);
    }
    else
    {
        field = line.substr(0, colon);
        value = line.substr(colon + 1);
        if (!value.empty() && value[0] == ' ')
            value.erase(0, 1);
    }

    if (field == "event")
    {
        current_.event = value;
    }
    else if (field == "data")
    {
        if (has_data_)
            current_.data.push_back('\n');
        current_.data += value;
        has_data_ = true;
    }
    else if (field == "id")
    {
        current_.id = value;
    }
}

void SseParser::dispatch(std::vector<SseEvent>& out)
{
    if (has_data_)
    {
        if (current_.event.empty())
            current_.event = "message";
        out.push_back(std::move(current_));
    }
    current_ = SseEvent{};
    has_data_ = false;
}

std::optional<std::string> first_data_payload(const std::string& body)
{
    SseParser parser;
    auto events = parser.feed(body);
    auto tail = parser.finish();
    events.insert(events.end(), tail.begin(), tail.end());
    for (auto& e : events)
    {
        if (!e.data.empty())
            return std::move(e.data);
    }
    return std::nullopt;
}

} // namespace mcpgate::util
