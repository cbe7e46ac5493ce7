#pragma once
#include <string>

namespace mcpgate::util
{

struct Url
{
    std::string scheme; ///< "http" or "https"
    std::string host;
    int port{80};
    std::string path{"/"}; ///< Leading '/', query string preserved

    bool is_https() const
    {
        return scheme == "https";
    }

    /// "scheme://host:port", the form httplib::Client accepts
    std::string origin() const;

    std::string str() const
    {
        return origin() + path;
    }
};

/// Split an absolute http(s) URL. Throws ConfigError for an empty URL, a missing or
/// unsupported scheme, an empty host or an invalid port.
Url parse_url(const std::string& url);

bool is_redirect_status(int status);

/// Resolve a Location header or SSE endpoint reference against @p base:
/// absolute URLs replace it, "/path" keeps the origin, anything else is relative
/// to the directory of base.path.
Url resolve_reference(const Url& base, const std::string& reference);

} // namespace mcpgate::util
