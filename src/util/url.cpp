#include "mcpgate/util/url.hpp"

#include "mcpgate/exceptions.hpp"

#include <cctype>

namespace mcpgate::util
{

std::string Url::origin() const
{
    return scheme + "://" + host + ":" + std::to_string(port);
}

Url parse_url(const std::string& url)
{
    if (url.empty())
        throw ConfigError("URL is required");

    Url result;
    auto scheme_pos = url.find("://");
    if (scheme_pos == std::string::npos)
        throw ConfigError("URL has no scheme: " + url);

    result.scheme = url.substr(0, scheme_pos);
    for (auto& c : result.scheme)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (result.scheme != "http" && result.scheme != "https")
        throw ConfigError("Unsupported URL scheme: " + result.scheme +
                          " (only http and https are allowed)");

    std::string remaining = url.substr(scheme_pos + 3);
    auto path_pos = remaining.find_first_of("/?#");
    std::string authority = remaining.substr(0, path_pos);
    if (path_pos != std::string::npos)
    {
        result.path = remaining.substr(path_pos);
        auto fragment = result.path.find('#');
        if (fragment != std::string::npos)
            result.path.erase(fragment);
        if (result.path.empty() || result.path[0] != '/')
            result.path.insert(result.path.begin(), '/');
    }

    // Drop userinfo; credentials travel in headers
    auto at = authority.rfind('@');
    if (at != std::string::npos)
        authority = authority.substr(at + 1);

    result.port = result.is_https() ? 443 : 80;
    auto colon_pos = authority.rfind(':');
    if (colon_pos != std::string::npos && authority.find(']', colon_pos) == std::string::npos)
    {
        std::string port_str = authority.substr(colon_pos + 1);
        result.host = authority.substr(0, colon_pos);
        if (!port_str.empty())
        {
            try
            {
                size_t consumed = 0;
                result.port = std::stoi(port_str, &consumed);
                if (consumed != port_str.size() || result.port <= 0 || result.port > 65535)
                    throw ConfigError("Invalid port in URL: " + url);
            }
            catch (const std::logic_error&)
            {
                throw ConfigError("Invalid port in URL: " + url);
            }
        }
    }
    else
    {
        result.host = authority;
    }

    if (result.host.empty())
        throw ConfigError("URL has no host: " + url);
    return result;
}

bool is_redirect_status(int status)
{
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

Url resolve_reference(const Url& base, const std::string& reference)
{
    if (reference.rfind("http://", 0) == 0 || reference.rfind("https://", 0) == 0)
        return parse_url(reference);

    Url out = base;
    if (!reference.empty() && reference[0] == '/')
    {
        out.path = reference;
        return out;
    }

    // Relative reference: resolve against the directory of the current path
    std::string current = base.path.substr(0, base.path.find('?'));
    std::string base_dir = "/";
    auto last_slash = current.rfind('/');
    if (last_slash != std::string::npos)
        base_dir = current.substr(0, last_slash + 1);
    out.path = base_dir + reference;
    return out;
}

} // namespace mcpgate::util
