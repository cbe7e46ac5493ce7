// HTTP plumbing shared by the Streamable HTTP and SSE clients

#pragma once

#include "mcpgate/context.hpp"
#include "mcpgate/types.hpp"
#include "mcpgate/util/url.hpp"

#include <httplib.h>
#include <memory>
#include <string>

namespace mcpgate::http
{

constexpr int kMaxRedirects = 5;

struct Reply
{
    int status{0};
    std::string body;
    httplib::Headers headers;
    util::Url url; ///< Final URL after redirects

    /// Header lookup, case-insensitive; empty when absent
    std::string header(const std::string& name) const;
};

/// httplib client for the origin of @p url. Throws TransportError when the scheme
/// is unusable with this build (https without TLS support).
std::unique_ptr<httplib::Client> make_client(const util::Url& url);

/// Connect, read and write timeouts set to what remains of @p ctx
void apply_deadline(httplib::Client& client, const Context& ctx);

httplib::Headers to_headers(const StringMap& headers);

/// Set @p name to @p value, replacing any header whose name differs only in case
void set_header(StringMap& headers, const std::string& name, const std::string& value);

/// @p configured layered over @p defaults; names compare case-insensitively
StringMap merge_headers(StringMap defaults, const StringMap& configured);

/// POST @p body as application/json, following up to kMaxRedirects 307/308
/// redirects. Other redirect statuses would turn the POST into a GET and are
/// reported as TransportError.
/// Throws TimeoutError when the context expires before or during the exchange and
/// TransportError for connection failures or a broken redirect chain.
Reply post(const util::Url& url, const httplib::Headers& headers, const std::string& body,
           const Context& ctx);

/// Failure text for an httplib result without response
std::string describe(httplib::Error error);

} // namespace mcpgate::http
