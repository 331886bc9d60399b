#pragma once

#include <string>

#include <clouddrive/connection_pool.h>
#include <clouddrive/http.h>

namespace clouddrive
{

// Performs exchanges using libcurl.
//
// Every exchange uses its own easy handle. Connections, DNS lookups and
// TLS sessions are shared through the connection pool.
class CurlTransport
  : public HttpTransport
{
    // Describes a single exchange.
    class Exchange;

    ConnectionPoolPtr mPool;
    const std::string mUserAgent;

public:
    CurlTransport(ConnectionPoolPtr pool, std::string userAgent);

    ErrorOr<HttpResponse> execute(HttpRequest& request,
                                  const Canceller& canceller) override;
}; // CurlTransport

} // clouddrive
