#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <clouddrive/canceller.h>
#include <clouddrive/common/error_or.h>
#include <clouddrive/types.h>

namespace clouddrive
{

#define DEFINE_HTTP_METHODS(expander) \
    expander(GET) \
    expander(POST) \
    expander(PUT)

enum HttpMethod : unsigned int
{
#define DEFINE_ENUMERANT(name) HTTP_METHOD_##name,
    DEFINE_HTTP_METHODS(DEFINE_ENUMERANT)
#undef DEFINE_ENUMERANT
}; // HttpMethod

const char* toString(HttpMethod method);

using HttpHeader = std::pair<std::string, std::string>;
using HttpHeaders = std::vector<HttpHeader>;

// Header names are compared without regard to case.
const std::string* findHeader(const HttpHeaders& headers, const std::string& name);

// Percent-encode a query component.
std::string urlEncode(const std::string& value);

// Streams a request's payload to the transport.
class RequestBody
{
public:
    virtual ~RequestBody() = default;

    // How many bytes will the body produce?
    virtual m_off_t contentLength() const = 0;

    // Read at most length bytes into buffer, zero when exhausted.
    virtual ErrorOr<std::size_t> read(void* buffer, std::size_t length) = 0;
}; // RequestBody

// Receives a response's payload as it arrives.
class ResponseConsumer
{
public:
    virtual ~ResponseConsumer() = default;

    // Called once the response's status and headers are known.
    //
    // contentLength is UNKNOWN_LENGTH if the remote didn't declare one.
    virtual Error begin(int status,
                        const HttpHeaders& headers,
                        m_off_t contentLength) = 0;

    // Called when the exchange has completed successfully.
    virtual Error end() = 0;

    // Called as payload arrives.
    virtual Error write(const void* buffer, std::size_t length) = 0;
}; // ResponseConsumer

struct HttpRequest
{
    // Append a header.
    void header(std::string name, std::string value);

    // Append a query argument to the request's URL.
    void query(const std::string& name, const std::string& value);

    HttpMethod mMethod = HTTP_METHOD_GET;

    std::string mURL;

    HttpHeaders mHeaders;

    // Streamed payload, if any.
    RequestBody* mBody = nullptr;

    // Streamed response, if any.
    //
    // When no consumer is specified, the response's payload is
    // collected into HttpResponse::mBody.
    ResponseConsumer* mConsumer = nullptr;

    // Zero means the transport's default.
    std::chrono::milliseconds mConnectTimeout{0};
    std::chrono::milliseconds mReadTimeout{0};
    std::chrono::milliseconds mWriteTimeout{0};
}; // HttpRequest

struct HttpResponse
{
    // Retrieve a header's value, if present.
    const std::string* header(const std::string& name) const;

    // Did the remote report success?
    bool successful() const;

    int mStatus = 0;

    HttpHeaders mHeaders;

    // Empty if the response was streamed to a consumer.
    std::string mBody;
}; // HttpResponse

// Performs a single HTTP exchange.
class HttpTransport
{
public:
    virtual ~HttpTransport() = default;

    // Perform the exchange described by request.
    //
    // Errors reported by request's consumer or body are returned as is.
    // The exchange is abandoned as soon as canceller is triggered.
    virtual ErrorOr<HttpResponse> execute(HttpRequest& request,
                                          const Canceller& canceller) = 0;
}; // HttpTransport

using HttpTransportPtr = std::shared_ptr<HttpTransport>;

// Decorates requests with credentials.
class Authenticator
{
public:
    virtual ~Authenticator() = default;

    virtual void authenticate(HttpRequest& request) = 0;

    // Called when the remote rejected our credentials.
    //
    // Returns true if the request should be retried.
    virtual bool refresh();
}; // Authenticator

using AuthenticatorPtr = std::shared_ptr<Authenticator>;

class Authenticators
{
public:
    // Adds "Authorization: Bearer <token>" to every request.
    static AuthenticatorPtr bearer(std::string token);

    // Adds an "access_token" query argument to every request.
    static AuthenticatorPtr accessToken(std::string token);
}; // Authenticators

} // clouddrive
