#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <clouddrive/api_service_options.h>
#include <clouddrive/common/error_or.h>
#include <clouddrive/http.h>
#include <clouddrive/remote_entry.h>
#include <clouddrive/response_cache.h>

namespace clouddrive
{

// Describes the invocation of a single remote method.
class ApiRequest
{
    std::vector<std::pair<std::string, std::string>> mArguments;

    // Streamed payload, if any.
    RequestBody* mBody;

    HttpMethod mHttpMethod;

    std::string mMethod;

public:
    explicit ApiRequest(std::string method);

    ApiRequest& arg(std::string name, std::string value);

    ApiRequest& arg(std::string name, const char* value);

    ApiRequest& arg(std::string name, std::int64_t value);

    ApiRequest& arg(std::string name, std::uint64_t value);

    const std::vector<std::pair<std::string, std::string>>& arguments() const;

    // Stream body to the remote using the specified method.
    ApiRequest& body(HttpMethod method, RequestBody& body);

    RequestBody* body() const;

    HttpMethod httpMethod() const;

    const std::string& method() const;
}; // ApiRequest

// Shapes requests and checks the remote's replies.
class ApiClient
{
    // Build an HTTP request from an API request.
    HttpRequest build(const ApiRequest& request) const;

    // Apply our timeouts to request.
    void configure(HttpRequest& request) const;

    // Perform an exchange, consulting the cache if possible.
    ErrorOr<HttpResponse> exchange(HttpRequest& request,
                                   const Canceller& canceller);

    const ApiServiceOptions mOptions;

    // May be null.
    ResponseCachePtr mCache;

    HttpTransportPtr mTransport;

public:
    ApiClient(const ApiServiceOptions& options,
              ResponseCachePtr cache,
              HttpTransportPtr transport);

    // Invoke a remote method.
    //
    // Returns the remote's reply if the remote reported success.
    ErrorOr<std::string> call(const ApiRequest& request,
                              const Canceller& canceller);

    // Stream the content at url to consumer.
    ErrorOr<HttpResponse> fetch(const std::string& url,
                                ResponseConsumer& consumer,
                                const Canceller& canceller);

    // Extract a reply's metadata.
    static ErrorOr<RemoteEntryPtr> decodeEntry(const std::string& reply);

    static ErrorOr<RemoteFile> decodeFile(const std::string& reply);

    static ErrorOr<FileLink> decodeFileLink(const std::string& reply);

    static ErrorOr<RemoteFolder> decodeFolder(const std::string& reply);

    // Extract a reply's result code and error message.
    static ErrorOr<std::pair<int, std::string>> decodeResult(const std::string& reply);

    static ErrorOr<UserInfo> decodeUserInfo(const std::string& reply);
}; // ApiClient

using ApiClientPtr = std::shared_ptr<ApiClient>;

} // clouddrive
