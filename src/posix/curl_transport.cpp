#include <algorithm>
#include <cassert>
#include <cstring>
#include <memory>

#include <curl/curl.h>

#include <clouddrive/logging.h>
#include <clouddrive/posix/curl_share.h>
#include <clouddrive/posix/curl_transport.h>

namespace clouddrive
{

using CurlPtr = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlListPtr = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

class CurlTransport::Exchange
{
    // Called by libcurl when it's received a header line.
    static std::size_t header(char* buffer,
                              std::size_t size,
                              std::size_t count,
                              void* context);

    // Called by libcurl periodically so we can abort the transfer.
    static int progress(void* context,
                        curl_off_t downloadTotal,
                        curl_off_t downloaded,
                        curl_off_t uploadTotal,
                        curl_off_t uploaded);

    // Called by libcurl when it wants more of the request's body.
    static std::size_t read(char* buffer,
                            std::size_t size,
                            std::size_t count,
                            void* context);

    // Called by libcurl when it's received some of the response's body.
    static std::size_t write(char* buffer,
                             std::size_t size,
                             std::size_t count,
                             void* context);

    // Let the consumer know the response has started arriving.
    bool begin();

    // Translate a libcurl failure into one of our errors.
    Error translate(CURLcode result) const;

    // Has the consumer been told that the response has arrived?
    bool mBegun;

    const Canceller& mCanceller;

    // Describes libcurl's failure in detail.
    char mDetail[CURL_ERROR_SIZE];

    // Set when the request's body or the response's consumer fails.
    Error mError;

    CURL* mHandle;

    HttpRequest& mRequest;

    HttpResponse mResponse;

public:
    Exchange(CURL* handle,
             HttpRequest& request,
             const Canceller& canceller);

    // Perform the exchange.
    ErrorOr<HttpResponse> perform();
}; // Exchange

std::size_t CurlTransport::Exchange::header(char* buffer,
                                            std::size_t size,
                                            std::size_t count,
                                            void* context)
{
    auto& exchange = *static_cast<Exchange*>(context);
    auto length = size * count;

    std::string line(buffer, length);

    // Strip the line terminator.
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        line.pop_back();

    // A new response is arriving: a redirect or an interim response.
    if (!line.compare(0, 5, "HTTP/"))
    {
        exchange.mResponse.mHeaders.clear();
        return length;
    }

    auto colon = line.find(':');

    // Malformed or blank line.
    if (colon == std::string::npos)
        return length;

    auto value = line.find_first_not_of(" \t", colon + 1);

    if (value == std::string::npos)
        value = line.size();

    exchange.mResponse.mHeaders.emplace_back(line.substr(0, colon),
                                             line.substr(value));

    return length;
}

int CurlTransport::Exchange::progress(void* context,
                                      curl_off_t,
                                      curl_off_t,
                                      curl_off_t,
                                      curl_off_t)
{
    auto& exchange = *static_cast<Exchange*>(context);

    // Nonzero tells libcurl to abort the transfer.
    return exchange.mCanceller.triggered();
}

std::size_t CurlTransport::Exchange::read(char* buffer,
                                          std::size_t size,
                                          std::size_t count,
                                          void* context)
{
    auto& exchange = *static_cast<Exchange*>(context);

    // Sanity.
    assert(exchange.mRequest.mBody);

    if (exchange.mCanceller.triggered())
        return CURL_READFUNC_ABORT;

    auto result = exchange.mRequest.mBody->read(buffer, size * count);

    if (result)
        return *result;

    exchange.mError = std::move(result).error();

    return CURL_READFUNC_ABORT;
}

std::size_t CurlTransport::Exchange::write(char* buffer,
                                           std::size_t size,
                                           std::size_t count,
                                           void* context)
{
    auto& exchange = *static_cast<Exchange*>(context);
    auto length = size * count;

    // Response is being collected in memory.
    if (!exchange.mRequest.mConsumer)
    {
        exchange.mResponse.mBody.append(buffer, length);
        return length;
    }

    // Returning anything other than length aborts the transfer.
    if (!exchange.begin())
        return 0;

    exchange.mError = exchange.mRequest.mConsumer->write(buffer, length);

    if (!exchange.mError.ok())
        return 0;

    return length;
}

bool CurlTransport::Exchange::begin()
{
    if (mBegun)
        return true;

    mBegun = true;

    long status = 0;

    curl_easy_getinfo(mHandle, CURLINFO_RESPONSE_CODE, &status);

    curl_off_t length = -1;

    if (curl_easy_getinfo(mHandle, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) != CURLE_OK)
        length = -1;

    mResponse.mStatus = static_cast<int>(status);

    mError = mRequest.mConsumer->begin(mResponse.mStatus,
                                       mResponse.mHeaders,
                                       static_cast<m_off_t>(length));

    return mError.ok();
}

Error CurlTransport::Exchange::translate(CURLcode result) const
{
    std::string message = curl_easy_strerror(result);

    if (mDetail[0])
        message.append(": ").append(mDetail);

    switch (result)
    {
    case CURLE_ABORTED_BY_CALLBACK:
        return cancelledError();
    case CURLE_COULDNT_CONNECT:
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_RESOLVE_PROXY:
        return transportError(LOCAL_ECONNECT, std::move(message));
    case CURLE_OPERATION_TIMEDOUT:
        return transportError(LOCAL_ETIMEOUT, std::move(message));
    case CURLE_PARTIAL_FILE:
        return integrityError(std::move(message));
    case CURLE_PEER_FAILED_VERIFICATION:
    case CURLE_SSL_CACERT_BADFILE:
    case CURLE_SSL_CERTPROBLEM:
    case CURLE_SSL_CIPHER:
    case CURLE_SSL_CONNECT_ERROR:
    case CURLE_SSL_PINNEDPUBKEYNOTMATCH:
        return transportError(LOCAL_ESSL, std::move(message));
    default:
        return transportError(LOCAL_ENETWORK, std::move(message));
    }
}

CurlTransport::Exchange::Exchange(CURL* handle,
                                  HttpRequest& request,
                                  const Canceller& canceller)
  : mBegun(false)
  , mCanceller(canceller)
  , mDetail()
  , mError()
  , mHandle(handle)
  , mRequest(request)
  , mResponse()
{
}

ErrorOr<HttpResponse> CurlTransport::Exchange::perform()
{
    curl_easy_setopt(mHandle, CURLOPT_ERRORBUFFER, mDetail);
    curl_easy_setopt(mHandle, CURLOPT_HEADERFUNCTION, &Exchange::header);
    curl_easy_setopt(mHandle, CURLOPT_HEADERDATA, this);
    curl_easy_setopt(mHandle, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(mHandle, CURLOPT_WRITEFUNCTION, &Exchange::write);
    curl_easy_setopt(mHandle, CURLOPT_WRITEDATA, this);
    curl_easy_setopt(mHandle, CURLOPT_XFERINFOFUNCTION, &Exchange::progress);
    curl_easy_setopt(mHandle, CURLOPT_XFERINFODATA, this);

    if (mRequest.mBody)
    {
        curl_easy_setopt(mHandle, CURLOPT_READFUNCTION, &Exchange::read);
        curl_easy_setopt(mHandle, CURLOPT_READDATA, this);
    }

    auto result = curl_easy_perform(mHandle);

    // The body or the consumer bailed.
    if (!mError.ok())
        return unexpected(mError);

    if (result != CURLE_OK)
        return unexpected(translate(result));

    long status = 0;

    curl_easy_getinfo(mHandle, CURLINFO_RESPONSE_CODE, &status);

    mResponse.mStatus = static_cast<int>(status);

    // Response had no body at all.
    if (mRequest.mConsumer && !begin())
        return unexpected(mError);

    if (mRequest.mConsumer)
        mError = mRequest.mConsumer->end();

    if (!mError.ok())
        return unexpected(mError);

    return std::move(mResponse);
}

CurlTransport::CurlTransport(ConnectionPoolPtr pool, std::string userAgent)
  : HttpTransport()
  , mPool(std::move(pool))
  , mUserAgent(std::move(userAgent))
{
    // Sanity.
    assert(mPool);

    initializeCurl();
}

ErrorOr<HttpResponse> CurlTransport::execute(HttpRequest& request,
                                             const Canceller& canceller)
{
    if (canceller.triggered())
        return unexpected(cancelledError());

    CurlPtr handle(curl_easy_init(), &curl_easy_cleanup);

    if (!handle)
        return unexpected(transportError(LOCAL_EINTERNAL,
                                         "Couldn't allocate easy handle"));

    auto* curl = handle.get();

    // Keeps the share alive until the exchange has completed.
    auto share = mPool->share();

    curl_easy_setopt(curl, CURLOPT_SHARE, share->handle());
    curl_easy_setopt(curl, CURLOPT_MAXCONNECTS, static_cast<long>(mPool->maxIdleConnections()));
    curl_easy_setopt(curl, CURLOPT_MAXAGE_CONN, static_cast<long>(mPool->keepAlive().count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_URL, request.mURL.c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, mUserAgent.c_str());

    switch (request.mMethod)
    {
    case HTTP_METHOD_GET:
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        break;
    case HTTP_METHOD_POST:
        curl_easy_setopt(curl, CURLOPT_POST, 1L);

        if (!request.mBody)
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, 0L);
        else if (request.mBody->contentLength() >= 0)
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(request.mBody->contentLength()));
        break;
    case HTTP_METHOD_PUT:
        curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);

        if (!request.mBody)
            curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(0));
        else if (request.mBody->contentLength() >= 0)
            curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE,
                             static_cast<curl_off_t>(request.mBody->contentLength()));
        break;
    }

    // Compressed downloads would confuse the consumer's length checks.
    if (!request.mConsumer)
        curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "");

    if (request.mConnectTimeout.count() > 0)
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(request.mConnectTimeout.count()));

    // Read and write timeouts become a stall timeout.
    auto stall = std::max(request.mReadTimeout, request.mWriteTimeout);

    if (stall.count() > 0)
    {
        auto seconds = (stall.count() + 999) / 1000;

        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(seconds));
    }

    CurlListPtr headers(nullptr, &curl_slist_free_all);

    for (auto& header : request.mHeaders)
    {
        auto line = header.first + ": " + header.second;
        auto* list = curl_slist_append(headers.get(), line.c_str());

        if (!list)
            return unexpected(transportError(LOCAL_EINTERNAL,
                                             "Couldn't allocate header list"));

        headers.release();
        headers.reset(list);
    }

    // Don't wait for the remote to acknowledge our upload.
    if (auto* list = curl_slist_append(headers.get(), "Expect:"))
    {
        headers.release();
        headers.reset(list);
    }

    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());

    // Keep credentials out of the log.
    LOG_debug << toString(request.mMethod) << " " << request.mURL.substr(0, request.mURL.find('?'));

    Exchange exchange(curl, request, canceller);

    auto result = exchange.perform();

    if (result)
        LOG_debug << "Response " << result->mStatus << " (" << result->mBody.size() << " bytes)";
    else
        LOG_debug << "Exchange failed: " << result.error();

    return result;
}

} // clouddrive
