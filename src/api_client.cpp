#include <cassert>

#include <clouddrive/api_client.h>
#include <clouddrive/common/utility.h>
#include <clouddrive/json.h>
#include <clouddrive/logging.h>

namespace clouddrive
{

using common::format;

static Error malformed(const char* what)
{
    return transportError(LOCAL_EPROTOCOL,
                          format("Malformed reply: %s", what));
}

// Locate a top-level member and hand it to parser.
template<typename Parser>
static bool member(const std::string& reply, const char* name, Parser&& parser)
{
    JSON json(reply);

    if (!json.enterobject())
        return false;

    for (auto key = json.getname(); !key.empty(); key = json.getname())
    {
        if (key == name)
            return parser(json);

        if (!json.storeobject())
            return false;
    }

    return false;
}

// Retrieve a number or a string as a string.
static bool storetext(JSON& json, std::string& value)
{
    if (json.storestring(value))
        return true;

    // Numbers can be wider than we can represent.
    return json.storeobject(&value);
}

static RemoteEntryPtr parseEntry(JSON& json);

static bool parseChildren(JSON& json, RemoteEntryPtrVector& children)
{
    if (!json.enterarray())
        return false;

    while (!json.leavearray())
    {
        auto child = parseEntry(json);

        if (!child)
            return false;

        children.emplace_back(std::move(child));
    }

    return true;
}

static RemoteEntryPtr parseEntry(JSON& json)
{
    if (!json.enterobject())
        return nullptr;

    RemoteEntryPtrVector children;
    std::int64_t created = 0;
    std::int64_t fileID = 0;
    std::int64_t folderID = 0;
    std::int64_t modified = 0;
    std::int64_t parentFolderID = 0;
    std::int64_t size = 0;
    bool folder = false;
    std::string contentType;
    std::string hash;
    std::string name;

    for (auto key = json.getname(); !key.empty(); key = json.getname())
    {
        auto parsed = true;

        if (key == "contents")
            parsed = parseChildren(json, children);
        else if (key == "contenttype")
            parsed = json.storestring(contentType);
        else if (key == "created")
            parsed = json.getint(created);
        else if (key == "fileid")
            parsed = json.getint(fileID);
        else if (key == "folderid")
            parsed = json.getint(folderID);
        else if (key == "hash")
            parsed = storetext(json, hash);
        else if (key == "isfolder")
            parsed = json.getbool(folder);
        else if (key == "modified")
            parsed = json.getint(modified);
        else if (key == "name")
            parsed = json.storestring(name);
        else if (key == "parentfolderid")
            parsed = json.getint(parentFolderID);
        else if (key == "size")
            parsed = json.getint(size);
        else
            parsed = json.storeobject();

        if (!parsed)
            return nullptr;
    }

    if (!json.leaveobject())
        return nullptr;

    if (folder)
    {
        auto entry = std::make_shared<RemoteFolder>();

        entry->mChildren = std::move(children);
        entry->mFolderID = static_cast<handle>(folderID);
        entry->mName = std::move(name);
        entry->mParentFolderID = static_cast<handle>(parentFolderID);
        entry->mCreated = created;
        entry->mModified = modified;

        return entry;
    }

    auto entry = std::make_shared<RemoteFile>();

    entry->mContentType = std::move(contentType);
    entry->mFileID = static_cast<handle>(fileID);
    entry->mHash = std::move(hash);
    entry->mName = std::move(name);
    entry->mParentFolderID = static_cast<handle>(parentFolderID);
    entry->mSize = size;
    entry->mCreated = created;
    entry->mModified = modified;

    return entry;
}

ApiRequest::ApiRequest(std::string method)
  : mArguments()
  , mBody(nullptr)
  , mHttpMethod(HTTP_METHOD_GET)
  , mMethod(std::move(method))
{
}

ApiRequest& ApiRequest::arg(std::string name, std::string value)
{
    mArguments.emplace_back(std::move(name), std::move(value));

    return *this;
}

ApiRequest& ApiRequest::arg(std::string name, const char* value)
{
    return arg(std::move(name), std::string(value));
}

ApiRequest& ApiRequest::arg(std::string name, std::int64_t value)
{
    return arg(std::move(name), std::to_string(value));
}

ApiRequest& ApiRequest::arg(std::string name, std::uint64_t value)
{
    return arg(std::move(name), std::to_string(value));
}

auto ApiRequest::arguments() const -> const std::vector<std::pair<std::string, std::string>>&
{
    return mArguments;
}

ApiRequest& ApiRequest::body(HttpMethod method, RequestBody& body)
{
    mBody = &body;
    mHttpMethod = method;

    return *this;
}

RequestBody* ApiRequest::body() const
{
    return mBody;
}

HttpMethod ApiRequest::httpMethod() const
{
    return mHttpMethod;
}

const std::string& ApiRequest::method() const
{
    return mMethod;
}

HttpRequest ApiClient::build(const ApiRequest& request) const
{
    HttpRequest result;

    result.mBody = request.body();
    result.mMethod = request.httpMethod();
    result.mURL = "https://" + mOptions.mApiHost + "/" + request.method();

    // We always want timestamps rather than formatted dates.
    result.query("timeformat", "timestamp");

    for (auto& argument : request.arguments())
        result.query(argument.first, argument.second);

    configure(result);

    if (mOptions.mAuthenticator)
        mOptions.mAuthenticator->authenticate(result);

    return result;
}

void ApiClient::configure(HttpRequest& request) const
{
    request.mConnectTimeout = mOptions.mConnectTimeout;
    request.mReadTimeout = mOptions.mReadTimeout;
    request.mWriteTimeout = mOptions.mWriteTimeout;
}

ErrorOr<HttpResponse> ApiClient::exchange(HttpRequest& request,
                                          const Canceller& canceller)
{
    auto cacheable = mCache
                     && request.mMethod == HTTP_METHOD_GET
                     && !request.mBody
                     && !request.mConsumer;

    if (!cacheable)
        return mTransport->execute(request, canceller);

    // Responses are only shared between requests with the same credentials.
    auto key = request.mURL;

    if (auto* authorization = findHeader(request.mHeaders, "Authorization"))
        key.append("\n").append(*authorization);

    if (auto response = mCache->get(key))
    {
        LOG_verbose << "Cache hit: " << request.mURL.substr(0, request.mURL.find('?'));
        return std::move(*response);
    }

    auto response = mTransport->execute(request, canceller);

    if (response)
        mCache->put(key, *response);

    return response;
}

ApiClient::ApiClient(const ApiServiceOptions& options,
                     ResponseCachePtr cache,
                     HttpTransportPtr transport)
  : mOptions(options)
  , mCache(std::move(cache))
  , mTransport(std::move(transport))
{
    // Sanity.
    assert(mTransport);
}

ErrorOr<std::string> ApiClient::call(const ApiRequest& request,
                                     const Canceller& canceller)
{
    // Requests with a streamed body can't be replayed.
    auto retryable = !request.body();

    while (true)
    {
        auto httpRequest = build(request);

        auto response = exchange(httpRequest, canceller);

        if (!response)
            return unexpected(std::move(response).error());

        if (!response->successful())
            return unexpected(apiError(response->mStatus,
                                       format("%s failed with HTTP status %d",
                                              request.method().c_str(),
                                              response->mStatus)));

        auto result = decodeResult(response->mBody);

        if (!result)
            return unexpected(std::move(result).error());

        auto code = result->first;

        if (code == API_OK)
            return std::move(response->mBody);

        LOG_debug << request.method() << " failed: " << code << ": " << result->second;

        // Give the authenticator a chance to refresh our credentials.
        if (retryable
            && isAuthenticationFailure(code)
            && mOptions.mAuthenticator
            && mOptions.mAuthenticator->refresh())
        {
            retryable = false;
            continue;
        }

        return unexpected(apiError(code, std::move(result->second)));
    }
}

ErrorOr<HttpResponse> ApiClient::fetch(const std::string& url,
                                       ResponseConsumer& consumer,
                                       const Canceller& canceller)
{
    HttpRequest request;

    request.mConsumer = &consumer;
    request.mMethod = HTTP_METHOD_GET;
    request.mURL = url;

    configure(request);

    return mTransport->execute(request, canceller);
}

ErrorOr<RemoteEntryPtr> ApiClient::decodeEntry(const std::string& reply)
{
    RemoteEntryPtr entry;

    auto found = member(reply, "metadata", [&](JSON& json) {
        // Uploads describe their files in an array.
        json.enterarray();

        entry = parseEntry(json);

        return entry != nullptr;
    });

    if (!found || !entry)
        return unexpected(malformed("missing or invalid metadata"));

    return entry;
}

ErrorOr<RemoteFile> ApiClient::decodeFile(const std::string& reply)
{
    auto entry = decodeEntry(reply);

    if (!entry)
        return unexpected(std::move(entry).error());

    if ((*entry)->isFolder())
        return unexpected(malformed("expected a file"));

    return static_cast<const RemoteFile&>(**entry);
}

ErrorOr<FileLink> ApiClient::decodeFileLink(const std::string& reply)
{
    FileLink link;
    std::vector<std::string> hosts;
    std::string path;

    JSON json(reply);

    if (!json.enterobject())
        return unexpected(malformed("expected an object"));

    for (auto key = json.getname(); !key.empty(); key = json.getname())
    {
        auto parsed = true;

        if (key == "expires")
        {
            parsed = json.getint(link.mExpires);
        }
        else if (key == "hosts")
        {
            parsed = json.enterarray();

            for (std::string host; parsed && json.storestring(host); )
                hosts.emplace_back(std::move(host));

            parsed = parsed && json.leavearray();
        }
        else if (key == "path")
        {
            parsed = json.storestring(path);
        }
        else
        {
            parsed = json.storeobject();
        }

        if (!parsed)
            return unexpected(malformed("invalid link"));
    }

    if (hosts.empty() || path.empty())
        return unexpected(malformed("link has no hosts"));

    for (auto& host : hosts)
        link.mURLs.emplace_back("https://" + host + path);

    return link;
}

ErrorOr<RemoteFolder> ApiClient::decodeFolder(const std::string& reply)
{
    auto entry = decodeEntry(reply);

    if (!entry)
        return unexpected(std::move(entry).error());

    if (!(*entry)->isFolder())
        return unexpected(malformed("expected a folder"));

    return static_cast<const RemoteFolder&>(**entry);
}

ErrorOr<std::pair<int, std::string>> ApiClient::decodeResult(const std::string& reply)
{
    JSON json(reply);

    if (!json.enterobject())
        return unexpected(malformed("expected an object"));

    std::int64_t code = -1;
    std::string message;
    bool found = false;

    for (auto key = json.getname(); !key.empty(); key = json.getname())
    {
        auto parsed = true;

        if (key == "result")
            parsed = found = json.getint(code);
        else if (key == "error")
            parsed = json.storestring(message);
        else
            parsed = json.storeobject();

        if (!parsed)
            return unexpected(malformed("invalid member"));
    }

    if (!found)
        return unexpected(malformed("no result"));

    return std::make_pair(static_cast<int>(code), std::move(message));
}

ErrorOr<UserInfo> ApiClient::decodeUserInfo(const std::string& reply)
{
    JSON json(reply);

    if (!json.enterobject())
        return unexpected(malformed("expected an object"));

    UserInfo info;

    auto getuint = [&json](std::uint64_t& value) {
        std::int64_t number;

        if (!json.getint(number) || number < 0)
            return false;

        value = static_cast<std::uint64_t>(number);

        return true;
    }; // getuint

    for (auto key = json.getname(); !key.empty(); key = json.getname())
    {
        auto parsed = true;

        if (key == "email")
            parsed = json.storestring(info.mEmail);
        else if (key == "emailverified")
            parsed = json.getbool(info.mEmailVerified);
        else if (key == "premium")
            parsed = json.getbool(info.mPremium);
        else if (key == "quota")
            parsed = getuint(info.mTotalQuota);
        else if (key == "usedquota")
            parsed = getuint(info.mUsedQuota);
        else if (key == "userid")
            parsed = getuint(info.mUserID);
        else
            parsed = json.storeobject();

        if (!parsed)
            return unexpected(malformed("invalid user info"));
    }

    return info;
}

} // clouddrive
