#include <algorithm>
#include <stdexcept>
#include <utility>

#include <clouddrive/api_service.h>
#include <clouddrive/common/utility.h>
#include <clouddrive/logging.h>
#include <clouddrive/posix/curl_transport.h>

namespace clouddrive
{

using common::format;

static EntryID entryID(const std::string& id)
{
    auto result = parseEntryID(id);

    if (!result)
        throw std::invalid_argument("Invalid entry identifier: \"" + id + "\"");

    return *result;
}

static void requireName(const std::string& name)
{
    if (name.empty())
        throw std::invalid_argument("Name can't be empty");
}

template<typename T>
static void requireNotNull(const T& pointer, const char* what)
{
    if (!pointer)
        throw std::invalid_argument(format("%s can't be null", what));
}

static void requireTimeout(std::chrono::milliseconds timeout)
{
    if (timeout.count() < 0)
        throw std::invalid_argument("Timeouts can't be negative");
}

static ApiRequest copyFileRequest(handle fileID, handle toFolderID, bool overwrite)
{
    ApiRequest request("copyfile");

    request.arg("fileid", fileID).arg("tofolderid", toFolderID);

    if (!overwrite)
        request.arg("noover", "1");

    return request;
}

static ApiRequest copyFolderRequest(handle folderID, handle toFolderID, bool overwrite)
{
    ApiRequest request("copyfolder");

    request.arg("folderid", folderID).arg("tofolderid", toFolderID);

    if (!overwrite)
        request.arg("noover", "1");

    return request;
}

static ApiRequest deleteFileRequest(handle fileID)
{
    ApiRequest request("deletefile");

    request.arg("fileid", fileID);

    return request;
}

static ApiRequest deleteFolderRequest(handle folderID, bool recursive)
{
    ApiRequest request(recursive ? "deletefolderrecursive" : "deletefolder");

    request.arg("folderid", folderID);

    return request;
}

static ApiRequest moveFileRequest(handle fileID, handle toFolderID)
{
    ApiRequest request("renamefile");

    request.arg("fileid", fileID).arg("tofolderid", toFolderID);

    return request;
}

static ApiRequest moveFolderRequest(handle folderID, handle toFolderID)
{
    ApiRequest request("renamefolder");

    request.arg("folderid", folderID).arg("tofolderid", toFolderID);

    return request;
}

static ApiRequest renameFileRequest(handle fileID, const std::string& name)
{
    requireName(name);

    ApiRequest request("renamefile");

    request.arg("fileid", fileID).arg("toname", name);

    return request;
}

static ApiRequest renameFolderRequest(handle folderID, const std::string& name)
{
    requireName(name);

    ApiRequest request("renamefolder");

    request.arg("folderid", folderID).arg("toname", name);

    return request;
}

static ApiRequest fileLinkRequest(handle fileID, const DownloadOptions& options)
{
    ApiRequest request("getfilelink");

    request.arg("fileid", fileID);

    if (!options.mContentType.empty())
        request.arg("contenttype", options.mContentType);

    if (options.mForceDownload)
        request.arg("forcedownload", "1");

    if (options.mSkipFilename)
        request.arg("skipfilename", "1");

    return request;
}

// Stream the content at url into sink.
static ErrorOr<std::uint64_t> fetch(ApiClient& client,
                                    const std::string& url,
                                    DataSinkPtr sink,
                                    const ProgressOptions& options,
                                    const Canceller& canceller)
{
    DownloadConsumer consumer(std::move(sink), options, canceller);

    auto response = client.fetch(url, consumer, canceller);

    if (!response)
        return unexpected(std::move(response).error());

    return static_cast<std::uint64_t>(consumer.transferred());
}

static ErrorOr<std::string> fetchContent(ApiClient& client,
                                         const std::string& url,
                                         const ProgressOptions& options,
                                         const Canceller& canceller)
{
    auto sink = std::make_shared<BufferSink>();

    auto transferred = fetch(client, url, sink, options, canceller);

    if (!transferred)
        return unexpected(std::move(transferred).error());

    return sink->content();
}

// Ask the remote where a file's content can be downloaded from.
static ErrorOr<std::string> locate(ApiClient& client,
                                   const ApiRequest& request,
                                   const Canceller& canceller)
{
    auto reply = client.call(request, canceller);

    if (!reply)
        return unexpected(std::move(reply).error());

    auto link = ApiClient::decodeFileLink(*reply);

    if (!link)
        return unexpected(std::move(link).error());

    return link->bestUrl();
}

ApiService::Builder::Builder(const HttpClient& client,
                             const ApiServiceOptions& options)
  : mClient(client)
  , mOptions(options)
{
}

ApiService::Builder::Builder()
  : mClient()
  , mOptions()
{
}

auto ApiService::Builder::apiHost(std::string host) -> Builder&
{
    requireName(host);

    mOptions.mApiHost = std::move(host);

    return *this;
}

auto ApiService::Builder::authenticator(AuthenticatorPtr authenticator) -> Builder&
{
    mOptions.mAuthenticator = std::move(authenticator);

    return *this;
}

auto ApiService::Builder::cache(ResponseCachePtr cache) -> Builder&
{
    mClient.mCache = std::move(cache);

    return *this;
}

auto ApiService::Builder::callbackExecutor(CallbackExecutorPtr executor) -> Builder&
{
    requireNotNull(executor, "Callback executor");

    mOptions.mCallbackExecutor = std::move(executor);

    return *this;
}

auto ApiService::Builder::connectionPool(ConnectionPoolPtr pool) -> Builder&
{
    requireNotNull(pool, "Connection pool");

    mClient.mConnectionPool = std::move(pool);

    return *this;
}

auto ApiService::Builder::connectTimeout(std::chrono::milliseconds timeout) -> Builder&
{
    requireTimeout(timeout);

    mOptions.mConnectTimeout = timeout;

    return *this;
}

auto ApiService::Builder::dispatcher(DispatcherPtr dispatcher) -> Builder&
{
    requireNotNull(dispatcher, "Dispatcher");

    mClient.mDispatcher = std::move(dispatcher);

    return *this;
}

auto ApiService::Builder::progressCallbackThreshold(m_off_t bytes) -> Builder&
{
    if (bytes <= 0)
        throw std::invalid_argument("Progress threshold must be positive");

    mOptions.mProgressThreshold = bytes;

    return *this;
}

auto ApiService::Builder::readTimeout(std::chrono::milliseconds timeout) -> Builder&
{
    requireTimeout(timeout);

    mOptions.mReadTimeout = timeout;

    return *this;
}

auto ApiService::Builder::transport(HttpTransportPtr transport) -> Builder&
{
    requireNotNull(transport, "Transport");

    mOptions.mTransport = std::move(transport);

    return *this;
}

auto ApiService::Builder::userAgent(std::string userAgent) -> Builder&
{
    mOptions.mUserAgent = std::move(userAgent);

    return *this;
}

auto ApiService::Builder::withClient(const HttpClient& client) -> Builder&
{
    requireNotNull(client.mConnectionPool, "Connection pool");
    requireNotNull(client.mDispatcher, "Dispatcher");

    mClient = client;

    return *this;
}

auto ApiService::Builder::writeTimeout(std::chrono::milliseconds timeout) -> Builder&
{
    requireTimeout(timeout);

    mOptions.mWriteTimeout = timeout;

    return *this;
}

const HttpClient& ApiService::Builder::client() const
{
    return mClient;
}

const ApiServiceOptions& ApiService::Builder::options() const
{
    return mOptions;
}

ApiServicePtr ApiService::Builder::create() const
{
    auto client = mClient;
    auto options = mOptions;

    if (!client.mConnectionPool)
        client.mConnectionPool = std::make_shared<ConnectionPool>();

    if (!client.mDispatcher)
        client.mDispatcher = std::make_shared<Dispatcher>();

    if (!options.mCallbackExecutor)
        options.mCallbackExecutor = inlineExecutor();

    return ApiServicePtr(new ApiService(client, options));
}

ApiService::ApiService(const HttpClient& client,
                       const ApiServiceOptions& options)
  : mApiClient()
  , mCalls()
  , mClient(client)
  , mLock()
  , mOptions(options)
  , mShutdown(false)
{
    auto transport = mOptions.mTransport;

    // Use libcurl unless we've been told otherwise.
    if (!transport)
        transport = std::make_shared<CurlTransport>(mClient.mConnectionPool,
                                                    mOptions.mUserAgent);

    mApiClient = std::make_shared<ApiClient>(mOptions,
                                             mClient.mCache,
                                             std::move(transport));

    LOG_debug << "Service constructed for " << mOptions.mApiHost;
}

template<typename T, typename Operation>
Call<T> ApiService::newCall(std::string description, Operation operation)
{
    typename CallContext<T>::Operation function = std::move(operation);

    std::lock_guard<std::mutex> guard(mLock);

    // Calls created after shutdown can only fail.
    if (mShutdown)
        function = [](const Canceller&) -> ErrorOr<T> {
            return unexpected(stateError(LOCAL_ESHUTDOWN,
                                         "Service has been shut down"));
        };

    auto call = makeCall<T>(std::move(description),
                            std::move(function),
                            mClient.mDispatcher,
                            mOptions.mCallbackExecutor);

    // Forget about calls that have gone away before we grow.
    if (mCalls.size() == mCalls.capacity())
    {
        auto expired = [](const CallContextBaseWeakPtr& call) {
            return call.expired();
        }; // expired

        mCalls.erase(std::remove_if(mCalls.begin(), mCalls.end(), expired),
                     mCalls.end());
    }

    mCalls.emplace_back(call.context());

    return call;
}

ProgressOptions ApiService::progress(ProgressListenerPtr listener) const
{
    ProgressOptions options;

    options.mExecutor = mOptions.mCallbackExecutor;
    options.mListener = std::move(listener);
    options.mThreshold = mOptions.mProgressThreshold;

    return options;
}

Call<bool> ApiService::deleteCall(ApiRequest request)
{
    auto description = request.method();

    return newCall<bool>(std::move(description),
                         [client = mApiClient, request = std::move(request)](const Canceller& canceller)
                             -> ErrorOr<bool> {
        auto reply = client->call(request, canceller);

        if (!reply)
            return unexpected(std::move(reply).error());

        return true;
    });
}

Call<RemoteEntryPtr> ApiService::entryCall(ApiRequest request)
{
    auto description = request.method();

    return newCall<RemoteEntryPtr>(std::move(description),
                                   [client = mApiClient, request = std::move(request)](const Canceller& canceller)
                                       -> ErrorOr<RemoteEntryPtr> {
        auto reply = client->call(request, canceller);

        if (!reply)
            return unexpected(std::move(reply).error());

        return ApiClient::decodeEntry(*reply);
    });
}

Call<RemoteFile> ApiService::fileCall(ApiRequest request)
{
    auto description = request.method();

    return newCall<RemoteFile>(std::move(description),
                               [client = mApiClient, request = std::move(request)](const Canceller& canceller)
                                   -> ErrorOr<RemoteFile> {
        auto reply = client->call(request, canceller);

        if (!reply)
            return unexpected(std::move(reply).error());

        return ApiClient::decodeFile(*reply);
    });
}

Call<RemoteFolder> ApiService::folderCall(ApiRequest request)
{
    auto description = request.method();

    return newCall<RemoteFolder>(std::move(description),
                                 [client = mApiClient, request = std::move(request)](const Canceller& canceller)
                                     -> ErrorOr<RemoteFolder> {
        auto reply = client->call(request, canceller);

        if (!reply)
            return unexpected(std::move(reply).error());

        return ApiClient::decodeFolder(*reply);
    });
}

ApiService::~ApiService()
{
    LOG_debug << "Service destroyed";
}

auto ApiService::builder() -> Builder
{
    return Builder();
}

auto ApiService::newBuilder() const -> Builder
{
    return Builder(mClient, mOptions);
}

const HttpClient& ApiService::client() const
{
    return mClient;
}

const ApiServiceOptions& ApiService::options() const
{
    return mOptions;
}

bool ApiService::isShutdown() const
{
    std::lock_guard<std::mutex> guard(mLock);

    return mShutdown;
}

void ApiService::shutdown()
{
    std::vector<CallContextBaseWeakPtr> calls;

    {
        std::lock_guard<std::mutex> guard(mLock);

        // Service's already been shut down.
        if (mShutdown)
            return;

        mShutdown = true;

        calls.swap(mCalls);
    }

    LOG_info << "Shutting down service for " << mOptions.mApiHost;

    for (auto& weak : calls)
    {
        if (auto call = weak.lock())
            call->cancel();
    }

    mClient.mDispatcher->shutdown();
    mClient.mConnectionPool->evictAll();

    if (mClient.mCache)
        mClient.mCache->close();
}

Call<RemoteFolder> ApiService::listFolder(handle folderID, bool recursive)
{
    ApiRequest request("listfolder");

    request.arg("folderid", folderID);

    if (recursive)
        request.arg("recursive", "1");

    return folderCall(std::move(request));
}

Call<RemoteEntryPtrVector> ApiService::listFiles(const RemoteFolder& folder)
{
    ApiRequest request("listfolder");

    request.arg("folderid", folder.mFolderID);

    return newCall<RemoteEntryPtrVector>("listfolder",
                                         [client = mApiClient, request = std::move(request)](const Canceller& canceller)
                                             -> ErrorOr<RemoteEntryPtrVector> {
        auto reply = client->call(request, canceller);

        if (!reply)
            return unexpected(std::move(reply).error());

        auto folder = ApiClient::decodeFolder(*reply);

        if (!folder)
            return unexpected(std::move(folder).error());

        RemoteEntryPtrVector files;

        for (auto& child : folder->mChildren)
        {
            if (!child->isFolder())
                files.emplace_back(child);
        }

        return files;
    });
}

Call<RemoteFolder> ApiService::createFolder(handle parentFolderID, const std::string& name)
{
    requireName(name);

    ApiRequest request("createfolder");

    request.arg("folderid", parentFolderID).arg("name", name);

    return folderCall(std::move(request));
}

Call<RemoteFolder> ApiService::createFolder(const RemoteFolder& parent, const std::string& name)
{
    return createFolder(parent.mFolderID, name);
}

Call<bool> ApiService::deleteFolder(handle folderID, bool recursive)
{
    return deleteCall(deleteFolderRequest(folderID, recursive));
}

Call<bool> ApiService::deleteFolder(const RemoteFolder& folder, bool recursive)
{
    return deleteFolder(folder.mFolderID, recursive);
}

Call<RemoteFolder> ApiService::renameFolder(handle folderID, const std::string& name)
{
    return folderCall(renameFolderRequest(folderID, name));
}

Call<RemoteFolder> ApiService::renameFolder(const RemoteFolder& folder, const std::string& name)
{
    return renameFolder(folder.mFolderID, name);
}

Call<RemoteFolder> ApiService::moveFolder(handle folderID, handle toFolderID)
{
    return folderCall(moveFolderRequest(folderID, toFolderID));
}

Call<RemoteFolder> ApiService::moveFolder(const RemoteFolder& folder, const RemoteFolder& toFolder)
{
    return moveFolder(folder.mFolderID, toFolder.mFolderID);
}

Call<RemoteFolder> ApiService::copyFolder(handle folderID,
                                          handle toFolderID,
                                          bool overwrite)
{
    return folderCall(copyFolderRequest(folderID, toFolderID, overwrite));
}

Call<RemoteFolder> ApiService::copyFolder(const RemoteFolder& folder,
                                          const RemoteFolder& toFolder,
                                          bool overwrite)
{
    return copyFolder(folder.mFolderID, toFolder.mFolderID, overwrite);
}

Call<RemoteFile> ApiService::createFile(handle folderID,
                                        const std::string& name,
                                        DataSourcePtr source,
                                        std::optional<m_time_t> modified,
                                        ProgressListenerPtr listener)
{
    requireName(name);
    requireNotNull(source, "Source");

    if (modified && *modified < 0)
        throw std::invalid_argument("Modification time can't be negative");

    ApiRequest request("uploadfile");

    request.arg("folderid", folderID)
           .arg("filename", name)
           .arg("nopartial", "1");

    if (modified)
        request.arg("mtime", static_cast<std::int64_t>(*modified));

    auto operation = [client = mApiClient,
                      options = progress(std::move(listener)),
                      request = std::move(request),
                      source = std::move(source)](const Canceller& canceller) mutable
                         -> ErrorOr<RemoteFile> {
        auto reader = source->open();

        if (!reader)
            return unexpected(std::move(reader).error());

        UploadBody body(std::move(reader).value(),
                        source->contentLength(),
                        options,
                        canceller);

        request.body(HTTP_METHOD_PUT, body);

        auto reply = client->call(request, canceller);

        if (!reply)
            return unexpected(std::move(reply).error());

        auto result = body.complete();

        if (!result.ok())
            return unexpected(std::move(result));

        return ApiClient::decodeFile(*reply);
    }; // operation

    return newCall<RemoteFile>("uploadfile", std::move(operation));
}

Call<RemoteFile> ApiService::createFile(const RemoteFolder& folder,
                                        const std::string& name,
                                        DataSourcePtr source,
                                        std::optional<m_time_t> modified,
                                        ProgressListenerPtr listener)
{
    return createFile(folder.mFolderID,
                      name,
                      std::move(source),
                      modified,
                      std::move(listener));
}

Call<bool> ApiService::deleteFile(handle fileID)
{
    return deleteCall(deleteFileRequest(fileID));
}

Call<bool> ApiService::deleteFile(const RemoteFile& file)
{
    return deleteFile(file.mFileID);
}

Call<FileLink> ApiService::createFileLink(handle fileID, const DownloadOptions& options)
{
    auto request = fileLinkRequest(fileID, options);

    return newCall<FileLink>("getfilelink",
                             [client = mApiClient, request = std::move(request)](const Canceller& canceller)
                                 -> ErrorOr<FileLink> {
        auto reply = client->call(request, canceller);

        if (!reply)
            return unexpected(std::move(reply).error());

        return ApiClient::decodeFileLink(*reply);
    });
}

Call<FileLink> ApiService::createFileLink(const RemoteFile& file, const DownloadOptions& options)
{
    return createFileLink(file.mFileID, options);
}

Call<std::uint64_t> ApiService::download(const FileLink& link,
                                         DataSinkPtr sink,
                                         ProgressListenerPtr listener)
{
    requireNotNull(sink, "Sink");

    if (link.mURLs.empty())
        throw std::invalid_argument("Link has no URLs");

    auto operation = [client = mApiClient,
                      options = progress(std::move(listener)),
                      sink = std::move(sink),
                      url = link.bestUrl()](const Canceller& canceller) {
        return fetch(*client, url, sink, options, canceller);
    }; // operation

    return newCall<std::uint64_t>("download", std::move(operation));
}

Call<std::uint64_t> ApiService::download(const RemoteFile& file,
                                         DataSinkPtr sink,
                                         ProgressListenerPtr listener)
{
    requireNotNull(sink, "Sink");

    auto operation = [client = mApiClient,
                      options = progress(std::move(listener)),
                      request = fileLinkRequest(file.mFileID, DownloadOptions::DEFAULT),
                      sink = std::move(sink)](const Canceller& canceller)
                         -> ErrorOr<std::uint64_t> {
        auto url = locate(*client, request, canceller);

        if (!url)
            return unexpected(std::move(url).error());

        return fetch(*client, *url, sink, options, canceller);
    }; // operation

    return newCall<std::uint64_t>("download", std::move(operation));
}

Call<std::string> ApiService::downloadContent(const FileLink& link,
                                              ProgressListenerPtr listener)
{
    if (link.mURLs.empty())
        throw std::invalid_argument("Link has no URLs");

    auto operation = [client = mApiClient,
                      options = progress(std::move(listener)),
                      url = link.bestUrl()](const Canceller& canceller) {
        return fetchContent(*client, url, options, canceller);
    }; // operation

    return newCall<std::string>("download", std::move(operation));
}

Call<std::string> ApiService::downloadContent(const RemoteFile& file,
                                              ProgressListenerPtr listener)
{
    auto operation = [client = mApiClient,
                      options = progress(std::move(listener)),
                      request = fileLinkRequest(file.mFileID, DownloadOptions::DEFAULT)]
                     (const Canceller& canceller) -> ErrorOr<std::string> {
        auto url = locate(*client, request, canceller);

        if (!url)
            return unexpected(std::move(url).error());

        return fetchContent(*client, *url, options, canceller);
    }; // operation

    return newCall<std::string>("download", std::move(operation));
}

Call<RemoteFile> ApiService::copyFile(handle fileID,
                                      handle toFolderID,
                                      bool overwrite)
{
    return fileCall(copyFileRequest(fileID, toFolderID, overwrite));
}

Call<RemoteFile> ApiService::copyFile(const RemoteFile& file,
                                      const RemoteFolder& toFolder,
                                      bool overwrite)
{
    return copyFile(file.mFileID, toFolder.mFolderID, overwrite);
}

Call<RemoteFile> ApiService::moveFile(handle fileID, handle toFolderID)
{
    return fileCall(moveFileRequest(fileID, toFolderID));
}

Call<RemoteFile> ApiService::moveFile(const RemoteFile& file, const RemoteFolder& toFolder)
{
    return moveFile(file.mFileID, toFolder.mFolderID);
}

Call<RemoteFile> ApiService::renameFile(handle fileID, const std::string& name)
{
    return fileCall(renameFileRequest(fileID, name));
}

Call<RemoteFile> ApiService::renameFile(const RemoteFile& file, const std::string& name)
{
    return renameFile(file.mFileID, name);
}

Call<RemoteEntryPtr> ApiService::copy(const std::string& id,
                                      handle toFolderID,
                                      bool overwrite)
{
    auto entry = entryID(id);

    if (entry.mFolder)
        return entryCall(copyFolderRequest(entry.mID, toFolderID, overwrite));

    return entryCall(copyFileRequest(entry.mID, toFolderID, overwrite));
}

Call<RemoteEntryPtr> ApiService::copy(const RemoteEntry& entry,
                                      const RemoteFolder& toFolder,
                                      bool overwrite)
{
    return copy(entry.id(), toFolder.mFolderID, overwrite);
}

Call<RemoteEntryPtr> ApiService::move(const std::string& id, handle toFolderID)
{
    auto entry = entryID(id);

    if (entry.mFolder)
        return entryCall(moveFolderRequest(entry.mID, toFolderID));

    return entryCall(moveFileRequest(entry.mID, toFolderID));
}

Call<RemoteEntryPtr> ApiService::move(const RemoteEntry& entry, const RemoteFolder& toFolder)
{
    return move(entry.id(), toFolder.mFolderID);
}

Call<RemoteEntryPtr> ApiService::rename(const std::string& id, const std::string& name)
{
    auto entry = entryID(id);

    if (entry.mFolder)
        return entryCall(renameFolderRequest(entry.mID, name));

    return entryCall(renameFileRequest(entry.mID, name));
}

Call<RemoteEntryPtr> ApiService::rename(const RemoteEntry& entry, const std::string& name)
{
    return rename(entry.id(), name);
}

Call<bool> ApiService::deleteEntry(const std::string& id)
{
    auto entry = entryID(id);

    if (entry.mFolder)
        return deleteCall(deleteFolderRequest(entry.mID, false));

    return deleteCall(deleteFileRequest(entry.mID));
}

Call<bool> ApiService::deleteEntry(const RemoteEntry& entry)
{
    return deleteEntry(entry.id());
}

Call<UserInfo> ApiService::getUserInfo()
{
    ApiRequest request("userinfo");

    return newCall<UserInfo>("userinfo",
                             [client = mApiClient, request = std::move(request)](const Canceller& canceller)
                                 -> ErrorOr<UserInfo> {
        auto reply = client->call(request, canceller);

        if (!reply)
            return unexpected(std::move(reply).error());

        return ApiClient::decodeUserInfo(*reply);
    });
}

} // clouddrive
