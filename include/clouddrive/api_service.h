#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <clouddrive/api_client.h>
#include <clouddrive/api_service_options.h>
#include <clouddrive/call.h>
#include <clouddrive/connection_pool.h>
#include <clouddrive/data_sink.h>
#include <clouddrive/data_source.h>
#include <clouddrive/dispatcher.h>
#include <clouddrive/progress_listener.h>
#include <clouddrive/remote_entry.h>
#include <clouddrive/response_cache.h>
#include <clouddrive/transfer.h>

namespace clouddrive
{

// Resources that can be shared between services.
struct HttpClient
{
    // May be null.
    ResponseCachePtr mCache;

    ConnectionPoolPtr mConnectionPool;

    DispatcherPtr mDispatcher;
}; // HttpClient

class ApiService;

using ApiServicePtr = std::unique_ptr<ApiService>;

// Exposes the remote's operations as calls.
//
// Services are immutable and safe to share between threads. Every
// operation validates its arguments immediately, throwing
// std::invalid_argument if they're unacceptable, and returns a call
// that hasn't been started.
class ApiService
{
public:
    // Assembles a service from a set of options.
    //
    // Builders are values: copying a builder copies its configuration.
    class Builder
    {
        friend class ApiService;

        Builder(const HttpClient& client, const ApiServiceOptions& options);

        HttpClient mClient;
        ApiServiceOptions mOptions;

    public:
        Builder();

        Builder& apiHost(std::string host);

        Builder& authenticator(AuthenticatorPtr authenticator);

        // Null disables caching.
        Builder& cache(ResponseCachePtr cache);

        Builder& callbackExecutor(CallbackExecutorPtr executor);

        Builder& connectionPool(ConnectionPoolPtr pool);

        Builder& connectTimeout(std::chrono::milliseconds timeout);

        Builder& dispatcher(DispatcherPtr dispatcher);

        Builder& progressCallbackThreshold(m_off_t bytes);

        Builder& readTimeout(std::chrono::milliseconds timeout);

        Builder& transport(HttpTransportPtr transport);

        Builder& userAgent(std::string userAgent);

        // Use another service's pooled resources.
        Builder& withClient(const HttpClient& client);

        Builder& writeTimeout(std::chrono::milliseconds timeout);

        const HttpClient& client() const;

        const ApiServiceOptions& options() const;

        // Create a new service.
        //
        // A new pool and dispatcher are created if none were specified.
        ApiServicePtr create() const;
    }; // Builder

private:
    ApiService(const HttpClient& client,
               const ApiServiceOptions& options);

    // Instantiate a call that performs operation.
    template<typename T, typename Operation>
    Call<T> newCall(std::string description, Operation operation);

    // Describes how transfers should report their progress.
    ProgressOptions progress(ProgressListenerPtr listener) const;

    // Operations shared by several methods.
    Call<bool> deleteCall(ApiRequest request);
    Call<RemoteEntryPtr> entryCall(ApiRequest request);
    Call<RemoteFile> fileCall(ApiRequest request);
    Call<RemoteFolder> folderCall(ApiRequest request);

    ApiClientPtr mApiClient;

    // Calls created by this service.
    std::vector<CallContextBaseWeakPtr> mCalls;

    // Effective resources, including any defaults we created.
    HttpClient mClient;

    // Serializes access to mCalls and mShutdown.
    mutable std::mutex mLock;

    // Options as specified by our builder.
    ApiServiceOptions mOptions;

    // Has this service been shut down?
    bool mShutdown;

public:
    ApiService(const ApiService& other) = delete;

    ~ApiService();

    ApiService& operator=(const ApiService& rhs) = delete;

    // Retrieve a builder with no configuration.
    static Builder builder();

    // Retrieve a builder with this service's configuration.
    Builder newBuilder() const;

    // Which resources does this service use?
    const HttpClient& client() const;

    const ApiServiceOptions& options() const;

    bool isShutdown() const;

    // Cancel every call this service created and release its resources.
    //
    // Resources shared with other services are released for those
    // services too.
    void shutdown();

    Call<RemoteFolder> listFolder(handle folderID, bool recursive = false);

    Call<RemoteEntryPtrVector> listFiles(const RemoteFolder& folder);

    Call<RemoteFolder> createFolder(handle parentFolderID, const std::string& name);

    Call<RemoteFolder> createFolder(const RemoteFolder& parent, const std::string& name);

    Call<bool> deleteFolder(handle folderID, bool recursive = false);

    Call<bool> deleteFolder(const RemoteFolder& folder, bool recursive = false);

    Call<RemoteFolder> renameFolder(handle folderID, const std::string& name);

    Call<RemoteFolder> renameFolder(const RemoteFolder& folder, const std::string& name);

    Call<RemoteFolder> moveFolder(handle folderID, handle toFolderID);

    Call<RemoteFolder> moveFolder(const RemoteFolder& folder, const RemoteFolder& toFolder);

    Call<RemoteFolder> copyFolder(handle folderID,
                                  handle toFolderID,
                                  bool overwrite = false);

    Call<RemoteFolder> copyFolder(const RemoteFolder& folder,
                                  const RemoteFolder& toFolder,
                                  bool overwrite = false);

    Call<RemoteFile> createFile(handle folderID,
                                const std::string& name,
                                DataSourcePtr source,
                                std::optional<m_time_t> modified = std::nullopt,
                                ProgressListenerPtr listener = nullptr);

    Call<RemoteFile> createFile(const RemoteFolder& folder,
                                const std::string& name,
                                DataSourcePtr source,
                                std::optional<m_time_t> modified = std::nullopt,
                                ProgressListenerPtr listener = nullptr);

    Call<bool> deleteFile(handle fileID);

    Call<bool> deleteFile(const RemoteFile& file);

    Call<FileLink> createFileLink(handle fileID,
                                  const DownloadOptions& options = DownloadOptions::DEFAULT);

    Call<FileLink> createFileLink(const RemoteFile& file,
                                  const DownloadOptions& options = DownloadOptions::DEFAULT);

    Call<std::uint64_t> download(const FileLink& link,
                                 DataSinkPtr sink,
                                 ProgressListenerPtr listener = nullptr);

    Call<std::uint64_t> download(const RemoteFile& file,
                                 DataSinkPtr sink,
                                 ProgressListenerPtr listener = nullptr);

    // Download into memory and yield the content.
    Call<std::string> downloadContent(const FileLink& link,
                                      ProgressListenerPtr listener = nullptr);

    Call<std::string> downloadContent(const RemoteFile& file,
                                      ProgressListenerPtr listener = nullptr);

    Call<RemoteFile> copyFile(handle fileID,
                              handle toFolderID,
                              bool overwrite = false);

    Call<RemoteFile> copyFile(const RemoteFile& file,
                              const RemoteFolder& toFolder,
                              bool overwrite = false);

    Call<RemoteFile> moveFile(handle fileID, handle toFolderID);

    Call<RemoteFile> moveFile(const RemoteFile& file, const RemoteFolder& toFolder);

    Call<RemoteFile> renameFile(handle fileID, const std::string& name);

    Call<RemoteFile> renameFile(const RemoteFile& file, const std::string& name);

    Call<RemoteEntryPtr> copy(const std::string& id,
                              handle toFolderID,
                              bool overwrite = false);

    Call<RemoteEntryPtr> copy(const RemoteEntry& entry,
                              const RemoteFolder& toFolder,
                              bool overwrite = false);

    Call<RemoteEntryPtr> move(const std::string& id, handle toFolderID);

    Call<RemoteEntryPtr> move(const RemoteEntry& entry, const RemoteFolder& toFolder);

    Call<RemoteEntryPtr> rename(const std::string& id, const std::string& name);

    Call<RemoteEntryPtr> rename(const RemoteEntry& entry, const std::string& name);

    Call<bool> deleteEntry(const std::string& id);

    Call<bool> deleteEntry(const RemoteEntry& entry);

    Call<UserInfo> getUserInfo();
}; // ApiService

} // clouddrive
