#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>

#include <gmock/gmock.h>

#include <clouddrive/http.h>

namespace clouddrive
{
namespace test
{

// Where FakeRemote serves file content from.
extern const std::string CONTENT_HOST;

// An in-memory remote that speaks just enough of the API to exercise
// the service end to end.
class FakeRemote
  : public HttpTransport
{
    struct File
    {
        std::string mContent;
        std::string mContentType;
        m_time_t mCreated;
        m_time_t mModified;
        std::string mName;
        handle mParent;
    }; // File

    struct Folder
    {
        m_time_t mCreated;
        m_time_t mModified;
        std::string mName;
        handle mParent;
    }; // Folder

    using Arguments = std::map<std::string, std::string>;

    // Method handlers.
    std::string copyfile(const Arguments& arguments);
    std::string copyfolder(const Arguments& arguments);
    std::string createfolder(const Arguments& arguments);
    std::string deletefile(const Arguments& arguments);
    std::string deletefolder(const Arguments& arguments, bool recursive);
    std::string getfilelink(const Arguments& arguments);
    std::string listfolder(const Arguments& arguments);
    std::string renamefile(const Arguments& arguments);
    std::string renamefolder(const Arguments& arguments);
    std::string uploadfile(const Arguments& arguments, std::string content);
    std::string userinfo();

    // Serve a file's content to a consumer.
    ErrorOr<HttpResponse> download(HttpRequest& request,
                                   const std::string& path,
                                   const Canceller& canceller);

    // Describe an entry as JSON.
    std::string describeFile(handle id) const;
    std::string describeFolder(handle id, bool contents, bool recursive) const;

    // Does a folder contain an entry with the specified name?
    bool exists(handle parent, const std::string& name) const;

    // Copy a folder and everything below it.
    handle duplicate(handle id, handle parent);

    // Remove a folder and everything below it.
    void purge(handle id, std::size_t& files, std::size_t& folders);

    // Pause the exchange if we've been asked to.
    bool wait(const Canceller& canceller);

    // How many requests must be rejected for bad credentials?
    std::size_t mAuthFailures;

    // Are exchanges currently being held?
    bool mBlocked;

    // How many exchanges are being held?
    std::size_t mBlockedCount;

    // How many bytes are served per write.
    std::size_t mChunkSize;

    std::map<handle, File> mFiles;

    std::map<handle, Folder> mFolders;

    // How many exchanges have been attempted?
    std::atomic<std::size_t> mInvocations;

    mutable std::mutex mLock;

    // Used to wait for exchanges to be held or released.
    std::condition_variable mLockCV;

    handle mNextID;

    // Credentials callers must present, if any.
    std::string mToken;

public:
    FakeRemote();

    // Reject the next count requests as if our credentials had expired.
    void authFailures(std::size_t count);

    // Hold exchanges until release() is called.
    void block();

    void chunkSize(std::size_t size);

    // Retrieve a file's content.
    std::string content(handle id) const;

    ErrorOr<HttpResponse> execute(HttpRequest& request,
                                  const Canceller& canceller) override;

    std::size_t invocations() const;

    void release();

    // Require callers to present token.
    void token(std::string token);

    // Wait until count exchanges are being held.
    bool waitUntilBlocked(std::size_t count = 1);
}; // FakeRemote

// Lets tests inspect the requests a client sends.
class MockTransport
  : public HttpTransport
{
public:
    MOCK_METHOD(ErrorOr<HttpResponse>,
                execute,
                (HttpRequest& request, const Canceller& canceller),
                (override));
}; // MockTransport

// Convenience.
HttpResponse reply(std::string body, int status = 200);

// Extract a query argument from a URL.
std::string queryArgument(const std::string& url, const std::string& name);

} // test
} // clouddrive
