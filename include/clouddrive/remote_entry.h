#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <clouddrive/types.h>

namespace clouddrive
{

class RemoteEntry;

using RemoteEntryPtr = std::shared_ptr<RemoteEntry>;
using RemoteEntryPtrVector = std::vector<RemoteEntryPtr>;

// Describes a file or a folder stored on the remote.
class RemoteEntry
{
protected:
    RemoteEntry() = default;

public:
    RemoteEntry(const RemoteEntry& other) = default;

    virtual ~RemoteEntry() = default;

    RemoteEntry& operator=(const RemoteEntry& rhs) = default;

    // "d<folder>" for folders, "f<file>" for files.
    virtual std::string id() const = 0;

    virtual bool isFolder() const = 0;

    std::string mName;

    // Which folder contains this entry?
    handle mParentFolderID = ROOT_FOLDER_ID;

    m_time_t mCreated = 0;
    m_time_t mModified = 0;
}; // RemoteEntry

class RemoteFile
  : public RemoteEntry
{
public:
    std::string id() const override;

    bool isFolder() const override;

    std::string mContentType;

    handle mFileID = 0;

    std::string mHash;

    m_off_t mSize = 0;
}; // RemoteFile

class RemoteFolder
  : public RemoteEntry
{
public:
    std::string id() const override;

    bool isFolder() const override;

    // Empty unless the folder's content was listed.
    RemoteEntryPtrVector mChildren;

    handle mFolderID = ROOT_FOLDER_ID;
}; // RemoteFolder

// Where a file's content can be downloaded from.
struct FileLink
{
    // Which URL should we download from?
    const std::string& bestUrl() const;

    // When do the URLs stop working?
    m_time_t mExpires = 0;

    // One URL per host, best first.
    std::vector<std::string> mURLs;
}; // FileLink

struct DownloadOptions
{
    static const DownloadOptions DEFAULT;

    // Override the content's type.
    std::string mContentType;

    // Ask the remote to serve the content as an attachment.
    bool mForceDownload = false;

    // Leave the file's name out of the link.
    bool mSkipFilename = false;
}; // DownloadOptions

struct UserInfo
{
    std::string mEmail;
    bool mEmailVerified = false;
    bool mPremium = false;
    std::uint64_t mTotalQuota = 0;
    std::uint64_t mUsedQuota = 0;
    std::uint64_t mUserID = 0;
}; // UserInfo

// A parsed entry identifier.
struct EntryID
{
    handle mID = 0;
    bool mFolder = false;
}; // EntryID

std::string fileEntryID(handle id);

std::string folderEntryID(handle id);

// Parse "d<digits>" or "f<digits>".
std::optional<EntryID> parseEntryID(const std::string& id);

} // clouddrive
