#include <cctype>
#include <cerrno>
#include <cstdlib>

#include <clouddrive/remote_entry.h>

namespace clouddrive
{

const DownloadOptions DownloadOptions::DEFAULT;

std::string RemoteFile::id() const
{
    return fileEntryID(mFileID);
}

bool RemoteFile::isFolder() const
{
    return false;
}

std::string RemoteFolder::id() const
{
    return folderEntryID(mFolderID);
}

bool RemoteFolder::isFolder() const
{
    return true;
}

const std::string& FileLink::bestUrl() const
{
    static const std::string none;

    if (mURLs.empty())
        return none;

    return mURLs.front();
}

std::string fileEntryID(handle id)
{
    return "f" + std::to_string(id);
}

std::string folderEntryID(handle id)
{
    return "d" + std::to_string(id);
}

std::optional<EntryID> parseEntryID(const std::string& id)
{
    // Too short to be an identifier.
    if (id.size() < 2)
        return std::nullopt;

    if (id[0] != 'd' && id[0] != 'f')
        return std::nullopt;

    // Only digits may follow the prefix.
    for (auto i = id.begin() + 1; i != id.end(); ++i)
    {
        if (!std::isdigit(static_cast<unsigned char>(*i)))
            return std::nullopt;
    }

    errno = 0;

    auto value = std::strtoull(id.c_str() + 1, nullptr, 10);

    if (errno == ERANGE)
        return std::nullopt;

    EntryID result;

    result.mFolder = id[0] == 'd';
    result.mID = static_cast<handle>(value);

    return result;
}

} // clouddrive
