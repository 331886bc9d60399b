#include <algorithm>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <clouddrive/data_source.h>
#include <clouddrive/logging.h>

namespace clouddrive
{

namespace fs = std::filesystem;

class BytesReader
  : public DataReader
{
    // Shared with our source.
    std::shared_ptr<const std::string> mBytes;
    std::size_t mPosition;

public:
    explicit BytesReader(std::shared_ptr<const std::string> bytes)
      : DataReader()
      , mBytes(std::move(bytes))
      , mPosition(0u)
    {
    }

    ErrorOr<std::size_t> read(void* buffer, std::size_t length) override
    {
        length = std::min(length, mBytes->size() - mPosition);

        std::memcpy(buffer, mBytes->data() + mPosition, length);

        mPosition += length;

        return length;
    }
}; // BytesReader

class BytesSource
  : public DataSource
{
    std::shared_ptr<const std::string> mBytes;

protected:
    ErrorOr<DataReaderPtr> doOpen() override
    {
        return DataReaderPtr(new BytesReader(mBytes));
    }

public:
    explicit BytesSource(std::string bytes)
      : DataSource()
      , mBytes(std::make_shared<const std::string>(std::move(bytes)))
    {
    }

    m_off_t contentLength() const override
    {
        return static_cast<m_off_t>(mBytes->size());
    }
}; // BytesSource

class FileReader
  : public DataReader
{
    std::ifstream mStream;
    std::string mPath;

public:
    FileReader(std::ifstream stream, std::string path)
      : DataReader()
      , mStream(std::move(stream))
      , mPath(std::move(path))
    {
    }

    ErrorOr<std::size_t> read(void* buffer, std::size_t length) override
    {
        mStream.read(static_cast<char*>(buffer),
                     static_cast<std::streamsize>(length));

        if (mStream.bad())
            return unexpected(Error(ERROR_KIND_TRANSPORT,
                                    LOCAL_EREAD,
                                    "Couldn't read from " + mPath));

        return static_cast<std::size_t>(mStream.gcount());
    }
}; // FileReader

class FileSource
  : public DataSource
{
    m_off_t mLength;
    std::string mPath;

protected:
    ErrorOr<DataReaderPtr> doOpen() override
    {
        std::ifstream stream(mPath, std::ios::binary);

        if (!stream)
        {
            LOG_err << "Couldn't open " << mPath << " for reading";

            return unexpected(Error(ERROR_KIND_TRANSPORT,
                                    LOCAL_EREAD,
                                    "Couldn't open " + mPath));
        }

        return DataReaderPtr(new FileReader(std::move(stream), mPath));
    }

public:
    FileSource(std::string path, m_off_t length)
      : DataSource()
      , mLength(length)
      , mPath(std::move(path))
    {
    }

    m_off_t contentLength() const override
    {
        return mLength;
    }
}; // FileSource

DataSource::DataSource()
  : mOpened(false)
{
}

ErrorOr<DataReaderPtr> DataSource::open()
{
    // Sources can only be read once.
    if (mOpened.exchange(true))
        return unexpected(stateError(LOCAL_EREAD,
                                     "Source has already been read"));

    return doOpen();
}

DataSourcePtr DataSource::empty()
{
    return std::make_shared<BytesSource>(std::string());
}

DataSourcePtr DataSource::fromBytes(std::string bytes)
{
    return std::make_shared<BytesSource>(std::move(bytes));
}

DataSourcePtr DataSource::fromFile(const std::string& path)
{
    std::error_code result;

    auto size = fs::file_size(path, result);

    if (result)
        throw std::invalid_argument("Couldn't determine size of " + path
                                    + ": " + result.message());

    return std::make_shared<FileSource>(path, static_cast<m_off_t>(size));
}

} // clouddrive
