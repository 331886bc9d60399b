#include <filesystem>
#include <fstream>

#include <clouddrive/data_sink.h>
#include <clouddrive/logging.h>

namespace clouddrive
{

namespace fs = std::filesystem;

class BufferSink::Writer
  : public DataWriter
{
    std::string mContent;

    // Kept alive until we're done with it.
    BufferSinkPtr mSink;

public:
    explicit Writer(BufferSinkPtr sink)
      : DataWriter()
      , mContent()
      , mSink(std::move(sink))
    {
    }

    Error finish() override
    {
        mSink->commit(std::move(mContent));

        return Error();
    }

    Error write(const void* buffer, std::size_t length) override
    {
        mContent.append(static_cast<const char*>(buffer), length);

        return Error();
    }
}; // Writer

class FileWriter
  : public DataWriter
{
    // Has the content been moved into place?
    bool mFinished;

    // Where is the content ultimately stored?
    std::string mPath;

    // Where is the content stored while it's being received?
    std::string mPartialPath;

    std::ofstream mStream;

public:
    FileWriter(std::string path, std::string partialPath, std::ofstream stream)
      : DataWriter()
      , mFinished(false)
      , mPath(std::move(path))
      , mPartialPath(std::move(partialPath))
      , mStream(std::move(stream))
    {
    }

    ~FileWriter()
    {
        if (mFinished)
            return;

        mStream.close();

        std::error_code result;

        // Remove any partial content.
        if (!fs::remove(mPartialPath, result) && result)
            LOG_warn << "Couldn't remove " << mPartialPath << ": " << result;
    }

    Error finish() override
    {
        mStream.close();

        if (mStream.fail())
            return Error(ERROR_KIND_TRANSPORT,
                         LOCAL_EWRITE,
                         "Couldn't flush " + mPartialPath);

        std::error_code result;

        fs::rename(mPartialPath, mPath, result);

        if (result)
        {
            LOG_err << "Couldn't move " << mPartialPath << " to " << mPath << ": " << result;

            return Error(ERROR_KIND_TRANSPORT,
                         LOCAL_EWRITE,
                         "Couldn't move content into " + mPath);
        }

        mFinished = true;

        return Error();
    }

    Error write(const void* buffer, std::size_t length) override
    {
        mStream.write(static_cast<const char*>(buffer),
                      static_cast<std::streamsize>(length));

        if (!mStream)
            return Error(ERROR_KIND_TRANSPORT,
                         LOCAL_EWRITE,
                         "Couldn't write to " + mPartialPath);

        return Error();
    }
}; // FileWriter

class FileSink
  : public DataSink
{
    std::string mPath;

protected:
    ErrorOr<DataWriterPtr> doOpen(m_off_t) override
    {
        auto partialPath = mPath + ".part";

        std::ofstream stream(partialPath, std::ios::binary | std::ios::trunc);

        if (!stream)
        {
            LOG_err << "Couldn't open " << partialPath << " for writing";

            return unexpected(Error(ERROR_KIND_TRANSPORT,
                                    LOCAL_EWRITE,
                                    "Couldn't open " + partialPath));
        }

        return DataWriterPtr(new FileWriter(mPath,
                                            std::move(partialPath),
                                            std::move(stream)));
    }

public:
    explicit FileSink(std::string path)
      : DataSink()
      , mPath(std::move(path))
    {
    }
}; // FileSink

DataSink::DataSink()
  : mOpened(false)
{
}

ErrorOr<DataWriterPtr> DataSink::open(m_off_t contentLength)
{
    // Sinks can only be written once.
    if (mOpened.exchange(true))
        return unexpected(stateError(LOCAL_EWRITE,
                                     "Sink has already been written"));

    return doOpen(contentLength);
}

bool DataSink::opened() const
{
    return mOpened;
}

DataSinkPtr DataSink::toFile(std::string path)
{
    return std::make_shared<FileSink>(std::move(path));
}

void BufferSink::commit(std::string content)
{
    std::lock_guard<std::mutex> guard(mLock);

    mContent = std::move(content);
    mFinished = true;
}

ErrorOr<DataWriterPtr> BufferSink::doOpen(m_off_t contentLength)
{
    std::lock_guard<std::mutex> guard(mLock);

    mDeclaredLength = contentLength;

    auto self = std::static_pointer_cast<BufferSink>(shared_from_this());

    return DataWriterPtr(new Writer(std::move(self)));
}

BufferSink::BufferSink()
  : DataSink()
  , mContent()
  , mDeclaredLength(UNKNOWN_LENGTH)
  , mFinished(false)
  , mLock()
{
}

std::string BufferSink::content() const
{
    std::lock_guard<std::mutex> guard(mLock);

    return mContent;
}

m_off_t BufferSink::declaredLength() const
{
    std::lock_guard<std::mutex> guard(mLock);

    return mDeclaredLength;
}

bool BufferSink::finished() const
{
    std::lock_guard<std::mutex> guard(mLock);

    return mFinished;
}

} // clouddrive
