#include <algorithm>
#include <cassert>

#include <clouddrive/common/utility.h>
#include <clouddrive/logging.h>
#include <clouddrive/transfer.h>

namespace clouddrive
{

using common::format;

UploadBody::UploadBody(DataReaderPtr reader,
                       m_off_t length,
                       const ProgressOptions& options,
                       const Canceller& canceller)
  : RequestBody()
  , mLength(length)
  , mRead(0)
  , mReader(std::move(reader))
  , mReporter(options.mListener,
              options.mExecutor,
              canceller,
              options.mThreshold,
              length)
{
    // Sanity.
    assert(mReader);
}

m_off_t UploadBody::contentLength() const
{
    return mLength;
}

Error UploadBody::complete()
{
    // Make sure the source hasn't got anything left to give.
    if (mLength >= 0)
    {
        char probe;

        auto result = mReader->read(&probe, sizeof(probe));

        if (!result)
            return result.error();

        if (*result)
            return integrityError(format("Source produced more than the %lld byte(s) it declared",
                                         static_cast<long long>(mLength)));
    }

    mReporter.finish();

    return Error();
}

ErrorOr<std::size_t> UploadBody::read(void* buffer, std::size_t length)
{
    length = std::min(length, UPLOAD_CHUNK_SIZE);

    // Don't read past the declared length.
    if (mLength >= 0)
        length = static_cast<std::size_t>(std::min<m_off_t>(static_cast<m_off_t>(length),
                                                            mLength - mRead));

    // Source has produced everything it promised.
    if (!length)
        return std::size_t(0);

    auto result = mReader->read(buffer, length);

    if (!result)
        return result;

    auto count = static_cast<m_off_t>(*result);

    // Source ran dry before producing everything it promised.
    if (!count && mLength >= 0)
        return unexpected(integrityError(format("Source produced %lld of the %lld byte(s) it declared",
                                                static_cast<long long>(mRead),
                                                static_cast<long long>(mLength))));

    mRead += count;

    mReporter.advance(count);

    return result;
}

m_off_t UploadBody::transferred() const
{
    return mRead;
}

DownloadConsumer::DownloadConsumer(DataSinkPtr sink,
                                   const ProgressOptions& options,
                                   const Canceller& canceller)
  : ResponseConsumer()
  , mCanceller(canceller)
  , mLength(UNKNOWN_LENGTH)
  , mOptions(options)
  , mReporter()
  , mSink(std::move(sink))
  , mWritten(0)
  , mWriter()
{
    // Sanity.
    assert(mSink);
}

Error DownloadConsumer::begin(int status,
                              const HttpHeaders&,
                              m_off_t contentLength)
{
    // The remote didn't give us the content.
    if (status < 200 || status >= 300)
        return apiError(status, format("Download failed with HTTP status %d", status));

    auto writer = mSink->open(contentLength);

    if (!writer)
        return writer.error();

    mLength = contentLength;
    mWriter = std::move(writer).value();

    mReporter.emplace(mOptions.mListener,
                      mOptions.mExecutor,
                      mCanceller,
                      mOptions.mThreshold,
                      contentLength);

    return Error();
}

Error DownloadConsumer::end()
{
    // Sanity.
    assert(mWriter);

    if (mLength >= 0 && mWritten != mLength)
        return integrityError(format("Received %lld of the %lld byte(s) declared",
                                     static_cast<long long>(mWritten),
                                     static_cast<long long>(mLength)));

    auto result = mWriter->finish();

    if (!result.ok())
        return result;

    // Release the sink's resources.
    mWriter.reset();

    mReporter->finish();

    return Error();
}

Error DownloadConsumer::write(const void* buffer, std::size_t length)
{
    // Sanity.
    assert(mWriter);

    auto count = static_cast<m_off_t>(length);

    if (mLength >= 0 && mWritten + count > mLength)
        return integrityError(format("Received more than the %lld byte(s) declared",
                                     static_cast<long long>(mLength)));

    auto result = mWriter->write(buffer, length);

    if (!result.ok())
        return result;

    mWritten += count;

    mReporter->advance(count);

    return Error();
}

m_off_t DownloadConsumer::transferred() const
{
    return mWritten;
}

} // clouddrive
