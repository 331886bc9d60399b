#pragma once

#include <cstddef>
#include <optional>

#include <clouddrive/callback_executor.h>
#include <clouddrive/canceller.h>
#include <clouddrive/data_sink.h>
#include <clouddrive/data_source.h>
#include <clouddrive/http.h>
#include <clouddrive/progress_reporter.h>

namespace clouddrive
{

// How much data we read from a source at a time.
constexpr std::size_t UPLOAD_CHUNK_SIZE = 64 * 1024;

// Describes how a transfer should report its progress.
struct ProgressOptions
{
    // Where should notifications be delivered?
    CallbackExecutorPtr mExecutor;

    // Who should be notified? May be null.
    ProgressListenerPtr mListener;

    // Minimum distance between notifications.
    m_off_t mThreshold = 0;
}; // ProgressOptions

// Streams a source's content to the transport.
class UploadBody
  : public RequestBody
{
    // How many bytes did the source promise?
    const m_off_t mLength;

    // How many bytes have we read from the source?
    m_off_t mRead;

    DataReaderPtr mReader;

    ProgressReporter mReporter;

public:
    UploadBody(DataReaderPtr reader,
               m_off_t length,
               const ProgressOptions& options,
               const Canceller& canceller);

    m_off_t contentLength() const override;

    // Called once the exchange has completed.
    //
    // Makes sure the source didn't produce more than it promised and
    // emits the final progress notification.
    Error complete();

    ErrorOr<std::size_t> read(void* buffer, std::size_t length) override;

    // How many bytes have been read from the source?
    m_off_t transferred() const;
}; // UploadBody

// Streams the transport's content into a sink.
class DownloadConsumer
  : public ResponseConsumer
{
    const Canceller& mCanceller;

    // How many bytes did the remote promise?
    m_off_t mLength;

    const ProgressOptions mOptions;

    // Created once we know the content's length.
    std::optional<ProgressReporter> mReporter;

    DataSinkPtr mSink;

    // How many bytes have we written to the sink?
    m_off_t mWritten;

    DataWriterPtr mWriter;

public:
    DownloadConsumer(DataSinkPtr sink,
                     const ProgressOptions& options,
                     const Canceller& canceller);

    Error begin(int status,
                const HttpHeaders& headers,
                m_off_t contentLength) override;

    Error end() override;

    Error write(const void* buffer, std::size_t length) override;

    // How many bytes have been written to the sink?
    m_off_t transferred() const;
}; // DownloadConsumer

} // clouddrive
