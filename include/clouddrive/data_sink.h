#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

#include <clouddrive/common/error_or.h>
#include <clouddrive/types.h>

namespace clouddrive
{

// Receives a stream of bytes.
//
// Output is only committed when finish() succeeds. A writer destroyed
// before that discards whatever it has received.
class DataWriter
{
protected:
    DataWriter() = default;

public:
    virtual ~DataWriter() = default;

    // Commit the received content.
    virtual Error finish() = 0;

    // Append length bytes from buffer.
    virtual Error write(const void* buffer, std::size_t length) = 0;
}; // DataWriter

using DataWriterPtr = std::unique_ptr<DataWriter>;

class DataSink;

using DataSinkPtr = std::shared_ptr<DataSink>;

// Sinks must be managed by a std::shared_ptr.
class DataSink
  : public std::enable_shared_from_this<DataSink>
{
    // Has this sink been opened?
    std::atomic<bool> mOpened;

protected:
    DataSink();

    // Called by open(...) the first time it is called.
    virtual ErrorOr<DataWriterPtr> doOpen(m_off_t contentLength) = 0;

public:
    DataSink(const DataSink& other) = delete;

    virtual ~DataSink() = default;

    DataSink& operator=(const DataSink& rhs) = delete;

    // Prepare the sink to receive contentLength bytes.
    //
    // contentLength may be UNKNOWN_LENGTH.
    ErrorOr<DataWriterPtr> open(m_off_t contentLength);

    // Has this sink been opened?
    bool opened() const;

    // A sink that writes to the specified file.
    //
    // Content is written to "<path>.part" and moved into place when
    // the writer is finished.
    static DataSinkPtr toFile(std::string path);
}; // DataSink

// Collects content in memory.
class BufferSink
  : public DataSink
{
    class Writer;

    // What content have we received?
    std::string mContent;

    // What length was declared when we were opened?
    m_off_t mDeclaredLength;

    // Has the content been committed?
    bool mFinished;

    // Serializes access to instance members.
    mutable std::mutex mLock;

    // Called by our writer when it has been finished.
    void commit(std::string content);

protected:
    ErrorOr<DataWriterPtr> doOpen(m_off_t contentLength) override;

public:
    BufferSink();

    // What content has been committed?
    std::string content() const;

    // What length was declared when the sink was opened?
    m_off_t declaredLength() const;

    // Has any content been committed?
    bool finished() const;
}; // BufferSink

using BufferSinkPtr = std::shared_ptr<BufferSink>;

} // clouddrive
