#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>

#include <clouddrive/common/error_or.h>
#include <clouddrive/types.h>

namespace clouddrive
{

// Reads a source's content sequentially.
//
// Any resources held by the reader are released when it is destroyed.
class DataReader
{
protected:
    DataReader() = default;

public:
    virtual ~DataReader() = default;

    // Read at most length bytes into buffer.
    //
    // Returns zero when the source has been exhausted.
    virtual ErrorOr<std::size_t> read(void* buffer, std::size_t length) = 0;
}; // DataReader

using DataReaderPtr = std::unique_ptr<DataReader>;

class DataSource;

using DataSourcePtr = std::shared_ptr<DataSource>;

// Produces a payload that can be read exactly once.
class DataSource
{
    // Has this source been opened?
    std::atomic<bool> mOpened;

protected:
    DataSource();

    // Called by open(...) the first time it is called.
    virtual ErrorOr<DataReaderPtr> doOpen() = 0;

public:
    DataSource(const DataSource& other) = delete;

    virtual ~DataSource() = default;

    DataSource& operator=(const DataSource& rhs) = delete;

    // How many bytes will this source produce?
    //
    // UNKNOWN_LENGTH if the source doesn't know in advance.
    virtual m_off_t contentLength() const = 0;

    // Open the source for reading.
    //
    // Fails with a state error if the source has already been opened.
    ErrorOr<DataReaderPtr> open();

    // A source that produces nothing.
    static DataSourcePtr empty();

    // A source that produces the specified bytes.
    static DataSourcePtr fromBytes(std::string bytes);

    // A source that produces the content of the specified file.
    //
    // Throws std::invalid_argument if the file can't be found.
    static DataSourcePtr fromFile(const std::string& path);
}; // DataSource

} // clouddrive
