#include <algorithm>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include <clouddrive/transfer.h>

namespace clouddrive
{

// Claims a length that may differ from what it actually produces.
class DishonestSource
  : public DataSource
{
    class Reader
      : public DataReader
    {
        std::string mContent;
        std::size_t mPosition = 0;

    public:
        explicit Reader(std::string content)
          : mContent(std::move(content))
        {
        }

        ErrorOr<std::size_t> read(void* buffer, std::size_t length) override
        {
            length = std::min(length, mContent.size() - mPosition);

            std::memcpy(buffer, mContent.data() + mPosition, length);

            mPosition += length;

            return length;
        }
    }; // Reader

    std::string mContent;
    m_off_t mLength;

protected:
    ErrorOr<DataReaderPtr> doOpen() override
    {
        return DataReaderPtr(new Reader(mContent));
    }

public:
    DishonestSource(std::string content, m_off_t length)
      : mContent(std::move(content))
      , mLength(length)
    {
    }

    m_off_t contentLength() const override
    {
        return mLength;
    }
}; // DishonestSource

class TransferTest
  : public testing::Test
{
protected:
    ProgressOptions options(m_off_t threshold = 1)
    {
        ProgressOptions options;

        options.mExecutor = inlineExecutor();
        options.mListener = makeProgressListener([this](m_off_t transferred, m_off_t total) {
            mNotifications.emplace_back(transferred, total);
        });
        options.mThreshold = threshold;

        return options;
    }

    DataReaderPtr open(DataSource& source)
    {
        auto reader = source.open();

        EXPECT_TRUE(reader);

        return std::move(reader).value();
    }

    std::string drain(UploadBody& body, Error& error)
    {
        std::string content;
        std::vector<char> buffer(128 * 1024);

        while (true)
        {
            auto count = body.read(buffer.data(), buffer.size());

            if (!count)
            {
                error = count.error();
                break;
            }

            if (!*count)
                break;

            // Reads are never larger than a chunk.
            EXPECT_LE(*count, UPLOAD_CHUNK_SIZE);

            content.append(buffer.data(), *count);
        }

        return content;
    }

    CancellerPtr mCanceller = std::make_shared<Canceller>();

    std::vector<std::pair<m_off_t, m_off_t>> mNotifications;
}; // TransferTest

TEST_F(TransferTest, upload_reads_in_chunks)
{
    auto source = DataSource::fromBytes(std::string(200000, 'x'));

    UploadBody body(open(*source), source->contentLength(), options(65536), *mCanceller);

    Error error;

    auto content = drain(body, error);

    EXPECT_TRUE(error.ok());
    EXPECT_EQ(content.size(), 200000u);
    EXPECT_TRUE(body.complete().ok());
    EXPECT_EQ(body.transferred(), 200000);

    ASSERT_FALSE(mNotifications.empty());
    EXPECT_EQ(mNotifications.back(), std::make_pair(m_off_t(200000), m_off_t(200000)));

    for (std::size_t i = 0; i + 1 < mNotifications.size(); ++i)
    {
        EXPECT_LT(mNotifications[i].first, 200000);
        EXPECT_LT(mNotifications[i].first, mNotifications[i + 1].first);
    }
}

TEST_F(TransferTest, upload_short_source)
{
    DishonestSource source("abc", 10);

    UploadBody body(open(source), source.contentLength(), options(), *mCanceller);

    Error error;

    drain(body, error);

    EXPECT_EQ(error.kind(), ERROR_KIND_INTEGRITY);
}

TEST_F(TransferTest, upload_long_source)
{
    DishonestSource source("abcdef", 3);

    UploadBody body(open(source), source.contentLength(), options(), *mCanceller);

    Error error;

    EXPECT_EQ(drain(body, error), "abc");
    EXPECT_TRUE(error.ok());

    auto result = body.complete();

    EXPECT_EQ(result.kind(), ERROR_KIND_INTEGRITY);

    // No final notification for a failed transfer.
    for (auto& notification : mNotifications)
        EXPECT_LT(notification.first, 3);
}

TEST_F(TransferTest, download_success)
{
    auto sink = std::make_shared<BufferSink>();

    DownloadConsumer consumer(sink, options(2), *mCanceller);

    EXPECT_TRUE(consumer.begin(200, HttpHeaders(), 6).ok());
    EXPECT_TRUE(consumer.write("abc", 3).ok());
    EXPECT_TRUE(consumer.write("def", 3).ok());
    EXPECT_TRUE(consumer.end().ok());

    EXPECT_EQ(sink->content(), "abcdef");
    EXPECT_EQ(sink->declaredLength(), 6);
    EXPECT_EQ(consumer.transferred(), 6);

    using Notification = std::pair<m_off_t, m_off_t>;

    EXPECT_EQ(mNotifications, (std::vector<Notification>{{3, 6}, {6, 6}}));
}

TEST_F(TransferTest, download_failure_status)
{
    auto sink = std::make_shared<BufferSink>();

    DownloadConsumer consumer(sink, options(), *mCanceller);

    auto result = consumer.begin(404, HttpHeaders(), UNKNOWN_LENGTH);

    EXPECT_EQ(result.kind(), ERROR_KIND_API);
    EXPECT_EQ(result.code(), 404);
    EXPECT_FALSE(sink->opened());
}

TEST_F(TransferTest, download_too_long)
{
    auto sink = std::make_shared<BufferSink>();

    DownloadConsumer consumer(sink, options(), *mCanceller);

    EXPECT_TRUE(consumer.begin(200, HttpHeaders(), 2).ok());
    EXPECT_EQ(consumer.write("abc", 3).kind(), ERROR_KIND_INTEGRITY);
    EXPECT_FALSE(sink->finished());
}

TEST_F(TransferTest, download_too_short)
{
    auto sink = std::make_shared<BufferSink>();

    DownloadConsumer consumer(sink, options(), *mCanceller);

    EXPECT_TRUE(consumer.begin(200, HttpHeaders(), 4).ok());
    EXPECT_TRUE(consumer.write("abc", 3).ok());
    EXPECT_EQ(consumer.end().kind(), ERROR_KIND_INTEGRITY);
    EXPECT_FALSE(sink->finished());
}

TEST_F(TransferTest, download_unknown_length)
{
    auto sink = std::make_shared<BufferSink>();

    DownloadConsumer consumer(sink, options(), *mCanceller);

    EXPECT_TRUE(consumer.begin(200, HttpHeaders(), UNKNOWN_LENGTH).ok());
    EXPECT_TRUE(consumer.write("abc", 3).ok());
    EXPECT_TRUE(consumer.end().ok());

    EXPECT_EQ(sink->content(), "abc");
    ASSERT_FALSE(mNotifications.empty());
    EXPECT_EQ(mNotifications.back(), std::make_pair(m_off_t(3), UNKNOWN_LENGTH));
}

} // clouddrive
