#include <clouddrive/connection_pool.h>
#include <clouddrive/logging.h>
#include <clouddrive/posix/curl_share.h>

namespace clouddrive
{

ConnectionPool::ConnectionPool(std::size_t maxIdleConnections,
                               std::chrono::seconds keepAlive)
  : mEvictions(0u)
  , mKeepAlive(keepAlive)
  , mLock()
  , mMaxIdleConnections(maxIdleConnections)
  , mShare()
{
}

ConnectionPool::~ConnectionPool() = default;

void ConnectionPool::evictAll()
{
    SharePtr share;

    {
        std::lock_guard<std::mutex> guard(mLock);

        ++mEvictions;

        // Exchanges still using the share keep it alive.
        share = std::move(mShare);
    }

    if (share)
        LOG_debug << "Evicting pooled connections";
}

std::uint64_t ConnectionPool::evictions() const
{
    std::lock_guard<std::mutex> guard(mLock);

    return mEvictions;
}

std::chrono::seconds ConnectionPool::keepAlive() const
{
    return mKeepAlive;
}

std::size_t ConnectionPool::maxIdleConnections() const
{
    return mMaxIdleConnections;
}

ConnectionPool::SharePtr ConnectionPool::share()
{
    std::lock_guard<std::mutex> guard(mLock);

    if (!mShare)
        mShare = std::make_shared<Share>();

    return mShare;
}

} // clouddrive
