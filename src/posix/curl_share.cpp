#include <stdexcept>
#include <mutex>

#include <clouddrive/logging.h>
#include <clouddrive/posix/curl_share.h>

namespace clouddrive
{

void initializeCurl()
{
    static std::once_flag initialized;

    std::call_once(initialized, []() {
        auto result = curl_global_init(CURL_GLOBAL_DEFAULT);

        if (result != CURLE_OK)
            LOG_err << "Couldn't initialize libcurl: " << curl_easy_strerror(result);

        LOG_debug << "Initialized " << curl_version();
    });
}

void ConnectionPool::Share::lock(CURL*,
                                 curl_lock_data data,
                                 curl_lock_access,
                                 void* context)
{
    static_cast<Share*>(context)->mLocks[data].lock();
}

void ConnectionPool::Share::unlock(CURL*,
                                   curl_lock_data data,
                                   void* context)
{
    static_cast<Share*>(context)->mLocks[data].unlock();
}

ConnectionPool::Share::Share()
  : mHandle(nullptr)
  , mLocks()
{
    initializeCurl();

    mHandle = curl_share_init();

    if (!mHandle)
        throw std::runtime_error("Couldn't allocate share handle");

    curl_share_setopt(mHandle, CURLSHOPT_LOCKFUNC, &Share::lock);
    curl_share_setopt(mHandle, CURLSHOPT_UNLOCKFUNC, &Share::unlock);
    curl_share_setopt(mHandle, CURLSHOPT_USERDATA, this);
    curl_share_setopt(mHandle, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
    curl_share_setopt(mHandle, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
    curl_share_setopt(mHandle, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
}

ConnectionPool::Share::~Share()
{
    auto result = curl_share_cleanup(mHandle);

    if (result != CURLSHE_OK)
        LOG_err << "Couldn't release share handle: " << curl_share_strerror(result);
}

CURLSH* ConnectionPool::Share::handle() const
{
    return mHandle;
}

} // clouddrive
