#pragma once

#include <mutex>

#include <curl/curl.h>

#include <clouddrive/connection_pool.h>

namespace clouddrive
{

// Make sure libcurl has been initialized.
void initializeCurl();

class ConnectionPool::Share
{
    static void lock(CURL* handle,
                     curl_lock_data data,
                     curl_lock_access access,
                     void* context);

    static void unlock(CURL* handle,
                       curl_lock_data data,
                       void* context);

    CURLSH* mHandle;

    // One lock per kind of shared data.
    std::mutex mLocks[CURL_LOCK_DATA_LAST];

public:
    Share();

    Share(const Share& other) = delete;

    ~Share();

    Share& operator=(const Share& rhs) = delete;

    CURLSH* handle() const;
}; // Share

} // clouddrive
