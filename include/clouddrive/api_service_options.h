#pragma once

#include <chrono>
#include <string>

#include <clouddrive/callback_executor.h>
#include <clouddrive/http.h>
#include <clouddrive/types.h>

namespace clouddrive
{

struct ApiServiceOptions
{
    // Which host services our requests?
    std::string mApiHost = "api.pcloud.com";

    // Adds credentials to our requests. May be null.
    AuthenticatorPtr mAuthenticator{};

    // Where are callbacks and progress notifications delivered?
    //
    // Null means on whichever thread performed the work.
    CallbackExecutorPtr mCallbackExecutor{};

    // Zero means the transport's default.
    std::chrono::milliseconds mConnectTimeout{0};

    // Minimum distance between progress notifications.
    m_off_t mProgressThreshold = 8192;

    // Zero means the transport's default.
    std::chrono::milliseconds mReadTimeout{0};

    // Performs our exchanges.
    //
    // Null means exchanges are performed by libcurl using the service's
    // connection pool.
    HttpTransportPtr mTransport{};

    // How do we identify ourselves?
    std::string mUserAgent = "clouddrive/1.0";

    // Zero means the transport's default.
    std::chrono::milliseconds mWriteTimeout{0};
}; // ApiServiceOptions

} // clouddrive
