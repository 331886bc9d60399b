#pragma once

#include <functional>
#include <memory>

#include <clouddrive/types.h>

namespace clouddrive
{

// Notified as a transfer makes progress.
class ProgressListener
{
public:
    virtual ~ProgressListener() = default;

    // total is UNKNOWN_LENGTH when the transfer's size isn't known.
    virtual void onProgress(m_off_t transferred, m_off_t total) = 0;
}; // ProgressListener

using ProgressListenerPtr = std::shared_ptr<ProgressListener>;

// Convenience.
ProgressListenerPtr makeProgressListener(std::function<void(m_off_t, m_off_t)> function);

} // clouddrive
