#pragma once

#include <atomic>
#include <memory>

#include <clouddrive/callback_executor.h>
#include <clouddrive/canceller.h>
#include <clouddrive/progress_listener.h>
#include <clouddrive/progress_throttle.h>

namespace clouddrive
{

// Delivers a single transfer's throttled progress to a listener.
class ProgressReporter
{
    // Tracks what has been delivered to the listener.
    struct State
    {
        State(ProgressListenerPtr listener,
              std::shared_ptr<const Canceller> canceller);

        // Deliver a notification, dropping it if it's stale.
        void deliver(m_off_t transferred, m_off_t total, bool final);

        std::shared_ptr<const Canceller> mCanceller;
        std::atomic<m_off_t> mDelivered;
        ProgressListenerPtr mListener;
    }; // State

    using StatePtr = std::shared_ptr<State>;

    void post(m_off_t transferred, bool final);

    CallbackExecutorPtr mExecutor;
    ProgressThrottle mThrottle;

    // Null when there's no listener.
    StatePtr mState;

public:
    ProgressReporter(ProgressListenerPtr listener,
                     CallbackExecutorPtr executor,
                     const Canceller& canceller,
                     m_off_t threshold,
                     m_off_t total);

    // Account for count more bytes.
    void advance(m_off_t count);

    // Emit the final notification.
    void finish();

    // How many bytes have been transferred?
    m_off_t transferred() const;
}; // ProgressReporter

} // clouddrive
