#include <clouddrive/common/logging.h>
#include <clouddrive/common/logger.h>
#include <clouddrive/progress_reporter.h>

namespace clouddrive
{

using namespace common;

class FunctionProgressListener
  : public ProgressListener
{
    std::function<void(m_off_t, m_off_t)> mFunction;

public:
    explicit FunctionProgressListener(std::function<void(m_off_t, m_off_t)> function)
      : ProgressListener()
      , mFunction(std::move(function))
    {
    }

    void onProgress(m_off_t transferred, m_off_t total) override
    {
        mFunction(transferred, total);
    }
}; // FunctionProgressListener

ProgressListenerPtr makeProgressListener(std::function<void(m_off_t, m_off_t)> function)
{
    return std::make_shared<FunctionProgressListener>(std::move(function));
}

ProgressReporter::State::State(ProgressListenerPtr listener,
                               std::shared_ptr<const Canceller> canceller)
  : mCanceller(std::move(canceller))
  , mDelivered(-1)
  , mListener(std::move(listener))
{
}

void ProgressReporter::State::deliver(m_off_t transferred,
                                      m_off_t total,
                                      bool final)
{
    // Call's been cancelled.
    if (mCanceller->triggered())
        return;

    auto delivered = mDelivered.load();

    // Make sure values only ever increase.
    while (true)
    {
        // Notification's stale.
        if (delivered > transferred || (delivered == transferred && !final))
            return;

        if (mDelivered.compare_exchange_weak(delivered, transferred))
            break;
    }

    try
    {
        mListener->onProgress(transferred, total);
    }
    catch (std::exception& exception)
    {
        LogErrorF(callLogger(),
                  "Unhandled progress listener error: %s",
                  exception.what());
    }
}

void ProgressReporter::post(m_off_t transferred, bool final)
{
    mExecutor->execute([state = mState, total = mThrottle.total(), transferred, final]() {
        state->deliver(transferred, total, final);
    });
}

ProgressReporter::ProgressReporter(ProgressListenerPtr listener,
                                   CallbackExecutorPtr executor,
                                   const Canceller& canceller,
                                   m_off_t threshold,
                                   m_off_t total)
  : mExecutor(std::move(executor))
  , mThrottle(threshold, total)
  , mState()
{
    if (listener)
        mState = std::make_shared<State>(std::move(listener),
                                         canceller.shared_from_this());
}

void ProgressReporter::advance(m_off_t count)
{
    if (mThrottle.advance(count) && mState)
        post(mThrottle.reported(), false);
}

void ProgressReporter::finish()
{
    auto transferred = mThrottle.finish();

    if (mState)
        post(transferred, true);
}

m_off_t ProgressReporter::transferred() const
{
    return mThrottle.transferred();
}

} // clouddrive
