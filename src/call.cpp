#include <cassert>

#include <clouddrive/call.h>
#include <clouddrive/common/logging.h>
#include <clouddrive/common/logger.h>
#include <clouddrive/common/utility.h>

namespace clouddrive
{

using namespace common;

// Generates call identifiers.
static std::atomic<std::uint64_t> nextID{1};

const char* toString(CallState state)
{
    static const char* names[] = {
#define DEFINE_NAME(name) #name,
        DEFINE_CALL_STATES(DEFINE_NAME)
#undef DEFINE_NAME
    }; // names

    if (state < sizeof(names) / sizeof(names[0]))
        return names[state];

    assert(false && "Unhandled call state enumerant");

    return "N/A";
}

bool terminal(CallState state)
{
    return state == CALL_STATE_CANCELLED
           || state == CALL_STATE_COMPLETED
           || state == CALL_STATE_FAILED;
}

Error CallContextBase::internalError(const char* what)
{
    return Error(ERROR_KIND_TRANSPORT,
                 LOCAL_EINTERNAL,
                 format("Operation raised an exception: %s", what));
}

void CallContextBase::unhandled(const char* what) const
{
    LogErrorF(callLogger(),
              "Unhandled callback error on call %llu (%s): %s",
              static_cast<unsigned long long>(mID),
              mDescription.c_str(),
              what);
}

CallContextBase::CallContextBase(std::string description)
  : mCanceller(std::make_shared<Canceller>())
  , mDescription(std::move(description))
  , mExecuted(false)
  , mID(nextID++)
  , mState(CALL_STATE_IDLE)
{
    LogDebugF(callLogger(),
              "Call %llu (%s) constructed",
              static_cast<unsigned long long>(mID),
              mDescription.c_str());
}

CallContextBase::~CallContextBase()
{
    LogDebugF(callLogger(),
              "Call %llu (%s) destroyed: %s",
              static_cast<unsigned long long>(mID),
              mDescription.c_str(),
              toString(mState.load()));
}

bool CallContextBase::begin()
{
    return !mExecuted.exchange(true);
}

bool CallContextBase::cancel()
{
    auto cancelled = false;
    auto state = mState.load();

    // Only idle or running calls can be cancelled.
    while (!terminal(state))
    {
        if (!mState.compare_exchange_weak(state, CALL_STATE_CANCELLED))
            continue;

        LogDebugF(callLogger(),
                  "Call %llu (%s) cancelled while %s",
                  static_cast<unsigned long long>(mID),
                  mDescription.c_str(),
                  toString(state));

        cancelled = true;
        break;
    }

    // Let the operation know it should stop.
    //
    // The state must change first so that an operation that stops
    // can't complete the call.
    mCanceller->cancel();

    return cancelled;
}

const Canceller& CallContextBase::canceller() const
{
    return *mCanceller;
}

const std::string& CallContextBase::description() const
{
    return mDescription;
}

std::uint64_t CallContextBase::id() const
{
    return mID;
}

std::string CallContextBase::label() const
{
    return format("call %llu (%s)",
                  static_cast<unsigned long long>(mID),
                  mDescription.c_str());
}

bool CallContextBase::isCancelled() const
{
    return mCanceller->triggered();
}

bool CallContextBase::isExecuted() const
{
    return mExecuted;
}

CallState CallContextBase::state() const
{
    return mState;
}

bool CallContextBase::transition(CallState from, CallState to)
{
    if (!mState.compare_exchange_strong(from, to))
        return false;

    LogDebugF(callLogger(),
              "Call %llu (%s) %s -> %s",
              static_cast<unsigned long long>(mID),
              mDescription.c_str(),
              toString(from),
              toString(to));

    return true;
}

} // clouddrive
