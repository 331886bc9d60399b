#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include <clouddrive/call_state.h>
#include <clouddrive/callback_executor.h>
#include <clouddrive/canceller.h>
#include <clouddrive/common/error_or.h>
#include <clouddrive/common/task_queue.h>
#include <clouddrive/dispatcher.h>

namespace clouddrive
{

template<typename T>
class Call;

// Receives the outcome of an enqueued call.
//
// Exactly one of the two methods is invoked for every enqueued call that
// hasn't been cancelled.
template<typename T>
class Callback
{
public:
    virtual ~Callback() = default;

    virtual void onComplete(Call<T>& call, T result) = 0;

    virtual void onFailure(Call<T>& call, const Error& error) = 0;
}; // Callback<T>

template<typename T>
using CallbackPtr = std::shared_ptr<Callback<T>>;

// State common to every call regardless of its result type.
class CallContextBase
{
    // Lets the operation know when it should stop.
    CancellerPtr mCanceller;

    // What operation does this call perform?
    const std::string mDescription;

    // Set when the call is first executed or enqueued.
    std::atomic<bool> mExecuted;

    // Uniquely identifies this call.
    const std::uint64_t mID;

    // Where is the call in its lifecycle?
    std::atomic<CallState> mState;

protected:
    // Used when an exception escapes the operation.
    static Error internalError(const char* what);

    // Log that a callback or listener misbehaved.
    void unhandled(const char* what) const;

public:
    explicit CallContextBase(std::string description);

    CallContextBase(const CallContextBase& other) = delete;

    virtual ~CallContextBase();

    CallContextBase& operator=(const CallContextBase& rhs) = delete;

    // Mark the call as executed.
    //
    // Returns false if the call had already been executed.
    bool begin();

    // Cancel the call.
    //
    // Returns true if the call's state changed as a result.
    bool cancel();

    // Who should the operation consult to see if it's been cancelled?
    const Canceller& canceller() const;

    const std::string& description() const;

    std::uint64_t id() const;

    // "call 7 (listfolder)"
    std::string label() const;

    bool isCancelled() const;

    bool isExecuted() const;

    CallState state() const;

    // Try and move the call from one state to another.
    bool transition(CallState from, CallState to);
}; // CallContextBase

using CallContextBasePtr = std::shared_ptr<CallContextBase>;
using CallContextBaseWeakPtr = std::weak_ptr<CallContextBase>;

template<typename T>
class CallContext
  : public CallContextBase
{
public:
    // Performs the call's actual work.
    using Operation = std::function<ErrorOr<T>(const Canceller&)>;

private:
    // Where are callbacks delivered?
    CallbackExecutorPtr mCallbackExecutor;

    // Who runs enqueued calls?
    DispatcherPtr mDispatcher;

    // Released once the call's been executed.
    Operation mOperation;

public:
    CallContext(std::string description,
                Operation operation,
                DispatcherPtr dispatcher,
                CallbackExecutorPtr callbackExecutor)
      : CallContextBase(std::move(description))
      , mCallbackExecutor(std::move(callbackExecutor))
      , mDispatcher(std::move(dispatcher))
      , mOperation(std::move(operation))
    {
    }

    const CallbackExecutorPtr& callbackExecutor() const
    {
        return mCallbackExecutor;
    }

    const DispatcherPtr& dispatcher() const
    {
        return mDispatcher;
    }

    // Perform the call's operation.
    ErrorOr<T> run()
    {
        // Take ownership of the operation so its resources are released
        // as soon as it has finished.
        auto operation = std::move(mOperation);

        mOperation = nullptr;

        if (canceller().triggered())
            return unexpected(cancelledError());

        try
        {
            return operation(canceller());
        }
        catch (std::exception& exception)
        {
            return unexpected(internalError(exception.what()));
        }
    }

    // Invoke callback, logging anything it throws.
    template<typename Function>
    void safely(Function&& function) const
    {
        try
        {
            function();
        }
        catch (std::exception& exception)
        {
            unhandled(exception.what());
        }
    }
}; // CallContext<T>

template<typename T>
using CallContextPtr = std::shared_ptr<CallContext<T>>;

// A single, cancellable unit of work.
//
// Instances are handles: copies refer to the same call.
template<typename T>
class Call
{
    // Adapts a function to the Callback interface.
    class FunctionCallback
      : public Callback<T>
    {
        std::function<void(ErrorOr<T>)> mFunction;

    public:
        explicit FunctionCallback(std::function<void(ErrorOr<T>)> function)
          : mFunction(std::move(function))
        {
        }

        void onComplete(Call<T>&, T result) override
        {
            mFunction(std::move(result));
        }

        void onFailure(Call<T>&, const Error& error) override
        {
            mFunction(unexpected(error));
        }
    }; // FunctionCallback

    // Deliver result to callback on the callback executor.
    static void deliver(Call call, CallbackPtr<T> callback, ErrorOr<T> result)
    {
        auto& executor = *call.mContext->callbackExecutor();

        executor.execute([call, callback, result = std::move(result)]() mutable {
            auto& context = *call.mContext;

            auto state = result ? CALL_STATE_COMPLETED : CALL_STATE_FAILED;

            // Call was cancelled before we could deliver its result.
            if (!context.transition(CALL_STATE_RUNNING, state))
                return;

            context.safely([&]() {
                if (result)
                    return callback->onComplete(call, std::move(result).value());

                callback->onFailure(call, result.error());
            });
        });
    }

    CallContextPtr<T> mContext;

public:
    explicit Call(CallContextPtr<T> context)
      : mContext(std::move(context))
    {
    }

    Call(const Call& other) = default;

    Call(Call&& other) = default;

    Call& operator=(const Call& rhs) = default;

    Call& operator=(Call&& rhs) = default;

    // Cancel the call.
    //
    // Safe to call from any thread and safe to call more than once.
    void cancel()
    {
        mContext->cancel();
    }

    // Which state machine does this handle refer to?
    const CallContextPtr<T>& context() const
    {
        return mContext;
    }

    const std::string& description() const
    {
        return mContext->description();
    }

    // Enqueue the call for execution on the dispatcher.
    void enqueue(CallbackPtr<T> callback)
    {
        if (!callback)
            throw std::invalid_argument("Callback can't be null");

        auto& context = *mContext;

        // Calls can only be executed once.
        if (!context.begin())
        {
            auto call = *this;

            context.callbackExecutor()->execute([call, callback]() mutable {
                call.mContext->safely([&]() {
                    callback->onFailure(call,
                                        stateError(LOCAL_EEXECUTED,
                                                   "Call has already been executed"));
                });
            });

            return;
        }

        context.dispatcher()->execute([call = *this, callback](const common::Task& task) {
            auto& context = *call.mContext;

            // Call was cancelled before it could start.
            if (!context.transition(CALL_STATE_IDLE, CALL_STATE_RUNNING))
                return;

            // Dispatcher was shut down before the call could start.
            if (task.cancelled())
                return deliver(call,
                               callback,
                               unexpected(stateError(LOCAL_ESHUTDOWN,
                                                     "Dispatcher has been shut down")));

            deliver(call, callback, context.run());
        }, context.label());
    }

    // Convenience.
    void enqueue(std::function<void(ErrorOr<T>)> function)
    {
        if (!function)
            throw std::invalid_argument("Callback can't be null");

        enqueue(std::make_shared<FunctionCallback>(std::move(function)));
    }

    // Execute the call on this thread.
    ErrorOr<T> execute()
    {
        auto& context = *mContext;

        // Calls can only be executed once.
        if (!context.begin())
            return unexpected(stateError(LOCAL_EEXECUTED,
                                         "Call has already been executed"));

        // Call was cancelled before it could start.
        if (!context.transition(CALL_STATE_IDLE, CALL_STATE_RUNNING))
            return unexpected(cancelledError());

        auto result = context.run();

        auto state = result ? CALL_STATE_COMPLETED : CALL_STATE_FAILED;

        // Call was cancelled while it was running.
        if (!context.transition(CALL_STATE_RUNNING, state))
            return unexpected(cancelledError());

        return result;
    }

    std::uint64_t id() const
    {
        return mContext->id();
    }

    bool isCancelled() const
    {
        return mContext->isCancelled();
    }

    bool isExecuted() const
    {
        return mContext->isExecuted();
    }

    CallState state() const
    {
        return mContext->state();
    }
}; // Call<T>

// Convenience.
template<typename T>
Call<T> makeCall(std::string description,
                 typename CallContext<T>::Operation operation,
                 DispatcherPtr dispatcher,
                 CallbackExecutorPtr callbackExecutor)
{
    auto context = std::make_shared<CallContext<T>>(std::move(description),
                                                    std::move(operation),
                                                    std::move(dispatcher),
                                                    std::move(callbackExecutor));

    return Call<T>(std::move(context));
}

} // clouddrive
