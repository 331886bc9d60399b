#pragma once

#include <functional>
#include <memory>

#include <clouddrive/common/task_executor.h>

namespace clouddrive
{

// Where completion callbacks and progress notifications are delivered.
class CallbackExecutor
{
public:
    virtual ~CallbackExecutor() = default;

    // Run function at some point, possibly right away.
    virtual void execute(std::function<void()> function) = 0;
}; // CallbackExecutor

using CallbackExecutorPtr = std::shared_ptr<CallbackExecutor>;

// Runs functions on the calling thread.
class InlineExecutor
  : public CallbackExecutor
{
public:
    void execute(std::function<void()> function) override;
}; // InlineExecutor

// Runs functions one at a time, in order, on a dedicated thread.
//
// Functions still pending when the executor is destroyed are dropped.
class SerialExecutor
  : public CallbackExecutor
{
    common::TaskExecutor mExecutor;

public:
    SerialExecutor();

    ~SerialExecutor();

    void execute(std::function<void()> function) override;
}; // SerialExecutor

// Convenience.
CallbackExecutorPtr inlineExecutor();

} // clouddrive
