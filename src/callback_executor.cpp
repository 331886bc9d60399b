#include <clouddrive/callback_executor.h>
#include <clouddrive/common/logger.h>

namespace clouddrive
{

using namespace common;

static TaskExecutorFlags serialFlags()
{
    TaskExecutorFlags flags;

    // A single worker guarantees ordering.
    flags.mMaxWorkers = 1;

    return flags;
}

void InlineExecutor::execute(std::function<void()> function)
{
    function();
}

SerialExecutor::SerialExecutor()
  : CallbackExecutor()
  , mExecutor(serialFlags(), callLogger())
{
}

SerialExecutor::~SerialExecutor()
{
    mExecutor.shutdown();
}

void SerialExecutor::execute(std::function<void()> function)
{
    mExecutor.execute([function = std::move(function)](const Task& task) {
        if (!task.cancelled())
            function();
    }, false);
}

CallbackExecutorPtr inlineExecutor()
{
    static CallbackExecutorPtr executor = std::make_shared<InlineExecutor>();

    return executor;
}

} // clouddrive
