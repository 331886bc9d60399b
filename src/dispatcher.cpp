#include <clouddrive/common/logging.h>
#include <clouddrive/common/logger.h>
#include <clouddrive/dispatcher.h>

namespace clouddrive
{

using namespace common;

Dispatcher::Dispatcher(const TaskExecutorFlags& flags)
  : mExecutor(flags, callLogger())
{
    LogDebugF(callLogger(),
              "Dispatcher constructed: max workers: %zu, idle time: %llds",
              flags.mMaxWorkers,
              static_cast<long long>(flags.mIdleTime.count()));
}

Dispatcher::~Dispatcher()
{
    mExecutor.shutdown();
}

Task Dispatcher::execute(std::function<void(const Task&)> function,
                         std::string label)
{
    return mExecutor.execute(std::move(function), true, std::move(label));
}

TaskExecutorFlags Dispatcher::flags() const
{
    return mExecutor.flags();
}

bool Dispatcher::isShutdown() const
{
    return mExecutor.terminating();
}

void Dispatcher::shutdown()
{
    if (mExecutor.terminating())
        return;

    LogInfo1(callLogger(), "Dispatcher shutting down");

    mExecutor.shutdown();
}

std::size_t Dispatcher::workers() const
{
    return mExecutor.workers();
}

} // clouddrive
