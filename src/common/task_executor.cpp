#include <cassert>
#include <condition_variable>
#include <deque>
#include <list>
#include <mutex>
#include <stdexcept>
#include <thread>

#include <clouddrive/common/logging.h>
#include <clouddrive/common/task_executor.h>

namespace clouddrive
{
namespace common
{

class TaskExecutor::Context
{
public:
    using WorkerList = std::list<std::thread>;

    Context(const TaskExecutorFlags& flags, Logger& logger)
      : mAvailableWorkers(0u)
      , mCV()
      , mFlags(flags)
      , mLock()
      , mLogger(logger)
      , mTaskQueue()
      , mTerminating(false)
      , mWorkers()
    {
    }

    // Executes tasks when appropriate.
    static void loop(ContextPtr context, WorkerList::iterator position);

    // Tracks how many workers are waiting for work.
    std::size_t mAvailableWorkers;

    // Signalled when we want our worker's attention.
    std::condition_variable mCV;

    // Controls how we spawn our workers and how they behave.
    TaskExecutorFlags mFlags;

    // Serializes access to instance members.
    mutable std::mutex mLock;

    // How should we log?
    Logger& mLogger;

    // Tracks what tasks we've queued.
    TaskQueue mTaskQueue;

    // Lets the workers know when they should terminate.
    bool mTerminating;

    // Tracks who our workers are.
    WorkerList mWorkers;
}; // Context

void TaskExecutor::Context::loop(ContextPtr context,
                                 WorkerList::iterator position)
{
    // Acquire executor lock.
    std::unique_lock<std::mutex> lock(context->mLock);

    // Convenience.
    auto& availableWorkers = context->mAvailableWorkers;
    auto& cv = context->mCV;
    auto& flags = context->mFlags;
    auto& logger = context->mLogger;
    auto& taskQueue = context->mTaskQueue;
    auto& terminating = context->mTerminating;
    auto& workers = context->mWorkers;

    // Should we wake up?
    auto shouldWake = [&]() {
        return terminating || !taskQueue.empty();
    }; // shouldWake

    LogDebug1(logger, "Worker thread started");

    while (true)
    {
        // Release excess workers.
        if (!terminating && workers.size() > flags.mMaxWorkers)
            break;

        // Sleep until there's something to do.
        auto hasWork = cv.wait_for(lock, flags.mIdleTime, shouldWake);

        // We haven't had any work in awhile.
        if (!hasWork)
        {
            // Keep at least this many workers alive.
            if (flags.mMinWorkers >= workers.size())
                continue;

            // Keep at least a single worker alive if there tasks pending.
            if (!taskQueue.empty() && workers.size() < 2)
                continue;

            break;
        }

        // Executor's closing up shop.
        if (terminating)
            break;

        auto task = taskQueue.dequeue();

        // Sanity.
        assert(task);

        // Let the executor know we're busy.
        --availableWorkers;

        // Release the lock so other workers can proceed.
        lock.unlock();

        task.complete();

        // Release our reference before we sleep.
        task.reset();

        lock.lock();

        // Let the executor know we're available.
        ++availableWorkers;
    }

    --availableWorkers;

    // The executor's taken ownership of our thread.
    if (terminating)
    {
        LogDebug1(logger, "Worker thread stopped");
        return;
    }

    // So we don't block on our own removal.
    position->detach();

    workers.erase(position);

    LogDebug1(logger, "Worker thread retired");
}

TaskExecutor::TaskExecutor(const TaskExecutorFlags& flags,
                           Logger& logger)
  : mContext(std::make_shared<Context>(flags, logger))
{
    LogDebug1(logger, "Executor constructed");
}

TaskExecutor::~TaskExecutor()
{
    shutdown();

    LogDebug1(mContext->mLogger, "Executor destroyed");
}

Task TaskExecutor::execute(std::function<void(const Task&)> function,
                           bool spawnWorker,
                           std::string label)
{
    if (!function)
        throw std::invalid_argument("Task function can't be null");

    auto& context = *mContext;

    auto task = Task(std::move(function), context.mLogger, std::move(label));

    // Acquire executor lock.
    std::unique_lock<std::mutex> lock(context.mLock);

    // Executor's being terminated.
    if (context.mTerminating)
    {
        lock.unlock();

        task.cancel();

        return task;
    }

    // Only spawn a new worker if requested and if none are available.
    spawnWorker = spawnWorker && !context.mAvailableWorkers;

    // Always spawn a worker if there are none present.
    spawnWorker |= context.mWorkers.empty();

    // But only spawn so many.
    spawnWorker &= context.mWorkers.size() < context.mFlags.mMaxWorkers;

    if (spawnWorker)
    {
        // Allocate a position for the worker.
        auto position = context.mWorkers.emplace(context.mWorkers.end());

        // The worker can't look at its position until we release the lock.
        *position = std::thread(&Context::loop, mContext, position);

        // We now have at least one worker available.
        ++context.mAvailableWorkers;
    }

    // Sanity.
    assert(!context.mWorkers.empty());

    context.mTaskQueue.queue(task);

    lock.unlock();

    // Let a worker know there's something to do.
    context.mCV.notify_one();

    return task;
}

void TaskExecutor::flags(const TaskExecutorFlags& flags)
{
    std::lock_guard<std::mutex> guard(mContext->mLock);

    mContext->mFlags = flags;

    mContext->mCV.notify_all();
}

TaskExecutorFlags TaskExecutor::flags() const
{
    std::lock_guard<std::mutex> guard(mContext->mLock);

    return mContext->mFlags;
}

void TaskExecutor::shutdown()
{
    auto& context = *mContext;

    std::deque<Task> tasks;
    Context::WorkerList workers;

    {
        std::lock_guard<std::mutex> guard(context.mLock);

        // Executor's already been shut down.
        if (context.mTerminating)
            return;

        context.mTerminating = true;

        // Take ownership of any pending tasks.
        context.mTaskQueue.dequeue(tasks);

        // Take ownership of our workers.
        workers.splice(workers.end(), context.mWorkers);
    }

    // Wake up all the workers.
    context.mCV.notify_all();

    LogDebugF(context.mLogger,
              "Executor shutting down: %zu queued task(s), %zu worker(s)",
              tasks.size(),
              workers.size());

    // Let pending tasks know they won't be run.
    for (auto& task : tasks)
    {
        if (!task.label().empty())
            LogDebugF(context.mLogger, "Cancelling %s", task.label().c_str());

        task.cancel();
    }

    auto self = std::this_thread::get_id();

    // Wait for the workers to quit.
    for (auto& worker : workers)
    {
        // We're being shut down by one of our own workers.
        if (worker.get_id() == self)
        {
            worker.detach();
            continue;
        }

        if (worker.joinable())
            worker.join();
    }
}

bool TaskExecutor::terminating() const
{
    std::lock_guard<std::mutex> guard(mContext->mLock);

    return mContext->mTerminating;
}

std::size_t TaskExecutor::workers() const
{
    std::lock_guard<std::mutex> guard(mContext->mLock);

    return mContext->mWorkers.size();
}

} // common
} // clouddrive
