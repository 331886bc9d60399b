#include <algorithm>
#include <atomic>
#include <iterator>
#include <stdexcept>

#include <clouddrive/common/logging.h>
#include <clouddrive/common/task_queue.h>

namespace clouddrive
{
namespace common
{

class TaskContext
{
    enum TaskState : int
    {
        TS_PENDING,
        TS_COMPLETED,
        TS_CANCELLED
    }; // TaskState

    // Moves us out of TS_PENDING and runs mFunction.
    bool run(TaskState state, const Task& task);

    std::function<void(const Task&)> mFunction;

    const std::string mLabel;

    Logger& mLogger;

    std::atomic<TaskState> mState;

public:
    TaskContext(std::function<void(const Task&)> function,
                Logger& logger,
                std::string label);

    bool cancel(const Task& task)
    {
        return run(TS_CANCELLED, task);
    }

    bool cancelled() const
    {
        return mState == TS_CANCELLED;
    }

    bool complete(const Task& task)
    {
        return run(TS_COMPLETED, task);
    }

    bool completed() const
    {
        return mState != TS_PENDING;
    }

    const std::string& label() const
    {
        return mLabel;
    }
}; // TaskContext

TaskContext::TaskContext(std::function<void(const Task&)> function,
                         Logger& logger,
                         std::string label)
  : mFunction(std::move(function))
  , mLabel(std::move(label))
  , mLogger(logger)
  , mState{TS_PENDING}
{
}

bool TaskContext::run(TaskState state, const Task& task)
{
    auto expected = TS_PENDING;

    if (!mState.compare_exchange_strong(expected, state))
        return false;

    // The closure may own resources so it is released once run.
    auto function = std::move(mFunction);

    mFunction = nullptr;

    try
    {
        function(task);
    }
    catch (std::exception& exception)
    {
        LogErrorF(mLogger,
                  "Task %s threw: %s",
                  mLabel.empty() ? "<unnamed>" : mLabel.c_str(),
                  exception.what());
    }

    return true;
}

Task::Task(std::function<void(const Task&)> function,
           Logger& logger,
           std::string label)
  : mContext(std::make_shared<TaskContext>(std::move(function),
                                           logger,
                                           std::move(label)))
{
}

Task::operator bool() const
{
    return static_cast<bool>(mContext);
}

bool Task::operator!() const
{
    return !mContext;
}

bool Task::cancel()
{
    return mContext && mContext->cancel(*this);
}

bool Task::cancelled() const
{
    return mContext && mContext->cancelled();
}

bool Task::complete()
{
    return mContext && mContext->complete(*this);
}

bool Task::completed() const
{
    return mContext && mContext->completed();
}

const std::string& Task::label() const
{
    static const std::string none;

    return mContext ? mContext->label() : none;
}

void Task::reset()
{
    mContext.reset();
}

TaskQueue::~TaskQueue()
{
    std::deque<Task> tasks;

    dequeue(tasks);

    for (auto& task : tasks)
        task.cancel();
}

void TaskQueue::dequeue(std::deque<Task>& tasks)
{
    std::move(mTasks.begin(), mTasks.end(), std::back_inserter(tasks));

    mTasks.clear();
}

Task TaskQueue::dequeue()
{
    Task task;

    if (mTasks.empty())
        return task;

    task = std::move(mTasks.front());

    mTasks.pop_front();

    return task;
}

bool TaskQueue::empty() const
{
    return mTasks.empty();
}

Task TaskQueue::queue(Task task)
{
    if (task && !task.completed())
        mTasks.push_back(task);

    return task;
}

std::size_t TaskQueue::size() const
{
    return mTasks.size();
}

} // common
} // clouddrive
