#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include <clouddrive/common/logger_forward.h>
#include <clouddrive/common/task_executor_flags.h>
#include <clouddrive/common/task_queue.h>

namespace clouddrive
{
namespace common
{

// Executes tasks on a bounded set of worker threads.
//
// Workers are spawned on demand and retire when they've been idle for
// longer than the configured idle time.
class TaskExecutor
{
    // State shared between the executor and its workers.
    class Context;

    using ContextPtr = std::shared_ptr<Context>;

    // Workers keep this alive until they've left.
    ContextPtr mContext;

public:
    TaskExecutor(const TaskExecutorFlags& flags, Logger& logger);

    TaskExecutor(const TaskExecutor& other) = delete;

    ~TaskExecutor();

    TaskExecutor& operator=(const TaskExecutor& rhs) = delete;

    // Execute a task as soon as a worker is available.
    //
    // If the executor has been shut down, the task is cancelled before
    // this function returns.
    Task execute(std::function<void(const Task&)> function,
                 bool spawnWorker,
                 std::string label = std::string());

    // Update this executor's flags.
    void flags(const TaskExecutorFlags& flags);

    // Retrieve this executor's flags.
    TaskExecutorFlags flags() const;

    // Cancel queued tasks and wait for the workers to leave.
    //
    // Safe to call more than once and safe to call from a task.
    void shutdown();

    // Has this executor been shut down?
    bool terminating() const;

    // How many workers are currently alive?
    std::size_t workers() const;
}; // TaskExecutor

} // common
} // clouddrive
