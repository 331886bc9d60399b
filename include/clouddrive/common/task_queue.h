#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <string>

#include <clouddrive/common/logger_forward.h>
#include <clouddrive/common/task_queue_forward.h>

namespace clouddrive
{
namespace common
{

// A unit of work waiting for a worker.
//
// The task's function runs exactly once, either when the task completes
// or when it's cancelled. Inside the function, cancelled() tells the two
// apart. Copies share the same underlying task.
class Task
{
    TaskContextPtr mContext;

public:
    Task() = default;

    // label names the work in log messages, "call 7 (listfolder)".
    Task(std::function<void(const Task&)> function,
         Logger& logger,
         std::string label = std::string());

    explicit operator bool() const;

    bool operator!() const;

    // Run the function as cancelled unless it has already run.
    bool cancel();

    bool cancelled() const;

    // Run the function unless it has already run.
    bool complete();

    // True once the function has run, cancelled or not.
    bool completed() const;

    const std::string& label() const;

    void reset();
}; // Task

// First in, first out.
class TaskQueue
{
    std::deque<Task> mTasks;

public:
    TaskQueue() = default;

    TaskQueue(const TaskQueue& other) = delete;

    // Cancels whatever is still queued.
    ~TaskQueue();

    TaskQueue& operator=(const TaskQueue& rhs) = delete;

    // Move every queued task to the end of tasks.
    void dequeue(std::deque<Task>& tasks);

    // Returns an empty task if nothing is queued.
    Task dequeue();

    bool empty() const;

    // Tasks that have already run are not queued.
    Task queue(Task task);

    std::size_t size() const;
}; // TaskQueue

} // common
} // clouddrive
