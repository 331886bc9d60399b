#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include <clouddrive/common/task_executor.h>

namespace clouddrive
{

// Runs enqueued calls with bounded concurrency.
//
// A dispatcher can be shared by several services. Once shut down it
// stops accepting work: tasks queued afterwards, and tasks that were
// still waiting for a worker, are cancelled.
class Dispatcher
{
    common::TaskExecutor mExecutor;

public:
    explicit Dispatcher(const common::TaskExecutorFlags& flags = common::TaskExecutorFlags());

    Dispatcher(const Dispatcher& other) = delete;

    ~Dispatcher();

    Dispatcher& operator=(const Dispatcher& rhs) = delete;

    // Schedule function for execution on one of our workers.
    common::Task execute(std::function<void(const common::Task&)> function,
                         std::string label = std::string());

    // Query how the dispatcher's workers are managed.
    common::TaskExecutorFlags flags() const;

    // Has the dispatcher been shut down?
    bool isShutdown() const;

    // Stop accepting new work.
    void shutdown();

    // How many workers are alive right now?
    std::size_t workers() const;
}; // Dispatcher

using DispatcherPtr = std::shared_ptr<Dispatcher>;

} // clouddrive
