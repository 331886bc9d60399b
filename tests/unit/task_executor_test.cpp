#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <string>
#include <stdexcept>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include <clouddrive/common/logger.h>
#include <clouddrive/common/task_executor.h>
#include <clouddrive/common/task_queue.h>
#include <clouddrive/logging.h>

namespace clouddrive
{
namespace common
{

using namespace std::chrono_literals;

TEST(TaskQueue, dequeue_preserves_order)
{
    TaskQueue queue;
    std::vector<int> order;

    for (auto i = 0; i < 3; ++i)
        queue.queue(Task([&order, i](const Task&) { order.push_back(i); }, callLogger()));

    EXPECT_EQ(queue.size(), 3u);

    while (!queue.empty())
        queue.dequeue().complete();

    EXPECT_EQ(order, (std::vector<int>{0, 1, 2}));
}

TEST(TaskQueue, destruction_cancels_outstanding_tasks)
{
    auto cancelled = false;

    {
        TaskQueue queue;

        queue.queue(Task([&](const Task& task) {
            cancelled = task.cancelled();
        }, callLogger()));
    }

    EXPECT_TRUE(cancelled);
}

TEST(TaskQueue, completed_tasks_are_not_queued)
{
    TaskQueue queue;
    Task task([](const Task&) { }, callLogger());

    EXPECT_TRUE(task.complete());
    EXPECT_FALSE(task.cancel());

    queue.queue(task);

    EXPECT_TRUE(queue.empty());
}

TEST(Task, runs_once)
{
    auto count = 0;

    Task task([&](const Task&) { ++count; }, callLogger());

    EXPECT_TRUE(task.complete());
    EXPECT_FALSE(task.complete());
    EXPECT_FALSE(task.cancel());
    EXPECT_TRUE(task.completed());
    EXPECT_FALSE(task.cancelled());
    EXPECT_EQ(count, 1);
}

TEST(Task, exceptions_are_contained)
{
    Task task([](const Task&) {
        throw std::runtime_error("bang");
    }, callLogger());

    EXPECT_TRUE(task.complete());
    EXPECT_TRUE(task.completed());
}

// Collects what a logger emits while in scope.
class LogCapture
{
    LogLevel mLevel;
    std::mutex mLock;
    std::vector<std::string> mMessages;

public:
    explicit LogCapture(LogLevel level)
      : mLevel(SimpleLogger::getLogLevel())
    {
        SimpleLogger::setLogLevel(level);

        g_externalLogger.addLogger(this, [this](const char*,
                                                int,
                                                const char*,
                                                const char* message) {
            std::lock_guard<std::mutex> guard(mLock);
            mMessages.emplace_back(message);
        });
    }

    ~LogCapture()
    {
        g_externalLogger.removeLogger(this);

        SimpleLogger::setLogLevel(mLevel);
    }

    bool contains(const std::string& text)
    {
        std::lock_guard<std::mutex> guard(mLock);

        for (auto& message : mMessages)
        {
            if (message.find(text) != std::string::npos)
                return true;
        }

        return false;
    }
}; // LogCapture

TEST(Task, exceptions_are_logged_with_label)
{
    LogCapture capture(logError);
    Logger logger("Tasks");

    Task task([](const Task&) {
        throw std::runtime_error("bang");
    }, logger, "call 3 (stat)");

    EXPECT_EQ(task.label(), "call 3 (stat)");
    EXPECT_TRUE(task.complete());
    EXPECT_TRUE(capture.contains("Tasks"));
    EXPECT_TRUE(capture.contains("Task call 3 (stat) threw: bang"));
}

TEST(Logger, own_level_masks_messages)
{
    LogCapture capture(logDebug);
    Logger logger("Quiet", logWarning);

    EXPECT_TRUE(logger.masked(logDebug));
    EXPECT_FALSE(logger.masked(logError));

    logger.emitf(logDebug, "test.cpp", 1, "hidden %d", 1);
    logger.emitf(logError, "test.cpp", 2, "shown %d", 2);

    EXPECT_FALSE(capture.contains("hidden 1"));
    EXPECT_TRUE(capture.contains("shown 2"));

    logger.level(logDebug);
    logger.emitf(logDebug, "test.cpp", 3, "revealed %s", "now");

    EXPECT_TRUE(capture.contains("revealed now"));
}

TEST(Logger, global_level_still_applies)
{
    LogCapture capture(logError);
    Logger logger("Loud", logVerbose);

    EXPECT_TRUE(logger.masked(logInfo));

    logger.emit(logInfo, "test.cpp", 1, "suppressed");

    EXPECT_FALSE(capture.contains("suppressed"));
}

TEST(TaskExecutor, executes_tasks)
{
    TaskExecutor executor(TaskExecutorFlags(), callLogger());

    std::promise<std::thread::id> executed;

    auto task = executor.execute([&](const Task& task) {
        EXPECT_FALSE(task.cancelled());
        executed.set_value(std::this_thread::get_id());
    }, true);

    auto waiter = executed.get_future();

    ASSERT_EQ(waiter.wait_for(8s), std::future_status::ready);
    EXPECT_NE(waiter.get(), std::this_thread::get_id());
}

TEST(TaskExecutor, respects_maximum_workers)
{
    TaskExecutorFlags flags;

    flags.mMaxWorkers = 2;

    TaskExecutor executor(flags, callLogger());

    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    std::atomic<int> finished{0};

    for (auto i = 0; i < 8; ++i)
    {
        executor.execute([&](const Task&) {
            auto current = ++running;

            for (auto expected = peak.load(); current > expected; )
            {
                if (peak.compare_exchange_weak(expected, current))
                    break;
            }

            std::this_thread::sleep_for(10ms);

            --running;
            ++finished;
        }, true);
    }

    for (auto i = 0; finished < 8 && i < 800; ++i)
        std::this_thread::sleep_for(10ms);

    EXPECT_EQ(finished, 8);
    EXPECT_LE(peak, 2);
    EXPECT_LE(executor.workers(), 2u);
}

TEST(TaskExecutor, shutdown_cancels_queued_tasks)
{
    TaskExecutorFlags flags;

    flags.mMaxWorkers = 1;

    TaskExecutor executor(flags, callLogger());

    std::mutex lock;
    std::condition_variable cv;
    bool started = false;
    bool release = false;

    executor.execute([&](const Task&) {
        std::unique_lock<std::mutex> guard(lock);

        started = true;
        cv.notify_all();

        cv.wait(guard, [&]() { return release; });
    }, true);

    {
        std::unique_lock<std::mutex> guard(lock);
        ASSERT_TRUE(cv.wait_for(guard, 8s, [&]() { return started; }));
    }

    std::atomic<bool> cancelled{false};

    auto queued = executor.execute([&](const Task& task) {
        cancelled = task.cancelled();
    }, false);

    std::thread releaser([&]() {
        std::this_thread::sleep_for(20ms);

        std::lock_guard<std::mutex> guard(lock);

        release = true;
        cv.notify_all();
    });

    executor.shutdown();
    releaser.join();

    EXPECT_TRUE(queued.cancelled());
    EXPECT_TRUE(cancelled);
    EXPECT_TRUE(executor.terminating());

    // Shutting down again is harmless.
    executor.shutdown();

    // New tasks are cancelled immediately.
    auto late = executor.execute([](const Task&) { }, true);

    EXPECT_TRUE(late.cancelled());
}

TEST(TaskExecutor, shutdown_from_worker)
{
    auto executor = std::make_unique<TaskExecutor>(TaskExecutorFlags(), callLogger());

    std::promise<void> done;

    executor->execute([&](const Task&) {
        executor->shutdown();
        done.set_value();
    }, true);

    auto waiter = done.get_future();

    ASSERT_EQ(waiter.wait_for(8s), std::future_status::ready);
    EXPECT_TRUE(executor->terminating());
}

TEST(TaskExecutor, idle_workers_retire)
{
    TaskExecutorFlags flags;

    flags.mIdleTime = 1s;

    TaskExecutor executor(flags, callLogger());

    std::promise<void> done;

    executor.execute([&](const Task&) { done.set_value(); }, true);

    ASSERT_EQ(done.get_future().wait_for(8s), std::future_status::ready);

    for (auto i = 0; executor.workers() && i < 400; ++i)
        std::this_thread::sleep_for(10ms);

    EXPECT_EQ(executor.workers(), 0u);
}

} // common
} // clouddrive
