#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <clouddrive/call.h>

namespace clouddrive
{

using namespace std::chrono_literals;

using ::testing::_;
using ::testing::Invoke;

template<typename T>
class MockCallback
  : public Callback<T>
{
public:
    MOCK_METHOD(void, onComplete, (Call<T>& call, T result), (override));
    MOCK_METHOD(void, onFailure, (Call<T>& call, const Error& error), (override));
}; // MockCallback<T>

class CallTest
  : public ::testing::Test
{
protected:
    template<typename Operation>
    Call<int> call(Operation operation)
    {
        return makeCall<int>("test", std::move(operation), mDispatcher, mExecutor);
    }

    DispatcherPtr mDispatcher = std::make_shared<Dispatcher>();

    CallbackExecutorPtr mExecutor = inlineExecutor();
}; // CallTest

// Blocks a dispatcher's only worker until released.
class Plug
{
    std::promise<void> mRelease;
    std::shared_future<void> mReleased;
    std::promise<void> mStarted;

public:
    explicit Plug(Dispatcher& dispatcher)
      : mReleased(mRelease.get_future().share())
    {
        dispatcher.execute([released = mReleased, this](const common::Task&) {
            mStarted.set_value();
            released.wait();
        });

        mStarted.get_future().wait();
    }

    ~Plug()
    {
        release();
    }

    void release()
    {
        if (mReleased.wait_for(0s) != std::future_status::ready)
            mRelease.set_value();
    }
}; // Plug

static common::TaskExecutorFlags singleWorker()
{
    common::TaskExecutorFlags flags;

    flags.mMaxWorkers = 1;

    return flags;
}

TEST_F(CallTest, execute)
{
    auto c = call([](const Canceller&) -> ErrorOr<int> { return 42; });

    EXPECT_EQ(c.state(), CALL_STATE_IDLE);
    EXPECT_FALSE(c.isExecuted());
    EXPECT_EQ(c.description(), "test");

    auto result = c.execute();

    ASSERT_TRUE(result);
    EXPECT_EQ(*result, 42);
    EXPECT_TRUE(c.isExecuted());
    EXPECT_FALSE(c.isCancelled());
    EXPECT_EQ(c.state(), CALL_STATE_COMPLETED);
}

TEST_F(CallTest, execute_failure)
{
    auto c = call([](const Canceller&) -> ErrorOr<int> {
        return unexpected(apiError(2005, "Directory does not exist."));
    });

    auto result = c.execute();

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), 2005);
    EXPECT_EQ(c.state(), CALL_STATE_FAILED);
}

TEST_F(CallTest, execute_twice)
{
    auto runs = 0;
    auto c = call([&](const Canceller&) -> ErrorOr<int> { return ++runs; });

    EXPECT_TRUE(c.execute());

    auto again = c.execute();

    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().kind(), ERROR_KIND_STATE);
    EXPECT_EQ(again.error().code(), LOCAL_EEXECUTED);
    EXPECT_EQ(runs, 1);
    EXPECT_EQ(c.state(), CALL_STATE_COMPLETED);
}

TEST_F(CallTest, copies_share_state)
{
    auto c = call([](const Canceller&) -> ErrorOr<int> { return 1; });
    auto copy = c;

    EXPECT_TRUE(c.execute());
    EXPECT_TRUE(copy.isExecuted());
    EXPECT_EQ(copy.id(), c.id());
    EXPECT_FALSE(copy.execute());
}

TEST_F(CallTest, identifiers_are_unique)
{
    auto a = call([](const Canceller&) -> ErrorOr<int> { return 1; });
    auto b = call([](const Canceller&) -> ErrorOr<int> { return 1; });

    EXPECT_NE(a.id(), b.id());
}

TEST_F(CallTest, cancel_before_execute)
{
    auto runs = 0;
    auto c = call([&](const Canceller&) -> ErrorOr<int> { return ++runs; });

    c.cancel();
    c.cancel();

    EXPECT_TRUE(c.isCancelled());
    EXPECT_EQ(c.state(), CALL_STATE_CANCELLED);

    auto result = c.execute();

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind(), ERROR_KIND_CANCELLED);
    EXPECT_EQ(runs, 0);
}

TEST_F(CallTest, cancel_during_execute)
{
    std::promise<void> started;

    auto c = call([&](const Canceller& canceller) -> ErrorOr<int> {
        started.set_value();

        while (!canceller.triggered())
            std::this_thread::sleep_for(1ms);

        return 0;
    });

    std::thread canceller([&]() {
        started.get_future().wait();
        c.cancel();
    });

    auto result = c.execute();

    canceller.join();

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind(), ERROR_KIND_CANCELLED);
    EXPECT_EQ(c.state(), CALL_STATE_CANCELLED);
}

TEST_F(CallTest, cancel_after_completion)
{
    auto c = call([](const Canceller&) -> ErrorOr<int> { return 1; });

    EXPECT_TRUE(c.execute());

    c.cancel();

    EXPECT_EQ(c.state(), CALL_STATE_COMPLETED);
}

TEST_F(CallTest, exceptions_become_errors)
{
    auto c = call([](const Canceller&) -> ErrorOr<int> {
        throw std::runtime_error("operation failed");
    });

    auto result = c.execute();

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().kind(), ERROR_KIND_TRANSPORT);
    EXPECT_EQ(result.error().code(), LOCAL_EINTERNAL);
    EXPECT_EQ(c.state(), CALL_STATE_FAILED);
}

TEST_F(CallTest, enqueue_completes)
{
    auto callback = std::make_shared<MockCallback<int>>();
    std::promise<std::thread::id> delivered;

    EXPECT_CALL(*callback, onComplete(_, 7)).WillOnce(Invoke([&](Call<int>& c, int) {
        EXPECT_EQ(c.state(), CALL_STATE_COMPLETED);
        delivered.set_value(std::this_thread::get_id());
    }));
    EXPECT_CALL(*callback, onFailure(_, _)).Times(0);

    auto c = call([](const Canceller&) -> ErrorOr<int> { return 7; });

    c.enqueue(callback);

    auto waiter = delivered.get_future();

    ASSERT_EQ(waiter.wait_for(8s), std::future_status::ready);
    EXPECT_NE(waiter.get(), std::this_thread::get_id());
}

TEST_F(CallTest, enqueue_fails)
{
    std::promise<Error> delivered;

    auto c = call([](const Canceller&) -> ErrorOr<int> {
        return unexpected(apiError(2009, "File not found."));
    });

    c.enqueue([&](ErrorOr<int> result) {
        EXPECT_FALSE(result);

        if (!result)
            delivered.set_value(result.error());
    });

    auto waiter = delivered.get_future();

    ASSERT_EQ(waiter.wait_for(8s), std::future_status::ready);
    EXPECT_EQ(waiter.get().code(), 2009);
    EXPECT_EQ(c.state(), CALL_STATE_FAILED);
}

TEST_F(CallTest, enqueue_requires_callback)
{
    auto c = call([](const Canceller&) -> ErrorOr<int> { return 7; });

    EXPECT_THROW(c.enqueue(CallbackPtr<int>()), std::invalid_argument);
    EXPECT_THROW(c.enqueue(std::function<void(ErrorOr<int>)>()), std::invalid_argument);

    // The call is still usable.
    EXPECT_EQ(c.state(), CALL_STATE_IDLE);

    auto result = c.execute();

    ASSERT_TRUE(result);
    EXPECT_EQ(*result, 7);
}

TEST_F(CallTest, enqueue_twice)
{
    mDispatcher = std::make_shared<Dispatcher>(singleWorker());

    Plug plug(*mDispatcher);

    auto first = std::make_shared<MockCallback<int>>();
    auto second = std::make_shared<MockCallback<int>>();
    std::promise<void> completed;

    EXPECT_CALL(*first, onComplete(_, 1)).WillOnce(Invoke([&](Call<int>&, int) {
        completed.set_value();
    }));
    EXPECT_CALL(*second, onFailure(_, stateError(LOCAL_EEXECUTED, "Call has already been executed")));

    auto c = call([](const Canceller&) -> ErrorOr<int> { return 1; });

    c.enqueue(first);

    // Delivered right away on the inline executor.
    c.enqueue(second);

    plug.release();

    ASSERT_EQ(completed.get_future().wait_for(8s), std::future_status::ready);
}

TEST_F(CallTest, cancelled_calls_are_not_delivered)
{
    mDispatcher = std::make_shared<Dispatcher>(singleWorker());

    auto callback = std::make_shared<MockCallback<int>>();
    std::atomic<int> runs{0};

    EXPECT_CALL(*callback, onComplete(_, _)).Times(0);
    EXPECT_CALL(*callback, onFailure(_, _)).Times(0);

    auto c = call([&](const Canceller&) -> ErrorOr<int> { return ++runs; });

    {
        Plug plug(*mDispatcher);

        c.enqueue(callback);
        c.cancel();
    }

    // Make sure the dispatcher has processed the call.
    std::promise<void> drained;

    mDispatcher->execute([&](const common::Task&) { drained.set_value(); });

    ASSERT_EQ(drained.get_future().wait_for(8s), std::future_status::ready);
    EXPECT_EQ(runs, 0);
    EXPECT_EQ(c.state(), CALL_STATE_CANCELLED);
}

TEST_F(CallTest, enqueue_after_dispatcher_shutdown)
{
    mDispatcher->shutdown();

    auto callback = std::make_shared<MockCallback<int>>();

    EXPECT_CALL(*callback, onFailure(_, _)).WillOnce(Invoke([](Call<int>&, const Error& error) {
        EXPECT_EQ(error.kind(), ERROR_KIND_STATE);
        EXPECT_EQ(error.code(), LOCAL_ESHUTDOWN);
    }));

    auto c = call([](const Canceller&) -> ErrorOr<int> { return 1; });

    // The failure's delivered before enqueue returns.
    c.enqueue(callback);

    EXPECT_EQ(c.state(), CALL_STATE_FAILED);
}

TEST_F(CallTest, callback_exceptions_are_contained)
{
    std::promise<void> delivered;

    auto c = call([](const Canceller&) -> ErrorOr<int> { return 1; });

    c.enqueue([&](ErrorOr<int>) {
        delivered.set_value();
        throw std::runtime_error("callback failed");
    });

    ASSERT_EQ(delivered.get_future().wait_for(8s), std::future_status::ready);

    // The dispatcher's still usable.
    auto d = call([](const Canceller&) -> ErrorOr<int> { return 2; });

    std::promise<int> value;

    d.enqueue([&](ErrorOr<int> result) { value.set_value(result ? *result : -1); });

    auto waiter = value.get_future();

    ASSERT_EQ(waiter.wait_for(8s), std::future_status::ready);
    EXPECT_EQ(waiter.get(), 2);
}

TEST_F(CallTest, serial_executor_preserves_order)
{
    mExecutor = std::make_shared<SerialExecutor>();

    std::mutex lock;
    std::vector<int> order;
    std::promise<void> done;

    for (auto i = 0; i < 5; ++i)
    {
        mExecutor->execute([&, i]() {
            std::lock_guard<std::mutex> guard(lock);

            order.push_back(i);

            if (order.size() == 5)
                done.set_value();
        });
    }

    ASSERT_EQ(done.get_future().wait_for(8s), std::future_status::ready);
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
}

} // clouddrive
