#include <atomic>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include <clouddrive/canceller.h>

using ::clouddrive::Canceller;

TEST(Canceller, not_triggered_until_cancelled)
{
    auto canceller = std::make_shared<Canceller>();

    EXPECT_FALSE(canceller->triggered());

    EXPECT_TRUE(canceller->cancel());
    EXPECT_TRUE(canceller->triggered());
}

TEST(Canceller, only_first_cancel_reports_trigger)
{
    auto canceller = std::make_shared<Canceller>();

    EXPECT_TRUE(canceller->cancel());
    EXPECT_FALSE(canceller->cancel());
    EXPECT_TRUE(canceller->triggered());
}

TEST(Canceller, concurrent_cancels_trigger_once)
{
    auto canceller = std::make_shared<Canceller>();
    std::atomic<int> triggers{0};
    std::vector<std::thread> threads;

    for (auto i = 0; i < 8; ++i)
    {
        threads.emplace_back([&]() {
            if (canceller->cancel())
                ++triggers;
        });
    }

    for (auto& thread : threads)
        thread.join();

    EXPECT_EQ(triggers, 1);
}
