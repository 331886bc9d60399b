#include <chrono>
#include <string>
#include <thread>

#include <gtest/gtest.h>

#include <clouddrive/response_cache.h>

namespace clouddrive
{

static HttpResponse cacheable(std::string body, const char* control = "max-age=60")
{
    HttpResponse response;

    response.mBody = std::move(body);
    response.mHeaders.emplace_back("Cache-Control", control);
    response.mStatus = 200;

    return response;
}

TEST(ResponseCache, max_age)
{
    EXPECT_EQ(ResponseCache::maxAge(cacheable("", "max-age=60")).count(), 60);
    EXPECT_EQ(ResponseCache::maxAge(cacheable("", "public, max-age=5")).count(), 5);
    EXPECT_EQ(ResponseCache::maxAge(cacheable("", "no-store, max-age=60")).count(), 0);
    EXPECT_EQ(ResponseCache::maxAge(cacheable("", "s-max-age=60")).count(), 0);
    EXPECT_EQ(ResponseCache::maxAge(cacheable("", "no-cache")).count(), 0);
    EXPECT_EQ(ResponseCache::maxAge(HttpResponse()).count(), 0);
}

TEST(ResponseCache, hits_and_misses)
{
    ResponseCache cache(1024);

    EXPECT_FALSE(cache.get("a"));
    EXPECT_TRUE(cache.put("a", cacheable("alpha")));

    auto response = cache.get("a");

    ASSERT_TRUE(response);
    EXPECT_EQ(response->mBody, "alpha");
    EXPECT_EQ(cache.hits(), 1u);
    EXPECT_EQ(cache.misses(), 1u);
    EXPECT_EQ(cache.size(), 5u);
}

TEST(ResponseCache, uncacheable_responses)
{
    ResponseCache cache(1024);

    auto failed = cacheable("error");

    failed.mStatus = 500;

    EXPECT_FALSE(cache.put("a", failed));
    EXPECT_FALSE(cache.put("b", cacheable("x", "no-store")));
    EXPECT_FALSE(cache.put("c", cacheable(std::string(2048, 'x'))));
    EXPECT_EQ(cache.size(), 0u);
}

TEST(ResponseCache, evicts_least_recently_used)
{
    ResponseCache cache(10);

    EXPECT_TRUE(cache.put("a", cacheable("aaaa")));
    EXPECT_TRUE(cache.put("b", cacheable("bbbb")));

    // Make "a" the most recently used.
    EXPECT_TRUE(cache.get("a"));

    EXPECT_TRUE(cache.put("c", cacheable("cccc")));

    EXPECT_TRUE(cache.get("a"));
    EXPECT_FALSE(cache.get("b"));
    EXPECT_TRUE(cache.get("c"));
    EXPECT_EQ(cache.size(), 8u);
}

TEST(ResponseCache, entries_expire)
{
    ResponseCache cache(1024);

    EXPECT_TRUE(cache.put("a", cacheable("alpha", "max-age=1")));

    std::this_thread::sleep_for(std::chrono::milliseconds(1100));

    EXPECT_FALSE(cache.get("a"));
    EXPECT_EQ(cache.size(), 0u);
}

TEST(ResponseCache, close)
{
    ResponseCache cache(1024);

    EXPECT_TRUE(cache.put("a", cacheable("alpha")));

    cache.close();

    EXPECT_TRUE(cache.closed());
    EXPECT_FALSE(cache.get("a"));
    EXPECT_FALSE(cache.put("a", cacheable("alpha")));
}

TEST(ResponseCache, evict_all)
{
    ResponseCache cache(1024);

    EXPECT_TRUE(cache.put("a", cacheable("alpha")));

    cache.evictAll();

    EXPECT_FALSE(cache.closed());
    EXPECT_FALSE(cache.get("a"));
    EXPECT_TRUE(cache.put("a", cacheable("alpha")));
}

} // clouddrive
