#include <cctype>
#include <cstdlib>
#include <iterator>

#include <clouddrive/logging.h>
#include <clouddrive/response_cache.h>

namespace clouddrive
{

// Locate a directive in a Cache-Control header.
static const char* directive(const std::string& value, const char* name)
{
    auto length = std::char_traits<char>::length(name);

    for (auto position = value.find(name);
         position != std::string::npos;
         position = value.find(name, position + 1))
    {
        // Make sure we're not looking at the tail of another directive.
        if (position
            && (std::isalnum(static_cast<unsigned char>(value[position - 1]))
                || value[position - 1] == '-'))
            continue;

        auto next = value.c_str() + position + length;

        if (std::isalnum(static_cast<unsigned char>(*next)) || *next == '-')
            continue;

        return next;
    }

    return nullptr;
}

void ResponseCache::remove(EntryList::iterator position)
{
    mSize -= position->mResponse.mBody.size();

    mIndex.erase(position->mKey);
    mEntries.erase(position);
}

ResponseCache::ResponseCache(std::size_t maxSize)
  : mClosed(false)
  , mEntries()
  , mHits(0u)
  , mIndex()
  , mLock()
  , mMaxSize(maxSize)
  , mMisses(0u)
  , mSize(0u)
{
}

std::chrono::seconds ResponseCache::maxAge(const HttpResponse& response)
{
    auto* value = response.header("Cache-Control");

    // Response doesn't say that it can be cached.
    if (!value)
        return std::chrono::seconds(0);

    // Response says that it mustn't be cached.
    if (directive(*value, "no-store"))
        return std::chrono::seconds(0);

    auto* age = directive(*value, "max-age");

    if (!age || *age != '=')
        return std::chrono::seconds(0);

    auto seconds = std::strtol(age + 1, nullptr, 10);

    if (seconds <= 0)
        return std::chrono::seconds(0);

    return std::chrono::seconds(seconds);
}

void ResponseCache::close()
{
    std::lock_guard<std::mutex> guard(mLock);

    mClosed = true;
    mEntries.clear();
    mIndex.clear();
    mSize = 0;
}

bool ResponseCache::closed() const
{
    std::lock_guard<std::mutex> guard(mLock);

    return mClosed;
}

void ResponseCache::evictAll()
{
    std::lock_guard<std::mutex> guard(mLock);

    mEntries.clear();
    mIndex.clear();
    mSize = 0;
}

std::optional<HttpResponse> ResponseCache::get(const std::string& key)
{
    std::lock_guard<std::mutex> guard(mLock);

    auto i = mIndex.find(key);

    if (i == mIndex.end())
    {
        ++mMisses;
        return std::nullopt;
    }

    auto position = i->second;

    // Entry's gone stale.
    if (position->mExpiry <= std::chrono::steady_clock::now())
    {
        remove(position);

        ++mMisses;

        return std::nullopt;
    }

    // Entry's now the most recently used.
    mEntries.splice(mEntries.begin(), mEntries, position);

    ++mHits;

    return position->mResponse;
}

std::uint64_t ResponseCache::hits() const
{
    std::lock_guard<std::mutex> guard(mLock);

    return mHits;
}

std::size_t ResponseCache::maxSize() const
{
    return mMaxSize;
}

std::uint64_t ResponseCache::misses() const
{
    std::lock_guard<std::mutex> guard(mLock);

    return mMisses;
}

bool ResponseCache::put(const std::string& key, const HttpResponse& response)
{
    auto age = maxAge(response);

    // Response isn't cacheable.
    if (age.count() <= 0 || !response.successful())
        return false;

    // Response would never fit.
    if (response.mBody.size() > mMaxSize)
        return false;

    std::lock_guard<std::mutex> guard(mLock);

    if (mClosed)
        return false;

    // Replace any existing entry.
    auto i = mIndex.find(key);

    if (i != mIndex.end())
        remove(i->second);

    auto expiry = std::chrono::steady_clock::now() + age;

    mEntries.push_front(Entry{expiry, key, response});
    mIndex.emplace(key, mEntries.begin());
    mSize += response.mBody.size();

    // Evict least recently used entries until we're within capacity.
    while (mSize > mMaxSize)
        remove(std::prev(mEntries.end()));

    LOG_verbose << "Cached response for " << age.count() << "s (" << mSize << "/" << mMaxSize << " bytes)";

    return true;
}

std::size_t ResponseCache::size() const
{
    std::lock_guard<std::mutex> guard(mLock);

    return mSize;
}

} // clouddrive
