#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <clouddrive/http.h>

namespace clouddrive
{

// Keeps cacheable responses in memory.
//
// Entries are evicted in least recently used order once the total size
// of the cached bodies exceeds the cache's capacity.
class ResponseCache
{
    struct Entry
    {
        std::chrono::steady_clock::time_point mExpiry;
        std::string mKey;
        HttpResponse mResponse;
    }; // Entry

    using EntryList = std::list<Entry>;

    // Remove an entry from the cache.
    void remove(EntryList::iterator position);

    // Has the cache been closed?
    bool mClosed;

    // Most recently used entries first.
    EntryList mEntries;

    // How many lookups have been satisfied?
    std::uint64_t mHits;

    // Quickly locates entries by key.
    std::unordered_map<std::string, EntryList::iterator> mIndex;

    // Serializes access to instance members.
    mutable std::mutex mLock;

    // How many bytes can we hold?
    const std::size_t mMaxSize;

    // How many lookups have gone unsatisfied?
    std::uint64_t mMisses;

    // How many bytes are we holding?
    std::size_t mSize;

public:
    explicit ResponseCache(std::size_t maxSize);

    ResponseCache(const ResponseCache& other) = delete;

    ResponseCache& operator=(const ResponseCache& rhs) = delete;

    // How long can response be cached for?
    //
    // Returns zero if the response can't be cached at all.
    static std::chrono::seconds maxAge(const HttpResponse& response);

    // Drop all entries and refuse any new ones.
    void close();

    bool closed() const;

    // Drop all entries.
    void evictAll();

    // Look up a response.
    std::optional<HttpResponse> get(const std::string& key);

    std::uint64_t hits() const;

    std::size_t maxSize() const;

    std::uint64_t misses() const;

    // Store a response if it's cacheable.
    //
    // Returns true if the response was stored.
    bool put(const std::string& key, const HttpResponse& response);

    // How many bytes are currently cached?
    std::size_t size() const;
}; // ResponseCache

using ResponseCachePtr = std::shared_ptr<ResponseCache>;

} // clouddrive
