#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>

namespace clouddrive
{

// Shares connections, DNS lookups and TLS sessions between exchanges.
class ConnectionPool
{
public:
    // The state shared between exchanges.
    class Share;

    using SharePtr = std::shared_ptr<Share>;

private:
    // How many times have we been asked to evict our connections?
    std::uint64_t mEvictions;

    // How long can a connection sit idle before it's closed?
    const std::chrono::seconds mKeepAlive;

    // Serializes access to instance members.
    mutable std::mutex mLock;

    // How many idle connections do we keep?
    const std::size_t mMaxIdleConnections;

    // Created on demand.
    SharePtr mShare;

public:
    explicit ConnectionPool(std::size_t maxIdleConnections = 5,
                            std::chrono::seconds keepAlive = std::chrono::minutes(5));

    ConnectionPool(const ConnectionPool& other) = delete;

    ~ConnectionPool();

    ConnectionPool& operator=(const ConnectionPool& rhs) = delete;

    // Close all idle connections.
    //
    // Exchanges in progress keep their connection until they complete.
    void evictAll();

    std::uint64_t evictions() const;

    std::chrono::seconds keepAlive() const;

    std::size_t maxIdleConnections() const;

    // Retrieve the current share.
    SharePtr share();
}; // ConnectionPool

using ConnectionPoolPtr = std::shared_ptr<ConnectionPool>;

} // clouddrive
