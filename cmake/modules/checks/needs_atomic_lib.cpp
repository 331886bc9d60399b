// Some toolchains need libatomic for 64-bit atomics.

#include <atomic>
#include <cstdint>

int main()
{
    std::atomic<std::uint64_t> counter{};
    std::uint64_t delta = 7;
    auto previous = counter.fetch_add(delta);
    return static_cast<int>(previous);
}
