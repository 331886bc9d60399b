#pragma once

#include <atomic>
#include <memory>

namespace clouddrive
{

// Lets long running work know that it should stop at the next
// convenient point.
//
// Cancellers are always managed by a std::shared_ptr so that work
// scheduled elsewhere can keep observing them.
class Canceller
  : public std::enable_shared_from_this<Canceller>
{
    std::atomic<bool> mTriggered;

public:
    Canceller() noexcept;

    Canceller(const Canceller&) = delete;

    Canceller& operator=(const Canceller&) = delete;

    // Trigger the canceller.
    //
    // Returns true if this call triggered the canceller.
    bool cancel() noexcept;

    // Has the canceller been triggered?
    bool triggered() const noexcept;
}; // Canceller

using CancellerPtr = std::shared_ptr<Canceller>;

} // clouddrive
