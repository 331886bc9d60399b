#include <clouddrive/canceller.h>

namespace clouddrive
{

Canceller::Canceller() noexcept
  : mTriggered{false}
{
}

bool Canceller::cancel() noexcept
{
    return !mTriggered.exchange(true, std::memory_order_acq_rel);
}

bool Canceller::triggered() const noexcept
{
    return mTriggered.load(std::memory_order_acquire);
}

} // clouddrive
