#include <algorithm>
#include <cassert>

#include <clouddrive/progress_throttle.h>

namespace clouddrive
{

ProgressThrottle::ProgressThrottle(m_off_t threshold, m_off_t total)
  : mReported(-1)
  , mThreshold(threshold)
  , mTotal(total)
  , mTransferred(0)
{
    // Sanity.
    assert(threshold > 0);
}

bool ProgressThrottle::advance(m_off_t count)
{
    // Sanity.
    assert(count >= 0);

    mTransferred += count;

    auto transferred = this->transferred();

    // Known totals are only ever reported by finish().
    if (mTotal >= 0 && transferred >= mTotal)
        return false;

    // Not enough progress since we last reported.
    if (transferred - std::max<m_off_t>(mReported, 0) < mThreshold)
        return false;

    mReported = transferred;

    return true;
}

m_off_t ProgressThrottle::finish()
{
    mReported = transferred();

    return mReported;
}

m_off_t ProgressThrottle::reported() const
{
    return mReported;
}

m_off_t ProgressThrottle::threshold() const
{
    return mThreshold;
}

m_off_t ProgressThrottle::total() const
{
    return mTotal;
}

m_off_t ProgressThrottle::transferred() const
{
    if (mTotal >= 0)
        return std::min(mTransferred, mTotal);

    return mTransferred;
}

} // clouddrive
