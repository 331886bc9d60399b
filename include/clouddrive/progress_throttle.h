#pragma once

#include <clouddrive/types.h>

namespace clouddrive
{

// Decides when a transfer's progress is worth reporting.
//
// Intermediate reports are at least mThreshold bytes apart and never
// reach a known total: that value is reserved for the final report.
class ProgressThrottle
{
    // Last value we decided to report.
    m_off_t mReported;

    // Minimum distance between intermediate reports.
    const m_off_t mThreshold;

    // How many bytes will be transferred in total?
    const m_off_t mTotal;

    // How many bytes have been transferred so far?
    m_off_t mTransferred;

public:
    ProgressThrottle(m_off_t threshold, m_off_t total);

    // Account for count more bytes.
    //
    // Returns true if the new total should be reported.
    bool advance(m_off_t count);

    // Transfer's complete: returns the value of the final report.
    m_off_t finish();

    // Last value reported, -1 if nothing's been reported.
    m_off_t reported() const;

    m_off_t threshold() const;

    m_off_t total() const;

    // How many bytes should we claim have been transferred?
    //
    // Never exceeds a known total.
    m_off_t transferred() const;
}; // ProgressThrottle

} // clouddrive
