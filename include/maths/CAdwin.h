/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License
 * 2.0 and the following additional limitation. Functionality enabled by the
 * files subject to the Elastic License 2.0 may only be used in production when
 * invoked by an Elasticsearch process with a license key installed that permits
 * use of machine learning features. You may not use this file except in
 * compliance with the Elastic License 2.0 and the foregoing additional
 * limitation.
 */

#ifndef INCLUDED_axgb_maths_CAdwin_h
#define INCLUDED_axgb_maths_CAdwin_h

#include <maths/CDriftMonitor.h>
#include <maths/ImportExport.h>

#include <cstddef>
#include <deque>
#include <string>
#include <vector>

namespace axgb {
namespace maths {

//! \brief ADaptive WINdowing change detection.
//!
//! DESCRIPTION:\n
//! Implements ADWIN of Bifet and Gavalda, "Learning from Time-Changing Data
//! with Adaptive Windowing", SDM 2007. It maintains a window of the recent
//! observations whose length adapts: whenever two sufficiently large
//! subwindows have means which differ by more than a bound depending on
//! their sizes and the confidence \f$\delta\f$, the older part is dropped.
//!
//! IMPLEMENTATION:\n
//! The window is summarised by an exponential histogram. Row i of the
//! histogram holds buckets each summarising \f$2^i\f$ observations by their
//! total and variance. A row holds at most maximumBuckets() buckets. When it
//! overflows its two oldest buckets are merged and moved to the next row,
//! so memory is logarithmic in the window length. Cuts are only tested
//! every clock() observations.
class MATHS_EXPORT CAdwin final : public CDriftMonitor {
public:
    static const double DEFAULT_DELTA;
    static const std::size_t DEFAULT_CLOCK;
    static const std::size_t DEFAULT_MAXIMUM_BUCKETS;
    static const std::size_t DEFAULT_MINIMUM_WINDOW_LENGTH;
    static const std::size_t DEFAULT_MINIMUM_SUBWINDOW_LENGTH;

public:
    explicit CAdwin(double delta = DEFAULT_DELTA,
                    std::size_t clock = DEFAULT_CLOCK,
                    std::size_t maximumBuckets = DEFAULT_MAXIMUM_BUCKETS,
                    std::size_t minimumWindowLength = DEFAULT_MINIMUM_WINDOW_LENGTH,
                    std::size_t minimumSubwindowLength = DEFAULT_MINIMUM_SUBWINDOW_LENGTH);

    void add(double bit) override;
    bool changeDetected() const override;
    std::size_t width() const override;
    double estimation() const override;
    std::size_t memoryUsage() const override;

    //! Get the total of the observations in the window.
    double total() const;

    //! Get the sum of squared deviations from the window mean.
    double variance() const;

    //! Get the number of buckets in the histogram.
    std::size_t numberBuckets() const;

    //! Get the number of histogram rows.
    std::size_t numberRows() const;

    //! Get the number of observations between cut checks.
    std::size_t clock() const;

    //! Get the maximum number of buckets per histogram row.
    std::size_t maximumBuckets() const;

    //! Get a debug description of the histogram.
    std::string print() const;

private:
    //! \brief A bucket summarising a run of consecutive observations.
    struct SBucket {
        double s_Total;
        double s_Variance;
    };
    //! Front is newest.
    using TBucketDeque = std::deque<SBucket>;
    using TBucketDequeVec = std::vector<TBucketDeque>;

private:
    //! Get the number of observations in each bucket of \p row.
    static double bucketSize(std::size_t row);

    //! Merge buckets to restore the row size constraint.
    void compress();

    //! Look for a cut and if one is found drop the oldest bucket.
    bool detectAndCut();

    //! Drop the oldest bucket.
    void dropOldestBucket();

private:
    double m_Delta;
    std::size_t m_Clock;
    std::size_t m_MaximumBuckets;
    std::size_t m_MinimumWindowLength;
    std::size_t m_MinimumSubwindowLength;

    TBucketDequeVec m_Rows;
    std::size_t m_Width = 0;
    double m_Total = 0.0;
    double m_Variance = 0.0;
    std::size_t m_NumberBuckets = 0;
    std::size_t m_Ticks = 0;
    bool m_ChangeDetected = false;
};
}
}

#endif // INCLUDED_axgb_maths_CAdwin_h
