/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_segreg_maths_CBreakpointTree_h
#define INCLUDED_segreg_maths_CBreakpointTree_h

#include <maths/CRegressionDataset.h>
#include <maths/CSegmentFitter.h>
#include <maths/Constants.h>
#include <maths/ImportExport.h>
#include <maths/MathsTypes.h>

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace segreg {
namespace maths {

//! \brief A partition of the range of a dataset's abscissas into fitted
//! segments.
//!
//! DESCRIPTION:\n
//! The segments are stored in a map keyed by their lower boundary. The first
//! segment's lower boundary is the smallest abscissa and every other lower
//! boundary is a breakpoint. A sample with abscissa x belongs to the segment
//! [lower, upper) containing x, except that the last segment also contains
//! the largest abscissa.
//!
//! Every segment holds the fit of its samples. Inserting or removing a
//! breakpoint refits the affected segments from the samples so the fits are
//! never stale.
//!
//! IMPLEMENTATION DECISIONS:\n
//! This is a value type: copies share the immutable dataset but not the
//! segments. Insert and remove offer the strong exception guarantee.
class MATHS_EXPORT CBreakpointTree {
public:
    using TDoubleVec = maths_t::TDoubleVec;

    //! \brief A fitted segment.
    struct MATHS_EXPORT SSegment {
        //! Get the number of samples.
        std::size_t size() const { return s_End - s_Begin; }

        std::string print() const;

        //! The index range [s_Begin, s_End) of the samples.
        std::size_t s_Begin{0};
        std::size_t s_End{0};
        double s_Lower{0.0};
        double s_Upper{0.0};
        //! The number of splits which created this segment.
        std::size_t s_Depth{0};
        CSegmentFitter::SFit s_Fit;
    };
    using TSegmentVec = std::vector<SSegment>;

public:
    //! Create a single segment spanning \p dataset.
    //!
    //! \throws CDegenerateSegmentError if the dataset can't be fitted.
    CBreakpointTree(TDatasetCPtr dataset, std::size_t minimumSegmentSize = DEFAULT_MINIMUM_SEGMENT_SIZE);

    //! Insert the breakpoint \p breakpoint.
    //!
    //! \throws CInvalidBreakpointError if \p breakpoint isn't finite, exists,
    //! isn't strictly inside the abscissa range or would leave a segment with
    //! fewer than the minimum number of samples.
    //! \throws CDegenerateSegmentError if either new segment can't be fitted.
    void insert(double breakpoint);

    //! Remove the breakpoint \p breakpoint.
    //!
    //! \throws CInvalidBreakpointError if \p breakpoint doesn't exist.
    void remove(double breakpoint);

    //! Check if \p breakpoint is a breakpoint.
    bool contains(double breakpoint) const;

    //! Get the breakpoints in increasing order.
    TDoubleVec breakpoints() const;

    //! Get the segments in increasing order.
    TSegmentVec segments() const;

    //! Get the segment containing \p x.
    //!
    //! Values outside the abscissa range belong to the nearest end segment.
    const SSegment& segmentFor(double x) const;

    std::size_t numberSegments() const { return m_Segments.size(); }
    std::size_t numberBreakpoints() const { return m_Segments.size() - 1; }

    //! Get the total weighted residual sum of squares of the segment fits.
    double rss() const;

    //! Recompute the weighted residual sum of squares from the samples.
    double computeRss() const;

    //! Get the minimum number of samples in a segment.
    std::size_t minimumSegmentSize() const { return m_MinimumSegmentSize; }

    //! Check the segments exactly cover the dataset and are consistent
    //! with their breakpoints.
    bool checkInvariants() const;

    const CRegressionDataset& dataset() const { return *m_Dataset; }
    const TDatasetCPtr& datasetPtr() const { return m_Dataset; }

    std::string print() const;

private:
    using TDoubleSegmentMap = std::map<double, SSegment>;

private:
    TDatasetCPtr m_Dataset;
    std::size_t m_MinimumSegmentSize;
    TDoubleSegmentMap m_Segments;
};
}
}

#endif // INCLUDED_segreg_maths_CBreakpointTree_h
