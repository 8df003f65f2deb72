/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_segreg_maths_CSegmentationScore_h
#define INCLUDED_segreg_maths_CSegmentationScore_h

#include <maths/Constants.h>
#include <maths/ImportExport.h>
#include <maths/MathsTypes.h>

#include <cstddef>
#include <iosfwd>
#include <string>

namespace segreg {
namespace maths {
class CBreakpointTree;
class CRegressionDataset;

//! \brief Computes the information criteria of a segmentation.
//!
//! DESCRIPTION:\n
//! For a segmentation with S segments and B = S - 1 breakpoints of n samples
//! with weighted residual sum of squares RSS, the maximum likelihood of the
//! data under Gaussian noise with variance proportional to 1 / w is
//! <pre class="fragment">
//!   \f$\log(L) = -\frac{n}{2}\left(\log\left(\frac{2\pi RSS}{n}\right) + 1\right) + \frac{1}{2}\sum_i{\log(w_i)}\f$
//! </pre>
//! The information criteria are then
//! <pre class="fragment">
//!   \f$BIC = n \log(RSS / n) + k \log(n)\f$
//!   \f$AIC = n \log(RSS / n) + 2 k\f$
//! </pre>
//! where k = 2 S + B + 1 counts the slope and intercept of each segment,
//! the location of each breakpoint and the noise scale. The constant terms
//! of -2 log(L) are dropped because they are equal for all segmentations of
//! the same data. Lower values are better.
//!
//! The RSS criterion is the size weighted mean of the segments' root mean
//! square residuals
//! <pre class="fragment">
//!   \f$\sum_s{\frac{n_s}{n}\sqrt{\frac{RSS_s}{n_s}}}\f$
//! </pre>
//! which doesn't penalise extra parameters, so growth is only limited by
//! the segment size, depth and breakpoint limits and by the precision.
//!
//! IMPLEMENTATION DECISIONS:\n
//! The RSS is floored at n (eps s)^2 where s^2 is the mean square ordinate
//! and eps a relative precision. Without this, segmentations which fit the
//! data exactly up to round off have arbitrarily large negative scores
//! determined by the round off. Each segment's RSS is floored at its share
//! of this, n_s / n of it, for the RSS criterion.
class MATHS_EXPORT CSegmentationScore {
public:
    //! \brief The score of a segmentation.
    struct MATHS_EXPORT SScore {
        //! Get the value of \p criterion.
        double value(maths_t::EInfoCriterion criterion) const;

        std::string print() const;

        //! The floored weighted residual sum of squares.
        double s_Rss{0.0};
        std::size_t s_Count{0};
        std::size_t s_Parameters{0};
        double s_LogLikelihood{0.0};
        double s_Bic{0.0};
        double s_Aic{0.0};
        //! The size weighted mean root mean square residual.
        double s_RootMse{0.0};
    };

public:
    CSegmentationScore(const CRegressionDataset& dataset, double precision = DEFAULT_PRECISION);

    //! Score a segmentation with \p segments segments, total weighted
    //! residual sum of squares \p rss and size weighted root mean square
    //! residual \p rootMse.
    SScore score(double rss, double rootMse, std::size_t segments) const;

    //! Score the segmentation \p tree.
    SScore score(const CBreakpointTree& tree) const;

    //! Get the contribution of a segment with \p count samples and weighted
    //! residual sum of squares \p rss to the size weighted root mean square
    //! residual.
    double rootMse(double rss, std::size_t count) const;

    //! Get the size weighted root mean square residual of \p tree.
    double rootMse(const CBreakpointTree& tree) const;

    //! Get the number of parameters of a segmentation with \p segments segments.
    static std::size_t numberParameters(std::size_t segments);

    //! Check if two scores are equal to within a small relative tolerance.
    static bool equivalent(double lhs, double rhs);

    //! Get the residual sum of squares floor.
    double rssFloor() const { return m_RssFloor; }

private:
    double m_Count;
    double m_SumLogWeights;
    double m_RssFloor;
};

MATHS_EXPORT
std::ostream& operator<<(std::ostream& strm, const CSegmentationScore::SScore& score);
}
}

#endif // INCLUDED_segreg_maths_CSegmentationScore_h
