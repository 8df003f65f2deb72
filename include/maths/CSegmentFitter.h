/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_segreg_maths_CSegmentFitter_h
#define INCLUDED_segreg_maths_CSegmentFitter_h

#include <maths/CWeightedLinearRegression.h>
#include <maths/Constants.h>
#include <maths/ImportExport.h>

#include <cstddef>
#include <string>

namespace segreg {
namespace maths {
class CRegressionDataset;

//! \brief Fits a single straight line to a contiguous range of samples.
//!
//! DESCRIPTION:\n
//! The fit is a weighted least squares fit in the fitting coordinates of
//! the dataset. The result retains the regression sufficient statistics so
//! fits of adjacent ranges can be combined without revisiting the samples.
class MATHS_EXPORT CSegmentFitter {
public:
    //! \brief The fit of one segment.
    struct MATHS_EXPORT SFit {
        //! Get the fitted value at \p fx in fitting coordinates.
        double predict(double fx) const { return s_Intercept + s_Slope * fx; }

        //! Get the number of parameters of the fit.
        std::size_t numberParameters() const { return PARAMETERS_PER_SEGMENT; }

        //! Get the total weight of the samples fitted.
        double weight() const { return s_Regression.weight(); }

        std::string print() const;

        CWeightedLinearRegression s_Regression;
        double s_Slope{0.0};
        double s_Intercept{0.0};
        //! The weighted residual sum of squares.
        double s_Rss{0.0};
        std::size_t s_Count{0};
    };

public:
    //! Accumulate the regression statistics of the samples [\p begin, \p end).
    static CWeightedLinearRegression
    accumulate(const CRegressionDataset& dataset, std::size_t begin, std::size_t end);

    //! Fit the samples [\p begin, \p end).
    //!
    //! \throws CDegenerateSegmentError if the range has fewer than two
    //! distinct abscissas or the fit is ill-conditioned.
    static SFit fit(const CRegressionDataset& dataset, std::size_t begin, std::size_t end);

    //! Fit from the sufficient statistics \p regression.
    //!
    //! \return False if the fit is ill-conditioned in which case \p result
    //! is unchanged.
    static bool tryFit(const CWeightedLinearRegression& regression, SFit& result);
};
}
}

#endif // INCLUDED_segreg_maths_CSegmentFitter_h
