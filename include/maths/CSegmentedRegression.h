/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_segreg_maths_CSegmentedRegression_h
#define INCLUDED_segreg_maths_CSegmentedRegression_h

#include <maths/CSegmentedModel.h>
#include <maths/CSegmentedRegressionParams.h>
#include <maths/ImportExport.h>
#include <maths/MathsTypes.h>

namespace segreg {
namespace maths {

//! \brief Fits segmented regression models.
//!
//! DESCRIPTION:\n
//! This is the entry point for fitting. It prepares the dataset, estimates
//! the noise model and grows a segmentation top down, for example
//! \code{.cpp}
//! CSegmentedModel model{CSegmentedRegression::computeRegression(x, y, maths_t::E_Log)};
//! CSegmentedModel simplest{model.autoSimplify()};
//! \endcode
//!
//! IMPLEMENTATION DECISIONS:\n
//! The breakpoint search uses the default async executor if it has been
//! started with core::startDefaultAsyncExecutor and the results don't
//! depend on whether it has.
class MATHS_EXPORT CSegmentedRegression {
public:
    using TDoubleVec = maths_t::TDoubleVec;
    using TDoubleDoublePrVec = maths_t::TDoubleDoublePrVec;

public:
    //! Fit a segmented regression of \p y on \p x.
    //!
    //! \throws std::invalid_argument if \p x and \p y have different lengths
    //! or contain a value which isn't finite.
    //! \throws CInsufficientDataError if there are no samples or fewer than
    //! two distinct x values.
    //! \throws CDegenerateSegmentError if a value is outside the domain of
    //! \p mode.
    static CSegmentedModel
    computeRegression(const TDoubleVec& x,
                      const TDoubleVec& y,
                      maths_t::ERegressionMode mode,
                      const CSegmentedRegressionParams& params = CSegmentedRegressionParams{});

    //! Fit a segmented regression to the (x, y) pairs \p samples.
    static CSegmentedModel
    computeRegression(TDoubleDoublePrVec samples,
                      maths_t::ERegressionMode mode,
                      const CSegmentedRegressionParams& params = CSegmentedRegressionParams{});
};
}
}

#endif // INCLUDED_segreg_maths_CSegmentedRegression_h
