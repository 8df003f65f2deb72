/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_segreg_maths_CSegmentationErrors_h
#define INCLUDED_segreg_maths_CSegmentationErrors_h

#include <maths/ImportExport.h>

#include <stdexcept>
#include <string>

namespace segreg {
namespace maths {

//! \brief The base of the errors raised while fitting a segmented model.
//!
//! DESCRIPTION:\n
//! Callers which only need to know that a segmentation operation failed
//! can catch this. The search algorithms catch it to exclude a candidate
//! breakpoint without abandoning the search.
class MATHS_EXPORT CSegmentationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

//! \brief There are too few samples, or too few distinct abscissas, to fit
//! anything.
class MATHS_EXPORT CInsufficientDataError : public CSegmentationError {
public:
    using CSegmentationError::CSegmentationError;
};

//! \brief A segment can't be fitted.
//!
//! This is raised if a segment has fewer than two distinct abscissas, if its
//! Gramian is singular or if a value is outside the domain of the coordinate
//! transform, for example x <= 0 when fitting in log coordinates.
class MATHS_EXPORT CDegenerateSegmentError : public CSegmentationError {
public:
    using CSegmentationError::CSegmentationError;
};

//! \brief A breakpoint insertion or removal would leave an invalid
//! segmentation.
class MATHS_EXPORT CInvalidBreakpointError : public CSegmentationError {
public:
    using CSegmentationError::CSegmentationError;
};

//! \brief There is no breakpoint which can be removed.
class MATHS_EXPORT CNoBreakpointsError : public CSegmentationError {
public:
    using CSegmentationError::CSegmentationError;
};
}
}

#endif // INCLUDED_segreg_maths_CSegmentationErrors_h
