/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_segreg_maths_Constants_h
#define INCLUDED_segreg_maths_Constants_h

#include <cstddef>

namespace segreg {
namespace maths {

//! The smallest number of samples a segment can hold for the fit to be
//! well posed.
constexpr std::size_t MINIMUM_SEGMENT_SIZE{2};

//! The default minimum number of samples in a segment.
constexpr std::size_t DEFAULT_MINIMUM_SEGMENT_SIZE{3};

//! The number of parameters of a single segment fit: slope and intercept.
constexpr std::size_t PARAMETERS_PER_SEGMENT{2};

//! The default relative precision of the residual sum of squares. Residuals
//! whose RMS is smaller than this fraction of the RMS ordinate are treated
//! as an exact fit.
constexpr double DEFAULT_PRECISION{1e-6};

//! The relative tolerance within which two scores are considered equal.
constexpr double EQUAL_SCORE_TOLERANCE{1e-12};

//! The floor for a noise variance estimate as a fraction of the mean square
//! of the ordinate in the space in which the noise is modelled.
constexpr double VARIANCE_FLOOR_FRACTION{1e-10};

//! The maximum condition number of the Gramian of a segment fit.
constexpr double MAXIMUM_CONDITION{1e15};
}
}

#endif // INCLUDED_segreg_maths_Constants_h
