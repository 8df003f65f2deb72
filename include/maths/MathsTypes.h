/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_segreg_maths_MathsTypes_h
#define INCLUDED_segreg_maths_MathsTypes_h

#include <maths/ImportExport.h>

#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace segreg {
namespace maths_t {

using TDoubleVec = std::vector<double>;
using TDoubleDoublePr = std::pair<double, double>;
using TDoubleDoublePrVec = std::vector<TDoubleDoublePr>;

//! An enumeration of the coordinate systems in which segments are fitted.
//!
//! The possible values are:
//!   -# Linear: which fits y = a x + b.
//!   -# Log: which fits log(y) = a log(x) + b, or y = a log(x) + b if the
//!      ordinate isn't transformed. This linearizes power laws and is
//!      appropriate when x is sampled on an exponential scale.
enum ERegressionMode { E_Linear, E_Log };

//! An enumeration of the criteria used to select the number of breakpoints.
//! Lower values are better for all of them.
//!
//! The possible values are:
//!   -# BIC: the Bayes information criterion.
//!   -# AIC: the Akaike information criterion.
//!   -# RSS: the size weighted mean of the segments' root mean square
//!      residuals, with no penalty for the number of parameters.
enum EInfoCriterion { E_BIC, E_AIC, E_RSS };

//! Get a string description of \p mode.
MATHS_EXPORT
std::string print(ERegressionMode mode);

//! Get a string description of \p criterion.
MATHS_EXPORT
std::string print(EInfoCriterion criterion);

//! Parse "linear" or "log", in any case, into \p mode.
MATHS_EXPORT
bool fromString(const std::string& str, ERegressionMode& mode);

//! Parse "bic", "aic" or "rss", in any case, into \p criterion.
MATHS_EXPORT
bool fromString(const std::string& str, EInfoCriterion& criterion);

MATHS_EXPORT
std::ostream& operator<<(std::ostream& strm, ERegressionMode mode);

MATHS_EXPORT
std::ostream& operator<<(std::ostream& strm, EInfoCriterion criterion);
}
}

#endif // INCLUDED_segreg_maths_MathsTypes_h
