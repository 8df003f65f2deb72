/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_segreg_maths_CWeightedLinearRegression_h
#define INCLUDED_segreg_maths_CWeightedLinearRegression_h

#include <maths/Constants.h>
#include <maths/ImportExport.h>

#include <boost/operators.hpp>

#include <array>
#include <cstddef>
#include <string>

namespace segreg {
namespace maths {

//! \brief Weighted least squares fit of a straight line.
//!
//! DESCRIPTION:\n
//! Maintains the sufficient statistics for the weighted least squares
//! regression of y on x, i.e. the total weight, the weighted means of x and
//! y and the weighted central co-moments
//! <pre class="fragment">
//!   \f$\displaystyle C_{uv} = \frac{1}{W}\sum_i{w_i (u_i - \bar{u})(v_i - \bar{v})}\f$
//! </pre>
//! for u, v in {x, y}.
//!
//! Statistics can be added and subtracted. The fit of a union of two
//! contiguous ranges of samples is therefore available in constant time,
//! which the breakpoint searches rely on.
//!
//! IMPLEMENTATION DECISIONS:\n
//! The statistics are central moments updated relative to the running
//! mean. Raw power sums lose all precision when the abscissa is large
//! relative to its spread, which happens for narrow segments at large x.
class MATHS_EXPORT CWeightedLinearRegression
    : boost::addable<CWeightedLinearRegression, boost::subtractable<CWeightedLinearRegression>> {
public:
    //! The parameters in order intercept then slope.
    using TArray = std::array<double, 2>;

public:
    CWeightedLinearRegression() = default;

    //! Add the point (\p x, \p y) with weight \p weight.
    void add(double x, double y, double weight = 1.0);

    //! Combine with the statistics of a disjoint set of samples.
    const CWeightedLinearRegression& operator+=(const CWeightedLinearRegression& rhs);

    //! Remove the statistics of a subset of the samples.
    //!
    //! \note The caller must ensure \p rhs are the statistics of a subset of
    //! the samples of this object.
    const CWeightedLinearRegression& operator-=(const CWeightedLinearRegression& rhs);

    //! Get the regression parameters.
    //!
    //! \param[out] result Filled in with the intercept and slope.
    //! \param[in] maxCondition The maximum condition number of the Gramian.
    //! \return False if the fit is not well posed, i.e. there are fewer than
    //! two samples or the abscissas are equal to working precision.
    bool parameters(TArray& result, double maxCondition = MAXIMUM_CONDITION) const;

    //! Get the weighted residual sum of squares of the least squares fit.
    double residualSumSquares() const;

    //! Predict the ordinate at \p x using \p params.
    static double predict(const TArray& params, double x) {
        return params[0] + params[1] * x;
    }

    //! Get the number of samples added.
    std::size_t numberSamples() const { return m_NumberSamples; }

    //! Get the total weight of the samples added.
    double weight() const { return m_Weight; }

    //! Get the weighted mean abscissa.
    double meanAbscissa() const { return m_MeanX; }

    //! Get the weighted mean ordinate.
    double meanOrdinate() const { return m_MeanY; }

    //! Get the weighted variance of the abscissa.
    double abscissaVariance() const { return m_Cxx; }

    //! Get the weighted variance of the ordinate.
    double ordinateVariance() const { return m_Cyy; }

    //! Print the statistics for debug.
    std::string print() const;

private:
    std::size_t m_NumberSamples{0};
    double m_Weight{0.0};
    double m_MeanX{0.0};
    double m_MeanY{0.0};
    double m_Cxx{0.0};
    double m_Cxy{0.0};
    double m_Cyy{0.0};
};
}
}

#endif // INCLUDED_segreg_maths_CWeightedLinearRegression_h
