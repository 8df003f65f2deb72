/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_segreg_maths_CBasicStatistics_h
#define INCLUDED_segreg_maths_CBasicStatistics_h

#include <maths/ImportExport.h>

#include <algorithm>
#include <cstddef>
#include <ostream>
#include <sstream>
#include <string>

namespace segreg {
namespace maths {

//! \brief Some basic stats utilities.
//!
//! DESCRIPTION:\n
//! Utilities for computing weighted sample central moments online.
class MATHS_EXPORT CBasicStatistics {
public:
    //! \brief An accumulator class for sample mean and variance.
    //!
    //! DESCRIPTION:\n
    //! This computes the weighted sample mean and (maximum likelihood)
    //! variance in a single pass. The update is numerically stable since
    //! it works with deviations from the running mean.
    //!
    //! Moments are combined with += and removed with -=, which is equivalent
    //! to running a single accumulator on the union or difference of the
    //! samples.
    //!
    //! \tparam ORDER Must be 1 or 2.
    template<std::size_t ORDER>
    struct SSampleCentralMoments {
        static_assert(ORDER == 1 || ORDER == 2, "Only mean and variance are supported");

        SSampleCentralMoments() : s_Count{0.0} { std::fill_n(s_Moments, ORDER, 0.0); }

        //! \name Update
        //@{
        //! Update the moments with \p x. \p n is the optional number of times
        //! to add \p x.
        void add(double x, double n = 1.0) {
            if (n == 0.0) {
                return;
            }

            s_Count += n;

            double alpha{n / s_Count};
            double beta{1.0 - alpha};

            double mean{s_Moments[0]};
            s_Moments[0] = beta * mean + alpha * x;

            if (ORDER > 1) {
                double r{x - s_Moments[0]};
                double dMean{mean - s_Moments[0]};
                s_Moments[ORDER - 1] =
                    beta * (s_Moments[ORDER - 1] + dMean * dMean) + alpha * r * r;
            }
        }

        //! Combine two moments.
        const SSampleCentralMoments& operator+=(const SSampleCentralMoments& rhs) {
            if (rhs.s_Count == 0.0) {
                return *this;
            }

            s_Count = s_Count + rhs.s_Count;

            double alpha{rhs.s_Count / s_Count};
            double beta{1.0 - alpha};

            double meanLhs{s_Moments[0]};
            double meanRhs{rhs.s_Moments[0]};

            s_Moments[0] = beta * meanLhs + alpha * meanRhs;

            if (ORDER > 1) {
                double dMeanLhs{meanLhs - s_Moments[0]};
                double dMeanRhs{meanRhs - s_Moments[0]};
                s_Moments[ORDER - 1] =
                    beta * (s_Moments[ORDER - 1] + dMeanLhs * dMeanLhs) +
                    alpha * (rhs.s_Moments[ORDER - 1] + dMeanRhs * dMeanRhs);
            }

            return *this;
        }

        //! Subtract \p rhs from these.
        //!
        //! \note This is only well defined if \p rhs are the moments of a
        //! subset of the samples of these. The caller must ensure this.
        const SSampleCentralMoments& operator-=(const SSampleCentralMoments& rhs) {
            if (rhs.s_Count == 0.0) {
                return *this;
            }

            s_Count = std::max(s_Count - rhs.s_Count, 0.0);

            if (s_Count == 0.0) {
                std::fill_n(s_Moments, ORDER, 0.0);
                return *this;
            }

            double alpha{rhs.s_Count / s_Count};
            double beta{1.0 + alpha};

            double meanLhs{s_Moments[0]};
            double meanRhs{rhs.s_Moments[0]};

            s_Moments[0] = beta * meanLhs - alpha * meanRhs;

            if (ORDER > 1) {
                double dMeanLhs{s_Moments[0] - meanLhs};
                double dMean2Lhs{dMeanLhs * dMeanLhs};
                double dMeanRhs{meanRhs - meanLhs};
                double dMean2Rhs{dMeanRhs * dMeanRhs};
                s_Moments[ORDER - 1] = std::max(
                    beta * (s_Moments[ORDER - 1] - dMean2Lhs) -
                        alpha * (rhs.s_Moments[ORDER - 1] + dMean2Rhs - dMean2Lhs),
                    0.0);
            }

            return *this;
        }
        //@}

        std::string print() const {
            std::ostringstream result;
            result << '(' << s_Count << ", " << s_Moments[0];
            if (ORDER > 1) {
                result << ", " << s_Moments[ORDER - 1];
            }
            result << ')';
            return result.str();
        }

        double s_Count;
        double s_Moments[ORDER];
    };

    using SSampleMean = SSampleCentralMoments<1>;
    using SSampleMeanVar = SSampleCentralMoments<2>;

    //! Make a mean and variance accumulator from its statistics.
    static SSampleMeanVar momentsAccumulator(double count, double mean, double variance) {
        SSampleMeanVar result;
        result.s_Count = count;
        result.s_Moments[0] = mean;
        result.s_Moments[1] = variance;
        return result;
    }

    //! Extract the count from an accumulator object.
    template<std::size_t ORDER>
    static double count(const SSampleCentralMoments<ORDER>& accumulator) {
        return accumulator.s_Count;
    }

    //! Extract the mean from an accumulator object.
    template<std::size_t ORDER>
    static double mean(const SSampleCentralMoments<ORDER>& accumulator) {
        return accumulator.s_Moments[0];
    }

    //! Extract the unbiased variance from an accumulator object.
    //!
    //! \note This treats the count as the number of samples so is only
    //! unbiased for unit weights.
    static double variance(const SSampleMeanVar& accumulator) {
        if (accumulator.s_Count <= 1.0) {
            return 0.0;
        }
        return accumulator.s_Count / (accumulator.s_Count - 1.0) * accumulator.s_Moments[1];
    }

    //! Extract the maximum likelihood variance from an accumulator object.
    static double maximumLikelihoodVariance(const SSampleMeanVar& accumulator) {
        return accumulator.s_Moments[1];
    }
};

template<std::size_t ORDER>
std::ostream& operator<<(std::ostream& strm,
                         const CBasicStatistics::SSampleCentralMoments<ORDER>& moments) {
    return strm << moments.print();
}
}
}

#endif // INCLUDED_segreg_maths_CBasicStatistics_h
