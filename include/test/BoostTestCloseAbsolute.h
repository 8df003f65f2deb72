/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_segreg_test_BoostTestCloseAbsolute_h
#define INCLUDED_segreg_test_BoostTestCloseAbsolute_h

#include <boost/test/test_tools.hpp>

#include <ostream>

namespace segreg {
namespace test {

template<typename T>
struct SAbsoluteTolerance {
    explicit SAbsoluteTolerance(T tolerance) : s_Tolerance(tolerance) {}
    T s_Tolerance;
};

template<typename T>
SAbsoluteTolerance<T> absoluteTolerance(T tolerance) {
    return SAbsoluteTolerance<T>(tolerance < T(0) ? -tolerance : tolerance);
}

template<typename T>
std::ostream& operator<<(std::ostream& strm, const SAbsoluteTolerance<T>& tol) {
    return strm << tol.s_Tolerance;
}

//! \brief Predicate for |lhs - rhs| <= tolerance.
class CIsCloseEnough {
public:
    using result_type = boost::test_tools::assertion_result;

public:
    template<typename T>
    result_type operator()(const T& lhs, const T& rhs, const SAbsoluteTolerance<T>& tol) const {
        T diff{(lhs < rhs) ? (rhs - lhs) : (lhs - rhs)};
        result_type result{diff <= tol.s_Tolerance};
        if (!result) {
            result.message() << diff;
        }
        return result;
    }
};
}
}

//! \brief
//! Boost.Test macros asserting on the absolute difference between values.
//!
//! DESCRIPTION:\n
//! BOOST_CHECK_CLOSE compares the relative difference, which is not useful
//! for values such as fitted intercepts which should be close to zero. The
//! failure messages use the same format as BOOST_REQUIRE_CLOSE_FRACTION.
#define BOOST_CHECK_CLOSE_ABSOLUTE(L, R, T)                                    \
    BOOST_TEST_TOOL_IMPL(0, segreg::test::CIsCloseEnough(), "", CHECK,         \
                         CHECK_CLOSE_FRACTION,                                 \
                         (L)(R)(segreg::test::absoluteTolerance(T)))
#define BOOST_REQUIRE_CLOSE_ABSOLUTE(L, R, T)                                  \
    BOOST_TEST_TOOL_IMPL(0, segreg::test::CIsCloseEnough(), "", REQUIRE,       \
                         CHECK_CLOSE_FRACTION,                                 \
                         (L)(R)(segreg::test::absoluteTolerance(T)))

#endif // INCLUDED_segreg_test_BoostTestCloseAbsolute_h
