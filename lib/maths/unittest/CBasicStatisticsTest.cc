/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <core/CLogger.h>

#include <maths/CBasicStatistics.h>

#include <test/BoostTestCloseAbsolute.h>
#include <test/CRandomNumbers.h>

#include <boost/test/unit_test.hpp>

#include <vector>

BOOST_AUTO_TEST_SUITE(CBasicStatisticsTest)

using namespace segreg;

namespace {
using TDoubleVec = std::vector<double>;
using TMeanAccumulator = maths::CBasicStatistics::SSampleMean;
using TMeanVarAccumulator = maths::CBasicStatistics::SSampleMeanVar;
}

BOOST_AUTO_TEST_CASE(testMean) {
    TMeanAccumulator mean;
    BOOST_REQUIRE_EQUAL(0.0, maths::CBasicStatistics::count(mean));

    for (double x : {1.0, 2.0, 3.0, 4.0}) {
        mean.add(x);
    }
    BOOST_REQUIRE_EQUAL(4.0, maths::CBasicStatistics::count(mean));
    BOOST_REQUIRE_CLOSE_ABSOLUTE(2.5, maths::CBasicStatistics::mean(mean), 1e-15);

    // Weighted
    TMeanAccumulator weighted;
    weighted.add(1.0, 3.0);
    weighted.add(5.0, 1.0);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(2.0, maths::CBasicStatistics::mean(weighted), 1e-15);
}

BOOST_AUTO_TEST_CASE(testCentralMoments) {
    test::CRandomNumbers rng;

    TDoubleVec samples;
    rng.generateNormalSamples(5.0, 4.0, 200, samples);

    TMeanVarAccumulator all;
    TMeanVarAccumulator first;
    TMeanVarAccumulator second;
    for (std::size_t i = 0; i < samples.size(); ++i) {
        all.add(samples[i]);
        (i < 80 ? first : second).add(samples[i]);
    }

    double mean{0.0};
    for (auto x : samples) {
        mean += x;
    }
    mean /= static_cast<double>(samples.size());
    double variance{0.0};
    for (auto x : samples) {
        variance += (x - mean) * (x - mean);
    }
    variance /= static_cast<double>(samples.size() - 1);

    LOG_DEBUG(<< "moments = " << all);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(mean, maths::CBasicStatistics::mean(all), 1e-12);
    BOOST_REQUIRE_CLOSE(variance, maths::CBasicStatistics::variance(all), 1e-10);

    // Combining the moments of disjoint subsets should give the moments of
    // the union and removing a subset should give the moments of the rest.
    TMeanVarAccumulator combined{first};
    combined += second;
    BOOST_REQUIRE_EQUAL(200.0, maths::CBasicStatistics::count(combined));
    BOOST_REQUIRE_CLOSE_ABSOLUTE(mean, maths::CBasicStatistics::mean(combined), 1e-12);
    BOOST_REQUIRE_CLOSE(variance, maths::CBasicStatistics::variance(combined), 1e-10);

    TMeanVarAccumulator remainder{all};
    remainder -= first;
    BOOST_REQUIRE_EQUAL(120.0, maths::CBasicStatistics::count(remainder));
    BOOST_REQUIRE_CLOSE_ABSOLUTE(maths::CBasicStatistics::mean(second),
                                 maths::CBasicStatistics::mean(remainder), 1e-10);
    BOOST_REQUIRE_CLOSE(maths::CBasicStatistics::variance(second),
                        maths::CBasicStatistics::variance(remainder), 1e-8);

    TMeanVarAccumulator restored{maths::CBasicStatistics::momentsAccumulator(
        maths::CBasicStatistics::count(all), maths::CBasicStatistics::mean(all),
        maths::CBasicStatistics::maximumLikelihoodVariance(all))};
    BOOST_REQUIRE_EQUAL(all.print(), restored.print());
}

BOOST_AUTO_TEST_SUITE_END()
