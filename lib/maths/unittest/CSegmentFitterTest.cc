/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <core/CLogger.h>

#include <maths/CRegressionDataset.h>
#include <maths/CSegmentFitter.h>
#include <maths/CSegmentationErrors.h>

#include <test/BoostTestCloseAbsolute.h>

#include <boost/test/unit_test.hpp>

#include <cmath>

BOOST_AUTO_TEST_SUITE(CSegmentFitterTest)

using namespace segreg;

namespace {
using TDoubleDoublePrVec = maths_t::TDoubleDoublePrVec;
}

BOOST_AUTO_TEST_CASE(testFit) {
    TDoubleDoublePrVec samples;
    for (std::size_t i = 1; i <= 10; ++i) {
        double x{static_cast<double>(i)};
        samples.emplace_back(x, i <= 5 ? 2.0 * x : 30.0 - x);
    }
    maths::CRegressionDataset dataset{
        samples, maths::CCoordinateTransform::create(maths_t::E_Linear)};

    auto left = maths::CSegmentFitter::fit(dataset, 0, 5);
    LOG_DEBUG(<< "left = " << left.print());
    BOOST_REQUIRE_CLOSE_ABSOLUTE(2.0, left.s_Slope, 1e-12);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.0, left.s_Intercept, 1e-12);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.0, left.s_Rss, 1e-10);
    BOOST_REQUIRE_EQUAL(std::size_t{5}, left.s_Count);
    BOOST_REQUIRE_EQUAL(std::size_t{2}, left.numberParameters());
    BOOST_REQUIRE_CLOSE_ABSOLUTE(8.0, left.predict(4.0), 1e-12);

    auto right = maths::CSegmentFitter::fit(dataset, 5, 10);
    LOG_DEBUG(<< "right = " << right.print());
    BOOST_REQUIRE_CLOSE_ABSOLUTE(-1.0, right.s_Slope, 1e-12);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(30.0, right.s_Intercept, 1e-10);

    // Fitting the combined statistics is the same as fitting all the samples.
    auto all = maths::CSegmentFitter::fit(dataset, 0, 10);
    maths::CSegmentFitter::SFit combined;
    BOOST_TEST_REQUIRE(maths::CSegmentFitter::tryFit(
        left.s_Regression + right.s_Regression, combined));
    BOOST_REQUIRE_CLOSE(all.s_Slope, combined.s_Slope, 1e-10);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(all.s_Intercept, combined.s_Intercept, 1e-10);
    BOOST_REQUIRE_CLOSE(all.s_Rss, combined.s_Rss, 1e-10);
    BOOST_REQUIRE_EQUAL(std::size_t{10}, combined.s_Count);
    BOOST_REQUIRE_EQUAL(10.0, combined.weight());
}

BOOST_AUTO_TEST_CASE(testWeightedFit) {
    // Down weighting an outlier reduces its influence on the fit.

    TDoubleDoublePrVec samples{{1.0, 1.0}, {2.0, 2.0}, {3.0, 3.0}, {4.0, 40.0}, {5.0, 5.0}};
    maths::CRegressionDataset dataset{
        samples, maths::CCoordinateTransform::create(maths_t::E_Linear)};

    auto unweighted = maths::CSegmentFitter::fit(dataset, 0, 5);
    dataset.weights({1.0, 1.0, 1.0, 1e-9, 1.0});
    auto weighted = maths::CSegmentFitter::fit(dataset, 0, 5);
    LOG_DEBUG(<< "unweighted = " << unweighted.print() << ", weighted = " << weighted.print());

    BOOST_REQUIRE_CLOSE(1.0, weighted.s_Slope, 1e-5);
    BOOST_TEST_REQUIRE(std::fabs(unweighted.s_Slope - 1.0) > 1.0);
}

BOOST_AUTO_TEST_CASE(testLogFit) {
    // y = 3 x^1.5 is a straight line in log coordinates.

    TDoubleDoublePrVec samples;
    for (double x : {1.0, 10.0, 100.0, 1000.0}) {
        samples.emplace_back(x, 3.0 * std::pow(x, 1.5));
    }
    maths::CRegressionDataset dataset{
        samples, maths::CCoordinateTransform::create(maths_t::E_Log)};

    auto fit = maths::CSegmentFitter::fit(dataset, 0, 4);
    BOOST_REQUIRE_CLOSE(1.5, fit.s_Slope, 1e-8);
    BOOST_REQUIRE_CLOSE(std::log(3.0), fit.s_Intercept, 1e-8);
}

BOOST_AUTO_TEST_CASE(testDegenerate) {
    TDoubleDoublePrVec samples{{1.0, 1.0}, {1.0, 2.0}, {1.0, 3.0}, {2.0, 1.0}};
    maths::CRegressionDataset dataset{
        samples, maths::CCoordinateTransform::create(maths_t::E_Linear)};

    BOOST_REQUIRE_THROW(maths::CSegmentFitter::fit(dataset, 0, 3), maths::CDegenerateSegmentError);
    BOOST_REQUIRE_THROW(maths::CSegmentFitter::fit(dataset, 3, 4), maths::CDegenerateSegmentError);
    BOOST_REQUIRE_THROW(maths::CSegmentFitter::fit(dataset, 0, 5), maths::CDegenerateSegmentError);
    BOOST_REQUIRE_NO_THROW(maths::CSegmentFitter::fit(dataset, 0, 4));

    maths::CSegmentFitter::SFit fit;
    fit.s_Slope = 7.0;
    BOOST_TEST_REQUIRE(maths::CSegmentFitter::tryFit(
                           maths::CSegmentFitter::accumulate(dataset, 0, 3), fit) == false);
    BOOST_REQUIRE_EQUAL(7.0, fit.s_Slope);
}

BOOST_AUTO_TEST_SUITE_END()
