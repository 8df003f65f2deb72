/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <core/CContainerPrinter.h>
#include <core/CLogger.h>
#include <core/Concurrency.h>

#include <maths/CSegmentationErrors.h>
#include <maths/CSegmentedRegression.h>

#include <test/BoostTestCloseAbsolute.h>
#include <test/CRandomNumbers.h>

#include <boost/test/unit_test.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

BOOST_AUTO_TEST_SUITE(CSegmentedRegressionTest)

using namespace segreg;

namespace {
using TDoubleVec = maths_t::TDoubleVec;
using TDoubleDoublePrVec = maths_t::TDoubleDoublePrVec;

void brokenLine(TDoubleVec& x, TDoubleVec& y) {
    x.clear();
    y.clear();
    for (std::size_t i = 1; i <= 12; ++i) {
        x.push_back(static_cast<double>(i));
        y.push_back(x.back() < 6.5 ? x.back() : 5.0 * x.back() - 26.0);
    }
}

//! A power law whose exponent changes from 0.2 to 0.9 at x = 1e5 with
//! multiplicative log-normal noise.
void powerLaws(TDoubleVec& x, TDoubleVec& y) {
    std::size_t n{200};
    test::CRandomNumbers rng;
    TDoubleVec noise;
    rng.generateLogNormalSamples(0.0, 0.0025, n, noise);
    x.clear();
    y.clear();
    for (std::size_t i = 0; i < n; ++i) {
        double xi{std::pow(10.0, 1.0 + 8.0 * static_cast<double>(i) / static_cast<double>(n - 1))};
        double yi{xi < 1e5 ? std::pow(xi, 0.2) : std::pow(1e5, -0.7) * std::pow(xi, 0.9)};
        x.push_back(xi);
        y.push_back(yi * noise[i]);
    }
}

void checkTrajectory(const maths::CSegmentedModel& model) {
    maths::CSegmentedModel current{model};
    BOOST_TEST_REQUIRE(current.tree().checkInvariants());
    while (current.numberBreakpoints() > 0) {
        maths::CSegmentedModel next{current.simplify()};
        BOOST_REQUIRE_EQUAL(current.numberBreakpoints() - 1, next.numberBreakpoints());
        BOOST_TEST_REQUIRE(next.tree().checkInvariants());
        for (double breakpoint : next.breakpoints()) {
            BOOST_TEST_REQUIRE(current.tree().contains(breakpoint));
        }
        current = next;
    }
}
}

BOOST_AUTO_TEST_CASE(testBrokenLine) {
    TDoubleVec x;
    TDoubleVec y;
    brokenLine(x, y);

    auto model = maths::CSegmentedRegression::computeRegression(x, y, maths_t::E_Linear);
    LOG_DEBUG(<< model);

    BOOST_REQUIRE_EQUAL(std::string{"[6.5]"}, core::CContainerPrinter::print(model.breakpoints()));
    BOOST_REQUIRE_EQUAL(std::size_t{2}, model.numberSegments());
    BOOST_REQUIRE_EQUAL(maths_t::E_Linear, model.mode());

    auto table = model.table();
    BOOST_REQUIRE_EQUAL(std::size_t{2}, table.size());
    BOOST_REQUIRE_CLOSE_ABSOLUTE(1.0, table[0].s_Slope, 1e-8);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(5.0, table[1].s_Slope, 1e-8);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(-26.0, table[1].s_Intercept, 1e-7);
    BOOST_REQUIRE_EQUAL(std::size_t{6}, table[0].s_Count);
    BOOST_REQUIRE_EQUAL(std::size_t{6}, table[1].s_Count);
    BOOST_REQUIRE_EQUAL(1.0, table[0].s_Lower);
    BOOST_REQUIRE_EQUAL(12.0, table[1].s_Upper);

    for (std::size_t i = 0; i < x.size(); ++i) {
        BOOST_REQUIRE_CLOSE_ABSOLUTE(y[i], model.predict(x[i]), 1e-7);
    }
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.0, model.meanSquaredError(), 1e-12);

    const auto& history = model.history();
    BOOST_REQUIRE_EQUAL(std::size_t{2}, history.size());
    BOOST_TEST_REQUIRE(history[1].s_Score < history[0].s_Score);
    BOOST_REQUIRE_EQUAL(model.criterionValue(), model.bic());

    // The whole range is searched first then both halves.
    const auto& curves = model.curves();
    BOOST_REQUIRE_EQUAL(std::size_t{3}, curves.size());
    LOG_DEBUG(<< curves[0].print());
    BOOST_REQUIRE_EQUAL(1.0, curves[0].s_Lower);
    BOOST_REQUIRE_EQUAL(history[0].s_Score, curves[0].s_NoSplit);
    BOOST_REQUIRE_CLOSE(history[1].s_Score, curves[0].s_MinSplit, 1e-8);
    auto lowest = std::min_element(
        curves[0].s_Splits.begin(), curves[0].s_Splits.end(),
        [](const auto& lhs, const auto& rhs) { return lhs.second < rhs.second; });
    BOOST_TEST_REQUIRE((lowest != curves[0].s_Splits.end()));
    BOOST_REQUIRE_EQUAL(6.5, lowest->first);
    BOOST_REQUIRE_EQUAL(curves[0].s_MinSplit, lowest->second);
    for (std::size_t i = 1; i < curves.size(); ++i) {
        BOOST_REQUIRE_CLOSE(history[1].s_Score, curves[i].s_NoSplit, 1e-8);
        BOOST_TEST_REQUIRE((curves[i].s_MinSplit >= curves[i].s_NoSplit ||
                            maths::CSegmentationScore::equivalent(curves[i].s_MinSplit,
                                                                  curves[i].s_NoSplit)));
    }

    // Simplified models weren't grown so have no growth record.
    auto simplified = model.simplify();
    BOOST_TEST_REQUIRE(simplified.history().empty());
    BOOST_TEST_REQUIRE(simplified.curves().empty());
    BOOST_TEST_REQUIRE(model.autoSimplify().history().empty());

    checkTrajectory(model);
}

BOOST_AUTO_TEST_CASE(testRssCriterion) {
    // The size weighted root mean square residual selects the same
    // breakpoint and then stops because the fit is exact.

    TDoubleVec x;
    TDoubleVec y;
    brokenLine(x, y);

    auto params = maths::CSegmentedRegressionParams{}.informationCriterion(maths_t::E_RSS);
    auto model = maths::CSegmentedRegression::computeRegression(x, y, maths_t::E_Linear, params);
    LOG_DEBUG(<< model);

    BOOST_REQUIRE_EQUAL(std::string{"[6.5]"}, core::CContainerPrinter::print(model.breakpoints()));
    BOOST_REQUIRE_EQUAL(model.score().s_RootMse, model.criterionValue());

    const auto& history = model.history();
    BOOST_REQUIRE_EQUAL(std::size_t{2}, history.size());
    BOOST_TEST_REQUIRE(history[1].s_Score < history[0].s_Score);
    BOOST_REQUIRE_EQUAL(history[1].s_Score, model.criterionValue());

    // The root mean square residual of the single segment fit.
    auto root = maths::CSegmentedModel{maths::CBreakpointTree{model.tree().datasetPtr()}, params};
    BOOST_REQUIRE_CLOSE(std::sqrt(root.rss() / 12.0), history[0].s_Score, 1e-8);
}

BOOST_AUTO_TEST_CASE(testSparseBrokenLine) {
    TDoubleVec x{1.0, 2.0, 3.0, 10.0, 20.0, 30.0};
    TDoubleVec y{1.0, 2.0, 3.0, 50.0, 100.0, 150.0};

    auto model = maths::CSegmentedRegression::computeRegression(x, y, maths_t::E_Linear);
    LOG_DEBUG(<< model);

    BOOST_REQUIRE_EQUAL(std::size_t{1}, model.numberBreakpoints());
    BOOST_TEST_REQUIRE(model.breakpoints()[0] > 3.0);
    BOOST_TEST_REQUIRE(model.breakpoints()[0] < 10.0);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(1.0, model.table()[0].s_Slope, 1e-8);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(5.0, model.table()[1].s_Slope, 1e-8);
    for (std::size_t i = 0; i < x.size(); ++i) {
        BOOST_REQUIRE_CLOSE_ABSOLUTE(y[i], model.predict(x[i]), 1e-6);
    }
}

BOOST_AUTO_TEST_CASE(testPowerLaws) {
    TDoubleVec x;
    TDoubleVec y;
    powerLaws(x, y);

    auto params = maths::CSegmentedRegressionParams{}.minimumSegmentSize(20);
    auto model = maths::CSegmentedRegression::computeRegression(x, y, maths_t::E_Log, params);
    LOG_DEBUG(<< model);

    BOOST_REQUIRE_EQUAL(maths_t::E_Log, model.mode());
    BOOST_TEST_REQUIRE(model.numberBreakpoints() >= 1);
    TDoubleVec breakpoints{model.breakpoints()};
    BOOST_TEST_REQUIRE(std::any_of(breakpoints.begin(), breakpoints.end(), [](double b) {
        return b >= 1e4 && b <= 1e6;
    }));

    // Slopes are exponents in log mode.
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.2, model.tree().segmentFor(100.0).s_Fit.s_Slope, 0.1);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.9, model.tree().segmentFor(1e8).s_Fit.s_Slope, 0.1);

    // Predictions are in the original coordinates.
    BOOST_REQUIRE_CLOSE(std::pow(1e3, 0.2), model.predict(1e3), 10.0);
    BOOST_REQUIRE_CLOSE(std::pow(1e5, -0.7) * std::pow(1e8, 0.9), model.predict(1e8), 10.0);

    auto simplest = model.autoSimplify();
    LOG_DEBUG(<< "simplest = " << simplest);
    BOOST_TEST_REQUIRE(simplest.numberBreakpoints() >= 1);
    BOOST_TEST_REQUIRE(simplest.numberBreakpoints() <= model.numberBreakpoints());
    BOOST_TEST_REQUIRE(simplest.criterionValue() <= model.criterionValue() + 1e-9);

    checkTrajectory(model);
}

BOOST_AUTO_TEST_CASE(testConstant) {
    TDoubleVec x;
    TDoubleVec y;
    for (std::size_t i = 1; i <= 20; ++i) {
        x.push_back(static_cast<double>(i));
        y.push_back(5.0);
    }

    auto model = maths::CSegmentedRegression::computeRegression(x, y, maths_t::E_Linear);
    LOG_DEBUG(<< model);

    BOOST_REQUIRE_EQUAL(std::size_t{0}, model.numberBreakpoints());
    BOOST_REQUIRE_CLOSE_ABSOLUTE(0.0, model.table()[0].s_Slope, 1e-10);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(5.0, model.predict(100.0), 1e-8);
    BOOST_REQUIRE_THROW(model.simplify(), maths::CNoBreakpointsError);
    BOOST_REQUIRE_EQUAL(std::size_t{0}, model.autoSimplify().numberBreakpoints());
}

BOOST_AUTO_TEST_CASE(testTwoDistinctAbscissas) {
    TDoubleVec x{1.0, 1.0, 1.0, 2.0, 2.0, 2.0};
    TDoubleVec y{1.0, 1.5, 2.0, 3.0, 3.5, 4.0};

    auto model = maths::CSegmentedRegression::computeRegression(x, y, maths_t::E_Linear);

    BOOST_REQUIRE_EQUAL(std::size_t{0}, model.numberBreakpoints());
    BOOST_REQUIRE_CLOSE_ABSOLUTE(2.0, model.table()[0].s_Slope, 1e-10);
    BOOST_REQUIRE_CLOSE_ABSOLUTE(1.5, model.predict(1.0), 1e-10);
}

BOOST_AUTO_TEST_CASE(testDeterminism) {
    TDoubleVec x;
    TDoubleVec y;
    powerLaws(x, y);

    auto serial = maths::CSegmentedRegression::computeRegression(x, y, maths_t::E_Log);

    core::startDefaultAsyncExecutor(4);
    auto parallel = maths::CSegmentedRegression::computeRegression(x, y, maths_t::E_Log);
    auto parallelSimplest = parallel.autoSimplify();
    core::stopDefaultAsyncExecutor();

    BOOST_REQUIRE_EQUAL(core::CContainerPrinter::print(serial.breakpoints()),
                        core::CContainerPrinter::print(parallel.breakpoints()));
    BOOST_REQUIRE_EQUAL(serial.bic(), parallel.bic());
    BOOST_REQUIRE_EQUAL(core::CContainerPrinter::print(serial.autoSimplify().breakpoints()),
                        core::CContainerPrinter::print(parallelSimplest.breakpoints()));

    // Refitting gives the same result.
    auto again = maths::CSegmentedRegression::computeRegression(x, y, maths_t::E_Log);
    BOOST_REQUIRE_EQUAL(serial.print(), again.print());
}

BOOST_AUTO_TEST_CASE(testScores) {
    TDoubleVec x;
    TDoubleVec y;
    powerLaws(x, y);

    auto bic = maths::CSegmentedRegression::computeRegression(x, y, maths_t::E_Log);
    auto aic = maths::CSegmentedRegression::computeRegression(
        x, y, maths_t::E_Log, maths::CSegmentedRegressionParams{}.informationCriterion(maths_t::E_AIC));
    LOG_DEBUG(<< "BIC model " << bic);
    LOG_DEBUG(<< "AIC model " << aic);

    // AIC penalises parameters less for more than seven samples.
    BOOST_TEST_REQUIRE(aic.numberBreakpoints() >= bic.numberBreakpoints());
    BOOST_REQUIRE_EQUAL(aic.criterionValue(), aic.aic());

    for (const auto* model : {&bic, &aic}) {
        BOOST_REQUIRE_CLOSE(model->computeRss(), model->rss(), 1e-6);
        const auto& history = model->history();
        for (std::size_t i = 1; i < history.size(); ++i) {
            BOOST_REQUIRE_EQUAL(i, history[i].s_NumberBreakpoints);
            BOOST_TEST_REQUIRE(history[i].s_Score < history[i - 1].s_Score);
        }
        BOOST_REQUIRE_EQUAL(model->numberBreakpoints(), history.back().s_NumberBreakpoints);

        // Auto simplification never makes the score worse and is idempotent.
        auto simplest = model->autoSimplify();
        BOOST_TEST_REQUIRE(simplest.criterionValue() <= model->criterionValue() + 1e-9);
        BOOST_REQUIRE_EQUAL(core::CContainerPrinter::print(simplest.breakpoints()),
                            core::CContainerPrinter::print(simplest.autoSimplify().breakpoints()));
    }
}

BOOST_AUTO_TEST_CASE(testPairs) {
    TDoubleVec x;
    TDoubleVec y;
    brokenLine(x, y);
    std::reverse(x.begin(), x.end());
    std::reverse(y.begin(), y.end());

    TDoubleDoublePrVec samples;
    for (std::size_t i = 0; i < x.size(); ++i) {
        samples.emplace_back(x[i], y[i]);
    }

    auto fromVectors = maths::CSegmentedRegression::computeRegression(x, y, maths_t::E_Linear);
    auto fromPairs = maths::CSegmentedRegression::computeRegression(samples, maths_t::E_Linear);
    BOOST_REQUIRE_EQUAL(fromVectors.print(), fromPairs.print());
    BOOST_REQUIRE_EQUAL(std::string{"[6.5]"},
                        core::CContainerPrinter::print(fromPairs.breakpoints()));
}

BOOST_AUTO_TEST_CASE(testErrors) {
    double nan{std::numeric_limits<double>::quiet_NaN()};
    double inf{std::numeric_limits<double>::infinity()};

    BOOST_REQUIRE_THROW(maths::CSegmentedRegression::computeRegression(
                            {1.0, 2.0, 3.0}, {1.0, 2.0}, maths_t::E_Linear),
                        std::invalid_argument);
    BOOST_REQUIRE_THROW(maths::CSegmentedRegression::computeRegression(
                            {1.0, 2.0, nan}, {1.0, 2.0, 3.0}, maths_t::E_Linear),
                        std::invalid_argument);
    BOOST_REQUIRE_THROW(maths::CSegmentedRegression::computeRegression(
                            {1.0, 2.0, 3.0}, {1.0, inf, 3.0}, maths_t::E_Linear),
                        std::invalid_argument);
    BOOST_REQUIRE_THROW(maths::CSegmentedRegression::computeRegression(
                            TDoubleVec{}, TDoubleVec{}, maths_t::E_Linear),
                        maths::CInsufficientDataError);
    BOOST_REQUIRE_THROW(maths::CSegmentedRegression::computeRegression(
                            {2.0, 2.0, 2.0}, {1.0, 2.0, 3.0}, maths_t::E_Linear),
                        maths::CInsufficientDataError);
    BOOST_REQUIRE_THROW(maths::CSegmentedRegression::computeRegression(
                            {0.0, 1.0, 2.0}, {1.0, 2.0, 3.0}, maths_t::E_Log),
                        maths::CDegenerateSegmentError);
    BOOST_REQUIRE_THROW(maths::CSegmentedRegression::computeRegression(
                            {1.0, 2.0, 3.0}, {1.0, -2.0, 3.0}, maths_t::E_Log),
                        maths::CDegenerateSegmentError);

    // Negative ordinates are allowed if only the abscissa is transformed.
    auto model = maths::CSegmentedRegression::computeRegression(
        {1.0, 2.0, 3.0, 4.0}, {1.0, -2.0, 3.0, -4.0}, maths_t::E_Log,
        maths::CSegmentedRegressionParams{}.transformOrdinate(false));
    BOOST_REQUIRE_EQUAL(std::size_t{0}, model.numberBreakpoints());

    // Predicting outside the domain of the transform fails.
    TDoubleVec x;
    TDoubleVec y;
    powerLaws(x, y);
    auto logModel = maths::CSegmentedRegression::computeRegression(x, y, maths_t::E_Log);
    BOOST_REQUIRE_THROW(logModel.predict(-1.0), maths::CDegenerateSegmentError);
}

BOOST_AUTO_TEST_SUITE_END()
