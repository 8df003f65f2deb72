/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <core/CContainerPrinter.h>
#include <core/CLogger.h>

#include <maths/CBottomUpSimplification.h>
#include <maths/CSegmentationErrors.h>

#include <boost/test/unit_test.hpp>

#include <memory>

BOOST_AUTO_TEST_SUITE(CBottomUpSimplificationTest)

using namespace segreg;

namespace {
using TDoubleDoublePrVec = maths_t::TDoubleDoublePrVec;

//! y = x with jumps of 100 after x = 10 and x = 20 and an unnecessary
//! breakpoint at 5.5.
maths::CBreakpointTree overSegmented() {
    TDoubleDoublePrVec samples;
    for (std::size_t i = 1; i <= 30; ++i) {
        double x{static_cast<double>(i)};
        samples.emplace_back(x, x + 100.0 * static_cast<double>((i - 1) / 10));
    }
    maths::CBreakpointTree tree{std::make_shared<const maths::CRegressionDataset>(
        samples, maths::CCoordinateTransform::create(maths_t::E_Linear))};
    tree.insert(10.5);
    tree.insert(20.5);
    tree.insert(5.5);
    return tree;
}
}

BOOST_AUTO_TEST_CASE(testSimplify) {
    maths::CBreakpointTree tree{overSegmented()};
    maths::CSegmentationScore scorer{tree.dataset()};

    maths::CBreakpointTree simplified{
        maths::CBottomUpSimplification::simplify(tree, scorer, maths_t::E_BIC)};
    LOG_DEBUG(<< simplified.print());

    BOOST_REQUIRE_EQUAL(std::string{"[10.5, 20.5]"},
                        core::CContainerPrinter::print(simplified.breakpoints()));
    BOOST_TEST_REQUIRE(simplified.checkInvariants());

    // The input is unchanged.
    BOOST_REQUIRE_EQUAL(std::size_t{3}, tree.numberBreakpoints());

    // The two jumps are equally important so the smaller is removed.
    simplified = maths::CBottomUpSimplification::simplify(simplified, scorer, maths_t::E_BIC);
    BOOST_REQUIRE_EQUAL(std::string{"[20.5]"},
                        core::CContainerPrinter::print(simplified.breakpoints()));

    simplified = maths::CBottomUpSimplification::simplify(simplified, scorer, maths_t::E_AIC);
    BOOST_REQUIRE_EQUAL(std::size_t{0}, simplified.numberBreakpoints());

    BOOST_REQUIRE_THROW(maths::CBottomUpSimplification::simplify(simplified, scorer, maths_t::E_BIC),
                        maths::CNoBreakpointsError);
}

BOOST_AUTO_TEST_CASE(testTrajectory) {
    maths::CBreakpointTree tree{overSegmented()};
    maths::CSegmentationScore scorer{tree.dataset()};

    auto steps = maths::CBottomUpSimplification::trajectory(tree, scorer, maths_t::E_BIC);

    BOOST_REQUIRE_EQUAL(std::size_t{4}, steps.size());
    BOOST_REQUIRE_EQUAL(core::CContainerPrinter::print(tree.breakpoints()),
                        core::CContainerPrinter::print(steps[0].s_Tree.breakpoints()));
    for (std::size_t i = 0; i < steps.size(); ++i) {
        LOG_DEBUG(<< "step " << i << ": " << steps[i].s_Score << " "
                  << core::CContainerPrinter::print(steps[i].s_Tree.breakpoints()));
        BOOST_REQUIRE_EQUAL(3 - i, steps[i].s_Tree.numberBreakpoints());
        BOOST_TEST_REQUIRE(steps[i].s_Tree.checkInvariants());
        BOOST_REQUIRE_EQUAL(scorer.score(steps[i].s_Tree).s_Bic,
                            steps[i].s_Score.s_Bic);
    }

    // Removing the unnecessary breakpoint improves the score and removing
    // either jump makes it much worse.
    BOOST_TEST_REQUIRE(steps[1].s_Score.s_Bic < steps[0].s_Score.s_Bic);
    BOOST_TEST_REQUIRE(steps[2].s_Score.s_Bic > steps[1].s_Score.s_Bic + 100.0);

    // Nested: each step's breakpoints are a subset of the previous step's.
    for (std::size_t i = 1; i < steps.size(); ++i) {
        for (double breakpoint : steps[i].s_Tree.breakpoints()) {
            BOOST_TEST_REQUIRE(steps[i - 1].s_Tree.contains(breakpoint));
        }
    }

    // A single segment has a trajectory of one step.
    maths::CBreakpointTree root{tree.datasetPtr()};
    BOOST_REQUIRE_EQUAL(std::size_t{1},
                        maths::CBottomUpSimplification::trajectory(root, scorer, maths_t::E_BIC)
                            .size());
}

BOOST_AUTO_TEST_CASE(testAutoSimplify) {
    maths::CBreakpointTree tree{overSegmented()};
    maths::CSegmentationScore scorer{tree.dataset()};

    for (auto criterion : {maths_t::E_BIC, maths_t::E_AIC, maths_t::E_RSS}) {
        maths::CBreakpointTree best{
            maths::CBottomUpSimplification::autoSimplify(tree, scorer, criterion)};
        LOG_DEBUG(<< criterion << ": " << best.print());
        BOOST_REQUIRE_EQUAL(std::string{"[10.5, 20.5]"},
                            core::CContainerPrinter::print(best.breakpoints()));

        // Simplifying the best segmentation again changes nothing.
        maths::CBreakpointTree again{
            maths::CBottomUpSimplification::autoSimplify(best, scorer, criterion)};
        BOOST_REQUIRE_EQUAL(core::CContainerPrinter::print(best.breakpoints()),
                            core::CContainerPrinter::print(again.breakpoints()));
    }

    // A single segment is returned unchanged.
    maths::CBreakpointTree root{tree.datasetPtr()};
    BOOST_REQUIRE_EQUAL(std::size_t{0},
                        maths::CBottomUpSimplification::autoSimplify(root, scorer, maths_t::E_BIC)
                            .numberBreakpoints());
}

BOOST_AUTO_TEST_SUITE_END()
