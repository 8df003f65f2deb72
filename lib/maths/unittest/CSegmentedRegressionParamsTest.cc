/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

#include <core/CLogger.h>

#include <maths/CSegmentedRegressionParams.h>

#include <boost/property_tree/ptree.hpp>
#include <boost/test/unit_test.hpp>

BOOST_AUTO_TEST_SUITE(CSegmentedRegressionParamsTest)

using namespace segreg;

BOOST_AUTO_TEST_CASE(testDefaults) {
    maths::CSegmentedRegressionParams params;
    LOG_DEBUG(<< params.print());

    BOOST_REQUIRE_EQUAL(std::size_t{3}, params.minimumSegmentSize());
    BOOST_REQUIRE_EQUAL(maths::CSegmentedRegressionParams::UNLIMITED, params.maximumBreakpoints());
    BOOST_REQUIRE_EQUAL(maths::CSegmentedRegressionParams::UNLIMITED, params.maximumDepth());
    BOOST_REQUIRE_EQUAL(0.0, params.minimumScoreImprovement());
    BOOST_REQUIRE_EQUAL(maths_t::E_BIC, params.informationCriterion());
    BOOST_REQUIRE_EQUAL(1e-6, params.precision());
    BOOST_TEST_REQUIRE(params.heteroscedastic());
    BOOST_TEST_REQUIRE(params.noiseInTransformedSpace());
    BOOST_TEST_REQUIRE(params.transformOrdinate());
}

BOOST_AUTO_TEST_CASE(testSetters) {
    auto params = maths::CSegmentedRegressionParams{}
                      .minimumSegmentSize(8)
                      .maximumBreakpoints(4)
                      .maximumDepth(2)
                      .minimumScoreImprovement(1.0)
                      .informationCriterion(maths_t::E_AIC)
                      .precision(1e-9)
                      .heteroscedastic(false)
                      .noiseInTransformedSpace(false)
                      .transformOrdinate(false);

    BOOST_REQUIRE_EQUAL(std::size_t{8}, params.minimumSegmentSize());
    BOOST_REQUIRE_EQUAL(std::size_t{4}, params.maximumBreakpoints());
    BOOST_REQUIRE_EQUAL(std::size_t{2}, params.maximumDepth());
    BOOST_REQUIRE_EQUAL(1.0, params.minimumScoreImprovement());
    BOOST_REQUIRE_EQUAL(maths_t::E_AIC, params.informationCriterion());
    BOOST_REQUIRE_EQUAL(1e-9, params.precision());
    BOOST_TEST_REQUIRE(params.heteroscedastic() == false);
    BOOST_TEST_REQUIRE(params.noiseInTransformedSpace() == false);
    BOOST_TEST_REQUIRE(params.transformOrdinate() == false);

    // Segments always hold at least two samples.
    params.minimumSegmentSize(0);
    BOOST_REQUIRE_EQUAL(std::size_t{2}, params.minimumSegmentSize());
}

BOOST_AUTO_TEST_CASE(testInitFromFile) {
    maths::CSegmentedRegressionParams params;
    BOOST_TEST_REQUIRE(params.init("testfiles/segreg.conf"));
    LOG_DEBUG(<< params.print());

    BOOST_REQUIRE_EQUAL(std::size_t{5}, params.minimumSegmentSize());
    BOOST_REQUIRE_EQUAL(std::size_t{10}, params.maximumBreakpoints());
    BOOST_REQUIRE_EQUAL(maths::CSegmentedRegressionParams::UNLIMITED, params.maximumDepth());
    BOOST_REQUIRE_EQUAL(2.5, params.minimumScoreImprovement());
    BOOST_REQUIRE_EQUAL(maths_t::E_AIC, params.informationCriterion());
    BOOST_REQUIRE_EQUAL(1e-8, params.precision());
    BOOST_TEST_REQUIRE(params.heteroscedastic() == false);
    BOOST_TEST_REQUIRE(params.noiseInTransformedSpace() == false);
    BOOST_TEST_REQUIRE(params.transformOrdinate() == false);
}

BOOST_AUTO_TEST_CASE(testInvalidFile) {
    auto params = maths::CSegmentedRegressionParams{}.maximumBreakpoints(7);
    std::string before{params.print()};

    // Nothing is applied if any value is invalid.
    BOOST_TEST_REQUIRE(params.init("testfiles/invalid.conf") == false);
    BOOST_REQUIRE_EQUAL(before, params.print());

    BOOST_TEST_REQUIRE(params.init("testfiles/does_not_exist.conf") == false);
    BOOST_REQUIRE_EQUAL(before, params.print());
}

BOOST_AUTO_TEST_CASE(testUnknownSettings) {
    // Unknown stanzas and properties are ignored.
    maths::CSegmentedRegressionParams params;
    BOOST_TEST_REQUIRE(params.init("testfiles/unknown.conf"));
    BOOST_REQUIRE_EQUAL(std::size_t{3}, params.maximumBreakpoints());
}

BOOST_AUTO_TEST_CASE(testInitFromPropertyTree) {
    boost::property_tree::ptree propTree;
    propTree.put("segmentation.maximumdepth", "3");
    propTree.put("segmentation.maximumbreakpoints", "UNLIMITED");
    propTree.put("segmentation.informationcriterion", " BIC ");

    auto params = maths::CSegmentedRegressionParams{}.maximumBreakpoints(1).informationCriterion(
        maths_t::E_AIC);
    BOOST_TEST_REQUIRE(params.init(propTree));
    BOOST_REQUIRE_EQUAL(std::size_t{3}, params.maximumDepth());
    BOOST_REQUIRE_EQUAL(maths::CSegmentedRegressionParams::UNLIMITED, params.maximumBreakpoints());
    BOOST_REQUIRE_EQUAL(maths_t::E_BIC, params.informationCriterion());

    boost::property_tree::ptree rss;
    rss.put("segmentation.informationcriterion", "Rss");
    BOOST_TEST_REQUIRE(params.init(rss));
    BOOST_REQUIRE_EQUAL(maths_t::E_RSS, params.informationCriterion());
    BOOST_REQUIRE_EQUAL(std::string{"rss"}, maths_t::print(params.informationCriterion()));

    boost::property_tree::ptree bad;
    bad.put("segmentation.minimumsegmentsize", "1");
    BOOST_TEST_REQUIRE(params.init(bad) == false);
    BOOST_REQUIRE_EQUAL(std::size_t{3}, params.minimumSegmentSize());

    bad.clear();
    bad.put("segmentation.minimumscoreimprovement", "-1");
    BOOST_TEST_REQUIRE(params.init(bad) == false);
    BOOST_REQUIRE_EQUAL(0.0, params.minimumScoreImprovement());
}

BOOST_AUTO_TEST_SUITE_END()
