/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <maths/CSegmentFitter.h>

#include <maths/CRegressionDataset.h>
#include <maths/CSegmentationErrors.h>

#include <sstream>

namespace segreg {
namespace maths {

std::string CSegmentFitter::SFit::print() const {
    std::ostringstream result;
    result << "slope = " << s_Slope << ", intercept = " << s_Intercept
           << ", rss = " << s_Rss << ", count = " << s_Count;
    return result.str();
}

CWeightedLinearRegression CSegmentFitter::accumulate(const CRegressionDataset& dataset,
                                                     std::size_t begin,
                                                     std::size_t end) {
    CWeightedLinearRegression result;
    for (std::size_t i = begin; i < end; ++i) {
        result.add(dataset.fx(i), dataset.fy(i), dataset.weight(i));
    }
    return result;
}

CSegmentFitter::SFit
CSegmentFitter::fit(const CRegressionDataset& dataset, std::size_t begin, std::size_t end) {
    if (end > dataset.size()) {
        throw CDegenerateSegmentError{"Segment end " + std::to_string(end) +
                                      " is past the last sample"};
    }
    std::size_t distinct{dataset.numberDistinctAbscissas(begin, end)};
    if (distinct < 2) {
        throw CDegenerateSegmentError{
            "Segment [" + std::to_string(begin) + ", " + std::to_string(end) +
            ") has " + std::to_string(distinct) + " distinct x values"};
    }

    SFit result;
    if (tryFit(accumulate(dataset, begin, end), result) == false) {
        throw CDegenerateSegmentError{"Ill-conditioned fit for segment [" +
                                      std::to_string(begin) + ", " +
                                      std::to_string(end) + ")"};
    }
    return result;
}

bool CSegmentFitter::tryFit(const CWeightedLinearRegression& regression, SFit& result) {
    CWeightedLinearRegression::TArray params;
    if (regression.parameters(params) == false) {
        return false;
    }
    result.s_Regression = regression;
    result.s_Intercept = params[0];
    result.s_Slope = params[1];
    result.s_Rss = regression.residualSumSquares();
    result.s_Count = regression.numberSamples();
    return true;
}
}
}
