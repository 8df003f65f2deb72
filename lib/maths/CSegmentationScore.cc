/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <maths/CSegmentationScore.h>

#include <core/CLogger.h>

#include <maths/CBreakpointTree.h>
#include <maths/CRegressionDataset.h>

#include <boost/math/constants/constants.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <ostream>
#include <sstream>

namespace segreg {
namespace maths {

double CSegmentationScore::SScore::value(maths_t::EInfoCriterion criterion) const {
    switch (criterion) {
    case maths_t::E_BIC:
        return s_Bic;
    case maths_t::E_AIC:
        return s_Aic;
    case maths_t::E_RSS:
        return s_RootMse;
    }
    return s_Bic;
}

std::string CSegmentationScore::SScore::print() const {
    std::ostringstream result;
    result << "{rss = " << s_Rss << ", n = " << s_Count << ", k = " << s_Parameters
           << ", log-likelihood = " << s_LogLikelihood << ", bic = " << s_Bic
           << ", aic = " << s_Aic << ", root mse = " << s_RootMse << "}";
    return result.str();
}

CSegmentationScore::CSegmentationScore(const CRegressionDataset& dataset, double precision)
    : m_Count{static_cast<double>(dataset.size())}, m_SumLogWeights{dataset.sumLogWeights()} {
    double scale{precision * std::sqrt(dataset.ordinateScale())};
    m_RssFloor = std::max(m_Count * scale * scale,
                          m_Count * std::numeric_limits<double>::min());
    LOG_TRACE(<< "RSS floor = " << m_RssFloor);
}

CSegmentationScore::SScore
CSegmentationScore::score(double rss, double rootMse, std::size_t segments) const {
    SScore result;
    result.s_Rss = std::max(rss, m_RssFloor);
    result.s_Count = static_cast<std::size_t>(m_Count);
    result.s_Parameters = numberParameters(segments);

    double k{static_cast<double>(result.s_Parameters)};
    double logMeanRss{std::log(result.s_Rss / m_Count)};
    result.s_LogLikelihood =
        -0.5 * m_Count * (std::log(boost::math::double_constants::two_pi) + logMeanRss + 1.0) +
        0.5 * m_SumLogWeights;
    result.s_Bic = m_Count * logMeanRss + k * std::log(m_Count);
    result.s_Aic = m_Count * logMeanRss + 2.0 * k;
    result.s_RootMse = rootMse;
    return result;
}

CSegmentationScore::SScore CSegmentationScore::score(const CBreakpointTree& tree) const {
    return this->score(tree.rss(), this->rootMse(tree), tree.numberSegments());
}

double CSegmentationScore::rootMse(double rss, std::size_t count) const {
    if (count == 0) {
        return 0.0;
    }
    double n{static_cast<double>(count)};
    double floor{m_RssFloor * n / m_Count};
    return n / m_Count * std::sqrt(std::max(rss, floor) / n);
}

double CSegmentationScore::rootMse(const CBreakpointTree& tree) const {
    double result{0.0};
    for (const auto& segment : tree.segments()) {
        result += this->rootMse(segment.s_Fit.s_Rss, segment.size());
    }
    return result;
}

std::size_t CSegmentationScore::numberParameters(std::size_t segments) {
    std::size_t breakpoints{segments > 0 ? segments - 1 : 0};
    return PARAMETERS_PER_SEGMENT * segments + breakpoints + 1;
}

bool CSegmentationScore::equivalent(double lhs, double rhs) {
    return std::fabs(lhs - rhs) <=
           EQUAL_SCORE_TOLERANCE * std::max(std::fabs(lhs), std::fabs(rhs));
}

std::ostream& operator<<(std::ostream& strm, const CSegmentationScore::SScore& score) {
    return strm << score.print();
}
}
}
