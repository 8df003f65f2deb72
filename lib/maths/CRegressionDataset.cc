/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <maths/CRegressionDataset.h>

#include <core/CLogger.h>
#include <core/CStringUtils.h>

#include <maths/CBasicStatistics.h>
#include <maths/CSegmentationErrors.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace segreg {
namespace maths {

CRegressionDataset::CRegressionDataset(TDoubleDoublePrVec samples, TTransformCPtr transform)
    : m_Transform{std::move(transform)} {

    if (samples.empty()) {
        throw CInsufficientDataError{"No samples to fit"};
    }
    if (m_Transform == nullptr) {
        throw std::invalid_argument("Missing coordinate transform");
    }

    for (const auto& sample : samples) {
        if (std::isfinite(sample.first) == false || std::isfinite(sample.second) == false) {
            throw std::invalid_argument(
                "Non-finite sample (" + core::CStringUtils::typeToString(sample.first) +
                ", " + core::CStringUtils::typeToString(sample.second) + ")");
        }
    }

    std::stable_sort(samples.begin(), samples.end());

    std::size_t n{samples.size()};
    m_X.reserve(n);
    m_Y.reserve(n);
    m_Fx.reserve(n);
    m_Fy.reserve(n);
    for (const auto& sample : samples) {
        m_X.push_back(sample.first);
        m_Y.push_back(sample.second);
        m_Fx.push_back(m_Transform->transformAbscissa(sample.first));
        m_Fy.push_back(m_Transform->transformOrdinate(sample.second));
    }
    m_Weights.assign(n, 1.0);

    m_GroupStarts.resize(n + 1, 0);
    for (std::size_t i = 0; i < n; ++i) {
        m_GroupStarts[i + 1] = m_GroupStarts[i] + (this->isGroupStart(i) ? 1 : 0);
    }

    LOG_TRACE(<< "Created dataset with " << n << " samples, "
              << this->numberDistinctAbscissas() << " distinct abscissas, "
              << m_Transform->print());
}

void CRegressionDataset::weights(TDoubleVec weights) {
    if (weights.size() != m_X.size()) {
        throw std::invalid_argument(
            "Expected " + core::CStringUtils::typeToString(m_X.size()) +
            " weights, got " + core::CStringUtils::typeToString(weights.size()));
    }
    if (std::any_of(weights.begin(), weights.end(), [](double weight) {
            return std::isfinite(weight) == false || weight <= 0.0;
        })) {
        throw std::invalid_argument("Weights must be positive and finite");
    }

    // Divide through by the largest weight first so the sum can't overflow.
    double scale{*std::max_element(weights.begin(), weights.end())};
    CBasicStatistics::SSampleMean mean;
    for (auto& weight : weights) {
        weight /= scale;
        mean.add(weight);
    }
    double normalizer{CBasicStatistics::mean(mean)};

    m_SumLogWeights = 0.0;
    for (auto& weight : weights) {
        weight = std::max(weight / normalizer, std::numeric_limits<double>::min());
        m_SumLogWeights += std::log(weight);
    }
    m_Weights = std::move(weights);
}

bool CRegressionDataset::isGroupStart(std::size_t i) const {
    return i == 0 || m_X[i] != m_X[i - 1];
}

std::size_t CRegressionDataset::numberDistinctAbscissas(std::size_t begin,
                                                        std::size_t end) const {
    if (begin >= end) {
        return 0;
    }
    // The first sample of the range always starts a group within the range.
    return m_GroupStarts[end] - m_GroupStarts[begin + 1] + 1;
}

std::size_t CRegressionDataset::numberDistinctAbscissas() const {
    return m_GroupStarts.back();
}

std::size_t CRegressionDataset::lowerBound(double x) const {
    return static_cast<std::size_t>(
        std::lower_bound(m_X.begin(), m_X.end(), x) - m_X.begin());
}

double CRegressionDataset::ordinateScale() const {
    CBasicStatistics::SSampleMean result;
    for (std::size_t i = 0; i < m_Fy.size(); ++i) {
        result.add(m_Fy[i] * m_Fy[i], m_Weights[i]);
    }
    return CBasicStatistics::mean(result);
}
}
}
