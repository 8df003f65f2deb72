/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <maths/CWeightedLinearRegression.h>

#include <core/CLogger.h>

#include <Eigen/Core>
#include <Eigen/SVD>

#include <algorithm>
#include <cmath>
#include <sstream>

namespace segreg {
namespace maths {

void CWeightedLinearRegression::add(double x, double y, double weight) {
    if (weight <= 0.0) {
        return;
    }

    ++m_NumberSamples;
    m_Weight += weight;

    double alpha{weight / m_Weight};
    double beta{1.0 - alpha};

    double meanX{m_MeanX};
    double meanY{m_MeanY};
    m_MeanX = beta * meanX + alpha * x;
    m_MeanY = beta * meanY + alpha * y;

    double dx{x - m_MeanX};
    double dy{y - m_MeanY};
    double dMeanX{meanX - m_MeanX};
    double dMeanY{meanY - m_MeanY};

    m_Cxx = beta * (m_Cxx + dMeanX * dMeanX) + alpha * dx * dx;
    m_Cxy = beta * (m_Cxy + dMeanX * dMeanY) + alpha * dx * dy;
    m_Cyy = beta * (m_Cyy + dMeanY * dMeanY) + alpha * dy * dy;
}

const CWeightedLinearRegression& CWeightedLinearRegression::
operator+=(const CWeightedLinearRegression& rhs) {
    if (rhs.m_Weight == 0.0) {
        return *this;
    }

    m_NumberSamples += rhs.m_NumberSamples;
    m_Weight += rhs.m_Weight;

    double alpha{rhs.m_Weight / m_Weight};
    double beta{1.0 - alpha};

    double meanXLhs{m_MeanX};
    double meanYLhs{m_MeanY};
    m_MeanX = beta * meanXLhs + alpha * rhs.m_MeanX;
    m_MeanY = beta * meanYLhs + alpha * rhs.m_MeanY;

    double dXLhs{meanXLhs - m_MeanX};
    double dYLhs{meanYLhs - m_MeanY};
    double dXRhs{rhs.m_MeanX - m_MeanX};
    double dYRhs{rhs.m_MeanY - m_MeanY};

    m_Cxx = beta * (m_Cxx + dXLhs * dXLhs) + alpha * (rhs.m_Cxx + dXRhs * dXRhs);
    m_Cxy = beta * (m_Cxy + dXLhs * dYLhs) + alpha * (rhs.m_Cxy + dXRhs * dYRhs);
    m_Cyy = beta * (m_Cyy + dYLhs * dYLhs) + alpha * (rhs.m_Cyy + dYRhs * dYRhs);

    return *this;
}

const CWeightedLinearRegression& CWeightedLinearRegression::
operator-=(const CWeightedLinearRegression& rhs) {
    if (rhs.m_Weight == 0.0) {
        return *this;
    }

    m_NumberSamples = m_NumberSamples > rhs.m_NumberSamples
                          ? m_NumberSamples - rhs.m_NumberSamples
                          : 0;
    m_Weight = std::max(m_Weight - rhs.m_Weight, 0.0);

    if (m_NumberSamples == 0 || m_Weight == 0.0) {
        *this = CWeightedLinearRegression{};
        return *this;
    }

    double alpha{rhs.m_Weight / m_Weight};
    double beta{1.0 + alpha};

    double meanXLhs{m_MeanX};
    double meanYLhs{m_MeanY};
    m_MeanX = beta * meanXLhs - alpha * rhs.m_MeanX;
    m_MeanY = beta * meanYLhs - alpha * rhs.m_MeanY;

    double dXLhs{m_MeanX - meanXLhs};
    double dYLhs{m_MeanY - meanYLhs};
    double dXRhs{rhs.m_MeanX - meanXLhs};
    double dYRhs{rhs.m_MeanY - meanYLhs};

    m_Cxx = std::max(beta * (m_Cxx - dXLhs * dXLhs) -
                         alpha * (rhs.m_Cxx + dXRhs * dXRhs - dXLhs * dXLhs),
                     0.0);
    m_Cxy = beta * (m_Cxy - dXLhs * dYLhs) -
            alpha * (rhs.m_Cxy + dXRhs * dYRhs - dXLhs * dYLhs);
    m_Cyy = std::max(beta * (m_Cyy - dYLhs * dYLhs) -
                         alpha * (rhs.m_Cyy + dYRhs * dYRhs - dYLhs * dYLhs),
                     0.0);

    return *this;
}

bool CWeightedLinearRegression::parameters(TArray& result, double maxCondition) const {
    if (m_NumberSamples < 2 || m_Weight <= 0.0) {
        return false;
    }

    // We solve the normal equations for the basis {1, (x - mean(x)) / s}
    // where s is the RMS abscissa. The Gramian condition is then the ratio
    // of the abscissa magnitude to its spread, which identifies segments
    // whose abscissas are equal to working precision independent of units.
    double scale{std::sqrt(m_MeanX * m_MeanX + m_Cxx)};
    if (scale == 0.0) {
        return false;
    }

    Eigen::Matrix2d gramian;
    gramian << 1.0, 0.0, 0.0, m_Cxx / (scale * scale);
    Eigen::Vector2d moments;
    moments << m_MeanY, m_Cxy / scale;

    Eigen::JacobiSVD<Eigen::Matrix2d> svd(gramian, Eigen::ComputeFullU | Eigen::ComputeFullV);
    if (svd.singularValues()(0) > maxCondition * svd.singularValues()(1)) {
        LOG_TRACE(<< "Ill-conditioned Gramian: singular values = "
                  << svd.singularValues().transpose() << ", statistics = " << this->print());
        return false;
    }

    Eigen::Vector2d solution{svd.solve(moments)};
    double slope{solution(1) / scale};
    result[0] = solution(0) - slope * m_MeanX;
    result[1] = slope;

    return true;
}

double CWeightedLinearRegression::residualSumSquares() const {
    if (m_Cxx <= 0.0) {
        return m_Weight * m_Cyy;
    }
    return m_Weight * std::max(m_Cyy - m_Cxy * m_Cxy / m_Cxx, 0.0);
}

std::string CWeightedLinearRegression::print() const {
    std::ostringstream result;
    result << "{n = " << m_NumberSamples << ", w = " << m_Weight
           << ", mean = (" << m_MeanX << ", " << m_MeanY << "), C = (" << m_Cxx
           << ", " << m_Cxy << ", " << m_Cyy << ")}";
    return result.str();
}
}
}
