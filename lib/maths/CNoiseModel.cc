/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <maths/CNoiseModel.h>

#include <core/CLogger.h>

#include <maths/CBasicStatistics.h>
#include <maths/CRegressionDataset.h>
#include <maths/CSegmentationErrors.h>
#include <maths/CWeightedLinearRegression.h>
#include <maths/Constants.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace segreg {
namespace maths {
namespace {
using TMeanVarAccumulator = CBasicStatistics::SSampleMeanVar;

//! Get the ordinate in the space in which the noise is modelled.
double noiseOrdinate(const CRegressionDataset& dataset, std::size_t i, bool inTransformedSpace) {
    return inTransformedSpace ? dataset.fy(i) : dataset.y(i);
}

//! Get the residuals of an unweighted straight line fit in fitting
//! coordinates, expressed in the noise space.
maths_t::TDoubleVec initialResiduals(const CRegressionDataset& dataset, bool inTransformedSpace) {
    CWeightedLinearRegression regression;
    for (std::size_t i = 0; i < dataset.size(); ++i) {
        regression.add(dataset.fx(i), dataset.fy(i));
    }

    CWeightedLinearRegression::TArray params;
    if (regression.parameters(params) == false) {
        LOG_DEBUG(<< "Initial fit is ill-conditioned, using mean: " << regression.print());
        params = {regression.meanOrdinate(), 0.0};
    }

    const CCoordinateTransform& transform{dataset.transform()};
    maths_t::TDoubleVec result;
    result.reserve(dataset.size());
    for (std::size_t i = 0; i < dataset.size(); ++i) {
        double prediction{CWeightedLinearRegression::predict(params, dataset.fx(i))};
        if (inTransformedSpace == false) {
            prediction = transform.inverseOrdinate(prediction);
        }
        result.push_back(noiseOrdinate(dataset, i, inTransformedSpace) - prediction);
    }
    return result;
}
}

CNoiseModel::CNoiseModel(double floor, bool inTransformedSpace)
    : m_Floor{floor}, m_InTransformedSpace{inTransformedSpace} {
}

CNoiseModel CNoiseModel::estimate(const CRegressionDataset& dataset,
                                  bool heteroscedastic,
                                  bool inTransformedSpace) {
    if (dataset.numberDistinctAbscissas() < 2) {
        throw CInsufficientDataError{"Need at least two distinct x values, got " +
                                     std::to_string(dataset.numberDistinctAbscissas())};
    }

    // The space in which the noise is modelled only differs from fitting
    // coordinates if the ordinate is transformed.
    inTransformedSpace = inTransformedSpace || dataset.transform().transformsOrdinate() == false;

    std::size_t n{dataset.size()};

    CBasicStatistics::SSampleMean meanSquare;
    for (std::size_t i = 0; i < n; ++i) {
        double z{noiseOrdinate(dataset, i, inTransformedSpace)};
        meanSquare.add(z * z);
    }
    double floor{std::max(VARIANCE_FLOOR_FRACTION * CBasicStatistics::mean(meanSquare),
                          std::numeric_limits<double>::min())};

    CNoiseModel result{floor, inTransformedSpace};

    if (heteroscedastic && dataset.numberDistinctAbscissas() < n) {
        result.m_Type = E_Empirical;

        TMeanVarAccumulator pooled;
        CWeightedLinearRegression groupVariances;
        std::size_t positive{0};
        for (std::size_t begin = 0, end = 0; begin < n; begin = end) {
            TMeanVarAccumulator moments;
            for (end = begin; end < n && dataset.x(end) == dataset.x(begin); ++end) {
                moments.add(noiseOrdinate(dataset, end, inTransformedSpace));
            }
            if (end - begin < 2) {
                continue;
            }

            double x{dataset.x(begin)};
            double variance{std::max(CBasicStatistics::variance(moments), floor)};
            result.m_Empirical[x] = variance;
            double degreesFreedom{static_cast<double>(end - begin - 1)};
            pooled.add(variance, degreesFreedom);
            if (x > 0.0) {
                groupVariances.add(std::log(x), std::log(variance), degreesFreedom);
                ++positive;
            }
        }
        result.m_Constant = std::max(CBasicStatistics::mean(pooled), floor);

        CWeightedLinearRegression::TArray params;
        if (positive >= 2 && groupVariances.parameters(params)) {
            result.m_HasPowerLaw = true;
            result.m_LogScale = params[0];
            result.m_Exponent = params[1];
        } else if (result.m_Empirical.size() < dataset.numberDistinctAbscissas()) {
            LOG_DEBUG(<< "Using pooled variance " << result.m_Constant
                      << " for singleton x values");
        }

        LOG_DEBUG(<< "Noise model: " << result.print());
        return result;
    }

    TDoubleVec residuals{initialResiduals(dataset, inTransformedSpace)};

    CBasicStatistics::SSampleMean meanSquareResidual;
    for (auto residual : residuals) {
        meanSquareResidual.add(residual * residual);
    }
    result.m_Constant = std::max(CBasicStatistics::mean(meanSquareResidual), floor);

    if (heteroscedastic) {
        if (dataset.minimumAbscissa() <= 0.0) {
            LOG_WARN(<< "Power law noise needs x > 0, but min(x) = "
                     << dataset.minimumAbscissa() << ". Using constant variance");
        } else {
            CWeightedLinearRegression regression;
            for (std::size_t i = 0; i < n; ++i) {
                regression.add(std::log(dataset.x(i)),
                               std::log(residuals[i] * residuals[i] + floor));
            }
            CWeightedLinearRegression::TArray params;
            if (regression.parameters(params)) {
                result.m_Type = E_PowerLaw;
                result.m_HasPowerLaw = true;
                result.m_LogScale = params[0];
                result.m_Exponent = params[1];
            } else {
                LOG_WARN(<< "Failed to fit power law noise. Using constant variance");
            }
        }
    }

    LOG_DEBUG(<< "Noise model: " << result.print());
    return result;
}

double CNoiseModel::variance(double x) const {
    if (m_Type == E_Empirical) {
        auto i = m_Empirical.find(x);
        if (i != m_Empirical.end()) {
            return i->second;
        }
    }
    return this->fallbackVariance(x);
}

double CNoiseModel::fallbackVariance(double x) const {
    if (m_HasPowerLaw && x > 0.0) {
        double result{std::exp(m_LogScale + m_Exponent * std::log(x))};
        // Overflow gives inf which would make the weight zero.
        return std::isfinite(result) ? std::max(result, m_Floor)
                                     : std::numeric_limits<double>::max();
    }
    return m_Constant;
}

CNoiseModel::TDoubleVec CNoiseModel::weights(const CRegressionDataset& dataset) const {
    const CCoordinateTransform& transform{dataset.transform()};
    bool deltaMethod{m_InTransformedSpace == false && transform.transformsOrdinate()};

    // We compute the effective variance of each sample in fitting coordinates
    // and weight relative to the smallest to avoid overflow.
    TDoubleVec variances;
    variances.reserve(dataset.size());
    for (std::size_t i = 0; i < dataset.size(); ++i) {
        double variance{this->variance(dataset.x(i))};
        if (deltaMethod) {
            double derivative{transform.ordinateDerivative(dataset.y(i))};
            variance *= derivative * derivative;
        }
        variances.push_back(std::max(variance, std::numeric_limits<double>::min()));
    }

    double minimum{*std::min_element(variances.begin(), variances.end())};
    CBasicStatistics::SSampleMean mean;
    TDoubleVec result;
    result.reserve(variances.size());
    for (auto variance : variances) {
        result.push_back(minimum / variance);
        mean.add(result.back());
    }
    double normalizer{CBasicStatistics::mean(mean)};
    for (auto& weight : result) {
        weight = std::max(weight / normalizer, std::numeric_limits<double>::min());
    }
    return result;
}

std::string CNoiseModel::print() const {
    std::ostringstream result;
    result << maths::print(m_Type) << (m_InTransformedSpace ? " (fitting space)" : " (original space)");
    switch (m_Type) {
    case E_Constant:
        result << " variance = " << m_Constant;
        break;
    case E_PowerLaw:
        result << " log(variance) = " << m_LogScale << " + " << m_Exponent << " log(x)";
        break;
    case E_Empirical:
        result << " groups = " << m_Empirical.size() << ", fallback = ";
        if (m_HasPowerLaw) {
            result << m_LogScale << " + " << m_Exponent << " log(x)";
        } else {
            result << m_Constant;
        }
        break;
    }
    result << ", floor = " << m_Floor;
    return result.str();
}

std::string print(CNoiseModel::EType type) {
    switch (type) {
    case CNoiseModel::E_Constant:
        return "constant";
    case CNoiseModel::E_PowerLaw:
        return "power law";
    case CNoiseModel::E_Empirical:
        return "empirical";
    }
    return "unknown";
}
}
}
