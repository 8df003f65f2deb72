/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <maths/CSegmentedRegression.h>

#include <core/CLogger.h>
#include <core/CStringUtils.h>

#include <maths/CCoordinateTransform.h>
#include <maths/CNoiseModel.h>
#include <maths/CRegressionDataset.h>
#include <maths/CTopDownSegmentation.h>

#include <memory>
#include <stdexcept>

namespace segreg {
namespace maths {

CSegmentedModel CSegmentedRegression::computeRegression(const TDoubleVec& x,
                                                        const TDoubleVec& y,
                                                        maths_t::ERegressionMode mode,
                                                        const CSegmentedRegressionParams& params) {
    if (x.size() != y.size()) {
        throw std::invalid_argument("Mismatched lengths: " +
                                    core::CStringUtils::typeToString(x.size()) + " x values and " +
                                    core::CStringUtils::typeToString(y.size()) + " y values");
    }

    TDoubleDoublePrVec samples;
    samples.reserve(x.size());
    for (std::size_t i = 0; i < x.size(); ++i) {
        samples.emplace_back(x[i], y[i]);
    }
    return computeRegression(std::move(samples), mode, params);
}

CSegmentedModel CSegmentedRegression::computeRegression(TDoubleDoublePrVec samples,
                                                        maths_t::ERegressionMode mode,
                                                        const CSegmentedRegressionParams& params) {
    LOG_DEBUG(<< "Fitting " << samples.size() << " samples in " << mode
              << " mode with " << params.print());

    auto dataset = std::make_shared<CRegressionDataset>(
        std::move(samples), CCoordinateTransform::create(mode, params.transformOrdinate()));

    CNoiseModel noise{CNoiseModel::estimate(*dataset, params.heteroscedastic(),
                                            params.noiseInTransformedSpace())};
    dataset->weights(noise.weights(*dataset));

    CTopDownSegmentation segmentation{TDatasetCPtr{std::move(dataset)}, params};
    segmentation.build();

    CSegmentedModel result{segmentation.tree(), params, segmentation.history(),
                           segmentation.curves()};
    LOG_DEBUG(<< "Fitted " << result);
    return result;
}
}
}
