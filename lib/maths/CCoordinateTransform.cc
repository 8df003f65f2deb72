/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <maths/CCoordinateTransform.h>

#include <core/CStringUtils.h>

#include <maths/CSegmentationErrors.h>

#include <cmath>
#include <stdexcept>

namespace segreg {
namespace maths {

CCoordinateTransform::TTransformCPtr
CCoordinateTransform::create(maths_t::ERegressionMode mode, bool transformOrdinate) {
    switch (mode) {
    case maths_t::E_Linear:
        return std::make_shared<const CLinearCoordinateTransform>();
    case maths_t::E_Log:
        return std::make_shared<const CLogCoordinateTransform>(transformOrdinate);
    }
    throw std::invalid_argument("Unsupported regression mode " +
                                core::CStringUtils::typeToString(static_cast<int>(mode)));
}

std::string CCoordinateTransform::print() const {
    return maths_t::print(this->mode()) + " (" + this->abscissaLabel() + ", " +
           this->ordinateLabel() + ")";
}

maths_t::ERegressionMode CLinearCoordinateTransform::mode() const {
    return maths_t::E_Linear;
}

bool CLinearCoordinateTransform::transformsOrdinate() const {
    return false;
}

double CLinearCoordinateTransform::transformAbscissa(double x) const {
    return x;
}

double CLinearCoordinateTransform::inverseAbscissa(double fx) const {
    return fx;
}

double CLinearCoordinateTransform::transformOrdinate(double y) const {
    return y;
}

double CLinearCoordinateTransform::inverseOrdinate(double fy) const {
    return fy;
}

double CLinearCoordinateTransform::ordinateDerivative(double /*y*/) const {
    return 1.0;
}

std::string CLinearCoordinateTransform::abscissaLabel() const {
    return "x";
}

std::string CLinearCoordinateTransform::ordinateLabel() const {
    return "y";
}

CLogCoordinateTransform::CLogCoordinateTransform(bool transformOrdinate)
    : m_TransformOrdinate{transformOrdinate} {
}

maths_t::ERegressionMode CLogCoordinateTransform::mode() const {
    return maths_t::E_Log;
}

bool CLogCoordinateTransform::transformsOrdinate() const {
    return m_TransformOrdinate;
}

double CLogCoordinateTransform::transformAbscissa(double x) const {
    if (!(x > 0.0)) {
        throw CDegenerateSegmentError{"Log mode requires x > 0, got " +
                                      core::CStringUtils::typeToStringPrecise(x, 17)};
    }
    return std::log(x);
}

double CLogCoordinateTransform::inverseAbscissa(double fx) const {
    return std::exp(fx);
}

double CLogCoordinateTransform::transformOrdinate(double y) const {
    if (m_TransformOrdinate == false) {
        return y;
    }
    if (!(y > 0.0)) {
        throw CDegenerateSegmentError{"Log mode requires y > 0, got " +
                                      core::CStringUtils::typeToStringPrecise(y, 17)};
    }
    return std::log(y);
}

double CLogCoordinateTransform::inverseOrdinate(double fy) const {
    return m_TransformOrdinate ? std::exp(fy) : fy;
}

double CLogCoordinateTransform::ordinateDerivative(double y) const {
    return m_TransformOrdinate ? 1.0 / y : 1.0;
}

std::string CLogCoordinateTransform::abscissaLabel() const {
    return "log(x)";
}

std::string CLogCoordinateTransform::ordinateLabel() const {
    return m_TransformOrdinate ? "log(y)" : "y";
}
}
}
