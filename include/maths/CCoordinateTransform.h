/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_segreg_maths_CCoordinateTransform_h
#define INCLUDED_segreg_maths_CCoordinateTransform_h

#include <maths/ImportExport.h>
#include <maths/MathsTypes.h>

#include <memory>
#include <string>

namespace segreg {
namespace maths {

//! \brief The coordinate system in which segments are fitted.
//!
//! DESCRIPTION:\n
//! Maps samples from their original coordinates to the coordinates in which
//! straight lines are fitted and back. A single transform is selected for a
//! regression run and shared by the dataset and the model.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Transforms which are undefined for a value throw CDegenerateSegmentError
//! rather than returning NaN so invalid input is never silently fitted.
class MATHS_EXPORT CCoordinateTransform {
public:
    using TTransformCPtr = std::shared_ptr<const CCoordinateTransform>;

public:
    virtual ~CCoordinateTransform() = default;

    //! Create the transform for \p mode.
    //!
    //! \param[in] transformOrdinate If false the log transform only applies
    //! to the abscissa. This is ignored for linear mode.
    static TTransformCPtr create(maths_t::ERegressionMode mode, bool transformOrdinate = true);

    //! Get the mode this implements.
    virtual maths_t::ERegressionMode mode() const = 0;

    //! Check if the ordinate is transformed.
    virtual bool transformsOrdinate() const = 0;

    //! Map \p x to fitting coordinates.
    virtual double transformAbscissa(double x) const = 0;

    //! Map \p fx in fitting coordinates back to the original abscissa.
    virtual double inverseAbscissa(double fx) const = 0;

    //! Map \p y to fitting coordinates.
    virtual double transformOrdinate(double y) const = 0;

    //! Map \p fy in fitting coordinates back to the original ordinate.
    virtual double inverseOrdinate(double fy) const = 0;

    //! Get the derivative of the ordinate transform at \p y.
    virtual double ordinateDerivative(double y) const = 0;

    //! Get a label for the fitted abscissa, e.g. "log(x)".
    virtual std::string abscissaLabel() const = 0;

    //! Get a label for the fitted ordinate.
    virtual std::string ordinateLabel() const = 0;

    //! Get a description of the transform.
    std::string print() const;
};

//! \brief The identity transform.
class MATHS_EXPORT CLinearCoordinateTransform final : public CCoordinateTransform {
public:
    maths_t::ERegressionMode mode() const override;
    bool transformsOrdinate() const override;
    double transformAbscissa(double x) const override;
    double inverseAbscissa(double fx) const override;
    double transformOrdinate(double y) const override;
    double inverseOrdinate(double fy) const override;
    double ordinateDerivative(double y) const override;
    std::string abscissaLabel() const override;
    std::string ordinateLabel() const override;
};

//! \brief Natural log of the abscissa and, optionally, the ordinate.
//!
//! A power law y = exp(b) x^a is a straight line in these coordinates.
class MATHS_EXPORT CLogCoordinateTransform final : public CCoordinateTransform {
public:
    explicit CLogCoordinateTransform(bool transformOrdinate);

    maths_t::ERegressionMode mode() const override;
    bool transformsOrdinate() const override;
    double transformAbscissa(double x) const override;
    double inverseAbscissa(double fx) const override;
    double transformOrdinate(double y) const override;
    double inverseOrdinate(double fy) const override;
    double ordinateDerivative(double y) const override;
    std::string abscissaLabel() const override;
    std::string ordinateLabel() const override;

private:
    bool m_TransformOrdinate;
};
}
}

#endif // INCLUDED_segreg_maths_CCoordinateTransform_h
