/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_segreg_maths_CNoiseModel_h
#define INCLUDED_segreg_maths_CNoiseModel_h

#include <maths/ImportExport.h>
#include <maths/MathsTypes.h>

#include <map>
#include <string>

namespace segreg {
namespace maths {
class CRegressionDataset;

//! \brief A model for the dependence of the measurement noise variance on x.
//!
//! DESCRIPTION:\n
//! The variance is modelled as one of:
//!   -# Constant: the mean square residual of a straight line fit.
//!   -# Power law: \f$\sigma^2(x) = \exp(c + k \log(x))\f$, found by
//!      regressing the log square residuals of a straight line fit on
//!      log(x).
//!   -# Empirical: the sample variance at each x with repeated
//!      measurements. For x with a single measurement it falls back to a
//!      power law fitted to the group variances or, if that isn't possible,
//!      the pooled group variance.
//!
//! The noise can be modelled either in fitting coordinates or in the
//! original ordinate. In the second case the weights for a transformed
//! ordinate f(y) use the delta method, i.e. Var[f(y)] ~ f'(y)^2 Var[y].
//!
//! IMPLEMENTATION DECISIONS:\n
//! All variances are floored at a small fraction of the mean square
//! ordinate so weights are always finite and positive.
class MATHS_EXPORT CNoiseModel {
public:
    using TDoubleVec = maths_t::TDoubleVec;

    //! The form of the variance model.
    enum EType { E_Constant, E_PowerLaw, E_Empirical };

public:
    //! Estimate the noise model for \p dataset.
    //!
    //! \param[in] heteroscedastic If false the variance is constant.
    //! \param[in] inTransformedSpace If true the noise is modelled in
    //! fitting coordinates, otherwise in the original ordinate.
    //! \throws CInsufficientDataError if there are fewer than two distinct
    //! abscissas.
    static CNoiseModel estimate(const CRegressionDataset& dataset,
                                bool heteroscedastic,
                                bool inTransformedSpace);

    //! Get the type of model.
    EType type() const { return m_Type; }

    //! Get the variance at \p x.
    double variance(double x) const;

    //! Get the variance floor.
    double floor() const { return m_Floor; }

    //! Get the regression weights of the samples of \p dataset normalised
    //! to have mean one.
    TDoubleVec weights(const CRegressionDataset& dataset) const;

    //! Get a description of the model.
    std::string print() const;

private:
    using TDoubleDoubleMap = std::map<double, double>;

private:
    CNoiseModel(double floor, bool inTransformedSpace);

    //! Get the variance at \p x if it isn't measured.
    double fallbackVariance(double x) const;

private:
    EType m_Type{E_Constant};
    double m_Floor;
    bool m_InTransformedSpace;
    //! The constant or pooled variance.
    double m_Constant{0.0};
    //! True if the power law parameters are set.
    bool m_HasPowerLaw{false};
    double m_LogScale{0.0};
    double m_Exponent{0.0};
    //! The measured variances by abscissa.
    TDoubleDoubleMap m_Empirical;
};

MATHS_EXPORT
std::string print(CNoiseModel::EType type);
}
}

#endif // INCLUDED_segreg_maths_CNoiseModel_h
