/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_segreg_maths_CRegressionDataset_h
#define INCLUDED_segreg_maths_CRegressionDataset_h

#include <maths/CCoordinateTransform.h>
#include <maths/ImportExport.h>
#include <maths/MathsTypes.h>

#include <cstddef>
#include <memory>
#include <vector>

namespace segreg {
namespace maths {

//! \brief The samples to which a segmented model is fitted.
//!
//! DESCRIPTION:\n
//! Holds the samples sorted by abscissa, then ordinate, together with their
//! values in fitting coordinates and their regression weights. Segments
//! refer to contiguous index ranges of this object.
//!
//! Samples with equal abscissa form a group. A breakpoint can only fall
//! between two groups, so the queries for the number of distinct abscissas
//! in a range and for the group starts are constant time.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Once the weights are set the dataset is shared immutable between the
//! models derived from one regression, i.e. through TDatasetCPtr.
class MATHS_EXPORT CRegressionDataset {
public:
    using TDoubleVec = maths_t::TDoubleVec;
    using TDoubleDoublePrVec = maths_t::TDoubleDoublePrVec;
    using TSizeVec = std::vector<std::size_t>;
    using TTransformCPtr = CCoordinateTransform::TTransformCPtr;

public:
    //! \throws CInsufficientDataError if \p samples is empty.
    //! \throws std::invalid_argument if any value isn't finite.
    //! \throws CDegenerateSegmentError if any value isn't in the domain of
    //! \p transform.
    CRegressionDataset(TDoubleDoublePrVec samples, TTransformCPtr transform);

    //! Set the sample weights.
    //!
    //! The weights are normalised to have mean one.
    //! \throws std::invalid_argument if the number of weights is wrong or
    //! any weight isn't positive and finite.
    void weights(TDoubleVec weights);

    //! Get the number of samples.
    std::size_t size() const { return m_X.size(); }

    //! Get the i'th abscissa.
    double x(std::size_t i) const { return m_X[i]; }
    //! Get the i'th ordinate.
    double y(std::size_t i) const { return m_Y[i]; }
    //! Get the i'th abscissa in fitting coordinates.
    double fx(std::size_t i) const { return m_Fx[i]; }
    //! Get the i'th ordinate in fitting coordinates.
    double fy(std::size_t i) const { return m_Fy[i]; }
    //! Get the i'th regression weight.
    double weight(std::size_t i) const { return m_Weights[i]; }

    //! Get the coordinate transform.
    const CCoordinateTransform& transform() const { return *m_Transform; }

    //! Get the shared coordinate transform.
    const TTransformCPtr& transformPtr() const { return m_Transform; }

    //! Check if \p i is the first sample with its abscissa.
    bool isGroupStart(std::size_t i) const;

    //! Get the number of distinct abscissas in the index range [\p begin, \p end).
    std::size_t numberDistinctAbscissas(std::size_t begin, std::size_t end) const;

    //! Get the number of distinct abscissas.
    std::size_t numberDistinctAbscissas() const;

    //! Get the index of the first sample whose abscissa is not less than \p x.
    std::size_t lowerBound(double x) const;

    //! Get the smallest abscissa.
    double minimumAbscissa() const { return m_X.front(); }

    //! Get the largest abscissa.
    double maximumAbscissa() const { return m_X.back(); }

    //! Get the sum of the logarithms of the weights.
    double sumLogWeights() const { return m_SumLogWeights; }

    //! Get the weighted mean square of the ordinate in fitting coordinates.
    double ordinateScale() const;

private:
    TDoubleVec m_X;
    TDoubleVec m_Y;
    TDoubleVec m_Fx;
    TDoubleVec m_Fy;
    TDoubleVec m_Weights;
    //! The number of group starts in [0, i).
    TSizeVec m_GroupStarts;
    double m_SumLogWeights{0.0};
    TTransformCPtr m_Transform;
};

using TDatasetCPtr = std::shared_ptr<const CRegressionDataset>;
}
}

#endif // INCLUDED_segreg_maths_CRegressionDataset_h
