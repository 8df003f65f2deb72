/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_segreg_maths_CSegmentedRegressionParams_h
#define INCLUDED_segreg_maths_CSegmentedRegressionParams_h

#include <maths/Constants.h>
#include <maths/ImportExport.h>
#include <maths/MathsTypes.h>

#include <boost/property_tree/ptree_fwd.hpp>

#include <cstddef>
#include <limits>
#include <string>

namespace segreg {
namespace maths {

//! \brief The parameters of a segmented regression.
//!
//! DESCRIPTION:\n
//! Holds every tunable of the breakpoint search, the noise model and the
//! coordinate transform. Values can be set programmatically, e.g.
//! \code{.cpp}
//! CSegmentedRegressionParams params;
//! params.minimumSegmentSize(5).informationCriterion(maths_t::E_AIC);
//! \endcode
//! or read from an ini file of the form
//! <pre>
//! [segmentation]
//! minimumsegmentsize = 5
//! maximumbreakpoints = 10
//! maximumdepth = 4
//! minimumscoreimprovement = 0.0
//! informationcriterion = bic
//! precision = 1e-6
//! [noise]
//! heteroscedastic = true
//! noiseintransformedspace = true
//! [transform]
//! transformordinate = true
//! </pre>
//!
//! IMPLEMENTATION DECISIONS:\n
//! Setters don't validate. Invalid values are detected by init when read
//! from a file and are clamped where they are used otherwise, i.e. the
//! minimum segment size is never less than MINIMUM_SEGMENT_SIZE.
class MATHS_EXPORT CSegmentedRegressionParams {
public:
    //! The value of a limit which doesn't apply.
    static const std::size_t UNLIMITED;

    static const std::string SEGMENTATION_STANZA;
    static const std::string NOISE_STANZA;
    static const std::string TRANSFORM_STANZA;
    static const std::string MINIMUM_SEGMENT_SIZE_PROPERTY;
    static const std::string MAXIMUM_BREAKPOINTS_PROPERTY;
    static const std::string MAXIMUM_DEPTH_PROPERTY;
    static const std::string MINIMUM_SCORE_IMPROVEMENT_PROPERTY;
    static const std::string INFORMATION_CRITERION_PROPERTY;
    static const std::string PRECISION_PROPERTY;
    static const std::string HETEROSCEDASTIC_PROPERTY;
    static const std::string NOISE_IN_TRANSFORMED_SPACE_PROPERTY;
    static const std::string TRANSFORM_ORDINATE_PROPERTY;

public:
    CSegmentedRegressionParams() = default;

    //! Initialize from the ini file \p configFile.
    //!
    //! \return False if the file can't be read or contains an invalid value
    //! in which case this object is unchanged.
    bool init(const std::string& configFile);

    //! Initialize from a property tree.
    bool init(const boost::property_tree::ptree& propTree);

    //! \name Segmentation
    //@{
    CSegmentedRegressionParams& minimumSegmentSize(std::size_t size);
    //! Get the minimum number of samples in a segment, which is at least
    //! MINIMUM_SEGMENT_SIZE.
    std::size_t minimumSegmentSize() const;

    CSegmentedRegressionParams& maximumBreakpoints(std::size_t breakpoints);
    std::size_t maximumBreakpoints() const;

    CSegmentedRegressionParams& maximumDepth(std::size_t depth);
    std::size_t maximumDepth() const;

    CSegmentedRegressionParams& minimumScoreImprovement(double improvement);
    double minimumScoreImprovement() const;

    CSegmentedRegressionParams& informationCriterion(maths_t::EInfoCriterion criterion);
    maths_t::EInfoCriterion informationCriterion() const;

    CSegmentedRegressionParams& precision(double precision);
    double precision() const;
    //@}

    //! \name Noise
    //@{
    CSegmentedRegressionParams& heteroscedastic(bool heteroscedastic);
    bool heteroscedastic() const;

    CSegmentedRegressionParams& noiseInTransformedSpace(bool inTransformedSpace);
    bool noiseInTransformedSpace() const;
    //@}

    //! \name Transform
    //@{
    CSegmentedRegressionParams& transformOrdinate(bool transform);
    bool transformOrdinate() const;
    //@}

    //! Get a description of the parameters.
    std::string print() const;

private:
    //! Read the properties of the stanza \p propertyTree.
    bool processStanza(const std::string& stanzaName,
                       const boost::property_tree::ptree& propertyTree);

private:
    std::size_t m_MinimumSegmentSize{DEFAULT_MINIMUM_SEGMENT_SIZE};
    std::size_t m_MaximumBreakpoints{std::numeric_limits<std::size_t>::max()};
    std::size_t m_MaximumDepth{std::numeric_limits<std::size_t>::max()};
    double m_MinimumScoreImprovement{0.0};
    maths_t::EInfoCriterion m_InformationCriterion{maths_t::E_BIC};
    double m_Precision{DEFAULT_PRECISION};
    bool m_Heteroscedastic{true};
    bool m_NoiseInTransformedSpace{true};
    bool m_TransformOrdinate{true};
};
}
}

#endif // INCLUDED_segreg_maths_CSegmentedRegressionParams_h
