/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <maths/CSegmentedRegressionParams.h>

#include <core/CLogger.h>
#include <core/CStringUtils.h>

#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>

namespace segreg {
namespace maths {
namespace {
const std::string UNLIMITED_VALUE{"unlimited"};

//! Parse a limit which may be "unlimited".
bool parseLimit(const std::string& value, std::size_t& result) {
    if (core::CStringUtils::toLower(value) == UNLIMITED_VALUE) {
        result = CSegmentedRegressionParams::UNLIMITED;
        return true;
    }
    unsigned long long limit;
    if (core::CStringUtils::stringToType(value, limit) == false) {
        return false;
    }
    result = static_cast<std::size_t>(limit);
    return true;
}

std::string printLimit(std::size_t limit) {
    return limit == CSegmentedRegressionParams::UNLIMITED
               ? UNLIMITED_VALUE
               : core::CStringUtils::typeToString(limit);
}
}

const std::size_t CSegmentedRegressionParams::UNLIMITED{std::numeric_limits<std::size_t>::max()};

const std::string CSegmentedRegressionParams::SEGMENTATION_STANZA{"segmentation"};
const std::string CSegmentedRegressionParams::NOISE_STANZA{"noise"};
const std::string CSegmentedRegressionParams::TRANSFORM_STANZA{"transform"};
const std::string CSegmentedRegressionParams::MINIMUM_SEGMENT_SIZE_PROPERTY{"minimumsegmentsize"};
const std::string CSegmentedRegressionParams::MAXIMUM_BREAKPOINTS_PROPERTY{"maximumbreakpoints"};
const std::string CSegmentedRegressionParams::MAXIMUM_DEPTH_PROPERTY{"maximumdepth"};
const std::string CSegmentedRegressionParams::MINIMUM_SCORE_IMPROVEMENT_PROPERTY{"minimumscoreimprovement"};
const std::string CSegmentedRegressionParams::INFORMATION_CRITERION_PROPERTY{"informationcriterion"};
const std::string CSegmentedRegressionParams::PRECISION_PROPERTY{"precision"};
const std::string CSegmentedRegressionParams::HETEROSCEDASTIC_PROPERTY{"heteroscedastic"};
const std::string CSegmentedRegressionParams::NOISE_IN_TRANSFORMED_SPACE_PROPERTY{"noiseintransformedspace"};
const std::string CSegmentedRegressionParams::TRANSFORM_ORDINATE_PROPERTY{"transformordinate"};

bool CSegmentedRegressionParams::init(const std::string& configFile) {
    LOG_DEBUG(<< "Reading config file " << configFile);

    boost::property_tree::ptree propTree;
    try {
        std::ifstream strm(configFile.c_str());
        if (!strm.is_open()) {
            LOG_ERROR(<< "Error opening config file " << configFile);
            return false;
        }
        boost::property_tree::ini_parser::read_ini(strm, propTree);
    } catch (boost::property_tree::ptree_error& e) {
        LOG_ERROR(<< "Error reading config file " << configFile << " : " << e.what());
        return false;
    }

    if (this->init(propTree) == false) {
        LOG_ERROR(<< "Error reading config file " << configFile);
        return false;
    }

    return true;
}

bool CSegmentedRegressionParams::init(const boost::property_tree::ptree& propTree) {
    // Work on a copy so a bad value leaves this object unchanged.
    CSegmentedRegressionParams candidate{*this};

    bool result = true;

    for (const auto& stanza : propTree) {
        const std::string& stanzaName = stanza.first;
        if (stanzaName == SEGMENTATION_STANZA || stanzaName == NOISE_STANZA ||
            stanzaName == TRANSFORM_STANZA) {
            if (candidate.processStanza(stanzaName, stanza.second) == false) {
                LOG_ERROR(<< "Error reading config stanza: " << stanzaName);
                result = false;
            }
        } else {
            LOG_WARN(<< "Ignoring unknown config stanza: " << stanzaName);
        }
    }

    if (result) {
        *this = candidate;
        LOG_DEBUG(<< "Segmented regression parameters: " << this->print());
    }

    return result;
}

bool CSegmentedRegressionParams::processStanza(const std::string& stanzaName,
                                               const boost::property_tree::ptree& propertyTree) {
    bool result = true;

    for (const auto& property : propertyTree) {
        std::string propName = property.first;
        std::string propValue = property.second.data();
        core::CStringUtils::trimWhitespace(propValue);

        if (stanzaName == SEGMENTATION_STANZA && propName == MINIMUM_SEGMENT_SIZE_PROPERTY) {
            std::size_t size;
            if (core::CStringUtils::stringToType(propValue, size) == false ||
                size < MINIMUM_SEGMENT_SIZE) {
                LOG_ERROR(<< "Invalid value for property " << propName << " : " << propValue);
                result = false;
                continue;
            }
            m_MinimumSegmentSize = size;
        } else if (stanzaName == SEGMENTATION_STANZA && propName == MAXIMUM_BREAKPOINTS_PROPERTY) {
            if (parseLimit(propValue, m_MaximumBreakpoints) == false) {
                LOG_ERROR(<< "Invalid value for property " << propName << " : " << propValue);
                result = false;
                continue;
            }
        } else if (stanzaName == SEGMENTATION_STANZA && propName == MAXIMUM_DEPTH_PROPERTY) {
            if (parseLimit(propValue, m_MaximumDepth) == false) {
                LOG_ERROR(<< "Invalid value for property " << propName << " : " << propValue);
                result = false;
                continue;
            }
        } else if (stanzaName == SEGMENTATION_STANZA &&
                   propName == MINIMUM_SCORE_IMPROVEMENT_PROPERTY) {
            double improvement;
            if (core::CStringUtils::stringToType(propValue, improvement) == false ||
                std::isfinite(improvement) == false || improvement < 0.0) {
                LOG_ERROR(<< "Invalid value for property " << propName << " : " << propValue);
                result = false;
                continue;
            }
            m_MinimumScoreImprovement = improvement;
        } else if (stanzaName == SEGMENTATION_STANZA && propName == INFORMATION_CRITERION_PROPERTY) {
            if (maths_t::fromString(propValue, m_InformationCriterion) == false) {
                LOG_ERROR(<< "Invalid value for property " << propName << " : " << propValue);
                result = false;
                continue;
            }
        } else if (stanzaName == SEGMENTATION_STANZA && propName == PRECISION_PROPERTY) {
            double precision;
            if (core::CStringUtils::stringToType(propValue, precision) == false ||
                std::isfinite(precision) == false || precision < 0.0 || precision >= 1.0) {
                LOG_ERROR(<< "Invalid value for property " << propName << " : " << propValue);
                result = false;
                continue;
            }
            m_Precision = precision;
        } else if (stanzaName == NOISE_STANZA && propName == HETEROSCEDASTIC_PROPERTY) {
            if (core::CStringUtils::stringToType(propValue, m_Heteroscedastic) == false) {
                LOG_ERROR(<< "Invalid value for property " << propName << " : " << propValue);
                result = false;
                continue;
            }
        } else if (stanzaName == NOISE_STANZA && propName == NOISE_IN_TRANSFORMED_SPACE_PROPERTY) {
            if (core::CStringUtils::stringToType(propValue, m_NoiseInTransformedSpace) == false) {
                LOG_ERROR(<< "Invalid value for property " << propName << " : " << propValue);
                result = false;
                continue;
            }
        } else if (stanzaName == TRANSFORM_STANZA && propName == TRANSFORM_ORDINATE_PROPERTY) {
            if (core::CStringUtils::stringToType(propValue, m_TransformOrdinate) == false) {
                LOG_ERROR(<< "Invalid value for property " << propName << " : " << propValue);
                result = false;
                continue;
            }
        } else {
            LOG_WARN(<< "Ignoring unknown property " << propName << " in stanza " << stanzaName);
        }
    }

    return result;
}

CSegmentedRegressionParams& CSegmentedRegressionParams::minimumSegmentSize(std::size_t size) {
    m_MinimumSegmentSize = size;
    return *this;
}

std::size_t CSegmentedRegressionParams::minimumSegmentSize() const {
    return std::max(m_MinimumSegmentSize, MINIMUM_SEGMENT_SIZE);
}

CSegmentedRegressionParams& CSegmentedRegressionParams::maximumBreakpoints(std::size_t breakpoints) {
    m_MaximumBreakpoints = breakpoints;
    return *this;
}

std::size_t CSegmentedRegressionParams::maximumBreakpoints() const {
    return m_MaximumBreakpoints;
}

CSegmentedRegressionParams& CSegmentedRegressionParams::maximumDepth(std::size_t depth) {
    m_MaximumDepth = depth;
    return *this;
}

std::size_t CSegmentedRegressionParams::maximumDepth() const {
    return m_MaximumDepth;
}

CSegmentedRegressionParams&
CSegmentedRegressionParams::minimumScoreImprovement(double improvement) {
    m_MinimumScoreImprovement = improvement;
    return *this;
}

double CSegmentedRegressionParams::minimumScoreImprovement() const {
    return m_MinimumScoreImprovement;
}

CSegmentedRegressionParams&
CSegmentedRegressionParams::informationCriterion(maths_t::EInfoCriterion criterion) {
    m_InformationCriterion = criterion;
    return *this;
}

maths_t::EInfoCriterion CSegmentedRegressionParams::informationCriterion() const {
    return m_InformationCriterion;
}

CSegmentedRegressionParams& CSegmentedRegressionParams::precision(double precision) {
    m_Precision = precision;
    return *this;
}

double CSegmentedRegressionParams::precision() const {
    return m_Precision;
}

CSegmentedRegressionParams& CSegmentedRegressionParams::heteroscedastic(bool heteroscedastic) {
    m_Heteroscedastic = heteroscedastic;
    return *this;
}

bool CSegmentedRegressionParams::heteroscedastic() const {
    return m_Heteroscedastic;
}

CSegmentedRegressionParams&
CSegmentedRegressionParams::noiseInTransformedSpace(bool inTransformedSpace) {
    m_NoiseInTransformedSpace = inTransformedSpace;
    return *this;
}

bool CSegmentedRegressionParams::noiseInTransformedSpace() const {
    return m_NoiseInTransformedSpace;
}

CSegmentedRegressionParams& CSegmentedRegressionParams::transformOrdinate(bool transform) {
    m_TransformOrdinate = transform;
    return *this;
}

bool CSegmentedRegressionParams::transformOrdinate() const {
    return m_TransformOrdinate;
}

std::string CSegmentedRegressionParams::print() const {
    std::ostringstream result;
    result << MINIMUM_SEGMENT_SIZE_PROPERTY << " = " << this->minimumSegmentSize() << ", "
           << MAXIMUM_BREAKPOINTS_PROPERTY << " = " << printLimit(m_MaximumBreakpoints) << ", "
           << MAXIMUM_DEPTH_PROPERTY << " = " << printLimit(m_MaximumDepth) << ", "
           << MINIMUM_SCORE_IMPROVEMENT_PROPERTY << " = " << m_MinimumScoreImprovement << ", "
           << INFORMATION_CRITERION_PROPERTY << " = " << m_InformationCriterion << ", "
           << PRECISION_PROPERTY << " = " << m_Precision << ", "
           << HETEROSCEDASTIC_PROPERTY << " = " << std::boolalpha << m_Heteroscedastic << ", "
           << NOISE_IN_TRANSFORMED_SPACE_PROPERTY << " = " << m_NoiseInTransformedSpace << ", "
           << TRANSFORM_ORDINATE_PROPERTY << " = " << m_TransformOrdinate;
    return result.str();
}
}
}
