/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <maths/MathsTypes.h>

#include <core/CStringUtils.h>

#include <ostream>

namespace segreg {
namespace maths_t {

std::string print(ERegressionMode mode) {
    switch (mode) {
    case E_Linear:
        return "linear";
    case E_Log:
        return "log";
    }
    return "unknown";
}

std::string print(EInfoCriterion criterion) {
    switch (criterion) {
    case E_BIC:
        return "bic";
    case E_AIC:
        return "aic";
    case E_RSS:
        return "rss";
    }
    return "unknown";
}

bool fromString(const std::string& str, ERegressionMode& mode) {
    std::string name{core::CStringUtils::toLower(str)};
    core::CStringUtils::trimWhitespace(name);
    if (name == "linear") {
        mode = E_Linear;
        return true;
    }
    if (name == "log") {
        mode = E_Log;
        return true;
    }
    return false;
}

bool fromString(const std::string& str, EInfoCriterion& criterion) {
    std::string name{core::CStringUtils::toLower(str)};
    core::CStringUtils::trimWhitespace(name);
    if (name == "bic") {
        criterion = E_BIC;
        return true;
    }
    if (name == "aic") {
        criterion = E_AIC;
        return true;
    }
    if (name == "rss") {
        criterion = E_RSS;
        return true;
    }
    return false;
}

std::ostream& operator<<(std::ostream& strm, ERegressionMode mode) {
    return strm << print(mode);
}

std::ostream& operator<<(std::ostream& strm, EInfoCriterion criterion) {
    return strm << print(criterion);
}
}
}
