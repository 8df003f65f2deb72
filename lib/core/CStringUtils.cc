/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <core/CStringUtils.h>

#include <core/CLogger.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>

namespace segreg {
namespace core {

const std::string CStringUtils::WHITESPACE_CHARS{" \t\r\n\v\f"};

std::string CStringUtils::typeToStringPretty(double d) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.7g", d);
    return buf;
}

std::string CStringUtils::typeToStringPrecise(double d, int precision) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*g", precision, d);
    return buf;
}

std::string CStringUtils::toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return str;
}

std::string CStringUtils::toUpper(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return str;
}

void CStringUtils::trimWhitespace(std::string& str) {
    std::size_t start{str.find_first_not_of(WHITESPACE_CHARS)};
    if (start == std::string::npos) {
        str.clear();
        return;
    }
    std::size_t stop{str.find_last_not_of(WHITESPACE_CHARS)};
    str = str.substr(start, stop - start + 1);
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, double& ret) {
    if (str.empty()) {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert empty string to double");
        }
        return false;
    }

    char* endPtr{nullptr};
    errno = 0;
    double result{std::strtod(str.c_str(), &endPtr)};
    if (errno == ERANGE && std::fabs(result) == HUGE_VAL) {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert string '" << str << "' to double: out of range");
        }
        return false;
    }
    if (endPtr == nullptr || *endPtr != '\0') {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert string '" << str << "' to double");
        }
        return false;
    }

    ret = result;
    return true;
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, int& ret) {
    long long result{0};
    char* endPtr{nullptr};
    errno = 0;
    result = std::strtoll(str.c_str(), &endPtr, 10);
    if (str.empty() || endPtr == nullptr || *endPtr != '\0' || errno == ERANGE ||
        result < std::numeric_limits<int>::min() ||
        result > std::numeric_limits<int>::max()) {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert string '" << str << "' to int");
        }
        return false;
    }
    ret = static_cast<int>(result);
    return true;
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, unsigned long long& ret) {
    // strtoull silently negates strings starting with '-'.
    if (str.empty() || str.find('-') != std::string::npos) {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert string '" << str << "' to unsigned long long");
        }
        return false;
    }
    char* endPtr{nullptr};
    errno = 0;
    unsigned long long result{std::strtoull(str.c_str(), &endPtr, 10)};
    if (endPtr == nullptr || *endPtr != '\0' || errno == ERANGE) {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert string '" << str << "' to unsigned long long");
        }
        return false;
    }
    ret = result;
    return true;
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, unsigned long& ret) {
    unsigned long long result{0};
    if (_stringToType(silent, str, result) == false) {
        return false;
    }
    if (result > std::numeric_limits<unsigned long>::max()) {
        if (!silent) {
            LOG_ERROR(<< "Unable to convert string '" << str
                      << "' to unsigned long: out of range");
        }
        return false;
    }
    ret = static_cast<unsigned long>(result);
    return true;
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, bool& ret) {
    std::string lower{toLower(str)};
    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        ret = true;
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        ret = false;
        return true;
    }
    if (!silent) {
        LOG_ERROR(<< "Unable to convert string '" << str << "' to bool");
    }
    return false;
}

bool CStringUtils::_stringToType(bool /*silent*/, const std::string& str, std::string& ret) {
    ret = str;
    return true;
}
}
}
