/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_segreg_core_CStringUtils_h
#define INCLUDED_segreg_core_CStringUtils_h

#include <core/ImportExport.h>

#include <boost/lexical_cast.hpp>

#include <string>

namespace segreg {
namespace core {

//! \brief
//! A holder of string utility methods.
//!
//! DESCRIPTION:\n
//! Conversions between strings and the built-in types, used when reading
//! configuration and when printing results.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Conversion from strings is strict: the whole string must be consumed and
//! the value must be in range for the target type. Failures are logged
//! unless the silent variant is used.
class CORE_EXPORT CStringUtils {
public:
    //! The definition of whitespace matches ::isspace() in the "C" locale.
    static const std::string WHITESPACE_CHARS;

public:
    //! Convert a type to a string
    template<typename T>
    static std::string typeToString(const T& type) {
        return boost::lexical_cast<std::string>(type);
    }

    //! Convert a double to a pretty string (single precision using %g formatting).
    static std::string typeToStringPretty(double d);

    //! Convert a double to a string with the specified precision.
    static std::string typeToStringPrecise(double d, int precision);

    //! Convert a string to a type
    template<typename T>
    static bool stringToType(const std::string& str, T& ret) {
        return CStringUtils::_stringToType(false, str, ret);
    }

    //! Convert a string to a type, and don't log an error message if the
    //! conversion fails
    template<typename T>
    static bool stringToTypeSilent(const std::string& str, T& ret) {
        return CStringUtils::_stringToType(true, str, ret);
    }

    //! Convert a string to lower case
    static std::string toLower(std::string str);

    //! Convert a string to upper case
    static std::string toUpper(std::string str);

    //! Trim whitespace characters from the beginning and end of a string
    static void trimWhitespace(std::string& str);

private:
    static bool _stringToType(bool silent, const std::string& str, double& ret);
    static bool _stringToType(bool silent, const std::string& str, int& ret);
    static bool _stringToType(bool silent, const std::string& str, unsigned long& ret);
    static bool _stringToType(bool silent, const std::string& str, unsigned long long& ret);
    //! Accepts true/false, yes/no, on/off and 1/0 in any case.
    static bool _stringToType(bool silent, const std::string& str, bool& ret);
    static bool _stringToType(bool silent, const std::string& str, std::string& ret);
};
}
}

#endif // INCLUDED_segreg_core_CStringUtils_h
