/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_segreg_core_CContainerPrinter_h
#define INCLUDED_segreg_core_CContainerPrinter_h

#include <core/CStringUtils.h>
#include <core/ImportExport.h>

#include <iterator>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

namespace segreg {
namespace core {

//! \brief Prints containers for logging.
//!
//! DESCRIPTION:\n
//! Converts a container, iterator range or pair to a string of the form
//! [a, b, c] or (a, b). Nested containers and pairs are printed recursively
//! and doubles are printed with CStringUtils::typeToStringPretty.
//!
//! IMPLEMENTATION DECISIONS:\n
//! This is intended for debug and trace logging so prefers brevity of
//! output over round tripping.
class CORE_EXPORT CContainerPrinter {
public:
    //! Print the range [\p begin, \p end).
    template<typename ITR>
    static std::string print(ITR begin, ITR end) {
        std::ostringstream result;
        result << '[';
        if (begin != end) {
            result << printElement(*begin);
            for (++begin; begin != end; ++begin) {
                result << ", " << printElement(*begin);
            }
        }
        result << ']';
        return result.str();
    }

    //! Print a container or a single value.
    template<typename T>
    static std::string print(const T& value) {
        return printElement(value);
    }

private:
    template<typename U, typename V>
    static std::string printElement(const std::pair<U, V>& value) {
        return "(" + printElement(value.first) + ", " + printElement(value.second) + ")";
    }

    static std::string printElement(double value) {
        return CStringUtils::typeToStringPretty(value);
    }

    static std::string printElement(const std::string& value) { return value; }

    template<typename T>
    static auto printElement(const T& value)
        -> decltype(std::begin(value), std::end(value), std::string()) {
        return print(std::begin(value), std::end(value));
    }

    template<typename T, typename = void>
    struct SIsRange : std::false_type {};
    template<typename T>
    struct SIsRange<T, decltype(std::begin(std::declval<const T&>()), void())>
        : std::true_type {};

    template<typename T>
    static auto printElement(const T& value)
        -> std::enable_if_t<SIsRange<T>::value == false, std::string> {
        std::ostringstream result;
        result << value;
        return result.str();
    }
};
}
}

#endif // INCLUDED_segreg_core_CContainerPrinter_h
