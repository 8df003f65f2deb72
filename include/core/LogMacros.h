/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */

// No include guards so that a translation unit can redefine the logging
// macros, for example to exclude trace logging.

#include <boost/current_function.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/utility/manipulators/add_value.hpp>

#include <sstream>

// Location info
#ifdef LOG_LOCATION_INFO
#undef LOG_LOCATION_INFO
#endif
#define LOG_LOCATION_INFO                                                                     \
    << boost::log::add_value(segreg::core::CLogger::instance().lineAttributeName(), __LINE__) \
    << boost::log::add_value(segreg::core::CLogger::instance().fileAttributeName(), __FILE__) \
    << boost::log::add_value(segreg::core::CLogger::instance().functionAttributeName(),       \
                             BOOST_CURRENT_FUNCTION)

#ifdef LOG_WITH_SEVERITY
#undef LOG_WITH_SEVERITY
#endif
#define LOG_WITH_SEVERITY(level, message)                                      \
    BOOST_LOG_STREAM_SEV(segreg::core::CLogger::instance().logger(), level)    \
    LOG_LOCATION_INFO                                                          \
    message

#ifdef LOG_TRACE
#undef LOG_TRACE
#endif
#ifdef EXCLUDE_TRACE_LOGGING
// Trace logging expands to code the compiler can eliminate entirely, so the
// level check is avoided in the inner loops of the segmentation search.
#define LOG_TRACE(message)                                                     \
    static_cast<void>([&]() { std::ostringstream() << "" message; })
#else
#define LOG_TRACE(message) LOG_WITH_SEVERITY(segreg::core::CLogger::E_Trace, message)
#endif

#ifdef LOG_DEBUG
#undef LOG_DEBUG
#endif
#define LOG_DEBUG(message) LOG_WITH_SEVERITY(segreg::core::CLogger::E_Debug, message)

#ifdef LOG_INFO
#undef LOG_INFO
#endif
#define LOG_INFO(message) LOG_WITH_SEVERITY(segreg::core::CLogger::E_Info, message)

#ifdef LOG_WARN
#undef LOG_WARN
#endif
#define LOG_WARN(message) LOG_WITH_SEVERITY(segreg::core::CLogger::E_Warn, message)

#ifdef LOG_ERROR
#undef LOG_ERROR
#endif
#define LOG_ERROR(message) LOG_WITH_SEVERITY(segreg::core::CLogger::E_Error, message)

#ifdef LOG_FATAL
#undef LOG_FATAL
#endif
#define LOG_FATAL(message) LOG_WITH_SEVERITY(segreg::core::CLogger::E_Fatal, message)

#ifdef HANDLE_FATAL
#undef HANDLE_FATAL
#endif
#define HANDLE_FATAL(message)                                                  \
    {                                                                          \
        std::ostringstream ss;                                                 \
        ss message;                                                            \
        segreg::core::CLogger::instance().handleFatal(ss.str());               \
    }

#ifdef LOG_ABORT
#undef LOG_ABORT
#endif
#define LOG_ABORT(message)                                                     \
    LOG_WITH_SEVERITY(segreg::core::CLogger::E_Fatal, message);                \
    segreg::core::CLogger::fatal()

// Log at a level chosen at runtime, for example
// LOG_AT_LEVEL(segreg::core::CLogger::E_Warn, << "Fallback to " << type)
#ifdef LOG_AT_LEVEL
#undef LOG_AT_LEVEL
#endif
#define LOG_AT_LEVEL(level, message) LOG_WITH_SEVERITY(level, message)
