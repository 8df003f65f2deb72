/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_segreg_core_CLogger_h
#define INCLUDED_segreg_core_CLogger_h

#include <core/CNonCopyable.h>
#include <core/ImportExport.h>
#include <core/LogMacros.h>

#include <boost/log/attributes/attribute_name.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <functional>
#include <iosfwd>
#include <string>

namespace segreg {
namespace core {

//! \brief
//! Core logging class.
//!
//! DESCRIPTION:\n
//! Access to the actual logging commands should be through the macros in
//! LogMacros.h.
//!
//! Problems which mean something has gone wrong, but the computation can
//! carry on, possibly with a slightly inferior result, should be logged with
//! LOG_ERROR. Problems which mean a computation can't complete should be
//! logged with LOG_FATAL, which doesn't itself change control flow.
//!
//! LOG_ABORT is for conditions which would NEVER occur if the code were
//! free of bugs. It logs and then throws.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Wrapper around Boost.Log.
//!
//! Singleton for simplicity.
//!
//! By default logging is to stderr at DEBUG. The logger can be reconfigured
//! from a Boost.Log settings file.
//!
//! TRACE is very verbose in the segmentation search and is intended for
//! unit tests and debugging only.
class CORE_EXPORT CLogger : private CNonCopyable {
public:
    using TFatalErrorHandler = std::function<void(std::string)>;

    //! Used to set the level we should log at
    enum ELevel { E_Trace, E_Debug, E_Info, E_Warn, E_Error, E_Fatal };

    using TLevelSeverityLogger = boost::log::sources::severity_logger_mt<ELevel>;

    //! \brief Sets the fatal error handler for the object lifetime.
    class CORE_EXPORT CScopeSetFatalErrorHandler : private CNonCopyable {
    public:
        explicit CScopeSetFatalErrorHandler(const TFatalErrorHandler& handler);
        ~CScopeSetFatalErrorHandler();

    private:
        TFatalErrorHandler m_OriginalFatalErrorHandler;
    };

public:
    //! Access to singleton - use MACROS to get to this when logging
    //! messages
    static CLogger& instance();

    //! Tell the logger to reconfigure itself by reading a specified
    //! Boost.Log settings file, if the file exists.
    bool reconfigureFromFile(const std::string& propertiesFile);

    //! Set the logging level on the fly.
    bool setLoggingLevel(ELevel level);

    //! Get the current logging level.
    ELevel loggingLevel() const;

    //! Map the level enum to a string.
    static const std::string& levelToString(ELevel level);

    //! Map a string, such as "DEBUG" or "debug", to a level.
    static bool stringToLevel(const std::string& str, ELevel& level);

    //! Has the logger been reconfigured?
    bool hasBeenReconfigured() const;

    //! Access to underlying logger (must only be called from macros)
    TLevelSeverityLogger& logger();

    //! Throw a fatal exception
    [[noreturn]] static void fatal();

    //! Register a new global fatal error handler.
    //!
    //! \note This is not thread safe as the intention is that it is invoked
    //! once, usually at the beginning of main or in single threaded test code.
    void fatalErrorHandler(const TFatalErrorHandler& handler);

    //! Get the current fatal error handler.
    const TFatalErrorHandler& fatalErrorHandler() const;

    //! Handle a fatal problem using the registered fatal error handler.
    void handleFatal(std::string message);

    //! Attribute names for efficient access to our custom attributes
    boost::log::attribute_name fileAttributeName() const;
    boost::log::attribute_name lineAttributeName() const;
    boost::log::attribute_name functionAttributeName() const;

    //! Reset the logger to log to stderr at DEBUG. This is primarily for
    //! unit tests since CLogger is a singleton.
    void reset();

private:
    CLogger();
    ~CLogger();

    //! The default fatal error handler throws std::runtime_error.
    [[noreturn]] static void defaultFatalErrorHandler(std::string message);

private:
    TLevelSeverityLogger m_Logger;

    //! Has the logger ever been reconfigured? This is not protected by a
    //! lock despite the fact that it may be read from different threads.
    volatile bool m_Reconfigured;

    //! The level of the default sink filter.
    ELevel m_Level;

    //! Custom Boost.Log attribute names
    boost::log::attribute_name m_FileAttributeName;
    boost::log::attribute_name m_LineAttributeName;
    boost::log::attribute_name m_FunctionAttributeName;

    TFatalErrorHandler m_FatalErrorHandler;
};

CORE_EXPORT std::ostream& operator<<(std::ostream& strm, CLogger::ELevel level);
CORE_EXPORT std::istream& operator>>(std::istream& strm, CLogger::ELevel& level);
}
}

#endif // INCLUDED_segreg_core_CLogger_h
