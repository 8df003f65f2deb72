/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <core/CLogger.h>

#include <core/CStringUtils.h>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/log/attributes/current_process_id.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/filter_parser.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>
#include <boost/log/utility/setup/from_stream.hpp>

#include <array>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace segreg {
namespace core {
namespace {
const std::array<std::string, 6> LEVEL_NAMES{"TRACE", "DEBUG", "INFO",
                                             "WARN",  "ERROR", "FATAL"};
const std::string UNKNOWN_LEVEL{"UNKNOWN"};

//! Write records as
//! <timestamp> <pid> <level> [<file>@<line>] <function> <message>.
void formatRecord(const boost::log::record_view& record,
                  boost::log::formatting_ostream& strm) {
    const CLogger& logger{CLogger::instance()};

    auto timestamp = boost::log::extract<boost::posix_time::ptime>("TimeStamp", record);
    if (timestamp) {
        strm << boost::posix_time::to_iso_extended_string(*timestamp) << ' ';
    }
    auto pid = boost::log::extract<boost::log::attributes::current_process_id::value_type>(
        "ProcessID", record);
    if (pid) {
        strm << '[' << *pid << "] ";
    }
    auto level = boost::log::extract<CLogger::ELevel>("Severity", record);
    if (level) {
        strm << *level << ' ';
    }
    auto file = boost::log::extract<std::string>(logger.fileAttributeName(), record);
    auto line = boost::log::extract<int>(logger.lineAttributeName(), record);
    if (file && line) {
        std::string::size_type slash{file->find_last_of("/\\")};
        strm << '[' << (slash == std::string::npos ? *file : file->substr(slash + 1))
             << '@' << *line << "] ";
    }
    strm << record[boost::log::expressions::smessage];
}
}

CLogger::CLogger()
    : m_Reconfigured{false}, m_Level{E_Debug}, m_FileAttributeName{"File"},
      m_LineAttributeName{"Line"}, m_FunctionAttributeName{"Function"},
      m_FatalErrorHandler{defaultFatalErrorHandler} {
    boost::log::add_common_attributes();
    boost::log::register_simple_formatter_factory<ELevel, char>("Severity");
    boost::log::register_simple_filter_factory<ELevel, char>("Severity");
    this->reset();
}

CLogger::~CLogger() {
    boost::log::core::get()->remove_all_sinks();
}

void CLogger::reset() {
    m_Reconfigured = false;

    auto core = boost::log::core::get();
    core->remove_all_sinks();
    core->reset_filter();

    auto sink = boost::log::add_console_log(std::cerr);
    sink->set_formatter(&formatRecord);
    sink->locked_backend()->auto_flush(true);

    this->setLoggingLevel(E_Debug);
}

CLogger& CLogger::instance() {
    static CLogger instance;
    return instance;
}

bool CLogger::hasBeenReconfigured() const {
    return m_Reconfigured;
}

CLogger::TLevelSeverityLogger& CLogger::logger() {
    return m_Logger;
}

void CLogger::fatal() {
    throw std::runtime_error("Fatal exception");
}

void CLogger::fatalErrorHandler(const TFatalErrorHandler& handler) {
    m_FatalErrorHandler = handler;
}

const CLogger::TFatalErrorHandler& CLogger::fatalErrorHandler() const {
    return m_FatalErrorHandler;
}

void CLogger::handleFatal(std::string message) {
    m_FatalErrorHandler(std::move(message));
}

boost::log::attribute_name CLogger::fileAttributeName() const {
    return m_FileAttributeName;
}

boost::log::attribute_name CLogger::lineAttributeName() const {
    return m_LineAttributeName;
}

boost::log::attribute_name CLogger::functionAttributeName() const {
    return m_FunctionAttributeName;
}

bool CLogger::setLoggingLevel(ELevel level) {
    if (level < E_Trace || level > E_Fatal) {
        LOG_ERROR(<< "Unexpected logging level " << static_cast<int>(level));
        return false;
    }
    m_Level = level;
    boost::log::core::get()->set_filter(
        boost::log::expressions::attr<ELevel>("Severity") >= level);
    return true;
}

CLogger::ELevel CLogger::loggingLevel() const {
    return m_Level;
}

const std::string& CLogger::levelToString(ELevel level) {
    if (level < E_Trace || level > E_Fatal) {
        return UNKNOWN_LEVEL;
    }
    return LEVEL_NAMES[static_cast<std::size_t>(level)];
}

bool CLogger::stringToLevel(const std::string& str, ELevel& level) {
    std::string name{CStringUtils::toUpper(str)};
    CStringUtils::trimWhitespace(name);
    for (std::size_t i = 0; i < LEVEL_NAMES.size(); ++i) {
        if (name == LEVEL_NAMES[i]) {
            level = static_cast<ELevel>(i);
            return true;
        }
    }
    return false;
}

bool CLogger::reconfigureFromFile(const std::string& propertiesFile) {
    std::ifstream strm{propertiesFile};
    if (strm.is_open() == false) {
        LOG_ERROR(<< "Unable to open logger properties file " << propertiesFile);
        return false;
    }

    try {
        boost::log::core::get()->remove_all_sinks();
        boost::log::core::get()->reset_filter();
        boost::log::init_from_stream(strm);
    } catch (const std::exception& e) {
        this->reset();
        LOG_ERROR(<< "Failed to reconfigure logger from " << propertiesFile
                  << ": " << e.what());
        return false;
    }

    m_Reconfigured = true;
    LOG_DEBUG(<< "Logger reconfigured from " << propertiesFile);

    return true;
}

void CLogger::defaultFatalErrorHandler(std::string message) {
    throw std::runtime_error(message);
}

CLogger::CScopeSetFatalErrorHandler::CScopeSetFatalErrorHandler(const TFatalErrorHandler& handler)
    : m_OriginalFatalErrorHandler{CLogger::instance().fatalErrorHandler()} {
    CLogger::instance().fatalErrorHandler(handler);
}

CLogger::CScopeSetFatalErrorHandler::~CScopeSetFatalErrorHandler() {
    CLogger::instance().fatalErrorHandler(m_OriginalFatalErrorHandler);
}

std::ostream& operator<<(std::ostream& strm, CLogger::ELevel level) {
    return strm << CLogger::levelToString(level);
}

std::istream& operator>>(std::istream& strm, CLogger::ELevel& level) {
    std::string name;
    strm >> name;
    if (CLogger::stringToLevel(name, level) == false) {
        strm.setstate(std::ios_base::failbit);
    }
    return strm;
}
}
}
