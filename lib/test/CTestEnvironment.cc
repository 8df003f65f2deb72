/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <test/CTestEnvironment.h>

#include <core/CLogger.h>

#include <boost/test/unit_test_log.hpp>

#include <cstdlib>

namespace segreg {
namespace test {

std::ofstream CTestEnvironment::ms_JUnitOutputFile("junit_results.xml");

bool CTestEnvironment::init() {
    boost::unit_test::unit_test_log.add_format(boost::unit_test::OF_JUNIT);
    boost::unit_test::unit_test_log.set_stream(boost::unit_test::OF_JUNIT, ms_JUnitOutputFile);

    const char* level{std::getenv("SEGREG_LOG_LEVEL")};
    if (level != nullptr) {
        core::CLogger::ELevel parsed;
        if (core::CLogger::stringToLevel(level, parsed)) {
            core::CLogger::instance().setLoggingLevel(parsed);
        } else {
            LOG_WARN(<< "Ignoring unknown SEGREG_LOG_LEVEL '" << level << "'");
        }
    }
    return true;
}
}
}
