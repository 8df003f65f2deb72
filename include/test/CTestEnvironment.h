/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_segreg_test_CTestEnvironment_h
#define INCLUDED_segreg_test_CTestEnvironment_h

#include <test/ImportExport.h>

#include <fstream>

namespace segreg {
namespace test {

//! \brief
//! Custom Boost.Test initialisation for the unit test executables.
//!
//! DESCRIPTION:\n
//! Adds JUnit output (to junit_results.xml) in addition to the default
//! console output, or whatever this has been overridden to on the command
//! line, and sets the logging level from the SEGREG_LOG_LEVEL environment
//! variable if it is set.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Always writes the same output file so it is clear which file a CI system
//! needs to pick up.
class TEST_EXPORT CTestEnvironment {
public:
    CTestEnvironment() = delete;
    CTestEnvironment(const CTestEnvironment&) = delete;
    CTestEnvironment& operator=(const CTestEnvironment&) = delete;

    //! Suitable for passing to boost::unit_test::unit_test_main.
    static bool init();

private:
    static std::ofstream ms_JUnitOutputFile;
};
}
}

#endif // INCLUDED_segreg_test_CTestEnvironment_h
