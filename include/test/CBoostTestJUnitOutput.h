/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License
 * 2.0 and the following additional limitation. Functionality enabled by the
 * files subject to the Elastic License 2.0 may only be used in production when
 * invoked by an Elasticsearch process with a license key installed that permits
 * use of machine learning features. You may not use this file except in
 * compliance with the Elastic License 2.0 and the foregoing additional
 * limitation.
 */
#ifndef INCLUDED_axgb_test_CBoostTestJUnitOutput_h
#define INCLUDED_axgb_test_CBoostTestJUnitOutput_h

#include <core/CNonInstantiatable.h>

#include <test/ImportExport.h>

#include <fstream>
#include <string>

namespace axgb {
namespace test {

//! \brief
//! Add JUnit output to default test output.
//!
//! DESCRIPTION:\n
//! A custom Boost.Test init function that unconditionally
//! adds JUnit output in addition to the default console output
//! (or whatever this has been overridden to via command line
//! arguments).
//!
//! IMPLEMENTATION DECISIONS:\n
//! The results go to the file named by the AXGB_JUNIT_OUTPUT
//! environment variable, or junit_results.xml in the working
//! directory if it isn't set, so a CI system knows which file
//! to pick up.
//!
class TEST_EXPORT CBoostTestJUnitOutput : private core::CNonInstantiatable {
public:
    static const std::string DEFAULT_FILE_NAME;

public:
    static bool init();

    //! Get the name of the file to which JUnit results are written.
    static std::string fileName();

private:
    static std::ofstream ms_JUnitOutputFile;
};
}
}

#endif // INCLUDED_axgb_test_CBoostTestJUnitOutput_h
