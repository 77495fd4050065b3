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
#ifndef INCLUDED_axgb_test_CTestObserver_h
#define INCLUDED_axgb_test_CTestObserver_h

#include <test/ImportExport.h>

#include <boost/test/tree/observer.hpp>

#include <cstddef>

namespace axgb {
namespace test {

//! \brief
//! A class to observe Boost.Test tests.
//!
//! DESCRIPTION:\n
//! Logs a banner with the test name at the beginning of each test
//! case and the elapsed time and number of failed assertions at the
//! end, so the library log output can be attributed to tests.
//!
class TEST_EXPORT CTestObserver : public boost::unit_test::test_observer {
public:
    //! Called at the start of each suite and at the start of each test case.
    void test_unit_start(const boost::unit_test::test_unit& test) override;

    //! Called at the end of each suite and at the end of each test case.
    void test_unit_finish(const boost::unit_test::test_unit& test, unsigned long elapsed) override;

    //! Called for each assertion.
    void assertion_result(boost::unit_test::assertion_result result) override;

private:
    std::size_t m_FailedAssertions = 0;
};
}
}

#endif // INCLUDED_axgb_test_CTestObserver_h
