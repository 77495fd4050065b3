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

#include <core/CLogger.h>

#include <maths/CAdwin.h>

#include <test/CRandomNumbers.h>

#include <boost/test/unit_test.hpp>

#include <cmath>
#include <cstddef>
#include <vector>

BOOST_AUTO_TEST_SUITE(CAdwinTest)

using namespace axgb;

namespace {
using TDoubleVec = std::vector<double>;
using TSizeVec = std::vector<std::size_t>;

TSizeVec addAll(maths::CAdwin& adwin, const TDoubleVec& bits, std::size_t offset = 0) {
    TSizeVec detections;
    for (std::size_t i = 0; i < bits.size(); ++i) {
        adwin.add(bits[i]);
        if (adwin.changeDetected()) {
            detections.push_back(offset + i);
        }
    }
    return detections;
}
}

BOOST_AUTO_TEST_CASE(testWindowStatistics) {

    // Alternating bits are stationary so nothing is dropped and the window
    // statistics are exact.

    maths::CAdwin adwin;
    TDoubleVec bits;
    for (std::size_t i = 0; i < 64; ++i) {
        bits.push_back(static_cast<double>(i % 2));
    }

    BOOST_TEST_REQUIRE(addAll(adwin, bits).empty());
    BOOST_REQUIRE_EQUAL(64, adwin.width());
    BOOST_REQUIRE_CLOSE_FRACTION(32.0, adwin.total(), 1e-12);
    BOOST_REQUIRE_CLOSE_FRACTION(0.5, adwin.estimation(), 1e-12);
    // The sum of square deviations from the mean, i.e. n p (1 - p).
    BOOST_REQUIRE_CLOSE_FRACTION(16.0, adwin.variance(), 1e-10);
}

BOOST_AUTO_TEST_CASE(testHistogramIsCompressed) {
    maths::CAdwin adwin;

    std::size_t previousRows{0};
    for (std::size_t i = 1; i <= 10000; ++i) {
        adwin.add(0.0);
        BOOST_REQUIRE_EQUAL(i, adwin.width());
        BOOST_TEST_REQUIRE(adwin.numberBuckets() <= adwin.maximumBuckets() * adwin.numberRows());
        BOOST_TEST_REQUIRE(adwin.numberRows() >= previousRows);
        previousRows = adwin.numberRows();
    }
    LOG_DEBUG(<< "rows = " << adwin.numberRows() << ", buckets = " << adwin.numberBuckets());

    // Row i buckets summarise 2^i observations so the number of rows is
    // logarithmic in the width.
    BOOST_TEST_REQUIRE(adwin.numberRows() <= 12);
    BOOST_TEST_REQUIRE(adwin.numberBuckets() <= 5 * 12);
    BOOST_REQUIRE_EQUAL(0.0, adwin.total());
    BOOST_REQUIRE_EQUAL(0.0, adwin.variance());
    BOOST_TEST_REQUIRE(adwin.memoryUsage() < 10000 * sizeof(double));
}

BOOST_AUTO_TEST_CASE(testStationary) {
    test::CRandomNumbers rng;

    TDoubleVec bits;
    rng.generateBernoulliSamples(0.2, 5000, bits);

    maths::CAdwin adwin;
    TSizeVec detections{addAll(adwin, bits)};
    LOG_DEBUG(<< "detections = " << detections.size());

    BOOST_TEST_REQUIRE(detections.size() <= 1);
    BOOST_REQUIRE_CLOSE_FRACTION(0.2, adwin.estimation(), 0.15);
    BOOST_TEST_REQUIRE(adwin.width() > 1000);
}

BOOST_AUTO_TEST_CASE(testAbruptChange) {
    test::CRandomNumbers rng;

    TDoubleVec before;
    TDoubleVec after;
    rng.generateBernoulliSamples(0.1, 1000, before);
    rng.generateBernoulliSamples(0.9, 1000, after);

    maths::CAdwin adwin;
    TSizeVec detections{addAll(adwin, before)};
    BOOST_TEST_REQUIRE(detections.empty());

    detections = addAll(adwin, after, before.size());
    BOOST_TEST_REQUIRE(detections.empty() == false);
    LOG_DEBUG(<< "first detection at " << detections[0]);

    // Cuts are only checked every clock() observations.
    BOOST_TEST_REQUIRE(detections[0] >= 1000);
    BOOST_TEST_REQUIRE(detections[0] < 1000 + 5 * adwin.clock());

    // The window should have dropped the data from before the change.
    BOOST_TEST_REQUIRE(adwin.width() < 1500);
    BOOST_TEST_REQUIRE(adwin.estimation() > 0.75);
}

BOOST_AUTO_TEST_CASE(testChangeDetectedOnlyReportsLastAdd) {
    maths::CAdwin adwin;

    TDoubleVec bits(320, 0.0);
    bits.resize(640, 1.0);

    bool detected{false};
    for (auto bit : bits) {
        adwin.add(bit);
        if (adwin.changeDetected()) {
            detected = true;
            // The next observation doesn't fall on a clock tick.
            adwin.add(1.0);
            BOOST_TEST_REQUIRE(adwin.changeDetected() == false);
            break;
        }
    }
    BOOST_TEST_REQUIRE(detected);
}

BOOST_AUTO_TEST_CASE(testParameterClamping) {
    maths::CAdwin adwin{2.0, 0, 1, 10, 0};
    BOOST_REQUIRE_EQUAL(1, adwin.clock());
    BOOST_REQUIRE_EQUAL(2, adwin.maximumBuckets());
    for (std::size_t i = 0; i < 100; ++i) {
        adwin.add(0.0);
    }
    BOOST_REQUIRE_EQUAL(100, adwin.width());
}

BOOST_AUTO_TEST_SUITE_END()
