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

#include <core/CContainerPrinter.h>
#include <core/CLogger.h>

#include <model/CAdaptiveWindow.h>

#include <boost/test/unit_test.hpp>

#include <algorithm>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <vector>

BOOST_AUTO_TEST_SUITE(CAdaptiveWindowTest)

using namespace axgb;

namespace {
using TDoubleVec = std::vector<double>;
using TSizeVec = std::vector<std::size_t>;
using TOptionalSize = model::CAdaptiveWindow::TOptionalSize;

//! Add examples to \p window until it is ready and return how many it took.
std::size_t fill(model::CAdaptiveWindow& window, double& next) {
    std::size_t result{0};
    while (window.isReady() == false) {
        window.add({next, -next}, 1.0);
        next += 1.0;
        ++result;
    }
    return result;
}
}

BOOST_AUTO_TEST_CASE(testGrowth) {
    model::CAdaptiveWindow window{100, TOptionalSize{2}};
    BOOST_REQUIRE_EQUAL(2, window.windowSize());

    TSizeVec sizes;
    double next{0.0};
    for (std::size_t i = 0; i < 8; ++i) {
        std::size_t n{fill(window, next)};
        BOOST_REQUIRE_EQUAL(window.windowSize(), n);
        auto batch = window.drainBatch();
        BOOST_REQUIRE_EQUAL(n, batch.s_Features.rows());
        BOOST_REQUIRE_EQUAL(0, window.bufferSize());
        sizes.push_back(n);
        window.grow();
    }
    LOG_DEBUG(<< "sizes = " << core::CContainerPrinter::print(sizes));

    BOOST_REQUIRE_EQUAL("[2, 4, 8, 16, 32, 64, 100, 100]",
                        core::CContainerPrinter::print(sizes));
    BOOST_REQUIRE_EQUAL(512, window.dynamicWindowSize());
}

BOOST_AUTO_TEST_CASE(testDynamicSizeIsUnclamped) {
    model::CAdaptiveWindow window{4, TOptionalSize{3}};
    window.grow();
    window.grow();
    BOOST_REQUIRE_EQUAL(4, window.windowSize());
    BOOST_REQUIRE_EQUAL(12, window.dynamicWindowSize());

    // Doubling saturates instead of overflowing.
    for (std::size_t i = 0; i < 70; ++i) {
        window.grow();
    }
    BOOST_REQUIRE_EQUAL(std::numeric_limits<std::size_t>::max(), window.dynamicWindowSize());
    BOOST_REQUIRE_EQUAL(4, window.windowSize());

    window.reset();
    BOOST_REQUIRE_EQUAL(3, window.dynamicWindowSize());
    BOOST_REQUIRE_EQUAL(3, window.windowSize());
}

BOOST_AUTO_TEST_CASE(testNonPowerOfTwoMinimum) {
    model::CAdaptiveWindow window{50, TOptionalSize{3}};

    TSizeVec sizes{window.windowSize()};
    for (std::size_t i = 0; i < 5; ++i) {
        window.grow();
        sizes.push_back(window.windowSize());
    }

    BOOST_REQUIRE_EQUAL("[3, 6, 12, 24, 48, 50]", core::CContainerPrinter::print(sizes));
}

BOOST_AUTO_TEST_CASE(testNoMinimum) {
    model::CAdaptiveWindow window{10, TOptionalSize{}};
    BOOST_REQUIRE_EQUAL(10, window.windowSize());
    BOOST_TEST_REQUIRE(!window.minimumWindowSize());

    window.grow();
    BOOST_REQUIRE_EQUAL(10, window.windowSize());
    window.reset();
    BOOST_REQUIRE_EQUAL(10, window.windowSize());
}

BOOST_AUTO_TEST_CASE(testClamping) {
    {
        model::CAdaptiveWindow window{0, TOptionalSize{}};
        BOOST_REQUIRE_EQUAL(1, window.maximumWindowSize());
        BOOST_REQUIRE_EQUAL(1, window.windowSize());
    }
    {
        model::CAdaptiveWindow window{8, TOptionalSize{0}};
        BOOST_REQUIRE_EQUAL(1, *window.minimumWindowSize());
        BOOST_REQUIRE_EQUAL(1, window.windowSize());
    }
    {
        model::CAdaptiveWindow window{8, TOptionalSize{20}};
        BOOST_REQUIRE_EQUAL(8, *window.minimumWindowSize());
        BOOST_REQUIRE_EQUAL(8, window.windowSize());
    }
}

BOOST_AUTO_TEST_CASE(testDrainIsFirstInFirstOut) {
    model::CAdaptiveWindow window{3, TOptionalSize{}};

    for (std::size_t i = 0; i < 5; ++i) {
        double x{static_cast<double>(i)};
        window.add({x, 10.0 * x}, static_cast<double>(i % 2));
    }
    BOOST_REQUIRE_EQUAL(5, window.bufferSize());

    auto batch = window.drainBatch();
    BOOST_REQUIRE_EQUAL(3, batch.s_Features.rows());
    BOOST_REQUIRE_EQUAL(2, batch.s_Features.cols());
    for (Eigen::Index i = 0; i < 3; ++i) {
        BOOST_REQUIRE_EQUAL(static_cast<double>(i), batch.s_Features(i, 0));
        BOOST_REQUIRE_EQUAL(10.0 * static_cast<double>(i), batch.s_Features(i, 1));
        BOOST_REQUIRE_EQUAL(static_cast<double>(i % 2), batch.s_Labels(i));
    }

    // The remaining examples are kept in order.
    BOOST_REQUIRE_EQUAL(2, window.bufferSize());
    BOOST_TEST_REQUIRE(window.isReady() == false);
    window.add({5.0, 50.0}, 1.0);
    batch = window.drainBatch();
    BOOST_REQUIRE_EQUAL(3.0, batch.s_Features(0, 0));
    BOOST_REQUIRE_EQUAL(4.0, batch.s_Features(1, 0));
    BOOST_REQUIRE_EQUAL(5.0, batch.s_Features(2, 0));
}

BOOST_AUTO_TEST_CASE(testDrainWhenNotReady) {
    model::CAdaptiveWindow window{4, TOptionalSize{}};
    window.add({1.0}, 0.0);

    BOOST_REQUIRE_THROW(window.drainBatch(), std::runtime_error);
    BOOST_REQUIRE_EQUAL(1, window.bufferSize());
}

BOOST_AUTO_TEST_CASE(testResetAndClear) {
    model::CAdaptiveWindow window{64, TOptionalSize{4}};
    window.grow();
    window.grow();
    BOOST_REQUIRE_EQUAL(16, window.windowSize());

    for (std::size_t i = 0; i < 7; ++i) {
        window.add({static_cast<double>(i)}, 0.0);
    }

    // Resetting the size keeps buffered examples.
    window.reset();
    BOOST_REQUIRE_EQUAL(4, window.windowSize());
    BOOST_REQUIRE_EQUAL(4, window.dynamicWindowSize());
    BOOST_REQUIRE_EQUAL(7, window.bufferSize());
    BOOST_TEST_REQUIRE(window.isReady());

    window.clear();
    BOOST_REQUIRE_EQUAL(0, window.bufferSize());
    BOOST_REQUIRE_EQUAL(4, window.windowSize());
    LOG_DEBUG(<< window.print());
}

BOOST_AUTO_TEST_CASE(testDoublingSequence) {
    // The window size is always the minimum times a power of two until it
    // reaches the maximum.
    for (std::size_t minimum : {1, 3, 5, 7}) {
        std::size_t maximum{1000};
        model::CAdaptiveWindow window{maximum, TOptionalSize{minimum}};
        std::size_t expected{minimum};
        for (std::size_t k = 0; k < 12; ++k) {
            BOOST_REQUIRE_EQUAL(std::min(expected, maximum), window.windowSize());
            window.grow();
            if (expected < maximum) {
                expected *= 2;
            }
        }
        BOOST_REQUIRE_EQUAL(maximum, window.windowSize());
    }
}

BOOST_AUTO_TEST_SUITE_END()
