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

#ifndef INCLUDED_axgb_maths_CTools_h
#define INCLUDED_axgb_maths_CTools_h

#include <core/CNonInstantiatable.h>

#include <maths/ImportExport.h>

#include <cmath>

namespace axgb {
namespace maths {

//! \brief A collection of utility functions.
class MATHS_EXPORT CTools : private core::CNonInstantiatable {
public:
    //! Compute \p x * \p x.
    static double pow2(double x) { return x * x; }

    //! The logistic function \f$1 / (1 + e^{-x})\f$ which maps a margin
    //! to a probability.
    static double logisticFunction(double x) { return 1.0 / (1.0 + std::exp(-x)); }

    //! Check if \p x is a missing value.
    static bool isMissing(double x) { return std::isnan(x); }
};
}
}

#endif // INCLUDED_axgb_maths_CTools_h
