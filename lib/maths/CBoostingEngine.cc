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

#include <maths/CBoostingEngine.h>

#include <sstream>

namespace axgb {
namespace maths {

std::string SBoostedTreeParameters::print() const {
    std::ostringstream result;
    result << "eta = " << s_Eta << ", maximum depth = " << s_MaximumDepth
           << ", lambda = " << s_Lambda << ", gamma = " << s_Gamma
           << ", minimum child weight = " << s_MinimumChildWeight;
    return result.str();
}
}
}
