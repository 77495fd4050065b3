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

namespace axgb {
namespace core {

std::string CContainerPrinter::bracket(const TStrVec& elements) {
    std::string result{"["};
    for (std::size_t i = 0; i < elements.size(); ++i) {
        if (i > 0) {
            result += ", ";
        }
        result += elements[i];
    }
    result += "]";
    return result;
}

const std::string& CContainerPrinter::null() {
    static const std::string NULL_STR{"\"null\""};
    return NULL_STR;
}
}
}
