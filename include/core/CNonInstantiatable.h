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
#ifndef INCLUDED_axgb_core_CNonInstantiatable_h
#define INCLUDED_axgb_core_CNonInstantiatable_h

#include <core/ImportExport.h>

namespace axgb {
namespace core {

//! \brief
//! Similar idea to boost::noncopyable, but for instantiation.
//!
//! DESCRIPTION:\n
//! Classes which only have static methods, such as CStringUtils and
//! CTools, inherit privately from this class.
//!
class CORE_EXPORT CNonInstantiatable {
public:
    CNonInstantiatable() = delete;
    CNonInstantiatable(const CNonInstantiatable&) = delete;
};
}
}

#endif // INCLUDED_axgb_core_CNonInstantiatable_h
