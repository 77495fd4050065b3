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
#ifndef INCLUDED_axgb_core_CNonCopyable_h
#define INCLUDED_axgb_core_CNonCopyable_h

#include <core/ImportExport.h>

namespace axgb {
namespace core {

//! \brief
//! Equivalent to boost::noncopyable.
//!
//! DESCRIPTION:\n
//! Classes which own state that must not be duplicated, for example
//! the logger singleton or the classifier's drift monitor, inherit
//! privately from this class.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Exported from the DLL to avoid Visual C++ warning C4275 when an
//! exported class derives from it.
//!
class CORE_EXPORT CNonCopyable {
protected:
    CNonCopyable() = default;
    ~CNonCopyable() = default;

public:
    CNonCopyable(const CNonCopyable&) = delete;
    CNonCopyable& operator=(const CNonCopyable&) = delete;
};
}
}

#endif // INCLUDED_axgb_core_CNonCopyable_h
