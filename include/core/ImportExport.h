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
#ifndef INCLUDED_axgb_core_ImportExport_h
#define INCLUDED_axgb_core_ImportExport_h

// Import/export macro for the core library.  On Windows symbols must be
// explicitly exported from the DLL that defines them and imported into the
// code that uses them.  On other platforms the macro expands to nothing.

#if defined(Windows)
#if defined(BUILDING_libAxgbCore)
#define CORE_EXPORT __declspec(dllexport)
#else
#define CORE_EXPORT __declspec(dllimport)
#endif
#else
#define CORE_EXPORT
#endif

#endif // INCLUDED_axgb_core_ImportExport_h
