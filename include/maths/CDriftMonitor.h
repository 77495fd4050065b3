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

#ifndef INCLUDED_axgb_maths_CDriftMonitor_h
#define INCLUDED_axgb_maths_CDriftMonitor_h

#include <maths/ImportExport.h>

#include <cstddef>
#include <memory>

namespace axgb {
namespace maths {

//! \brief Interface to a change detector over a stream of bits.
//!
//! DESCRIPTION:\n
//! Observes a sequence of 0/1 values, typically prediction error indicators,
//! and reports whether the most recent observation revealed a statistically
//! significant change in their rate. Implementations manage their own state
//! and are never explicitly reset; to start afresh discard the object.
class MATHS_EXPORT CDriftMonitor {
public:
    virtual ~CDriftMonitor() = default;

    //! Add the next observation \p bit, which should be 0 or 1.
    virtual void add(double bit) = 0;

    //! Check if the last call to add detected a change.
    virtual bool changeDetected() const = 0;

    //! Get the number of observations the monitor currently summarises.
    virtual std::size_t width() const = 0;

    //! Get the mean of the observations the monitor currently summarises.
    virtual double estimation() const = 0;

    //! Get the memory used by this object.
    virtual std::size_t memoryUsage() const = 0;
};

using TDriftMonitorUPtr = std::unique_ptr<CDriftMonitor>;
}
}

#endif // INCLUDED_axgb_maths_CDriftMonitor_h
