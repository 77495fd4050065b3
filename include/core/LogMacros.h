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

// No include guards: the logging macros may be redefined per file, for
// example to compile out trace logging in hot loops.

#include <boost/current_function.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/utility/manipulators/add_value.hpp>

#include <sstream>

#ifdef LOG_LOCATION_INFO
#undef LOG_LOCATION_INFO
#endif
#define LOG_LOCATION_INFO                                                   \
    << boost::log::add_value(axgb::core::CLogger::instance().lineAttributeName(), \
                             __LINE__)                                      \
    << boost::log::add_value(axgb::core::CLogger::instance().fileAttributeName(), \
                             __FILE__)                                      \
    << boost::log::add_value(                                               \
           axgb::core::CLogger::instance().functionAttributeName(), BOOST_CURRENT_FUNCTION)

#ifdef AXGB_LOG_AT
#undef AXGB_LOG_AT
#endif
#define AXGB_LOG_AT(level, message)                                         \
    BOOST_LOG_STREAM_SEV(axgb::core::CLogger::instance().logger(), level)   \
    LOG_LOCATION_INFO                                                       \
    message

#ifdef LOG_TRACE
#undef LOG_TRACE
#endif
#ifdef EXCLUDE_TRACE_LOGGING
// Expands to code the optimiser removes so tracing in tight loops, such as
// split search, costs nothing in release builds.
#define LOG_TRACE(message)                                                  \
    static_cast<void>([&]() { std::ostringstream() << "" message; })
#else
#define LOG_TRACE(message) AXGB_LOG_AT(axgb::core::CLogger::E_Trace, message)
#endif

#ifdef LOG_DEBUG
#undef LOG_DEBUG
#endif
#define LOG_DEBUG(message) AXGB_LOG_AT(axgb::core::CLogger::E_Debug, message)

#ifdef LOG_INFO
#undef LOG_INFO
#endif
#define LOG_INFO(message) AXGB_LOG_AT(axgb::core::CLogger::E_Info, message)

#ifdef LOG_WARN
#undef LOG_WARN
#endif
#define LOG_WARN(message) AXGB_LOG_AT(axgb::core::CLogger::E_Warn, message)

#ifdef LOG_ERROR
#undef LOG_ERROR
#endif
#define LOG_ERROR(message) AXGB_LOG_AT(axgb::core::CLogger::E_Error, message)

#ifdef LOG_FATAL
#undef LOG_FATAL
#endif
#define LOG_FATAL(message) AXGB_LOG_AT(axgb::core::CLogger::E_Fatal, message)

// Pass a fatal problem to the registered fatal error handler.
#ifdef HANDLE_FATAL
#undef HANDLE_FATAL
#endif
#define HANDLE_FATAL(message)                                               \
    {                                                                       \
        std::ostringstream ss;                                              \
        ss message;                                                         \
        axgb::core::CLogger::instance().handleFatal(ss.str());              \
    }

// Only for states which are unreachable unless the code has a bug.
#ifdef LOG_ABORT
#undef LOG_ABORT
#endif
#define LOG_ABORT(message)                                                  \
    AXGB_LOG_AT(axgb::core::CLogger::E_Fatal, message);                     \
    axgb::core::CLogger::fatal()
