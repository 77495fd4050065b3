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
#ifndef INCLUDED_axgb_core_CLogger_h
#define INCLUDED_axgb_core_CLogger_h

#include <core/CNonCopyable.h>
#include <core/ImportExport.h>
#include <core/LogMacros.h>

#include <boost/log/attributes/attribute_name.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <functional>
#include <iosfwd>
#include <string>

namespace axgb {
namespace core {

//! \brief
//! Core logging class.
//!
//! DESCRIPTION:\n
//! Access to the actual logging commands should be through the macros
//! in LogMacros.h.
//!
//! Problems which mean something has gone wrong, but processing of the
//! stream can continue, for example a row with the wrong number of
//! features, should be logged with LOG_ERROR.
//!
//! LOG_ABORT should only be used in situations that would never occur
//! if the code were free of bugs, such as draining a window which isn't
//! full. It logs at fatal level and then throws from fatal().
//!
//! IMPLEMENTATION DECISIONS:\n
//! Wrapper around Boost.Log.
//!
//! Singleton for simplicity.
//!
//! By default, logging is to stderr at debug level. The logger can be
//! reconfigured from a Boost.Log settings file.
//!
class CORE_EXPORT CLogger : private CNonCopyable {
public:
    using TFatalErrorHandler = std::function<void(std::string)>;

    //! Used to set the level we should log at
    enum ELevel { E_Trace, E_Debug, E_Info, E_Warn, E_Error, E_Fatal };

    using TLevelSeverityLogger = boost::log::sources::severity_logger_mt<ELevel>;

    //! \brief Sets the fatal error handler for the object lifetime.
    class CORE_EXPORT CScopeSetFatalErrorHandler : private CNonCopyable {
    public:
        explicit CScopeSetFatalErrorHandler(const TFatalErrorHandler& handler);
        ~CScopeSetFatalErrorHandler();

    private:
        TFatalErrorHandler m_OriginalFatalErrorHandler;
    };

public:
    //! Access to singleton - use the macros to get to this when logging.
    static CLogger& instance();

    //! Reconfigure from a Boost.Log settings file, if the file exists.
    bool reconfigureFromFile(const std::string& settingsFile);

    //! Set the logging level on the fly.
    bool setLoggingLevel(ELevel level);

    //! Get the current logging level.
    ELevel loggingLevel() const;

    //! Map the level enum to a string.
    static std::string levelToString(ELevel level);

    //! Has the logger been reconfigured?
    bool hasBeenReconfigured() const;

    //! Access to underlying logger (must only be called from macros)
    TLevelSeverityLogger& logger();

    //! Throw a fatal exception
    [[noreturn]] static void fatal();

    //! Register a new global fatal error handler.
    //!
    //! \note This is not thread safe. It is intended to be invoked once at
    //! the start of main or in single threaded test code.
    void fatalErrorHandler(const TFatalErrorHandler& handler);

    //! Get the current fatal error handler.
    const TFatalErrorHandler& fatalErrorHandler() const;

    //! Handle a fatal problem using the registered fatal error handler.
    void handleFatal(std::string message);

    //! Attribute names for efficient access to our custom attributes
    boost::log::attribute_name fileAttributeName() const;
    boost::log::attribute_name lineAttributeName() const;
    boost::log::attribute_name functionAttributeName() const;

    //! Reset the logger to log to stderr at debug level. This is primarily
    //! a helper for unit testing as CLogger is a singleton.
    void reset();

private:
    CLogger();
    ~CLogger();

    //! Helper for reconfigureFromFile.
    bool reconfigureFromSettings(std::istream& settingsStrm);

    //! The default fatal error handler exits with a non zero status.
    [[noreturn]] static void defaultFatalErrorHandler(std::string message);

private:
    TLevelSeverityLogger m_Logger;

    //! Has the logger ever been reconfigured?
    volatile bool m_Reconfigured;

    //! The current threshold.
    ELevel m_Level;

    //! Custom Boost.Log attribute names
    boost::log::attribute_name m_FileAttributeName;
    boost::log::attribute_name m_LineAttributeName;
    boost::log::attribute_name m_FunctionAttributeName;

    //! The handler for fatal errors.
    TFatalErrorHandler m_FatalErrorHandler;
};

CORE_EXPORT std::ostream& operator<<(std::ostream& strm, CLogger::ELevel level);
CORE_EXPORT std::istream& operator>>(std::istream& strm, CLogger::ELevel& level);
}
}

#endif // INCLUDED_axgb_core_CLogger_h
