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
#include <core/CLogger.h>

#include <boost/core/null_deleter.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/log/attributes/current_process_id.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/filter_parser.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>
#include <boost/log/utility/setup/from_stream.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace axgb {
namespace core {
namespace {
// Plain character arrays are constant initialised so they are safe to use
// from other translation units' static initialisation.
const char* const LEVEL_NAMES[]{"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL"};
const std::size_t NUMBER_LEVELS{sizeof(LEVEL_NAMES) / sizeof(LEVEL_NAMES[0])};
const char* const UNKNOWN_LEVEL_NAME{"UNKNOWN"};
const char* const SEVERITY_ATTRIBUTE_NAME{"Severity"};

// To ensure the singleton is constructed before multiple threads may require
// it call instance() during the static initialisation phase of the program.
const CLogger& DO_NOT_USE_THIS_VARIABLE = CLogger::instance();
}

CLogger::CScopeSetFatalErrorHandler::CScopeSetFatalErrorHandler(const TFatalErrorHandler& handler)
    : m_OriginalFatalErrorHandler{CLogger::instance().fatalErrorHandler()} {
    CLogger::instance().fatalErrorHandler(handler);
}

CLogger::CScopeSetFatalErrorHandler::~CScopeSetFatalErrorHandler() {
    CLogger::instance().fatalErrorHandler(m_OriginalFatalErrorHandler);
}

CLogger::CLogger()
    : m_Reconfigured{false}, m_Level{E_Debug}, m_FileAttributeName{"File"},
      m_LineAttributeName{"Line"}, m_FunctionAttributeName{"Function"},
      m_FatalErrorHandler{defaultFatalErrorHandler} {
    boost::log::add_common_attributes();
    boost::log::register_simple_filter_factory<ELevel, char>(SEVERITY_ATTRIBUTE_NAME);
    boost::log::register_simple_formatter_factory<ELevel, char>(SEVERITY_ATTRIBUTE_NAME);
    this->reset();
}

CLogger::~CLogger() {
    boost::log::core::get()->remove_all_sinks();
}

void CLogger::reset() {
    namespace expr = boost::log::expressions;
    using TTextSink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_ostream_backend>;

    m_Reconfigured = false;

    auto core = boost::log::core::get();
    core->remove_all_sinks();
    core->reset_filter();

    // Equivalent of the pattern "%d [PID] %-5p %F@%L %m%n" which keeps
    // the output of tests and embedding programs readable with no setup.
    auto backend = boost::make_shared<boost::log::sinks::text_ostream_backend>();
    backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
    backend->auto_flush(true);

    auto sink = boost::make_shared<TTextSink>(backend);
    sink->set_formatter(
        expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S,%f")
        << " [" << expr::attr<boost::log::attributes::current_process_id::value_type>("ProcessID")
        << "] " << expr::attr<ELevel>(SEVERITY_ATTRIBUTE_NAME) << ' '
        << expr::attr<std::string>(m_FileAttributeName) << '@'
        << expr::attr<int>(m_LineAttributeName) << ' ' << expr::smessage);
    core->add_sink(sink);

    this->setLoggingLevel(E_Debug);
}

CLogger& CLogger::instance() {
    static CLogger instance;
    return instance;
}

bool CLogger::hasBeenReconfigured() const {
    return m_Reconfigured;
}

CLogger::TLevelSeverityLogger& CLogger::logger() {
    return m_Logger;
}

void CLogger::fatal() {
    throw std::runtime_error("Axgb Fatal Exception");
}

void CLogger::fatalErrorHandler(const TFatalErrorHandler& handler) {
    m_FatalErrorHandler = handler;
}

const CLogger::TFatalErrorHandler& CLogger::fatalErrorHandler() const {
    return m_FatalErrorHandler;
}

void CLogger::handleFatal(std::string message) {
    m_FatalErrorHandler(std::move(message));
}

boost::log::attribute_name CLogger::fileAttributeName() const {
    return m_FileAttributeName;
}

boost::log::attribute_name CLogger::lineAttributeName() const {
    return m_LineAttributeName;
}

boost::log::attribute_name CLogger::functionAttributeName() const {
    return m_FunctionAttributeName;
}

bool CLogger::setLoggingLevel(ELevel level) {
    if (level < E_Trace || level > E_Fatal) {
        return false;
    }
    boost::log::core::get()->set_filter(
        boost::log::expressions::attr<ELevel>(SEVERITY_ATTRIBUTE_NAME) >= level);
    m_Level = level;
    return true;
}

CLogger::ELevel CLogger::loggingLevel() const {
    return m_Level;
}

std::string CLogger::levelToString(ELevel level) {
    if (level < E_Trace || level > E_Fatal) {
        return UNKNOWN_LEVEL_NAME;
    }
    return LEVEL_NAMES[static_cast<std::size_t>(level)];
}

bool CLogger::reconfigureFromFile(const std::string& settingsFile) {
    std::ifstream settingsStrm{settingsFile};
    if (settingsStrm.is_open() == false) {
        LOG_ERROR(<< "Unable to open settings file " << settingsFile
                  << " for logger re-initialisation");
        return false;
    }

    if (this->reconfigureFromSettings(settingsStrm) == false) {
        return false;
    }

    LOG_DEBUG(<< "Logger re-initialised using settings file "
              << boost::filesystem::path{settingsFile}.filename().string());
    return true;
}

bool CLogger::reconfigureFromSettings(std::istream& settingsStrm) {
    try {
        boost::log::core::get()->remove_all_sinks();
        boost::log::init_from_stream(settingsStrm);
    } catch (const std::exception& e) {
        // The sinks are gone so restore the default configuration before
        // reporting the problem.
        this->reset();
        LOG_ERROR(<< "Failed to reinitialise logger: " << e.what());
        return false;
    }
    m_Reconfigured = true;
    return true;
}

void CLogger::defaultFatalErrorHandler(std::string message) {
    LOG_FATAL(<< message);
    std::exit(EXIT_FAILURE);
}

std::ostream& operator<<(std::ostream& strm, CLogger::ELevel level) {
    return strm << CLogger::levelToString(level);
}

std::istream& operator>>(std::istream& strm, CLogger::ELevel& level) {
    std::string name;
    if (strm >> name) {
        for (std::size_t i = 0; i < NUMBER_LEVELS; ++i) {
            if (name == LEVEL_NAMES[i]) {
                level = static_cast<CLogger::ELevel>(i);
                return strm;
            }
        }
        strm.setstate(std::ios_base::failbit);
    }
    return strm;
}
}
}
