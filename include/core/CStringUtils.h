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
#ifndef INCLUDED_axgb_core_CStringUtils_h
#define INCLUDED_axgb_core_CStringUtils_h

#include <core/CNonInstantiatable.h>
#include <core/ImportExport.h>

#include <string>
#include <type_traits>

namespace axgb {
namespace core {

//! \brief
//! Conversions between strings and fundamental types.
//!
//! DESCRIPTION:\n
//! Parsing is stricter than the standard library and Boost.PropertyTree:
//! the whole string must be consumed, unsigned values must not have a
//! sign and out of range values fail. Failures are logged unless the
//! silent variant is used, and the output is untouched on failure.
//!
class CORE_EXPORT CStringUtils : private CNonInstantiatable {
public:
    //! The characters ::isspace() treats as whitespace in the "C" locale.
    static const std::string WHITESPACE_CHARS;

public:
    //! Convert \p value to a string.
    template<typename T>
    static std::string typeToString(const T& value) {
        if constexpr (std::is_same_v<T, bool>) {
            return value ? "true" : "false";
        } else if constexpr (std::is_integral_v<T>) {
            return std::to_string(value);
        } else {
            return CStringUtils::_typeToString(value);
        }
    }

    //! Convert a double to a short string using 7 significant figures.
    static std::string typeToStringPretty(double d);

    //! For types other than double use the default conversions.
    template<typename T>
    static std::string typeToStringPretty(const T& value) {
        return CStringUtils::typeToString(value);
    }

    //! Convert \p str to a value, logging any failure.
    template<typename T>
    static bool stringToType(const std::string& str, T& ret) {
        return CStringUtils::_stringToType(false, str, ret);
    }

    //! Convert \p str to a value without logging.
    template<typename T>
    static bool stringToTypeSilent(const std::string& str, T& ret) {
        return CStringUtils::_stringToType(true, str, ret);
    }

    //! Get \p str in lower case.
    static std::string toLower(std::string str);

    //! Remove leading and trailing whitespace from \p str.
    static void trimWhitespace(std::string& str);

    //! Remove leading and trailing characters in \p toTrim from \p str.
    static void trim(const std::string& toTrim, std::string& str);

private:
    static std::string _typeToString(double d);
    static std::string _typeToString(const char* str);
    static std::string _typeToString(const std::string& str);

    static bool _stringToType(bool silent, const std::string& str, unsigned long long& i);
    static bool _stringToType(bool silent, const std::string& str, unsigned long& i);
    static bool _stringToType(bool silent, const std::string& str, unsigned int& i);
    static bool _stringToType(bool silent, const std::string& str, long& i);
    static bool _stringToType(bool silent, const std::string& str, int& i);
    static bool _stringToType(bool silent, const std::string& str, bool& ret);
    static bool _stringToType(bool silent, const std::string& str, double& d);
    static bool _stringToType(bool silent, const std::string& str, std::string& outStr);
};
}
}

#endif // INCLUDED_axgb_core_CStringUtils_h
