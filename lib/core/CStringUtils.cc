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
#include <core/CStringUtils.h>

#include <core/CLogger.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>

namespace axgb {
namespace core {
namespace {

bool fail(bool silent, const std::string& str, const char* type, const std::string& reason) {
    if (!silent) {
        LOG_ERROR(<< "Unable to convert '" << str << "' to " << type << ": " << reason);
    }
    return false;
}

//! Parse an integer of type T accepting decimal, hex and octal notation.
template<typename T>
bool parseInteger(bool silent, const std::string& str, const char* type, T& result) {
    if (str.empty()) {
        return fail(silent, str, type, "empty");
    }

    char* end{nullptr};
    errno = 0;
    T value{0};
    if constexpr (std::is_signed_v<T>) {
        long long parsed{std::strtoll(str.c_str(), &end, 0)};
        if (errno == ERANGE || parsed < std::numeric_limits<T>::min() ||
            parsed > std::numeric_limits<T>::max()) {
            return fail(silent, str, type, "out of range");
        }
        value = static_cast<T>(parsed);
    } else {
        // strtoull silently negates
        if (str.find('-') != std::string::npos) {
            return fail(silent, str, type, "negative");
        }
        unsigned long long parsed{std::strtoull(str.c_str(), &end, 0)};
        if (errno == ERANGE || parsed > std::numeric_limits<T>::max()) {
            return fail(silent, str, type, "out of range");
        }
        value = static_cast<T>(parsed);
    }

    if (end == str.c_str() || *end != '\0') {
        return fail(silent, str, type, "invalid character at '" + std::string{end} + "'");
    }

    result = value;
    return true;
}
}

const std::string CStringUtils::WHITESPACE_CHARS{" \t\r\n\v\f"};

std::string CStringUtils::toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

void CStringUtils::trimWhitespace(std::string& str) {
    CStringUtils::trim(WHITESPACE_CHARS, str);
}

void CStringUtils::trim(const std::string& toTrim, std::string& str) {
    auto last = str.find_last_not_of(toTrim);
    if (last == std::string::npos) {
        str.clear();
        return;
    }
    str.erase(last + 1);
    str.erase(0, str.find_first_not_of(toTrim));
}

std::string CStringUtils::_typeToString(double d) {
    // %f can print up to 309 digits before the point
    char buf[512];
    std::snprintf(buf, sizeof(buf), "%f", d);
    return buf;
}

std::string CStringUtils::_typeToString(const char* str) {
    return str;
}

std::string CStringUtils::_typeToString(const std::string& str) {
    return str;
}

std::string CStringUtils::typeToStringPretty(double d) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.7g", d);
    return buf;
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, unsigned long long& i) {
    return parseInteger(silent, str, "unsigned long long", i);
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, unsigned long& i) {
    return parseInteger(silent, str, "unsigned long", i);
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, unsigned int& i) {
    return parseInteger(silent, str, "unsigned int", i);
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, long& i) {
    return parseInteger(silent, str, "long", i);
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, int& i) {
    return parseInteger(silent, str, "int", i);
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, bool& ret) {
    static const std::string TRUE_NAMES[]{"t", "y", "on", "yes", "true"};
    static const std::string FALSE_NAMES[]{"f", "n", "off", "no", "false"};

    std::string lower{CStringUtils::toLower(str)};
    if (std::find(std::begin(TRUE_NAMES), std::end(TRUE_NAMES), lower) != std::end(TRUE_NAMES)) {
        ret = true;
        return true;
    }
    if (std::find(std::begin(FALSE_NAMES), std::end(FALSE_NAMES), lower) != std::end(FALSE_NAMES)) {
        ret = false;
        return true;
    }

    // Otherwise any integer is accepted with non-zero meaning true.
    long l{0};
    if (parseInteger(true, str, "long", l) == false) {
        return fail(silent, str, "bool", "not a boolean name or integer");
    }
    ret = (l != 0);
    return true;
}

bool CStringUtils::_stringToType(bool silent, const std::string& str, double& d) {
    if (str.empty()) {
        return fail(silent, str, "double", "empty");
    }

    char* end{nullptr};
    errno = 0;
    double value{std::strtod(str.c_str(), &end)};
    if (errno == ERANGE && std::isinf(value)) {
        return fail(silent, str, "double", "out of range");
    }
    if (end == str.c_str() || *end != '\0') {
        return fail(silent, str, "double", "invalid character at '" + std::string{end} + "'");
    }

    d = value;
    return true;
}

bool CStringUtils::_stringToType(bool /*silent*/, const std::string& str, std::string& outStr) {
    outStr = str;
    return true;
}
}
}
