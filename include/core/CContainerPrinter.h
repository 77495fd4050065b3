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
#ifndef INCLUDED_axgb_core_CContainerPrinter_h
#define INCLUDED_axgb_core_CContainerPrinter_h

#include <core/CNonInstantiatable.h>
#include <core/CStringUtils.h>
#include <core/ImportExport.h>

#include <boost/optional.hpp>

#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace axgb {
namespace core {
namespace printer_detail {

//! True if T can be iterated with std::begin and std::end.
template<typename, typename = void>
struct is_range : std::false_type {};
template<typename T>
struct is_range<T, std::void_t<decltype(std::begin(std::declval<const T&>())),
                               decltype(std::end(std::declval<const T&>()))>>
    : std::true_type {};

//! True if T has a member "std::string print() const".
template<typename, typename = void>
struct has_print : std::false_type {};
template<typename T>
struct has_print<T, std::enable_if_t<std::is_convertible_v<decltype(std::declval<const T&>().print()), std::string>>>
    : std::true_type {};
}

//! \brief Prints containers, iterator ranges and the values they hold.
//!
//! DESCRIPTION:\n
//! Used for debug logging and test diagnostics, for example
//! \code{.cpp}
//!   LOG_DEBUG(<< "window sizes = " << core::CContainerPrinter::print(sizes));
//! \endcode
//! produces "window sizes = [2, 4, 4, 4]". Values are printed, in order of
//! preference, as a nested range, using their own print member, with
//! CStringUtils if they're arithmetic and otherwise with operator<<.
//! Pointers, smart pointers and optionals are dereferenced and print as
//! "null" if unset.
class CORE_EXPORT CContainerPrinter : private CNonInstantiatable {
public:
    using TStrVec = std::vector<std::string>;

public:
    //! Print a single value or container.
    template<typename T>
    static std::string print(const T& value) {
        return printElement(value);
    }

    //! Print the values in [\p begin, \p end).
    template<typename ITR>
    static std::string print(ITR begin, ITR end) {
        TStrVec elements;
        for (/**/; begin != end; ++begin) {
            elements.push_back(printElement(*begin));
        }
        return bracket(elements);
    }

private:
    //! Get "[e1, e2, ...]" for \p elements.
    static std::string bracket(const TStrVec& elements);

    //! Get the representation of a missing value.
    static const std::string& null();

    template<typename T>
    static std::string printElement(const T& value) {
        if constexpr (std::is_pointer_v<T>) {
            return value == nullptr ? null() : printElement(*value);
        } else if constexpr (printer_detail::is_range<T>::value) {
            return print(std::begin(value), std::end(value));
        } else if constexpr (printer_detail::has_print<T>::value) {
            return value.print();
        } else if constexpr (std::is_arithmetic_v<T>) {
            return CStringUtils::typeToStringPretty(value);
        } else {
            std::ostringstream result;
            result << value;
            return result.str();
        }
    }

    template<typename T>
    static std::string printElement(const std::unique_ptr<T>& value) {
        return value == nullptr ? null() : printElement(*value);
    }

    template<typename T>
    static std::string printElement(const std::shared_ptr<T>& value) {
        return value == nullptr ? null() : printElement(*value);
    }

    template<typename T>
    static std::string printElement(const boost::optional<T>& value) {
        return value ? printElement(*value) : null();
    }

    template<typename U, typename V>
    static std::string printElement(const std::pair<U, V>& value) {
        return "(" + printElement(value.first) + ", " + printElement(value.second) + ")";
    }

    static std::string printElement(const std::string& value) { return value; }

    static std::string printElement(const char* value) {
        return value == nullptr ? null() : std::string{value};
    }
};
}
}

#endif // INCLUDED_axgb_core_CContainerPrinter_h
