/*
 Copyright (C) 2024 Quaternion Risk Management Ltd
 All rights reserved.

 This file is part of ORE, a free-software/open-source library
 for transparent pricing and risk analysis - http://opensourcerisk.org

 ORE is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program.
 The license is also available online at <http://opensourcerisk.org>

 This program is distributed on the basis that it will form a useful
 contribution to risk analytics and model standardisation, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

/*! \file zrk/errors.hpp
    \brief Exception classes and requirement macros for configuration and domain errors
*/

#pragma once

#include <ql/errors.hpp>

#include <sstream>
#include <string>

namespace ZeroRisk {

//! Raised when a curve or configuration violates the invariants of the object being built
/*! Detected eagerly at construction time, e.g. a curve whose y-values are not zero rates
    being wrapped into a zero rate discount factors object.
 */
class ConfigurationError : public QuantLib::Error {
public:
    ConfigurationError(const std::string& file, long line, const std::string& functionName,
                       const std::string& message = "")
        : QuantLib::Error(file, line, functionName, message) {}
};

//! Raised when an argument is outside the domain of a calculation, e.g. a non-positive compounding frequency
class DomainArgumentError : public QuantLib::Error {
public:
    DomainArgumentError(const std::string& file, long line, const std::string& functionName,
                        const std::string& message = "")
        : QuantLib::Error(file, line, functionName, message) {}
};

} // namespace ZeroRisk

/*! \def ZRK_FAIL_CONFIG
    \brief throw a ConfigurationError with the given message
*/
#define ZRK_FAIL_CONFIG(message)                                                                                       \
    do {                                                                                                               \
        std::ostringstream _zrk_msg_stream;                                                                            \
        _zrk_msg_stream << message;                                                                                    \
        throw ZeroRisk::ConfigurationError(__FILE__, __LINE__, QL_PRETTY_FUNCTION, _zrk_msg_stream.str());             \
    } while (false)

/*! \def ZRK_REQUIRE_CONFIG
    \brief throw a ConfigurationError if the given condition is not verified
*/
#define ZRK_REQUIRE_CONFIG(condition, message)                                                                         \
    if (!(condition)) {                                                                                                \
        std::ostringstream _zrk_msg_stream;                                                                            \
        _zrk_msg_stream << message;                                                                                    \
        throw ZeroRisk::ConfigurationError(__FILE__, __LINE__, QL_PRETTY_FUNCTION, _zrk_msg_stream.str());             \
    } else

/*! \def ZRK_REQUIRE_DOMAIN
    \brief throw a DomainArgumentError if the given condition is not verified
*/
#define ZRK_REQUIRE_DOMAIN(condition, message)                                                                         \
    if (!(condition)) {                                                                                                \
        std::ostringstream _zrk_msg_stream;                                                                            \
        _zrk_msg_stream << message;                                                                                    \
        throw ZeroRisk::DomainArgumentError(__FILE__, __LINE__, QL_PRETTY_FUNCTION, _zrk_msg_stream.str());            \
    } else
