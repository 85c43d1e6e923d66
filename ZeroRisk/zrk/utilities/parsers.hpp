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

/*! \file zrk/utilities/parsers.hpp
    \brief Map text representations to QuantLib and ZeroRisk objects
    \ingroup utilities
*/

#pragma once

#include <zrk/curves/interpolatednodalcurve.hpp>
#include <zrk/curves/valuetype.hpp>
#include <zrk/math/compounding.hpp>

#include <ql/currency.hpp>
#include <ql/errors.hpp>
#include <ql/time/date.hpp>
#include <ql/time/daycounter.hpp>

#include <functional>
#include <string>
#include <vector>

namespace ZeroRisk {

//! Convert text to QuantLib::Date
/*! Supported formats are yyyymmdd, yyyy-mm-dd, yyyy/mm/dd, yyyy.mm.dd, dd-mm-yyyy, dd/mm/yyyy and dd.mm.yyyy.
    Up to six digits are read as a spreadsheet serial number, e.g. 42159 for 4 June 2015.
    \ingroup utilities
*/
QuantLib::Date parseDate(const std::string& s);

//! Convert text to Real
/*! \ingroup utilities */
QuantLib::Real parseReal(const std::string& s);

//! Convert text to QuantLib::Integer
/*! \ingroup utilities */
QuantLib::Integer parseInteger(const std::string& s);

//! Convert text to bool
/*! Y, YES, TRUE, true, 1 map to \c true and N, NO, FALSE, false, 0 to \c false
    \ingroup utilities
*/
bool parseBool(const std::string& s);

//! Convert an ISO currency code to QuantLib::Currency
/*! \ingroup utilities */
QuantLib::Currency parseCurrency(const std::string& s);

//! Convert text to QuantLib::DayCounter
/*! \ingroup utilities */
QuantLib::DayCounter parseDayCounter(const std::string& s);

//! Convert text to ZeroRisk::ValueType
/*! \ingroup utilities */
ValueType parseValueType(const std::string& s);

//! Convert text to ZeroRisk::CurveInterpolator
/*! \ingroup utilities */
CurveInterpolator parseCurveInterpolator(const std::string& s);

//! Convert text to ZeroRisk::CompoundedRateType
/*! \ingroup utilities */
CompoundedRateType parseCompoundedRateType(const std::string& s);

//! Split a delimited string into its trimmed tokens, empty input gives an empty vector
/*! \ingroup utilities */
std::vector<std::string> parseListOfValues(const std::string& s, const char delim = ',');

//! Split a delimited string and apply \c parser to each token
/*! \ingroup utilities */
template <class T>
std::vector<T> parseListOfValues(const std::string& s, std::function<T(const std::string&)> parser,
                                 const char delim = ',') {
    std::vector<T> vec;
    for (auto const& token : parseListOfValues(s, delim))
        vec.push_back(parser(token));
    return vec;
}

} // namespace ZeroRisk
