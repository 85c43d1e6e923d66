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

#include <zrk/utilities/parsers.hpp>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <ql/currencies/all.hpp>
#include <ql/time/daycounters/all.hpp>

#include <map>

using namespace QuantLib;
using std::string;
using std::vector;

namespace ZeroRisk {

namespace {
template <class T> T parseFromMap(const string& s, const std::map<string, T>& m, const string& what) {
    auto it = m.find(s);
    if (it != m.end())
        return it->second;
    QL_FAIL("Cannot convert \"" << s << "\" to " << what);
}
} // namespace

Date parseDate(const string& s) {
    QL_REQUIRE(!s.empty(), "Cannot convert empty string to date");

    try {
        if (s.size() <= 6 && boost::all(s, boost::is_digit())) {
            // serial number as written by spreadsheets
            Date::serial_type serial = boost::lexical_cast<Date::serial_type>(s);
            QL_REQUIRE(serial >= Date::minDate().serialNumber() && serial <= Date::maxDate().serialNumber(),
                       "Date serial number " << s << " is out of range");
            return Date(serial);
        } else if (s.size() == 8 && boost::all(s, boost::is_digit())) {
            // yyyymmdd
            Year y = boost::lexical_cast<Year>(s.substr(0, 4));
            Month m = static_cast<Month>(boost::lexical_cast<Integer>(s.substr(4, 2)));
            Day d = boost::lexical_cast<Day>(s.substr(6, 2));
            return Date(d, m, y);
        } else if (s.size() == 10 && (s[4] == '-' || s[4] == '/' || s[4] == '.') && s[7] == s[4]) {
            // yyyy-mm-dd, yyyy/mm/dd, yyyy.mm.dd
            Year y = boost::lexical_cast<Year>(s.substr(0, 4));
            Month m = static_cast<Month>(boost::lexical_cast<Integer>(s.substr(5, 2)));
            Day d = boost::lexical_cast<Day>(s.substr(8, 2));
            return Date(d, m, y);
        } else if (s.size() == 10 && (s[2] == '-' || s[2] == '/' || s[2] == '.') && s[5] == s[2]) {
            // dd-mm-yyyy, dd/mm/yyyy, dd.mm.yyyy
            Day d = boost::lexical_cast<Day>(s.substr(0, 2));
            Month m = static_cast<Month>(boost::lexical_cast<Integer>(s.substr(3, 2)));
            Year y = boost::lexical_cast<Year>(s.substr(6, 4));
            return Date(d, m, y);
        }
    } catch (const boost::bad_lexical_cast& e) {
        QL_FAIL("Cannot convert \"" << s << "\" to Date: " << e.what());
    }

    QL_FAIL("Cannot convert \"" << s << "\" to Date.");
}

Real parseReal(const string& s) {
    try {
        return std::stod(s);
    } catch (const std::exception& ex) {
        QL_FAIL("Failed to parseReal(\"" << s << "\") " << ex.what());
    }
}

Integer parseInteger(const string& s) {
    try {
        return boost::lexical_cast<Integer>(s.c_str());
    } catch (const std::exception& ex) {
        QL_FAIL("Failed to parseInteger(\"" << s << "\") " << ex.what());
    }
}

bool parseBool(const string& s) {
    static std::map<string, bool> b = {{"Y", true},     {"YES", true},  {"TRUE", true},   {"True", true},
                                       {"true", true},  {"1", true},    {"N", false},     {"NO", false},
                                       {"FALSE", false}, {"False", false}, {"false", false}, {"0", false}};
    return parseFromMap(s, b, "bool");
}

Currency parseCurrency(const string& s) {
    static std::map<string, Currency> m = {
        {"AUD", AUDCurrency()}, {"BRL", BRLCurrency()}, {"CAD", CADCurrency()}, {"CHF", CHFCurrency()},
        {"CNY", CNYCurrency()}, {"CZK", CZKCurrency()}, {"DKK", DKKCurrency()}, {"EUR", EURCurrency()},
        {"GBP", GBPCurrency()}, {"HKD", HKDCurrency()}, {"HUF", HUFCurrency()}, {"INR", INRCurrency()},
        {"JPY", JPYCurrency()}, {"KRW", KRWCurrency()}, {"MXN", MXNCurrency()}, {"NOK", NOKCurrency()},
        {"NZD", NZDCurrency()}, {"PLN", PLNCurrency()}, {"SEK", SEKCurrency()}, {"SGD", SGDCurrency()},
        {"TRY", TRYCurrency()}, {"USD", USDCurrency()}, {"ZAR", ZARCurrency()}};
    return parseFromMap(s, m, "Currency");
}

DayCounter parseDayCounter(const string& s) {
    static std::map<string, DayCounter> m = {{"A360", Actual360()},
                                             {"Actual/360", Actual360()},
                                             {"ACT/360", Actual360()},
                                             {"Act/360", Actual360()},
                                             {"A365", Actual365Fixed()},
                                             {"A365F", Actual365Fixed()},
                                             {"Actual/365 (Fixed)", Actual365Fixed()},
                                             {"Actual/365 (fixed)", Actual365Fixed()},
                                             {"ACT/365.FIXED", Actual365Fixed()},
                                             {"ACT/365", Actual365Fixed()},
                                             {"ACT/365F", Actual365Fixed()},
                                             {"Act/365", Actual365Fixed()},
                                             {"T360", Thirty360(Thirty360::USA)},
                                             {"30/360", Thirty360(Thirty360::USA)},
                                             {"30/360 (Bond Basis)", Thirty360(Thirty360::BondBasis)},
                                             {"30E/360", Thirty360(Thirty360::European)},
                                             {"30E/360 (Eurobond Basis)", Thirty360(Thirty360::European)},
                                             {"ActActISDA", ActualActual(ActualActual::ISDA)},
                                             {"ACT/ACT", ActualActual(ActualActual::ISDA)},
                                             {"Actual/Actual (ISDA)", ActualActual(ActualActual::ISDA)},
                                             {"ActActISMA", ActualActual(ActualActual::ISMA)},
                                             {"ActActAFB", ActualActual(ActualActual::AFB)},
                                             {"1/1", OneDayCounter()},
                                             {"Simple", SimpleDayCounter()}};
    return parseFromMap(s, m, "DayCounter");
}

ValueType parseValueType(const string& s) {
    static std::map<string, ValueType> m = {{"YearFraction", ValueType::YearFraction},
                                            {"Months", ValueType::Months},
                                            {"ZeroRate", ValueType::ZeroRate},
                                            {"DiscountFactor", ValueType::DiscountFactor},
                                            {"PriceIndex", ValueType::PriceIndex},
                                            {"Unknown", ValueType::Unknown}};
    return parseFromMap(s, m, "ValueType");
}

CurveInterpolator parseCurveInterpolator(const string& s) {
    static std::map<string, CurveInterpolator> m = {{"Linear", CurveInterpolator::Linear},
                                                    {"BackwardFlat", CurveInterpolator::BackwardFlat},
                                                    {"ForwardFlat", CurveInterpolator::ForwardFlat},
                                                    {"NaturalCubic", CurveInterpolator::NaturalCubic},
                                                    {"CubicSpline", CurveInterpolator::NaturalCubic}};
    return parseFromMap(s, m, "CurveInterpolator");
}

CompoundedRateType parseCompoundedRateType(const string& s) {
    static std::map<string, CompoundedRateType> m = {{"Continuous", CompoundedRateType::Continuous},
                                                     {"Periodic", CompoundedRateType::Periodic}};
    return parseFromMap(s, m, "CompoundedRateType");
}

vector<string> parseListOfValues(const string& s, const char delim) {
    vector<string> result;
    if (boost::trim_copy(s).empty())
        return result;
    boost::split(result, s, [delim](char c) { return c == delim; });
    for (auto& token : result)
        boost::trim(token);
    return result;
}

} // namespace ZeroRisk
