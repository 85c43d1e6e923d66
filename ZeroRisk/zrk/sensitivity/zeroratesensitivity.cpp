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

#include <zrk/sensitivity/zeroratesensitivity.hpp>

#include <ql/errors.hpp>
#include <ql/time/date.hpp>

#include <cmath>

using namespace QuantLib;

namespace ZeroRisk {

ZeroRateSensitivity::ZeroRateSensitivity(const Currency& curveCurrency, const Date& date, Real sensitivity)
    : ZeroRateSensitivity(curveCurrency, date, curveCurrency, sensitivity) {}

ZeroRateSensitivity::ZeroRateSensitivity(const Currency& curveCurrency, const Date& date, const Currency& currency,
                                         Real sensitivity)
    : curveCurrency_(curveCurrency), date_(date), currency_(currency), sensitivity_(sensitivity) {
    QL_REQUIRE(!curveCurrency_.empty(), "ZeroRateSensitivity: curve currency must not be empty");
    QL_REQUIRE(!currency_.empty(), "ZeroRateSensitivity: sensitivity currency must not be empty");
    QL_REQUIRE(date_ != Date(), "ZeroRateSensitivity: date must not be empty");
}

ZeroRateSensitivity ZeroRateSensitivity::withCurrency(const Currency& currency) const {
    return ZeroRateSensitivity(curveCurrency_, date_, currency, sensitivity_);
}

ZeroRateSensitivity ZeroRateSensitivity::withSensitivity(Real sensitivity) const {
    return ZeroRateSensitivity(curveCurrency_, date_, currency_, sensitivity);
}

ZeroRateSensitivity ZeroRateSensitivity::multipliedBy(Real factor) const {
    return withSensitivity(sensitivity_ * factor);
}

ZeroRateSensitivity ZeroRateSensitivity::mapSensitivity(const std::function<Real(Real)>& op) const {
    return withSensitivity(op(sensitivity_));
}

int ZeroRateSensitivity::compareKey(const ZeroRateSensitivity& other) const {
    int c = curveCurrency_.code().compare(other.curveCurrency_.code());
    if (c != 0)
        return c;
    c = currency_.code().compare(other.currency_.code());
    if (c != 0)
        return c;
    if (date_ != other.date_)
        return date_ < other.date_ ? -1 : 1;
    return 0;
}

bool operator==(const ZeroRateSensitivity& lhs, const ZeroRateSensitivity& rhs) {
    return lhs.compareKey(rhs) == 0 && lhs.sensitivity() == rhs.sensitivity() &&
           std::signbit(lhs.sensitivity()) == std::signbit(rhs.sensitivity());
}

bool operator!=(const ZeroRateSensitivity& lhs, const ZeroRateSensitivity& rhs) { return !(lhs == rhs); }

std::ostream& operator<<(std::ostream& out, const ZeroRateSensitivity& s) {
    return out << "ZeroRateSensitivity{" << s.curveCurrency().code() << ", " << io::iso_date(s.date()) << ", "
               << s.currency().code() << ", " << s.sensitivity() << "}";
}

} // namespace ZeroRisk
