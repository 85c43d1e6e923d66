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

#include <zrk/sensitivity/curveparametersensitivity.hpp>

#include <ql/errors.hpp>

#include <algorithm>
#include <numeric>

using namespace QuantLib;

namespace ZeroRisk {

namespace {
bool equal(const Array& a, const Array& b) { return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin()); }

void print(std::ostream& out, const Array& a) {
    out << "[";
    for (Size i = 0; i < a.size(); ++i)
        out << (i == 0 ? "" : ", ") << a[i];
    out << "]";
}
} // namespace

CurveUnitParameterSensitivity::CurveUnitParameterSensitivity(const std::string& curveName, const Array& sensitivity)
    : curveName_(curveName), sensitivity_(sensitivity) {
    QL_REQUIRE(!curveName_.empty(), "CurveUnitParameterSensitivity: curve name must not be empty");
}

CurveCurrencyParameterSensitivity CurveUnitParameterSensitivity::multipliedBy(const Currency& currency,
                                                                              Real amount) const {
    return CurveCurrencyParameterSensitivity(curveName_, currency, sensitivity_ * amount);
}

CurveCurrencyParameterSensitivity::CurveCurrencyParameterSensitivity(const std::string& curveName,
                                                                     const Currency& currency,
                                                                     const Array& sensitivity)
    : curveName_(curveName), currency_(currency), sensitivity_(sensitivity) {
    QL_REQUIRE(!curveName_.empty(), "CurveCurrencyParameterSensitivity: curve name must not be empty");
    QL_REQUIRE(!currency_.empty(), "CurveCurrencyParameterSensitivity: currency must not be empty for curve "
                                       << curveName_);
}

CurveCurrencyParameterSensitivity CurveCurrencyParameterSensitivity::multipliedBy(Real factor) const {
    return CurveCurrencyParameterSensitivity(curveName_, currency_, sensitivity_ * factor);
}

CurveCurrencyParameterSensitivity
CurveCurrencyParameterSensitivity::plus(const CurveCurrencyParameterSensitivity& other) const {
    QL_REQUIRE(curveName_ == other.curveName_ && currency_ == other.currency_,
               "CurveCurrencyParameterSensitivity: cannot add sensitivity to " << other.curveName_ << "/"
                                                                             << other.currency_.code() << " to "
                                                                             << curveName_ << "/"
                                                                             << currency_.code());
    QL_REQUIRE(sensitivity_.size() == other.sensitivity_.size(),
               "CurveCurrencyParameterSensitivity: parameter count mismatch for curve "
                   << curveName_ << " (" << sensitivity_.size() << " vs " << other.sensitivity_.size() << ")");
    return CurveCurrencyParameterSensitivity(curveName_, currency_, sensitivity_ + other.sensitivity_);
}

Real CurveCurrencyParameterSensitivity::total() const {
    return std::accumulate(sensitivity_.begin(), sensitivity_.end(), 0.0);
}

bool operator==(const CurveUnitParameterSensitivity& lhs, const CurveUnitParameterSensitivity& rhs) {
    return lhs.curveName() == rhs.curveName() && equal(lhs.sensitivity(), rhs.sensitivity());
}

bool operator==(const CurveCurrencyParameterSensitivity& lhs, const CurveCurrencyParameterSensitivity& rhs) {
    return lhs.curveName() == rhs.curveName() && lhs.currency() == rhs.currency() &&
           equal(lhs.sensitivity(), rhs.sensitivity());
}

std::ostream& operator<<(std::ostream& out, const CurveUnitParameterSensitivity& s) {
    out << "CurveUnitParameterSensitivity{" << s.curveName() << ", ";
    print(out, s.sensitivity());
    return out << "}";
}

std::ostream& operator<<(std::ostream& out, const CurveCurrencyParameterSensitivity& s) {
    out << "CurveCurrencyParameterSensitivity{" << s.curveName() << ", " << s.currency().code() << ", ";
    print(out, s.sensitivity());
    return out << "}";
}

} // namespace ZeroRisk
