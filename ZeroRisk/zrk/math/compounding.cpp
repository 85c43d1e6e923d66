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

#include <zrk/errors.hpp>
#include <zrk/math/compounding.hpp>

#include <cmath>

using namespace QuantLib;

namespace ZeroRisk {

namespace {
void checkPeriodsPerYear(Integer periodsPerYear) {
    ZRK_REQUIRE_DOMAIN(periodsPerYear >= 1,
                       "periods per year (" << periodsPerYear << ") must be at least 1 for periodic compounding");
}
} // namespace

std::ostream& operator<<(std::ostream& out, const CompoundedRateType& type) {
    switch (type) {
    case CompoundedRateType::Continuous:
        return out << "Continuous";
    case CompoundedRateType::Periodic:
        return out << "Periodic";
    default:
        QL_FAIL("Unknown CompoundedRateType (" << static_cast<int>(type) << ")");
    }
}

Real periodicRateFromDiscountFactor(Real discountFactor, Time t, Integer periodsPerYear) {
    checkPeriodsPerYear(periodsPerYear);
    QL_REQUIRE(t != 0.0, "periodicRateFromDiscountFactor: time must be non-zero");
    Real n = static_cast<Real>(periodsPerYear);
    return n * (std::pow(discountFactor, -1.0 / (n * t)) - 1.0);
}

Real discountFactorFromPeriodicRate(Real rate, Time t, Integer periodsPerYear) {
    checkPeriodsPerYear(periodsPerYear);
    Real n = static_cast<Real>(periodsPerYear);
    return std::pow(1.0 + rate / n, -n * t);
}

Real discountFactorFromPeriodicRateDerivative(Real rate, Time t, Integer periodsPerYear) {
    checkPeriodsPerYear(periodsPerYear);
    Real n = static_cast<Real>(periodsPerYear);
    return -t * std::pow(1.0 + rate / n, -n * t - 1.0);
}

Real periodicRateFromContinuousRate(Real continuousRate, Integer periodsPerYear) {
    checkPeriodsPerYear(periodsPerYear);
    Real n = static_cast<Real>(periodsPerYear);
    return n * (std::exp(continuousRate / n) - 1.0);
}

Real periodicRateFromContinuousRateDerivative(Real continuousRate, Integer periodsPerYear) {
    checkPeriodsPerYear(periodsPerYear);
    return std::exp(continuousRate / static_cast<Real>(periodsPerYear));
}

Real continuousRateFromPeriodicRate(Real periodicRate, Integer periodsPerYear) {
    checkPeriodsPerYear(periodsPerYear);
    Real n = static_cast<Real>(periodsPerYear);
    return n * std::log(1.0 + periodicRate / n);
}

} // namespace ZeroRisk
