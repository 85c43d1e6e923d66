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

#include <zrk/discounting/zeroratediscountfactors.hpp>
#include <zrk/errors.hpp>
#include <zrk/utilities/dates.hpp>
#include <zrk/utilities/log.hpp>

#include <cmath>

using namespace QuantLib;

namespace ZeroRisk {

namespace {
// year fractions below this are treated as zero
const Real effectiveZero = 1.0e-10;

void checkCompounding(CompoundedRateType compoundedRateType, Integer periodsPerYear) {
    if (compoundedRateType == CompoundedRateType::Periodic) {
        ZRK_REQUIRE_DOMAIN(periodsPerYear >= 1,
                           "periods per year (" << periodsPerYear << ") must be at least 1 for periodic compounding");
    }
}
} // namespace

ZeroRateDiscountFactors::ZeroRateDiscountFactors(const Currency& currency, const Date& valuationDate,
                                                 const ext::shared_ptr<const Curve>& curve)
    : currency_(currency), valuationDate_(valuationDate), curve_(curve) {
    ZRK_REQUIRE_CONFIG(!currency_.empty(), "ZeroRateDiscountFactors: currency must not be empty");
    ZRK_REQUIRE_CONFIG(valuationDate_ != Date(), "ZeroRateDiscountFactors: valuation date must not be empty");
    ZRK_REQUIRE_CONFIG(curve_, "ZeroRateDiscountFactors: curve must not be null");
    const CurveMetadata& md = curve_->metadata();
    ZRK_REQUIRE_CONFIG(md.xValueType() == ValueType::YearFraction,
                       "ZeroRateDiscountFactors: curve " << md.curveName()
                                                         << " has x-value type " << md.xValueType()
                                                         << ", expected " << ValueType::YearFraction);
    ZRK_REQUIRE_CONFIG(md.yValueType() == ValueType::ZeroRate, "ZeroRateDiscountFactors: curve "
                                                                   << md.curveName() << " has y-value type "
                                                                   << md.yValueType() << ", expected "
                                                                   << ValueType::ZeroRate);
    ZRK_REQUIRE_CONFIG(md.hasDayCounter(),
                       "ZeroRateDiscountFactors: curve " << md.curveName() << " has no day counter in its metadata");
    DLOG("ZeroRateDiscountFactors " << currency_.code() << " built on curve " << md.curveName() << " with "
                                    << curve_->parameterCount() << " parameters, valuation date "
                                    << io::iso_date(valuationDate_));
}

Time ZeroRateDiscountFactors::relativeYearFraction(const Date& date) const {
    return ZeroRisk::relativeYearFraction(dayCounter(), valuationDate_, date);
}

Real ZeroRateDiscountFactors::zeroRate(const Date& date) const { return curve_->yValue(relativeYearFraction(date)); }

Real ZeroRateDiscountFactors::discountFactor(const Date& date) const {
    Time t = relativeYearFraction(date);
    return std::exp(-curve_->yValue(t) * t);
}

Real ZeroRateDiscountFactors::discountFactorWithSpread(const Date& date, Real spread,
                                                       CompoundedRateType compoundedRateType,
                                                       Integer periodsPerYear) const {
    checkCompounding(compoundedRateType, periodsPerYear);
    Time t = relativeYearFraction(date);
    if (std::fabs(t) < effectiveZero)
        return 1.0;
    Real z = curve_->yValue(t);
    if (compoundedRateType == CompoundedRateType::Continuous)
        return std::exp(-(z + spread) * t);
    Real rate = periodicRateFromDiscountFactor(std::exp(-z * t), t, periodsPerYear);
    return discountFactorFromPeriodicRate(rate + spread, t, periodsPerYear);
}

ZeroRateSensitivity ZeroRateDiscountFactors::zeroRatePointSensitivity(const Date& date) const {
    return zeroRatePointSensitivity(date, currency_);
}

ZeroRateSensitivity ZeroRateDiscountFactors::zeroRatePointSensitivity(const Date& date,
                                                                      const Currency& sensitivityCurrency) const {
    Time t = relativeYearFraction(date);
    Real df = std::exp(-curve_->yValue(t) * t);
    // -df * t is -0.0 for t = 0
    return ZeroRateSensitivity(currency_, date, sensitivityCurrency, -df * t);
}

ZeroRateSensitivity ZeroRateDiscountFactors::zeroRatePointSensitivityWithSpread(const Date& date, Real spread,
                                                                                CompoundedRateType compoundedRateType,
                                                                                Integer periodsPerYear) const {
    return zeroRatePointSensitivityWithSpread(date, currency_, spread, compoundedRateType, periodsPerYear);
}

ZeroRateSensitivity ZeroRateDiscountFactors::zeroRatePointSensitivityWithSpread(
    const Date& date, const Currency& sensitivityCurrency, Real spread, CompoundedRateType compoundedRateType,
    Integer periodsPerYear) const {
    checkCompounding(compoundedRateType, periodsPerYear);
    Time t = relativeYearFraction(date);
    if (std::fabs(t) < effectiveZero)
        return ZeroRateSensitivity(currency_, date, sensitivityCurrency, -0.0);
    if (compoundedRateType == CompoundedRateType::Continuous) {
        Real df = discountFactorWithSpread(date, spread, compoundedRateType, periodsPerYear);
        return ZeroRateSensitivity(currency_, date, sensitivityCurrency, -df * t);
    }
    // d/dz of (1 + (r(z) + s) / n)^(-n t) with r(z) = n (exp(z / n) - 1), the spread does not depend on z
    Real z = curve_->yValue(t);
    Real rate = periodicRateFromContinuousRate(z, periodsPerYear);
    Real dRateDz = periodicRateFromContinuousRateDerivative(z, periodsPerYear);
    Real dDfDRate = discountFactorFromPeriodicRateDerivative(rate + spread, t, periodsPerYear);
    return ZeroRateSensitivity(currency_, date, sensitivityCurrency, dDfDRate * dRateDz);
}

CurveUnitParameterSensitivity ZeroRateDiscountFactors::unitParameterSensitivity(const Date& date) const {
    Time t = relativeYearFraction(date);
    return CurveUnitParameterSensitivity(curve_->name(), curve_->yValueParameterSensitivity(t));
}

CurveCurrencyParameterSensitivities
ZeroRateDiscountFactors::curveParameterSensitivity(const ZeroRateSensitivity& pointSensitivity) const {
    CurveUnitParameterSensitivity unit = unitParameterSensitivity(pointSensitivity.date());
    return CurveCurrencyParameterSensitivities(
        unit.multipliedBy(pointSensitivity.currency(), pointSensitivity.sensitivity()));
}

CurveCurrencyParameterSensitivities
ZeroRateDiscountFactors::curveParameterSensitivity(const PointSensitivities& pointSensitivities) const {
    CurveCurrencyParameterSensitivities result;
    for (auto const& s : pointSensitivities.sensitivities()) {
        if (s.curveCurrency() != currency_) {
            DLOG("ZeroRateDiscountFactors " << currency_.code() << ": skip " << s << ", it refers to the "
                                            << s.curveCurrency().code() << " curve");
            continue;
        }
        CurveUnitParameterSensitivity unit = unitParameterSensitivity(s.date());
        result.add(unit.multipliedBy(s.currency(), s.sensitivity()));
    }
    return result;
}

ZeroRateDiscountFactors ZeroRateDiscountFactors::withCurve(const ext::shared_ptr<const Curve>& curve) const {
    return ZeroRateDiscountFactors(currency_, valuationDate_, curve);
}

ZeroRateDiscountFactors ZeroRateDiscountFactors::applyPerturbation(const CurvePerturbation& perturbation) const {
    QL_REQUIRE(perturbation, "ZeroRateDiscountFactors: perturbation must not be empty");
    return withCurve(perturbation(curve_));
}

} // namespace ZeroRisk
