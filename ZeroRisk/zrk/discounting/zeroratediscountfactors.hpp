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

/*! \file zrk/discounting/zeroratediscountfactors.hpp
    \brief Discount factors and their sensitivities from a zero rate curve
    \ingroup discounting
*/

#pragma once

#include <zrk/curves/curve.hpp>
#include <zrk/curves/curveperturbation.hpp>
#include <zrk/math/compounding.hpp>
#include <zrk/sensitivity/curvecurrencyparametersensitivities.hpp>
#include <zrk/sensitivity/pointsensitivities.hpp>

#include <ql/currency.hpp>
#include <ql/time/date.hpp>

namespace ZeroRisk {

//! Discount factors based on a zero rate curve
/*! Wraps a curve of continuously compounded zero rates against year fractions, measured from the valuation date
    with the curve's day counter, and provides discount factors, discount factors adjusted by a spread and the
    sensitivities of those to the curve.

    The discount factor for a date with relative year fraction \f$ t \f$ is \f$ e^{-z(t) t} \f$.

    Instances are immutable; withCurve() and applyPerturbation() return new instances. The curve may be shared
    between several instances.

    \ingroup discounting
*/
class ZeroRateDiscountFactors {
public:
    //! Throws ConfigurationError unless the curve has year fraction x-values, zero rate y-values and a day counter
    ZeroRateDiscountFactors(const QuantLib::Currency& currency, const QuantLib::Date& valuationDate,
                            const QuantLib::ext::shared_ptr<const Curve>& curve);

    //! \name Inspectors
    //@{
    const QuantLib::Currency& currency() const { return currency_; }
    const QuantLib::Date& valuationDate() const { return valuationDate_; }
    const QuantLib::ext::shared_ptr<const Curve>& curve() const { return curve_; }
    const std::string& curveName() const { return curve_->name(); }
    QuantLib::Size parameterCount() const { return curve_->parameterCount(); }
    const QuantLib::DayCounter& dayCounter() const { return curve_->metadata().dayCounter(); }
    //@}

    //! Year fraction of \c date relative to the valuation date, negative for dates before it
    QuantLib::Time relativeYearFraction(const QuantLib::Date& date) const;

    //! \name Discount factors
    //@{
    QuantLib::Real zeroRate(const QuantLib::Date& date) const;
    QuantLib::Real discountFactor(const QuantLib::Date& date) const;
    /*! Discount factor with the zero rate shifted by \c spread. For CompoundedRateType::Periodic the zero rate is
        converted to the equivalent rate compounded \c periodsPerYear times per year, the spread is added to that
        rate and the result converted back to a discount factor. \c periodsPerYear is ignored for
        CompoundedRateType::Continuous.
    */
    QuantLib::Real discountFactorWithSpread(const QuantLib::Date& date, QuantLib::Real spread,
                                            CompoundedRateType compoundedRateType,
                                            QuantLib::Integer periodsPerYear) const;
    //@}

    //! \name Point sensitivities
    //@{
    ZeroRateSensitivity zeroRatePointSensitivity(const QuantLib::Date& date) const;
    ZeroRateSensitivity zeroRatePointSensitivity(const QuantLib::Date& date,
                                                 const QuantLib::Currency& sensitivityCurrency) const;
    //! Sensitivity of discountFactorWithSpread() to the zero rate
    ZeroRateSensitivity zeroRatePointSensitivityWithSpread(const QuantLib::Date& date, QuantLib::Real spread,
                                                           CompoundedRateType compoundedRateType,
                                                           QuantLib::Integer periodsPerYear) const;
    ZeroRateSensitivity zeroRatePointSensitivityWithSpread(const QuantLib::Date& date,
                                                           const QuantLib::Currency& sensitivityCurrency,
                                                           QuantLib::Real spread,
                                                           CompoundedRateType compoundedRateType,
                                                           QuantLib::Integer periodsPerYear) const;
    //@}

    //! \name Parameter sensitivities
    //@{
    //! Sensitivity of the zero rate at \c date to the curve parameters
    CurveUnitParameterSensitivity unitParameterSensitivity(const QuantLib::Date& date) const;
    //! Converts a point sensitivity into a sensitivity to the curve parameters
    CurveCurrencyParameterSensitivities curveParameterSensitivity(const ZeroRateSensitivity& pointSensitivity) const;
    /*! Converts and aggregates the point sensitivities that refer to this curve, i.e. those whose curve currency
        is the currency of this instance. The others are ignored.
    */
    CurveCurrencyParameterSensitivities
    curveParameterSensitivity(const PointSensitivities& pointSensitivities) const;
    //@}

    //! \name Modifiers
    //@{
    ZeroRateDiscountFactors withCurve(const QuantLib::ext::shared_ptr<const Curve>& curve) const;
    ZeroRateDiscountFactors applyPerturbation(const CurvePerturbation& perturbation) const;
    //@}

private:
    QuantLib::Currency currency_;
    QuantLib::Date valuationDate_;
    QuantLib::ext::shared_ptr<const Curve> curve_;
};

} // namespace ZeroRisk
