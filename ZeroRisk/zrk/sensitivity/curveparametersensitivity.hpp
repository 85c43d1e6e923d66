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

/*! \file zrk/sensitivity/curveparametersensitivity.hpp
    \brief Sensitivities to the parameters of a single curve
    \ingroup sensitivity
*/

#pragma once

#include <ql/currency.hpp>
#include <ql/math/array.hpp>

#include <string>

namespace ZeroRisk {

class CurveCurrencyParameterSensitivity;

//! Unit sensitivity of a curve value to the curve parameters
/*! The raw partial derivatives of a curve's y-value with respect to each of its parameters, not scaled by any
    amount and therefore without currency.
    \ingroup sensitivity
*/
class CurveUnitParameterSensitivity {
public:
    CurveUnitParameterSensitivity(const std::string& curveName, const QuantLib::Array& sensitivity);

    const std::string& curveName() const { return curveName_; }
    const QuantLib::Array& sensitivity() const { return sensitivity_; }
    QuantLib::Size parameterCount() const { return sensitivity_.size(); }

    //! Scales the unit sensitivity by \c amount, expressed in \c currency
    CurveCurrencyParameterSensitivity multipliedBy(const QuantLib::Currency& currency, QuantLib::Real amount) const;

private:
    std::string curveName_;
    QuantLib::Array sensitivity_;
};

//! Sensitivity to the parameters of a curve expressed in a currency
/*! \ingroup sensitivity */
class CurveCurrencyParameterSensitivity {
public:
    CurveCurrencyParameterSensitivity(const std::string& curveName, const QuantLib::Currency& currency,
                                      const QuantLib::Array& sensitivity);

    const std::string& curveName() const { return curveName_; }
    const QuantLib::Currency& currency() const { return currency_; }
    const QuantLib::Array& sensitivity() const { return sensitivity_; }
    QuantLib::Size parameterCount() const { return sensitivity_.size(); }

    CurveCurrencyParameterSensitivity multipliedBy(QuantLib::Real factor) const;
    //! Element-wise sum, both sensitivities must refer to the same curve, currency and number of parameters
    CurveCurrencyParameterSensitivity plus(const CurveCurrencyParameterSensitivity& other) const;
    //! Sum over all parameters
    QuantLib::Real total() const;

private:
    std::string curveName_;
    QuantLib::Currency currency_;
    QuantLib::Array sensitivity_;
};

bool operator==(const CurveUnitParameterSensitivity& lhs, const CurveUnitParameterSensitivity& rhs);
bool operator==(const CurveCurrencyParameterSensitivity& lhs, const CurveCurrencyParameterSensitivity& rhs);

std::ostream& operator<<(std::ostream& out, const CurveUnitParameterSensitivity& s);
std::ostream& operator<<(std::ostream& out, const CurveCurrencyParameterSensitivity& s);

} // namespace ZeroRisk
