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

/*! \file zrk/sensitivity/zeroratesensitivity.hpp
    \brief Point sensitivity to the zero rate of a curve at a date
    \ingroup sensitivity
*/

#pragma once

#include <ql/currency.hpp>
#include <ql/time/date.hpp>

#include <functional>

namespace ZeroRisk {

//! Point sensitivity to a zero rate
/*! Holds the derivative of some quantity with respect to the zero rate of the curve of \c curveCurrency observed
    for \c date. The sensitivity value is expressed in \c currency, which defaults to the curve currency but may
    differ from it, e.g. when the quantity has been converted upstream.

    Two sensitivities are equal if all fields are equal, where -0.0 and 0.0 are considered different values.

    \ingroup sensitivity
*/
class ZeroRateSensitivity {
public:
    //! Sensitivity expressed in the curve currency
    ZeroRateSensitivity(const QuantLib::Currency& curveCurrency, const QuantLib::Date& date,
                        QuantLib::Real sensitivity);
    ZeroRateSensitivity(const QuantLib::Currency& curveCurrency, const QuantLib::Date& date,
                        const QuantLib::Currency& currency, QuantLib::Real sensitivity);

    //! \name Inspectors
    //@{
    const QuantLib::Currency& curveCurrency() const { return curveCurrency_; }
    const QuantLib::Date& date() const { return date_; }
    const QuantLib::Currency& currency() const { return currency_; }
    QuantLib::Real sensitivity() const { return sensitivity_; }
    //@}

    //! \name Modifiers
    //! Each returns a new instance
    //@{
    ZeroRateSensitivity withCurrency(const QuantLib::Currency& currency) const;
    ZeroRateSensitivity withSensitivity(QuantLib::Real sensitivity) const;
    ZeroRateSensitivity multipliedBy(QuantLib::Real factor) const;
    ZeroRateSensitivity mapSensitivity(const std::function<QuantLib::Real(QuantLib::Real)>& op) const;
    //@}

    //! Compares curve currency, currency and date in that order, returns a negative, zero or positive number
    int compareKey(const ZeroRateSensitivity& other) const;

private:
    QuantLib::Currency curveCurrency_;
    QuantLib::Date date_;
    QuantLib::Currency currency_;
    QuantLib::Real sensitivity_;
};

bool operator==(const ZeroRateSensitivity& lhs, const ZeroRateSensitivity& rhs);
bool operator!=(const ZeroRateSensitivity& lhs, const ZeroRateSensitivity& rhs);

std::ostream& operator<<(std::ostream& out, const ZeroRateSensitivity& s);

} // namespace ZeroRisk
