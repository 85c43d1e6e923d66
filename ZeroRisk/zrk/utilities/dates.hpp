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

/*! \file zrk/utilities/dates.hpp
    \brief Date related utilities
    \ingroup utilities
*/

#pragma once

#include <ql/time/date.hpp>
#include <ql/time/daycounter.hpp>

namespace ZeroRisk {

//! Signed year fraction between two dates
/*! Equal to \c dayCounter.yearFraction(d1, d2) if \c d2 is not before \c d1 and to
    \c -dayCounter.yearFraction(d2, d1) otherwise, so that the result is antisymmetric in its arguments whatever
    the day counter.
    \ingroup utilities
*/
QuantLib::Time relativeYearFraction(const QuantLib::DayCounter& dayCounter, const QuantLib::Date& d1,
                                    const QuantLib::Date& d2);

} // namespace ZeroRisk
