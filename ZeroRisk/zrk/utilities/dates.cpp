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

#include <zrk/utilities/dates.hpp>

#include <ql/errors.hpp>

using namespace QuantLib;

namespace ZeroRisk {

Time relativeYearFraction(const DayCounter& dayCounter, const Date& d1, const Date& d2) {
    QL_REQUIRE(!dayCounter.empty(), "relativeYearFraction: no day counter given");
    if (d2 < d1)
        return -dayCounter.yearFraction(d2, d1);
    return dayCounter.yearFraction(d1, d2);
}

} // namespace ZeroRisk
