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

#include <zrk/curves/valuetype.hpp>

#include <ql/errors.hpp>

namespace ZeroRisk {

std::ostream& operator<<(std::ostream& out, const ValueType& type) {
    switch (type) {
    case ValueType::YearFraction:
        return out << "YearFraction";
    case ValueType::Months:
        return out << "Months";
    case ValueType::ZeroRate:
        return out << "ZeroRate";
    case ValueType::DiscountFactor:
        return out << "DiscountFactor";
    case ValueType::PriceIndex:
        return out << "PriceIndex";
    case ValueType::Unknown:
        return out << "Unknown";
    default:
        QL_FAIL("Unknown ValueType (" << static_cast<int>(type) << ")");
    }
}

} // namespace ZeroRisk
