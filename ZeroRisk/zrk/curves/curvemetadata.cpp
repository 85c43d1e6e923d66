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

#include <zrk/curves/curvemetadata.hpp>

#include <ql/errors.hpp>

namespace ZeroRisk {

CurveMetadata::CurveMetadata(const std::string& curveName, ValueType xValueType, ValueType yValueType,
                             const QuantLib::DayCounter& dayCounter)
    : curveName_(curveName), xValueType_(xValueType), yValueType_(yValueType), dayCounter_(dayCounter) {
    QL_REQUIRE(!curveName_.empty(), "CurveMetadata: curve name must not be empty");
}

CurveMetadata CurveMetadata::withCurveName(const std::string& curveName) const {
    return CurveMetadata(curveName, xValueType_, yValueType_, dayCounter_);
}

bool operator==(const CurveMetadata& lhs, const CurveMetadata& rhs) {
    return lhs.curveName() == rhs.curveName() && lhs.xValueType() == rhs.xValueType() &&
           lhs.yValueType() == rhs.yValueType() && lhs.dayCounter() == rhs.dayCounter();
}

bool operator!=(const CurveMetadata& lhs, const CurveMetadata& rhs) { return !(lhs == rhs); }

std::ostream& operator<<(std::ostream& out, const CurveMetadata& metadata) {
    out << "CurveMetadata{" << metadata.curveName() << ", " << metadata.xValueType() << ", "
        << metadata.yValueType() << ", ";
    if (metadata.hasDayCounter())
        out << metadata.dayCounter().name();
    else
        out << "no day counter";
    return out << "}";
}

} // namespace ZeroRisk
