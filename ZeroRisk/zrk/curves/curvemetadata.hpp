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

/*! \file zrk/curves/curvemetadata.hpp
    \brief Metadata describing a curve
    \ingroup curves
*/

#pragma once

#include <zrk/curves/valuetype.hpp>

#include <ql/time/daycounter.hpp>

#include <string>

namespace ZeroRisk {

//! Curve metadata
/*! Holds the curve name, the value types of both axes and, where the x-values are derived from dates, the day
    counter used to do so. An empty day counter means the curve carries no day count information.
    \ingroup curves
*/
class CurveMetadata {
public:
    CurveMetadata(const std::string& curveName, ValueType xValueType = ValueType::Unknown,
                  ValueType yValueType = ValueType::Unknown,
                  const QuantLib::DayCounter& dayCounter = QuantLib::DayCounter());

    //! \name Inspectors
    //@{
    const std::string& curveName() const { return curveName_; }
    ValueType xValueType() const { return xValueType_; }
    ValueType yValueType() const { return yValueType_; }
    const QuantLib::DayCounter& dayCounter() const { return dayCounter_; }
    bool hasDayCounter() const { return !dayCounter_.empty(); }
    //@}

    CurveMetadata withCurveName(const std::string& curveName) const;

private:
    std::string curveName_;
    ValueType xValueType_;
    ValueType yValueType_;
    QuantLib::DayCounter dayCounter_;
};

bool operator==(const CurveMetadata& lhs, const CurveMetadata& rhs);
bool operator!=(const CurveMetadata& lhs, const CurveMetadata& rhs);

std::ostream& operator<<(std::ostream& out, const CurveMetadata& metadata);

} // namespace ZeroRisk
