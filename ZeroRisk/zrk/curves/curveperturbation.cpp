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

#include <zrk/curves/curveperturbation.hpp>

#include <ql/errors.hpp>

using namespace QuantLib;

namespace ZeroRisk {

ext::shared_ptr<const Curve> CurveParallelShift::operator()(const ext::shared_ptr<const Curve>& curve) const {
    QL_REQUIRE(curve, "CurveParallelShift: curve is null");
    ext::shared_ptr<const Curve> result = curve;
    for (Size i = 0; i < curve->parameterCount(); ++i)
        result = result->withParameter(i, curve->parameter(i) + shift_);
    return result;
}

ext::shared_ptr<const Curve> CurvePointShift::operator()(const ext::shared_ptr<const Curve>& curve) const {
    QL_REQUIRE(curve, "CurvePointShift: curve is null");
    QL_REQUIRE(index_ < curve->parameterCount(), "CurvePointShift: index " << index_ << " out of range for curve "
                                                                           << curve->name() << " with "
                                                                           << curve->parameterCount()
                                                                           << " parameters");
    return curve->withParameter(index_, curve->parameter(index_) + shift_);
}

} // namespace ZeroRisk
