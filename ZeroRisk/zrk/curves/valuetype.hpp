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

/*! \file zrk/curves/valuetype.hpp
    \brief Semantic type of the x- and y-values of a curve
    \ingroup curves
*/

#pragma once

#include <ostream>

namespace ZeroRisk {

//! Value type of a curve axis
/*! Used in the curve metadata to state what the x-values and y-values of a curve represent, so that consumers of
    a curve can check it is of the type they expect.
    \ingroup curves
*/
enum class ValueType { YearFraction, Months, ZeroRate, DiscountFactor, PriceIndex, Unknown };

std::ostream& operator<<(std::ostream& out, const ValueType& type);

} // namespace ZeroRisk
