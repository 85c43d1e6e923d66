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

/*! \file zrk/curves/curves.hpp
    \brief Metadata factory functions for the standard curve types
    \ingroup curves
*/

#pragma once

#include <zrk/curves/curvemetadata.hpp>

namespace ZeroRisk {

//! Standard curve metadata
/*! \ingroup curves */
class Curves {
private:
    Curves();

public:
    //! Zero rates against year fractions measured with \c dayCounter
    static CurveMetadata zeroRates(const std::string& curveName, const QuantLib::DayCounter& dayCounter);
    //! Discount factors against year fractions measured with \c dayCounter
    static CurveMetadata discountFactors(const std::string& curveName, const QuantLib::DayCounter& dayCounter);
    //! Price index values against months
    static CurveMetadata prices(const std::string& curveName);
};

} // namespace ZeroRisk
