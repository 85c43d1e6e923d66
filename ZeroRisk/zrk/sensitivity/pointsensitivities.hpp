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

/*! \file zrk/sensitivity/pointsensitivities.hpp
    \brief Collection of point sensitivities
    \ingroup sensitivity
*/

#pragma once

#include <zrk/sensitivity/zeroratesensitivity.hpp>

#include <vector>

namespace ZeroRisk {

//! Collection of zero rate point sensitivities
/*! The collection keeps the order in which sensitivities were added. Sensitivities sharing the same key are only
    merged by normalized().
    \ingroup sensitivity
*/
class PointSensitivities {
public:
    PointSensitivities() {}
    explicit PointSensitivities(const std::vector<ZeroRateSensitivity>& sensitivities)
        : sensitivities_(sensitivities) {}

    //! \name Inspectors
    //@{
    const std::vector<ZeroRateSensitivity>& sensitivities() const { return sensitivities_; }
    QuantLib::Size size() const { return sensitivities_.size(); }
    bool empty() const { return sensitivities_.empty(); }
    //@}

    PointSensitivities combinedWith(const ZeroRateSensitivity& sensitivity) const;
    PointSensitivities combinedWith(const PointSensitivities& other) const;
    PointSensitivities multipliedBy(QuantLib::Real factor) const;

    //! Sorts the sensitivities by key and sums up those with the same key
    PointSensitivities normalized() const;

private:
    std::vector<ZeroRateSensitivity> sensitivities_;
};

bool operator==(const PointSensitivities& lhs, const PointSensitivities& rhs);

std::ostream& operator<<(std::ostream& out, const PointSensitivities& s);

} // namespace ZeroRisk
