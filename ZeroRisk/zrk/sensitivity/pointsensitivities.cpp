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

#include <zrk/sensitivity/pointsensitivities.hpp>

#include <algorithm>

using namespace QuantLib;
using std::vector;

namespace ZeroRisk {

PointSensitivities PointSensitivities::combinedWith(const ZeroRateSensitivity& sensitivity) const {
    vector<ZeroRateSensitivity> result(sensitivities_);
    result.push_back(sensitivity);
    return PointSensitivities(result);
}

PointSensitivities PointSensitivities::combinedWith(const PointSensitivities& other) const {
    vector<ZeroRateSensitivity> result(sensitivities_);
    result.insert(result.end(), other.sensitivities_.begin(), other.sensitivities_.end());
    return PointSensitivities(result);
}

PointSensitivities PointSensitivities::multipliedBy(Real factor) const {
    vector<ZeroRateSensitivity> result;
    result.reserve(sensitivities_.size());
    for (auto const& s : sensitivities_)
        result.push_back(s.multipliedBy(factor));
    return PointSensitivities(result);
}

PointSensitivities PointSensitivities::normalized() const {
    vector<ZeroRateSensitivity> sorted(sensitivities_);
    std::stable_sort(sorted.begin(), sorted.end(), [](const ZeroRateSensitivity& a, const ZeroRateSensitivity& b) {
        return a.compareKey(b) < 0;
    });
    vector<ZeroRateSensitivity> result;
    for (auto const& s : sorted) {
        if (!result.empty() && result.back().compareKey(s) == 0)
            result.back() = result.back().withSensitivity(result.back().sensitivity() + s.sensitivity());
        else
            result.push_back(s);
    }
    return PointSensitivities(result);
}

bool operator==(const PointSensitivities& lhs, const PointSensitivities& rhs) {
    return lhs.sensitivities() == rhs.sensitivities();
}

std::ostream& operator<<(std::ostream& out, const PointSensitivities& s) {
    out << "PointSensitivities[";
    for (Size i = 0; i < s.size(); ++i)
        out << (i == 0 ? "" : ", ") << s.sensitivities()[i];
    return out << "]";
}

} // namespace ZeroRisk
