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

#include <zrk/sensitivity/curvecurrencyparametersensitivities.hpp>

#include <ql/errors.hpp>

using namespace QuantLib;
using std::string;
using std::vector;

namespace ZeroRisk {

CurveCurrencyParameterSensitivities::CurveCurrencyParameterSensitivities(
    const CurveCurrencyParameterSensitivity& sensitivity) {
    add(sensitivity);
}

void CurveCurrencyParameterSensitivities::add(const CurveCurrencyParameterSensitivity& sensitivity) {
    Key key(sensitivity.curveName(), sensitivity.currency().code());
    auto it = data_.find(key);
    if (it == data_.end())
        data_.insert(std::make_pair(key, sensitivity));
    else
        it->second = it->second.plus(sensitivity);
}

CurveCurrencyParameterSensitivities
CurveCurrencyParameterSensitivities::combinedWith(const CurveCurrencyParameterSensitivity& sensitivity) const {
    CurveCurrencyParameterSensitivities result(*this);
    result.add(sensitivity);
    return result;
}

CurveCurrencyParameterSensitivities
CurveCurrencyParameterSensitivities::combinedWith(const CurveCurrencyParameterSensitivities& other) const {
    CurveCurrencyParameterSensitivities result(*this);
    for (auto const& kv : other.data_)
        result.add(kv.second);
    return result;
}

CurveCurrencyParameterSensitivities CurveCurrencyParameterSensitivities::multipliedBy(Real factor) const {
    CurveCurrencyParameterSensitivities result;
    for (auto const& kv : data_)
        result.add(kv.second.multipliedBy(factor));
    return result;
}

bool CurveCurrencyParameterSensitivities::has(const string& curveName, const Currency& currency) const {
    return data_.find(Key(curveName, currency.code())) != data_.end();
}

const CurveCurrencyParameterSensitivity&
CurveCurrencyParameterSensitivities::sensitivity(const string& curveName, const Currency& currency) const {
    auto it = data_.find(Key(curveName, currency.code()));
    QL_REQUIRE(it != data_.end(), "CurveCurrencyParameterSensitivities: no sensitivity found for curve "
                                      << curveName << " and currency " << currency.code());
    return it->second;
}

vector<CurveCurrencyParameterSensitivity> CurveCurrencyParameterSensitivities::sensitivities() const {
    vector<CurveCurrencyParameterSensitivity> result;
    result.reserve(data_.size());
    for (auto const& kv : data_)
        result.push_back(kv.second);
    return result;
}

Real CurveCurrencyParameterSensitivities::total(const Currency& currency) const {
    Real sum = 0.0;
    for (auto const& kv : data_) {
        if (kv.second.currency() == currency)
            sum += kv.second.total();
    }
    return sum;
}

bool operator==(const CurveCurrencyParameterSensitivities& lhs, const CurveCurrencyParameterSensitivities& rhs) {
    return lhs.sensitivities() == rhs.sensitivities();
}

std::ostream& operator<<(std::ostream& out, const CurveCurrencyParameterSensitivities& s) {
    out << "CurveCurrencyParameterSensitivities[";
    vector<CurveCurrencyParameterSensitivity> sensitivities = s.sensitivities();
    for (Size i = 0; i < sensitivities.size(); ++i)
        out << (i == 0 ? "" : ", ") << sensitivities[i];
    return out << "]";
}

} // namespace ZeroRisk
