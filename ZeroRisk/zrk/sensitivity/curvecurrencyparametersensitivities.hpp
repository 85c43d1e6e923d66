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

/*! \file zrk/sensitivity/curvecurrencyparametersensitivities.hpp
    \brief Parameter sensitivities aggregated by curve and currency
    \ingroup sensitivity
*/

#pragma once

#include <zrk/sensitivity/curveparametersensitivity.hpp>

#include <map>
#include <vector>

namespace ZeroRisk {

//! Parameter sensitivities keyed by curve name and currency
/*! Adding a sensitivity for a (curve name, currency) pair that is already present accumulates it element-wise
    into the existing entry.
    \ingroup sensitivity
*/
class CurveCurrencyParameterSensitivities {
public:
    CurveCurrencyParameterSensitivities() {}
    explicit CurveCurrencyParameterSensitivities(const CurveCurrencyParameterSensitivity& sensitivity);

    //! Accumulates \c sensitivity into this collection
    void add(const CurveCurrencyParameterSensitivity& sensitivity);

    CurveCurrencyParameterSensitivities combinedWith(const CurveCurrencyParameterSensitivity& sensitivity) const;
    CurveCurrencyParameterSensitivities combinedWith(const CurveCurrencyParameterSensitivities& other) const;
    CurveCurrencyParameterSensitivities multipliedBy(QuantLib::Real factor) const;

    //! \name Inspectors
    //@{
    QuantLib::Size size() const { return data_.size(); }
    bool empty() const { return data_.empty(); }
    bool has(const std::string& curveName, const QuantLib::Currency& currency) const;
    //! Throws if there is no entry for the given curve and currency
    const CurveCurrencyParameterSensitivity& sensitivity(const std::string& curveName,
                                                         const QuantLib::Currency& currency) const;
    //! All entries, ordered by curve name and currency code
    std::vector<CurveCurrencyParameterSensitivity> sensitivities() const;
    //! Sum of all entries expressed in \c currency
    QuantLib::Real total(const QuantLib::Currency& currency) const;
    //@}

private:
    typedef std::pair<std::string, std::string> Key;
    std::map<Key, CurveCurrencyParameterSensitivity> data_;
};

bool operator==(const CurveCurrencyParameterSensitivities& lhs, const CurveCurrencyParameterSensitivities& rhs);

std::ostream& operator<<(std::ostream& out, const CurveCurrencyParameterSensitivities& s);

} // namespace ZeroRisk
