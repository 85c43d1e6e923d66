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

/*! \file zrk/configuration/zerocurveconfig.hpp
    \brief Serializable configuration of a single zero rate curve
    \ingroup configuration
*/

#pragma once

#include <zrk/curves/interpolatednodalcurve.hpp>
#include <zrk/utilities/xmlutils.hpp>

#include <ql/currency.hpp>
#include <ql/time/daycounter.hpp>

#include <string>
#include <vector>

namespace ZeroRisk {

//! Zero curve configuration
/*! Nodes of continuously compounded zero rates against year fractions, e.g.

    \code
    <ZeroCurve>
      <CurveId>GBP-SONIA</CurveId>
      <Currency>GBP</Currency>
      <DayCounter>A365F</DayCounter>
      <Interpolation>Linear</Interpolation>
      <Times>0.0,10.0</Times>
      <Rates>0.01,0.02</Rates>
    </ZeroCurve>
    \endcode

    The Interpolation node is optional and defaults to Linear.

    \ingroup configuration
*/
class ZeroCurveConfig : public XMLSerializable {
public:
    //! Default constructor, the members are populated by fromXML()
    ZeroCurveConfig() {}
    //! Detailed constructor, throws ConfigurationError if the nodes or the text fields are invalid
    ZeroCurveConfig(const std::string& curveId, const std::string& currency, const std::string& dayCounter,
                    const std::vector<QuantLib::Real>& times, const std::vector<QuantLib::Real>& rates,
                    const std::string& interpolation = "Linear");

    //! \name XMLSerializable interface
    //@{
    void fromXML(XMLNode* node) override;
    XMLNode* toXML(XMLDocument& doc) const override;
    //@}

    //! \name Inspectors
    //@{
    const std::string& curveId() const { return curveId_; }
    const std::string& currencyCode() const { return currency_; }
    const std::string& dayCounterName() const { return dayCounter_; }
    const std::string& interpolationName() const { return interpolation_; }
    const std::vector<QuantLib::Real>& times() const { return times_; }
    const std::vector<QuantLib::Real>& rates() const { return rates_; }

    QuantLib::Currency currency() const;
    QuantLib::DayCounter dayCounter() const;
    CurveInterpolator interpolation() const;
    //@}

    //! Zero rate curve with year fraction x-values, named after the curve id
    QuantLib::ext::shared_ptr<InterpolatedNodalCurve> buildCurve() const;

private:
    void check() const;

    std::string curveId_;
    std::string currency_;
    std::string dayCounter_;
    std::string interpolation_;
    std::vector<QuantLib::Real> times_;
    std::vector<QuantLib::Real> rates_;
};

} // namespace ZeroRisk
