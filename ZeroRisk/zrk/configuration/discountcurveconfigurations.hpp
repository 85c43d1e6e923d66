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

/*! \file zrk/configuration/discountcurveconfigurations.hpp
    \brief Repository of zero curve configurations, one per currency
    \ingroup configuration
*/

#pragma once

#include <zrk/configuration/zerocurveconfig.hpp>
#include <zrk/discounting/zeroratediscountfactors.hpp>
#include <zrk/utilities/xmlutils.hpp>

#include <ql/time/date.hpp>

#include <map>
#include <string>

namespace ZeroRisk {

//! Container class for the discount curve configurations
/*! Holds the valuation date and at most one ZeroCurveConfig per currency, read from

    \code
    <DiscountCurves>
      <ValuationDate>2015-06-04</ValuationDate>
      <ZeroCurve> ... </ZeroCurve>
      <ZeroCurve> ... </ZeroCurve>
    </DiscountCurves>
    \endcode

    \ingroup configuration
*/
class DiscountCurveConfigurations : public XMLSerializable {
public:
    //! Default constructor
    DiscountCurveConfigurations() {}
    DiscountCurveConfigurations(const QuantLib::Date& valuationDate) : valuationDate_(valuationDate) {}

    //! \name XMLSerializable interface
    //@{
    void fromXML(XMLNode* node) override;
    XMLNode* toXML(XMLDocument& doc) const override;
    //@}

    //! \name Setters and Getters
    //@{
    const QuantLib::Date& valuationDate() const { return valuationDate_; }
    void setValuationDate(const QuantLib::Date& d) { valuationDate_ = d; }

    //! Adds a configuration, throws ConfigurationError if its currency is already configured
    void add(const QuantLib::ext::shared_ptr<ZeroCurveConfig>& config);
    bool has(const std::string& currencyCode) const;
    const QuantLib::ext::shared_ptr<ZeroCurveConfig>& get(const std::string& currencyCode) const;
    const std::map<std::string, QuantLib::ext::shared_ptr<ZeroCurveConfig>>& configs() const { return configs_; }
    //@}

    //! Discount factors for \c currencyCode built from the configured curve and the valuation date
    ZeroRateDiscountFactors discountFactors(const std::string& currencyCode) const;

private:
    QuantLib::Date valuationDate_;
    std::map<std::string, QuantLib::ext::shared_ptr<ZeroCurveConfig>> configs_;
};

} // namespace ZeroRisk
