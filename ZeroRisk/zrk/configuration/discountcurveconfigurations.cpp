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

#include <zrk/configuration/discountcurveconfigurations.hpp>
#include <zrk/errors.hpp>
#include <zrk/utilities/log.hpp>
#include <zrk/utilities/parsers.hpp>

#include <ql/time/date.hpp>

#include <sstream>

using namespace QuantLib;
using std::string;

namespace ZeroRisk {

void DiscountCurveConfigurations::fromXML(XMLNode* node) {
    XMLUtils::checkNode(node, "DiscountCurves");

    configs_.clear();
    try {
        valuationDate_ = parseDate(XMLUtils::getChildValue(node, "ValuationDate", true));
        for (XMLNode* child : XMLUtils::getChildrenNodes(node, "ZeroCurve")) {
            QuantLib::ext::shared_ptr<ZeroCurveConfig> config = QuantLib::ext::make_shared<ZeroCurveConfig>();
            config->fromXML(child);
            add(config);
        }
    } catch (const std::exception& e) {
        ALOG("Failed to load discount curve configurations: " << e.what());
        throw;
    }
    LOG("Loaded " << configs_.size() << " discount curve configurations for valuation date "
                  << io::iso_date(valuationDate_));
}

XMLNode* DiscountCurveConfigurations::toXML(XMLDocument& doc) const {
    XMLNode* node = doc.allocNode("DiscountCurves");
    std::ostringstream date;
    date << io::iso_date(valuationDate_);
    XMLUtils::addChild(doc, node, "ValuationDate", date.str());
    for (auto const& kv : configs_)
        XMLUtils::appendNode(node, kv.second->toXML(doc));
    return node;
}

void DiscountCurveConfigurations::add(const QuantLib::ext::shared_ptr<ZeroCurveConfig>& config) {
    QL_REQUIRE(config, "DiscountCurveConfigurations: zero curve configuration is null");
    const string& ccy = config->currencyCode();
    ZRK_REQUIRE_CONFIG(configs_.find(ccy) == configs_.end(),
                       "Duplicate discount curve for currency " << ccy << " (" << configs_.at(ccy)->curveId()
                                                                << ", " << config->curveId() << ")");
    configs_[ccy] = config;
}

bool DiscountCurveConfigurations::has(const string& currencyCode) const {
    return configs_.find(currencyCode) != configs_.end();
}

const QuantLib::ext::shared_ptr<ZeroCurveConfig>& DiscountCurveConfigurations::get(const string& currencyCode) const {
    auto it = configs_.find(currencyCode);
    QL_REQUIRE(it != configs_.end(), "No discount curve configured for currency " << currencyCode);
    return it->second;
}

ZeroRateDiscountFactors DiscountCurveConfigurations::discountFactors(const string& currencyCode) const {
    const QuantLib::ext::shared_ptr<ZeroCurveConfig>& config = get(currencyCode);
    try {
        return ZeroRateDiscountFactors(config->currency(), valuationDate_, config->buildCurve());
    } catch (const std::exception& e) {
        ALOG("Failed to build discount factors for " << currencyCode << " from curve " << config->curveId() << ": "
                                                     << e.what());
        throw;
    }
}

} // namespace ZeroRisk
