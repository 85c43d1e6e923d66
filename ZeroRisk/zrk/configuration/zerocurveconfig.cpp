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

#include <zrk/configuration/zerocurveconfig.hpp>
#include <zrk/curves/curves.hpp>
#include <zrk/errors.hpp>
#include <zrk/utilities/log.hpp>
#include <zrk/utilities/parsers.hpp>

using namespace QuantLib;
using std::string;
using std::vector;

namespace ZeroRisk {

ZeroCurveConfig::ZeroCurveConfig(const string& curveId, const string& currency, const string& dayCounter,
                                 const vector<Real>& times, const vector<Real>& rates, const string& interpolation)
    : curveId_(curveId), currency_(currency), dayCounter_(dayCounter), interpolation_(interpolation),
      times_(times), rates_(rates) {
    check();
}

void ZeroCurveConfig::fromXML(XMLNode* node) {
    XMLUtils::checkNode(node, "ZeroCurve");

    curveId_ = XMLUtils::getChildValue(node, "CurveId", true);
    currency_ = XMLUtils::getChildValue(node, "Currency", true);
    dayCounter_ = XMLUtils::getChildValue(node, "DayCounter", true);
    interpolation_ = XMLUtils::getChildValue(node, "Interpolation", false, "Linear");
    times_ = XMLUtils::getChildrenValuesAsDoublesCompact(node, "Times", true);
    rates_ = XMLUtils::getChildrenValuesAsDoublesCompact(node, "Rates", true);

    check();
}

XMLNode* ZeroCurveConfig::toXML(XMLDocument& doc) const {
    XMLNode* node = doc.allocNode("ZeroCurve");
    XMLUtils::addChild(doc, node, "CurveId", curveId_);
    XMLUtils::addChild(doc, node, "Currency", currency_);
    XMLUtils::addChild(doc, node, "DayCounter", dayCounter_);
    XMLUtils::addChild(doc, node, "Interpolation", interpolation_);
    XMLUtils::addChild(doc, node, "Times", times_);
    XMLUtils::addChild(doc, node, "Rates", rates_);
    return node;
}

Currency ZeroCurveConfig::currency() const { return parseCurrency(currency_); }

DayCounter ZeroCurveConfig::dayCounter() const { return parseDayCounter(dayCounter_); }

CurveInterpolator ZeroCurveConfig::interpolation() const { return parseCurveInterpolator(interpolation_); }

QuantLib::ext::shared_ptr<InterpolatedNodalCurve> ZeroCurveConfig::buildCurve() const {
    DLOG("Building zero curve " << curveId_ << " with " << times_.size() << " nodes");
    return QuantLib::ext::make_shared<InterpolatedNodalCurve>(Curves::zeroRates(curveId_, dayCounter()), times_,
                                                              rates_, interpolation());
}

void ZeroCurveConfig::check() const {
    ZRK_REQUIRE_CONFIG(!curveId_.empty(), "ZeroCurve: CurveId must not be empty");
    ZRK_REQUIRE_CONFIG(times_.size() == rates_.size(), "ZeroCurve " << curveId_ << ": number of Times ("
                                                                    << times_.size() << ") and Rates ("
                                                                    << rates_.size() << ") differ");
    ZRK_REQUIRE_CONFIG(times_.size() >= 2,
                       "ZeroCurve " << curveId_ << ": at least two nodes required, got " << times_.size());
    for (Size i = 1; i < times_.size(); ++i) {
        ZRK_REQUIRE_CONFIG(times_[i] > times_[i - 1], "ZeroCurve " << curveId_ << ": Times must be strictly increasing ("
                                                                   << times_[i - 1] << ", " << times_[i] << ")");
    }
    // the text fields are stored as given and parsed on demand, reject bad values here already
    try {
        parseCurrency(currency_);
        parseDayCounter(dayCounter_);
        parseCurveInterpolator(interpolation_);
    } catch (const std::exception& e) {
        ZRK_FAIL_CONFIG("ZeroCurve " << curveId_ << ": " << e.what());
    }
}

} // namespace ZeroRisk
