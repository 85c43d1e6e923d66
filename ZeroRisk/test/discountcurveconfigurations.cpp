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

#include "toplevelfixture.hpp"
#include <boost/test/unit_test.hpp>

#include <zrk/configuration/discountcurveconfigurations.hpp>
#include <zrk/errors.hpp>
#include <zrk/utilities/log.hpp>

#include <ql/currencies/europe.hpp>
#include <ql/time/daycounters/actual360.hpp>
#include <ql/time/daycounters/actual365fixed.hpp>

#include <boost/algorithm/string/predicate.hpp>

#include <cmath>
#include <cstdio>
#include <fstream>

using namespace ZeroRisk;
using namespace QuantLib;
using namespace boost::unit_test_framework;
using std::string;
using std::vector;

namespace {

string zeroCurveXml(const string& curveId, const string& ccy, const string& dayCounter, const string& times,
                    const string& rates) {
    return "<ZeroCurve>"
           "<CurveId>" + curveId + "</CurveId>"
           "<Currency>" + ccy + "</Currency>"
           "<DayCounter>" + dayCounter + "</DayCounter>"
           "<Interpolation>Linear</Interpolation>"
           "<Times>" + times + "</Times>"
           "<Rates>" + rates + "</Rates>"
           "</ZeroCurve>";
}

string discountCurvesXml(const string& curves) {
    return "<DiscountCurves><ValuationDate>2015-06-04</ValuationDate>" + curves + "</DiscountCurves>";
}

void writeFile(const string& fileName, const string& contents) {
    std::ofstream ofs(fileName.c_str());
    BOOST_REQUIRE(ofs.is_open());
    ofs << contents;
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(ZeroRiskTestSuite, ZeroRisk::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(DiscountCurveConfigurationsTest)

BOOST_AUTO_TEST_CASE(testFromXml) {

    BOOST_TEST_MESSAGE("Testing loading discount curve configurations from XML");

    DiscountCurveConfigurations configs;
    configs.fromXMLString(discountCurvesXml(zeroCurveXml("GBP-SONIA", "GBP", "A365F", "0.0,10.0", "0.01,0.02") +
                                            zeroCurveXml("EUR-ESTR", "EUR", "A360", "0.5, 1, 5", "0.02, 0.025, 0.03")));

    BOOST_CHECK_EQUAL(configs.valuationDate(), Date(4, June, 2015));
    BOOST_CHECK_EQUAL(configs.configs().size(), 2);
    BOOST_REQUIRE(configs.has("GBP"));
    BOOST_REQUIRE(configs.has("EUR"));
    BOOST_CHECK(!configs.has("USD"));
    BOOST_CHECK_THROW(configs.get("USD"), QuantLib::Error);

    const ext::shared_ptr<ZeroCurveConfig>& eur = configs.get("EUR");
    BOOST_CHECK_EQUAL(eur->curveId(), "EUR-ESTR");
    BOOST_CHECK_EQUAL(eur->currency(), EURCurrency());
    BOOST_CHECK(eur->dayCounter() == Actual360());
    BOOST_CHECK(eur->interpolation() == CurveInterpolator::Linear);
    BOOST_CHECK(eur->times() == (vector<Real>{0.5, 1.0, 5.0}));
    BOOST_CHECK(eur->rates() == (vector<Real>{0.02, 0.025, 0.03}));
}

BOOST_AUTO_TEST_CASE(testDiscountFactorsFromConfiguration) {

    BOOST_TEST_MESSAGE("Testing discount factors built from a configuration");

    DiscountCurveConfigurations configs;
    configs.fromXMLString(discountCurvesXml(zeroCurveXml("TestCurve", "GBP", "A365F", "0,10", "1,2")));

    ZeroRateDiscountFactors dfs = configs.discountFactors("GBP");
    BOOST_CHECK_EQUAL(dfs.currency(), GBPCurrency());
    BOOST_CHECK_EQUAL(dfs.valuationDate(), Date(4, June, 2015));
    BOOST_CHECK_EQUAL(dfs.curveName(), "TestCurve");
    BOOST_CHECK_EQUAL(dfs.parameterCount(), 2);
    BOOST_CHECK(dfs.dayCounter() == Actual365Fixed());

    Date d(30, July, 2015);
    Time t = 56.0 / 365.0;
    BOOST_CHECK_CLOSE(dfs.discountFactor(d), std::exp(-(1.0 + 0.1 * t) * t), 1.0e-10);

    BOOST_CHECK_THROW(configs.discountFactors("EUR"), QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testRoundTrip) {

    BOOST_TEST_MESSAGE("Testing discount curve configurations survive writing to and reading from XML");

    DiscountCurveConfigurations configs(Date(4, June, 2015));
    configs.add(ext::make_shared<ZeroCurveConfig>("GBP-SONIA", "GBP", "A365F", vector<Real>{0.25, 1.0, 10.0},
                                                  vector<Real>{0.0123, 0.0145, 0.02}, "NaturalCubic"));
    configs.add(ext::make_shared<ZeroCurveConfig>("EUR-ESTR", "EUR", "A360", vector<Real>{0.5, 2.0},
                                                  vector<Real>{-0.001, 0.0025}));

    string xml = configs.toXMLString();
    BOOST_TEST_MESSAGE(xml);

    DiscountCurveConfigurations read;
    read.fromXMLString(xml);
    BOOST_CHECK_EQUAL(read.valuationDate(), configs.valuationDate());
    BOOST_REQUIRE_EQUAL(read.configs().size(), configs.configs().size());
    for (auto const& kv : configs.configs()) {
        BOOST_REQUIRE(read.has(kv.first));
        const ext::shared_ptr<ZeroCurveConfig>& c = read.get(kv.first);
        BOOST_CHECK_EQUAL(c->curveId(), kv.second->curveId());
        BOOST_CHECK_EQUAL(c->currencyCode(), kv.second->currencyCode());
        BOOST_CHECK_EQUAL(c->dayCounterName(), kv.second->dayCounterName());
        BOOST_CHECK_EQUAL(c->interpolationName(), kv.second->interpolationName());
        BOOST_CHECK(c->times() == kv.second->times());
        BOOST_CHECK(c->rates() == kv.second->rates());
    }

    // and through a file
    string fileName = "zerorisk_discountcurves_test.xml";
    configs.toFile(fileName);
    DiscountCurveConfigurations fromFile;
    fromFile.fromFile(fileName);
    std::remove(fileName.c_str());
    BOOST_CHECK_EQUAL(fromFile.configs().size(), 2);
    BOOST_CHECK(fromFile.get("GBP")->interpolation() == CurveInterpolator::NaturalCubic);
}

BOOST_AUTO_TEST_CASE(testDuplicateCurrency) {

    BOOST_TEST_MESSAGE("Testing that two curves for the same currency are rejected");

    DiscountCurveConfigurations configs;
    BOOST_CHECK_THROW(configs.fromXMLString(discountCurvesXml(
                          zeroCurveXml("GBP-SONIA", "GBP", "A365F", "0,10", "0.01,0.02") +
                          zeroCurveXml("GBP-LIBOR", "GBP", "A365F", "0,10", "0.015,0.025"))),
                      ConfigurationError);

    DiscountCurveConfigurations direct;
    direct.add(ext::make_shared<ZeroCurveConfig>("GBP-SONIA", "GBP", "A365F", vector<Real>{0.0, 10.0},
                                                 vector<Real>{0.01, 0.02}));
    BOOST_CHECK_THROW(direct.add(ext::make_shared<ZeroCurveConfig>("GBP-LIBOR", "GBP", "A365F",
                                                                   vector<Real>{0.0, 10.0}, vector<Real>{0.01, 0.02})),
                      ConfigurationError);
}

BOOST_AUTO_TEST_CASE(testInvalidCurves) {

    BOOST_TEST_MESSAGE("Testing that invalid zero curve configurations are rejected");

    DiscountCurveConfigurations configs;
    // unknown day counter, currency and interpolation
    BOOST_CHECK_THROW(configs.fromXMLString(discountCurvesXml(zeroCurveXml("C", "GBP", "A366", "0,10", "0.01,0.02"))),
                      ConfigurationError);
    BOOST_CHECK_THROW(configs.fromXMLString(discountCurvesXml(zeroCurveXml("C", "XXX", "A365F", "0,10", "0.01,0.02"))),
                      ConfigurationError);
    BOOST_CHECK_THROW(ZeroCurveConfig("C", "GBP", "A365F", vector<Real>{0.0, 10.0}, vector<Real>{0.01, 0.02}, "Spline"),
                      ConfigurationError);
    // inconsistent nodes
    BOOST_CHECK_THROW(configs.fromXMLString(discountCurvesXml(zeroCurveXml("C", "GBP", "A365F", "0,10", "0.01"))),
                      ConfigurationError);
    BOOST_CHECK_THROW(configs.fromXMLString(discountCurvesXml(zeroCurveXml("C", "GBP", "A365F", "10,0", "0.01,0.02"))),
                      ConfigurationError);
    BOOST_CHECK_THROW(configs.fromXMLString(discountCurvesXml(zeroCurveXml("C", "GBP", "A365F", "1", "0.01"))),
                      ConfigurationError);
    // malformed input
    BOOST_CHECK_THROW(configs.fromXMLString(discountCurvesXml(zeroCurveXml("C", "GBP", "A365F", "0,x", "0.01,0.02"))),
                      QuantLib::Error);
    BOOST_CHECK_THROW(configs.fromXMLString("<DiscountCurves><ZeroCurve>"), QuantLib::Error);
    BOOST_CHECK_THROW(configs.fromXMLString("<YieldCurves/>"), QuantLib::Error);
    BOOST_CHECK_THROW(configs.fromXMLString("<DiscountCurves></DiscountCurves>"), QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testCDataValues) {

    BOOST_TEST_MESSAGE("Testing values given as CDATA sections");

    DiscountCurveConfigurations configs;
    configs.fromXMLString(discountCurvesXml("<ZeroCurve>"
                                            "<CurveId><![CDATA[GBP-SONIA]]></CurveId>"
                                            "<Currency>GBP</Currency>"
                                            "<DayCounter>A365F</DayCounter>"
                                            "<Times>0,10</Times>"
                                            "<Rates>0.01,0.02</Rates>"
                                            "</ZeroCurve>"));
    BOOST_REQUIRE(configs.has("GBP"));
    BOOST_CHECK_EQUAL(configs.get("GBP")->curveId(), "GBP-SONIA");
    BOOST_CHECK_EQUAL(configs.get("GBP")->interpolationName(), "Linear");
}

BOOST_AUTO_TEST_CASE(testUnreadableFiles) {

    BOOST_TEST_MESSAGE("Testing loading discount curve configurations from missing, empty and malformed files");

    DiscountCurveConfigurations configs;
    BOOST_CHECK_THROW(configs.fromFile("zerorisk_no_such_discountcurves.xml"), QuantLib::Error);
    // a directory can be opened as a stream but not read
    BOOST_CHECK_THROW(configs.fromFile("."), QuantLib::Error);

    string emptyFile = "zerorisk_empty_discountcurves.xml";
    writeFile(emptyFile, "");
    BOOST_CHECK_THROW(configs.fromFile(emptyFile), QuantLib::Error);
    std::remove(emptyFile.c_str());

    string truncatedFile = "zerorisk_truncated_discountcurves.xml";
    writeFile(truncatedFile, "<DiscountCurves><ValuationDate>2015-06-04</ValuationDate><ZeroCurve>");
    BOOST_CHECK_THROW(configs.fromFile(truncatedFile), QuantLib::Error);
    std::remove(truncatedFile.c_str());

    // a good file still loads afterwards
    string goodFile = "zerorisk_good_discountcurves.xml";
    writeFile(goodFile, discountCurvesXml(zeroCurveXml("GBP-SONIA", "GBP", "A365F", "0,10", "0.01,0.02")));
    configs.fromFile(goodFile);
    std::remove(goodFile.c_str());
    BOOST_CHECK(configs.has("GBP"));
}

BOOST_AUTO_TEST_CASE(testFailuresAreLogged) {

    BOOST_TEST_MESSAGE("Testing that configuration failures are logged as alerts");

    QuantLib::ext::shared_ptr<BufferLogger> logger = QuantLib::ext::make_shared<BufferLogger>(ZRK_ALERT);
    Log::instance().registerLogger(logger);
    Log::instance().switchOn();
    Log::instance().setMask(255);

    DiscountCurveConfigurations configs;
    BOOST_CHECK_THROW(configs.fromXMLString(discountCurvesXml(zeroCurveXml("C", "GBP", "A366", "0,10", "0.01,0.02"))),
                      ConfigurationError);

    BOOST_REQUIRE(logger->hasNext());
    string msg = logger->next();
    BOOST_CHECK(boost::starts_with(msg, "ALERT"));
    BOOST_CHECK(msg.find("A366") != string::npos);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
