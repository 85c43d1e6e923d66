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

#include <zrk/curves/curves.hpp>
#include <zrk/curves/interpolatednodalcurve.hpp>

#include <ql/math/interpolations/linearinterpolation.hpp>
#include <ql/time/daycounters/actual365fixed.hpp>

using namespace ZeroRisk;
using namespace QuantLib;
using namespace boost::unit_test_framework;
using std::vector;

namespace {

CurveMetadata metadata() { return Curves::zeroRates("TestCurve", Actual365Fixed()); }

const vector<Real> xs{0.5, 1.0, 2.0, 5.0, 10.0};
const vector<Real> ys{0.010, 0.012, 0.015, 0.019, 0.022};

} // namespace

BOOST_FIXTURE_TEST_SUITE(ZeroRiskTestSuite, ZeroRisk::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(InterpolatedNodalCurveTest)

BOOST_AUTO_TEST_CASE(testLinearValues) {

    BOOST_TEST_MESSAGE("Testing values of a linearly interpolated curve");

    InterpolatedNodalCurve curve(metadata(), xs, ys);

    BOOST_CHECK(curve.interpolator() == CurveInterpolator::Linear);
    BOOST_CHECK_EQUAL(curve.parameterCount(), xs.size());
    BOOST_CHECK_EQUAL(curve.name(), "TestCurve");

    LinearInterpolation expected(xs.begin(), xs.end(), ys.begin());
    for (Real x : {0.5, 0.75, 1.0, 1.5, 3.3, 7.0, 10.0})
        BOOST_CHECK_CLOSE(curve.yValue(x), expected(x), 1.0e-12);

    for (Size i = 0; i < xs.size(); ++i) {
        BOOST_CHECK_CLOSE(curve.yValue(xs[i]), ys[i], 1.0e-12);
        BOOST_CHECK_EQUAL(curve.parameter(i), ys[i]);
    }
}

BOOST_AUTO_TEST_CASE(testFlatExtrapolation) {

    BOOST_TEST_MESSAGE("Testing flat extrapolation outside the nodes");

    for (CurveInterpolator interpolator : {CurveInterpolator::Linear, CurveInterpolator::BackwardFlat,
                                           CurveInterpolator::ForwardFlat, CurveInterpolator::NaturalCubic}) {
        InterpolatedNodalCurve curve(metadata(), xs, ys, interpolator);
        BOOST_CHECK_CLOSE(curve.yValue(0.0), ys.front(), 1.0e-12);
        BOOST_CHECK_CLOSE(curve.yValue(-1.0), ys.front(), 1.0e-12);
        BOOST_CHECK_CLOSE(curve.yValue(30.0), ys.back(), 1.0e-12);

        Array left = curve.yValueParameterSensitivity(-1.0);
        Array right = curve.yValueParameterSensitivity(30.0);
        for (Size i = 0; i < xs.size(); ++i) {
            BOOST_CHECK_SMALL(left[i] - (i == 0 ? 1.0 : 0.0), 1.0e-12);
            BOOST_CHECK_SMALL(right[i] - (i == xs.size() - 1 ? 1.0 : 0.0), 1.0e-12);
        }
    }
}

BOOST_AUTO_TEST_CASE(testParameterSensitivityAgainstBumps) {

    BOOST_TEST_MESSAGE("Testing node sensitivities against bumped curves");

    Real h = 1.0e-6;
    for (CurveInterpolator interpolator : {CurveInterpolator::Linear, CurveInterpolator::BackwardFlat,
                                           CurveInterpolator::ForwardFlat, CurveInterpolator::NaturalCubic}) {
        InterpolatedNodalCurve curve(metadata(), xs, ys, interpolator);
        for (Real x : {0.3, 0.8, 1.7, 4.2, 6.0, 9.9, 12.0}) {
            Array sens = curve.yValueParameterSensitivity(x);
            BOOST_REQUIRE_EQUAL(sens.size(), xs.size());
            for (Size i = 0; i < xs.size(); ++i) {
                Real up = curve.withParameter(i, ys[i] + h)->yValue(x);
                Real down = curve.withParameter(i, ys[i] - h)->yValue(x);
                BOOST_CHECK_SMALL(sens[i] - (up - down) / (2.0 * h), 1.0e-8);
            }
        }
    }
}

BOOST_AUTO_TEST_CASE(testLinearSensitivityWeights) {

    BOOST_TEST_MESSAGE("Testing node sensitivities of a linear curve are the interpolation weights");

    InterpolatedNodalCurve curve(metadata(), vector<Real>{0.0, 10.0}, vector<Real>{1.0, 2.0});
    Array sens = curve.yValueParameterSensitivity(2.5);
    BOOST_CHECK_CLOSE(sens[0], 0.75, 1.0e-12);
    BOOST_CHECK_CLOSE(sens[1], 0.25, 1.0e-12);
}

BOOST_AUTO_TEST_CASE(testModifiers) {

    BOOST_TEST_MESSAGE("Testing curves derived from an interpolated nodal curve");

    InterpolatedNodalCurve curve(metadata(), xs, ys, CurveInterpolator::NaturalCubic);

    vector<Real> ys2(ys.size(), 0.03);
    ext::shared_ptr<InterpolatedNodalCurve> flat = curve.withYValues(ys2);
    BOOST_CHECK(flat->interpolator() == CurveInterpolator::NaturalCubic);
    BOOST_CHECK(flat->metadata() == curve.metadata());
    BOOST_CHECK_CLOSE(flat->yValue(3.0), 0.03, 1.0e-12);
    // unchanged
    BOOST_CHECK_CLOSE(curve.yValue(xs[2]), ys[2], 1.0e-12);

    ext::shared_ptr<Curve> bumped = curve.withParameter(2, 0.1);
    BOOST_CHECK_EQUAL(bumped->parameter(2), 0.1);
    BOOST_CHECK_EQUAL(bumped->parameter(1), ys[1]);
    BOOST_CHECK_THROW(curve.withParameter(xs.size(), 0.1), QuantLib::Error);
    BOOST_CHECK_THROW(curve.parameter(xs.size()), QuantLib::Error);

    ext::shared_ptr<InterpolatedNodalCurve> renamed = curve.withMetadata(metadata().withCurveName("Other"));
    BOOST_CHECK_EQUAL(renamed->name(), "Other");
    BOOST_CHECK(renamed->yValues() == curve.yValues());
}

BOOST_AUTO_TEST_CASE(testInvalidNodes) {

    BOOST_TEST_MESSAGE("Testing that invalid nodes are rejected");

    BOOST_CHECK_THROW(InterpolatedNodalCurve(metadata(), vector<Real>{1.0}, vector<Real>{0.01}), QuantLib::Error);
    BOOST_CHECK_THROW(InterpolatedNodalCurve(metadata(), vector<Real>{1.0, 2.0}, vector<Real>{0.01}),
                      QuantLib::Error);
    BOOST_CHECK_THROW(InterpolatedNodalCurve(metadata(), vector<Real>{1.0, 1.0}, vector<Real>{0.01, 0.02}),
                      QuantLib::Error);
    BOOST_CHECK_THROW(InterpolatedNodalCurve(metadata(), vector<Real>{2.0, 1.0}, vector<Real>{0.01, 0.02}),
                      QuantLib::Error);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()
