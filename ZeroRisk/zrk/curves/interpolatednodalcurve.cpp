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

#include <zrk/curves/interpolatednodalcurve.hpp>

#include <ql/math/interpolations/backwardflatinterpolation.hpp>
#include <ql/math/interpolations/cubicinterpolation.hpp>
#include <ql/math/interpolations/forwardflatinterpolation.hpp>
#include <ql/math/interpolations/linearinterpolation.hpp>

#include <algorithm>

using namespace QuantLib;
using std::vector;

namespace ZeroRisk {

std::ostream& operator<<(std::ostream& out, const CurveInterpolator& interpolator) {
    switch (interpolator) {
    case CurveInterpolator::Linear:
        return out << "Linear";
    case CurveInterpolator::BackwardFlat:
        return out << "BackwardFlat";
    case CurveInterpolator::ForwardFlat:
        return out << "ForwardFlat";
    case CurveInterpolator::NaturalCubic:
        return out << "NaturalCubic";
    default:
        QL_FAIL("Unknown CurveInterpolator (" << static_cast<int>(interpolator) << ")");
    }
}

InterpolatedNodalCurve::InterpolatedNodalCurve(const CurveMetadata& metadata, const vector<Real>& xValues,
                                               const vector<Real>& yValues, CurveInterpolator interpolator)
    : metadata_(metadata), xValues_(xValues), yValues_(yValues), interpolator_(interpolator) {

    QL_REQUIRE(xValues_.size() >= 2, "InterpolatedNodalCurve " << metadata_.curveName()
                                                                << ": at least two nodes required, got "
                                                                << xValues_.size());
    QL_REQUIRE(xValues_.size() == yValues_.size(), "InterpolatedNodalCurve "
                                                       << metadata_.curveName() << ": number of x-values ("
                                                       << xValues_.size() << ") and y-values (" << yValues_.size()
                                                       << ") must match");
    for (Size i = 1; i < xValues_.size(); ++i) {
        QL_REQUIRE(xValues_[i] > xValues_[i - 1], "InterpolatedNodalCurve "
                                                      << metadata_.curveName()
                                                      << ": x-values must be strictly increasing, x[" << i - 1
                                                      << "] = " << xValues_[i - 1] << ", x[" << i
                                                      << "] = " << xValues_[i]);
    }

    interpolation_ = interpolate(yValues_);

    // the unit vectors must be complete before any interpolation refers to them
    Size n = yValues_.size();
    unitYValues_.assign(n, vector<Real>(n, 0.0));
    for (Size i = 0; i < n; ++i)
        unitYValues_[i][i] = 1.0;
    unitInterpolations_.reserve(n);
    for (Size i = 0; i < n; ++i)
        unitInterpolations_.push_back(interpolate(unitYValues_[i]));
}

Interpolation InterpolatedNodalCurve::interpolate(const vector<Real>& yValues) const {
    switch (interpolator_) {
    case CurveInterpolator::Linear:
        return LinearInterpolation(xValues_.begin(), xValues_.end(), yValues.begin());
    case CurveInterpolator::BackwardFlat:
        return BackwardFlatInterpolation(xValues_.begin(), xValues_.end(), yValues.begin());
    case CurveInterpolator::ForwardFlat:
        return ForwardFlatInterpolation(xValues_.begin(), xValues_.end(), yValues.begin());
    case CurveInterpolator::NaturalCubic:
        return CubicNaturalSpline(xValues_.begin(), xValues_.end(), yValues.begin());
    default:
        QL_FAIL("InterpolatedNodalCurve: unknown interpolator " << static_cast<int>(interpolator_));
    }
}

Real InterpolatedNodalCurve::flatExtrapolated(Real x) const {
    return std::min(std::max(x, xValues_.front()), xValues_.back());
}

Real InterpolatedNodalCurve::parameter(Size i) const {
    QL_REQUIRE(i < yValues_.size(), "InterpolatedNodalCurve " << metadata_.curveName() << ": parameter index " << i
                                                               << " out of range [0, " << yValues_.size() << ")");
    return yValues_[i];
}

ext::shared_ptr<Curve> InterpolatedNodalCurve::withParameter(Size i, Real value) const {
    QL_REQUIRE(i < yValues_.size(), "InterpolatedNodalCurve " << metadata_.curveName() << ": parameter index " << i
                                                               << " out of range [0, " << yValues_.size() << ")");
    vector<Real> yValues = yValues_;
    yValues[i] = value;
    return withYValues(yValues);
}

Real InterpolatedNodalCurve::yValue(Real x) const { return interpolation_(flatExtrapolated(x), true); }

Array InterpolatedNodalCurve::yValueParameterSensitivity(Real x) const {
    Real xc = flatExtrapolated(x);
    Array result(unitInterpolations_.size());
    for (Size i = 0; i < unitInterpolations_.size(); ++i)
        result[i] = unitInterpolations_[i](xc, true);
    return result;
}

ext::shared_ptr<InterpolatedNodalCurve> InterpolatedNodalCurve::withYValues(const vector<Real>& yValues) const {
    return ext::make_shared<InterpolatedNodalCurve>(metadata_, xValues_, yValues, interpolator_);
}

ext::shared_ptr<InterpolatedNodalCurve> InterpolatedNodalCurve::withMetadata(const CurveMetadata& metadata) const {
    return ext::make_shared<InterpolatedNodalCurve>(metadata, xValues_, yValues_, interpolator_);
}

} // namespace ZeroRisk
