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

/*! \file zrk/curves/interpolatednodalcurve.hpp
    \brief Curve interpolated between a set of nodes
    \ingroup curves
*/

#pragma once

#include <zrk/curves/curve.hpp>

#include <ql/math/interpolation.hpp>

#include <vector>

namespace ZeroRisk {

//! Interpolation schemes supported by InterpolatedNodalCurve
/*! All of them are linear in the node values, which is what makes the node sensitivities exact. */
enum class CurveInterpolator { Linear, BackwardFlat, ForwardFlat, NaturalCubic };

std::ostream& operator<<(std::ostream& out, const CurveInterpolator& interpolator);

//! Interpolated nodal curve
/*! A curve defined by nodes \f$ (x_i, y_i) \f$ and an interpolator. The parameters of the curve are the node
    y-values. Outside the node range the curve is extrapolated flat.

    The sensitivity of the y-value to node \f$ j \f$ is obtained by interpolating the unit vector \f$ e_j \f$, which
    is exact because every supported interpolator is linear in the y-values.

    Instances hold QuantLib interpolations referring to their own node vectors and are therefore not copyable,
    share them through a pointer instead.

    \ingroup curves
*/
class InterpolatedNodalCurve : public Curve {
public:
    InterpolatedNodalCurve(const CurveMetadata& metadata, const std::vector<QuantLib::Real>& xValues,
                           const std::vector<QuantLib::Real>& yValues,
                           CurveInterpolator interpolator = CurveInterpolator::Linear);

    InterpolatedNodalCurve(const InterpolatedNodalCurve&) = delete;
    InterpolatedNodalCurve& operator=(const InterpolatedNodalCurve&) = delete;

    //! \name Curve interface
    //@{
    const CurveMetadata& metadata() const override { return metadata_; }
    QuantLib::Size parameterCount() const override { return yValues_.size(); }
    QuantLib::Real parameter(QuantLib::Size i) const override;
    QuantLib::ext::shared_ptr<Curve> withParameter(QuantLib::Size i, QuantLib::Real value) const override;
    QuantLib::Real yValue(QuantLib::Real x) const override;
    QuantLib::Array yValueParameterSensitivity(QuantLib::Real x) const override;
    //@}

    //! \name Inspectors
    //@{
    const std::vector<QuantLib::Real>& xValues() const { return xValues_; }
    const std::vector<QuantLib::Real>& yValues() const { return yValues_; }
    CurveInterpolator interpolator() const { return interpolator_; }
    //@}

    QuantLib::ext::shared_ptr<InterpolatedNodalCurve> withYValues(const std::vector<QuantLib::Real>& yValues) const;
    QuantLib::ext::shared_ptr<InterpolatedNodalCurve> withMetadata(const CurveMetadata& metadata) const;

private:
    QuantLib::Interpolation interpolate(const std::vector<QuantLib::Real>& yValues) const;
    QuantLib::Real flatExtrapolated(QuantLib::Real x) const;

    CurveMetadata metadata_;
    std::vector<QuantLib::Real> xValues_;
    std::vector<QuantLib::Real> yValues_;
    CurveInterpolator interpolator_;

    QuantLib::Interpolation interpolation_;
    std::vector<std::vector<QuantLib::Real>> unitYValues_;
    std::vector<QuantLib::Interpolation> unitInterpolations_;
};

} // namespace ZeroRisk
