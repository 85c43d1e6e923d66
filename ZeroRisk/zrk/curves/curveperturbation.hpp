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

/*! \file zrk/curves/curveperturbation.hpp
    \brief Functions transforming a curve into a perturbed copy
    \ingroup curves
*/

#pragma once

#include <zrk/curves/curve.hpp>

#include <functional>

namespace ZeroRisk {

//! A perturbation maps a curve to a replacement curve, it must not modify its argument
typedef std::function<QuantLib::ext::shared_ptr<const Curve>(const QuantLib::ext::shared_ptr<const Curve>&)>
    CurvePerturbation;

//! Shifts every parameter of a curve by the same amount
/*! \ingroup curves */
class CurveParallelShift {
public:
    explicit CurveParallelShift(QuantLib::Real shift) : shift_(shift) {}
    QuantLib::ext::shared_ptr<const Curve> operator()(const QuantLib::ext::shared_ptr<const Curve>& curve) const;
    QuantLib::Real shift() const { return shift_; }

private:
    QuantLib::Real shift_;
};

//! Shifts a single parameter of a curve
/*! \ingroup curves */
class CurvePointShift {
public:
    CurvePointShift(QuantLib::Size index, QuantLib::Real shift) : index_(index), shift_(shift) {}
    QuantLib::ext::shared_ptr<const Curve> operator()(const QuantLib::ext::shared_ptr<const Curve>& curve) const;
    QuantLib::Size index() const { return index_; }
    QuantLib::Real shift() const { return shift_; }

private:
    QuantLib::Size index_;
    QuantLib::Real shift_;
};

} // namespace ZeroRisk
