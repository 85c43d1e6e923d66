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

/*! \file zrk/curves/curve.hpp
    \brief Curve interface
    \ingroup curves
*/

#pragma once

#include <zrk/curves/curvemetadata.hpp>

#include <ql/math/array.hpp>
#include <ql/shared_ptr.hpp>
#include <ql/types.hpp>

namespace ZeroRisk {

//! Curve
/*! An immutable function from an x-value to a y-value defined by a fixed number of parameters, typically the node
    values of an interpolated curve. The value types of both axes are given in the metadata.

    Besides the y-value itself, a curve provides the sensitivity of the y-value to each of its parameters.

    \ingroup curves
*/
class Curve {
public:
    virtual ~Curve() {}

    //! \name Inspectors
    //@{
    virtual const CurveMetadata& metadata() const = 0;
    const std::string& name() const { return metadata().curveName(); }
    //@}

    //! \name Parameters
    //@{
    virtual QuantLib::Size parameterCount() const = 0;
    virtual QuantLib::Real parameter(QuantLib::Size i) const = 0;
    //! Returns a copy of this curve with parameter \c i replaced by \c value
    virtual QuantLib::ext::shared_ptr<Curve> withParameter(QuantLib::Size i, QuantLib::Real value) const = 0;
    //@}

    //! \name Values
    //@{
    virtual QuantLib::Real yValue(QuantLib::Real x) const = 0;
    //! Partial derivatives of yValue(x) with respect to each parameter, of size parameterCount()
    virtual QuantLib::Array yValueParameterSensitivity(QuantLib::Real x) const = 0;
    //@}
};

} // namespace ZeroRisk
