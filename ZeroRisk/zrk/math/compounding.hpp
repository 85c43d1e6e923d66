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

/*! \file zrk/math/compounding.hpp
    \brief Conversions between continuously and periodically compounded rates
    \ingroup math
*/

#pragma once

#include <ql/types.hpp>

#include <ostream>

namespace ZeroRisk {

//! Compounding convention in which a rate spread is expressed
enum class CompoundedRateType { Continuous, Periodic };

std::ostream& operator<<(std::ostream& out, const CompoundedRateType& type);

/*! \addtogroup math
    @{
*/

/*! Rate \f$ r \f$ compounded \f$ n \f$ times per year equivalent to the discount factor \f$ df \f$ at time \f$ t \f$,
    \f[ r = n \left( df^{-1/(nt)} - 1 \right) \f]
    \c t must be non-zero.
*/
QuantLib::Real periodicRateFromDiscountFactor(QuantLib::Real discountFactor, QuantLib::Time t,
                                              QuantLib::Integer periodsPerYear);

//! Discount factor \f$ (1 + r/n)^{-nt} \f$ for a rate compounded \f$ n \f$ times per year
QuantLib::Real discountFactorFromPeriodicRate(QuantLib::Real rate, QuantLib::Time t,
                                              QuantLib::Integer periodsPerYear);

//! Derivative of discountFactorFromPeriodicRate with respect to the rate, \f$ -t (1 + r/n)^{-nt-1} \f$
QuantLib::Real discountFactorFromPeriodicRateDerivative(QuantLib::Real rate, QuantLib::Time t,
                                                        QuantLib::Integer periodsPerYear);

//! Periodically compounded rate \f$ n (e^{z/n} - 1) \f$ equivalent to the continuously compounded rate \f$ z \f$
QuantLib::Real periodicRateFromContinuousRate(QuantLib::Real continuousRate, QuantLib::Integer periodsPerYear);

//! Derivative of periodicRateFromContinuousRate with respect to the continuous rate, \f$ e^{z/n} \f$
QuantLib::Real periodicRateFromContinuousRateDerivative(QuantLib::Real continuousRate,
                                                        QuantLib::Integer periodsPerYear);

//! Continuously compounded rate \f$ n \ln(1 + r/n) \f$ equivalent to the periodically compounded rate \f$ r \f$
QuantLib::Real continuousRateFromPeriodicRate(QuantLib::Real periodicRate, QuantLib::Integer periodsPerYear);

//! @}

} // namespace ZeroRisk
