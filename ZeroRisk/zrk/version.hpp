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

/*! \file zrk/version.hpp
    \brief ZeroRisk version and minimum dependency versions
*/

#ifndef zerorisk_version_hpp
#define zerorisk_version_hpp

#include <boost/version.hpp>
#include <ql/version.hpp>

#if BOOST_VERSION < 107200
#error ZeroRisk requires Boost 1.72 or later
#endif

// QuantLib::ext::shared_ptr appeared in QuantLib 1.30
#if QL_HEX_VERSION < 0x013000f0
#error ZeroRisk requires QuantLib 1.30 or later
#endif

#define ZERORISK_VERSION_MAJOR 1
#define ZERORISK_VERSION_MINOR 0
#define ZERORISK_VERSION_PATCH 0

//! Version string, major.minor.patch
#define ZERORISK_VERSION "1.0.0"

//! Version number, major * 1000000 + minor * 1000 + patch
#define ZERORISK_VERSION_NUM                                                                                    \
    (ZERORISK_VERSION_MAJOR * 1000000 + ZERORISK_VERSION_MINOR * 1000 + ZERORISK_VERSION_PATCH)

#endif
