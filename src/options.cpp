// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#include "stdafx.h"

#include <drift/options.hpp>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <stdexcept>

namespace drift {

interpolation_method parse_interpolation_method( const std::string& name ) {
    const std::string trimmed = boost::algorithm::trim_copy( name );

    if( boost::algorithm::iequals( trimmed, "linear" ) || boost::algorithm::iequals( trimmed, "bilinear" ) )
        return kLinear;
    if( boost::algorithm::iequals( trimmed, "nearest" ) )
        return kNearest;
    if( boost::algorithm::iequals( trimmed, "cubic" ) || boost::algorithm::iequals( trimmed, "bicubic" ) )
        return kCubic;

    throw std::invalid_argument( "parse_interpolation_method() - Invalid interpolation method \"" + name + "\"" );
}

time_policy parse_time_policy( const std::string& name ) {
    const std::string trimmed = boost::algorithm::trim_copy( name );

    if( boost::algorithm::iequals( trimmed, "clamp" ) )
        return kClampTime;
    if( boost::algorithm::iequals( trimmed, "invalidate" ) )
        return kInvalidateTime;

    throw std::invalid_argument( "parse_time_policy() - Invalid time policy \"" + name + "\"" );
}

integrator_type parse_integrator_type( const std::string& name ) {
    const std::string trimmed = boost::algorithm::trim_copy( name );

    if( boost::algorithm::iequals( trimmed, "euler" ) )
        return kEuler;
    if( boost::algorithm::iequals( trimmed, "rk2" ) )
        return kRK2;
    if( boost::algorithm::iequals( trimmed, "rk4" ) )
        return kRK4;
    if( boost::algorithm::iequals( trimmed, "rkf45" ) )
        return kRKF45;

    throw std::invalid_argument( "parse_integrator_type() - Invalid advection function \"" + name + "\"" );
}

std::string to_string( interpolation_method method ) {
    switch( method ) {
    case kLinear:
        return "linear";
    case kNearest:
        return "nearest";
    case kCubic:
        return "cubic";
    default:
        return "unknown";
    }
}

std::string to_string( time_policy policy ) {
    switch( policy ) {
    case kClampTime:
        return "clamp";
    case kInvalidateTime:
        return "invalidate";
    default:
        return "unknown";
    }
}

std::string to_string( integrator_type type ) {
    switch( type ) {
    case kEuler:
        return "euler";
    case kRK2:
        return "RK2";
    case kRK4:
        return "RK4";
    case kRKF45:
        return "RKF45";
    default:
        return "unknown";
    }
}

} // namespace drift
