// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#include "stdafx.h"

#include <drift/euler_advector.hpp>
#include <drift/rk2_advector.hpp>
#include <drift/rk4_advector.hpp>
#include <drift/rkf45_advector.hpp>

#include <boost/make_shared.hpp>

namespace drift {

namespace {

// Butcher tableau of the Fehlberg 4(5) pair.
const double g_rkf45Nodes[6] = { 0.0, 1.0 / 4.0, 3.0 / 8.0, 12.0 / 13.0, 1.0, 1.0 / 2.0 };

const double g_rkf45Coefficients[6][5] = {
    { 0.0, 0.0, 0.0, 0.0, 0.0 },
    { 1.0 / 4.0, 0.0, 0.0, 0.0, 0.0 },
    { 3.0 / 32.0, 9.0 / 32.0, 0.0, 0.0, 0.0 },
    { 1932.0 / 2197.0, -7200.0 / 2197.0, 7296.0 / 2197.0, 0.0, 0.0 },
    { 439.0 / 216.0, -8.0, 3680.0 / 513.0, -845.0 / 4104.0, 0.0 },
    { -8.0 / 27.0, 2.0, -3544.0 / 2565.0, 1859.0 / 4104.0, -11.0 / 40.0 } };

const double g_rkf45Weights4[6] = { 25.0 / 216.0, 0.0, 1408.0 / 2565.0, 2197.0 / 4104.0, -1.0 / 5.0, 0.0 };

const double g_rkf45Weights5[6] = { 16.0 / 135.0,      0.0,          6656.0 / 12825.0,
                                    28561.0 / 56430.0, -9.0 / 50.0, 2.0 / 55.0 };

vec2 weighted_sum( const double ( &weights )[6], const vec2 ( &stages )[6] ) {
    vec2 result( 0, 0 );
    for( int i = 0; i < 6; ++i )
        result += weights[i] * stages[i];
    return result;
}

} // namespace

bool rkf45_advector::evaluate_stages( const vec2& p, const vec2& v, double t, const field_interface& velocityField,
                                      double timeStep, vec2 ( &outStages )[6] ) const {
    outStages[0] = v;

    for( int i = 1; i < 6; ++i ) {
        vec2 delta( 0, 0 );
        for( int j = 0; j < i; ++j )
            delta += g_rkf45Coefficients[i][j] * outStages[j];

        field_sample stage = velocityField.evaluate_velocity( t + g_rkf45Nodes[i] * timeStep, p + timeStep * delta );
        if( !stage.valid )
            return false;

        outStages[i] = stage.velocity;
    }

    return true;
}

bool rkf45_advector::get_offset( const vec2& p, const vec2& v, double t, const field_interface& velocityField,
                                 double timeStep, vec2& outOffset ) const {
    vec2 stages[6];
    if( !evaluate_stages( p, v, t, velocityField, timeStep, stages ) )
        return false;

    outOffset = timeStep * weighted_sum( g_rkf45Weights4, stages );
    return true;
}

bool rkf45_advector::get_offset_pair( const vec2& p, const vec2& v, double t, const field_interface& velocityField,
                                      double timeStep, vec2& outOffset, vec2& outHigherOffset ) const {
    vec2 stages[6];
    if( !evaluate_stages( p, v, t, velocityField, timeStep, stages ) )
        return false;

    outOffset = timeStep * weighted_sum( g_rkf45Weights4, stages );
    outHigherOffset = timeStep * weighted_sum( g_rkf45Weights5, stages );
    return true;
}

advector_interface_ptr create_advector( integrator_type type ) {
    switch( type ) {
    case kEuler:
        return boost::make_shared<euler_advector>();
    case kRK2:
        return boost::make_shared<rk2_advector>();
    case kRK4:
        return boost::make_shared<rk4_advector>();
    case kRKF45:
        return boost::make_shared<rkf45_advector>();
    default:
        throw std::invalid_argument( "create_advector() - Invalid advection function" );
    }
}

} // namespace drift
