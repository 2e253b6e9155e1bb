// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#include <catch2/catch.hpp>

#include "test_helpers.hpp"

#include <drift/constant_velocity_field.hpp>
#include <drift/euler_advector.hpp>
#include <drift/rk2_advector.hpp>
#include <drift/rk4_advector.hpp>
#include <drift/rkf45_advector.hpp>

#include <cmath>

namespace drift {
namespace test {

namespace {

const integrator_type g_allIntegrators[] = { kEuler, kRK2, kRK4, kRKF45 };

// dx/dt = x, so x(t) = x0 * exp(t).
vector_velocity_field make_stretch_field() {
    const std::vector<double> axis = make_axis( -10.0, 10.0, 21 );
    return vector_velocity_field( boost::make_shared<vector_resolver>( make_vector_grid( axis, axis, &stretch_x ) ) );
}

} // namespace

TEST_CASE( "create_advector builds every scheme", "[advector]" ) {
    for( int i = 0; i < 4; ++i ) {
        advector_interface_ptr pAdvector = create_advector( g_allIntegrators[i] );
        REQUIRE( pAdvector );
        REQUIRE( pAdvector->get_type() == g_allIntegrators[i] );
        REQUIRE( pAdvector->has_error_estimate() == ( g_allIntegrators[i] == kRKF45 ) );
    }
}

TEST_CASE( "every scheme is exact on a uniform field", "[advector]" ) {
    constant_velocity_field field( vec2( 0.75, -0.25 ) );
    const vec2 p( 1.0, 2.0 );
    const vec2 v = field.evaluate_velocity( 0.0, p ).velocity;

    for( int i = 0; i < 4; ++i ) {
        advector_interface_ptr pAdvector = create_advector( g_allIntegrators[i] );

        vec2 result;
        REQUIRE( pAdvector->advect_particle( p, v, 0.0, field, 2.0, result ) );
        REQUIRE( result.x == Approx( 2.5 ) );
        REQUIRE( result.y == Approx( 1.5 ) );

        REQUIRE( pAdvector->advect_particle( p, v, 0.0, field, -2.0, result ) );
        REQUIRE( result.x == Approx( -0.5 ) );
        REQUIRE( result.y == Approx( 2.5 ) );
    }
}

TEST_CASE( "higher order schemes are more accurate", "[advector]" ) {
    vector_velocity_field field = make_stretch_field();

    const vec2 p( 1.0, 0.0 );
    const vec2 v = field.evaluate_velocity( 0.0, p ).velocity;
    const double dt = 0.1;
    const double exact = std::exp( dt );

    double errors[4];
    for( int i = 0; i < 4; ++i ) {
        vec2 result;
        REQUIRE( create_advector( g_allIntegrators[i] )->advect_particle( p, v, 0.0, field, dt, result ) );
        errors[i] = std::abs( result.x - exact );
        REQUIRE( result.y == 0.0 );
    }

    REQUIRE( errors[0] == Approx( exact - 1.1 ) );
    REQUIRE( errors[1] < errors[0] );
    REQUIRE( errors[2] < errors[1] );
    REQUIRE( errors[2] < 1e-6 );
    REQUIRE( errors[3] < 1e-6 );
}

TEST_CASE( "the rkf45 error estimate tracks the step error", "[advector]" ) {
    vector_velocity_field field = make_stretch_field();
    rkf45_advector advector;

    const vec2 p( 1.0, 0.0 );
    const vec2 v = field.evaluate_velocity( 0.0, p ).velocity;

    vec2 lower, higher;
    REQUIRE( advector.get_offset_pair( p, v, 0.0, field, 0.5, lower, higher ) );

    const double exact = std::exp( 0.5 ) - 1.0;
    REQUIRE( std::abs( higher.x - exact ) < std::abs( lower.x - exact ) );
    REQUIRE( std::abs( higher.x - lower.x ) > 0.0 );

    vec2 offset;
    REQUIRE( advector.get_offset( p, v, 0.0, field, 0.5, offset ) );
    REQUIRE( offset.x == lower.x );
}

TEST_CASE( "schemes without an estimate return the same offset twice", "[advector]" ) {
    constant_velocity_field field( vec2( 1.0, 1.0 ) );
    rk4_advector advector;

    vec2 lower, higher;
    REQUIRE( advector.get_offset_pair( vec2( 0.0, 0.0 ), vec2( 1.0, 1.0 ), 0.0, field, 1.0, lower, higher ) );
    REQUIRE( lower == higher );
}

TEST_CASE( "a scheme fails if any stage leaves the field", "[advector]" ) {
    constant_velocity_field field( vec2( 1.0, 0.0 ), bounds2( 0.0, 1.0, 0.0, 1.0 ) );
    const vec2 p( 0.9, 0.5 );
    const vec2 v( 1.0, 0.0 );

    // Euler never samples past the start, every other scheme samples outside of the box.
    vec2 result( -1.0, -1.0 );
    REQUIRE( euler_advector().advect_particle( p, v, 0.0, field, 0.5, result ) );
    REQUIRE( result.x == Approx( 1.4 ) );

    for( int i = 1; i < 4; ++i ) {
        vec2 untouched( -1.0, -1.0 );
        REQUIRE_FALSE( create_advector( g_allIntegrators[i] )->advect_particle( p, v, 0.0, field, 0.5, untouched ) );
        REQUIRE( untouched == vec2( -1.0, -1.0 ) );
    }
}

TEST_CASE( "stages are evaluated at their intermediate times", "[advector]" ) {
    const std::vector<double> axis = make_axis( -100.0, 100.0, 3 );

    // u(t) = t, so the exact displacement over [0, 2] is 2.
    std::vector<time_slice<vec2> > slices;
    slices.push_back( time_slice<vec2>( 0.0, make_constant_grid( axis, axis, vec2( 0.0, 0.0 ) ) ) );
    slices.push_back( time_slice<vec2>( 10.0, make_constant_grid( axis, axis, vec2( 10.0, 0.0 ) ) ) );

    vector_velocity_field field( boost::make_shared<vector_resolver>( slices ) );

    const vec2 p( 0.0, 0.0 );
    const vec2 v = field.evaluate_velocity( 0.0, p ).velocity;

    vec2 result;
    REQUIRE( rk2_advector().advect_particle( p, v, 0.0, field, 2.0, result ) );
    REQUIRE( result.x == Approx( 2.0 ) );

    REQUIRE( rk4_advector().advect_particle( p, v, 0.0, field, 2.0, result ) );
    REQUIRE( result.x == Approx( 2.0 ) );

    REQUIRE( rkf45_advector().advect_particle( p, v, 0.0, field, 2.0, result ) );
    REQUIRE( result.x == Approx( 2.0 ) );

    REQUIRE( euler_advector().advect_particle( p, v, 0.0, field, 2.0, result ) );
    REQUIRE( result.x == 0.0 );
}

} // namespace test
} // namespace drift
