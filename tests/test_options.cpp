// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#include <catch2/catch.hpp>

#include <drift/options.hpp>

#include <stdexcept>

namespace drift {
namespace test {

TEST_CASE( "integrator names are parsed case insensitively", "[options]" ) {
    REQUIRE( parse_integrator_type( "euler" ) == kEuler );
    REQUIRE( parse_integrator_type( "RK2" ) == kRK2 );
    REQUIRE( parse_integrator_type( "rk4" ) == kRK4 );
    REQUIRE( parse_integrator_type( " RKF45 " ) == kRKF45 );

    REQUIRE_THROWS_AS( parse_integrator_type( "rk3" ), std::invalid_argument );
    REQUIRE_THROWS_AS( parse_integrator_type( "" ), std::invalid_argument );
}

TEST_CASE( "interpolation and time policy names are parsed", "[options]" ) {
    REQUIRE( parse_interpolation_method( "Linear" ) == kLinear );
    REQUIRE( parse_interpolation_method( "bilinear" ) == kLinear );
    REQUIRE( parse_interpolation_method( "NEAREST" ) == kNearest );
    REQUIRE( parse_interpolation_method( "cubic" ) == kCubic );
    REQUIRE_THROWS_AS( parse_interpolation_method( "spline" ), std::invalid_argument );

    REQUIRE( parse_time_policy( "clamp" ) == kClampTime );
    REQUIRE( parse_time_policy( "Invalidate" ) == kInvalidateTime );
    REQUIRE_THROWS_AS( parse_time_policy( "extrapolate" ), std::invalid_argument );
}

TEST_CASE( "option names survive a round trip", "[options]" ) {
    const integrator_type types[] = { kEuler, kRK2, kRK4, kRKF45 };
    for( int i = 0; i < 4; ++i )
        REQUIRE( parse_integrator_type( to_string( types[i] ) ) == types[i] );

    const interpolation_method methods[] = { kLinear, kNearest, kCubic };
    for( int i = 0; i < 3; ++i )
        REQUIRE( parse_interpolation_method( to_string( methods[i] ) ) == methods[i] );

    REQUIRE( parse_time_policy( to_string( kInvalidateTime ) ) == kInvalidateTime );
}

TEST_CASE( "sampler options default to bilinear without extrapolation", "[options]" ) {
    sampler_options options;
    REQUIRE( options.method == kLinear );
    REQUIRE( options.extrapolation == kNoExtrapolation );

    sampler_options cubic( kCubic, kOneCellExtrapolation );
    REQUIRE( cubic.method == kCubic );
    REQUIRE( cubic.extrapolation == kOneCellExtrapolation );
}

} // namespace test
} // namespace drift
