// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#include <catch2/catch.hpp>

#include "test_helpers.hpp"

#include <drift/grid_sampler.hpp>

#include <cmath>
#include <limits>
#include <stdexcept>

namespace drift {
namespace test {

namespace {

const double g_nan = std::numeric_limits<double>::quiet_NaN();

double wavy( double x, double y ) { return std::sin( 1.3 * x ) + 0.37 * y * y - 0.1 * x * y; }

double cubic_poly( double x, double y ) { return x * x * x - 2.0 * x + 0.5 * y * y * y + y; }

} // namespace

TEST_CASE( "grid construction rejects malformed axes and shapes", "[grid]" ) {
    const std::vector<double> good = make_axis( 0.0, 2.0, 3 );

    SECTION( "too few coordinates" ) {
        const std::vector<double> single( 1, 0.0 );
        REQUIRE_THROWS_AS( scalar_grid( single, good, std::vector<double>( 3, 0.0 ) ), std::invalid_argument );
    }

    SECTION( "non monotonic axis" ) {
        const double coords[] = { 0.0, 2.0, 1.0 };
        REQUIRE_THROWS_AS( scalar_grid( make_axis( coords, 3 ), good, std::vector<double>( 9, 0.0 ) ),
                           std::invalid_argument );
    }

    SECTION( "repeated coordinate" ) {
        const double coords[] = { 0.0, 1.0, 1.0 };
        REQUIRE_THROWS_AS( scalar_grid( good, make_axis( coords, 3 ), std::vector<double>( 9, 0.0 ) ),
                           std::invalid_argument );
    }

    SECTION( "non finite coordinate" ) {
        const double coords[] = { 0.0, g_nan, 2.0 };
        REQUIRE_THROWS_AS( scalar_grid( make_axis( coords, 3 ), good, std::vector<double>( 9, 0.0 ) ),
                           std::invalid_argument );
    }

    SECTION( "shape mismatch" ) {
        REQUIRE_THROWS_AS( scalar_grid( good, good, std::vector<double>( 8, 0.0 ) ), std::invalid_argument );
    }

    SECTION( "descending axes are accepted" ) {
        const double coords[] = { 2.0, 1.0, 0.0 };
        scalar_grid g( good, make_axis( coords, 3 ), std::vector<double>( 9, 1.0 ) );
        REQUIRE( g.get_size( 1 ) == 3 );

        bounds2 b = g.get_bounds();
        REQUIRE( b.ymin == 0.0 );
        REQUIRE( b.ymax == 2.0 );
    }
}

TEST_CASE( "locate_cell finds the enclosing cell", "[grid]" ) {
    const double coords[] = { 0.0, 1.0, 3.0, 6.0 };
    const std::vector<double> axis = make_axis( coords, 4 );

    std::size_t i;
    double alpha;

    REQUIRE( locate_cell( axis, 2.0, false, i, alpha ) );
    REQUIRE( i == 1 );
    REQUIRE( alpha == Approx( 0.5 ) );

    REQUIRE( locate_cell( axis, 6.0, false, i, alpha ) );
    REQUIRE( i == 2 );
    REQUIRE( alpha == 1.0 );

    REQUIRE( locate_cell( axis, 0.0, false, i, alpha ) );
    REQUIRE( i == 0 );
    REQUIRE( alpha == 0.0 );

    REQUIRE_FALSE( locate_cell( axis, -0.5, false, i, alpha ) );
    REQUIRE_FALSE( locate_cell( axis, 6.5, false, i, alpha ) );
    REQUIRE_FALSE( locate_cell( axis, g_nan, true, i, alpha ) );

    REQUIRE( locate_cell( axis, -0.5, true, i, alpha ) );
    REQUIRE( i == 0 );
    REQUIRE( alpha == Approx( -0.5 ) );

    REQUIRE( locate_cell( axis, 7.5, true, i, alpha ) );
    REQUIRE( i == 2 );
    REQUIRE( alpha == Approx( 1.5 ) );

    REQUIRE_FALSE( locate_cell( axis, 9.5, true, i, alpha ) );

    const double descending[] = { 6.0, 3.0, 1.0, 0.0 };
    REQUIRE( locate_cell( make_axis( descending, 4 ), 2.0, false, i, alpha ) );
    REQUIRE( i == 1 );
    REQUIRE( alpha == Approx( 0.5 ) );
}

TEST_CASE( "samples on mesh nodes are exact for every method", "[grid]" ) {
    const double xCoords[] = { -1.0, 0.5, 1.75, 4.0, 4.5 };
    const double yCoords[] = { 10.0, 8.0, 7.5, 3.0, 0.0 };
    const std::vector<double> xs = make_axis( xCoords, 5 );
    const std::vector<double> ys = make_axis( yCoords, 5 );

    scalar_grid_ptr pGrid = make_scalar_grid( xs, ys, &wavy );

    const interpolation_method methods[] = { kLinear, kNearest, kCubic };

    for( int m = 0; m < 3; ++m ) {
        scalar_sampler sampler( pGrid, sampler_options( methods[m] ) );

        for( std::size_t j = 0; j < ys.size(); ++j ) {
            for( std::size_t i = 0; i < xs.size(); ++i ) {
                double value = g_nan;
                REQUIRE( sampler.sample( xs[i], ys[j], value ) );
                REQUIRE( value == pGrid->get_value( i, j ) );
            }
        }
    }
}

TEST_CASE( "samples outside of the grid are invalid without extrapolation", "[grid]" ) {
    const std::vector<double> axis = make_axis( 0.0, 2.0, 3 );
    scalar_grid_ptr pGrid = make_scalar_grid( axis, axis, &linear_xy );

    const interpolation_method methods[] = { kLinear, kNearest, kCubic };
    const double outside[][2] = { { -1e-9, 1.0 }, { 2.0 + 1e-9, 1.0 }, { 1.0, -0.5 }, { 1.0, 7.0 }, { 5.0, 5.0 } };

    for( int m = 0; m < 3; ++m ) {
        scalar_sampler sampler( pGrid, sampler_options( methods[m] ) );

        for( int k = 0; k < 5; ++k ) {
            double value = 42.0;
            REQUIRE_FALSE( sampler.sample( outside[k][0], outside[k][1], value ) );
            REQUIRE( value == 42.0 );
        }
    }
}

TEST_CASE( "bilinear sampling reproduces linear fields", "[grid]" ) {
    const double xCoords[] = { 0.0, 0.3, 1.0, 2.5 };
    const std::vector<double> xs = make_axis( xCoords, 4 );
    const std::vector<double> ys = make_axis( -1.0, 1.0, 5 );

    scalar_sampler sampler( make_scalar_grid( xs, ys, &linear_xy ) );

    double value;
    REQUIRE( sampler.sample( 0.15, 0.25, value ) );
    REQUIRE( value == Approx( linear_xy( 0.15, 0.25 ) ) );

    REQUIRE( sampler.sample( 1.8, -0.9, value ) );
    REQUIRE( value == Approx( linear_xy( 1.8, -0.9 ) ) );
}

TEST_CASE( "nearest sampling picks the closest node", "[grid]" ) {
    const std::vector<double> axis = make_axis( 0.0, 2.0, 3 );
    scalar_sampler sampler( make_scalar_grid( axis, axis, &linear_xy ), sampler_options( kNearest ) );

    double value;
    REQUIRE( sampler.sample( 0.4, 1.6, value ) );
    REQUIRE( value == linear_xy( 0.0, 2.0 ) );

    REQUIRE( sampler.sample( 1.6, 0.4, value ) );
    REQUIRE( value == linear_xy( 2.0, 0.0 ) );
}

TEST_CASE( "cubic sampling reproduces cubic polynomials on non-uniform meshes", "[grid]" ) {
    const double xCoords[] = { 0.0, 0.4, 1.0, 1.9, 3.0, 3.2 };
    const double yCoords[] = { 5.0, 4.0, 2.5, 1.0, 0.0 };
    const std::vector<double> xs = make_axis( xCoords, 6 );
    const std::vector<double> ys = make_axis( yCoords, 5 );

    scalar_sampler sampler( make_scalar_grid( xs, ys, &cubic_poly ), sampler_options( kCubic ) );

    const double points[][2] = { { 0.2, 4.5 }, { 1.5, 3.3 }, { 3.1, 0.5 }, { 2.2, 1.7 } };
    for( int k = 0; k < 4; ++k ) {
        double value;
        REQUIRE( sampler.sample( points[k][0], points[k][1], value ) );
        REQUIRE( value == Approx( cubic_poly( points[k][0], points[k][1] ) ).margin( 1e-9 ) );
    }
}

TEST_CASE( "one cell extrapolation extends the edge cells linearly", "[grid]" ) {
    const std::vector<double> axis = make_axis( 0.0, 2.0, 3 );
    scalar_grid_ptr pGrid = make_scalar_grid( axis, axis, &linear_xy );

    scalar_sampler linear( pGrid, sampler_options( kLinear, kOneCellExtrapolation ) );
    scalar_sampler cubic( pGrid, sampler_options( kCubic, kOneCellExtrapolation ) );

    double value;
    REQUIRE( linear.sample( -0.5, 1.0, value ) );
    REQUIRE( value == Approx( linear_xy( -0.5, 1.0 ) ) );

    REQUIRE( linear.sample( 2.75, 2.9, value ) );
    REQUIRE( value == Approx( linear_xy( 2.75, 2.9 ) ) );

    REQUIRE( cubic.sample( -0.5, 1.0, value ) );
    REQUIRE( value == Approx( linear_xy( -0.5, 1.0 ) ) );

    REQUIRE_FALSE( linear.sample( -1.5, 1.0, value ) );
    REQUIRE_FALSE( cubic.sample( 1.0, 3.5, value ) );
}

TEST_CASE( "descending axes are sampled like ascending ones", "[grid]" ) {
    const std::vector<double> xs = make_axis( 0.0, 2.0, 3 );
    const double yCoords[] = { 2.0, 1.0, 0.0 };

    scalar_sampler sampler( make_scalar_grid( xs, make_axis( yCoords, 3 ), &linear_xy ) );

    double value;
    REQUIRE( sampler.sample( 0.5, 0.25, value ) );
    REQUIRE( value == Approx( linear_xy( 0.5, 0.25 ) ) );

    REQUIRE( sampler.sample( 1.5, 1.75, value ) );
    REQUIRE( value == Approx( linear_xy( 1.5, 1.75 ) ) );
}

TEST_CASE( "missing data only invalidates samples it contributes to", "[grid]" ) {
    const std::vector<double> axis = make_axis( 0.0, 2.0, 3 );

    std::vector<double> values( 9, 1.0 );
    values[2 + 3 * 2] = g_nan; // node (2, 2)

    scalar_sampler sampler( boost::make_shared<scalar_grid>( axis, axis, values ) );

    double value;
    REQUIRE_FALSE( sampler.sample( 1.5, 1.5, value ) );
    REQUIRE_FALSE( sampler.sample( 2.0, 2.0, value ) );

    REQUIRE( sampler.sample( 1.0, 1.0, value ) );
    REQUIRE( value == 1.0 );

    REQUIRE( sampler.sample( 2.0, 1.0, value ) );
    REQUIRE( value == 1.0 );

    REQUIRE( sampler.sample( 0.5, 1.5, value ) );
    REQUIRE( value == Approx( 1.0 ) );
}

TEST_CASE( "vector grids interpolate both components", "[grid]" ) {
    const std::vector<double> axis = make_axis( -2.0, 2.0, 5 );
    vector_sampler sampler( make_vector_grid( axis, axis, &rotation ) );

    vec2 value;
    REQUIRE( sampler.sample( 0.5, 1.25, value ) );
    REQUIRE( value.x == Approx( -1.25 ) );
    REQUIRE( value.y == Approx( 0.5 ) );

    REQUIRE_FALSE( sampler.sample( 2.5, 0.0, value ) );
}

TEST_CASE( "grid sampler requires a grid", "[grid]" ) {
    REQUIRE_THROWS_AS( scalar_sampler( scalar_grid_ptr() ), std::invalid_argument );
}

} // namespace test
} // namespace drift
