// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <boost/math/special_functions/fpclassify.hpp>

#include <cmath>

namespace drift {

/**
 * A position or velocity in the plane of the gridded datasets. Components are in the same units as the grid axes (or
 * axis units per time unit for velocities).
 */
struct vec2 {
    double x, y;

    vec2()
        : x( 0 )
        , y( 0 ) {}

    explicit vec2( double v )
        : x( v )
        , y( v ) {}

    vec2( double x_, double y_ )
        : x( x_ )
        , y( y_ ) {}

    vec2& operator+=( const vec2& rhs ) {
        x += rhs.x;
        y += rhs.y;
        return *this;
    }

    vec2& operator-=( const vec2& rhs ) {
        x -= rhs.x;
        y -= rhs.y;
        return *this;
    }

    vec2& operator*=( double s ) {
        x *= s;
        y *= s;
        return *this;
    }

    double get_magnitude() const { return std::sqrt( x * x + y * y ); }

    bool is_finite() const { return ( boost::math::isfinite )( x ) && ( boost::math::isfinite )( y ); }

    static double distance( const vec2& a, const vec2& b ) {
        double dx = a.x - b.x, dy = a.y - b.y;
        return std::sqrt( dx * dx + dy * dy );
    }
};

inline vec2 operator+( const vec2& a, const vec2& b ) { return vec2( a.x + b.x, a.y + b.y ); }

inline vec2 operator-( const vec2& a, const vec2& b ) { return vec2( a.x - b.x, a.y - b.y ); }

inline vec2 operator*( double s, const vec2& v ) { return vec2( s * v.x, s * v.y ); }

inline vec2 operator*( const vec2& v, double s ) { return vec2( s * v.x, s * v.y ); }

inline bool operator==( const vec2& a, const vec2& b ) { return a.x == b.x && a.y == b.y; }

inline bool operator!=( const vec2& a, const vec2& b ) { return !( a == b ); }

/**
 * Axis aligned box in grid coordinates, stored as [xmin, xmax, ymin, ymax].
 */
struct bounds2 {
    double xmin, xmax, ymin, ymax;

    bounds2()
        : xmin( 0 )
        , xmax( 0 )
        , ymin( 0 )
        , ymax( 0 ) {}

    bounds2( double xmin_, double xmax_, double ymin_, double ymax_ )
        : xmin( xmin_ )
        , xmax( xmax_ )
        , ymin( ymin_ )
        , ymax( ymax_ ) {}

    bool contains( const vec2& p ) const { return p.x >= xmin && p.x <= xmax && p.y >= ymin && p.y <= ymax; }
};

// Overloads used by the templated samplers so scalar and vector grids share one code path.
inline bool is_finite_value( double v ) { return ( boost::math::isfinite )( v ); }

inline bool is_finite_value( const vec2& v ) { return v.is_finite(); }

} // namespace drift
