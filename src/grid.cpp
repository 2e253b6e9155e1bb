// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#include "stdafx.h"

#include <drift/grid.hpp>

#include <boost/lexical_cast.hpp>
#include <boost/math/special_functions/fpclassify.hpp>

#include <algorithm>
#include <functional>
#include <string>

namespace drift {

void validate_axis( const std::vector<double>& axis, const char* axisName ) {
    if( axis.size() < 2 )
        throw std::invalid_argument( std::string( "grid::grid() - the " ) + axisName +
                                     " axis requires at least two coordinates" );

    for( std::size_t i = 0, iEnd = axis.size(); i < iEnd; ++i ) {
        if( !( boost::math::isfinite )( axis[i] ) )
            throw std::invalid_argument( std::string( "grid::grid() - the " ) + axisName +
                                         " axis has a non-finite coordinate at index " +
                                         boost::lexical_cast<std::string>( i ) );
    }

    const bool ascending = axis[1] > axis[0];

    for( std::size_t i = 1, iEnd = axis.size(); i < iEnd; ++i ) {
        if( ascending ? !( axis[i] > axis[i - 1] ) : !( axis[i] < axis[i - 1] ) )
            throw std::invalid_argument( std::string( "grid::grid() - the " ) + axisName +
                                         " axis is not strictly monotonic at index " +
                                         boost::lexical_cast<std::string>( i ) );
    }
}

void validate_shape( std::size_t valueCount, std::size_t xSize, std::size_t ySize ) {
    if( valueCount != xSize * ySize )
        throw std::invalid_argument( "grid::grid() - shape mismatch, expected " +
                                     boost::lexical_cast<std::string>( ySize ) + "x" +
                                     boost::lexical_cast<std::string>( xSize ) + " values but got " +
                                     boost::lexical_cast<std::string>( valueCount ) );
}

bool locate_cell( const std::vector<double>& axis, double coord, bool allowExtrapolation, std::size_t& outIndex,
                  double& outAlpha ) {
    if( !( boost::math::isfinite )( coord ) )
        return false;

    const std::size_t n = axis.size();
    const bool ascending = axis[n - 1] > axis[0];

    // 'upper' is the first node that lies strictly past 'coord' in the direction of the axis.
    std::size_t upper;
    if( ascending )
        upper = static_cast<std::size_t>( std::upper_bound( axis.begin(), axis.end(), coord ) - axis.begin() );
    else
        upper = static_cast<std::size_t>( std::upper_bound( axis.begin(), axis.end(), coord, std::greater<double>() ) -
                                          axis.begin() );

    if( upper == 0 ) {
        if( !allowExtrapolation )
            return false;
        outIndex = 0;
    } else if( upper == n ) {
        if( coord == axis[n - 1] ) {
            outIndex = n - 2;
            outAlpha = 1.0;
            return true;
        }
        if( !allowExtrapolation )
            return false;
        outIndex = n - 2;
    } else {
        outIndex = upper - 1;
    }

    const double lo = axis[outIndex];
    const double hi = axis[outIndex + 1];

    outAlpha = ( coord - lo ) / ( hi - lo );

    return outAlpha >= -1.0 && outAlpha <= 2.0;
}

namespace {

// Lagrange weights of a stencil of up to 4 nodes around the cell [i, i+1]. The stencil is shifted inward at the edges
// so it never leaves the axis.
void get_cubic_weights( const std::vector<double>& axis, std::size_t i, double coord, std::size_t& outStart,
                        std::size_t& outCount, double ( &outWeights )[4] ) {
    const std::size_t n = axis.size();

    outCount = ( std::min )( n, std::size_t( 4 ) );
    if( n <= 4 || i == 0 )
        outStart = 0;
    else
        outStart = ( std::min )( i - 1, n - 4 );

    for( std::size_t k = 0; k < outCount; ++k ) {
        const double xk = axis[outStart + k];

        double w = 1.0;
        for( std::size_t m = 0; m < outCount; ++m ) {
            if( m != k ) {
                const double xm = axis[outStart + m];
                w *= ( coord - xm ) / ( xk - xm );
            }
        }
        outWeights[k] = w;
    }
}

} // namespace

template <class T>
class grid_helper {
  public:
    inline static bool bilerp( const grid<T>& grid, double x, double y, bool extrapolate, T& outValue );

    inline static bool nearest( const grid<T>& grid, double x, double y, bool extrapolate, T& outValue );

    inline static bool cubic( const grid<T>& grid, double x, double y, bool extrapolate, T& outValue );

    inline static bool interpolate( const grid<T>& grid, double x, double y, const sampler_options& options,
                                    T& outValue );
};

template <class T>
bool grid_helper<T>::bilerp( const grid<T>& grid, double x, double y, bool extrapolate, T& outValue ) {
    std::size_t ipos[2];
    double alpha[2];

    if( !locate_cell( grid.m_axes[0], x, extrapolate, ipos[0], alpha[0] ) ||
        !locate_cell( grid.m_axes[1], y, extrapolate, ipos[1], alpha[1] ) )
        return false;

    const double xWeights[] = { 1.0 - alpha[0], alpha[0] };
    const double yWeights[] = { 1.0 - alpha[1], alpha[1] };

    T result( 0.0 );

    for( std::size_t dy = 0; dy < 2; ++dy ) {
        for( std::size_t dx = 0; dx < 2; ++dx ) {
            const double weight = xWeights[dx] * yWeights[dy];

            // Corners that do not contribute are skipped so missing data next to an exact node does not poison it.
            if( weight == 0.0 )
                continue;

            const T& value = grid.get_value( ipos[0] + dx, ipos[1] + dy );
            if( !is_finite_value( value ) )
                return false;

            result += weight * value;
        }
    }

    outValue = result;
    return true;
}

template <class T>
bool grid_helper<T>::nearest( const grid<T>& grid, double x, double y, bool extrapolate, T& outValue ) {
    std::size_t ipos[2];
    double alpha[2];

    if( !locate_cell( grid.m_axes[0], x, extrapolate, ipos[0], alpha[0] ) ||
        !locate_cell( grid.m_axes[1], y, extrapolate, ipos[1], alpha[1] ) )
        return false;

    if( alpha[0] >= 0.5 )
        ++ipos[0];
    if( alpha[1] >= 0.5 )
        ++ipos[1];

    const T& value = grid.get_value( ipos[0], ipos[1] );
    if( !is_finite_value( value ) )
        return false;

    outValue = value;
    return true;
}

template <class T>
bool grid_helper<T>::cubic( const grid<T>& grid, double x, double y, bool extrapolate, T& outValue ) {
    std::size_t ipos[2];
    double alpha[2];

    if( !locate_cell( grid.m_axes[0], x, false, ipos[0], alpha[0] ) ||
        !locate_cell( grid.m_axes[1], y, false, ipos[1], alpha[1] ) ) {
        // The one cell margin is only ever extended linearly.
        return extrapolate ? bilerp( grid, x, y, true, outValue ) : false;
    }

    std::size_t start[2], count[2];
    double xWeights[4], yWeights[4];

    get_cubic_weights( grid.m_axes[0], ipos[0], x, start[0], count[0], xWeights );
    get_cubic_weights( grid.m_axes[1], ipos[1], y, start[1], count[1], yWeights );

    T result( 0.0 );

    for( std::size_t j = 0; j < count[1]; ++j ) {
        if( yWeights[j] == 0.0 )
            continue;

        for( std::size_t i = 0; i < count[0]; ++i ) {
            const double weight = xWeights[i] * yWeights[j];
            if( weight == 0.0 )
                continue;

            const T& value = grid.get_value( start[0] + i, start[1] + j );
            if( !is_finite_value( value ) )
                return false;

            result += weight * value;
        }
    }

    outValue = result;
    return true;
}

template <class T>
bool grid_helper<T>::interpolate( const grid<T>& grid, double x, double y, const sampler_options& options,
                                  T& outValue ) {
    const bool extrapolate = ( options.extrapolation == kOneCellExtrapolation );

    switch( options.method ) {
    case kNearest:
        return nearest( grid, x, y, extrapolate, outValue );
    case kCubic:
        return cubic( grid, x, y, extrapolate, outValue );
    case kLinear:
    default:
        return bilerp( grid, x, y, extrapolate, outValue );
    }
}

bool interpolate( const grid<double>& grid, double x, double y, const sampler_options& options, double& outValue ) {
    return grid_helper<double>::interpolate( grid, x, y, options, outValue );
}

bool interpolate( const grid<vec2>& grid, double x, double y, const sampler_options& options, vec2& outValue ) {
    return grid_helper<vec2>::interpolate( grid, x, y, options, outValue );
}

} // namespace drift
