// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#include "stdafx.h"

#include <drift/grid_tools.hpp>

#pragma warning( push, 3 )
#pragma warning( disable : 4512 4100 )
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#pragma warning( pop )

#include <boost/bind.hpp>
#include <boost/make_shared.hpp>

#include <limits>
#include <string>

namespace drift {

namespace {

void check_same_axes( const scalar_grid& u, const scalar_grid& v, const char* fnName ) {
    if( u.get_axis( 0 ) != v.get_axis( 0 ) || u.get_axis( 1 ) != v.get_axis( 1 ) )
        throw std::invalid_argument( std::string( fnName ) + " - the component grids must share the same axes" );
}

// Derivative of 'values' along a strided line of nodes with coordinates 'axis'.
double derivative_at( const std::vector<double>& axis, const double* values, std::size_t stride, std::size_t i ) {
    const std::size_t n = axis.size();

    if( i == 0 )
        return ( values[stride] - values[0] ) / ( axis[1] - axis[0] );
    if( i == n - 1 )
        return ( values[i * stride] - values[( i - 1 ) * stride] ) / ( axis[i] - axis[i - 1] );

    const double h1 = axis[i] - axis[i - 1];
    const double h2 = axis[i + 1] - axis[i];
    const double fm = values[( i - 1 ) * stride];
    const double f = values[i * stride];
    const double fp = values[( i + 1 ) * stride];

    return ( h1 * h1 * fp - h2 * h2 * fm + ( h2 * h2 - h1 * h1 ) * f ) / ( h1 * h2 * ( h1 + h2 ) );
}

} // namespace

class grid_tools_impl {
  public:
    template <class T>
    static void scale_rows( const tbb::blocked_range<std::size_t>& range, const grid<T>& src, double factor,
                            std::vector<T>& result ) {
        const std::size_t nx = src.get_size( 0 );
        for( std::size_t y = range.begin(), yEnd = range.end(); y != yEnd; ++y ) {
            for( std::size_t x = 0; x < nx; ++x )
                result[x + nx * y] = factor * src.get_value( x, y );
        }
    }

    static void combine_rows( const tbb::blocked_range<std::size_t>& range, const scalar_grid& u,
                              const scalar_grid& v, std::vector<vec2>& result ) {
        const std::size_t nx = u.get_size( 0 );
        for( std::size_t y = range.begin(), yEnd = range.end(); y != yEnd; ++y ) {
            for( std::size_t x = 0; x < nx; ++x )
                result[x + nx * y] = vec2( u.get_value( x, y ), v.get_value( x, y ) );
        }
    }

    static void speed_rows( const tbb::blocked_range<std::size_t>& range, const vector_grid& uv,
                            std::vector<double>& result ) {
        const std::size_t nx = uv.get_size( 0 );
        for( std::size_t y = range.begin(), yEnd = range.end(); y != yEnd; ++y ) {
            for( std::size_t x = 0; x < nx; ++x )
                result[x + nx * y] = uv.get_value( x, y ).get_magnitude();
        }
    }

    static void divergence_rows( const tbb::blocked_range<std::size_t>& range, const scalar_grid& u,
                                 const scalar_grid& v, std::vector<double>& result ) {
        const std::vector<double>& xs = u.get_axis( 0 );
        const std::vector<double>& ys = u.get_axis( 1 );
        const std::size_t nx = xs.size();

        const double* uValues = &u.get_values()[0];
        const double* vValues = &v.get_values()[0];

        for( std::size_t y = range.begin(), yEnd = range.end(); y != yEnd; ++y ) {
            for( std::size_t x = 0; x < nx; ++x ) {
                const double dudx = derivative_at( xs, uValues + nx * y, 1, x );
                const double dvdy = derivative_at( ys, vValues + x, nx, y );
                result[x + nx * y] = dudx + dvdy;
            }
        }
    }

    template <class T>
    static void inpaint_rows( const tbb::blocked_range<std::size_t>& range, const grid<T>& src,
                              const std::vector<std::size_t>& validIndices, std::vector<T>& result ) {
        const std::size_t nx = src.get_size( 0 );

        for( std::size_t y = range.begin(), yEnd = range.end(); y != yEnd; ++y ) {
            for( std::size_t x = 0; x < nx; ++x ) {
                const T& value = src.get_value( x, y );
                if( is_finite_value( value ) ) {
                    result[x + nx * y] = value;
                    continue;
                }

                const vec2 p( src.get_coord( 0, x ), src.get_coord( 1, y ) );

                std::size_t nearest = validIndices.front();
                double nearestDistSq = std::numeric_limits<double>::infinity();

                for( std::vector<std::size_t>::const_iterator it = validIndices.begin(), itEnd = validIndices.end();
                     it != itEnd; ++it ) {
                    const vec2 delta = vec2( src.get_coord( 0, *it % nx ), src.get_coord( 1, *it / nx ) ) - p;
                    const double distSq = delta.x * delta.x + delta.y * delta.y;
                    if( distSq < nearestDistSq ) {
                        nearestDistSq = distSq;
                        nearest = *it;
                    }
                }

                result[x + nx * y] = src.get_values()[nearest];
            }
        }
    }
};

namespace {

void get_crop_range( const std::vector<double>& axis, double lo, double hi, const char* axisName,
                     std::size_t& outBegin, std::size_t& outEnd ) {
    outBegin = axis.size();
    outEnd = 0;

    // The axis is monotonic so the nodes inside [lo, hi] are contiguous.
    for( std::size_t i = 0, iEnd = axis.size(); i < iEnd; ++i ) {
        if( axis[i] >= lo && axis[i] <= hi ) {
            outBegin = ( std::min )( outBegin, i );
            outEnd = i + 1;
        }
    }

    if( outEnd < outBegin + 2 || outBegin >= axis.size() )
        throw std::out_of_range( std::string( "crop() - fewer than two nodes of the " ) + axisName +
                                 " axis lie within the cropping bounds" );
}

template <class T>
boost::shared_ptr<const grid<T> > crop_impl( const grid<T>& src, const bounds2& bounds, double buffer ) {
    std::size_t xBegin, xEnd, yBegin, yEnd;
    get_crop_range( src.get_axis( 0 ), bounds.xmin - buffer, bounds.xmax + buffer, "x", xBegin, xEnd );
    get_crop_range( src.get_axis( 1 ), bounds.ymin - buffer, bounds.ymax + buffer, "y", yBegin, yEnd );

    std::vector<double> xs( src.get_axis( 0 ).begin() + xBegin, src.get_axis( 0 ).begin() + xEnd );
    std::vector<double> ys( src.get_axis( 1 ).begin() + yBegin, src.get_axis( 1 ).begin() + yEnd );

    std::vector<T> values;
    values.reserve( xs.size() * ys.size() );

    for( std::size_t y = yBegin; y < yEnd; ++y ) {
        for( std::size_t x = xBegin; x < xEnd; ++x )
            values.push_back( src.get_value( x, y ) );
    }

    return boost::make_shared<grid<T> >( xs, ys, values );
}

template <class T>
boost::shared_ptr<const grid<T> > scaled_impl( const grid<T>& src, double factor ) {
    std::vector<T> values( src.get_values().size() );

    tbb::parallel_for( tbb::blocked_range<std::size_t>( 0, src.get_size( 1 ) ),
                       boost::bind( &grid_tools_impl::scale_rows<T>, _1, boost::cref( src ), factor,
                                    boost::ref( values ) ),
                       tbb::auto_partitioner() );

    return boost::make_shared<grid<T> >( src.get_axis( 0 ), src.get_axis( 1 ), values );
}

template <class T>
boost::shared_ptr<const grid<T> > inpaint_nearest_impl( const grid<T>& src ) {
    std::vector<std::size_t> validIndices;

    const std::vector<T>& srcValues = src.get_values();
    for( std::size_t i = 0, iEnd = srcValues.size(); i < iEnd; ++i ) {
        if( is_finite_value( srcValues[i] ) )
            validIndices.push_back( i );
    }

    if( validIndices.empty() )
        throw std::invalid_argument( "inpaint_nearest() - the grid has no valid values" );

    std::vector<T> values( srcValues.size() );

    tbb::parallel_for( tbb::blocked_range<std::size_t>( 0, src.get_size( 1 ) ),
                       boost::bind( &grid_tools_impl::inpaint_rows<T>, _1, boost::cref( src ),
                                    boost::cref( validIndices ), boost::ref( values ) ),
                       tbb::auto_partitioner() );

    return boost::make_shared<grid<T> >( src.get_axis( 0 ), src.get_axis( 1 ), values );
}

} // namespace

scalar_grid_ptr crop( const scalar_grid& grid, const bounds2& bounds, double buffer ) {
    return crop_impl( grid, bounds, buffer );
}

vector_grid_ptr crop( const vector_grid& grid, const bounds2& bounds, double buffer ) {
    return crop_impl( grid, bounds, buffer );
}

scalar_grid_ptr scaled( const scalar_grid& grid, double factor ) { return scaled_impl( grid, factor ); }

vector_grid_ptr scaled( const vector_grid& grid, double factor ) { return scaled_impl( grid, factor ); }

vector_grid_ptr combine( const scalar_grid& u, const scalar_grid& v ) {
    check_same_axes( u, v, "combine()" );

    std::vector<vec2> values( u.get_values().size() );

    tbb::parallel_for( tbb::blocked_range<std::size_t>( 0, u.get_size( 1 ) ),
                       boost::bind( &grid_tools_impl::combine_rows, _1, boost::cref( u ), boost::cref( v ),
                                    boost::ref( values ) ),
                       tbb::auto_partitioner() );

    return boost::make_shared<vector_grid>( u.get_axis( 0 ), u.get_axis( 1 ), values );
}

scalar_grid_ptr speed( const scalar_grid& u, const scalar_grid& v ) { return speed( *combine( u, v ) ); }

scalar_grid_ptr speed( const vector_grid& uv ) {
    std::vector<double> values( uv.get_values().size() );

    tbb::parallel_for( tbb::blocked_range<std::size_t>( 0, uv.get_size( 1 ) ),
                       boost::bind( &grid_tools_impl::speed_rows, _1, boost::cref( uv ), boost::ref( values ) ),
                       tbb::auto_partitioner() );

    return boost::make_shared<scalar_grid>( uv.get_axis( 0 ), uv.get_axis( 1 ), values );
}

scalar_grid_ptr divergence( const scalar_grid& u, const scalar_grid& v ) {
    check_same_axes( u, v, "divergence()" );

    std::vector<double> values( u.get_values().size() );

    tbb::parallel_for( tbb::blocked_range<std::size_t>( 0, u.get_size( 1 ) ),
                       boost::bind( &grid_tools_impl::divergence_rows, _1, boost::cref( u ), boost::cref( v ),
                                    boost::ref( values ) ),
                       tbb::auto_partitioner() );

    return boost::make_shared<scalar_grid>( u.get_axis( 0 ), u.get_axis( 1 ), values );
}

scalar_grid_ptr inpaint_nearest( const scalar_grid& grid ) { return inpaint_nearest_impl( grid ); }

vector_grid_ptr inpaint_nearest( const vector_grid& grid ) { return inpaint_nearest_impl( grid ); }

} // namespace drift
