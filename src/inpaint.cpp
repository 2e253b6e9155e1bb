// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#include "stdafx.h"

#include <drift/grid_tools.hpp>

#include <frantic/logging/logging_level.hpp>

#pragma warning( push, 3 )
#pragma warning( disable : 4512 4100 )
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#pragma warning( pop )

#include <mkl_dfti.h>
#include <mkl_trig_transforms.h>

#include <boost/bind.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/make_shared.hpp>
#include <boost/math/constants/constants.hpp>
#include <boost/math/special_functions/fpclassify.hpp>
#include <boost/noncopyable.hpp>
#include <boost/scoped_array.hpp>

#include <cstring>
#include <string>

namespace drift {

namespace {

// Smallest smoothing parameter, reached on the last iteration.
const double g_finalSmoothingExponent = -6.0;

/**
 * An in-place DCT-II of a fixed length and its exact inverse, built on MKL's staggered cosine transform. MKL's backward
 * staggered cosine transform is an unnormalised DCT-II of the samples and its forward transform undoes it. Only
 * diagonal filters are applied between the two, so the normalisation does not matter.
 *
 * The MKL parameter arrays are written during the transforms, so each thread needs its own instance.
 */
class cosine_transform : boost::noncopyable {
  public:
    explicit cosine_transform( std::size_t n );

    ~cosine_transform();

    /**
     * Transforms the n values starting at 'values' and 'stride' apart.
     */
    void dct( double* values, std::size_t stride ) { apply( values, stride, false ); }

    void idct( double* values, std::size_t stride ) { apply( values, stride, true ); }

  private:
    void apply( double* values, std::size_t stride, bool inverse );

    MKL_INT m_size;
    boost::scoped_array<MKL_INT> m_ipar;
    boost::scoped_array<double> m_dpar;
    boost::scoped_array<double> m_buffer;
    DFTI_DESCRIPTOR_HANDLE m_handle;
};

cosine_transform::cosine_transform( std::size_t n )
    : m_size( static_cast<MKL_INT>( n ) )
    , m_ipar( new MKL_INT[128] )
    , m_dpar( new double[5 * n / 2 + 2] )
    , m_buffer( new double[n + 1] )
    , m_handle( 0 ) {
    // Parameters that init does not set must be zero.
    memset( m_ipar.get(), 0, sizeof( MKL_INT ) * 128 );

    MKL_INT transformType = MKL_STAGGERED_COSINE_TRANSFORM;
    MKL_INT stat = 0;

    d_init_trig_transform( &m_size, &transformType, m_ipar.get(), m_dpar.get(), &stat );
    if( stat != 0 )
        throw std::runtime_error( "cosine_transform::cosine_transform() - d_init_trig_transform failed with status " +
                                  boost::lexical_cast<std::string>( stat ) );

    d_commit_trig_transform( m_buffer.get(), &m_handle, m_ipar.get(), m_dpar.get(), &stat );
    if( stat != 0 ) {
        MKL_INT freeStat = 0;
        free_trig_transform( &m_handle, m_ipar.get(), &freeStat );
        throw std::runtime_error( "cosine_transform::cosine_transform() - d_commit_trig_transform failed with status " +
                                  boost::lexical_cast<std::string>( stat ) );
    }
}

cosine_transform::~cosine_transform() {
    MKL_INT stat = 0;
    free_trig_transform( &m_handle, m_ipar.get(), &stat );
    if( stat != 0 )
        FF_LOG( warning ) << _T("free_trig_transform failed with status ") << stat << std::endl;
}

void cosine_transform::apply( double* values, std::size_t stride, bool inverse ) {
    const std::size_t n = static_cast<std::size_t>( m_size );

    for( std::size_t i = 0; i < n; ++i )
        m_buffer[i] = values[i * stride];

    MKL_INT stat = 0;
    if( inverse )
        d_forward_trig_transform( m_buffer.get(), &m_handle, m_ipar.get(), m_dpar.get(), &stat );
    else
        d_backward_trig_transform( m_buffer.get(), &m_handle, m_ipar.get(), m_dpar.get(), &stat );

    if( stat != 0 )
        throw std::runtime_error( "cosine_transform::apply() - the MKL trigonometric transform failed with status " +
                                  boost::lexical_cast<std::string>( stat ) );

    for( std::size_t i = 0; i < n; ++i )
        values[i * stride] = m_buffer[i];
}

} // namespace

class inpaint_impl {
  public:
    static void transform_rows( const tbb::blocked_range<std::size_t>& range, std::vector<double>& values,
                                std::size_t nx, bool inverse ) {
        cosine_transform transform( nx );
        for( std::size_t y = range.begin(), yEnd = range.end(); y != yEnd; ++y ) {
            if( inverse )
                transform.idct( &values[nx * y], 1 );
            else
                transform.dct( &values[nx * y], 1 );
        }
    }

    static void transform_columns( const tbb::blocked_range<std::size_t>& range, std::vector<double>& values,
                                   std::size_t nx, std::size_t ny, bool inverse ) {
        cosine_transform transform( ny );
        for( std::size_t x = range.begin(), xEnd = range.end(); x != xEnd; ++x ) {
            if( inverse )
                transform.idct( &values[x], nx );
            else
                transform.dct( &values[x], nx );
        }
    }

    static void transform( std::vector<double>& values, std::size_t nx, std::size_t ny, bool inverse ) {
        tbb::parallel_for( tbb::blocked_range<std::size_t>( 0, ny ),
                           boost::bind( &inpaint_impl::transform_rows, _1, boost::ref( values ), nx, inverse ),
                           tbb::auto_partitioner() );
        tbb::parallel_for( tbb::blocked_range<std::size_t>( 0, nx ),
                           boost::bind( &inpaint_impl::transform_columns, _1, boost::ref( values ), nx, ny, inverse ),
                           tbb::auto_partitioner() );
    }
};

scalar_grid_ptr inpaint_smooth( const scalar_grid& grid, std::size_t iterations, double smoothing, double power,
                                double relaxation ) {
    if( !( boost::math::isfinite )( smoothing ) || !( boost::math::isfinite )( power ) ||
        !( boost::math::isfinite )( relaxation ) )
        throw std::invalid_argument( "inpaint_smooth() - the smoothing, power and relaxation must be finite" );

    scalar_grid_ptr pNearest = inpaint_nearest( grid );
    if( iterations == 0 )
        return pNearest;

    const std::size_t nx = grid.get_size( 0 );
    const std::size_t ny = grid.get_size( 1 );
    const std::size_t count = nx * ny;
    const double pi = boost::math::constants::pi<double>();

    const std::vector<double>& original = grid.get_values();
    std::vector<double> current( pNearest->get_values() );

    // Eigenvalues of the discrete Laplacian in the cosine basis, raised to 'power'.
    std::vector<double> lambda( count );
    for( std::size_t y = 0; y < ny; ++y ) {
        for( std::size_t x = 0; x < nx; ++x ) {
            const double l = std::cos( pi * static_cast<double>( y ) / static_cast<double>( ny ) ) +
                             std::cos( pi * static_cast<double>( x ) / static_cast<double>( nx ) );
            lambda[x + nx * y] = std::pow( 2.0 * ( 2.0 - l ), power );
        }
    }

    std::vector<double> work( count );

    for( std::size_t i = 0; i < iterations; ++i ) {
        // The smoothing parameter decreases logarithmically from 10^smoothing to 10^-6.
        double exponent = smoothing;
        if( iterations > 1 )
            exponent += ( g_finalSmoothingExponent - smoothing ) * static_cast<double>( i ) /
                        static_cast<double>( iterations - 1 );
        const double s = std::pow( 10.0, exponent );

        for( std::size_t k = 0; k < count; ++k )
            work[k] = ( boost::math::isfinite )( original[k] ) ? original[k] : current[k];

        inpaint_impl::transform( work, nx, ny, false );

        for( std::size_t k = 0; k < count; ++k )
            work[k] /= 1.0 + s * lambda[k];

        inpaint_impl::transform( work, nx, ny, true );

        for( std::size_t k = 0; k < count; ++k )
            current[k] = relaxation * work[k] + ( 1.0 - relaxation ) * current[k];
    }

    for( std::size_t k = 0; k < count; ++k ) {
        if( ( boost::math::isfinite )( original[k] ) )
            current[k] = original[k];
    }

    FF_LOG( debug ) << _T("Inpainted a ") << nx << _T("x") << ny << _T(" grid with ") << iterations
                    << _T(" smoothing iterations") << std::endl;

    return boost::make_shared<scalar_grid>( grid.get_axis( 0 ), grid.get_axis( 1 ), current );
}

vector_grid_ptr inpaint_smooth( const vector_grid& grid, std::size_t iterations, double smoothing, double power,
                                double relaxation ) {
    const std::vector<vec2>& values = grid.get_values();
    const double nan = std::numeric_limits<double>::quiet_NaN();

    // A vector with either component missing is missing as a whole.
    std::vector<double> u( values.size() ), v( values.size() );
    for( std::size_t k = 0, kEnd = values.size(); k < kEnd; ++k ) {
        const bool valid = is_finite_value( values[k] );
        u[k] = valid ? values[k].x : nan;
        v[k] = valid ? values[k].y : nan;
    }

    scalar_grid_ptr pU = inpaint_smooth( scalar_grid( grid.get_axis( 0 ), grid.get_axis( 1 ), u ), iterations,
                                         smoothing, power, relaxation );
    scalar_grid_ptr pV = inpaint_smooth( scalar_grid( grid.get_axis( 0 ), grid.get_axis( 1 ), v ), iterations,
                                         smoothing, power, relaxation );

    return combine( *pU, *pV );
}

} // namespace drift
