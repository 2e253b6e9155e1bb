// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#include "stdafx.h"

#include <drift/parcel_batch.hpp>

#include <frantic/diagnostics/profiling_section.hpp>
#include <frantic/logging/logging_level.hpp>

#pragma warning( push, 3 )
#pragma warning( disable : 4512 4100 )
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#pragma warning( pop )

#include <boost/bind.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/math/special_functions/fpclassify.hpp>

#include <algorithm>
#include <string>

namespace drift {

batch_summary summarize( const std::vector<trajectory>& results ) {
    batch_summary summary;
    summary.parcelCount = results.size();

    for( std::vector<trajectory>::const_iterator it = results.begin(), itEnd = results.end(); it != itEnd; ++it ) {
        if( it->state == kCompleted )
            ++summary.completedCount;
        else if( it->state == kOutOfBounds )
            ++summary.outOfBoundsCount;
        summary.totalSteps += it->steps;
    }

    return summary;
}

class parcel_batch_impl {
  public:
    static void integrate_parcels( const tbb::blocked_range<std::size_t>& range, const parcel_integrator& integrator,
                                   const std::vector<parcel_start>& points,
                                   const std::vector<integration_options>& options,
                                   std::vector<trajectory>& results ) {
        for( std::size_t i = range.begin(), iEnd = range.end(); i != iEnd; ++i )
            results[i] = integrator.integrate( points[i].time, points[i].position, options[i] );
    }
};

parcel_batch::parcel_batch( field_interface_ptr pField, integrator_type type )
    : m_field( pField )
    , m_refinementTolerance( 5e-2 )
    , m_maxRefinements( 8 )
    , m_hasEndTime( false )
    , m_endTime( 0 ) {
    if( !m_field )
        throw std::invalid_argument( "parcel_batch::parcel_batch() - the velocity field cannot be NULL" );

    set_integrator( type );
}

void parcel_batch::set_integrator( integrator_type type ) {
    m_advector = create_advector( type );
    m_integratorType = type;
}

void parcel_batch::set_refinement_tolerance( double tolerance ) {
    if( !( boost::math::isfinite )( tolerance ) || tolerance < 0 )
        throw std::invalid_argument(
            "parcel_batch::set_refinement_tolerance() - the tolerance must be finite and non-negative" );

    m_refinementTolerance = tolerance;
}

void parcel_batch::set_end_time( double t ) {
    if( !( boost::math::isfinite )( t ) )
        throw std::invalid_argument( "parcel_batch::set_end_time() - the end time must be finite" );

    m_hasEndTime = true;
    m_endTime = t;
}

void parcel_batch::validate_points( const std::vector<parcel_start>& points ) const {
    for( std::size_t i = 0, iEnd = points.size(); i < iEnd; ++i ) {
        if( !( boost::math::isfinite )( points[i].time ) || !points[i].position.is_finite() )
            throw std::invalid_argument( "parcel_batch - parcel " + boost::lexical_cast<std::string>( i ) +
                                         " has a non-finite start time or position" );
    }
}

integration_options parcel_batch::get_base_options() const {
    integration_options options;
    options.refinementTolerance = m_refinementTolerance;
    options.maxRefinements = m_maxRefinements;
    return options;
}

std::vector<trajectory> parcel_batch::advect( const std::vector<parcel_start>& points, double timeStep,
                                              std::size_t maxSteps ) const {
    if( !( boost::math::isfinite )( timeStep ) )
        throw std::invalid_argument( "parcel_batch::advect() - the time step must be finite" );
    validate_points( points );

    integration_options options = get_base_options();
    options.timeStep = timeStep;
    options.maxSteps = maxSteps;
    if( m_hasEndTime )
        options.set_end_time( m_endTime );

    FF_LOG( debug ) << _T("Advecting ") << points.size() << _T(" parcels with ")
                    << frantic::strings::to_tstring( to_string( m_integratorType ) ) << _T(", time step: ")
                    << timeStep << _T(", max steps: ") << maxSteps << std::endl;

    return run( points, std::vector<integration_options>( points.size(), options ) );
}

std::vector<trajectory> parcel_batch::advect_to( const std::vector<parcel_start>& points, double endTime,
                                                 double nominalStep ) const {
    if( !( boost::math::isfinite )( endTime ) )
        throw std::invalid_argument( "parcel_batch::advect_to() - the end time must be finite" );
    if( !( boost::math::isfinite )( nominalStep ) || !( nominalStep > 0 ) )
        throw std::invalid_argument( "parcel_batch::advect_to() - the nominal step must be finite and positive" );
    validate_points( points );

    std::vector<integration_options> parcelOptions( points.size(), get_base_options() );

    for( std::size_t i = 0, iEnd = points.size(); i < iEnd; ++i ) {
        const double span = endTime - points[i].time;
        const double stepCount = std::floor( std::abs( span ) / nominalStep );

        if( !( stepCount < static_cast<double>( std::numeric_limits<std::size_t>::max() ) ) )
            throw std::invalid_argument( "parcel_batch::advect_to() - parcel " + boost::lexical_cast<std::string>( i ) +
                                         " would need too many steps of the nominal size" );

        integration_options& options = parcelOptions[i];
        options.maxSteps = ( std::max )( std::size_t( 1 ), static_cast<std::size_t>( stepCount ) );
        options.timeStep = span / static_cast<double>( options.maxSteps );
        options.set_end_time( endTime );
    }

    FF_LOG( debug ) << _T("Advecting ") << points.size() << _T(" parcels with ")
                    << frantic::strings::to_tstring( to_string( m_integratorType ) ) << _T(" to time: ") << endTime
                    << _T(", nominal step: ") << nominalStep << std::endl;

    return run( points, parcelOptions );
}

std::vector<trajectory> parcel_batch::run( const std::vector<parcel_start>& points,
                                           const std::vector<integration_options>& options ) const {
    frantic::diagnostics::profiling_section psAdvect( _T("Parcel Advection") );

    parcel_integrator integrator( m_advector, m_field );

    std::vector<trajectory> results( points.size() );

    {
        frantic::diagnostics::scoped_profile spsAdvect( psAdvect );

        tbb::parallel_for( tbb::blocked_range<std::size_t>( 0, points.size() ),
                           boost::bind( &parcel_batch_impl::integrate_parcels, _1, boost::cref( integrator ),
                                        boost::cref( points ), boost::cref( options ), boost::ref( results ) ),
                           tbb::auto_partitioner() );
    }

    batch_summary summary = summarize( results );

    FF_LOG( progress ) << _T("Advected ") << summary.parcelCount << _T(" parcels: ") << summary.completedCount
                       << _T(" completed, ") << summary.outOfBoundsCount << _T(" left the domain") << std::endl;
    if( frantic::logging::is_logging_stats() )
        frantic::logging::stats << _T("Parcel steps taken: ") << summary.totalSteps << _T('\n') << psAdvect
                                << std::endl;

    return results;
}

} // namespace drift
