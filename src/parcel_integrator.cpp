// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#include "stdafx.h"

#include <drift/parcel_integrator.hpp>

#include <frantic/logging/logging_level.hpp>

#include <boost/math/special_functions/fpclassify.hpp>

namespace drift {

namespace {

// Relative slack when deciding whether the remaining time fits in one more step, so accumulated rounding does not
// leave a sliver of a step before the end time.
const double g_endTimeSlack = 1e-9;

} // namespace

void validate_integration_options( const integration_options& options ) {
    if( !( boost::math::isfinite )( options.timeStep ) )
        throw std::invalid_argument( "validate_integration_options() - the time step must be finite" );
    if( options.hasEndTime && !( boost::math::isfinite )( options.endTime ) )
        throw std::invalid_argument( "validate_integration_options() - the end time must be finite" );
    if( !( boost::math::isfinite )( options.refinementTolerance ) || options.refinementTolerance < 0 )
        throw std::invalid_argument(
            "validate_integration_options() - the refinement tolerance must be finite and non-negative" );
}

parcel_integrator::parcel_integrator( advector_interface_ptr pAdvector, field_interface_ptr pField )
    : m_advector( pAdvector )
    , m_field( pField ) {
    if( !m_advector )
        throw std::invalid_argument( "parcel_integrator::parcel_integrator() - the advector cannot be NULL" );
    if( !m_field )
        throw std::invalid_argument( "parcel_integrator::parcel_integrator() - the velocity field cannot be NULL" );
}

parcel parcel_integrator::create_parcel( double t0, const vec2& p0 ) const {
    if( !( boost::math::isfinite )( t0 ) || !p0.is_finite() )
        throw std::invalid_argument( "parcel_integrator::create_parcel() - the start time and position must be finite" );

    parcel result;
    result.m_position = p0;
    result.m_time = t0;

    field_sample sample = m_field->evaluate( t0, p0 );
    if( sample.valid ) {
        result.m_velocity = sample.velocity;
        result.m_scalar = sample.scalar;
    } else {
        result.terminate( kOutOfBounds, kLeftDomain );
    }

    return result;
}

void parcel_integrator::update_completion( parcel& p, const integration_options& options ) const {
    if( !p.is_active() )
        return;

    if( options.hasEndTime && options.timeStep != 0 ) {
        const double remaining = options.endTime - p.m_time;
        if( ( options.timeStep > 0 ? remaining : -remaining ) <= 0 ) {
            p.terminate( kCompleted, kReachedEndTime );
            return;
        }
    }

    if( p.m_stepCount >= options.maxSteps )
        p.terminate( kCompleted, kReachedMaxSteps );
    else if( options.timeStep == 0 )
        p.terminate( kCompleted, kZeroTimeStep );
}

double parcel_integrator::get_step_size( const parcel& p, const integration_options& options,
                                         double& outNewTime ) const {
    double timeStep = options.timeStep;
    outNewTime = p.m_time + timeStep;

    if( options.hasEndTime ) {
        const double remaining = options.endTime - p.m_time;

        // The last step lands on the end time exactly.
        if( std::abs( remaining ) <= std::abs( timeStep ) * ( 1.0 + g_endTimeSlack ) ) {
            timeStep = remaining;
            outNewTime = options.endTime;
        }
    }

    return timeStep;
}

bool parcel_integrator::is_last_step( const parcel& p, const integration_options& options, double newTime ) const {
    if( p.m_stepCount + 1 >= options.maxSteps )
        return true;
    return options.hasEndTime && newTime == options.endTime;
}

bool parcel_integrator::advance( parcel& p, double timeStep, double newTime, bool lastStep ) const {
    vec2 offset;
    if( !m_advector->get_offset( p.m_position, p.m_velocity, p.m_time, *m_field, timeStep, offset ) ) {
        p.terminate( kOutOfBounds, kLeftDomain );
        return false;
    }

    const vec2 newPosition = p.m_position + offset;

    // The velocity at the end of the step seeds the next step, so the new position must be covered unless the run
    // ends here.
    field_sample sample = m_field->evaluate( newTime, newPosition );
    if( !sample.valid ) {
        if( !lastStep ) {
            p.terminate( kOutOfBounds, kLeftDomain );
            return false;
        }
        sample.velocity = vec2( std::numeric_limits<double>::quiet_NaN(), std::numeric_limits<double>::quiet_NaN() );
        sample.scalar = std::numeric_limits<double>::quiet_NaN();
    }

    p.m_position = newPosition;
    p.m_time = newTime;
    p.m_velocity = sample.velocity;
    p.m_scalar = sample.scalar;
    ++p.m_stepCount;

    return true;
}

bool parcel_integrator::step( parcel& p, const integration_options& options ) const {
    update_completion( p, options );
    if( !p.is_active() )
        return false;

    double newTime;
    const double timeStep = get_step_size( p, options, newTime );

    if( !advance( p, timeStep, newTime, is_last_step( p, options, newTime ) ) )
        return false;

    update_completion( p, options );
    return true;
}

trajectory parcel_integrator::run( double t0, const vec2& p0, const integration_options& options,
                                   double* pOutError ) const {
    trajectory result;

    parcel p = create_parcel( t0, p0 );
    result.samples.push_back( trajectory_sample( p.m_time, p.m_position, p.m_scalar ) );

    // The higher order solution is carried along as a separate path started from the same point.
    vec2 shadowPosition = p.m_position, shadowVelocity = p.m_velocity;
    bool shadowValid = p.is_active();

    update_completion( p, options );

    while( p.is_active() ) {
        const double t = p.m_time;

        double newTime;
        const double timeStep = get_step_size( p, options, newTime );
        const bool lastStep = is_last_step( p, options, newTime );

        if( pOutError && shadowValid ) {
            vec2 offset, higherOffset;
            shadowValid = m_advector->get_offset_pair( shadowPosition, shadowVelocity, t, *m_field, timeStep, offset,
                                                       higherOffset );

            if( shadowValid ) {
                shadowPosition += higherOffset;

                if( !lastStep ) {
                    field_sample sample = m_field->evaluate_velocity( newTime, shadowPosition );
                    shadowValid = sample.valid;
                    shadowVelocity = sample.velocity;
                }
            }
        }

        if( !advance( p, timeStep, newTime, lastStep ) )
            break;

        result.samples.push_back( trajectory_sample( p.m_time, p.m_position, p.m_scalar ) );

        update_completion( p, options );
    }

    result.state = p.m_state;
    result.reason = p.m_reason;
    result.steps = p.m_stepCount;

    if( pOutError ) {
        // Parcels that left the domain are accepted as is, more steps would not bring them back.
        if( p.m_state == kCompleted && shadowValid )
            *pOutError = vec2::distance( p.m_position, shadowPosition );
        else
            *pOutError = 0.0;
    }

    return result;
}

trajectory parcel_integrator::integrate( double t0, const vec2& p0, const integration_options& options ) const {
    validate_integration_options( options );

    if( !m_advector->has_error_estimate() || options.maxRefinements == 0 )
        return run( t0, p0, options, NULL );

    integration_options currentOptions = options;

    for( std::size_t refinement = 0;; ++refinement ) {
        double error = 0.0;

        trajectory result = run( t0, p0, currentOptions, &error );
        result.refinements = refinement;

        if( !( error > options.refinementTolerance ) )
            return result;

        if( refinement >= options.maxRefinements ) {
            FF_LOG( warning ) << _T("Parcel starting at (") << p0.x << _T(", ") << p0.y << _T(") did not reach ")
                              << _T("the refinement tolerance ") << options.refinementTolerance << _T(" after ")
                              << refinement << _T(" refinements, the remaining error is ") << error << std::endl;
            return result;
        }

        currentOptions.timeStep *= 0.5;
        currentOptions.maxSteps *= 2;
    }
}

std::string to_string( parcel_state state ) {
    switch( state ) {
    case kActive:
        return "active";
    case kOutOfBounds:
        return "out_of_bounds";
    case kCompleted:
        return "completed";
    default:
        return "unknown";
    }
}

std::string to_string( termination_reason reason ) {
    switch( reason ) {
    case kNotTerminated:
        return "not_terminated";
    case kReachedMaxSteps:
        return "reached_max_steps";
    case kReachedEndTime:
        return "reached_end_time";
    case kZeroTimeStep:
        return "zero_time_step";
    case kLeftDomain:
        return "left_domain";
    default:
        return "unknown";
    }
}

} // namespace drift
