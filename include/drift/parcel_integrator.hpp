// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <drift/advector_interface.hpp>
#include <drift/field_interface.hpp>
#include <drift/parcel.hpp>

#include <cstddef>

namespace drift {

struct integration_options {
    double timeStep;            // Signed, negative to integrate backwards
    std::size_t maxSteps;       // Cap on the number of steps of a single run
    bool hasEndTime;            // If set, a run also stops on reaching endTime
    double endTime;
    double refinementTolerance; // Largest accepted distance between the 4th and 5th order end points
    std::size_t maxRefinements; // Cap on the number of step halvings, for schemes with an error estimate

    integration_options()
        : timeStep( 1.0 )
        , maxSteps( 1 )
        , hasEndTime( false )
        , endTime( 0 )
        , refinementTolerance( 5e-2 )
        , maxRefinements( 8 ) {}

    integration_options( double timeStep_, std::size_t maxSteps_ )
        : timeStep( timeStep_ )
        , maxSteps( maxSteps_ )
        , hasEndTime( false )
        , endTime( 0 )
        , refinementTolerance( 5e-2 )
        , maxRefinements( 8 ) {}

    void set_end_time( double t ) {
        hasEndTime = true;
        endTime = t;
    }

    void clear_end_time() { hasEndTime = false; }
};

/**
 * Throws std::invalid_argument if the options hold a non-finite step, end time or tolerance.
 */
void validate_integration_options( const integration_options& options );

/**
 * Drives parcels through a velocity field with a fixed step scheme. A parcel moves ACTIVE -> ACTIVE on every valid step,
 * and ends either COMPLETED (step cap, end time, or a zero step) or OUT_OF_BOUNDS (some required velocity sample was
 * invalid). An OUT_OF_BOUNDS parcel keeps the position of its last valid sample. The end point of a step is only
 * required when another step follows, so the step that completes a run may land outside the field with a NaN scalar.
 *
 * The integrator holds no per-parcel state so a single instance may be shared by any number of threads.
 */
class parcel_integrator {
  public:
    parcel_integrator( advector_interface_ptr pAdvector, field_interface_ptr pField );

    /**
     * Creates a parcel at (t0, p0). If the field is invalid there, the parcel is already OUT_OF_BOUNDS.
     */
    parcel create_parcel( double t0, const vec2& p0 ) const;

    /**
     * Advances an active parcel by one step, or marks it COMPLETED if it has nowhere left to go.
     * @return true if the parcel moved.
     */
    bool step( parcel& p, const integration_options& options ) const;

    /**
     * Integrates a parcel from (t0, p0) until it terminates. Schemes with an error estimate repeat the run with twice
     * the steps at half the step size until the 4th/5th order end points agree to within the tolerance.
     */
    trajectory integrate( double t0, const vec2& p0, const integration_options& options ) const;

  private:
    void update_completion( parcel& p, const integration_options& options ) const;

    double get_step_size( const parcel& p, const integration_options& options, double& outNewTime ) const;

    bool is_last_step( const parcel& p, const integration_options& options, double newTime ) const;

    bool advance( parcel& p, double timeStep, double newTime, bool lastStep ) const;

    trajectory run( double t0, const vec2& p0, const integration_options& options, double* pOutError ) const;

  private:
    advector_interface_ptr m_advector;
    field_interface_ptr m_field;
};

} // namespace drift
