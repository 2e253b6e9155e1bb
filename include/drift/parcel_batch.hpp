// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <drift/advector_interface.hpp>
#include <drift/field_interface.hpp>
#include <drift/options.hpp>
#include <drift/parcel.hpp>
#include <drift/parcel_integrator.hpp>

#include <cstddef>
#include <vector>

namespace drift {

/**
 * The initial state of a parcel supplied by the caller.
 */
struct parcel_start {
    double time;
    vec2 position;

    parcel_start()
        : time( 0 ) {}

    parcel_start( double time_, const vec2& position_ )
        : time( time_ )
        , position( position_ ) {}

    parcel_start( double time_, double x, double y )
        : time( time_ )
        , position( x, y ) {}
};

struct batch_summary {
    std::size_t parcelCount;
    std::size_t completedCount;
    std::size_t outOfBoundsCount;
    std::size_t totalSteps;

    batch_summary()
        : parcelCount( 0 )
        , completedCount( 0 )
        , outOfBoundsCount( 0 )
        , totalSteps( 0 ) {}
};

batch_summary summarize( const std::vector<trajectory>& results );

/**
 * Integrates many independent parcels through one shared velocity field. Parcels are integrated in parallel and the
 * results are returned in the order the parcels were supplied.
 *
 * All inputs are checked before any integration starts. Bad input throws std::invalid_argument and produces no partial
 * results, while parcels leaving the domain are reported through their trajectory's state.
 */
class parcel_batch {
  public:
    explicit parcel_batch( field_interface_ptr pField, integrator_type type = kRK4 );

    integrator_type get_integrator() const { return m_integratorType; }

    void set_integrator( integrator_type type );

    double get_refinement_tolerance() const { return m_refinementTolerance; }

    void set_refinement_tolerance( double tolerance );

    std::size_t get_max_refinements() const { return m_maxRefinements; }

    void set_max_refinements( std::size_t maxRefinements ) { m_maxRefinements = maxRefinements; }

    /**
     * Makes advect() also stop every parcel at 't'.
     */
    void set_end_time( double t );

    void clear_end_time() { m_hasEndTime = false; }

    bool has_end_time() const { return m_hasEndTime; }

    /**
     * Advances every parcel by up to 'maxSteps' steps of 'timeStep', or until the end time if one is set.
     */
    std::vector<trajectory> advect( const std::vector<parcel_start>& points, double timeStep,
                                    std::size_t maxSteps ) const;

    /**
     * Advances every parcel to 'endTime'. Each parcel takes max(1, floor(|endTime - t0| / nominalStep)) equal steps,
     * so parcels with different start times all land on 'endTime'.
     */
    std::vector<trajectory> advect_to( const std::vector<parcel_start>& points, double endTime,
                                       double nominalStep ) const;

  private:
    void validate_points( const std::vector<parcel_start>& points ) const;

    integration_options get_base_options() const;

    std::vector<trajectory> run( const std::vector<parcel_start>& points,
                                 const std::vector<integration_options>& options ) const;

  private:
    field_interface_ptr m_field;

    integrator_type m_integratorType;
    advector_interface_ptr m_advector;

    double m_refinementTolerance;
    std::size_t m_maxRefinements;

    bool m_hasEndTime;
    double m_endTime;
};

} // namespace drift
