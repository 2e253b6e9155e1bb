// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <drift/data_types.hpp>

#include <cstddef>
#include <limits>
#include <string>
#include <vector>

namespace drift {

enum parcel_state { kActive, kOutOfBounds, kCompleted };

enum termination_reason {
    kNotTerminated,
    kReachedMaxSteps,
    kReachedEndTime,
    kZeroTimeStep,
    kLeftDomain // A required velocity sample was outside of the field's coverage
};

class parcel_integrator;

/**
 * The mutable integration state of a single parcel. Only a parcel_integrator changes it. The position is that of the
 * last valid sample, so it stays meaningful after the parcel has left the domain.
 */
class parcel {
  public:
    parcel()
        : m_time( 0 )
        , m_scalar( std::numeric_limits<double>::quiet_NaN() )
        , m_stepCount( 0 )
        , m_state( kActive )
        , m_reason( kNotTerminated ) {}

    const vec2& get_position() const { return m_position; }

    double get_time() const { return m_time; }

    /**
     * The field velocity at the current position and time.
     */
    const vec2& get_velocity() const { return m_velocity; }

    double get_scalar() const { return m_scalar; }

    std::size_t get_step_count() const { return m_stepCount; }

    parcel_state get_state() const { return m_state; }

    termination_reason get_termination_reason() const { return m_reason; }

    bool is_active() const { return m_state == kActive; }

  private:
    friend class parcel_integrator;

    void terminate( parcel_state state, termination_reason reason ) {
        m_state = state;
        m_reason = reason;
    }

    vec2 m_position;
    double m_time;
    vec2 m_velocity;
    double m_scalar;
    std::size_t m_stepCount;
    parcel_state m_state;
    termination_reason m_reason;
};

struct trajectory_sample {
    double time;
    vec2 position;
    double scalar; // NaN if the field has no auxiliary scalar or it was missing here

    trajectory_sample()
        : time( 0 )
        , scalar( std::numeric_limits<double>::quiet_NaN() ) {}

    trajectory_sample( double time_, const vec2& position_, double scalar_ )
        : time( time_ )
        , position( position_ )
        , scalar( scalar_ ) {}
};

/**
 * The path of one parcel from its start to its terminal state. There is always at least the starting sample.
 */
struct trajectory {
    std::vector<trajectory_sample> samples;
    parcel_state state;
    termination_reason reason;
    std::size_t steps;
    std::size_t refinements; // Number of times the run was repeated with a halved step

    trajectory()
        : state( kActive )
        , reason( kNotTerminated )
        , steps( 0 )
        , refinements( 0 ) {}

    bool is_complete() const { return state == kCompleted; }

    const trajectory_sample& get_start() const { return samples.front(); }

    const trajectory_sample& get_end() const { return samples.back(); }

    const vec2& get_final_position() const { return samples.back().position; }

    /**
     * @return The straight line distance between the first and last samples.
     */
    double get_displacement() const { return vec2::distance( samples.front().position, samples.back().position ); }

    /**
     * @return The length of the path through every sample.
     */
    double get_path_length() const {
        double result = 0;
        for( std::size_t i = 1; i < samples.size(); ++i )
            result += vec2::distance( samples[i - 1].position, samples[i].position );
        return result;
    }
};

std::string to_string( parcel_state state );
std::string to_string( termination_reason reason );

} // namespace drift
