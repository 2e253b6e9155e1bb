// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <drift/data_types.hpp>
#include <drift/field_interface.hpp>
#include <drift/options.hpp>

#include <boost/shared_ptr.hpp>

namespace drift {

/**
 * A fixed step explicit integration scheme. All functions return false without touching their output if any velocity
 * sample required by the scheme is invalid.
 */
class advector_interface {
  public:
    virtual ~advector_interface() {}

    virtual integrator_type get_type() const = 0;

    /**
     * This will return the actual advected position.
     * @param p The position at the start of the step.
     * @param v The velocity at (t, p), which the caller has already sampled.
     * @param t The time at the start of the step.
     * @param timeStep The signed step. Negative steps integrate backwards in time.
     */
    virtual bool advect_particle( const vec2& p, const vec2& v, double t, const field_interface& velocityField,
                                  double timeStep, vec2& outPosition ) const;

    /**
     * This will just return the offset that the position would have if it had been advected.
     */
    virtual bool get_offset( const vec2& p, const vec2& v, double t, const field_interface& velocityField,
                             double timeStep, vec2& outOffset ) const = 0;

    /**
     * @return true if get_offset_pair() produces a higher order offset from the same stages.
     */
    virtual bool has_error_estimate() const { return false; }

    /**
     * Returns the regular offset along with a higher order estimate of it. Schemes without an embedded estimate
     * return the same offset twice.
     */
    virtual bool get_offset_pair( const vec2& p, const vec2& v, double t, const field_interface& velocityField,
                                  double timeStep, vec2& outOffset, vec2& outHigherOffset ) const;
};

typedef boost::shared_ptr<advector_interface> advector_interface_ptr;

advector_interface_ptr create_advector( integrator_type type );

inline bool advector_interface::advect_particle( const vec2& p, const vec2& v, double t,
                                                 const field_interface& velocityField, double timeStep,
                                                 vec2& outPosition ) const {
    vec2 offset;
    if( !get_offset( p, v, t, velocityField, timeStep, offset ) )
        return false;

    outPosition = p + offset;
    return true;
}

inline bool advector_interface::get_offset_pair( const vec2& p, const vec2& v, double t,
                                                 const field_interface& velocityField, double timeStep,
                                                 vec2& outOffset, vec2& outHigherOffset ) const {
    if( !get_offset( p, v, t, velocityField, timeStep, outOffset ) )
        return false;

    outHigherOffset = outOffset;
    return true;
}

} // namespace drift
