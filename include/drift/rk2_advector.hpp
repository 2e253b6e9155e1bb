// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <drift/advector_interface.hpp>
#include <drift/field_interface.hpp>

namespace drift {

// Heun's method: the average of the velocities at both ends of an Euler step.
class rk2_advector : public advector_interface {
  public:
    virtual ~rk2_advector() {}

    virtual integrator_type get_type() const { return kRK2; }

    virtual bool get_offset( const vec2& p, const vec2& v, double t, const field_interface& velocityField,
                             double timeStep, vec2& outOffset ) const;
};

inline bool rk2_advector::get_offset( const vec2& p, const vec2& v, double t, const field_interface& velocityField,
                                      double timeStep, vec2& outOffset ) const {
    vec2 pTemp = p + timeStep * v;
    field_sample vTemp = velocityField.evaluate_velocity( t + timeStep, pTemp );
    if( !vTemp.valid )
        return false;

    outOffset = 0.5 * timeStep * ( v + vTemp.velocity );
    return true;
}

} // namespace drift
