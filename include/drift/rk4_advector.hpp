// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <drift/advector_interface.hpp>
#include <drift/field_interface.hpp>

namespace drift {

class rk4_advector : public advector_interface {
  public:
    virtual ~rk4_advector() {}

    virtual integrator_type get_type() const { return kRK4; }

    virtual bool get_offset( const vec2& p, const vec2& v, double t, const field_interface& velocityField,
                             double timeStep, vec2& outOffset ) const;
};

inline bool rk4_advector::get_offset( const vec2& p, const vec2& v, double t, const field_interface& velocityField,
                                      double timeStep, vec2& outOffset ) const {
    const double halfStep = 0.5 * timeStep;

    field_sample v2 = velocityField.evaluate_velocity( t + halfStep, p + halfStep * v );
    if( !v2.valid )
        return false;

    field_sample v3 = velocityField.evaluate_velocity( t + halfStep, p + halfStep * v2.velocity );
    if( !v3.valid )
        return false;

    field_sample v4 = velocityField.evaluate_velocity( t + timeStep, p + timeStep * v3.velocity );
    if( !v4.valid )
        return false;

    outOffset = ( timeStep / 6.0 ) * ( v + 2.0 * ( v2.velocity + v3.velocity ) + v4.velocity );
    return true;
}

} // namespace drift
