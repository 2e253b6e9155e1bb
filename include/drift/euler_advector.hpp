// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <drift/advector_interface.hpp>

namespace drift {

class euler_advector : public advector_interface {
  public:
    virtual ~euler_advector() {}

    virtual integrator_type get_type() const { return kEuler; }

    virtual bool get_offset( const vec2& p, const vec2& v, double t, const field_interface& velocityField,
                             double timeStep, vec2& outOffset ) const;
};

inline bool euler_advector::get_offset( const vec2&, const vec2& v, double, const field_interface&, double timeStep,
                                        vec2& outOffset ) const {
    outOffset = timeStep * v;
    return true;
}

} // namespace drift
