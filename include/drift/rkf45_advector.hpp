// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <drift/advector_interface.hpp>

namespace drift {

/**
 * Runge-Kutta-Fehlberg 4(5). get_offset() advances with the 4th order weights and get_offset_pair() additionally
 * returns the embedded 5th order offset, computed from the same six stages.
 */
class rkf45_advector : public advector_interface {
  public:
    virtual ~rkf45_advector() {}

    virtual integrator_type get_type() const { return kRKF45; }

    virtual bool get_offset( const vec2& p, const vec2& v, double t, const field_interface& velocityField,
                             double timeStep, vec2& outOffset ) const;

    virtual bool has_error_estimate() const { return true; }

    virtual bool get_offset_pair( const vec2& p, const vec2& v, double t, const field_interface& velocityField,
                                  double timeStep, vec2& outOffset, vec2& outHigherOffset ) const;

  private:
    bool evaluate_stages( const vec2& p, const vec2& v, double t, const field_interface& velocityField,
                          double timeStep, vec2 ( &outStages )[6] ) const;
};

} // namespace drift
