// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <drift/data_types.hpp>

#include <boost/shared_ptr.hpp>

#include <limits>

namespace drift {

/**
 * The result of a point query against a velocity field. 'velocity' and 'scalar' are only meaningful when 'valid' is
 * true. 'scalar' is NaN when the field has no auxiliary scalar or it could not be sampled.
 */
struct field_sample {
    vec2 velocity;
    double scalar;
    bool valid;

    field_sample()
        : scalar( std::numeric_limits<double>::quiet_NaN() )
        , valid( false ) {}

    explicit field_sample( const vec2& velocity_ )
        : velocity( velocity_ )
        , scalar( std::numeric_limits<double>::quiet_NaN() )
        , valid( true ) {}

    static field_sample invalid() { return field_sample(); }
};

class field_interface {
  public:
    virtual ~field_interface() {}

    virtual double get_velocity_scale() const = 0;

    /**
     * The scale is applied to every velocity this field returns, ie. to convert from the dataset's units.
     */
    virtual void set_velocity_scale( double newScale ) = 0;

    virtual field_sample evaluate_velocity( double t, const vec2& p ) const = 0;

    /**
     * @return true if this field carries an auxiliary scalar that is recorded along trajectories.
     */
    virtual bool has_scalar() const { return false; }

    virtual bool evaluate_scalar( double /*t*/, const vec2& /*p*/, double& /*outValue*/ ) const { return false; }

    /**
     * Evaluates the velocity and, if the velocity is valid, the auxiliary scalar. A missing scalar does not invalidate
     * the sample.
     */
    field_sample evaluate( double t, const vec2& p ) const {
        field_sample result = evaluate_velocity( t, p );

        if( result.valid && has_scalar() ) {
            double value;
            if( evaluate_scalar( t, p, value ) )
                result.scalar = value;
        }

        return result;
    }
};

typedef boost::shared_ptr<field_interface> field_interface_ptr;

} // namespace drift
