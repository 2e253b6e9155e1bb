// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <drift/field_interface.hpp>

namespace drift {

/**
 * A uniform, steady velocity field. If a domain is given, queries outside of it are invalid.
 */
class constant_velocity_field : public field_interface {
  public:
    explicit constant_velocity_field( const vec2& velocity );

    constant_velocity_field( const vec2& velocity, const bounds2& domain );

    virtual ~constant_velocity_field();

    virtual double get_velocity_scale() const;

    virtual void set_velocity_scale( double newScale );

    virtual field_sample evaluate_velocity( double t, const vec2& p ) const;

  private:
    vec2 m_velocity;
    bounds2 m_domain;
    bool m_bounded;
    double m_velocityScale;
};

inline constant_velocity_field::constant_velocity_field( const vec2& velocity )
    : m_velocity( velocity )
    , m_bounded( false )
    , m_velocityScale( 1.0 ) {}

inline constant_velocity_field::constant_velocity_field( const vec2& velocity, const bounds2& domain )
    : m_velocity( velocity )
    , m_domain( domain )
    , m_bounded( true )
    , m_velocityScale( 1.0 ) {}

inline constant_velocity_field::~constant_velocity_field() {}

inline double constant_velocity_field::get_velocity_scale() const { return m_velocityScale; }

inline void constant_velocity_field::set_velocity_scale( double newScale ) { m_velocityScale = newScale; }

inline field_sample constant_velocity_field::evaluate_velocity( double, const vec2& p ) const {
    if( !p.is_finite() || ( m_bounded && !m_domain.contains( p ) ) )
        return field_sample::invalid();

    return field_sample( m_velocityScale * m_velocity );
}

} // namespace drift
