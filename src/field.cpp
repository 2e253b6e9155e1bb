// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#include "stdafx.h"

#include <drift/field.hpp>

#include <stdexcept>

namespace drift {

gridded_velocity_field::gridded_velocity_field() { m_velocityScale = 1.0; }

double gridded_velocity_field::get_velocity_scale() const { return m_velocityScale; }

void gridded_velocity_field::set_velocity_scale( double newScale ) { m_velocityScale = newScale; }

bool gridded_velocity_field::has_scalar() const { return static_cast<bool>( m_scalarSource ); }

bool gridded_velocity_field::evaluate_scalar( double t, const vec2& p, double& outValue ) const {
    if( !m_scalarSource )
        return false;

    return m_scalarSource->sample_at( t, p.x, p.y, outValue );
}

void gridded_velocity_field::set_scalar_source( scalar_resolver_ptr pScalar ) { m_scalarSource = pScalar; }

scalar_resolver_ptr gridded_velocity_field::get_scalar_source() const { return m_scalarSource; }

component_velocity_field::component_velocity_field( scalar_resolver_ptr pU, scalar_resolver_ptr pV )
    : m_u( pU )
    , m_v( pV ) {
    if( !m_u || !m_v )
        throw std::invalid_argument(
            "component_velocity_field::component_velocity_field() - the velocity components cannot be NULL" );
}

field_sample component_velocity_field::evaluate_velocity( double t, const vec2& p ) const {
    vec2 v;

    if( !m_u->sample_at( t, p.x, p.y, v.x ) || !m_v->sample_at( t, p.x, p.y, v.y ) )
        return field_sample::invalid();

    return field_sample( get_velocity_scale() * v );
}

vector_velocity_field::vector_velocity_field( vector_resolver_ptr pVelocity )
    : m_velocity( pVelocity ) {
    if( !m_velocity )
        throw std::invalid_argument( "vector_velocity_field::vector_velocity_field() - the velocity cannot be NULL" );
}

field_sample vector_velocity_field::evaluate_velocity( double t, const vec2& p ) const {
    vec2 v;

    if( !m_velocity->sample_at( t, p.x, p.y, v ) )
        return field_sample::invalid();

    return field_sample( get_velocity_scale() * v );
}

} // namespace drift
