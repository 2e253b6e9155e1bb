// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#include "stdafx.h"

#include <drift/additive_velocity_field.hpp>

namespace drift {

additive_velocity_field::~additive_velocity_field() {}

void additive_velocity_field::validate_fields() const {
    if( m_implFields.empty() )
        throw std::invalid_argument( "additive_velocity_field::additive_velocity_field() - at least one field is required" );

    for( std::vector<field_interface_ptr>::const_iterator it = m_implFields.begin(), itEnd = m_implFields.end();
         it != itEnd; ++it ) {
        if( !*it )
            throw std::invalid_argument( "additive_velocity_field::additive_velocity_field() - fields cannot be NULL" );
    }
}

double additive_velocity_field::get_velocity_scale() const { return m_velocityScale; }

void additive_velocity_field::set_velocity_scale( double newScale ) { m_velocityScale = newScale; }

field_sample additive_velocity_field::evaluate_velocity( double t, const vec2& p ) const {
    vec2 result( 0, 0 );

    for( std::vector<field_interface_ptr>::const_iterator it = m_implFields.begin(), itEnd = m_implFields.end();
         it != itEnd; ++it ) {
        field_sample part = ( *it )->evaluate_velocity( t, p );
        if( !part.valid )
            return field_sample::invalid();

        result += part.velocity;
    }

    return field_sample( m_velocityScale * result );
}

bool additive_velocity_field::has_scalar() const {
    for( std::vector<field_interface_ptr>::const_iterator it = m_implFields.begin(), itEnd = m_implFields.end();
         it != itEnd; ++it ) {
        if( ( *it )->has_scalar() )
            return true;
    }

    return false;
}

bool additive_velocity_field::evaluate_scalar( double t, const vec2& p, double& outValue ) const {
    for( std::vector<field_interface_ptr>::const_iterator it = m_implFields.begin(), itEnd = m_implFields.end();
         it != itEnd; ++it ) {
        if( ( *it )->has_scalar() )
            return ( *it )->evaluate_scalar( t, p, outValue );
    }

    return false;
}

} // namespace drift
