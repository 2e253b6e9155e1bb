// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <drift/field_interface.hpp>

#include <stdexcept>
#include <vector>

namespace drift {

/**
 * Sums the velocities of several fields. A query is only valid where every constituent field is valid. The auxiliary
 * scalar is taken from the first constituent that has one.
 */
class additive_velocity_field : public field_interface {
  public:
    template <class ForwardIterator>
    additive_velocity_field( ForwardIterator begin, ForwardIterator end );

    virtual ~additive_velocity_field();

    virtual double get_velocity_scale() const;

    virtual void set_velocity_scale( double newScale );

    virtual field_sample evaluate_velocity( double t, const vec2& p ) const;

    virtual bool has_scalar() const;

    virtual bool evaluate_scalar( double t, const vec2& p, double& outValue ) const;

    std::size_t get_field_count() const { return m_implFields.size(); }

  private:
    void validate_fields() const;

  private:
    std::vector<field_interface_ptr> m_implFields;

    double m_velocityScale;
};

template <class ForwardIterator>
additive_velocity_field::additive_velocity_field( ForwardIterator begin, ForwardIterator end )
    : m_implFields( begin, end )
    , m_velocityScale( 1.0 ) {
    validate_fields();
}

} // namespace drift
