// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <drift/field_interface.hpp>
#include <drift/temporal_resolver.hpp>

namespace drift {

// This class partially implements field_interface for fields backed by gridded datasets. Subclasses still need to
// implement evaluate_velocity().
class gridded_velocity_field : public field_interface {
  public:
    gridded_velocity_field();

    virtual ~gridded_velocity_field() {}

    virtual double get_velocity_scale() const;

    virtual void set_velocity_scale( double newScale );

    virtual field_sample evaluate_velocity( double t, const vec2& p ) const = 0;

    virtual bool has_scalar() const;

    virtual bool evaluate_scalar( double t, const vec2& p, double& outValue ) const;

    /**
     * Sets the dataset sampled alongside the velocity. Pass NULL to remove it.
     */
    void set_scalar_source( scalar_resolver_ptr pScalar );

    scalar_resolver_ptr get_scalar_source() const;

  private:
    double m_velocityScale;

    scalar_resolver_ptr m_scalarSource;
};

/**
 * A velocity field made of two datasets holding the x and y velocity components separately. The two datasets need not
 * share a grid or time axis.
 */
class component_velocity_field : public gridded_velocity_field {
  public:
    component_velocity_field( scalar_resolver_ptr pU, scalar_resolver_ptr pV );

    virtual ~component_velocity_field() {}

    virtual field_sample evaluate_velocity( double t, const vec2& p ) const;

  private:
    scalar_resolver_ptr m_u, m_v;
};

/**
 * A velocity field backed by a single dataset of (u, v) vectors.
 */
class vector_velocity_field : public gridded_velocity_field {
  public:
    explicit vector_velocity_field( vector_resolver_ptr pVelocity );

    virtual ~vector_velocity_field() {}

    virtual field_sample evaluate_velocity( double t, const vec2& p ) const;

  private:
    vector_resolver_ptr m_velocity;
};

} // namespace drift
