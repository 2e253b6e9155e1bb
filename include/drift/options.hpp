// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>

namespace drift {

enum interpolation_method {
    kLinear,  // Bilinear blend of the enclosing cell's corners
    kNearest, // Value of the closest mesh node
    kCubic    // 4-point Lagrange stencil per axis, shifted inward at the edges
};

enum extrapolation_mode {
    kNoExtrapolation,     // Queries outside the axes are invalid
    kOneCellExtrapolation // Linear extrapolation of the edge cell, up to one cell width past the axes
};

/**
 * Behaviour of a time-varying dataset when queried before its first or after its last slice.
 */
enum time_policy { kClampTime, kInvalidateTime };

enum integrator_type { kEuler, kRK2, kRK4, kRKF45 };

struct sampler_options {
    interpolation_method method;
    extrapolation_mode extrapolation;

    sampler_options()
        : method( kLinear )
        , extrapolation( kNoExtrapolation ) {}

    explicit sampler_options( interpolation_method method_, extrapolation_mode extrapolation_ = kNoExtrapolation )
        : method( method_ )
        , extrapolation( extrapolation_ ) {}
};

// Case-insensitive parsing of user supplied option names. These throw std::invalid_argument for unknown names.
interpolation_method parse_interpolation_method( const std::string& name );
time_policy parse_time_policy( const std::string& name );
integrator_type parse_integrator_type( const std::string& name );

std::string to_string( interpolation_method method );
std::string to_string( time_policy policy );
std::string to_string( integrator_type type );

} // namespace drift
