// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <drift/grid.hpp>

namespace drift {

/**
 * Keeps the nodes lying within 'bounds' grown by 'buffer' on every side.
 * @throw std::out_of_range if fewer than two nodes remain on either axis.
 */
scalar_grid_ptr crop( const scalar_grid& grid, const bounds2& bounds, double buffer = 0.0 );
vector_grid_ptr crop( const vector_grid& grid, const bounds2& bounds, double buffer = 0.0 );

/**
 * Multiplies every value by 'factor', ie. to convert between units.
 */
scalar_grid_ptr scaled( const scalar_grid& grid, double factor );
vector_grid_ptr scaled( const vector_grid& grid, double factor );

/**
 * Combines separate x and y component grids sharing the same axes into a grid of vectors.
 * @throw std::invalid_argument if the axes differ.
 */
vector_grid_ptr combine( const scalar_grid& u, const scalar_grid& v );

/**
 * @return sqrt(u^2 + v^2) at every node. Missing inputs give missing outputs.
 */
scalar_grid_ptr speed( const scalar_grid& u, const scalar_grid& v );
scalar_grid_ptr speed( const vector_grid& uv );

/**
 * @return du/dx + dv/dy at every node, using second order central differences on the (possibly non-uniform) mesh and
 * first order one sided differences along the edges.
 */
scalar_grid_ptr divergence( const scalar_grid& u, const scalar_grid& v );

/**
 * Replaces every missing value with the value of the closest valid node, measured in grid coordinates.
 * @throw std::invalid_argument if the grid has no valid value.
 */
scalar_grid_ptr inpaint_nearest( const scalar_grid& grid );
vector_grid_ptr inpaint_nearest( const vector_grid& grid );

/**
 * Fills missing values by penalised least squares smoothing in the discrete cosine domain, starting from the
 * inpaint_nearest() result. Over the iterations the smoothing parameter falls logarithmically from 10^smoothing to
 * 10^-6. Each iteration blends the smoothed estimate with the previous one by 'relaxation'. Valid nodes keep their
 * values and zero iterations is the same as inpaint_nearest().
 *
 * @param power Exponent applied to the Laplacian eigenvalues of the penalty.
 * @throw std::invalid_argument if the grid has no valid value or a parameter is non-finite.
 */
scalar_grid_ptr inpaint_smooth( const scalar_grid& grid, std::size_t iterations, double smoothing = 3.0,
                                double power = 2.0, double relaxation = 2.0 );
vector_grid_ptr inpaint_smooth( const vector_grid& grid, std::size_t iterations, double smoothing = 3.0,
                                double power = 2.0, double relaxation = 2.0 );

} // namespace drift
