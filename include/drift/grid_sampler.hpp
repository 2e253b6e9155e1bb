// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <drift/grid.hpp>

#include <stdexcept>

namespace drift {

/**
 * Answers point queries against one time slice of gridded data. The sampler shares ownership of the grid it was built
 * from and never modifies it, so one sampler may be queried from any number of threads.
 */
template <class T>
class grid_sampler {
  public:
    typedef T value_type;
    typedef boost::shared_ptr<const grid<T> > grid_ptr;

    explicit grid_sampler( grid_ptr pGrid, const sampler_options& options = sampler_options() );

    /**
     * @param[out] outValue The interpolated value. Left untouched if the query is invalid.
     * @return false if (x, y) falls outside of the grid (plus one cell if extrapolation is enabled) or if missing data
     * contributes to the result.
     */
    bool sample( double x, double y, T& outValue ) const;

  private:
    grid_ptr m_grid;
    sampler_options m_options;
};

typedef grid_sampler<double> scalar_sampler;
typedef grid_sampler<vec2> vector_sampler;

template <class T>
inline grid_sampler<T>::grid_sampler( grid_ptr pGrid, const sampler_options& options )
    : m_grid( pGrid )
    , m_options( options ) {
    if( !m_grid )
        throw std::invalid_argument( "grid_sampler::grid_sampler() - the grid cannot be NULL" );
}

template <class T>
inline bool grid_sampler<T>::sample( double x, double y, T& outValue ) const {
    return interpolate( *m_grid, x, y, m_options, outValue );
}

} // namespace drift
