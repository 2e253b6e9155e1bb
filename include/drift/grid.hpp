// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <drift/data_types.hpp>
#include <drift/options.hpp>

#include <boost/shared_ptr.hpp>

#include <algorithm>
#include <cstddef>
#include <vector>

namespace drift {

template <class T>
class grid_helper;

/**
 * An immutable regular mesh of samples. The x and y axes are strictly monotonic (increasing or decreasing) and the
 * values are stored row major, aligned to (y, x). Missing data is stored as NaN.
 */
template <class T>
class grid {
  public:
    typedef T value_type;

    inline grid( const std::vector<double>& xAxis, const std::vector<double>& yAxis, const std::vector<T>& values );

    inline std::size_t get_size( int axis ) const;

    inline const std::vector<double>& get_axis( int axis ) const;

    inline double get_coord( int axis, std::size_t i ) const;

    inline const T& get_value( std::size_t x, std::size_t y ) const;

    inline const std::vector<T>& get_values() const;

    /**
     * @return The box spanned by the axes, regardless of their direction.
     */
    inline bounds2 get_bounds() const;

    template <class U>
    friend class grid_helper;

  private:
    std::vector<double> m_axes[2];
    std::vector<T> m_storage;
};

typedef grid<double> scalar_grid;
typedef grid<vec2> vector_grid;

typedef boost::shared_ptr<const scalar_grid> scalar_grid_ptr;
typedef boost::shared_ptr<const vector_grid> vector_grid_ptr;

/**
 * Throws std::invalid_argument unless the axis has at least two finite, strictly monotonic coordinates.
 * @param axisName Used in the exception message.
 */
void validate_axis( const std::vector<double>& axis, const char* axisName );

/**
 * Throws std::invalid_argument unless 'valueCount' matches the (y, x) shape of the axes.
 */
void validate_shape( std::size_t valueCount, std::size_t xSize, std::size_t ySize );

/**
 * Finds the cell of a strictly monotonic axis enclosing 'coord' using a binary search.
 * @param axis The coordinates of the axis.
 * @param coord The coordinate to locate.
 * @param allowExtrapolation If true, coordinates up to one cell width outside of the axis are assigned to the edge cell
 * with a fractional position outside of [0,1].
 * @param[out] outIndex The index of the lower corner of the cell, in [0, size - 2].
 * @param[out] outAlpha The fractional position of 'coord' between axis[outIndex] and axis[outIndex + 1].
 * @return false if 'coord' is not covered by the axis.
 */
bool locate_cell( const std::vector<double>& axis, double coord, bool allowExtrapolation, std::size_t& outIndex,
                  double& outAlpha );

/**
 * Interpolates a grid at (x, y).
 * @return false if the point is outside of the covered domain, or if any missing value contributes to the result.
 */
bool interpolate( const grid<double>& grid, double x, double y, const sampler_options& options, double& outValue );
bool interpolate( const grid<vec2>& grid, double x, double y, const sampler_options& options, vec2& outValue );

template <class T>
inline grid<T>::grid( const std::vector<double>& xAxis, const std::vector<double>& yAxis,
                      const std::vector<T>& values ) {
    validate_axis( xAxis, "x" );
    validate_axis( yAxis, "y" );
    validate_shape( values.size(), xAxis.size(), yAxis.size() );

    m_axes[0] = xAxis;
    m_axes[1] = yAxis;
    m_storage = values;
}

template <class T>
inline std::size_t grid<T>::get_size( int axis ) const {
    return m_axes[axis].size();
}

template <class T>
inline const std::vector<double>& grid<T>::get_axis( int axis ) const {
    return m_axes[axis];
}

template <class T>
inline double grid<T>::get_coord( int axis, std::size_t i ) const {
    return m_axes[axis][i];
}

template <class T>
inline const T& grid<T>::get_value( std::size_t x, std::size_t y ) const {
    return m_storage[x + m_axes[0].size() * y];
}

template <class T>
inline const std::vector<T>& grid<T>::get_values() const {
    return m_storage;
}

template <class T>
inline bounds2 grid<T>::get_bounds() const {
    const std::vector<double>& xs = m_axes[0];
    const std::vector<double>& ys = m_axes[1];

    return bounds2( ( std::min )( xs.front(), xs.back() ), ( std::max )( xs.front(), xs.back() ),
                    ( std::min )( ys.front(), ys.back() ), ( std::max )( ys.front(), ys.back() ) );
}

} // namespace drift
