// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <drift/grid_sampler.hpp>

#include <boost/lexical_cast.hpp>
#include <boost/math/special_functions/fpclassify.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

namespace drift {

/**
 * One time-stamped snapshot of a gridded dataset.
 */
template <class T>
struct time_slice {
    double time;
    boost::shared_ptr<const grid<T> > data;

    time_slice()
        : time( 0 ) {}

    time_slice( double time_, const boost::shared_ptr<const grid<T> >& data_ )
        : time( time_ )
        , data( data_ ) {}
};

/**
 * Samples a dataset made of one or more time slices at (t, x, y). A single slice is treated as a steady dataset and
 * ignores t. Otherwise the two slices bracketing t are sampled and linearly blended in time.
 */
template <class T>
class temporal_resolver {
  public:
    typedef T value_type;

    /**
     * Builds a steady dataset from a single grid.
     */
    explicit temporal_resolver( boost::shared_ptr<const grid<T> > pGrid,
                                const sampler_options& options = sampler_options() );

    /**
     * @param slices The time slices, ordered by strictly increasing time.
     */
    explicit temporal_resolver( const std::vector<time_slice<T> >& slices,
                                const sampler_options& options = sampler_options(),
                                time_policy policy = kClampTime );

    /**
     * @param[out] outValue The blended value. Left untouched if the query is invalid.
     * @return false if either bracketing sample is invalid, if t is non-finite, or if t is outside of the dataset's time
     * range and the policy is kInvalidateTime.
     */
    bool sample_at( double t, double x, double y, T& outValue ) const;

    std::size_t get_slice_count() const { return m_samplers.size(); }

    double get_start_time() const { return m_times.front(); }

    double get_end_time() const { return m_times.back(); }

    bool is_steady() const { return m_samplers.size() == 1; }

    time_policy get_time_policy() const { return m_policy; }

    void set_time_policy( time_policy policy ) { m_policy = policy; }

  private:
    std::vector<double> m_times;
    std::vector<grid_sampler<T> > m_samplers;
    time_policy m_policy;
};

typedef temporal_resolver<double> scalar_resolver;
typedef temporal_resolver<vec2> vector_resolver;

typedef boost::shared_ptr<const scalar_resolver> scalar_resolver_ptr;
typedef boost::shared_ptr<const vector_resolver> vector_resolver_ptr;

template <class T>
inline temporal_resolver<T>::temporal_resolver( boost::shared_ptr<const grid<T> > pGrid,
                                                const sampler_options& options )
    : m_policy( kClampTime ) {
    m_times.push_back( 0.0 );
    m_samplers.push_back( grid_sampler<T>( pGrid, options ) );
}

template <class T>
inline temporal_resolver<T>::temporal_resolver( const std::vector<time_slice<T> >& slices,
                                                const sampler_options& options, time_policy policy )
    : m_policy( policy ) {
    if( slices.empty() )
        throw std::invalid_argument( "temporal_resolver::temporal_resolver() - at least one time slice is required" );

    m_times.reserve( slices.size() );
    m_samplers.reserve( slices.size() );

    for( std::size_t i = 0, iEnd = slices.size(); i < iEnd; ++i ) {
        const double t = slices[i].time;

        if( !( boost::math::isfinite )( t ) )
            throw std::invalid_argument( "temporal_resolver::temporal_resolver() - slice " +
                                         boost::lexical_cast<std::string>( i ) + " has a non-finite time" );
        if( i > 0 && !( t > m_times.back() ) )
            throw std::invalid_argument( "temporal_resolver::temporal_resolver() - slice " +
                                         boost::lexical_cast<std::string>( i ) +
                                         " is not strictly after the previous slice" );
        if( !slices[i].data )
            throw std::invalid_argument( "temporal_resolver::temporal_resolver() - slice " +
                                         boost::lexical_cast<std::string>( i ) + " has a NULL grid" );

        m_times.push_back( t );
        m_samplers.push_back( grid_sampler<T>( slices[i].data, options ) );
    }
}

template <class T>
inline bool temporal_resolver<T>::sample_at( double t, double x, double y, T& outValue ) const {
    if( m_samplers.size() == 1 )
        return m_samplers[0].sample( x, y, outValue );

    if( !( boost::math::isfinite )( t ) )
        return false;

    if( t <= m_times.front() ) {
        if( t < m_times.front() && m_policy == kInvalidateTime )
            return false;
        return m_samplers.front().sample( x, y, outValue );
    }

    if( t >= m_times.back() ) {
        if( t > m_times.back() && m_policy == kInvalidateTime )
            return false;
        return m_samplers.back().sample( x, y, outValue );
    }

    // m_times[i1 - 1] <= t < m_times[i1]
    const std::size_t i1 = static_cast<std::size_t>( std::upper_bound( m_times.begin(), m_times.end(), t ) -
                                                     m_times.begin() );
    const std::size_t i0 = i1 - 1;

    if( t == m_times[i0] )
        return m_samplers[i0].sample( x, y, outValue );

    T s0, s1;
    if( !m_samplers[i0].sample( x, y, s0 ) || !m_samplers[i1].sample( x, y, s1 ) )
        return false;

    const double t0 = m_times[i0];
    const double t1 = m_times[i1];
    const double span = t1 - t0;

    outValue = ( ( t1 - t ) / span ) * s0 + ( ( t - t0 ) / span ) * s1;
    return true;
}

} // namespace drift
