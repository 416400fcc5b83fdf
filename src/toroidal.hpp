#pragma once
#include <Eigen/Dense>

#include <cmath>

#include "autodiff.hpp"

// Minimal-image displacement from `from` to `to`, each component in [-W/2, W/2].
// Invariant under adding integer multiples of (W, 0) or (0, H) to either point.
template <typename T>
Vec2<T> toroidal_displacement(const Vec2<T> &from, const Vec2<T> &to, double width, double height)
{
    Vec2<T> d = to - from;
    d(0) -= width * std::round(value_of(d(0)) / width);
    d(1) -= height * std::round(value_of(d(1)) / height);
    return d;
}

template <typename T> T toroidal_distance(const Vec2<T> &from, const Vec2<T> &to, double width, double height)
{
    using std::sqrt;
    const Vec2<T> d = toroidal_displacement(from, to, width, height);
    const T sq = d(0) * d(0) + d(1) * d(1);
    return sqrt(sq);
}

// Wraps into [0, W) x [0, H).
template <typename T> Vec2<T> wrap_position(const Vec2<T> &p, double width, double height)
{
    Vec2<T> w = p;
    w(0) -= width * std::floor(value_of(p(0)) / width);
    w(1) -= height * std::floor(value_of(p(1)) / height);
    if (value_of(w(0)) >= width)
        w(0) -= width;
    if (value_of(w(1)) >= height)
        w(1) -= height;
    return w;
}
