#pragma once
#include <Eigen/Dense>
#include <unsupported/Eigen/AutoDiff>

#include <cmath>

#include "constants.hpp"

// Forward-mode scalar carrying the derivative with respect to the 2D action.
// Every templated function on the cost path runs on both double and ActionScalar.
// Intermediate AutoDiff values are always stored as a named T, never auto, since
// Eigen returns lazy expressions that reference their operands.
using ActionScalar = Eigen::AutoDiffScalar<Eigen::Vector2d>;
using ActionVector = Eigen::Matrix<ActionScalar, 2, 1>;
template <typename T> using Vec2 = Eigen::Matrix<T, 2, 1>;

inline double value_of(double x)
{
    return x;
}
inline double value_of(const ActionScalar &x)
{
    return x.value();
}

inline bool is_finite(double x)
{
    return std::isfinite(x);
}
inline bool is_finite(const ActionScalar &x)
{
    return std::isfinite(x.value()) && x.derivatives().allFinite();
}

inline Eigen::Vector2d derivative_of(double)
{
    return Eigen::Vector2d::Zero();
}
inline Eigen::Vector2d derivative_of(const ActionScalar &x)
{
    return x.derivatives();
}

// Seeds the two action components as independent variables.
inline ActionVector make_action(const Eigen::Vector2d &a)
{
    ActionVector out;
    out(0) = ActionScalar(a.x(), Eigen::Vector2d::UnitX());
    out(1) = ActionScalar(a.y(), Eigen::Vector2d::UnitY());
    return out;
}

inline Eigen::Vector2d values_of(const ActionVector &a)
{
    return Eigen::Vector2d(a(0).value(), a(1).value());
}
inline Eigen::Vector2d values_of(const Eigen::Vector2d &a)
{
    return a;
}

// atan2 with an analytic derivative, staying in the fixed-size derivative type.
inline double polar_angle(double y, double x)
{
    return std::atan2(y, x);
}
inline ActionScalar polar_angle(const ActionScalar &y, const ActionScalar &x)
{
    const double xv = x.value();
    const double yv = y.value();
    const double r2 = xv * xv + yv * yv + kEPSILON * kEPSILON;
    const Eigen::Vector2d d = (xv * y.derivatives() - yv * x.derivatives()) / r2;
    return ActionScalar(std::atan2(yv, xv), d);
}

template <typename T> T rectify(const T &x)
{
    return x > 0.0 ? x : T(0.0);
}

template <typename T> T norm_of(const Vec2<T> &v)
{
    using std::sqrt;
    const T sq = v(0) * v(0) + v(1) * v(1) + kEPSILON * kEPSILON;
    return sqrt(sq);
}

// Result lies in [-pi, pi].
template <typename T> T wrap_angle(const T &a)
{
    const double turns = std::round(value_of(a) / kTWO_PI);
    return a - turns * kTWO_PI;
}
