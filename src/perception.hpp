#pragma once
#include <Eigen/Dense>

#include <cmath>
#include <vector>

#include "agent.hpp"
#include "autodiff.hpp"
#include "parameters.hpp"
#include "saliency_map.hpp"
#include "toroidal.hpp"

// Saliency polar map conventions
//  radial:  coordinate 0 at or inside personal space, then (Nr - 1) * ln(d / ps) / ln(range / ps),
//           so bin 0 is centered on the personal-space boundary and bin Nr - 1 on the range limit.
//  angular: coordinate (rel + fov / 2) / fov * Ntheta - 0.5, bin j centered at j. The axis is
//           clipped at the field-of-view edges; kernel mass outside [0, Ntheta) is dropped.

// Relative angle of the center of angular bin t, measured from the heading.
inline double bin_bearing(int t, const Parameters &p)
{
    return -0.5 * p.kFOV_ANGLE + (t + 0.5) * p.kFOV_ANGLE / p.kNTHETA;
}

template <typename T> T radial_coordinate(const T &distance, double personal_space, const Parameters &p)
{
    using std::log;
    if (distance <= personal_space)
        return T(0.0);
    const double log_span = std::log(p.kFOV_RANGE / personal_space) + kLOG_SCALE_EPSILON;
    const T ratio = distance / personal_space;
    const T log_ratio = log(ratio);
    return log_ratio * (static_cast<double>(p.kNR - 1) / log_span);
}

template <typename T> T angular_coordinate(const T &relative_angle, const Parameters &p)
{
    const T shifted = relative_angle + 0.5 * p.kFOV_ANGLE;
    return shifted * (p.kNTHETA / p.kFOV_ANGLE) - 0.5;
}

// Separable Gaussian splat of one neighbor around its continuous (r, theta) coordinate.
// Every weight is a smooth function of the coordinates; only bins further than
// kSPLAT_RADIUS from the center are skipped.
template <typename T>
void splat(SaliencyMap<T> &map, const T &r_coord, const T &t_coord, const T &v_radial, const T &v_tangential,
           const Parameters &p)
{
    using std::exp;
    const double inv_var_r = 1.0 / (2.0 * p.kSIGMA_R * p.kSIGMA_R);
    const double inv_var_t = 1.0 / (2.0 * p.kSIGMA_THETA * p.kSIGMA_THETA);
    const double reach = p.kSPLAT_RADIUS;

    for (int r = 0; r < map.rows(); ++r)
    {
        const T dr = static_cast<double>(r) - r_coord;
        if (std::abs(value_of(dr)) > reach)
            continue;
        for (int t = 0; t < map.cols(); ++t)
        {
            const T dt = static_cast<double>(t) - t_coord;
            if (std::abs(value_of(dt)) > reach)
                continue;
            const T exponent = dr * dr * (-inv_var_r) - dt * dt * inv_var_t;
            const T weight = exp(exponent);
            map.channels[kOCCUPANCY](r, t) += weight;
            map.channels[kRADIAL_VELOCITY](r, t) += weight * v_radial;
            map.channels[kTANGENTIAL_VELOCITY](r, t) += weight * v_tangential;
        }
    }
}

// Builds the tensor seen from (self_position, heading). `others` may contain the
// agent itself; entries with self_id are skipped. Returns a fresh tensor, the
// inputs are never modified, so the same path can be differentiated.
template <typename T>
SaliencyMap<T> encode(const Vec2<T> &self_position, const Vec2<T> &self_velocity, const T &heading,
                      double personal_space, const std::vector<AgentState> &others, int self_id, double width,
                      double height, const Parameters &p, std::vector<int> *visible = nullptr)
{
    using std::cos;
    using std::sin;
    SaliencyMap<T> map(p.kNR, p.kNTHETA);
    const double half_fov = 0.5 * p.kFOV_ANGLE;

    for (const AgentState &other : others)
    {
        if (other.id == self_id)
            continue;

        const Vec2<T> other_position = other.position.cast<T>();
        const Vec2<T> offset = toroidal_displacement(self_position, other_position, width, height);
        const T distance = norm_of(offset);
        if (distance > p.kFOV_RANGE)
            continue;

        const T bearing = polar_angle(offset(1), offset(0));
        const T turned = bearing - heading;
        const T relative = wrap_angle(turned);
        if (std::abs(value_of(relative)) > half_fov)
            continue;
        if (visible)
            visible->push_back(other.id);

        const Vec2<T> relative_velocity = other.velocity.cast<T>() - self_velocity;
        const T c = cos(bearing);
        const T s = sin(bearing);
        const T v_radial = relative_velocity(0) * c + relative_velocity(1) * s;
        const T v_tangential = relative_velocity(1) * c - relative_velocity(0) * s;

        const T r_coord = radial_coordinate(distance, personal_space, p);
        const T t_coord = angular_coordinate(relative, p);
        splat(map, r_coord, t_coord, v_radial, v_tangential, p);
    }
    return map;
}

inline SaliencyMap<double> encode(const AgentState &self, const WorldSnapshot &world, const Parameters &p,
                                  std::vector<int> *visible = nullptr)
{
    return encode<double>(self.position, self.velocity, self.heading, self.personal_space, world.agents, self.id,
                          world.width, world.height, p, visible);
}
