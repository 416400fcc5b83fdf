#pragma once
#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <vector>

#include "agent.hpp"
#include "parameters.hpp"
#include "perception.hpp"
#include "saliency_map.hpp"

template <typename T> T mean_occupancy(const SaliencyMap<T> &map)
{
    const T total = map.occupancy().sum();
    return total / static_cast<double>(map.occupancy().size());
}

// h = h_max * sigmoid(-alpha * (omega - threshold)); decreasing in omega.
template <typename T> T haze_from_occupancy(const T &omega, const Parameters &p)
{
    using std::exp;
    const T excess = omega - p.kOMEGA_THRESHOLD;
    const T logit = excess * p.kALPHA;
    const T growth = exp(logit);
    const T denominator = growth + 1.0;
    return p.kH_MAX / denominator;
}

template <typename T> T self_haze(const SaliencyMap<T> &map, const Parameters &p)
{
    const T omega = mean_occupancy(map);
    return haze_from_occupancy(omega, p);
}

inline double base_precision(int r, int n_r, const Parameters &p)
{
    const double r_norm = static_cast<double>(r) / std::max(n_r - 1, 1);
    return p.kPI_MAX * std::exp(-p.kDECAY_RATE * r_norm);
}

// Pi(r, theta) = max(base(r) * (1 - h)^gamma, floor); haze attenuates every bin alike.
template <typename T> Grid<T> precision_field(const SaliencyMap<T> &map, const T &haze, const Parameters &p)
{
    using std::pow;
    const int n_r = map.rows();
    const int n_theta = map.cols();
    const T clarity = 1.0 - haze;
    const T attenuation = pow(clarity, p.kGAMMA);

    Grid<T> pi(n_r, n_theta);
    for (int r = 0; r < n_r; ++r)
    {
        const T scaled = attenuation * base_precision(r, n_r, p);
        const T clamped = scaled > p.kPRECISION_FLOOR ? scaled : T(p.kPRECISION_FLOOR);
        for (int t = 0; t < n_theta; ++t)
            pi(r, t) = clamped;
    }
    return pi;
}

// H = -1/2 * sum log(Pi_i + eps), the Gaussian entropy up to a constant.
template <typename T> T belief_entropy(const Grid<T> &precision)
{
    using std::log;
    T log_det(0.0);
    for (Eigen::Index i = 0; i < precision.size(); ++i)
    {
        const T shifted = precision(i) + kENTROPY_EPSILON;
        log_det += log(shifted);
    }
    return log_det * -0.5;
}

struct OccupancyStats
{
    double total{};
    double normalized{};
    double max{};
    int occupied_bins{};
};

inline OccupancyStats occupancy_stats(const SaliencyMap<double> &map)
{
    const Eigen::MatrixXd &occupancy = map.occupancy();
    OccupancyStats stats;
    if (occupancy.size() == 0)
        return stats;
    stats.total = occupancy.sum();
    stats.normalized = occupancy.mean();
    stats.max = occupancy.maxCoeff();
    stats.occupied_bins = static_cast<int>((occupancy.array() > kOCCUPIED_BIN).count());
    return stats;
}

// Output of the Perceive and Infer-Uncertainty phases for one agent.
struct Perception
{
    SaliencyMap<double> map;
    double haze{};
    Eigen::MatrixXd precision;
    double entropy{};
    std::vector<int> visible;
};

inline Perception perceive(const AgentState &self, const WorldSnapshot &world, const Parameters &p)
{
    Perception out;
    out.map = encode(self, world, p, &out.visible);
    out.haze = self_haze(out.map, p);
    out.precision = precision_field(out.map, out.haze, p);
    out.entropy = belief_entropy(out.precision);
    return out;
}
