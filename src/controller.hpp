#pragma once
#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <optional>
#include <random>

#include "agent.hpp"
#include "autodiff.hpp"
#include "haze.hpp"
#include "parameters.hpp"
#include "perception.hpp"
#include "predictor.hpp"
#include "saliency_map.hpp"

// G(a) = F_percept + beta * H_future - gamma_info * I_gain + lambda * M_meta
template <typename T> struct CostTerms
{
    T perceptual{0.0};
    T entropy{0.0};
    T information{0.0};
    T meta{0.0};
    T total{0.0};
    bool predictor_failed{false};
};

// Collision risk on the near radial bins of the current map. max(0, cos(a, u)) * |a|
// is the positive part of the projection of a onto the bin direction u.
template <typename T>
T perceptual_free_energy(const SaliencyMap<double> &map, const Eigen::MatrixXd &precision, const Vec2<T> &action,
                         double heading, const Parameters &p)
{
    T total(0.0);
    const int near = std::min(p.kNEAR_BINS, map.rows());
    for (int r = 0; r < near; ++r)
    {
        for (int t = 0; t < map.cols(); ++t)
        {
            const double weight = map.occupancy()(r, t) * precision(r, t) / (r + 1.0);
            if (weight <= 0.0)
                continue;
            const double bearing = heading + bin_bearing(t, p);
            const T projection = action(0) * std::cos(bearing) + action(1) * std::sin(bearing);
            total += rectify(projection) * weight;
        }
    }
    return total * p.kCOLLISION_GAIN;
}

// Population variance of the occupancy channel.
template <typename T> T information_gain(const SaliencyMap<T> &map)
{
    const Eigen::Index n = map.occupancy().size();
    if (n == 0)
        return T(0.0);
    const T mean = mean_occupancy(map);
    T spread(0.0);
    for (Eigen::Index i = 0; i < n; ++i)
    {
        const T d = map.occupancy()(i) - mean;
        spread += d * d;
    }
    return spread / static_cast<double>(n);
}

template <typename T>
T meta_cost(const Vec2<T> &action, const std::optional<Eigen::Vector2d> &preferred, const Parameters &p)
{
    if (preferred)
    {
        const T dx = action(0) - preferred->x();
        const T dy = action(1) - preferred->y();
        return dx * dx + dy * dy;
    }
    const T speed = norm_of(action);
    const T excess = speed - p.kTARGET_SPEED;
    return excess * excess;
}

// Toward the goal at maximum speed along the shortest toroidal path.
std::optional<Eigen::Vector2d> preferred_velocity(const AgentState &self, const WorldSnapshot &world);

// Full cost with derivatives. Predictor exceptions, malformed shapes and
// non-finite predictions zero H_future and I_gain and set predictor_failed.
CostTerms<ActionScalar> evaluate_cost(const ActionVector &action, const AgentState &self,
                                      const Perception &perception, const WorldSnapshot &world,
                                      const std::optional<Eigen::Vector2d> &preferred, const Parameters &p,
                                      const Predictor &predictor);

CostTerms<double> expected_free_energy(const Eigen::Vector2d &action, const AgentState &self,
                                       const Perception &perception, const WorldSnapshot &world,
                                       const std::optional<Eigen::Vector2d> &preferred, const Parameters &p,
                                       const Predictor &predictor);

struct Decision
{
    Eigen::Vector2d action{Eigen::Vector2d::Zero()};
    DecisionTrace trace;
};

Decision decide_action(const AgentState &self, const Perception &perception, const WorldSnapshot &world,
                       const std::optional<Eigen::Vector2d> &preferred, const Parameters &p,
                       const Predictor &predictor, std::mt19937 &mt);
