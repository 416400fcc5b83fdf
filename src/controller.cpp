#include "controller.hpp"

#include <exception>

#include "logging.hpp"
#include "toroidal.hpp"

std::optional<Eigen::Vector2d> preferred_velocity(const AgentState &self, const WorldSnapshot &world)
{
    if (!self.goal)
        return std::nullopt;
    const Eigen::Vector2d to_goal = toroidal_displacement<double>(self.position, *self.goal, world.width, world.height);
    const double distance = to_goal.norm();
    if (distance < kEPSILON)
        return std::nullopt;
    return Eigen::Vector2d(to_goal * (self.max_speed / distance));
}

CostTerms<ActionScalar> evaluate_cost(const ActionVector &action, const AgentState &self,
                                      const Perception &perception, const WorldSnapshot &world,
                                      const std::optional<Eigen::Vector2d> &preferred, const Parameters &p,
                                      const Predictor &predictor)
{
    CostTerms<ActionScalar> cost;
    cost.perceptual = perceptual_free_energy(perception.map, perception.precision, action, self.heading, p);
    cost.meta = meta_cost(action, preferred, p);

    SaliencyMap<ActionScalar> predicted;
    try
    {
        predicted = predictor.predict(self, perception.map, action, world, p);
        if (!predicted.has_shape(p.kNR, p.kNTHETA))
        {
            cost.predictor_failed = true;
            eph_log::get()->debug("Agent {}: {} predictor returned a {}x{} map", self.id, predictor.name(),
                                  predicted.rows(), predicted.cols());
        }
        else if (!predicted.all_finite())
        {
            cost.predictor_failed = true;
            eph_log::get()->debug("Agent {}: {} predictor returned non-finite values", self.id, predictor.name());
        }
    }
    catch (const std::exception &e)
    {
        cost.predictor_failed = true;
        eph_log::get()->debug("Agent {}: {} predictor failed: {}", self.id, predictor.name(), e.what());
    }

    if (!cost.predictor_failed)
    {
        const ActionScalar haze = self_haze(predicted, p);
        const Grid<ActionScalar> precision = precision_field(predicted, haze, p);
        cost.entropy = belief_entropy(precision);
        cost.information = information_gain(predicted);
    }

    const ActionScalar weighted_entropy = cost.entropy * p.kBETA;
    const ActionScalar weighted_information = cost.information * p.kGAMMA_INFO;
    const ActionScalar weighted_meta = cost.meta * p.kLAMBDA;
    cost.total = cost.perceptual + weighted_entropy - weighted_information + weighted_meta;
    return cost;
}

CostTerms<double> expected_free_energy(const Eigen::Vector2d &action, const AgentState &self,
                                       const Perception &perception, const WorldSnapshot &world,
                                       const std::optional<Eigen::Vector2d> &preferred, const Parameters &p,
                                       const Predictor &predictor)
{
    const CostTerms<ActionScalar> cost =
        evaluate_cost(make_action(action), self, perception, world, preferred, p, predictor);
    CostTerms<double> out;
    out.perceptual = cost.perceptual.value();
    out.entropy = cost.entropy.value();
    out.information = cost.information.value();
    out.meta = cost.meta.value();
    out.total = cost.total.value();
    out.predictor_failed = cost.predictor_failed;
    return out;
}

Decision decide_action(const AgentState &self, const Perception &perception, const WorldSnapshot &world,
                       const std::optional<Eigen::Vector2d> &preferred, const Parameters &p,
                       const Predictor &predictor, std::mt19937 &mt)
{
    Decision decision;
    DecisionTrace &trace = decision.trace;
    trace.belief_entropy = perception.entropy;
    trace.cost_history.reserve(p.kMAX_ITER);

    const Eigen::Vector2d previous = self.velocity.allFinite() ? self.velocity : Eigen::Vector2d::Zero();
    Eigen::Vector2d action = previous;
    if (previous.norm() < p.kMIN_INIT_SPEED)
    {
        // a resting agent has no direction to improve on
        std::normal_distribution<double> noise(0.0, p.kINIT_NOISE);
        action.x() = noise(mt);
        action.y() = noise(mt);
    }
    action = clamp_speed(action, self.max_speed);

    for (int iter = 0; iter < p.kMAX_ITER; ++iter)
    {
        const CostTerms<ActionScalar> cost =
            evaluate_cost(make_action(action), self, perception, world, preferred, p, predictor);
        if (cost.predictor_failed)
            ++trace.predictor_failures;

        const double value = cost.total.value();
        Eigen::Vector2d gradient = cost.total.derivatives();
        trace.cost_history.push_back(value);
        if (!std::isfinite(value) || !gradient.allFinite())
        {
            ++trace.skipped_updates;
            continue;
        }

        const double magnitude = gradient.norm();
        if (magnitude > p.kGRAD_CLIP)
            gradient *= p.kGRAD_CLIP / magnitude;
        trace.cost = value;
        trace.gradient = gradient;
        action = clamp_speed(action - p.kETA * gradient, self.max_speed);
    }

    Eigen::Vector2d blended = p.kSMOOTHING * action + (1.0 - p.kSMOOTHING) * previous;
    blended = clamp_speed(blended, self.max_speed);
    if (!blended.allFinite())
    {
        trace.fallback = true;
        blended = preferred ? clamp_speed(*preferred, self.max_speed) : Eigen::Vector2d::Zero();
        if (!blended.allFinite())
            blended.setZero();
        eph_log::get()->warn("Agent {}: non-finite action replaced by the safe default", self.id);
    }
    decision.action = blended;
    return decision;
}
