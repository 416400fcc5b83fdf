#include "simulation.hpp"

#include <fmt/format.h>

#include <cmath>
#include <cstdint>
#include <exception>
#include <set>
#include <stdexcept>
#include <utility>

#include "controller.hpp"
#include "haze.hpp"
#include "logging.hpp"
#include "scenarios.hpp"
#include "toroidal.hpp"

FrameSnapshot make_frame(const Environment &env, bool include_maps)
{
    FrameSnapshot frame;
    frame.frame = env.frame_count;
    frame.coverage = env.coverage_fraction();
    frame.agents.reserve(env.agents.size());
    for (const Agent &agent : env.agents)
    {
        AgentFrame view;
        view.id = agent.id;
        view.position = agent.position;
        view.velocity = agent.velocity;
        view.heading = agent.heading;
        view.self_haze = agent.self_haze;
        view.belief_entropy = agent.trace.belief_entropy;
        view.visible = static_cast<int>(agent.visible.size());
        if (include_maps)
            view.map = agent.current_map;
        frame.agents.push_back(std::move(view));
    }
    return frame;
}

double mean_haze(const Environment &env)
{
    if (env.agents.empty())
        return 0.0;
    double total = 0.0;
    for (const Agent &agent : env.agents)
        total += agent.self_haze;
    return total / static_cast<double>(env.agents.size());
}

int resolve_collisions(Environment &env)
{
    const int n = static_cast<int>(env.agents.size());
    std::vector<Eigen::Vector2d> deltas(n, Eigen::Vector2d::Zero());
    int overlaps = 0;

    for (int i = 0; i < n; ++i)
    {
        const Agent &a = env.agents[i];
        for (int j = i + 1; j < n; ++j)
        {
            const Agent &b = env.agents[j];
            const Eigen::Vector2d d = toroidal_displacement<double>(a.position, b.position, env.width, env.height);
            const double distance = d.norm();
            const double contact = a.radius + b.radius;
            if (distance >= contact)
                continue;
            // coincident agents are separated along x
            Eigen::Vector2d normal = Eigen::Vector2d::UnitX();
            if (distance >= kEPSILON)
                normal = d / distance;
            const double push = 0.5 * (contact - distance);
            deltas[i] -= push * normal;
            deltas[j] += push * normal;
            ++overlaps;
        }
    }

    for (int i = 0; i < n; ++i)
    {
        Agent &agent = env.agents[i];
        agent.position = wrap_position<double>(agent.position + deltas[i], env.width, env.height);
    }
    return overlaps;
}

StepStats step(Environment &env, const Parameters &p, const Predictor &predictor, std::mt19937 &mt)
{
    StepStats stats;
    const WorldSnapshot world = env.snapshot();
    const int n = static_cast<int>(world.agents.size());

    std::vector<std::uint32_t> streams(n);
    for (int i = 0; i < n; ++i)
        streams[i] = static_cast<std::uint32_t>(mt());

    // Perceive, Infer-Uncertainty and Act read only the snapshot
    std::vector<Perception> perceptions;
    std::vector<Decision> decisions;
    perceptions.reserve(n);
    decisions.reserve(n);
    for (int i = 0; i < n; ++i)
    {
        const AgentState &self = world.agents[i];
        perceptions.push_back(perceive(self, world, p));
        std::mt19937 stream(streams[i]);
        decisions.push_back(
            decide_action(self, perceptions[i], world, preferred_velocity(self, world), p, predictor, stream));
    }

    // Integrate
    const double max_change = p.kMAX_ACCEL * world.dt;
    for (int i = 0; i < n; ++i)
    {
        Agent &agent = env.agents[i];
        Perception &perception = perceptions[i];
        Decision &decision = decisions[i];
        stats.predictor_failures += decision.trace.predictor_failures;
        if (decision.trace.fallback)
            ++stats.fallbacks;

        Eigen::Vector2d change = decision.action - agent.velocity;
        const double magnitude = change.norm();
        if (magnitude > max_change)
            change *= max_change / magnitude;
        const Eigen::Vector2d velocity = clamp_speed(agent.velocity + change, agent.max_speed);
        const Eigen::Vector2d position =
            wrap_position<double>(agent.position + velocity * world.dt, world.width, world.height);

        agent.trace = std::move(decision.trace);
        if (!velocity.allFinite() || !position.allFinite())
        {
            eph_log::get()->warn("Agent {}: non-finite update discarded, keeping last valid state", agent.id);
            ++stats.discarded;
            continue;
        }

        agent.velocity = velocity;
        agent.position = position;
        if (velocity.norm() > p.kHEADING_SPEED)
            agent.heading = std::atan2(velocity.y(), velocity.x());

        if (!perception.map.all_finite())
        {
            eph_log::get()->warn("Agent {}: non-finite saliency map discarded", agent.id);
            continue;
        }
        agent.previous_map = std::move(agent.current_map);
        agent.current_map = std::move(perception.map);
        agent.precision = std::move(perception.precision);
        agent.self_haze = perception.haze;
        agent.visible = std::move(perception.visible);

        try
        {
            agent.memory = predictor.next_memory(world.agents[i], agent.current_map, velocity, p);
        }
        catch (const std::exception &e)
        {
            eph_log::get()->warn("Agent {}: predictor memory not advanced: {}", agent.id, e.what());
        }
    }

    stats.collisions = resolve_collisions(env);
    env.record_coverage();
    ++env.frame_count;
    return stats;
}

const Parameters &Simulation::validated(const Parameters &params)
{
    validate(params);
    return params;
}

Simulation::Simulation(const Parameters &params, std::mt19937 &mt, std::vector<Agent> agents,
                       std::unique_ptr<Predictor> predictor)
    : p(validated(params)), env(params), seed_(mt)
{
    if (agents.empty())
        agents = random_exploration(p, seed_);

    std::set<int> ids;
    for (Agent &agent : agents)
    {
        if (!ids.insert(agent.id).second)
            throw std::invalid_argument(fmt::format("Duplicate agent id {}", agent.id));
        if (!agent.position.allFinite() || !agent.velocity.allFinite())
            throw std::invalid_argument(fmt::format("Agent {} starts with a non-finite state", agent.id));
        agent.position = wrap_position<double>(agent.position, p.kWIDTH, p.kHEIGHT);
        agent.velocity = clamp_speed(agent.velocity, agent.max_speed);
    }
    env.agents = std::move(agents);

    predictor_ = predictor ? std::move(predictor) : make_predictor(p, seed_);
    prime_perception();
    env.record_coverage();

    eph_log::get()->info("Simulation created: {} agents in a {}x{} world, {} predictor", env.agents.size(),
                         p.kWIDTH, p.kHEIGHT, predictor_->name());
}

// Start-of-run perception so the first frame already reports haze and maps.
void Simulation::prime_perception()
{
    const WorldSnapshot world = env.snapshot();
    for (std::size_t i = 0; i < env.agents.size(); ++i)
    {
        Perception perception = perceive(world.agents[i], world, p);
        Agent &agent = env.agents[i];
        agent.current_map = std::move(perception.map);
        agent.precision = std::move(perception.precision);
        agent.self_haze = perception.haze;
        agent.visible = std::move(perception.visible);
        agent.trace.belief_entropy = perception.entropy;
    }
}

StepStats Simulation::update_state()
{
    const StepStats stats = step(env, p, *predictor_, seed_);
    if (stats.discarded > 0)
        eph_log::get()->warn("Frame {}: {} agent updates discarded", env.frame_count, stats.discarded);
    if (p.kLOG_INTERVAL > 0 && env.frame_count % p.kLOG_INTERVAL == 0)
        eph_log::get()->info("Frame {}: coverage {:.3f}, mean haze {:.3f}, collisions {}, predictor failures {}",
                             env.frame_count, env.coverage_fraction(), mean_haze(env), stats.collisions,
                             stats.predictor_failures);
    return stats;
}
