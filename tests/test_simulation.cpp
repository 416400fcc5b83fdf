#include <doctest/doctest.h>

#include "agent.hpp"
#include "parameters.hpp"
#include "predictor.hpp"
#include "scenarios.hpp"
#include "simulation.hpp"
#include "toroidal.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace simulation_tests
{
class ThrowingPredictor final : public Predictor
{
  public:
    SaliencyMap<ActionScalar> predict(const AgentState &, const SaliencyMap<double> &, const ActionVector &,
                                      const WorldSnapshot &, const Parameters &) const override
    {
        throw std::runtime_error("forward model unavailable");
    }
    std::string name() const override
    {
        return "throwing";
    }
};

// Rate at which the pair's separation shrinks.
double closing_speed(const Environment &env)
{
    const Agent &a = env.agents[0];
    const Agent &b = env.agents[1];
    const Eigen::Vector2d d = toroidal_displacement<double>(a.position, b.position, env.width, env.height);
    const Eigen::Vector2d relative = b.velocity - a.velocity;
    return -relative.dot(d) / d.norm();
}

double separation(const Environment &env)
{
    return toroidal_distance<double>(env.agents[0].position, env.agents[1].position, env.width, env.height);
}

bool inside(const Eigen::Vector2d &position, const Parameters &p)
{
    return position.x() >= 0.0 && position.x() < p.kWIDTH && position.y() >= 0.0 && position.y() < p.kHEIGHT;
}
} // namespace simulation_tests

TEST_CASE("a head-on pair brakes before contact and closes slower than at constant velocity")
{
    const Parameters p;
    const double speed = 20.0;
    std::mt19937 mt(44);
    Simulation sim(p, mt, head_on_pair(p, 100.0, speed));
    const double contact = sim.env.agents[0].radius + sim.env.agents[1].radius;

    double min_separation = simulation_tests::separation(sim.env);
    for (int i = 0; i < 60; ++i)
    {
        const StepStats stats = sim.update_state();
        CHECK(stats.collisions == 0);
        min_separation = std::min(min_separation, simulation_tests::separation(sim.env));
        if (i == 19)
        {
            CHECK(simulation_tests::closing_speed(sim.env) < 0.9 * 2.0 * speed);
        }
    }

    CHECK(min_separation > contact);
    for (const Agent &agent : sim.env.agents)
        CHECK(agent.velocity.norm() <= agent.max_speed + 1e-9);
}

TEST_CASE("an isolated agent reports high haze")
{
    Parameters p;
    std::mt19937 mt(1);
    std::vector<Agent> agents;
    agents.emplace_back(0, Eigen::Vector2d(300.0, 300.0), 0.0, p);
    agents.back().velocity = Eigen::Vector2d(10.0, 0.0);
    Simulation sim(p, mt, std::move(agents));

    for (int i = 0; i < 5; ++i)
        sim.update_state();
    const FrameSnapshot frame = sim.frame(true);
    REQUIRE(frame.agents.size() == 1);
    CHECK(frame.agents[0].self_haze > 0.5 * p.kH_MAX);
    CHECK(frame.agents[0].visible == 0);
    REQUIRE(frame.agents[0].map.has_value());
    CHECK(frame.agents[0].map->has_shape(p.kNR, p.kNTHETA));
    CHECK(frame.frame == 5);
}

TEST_CASE("random exploration stays bounded and finite")
{
    Parameters p;
    p.kN_AGENTS = 20;
    std::mt19937 mt(2024);
    Simulation sim(p, mt);
    REQUIRE(sim.size() == 20);

    for (int i = 0; i < 10; ++i)
    {
        const StepStats stats = sim.update_state();
        CHECK(stats.discarded == 0);
        CHECK(stats.predictor_failures == 0);
    }
    for (const Agent &agent : sim.env.agents)
    {
        CHECK(simulation_tests::inside(agent.position, p));
        CHECK(agent.velocity.norm() <= agent.max_speed + 1e-9);
        REQUIRE(agent.trace.cost_history.size() == static_cast<std::size_t>(p.kMAX_ITER));
        for (double c : agent.trace.cost_history)
            CHECK(std::isfinite(c));
        CHECK(agent.previous_map.has_shape(p.kNR, p.kNTHETA));
    }
    CHECK(sim.frame_count() == 10);
    CHECK(sim.env.coverage_fraction() > 0.0);
}

TEST_CASE("the same seed reproduces the same run")
{
    Parameters p;
    p.kN_AGENTS = 8;
    std::mt19937 first_mt(99);
    std::mt19937 second_mt(99);
    Simulation first(p, first_mt);
    Simulation second(p, second_mt);
    for (int i = 0; i < 5; ++i)
    {
        first.update_state();
        second.update_state();
    }
    for (int i = 0; i < first.size(); ++i)
    {
        CHECK(first.env.agents[i].position == second.env.agents[i].position);
        CHECK(first.env.agents[i].velocity == second.env.agents[i].velocity);
    }
}

TEST_CASE("velocity changes are limited by the acceleration bound")
{
    Parameters p;
    std::mt19937 mt(4);
    std::vector<Agent> agents;
    agents.emplace_back(0, Eigen::Vector2d(100.0, 100.0), 0.0, p);
    agents.back().goal = Eigen::Vector2d(100.0, 300.0);
    Simulation sim(p, mt, std::move(agents));

    Eigen::Vector2d previous = sim.env.agents[0].velocity;
    for (int i = 0; i < 5; ++i)
    {
        sim.update_state();
        const Eigen::Vector2d current = sim.env.agents[0].velocity;
        CHECK((current - previous).norm() <= p.kMAX_ACCEL * p.kTIMESTEP + 1e-9);
        previous = current;
    }
}

TEST_CASE("agents wrap around the world edge")
{
    Parameters p;
    std::mt19937 mt(8);
    std::vector<Agent> agents;
    agents.emplace_back(0, Eigen::Vector2d(p.kWIDTH - 1.0, 50.0), 0.0, p);
    agents.back().velocity = Eigen::Vector2d(p.kTARGET_SPEED, 0.0);
    Simulation sim(p, mt, std::move(agents));

    for (int i = 0; i < 3; ++i)
        sim.update_state();
    const Eigen::Vector2d position = sim.env.agents[0].position;
    CHECK(simulation_tests::inside(position, p));
    CHECK(position.x() < 10.0);
}

TEST_CASE("overlapping agents are pushed apart symmetrically")
{
    const Parameters p;
    Environment env(p);
    env.agents.emplace_back(0, Eigen::Vector2d(100.0, 100.0), 0.0, p);
    env.agents.emplace_back(1, Eigen::Vector2d(101.0, 100.0), 0.0, p);
    env.agents.emplace_back(2, Eigen::Vector2d(300.0, 300.0), 0.0, p);
    env.agents.emplace_back(3, Eigen::Vector2d(300.0, 300.0), 0.0, p);
    env.agents.emplace_back(4, Eigen::Vector2d(p.kWIDTH - 0.5, 500.0), 0.0, p);
    env.agents.emplace_back(5, Eigen::Vector2d(0.5, 500.0), 0.0, p);

    CHECK(resolve_collisions(env) == 3);
    for (int i = 0; i < 6; i += 2)
    {
        const Agent &a = env.agents[i];
        const Agent &b = env.agents[i + 1];
        CAPTURE(i);
        CHECK(toroidal_distance<double>(a.position, b.position, env.width, env.height) ==
              doctest::Approx(a.radius + b.radius));
        CHECK(simulation_tests::inside(a.position, p));
        CHECK(simulation_tests::inside(b.position, p));
    }
    CHECK(env.agents[0].position.x() == doctest::Approx(98.5));
    CHECK(env.agents[1].position.x() == doctest::Approx(102.5));
    // coincident agents separate along x
    CHECK(env.agents[2].position.x() == doctest::Approx(298.0));
    CHECK(env.agents[3].position.x() == doctest::Approx(302.0));
    CHECK(resolve_collisions(env) == 0);
}

TEST_CASE("a failing predictor never stops the step")
{
    Parameters p;
    p.kN_AGENTS = 6;
    std::mt19937 mt(13);
    Simulation sim(p, mt, random_exploration(p, mt), std::make_unique<simulation_tests::ThrowingPredictor>());
    CHECK(sim.predictor().name() == "throwing");

    const StepStats stats = sim.update_state();
    CHECK(stats.predictor_failures == p.kN_AGENTS * p.kMAX_ITER);
    CHECK(stats.discarded == 0);
    for (const Agent &agent : sim.env.agents)
    {
        CHECK(agent.position.allFinite());
        CHECK(agent.velocity.allFinite());
    }
}

TEST_CASE("a non-finite agent update is discarded without affecting the others")
{
    Parameters p;
    Environment env(p);
    env.agents.emplace_back(0, Eigen::Vector2d(100.0, 100.0), 0.0, p);
    env.agents.emplace_back(1, Eigen::Vector2d(140.0, 100.0), kPI, p);
    env.agents[0].velocity = Eigen::Vector2d(std::numeric_limits<double>::quiet_NaN(), 0.0);
    env.agents[1].velocity = Eigen::Vector2d(-10.0, 0.0);
    const Eigen::Vector2d stuck = env.agents[0].position;
    const Eigen::Vector2d moving = env.agents[1].position;

    const KinematicPredictor predictor;
    std::mt19937 mt(3);
    const StepStats stats = step(env, p, predictor, mt);

    CHECK(stats.discarded == 1);
    CHECK(env.agents[0].position == stuck);
    CHECK(env.agents[1].position.allFinite());
    CHECK(env.agents[1].velocity.allFinite());
    CHECK(env.agents[1].position != moving);
    CHECK(env.frame_count == 1);
}

TEST_CASE("learned predictor memory advances every step")
{
    Parameters p;
    p.kN_AGENTS = 4;
    p.kPREDICTOR = PredictorKind::learned;
    p.kHIDDEN_SIZE = 8;
    std::mt19937 mt(17);
    Simulation sim(p, mt);
    CHECK(sim.predictor().name() == "learned");

    for (int i = 0; i < 3; ++i)
        sim.update_state();
    for (const Agent &agent : sim.env.agents)
    {
        CHECK(agent.memory.size() == p.kHIDDEN_SIZE);
        CHECK(agent.memory.allFinite());
        CHECK(agent.position.allFinite());
    }
}

TEST_CASE("duplicate agent ids are rejected")
{
    const Parameters p;
    std::mt19937 mt(6);
    std::vector<Agent> agents;
    agents.emplace_back(0, Eigen::Vector2d(10.0, 10.0), 0.0, p);
    agents.emplace_back(0, Eigen::Vector2d(50.0, 10.0), 0.0, p);
    CHECK_THROWS_AS(Simulation(p, mt, agents), std::invalid_argument);
}

TEST_CASE("scenarios populate the world")
{
    Parameters p;
    p.kN_AGENTS = 16;
    std::mt19937 mt(12);

    SUBCASE("scramble crossing")
    {
        const std::vector<Agent> agents = scramble_crossing(p, mt);
        REQUIRE(agents.size() == 16);
        for (const Agent &agent : agents)
        {
            REQUIRE(agent.goal.has_value());
            CHECK(simulation_tests::inside(agent.position, p));
            CHECK(agent.personal_space >= kMIN_PERSONAL_SPACE);
            CHECK(agent.personal_space < kMIN_PERSONAL_SPACE + kPERSONAL_SPACE_SPREAD);
            // each goal lies on the far side of the center
            const Eigen::Vector2d center(0.5 * p.kWIDTH, 0.5 * p.kHEIGHT);
            CHECK((agent.position - center).dot(*agent.goal - center) < 0.0);
        }
    }
    SUBCASE("random exploration")
    {
        const std::vector<Agent> agents = random_exploration(p, mt);
        REQUIRE(agents.size() == 16);
        for (const Agent &agent : agents)
        {
            CHECK_FALSE(agent.goal.has_value());
            CHECK(simulation_tests::inside(agent.position, p));
            CHECK(agent.velocity.norm() <= p.kTARGET_SPEED + 1e-9);
        }
    }
    SUBCASE("head-on pair")
    {
        const std::vector<Agent> agents = head_on_pair(p, 100.0, 20.0);
        REQUIRE(agents.size() == 2);
        CHECK(agents[0].position.x() == doctest::Approx(250.0));
        CHECK(agents[1].position.x() == doctest::Approx(350.0));
        CHECK(agents[0].velocity.x() == doctest::Approx(20.0));
        CHECK(agents[1].velocity.x() == doctest::Approx(-20.0));
    }
}
