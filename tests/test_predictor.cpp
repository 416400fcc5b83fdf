#include <doctest/doctest.h>

#include "agent.hpp"
#include "autodiff.hpp"
#include "parameters.hpp"
#include "perception.hpp"
#include "predictor.hpp"

#include <random>
#include <stdexcept>
#include <vector>

namespace predictor_tests
{
AgentState state_at(int id, double x, double y, const Eigen::Vector2d &velocity = Eigen::Vector2d::Zero())
{
    AgentState s;
    s.id = id;
    s.position = Eigen::Vector2d(x, y);
    s.velocity = velocity;
    return s;
}

WorldSnapshot world_of(const std::vector<AgentState> &agents, const Parameters &p)
{
    WorldSnapshot world;
    world.width = p.kWIDTH;
    world.height = p.kHEIGHT;
    world.dt = p.kTIMESTEP;
    world.agents = agents;
    return world;
}
} // namespace predictor_tests

using predictor_tests::state_at;
using predictor_tests::world_of;

TEST_CASE("kinematic prediction re-encodes the extrapolated world")
{
    const Parameters p;
    const KinematicPredictor predictor;
    const AgentState self = state_at(0, 300.0, 300.0);
    const AgentState other = state_at(1, 340.0, 302.0, Eigen::Vector2d(-5.0, 0.0));
    const WorldSnapshot world = world_of({self, other}, p);
    const SaliencyMap<double> current = encode(self, world, p);

    const Eigen::Vector2d action(10.0, 0.0);
    const SaliencyMap<ActionScalar> predicted = predictor.predict(self, current, make_action(action), world, p);
    REQUIRE(predicted.has_shape(p.kNR, p.kNTHETA));
    CHECK(predicted.all_finite());

    const double dt = p.kPREDICTION_DT;
    const std::vector<AgentState> moved{state_at(1, 340.0 - 5.0 * dt, 302.0, Eigen::Vector2d(-5.0, 0.0))};
    const SaliencyMap<double> expected =
        encode<double>(Eigen::Vector2d(300.0 + 10.0 * dt, 300.0), action, 0.0, self.personal_space, moved, 0,
                       p.kWIDTH, p.kHEIGHT, p);
    const SaliencyMap<double> values = predicted.values();
    for (int k = 0; k < kN_CHANNELS; ++k)
        CHECK((values.channels[k] - expected.channels[k]).cwiseAbs().maxCoeff() == doctest::Approx(0.0));

    // speeding up toward the neighbor changes the forecast
    double derivative_mass = 0.0;
    for (Eigen::Index i = 0; i < predicted.occupancy().size(); ++i)
        derivative_mass += derivative_of(predicted.occupancy()(i)).norm();
    CHECK(derivative_mass > 0.0);
}

TEST_CASE("kinematic prediction of an empty world is zero with zero gradient")
{
    const Parameters p;
    const KinematicPredictor predictor;
    const AgentState self = state_at(0, 10.0, 10.0);
    const WorldSnapshot world = world_of({self}, p);
    const SaliencyMap<ActionScalar> predicted =
        predictor.predict(self, SaliencyMap<double>(p.kNR, p.kNTHETA), make_action(Eigen::Vector2d(-30.0, 4.0)),
                          world, p);
    for (const auto &channel : predicted.channels)
        for (Eigen::Index i = 0; i < channel.size(); ++i)
        {
            CHECK(channel(i).value() == 0.0);
            CHECK(channel(i).derivatives().isZero());
        }
    CHECK(predictor.next_memory(self, SaliencyMap<double>(p.kNR, p.kNTHETA), Eigen::Vector2d(1.0, 0.0), p).size() ==
          0);
}

TEST_CASE("learned prediction has the map shape and non-negative occupancy")
{
    Parameters p;
    p.kHIDDEN_SIZE = 8;
    std::mt19937 mt(3);
    const LearnedPredictor predictor = LearnedPredictor::random(p, mt);
    CHECK(predictor.hidden_size() == 8);
    CHECK(predictor.map_size() == kN_CHANNELS * p.kNR * p.kNTHETA);

    const AgentState self = state_at(0, 300.0, 300.0, Eigen::Vector2d(5.0, 0.0));
    const WorldSnapshot world = world_of({self, state_at(1, 330.0, 300.0)}, p);
    const SaliencyMap<double> current = encode(self, world, p);
    const SaliencyMap<ActionScalar> predicted =
        predictor.predict(self, current, make_action(Eigen::Vector2d(5.0, 1.0)), world, p);

    REQUIRE(predicted.has_shape(p.kNR, p.kNTHETA));
    CHECK(predicted.all_finite());
    CHECK((predicted.values().occupancy().array() >= 0.0).all());

    SUBCASE("memory advances without touching the prediction input")
    {
        const Eigen::VectorXd memory = predictor.next_memory(self, current, Eigen::Vector2d(5.0, 1.0), p);
        REQUIRE(memory.size() == 8);
        CHECK(memory.allFinite());
        CHECK(memory.cwiseAbs().maxCoeff() < 1.0);

        AgentState remembered = self;
        remembered.memory = memory;
        const SaliencyMap<ActionScalar> again =
            predictor.predict(remembered, current, make_action(Eigen::Vector2d(5.0, 1.0)), world, p);
        CHECK(again.all_finite());
        CHECK(remembered.memory == memory);
    }
    SUBCASE("mis-sized inputs are rejected")
    {
        const SaliencyMap<double> wrong(p.kNR + 1, p.kNTHETA);
        CHECK_THROWS_AS(predictor.predict(self, wrong, make_action(Eigen::Vector2d::Zero()), world, p),
                        std::invalid_argument);
        AgentState stale = self;
        stale.memory = Eigen::VectorXd::Zero(3);
        CHECK_THROWS_AS(predictor.next_memory(stale, current, Eigen::Vector2d::Zero(), p), std::invalid_argument);
    }
}

TEST_CASE("learned predictor weights are checked at construction")
{
    Parameters p;
    p.kHIDDEN_SIZE = 4;
    std::mt19937 mt(11);
    const LearnedPredictor reference = LearnedPredictor::random(p, mt);
    CHECK(reference.name() == "learned");

    GruWeights w;
    w.input_weights = Eigen::MatrixXd::Zero(4, 5);
    w.input_bias = Eigen::VectorXd::Zero(4);
    w.gate_weights = Eigen::MatrixXd::Zero(12, 4);
    w.recurrent_weights = Eigen::MatrixXd::Zero(12, 4);
    w.gate_bias = Eigen::VectorXd::Zero(12);
    w.output_weights = Eigen::MatrixXd::Zero(kN_CHANNELS * p.kNR * p.kNTHETA, 4);
    w.output_bias = Eigen::VectorXd::Zero(kN_CHANNELS * p.kNR * p.kNTHETA);
    CHECK_THROWS_AS(LearnedPredictor(w, p.kNR, p.kNTHETA), std::invalid_argument);
}

TEST_CASE("make_predictor follows the configured kind")
{
    Parameters p;
    std::mt19937 mt(5);
    CHECK(make_predictor(p, mt)->name() == "kinematic");
    p.kPREDICTOR = PredictorKind::learned;
    p.kHIDDEN_SIZE = 6;
    CHECK(make_predictor(p, mt)->name() == "learned");
}
