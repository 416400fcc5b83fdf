#include <doctest/doctest.h>

#include "agent.hpp"
#include "haze.hpp"
#include "parameters.hpp"

#include <cmath>
#include <vector>

namespace haze_tests
{
AgentState state_at(int id, double x, double y)
{
    AgentState s;
    s.id = id;
    s.position = Eigen::Vector2d(x, y);
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
} // namespace haze_tests

TEST_CASE("haze decreases with mean occupancy")
{
    const Parameters p;
    double previous = haze_from_occupancy(0.0, p);
    CHECK(previous < p.kH_MAX);
    for (double omega = 0.01; omega <= 2.0; omega += 0.01)
    {
        const double h = haze_from_occupancy(omega, p);
        CHECK(h <= previous);
        CHECK(h >= 0.0);
        previous = h;
    }
    CHECK(haze_from_occupancy(p.kOMEGA_THRESHOLD, p) == doctest::Approx(0.5 * p.kH_MAX));
}

TEST_CASE("an empty map has the isolated haze")
{
    const Parameters p;
    const SaliencyMap<double> empty(p.kNR, p.kNTHETA);
    const double h = self_haze(empty, p);
    CHECK(h == doctest::Approx(p.kH_MAX / (1.0 + std::exp(-p.kALPHA * p.kOMEGA_THRESHOLD))));
    CHECK(h > 0.5 * p.kH_MAX);

    const Agent fresh(0, Eigen::Vector2d(1.0, 1.0), 0.0, p);
    CHECK(fresh.self_haze == doctest::Approx(h));
}

TEST_CASE("more haze never raises precision nor lowers entropy")
{
    const Parameters p;
    const SaliencyMap<double> map(p.kNR, p.kNTHETA);
    Eigen::MatrixXd previous = precision_field(map, 0.0, p);
    double previous_entropy = belief_entropy(previous);
    for (double h = 0.05; h < p.kH_MAX; h += 0.05)
    {
        const Eigen::MatrixXd pi = precision_field(map, h, p);
        const double entropy = belief_entropy(pi);
        CHECK((pi.array() <= previous.array()).all());
        CHECK(entropy >= previous_entropy);
        previous = pi;
        previous_entropy = entropy;
    }
}

TEST_CASE("precision decays with radius and is constant across angles")
{
    const Parameters p;
    const SaliencyMap<double> map(p.kNR, p.kNTHETA);
    const Eigen::MatrixXd pi = precision_field(map, 0.0, p);
    CHECK(pi(0, 0) == doctest::Approx(p.kPI_MAX));
    CHECK(pi(p.kNR - 1, 0) == doctest::Approx(p.kPI_MAX * std::exp(-p.kDECAY_RATE)));
    for (int r = 0; r < p.kNR; ++r)
    {
        CHECK(pi.row(r).maxCoeff() == doctest::Approx(pi.row(r).minCoeff()));
        if (r > 0)
            CHECK(pi(r, 0) < pi(r - 1, 0));
    }

    Parameters faint = p;
    faint.kPI_MAX = 1e-9;
    const Eigen::MatrixXd floored = precision_field(map, 0.5, faint);
    CHECK((floored.array() == faint.kPRECISION_FLOOR).all());
}

TEST_CASE("belief entropy matches the log-determinant form")
{
    Eigen::MatrixXd pi = Eigen::MatrixXd::Constant(2, 3, 0.5);
    CHECK(belief_entropy(pi) == doctest::Approx(-0.5 * 6.0 * std::log(0.5 + kENTROPY_EPSILON)));
}

TEST_CASE("occupancy stats summarize the occupancy channel")
{
    SaliencyMap<double> map(2, 2);
    map.occupancy() << 0.0, 0.5, 0.05, 1.5;
    const OccupancyStats stats = occupancy_stats(map);
    CHECK(stats.total == doctest::Approx(2.05));
    CHECK(stats.normalized == doctest::Approx(2.05 / 4.0));
    CHECK(stats.max == doctest::Approx(1.5));
    CHECK(stats.occupied_bins == 2);
}

TEST_CASE("an isolated agent is hazier and less certain than a crowded one")
{
    const Parameters p;
    const AgentState self = haze_tests::state_at(0, 300.0, 300.0);
    const Perception isolated = perceive(self, haze_tests::world_of({self}, p), p);

    std::vector<AgentState> crowd{self};
    for (int k = 0; k < 11; ++k)
    {
        const double angle = (-100.0 + 20.0 * k) * kPI / 180.0;
        crowd.push_back(haze_tests::state_at(k + 1, 300.0 + 30.0 * std::cos(angle), 300.0 + 30.0 * std::sin(angle)));
    }
    const Perception dense = perceive(self, haze_tests::world_of(crowd, p), p);

    CHECK(isolated.haze > 0.5 * p.kH_MAX);
    CHECK(dense.haze < 0.1);
    CHECK(isolated.entropy > dense.entropy);
    CHECK(dense.visible.size() == 11);
    CHECK(isolated.visible.empty());
}
