#include "scenarios.hpp"

#include <array>
#include <cmath>
#include <utility>

#include "toroidal.hpp"

std::vector<Agent> scramble_crossing(const Parameters &p, std::mt19937 &mt)
{
    const Eigen::Vector2d center(0.5 * p.kWIDTH, 0.5 * p.kHEIGHT);
    // north, south, east, west with screen y pointing down
    const std::array<Eigen::Vector2d, 4> directions{Eigen::Vector2d(0, -1), Eigen::Vector2d(0, 1),
                                                    Eigen::Vector2d(1, 0), Eigen::Vector2d(-1, 0)};

    std::uniform_real_distribution<double> along{-20.0, 20.0};
    std::uniform_real_distribution<double> across{-30.0, 30.0};
    std::uniform_real_distribution<double> goal_jitter{-30.0, 30.0};
    std::uniform_real_distribution<double> heading{-kPI, kPI};
    std::uniform_real_distribution<double> personal_space{kMIN_PERSONAL_SPACE,
                                                          kMIN_PERSONAL_SPACE + kPERSONAL_SPACE_SPREAD};

    std::vector<Agent> agents;
    agents.reserve(p.kN_AGENTS);
    for (int i = 0; i < p.kN_AGENTS; ++i)
    {
        const Eigen::Vector2d &dir = directions[i % directions.size()];
        const Eigen::Vector2d side(-dir.y(), dir.x());
        const double forward = along(mt);
        const double lateral = across(mt);
        const Eigen::Vector2d spawn = center + (kSPAWN_DISTANCE + forward) * dir + lateral * side;

        Agent agent(i, wrap_position<double>(spawn, p.kWIDTH, p.kHEIGHT), heading(mt), p);
        Eigen::Vector2d goal = center - kSPAWN_DISTANCE * dir;
        goal.x() += goal_jitter(mt);
        goal.y() += goal_jitter(mt);
        agent.goal = wrap_position<double>(goal, p.kWIDTH, p.kHEIGHT);
        agent.personal_space = personal_space(mt);
        agents.push_back(std::move(agent));
    }
    return agents;
}

std::vector<Agent> random_exploration(const Parameters &p, std::mt19937 &mt)
{
    std::uniform_real_distribution<double> x{0.0, p.kWIDTH};
    std::uniform_real_distribution<double> y{0.0, p.kHEIGHT};
    std::uniform_real_distribution<double> heading{-kPI, kPI};
    std::uniform_real_distribution<double> speed{0.0, p.kTARGET_SPEED};

    std::vector<Agent> agents;
    agents.reserve(p.kN_AGENTS);
    for (int i = 0; i < p.kN_AGENTS; ++i)
    {
        Eigen::Vector2d position;
        position.x() = x(mt);
        position.y() = y(mt);
        const double theta = heading(mt);
        Agent agent(i, wrap_position<double>(position, p.kWIDTH, p.kHEIGHT), theta, p);
        agent.velocity = speed(mt) * Eigen::Vector2d(std::cos(theta), std::sin(theta));
        agents.push_back(std::move(agent));
    }
    return agents;
}

std::vector<Agent> head_on_pair(const Parameters &p, double separation, double speed)
{
    const Eigen::Vector2d center(0.5 * p.kWIDTH, 0.5 * p.kHEIGHT);
    const Eigen::Vector2d offset(0.5 * separation, 0.0);

    std::vector<Agent> agents;
    agents.emplace_back(0, center - offset, 0.0, p);
    agents.back().velocity = Eigen::Vector2d(speed, 0.0);
    agents.emplace_back(1, center + offset, kPI, p);
    agents.back().velocity = Eigen::Vector2d(-speed, 0.0);
    return agents;
}
