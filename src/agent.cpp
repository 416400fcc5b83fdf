#include "agent.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

Agent::Agent(int agent_id, const Eigen::Vector2d &start, double start_heading, const Parameters &p)
{
    id = agent_id;
    position = start;
    heading = start_heading;
    radius = p.kRADIUS;
    max_speed = p.kMAX_SPEED;
    personal_space = p.kPERSONAL_SPACE;
    // an empty map is the isolated state, so start from its haze
    self_haze = p.kH_MAX / (1.0 + std::exp(-p.kALPHA * p.kOMEGA_THRESHOLD));
}

Environment::Environment(const Parameters &p, std::vector<Agent> initial_agents)
    : width(p.kWIDTH), height(p.kHEIGHT), dt(p.kTIMESTEP), agents(std::move(initial_agents)),
      coverage_cell(p.kCOVERAGE_CELL)
{
    const int cells_x = static_cast<int>(std::ceil(width / coverage_cell));
    const int cells_y = static_cast<int>(std::ceil(height / coverage_cell));
    coverage = Eigen::MatrixXi::Zero(cells_x, cells_y);
}

WorldSnapshot Environment::snapshot() const
{
    WorldSnapshot world;
    world.width = width;
    world.height = height;
    world.dt = dt;
    world.agents.reserve(agents.size());
    for (const Agent &agent : agents)
        world.agents.push_back(agent.state());
    return world;
}

void Environment::record_coverage()
{
    if (coverage.size() == 0)
        return;
    for (const Agent &agent : agents)
    {
        const int cx = std::clamp(static_cast<int>(agent.position.x() / coverage_cell), 0,
                                  static_cast<int>(coverage.rows()) - 1);
        const int cy = std::clamp(static_cast<int>(agent.position.y() / coverage_cell), 0,
                                  static_cast<int>(coverage.cols()) - 1);
        ++coverage(cx, cy);
    }
}

double Environment::coverage_fraction() const
{
    if (coverage.size() == 0)
        return 0.0;
    return static_cast<double>((coverage.array() > 0).count()) / static_cast<double>(coverage.size());
}

Eigen::Vector2d clamp_speed(const Eigen::Vector2d &v, double max_speed)
{
    const double speed = v.norm();
    if (speed > max_speed)
        return v * (max_speed / speed);
    return v;
}
