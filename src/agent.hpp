#pragma once
#include <Eigen/Dense>

#include <optional>
#include <vector>

#include "parameters.hpp"
#include "saliency_map.hpp"

// Diagnostics returned by the controller next to the action. Nothing in the
// control loop reads them back.
struct DecisionTrace
{
    Eigen::Vector2d gradient{Eigen::Vector2d::Zero()};
    double cost{0.0};
    double belief_entropy{0.0};
    std::vector<double> cost_history; // cost at the start of every iteration
    int predictor_failures{0};
    int skipped_updates{0};            // iterations with a non-finite gradient
    bool fallback{false};              // final action was replaced by the safe default
};

// Kinematic state of an agent, the unit copied into the start-of-step snapshot.
struct AgentState
{
    int id{};
    Eigen::Vector2d position{Eigen::Vector2d::Zero()};
    Eigen::Vector2d velocity{Eigen::Vector2d::Zero()};
    double heading{};
    double radius{2.0};
    double max_speed{50.0};
    double personal_space{20.0};
    std::optional<Eigen::Vector2d> goal;
    Eigen::VectorXd memory; // recurrent state of the learned predictor, empty otherwise
};

struct Agent : AgentState
{
    SaliencyMap<double> current_map;
    SaliencyMap<double> previous_map;
    Eigen::MatrixXd precision;
    double self_haze{};
    std::vector<int> visible;
    DecisionTrace trace;

    Agent() = default;
    Agent(int id, const Eigen::Vector2d &position, double heading, const Parameters &p);

    AgentState state() const
    {
        return *this;
    }
};

// Immutable start-of-step view every decision function reads from.
struct WorldSnapshot
{
    double width{};
    double height{};
    double dt{};
    std::vector<AgentState> agents;
};

struct Environment
{
    double width{};
    double height{};
    double dt{};
    std::vector<Agent> agents;
    Eigen::MatrixXi coverage; // visit counts per cell, diagnostics only
    double coverage_cell{};
    long frame_count{};

    Environment() = default;
    explicit Environment(const Parameters &p, std::vector<Agent> initial_agents = {});

    WorldSnapshot snapshot() const;
    void record_coverage();
    double coverage_fraction() const;
};

Eigen::Vector2d clamp_speed(const Eigen::Vector2d &v, double max_speed);
