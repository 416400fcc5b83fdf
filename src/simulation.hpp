#pragma once
#include <Eigen/Dense>

#include <memory>
#include <optional>
#include <random>
#include <vector>

#include "agent.hpp"
#include "parameters.hpp"
#include "predictor.hpp"
#include "saliency_map.hpp"

struct AgentFrame
{
    int id{};
    Eigen::Vector2d position{Eigen::Vector2d::Zero()};
    Eigen::Vector2d velocity{Eigen::Vector2d::Zero()};
    double heading{};
    double self_haze{};
    double belief_entropy{};
    int visible{};
    std::optional<SaliencyMap<double>> map;
};

// Read-only per-step view for the viewer and the Python module.
struct FrameSnapshot
{
    long frame{};
    double coverage{};
    std::vector<AgentFrame> agents;
};

struct StepStats
{
    int discarded{};          // agents whose non-finite update was dropped
    int collisions{};
    int predictor_failures{};
    int fallbacks{};
};

FrameSnapshot make_frame(const Environment &env, bool include_maps = false);
double mean_haze(const Environment &env);

// Symmetric half-overlap pushes, accumulated in a delta buffer and applied
// after the pair scan. Returns the number of overlapping pairs.
int resolve_collisions(Environment &env);

// One timestep: Perceive -> Infer-Uncertainty -> Act against the start-of-step
// snapshot, then Integrate and Resolve-Collisions.
StepStats step(Environment &env, const Parameters &p, const Predictor &predictor, std::mt19937 &mt);

class Simulation
{
  public:
    Parameters p;
    Environment env;

  private:
    std::unique_ptr<Predictor> predictor_;
    std::mt19937 seed_;

  public:
    // Empty `agents` populates the world with random_exploration. Throws
    // std::invalid_argument for invalid parameters or duplicate agent ids.
    Simulation(const Parameters &params, std::mt19937 &mt, std::vector<Agent> agents = {},
               std::unique_ptr<Predictor> predictor = nullptr);

    StepStats update_state();
    FrameSnapshot frame(bool include_maps = false) const
    {
        return make_frame(env, include_maps);
    }

    const Predictor &predictor() const
    {
        return *predictor_;
    }
    long frame_count() const
    {
        return env.frame_count;
    }
    int size() const
    {
        return static_cast<int>(env.agents.size());
    }

  private:
    static const Parameters &validated(const Parameters &params);
    void prime_perception();
};
