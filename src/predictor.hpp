#pragma once
#include <Eigen/Dense>

#include <memory>
#include <random>
#include <string>

#include "agent.hpp"
#include "autodiff.hpp"
#include "parameters.hpp"
#include "saliency_map.hpp"

// One-step-ahead forecast of the saliency map if `action` were executed. The
// result carries derivatives with respect to the action. Implementations may
// throw; the controller treats any exception or malformed output as a failed
// prediction.
class Predictor
{
  public:
    virtual ~Predictor() = default;

    virtual SaliencyMap<ActionScalar> predict(const AgentState &self, const SaliencyMap<double> &current,
                                              const ActionVector &action, const WorldSnapshot &world,
                                              const Parameters &p) const = 0;

    // Recurrent memory after the executed action was taken from the current map. Stateless
    // predictors keep no memory.
    virtual Eigen::VectorXd next_memory(const AgentState &, const SaliencyMap<double> &, const Eigen::Vector2d &,
                                        const Parameters &) const
    {
        return {};
    }

    virtual std::string name() const = 0;
};

// Moves the agent by the action and the neighbors by their velocities, then re-encodes.
class KinematicPredictor final : public Predictor
{
  public:
    SaliencyMap<ActionScalar> predict(const AgentState &self, const SaliencyMap<double> &current,
                                      const ActionVector &action, const WorldSnapshot &world,
                                      const Parameters &p) const override;
    std::string name() const override
    {
        return "kinematic";
    }
};

// Dense(relu) -> GRU cell -> Dense over [flatten(map); action].
struct GruWeights
{
    Eigen::MatrixXd input_weights;  // H x (3 Nr Ntheta + 2)
    Eigen::VectorXd input_bias;     // H
    Eigen::MatrixXd gate_weights;   // 3H x H, reset | update | candidate
    Eigen::MatrixXd recurrent_weights; // 3H x H
    Eigen::VectorXd gate_bias;      // 3H
    Eigen::MatrixXd output_weights; // 3 Nr Ntheta x H
    Eigen::VectorXd output_bias;    // 3 Nr Ntheta
};

class LearnedPredictor final : public Predictor
{
  public:
    LearnedPredictor(GruWeights weights, int n_r, int n_theta);

    // Xavier-uniform weights and zero biases.
    static LearnedPredictor random(const Parameters &p, std::mt19937 &mt);

    SaliencyMap<ActionScalar> predict(const AgentState &self, const SaliencyMap<double> &current,
                                      const ActionVector &action, const WorldSnapshot &world,
                                      const Parameters &p) const override;
    Eigen::VectorXd next_memory(const AgentState &self, const SaliencyMap<double> &current,
                                const Eigen::Vector2d &executed_action, const Parameters &p) const override;
    std::string name() const override
    {
        return "learned";
    }

    int hidden_size() const
    {
        return static_cast<int>(w_.input_bias.size());
    }
    int map_size() const
    {
        return kN_CHANNELS * n_r_ * n_theta_;
    }

  private:
    template <typename T>
    VectorX<T> hidden_input(const SaliencyMap<double> &current, const Vec2<T> &action) const;
    template <typename T> VectorX<T> gru_cell(const VectorX<T> &x, const Eigen::VectorXd &h) const;
    Eigen::VectorXd memory_of(const AgentState &self) const;
    void check_map(const SaliencyMap<double> &current) const;

    GruWeights w_;
    int n_r_;
    int n_theta_;
};

std::unique_ptr<Predictor> make_predictor(const Parameters &p, std::mt19937 &mt);
