#include "predictor.hpp"

#include <fmt/format.h>

#include <cmath>
#include <stdexcept>
#include <utility>

#include "logging.hpp"
#include "perception.hpp"
#include "toroidal.hpp"

namespace
{
template <typename T> T sigmoid(const T &x)
{
    using std::exp;
    const T decay = exp(-x);
    const T denominator = decay + 1.0;
    return 1.0 / denominator;
}

void require_shape(const Eigen::MatrixXd &m, Eigen::Index rows, Eigen::Index cols, const char *name)
{
    if (m.rows() != rows || m.cols() != cols)
        throw std::invalid_argument(
            fmt::format("LearnedPredictor: {} is {}x{}, expected {}x{}", name, m.rows(), m.cols(), rows, cols));
}
} // namespace

SaliencyMap<ActionScalar> KinematicPredictor::predict(const AgentState &self, const SaliencyMap<double> &,
                                                      const ActionVector &action, const WorldSnapshot &world,
                                                      const Parameters &p) const
{
    const double dt = p.kPREDICTION_DT;

    ActionVector moved;
    moved(0) = action(0) * dt + self.position.x();
    moved(1) = action(1) * dt + self.position.y();
    const ActionVector position = wrap_position(moved, world.width, world.height);

    const ActionScalar heading = values_of(action).norm() > p.kHEADING_SPEED ? polar_angle(action(1), action(0))
                                                                            : ActionScalar(self.heading);

    // neighbors keep their current velocity over the horizon
    std::vector<AgentState> others = world.agents;
    for (AgentState &other : others)
    {
        if (other.id == self.id)
            continue;
        other.position = wrap_position<double>(other.position + other.velocity * dt, world.width, world.height);
    }

    return encode<ActionScalar>(position, action, heading, self.personal_space, others, self.id, world.width,
                                world.height, p);
}

LearnedPredictor::LearnedPredictor(GruWeights weights, int n_r, int n_theta)
    : w_(std::move(weights)), n_r_(n_r), n_theta_(n_theta)
{
    if (n_r_ < 1 || n_theta_ < 1)
        throw std::invalid_argument("LearnedPredictor: map dimensions must be positive");
    const Eigen::Index h = w_.input_bias.size();
    if (h == 0)
        throw std::invalid_argument("LearnedPredictor: hidden size must be positive");
    const Eigen::Index m = map_size();
    require_shape(w_.input_weights, h, m + 2, "input_weights");
    require_shape(w_.gate_weights, 3 * h, h, "gate_weights");
    require_shape(w_.recurrent_weights, 3 * h, h, "recurrent_weights");
    require_shape(w_.gate_bias, 3 * h, 1, "gate_bias");
    require_shape(w_.output_weights, m, h, "output_weights");
    require_shape(w_.output_bias, m, 1, "output_bias");
}

LearnedPredictor LearnedPredictor::random(const Parameters &p, std::mt19937 &mt)
{
    const int h = p.kHIDDEN_SIZE;
    const int m = kN_CHANNELS * p.kNR * p.kNTHETA;

    auto xavier = [&mt](int rows, int cols) -> Eigen::MatrixXd {
        const double limit = std::sqrt(6.0 / (rows + cols));
        std::uniform_real_distribution<double> dist(-limit, limit);
        return Eigen::MatrixXd::NullaryExpr(rows, cols, [&]() { return dist(mt); });
    };

    GruWeights w;
    w.input_weights = xavier(h, m + 2);
    w.input_bias = Eigen::VectorXd::Zero(h);
    w.gate_weights = xavier(3 * h, h);
    w.recurrent_weights = xavier(3 * h, h);
    w.gate_bias = Eigen::VectorXd::Zero(3 * h);
    w.output_weights = xavier(m, h);
    w.output_bias = Eigen::VectorXd::Zero(m);
    return LearnedPredictor(std::move(w), p.kNR, p.kNTHETA);
}

void LearnedPredictor::check_map(const SaliencyMap<double> &current) const
{
    if (!current.has_shape(n_r_, n_theta_))
        throw std::invalid_argument(fmt::format("LearnedPredictor: expected a {}x{} map, got {}x{}", n_r_, n_theta_,
                                                current.rows(), current.cols()));
}

Eigen::VectorXd LearnedPredictor::memory_of(const AgentState &self) const
{
    if (self.memory.size() == 0)
        return Eigen::VectorXd::Zero(hidden_size());
    if (self.memory.size() != hidden_size())
        throw std::invalid_argument(fmt::format("LearnedPredictor: memory of agent {} has size {}, expected {}",
                                                self.id, self.memory.size(), hidden_size()));
    return self.memory;
}

// Only the two action columns of the input layer carry derivatives.
template <typename T>
VectorX<T> LearnedPredictor::hidden_input(const SaliencyMap<double> &current, const Vec2<T> &action) const
{
    const int m = map_size();
    const Eigen::VectorXd flat = current.flatten();
    const Eigen::VectorXd base = w_.input_weights.leftCols(m) * flat + w_.input_bias;

    VectorX<T> hidden(base.size());
    for (Eigen::Index k = 0; k < base.size(); ++k)
    {
        const T pre = action(0) * w_.input_weights(k, m) + action(1) * w_.input_weights(k, m + 1) + base(k);
        hidden(k) = rectify(pre);
    }
    return hidden;
}

template <typename T> VectorX<T> LearnedPredictor::gru_cell(const VectorX<T> &x, const Eigen::VectorXd &h) const
{
    using std::tanh;
    const Eigen::Index n = hidden_size();
    const Eigen::VectorXd gh = w_.recurrent_weights * h;
    const VectorX<T> gx = w_.gate_weights.cast<T>() * x + w_.gate_bias.cast<T>();

    VectorX<T> next(n);
    for (Eigen::Index k = 0; k < n; ++k)
    {
        const T reset = sigmoid<T>(gx(k) + gh(k));
        const T update = sigmoid<T>(gx(n + k) + gh(n + k));
        const T gated = gx(2 * n + k) + reset * gh(2 * n + k);
        const T candidate = tanh(gated);
        const T kept = update * h(k);
        next(k) = (1.0 - update) * candidate + kept;
    }
    return next;
}

SaliencyMap<ActionScalar> LearnedPredictor::predict(const AgentState &self, const SaliencyMap<double> &current,
                                                    const ActionVector &action, const WorldSnapshot &,
                                                    const Parameters &) const
{
    check_map(current);
    const Eigen::VectorXd memory = memory_of(self);
    const VectorX<ActionScalar> x = hidden_input<ActionScalar>(current, action);
    const VectorX<ActionScalar> h = gru_cell<ActionScalar>(x, memory);
    const VectorX<ActionScalar> y =
        w_.output_weights.cast<ActionScalar>() * h + w_.output_bias.cast<ActionScalar>();

    SaliencyMap<ActionScalar> predicted(n_r_, n_theta_);
    const Eigen::Index block = static_cast<Eigen::Index>(n_r_) * n_theta_;
    for (int k = 0; k < kN_CHANNELS; ++k)
        for (Eigen::Index i = 0; i < block; ++i)
            predicted.channels[k](i) = y(k * block + i);

    for (Eigen::Index i = 0; i < block; ++i)
        predicted.occupancy()(i) = rectify(predicted.occupancy()(i));
    return predicted;
}

Eigen::VectorXd LearnedPredictor::next_memory(const AgentState &self, const SaliencyMap<double> &current,
                                              const Eigen::Vector2d &executed_action, const Parameters &) const
{
    check_map(current);
    const Eigen::VectorXd x = hidden_input<double>(current, executed_action);
    return gru_cell<double>(x, memory_of(self));
}

std::unique_ptr<Predictor> make_predictor(const Parameters &p, std::mt19937 &mt)
{
    validate(p);
    std::unique_ptr<Predictor> predictor;
    switch (p.kPREDICTOR)
    {
    case PredictorKind::kinematic:
        predictor = std::make_unique<KinematicPredictor>();
        break;
    case PredictorKind::learned:
        predictor = std::make_unique<LearnedPredictor>(LearnedPredictor::random(p, mt));
        break;
    default:
        throw std::invalid_argument("Invalid parameter kPREDICTOR: unknown predictor kind");
    }
    eph_log::get()->info("Predictor: {}", predictor->name());
    return predictor;
}
