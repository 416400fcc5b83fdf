#include <pybind11/eigen.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <cstdint>
#include <memory>
#include <random>
#include <stdexcept>
#include <utility>
#include <vector>

#include "haze.hpp"
#include "logging.hpp"
#include "perception.hpp"
#include "scenarios.hpp"
#include "simulation.hpp"

namespace py = pybind11;

namespace
{
const Agent &agent_at(const Simulation &sim, int index)
{
    if (index < 0 || index >= sim.size())
        throw py::index_error("agent index out of range");
    return sim.env.agents[index];
}

Eigen::MatrixX2d stacked(const Simulation &sim, bool velocities)
{
    Eigen::MatrixX2d out(sim.size(), 2);
    for (int i = 0; i < sim.size(); ++i)
        out.row(i) = (velocities ? sim.env.agents[i].velocity : sim.env.agents[i].position).transpose();
    return out;
}
} // namespace

void bind_parameters(py::module &m)
{
    py::enum_<PredictorKind>(m, "PredictorKind", "Forward model used by the controller.")
        .value("kinematic", PredictorKind::kinematic)
        .value("learned", PredictorKind::learned);

    py::class_<Parameters>(m, "Parameters", "Container for world, perception, haze and controller settings.")
        .def(py::init<>())
        .def_readwrite("kWIDTH", &Parameters::kWIDTH, "World width; the x axis wraps around.")
        .def_readwrite("kHEIGHT", &Parameters::kHEIGHT, "World height; the y axis wraps around.")
        .def_readwrite("kTIMESTEP", &Parameters::kTIMESTEP, "Integration timestep (dt).")
        .def_readwrite("kN_AGENTS", &Parameters::kN_AGENTS, "Agent count for generated scenarios.")
        .def_readwrite("kRADIUS", &Parameters::kRADIUS, "Collision radius.")
        .def_readwrite("kMAX_SPEED", &Parameters::kMAX_SPEED, "Upper bound on agent speed.")
        .def_readwrite("kMAX_ACCEL", &Parameters::kMAX_ACCEL, "Upper bound on the velocity change per second.")
        .def_readwrite("kPERSONAL_SPACE", &Parameters::kPERSONAL_SPACE,
                       "Distance at which the radial encoding saturates into the innermost bin.")
        .def_readwrite("kHEADING_SPEED", &Parameters::kHEADING_SPEED,
                       "Speed above which the heading follows the velocity.")
        .def_readwrite("kNR", &Parameters::kNR, "Radial bins of the saliency map (at least 2).")
        .def_readwrite("kNTHETA", &Parameters::kNTHETA, "Angular bins of the saliency map.")
        .def_readwrite("kFOV_ANGLE", &Parameters::kFOV_ANGLE, "Field of view in radians, centered on the heading.")
        .def_readwrite("kFOV_RANGE", &Parameters::kFOV_RANGE, "Perception range.")
        .def_readwrite("kSIGMA_R", &Parameters::kSIGMA_R, "Radial kernel width in bins.")
        .def_readwrite("kSIGMA_THETA", &Parameters::kSIGMA_THETA, "Angular kernel width in bins.")
        .def_readwrite("kSPLAT_RADIUS", &Parameters::kSPLAT_RADIUS, "Bins reached by the splat kernel.")
        .def_readwrite("kH_MAX", &Parameters::kH_MAX, "Maximum self-haze, reached when nothing is seen.")
        .def_readwrite("kALPHA", &Parameters::kALPHA, "Sensitivity of the haze sigmoid.")
        .def_readwrite("kOMEGA_THRESHOLD", &Parameters::kOMEGA_THRESHOLD, "Mean occupancy at the sigmoid midpoint.")
        .def_readwrite("kGAMMA", &Parameters::kGAMMA, "Exponent of the haze attenuation (1 - h)^gamma.")
        .def_readwrite("kPI_MAX", &Parameters::kPI_MAX, "Precision of the innermost radial bin without haze.")
        .def_readwrite("kDECAY_RATE", &Parameters::kDECAY_RATE, "Radial decay of the base precision.")
        .def_readwrite("kPRECISION_FLOOR", &Parameters::kPRECISION_FLOOR, "Lower bound of every precision entry.")
        .def_readwrite("kBETA", &Parameters::kBETA, "Weight of the predicted belief entropy.")
        .def_readwrite("kGAMMA_INFO", &Parameters::kGAMMA_INFO, "Weight of the information gain reward.")
        .def_readwrite("kLAMBDA", &Parameters::kLAMBDA, "Weight of the goal or exploration-speed term.")
        .def_readwrite("kCOLLISION_GAIN", &Parameters::kCOLLISION_GAIN, "Scale of the collision-risk term.")
        .def_readwrite("kNEAR_BINS", &Parameters::kNEAR_BINS, "Radial bins considered by the collision-risk term.")
        .def_readwrite("kTARGET_SPEED", &Parameters::kTARGET_SPEED, "Exploration speed of goal-free agents.")
        .def_readwrite("kMAX_ITER", &Parameters::kMAX_ITER, "Gradient iterations per decision.")
        .def_readwrite("kETA", &Parameters::kETA, "Gradient step size.")
        .def_readwrite("kGRAD_CLIP", &Parameters::kGRAD_CLIP, "Maximum gradient magnitude.")
        .def_readwrite("kSMOOTHING", &Parameters::kSMOOTHING,
                       "Weight of the optimized action against the previous velocity.")
        .def_readwrite("kMIN_INIT_SPEED", &Parameters::kMIN_INIT_SPEED,
                       "Below this speed the optimizer starts from a random action.")
        .def_readwrite("kINIT_NOISE", &Parameters::kINIT_NOISE, "Standard deviation of the random start.")
        .def_readwrite("kPREDICTOR", &Parameters::kPREDICTOR, "Forward model variant.")
        .def_readwrite("kPREDICTION_DT", &Parameters::kPREDICTION_DT, "Prediction horizon.")
        .def_readwrite("kHIDDEN_SIZE", &Parameters::kHIDDEN_SIZE, "Hidden units of the learned predictor.")
        .def_readwrite("kCOVERAGE_CELL", &Parameters::kCOVERAGE_CELL, "Cell size of the coverage map.")
        .def_readwrite("kLOG_INTERVAL", &Parameters::kLOG_INTERVAL, "Frames between progress log lines.")
        .def_readwrite("kFRAMERATE", &Parameters::kFRAMERATE, "Viewer framerate limit.")
        .def_readwrite("kROUNDS", &Parameters::kROUNDS, "Number of simulation steps to run.")
        .def("validate", [](const Parameters &self) { validate(self); },
             "Raises ValueError naming the first invalid field.");
}

void bind_agents(py::module &m)
{
    py::class_<SaliencyMap<double>>(m, "SaliencyMap", "Egocentric log-polar tensor, rows radial, columns angular.")
        .def_property_readonly(
            "occupancy", [](const SaliencyMap<double> &self) { return self.channels[kOCCUPANCY]; },
            "(Nr, Ntheta) occupancy channel.")
        .def_property_readonly(
            "radial_velocity", [](const SaliencyMap<double> &self) { return self.channels[kRADIAL_VELOCITY]; },
            "(Nr, Ntheta) radial relative velocity channel.")
        .def_property_readonly(
            "tangential_velocity",
            [](const SaliencyMap<double> &self) { return self.channels[kTANGENTIAL_VELOCITY]; },
            "(Nr, Ntheta) tangential relative velocity channel.")
        .def("flatten", &SaliencyMap<double>::flatten, "Channel-major flattening.");

    py::class_<Agent>(m, "Agent", "Agent state plus its last perception.")
        .def(py::init<int, const Eigen::Vector2d &, double, const Parameters &>(), py::arg("id"), py::arg("position"),
             py::arg("heading"), py::arg("params"))
        .def_readonly("id", &Agent::id)
        .def_readwrite("position", &Agent::position)
        .def_readwrite("velocity", &Agent::velocity)
        .def_readwrite("heading", &Agent::heading)
        .def_readwrite("radius", &Agent::radius)
        .def_readwrite("max_speed", &Agent::max_speed)
        .def_readwrite("personal_space", &Agent::personal_space)
        .def_readwrite("goal", &Agent::goal)
        .def_readonly("self_haze", &Agent::self_haze)
        .def_readonly("visible", &Agent::visible)
        .def_readonly("current_map", &Agent::current_map)
        .def_readonly("precision", &Agent::precision);

    py::class_<AgentFrame>(m, "AgentFrame")
        .def_readonly("id", &AgentFrame::id)
        .def_readonly("position", &AgentFrame::position)
        .def_readonly("velocity", &AgentFrame::velocity)
        .def_readonly("heading", &AgentFrame::heading)
        .def_readonly("self_haze", &AgentFrame::self_haze)
        .def_readonly("belief_entropy", &AgentFrame::belief_entropy)
        .def_readonly("visible", &AgentFrame::visible)
        .def_readonly("map", &AgentFrame::map);

    py::class_<FrameSnapshot>(m, "FrameSnapshot", "Read-only view of one step.")
        .def_readonly("frame", &FrameSnapshot::frame)
        .def_readonly("coverage", &FrameSnapshot::coverage)
        .def_readonly("agents", &FrameSnapshot::agents);

    py::class_<StepStats>(m, "StepStats")
        .def_readonly("discarded", &StepStats::discarded)
        .def_readonly("collisions", &StepStats::collisions)
        .def_readonly("predictor_failures", &StepStats::predictor_failures)
        .def_readonly("fallbacks", &StepStats::fallbacks);

    py::class_<Perception>(m, "Perception", "Saliency map, haze, precision and entropy of one agent.")
        .def_readonly("map", &Perception::map)
        .def_readonly("haze", &Perception::haze)
        .def_readonly("precision", &Perception::precision)
        .def_readonly("entropy", &Perception::entropy)
        .def_readonly("visible", &Perception::visible);
}

PYBIND11_MODULE(eph_swarm_core, m)
{
    m.doc() = "C++ backend for the toroidal active-inference swarm.";
    eph_log::init();

    bind_parameters(m);
    bind_agents(m);

    py::class_<std::mt19937>(m, "MT19937", "Mersenne Twister 19937 pseudo-random generator.")
        .def(py::init<std::uint32_t>(), py::arg("seed"), "Initialize the generator with a deterministic seed.");

    m.def("scramble_crossing", &scramble_crossing, py::arg("params"), py::arg("seed"),
          "Four groups crossing the world center toward the opposite side.");
    m.def("random_exploration", &random_exploration, py::arg("params"), py::arg("seed"),
          "Goal-free agents at uniform positions.");
    m.def("head_on_pair", &head_on_pair, py::arg("params"), py::arg("separation"), py::arg("speed"),
          "Two agents closing head-on on the horizontal center line.");

    py::class_<Simulation>(m, "Simulation", "Owns the environment, the predictor and the generator.")
        .def(py::init([](const Parameters &params, std::mt19937 &mt, std::vector<Agent> agents) {
                 return std::make_unique<Simulation>(params, mt, std::move(agents));
             }),
             py::arg("params"), py::arg("seed"), py::arg("agents") = std::vector<Agent>{},
             "Constructs the simulation. An empty agent list spawns kN_AGENTS exploring agents.")
        .def("update", &Simulation::update_state, "Advances every agent by one timestep.")
        .def("frame", &Simulation::frame, py::arg("include_maps") = false, "Snapshot of the current step.")
        .def_readonly("params", &Simulation::p)
        .def_property_readonly("frame_count", &Simulation::frame_count)
        .def_property_readonly(
            "agents", [](const Simulation &self) { return self.env.agents; }, "Copies of the agents.")
        .def_property_readonly(
            "positions", [](const Simulation &self) { return stacked(self, false); },
            "(N, 2) agent coordinates, read-only.")
        .def_property_readonly(
            "velocities", [](const Simulation &self) { return stacked(self, true); },
            "(N, 2) velocity vectors, read-only.")
        .def_property_readonly(
            "haze",
            [](const Simulation &self) {
                Eigen::VectorXd out(self.size());
                for (int i = 0; i < self.size(); ++i)
                    out(i) = self.env.agents[i].self_haze;
                return out;
            },
            "Self-haze of every agent, read-only.")
        .def_property_readonly(
            "coverage", [](const Simulation &self) { return self.env.coverage; }, "Visit counts per coverage cell.");

    m.def(
        "encode",
        [](const Simulation &sim, int index) {
            const WorldSnapshot world = sim.env.snapshot();
            return encode(agent_at(sim, index).state(), world, sim.p);
        },
        py::arg("simulation"), py::arg("index"), "Saliency map of one agent against the current state.");
    m.def(
        "perceive",
        [](const Simulation &sim, int index) {
            const WorldSnapshot world = sim.env.snapshot();
            return perceive(agent_at(sim, index).state(), world, sim.p);
        },
        py::arg("simulation"), py::arg("index"), "Saliency map, haze, precision and entropy of one agent.");
    m.def(
        "self_haze", [](const SaliencyMap<double> &map, const Parameters &p) { return self_haze(map, p); },
        py::arg("map"), py::arg("params"));
    m.def(
        "precision_field",
        [](const SaliencyMap<double> &map, double haze, const Parameters &p) {
            return Eigen::MatrixXd(precision_field(map, haze, p));
        },
        py::arg("map"), py::arg("haze"), py::arg("params"));
    m.def(
        "belief_entropy", [](const Eigen::MatrixXd &precision) { return belief_entropy(precision); },
        py::arg("precision"));
}
