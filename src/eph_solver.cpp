#include "logging.hpp"
#include "scenarios.hpp"
#include "simulation.hpp"

#include <random>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// Headless run: eph_solver [scramble|explore|head_on] [rounds]
int main(int argc, char **argv)
{
    eph_log::init();

    const std::string scenario = argc > 1 ? argv[1] : "scramble";
    Parameters p;
    p.kN_AGENTS = 40;

    std::mt19937 mt;
    mt.seed(44);

    try
    {
        if (argc > 2)
            p.kROUNDS = std::stoi(argv[2]);
        validate(p);

        std::vector<Agent> agents;
        if (scenario == "scramble")
            agents = scramble_crossing(p, mt);
        else if (scenario == "explore")
            agents = random_exploration(p, mt);
        else if (scenario == "head_on")
            agents = head_on_pair(p, 100.0, p.kTARGET_SPEED);
        else
            throw std::invalid_argument("Unknown scenario " + scenario);

        Simulation sim(p, mt, std::move(agents));
        int collisions{};
        int failures{};
        for (int i = 0; i < p.kROUNDS; ++i)
        {
            const StepStats stats = sim.update_state();
            collisions += stats.collisions;
            failures += stats.predictor_failures;
        }
        eph_log::get()->info("Finished {} after {} frames: coverage {:.3f}, mean haze {:.3f}, {} collisions, {} "
                             "predictor failures",
                             scenario, sim.frame_count(), sim.env.coverage_fraction(), mean_haze(sim.env), collisions,
                             failures);
    }
    catch (const std::invalid_argument &e)
    {
        eph_log::get()->error("{}", e.what());
        return 1;
    }
    catch (const std::out_of_range &e)
    {
        eph_log::get()->error("Round count out of range: {}", e.what());
        return 1;
    }
    return 0;
}
