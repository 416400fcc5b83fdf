#include "logging.hpp"
#include "scenarios.hpp"
#include "simulation.hpp"
#include "visual.hpp"

#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <type_traits>

template <typename T> T get_parameter(T param, std::string name)
{
    std::string input;

    std::cout << "Enter " << name << " (or press Enter for default " << param << "): ";
    std::getline(std::cin, input);

    if (!input.empty())
    {
        try
        {
            if constexpr (std::is_integral_v<T>)
                return static_cast<T>(std::stoll(input));
            else
                return static_cast<T>(std::stod(input));
        }
        catch (const std::exception &)
        {
            std::cout << "Invalid input, keeping default.\n";
            return param;
        }
    }
    return param;
}

int main()
{
    eph_log::init();

    Parameters p;
    p.kN_AGENTS = get_parameter(40, "Agent count");
    p.kH_MAX = get_parameter(p.kH_MAX, "Maximum haze");
    p.kBETA = get_parameter(p.kBETA, "Entropy weight");
    p.kLAMBDA = get_parameter(p.kLAMBDA, "Goal weight");
    if (get_parameter(0, "Predictor (0 kinematic, 1 learned)") == 1)
        p.kPREDICTOR = PredictorKind::learned;
    std::mt19937 mt;
    mt.seed(get_parameter(std::random_device{}(), "Seed value"));

    try
    {
        validate(p);
        Simulation sim(p, mt, scramble_crossing(p, mt));
        init_simulation(sim);
    }
    catch (const std::invalid_argument &e)
    {
        eph_log::get()->error("{}", e.what());
        return 1;
    }
    return 0;
}
