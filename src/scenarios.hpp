#pragma once
#include <random>
#include <vector>

#include "agent.hpp"
#include "parameters.hpp"

// Four groups spawned kSPAWN_DISTANCE north, south, east and west of the center,
// each agent heading for a jittered goal on the opposite side.
std::vector<Agent> scramble_crossing(const Parameters &p, std::mt19937 &mt);

// Goal-free agents at uniform positions with random headings and speeds up to kTARGET_SPEED.
std::vector<Agent> random_exploration(const Parameters &p, std::mt19937 &mt);

// Two goal-free agents on the horizontal center line, closing head-on.
std::vector<Agent> head_on_pair(const Parameters &p, double separation, double speed);
