#pragma once
#include <SFML/Graphics.hpp>

#include "simulation.hpp"

// Haze 0 maps to white, kH_MAX to orange.
sf::Color haze_color(double haze, double h_max);

// Runs the simulation in a window for kROUNDS frames or until it is closed.
// The panel right of the world shows the tracked agent's occupancy channel;
// the window title carries the frame statistics.
void init_simulation(Simulation &simulation, int tracked_agent = 0);
