#include "visual.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>

#include "logging.hpp"

sf::Color haze_color(double haze, double h_max)
{
    const double t = std::clamp(haze / h_max, 0.0, 1.0);
    const auto green = static_cast<sf::Uint8>(255.0 - 110.0 * t);
    const auto blue = static_cast<sf::Uint8>(255.0 * (1.0 - t));
    return sf::Color(255, green, blue);
}

void init_simulation(Simulation &simulation, int tracked_agent)
{
    const Parameters &p = simulation.p;
    const int n = simulation.size();
    const float world_w = static_cast<float>(p.kWIDTH);
    const float world_h = static_cast<float>(p.kHEIGHT);
    const float panel_w = kHEATMAP_CELL * p.kNTHETA + 20.f;
    tracked_agent = std::clamp(tracked_agent, 0, std::max(n - 1, 0));

    sf::RenderWindow window(sf::VideoMode(static_cast<unsigned>(world_w + panel_w), static_cast<unsigned>(world_h)),
                            "EphSwarm");
    window.setFramerateLimit(p.kFRAMERATE);

    sf::VertexArray plot_agents(sf::Quads, n * 4);
    sf::VertexArray headings(sf::Lines, n * 2);
    sf::VertexArray heatmap(sf::Quads, p.kNR * p.kNTHETA * 4);

    sf::RectangleShape border(sf::Vector2f(world_w - 2.f, world_h - 2.f));
    border.setPosition(1.f, 1.f);
    border.setFillColor(sf::Color::Black);
    border.setOutlineThickness(1.f);
    border.setOutlineColor(sf::Color(92, 179, 219));

    sf::Clock fps_clock;
    float current_fps = 0;
    int iterations{};

    while (window.isOpen() && iterations < p.kROUNDS)
    {
        sf::Time dt = fps_clock.restart();
        current_fps = (dt.asSeconds() > 0) ? (1.0f / dt.asSeconds()) : 0;

        sf::Event event;
        while (window.pollEvent(event))
        {
            if (event.type == sf::Event::Closed)
                window.close();
        }

        simulation.update_state();
        const FrameSnapshot frame = simulation.frame(true);

        for (int i = 0; i < n; ++i)
        {
            const AgentFrame &agent = frame.agents[i];
            const int v = i * 4;
            const float size = kAGENT_DRAW_SCALE * static_cast<float>(simulation.env.agents[i].radius);
            const float x_pos = static_cast<float>(agent.position.x());
            const float y_pos = static_cast<float>(agent.position.y());
            sf::Color color = haze_color(agent.self_haze, p.kH_MAX);
            if (i == tracked_agent)
                color = sf::Color::Cyan;

            plot_agents[v + 0].position = sf::Vector2f(x_pos - size, y_pos - size);
            plot_agents[v + 1].position = sf::Vector2f(x_pos + size, y_pos - size);
            plot_agents[v + 2].position = sf::Vector2f(x_pos + size, y_pos + size);
            plot_agents[v + 3].position = sf::Vector2f(x_pos - size, y_pos + size);
            for (int j = 0; j < 4; ++j)
                plot_agents[v + j].color = color;

            const float reach = 4.f * size;
            headings[2 * i].position = sf::Vector2f(x_pos, y_pos);
            headings[2 * i + 1].position = sf::Vector2f(x_pos + reach * static_cast<float>(std::cos(agent.heading)),
                                                        y_pos + reach * static_cast<float>(std::sin(agent.heading)));
            headings[2 * i].color = color;
            headings[2 * i + 1].color = color;
        }

        // rows are radial bins from the nearest down, columns sweep the field of view
        if (n > 0 && frame.agents[tracked_agent].map && !frame.agents[tracked_agent].map->empty())
        {
            const Eigen::MatrixXd &occupancy = frame.agents[tracked_agent].map->occupancy();
            const double peak = std::max(occupancy.maxCoeff(), 1.0);
            for (int r = 0; r < occupancy.rows(); ++r)
            {
                for (int t = 0; t < occupancy.cols(); ++t)
                {
                    const int v = (r * static_cast<int>(occupancy.cols()) + t) * 4;
                    const float x0 = world_w + 10.f + kHEATMAP_CELL * t;
                    const float y0 = 10.f + kHEATMAP_CELL * r;
                    const auto level = static_cast<sf::Uint8>(255.0 * std::clamp(occupancy(r, t) / peak, 0.0, 1.0));
                    heatmap[v + 0].position = sf::Vector2f(x0, y0);
                    heatmap[v + 1].position = sf::Vector2f(x0 + kHEATMAP_CELL - 1.f, y0);
                    heatmap[v + 2].position = sf::Vector2f(x0 + kHEATMAP_CELL - 1.f, y0 + kHEATMAP_CELL - 1.f);
                    heatmap[v + 3].position = sf::Vector2f(x0, y0 + kHEATMAP_CELL - 1.f);
                    for (int j = 0; j < 4; ++j)
                        heatmap[v + j].color = sf::Color(level, level / 2, 255 - level);
                }
            }
        }

        if (iterations % 25 == 0)
            window.setTitle(fmt::format("EphSwarm | FPS: {:.0f} | n={} | frame {} | coverage {:.2f} | mean haze {:.3f}",
                                        current_fps, n, frame.frame, frame.coverage, mean_haze(simulation.env)));

        window.clear(sf::Color::Black);
        window.draw(border);
        window.draw(plot_agents);
        window.draw(headings);
        window.draw(heatmap);
        window.display();

        ++iterations;
    }
    eph_log::get()->info("Viewer closed at frame {}, coverage {:.3f}", simulation.frame_count(),
                         simulation.env.coverage_fraction());
}
