/**
 * @file main.cpp
 * @brief Headless demo: aim, predict, shoot and run the table for a while.
 *
 * Usage: snooker_demo [ticks] [aimDegrees] [power]
 */

#include <algorithm>
#include <exception>
#include <iostream>
#include <string>

#include "snooker/components/basic.hpp"
#include "snooker/core/constants.hpp"
#include "snooker/core/debug.hpp"
#include "snooker/core/profile.hpp"
#include "snooker/core/simulator.hpp"
#include "snooker/systems/obstacle_lifecycle.hpp"
#include "snooker/systems/obstacles.hpp"
#include "snooker/systems/trajectory.hpp"

int main(int argc, char* argv[]) {
    int ticks = 900;
    double aimDegrees = 180.0;   // Cue behind the ball, shot towards +x
    double power = 40.0;

    try {
        if (argc > 1) ticks = std::stoi(argv[1]);
        if (argc > 2) aimDegrees = std::stod(argv[2]);
        if (argc > 3) power = std::stod(argv[3]);
    } catch (const std::exception& e) {
        std::cerr << "Usage: " << argv[0] << " [ticks] [aimDegrees] [power]\n"
                  << "Invalid argument: " << e.what() << "\n";
        return 1;
    }

    PROFILE_SCOPE("main");

    TableSimulator simulator;
    auto& registry = simulator.getRegistry();

    auto cue = simulator.cueBall();
    if (!cue) {
        std::cerr << "Scenario has no cue ball\n";
        return 1;
    }

    auto& aim = registry.get<Components::CueAim>(*cue);
    aim.angle = SnookerConstants::degreesToRadians(aimDegrees);
    aim.visible = true;

    // One tick while aiming computes the preview trail
    simulator.tick();

    const auto& trail = registry.get<Components::PredictedTrail>(*cue);
    std::cout << "Predicted trail: " << trail.samples.size() << " samples, "
              << trail.bounces << " bounces\n";
    for (auto index : Systems::TrajectoryPredictor::bouncePoints(trail.samples)) {
        const auto& sample = trail.samples[index];
        std::cout << "  bounce " << sample.bounceCount << " at (" << sample.position.x
                  << ", " << sample.position.y << ") speed " << sample.speed << "\n";
    }

    simulator.shoot(power);

    std::size_t peakObstacles = 0;
    for (int i = 0; i < ticks; ++i) {
        simulator.tick();
        peakObstacles = std::max(peakObstacles, simulator.obstacles().count(registry));
    }

    const auto& cuePos = registry.get<Components::Position>(*cue);
    std::cout << "Cue ball after " << ticks << " ticks ("
              << SnookerConstants::ticksToSeconds(ticks) << "s): ("
              << cuePos.x << ", " << cuePos.y << ")\n"
              << "Obstacles now: " << simulator.obstacles().count(registry)
              << ", peak: " << peakObstacles << "\n";

    const auto& thresholds = simulator.obstacles().getSpecificConfig().lifecycle;
    auto obstacles = registry.view<const Components::Obstacle, const Components::Position>();
    for (auto [entity, obstacle, centre] : obstacles.each()) {
        std::cout << "  " << Systems::phaseName(obstacle.phase) << " obstacle at ("
                  << centre.x << ", " << centre.y << ")";
        if (obstacle.phase == Components::ObstaclePhase::Warning) {
            std::cout << ", active in "
                      << Systems::warningCountdownSeconds(obstacle.age, thresholds,
                                                          SnookerConstants::TicksPerSecond)
                      << "s";
        } else if (obstacle.phase == Components::ObstaclePhase::Fading) {
            std::cout << ", faded " << Systems::fadeProgress(obstacle.age, thresholds) * 100.0 << "%";
        }
        std::cout << "\n";
    }

    DebugStats::printInteractionStats();
    Profiling::Profiler::printStats();
    return 0;
}
