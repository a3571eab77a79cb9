/**
 * @file snooker_frame.cpp
 * @brief Implementation of the starting frame layout.
 */

#include "snooker/scenarios/snooker_frame.hpp"

#include <string>
#include <utility>

#include "snooker/components/basic.hpp"
#include "snooker/core/debug.hpp"

namespace {

struct ColourBall {
    const char* name;
    int value;
};

constexpr ColourBall kColours[] = {
    {"yellow", 2},
    {"green", 3},
    {"brown", 4},
    {"blue", 5},
    {"pink", 6},
    {"black", 7},
};

entt::entity makeBall(entt::registry &registry, const Position &pos, double radius,
                      Components::BallKind kind, std::string name, int value) {
    auto e = registry.create();
    registry.emplace<Components::Position>(e, pos);
    registry.emplace<Components::Velocity>(e, 0.0, 0.0);
    registry.emplace<Components::Radius>(e, radius);
    registry.emplace<Components::Ball>(e, kind, std::move(name), value);
    return e;
}

} // namespace

SystemConfig SnookerFrameScenario::getConfig() const {
    SystemConfig cfg;
    cfg.TimeScale = 1.0;
    cfg.MotionThreshold = 0.5;
    return cfg;
}

TableConfig SnookerFrameScenario::getTableConfig() const {
    return TableConfig{};
}

void SnookerFrameScenario::createEntities(entt::registry &registry, const Table &table) const {
    double const radius = table.getBallRadius();

    // Object balls only go where the table allows one; the cue ball belongs in the D
    int index = 0;
    for (const auto &pos : table.getRedTrianglePositions()) {
        std::string name = "red_" + std::to_string(index++);
        if (!table.isValidBallPosition(pos.x, pos.y)) {
            DEBUG_MSG(DEBUG_LEVEL_BASIC, "[SnookerFrameScenario] Skipping " << name
                      << " at (" << pos.x << ", " << pos.y << ")\n");
            continue;
        }
        makeBall(registry, pos, radius, Components::BallKind::Red, std::move(name), 1);
    }

    for (const auto &colour : kColours) {
        auto spot = table.getBallSpotPosition(colour.name);
        if (!spot || !table.isValidBallPosition(spot->x, spot->y)) {
            DEBUG_MSG(DEBUG_LEVEL_BASIC, "[SnookerFrameScenario] No valid spot for "
                      << colour.name << "\n");
            continue;
        }
        makeBall(registry, *spot, radius, Components::BallKind::Colour, colour.name, colour.value);
    }

    if (scenarioConfig.placeCueBall) {
        Position const brown = table.getBallSpotPosition("brown").value_or(table.getDCentre());
        Position const cuePos(brown.x + scenarioConfig.cueBallOffsetX,
                              brown.y + scenarioConfig.cueBallOffsetY);
        auto cue = makeBall(registry, cuePos, radius, Components::BallKind::Cue, "cue", 0);
        registry.emplace<Components::CueAim>(cue);
    }
}
