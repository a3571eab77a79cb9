/**
 * @file snooker_frame.hpp
 * @brief Declaration of the SnookerFrameScenario class
 */

#pragma once

#include <entt/entt.hpp>
#include "snooker/scenarios/i_scenario.hpp"

/**
 * @struct SnookerFrameConfig
 * @brief Configuration parameters specific to the starting frame layout
 */
struct SnookerFrameConfig {
    bool placeCueBall = true;          // Put the cue ball in the D ready to aim
    double cueBallOffsetX = -40.0;     // Offset from the brown spot
    double cueBallOffsetY = 0.0;
};

/**
 * @class SnookerFrameScenario
 *
 * Fifteen reds racked in a triangle, the six colours on their spots and the
 * cue ball in the D.
 */
class SnookerFrameScenario : public IScenario {
public:
    SnookerFrameScenario() = default;
    explicit SnookerFrameScenario(const SnookerFrameConfig &config) : scenarioConfig(config) {}
    ~SnookerFrameScenario() override = default;

    SystemConfig getConfig() const override;
    TableConfig getTableConfig() const override;
    void createEntities(entt::registry &registry, const Table &table) const override;

private:
    SnookerFrameConfig scenarioConfig;
};
