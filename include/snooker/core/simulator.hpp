/**
 * @file simulator.hpp
 * @brief Headless table simulator that owns the registry, table and systems.
 */

#pragma once

#include <memory>
#include <optional>
#include <vector>

#include <entt/entt.hpp>

#include "snooker/core/random_source.hpp"
#include "snooker/core/system_config.hpp"
#include "snooker/core/table.hpp"
#include "snooker/scenarios/i_scenario.hpp"
#include "snooker/systems/i_system.hpp"

namespace Systems {
class TrajectorySystem;
class ObstacleSystem;
}

/**
 * @class TableSimulator
 * @brief Steps the systems in order once per tick against one registry.
 *
 * Tick order: trajectory prediction, obstacles, then the stand-in motion
 * systems (movement, dampening, cushions).
 */
class TableSimulator {
public:
    TableSimulator();

    /**
     * @param random Random source handed to the obstacle system
     */
    explicit TableSimulator(std::shared_ptr<IRandomSource> random);

    ~TableSimulator();

    /**
     * @brief Installs a scenario; takes effect on the next reset().
     */
    void loadScenario(std::unique_ptr<IScenario> scenario);

    /**
     * @brief Clears the registry, rebuilds the table and systems, and
     * lets the scenario place its entities.
     */
    void reset();

    /**
     * @brief Steps the ECS systems for one tick
     */
    void tick();

    /**
     * @brief Sends the cue ball off along its current aim.
     *
     * Power is clamped to 0..100 and mapped onto 1..maxShotSpeed; the cue hides.
     *
     * @return false when there is no cue ball on the table
     */
    bool shoot(double power);

    /** @brief Cue ball entity, if one is on the table */
    std::optional<entt::entity> cueBall() const;

    entt::registry& getRegistry();
    const entt::registry& getRegistry() const;
    const Table& getTable() const;
    const SystemConfig& getConfig() const;

    Systems::TrajectorySystem& trajectory();
    Systems::ObstacleSystem& obstacles();

    double maxShotSpeed = 20.0;

private:
    void createSystems();

    entt::registry registry;
    std::unique_ptr<IScenario> scenarioPtr;
    std::shared_ptr<IRandomSource> random;
    SystemConfig currentConfig;
    Table table;

    std::vector<std::unique_ptr<Systems::ISystem>> systems;
    Systems::TrajectorySystem* trajectorySystem = nullptr;
    Systems::ObstacleSystem* obstacleSystem = nullptr;
};
