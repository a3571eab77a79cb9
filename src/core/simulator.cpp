/**
 * @fileoverview simulator.cpp
 * @brief Implementation of TableSimulator.
 */

#include "snooker/core/simulator.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "snooker/components/basic.hpp"
#include "snooker/core/constants.hpp"
#include "snooker/core/debug.hpp"
#include "snooker/core/profile.hpp"
#include "snooker/scenarios/snooker_frame.hpp"
#include "snooker/systems/boundary.hpp"
#include "snooker/systems/dampening.hpp"
#include "snooker/systems/movement.hpp"
#include "snooker/systems/obstacles.hpp"
#include "snooker/systems/trajectory.hpp"

TableSimulator::TableSimulator()
    : TableSimulator(std::make_shared<EngineRandomSource>()) {}

TableSimulator::TableSimulator(std::shared_ptr<IRandomSource> randomSource)
    : scenarioPtr(std::make_unique<SnookerFrameScenario>()),
      random(std::move(randomSource))
{
    reset();
}

TableSimulator::~TableSimulator() = default;

void TableSimulator::loadScenario(std::unique_ptr<IScenario> scenario) {
    scenarioPtr = std::move(scenario);
}

void TableSimulator::reset() {
    registry.clear();

    if (scenarioPtr) {
        currentConfig = scenarioPtr->getConfig();
        table = Table(scenarioPtr->getTableConfig());
    }

    createSystems();

    if (scenarioPtr) {
        scenarioPtr->createEntities(registry, table);
    }

    DEBUG_MSG(DEBUG_LEVEL_BASIC, "[TableSimulator] reset with "
              << registry.view<Components::Ball>().size() << " balls\n");
}

void TableSimulator::createSystems() {
    systems.clear();
    trajectorySystem = nullptr;
    obstacleSystem = nullptr;

    for (auto type : currentConfig.activeSystems) {
        switch (type) {
            case Systems::SystemType::TRAJECTORY: {
                auto system = std::make_unique<Systems::TrajectorySystem>();
                trajectorySystem = system.get();
                systems.push_back(std::move(system));
                break;
            }
            case Systems::SystemType::OBSTACLES: {
                auto system = std::make_unique<Systems::ObstacleSystem>(random);
                obstacleSystem = system.get();
                systems.push_back(std::move(system));
                break;
            }
            case Systems::SystemType::MOVEMENT:
                systems.push_back(std::make_unique<Systems::MovementSystem>());
                break;
            case Systems::SystemType::DAMPENING:
                systems.push_back(std::make_unique<Systems::DampeningSystem>());
                break;
            case Systems::SystemType::CUSHION:
                systems.push_back(std::make_unique<Systems::CushionSystem>());
                break;
        }
    }

    // Configure all systems
    for (auto& system : systems) {
        system->setSystemConfig(currentConfig);
    }
}

void TableSimulator::tick() {
    PROFILE_SCOPE("TableSimulator::tick");

    // Update all systems in order
    for (auto& system : systems) {
        system->update(registry, table);
    }
}

std::optional<entt::entity> TableSimulator::cueBall() const {
    auto view = registry.view<const Components::Ball>(entt::exclude<Components::Pocketed>);
    for (auto [entity, ball] : view.each()) {
        if (ball.kind == Components::BallKind::Cue) {
            return entity;
        }
    }
    return std::nullopt;
}

bool TableSimulator::shoot(double power) {
    auto cue = cueBall();
    if (!cue || !registry.all_of<Components::CueAim, Components::Velocity>(*cue)) {
        return false;
    }

    auto &aim = registry.get<Components::CueAim>(*cue);
    double const shootAngle = aim.angle + SnookerConstants::Pi;
    double const clampedPower = std::clamp(power, 0.0, 100.0);
    double const speed = remap(clampedPower, 0.0, 100.0, 1.0, maxShotSpeed);

    registry.replace<Components::Velocity>(*cue, Vector::fromAngle(shootAngle, speed));

    aim.visible = false;
    aim.charging = false;
    aim.power = 0.0;
    return true;
}

entt::registry& TableSimulator::getRegistry() {
    return registry;
}

const entt::registry& TableSimulator::getRegistry() const {
    return registry;
}

const Table& TableSimulator::getTable() const {
    return table;
}

const SystemConfig& TableSimulator::getConfig() const {
    return currentConfig;
}

Systems::TrajectorySystem& TableSimulator::trajectory() {
    if (!trajectorySystem) {
        throw std::logic_error("Trajectory system is not active in this simulator");
    }
    return *trajectorySystem;
}

Systems::ObstacleSystem& TableSimulator::obstacles() {
    if (!obstacleSystem) {
        throw std::logic_error("Obstacle system is not active in this simulator");
    }
    return *obstacleSystem;
}
