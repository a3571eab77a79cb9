/**
 * @file obstacles.cpp
 * @brief Implementation of the timed obstacle field
 */

#include "snooker/systems/obstacles.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>
#include <vector>

#include "snooker/components/basic.hpp"
#include "snooker/core/debug.hpp"
#include "snooker/core/profile.hpp"
#include "snooker/core/table.hpp"
#include "snooker/systems/movement.hpp"

namespace Systems {

void validateObstacleConfig(const ObstacleConfig& config) {
    if (config.spawnInterval < 0 || config.maxObstacles < 0 || config.maxSpawnAttempts < 0) {
        throw std::invalid_argument("Obstacle counts and intervals must be non-negative");
    }
    if (config.lifecycle.warningDuration < 0) {
        throw std::invalid_argument("Obstacle warning duration must be non-negative");
    }
    // Every obstacle must pass through Active and Fading
    if (config.lifecycle.activeDuration <= 0 || config.lifecycle.fadeDuration <= 0) {
        throw std::invalid_argument("Obstacle active and fade durations must be positive");
    }
    if (config.emergencyRadius < 0.0 || config.emergencyRadius >= config.interactionRadius) {
        throw std::invalid_argument("Emergency radius must be in [0, interactionRadius)");
    }
    if (config.innerRadius < 0.0 || config.innerRadius >= config.interactionRadius) {
        throw std::invalid_argument("Inner radius must be in [0, interactionRadius)");
    }
    if (config.escapeDistance <= config.emergencyRadius) {
        throw std::invalid_argument("Escape distance must lie outside the emergency radius");
    }
    if (config.maxBallSpeed <= 0.0) {
        throw std::invalid_argument("Maximum ball speed must be positive");
    }
}

ObstacleSystem::ObstacleSystem()
    : ObstacleSystem(std::make_shared<EngineRandomSource>()) {}

ObstacleSystem::ObstacleSystem(std::shared_ptr<IRandomSource> randomSource)
    : random(std::move(randomSource))
{
    if (!random) {
        random = std::make_shared<EngineRandomSource>();
    }
}

void ObstacleSystem::setSpecificConfig(const ObstacleConfig& config) {
    validateObstacleConfig(config);
    specificConfig = config;
}

std::size_t ObstacleSystem::count(const entt::registry &registry) const {
    return registry.view<const Components::Obstacle>().size();
}

void ObstacleSystem::update(entt::registry &registry, const Table& table) {
    PROFILE_SCOPE("ObstacleSystem");

    if (!enabled) {
        return;
    }

    ++spawnTimer;

    if (spawnTimer >= specificConfig.spawnInterval &&
        count(registry) < static_cast<std::size_t>(specificConfig.maxObstacles) &&
        !anyBallsMoving(registry, sysConfig.MotionThreshold)) {
        spawn(registry, table);
        spawnTimer = 0;
    }

    // Snapshot first so removal never disturbs the visit order
    std::vector<entt::entity> obstacles;
    for (auto entity : registry.view<Components::Obstacle>()) {
        obstacles.push_back(entity);
    }

    for (auto it = obstacles.rbegin(); it != obstacles.rend(); ++it) {
        entt::entity const entity = *it;

        bool const expired = advanceLifecycle(registry, entity);

        auto &obstacle = registry.get<Components::Obstacle>(entity);
        obstacle.rotationAngle += obstacle.rotationSpeed;

        if (obstacle.phase == Components::ObstaclePhase::Active) {
            applyForces(registry, entity);
        }

        if (expired) {
            DEBUG_MSG(DEBUG_LEVEL_BASIC, "[ObstacleSystem] Obstacle removed after "
                      << obstacle.age << " ticks\n");
            registry.destroy(entity);
        }
    }
}

std::optional<entt::entity> ObstacleSystem::spawn(entt::registry &registry, const Table& table) {
    std::optional<Position> const spawnPos = findSafeSpawnPosition(registry, table);
    if (!spawnPos) {
        DEBUG_MSG(DEBUG_LEVEL_BASIC, "[ObstacleSystem] No safe position found for obstacle spawn\n");
        DebugStats::recordSpawnFailure();
        return std::nullopt;
    }

    auto entity = registry.create();
    registry.emplace<Components::Position>(entity, *spawnPos);

    Components::Obstacle obstacle;
    obstacle.rotationSpeed = specificConfig.rotationSpeed;
    registry.emplace<Components::Obstacle>(entity, obstacle);

    DEBUG_MSG(DEBUG_LEVEL_BASIC, "[ObstacleSystem] Obstacle spawned at ("
              << spawnPos->x << ", " << spawnPos->y << ")\n");
    return entity;
}

std::optional<Position> ObstacleSystem::findSafeSpawnPosition(const entt::registry &registry, const Table& table) {
    TableBounds const bounds = table.getBoundaries();
    double const margin = specificConfig.spawnEdgeMargin;

    auto balls = registry.view<const Components::Ball, const Components::Position>(
        entt::exclude<Components::Pocketed>);
    auto obstacles = registry.view<const Components::Obstacle, const Components::Position>();

    for (int attempt = 0; attempt < specificConfig.maxSpawnAttempts; ++attempt) {
        Position const candidate(random->uniform(bounds.left + margin, bounds.right - margin),
                                 random->uniform(bounds.top + margin, bounds.bottom - margin));

        if (table.isInRestrictedZone(candidate.x, candidate.y)) {
            continue;
        }

        const auto &pockets = table.getPocketPositions();
        bool const nearPocket = std::any_of(pockets.begin(), pockets.end(), [&](const Pocket &pocket) {
            return candidate.dist(pocket.position) < specificConfig.pocketClearance;
        });
        if (nearPocket) {
            continue;
        }

        bool blocked = false;
        for (auto [entity, ball, pos] : balls.each()) {
            if (candidate.dist(pos) < specificConfig.ballClearance) {
                blocked = true;
                break;
            }
        }
        if (!blocked) {
            for (auto [entity, obstacle, centre] : obstacles.each()) {
                if (candidate.dist(centre) < specificConfig.obstacleSeparation) {
                    blocked = true;
                    break;
                }
            }
        }
        if (!blocked) {
            return candidate;
        }
    }

    return std::nullopt;
}

bool ObstacleSystem::advanceLifecycle(entt::registry &registry, entt::entity entity) {
    auto &obstacle = registry.get<Components::Obstacle>(entity);
    ++obstacle.age;

    PhaseTransition const transition = advancePhase(obstacle.phase, obstacle.age, specificConfig.lifecycle);

    if (transition.createForceField) {
        DEBUG_MSG(DEBUG_LEVEL_BASIC, "[ObstacleSystem] Obstacle became ACTIVE - now affecting balls\n");
        registry.emplace_or_replace<Components::ForceField>(entity, specificConfig.interactionRadius);
    }
    if (transition.destroyForceField) {
        DEBUG_MSG(DEBUG_LEVEL_BASIC, "[ObstacleSystem] Obstacle fading out - force field removed\n");
        registry.remove<Components::ForceField>(entity);
    }

    obstacle.phase = transition.phase;
    return transition.expired;
}

void ObstacleSystem::applyForces(entt::registry &registry, entt::entity entity) {
    const auto *field = registry.try_get<Components::ForceField>(entity);
    if (!field) {
        return;
    }

    const auto &obstacle = registry.get<Components::Obstacle>(entity);
    Position const centre = registry.get<Components::Position>(entity);
    double const interactionRadius = field->interactionRadius;

    auto balls = registry.view<Components::Ball, Components::Position, Components::Velocity>(
        entt::exclude<Components::Pocketed>);

    for (auto &&[ballEntity, ball, pos, vel] : balls.each()) {
        double const distance = centre.dist(pos);

        if (distance <= specificConfig.emergencyRadius) {
            emergencyEscape(obstacle, centre, pos, vel);
        } else if (distance < interactionRadius) {
            pushBallAway(obstacle, centre, pos, vel, distance, interactionRadius);
        }
    }
}

void ObstacleSystem::pushBallAway(const Components::Obstacle &obstacle, const Position &centre,
                                  Position &ballPos, Vector &ballVel, double distance,
                                  double interactionRadius) const {
    double pushAngle = ballPos.offsetFrom(centre).angle();
    pushAngle += std::sin(obstacle.rotationAngle * 2.0) * specificConfig.spinInfluence;

    // Strongest at innerRadius, weakest at the interaction edge
    double const outerRadius = std::max(interactionRadius, specificConfig.innerRadius);
    double const clamped = std::clamp(distance, specificConfig.innerRadius, outerRadius);
    double const forceMagnitude = remap(clamped,
                                        specificConfig.innerRadius, outerRadius,
                                        specificConfig.maxPushForce, specificConfig.minPushForce);

    Vector const push = Vector::fromAngle(pushAngle, forceMagnitude);
    ballVel = (ballVel + push * specificConfig.pushBlend).clampedLength(specificConfig.maxBallSpeed);

    DebugStats::updatePush(forceMagnitude);
}

void ObstacleSystem::emergencyEscape(const Components::Obstacle &obstacle, const Position &centre,
                                     Position &ballPos, Vector &ballVel) const {
    Vector const offset = ballPos.offsetFrom(centre);

    // A ball sitting on the centre has no direction of its own
    double const escapeAngle = offset.length() > EPSILON ? offset.angle() : obstacle.rotationAngle;

    ballPos = centre + Vector::fromAngle(escapeAngle, specificConfig.escapeDistance);
    ballVel = Vector::fromAngle(escapeAngle, specificConfig.escapeSpeed);

    DebugStats::recordEscape();
    DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[ObstacleSystem] Emergency escape to ("
              << ballPos.x << ", " << ballPos.y << ")\n");
}

void ObstacleSystem::disable(entt::registry &registry) {
    enabled = false;

    auto view = registry.view<Components::Obstacle>();
    std::vector<entt::entity> obstacles(view.begin(), view.end());
    for (auto entity : obstacles) {
        registry.remove<Components::ForceField>(entity);
        registry.destroy(entity);
    }
}

void ObstacleSystem::toggle(entt::registry &registry) {
    if (enabled) {
        disable(registry);
    } else {
        enable();
    }
}

} // namespace Systems
