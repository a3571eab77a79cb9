/**
 * @file obstacles.hpp
 * @brief Timed spinning obstacles that push balls away while active
 *
 * This system handles:
 * - Spawning obstacles on a timer, only while every ball is at rest
 * - Searching for a spawn point clear of the D, pockets, balls and other obstacles
 * - Advancing each obstacle through Warning -> Active -> Fading -> removed
 * - Applying a radial push to balls near an Active obstacle, with an
 *   emergency escape for balls that get too close
 *
 * Obstacle entities:
 * - Position (centre, fixed after spawn)
 * - Obstacle (age, phase, rotation)
 * - ForceField (only while Active)
 *
 * Balls affected:
 * - Ball, Position, Velocity, excluding Pocketed
 */

#ifndef SNOOKER_OBSTACLES_HPP
#define SNOOKER_OBSTACLES_HPP

#include <cstddef>
#include <memory>
#include <optional>

#include <entt/entt.hpp>

#include "snooker/core/random_source.hpp"
#include "snooker/systems/i_system.hpp"
#include "snooker/systems/obstacle_lifecycle.hpp"

namespace Systems {

/**
 * @struct ObstacleConfig
 * @brief Configuration parameters specific to the obstacle system
 */
struct ObstacleConfig {
    // Spawning
    int spawnInterval = 420;           // Ticks between spawn attempts
    int maxObstacles = 2;
    int maxSpawnAttempts = 50;
    double spawnEdgeMargin = 80.0;     // Candidates stay this far inside the rails
    double pocketClearance = 70.0;
    double ballClearance = 80.0;
    double obstacleSeparation = 100.0;

    LifecycleThresholds lifecycle;
    double rotationSpeed = 0.08;       // Radians per tick

    // Force field
    double interactionRadius = 60.0;
    double emergencyRadius = 25.0;
    double innerRadius = 5.0;          // Distance at which the push is strongest
    double maxPushForce = 6.0;
    double minPushForce = 1.5;
    double pushBlend = 0.3;            // Fraction of the push added to velocity
    double spinInfluence = 0.2;        // Radians of deflection at peak spin
    double maxBallSpeed = 10.0;

    // Emergency escape
    double escapeDistance = 40.0;
    double escapeSpeed = 3.0;
};

/**
 * @brief Validates an obstacle configuration.
 * @throws std::invalid_argument on inconsistent radii, negative counts, or
 * phase durations that would let an obstacle skip Active or Fading
 */
void validateObstacleConfig(const ObstacleConfig& config);

/**
 * @class ObstacleSystem
 * @brief Owns the spawn timer and enabled flag; obstacles live in the registry
 */
class ObstacleSystem : public ConfigurableSystem<ObstacleConfig> {
public:
    /**
     * @brief Constructor using a clock-seeded random source
     */
    ObstacleSystem();

    /**
     * @brief Constructor with an injected random source for spawn search
     */
    explicit ObstacleSystem(std::shared_ptr<IRandomSource> random);

    ~ObstacleSystem() override = default;

    /**
     * @brief Per-tick entry point.
     *
     * Advances the spawn timer and, when due, under the cap and with no
     * ball moving, makes one spawn attempt. Then ages every obstacle,
     * applies forces from active ones and removes expired ones.
     */
    void update(entt::registry &registry, const Table& table) override;

    void setSpecificConfig(const ObstacleConfig& config) override;

    /**
     * @brief Tries to place one obstacle.
     * @return The new obstacle entity, or nullopt when no clear spot was found
     */
    std::optional<entt::entity> spawn(entt::registry &registry, const Table& table);

    /**
     * @brief Bounded random search for a clear obstacle centre.
     */
    std::optional<Position> findSafeSpawnPosition(const entt::registry &registry, const Table& table);

    /**
     * @brief Ages an obstacle by one tick and applies its phase edges.
     *
     * Creates the ForceField on entering Active and removes it on leaving.
     * Does not destroy the entity.
     *
     * @return true when the obstacle has outlived its lifetime
     */
    bool advanceLifecycle(entt::registry &registry, entt::entity obstacle);

    /**
     * @brief Pushes every ball within the obstacle's ForceField radius away from it.
     *
     * Does nothing for an obstacle without a ForceField.
     */
    void applyForces(entt::registry &registry, entt::entity obstacle);

    void enable() { enabled = true; }

    /**
     * @brief Disables the system and removes every obstacle immediately.
     */
    void disable(entt::registry &registry);

    void toggle(entt::registry &registry);

    bool isEnabled() const { return enabled; }

    /** @brief Number of live obstacles in the registry */
    std::size_t count(const entt::registry &registry) const;

    int getSpawnTimer() const { return spawnTimer; }

private:
    void pushBallAway(const Components::Obstacle &obstacle, const Position &centre,
                      Position &ballPos, Vector &ballVel, double distance,
                      double interactionRadius) const;
    void emergencyEscape(const Components::Obstacle &obstacle, const Position &centre,
                         Position &ballPos, Vector &ballVel) const;

    std::shared_ptr<IRandomSource> random;
    int spawnTimer = 0;
    bool enabled = true;
};

} // namespace Systems

#endif // SNOOKER_OBSTACLES_HPP
