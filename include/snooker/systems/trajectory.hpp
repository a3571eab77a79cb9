/**
 * @file trajectory.hpp
 * @brief Forward prediction of the cue ball path before a shot
 *
 * This file provides:
 * - TrajectoryPredictor, a pure fixed-step simulation of a ball launched
 *   across the table, reflecting off the cushions with energy loss
 * - TrajectorySystem, which keeps the cue ball's PredictedTrail in sync
 *   with its CueAim each tick
 *
 * The predictor does not model other balls or obstacles; it shows where
 * the cue ball would travel on an empty table.
 */

#ifndef SNOOKER_TRAJECTORY_HPP
#define SNOOKER_TRAJECTORY_HPP

#include <cstddef>
#include <vector>

#include <entt/entt.hpp>

#include "snooker/components/basic.hpp"
#include "snooker/core/constants.hpp"
#include "snooker/core/table.hpp"
#include "snooker/systems/i_system.hpp"

namespace Systems {

/**
 * @struct TrajectoryConfig
 * @brief Parameters of the prediction run
 */
struct TrajectoryConfig {
    int maxSteps = 300;                 // Hard cap on samples
    double stepSize = 2.0;              // Velocity multiplier per step
    int maxBounces = 5;                 // Stop once this many cushions are hit
    double speedFloor = 0.3;            // Stop once speed drops below this
    double frictionFactor = 0.985;      // Per-step velocity multiplier
    double cushionRestitution = 0.75;   // Speed kept after a cushion bounce

    double ballRadius = SnookerConstants::BallRadius;
    double cushionThickness = SnookerConstants::CushionThickness;

    // Launch speed when previewing an aim without charging
    double previewSpeed = 6.0;
    // Power 0..100 maps linearly onto this range while charging
    double minChargeSpeed = 2.0;
    double maxChargeSpeed = 12.0;
};

/**
 * @brief Validates a prediction configuration.
 * @throws std::invalid_argument on out-of-range parameters
 */
void validateTrajectoryConfig(const TrajectoryConfig& config);

/**
 * @struct CushionHit
 * @brief Result of testing one prediction step against the rails
 */
struct CushionHit {
    bool hit = false;
    Position hitPoint;          // Candidate clamped onto the crossed rail
    Vector normal;              // Unit normal pointing back into the table
};

/**
 * @class TrajectoryPredictor
 * @brief Fixed-step explicit simulation of a launched ball
 *
 * Each step applies friction, advances by velocity * stepSize, and tests
 * the step against the four inset rails. Only one rail is resolved per
 * step, tested left, right, top, bottom; a step that crosses a corner
 * bounces off whichever rail is tested first.
 */
class TrajectoryPredictor {
public:
    TrajectoryPredictor() = default;
    explicit TrajectoryPredictor(const TrajectoryConfig& config);

    /**
     * @brief Predicts the path of a ball.
     *
     * Never fails; a zero launch velocity yields at most one sample.
     *
     * @param start Ball centre at launch
     * @param launchVelocity Initial velocity
     * @param boundaries Outer rails of the table
     * @return Samples in travel order
     */
    std::vector<Components::TrajectorySample> predict(const Position& start,
                                                      const Vector& launchVelocity,
                                                      const TableBounds& boundaries) const;

    /**
     * @brief Rails inset by cushion thickness plus ball radius; the lines
     * the ball centre touches at contact.
     */
    TableBounds insetBounds(const TableBounds& boundaries) const;

    /**
     * @brief Tests the step current -> next against the inset rails.
     *
     * A crossing needs current strictly inside the rail and next on or
     * past it.
     */
    CushionHit checkCushionCollision(const Position& current,
                                     const Position& next,
                                     const TableBounds& boundaries) const;

    /**
     * @brief Reflects a velocity about a unit surface normal.
     */
    static Vector reflectVelocity(const Vector& incident, const Vector& normal);

    /**
     * @brief Velocity the cue would give the ball for an aim.
     *
     * The shot travels opposite to the cue angle. Speed is previewSpeed
     * unless charging, in which case power is mapped onto the charge range.
     */
    Vector launchVelocityFor(const Components::CueAim& aim) const;

    /**
     * @brief Indices of samples where the bounce count increases; the
     * first sample is always included.
     */
    static std::vector<std::size_t> bouncePoints(const std::vector<Components::TrajectorySample>& trail);

    /**
     * @brief Palette slot for a sample, clamped to the last entry.
     */
    static std::size_t segmentColourIndex(const Components::TrajectorySample& sample,
                                          std::size_t paletteSize);

    const TrajectoryConfig& getConfig() const { return config; }
    void setConfig(const TrajectoryConfig& cfg);

private:
    TrajectoryConfig config;
};

/**
 * @class TrajectorySystem
 * @brief Recomputes the cue ball's predicted trail while the player aims
 *
 * Required components on the cue ball:
 * - Ball (kind Cue), Position, CueAim
 *
 * PredictedTrail is created on demand and fully replaced on each run.
 */
class TrajectorySystem : public ConfigurableSystem<TrajectoryConfig> {
public:
    TrajectorySystem();
    ~TrajectorySystem() override = default;

    /**
     * @brief Refreshes or hides the trail of every aimed cue ball
     * @param registry EnTT registry containing entities and components
     * @param table Table geometry supplying the rails
     */
    void update(entt::registry &registry, const Table& table) override;

    void setSpecificConfig(const TrajectoryConfig& config) override;

    void enable() { enabled = true; }
    void disable() { enabled = false; }

    /**
     * @brief Flips the enabled flag; turning off also hides trails on the next update.
     */
    void toggle() { enabled = !enabled; }

    bool isEnabled() const { return enabled; }

    /** @brief Limits how many bounces later predictions show */
    void setMaxBounces(int maxBounces);

    /** @brief Smaller steps give a finer trail */
    void setPredictionAccuracy(double stepSize);

    const TrajectoryPredictor& getPredictor() const { return predictor; }

private:
    TrajectoryPredictor predictor;
    bool enabled = true;
};

} // namespace Systems

#endif // SNOOKER_TRAJECTORY_HPP
