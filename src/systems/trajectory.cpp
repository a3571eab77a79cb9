/**
 * @file trajectory.cpp
 * @brief Implementation of cue ball path prediction
 */

#include "snooker/systems/trajectory.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "snooker/core/constants.hpp"
#include "snooker/core/debug.hpp"
#include "snooker/core/profile.hpp"
#include "snooker/systems/movement.hpp"

namespace Systems {

void validateTrajectoryConfig(const TrajectoryConfig& config) {
    if (config.maxSteps < 0 || config.maxBounces < 0) {
        throw std::invalid_argument("Prediction step and bounce limits must be non-negative");
    }
    if (config.stepSize <= 0.0) {
        throw std::invalid_argument("Prediction step size must be positive");
    }
    if (config.frictionFactor <= 0.0 || config.frictionFactor > 1.0) {
        throw std::invalid_argument("Friction factor must be in (0, 1]");
    }
    if (config.cushionRestitution <= 0.0 || config.cushionRestitution > 1.0) {
        throw std::invalid_argument("Cushion restitution must be in (0, 1]");
    }
    if (config.speedFloor < 0.0 || config.ballRadius < 0.0 || config.cushionThickness < 0.0) {
        throw std::invalid_argument("Speed floor, ball radius and cushion thickness must be non-negative");
    }
}

// ------------------ TrajectoryPredictor ------------------

TrajectoryPredictor::TrajectoryPredictor(const TrajectoryConfig& cfg) {
    setConfig(cfg);
}

void TrajectoryPredictor::setConfig(const TrajectoryConfig& cfg) {
    validateTrajectoryConfig(cfg);
    config = cfg;
}

TableBounds TrajectoryPredictor::insetBounds(const TableBounds& boundaries) const {
    double const inset = config.cushionThickness + config.ballRadius;
    return TableBounds{
        boundaries.left + inset,
        boundaries.right - inset,
        boundaries.top + inset,
        boundaries.bottom - inset
    };
}

CushionHit TrajectoryPredictor::checkCushionCollision(const Position& current,
                                                      const Position& next,
                                                      const TableBounds& boundaries) const {
    TableBounds const rail = insetBounds(boundaries);
    CushionHit collision;
    collision.hitPoint = next;

    // First match wins; at most one axis is resolved per step
    if (next.x <= rail.left && current.x > rail.left) {
        collision.hit = true;
        collision.hitPoint = Position(rail.left, next.y);
        collision.normal = Vector(1.0, 0.0);
    }
    else if (next.x >= rail.right && current.x < rail.right) {
        collision.hit = true;
        collision.hitPoint = Position(rail.right, next.y);
        collision.normal = Vector(-1.0, 0.0);
    }
    else if (next.y <= rail.top && current.y > rail.top) {
        collision.hit = true;
        collision.hitPoint = Position(next.x, rail.top);
        collision.normal = Vector(0.0, 1.0);
    }
    else if (next.y >= rail.bottom && current.y < rail.bottom) {
        collision.hit = true;
        collision.hitPoint = Position(next.x, rail.bottom);
        collision.normal = Vector(0.0, -1.0);
    }
    return collision;
}

Vector TrajectoryPredictor::reflectVelocity(const Vector& incident, const Vector& normal) {
    return incident.reflect(normal);
}

std::vector<Components::TrajectorySample> TrajectoryPredictor::predict(const Position& start,
                                                                       const Vector& launchVelocity,
                                                                       const TableBounds& boundaries) const {
    std::vector<Components::TrajectorySample> trail;
    trail.reserve(static_cast<std::size_t>(config.maxSteps));

    Vector velocity = launchVelocity;
    Position current = start;
    int bounces = 0;

    for (int step = 0; step < config.maxSteps && bounces < config.maxBounces; ++step) {
        velocity *= config.frictionFactor;

        Position next = current + velocity * config.stepSize;

        CushionHit const collision = checkCushionCollision(current, next, boundaries);
        if (collision.hit) {
            next = collision.hitPoint;
            velocity = reflectVelocity(velocity, collision.normal) * config.cushionRestitution;
            ++bounces;
        }

        double const speed = velocity.length();
        trail.push_back(Components::TrajectorySample{next, bounces, speed});

        current = next;
        if (speed < config.speedFloor) {
            break;
        }
    }

    return trail;
}

Vector TrajectoryPredictor::launchVelocityFor(const Components::CueAim& aim) const {
    double const shootAngle = aim.angle + SnookerConstants::Pi;

    double speed = config.previewSpeed;
    if (aim.charging) {
        double const powerRatio = std::clamp(aim.power / 100.0, 0.0, 1.0);
        speed = remap(powerRatio, 0.0, 1.0, config.minChargeSpeed, config.maxChargeSpeed);
    }
    return Vector::fromAngle(shootAngle, speed);
}

std::vector<std::size_t> TrajectoryPredictor::bouncePoints(const std::vector<Components::TrajectorySample>& trail) {
    std::vector<std::size_t> indices;
    int lastBounce = -1;
    for (std::size_t i = 0; i < trail.size(); ++i) {
        if (trail[i].bounceCount > lastBounce) {
            indices.push_back(i);
            lastBounce = trail[i].bounceCount;
        }
    }
    return indices;
}

std::size_t TrajectoryPredictor::segmentColourIndex(const Components::TrajectorySample& sample,
                                                    std::size_t paletteSize) {
    if (paletteSize == 0) {
        return 0;
    }
    auto const bounce = static_cast<std::size_t>(std::max(sample.bounceCount, 0));
    return std::min(bounce, paletteSize - 1);
}

// ------------------ TrajectorySystem ------------------

TrajectorySystem::TrajectorySystem() {
    predictor.setConfig(specificConfig);
}

void TrajectorySystem::setSpecificConfig(const TrajectoryConfig& config) {
    predictor.setConfig(config);
    specificConfig = config;
}

void TrajectorySystem::setMaxBounces(int maxBounces) {
    TrajectoryConfig cfg = specificConfig;
    cfg.maxBounces = maxBounces;
    setSpecificConfig(cfg);
}

void TrajectorySystem::setPredictionAccuracy(double stepSize) {
    TrajectoryConfig cfg = specificConfig;
    cfg.stepSize = stepSize;
    setSpecificConfig(cfg);
}

void TrajectorySystem::update(entt::registry &registry, const Table& table) {
    PROFILE_SCOPE("TrajectorySystem");

    // The table is authoritative for the rail inset
    if (specificConfig.ballRadius != table.getBallRadius() ||
        specificConfig.cushionThickness != table.getCushionThickness()) {
        TrajectoryConfig cfg = specificConfig;
        cfg.ballRadius = table.getBallRadius();
        cfg.cushionThickness = table.getCushionThickness();
        setSpecificConfig(cfg);
    }

    bool const ballsMoving = anyBallsMoving(registry, sysConfig.MotionThreshold);

    auto view = registry.view<Components::Ball, Components::Position, Components::CueAim>(
        entt::exclude<Components::Pocketed>);

    for (auto &&[entity, ball, pos, aim] : view.each()) {
        if (ball.kind != Components::BallKind::Cue) {
            continue;
        }

        auto &trail = registry.get_or_emplace<Components::PredictedTrail>(entity);

        if (!enabled) {
            trail.samples.clear();
            trail.bounces = 0;
            trail.visible = false;
            continue;
        }

        if (!aim.visible || ballsMoving) {
            trail.visible = false;
            continue;
        }

        trail.samples = predictor.predict(pos, predictor.launchVelocityFor(aim), table.getBoundaries());
        trail.bounces = trail.samples.empty() ? 0 : trail.samples.back().bounceCount;
        trail.visible = true;

        DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[TrajectorySystem] " << trail.samples.size()
                  << " samples, " << trail.bounces << " bounces\n");
    }
}

} // namespace Systems
