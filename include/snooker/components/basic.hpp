#ifndef SNOOKER_COMPONENTS_BASIC_HPP
#define SNOOKER_COMPONENTS_BASIC_HPP

#include <string>
#include <vector>
#include "snooker/math/vector_math.hpp" // for Position, Vector

namespace Components {

    enum class BallKind {
        Cue,
        Red,
        Colour
    };

    // Obstacle lifecycle; the order is the only legal progression.
    enum class ObstaclePhase {
        Warning,
        Active,
        Fading
    };

    using Position = ::Position;
    using Velocity = ::Vector;

    struct Radius {
        double value;
    };

    /**
     * @brief Identifies an entity as a ball on the table.
     */
    struct Ball {
        BallKind kind;
        std::string name;
        int value = 0;
    };

    // Tag: ball has left the playing surface
    struct Pocketed {};

    /**
     * @brief Timed obstacle. Its centre is the entity's Position, which
     * never changes after spawn.
     */
    struct Obstacle {
        int age = 0;
        ObstaclePhase phase = ObstaclePhase::Warning;
        double rotationAngle = 0.0;
        double rotationSpeed = 0.08; // radians per tick
    };

    /**
     * @brief Present on an obstacle exactly while it is Active.
     */
    struct ForceField {
        double interactionRadius;
    };

    /**
     * @brief Aiming state of the cue, attached to the cue ball.
     *
     * angle points from the ball towards the cue butt; the shot travels
     * the opposite way.
     */
    struct CueAim {
        double angle = 0.0;
        double power = 0.0;   // 0..100
        bool charging = false;
        bool visible = false;
    };

    struct TrajectorySample {
        Position position;
        int bounceCount;
        double speed;
    };

    /**
     * @brief Last prediction computed for the cue ball.
     */
    struct PredictedTrail {
        std::vector<TrajectorySample> samples;
        int bounces = 0;
        bool visible = false;
    };

} // namespace Components

#endif
