#include "snooker/systems/movement.hpp"
#include "snooker/components/basic.hpp"
#include "snooker/core/profile.hpp"

namespace Systems {

bool anyBallsMoving(const entt::registry& registry, double threshold) {
    auto view = registry.view<const Components::Ball, const Components::Velocity>(
        entt::exclude<Components::Pocketed>);

    for (auto [entity, ball, vel] : view.each()) {
        if (vel.length() > threshold) {
            return true;
        }
    }
    return false;
}

void MovementSystem::update(entt::registry &registry, const Table& /*table*/) {
    PROFILE_SCOPE("MovementSystem");

    double const dt = sysConfig.TimeScale;

    auto view = registry.view<Components::Ball, Components::Position, Components::Velocity>(
        entt::exclude<Components::Pocketed>);

    for (auto [entity, ball, pos, vel] : view.each()) {
        pos.x += vel.x * dt;
        pos.y += vel.y * dt;
    }
}

} // namespace Systems
