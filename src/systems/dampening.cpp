/**
 * @file dampening.cpp
 * @brief Implementation of velocity dampening system
 */

#include "snooker/systems/dampening.hpp"
#include "snooker/components/basic.hpp"
#include "snooker/core/profile.hpp"

namespace Systems {

void DampeningSystem::update(entt::registry &registry, const Table& /*table*/) {
    PROFILE_SCOPE("DampeningSystem");

    auto view = registry.view<Components::Ball, Components::Velocity>(
        entt::exclude<Components::Pocketed>);

    for (auto [entity, ball, vel] : view.each()) {
        vel *= specificConfig.linearDampingFactor;

        if (vel.length() < specificConfig.restSpeed) {
            vel = Components::Velocity(0.0, 0.0);
        }
    }
}

} // namespace Systems
