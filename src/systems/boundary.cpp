#include "snooker/systems/boundary.hpp"
#include "snooker/components/basic.hpp"
#include "snooker/core/profile.hpp"
#include "snooker/core/table.hpp"

#include <cmath>

namespace Systems {

void CushionSystem::update(entt::registry &registry, const Table& table) {
    PROFILE_SCOPE("CushionSystem");

    TableBounds const rails = table.getBoundaries();
    double const inset = table.getCushionThickness() + table.getBallRadius();
    double const left = rails.left + inset;
    double const right = rails.right - inset;
    double const top = rails.top + inset;
    double const bottom = rails.bottom - inset;
    double const restitution = specificConfig.restitution;

    auto view = registry.view<Components::Ball, Components::Position, Components::Velocity>(
        entt::exclude<Components::Pocketed>);

    for (auto &&[entity, ball, pos, vel] : view.each()) {
        // Check left cushion
        if (pos.x < left) {
            pos.x = left;
            vel.x = std::abs(vel.x) * restitution;
        }
        // Check right cushion
        else if (pos.x > right) {
            pos.x = right;
            vel.x = -std::abs(vel.x) * restitution;
        }

        // Check top cushion
        if (pos.y < top) {
            pos.y = top;
            vel.y = std::abs(vel.y) * restitution;
        }
        // Check bottom cushion
        else if (pos.y > bottom) {
            pos.y = bottom;
            vel.y = -std::abs(vel.y) * restitution;
        }
    }
}

} // namespace Systems
