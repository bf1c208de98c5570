#pragma once

#include <entt/entt.hpp>

namespace harvest::ecs {

// Base system interface. Systems run once per resolved turn phase.
class System {
public:
    virtual ~System() = default;
    virtual void update(entt::registry& registry) = 0;
};

} // namespace harvest::ecs
