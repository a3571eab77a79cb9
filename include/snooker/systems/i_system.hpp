/**
 * @file i_system.hpp
 * @brief Interface for all ECS systems in the table simulation
 */

#pragma once

#include <entt/entt.hpp>
#include "snooker/core/system_config.hpp"

class Table;

namespace Systems {

/**
 * @class ISystem
 * @brief Base interface for all ECS systems
 *
 * Every system is invoked once per tick with the registry holding balls and
 * obstacles, and the read-only table geometry.
 */
class ISystem {
protected:
    SystemConfig sysConfig;  // Common configuration all systems have

public:
    /**
     * @brief Virtual destructor for proper cleanup of derived classes
     */
    virtual ~ISystem() = default;

    /**
     * @brief Updates the system for one simulation step
     *
     * @param registry EnTT registry containing all entities and components
     * @param table Table geometry
     */
    virtual void update(entt::registry& registry, const Table& table) = 0;

    /**
     * @brief Sets the system configuration
     *
     * @param config System configuration parameters
     */
    virtual void setSystemConfig(const SystemConfig& config) {
        sysConfig = config;
    }

    /**
     * @brief Gets the system configuration
     *
     * @return Current system configuration
     */
    virtual const SystemConfig& getSystemConfig() const {
        return sysConfig;
    }
};

/**
 * @brief Template for system-specific configurations
 *
 * Derived systems keep their own tuning struct next to the shared SystemConfig.
 */
template<typename SpecificConfig>
class ConfigurableSystem : public ISystem {
protected:
    SpecificConfig specificConfig;

public:
    /**
     * @brief Sets the system-specific configuration
     *
     * @param config System-specific configuration parameters
     */
    virtual void setSpecificConfig(const SpecificConfig& config) {
        specificConfig = config;
    }

    /**
     * @brief Gets the system-specific configuration
     *
     * @return Current system-specific configuration
     */
    const SpecificConfig& getSpecificConfig() const {
        return specificConfig;
    }
};

} // namespace Systems
