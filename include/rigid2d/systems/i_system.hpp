/**
 * @file i_system.hpp
 * @brief Configuration mixin shared by the sims and force laws
 */

#pragma once

namespace Systems {

/**
 * @brief Template for objects carrying a specific configuration struct
 *
 * The config struct holds defaults in-class; callers copy it out, change the
 * fields they care about and set it back.
 */
template<typename SpecificConfig>
class ConfigurableSystem {
protected:
    SpecificConfig specificConfig;

public:
    virtual ~ConfigurableSystem() = default;

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
