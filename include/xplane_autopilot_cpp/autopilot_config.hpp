#ifndef AUTOPILOT_CONFIG_HPP
#define AUTOPILOT_CONFIG_HPP

#include <chrono>
#include <string>

#include "xplane_autopilot_cpp/autopilot_modes.hpp"

/**
 * @brief How often a crashing worker may be restarted before giving up
 */
struct RestartPolicy {
    int max_restarts = 3;                           ///< Restarts allowed within the window
    std::chrono::milliseconds window{5000};         ///< Sliding window length
};

/**
 * @brief Autopilot settings, defaults overridden from node parameters
 */
struct AutopilotConfig {
    std::chrono::milliseconds tick_period{20};        ///< Control loop delay between ticks
    std::chrono::milliseconds discovery_period{1000}; ///< Instance discovery poll
    std::chrono::milliseconds monitor_period{100};    ///< Worker exit check
    std::chrono::milliseconds instance_timeout{5000}; ///< Beacon age before an instance is gone
    int feedback_rate_hz = 50;                        ///< Requested dataref stream rate
    RestartPolicy restart;
    std::string topic_prefix = "/xplane";

    // Mode switches a new control loop starts with
    bool ap_enabled = true;
    bool heading_mode = true;
    bool airspeed_mode = false;
    bool altitude_mode = false;

    HeadingModeGains heading_gains;
};

/**
 * @brief Reject settings the autopilot cannot run with
 * @throws std::invalid_argument describing the first bad setting
 */
void validateConfig(const AutopilotConfig& config);

#endif // AUTOPILOT_CONFIG_HPP
