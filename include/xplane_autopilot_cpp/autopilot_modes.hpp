#ifndef AUTOPILOT_MODES_HPP
#define AUTOPILOT_MODES_HPP

#include <string>
#include <vector>

#include "xplane_autopilot_cpp/control_state.hpp"
#include "xplane_autopilot_cpp/pid_controller.hpp"

/**
 * @brief One PID step of a cascade
 */
struct CascadeStage {
    PIDKey key;
    PIDGains gains;
};

/**
 * @brief Ordered chain of PID steps run together under one mode switch
 *
 * A later stage may use an earlier stage's output as its setpoint, so the
 * stages must be listed in the order they are meant to run.
 */
struct Cascade {
    std::string name;
    Mode mode;
    std::vector<CascadeStage> stages;
    std::vector<Field> outputs;    ///< Fields sent to the aircraft after the cascade runs
};

/**
 * @brief Gains of the three heading-mode controllers
 */
struct HeadingModeGains {
    PIDGains heading{1.0, 0.0, -0.5, -30.0, 30.0, 360.0};   ///< Heading error -> roll setpoint
    PIDGains roll{0.5, 0.0, 0.0, -1.0, 1.0, std::nullopt};  ///< Roll error -> aileron trim
    PIDGains yaw{1.0, 0.0, 0.0, -1.0, 1.0, std::nullopt};   ///< Sideslip -> rudder trim
};

Cascade airspeedCascade();
Cascade headingCascade(const HeadingModeGains& gains = HeadingModeGains());
Cascade altitudeCascade();

/**
 * @brief Register every controller of a cascade; already registered triples are kept
 */
void registerCascade(ControlState& state, const Cascade& cascade);

/**
 * @brief Run a cascade at the state's current time if its mode is on
 * @return True if the cascade ran
 */
bool runCascade(ControlState& state, const Cascade& cascade);

#endif // AUTOPILOT_MODES_HPP
