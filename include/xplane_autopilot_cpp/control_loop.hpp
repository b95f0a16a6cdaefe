#ifndef CONTROL_LOOP_HPP
#define CONTROL_LOOP_HPP

#include <rclcpp/rclcpp.hpp>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "xplane_autopilot_cpp/autopilot_config.hpp"
#include "xplane_autopilot_cpp/autopilot_modes.hpp"
#include "xplane_autopilot_cpp/control_state.hpp"
#include "xplane_autopilot_cpp/instance.hpp"
#include "xplane_autopilot_cpp/vehicle_link.hpp"

/**
 * @brief Autopilot for one aircraft, advanced one tick at a time
 *
 * Each tick pulls fresh feedback, runs the airspeed, heading and altitude
 * cascades in that order and writes the outputs of the cascades that ran.
 * The loop does not schedule itself; its owner calls tick() once per period.
 */
class ControlLoop {
public:
    /**
     * @brief Constructor, registers all cascades and subscribes to feedback
     * @param instance Aircraft to fly
     * @param config Starting mode switches, gains and feedback rate
     * @param link Data exchange with the aircraft, must outlive the loop
     * @throws UnsupportedVersionError if the simulator version has no output datarefs
     * @throws VehicleLinkError if the feedback subscription fails
     */
    ControlLoop(const InstanceDescriptor& instance, const AutopilotConfig& config,
                VehicleLink& link);

    /**
     * @brief Run one control tick
     *
     * Does nothing while the autopilot switch is off. The state is only
     * replaced once the outputs were written, so a failing tick leaves it
     * as it was.
     *
     * @throws VehicleLinkError if feedback cannot be read or outputs cannot be written
     */
    void tick();

    const ControlState& state() const { return state_; }
    const InstanceDescriptor& instance() const { return instance_; }
    std::uint64_t ticksRun() const { return ticks_run_; }

    void setMode(Mode mode, bool on);

private:
    InstanceDescriptor instance_;
    VehicleLink& link_;
    std::vector<Cascade> cascades_;                  ///< Run order: airspeed, heading, altitude
    std::vector<std::string> feedback_datarefs_;
    std::map<Field, std::string> output_datarefs_;   ///< Every cascade output, resolved up front
    ControlState state_;
    std::uint64_t ticks_run_;
    rclcpp::Logger logger_;

    void refreshFeedback(ControlState& state);
    void flushOutputs(const ControlState& state, const std::vector<Field>& outputs);
    void warnIfNoControlLaw(const Cascade& cascade);
};

#endif // CONTROL_LOOP_HPP
