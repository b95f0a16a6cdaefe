#include "xplane_autopilot_cpp/control_loop.hpp"
#include "xplane_autopilot_cpp/datarefs.hpp"
#include <algorithm>
#include <utility>

ControlLoop::ControlLoop(const InstanceDescriptor& instance, const AutopilotConfig& config,
                         VehicleLink& link)
    : instance_(instance), link_(link), ticks_run_(0),
      logger_(rclcpp::get_logger("control_loop")) {

    cascades_ = {airspeedCascade(), headingCascade(config.heading_gains), altitudeCascade()};

    state_.setMode(Mode::Autopilot, config.ap_enabled);
    state_.setMode(Mode::Airspeed, config.airspeed_mode);
    state_.setMode(Mode::Heading, config.heading_mode);
    state_.setMode(Mode::Altitude, config.altitude_mode);

    for (const auto& cascade : cascades_) {
        registerCascade(state_, cascade);
        for (Field output : cascade.outputs) {
            output_datarefs_.emplace(output, outputDataref(output, instance_.version_number));
        }
        warnIfNoControlLaw(cascade);
    }

    feedback_datarefs_ = feedbackDatarefs();
    link_.requestFeedback(feedback_datarefs_, config.feedback_rate_hz);

    RCLCPP_INFO(logger_, "Autopilot ready for %s (X-Plane %d), autopilot %s, heading mode %s",
                instance_.address.c_str(), instance_.version_number,
                config.ap_enabled ? "on" : "off", config.heading_mode ? "on" : "off");
}

void ControlLoop::setMode(Mode mode, bool on) {
    state_.setMode(mode, on);
    for (const auto& cascade : cascades_) {
        if (cascade.mode == mode) {
            warnIfNoControlLaw(cascade);
        }
    }
}

void ControlLoop::warnIfNoControlLaw(const Cascade& cascade) {
    if (cascade.stages.empty() && state_.isOn(cascade.mode)) {
        RCLCPP_WARN(logger_, "%s: %s mode is on but has no control law, passing through",
                    instance_.address.c_str(), cascade.name.c_str());
    }
}

void ControlLoop::tick() {
    if (!state_.isOn(Mode::Autopilot)) {
        return;
    }

    ControlState next = state_;
    refreshFeedback(next);

    std::vector<Field> outputs;
    for (const auto& cascade : cascades_) {
        if (!runCascade(next, cascade)) {
            continue;
        }
        for (Field output : cascade.outputs) {
            if (std::find(outputs.begin(), outputs.end(), output) == outputs.end()) {
                outputs.push_back(output);
            }
        }
    }

    flushOutputs(next, outputs);

    state_ = std::move(next);
    ++ticks_run_;
}

void ControlLoop::refreshFeedback(ControlState& state) {
    DatarefValues feedback = link_.fetchFeedback(feedback_datarefs_);

    auto lookup = [&feedback](const std::string& dataref) -> std::optional<double> {
        auto it = feedback.find(dataref);
        return it == feedback.end() ? std::nullopt : it->second;
    };

    // Keep the previous time if the simulator clock did not arrive
    if (auto time = lookup(kFlightTimeDataref)) {
        state.setTime(*time);
    }
    for (const auto& binding : feedbackBindings()) {
        state.set(binding.field, lookup(binding.dataref));
    }
}

void ControlLoop::flushOutputs(const ControlState& state, const std::vector<Field>& outputs) {
    DatarefWrites writes;
    writes.reserve(outputs.size());
    for (Field output : outputs) {
        auto value = state.get(output);
        if (value) {
            writes.emplace_back(output_datarefs_.at(output), *value);
        }
    }
    if (writes.empty()) {
        return;
    }
    link_.writeOutputs(writes);
}
